/**
 * DialogueBuilder.cpp
 */

#include "DialogueBuilder.h"
#include "core/Log.h"

namespace Parley {

DialogueBuilder::DialogueBuilder(DialogueId id, const std::string& name) {
    tree_.id = id;
    tree_.name = name;
}

DialogueBuilder& DialogueBuilder::speaker(const std::string& name) {
    tree_.speakerName = name;
    return *this;
}

DialogueBuilder& DialogueBuilder::repeatable(bool value) {
    tree_.repeatable = value;
    return *this;
}

DialogueBuilder& DialogueBuilder::associatedQuest(QuestId questId) {
    tree_.associatedQuest = questId;
    return *this;
}

DialogueBuilder& DialogueBuilder::root(NodeId nodeId) {
    tree_.rootNode = nodeId;
    rootSet_ = true;
    return *this;
}

DialogueBuilder& DialogueBuilder::node(NodeId nodeId, const std::string& text) {
    DialogueNode node;
    node.id = nodeId;
    node.text = text;
    tree_.addNode(std::move(node));

    if (!rootSet_) {
        tree_.rootNode = nodeId;
        rootSet_ = true;
    }

    currentNode_ = &tree_.nodes[nodeId];
    currentChoice_ = nullptr;
    return *this;
}

DialogueBuilder& DialogueBuilder::speakerOverride(const std::string& name) {
    if (!currentNode_) return *this;
    currentNode_->speakerOverride = name;
    return *this;
}

DialogueBuilder& DialogueBuilder::terminal() {
    if (!currentNode_) return *this;
    currentNode_->isTerminal = true;
    return *this;
}

DialogueBuilder& DialogueBuilder::gate(DialogueCondition condition) {
    if (!currentNode_) return *this;
    currentNode_->conditions.push_back(std::move(condition));
    return *this;
}

DialogueBuilder& DialogueBuilder::onEnter(DialogueAction action) {
    if (!currentNode_) return *this;
    currentNode_->actions.push_back(std::move(action));
    return *this;
}

DialogueBuilder& DialogueBuilder::choice(const std::string& text) {
    if (!currentNode_) {
        PARLEY_LOG_WARN("DialogueBuilder: choice '%s' added before any node", text.c_str());
        return *this;
    }

    DialogueChoice choice;
    choice.text = text;
    currentNode_->choices.push_back(std::move(choice));
    currentChoice_ = &currentNode_->choices.back();
    return *this;
}

DialogueBuilder& DialogueBuilder::to(NodeId target) {
    if (!currentChoice_) return *this;
    currentChoice_->targetNode = target;
    return *this;
}

DialogueBuilder& DialogueBuilder::ends() {
    if (!currentChoice_) return *this;
    currentChoice_->endsDialogue = true;
    return *this;
}

DialogueBuilder& DialogueBuilder::when(DialogueCondition condition) {
    if (!currentChoice_) return *this;
    currentChoice_->conditions.push_back(std::move(condition));
    return *this;
}

DialogueBuilder& DialogueBuilder::action(DialogueAction action) {
    if (!currentChoice_) return *this;
    currentChoice_->actions.push_back(std::move(action));
    return *this;
}

DialogueTree DialogueBuilder::build() {
    currentNode_ = nullptr;
    currentChoice_ = nullptr;
    return std::move(tree_);
}

} // namespace Parley
