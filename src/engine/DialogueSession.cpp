/**
 * DialogueSession.cpp
 *
 * Dialogue state machine implementation
 */

#include "DialogueSession.h"
#include "ConditionEvaluator.h"
#include "core/Log.h"

namespace Parley {

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Active: return "Active";
        case SessionState::StuckActive: return "StuckActive";
        case SessionState::Ended: return "Ended";
    }
    return "Unknown";
}

const char* toString(SessionError error) {
    switch (error) {
        case SessionError::None: return "None";
        case SessionError::NoSuchTree: return "NoSuchTree";
        case SessionError::AlreadyActive: return "AlreadyActive";
        case SessionError::NotRepeatable: return "NotRepeatable";
        case SessionError::NotActive: return "NotActive";
        case SessionError::InvalidChoiceIndex: return "InvalidChoiceIndex";
        case SessionError::ChoiceNotVisible: return "ChoiceNotVisible";
    }
    return "Unknown";
}

const char* toString(EndReason reason) {
    switch (reason) {
        case EndReason::None: return "None";
        case EndReason::TerminalNode: return "TerminalNode";
        case EndReason::ChoiceEnded: return "ChoiceEnded";
        case EndReason::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

DialogueSession::DialogueSession(std::shared_ptr<const DialogueStore> dialogues,
                                 ActionDispatcher& dispatcher,
                                 GameStateHandle& state)
    : dialogues_(std::move(dialogues))
    , dispatcher_(dispatcher)
    , state_(state)
{
}

SessionError DialogueSession::start(DialogueId treeId, std::optional<NpcId> npcId) {
    if (!ended_) {
        return SessionError::AlreadyActive;
    }

    const DialogueTree* tree = dialogues_ ? dialogues_->getTree(treeId) : nullptr;
    if (!tree) {
        PARLEY_LOG_WARN("Dialogue %u not found", static_cast<unsigned>(treeId));
        return SessionError::NoSuchTree;
    }

    if (!tree->repeatable && state_.isDialogueCompleted(treeId)) {
        return SessionError::NotRepeatable;
    }

    if (tree->associatedQuest && !dispatcher_.questStore().getQuest(*tree->associatedQuest)) {
        PARLEY_LOG_WARN("Dialogue %u references missing quest %u",
                        static_cast<unsigned>(treeId),
                        static_cast<unsigned>(*tree->associatedQuest));
    }

    tree_ = tree;
    ended_ = false;
    endReason_ = EndReason::None;
    history_.clear();
    lastFailures_.clear();

    PARLEY_LOG_DEBUG("Dialogue %u '%s' started", static_cast<unsigned>(treeId), tree->name.c_str());

    DialogueEvent event;
    event.type = DialogueEvent::Type::Started;
    event.treeId = treeId;
    fireEvent(event);

    if (npcId) {
        dispatcher_.notify(QuestEvent::npcTalkedTo(*npcId), state_);
    }

    enterNode(tree->rootNode);
    return SessionError::None;
}

bool DialogueSession::isChoiceVisible(const DialogueChoice& choice) const {
    if (!evaluateConditions(choice.conditions, state_)) {
        return false;
    }

    if (choice.leavesDialogue()) {
        return true;
    }

    const DialogueNode* target = tree_->getNode(*choice.targetNode);
    if (!target) {
        PARLEY_LOG_WARN("Dialogue %u choice '%s' targets missing node %u",
                        static_cast<unsigned>(tree_->id), choice.text.c_str(),
                        static_cast<unsigned>(*choice.targetNode));
        return false;
    }

    return evaluateConditions(target->conditions, state_);
}

std::vector<size_t> DialogueSession::visibleChoices() const {
    std::vector<size_t> visible;

    const DialogueNode* node = currentNode();
    if (!node) return visible;

    for (size_t i = 0; i < node->choices.size(); ++i) {
        if (isChoiceVisible(node->choices[i])) {
            visible.push_back(i);
        }
    }
    return visible;
}

SelectResult DialogueSession::select(size_t choiceIndex) {
    SelectResult result;

    const DialogueNode* node = currentNode();
    if (!node) {
        result.error = SessionError::NotActive;
        return result;
    }

    if (choiceIndex >= node->choices.size()) {
        result.error = SessionError::InvalidChoiceIndex;
        return result;
    }

    const DialogueChoice& choice = node->choices[choiceIndex];
    if (!isChoiceVisible(choice)) {
        result.error = SessionError::ChoiceNotVisible;
        return result;
    }

    lastFailures_.clear();

    DialogueEvent event;
    event.type = DialogueEvent::Type::ChoiceMade;
    event.treeId = tree_->id;
    event.nodeId = currentNodeId_;
    event.choiceIndex = static_cast<int>(choiceIndex);
    fireEvent(event);

    executeActions(choice.actions);

    if (choice.leavesDialogue()) {
        finish(EndReason::ChoiceEnded);
    } else {
        enterNode(*choice.targetNode);
    }

    result.actionFailures = lastFailures_;
    return result;
}

void DialogueSession::cancel() {
    if (ended_) return;
    finish(EndReason::Cancelled);
}

SessionState DialogueSession::state() const {
    const DialogueNode* node = currentNode();
    if (!node) {
        return SessionState::Ended;
    }

    if (!node->choices.empty() && visibleChoices().empty()) {
        return SessionState::StuckActive;
    }
    return SessionState::Active;
}

std::optional<DialogueId> DialogueSession::treeId() const {
    if (!tree_) return std::nullopt;
    return tree_->id;
}

std::optional<NodeId> DialogueSession::currentNodeId() const {
    if (ended_) return std::nullopt;
    return currentNodeId_;
}

const DialogueNode* DialogueSession::currentNode() const {
    if (ended_ || !tree_) return nullptr;
    return tree_->getNode(currentNodeId_);
}

std::optional<std::string> DialogueSession::speakerName() const {
    const DialogueNode* node = currentNode();
    if (node && node->speakerOverride) {
        return node->speakerOverride;
    }
    if (tree_) {
        return tree_->speakerName;
    }
    return std::nullopt;
}

void DialogueSession::enterNode(NodeId nodeId) {
    const DialogueNode* node = tree_->getNode(nodeId);
    if (!node) {
        // Only a root missing from an unvalidated tree can get here
        PARLEY_LOG_ERROR("Dialogue %u has no node %u",
                         static_cast<unsigned>(tree_->id), static_cast<unsigned>(nodeId));
        finish(EndReason::Cancelled);
        return;
    }

    currentNodeId_ = nodeId;
    history_.push_back(nodeId);

    DialogueEvent entered;
    entered.type = DialogueEvent::Type::NodeEntered;
    entered.treeId = tree_->id;
    entered.nodeId = nodeId;
    fireEvent(entered);

    executeActions(node->actions);

    if (node->isTerminal) {
        finish(EndReason::TerminalNode);
        return;
    }

    if (!node->choices.empty() && visibleChoices().empty()) {
        PARLEY_LOG_WARN("Dialogue %u node %u has no visible choices",
                        static_cast<unsigned>(tree_->id), static_cast<unsigned>(nodeId));
    }

    DialogueEvent presented;
    presented.type = DialogueEvent::Type::ChoicesPresented;
    presented.treeId = tree_->id;
    presented.nodeId = nodeId;
    fireEvent(presented);
}

void DialogueSession::executeActions(const std::vector<DialogueAction>& actions) {
    for (const auto& action : actions) {
        ActionResult actionResult = dispatcher_.apply(action, state_);

        DialogueEvent event;
        event.type = actionResult.success ? DialogueEvent::Type::ActionExecuted
                                          : DialogueEvent::Type::ActionFailed;
        event.treeId = tree_->id;
        event.nodeId = currentNodeId_;
        event.action = &action;
        event.actionResult = actionResult;
        fireEvent(event);

        if (!actionResult.success) {
            lastFailures_.push_back(std::move(actionResult));
        }
    }
}

void DialogueSession::finish(EndReason reason) {
    ended_ = true;
    endReason_ = reason;

    if (reason != EndReason::Cancelled) {
        state_.markDialogueCompleted(tree_->id);
    }

    PARLEY_LOG_DEBUG("Dialogue %u ended (%s)", static_cast<unsigned>(tree_->id), toString(reason));

    DialogueEvent event;
    event.type = DialogueEvent::Type::Ended;
    event.treeId = tree_->id;
    event.nodeId = currentNodeId_;
    event.endReason = reason;
    fireEvent(event);
}

void DialogueSession::fireEvent(const DialogueEvent& event) const {
    if (eventCallback_) {
        eventCallback_(event);
    }
}

} // namespace Parley
