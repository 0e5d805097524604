/**
 * DialogueBuilder.h
 *
 * Helper for building dialogue trees programmatically
 *
 * Usage:
 *   DialogueTree tree = DialogueBuilder(100, "Gate Guard")
 *       .speaker("Guard")
 *       .node(1, "Halt! State your business.")
 *           .choice("I seek the elder.").to(2)
 *           .choice("Never mind.").ends()
 *       .node(2, "Go on through.").terminal()
 *       .build();
 */

#pragma once

#include "DialogueTypes.h"
#include <string>

namespace Parley {

class DialogueBuilder {
public:
    explicit DialogueBuilder(DialogueId id, const std::string& name = "Dialogue");

    DialogueBuilder& speaker(const std::string& name);
    DialogueBuilder& repeatable(bool value = true);
    DialogueBuilder& associatedQuest(QuestId questId);

    /**
     * Set the root node; defaults to the first node added
     */
    DialogueBuilder& root(NodeId nodeId);

    /**
     * Start a node. Later calls apply to it until the next node().
     */
    DialogueBuilder& node(NodeId nodeId, const std::string& text);
    DialogueBuilder& speakerOverride(const std::string& name);
    DialogueBuilder& terminal();

    /**
     * Condition on entering the current node
     */
    DialogueBuilder& gate(DialogueCondition condition);

    /**
     * Action applied on entering the current node
     */
    DialogueBuilder& onEnter(DialogueAction action);

    /**
     * Add a choice to the current node. Later calls apply to it until the
     * next choice() or node().
     */
    DialogueBuilder& choice(const std::string& text);
    DialogueBuilder& to(NodeId target);
    DialogueBuilder& ends();
    DialogueBuilder& when(DialogueCondition condition);
    DialogueBuilder& action(DialogueAction action);

    DialogueTree build();

private:
    DialogueTree tree_;
    DialogueNode* currentNode_ = nullptr;
    DialogueChoice* currentChoice_ = nullptr;
    bool rootSet_ = false;
};

} // namespace Parley
