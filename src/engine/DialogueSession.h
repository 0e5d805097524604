/**
 * DialogueSession.h
 *
 * Runs one conversation against a dialogue store
 *
 * A session is created per interaction. It owns the cursor (current node)
 * and works against the game state handle it was given; the store is shared
 * read-only, so any number of sessions may run over the same trees.
 *
 * States:
 *   Active       - on a node, waiting for a choice
 *   StuckActive  - on a non-terminal node whose choices are all hidden
 *   Ended        - not started yet, or finished
 */

#pragma once

#include "ActionDispatcher.h"
#include "DialogueStore.h"
#include "GameState.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Parley {

enum class SessionState {
    Active,
    StuckActive,
    Ended
};

enum class SessionError {
    None,
    NoSuchTree,
    AlreadyActive,
    NotRepeatable,
    NotActive,
    InvalidChoiceIndex,
    ChoiceNotVisible
};

enum class EndReason {
    None,
    TerminalNode,
    ChoiceEnded,
    Cancelled
};

const char* toString(SessionState state);
const char* toString(SessionError error);
const char* toString(EndReason reason);

// ============================================================================
// SESSION EVENTS
// ============================================================================

/**
 * Events fired during a session
 */
struct DialogueEvent {
    enum class Type {
        Started,            // Session began on a tree
        NodeEntered,        // Cursor moved to a node
        ChoicesPresented,   // Visible choices computed for the new node
        ChoiceMade,         // Player selected a choice
        ActionExecuted,     // An action applied successfully
        ActionFailed,       // An action reported an error
        Ended               // Session finished
    } type = Type::Started;

    DialogueId treeId = 0;
    std::optional<NodeId> nodeId;
    int choiceIndex = -1;
    const DialogueAction* action = nullptr;
    ActionResult actionResult;
    EndReason endReason = EndReason::None;
};

/**
 * Outcome of start/select. Action failures do not block the transition.
 */
struct SelectResult {
    SessionError error = SessionError::None;
    std::vector<ActionResult> actionFailures;

    bool success() const { return error == SessionError::None; }
};

// ============================================================================
// DIALOGUE SESSION
// ============================================================================

class DialogueSession {
public:
    using EventCallback = std::function<void(const DialogueEvent&)>;

    /**
     * @param dispatcher Applies node and choice actions; must outlive the session
     * @param state Game state the session reads and changes; must outlive the session
     */
    DialogueSession(std::shared_ptr<const DialogueStore> dialogues,
                    ActionDispatcher& dispatcher,
                    GameStateHandle& state);

    /**
     * Begin a tree at its root node. Root node conditions are not checked.
     * When npcId is given, an NpcTalkedTo quest event is raised.
     */
    SessionError start(DialogueId treeId, std::optional<NpcId> npcId = std::nullopt);

    /**
     * Indices of the current node's visible choices, in declaration order
     */
    std::vector<size_t> visibleChoices() const;

    /**
     * Select a choice by its index in the node's choice list.
     * Rejected selections leave the session and game state untouched.
     */
    SelectResult select(size_t choiceIndex);

    /**
     * End the session without running actions. The tree is not recorded as
     * completed.
     */
    void cancel();

    SessionState state() const;
    bool isEnded() const { return ended_; }
    EndReason endReason() const { return endReason_; }

    std::optional<DialogueId> treeId() const;
    std::optional<NodeId> currentNodeId() const;
    const DialogueNode* currentNode() const;
    const DialogueTree* currentTree() const { return tree_; }

    /**
     * Node override, else the tree's speaker
     */
    std::optional<std::string> speakerName() const;

    /**
     * Node ids visited since start, in order
     */
    const std::vector<NodeId>& history() const { return history_; }

    /**
     * Failures from the most recent start or select
     */
    const std::vector<ActionResult>& lastActionFailures() const { return lastFailures_; }

    void setEventCallback(EventCallback callback) { eventCallback_ = std::move(callback); }

private:
    bool isChoiceVisible(const DialogueChoice& choice) const;
    void enterNode(NodeId nodeId);
    void executeActions(const std::vector<DialogueAction>& actions);
    void finish(EndReason reason);
    void fireEvent(const DialogueEvent& event) const;

    std::shared_ptr<const DialogueStore> dialogues_;
    ActionDispatcher& dispatcher_;
    GameStateHandle& state_;

    const DialogueTree* tree_ = nullptr;
    NodeId currentNodeId_ = 0;
    bool ended_ = true;
    EndReason endReason_ = EndReason::None;

    std::vector<NodeId> history_;
    std::vector<ActionResult> lastFailures_;

    EventCallback eventCallback_;
};

} // namespace Parley
