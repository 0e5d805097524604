/**
 * DialogueTypes.h
 *
 * Dialogue content model
 *
 * A dialogue tree is an arena of nodes keyed by id. Nodes reference each
 * other only by id, so trees may loop back on themselves (e.g. "ask about
 * something else" returning to an earlier node).
 *
 * Conditions and actions are closed tagged variants. Adding a variant means
 * extending the variant and every std::visit over it.
 */

#pragma once

#include "ContentTypes.h"
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace Parley {

struct DialogueCondition;

// ============================================================================
// DIALOGUE CONDITIONS
// ============================================================================

namespace Conditions {

/** Quest is currently active */
struct HasQuest {
    QuestId questId = 0;
};

/** Quest has been completed at least once */
struct CompletedQuest {
    QuestId questId = 0;
};

/** Given stage of a quest has been completed */
struct QuestStage {
    QuestId questId = 0;
    uint8_t stageNumber = 1;
};

struct HasItem {
    ItemId itemId = 0;
    uint16_t quantity = 1;
};

struct HasGold {
    uint32_t amount = 0;
};

struct MinLevel {
    uint8_t level = 1;
};

/** Flag equals value (unset flags read as false) */
struct FlagSet {
    std::string flagName;
    bool value = true;
};

struct ReputationThreshold {
    std::string faction;
    int16_t threshold = 0;
};

struct And {
    std::vector<DialogueCondition> conditions;
};

struct Or {
    std::vector<DialogueCondition> conditions;
};

struct Not {
    std::shared_ptr<const DialogueCondition> condition;
};

/**
 * Variant tag the loader did not recognise. The original JSON object is kept
 * in payload so content round-trips; always evaluates to false.
 */
struct Unknown {
    std::string tag;
    std::string payload;
};

} // namespace Conditions

/**
 * A condition gating a node or choice
 */
struct DialogueCondition {
    using Variant = std::variant<
        Conditions::HasQuest,
        Conditions::CompletedQuest,
        Conditions::QuestStage,
        Conditions::HasItem,
        Conditions::HasGold,
        Conditions::MinLevel,
        Conditions::FlagSet,
        Conditions::ReputationThreshold,
        Conditions::And,
        Conditions::Or,
        Conditions::Not,
        Conditions::Unknown>;

    Variant kind;

    DialogueCondition() = default;

    template<typename T,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, DialogueCondition>>>
    DialogueCondition(T&& value)
        : kind(std::forward<T>(value))
    {
    }

    template<typename T>
    const T* as() const { return std::get_if<T>(&kind); }

    /**
     * Human-readable summary for editors and diagnostics
     */
    std::string description() const;
};

/**
 * Wrap a condition for use as the operand of Conditions::Not
 */
Conditions::Not negate(DialogueCondition condition);

// ============================================================================
// DIALOGUE ACTIONS
// ============================================================================

namespace Actions {

struct StartQuest {
    QuestId questId = 0;
};

struct CompleteQuestStage {
    QuestId questId = 0;
    uint8_t stageNumber = 1;
};

struct GiveItems {
    std::vector<ItemStack> items;
};

struct TakeItems {
    std::vector<ItemStack> items;
};

struct GiveGold {
    uint32_t amount = 0;
};

struct TakeGold {
    uint32_t amount = 0;
};

struct SetFlag {
    std::string flagName;
    bool value = true;
};

struct ChangeReputation {
    std::string faction;
    int16_t change = 0;
};

struct TriggerEvent {
    std::string eventName;
};

struct GrantExperience {
    uint32_t amount = 0;
};

struct RecruitToParty {
    std::string characterId;
};

struct RecruitToInn {
    std::string characterId;
    std::string innkeeperId;
};

struct OpenShop {
    ShopId shopId = 0;
};

} // namespace Actions

/**
 * A side effect applied when a node is entered or a choice is selected
 */
struct DialogueAction {
    using Variant = std::variant<
        Actions::StartQuest,
        Actions::CompleteQuestStage,
        Actions::GiveItems,
        Actions::TakeItems,
        Actions::GiveGold,
        Actions::TakeGold,
        Actions::SetFlag,
        Actions::ChangeReputation,
        Actions::TriggerEvent,
        Actions::GrantExperience,
        Actions::RecruitToParty,
        Actions::RecruitToInn,
        Actions::OpenShop>;

    Variant kind;

    DialogueAction() = default;

    template<typename T,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, DialogueAction>>>
    DialogueAction(T&& value)
        : kind(std::forward<T>(value))
    {
    }

    template<typename T>
    const T* as() const { return std::get_if<T>(&kind); }

    std::string description() const;
};

// ============================================================================
// DIALOGUE GRAPH
// ============================================================================

/**
 * A player response option
 */
struct DialogueChoice {
    std::string text;
    std::optional<NodeId> targetNode;           // None = leaves the tree
    std::vector<DialogueCondition> conditions;  // Hidden if any is false
    std::vector<DialogueAction> actions;        // Applied before the transition
    bool endsDialogue = false;

    /**
     * True when selecting this choice ends the session instead of moving
     */
    bool leavesDialogue() const { return endsDialogue || !targetNode.has_value(); }
};

/**
 * One dialogue beat
 */
struct DialogueNode {
    NodeId id = 0;
    std::string text;
    std::optional<std::string> speakerOverride;
    std::vector<DialogueChoice> choices;

    // Gate the node itself; evaluated only when a transition targets it
    std::vector<DialogueCondition> conditions;

    // Applied on entry, before choices are evaluated
    std::vector<DialogueAction> actions;

    bool isTerminal = false;
};

/**
 * A complete conversation
 */
struct DialogueTree {
    DialogueId id = 0;
    std::string name;
    NodeId rootNode = 0;
    std::unordered_map<NodeId, DialogueNode> nodes;
    std::optional<std::string> speakerName;
    bool repeatable = true;
    std::optional<QuestId> associatedQuest;

    const DialogueNode* getNode(NodeId nodeId) const {
        auto it = nodes.find(nodeId);
        return it != nodes.end() ? &it->second : nullptr;
    }

    const DialogueNode* getRootNode() const { return getNode(rootNode); }

    /**
     * Insert or replace a node under its own id
     */
    void addNode(DialogueNode node) {
        NodeId nodeId = node.id;
        nodes[nodeId] = std::move(node);
    }

    size_t nodeCount() const { return nodes.size(); }

    /**
     * Node ids in ascending order (stable iteration for tools and encoding)
     */
    std::vector<NodeId> sortedNodeIds() const;
};

} // namespace Parley
