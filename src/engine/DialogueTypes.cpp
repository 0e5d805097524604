/**
 * DialogueTypes.cpp
 *
 * Descriptions and helpers for dialogue content
 */

#include "DialogueTypes.h"
#include <algorithm>
#include <sstream>

namespace Parley {

namespace {

const char* boolText(bool value) {
    return value ? "true" : "false";
}

std::string describeStacks(const std::vector<ItemStack>& items) {
    std::ostringstream ss;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << items[i].quantity << "x item " << items[i].itemId;
    }
    return ss.str();
}

} // namespace

// ============================================================================
// CONDITIONS
// ============================================================================

std::string DialogueCondition::description() const {
    return std::visit([](const auto& c) -> std::string {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, Conditions::HasQuest>) {
            return "Has quest " + std::to_string(c.questId);
        } else if constexpr (std::is_same_v<T, Conditions::CompletedQuest>) {
            return "Completed quest " + std::to_string(c.questId);
        } else if constexpr (std::is_same_v<T, Conditions::QuestStage>) {
            return "Quest " + std::to_string(c.questId) + " stage " +
                   std::to_string(c.stageNumber);
        } else if constexpr (std::is_same_v<T, Conditions::HasItem>) {
            return "Has " + std::to_string(c.quantity) + " of item " + std::to_string(c.itemId);
        } else if constexpr (std::is_same_v<T, Conditions::HasGold>) {
            return "Has " + std::to_string(c.amount) + " gold";
        } else if constexpr (std::is_same_v<T, Conditions::MinLevel>) {
            return "Min level " + std::to_string(c.level);
        } else if constexpr (std::is_same_v<T, Conditions::FlagSet>) {
            return "Flag '" + c.flagName + "' = " + boolText(c.value);
        } else if constexpr (std::is_same_v<T, Conditions::ReputationThreshold>) {
            return "Reputation with " + c.faction + " >= " + std::to_string(c.threshold);
        } else if constexpr (std::is_same_v<T, Conditions::And>) {
            return "AND(" + std::to_string(c.conditions.size()) + " conditions)";
        } else if constexpr (std::is_same_v<T, Conditions::Or>) {
            return "OR(" + std::to_string(c.conditions.size()) + " conditions)";
        } else if constexpr (std::is_same_v<T, Conditions::Not>) {
            if (!c.condition) return "NOT(<missing>)";
            return "NOT(" + c.condition->description() + ")";
        } else if constexpr (std::is_same_v<T, Conditions::Unknown>) {
            return "Unknown condition '" + c.tag + "'";
        } else {
            static_assert(kUnhandledAlternative<T>, "unhandled condition variant");
        }
    }, kind);
}

Conditions::Not negate(DialogueCondition condition) {
    Conditions::Not result;
    result.condition = std::make_shared<const DialogueCondition>(std::move(condition));
    return result;
}

// ============================================================================
// ACTIONS
// ============================================================================

std::string DialogueAction::description() const {
    return std::visit([](const auto& a) -> std::string {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, Actions::StartQuest>) {
            return "Start quest " + std::to_string(a.questId);
        } else if constexpr (std::is_same_v<T, Actions::CompleteQuestStage>) {
            return "Complete quest " + std::to_string(a.questId) + " stage " +
                   std::to_string(a.stageNumber);
        } else if constexpr (std::is_same_v<T, Actions::GiveItems>) {
            return "Give " + describeStacks(a.items);
        } else if constexpr (std::is_same_v<T, Actions::TakeItems>) {
            return "Take " + describeStacks(a.items);
        } else if constexpr (std::is_same_v<T, Actions::GiveGold>) {
            return "Give " + std::to_string(a.amount) + " gold";
        } else if constexpr (std::is_same_v<T, Actions::TakeGold>) {
            return "Take " + std::to_string(a.amount) + " gold";
        } else if constexpr (std::is_same_v<T, Actions::SetFlag>) {
            return "Set flag '" + a.flagName + "' to " + boolText(a.value);
        } else if constexpr (std::is_same_v<T, Actions::ChangeReputation>) {
            return "Change reputation with " + a.faction + " by " + std::to_string(a.change);
        } else if constexpr (std::is_same_v<T, Actions::TriggerEvent>) {
            return "Trigger event '" + a.eventName + "'";
        } else if constexpr (std::is_same_v<T, Actions::GrantExperience>) {
            return "Grant " + std::to_string(a.amount) + " experience";
        } else if constexpr (std::is_same_v<T, Actions::RecruitToParty>) {
            return "Recruit '" + a.characterId + "' to party";
        } else if constexpr (std::is_same_v<T, Actions::RecruitToInn>) {
            return "Send '" + a.characterId + "' to inn (keeper: " + a.innkeeperId + ")";
        } else if constexpr (std::is_same_v<T, Actions::OpenShop>) {
            return "Open shop " + std::to_string(a.shopId);
        } else {
            static_assert(kUnhandledAlternative<T>, "unhandled action variant");
        }
    }, kind);
}

// ============================================================================
// TREE
// ============================================================================

std::vector<NodeId> DialogueTree::sortedNodeIds() const {
    std::vector<NodeId> ids;
    ids.reserve(nodes.size());
    for (const auto& [nodeId, node] : nodes) {
        ids.push_back(nodeId);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace Parley
