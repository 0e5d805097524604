/**
 * QuestTypes.cpp
 *
 * Objective goals and descriptions
 */

#include "QuestTypes.h"

namespace Parley {

// ============================================================================
// OBJECTIVE IMPLEMENTATION
// ============================================================================

uint32_t QuestObjective::goalCount() const {
    return std::visit([](const auto& o) -> uint32_t {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, Objectives::KillMonsters> ||
                      std::is_same_v<T, Objectives::CollectItems> ||
                      std::is_same_v<T, Objectives::DeliverItem>) {
            return o.quantity;
        } else if constexpr (std::is_same_v<T, Objectives::TalkToNpc> ||
                             std::is_same_v<T, Objectives::ReachLocation> ||
                             std::is_same_v<T, Objectives::EscortNpc> ||
                             std::is_same_v<T, Objectives::CustomFlag>) {
            // Boolean objectives: 1 = done
            return 1;
        } else {
            static_assert(kUnhandledAlternative<T>, "unhandled objective variant");
        }
    }, kind);
}

std::string QuestObjective::description() const {
    return std::visit([](const auto& o) -> std::string {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, Objectives::TalkToNpc>) {
            return "Talk to NPC " + std::to_string(o.npcId) + " on map " + std::to_string(o.mapId);
        } else if constexpr (std::is_same_v<T, Objectives::KillMonsters>) {
            return "Kill " + std::to_string(o.quantity) + " of monster type " +
                   std::to_string(o.monsterId);
        } else if constexpr (std::is_same_v<T, Objectives::CollectItems>) {
            return "Collect " + std::to_string(o.quantity) + " of item " + std::to_string(o.itemId);
        } else if constexpr (std::is_same_v<T, Objectives::ReachLocation>) {
            return "Reach (" + std::to_string(o.position.x) + ", " + std::to_string(o.position.y) +
                   ") on map " + std::to_string(o.mapId) + " (radius: " +
                   std::to_string(o.radius) + ")";
        } else if constexpr (std::is_same_v<T, Objectives::DeliverItem>) {
            return "Deliver " + std::to_string(o.quantity) + " of item " +
                   std::to_string(o.itemId) + " to NPC " + std::to_string(o.npcId);
        } else if constexpr (std::is_same_v<T, Objectives::EscortNpc>) {
            return "Escort NPC " + std::to_string(o.npcId) + " to (" +
                   std::to_string(o.position.x) + ", " + std::to_string(o.position.y) +
                   ") on map " + std::to_string(o.mapId);
        } else if constexpr (std::is_same_v<T, Objectives::CustomFlag>) {
            return "Set flag '" + o.flagName + "' to " + (o.requiredValue ? "true" : "false");
        } else {
            static_assert(kUnhandledAlternative<T>, "unhandled objective variant");
        }
    }, kind);
}

// ============================================================================
// REWARD IMPLEMENTATION
// ============================================================================

std::string QuestReward::description() const {
    return std::visit([](const auto& r) -> std::string {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, Rewards::Experience>) {
            return std::to_string(r.amount) + " experience";
        } else if constexpr (std::is_same_v<T, Rewards::Gold>) {
            return std::to_string(r.amount) + " gold";
        } else if constexpr (std::is_same_v<T, Rewards::Items>) {
            return std::to_string(r.items.size()) + " item types";
        } else if constexpr (std::is_same_v<T, Rewards::UnlockQuest>) {
            return "Unlocks quest " + std::to_string(r.questId);
        } else if constexpr (std::is_same_v<T, Rewards::SetFlag>) {
            return "Sets flag '" + r.flagName + "' to " + (r.value ? "true" : "false");
        } else if constexpr (std::is_same_v<T, Rewards::Reputation>) {
            return "Reputation with " + r.faction + " " + std::to_string(r.change);
        } else {
            static_assert(kUnhandledAlternative<T>, "unhandled reward variant");
        }
    }, kind);
}

} // namespace Parley
