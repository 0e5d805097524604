/**
 * ConditionEvaluator.cpp
 */

#include "ConditionEvaluator.h"
#include "core/Log.h"

namespace Parley {

bool evaluateCondition(const DialogueCondition& condition, const GameStateView& state) {
    return std::visit([&state](const auto& c) -> bool {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, Conditions::HasQuest>) {
            return state.isQuestActive(c.questId);
        } else if constexpr (std::is_same_v<T, Conditions::CompletedQuest>) {
            return state.isQuestCompleted(c.questId);
        } else if constexpr (std::is_same_v<T, Conditions::QuestStage>) {
            return state.isQuestStageCompleted(c.questId, c.stageNumber);
        } else if constexpr (std::is_same_v<T, Conditions::HasItem>) {
            return state.getItemCount(c.itemId) >= c.quantity;
        } else if constexpr (std::is_same_v<T, Conditions::HasGold>) {
            return state.getGold() >= c.amount;
        } else if constexpr (std::is_same_v<T, Conditions::MinLevel>) {
            return state.getCharacterLevel() >= c.level;
        } else if constexpr (std::is_same_v<T, Conditions::FlagSet>) {
            return state.getFlag(c.flagName) == c.value;
        } else if constexpr (std::is_same_v<T, Conditions::ReputationThreshold>) {
            return state.getReputation(c.faction) >= c.threshold;
        } else if constexpr (std::is_same_v<T, Conditions::And>) {
            for (const auto& inner : c.conditions) {
                if (!evaluateCondition(inner, state)) return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, Conditions::Or>) {
            for (const auto& inner : c.conditions) {
                if (evaluateCondition(inner, state)) return true;
            }
            return false;
        } else if constexpr (std::is_same_v<T, Conditions::Not>) {
            if (!c.condition) {
                PARLEY_LOG_WARN("Condition 'not' has no operand; treating as false");
                return false;
            }
            return !evaluateCondition(*c.condition, state);
        } else if constexpr (std::is_same_v<T, Conditions::Unknown>) {
            PARLEY_LOG_WARN("Unknown condition '%s'; treating as false", c.tag.c_str());
            return false;
        } else {
            static_assert(kUnhandledAlternative<T>, "unhandled condition");
        }
    }, condition.kind);
}

bool evaluateConditions(const std::vector<DialogueCondition>& conditions,
                        const GameStateView& state) {
    for (const auto& condition : conditions) {
        if (!evaluateCondition(condition, state)) return false;
    }
    return true;
}

} // namespace Parley
