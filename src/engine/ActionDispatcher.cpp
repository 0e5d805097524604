/**
 * ActionDispatcher.cpp
 */

#include "ActionDispatcher.h"
#include "core/Log.h"
#include <map>

namespace Parley {

ActionDispatcher::ActionDispatcher(std::shared_ptr<const QuestStore> quests,
                                   const ContentReferences* references)
    : tracker_(std::move(quests))
    , references_(references)
{
}

ActionResult ActionDispatcher::checkItems(const std::vector<ItemStack>& items) const {
    if (!references_) return ActionResult::ok();

    for (const auto& stack : items) {
        if (!references_->hasItem(stack.itemId)) {
            return ActionResult::failure(ActionError::InvalidTarget,
                "Item " + std::to_string(stack.itemId) + " does not exist");
        }
    }
    return ActionResult::ok();
}

ActionResult ActionDispatcher::apply(const DialogueAction& action, GameStateHandle& state) {
    ActionResult result = std::visit([&](const auto& a) -> ActionResult {
        using T = std::decay_t<decltype(a)>;

        if constexpr (std::is_same_v<T, Actions::StartQuest>) {
            return tracker_.startQuest(a.questId, state);
        } else if constexpr (std::is_same_v<T, Actions::CompleteQuestStage>) {
            return tracker_.completeStage(a.questId, a.stageNumber, state);
        } else if constexpr (std::is_same_v<T, Actions::GiveItems>) {
            ActionResult check = checkItems(a.items);
            if (!check.success) return check;
            for (const auto& stack : a.items) {
                state.addItem(stack.itemId, stack.quantity);
            }
            return ActionResult::ok();
        } else if constexpr (std::is_same_v<T, Actions::TakeItems>) {
            ActionResult check = checkItems(a.items);
            if (!check.success) return check;

            // The same item may appear more than once in a list
            std::map<ItemId, uint32_t> needed;
            for (const auto& stack : a.items) {
                needed[stack.itemId] += stack.quantity;
            }
            for (const auto& [itemId, count] : needed) {
                if (state.getItemCount(itemId) < count) {
                    return ActionResult::failure(ActionError::InsufficientResources,
                        "Need " + std::to_string(count) + " of item " + std::to_string(itemId) +
                        ", have " + std::to_string(state.getItemCount(itemId)));
                }
            }
            for (const auto& [itemId, count] : needed) {
                if (!state.removeItem(itemId, count)) {
                    return ActionResult::failure(ActionError::InsufficientResources,
                        "Item " + std::to_string(itemId) + " could not be removed");
                }
            }
            return ActionResult::ok();
        } else if constexpr (std::is_same_v<T, Actions::GiveGold>) {
            state.addGold(a.amount);
            return ActionResult::ok();
        } else if constexpr (std::is_same_v<T, Actions::TakeGold>) {
            if (!state.removeGold(a.amount)) {
                return ActionResult::failure(ActionError::InsufficientResources,
                    "Need " + std::to_string(a.amount) + " gold, have " +
                    std::to_string(state.getGold()));
            }
            return ActionResult::ok();
        } else if constexpr (std::is_same_v<T, Actions::SetFlag>) {
            if (state.getFlag(a.flagName) == a.value) {
                return ActionResult::ok("Flag unchanged");
            }
            state.setFlag(a.flagName, a.value);
            tracker_.processEvent(QuestEvent::flagChanged(a.flagName, a.value), state);
            return ActionResult::ok();
        } else if constexpr (std::is_same_v<T, Actions::ChangeReputation>) {
            state.changeReputation(a.faction, a.change);
            return ActionResult::ok();
        } else if constexpr (std::is_same_v<T, Actions::TriggerEvent>) {
            state.triggerEvent(a.eventName);
            return ActionResult::ok();
        } else if constexpr (std::is_same_v<T, Actions::GrantExperience>) {
            state.addExperience(a.amount);
            return ActionResult::ok();
        } else if constexpr (std::is_same_v<T, Actions::RecruitToParty>) {
            if (references_ && !references_->hasCharacter(a.characterId)) {
                return ActionResult::failure(ActionError::InvalidTarget,
                    "Character '" + a.characterId + "' does not exist");
            }
            state.recruitToParty(a.characterId);
            return ActionResult::ok();
        } else if constexpr (std::is_same_v<T, Actions::RecruitToInn>) {
            if (references_ && !references_->hasCharacter(a.characterId)) {
                return ActionResult::failure(ActionError::InvalidTarget,
                    "Character '" + a.characterId + "' does not exist");
            }
            state.recruitToInn(a.characterId, a.innkeeperId);
            return ActionResult::ok();
        } else if constexpr (std::is_same_v<T, Actions::OpenShop>) {
            if (references_ && !references_->hasShop(a.shopId)) {
                return ActionResult::failure(ActionError::InvalidTarget,
                    "Shop " + std::to_string(a.shopId) + " does not exist");
            }
            state.openShop(a.shopId);
            return ActionResult::ok();
        } else {
            static_assert(kUnhandledAlternative<T>, "unhandled action");
        }
    }, action.kind);

    if (!result.success) {
        PARLEY_LOG_WARN("Action '%s' failed (%s): %s", action.description().c_str(),
                        toString(result.error), result.message.c_str());
    }
    return result;
}

ActionListResult ActionDispatcher::applyAll(const std::vector<DialogueAction>& actions,
                                            GameStateHandle& state) {
    ActionListResult result;
    for (size_t i = 0; i < actions.size(); ++i) {
        ActionResult actionResult = apply(actions[i], state);
        ++result.attempted;
        if (!actionResult.success) {
            result.success = false;
            result.failures.emplace_back(i, std::move(actionResult));
        }
    }
    return result;
}

void ActionDispatcher::notify(const QuestEvent& event, GameStateHandle& state) {
    tracker_.processEvent(event, state);
}

} // namespace Parley
