/**
 * ActionDispatcher.h
 *
 * Applies dialogue actions to the game state
 *
 * Quest-related actions go through the quest tracker so dialogue and
 * gameplay share one set of quest rules. Ids are checked against the quest
 * store and, when provided, the campaign's content references.
 */

#pragma once

#include "ActionResult.h"
#include "DialogueTypes.h"
#include "GameState.h"
#include "QuestTracker.h"
#include <memory>
#include <utility>
#include <vector>

namespace Parley {

/**
 * Outcome of applying a list of actions. Every action is attempted.
 */
struct ActionListResult {
    bool success = true;
    size_t attempted = 0;
    std::vector<std::pair<size_t, ActionResult>> failures;    // action index -> result
};

class ActionDispatcher {
public:
    /**
     * @param references Optional id sets; must outlive the dispatcher
     */
    explicit ActionDispatcher(std::shared_ptr<const QuestStore> quests,
                              const ContentReferences* references = nullptr);

    ActionResult apply(const DialogueAction& action, GameStateHandle& state);

    ActionListResult applyAll(const std::vector<DialogueAction>& actions, GameStateHandle& state);

    /**
     * Forward a gameplay event to the quest tracker
     */
    void notify(const QuestEvent& event, GameStateHandle& state);

    QuestTracker& tracker() { return tracker_; }
    const QuestTracker& tracker() const { return tracker_; }

    const QuestStore& questStore() const { return tracker_.store(); }

private:
    ActionResult checkItems(const std::vector<ItemStack>& items) const;

    QuestTracker tracker_;
    const ContentReferences* references_ = nullptr;
};

} // namespace Parley
