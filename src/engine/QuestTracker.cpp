/**
 * QuestTracker.cpp
 *
 * Quest progress rules implementation
 */

#include "QuestTracker.h"
#include "core/Log.h"
#include <algorithm>
#include <limits>

namespace Parley {

// ============================================================================
// QUEST EVENT
// ============================================================================

QuestEvent QuestEvent::monsterKilled(MonsterId monster, uint32_t count) {
    QuestEvent event;
    event.type = Type::MonsterKilled;
    event.monsterId = monster;
    event.count = count;
    return event;
}

QuestEvent QuestEvent::itemCollected(ItemId item, uint32_t count) {
    QuestEvent event;
    event.type = Type::ItemCollected;
    event.itemId = item;
    event.count = count;
    return event;
}

QuestEvent QuestEvent::locationReached(MapId map, Position position) {
    QuestEvent event;
    event.type = Type::LocationReached;
    event.mapId = map;
    event.position = position;
    return event;
}

QuestEvent QuestEvent::npcTalkedTo(NpcId npc, std::optional<MapId> map) {
    QuestEvent event;
    event.type = Type::NpcTalkedTo;
    event.npcId = npc;
    event.mapId = map;
    return event;
}

QuestEvent QuestEvent::itemDelivered(ItemId item, NpcId npc, uint32_t count) {
    QuestEvent event;
    event.type = Type::ItemDelivered;
    event.itemId = item;
    event.npcId = npc;
    event.count = count;
    return event;
}

QuestEvent QuestEvent::escortCompleted(NpcId npc, MapId map, Position position) {
    QuestEvent event;
    event.type = Type::EscortCompleted;
    event.npcId = npc;
    event.mapId = map;
    event.position = position;
    return event;
}

QuestEvent QuestEvent::flagChanged(const std::string& flag, bool value) {
    QuestEvent event;
    event.type = Type::FlagChanged;
    event.flagName = flag;
    event.flagValue = value;
    return event;
}

const char* toString(QuestEvent::Type type) {
    switch (type) {
        case QuestEvent::Type::MonsterKilled: return "MonsterKilled";
        case QuestEvent::Type::ItemCollected: return "ItemCollected";
        case QuestEvent::Type::LocationReached: return "LocationReached";
        case QuestEvent::Type::NpcTalkedTo: return "NpcTalkedTo";
        case QuestEvent::Type::ItemDelivered: return "ItemDelivered";
        case QuestEvent::Type::EscortCompleted: return "EscortCompleted";
        case QuestEvent::Type::FlagChanged: return "FlagChanged";
    }
    return "Unknown";
}

// ============================================================================
// QUEST TRACKER
// ============================================================================

QuestTracker::QuestTracker(std::shared_ptr<const QuestStore> quests)
    : quests_(quests ? std::move(quests) : QuestStore::empty())
{
}

ActionResult QuestTracker::checkCanStart(QuestId questId, const GameStateView& state) const {
    const Quest* quest = quests_->getQuest(questId);
    if (!quest) {
        return ActionResult::failure(ActionError::InvalidTarget,
            "Quest " + std::to_string(questId) + " does not exist");
    }

    if (!quest->isAvailableForLevel(state.getCharacterLevel())) {
        return ActionResult::failure(ActionError::PrerequisitesNotMet,
            "Quest " + std::to_string(questId) + " is not available at level " +
            std::to_string(state.getCharacterLevel()));
    }

    if (!prerequisitesMet(*quest, state)) {
        return ActionResult::failure(ActionError::PrerequisitesNotMet,
            "Quest " + std::to_string(questId) + " requires quests not yet completed");
    }

    return ActionResult::ok();
}

ActionResult QuestTracker::startQuest(QuestId questId, GameStateHandle& state) {
    const Quest* quest = quests_->getQuest(questId);
    if (!quest) {
        return ActionResult::failure(ActionError::InvalidTarget,
            "Quest " + std::to_string(questId) + " does not exist");
    }

    if (const QuestProgress* existing = state.getQuestProgress(questId)) {
        if (existing->isActive()) {
            return ActionResult::ok("Quest already active");
        }
        if (!quest->repeatable) {
            return ActionResult::ok("Quest already completed");
        }
    }

    ActionResult check = checkCanStart(questId, state);
    if (!check.success) {
        return check;
    }

    QuestProgress& progress = state.beginQuestProgress(questId);
    PARLEY_LOG_INFO("Quest %u '%s' started", static_cast<unsigned>(questId), quest->name.c_str());

    if (onQuestStarted_) {
        onQuestStarted_(*quest);
    }

    enterStage(*quest, progress, state);
    settleStage(*quest, progress, state);
    drainPending(state);

    return ActionResult::ok();
}

void QuestTracker::processEvent(const QuestEvent& event, GameStateHandle& state) {
    pending_.push_back(event);
    drainPending(state);
}

void QuestTracker::drainPending(GameStateHandle& state) {
    if (draining_) return;

    draining_ = true;
    while (!pending_.empty()) {
        QuestEvent event = std::move(pending_.front());
        pending_.pop_front();
        dispatchEvent(event, state);
    }
    draining_ = false;
}

void QuestTracker::dispatchEvent(const QuestEvent& event, GameStateHandle& state) {
    PARLEY_LOG_TRACE("Quest event %s", toString(event.type));

    for (QuestId questId : quests_->questIds()) {
        QuestProgress* progress = state.getQuestProgressMutable(questId);
        if (!progress || !progress->isActive()) continue;

        const Quest* quest = quests_->getQuest(questId);
        const QuestStage* stage = quest->getStage(progress->currentStage);
        if (!stage) {
            completeQuest(*quest, *progress, state);
            continue;
        }

        bool changed = false;
        for (size_t i = 0; i < stage->objectives.size(); ++i) {
            const QuestObjective& objective = stage->objectives[i];
            const uint32_t goal = objective.goalCount();
            const uint32_t current = progress->getObjectiveProgress(i);
            if (current >= goal) continue;

            uint32_t contribution = eventContribution(event, objective);
            if (contribution == 0) continue;

            uint32_t room = goal - current;
            progress->updateObjective(i, current + std::min(contribution, room));
            changed = true;
        }

        if (changed) {
            settleStage(*quest, *progress, state);
        }
    }
}

uint32_t QuestTracker::eventContribution(const QuestEvent& event,
                                         const QuestObjective& objective) const {
    return std::visit([&event](const auto& o) -> uint32_t {
        using T = std::decay_t<decltype(o)>;
        using Type = QuestEvent::Type;

        if constexpr (std::is_same_v<T, Objectives::TalkToNpc>) {
            if (event.type != Type::NpcTalkedTo || event.npcId != o.npcId) return 0;
            if (event.mapId && *event.mapId != o.mapId) return 0;
            return 1;
        } else if constexpr (std::is_same_v<T, Objectives::KillMonsters>) {
            if (event.type != Type::MonsterKilled || event.monsterId != o.monsterId) return 0;
            return event.count;
        } else if constexpr (std::is_same_v<T, Objectives::CollectItems>) {
            if (event.type != Type::ItemCollected || event.itemId != o.itemId) return 0;
            return event.count;
        } else if constexpr (std::is_same_v<T, Objectives::ReachLocation>) {
            if (event.type != Type::LocationReached) return 0;
            if (!event.mapId || *event.mapId != o.mapId) return 0;
            const int64_t dx = static_cast<int64_t>(event.position.x) - o.position.x;
            const int64_t dy = static_cast<int64_t>(event.position.y) - o.position.y;
            const int64_t r = o.radius;
            return dx * dx + dy * dy <= r * r ? 1 : 0;
        } else if constexpr (std::is_same_v<T, Objectives::DeliverItem>) {
            if (event.type != Type::ItemDelivered) return 0;
            if (event.itemId != o.itemId || event.npcId != o.npcId) return 0;
            return event.count;
        } else if constexpr (std::is_same_v<T, Objectives::EscortNpc>) {
            if (event.type != Type::EscortCompleted || event.npcId != o.npcId) return 0;
            if (!event.mapId || *event.mapId != o.mapId) return 0;
            return event.position == o.position ? 1 : 0;
        } else if constexpr (std::is_same_v<T, Objectives::CustomFlag>) {
            if (event.type != Type::FlagChanged || event.flagName != o.flagName) return 0;
            return event.flagValue == o.requiredValue ? 1 : 0;
        } else {
            static_assert(kUnhandledAlternative<T>, "unhandled objective");
        }
    }, objective.kind);
}

void QuestTracker::enterStage(const Quest& quest, QuestProgress& progress,
                              const GameStateView& state) {
    const QuestStage* stage = quest.getStage(progress.currentStage);
    if (!stage) return;

    // Flag objectives may already hold when the stage begins
    for (size_t i = 0; i < stage->objectives.size(); ++i) {
        if (const auto* flag = stage->objectives[i].as<Objectives::CustomFlag>()) {
            if (state.getFlag(flag->flagName) == flag->requiredValue) {
                progress.updateObjective(i, 1);
            }
        }
    }
}

bool QuestTracker::isStageSatisfied(const QuestStage& stage, const QuestProgress& progress) const {
    auto met = [&](size_t i) {
        return progress.getObjectiveProgress(i) >= stage.objectives[i].goalCount();
    };

    if (stage.requireAllObjectives) {
        for (size_t i = 0; i < stage.objectives.size(); ++i) {
            if (!met(i)) return false;
        }
        return true;
    }

    for (size_t i = 0; i < stage.objectives.size(); ++i) {
        if (met(i)) return true;
    }
    return false;
}

void QuestTracker::settleStage(const Quest& quest, QuestProgress& progress, GameStateHandle& state) {
    while (progress.isActive()) {
        const QuestStage* stage = quest.getStage(progress.currentStage);
        if (!stage) {
            completeQuest(quest, progress, state);
            return;
        }

        if (!isStageSatisfied(*stage, progress)) return;

        if (progress.currentStage < quest.stageCount()) {
            progress.advanceStage();
            PARLEY_LOG_INFO("Quest %u advanced to stage %u",
                            static_cast<unsigned>(quest.id),
                            static_cast<unsigned>(progress.currentStage));
            if (onStageAdvanced_) {
                onStageAdvanced_(quest, progress.currentStage);
            }
            enterStage(quest, progress, state);
        } else {
            completeQuest(quest, progress, state);
        }
    }
}

ActionResult QuestTracker::completeStage(QuestId questId, uint8_t stageNumber,
                                         GameStateHandle& state) {
    const Quest* quest = quests_->getQuest(questId);
    if (!quest) {
        return ActionResult::failure(ActionError::InvalidTarget,
            "Quest " + std::to_string(questId) + " does not exist");
    }

    if (!quest->getStage(stageNumber)) {
        return ActionResult::failure(ActionError::InvalidTarget,
            "Quest " + std::to_string(questId) + " has no stage " + std::to_string(stageNumber));
    }

    QuestProgress* progress = state.getQuestProgressMutable(questId);
    if (!progress) {
        return ActionResult::failure(ActionError::PrerequisitesNotMet,
            "Quest " + std::to_string(questId) + " has not been started");
    }

    if (!progress->isActive() || stageNumber < progress->currentStage) {
        return ActionResult::ok("Stage already completed");
    }

    if (stageNumber > progress->currentStage) {
        return ActionResult::failure(ActionError::PrerequisitesNotMet,
            "Quest " + std::to_string(questId) + " is on stage " +
            std::to_string(progress->currentStage) + ", not " + std::to_string(stageNumber));
    }

    if (progress->currentStage < quest->stageCount()) {
        progress->advanceStage();
        if (onStageAdvanced_) {
            onStageAdvanced_(*quest, progress->currentStage);
        }
        enterStage(*quest, *progress, state);
        settleStage(*quest, *progress, state);
    } else {
        completeQuest(*quest, *progress, state);
    }

    drainPending(state);
    return ActionResult::ok();
}

ActionResult QuestTracker::turnIn(QuestId questId, GameStateHandle& state) {
    if (!quests_->getQuest(questId)) {
        return ActionResult::failure(ActionError::InvalidTarget,
            "Quest " + std::to_string(questId) + " does not exist");
    }

    QuestProgress* progress = state.getQuestProgressMutable(questId);
    if (!progress || !progress->completed) {
        return ActionResult::failure(ActionError::PrerequisitesNotMet,
            "Quest " + std::to_string(questId) + " is not completed");
    }

    if (progress->turnedIn) {
        return ActionResult::ok("Quest already turned in");
    }

    progress->turnedIn = true;
    return ActionResult::ok();
}

bool QuestTracker::abandonQuest(QuestId questId, GameStateHandle& state) {
    QuestProgress* progress = state.getQuestProgressMutable(questId);
    if (!progress || !progress->isActive()) {
        return false;
    }

    if (progress->timesCompleted > 0) {
        // Abandoning a repeat run falls back to the earlier completion
        progress->completed = true;
        progress->objectiveProgress.clear();
    } else {
        state.removeQuestProgress(questId);
    }

    PARLEY_LOG_INFO("Quest %u abandoned", static_cast<unsigned>(questId));
    return true;
}

std::vector<QuestId> QuestTracker::availableQuests(const GameStateView& state) const {
    std::vector<QuestId> result;

    for (QuestId questId : quests_->questIds()) {
        const Quest* quest = quests_->getQuest(questId);
        if (const QuestProgress* progress = state.getQuestProgress(questId)) {
            if (progress->isActive()) continue;
            if (!quest->repeatable) continue;
        }

        if (checkCanStart(questId, state).success) {
            result.push_back(questId);
        }
    }

    return result;
}

std::vector<QuestId> QuestTracker::activeQuests(const GameStateView& state) const {
    std::vector<QuestId> result;
    for (QuestId questId : quests_->questIds()) {
        if (state.isQuestActive(questId)) {
            result.push_back(questId);
        }
    }
    return result;
}

bool QuestTracker::prerequisitesMet(const Quest& quest, const GameStateView& state) const {
    if (state.isQuestUnlocked(quest.id)) {
        return true;
    }

    for (QuestId required : quest.requiredQuests) {
        if (!state.isQuestCompleted(required)) {
            return false;
        }
    }
    return true;
}

void QuestTracker::completeQuest(const Quest& quest, QuestProgress& progress, GameStateHandle& state) {
    progress.completed = true;
    progress.turnedIn = false;
    if (progress.timesCompleted < std::numeric_limits<uint32_t>::max()) {
        ++progress.timesCompleted;
    }

    PARLEY_LOG_INFO("Quest %u '%s' completed", static_cast<unsigned>(quest.id), quest.name.c_str());

    applyRewards(quest, state);

    if (onQuestCompleted_) {
        onQuestCompleted_(quest);
    }
}

void QuestTracker::applyRewards(const Quest& quest, GameStateHandle& state) {
    for (const auto& reward : quest.rewards) {
        std::visit([&](const auto& r) {
            using T = std::decay_t<decltype(r)>;

            if constexpr (std::is_same_v<T, Rewards::Experience>) {
                state.addExperience(r.amount);
            } else if constexpr (std::is_same_v<T, Rewards::Gold>) {
                state.addGold(r.amount);
            } else if constexpr (std::is_same_v<T, Rewards::Items>) {
                for (const auto& stack : r.items) {
                    state.addItem(stack.itemId, stack.quantity);
                }
            } else if constexpr (std::is_same_v<T, Rewards::UnlockQuest>) {
                state.unlockQuest(r.questId);
            } else if constexpr (std::is_same_v<T, Rewards::SetFlag>) {
                if (state.getFlag(r.flagName) != r.value) {
                    state.setFlag(r.flagName, r.value);
                    pending_.push_back(QuestEvent::flagChanged(r.flagName, r.value));
                }
            } else if constexpr (std::is_same_v<T, Rewards::Reputation>) {
                state.changeReputation(r.faction, r.change);
            } else {
                static_assert(kUnhandledAlternative<T>, "unhandled reward");
            }
        }, reward.kind);
    }
}

} // namespace Parley
