/**
 * QuestTracker.h
 *
 * Quest progress rules
 *
 * Features:
 * - Start, abandon and turn in quests with level and prerequisite checks
 * - Gameplay events advance objectives of the current stage only
 * - AND/OR stage completion, stage advancement, reward application
 * - Callbacks for quest start, stage advancement and completion
 *
 * The tracker holds no per-player state. All progress lives in the
 * GameStateHandle passed to each call.
 */

#pragma once

#include "ActionResult.h"
#include "GameState.h"
#include "QuestStore.h"
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Parley {

// ============================================================================
// QUEST EVENTS
// ============================================================================

/**
 * Something that happened in the game world which may advance objectives
 */
struct QuestEvent {
    enum class Type {
        MonsterKilled,
        ItemCollected,
        LocationReached,
        NpcTalkedTo,
        ItemDelivered,
        EscortCompleted,
        FlagChanged
    };

    Type type = Type::MonsterKilled;

    MonsterId monsterId = 0;
    ItemId itemId = 0;
    NpcId npcId = 0;
    std::optional<MapId> mapId;     // None = any map
    Position position = Position(0);
    uint32_t count = 1;

    std::string flagName;
    bool flagValue = false;

    static QuestEvent monsterKilled(MonsterId monster, uint32_t count = 1);
    static QuestEvent itemCollected(ItemId item, uint32_t count = 1);
    static QuestEvent locationReached(MapId map, Position position);
    static QuestEvent npcTalkedTo(NpcId npc, std::optional<MapId> map = std::nullopt);
    static QuestEvent itemDelivered(ItemId item, NpcId npc, uint32_t count = 1);
    static QuestEvent escortCompleted(NpcId npc, MapId map, Position position);
    static QuestEvent flagChanged(const std::string& flag, bool value);
};

const char* toString(QuestEvent::Type type);

// ============================================================================
// QUEST TRACKER
// ============================================================================

class QuestTracker {
public:
    using QuestCallback = std::function<void(const Quest&)>;
    using StageCallback = std::function<void(const Quest&, uint8_t newStage)>;

    explicit QuestTracker(std::shared_ptr<const QuestStore> quests);

    const QuestStore& store() const { return *quests_; }

    /**
     * Begin a quest at stage 1.
     *
     * Already active: no-op. Completed and not repeatable: no-op.
     * Completed and repeatable: restarts. Level bounds and required quests
     * are checked before anything changes.
     */
    ActionResult startQuest(QuestId questId, GameStateHandle& state);

    /**
     * Whether startQuest would create or restart progress
     */
    ActionResult checkCanStart(QuestId questId, const GameStateView& state) const;

    /**
     * Feed a gameplay event to every active quest
     */
    void processEvent(const QuestEvent& event, GameStateHandle& state);

    /**
     * Mark the current stage finished regardless of its objectives.
     * Stages already behind the player are a no-op.
     */
    ActionResult completeStage(QuestId questId, uint8_t stageNumber, GameStateHandle& state);

    /**
     * Hand in a completed quest
     */
    ActionResult turnIn(QuestId questId, GameStateHandle& state);

    /**
     * Drop an active quest. Returns false if it was not active.
     */
    bool abandonQuest(QuestId questId, GameStateHandle& state);

    /**
     * Quests the player could start right now, ascending by id
     */
    std::vector<QuestId> availableQuests(const GameStateView& state) const;

    /**
     * Active quests, ascending by id
     */
    std::vector<QuestId> activeQuests(const GameStateView& state) const;

    void setOnQuestStarted(QuestCallback callback) { onQuestStarted_ = std::move(callback); }
    void setOnStageAdvanced(StageCallback callback) { onStageAdvanced_ = std::move(callback); }
    void setOnQuestCompleted(QuestCallback callback) { onQuestCompleted_ = std::move(callback); }

private:
    bool prerequisitesMet(const Quest& quest, const GameStateView& state) const;
    uint32_t eventContribution(const QuestEvent& event, const QuestObjective& objective) const;
    void dispatchEvent(const QuestEvent& event, GameStateHandle& state);

    void enterStage(const Quest& quest, QuestProgress& progress, const GameStateView& state);
    void settleStage(const Quest& quest, QuestProgress& progress, GameStateHandle& state);
    bool isStageSatisfied(const QuestStage& stage, const QuestProgress& progress) const;
    void completeQuest(const Quest& quest, QuestProgress& progress, GameStateHandle& state);
    void applyRewards(const Quest& quest, GameStateHandle& state);
    void drainPending(GameStateHandle& state);

    std::shared_ptr<const QuestStore> quests_;

    // Flag changes made by rewards, fed back in after the current event
    std::deque<QuestEvent> pending_;
    bool draining_ = false;

    QuestCallback onQuestStarted_;
    StageCallback onStageAdvanced_;
    QuestCallback onQuestCompleted_;
};

} // namespace Parley
