/**
 * QuestTypes.h
 *
 * Quest content model and per-player quest progress
 *
 * Features:
 * - Ordered stages, each with AND/OR objective sets
 * - Objective variants (talk, kill, collect, reach, deliver, escort, flag)
 * - Level bounds and prerequisite quests
 * - Rewards applied on completion
 */

#pragma once

#include "ContentTypes.h"
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace Parley {

// ============================================================================
// QUEST OBJECTIVES
// ============================================================================

namespace Objectives {

struct TalkToNpc {
    NpcId npcId = 0;
    MapId mapId = 0;
};

struct KillMonsters {
    MonsterId monsterId = 0;
    uint16_t quantity = 1;
};

struct CollectItems {
    ItemId itemId = 0;
    uint16_t quantity = 1;
};

struct ReachLocation {
    MapId mapId = 0;
    Position position = Position(0);
    uint8_t radius = 0;
};

struct DeliverItem {
    ItemId itemId = 0;
    NpcId npcId = 0;
    uint16_t quantity = 1;
};

struct EscortNpc {
    NpcId npcId = 0;
    MapId mapId = 0;
    Position position = Position(0);
};

struct CustomFlag {
    std::string flagName;
    bool requiredValue = true;
};

} // namespace Objectives

/**
 * One measurable requirement of a quest stage
 */
struct QuestObjective {
    using Variant = std::variant<
        Objectives::TalkToNpc,
        Objectives::KillMonsters,
        Objectives::CollectItems,
        Objectives::ReachLocation,
        Objectives::DeliverItem,
        Objectives::EscortNpc,
        Objectives::CustomFlag>;

    Variant kind;

    QuestObjective() = default;

    template<typename T,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, QuestObjective>>>
    QuestObjective(T&& value)
        : kind(std::forward<T>(value))
    {
    }

    template<typename T>
    const T* as() const { return std::get_if<T>(&kind); }

    /**
     * Counter value at which the objective is satisfied
     */
    uint32_t goalCount() const;

    std::string description() const;
};

// ============================================================================
// QUEST REWARDS
// ============================================================================

namespace Rewards {

struct Experience {
    uint32_t amount = 0;
};

struct Gold {
    uint32_t amount = 0;
};

struct Items {
    std::vector<ItemStack> items;
};

struct UnlockQuest {
    QuestId questId = 0;
};

struct SetFlag {
    std::string flagName;
    bool value = true;
};

struct Reputation {
    std::string faction;
    int16_t change = 0;
};

} // namespace Rewards

struct QuestReward {
    using Variant = std::variant<
        Rewards::Experience,
        Rewards::Gold,
        Rewards::Items,
        Rewards::UnlockQuest,
        Rewards::SetFlag,
        Rewards::Reputation>;

    Variant kind;

    QuestReward() = default;

    template<typename T,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, QuestReward>>>
    QuestReward(T&& value)
        : kind(std::forward<T>(value))
    {
    }

    template<typename T>
    const T* as() const { return std::get_if<T>(&kind); }

    std::string description() const;
};

// ============================================================================
// QUEST
// ============================================================================

/**
 * A stage of a quest. Stages complete in order.
 */
struct QuestStage {
    uint8_t stageNumber = 1;    // 1-based, must match position
    std::string name;
    std::string description;
    std::vector<QuestObjective> objectives;
    bool requireAllObjectives = true;   // false = any objective completes the stage
};

/**
 * A complete quest definition
 */
struct Quest {
    QuestId id = 0;
    std::string name;
    std::string description;
    std::vector<QuestStage> stages;
    std::vector<QuestReward> rewards;

    // Inclusive level bounds
    std::optional<uint8_t> minLevel;
    std::optional<uint8_t> maxLevel;

    std::vector<QuestId> requiredQuests;
    bool repeatable = false;
    bool isMainQuest = false;

    // Location binding (UI only)
    std::optional<NpcId> questGiverNpc;
    std::optional<MapId> questGiverMap;
    std::optional<Position> questGiverPosition;

    bool isAvailableForLevel(uint32_t level) const {
        if (minLevel && level < *minLevel) return false;
        if (maxLevel && level > *maxLevel) return false;
        return true;
    }

    /**
     * Stage by 1-based stage number, null when out of range
     */
    const QuestStage* getStage(uint8_t stageNumber) const {
        if (stageNumber == 0 || stageNumber > stages.size()) return nullptr;
        return &stages[stageNumber - 1];
    }

    size_t stageCount() const { return stages.size(); }
};

// ============================================================================
// QUEST PROGRESS
// ============================================================================

/**
 * Per-player progress through one quest. Owned by the game state.
 */
struct QuestProgress {
    QuestId questId = 0;
    uint8_t currentStage = 1;
    std::unordered_map<size_t, uint32_t> objectiveProgress;  // objective index -> count
    bool completed = false;
    bool turnedIn = false;
    uint32_t timesCompleted = 0;

    QuestProgress() = default;
    explicit QuestProgress(QuestId id)
        : questId(id)
    {
    }

    bool isActive() const { return !completed; }

    uint32_t getObjectiveProgress(size_t objectiveIndex) const {
        auto it = objectiveProgress.find(objectiveIndex);
        return it != objectiveProgress.end() ? it->second : 0;
    }

    void updateObjective(size_t objectiveIndex, uint32_t progress) {
        objectiveProgress[objectiveIndex] = progress;
    }

    void advanceStage() {
        ++currentStage;
        objectiveProgress.clear();
    }

    /**
     * Whether the given stage is behind the player
     */
    bool isStageCompleted(uint8_t stageNumber) const {
        return completed || timesCompleted > 0 || stageNumber < currentStage;
    }
};

} // namespace Parley
