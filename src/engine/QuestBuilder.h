/**
 * QuestBuilder.h
 *
 * Helper for building quests programmatically
 *
 * Usage:
 *   Quest quest = QuestBuilder(1)
 *       .name("Wolf Trouble")
 *       .minLevel(2)
 *       .stage("Thin the pack")
 *           .kill(7, 5)
 *       .stage("Report back")
 *           .talkTo(3, 1)
 *       .rewardGold(50)
 *       .build();
 *
 * Stages are numbered in the order they are added.
 */

#pragma once

#include "QuestTypes.h"
#include <string>

namespace Parley {

class QuestBuilder {
public:
    explicit QuestBuilder(QuestId id);

    QuestBuilder& name(const std::string& n);
    QuestBuilder& description(const std::string& d);
    QuestBuilder& repeatable(bool value = true);
    QuestBuilder& mainQuest(bool value = true);

    QuestBuilder& minLevel(uint8_t level);
    QuestBuilder& maxLevel(uint8_t level);
    QuestBuilder& prerequisite(QuestId questId);
    QuestBuilder& questGiver(NpcId npcId, MapId mapId, Position position);

    // Stages
    QuestBuilder& stage(const std::string& stageName, const std::string& stageDescription = "");

    /**
     * Current stage completes when any one objective is met
     */
    QuestBuilder& anyObjective();

    // Objectives (added to the current stage)
    QuestBuilder& talkTo(NpcId npcId, MapId mapId);
    QuestBuilder& kill(MonsterId monsterId, uint16_t quantity = 1);
    QuestBuilder& collect(ItemId itemId, uint16_t quantity = 1);
    QuestBuilder& reach(MapId mapId, Position position, uint8_t radius = 0);
    QuestBuilder& deliver(ItemId itemId, NpcId npcId, uint16_t quantity = 1);
    QuestBuilder& escort(NpcId npcId, MapId mapId, Position position);
    QuestBuilder& flag(const std::string& flagName, bool requiredValue = true);
    QuestBuilder& objective(QuestObjective objective);

    // Rewards
    QuestBuilder& rewardExperience(uint32_t amount);
    QuestBuilder& rewardGold(uint32_t amount);
    QuestBuilder& rewardItem(ItemId itemId, uint16_t quantity = 1);
    QuestBuilder& unlocks(QuestId questId);
    QuestBuilder& rewardFlag(const std::string& flagName, bool value = true);
    QuestBuilder& rewardReputation(const std::string& faction, int16_t change);

    Quest build();

private:
    QuestStage& currentStage();

    Quest quest_;
};

} // namespace Parley
