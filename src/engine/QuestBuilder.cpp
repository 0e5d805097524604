/**
 * QuestBuilder.cpp
 */

#include "QuestBuilder.h"
#include "core/Log.h"

namespace Parley {

QuestBuilder::QuestBuilder(QuestId id) {
    quest_.id = id;
}

QuestBuilder& QuestBuilder::name(const std::string& n) {
    quest_.name = n;
    return *this;
}

QuestBuilder& QuestBuilder::description(const std::string& d) {
    quest_.description = d;
    return *this;
}

QuestBuilder& QuestBuilder::repeatable(bool value) {
    quest_.repeatable = value;
    return *this;
}

QuestBuilder& QuestBuilder::mainQuest(bool value) {
    quest_.isMainQuest = value;
    return *this;
}

QuestBuilder& QuestBuilder::minLevel(uint8_t level) {
    quest_.minLevel = level;
    return *this;
}

QuestBuilder& QuestBuilder::maxLevel(uint8_t level) {
    quest_.maxLevel = level;
    return *this;
}

QuestBuilder& QuestBuilder::prerequisite(QuestId questId) {
    quest_.requiredQuests.push_back(questId);
    return *this;
}

QuestBuilder& QuestBuilder::questGiver(NpcId npcId, MapId mapId, Position position) {
    quest_.questGiverNpc = npcId;
    quest_.questGiverMap = mapId;
    quest_.questGiverPosition = position;
    return *this;
}

QuestBuilder& QuestBuilder::stage(const std::string& stageName, const std::string& stageDescription) {
    QuestStage stage;
    stage.stageNumber = static_cast<uint8_t>(quest_.stages.size() + 1);
    stage.name = stageName;
    stage.description = stageDescription;
    quest_.stages.push_back(std::move(stage));
    return *this;
}

QuestStage& QuestBuilder::currentStage() {
    if (quest_.stages.empty()) {
        PARLEY_LOG_WARN("QuestBuilder: quest %u objective added before any stage; adding stage 1",
                        static_cast<unsigned>(quest_.id));
        stage("Stage 1");
    }
    return quest_.stages.back();
}

QuestBuilder& QuestBuilder::anyObjective() {
    currentStage().requireAllObjectives = false;
    return *this;
}

QuestBuilder& QuestBuilder::talkTo(NpcId npcId, MapId mapId) {
    return objective(Objectives::TalkToNpc{npcId, mapId});
}

QuestBuilder& QuestBuilder::kill(MonsterId monsterId, uint16_t quantity) {
    return objective(Objectives::KillMonsters{monsterId, quantity});
}

QuestBuilder& QuestBuilder::collect(ItemId itemId, uint16_t quantity) {
    return objective(Objectives::CollectItems{itemId, quantity});
}

QuestBuilder& QuestBuilder::reach(MapId mapId, Position position, uint8_t radius) {
    return objective(Objectives::ReachLocation{mapId, position, radius});
}

QuestBuilder& QuestBuilder::deliver(ItemId itemId, NpcId npcId, uint16_t quantity) {
    return objective(Objectives::DeliverItem{itemId, npcId, quantity});
}

QuestBuilder& QuestBuilder::escort(NpcId npcId, MapId mapId, Position position) {
    return objective(Objectives::EscortNpc{npcId, mapId, position});
}

QuestBuilder& QuestBuilder::flag(const std::string& flagName, bool requiredValue) {
    return objective(Objectives::CustomFlag{flagName, requiredValue});
}

QuestBuilder& QuestBuilder::objective(QuestObjective objective) {
    currentStage().objectives.push_back(std::move(objective));
    return *this;
}

QuestBuilder& QuestBuilder::rewardExperience(uint32_t amount) {
    quest_.rewards.push_back(Rewards::Experience{amount});
    return *this;
}

QuestBuilder& QuestBuilder::rewardGold(uint32_t amount) {
    quest_.rewards.push_back(Rewards::Gold{amount});
    return *this;
}

QuestBuilder& QuestBuilder::rewardItem(ItemId itemId, uint16_t quantity) {
    // Consecutive item rewards share one entry
    if (!quest_.rewards.empty()) {
        if (auto* items = std::get_if<Rewards::Items>(&quest_.rewards.back().kind)) {
            items->items.push_back({itemId, quantity});
            return *this;
        }
    }

    Rewards::Items items;
    items.items.push_back({itemId, quantity});
    quest_.rewards.push_back(std::move(items));
    return *this;
}

QuestBuilder& QuestBuilder::unlocks(QuestId questId) {
    quest_.rewards.push_back(Rewards::UnlockQuest{questId});
    return *this;
}

QuestBuilder& QuestBuilder::rewardFlag(const std::string& flagName, bool value) {
    quest_.rewards.push_back(Rewards::SetFlag{flagName, value});
    return *this;
}

QuestBuilder& QuestBuilder::rewardReputation(const std::string& faction, int16_t change) {
    quest_.rewards.push_back(Rewards::Reputation{faction, change});
    return *this;
}

Quest QuestBuilder::build() {
    return std::move(quest_);
}

} // namespace Parley
