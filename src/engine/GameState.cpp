/**
 * GameState.cpp
 *
 * In-memory game state implementation
 */

#include "GameState.h"
#include <limits>

namespace Parley {

bool GameState::getFlag(const std::string& name) const {
    auto it = flags.find(name);
    return it != flags.end() && it->second;
}

uint32_t GameState::getItemCount(ItemId itemId) const {
    auto it = inventory.find(itemId);
    return it != inventory.end() ? it->second : 0;
}

int32_t GameState::getReputation(const std::string& faction) const {
    auto it = reputation.find(faction);
    return it != reputation.end() ? it->second : 0;
}

const QuestProgress* GameState::getQuestProgress(QuestId questId) const {
    auto it = quests.find(questId);
    return it != quests.end() ? &it->second : nullptr;
}

bool GameState::isQuestUnlocked(QuestId questId) const {
    return unlockedQuests.count(questId) > 0;
}

bool GameState::isDialogueCompleted(DialogueId dialogueId) const {
    return completedDialogues.count(dialogueId) > 0;
}

void GameState::setFlag(const std::string& name, bool value) {
    flags[name] = value;
}

void GameState::addItem(ItemId itemId, uint32_t count) {
    if (count == 0) return;
    uint32_t& held = inventory[itemId];
    uint32_t room = std::numeric_limits<uint32_t>::max() - held;
    held += count < room ? count : room;
}

bool GameState::removeItem(ItemId itemId, uint32_t count) {
    auto it = inventory.find(itemId);
    uint32_t held = it != inventory.end() ? it->second : 0;
    if (held < count) return false;
    if (count == 0) return true;

    it->second -= count;
    if (it->second == 0) {
        inventory.erase(it);
    }
    return true;
}

void GameState::addGold(uint32_t amount) {
    uint32_t room = std::numeric_limits<uint32_t>::max() - gold;
    gold += amount < room ? amount : room;
}

bool GameState::removeGold(uint32_t amount) {
    if (gold < amount) return false;
    gold -= amount;
    return true;
}

void GameState::addExperience(uint32_t amount) {
    experience += amount;
}

void GameState::changeReputation(const std::string& faction, int32_t change) {
    reputation[faction] += change;
}

QuestProgress* GameState::getQuestProgressMutable(QuestId questId) {
    auto it = quests.find(questId);
    return it != quests.end() ? &it->second : nullptr;
}

QuestProgress& GameState::beginQuestProgress(QuestId questId) {
    auto it = quests.find(questId);
    if (it == quests.end()) {
        it = quests.emplace(questId, QuestProgress(questId)).first;
        return it->second;
    }

    // Restart keeps the completion history
    QuestProgress& progress = it->second;
    progress.currentStage = 1;
    progress.objectiveProgress.clear();
    progress.completed = false;
    progress.turnedIn = false;
    return progress;
}

void GameState::removeQuestProgress(QuestId questId) {
    quests.erase(questId);
}

void GameState::unlockQuest(QuestId questId) {
    unlockedQuests.insert(questId);
}

void GameState::markDialogueCompleted(DialogueId dialogueId) {
    completedDialogues.insert(dialogueId);
}

void GameState::openShop(ShopId shopId) {
    openedShops.push_back(shopId);
    if (onOpenShop) onOpenShop(shopId);
}

void GameState::triggerEvent(const std::string& eventName) {
    triggeredEvents.push_back(eventName);
    if (onTriggerEvent) onTriggerEvent(eventName);
}

void GameState::recruitToParty(const std::string& characterId) {
    partyRecruits.push_back(characterId);
}

void GameState::recruitToInn(const std::string& characterId, const std::string& innkeeperId) {
    innRecruits.emplace_back(characterId, innkeeperId);
}

} // namespace Parley
