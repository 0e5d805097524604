/**
 * GameState.h
 *
 * Capability interfaces the dialogue runtime uses to read and change the
 * surrounding game's persistent state, plus an in-memory implementation.
 *
 * The runtime never holds the state globally: every evaluator, dispatcher and
 * session call receives the view or handle it works against.
 */

#pragma once

#include "ContentTypes.h"
#include "QuestTypes.h"
#include <functional>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace Parley {

// ============================================================================
// READ-ONLY VIEW
// ============================================================================

/**
 * Read-only capability used by condition evaluation
 */
class GameStateView {
public:
    virtual ~GameStateView() = default;

    /**
     * Flag value; unset flags read as false
     */
    virtual bool getFlag(const std::string& name) const = 0;

    virtual uint32_t getItemCount(ItemId itemId) const = 0;
    virtual uint32_t getGold() const = 0;
    virtual uint32_t getCharacterLevel() const = 0;
    virtual int32_t getReputation(const std::string& faction) const = 0;

    /**
     * Progress record for a quest the player has started, null otherwise
     */
    virtual const QuestProgress* getQuestProgress(QuestId questId) const = 0;

    virtual bool isQuestUnlocked(QuestId questId) const = 0;
    virtual bool isDialogueCompleted(DialogueId dialogueId) const = 0;

    bool isQuestActive(QuestId questId) const {
        const QuestProgress* progress = getQuestProgress(questId);
        return progress && progress->isActive();
    }

    bool isQuestCompleted(QuestId questId) const {
        const QuestProgress* progress = getQuestProgress(questId);
        return progress && (progress->completed || progress->timesCompleted > 0);
    }

    bool isQuestStageCompleted(QuestId questId, uint8_t stageNumber) const {
        const QuestProgress* progress = getQuestProgress(questId);
        return progress && progress->isStageCompleted(stageNumber);
    }
};

// ============================================================================
// MUTABLE HANDLE
// ============================================================================

/**
 * Mutable capability used by the action dispatcher and quest tracker.
 * Access is synchronous and non-reentrant.
 */
class GameStateHandle : public GameStateView {
public:
    virtual void setFlag(const std::string& name, bool value) = 0;

    virtual void addItem(ItemId itemId, uint32_t count) = 0;

    /**
     * Remove items; returns false and removes nothing if fewer are held
     */
    virtual bool removeItem(ItemId itemId, uint32_t count) = 0;

    virtual void addGold(uint32_t amount) = 0;
    virtual bool removeGold(uint32_t amount) = 0;
    virtual void addExperience(uint32_t amount) = 0;
    virtual void changeReputation(const std::string& faction, int32_t change) = 0;

    virtual QuestProgress* getQuestProgressMutable(QuestId questId) = 0;

    /**
     * Create (or reset) the progress record for a quest at stage 1
     */
    virtual QuestProgress& beginQuestProgress(QuestId questId) = 0;

    virtual void removeQuestProgress(QuestId questId) = 0;
    virtual void unlockQuest(QuestId questId) = 0;
    virtual void markDialogueCompleted(DialogueId dialogueId) = 0;

    // Requests forwarded to the outer game layer
    virtual void openShop(ShopId shopId) = 0;
    virtual void triggerEvent(const std::string& eventName) = 0;
    virtual void recruitToParty(const std::string& characterId) = 0;
    virtual void recruitToInn(const std::string& characterId, const std::string& innkeeperId) = 0;
};

// ============================================================================
// IN-MEMORY GAME STATE
// ============================================================================

/**
 * Self-contained game state used by tools and tests.
 *
 * Requests meant for the outer game (shops, events, recruitment) are
 * recorded in order and forwarded to the optional callbacks.
 */
class GameState : public GameStateHandle {
public:
    GameState() = default;

    // GameStateView
    bool getFlag(const std::string& name) const override;
    uint32_t getItemCount(ItemId itemId) const override;
    uint32_t getGold() const override { return gold; }
    uint32_t getCharacterLevel() const override { return level; }
    int32_t getReputation(const std::string& faction) const override;
    const QuestProgress* getQuestProgress(QuestId questId) const override;
    bool isQuestUnlocked(QuestId questId) const override;
    bool isDialogueCompleted(DialogueId dialogueId) const override;

    // GameStateHandle
    void setFlag(const std::string& name, bool value) override;
    void addItem(ItemId itemId, uint32_t count) override;
    bool removeItem(ItemId itemId, uint32_t count) override;
    void addGold(uint32_t amount) override;
    bool removeGold(uint32_t amount) override;
    void addExperience(uint32_t amount) override;
    void changeReputation(const std::string& faction, int32_t change) override;
    QuestProgress* getQuestProgressMutable(QuestId questId) override;
    QuestProgress& beginQuestProgress(QuestId questId) override;
    void removeQuestProgress(QuestId questId) override;
    void unlockQuest(QuestId questId) override;
    void markDialogueCompleted(DialogueId dialogueId) override;
    void openShop(ShopId shopId) override;
    void triggerEvent(const std::string& eventName) override;
    void recruitToParty(const std::string& characterId) override;
    void recruitToInn(const std::string& characterId, const std::string& innkeeperId) override;

    // Persistent state
    uint32_t level = 1;
    uint64_t experience = 0;
    uint32_t gold = 0;
    std::map<std::string, bool> flags;
    std::map<ItemId, uint32_t> inventory;
    std::map<std::string, int32_t> reputation;
    std::map<QuestId, QuestProgress> quests;
    std::set<QuestId> unlockedQuests;
    std::set<DialogueId> completedDialogues;

    // Outer-layer requests, in the order they were made
    std::vector<ShopId> openedShops;
    std::vector<std::string> triggeredEvents;
    std::vector<std::string> partyRecruits;
    std::vector<std::pair<std::string, std::string>> innRecruits;

    std::function<void(ShopId)> onOpenShop;
    std::function<void(const std::string&)> onTriggerEvent;
};

} // namespace Parley
