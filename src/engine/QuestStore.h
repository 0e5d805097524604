/**
 * QuestStore.h
 *
 * Immutable, validated collection of quest definitions
 */

#pragma once

#include "DialogueStore.h"
#include "QuestTypes.h"
#include <memory>
#include <unordered_map>
#include <vector>

namespace Parley {

class QuestStore;

struct QuestStoreLoadResult {
    bool success = false;
    std::shared_ptr<const QuestStore> store;
    std::vector<LoadError> errors;
};

class QuestStore {
public:
    /**
     * Build a store. Rejects duplicate ids, stage numbers that are not 1..N in
     * order, and require-all stages without objectives.
     */
    static QuestStoreLoadResult load(std::vector<Quest> quests);

    /**
     * Empty store, for campaigns without quests
     */
    static std::shared_ptr<const QuestStore> empty();

    const Quest* getQuest(QuestId id) const;

    size_t questCount() const { return quests_.size(); }
    std::vector<QuestId> questIds() const;

    const std::unordered_map<QuestId, Quest>& quests() const { return quests_; }

private:
    struct Key {
        explicit Key() = default;
    };

public:
    /**
     * Only reachable through load(); the key type is private
     */
    explicit QuestStore(Key) {}

private:

    std::unordered_map<QuestId, Quest> quests_;
};

} // namespace Parley
