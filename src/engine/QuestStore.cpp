/**
 * QuestStore.cpp
 *
 * Quest store construction and lookup
 */

#include "QuestStore.h"
#include "core/Log.h"
#include <algorithm>
#include <unordered_set>

namespace Parley {

QuestStoreLoadResult QuestStore::load(std::vector<Quest> quests) {
    QuestStoreLoadResult result;
    auto store = std::make_shared<QuestStore>(Key{});
    std::unordered_set<QuestId> seenIds;

    for (auto& quest : quests) {
        const std::string label = "Quest " + std::to_string(quest.id);

        if (!seenIds.insert(quest.id).second) {
            result.errors.push_back({LoadError::Code::DuplicateId,
                label + " is defined more than once"});
            continue;
        }

        bool questValid = true;
        for (size_t i = 0; i < quest.stages.size(); ++i) {
            const QuestStage& stage = quest.stages[i];
            const size_t expected = i + 1;

            if (static_cast<size_t>(stage.stageNumber) != expected) {
                result.errors.push_back({LoadError::Code::NonSequentialStage,
                    label + " stage at position " + std::to_string(expected) +
                    " is numbered " + std::to_string(stage.stageNumber)});
                questValid = false;
            }

            if (stage.requireAllObjectives && stage.objectives.empty()) {
                result.errors.push_back({LoadError::Code::EmptyRequiredStage,
                    label + " stage " + std::to_string(stage.stageNumber) +
                    " requires all objectives but has none"});
                questValid = false;
            }
        }

        if (questValid) {
            QuestId id = quest.id;
            store->quests_.emplace(id, std::move(quest));
        }
    }

    if (!result.errors.empty()) {
        for (const auto& error : result.errors) {
            PARLEY_LOG_ERROR("Quest store: %s", error.message.c_str());
        }
        return result;
    }

    PARLEY_LOG_DEBUG("Quest store loaded %zu quests", store->quests_.size());

    result.success = true;
    result.store = std::move(store);
    return result;
}

std::shared_ptr<const QuestStore> QuestStore::empty() {
    return std::make_shared<const QuestStore>(Key{});
}

const Quest* QuestStore::getQuest(QuestId id) const {
    auto it = quests_.find(id);
    return it != quests_.end() ? &it->second : nullptr;
}

std::vector<QuestId> QuestStore::questIds() const {
    std::vector<QuestId> ids;
    ids.reserve(quests_.size());
    for (const auto& [id, quest] : quests_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace Parley
