/**
 * DialogueStore.cpp
 *
 * Dialogue store construction and lookup
 */

#include "DialogueStore.h"
#include "core/Log.h"
#include <algorithm>
#include <unordered_set>

namespace Parley {

const char* toString(LoadError::Code code) {
    switch (code) {
        case LoadError::Code::DuplicateId: return "DuplicateId";
        case LoadError::Code::MissingRootNode: return "MissingRootNode";
        case LoadError::Code::NodeIdMismatch: return "NodeIdMismatch";
        case LoadError::Code::NonSequentialStage: return "NonSequentialStage";
        case LoadError::Code::EmptyRequiredStage: return "EmptyRequiredStage";
    }
    return "Unknown";
}

DialogueStoreLoadResult DialogueStore::load(std::vector<DialogueTree> trees) {
    DialogueStoreLoadResult result;
    auto store = std::make_shared<DialogueStore>(Key{});
    std::unordered_set<DialogueId> seenIds;

    for (auto& tree : trees) {
        bool treeValid = true;

        if (!seenIds.insert(tree.id).second) {
            result.errors.push_back({LoadError::Code::DuplicateId,
                "Dialogue " + std::to_string(tree.id) + " is defined more than once"});
            continue;
        }

        if (tree.nodes.find(tree.rootNode) == tree.nodes.end()) {
            result.errors.push_back({LoadError::Code::MissingRootNode,
                "Dialogue " + std::to_string(tree.id) + " root node " +
                std::to_string(tree.rootNode) + " does not exist"});
            treeValid = false;
        }

        for (NodeId key : tree.sortedNodeIds()) {
            const DialogueNode& node = tree.nodes.at(key);
            if (node.id != key) {
                result.errors.push_back({LoadError::Code::NodeIdMismatch,
                    "Dialogue " + std::to_string(tree.id) + " node stored under key " +
                    std::to_string(key) + " has id " + std::to_string(node.id)});
                treeValid = false;
            }
        }

        if (treeValid) {
            DialogueId id = tree.id;
            store->trees_.emplace(id, std::move(tree));
        }
    }

    if (!result.errors.empty()) {
        for (const auto& error : result.errors) {
            PARLEY_LOG_ERROR("Dialogue store: %s", error.message.c_str());
        }
        return result;
    }

    PARLEY_LOG_DEBUG("Dialogue store loaded %zu trees", store->trees_.size());

    result.success = true;
    result.store = std::move(store);
    return result;
}

const DialogueTree* DialogueStore::getTree(DialogueId id) const {
    auto it = trees_.find(id);
    return it != trees_.end() ? &it->second : nullptr;
}

const DialogueNode* DialogueStore::getNode(DialogueId treeId, NodeId nodeId) const {
    const DialogueTree* tree = getTree(treeId);
    return tree ? tree->getNode(nodeId) : nullptr;
}

std::vector<DialogueId> DialogueStore::treeIds() const {
    std::vector<DialogueId> ids;
    ids.reserve(trees_.size());
    for (const auto& [id, tree] : trees_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace Parley
