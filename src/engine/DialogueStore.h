/**
 * DialogueStore.h
 *
 * Immutable, validated collection of dialogue trees
 *
 * Built once at campaign load and shared read-only by every session.
 */

#pragma once

#include "DialogueTypes.h"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace Parley {

/**
 * A structural problem that prevents a store from being built
 */
struct LoadError {
    enum class Code {
        DuplicateId,
        MissingRootNode,
        NodeIdMismatch,
        NonSequentialStage,
        EmptyRequiredStage
    };

    Code code = Code::DuplicateId;
    std::string message;
};

const char* toString(LoadError::Code code);

class DialogueStore;

struct DialogueStoreLoadResult {
    bool success = false;
    std::shared_ptr<const DialogueStore> store;
    std::vector<LoadError> errors;
};

class DialogueStore {
public:
    /**
     * Build a store. Every problem found is reported; the store is only
     * produced when there are none.
     */
    static DialogueStoreLoadResult load(std::vector<DialogueTree> trees);

    const DialogueTree* getTree(DialogueId id) const;
    const DialogueNode* getNode(DialogueId treeId, NodeId nodeId) const;

    size_t treeCount() const { return trees_.size(); }

    /**
     * Tree ids in ascending order
     */
    std::vector<DialogueId> treeIds() const;

    const std::unordered_map<DialogueId, DialogueTree>& trees() const { return trees_; }

private:
    struct Key {
        explicit Key() = default;
    };

public:
    /**
     * Only reachable through load(); the key type is private
     */
    explicit DialogueStore(Key) {}

private:

    std::unordered_map<DialogueId, DialogueTree> trees_;
};

} // namespace Parley
