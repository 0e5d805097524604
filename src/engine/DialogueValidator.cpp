/**
 * DialogueValidator.cpp
 *
 * Content validation implementation
 */

#include "DialogueValidator.h"
#include "core/Log.h"
#include <algorithm>
#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace Parley {

const char* toString(Severity severity) {
    switch (severity) {
        case Severity::Warning: return "WARNING";
        case Severity::Error: return "ERROR";
    }
    return "UNKNOWN";
}

std::string formatFinding(const ValidationFinding& finding) {
    std::string text = toString(finding.severity);
    text += " ";
    text += finding.code;

    std::string context;
    auto append = [&context](const std::string& part) {
        if (!context.empty()) context += ", ";
        context += part;
    };
    if (finding.dialogueId) append("dialogue " + std::to_string(*finding.dialogueId));
    if (finding.nodeId) append("node " + std::to_string(*finding.nodeId));
    if (finding.questId) append("quest " + std::to_string(*finding.questId));

    if (!context.empty()) {
        text += " [" + context + "]";
    }
    text += ": " + finding.message;
    return text;
}

bool hasErrors(const std::vector<ValidationFinding>& findings) {
    return countBySeverity(findings, Severity::Error) > 0;
}

size_t countBySeverity(const std::vector<ValidationFinding>& findings, Severity severity) {
    return static_cast<size_t>(std::count_if(findings.begin(), findings.end(),
        [severity](const ValidationFinding& f) { return f.severity == severity; }));
}

// ============================================================================
// STATIC CONDITION ANALYSIS
// ============================================================================

namespace {

bool isTautology(const DialogueCondition& condition);

bool hasContradictoryFlags(const std::vector<DialogueCondition>& conditions) {
    std::unordered_map<std::string, bool> required;
    for (const auto& condition : conditions) {
        const auto* flag = condition.as<Conditions::FlagSet>();
        if (!flag) continue;

        auto [it, inserted] = required.emplace(flag->flagName, flag->value);
        if (!inserted && it->second != flag->value) {
            return true;
        }
    }
    return false;
}

bool isTautology(const DialogueCondition& condition) {
    return std::visit([](const auto& c) -> bool {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, Conditions::HasItem>) {
            return c.quantity == 0;
        } else if constexpr (std::is_same_v<T, Conditions::HasGold>) {
            return c.amount == 0;
        } else if constexpr (std::is_same_v<T, Conditions::MinLevel>) {
            return c.level == 0;
        } else if constexpr (std::is_same_v<T, Conditions::And>) {
            return std::all_of(c.conditions.begin(), c.conditions.end(),
                               [](const DialogueCondition& inner) { return isTautology(inner); });
        } else if constexpr (std::is_same_v<T, Conditions::Or>) {
            return std::any_of(c.conditions.begin(), c.conditions.end(),
                               [](const DialogueCondition& inner) { return isTautology(inner); });
        } else if constexpr (std::is_same_v<T, Conditions::Not>) {
            return c.condition && DialogueValidator::isStaticallyUnsatisfiable(*c.condition);
        } else {
            return false;
        }
    }, condition.kind);
}

} // namespace

bool DialogueValidator::isStaticallyUnsatisfiable(const DialogueCondition& condition) {
    return std::visit([](const auto& c) -> bool {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, Conditions::Unknown>) {
            return true;
        } else if constexpr (std::is_same_v<T, Conditions::And>) {
            return isStaticallyUnsatisfiable(c.conditions);
        } else if constexpr (std::is_same_v<T, Conditions::Or>) {
            return std::all_of(c.conditions.begin(), c.conditions.end(),
                [](const DialogueCondition& inner) { return isStaticallyUnsatisfiable(inner); });
        } else if constexpr (std::is_same_v<T, Conditions::Not>) {
            return !c.condition || isTautology(*c.condition);
        } else {
            return false;
        }
    }, condition.kind);
}

bool DialogueValidator::isStaticallyUnsatisfiable(const std::vector<DialogueCondition>& conditions) {
    for (const auto& condition : conditions) {
        if (isStaticallyUnsatisfiable(condition)) return true;
    }
    return hasContradictoryFlags(conditions);
}

// ============================================================================
// VALIDATION PASS
// ============================================================================

class DialogueValidator::Pass {
public:
    Pass(const ContentReferences& references, const Options& options)
        : refs_(references)
        , options_(options)
    {
    }

    std::vector<ValidationFinding> run(const std::vector<const DialogueTree*>& trees,
                                       const std::vector<const Quest*>& quests) {
        // Quest ids are indexed first so dialogue content can reference them
        std::unordered_set<QuestId> seenQuests;
        for (const Quest* quest : quests) {
            if (!seenQuests.insert(quest->id).second) {
                questError(quest->id, "duplicate-quest-id", "Quest id is defined more than once");
                continue;
            }
            quests_.emplace(quest->id, quest);
        }

        std::unordered_set<DialogueId> seenTrees;
        for (const DialogueTree* tree : trees) {
            if (!seenTrees.insert(tree->id).second) {
                add(Severity::Error, "duplicate-dialogue-id", tree->id, std::nullopt, std::nullopt,
                    "Dialogue id is defined more than once");
                continue;
            }
            checkTree(*tree);
        }

        for (const Quest* quest : quests) {
            if (quests_.at(quest->id) != quest) continue;
            checkQuest(*quest);
        }

        return std::move(findings_);
    }

private:
    // ========================================================================
    // Findings
    // ========================================================================

    void add(Severity severity, const char* code, std::optional<DialogueId> dialogueId,
             std::optional<NodeId> nodeId, std::optional<QuestId> questId, std::string message) {
        ValidationFinding finding;
        finding.severity = severity;
        finding.code = code;
        finding.dialogueId = dialogueId;
        finding.nodeId = nodeId;
        finding.questId = questId;
        finding.message = std::move(message);
        findings_.push_back(std::move(finding));
    }

    void nodeFinding(Severity severity, const char* code, std::string message) {
        add(severity, code, currentTree_, currentNode_, std::nullopt, std::move(message));
    }

    void questError(QuestId questId, const char* code, std::string message) {
        add(Severity::Error, code, std::nullopt, std::nullopt, questId, std::move(message));
    }

    // Routes a reference problem to the tree/node or quest being checked
    void referenceError(const char* code, std::string message) {
        if (currentQuest_) {
            add(Severity::Error, code, std::nullopt, std::nullopt, currentQuest_, std::move(message));
        } else {
            nodeFinding(Severity::Error, code, std::move(message));
        }
    }

    // ========================================================================
    // Reference checks
    // ========================================================================

    const Quest* checkQuestRef(QuestId questId) {
        auto it = quests_.find(questId);
        if (it == quests_.end()) {
            referenceError("unknown-quest", "Quest " + std::to_string(questId) + " does not exist");
            return nullptr;
        }
        return it->second;
    }

    void checkStageRef(QuestId questId, uint8_t stageNumber) {
        const Quest* quest = checkQuestRef(questId);
        if (quest && !quest->getStage(stageNumber)) {
            referenceError("unknown-quest-stage", "Quest " + std::to_string(questId) +
                           " has no stage " + std::to_string(stageNumber));
        }
    }

    void checkItem(ItemId id) {
        if (options_.checkReferences && !refs_.hasItem(id)) {
            referenceError("unknown-item", "Item " + std::to_string(id) + " does not exist");
        }
    }

    void checkItems(const std::vector<ItemStack>& items) {
        for (const auto& stack : items) checkItem(stack.itemId);
    }

    void checkMonster(MonsterId id) {
        if (options_.checkReferences && !refs_.hasMonster(id)) {
            referenceError("unknown-monster", "Monster " + std::to_string(id) + " does not exist");
        }
    }

    void checkNpc(NpcId id) {
        if (options_.checkReferences && !refs_.hasNpc(id)) {
            referenceError("unknown-npc", "NPC " + std::to_string(id) + " does not exist");
        }
    }

    void checkMap(MapId id) {
        if (options_.checkReferences && !refs_.hasMap(id)) {
            referenceError("unknown-map", "Map " + std::to_string(id) + " does not exist");
        }
    }

    void checkShop(ShopId id) {
        if (options_.checkReferences && !refs_.hasShop(id)) {
            referenceError("unknown-shop", "Shop " + std::to_string(id) + " does not exist");
        }
    }

    void checkCharacter(const std::string& id) {
        if (options_.checkReferences && !refs_.hasCharacter(id)) {
            referenceError("unknown-character", "Character '" + id + "' does not exist");
        }
    }

    void checkCondition(const DialogueCondition& condition) {
        std::visit([this](const auto& c) {
            using T = std::decay_t<decltype(c)>;

            if constexpr (std::is_same_v<T, Conditions::HasQuest> ||
                          std::is_same_v<T, Conditions::CompletedQuest>) {
                checkQuestRef(c.questId);
            } else if constexpr (std::is_same_v<T, Conditions::QuestStage>) {
                checkStageRef(c.questId, c.stageNumber);
            } else if constexpr (std::is_same_v<T, Conditions::HasItem>) {
                checkItem(c.itemId);
            } else if constexpr (std::is_same_v<T, Conditions::And> ||
                                 std::is_same_v<T, Conditions::Or>) {
                for (const auto& inner : c.conditions) checkCondition(inner);
            } else if constexpr (std::is_same_v<T, Conditions::Not>) {
                if (c.condition) {
                    checkCondition(*c.condition);
                } else {
                    referenceError("malformed-condition", "'not' condition has no operand");
                }
            } else if constexpr (std::is_same_v<T, Conditions::Unknown>) {
                referenceError("unknown-condition", "Condition '" + c.tag + "' is not recognised");
            }
        }, condition.kind);
    }

    void checkAction(const DialogueAction& action) {
        std::visit([this](const auto& a) {
            using T = std::decay_t<decltype(a)>;

            if constexpr (std::is_same_v<T, Actions::StartQuest>) {
                checkQuestRef(a.questId);
            } else if constexpr (std::is_same_v<T, Actions::CompleteQuestStage>) {
                checkStageRef(a.questId, a.stageNumber);
            } else if constexpr (std::is_same_v<T, Actions::GiveItems> ||
                                 std::is_same_v<T, Actions::TakeItems>) {
                checkItems(a.items);
            } else if constexpr (std::is_same_v<T, Actions::RecruitToParty> ||
                                 std::is_same_v<T, Actions::RecruitToInn>) {
                checkCharacter(a.characterId);
            } else if constexpr (std::is_same_v<T, Actions::OpenShop>) {
                checkShop(a.shopId);
            }
        }, action.kind);
    }

    void checkObjective(const QuestObjective& objective) {
        std::visit([this](const auto& o) {
            using T = std::decay_t<decltype(o)>;

            if constexpr (std::is_same_v<T, Objectives::TalkToNpc>) {
                checkNpc(o.npcId);
                checkMap(o.mapId);
            } else if constexpr (std::is_same_v<T, Objectives::KillMonsters>) {
                checkMonster(o.monsterId);
            } else if constexpr (std::is_same_v<T, Objectives::CollectItems>) {
                checkItem(o.itemId);
            } else if constexpr (std::is_same_v<T, Objectives::ReachLocation>) {
                checkMap(o.mapId);
            } else if constexpr (std::is_same_v<T, Objectives::DeliverItem>) {
                checkItem(o.itemId);
                checkNpc(o.npcId);
            } else if constexpr (std::is_same_v<T, Objectives::EscortNpc>) {
                checkNpc(o.npcId);
                checkMap(o.mapId);
            }
        }, objective.kind);
    }

    void checkReward(const QuestReward& reward) {
        if (const auto* items = reward.as<Rewards::Items>()) {
            checkItems(items->items);
        } else if (const auto* unlock = reward.as<Rewards::UnlockQuest>()) {
            checkQuestRef(unlock->questId);
        }
    }

    // ========================================================================
    // Dialogue trees
    // ========================================================================

    void checkTree(const DialogueTree& tree) {
        currentTree_ = tree.id;
        currentNode_.reset();
        currentQuest_.reset();

        const bool hasRoot = tree.getNode(tree.rootNode) != nullptr;
        if (!hasRoot) {
            nodeFinding(Severity::Error, "missing-root-node",
                        "Root node " + std::to_string(tree.rootNode) + " does not exist");
        }

        if (tree.associatedQuest && quests_.count(*tree.associatedQuest) == 0) {
            nodeFinding(Severity::Error, "unknown-associated-quest",
                        "Associated quest " + std::to_string(*tree.associatedQuest) +
                        " does not exist");
        }

        for (NodeId key : tree.sortedNodeIds()) {
            const DialogueNode& node = tree.nodes.at(key);
            currentNode_ = key;
            checkNode(tree, key, node);
        }
        currentNode_.reset();

        if (hasRoot && options_.checkReachability) {
            checkReachability(tree);
        }

        currentTree_.reset();
    }

    void checkNode(const DialogueTree& tree, NodeId key, const DialogueNode& node) {
        if (node.id != key) {
            nodeFinding(Severity::Error, "node-id-mismatch",
                        "Node stored under key " + std::to_string(key) +
                        " has id " + std::to_string(node.id));
        }

        if (node.text.empty()) {
            nodeFinding(Severity::Error, "empty-node-text", "Node text is empty");
        }

        if (!node.isTerminal && node.choices.empty() && options_.warnOnDeadEnds) {
            nodeFinding(Severity::Warning, "dead-end-node",
                        "Non-terminal node has no choices");
        }

        for (const auto& condition : node.conditions) checkCondition(condition);
        for (const auto& action : node.actions) checkAction(action);

        for (size_t i = 0; i < node.choices.size(); ++i) {
            const DialogueChoice& choice = node.choices[i];
            const std::string label = "Choice " + std::to_string(i);

            if (choice.targetNode) {
                if (!tree.getNode(*choice.targetNode)) {
                    nodeFinding(Severity::Error, "dangling-target",
                                label + " targets missing node " +
                                std::to_string(*choice.targetNode));
                }
            } else if (!choice.endsDialogue) {
                nodeFinding(Severity::Error, "missing-target",
                            label + " has no target and does not end the dialogue");
            }

            for (const auto& condition : choice.conditions) checkCondition(condition);
            for (const auto& action : choice.actions) checkAction(action);
        }
    }

    // Breadth-first walk; with respectConditions, edges that can never be
    // taken are skipped
    std::unordered_set<NodeId> reachableFrom(const DialogueTree& tree, bool respectConditions) const {
        std::unordered_set<NodeId> visited;
        std::deque<NodeId> frontier;
        visited.insert(tree.rootNode);
        frontier.push_back(tree.rootNode);

        while (!frontier.empty()) {
            const DialogueNode* node = tree.getNode(frontier.front());
            frontier.pop_front();
            if (!node || node->isTerminal) continue;

            for (const auto& choice : node->choices) {
                if (choice.leavesDialogue()) continue;

                const DialogueNode* target = tree.getNode(*choice.targetNode);
                if (!target) continue;

                if (respectConditions &&
                    (isStaticallyUnsatisfiable(choice.conditions) ||
                     isStaticallyUnsatisfiable(target->conditions))) {
                    continue;
                }

                if (visited.insert(*choice.targetNode).second) {
                    frontier.push_back(*choice.targetNode);
                }
            }
        }
        return visited;
    }

    void checkReachability(const DialogueTree& tree) {
        const auto structural = reachableFrom(tree, false);
        const auto satisfiable = reachableFrom(tree, true);

        for (NodeId key : tree.sortedNodeIds()) {
            const DialogueNode& node = tree.nodes.at(key);
            currentNode_ = key;

            if (structural.count(key) == 0) {
                if (!node.isTerminal) {
                    nodeFinding(Severity::Error, "unreachable-node",
                                "Node cannot be reached from root " +
                                std::to_string(tree.rootNode));
                }
            } else if (satisfiable.count(key) == 0) {
                nodeFinding(Severity::Warning, "gated-node",
                            "Node is only reachable through conditions that can never hold");
            }
        }
        currentNode_.reset();
    }

    // ========================================================================
    // Quests
    // ========================================================================

    void checkQuest(const Quest& quest) {
        currentQuest_ = quest.id;

        if (quest.stages.empty()) {
            add(Severity::Warning, "quest-without-stages", std::nullopt, std::nullopt, quest.id,
                "Quest has no stages");
        }

        for (size_t i = 0; i < quest.stages.size(); ++i) {
            const QuestStage& stage = quest.stages[i];
            if (static_cast<size_t>(stage.stageNumber) != i + 1) {
                questError(quest.id, "non-sequential-stage",
                           "Stage at position " + std::to_string(i + 1) + " is numbered " +
                           std::to_string(stage.stageNumber));
            }
            if (stage.requireAllObjectives && stage.objectives.empty()) {
                questError(quest.id, "empty-required-stage",
                           "Stage " + std::to_string(stage.stageNumber) +
                           " requires all objectives but has none");
            }
            for (const auto& objective : stage.objectives) checkObjective(objective);
        }

        if (quest.minLevel && quest.maxLevel && *quest.minLevel > *quest.maxLevel) {
            questError(quest.id, "invalid-level-range",
                       "Minimum level " + std::to_string(*quest.minLevel) +
                       " exceeds maximum level " + std::to_string(*quest.maxLevel));
        }

        for (QuestId required : quest.requiredQuests) {
            if (required == quest.id) {
                questError(quest.id, "self-required-quest", "Quest requires itself");
            } else if (quests_.count(required) == 0) {
                questError(quest.id, "unknown-required-quest",
                           "Required quest " + std::to_string(required) + " does not exist");
            }
        }

        for (const auto& reward : quest.rewards) checkReward(reward);

        if (quest.questGiverNpc) checkNpc(*quest.questGiverNpc);
        if (quest.questGiverMap) checkMap(*quest.questGiverMap);

        currentQuest_.reset();
    }

    const ContentReferences& refs_;
    const Options& options_;

    std::unordered_map<QuestId, const Quest*> quests_;
    std::vector<ValidationFinding> findings_;

    std::optional<DialogueId> currentTree_;
    std::optional<NodeId> currentNode_;
    std::optional<QuestId> currentQuest_;
};

// ============================================================================
// DIALOGUE VALIDATOR
// ============================================================================

DialogueValidator::DialogueValidator(ContentReferences references)
    : references_(std::move(references))
{
}

DialogueValidator::DialogueValidator(ContentReferences references, Options options)
    : references_(std::move(references))
    , options_(options)
{
}

std::vector<ValidationFinding> DialogueValidator::validate(const DialogueStore& dialogues,
                                                           const QuestStore& quests) const {
    std::vector<const DialogueTree*> treeList;
    for (DialogueId id : dialogues.treeIds()) {
        treeList.push_back(dialogues.getTree(id));
    }

    std::vector<const Quest*> questList;
    for (QuestId id : quests.questIds()) {
        questList.push_back(quests.getQuest(id));
    }

    Pass pass(references_, options_);
    auto findings = pass.run(treeList, questList);
    PARLEY_LOG_DEBUG("Validation found %zu errors, %zu warnings",
                     countBySeverity(findings, Severity::Error),
                     countBySeverity(findings, Severity::Warning));
    return findings;
}

std::vector<ValidationFinding> DialogueValidator::validate(const std::vector<DialogueTree>& trees,
                                                           const std::vector<Quest>& quests) const {
    std::vector<const DialogueTree*> treeList;
    treeList.reserve(trees.size());
    for (const auto& tree : trees) treeList.push_back(&tree);

    std::vector<const Quest*> questList;
    questList.reserve(quests.size());
    for (const auto& quest : quests) questList.push_back(&quest);

    Pass pass(references_, options_);
    auto findings = pass.run(treeList, questList);
    PARLEY_LOG_DEBUG("Validation found %zu errors, %zu warnings",
                     countBySeverity(findings, Severity::Error),
                     countBySeverity(findings, Severity::Warning));
    return findings;
}

} // namespace Parley
