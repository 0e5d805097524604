/**
 * DialogueValidator.h
 *
 * Build-time checks over dialogue and quest content
 *
 * Checks:
 * - Graph structure: targets resolve, roots exist, ids match keys
 * - Reachability from the root, ignoring conditions
 * - Nodes only reachable through conditions that can never hold
 * - Quest structure: stage numbering, levels, prerequisites
 * - Ids referenced by content resolve against the campaign's reference sets
 *
 * The validator never changes what it inspects and never runs a session.
 */

#pragma once

#include "DialogueStore.h"
#include "QuestStore.h"
#include <optional>
#include <string>
#include <vector>

namespace Parley {

enum class Severity {
    Warning,
    Error
};

const char* toString(Severity severity);

/**
 * One problem found in content
 */
struct ValidationFinding {
    Severity severity = Severity::Error;
    std::string code;                       // Stable kebab-case identifier
    std::optional<DialogueId> dialogueId;
    std::optional<NodeId> nodeId;
    std::optional<QuestId> questId;
    std::string message;
};

/**
 * Single-line rendering: "ERROR dangling-target [dialogue 1, node 2]: message"
 */
std::string formatFinding(const ValidationFinding& finding);

bool hasErrors(const std::vector<ValidationFinding>& findings);
size_t countBySeverity(const std::vector<ValidationFinding>& findings, Severity severity);

class DialogueValidator {
public:
    struct Options {
        bool checkReachability = true;
        bool checkReferences = true;    // Against ContentReferences; quest ids are always checked
        bool warnOnDeadEnds = true;
    };

    explicit DialogueValidator(ContentReferences references = {});
    DialogueValidator(ContentReferences references, Options options);

    std::vector<ValidationFinding> validate(const DialogueStore& dialogues,
                                            const QuestStore& quests) const;

    /**
     * Validate definitions that have not been through a store yet, so
     * problems a store would reject are reported alongside everything else
     */
    std::vector<ValidationFinding> validate(const std::vector<DialogueTree>& trees,
                                            const std::vector<Quest>& quests) const;

    /**
     * True when the condition can never hold, whatever the game state
     */
    static bool isStaticallyUnsatisfiable(const DialogueCondition& condition);
    static bool isStaticallyUnsatisfiable(const std::vector<DialogueCondition>& conditions);

    const ContentReferences& references() const { return references_; }
    const Options& options() const { return options_; }

private:
    class Pass;

    ContentReferences references_;
    Options options_;
};

} // namespace Parley
