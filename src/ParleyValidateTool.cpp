/**
 * ParleyValidateTool.cpp
 *
 * Command-line gate for campaign dialogue and quest content.
 * Loads the JSON documents, runs the validator and prints every finding.
 *
 * Usage:
 *   parley_validate --dialogues dialogues.json
 *   parley_validate --dialogues dialogues.json --quests quests.json --references references.json
 *   parley_validate --dialogues dialogues.json --config validate.json --warnings-as-errors
 *
 * Exit codes: 0 no errors, 1 errors found, 2 usage or load failure
 */

#include "engine/CampaignSerializer.h"
#include "engine/DialogueValidator.h"
#include "engine/ValidatorConfig.h"
#include "engine/core/Log.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr int kExitClean = 0;
constexpr int kExitFindings = 1;
constexpr int kExitUsage = 2;

// ============================================================================
// COMMAND LINE PARSING
// ============================================================================

struct ValidateOptions {
    std::string dialoguesPath;
    std::string questsPath;
    std::string referencesPath;
    std::string configPath;
    bool warningsAsErrors = false;
    bool quiet = false;
    bool verbose = false;
};

void printUsage(const char* programName) {
    std::cout << "Parley content validator\n";
    std::cout << "\nUsage:\n";
    std::cout << "  " << programName << " --dialogues <file> [options]\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -d, --dialogues <file>    Dialogue trees (JSON array)\n";
    std::cout << "  -q, --quests <file>       Quests (JSON array)\n";
    std::cout << "  -r, --references <file>   Campaign id sets (monsters, items, npcs, maps, shops, characters)\n";
    std::cout << "  -c, --config <file>       Validator settings (JSON)\n";
    std::cout << "  --warnings-as-errors      Fail when any warning is reported\n";
    std::cout << "  --quiet                   Only print errors and the summary\n";
    std::cout << "  -v, --verbose             Debug logging\n";
    std::cout << "\nExit codes:\n";
    std::cout << "  0  no errors\n";
    std::cout << "  1  errors found\n";
    std::cout << "  2  usage or load failure\n";
    std::cout << "\n";
}

bool parseArgs(int argc, char* argv[], ValidateOptions& options) {
    if (argc < 2) {
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto takeValue = [&](std::string& target) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument\n";
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            return false;
        } else if (arg == "-d" || arg == "--dialogues") {
            if (!takeValue(options.dialoguesPath)) return false;
        } else if (arg == "-q" || arg == "--quests") {
            if (!takeValue(options.questsPath)) return false;
        } else if (arg == "-r" || arg == "--references") {
            if (!takeValue(options.referencesPath)) return false;
        } else if (arg == "-c" || arg == "--config") {
            if (!takeValue(options.configPath)) return false;
        } else if (arg == "--warnings-as-errors") {
            options.warningsAsErrors = true;
        } else if (arg == "--quiet") {
            options.quiet = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
    }

    if (options.dialoguesPath.empty()) {
        std::cerr << "Error: No dialogue file specified\n";
        return false;
    }

    if (options.quiet && options.verbose) {
        std::cerr << "Error: --quiet and --verbose are mutually exclusive\n";
        return false;
    }

    return true;
}

} // namespace

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char* argv[]) {
    using namespace Parley;

    ValidateOptions options;
    if (!parseArgs(argc, argv, options)) {
        printUsage(argv[0]);
        return kExitUsage;
    }

    ValidatorConfig config;
    std::string error;
    if (!options.configPath.empty() && !config.loadFromFile(options.configPath, &error)) {
        std::cerr << "Error loading config: " << error << "\n";
        return kExitUsage;
    }

    // Command line overrides the config file
    if (options.warningsAsErrors) config.warningsAsErrors = true;
    if (options.verbose) config.logLevel = LogLevel::Debug;
    if (options.quiet) config.logLevel = LogLevel::Error;
    setLogLevel(config.logLevel);

    std::vector<DialogueTree> trees;
    if (!CampaignSerializer::loadDialogues(options.dialoguesPath, trees, &error)) {
        std::cerr << "Error loading dialogues: " << error << "\n";
        return kExitUsage;
    }

    std::vector<Quest> quests;
    if (!options.questsPath.empty() &&
        !CampaignSerializer::loadQuests(options.questsPath, quests, &error)) {
        std::cerr << "Error loading quests: " << error << "\n";
        return kExitUsage;
    }

    ContentReferences references;
    if (!options.referencesPath.empty() &&
        !CampaignSerializer::loadReferences(options.referencesPath, references, &error)) {
        std::cerr << "Error loading references: " << error << "\n";
        return kExitUsage;
    }

    PARLEY_LOG_INFO("Validating %zu dialogue trees and %zu quests", trees.size(), quests.size());

    DialogueValidator validator(references, config.validatorOptions());
    std::vector<ValidationFinding> findings = validator.validate(trees, quests);

    for (const auto& finding : findings) {
        if (options.quiet && finding.severity != Severity::Error) continue;

        if (finding.severity == Severity::Error) {
            std::cerr << formatFinding(finding) << "\n";
        } else {
            std::cout << formatFinding(finding) << "\n";
        }
    }

    const size_t errorCount = countBySeverity(findings, Severity::Error);
    const size_t warningCount = countBySeverity(findings, Severity::Warning);

    std::cout << "\n";
    std::cout << "==================\n";
    std::cout << "Validation complete\n";
    std::cout << "  Dialogues: " << trees.size() << "\n";
    std::cout << "  Quests:    " << quests.size() << "\n";
    std::cout << "  Errors:    " << errorCount << "\n";
    std::cout << "  Warnings:  " << warningCount << "\n";

    if (errorCount > 0) {
        return kExitFindings;
    }
    if (config.warningsAsErrors && warningCount > 0) {
        std::cout << "Warnings treated as errors\n";
        return kExitFindings;
    }
    return kExitClean;
}
