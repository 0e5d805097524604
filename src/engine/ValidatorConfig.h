/**
 * ValidatorConfig.h
 *
 * Settings for content validation runs, loadable from a JSON file
 *
 * {
 *   "warningsAsErrors": false,
 *   "checkReachability": true,
 *   "checkReferences": true,
 *   "warnOnDeadEnds": true,
 *   "logLevel": "info"
 * }
 */

#pragma once

#include "DialogueValidator.h"
#include "core/Log.h"
#include <string>

namespace Parley {

struct ValidatorConfig {
    bool warningsAsErrors = false;      // Any warning fails the run
    bool checkReachability = true;
    bool checkReferences = true;        // Against the reference sets
    bool warnOnDeadEnds = true;         // Non-terminal nodes without choices
    LogLevel logLevel = LogLevel::Info;

    DialogueValidator::Options validatorOptions() const {
        DialogueValidator::Options options;
        options.checkReachability = checkReachability;
        options.checkReferences = checkReferences;
        options.warnOnDeadEnds = warnOnDeadEnds;
        return options;
    }

    /**
     * Overlay the keys present in a JSON document; absent keys keep their
     * current values
     */
    bool loadFromString(const std::string& text, std::string* error = nullptr);
    bool loadFromFile(const std::string& path, std::string* error = nullptr);
};

} // namespace Parley
