/**
 * ValidatorConfig.cpp
 */

#include "ValidatorConfig.h"
#include "CampaignSerializer.h"
#include <nlohmann/json.hpp>

namespace Parley {

bool ValidatorConfig::loadFromString(const std::string& text, std::string* error) {
    using json = nlohmann::json;

    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::exception& e) {
        if (error) *error = e.what();
        return false;
    }

    if (!doc.is_object()) {
        if (error) *error = "config document must be an object";
        return false;
    }

    ValidatorConfig loaded = *this;
    try {
        loaded.warningsAsErrors = doc.value("warningsAsErrors", warningsAsErrors);
        loaded.checkReachability = doc.value("checkReachability", checkReachability);
        loaded.checkReferences = doc.value("checkReferences", checkReferences);
        loaded.warnOnDeadEnds = doc.value("warnOnDeadEnds", warnOnDeadEnds);

        if (doc.contains("logLevel")) {
            const std::string name = doc.at("logLevel").get<std::string>();
            if (!parseLogLevel(name, loaded.logLevel)) {
                if (error) *error = "unknown log level '" + name + "'";
                return false;
            }
        }
    } catch (const json::exception& e) {
        if (error) *error = e.what();
        return false;
    }

    *this = loaded;
    return true;
}

bool ValidatorConfig::loadFromFile(const std::string& path, std::string* error) {
    std::string text;
    if (!CampaignSerializer::readFile(path, text, error)) {
        return false;
    }
    if (!loadFromString(text, error)) {
        if (error) *error = path + ": " + *error;
        return false;
    }
    return true;
}

} // namespace Parley
