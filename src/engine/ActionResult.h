/**
 * ActionResult.h
 *
 * Outcome of a state-changing request (dialogue action, quest operation)
 */

#pragma once

#include <string>
#include <utility>

namespace Parley {

enum class ActionError {
    None,
    InvalidTarget,          // Referenced quest, stage, item, npc, shop or character does not exist
    PrerequisitesNotMet,    // Level bounds or required quests
    InsufficientResources   // Not enough gold or items to take
};

inline const char* toString(ActionError error) {
    switch (error) {
        case ActionError::None: return "None";
        case ActionError::InvalidTarget: return "InvalidTarget";
        case ActionError::PrerequisitesNotMet: return "PrerequisitesNotMet";
        case ActionError::InsufficientResources: return "InsufficientResources";
    }
    return "Unknown";
}

struct ActionResult {
    bool success = true;
    ActionError error = ActionError::None;
    std::string message;

    static ActionResult ok(std::string message = {}) {
        ActionResult result;
        result.message = std::move(message);
        return result;
    }

    static ActionResult failure(ActionError error, std::string message) {
        ActionResult result;
        result.success = false;
        result.error = error;
        result.message = std::move(message);
        return result;
    }
};

} // namespace Parley
