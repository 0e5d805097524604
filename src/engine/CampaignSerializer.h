/**
 * CampaignSerializer.h
 *
 * JSON encoding for campaign content and game state
 *
 * Documents:
 *   dialogues.json   - array of dialogue trees
 *   quests.json      - array of quests
 *   references.json  - id sets defined elsewhere in the campaign
 *   save documents   - GameState persistent fields
 *
 * Encoding is deterministic: store contents are written in id order and
 * object keys are sorted, so loading and re-saving yields identical text.
 * Parse functions never throw; they return false and fill in the error.
 */

#pragma once

#include "DialogueStore.h"
#include "GameState.h"
#include "QuestStore.h"
#include <string>
#include <vector>

namespace Parley {

class CampaignSerializer {
public:
    // Dialogues
    static std::string dialoguesToString(const std::vector<DialogueTree>& trees);
    static std::string dialoguesToString(const DialogueStore& store);
    static bool dialoguesFromString(const std::string& text, std::vector<DialogueTree>& out,
                                    std::string* error = nullptr);

    // Quests
    static std::string questsToString(const std::vector<Quest>& quests);
    static std::string questsToString(const QuestStore& store);
    static bool questsFromString(const std::string& text, std::vector<Quest>& out,
                                 std::string* error = nullptr);

    // Content references
    static std::string referencesToString(const ContentReferences& references);
    static bool referencesFromString(const std::string& text, ContentReferences& out,
                                     std::string* error = nullptr);

    // Game state (persistent fields only)
    static std::string gameStateToString(const GameState& state);
    static bool gameStateFromString(const std::string& text, GameState& out,
                                    std::string* error = nullptr);

    // Files
    static bool loadDialogues(const std::string& path, std::vector<DialogueTree>& out,
                              std::string* error = nullptr);
    static bool saveDialogues(const std::string& path, const std::vector<DialogueTree>& trees,
                              std::string* error = nullptr);
    static bool loadQuests(const std::string& path, std::vector<Quest>& out,
                           std::string* error = nullptr);
    static bool saveQuests(const std::string& path, const std::vector<Quest>& quests,
                           std::string* error = nullptr);
    static bool loadReferences(const std::string& path, ContentReferences& out,
                               std::string* error = nullptr);
    static bool loadGameState(const std::string& path, GameState& out,
                              std::string* error = nullptr);
    static bool saveGameState(const std::string& path, const GameState& state,
                              std::string* error = nullptr);

    static bool readFile(const std::string& path, std::string& out, std::string* error = nullptr);
    static bool writeFile(const std::string& path, const std::string& text,
                          std::string* error = nullptr);
};

} // namespace Parley
