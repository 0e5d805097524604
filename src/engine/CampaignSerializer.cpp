/**
 * CampaignSerializer.cpp
 *
 * JSON encoding implementation
 */

#include "CampaignSerializer.h"
#include "core/Log.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace Parley {

using json = nlohmann::json;

namespace {

void setError(std::string* error, const std::string& message) {
    if (error) *error = message;
}

// ============================================================================
// SHARED PIECES
// ============================================================================

json positionToJson(const Position& position) {
    return json::array({position.x, position.y});
}

Position positionFromJson(const json& j) {
    if (!j.is_array() || j.size() != 2) {
        throw std::runtime_error("position must be an [x, y] array");
    }
    return Position(checkedNumber<int>(j[0], "position"), checkedNumber<int>(j[1], "position"));
}

json itemsToJson(const std::vector<ItemStack>& items) {
    json array = json::array();
    for (const auto& stack : items) {
        array.push_back({{"itemId", stack.itemId}, {"quantity", stack.quantity}});
    }
    return array;
}

std::vector<ItemStack> itemsFromJson(const json& j) {
    std::vector<ItemStack> items;
    if (!j.contains("items")) return items;

    for (const auto& entry : j.at("items")) {
        ItemStack stack;
        stack.itemId = numberFrom(entry, "itemId", ItemId{0});
        stack.quantity = numberFrom(entry, "quantity", uint16_t{1});
        items.push_back(stack);
    }
    return items;
}

uint16_t idFromKey(const std::string& key) {
    size_t consumed = 0;
    unsigned long value = std::stoul(key, &consumed);
    if (consumed != key.size() || value > std::numeric_limits<uint16_t>::max()) {
        throw std::out_of_range("invalid id key '" + key + "'");
    }
    return static_cast<uint16_t>(value);
}

/**
 * Integer conversion that rejects values outside T instead of wrapping
 */
template<typename T>
T checkedNumber(const json& value, const char* key) {
    if (!value.is_number_integer()) {
        throw std::runtime_error(std::string("\"") + key + "\" must be an integer");
    }

    bool inRange = false;
    if (value.is_number_unsigned()) {
        inRange = value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<T>::max());
    } else {
        const int64_t v = value.get<int64_t>();
        inRange = v < 0 ? v >= static_cast<int64_t>(std::numeric_limits<T>::min())
                        : static_cast<uint64_t>(v) <= static_cast<uint64_t>(std::numeric_limits<T>::max());
    }
    if (!inRange) {
        throw std::out_of_range(std::string("\"") + key + "\" value " + value.dump() +
                                " is out of range");
    }
    return value.get<T>();
}

template<typename T>
T numberFrom(const json& j, const char* key, T fallback) {
    if (!j.contains(key)) return fallback;
    return checkedNumber<T>(j.at(key), key);
}

template<typename Container>
Container numbersFrom(const json& j, const char* key) {
    Container values;
    if (!j.contains(key)) return values;
    for (const auto& value : j.at(key)) {
        values.insert(values.end(), checkedNumber<typename Container::value_type>(value, key));
    }
    return values;
}

std::string typeOf(const json& j) {
    if (!j.contains("type") || !j.at("type").is_string()) {
        throw std::runtime_error("entry has no \"type\" tag");
    }
    return j.at("type").get<std::string>();
}

// ============================================================================
// CONDITIONS
// ============================================================================

json conditionToJson(const DialogueCondition& condition);
DialogueCondition conditionFromJson(const json& j);

json conditionsToJson(const std::vector<DialogueCondition>& conditions) {
    json array = json::array();
    for (const auto& condition : conditions) {
        array.push_back(conditionToJson(condition));
    }
    return array;
}

std::vector<DialogueCondition> conditionsFromJson(const json& parent, const char* key) {
    std::vector<DialogueCondition> conditions;
    if (!parent.contains(key)) return conditions;

    for (const auto& entry : parent.at(key)) {
        conditions.push_back(conditionFromJson(entry));
    }
    return conditions;
}

json conditionToJson(const DialogueCondition& condition) {
    return std::visit([](const auto& c) -> json {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, Conditions::HasQuest>) {
            return {{"type", "hasQuest"}, {"questId", c.questId}};
        } else if constexpr (std::is_same_v<T, Conditions::CompletedQuest>) {
            return {{"type", "completedQuest"}, {"questId", c.questId}};
        } else if constexpr (std::is_same_v<T, Conditions::QuestStage>) {
            return {{"type", "questStage"}, {"questId", c.questId}, {"stageNumber", c.stageNumber}};
        } else if constexpr (std::is_same_v<T, Conditions::HasItem>) {
            return {{"type", "hasItem"}, {"itemId", c.itemId}, {"quantity", c.quantity}};
        } else if constexpr (std::is_same_v<T, Conditions::HasGold>) {
            return {{"type", "hasGold"}, {"amount", c.amount}};
        } else if constexpr (std::is_same_v<T, Conditions::MinLevel>) {
            return {{"type", "minLevel"}, {"level", c.level}};
        } else if constexpr (std::is_same_v<T, Conditions::FlagSet>) {
            return {{"type", "flagSet"}, {"flagName", c.flagName}, {"value", c.value}};
        } else if constexpr (std::is_same_v<T, Conditions::ReputationThreshold>) {
            return {{"type", "reputationThreshold"}, {"faction", c.faction},
                    {"threshold", c.threshold}};
        } else if constexpr (std::is_same_v<T, Conditions::And>) {
            return {{"type", "and"}, {"conditions", conditionsToJson(c.conditions)}};
        } else if constexpr (std::is_same_v<T, Conditions::Or>) {
            return {{"type", "or"}, {"conditions", conditionsToJson(c.conditions)}};
        } else if constexpr (std::is_same_v<T, Conditions::Not>) {
            json j = {{"type", "not"}};
            if (c.condition) {
                j["condition"] = conditionToJson(*c.condition);
            }
            return j;
        } else if constexpr (std::is_same_v<T, Conditions::Unknown>) {
            if (c.payload.empty()) return {{"type", c.tag}};
            return json::parse(c.payload);
        } else {
            static_assert(kUnhandledAlternative<T>, "unhandled condition");
        }
    }, condition.kind);
}

DialogueCondition conditionFromJson(const json& j) {
    const std::string type = typeOf(j);

    if (type == "hasQuest") {
        return Conditions::HasQuest{numberFrom(j, "questId", QuestId{0})};
    } else if (type == "completedQuest") {
        return Conditions::CompletedQuest{numberFrom(j, "questId", QuestId{0})};
    } else if (type == "questStage") {
        return Conditions::QuestStage{numberFrom(j, "questId", QuestId{0}),
                                      numberFrom(j, "stageNumber", uint8_t{1})};
    } else if (type == "hasItem") {
        return Conditions::HasItem{numberFrom(j, "itemId", ItemId{0}), numberFrom(j, "quantity", uint16_t{1})};
    } else if (type == "hasGold") {
        return Conditions::HasGold{numberFrom(j, "amount", uint32_t{0})};
    } else if (type == "minLevel") {
        return Conditions::MinLevel{numberFrom(j, "level", uint8_t{1})};
    } else if (type == "flagSet") {
        return Conditions::FlagSet{j.value("flagName", std::string()), j.value("value", true)};
    } else if (type == "reputationThreshold") {
        return Conditions::ReputationThreshold{j.value("faction", std::string()),
                                               numberFrom(j, "threshold", int16_t{0})};
    } else if (type == "and") {
        return Conditions::And{conditionsFromJson(j, "conditions")};
    } else if (type == "or") {
        return Conditions::Or{conditionsFromJson(j, "conditions")};
    } else if (type == "not") {
        Conditions::Not negated;
        if (j.contains("condition")) {
            negated = negate(conditionFromJson(j.at("condition")));
        }
        return negated;
    }

    // Kept whole so the content round-trips; evaluates to false
    PARLEY_LOG_WARN("Unknown condition type '%s'", type.c_str());
    return Conditions::Unknown{type, j.dump()};
}

// ============================================================================
// ACTIONS
// ============================================================================

json actionToJson(const DialogueAction& action) {
    return std::visit([](const auto& a) -> json {
        using T = std::decay_t<decltype(a)>;

        if constexpr (std::is_same_v<T, Actions::StartQuest>) {
            return {{"type", "startQuest"}, {"questId", a.questId}};
        } else if constexpr (std::is_same_v<T, Actions::CompleteQuestStage>) {
            return {{"type", "completeQuestStage"}, {"questId", a.questId},
                    {"stageNumber", a.stageNumber}};
        } else if constexpr (std::is_same_v<T, Actions::GiveItems>) {
            return {{"type", "giveItems"}, {"items", itemsToJson(a.items)}};
        } else if constexpr (std::is_same_v<T, Actions::TakeItems>) {
            return {{"type", "takeItems"}, {"items", itemsToJson(a.items)}};
        } else if constexpr (std::is_same_v<T, Actions::GiveGold>) {
            return {{"type", "giveGold"}, {"amount", a.amount}};
        } else if constexpr (std::is_same_v<T, Actions::TakeGold>) {
            return {{"type", "takeGold"}, {"amount", a.amount}};
        } else if constexpr (std::is_same_v<T, Actions::SetFlag>) {
            return {{"type", "setFlag"}, {"flagName", a.flagName}, {"value", a.value}};
        } else if constexpr (std::is_same_v<T, Actions::ChangeReputation>) {
            return {{"type", "changeReputation"}, {"faction", a.faction}, {"change", a.change}};
        } else if constexpr (std::is_same_v<T, Actions::TriggerEvent>) {
            return {{"type", "triggerEvent"}, {"eventName", a.eventName}};
        } else if constexpr (std::is_same_v<T, Actions::GrantExperience>) {
            return {{"type", "grantExperience"}, {"amount", a.amount}};
        } else if constexpr (std::is_same_v<T, Actions::RecruitToParty>) {
            return {{"type", "recruitToParty"}, {"characterId", a.characterId}};
        } else if constexpr (std::is_same_v<T, Actions::RecruitToInn>) {
            return {{"type", "recruitToInn"}, {"characterId", a.characterId},
                    {"innkeeperId", a.innkeeperId}};
        } else if constexpr (std::is_same_v<T, Actions::OpenShop>) {
            return {{"type", "openShop"}, {"shopId", a.shopId}};
        } else {
            static_assert(kUnhandledAlternative<T>, "unhandled action");
        }
    }, action.kind);
}

DialogueAction actionFromJson(const json& j) {
    const std::string type = typeOf(j);

    if (type == "startQuest") {
        return Actions::StartQuest{numberFrom(j, "questId", QuestId{0})};
    } else if (type == "completeQuestStage") {
        return Actions::CompleteQuestStage{numberFrom(j, "questId", QuestId{0}),
                                           numberFrom(j, "stageNumber", uint8_t{1})};
    } else if (type == "giveItems") {
        return Actions::GiveItems{itemsFromJson(j)};
    } else if (type == "takeItems") {
        return Actions::TakeItems{itemsFromJson(j)};
    } else if (type == "giveGold") {
        return Actions::GiveGold{numberFrom(j, "amount", uint32_t{0})};
    } else if (type == "takeGold") {
        return Actions::TakeGold{numberFrom(j, "amount", uint32_t{0})};
    } else if (type == "setFlag") {
        return Actions::SetFlag{j.value("flagName", std::string()), j.value("value", true)};
    } else if (type == "changeReputation") {
        return Actions::ChangeReputation{j.value("faction", std::string()),
                                         numberFrom(j, "change", int16_t{0})};
    } else if (type == "triggerEvent") {
        return Actions::TriggerEvent{j.value("eventName", std::string())};
    } else if (type == "grantExperience") {
        return Actions::GrantExperience{numberFrom(j, "amount", uint32_t{0})};
    } else if (type == "recruitToParty") {
        return Actions::RecruitToParty{j.value("characterId", std::string())};
    } else if (type == "recruitToInn") {
        return Actions::RecruitToInn{j.value("characterId", std::string()),
                                     j.value("innkeeperId", std::string())};
    } else if (type == "openShop") {
        return Actions::OpenShop{numberFrom(j, "shopId", ShopId{0})};
    }

    throw std::runtime_error("unknown action type '" + type + "'");
}

json actionsToJson(const std::vector<DialogueAction>& actions) {
    json array = json::array();
    for (const auto& action : actions) {
        array.push_back(actionToJson(action));
    }
    return array;
}

std::vector<DialogueAction> actionsFromJson(const json& parent) {
    std::vector<DialogueAction> actions;
    if (!parent.contains("actions")) return actions;

    for (const auto& entry : parent.at("actions")) {
        actions.push_back(actionFromJson(entry));
    }
    return actions;
}

// ============================================================================
// DIALOGUE TREES
// ============================================================================

json treeToJson(const DialogueTree& tree) {
    json doc;
    doc["id"] = tree.id;
    doc["name"] = tree.name;
    doc["rootNode"] = tree.rootNode;
    doc["repeatable"] = tree.repeatable;
    if (tree.speakerName) doc["speakerName"] = *tree.speakerName;
    if (tree.associatedQuest) doc["associatedQuest"] = *tree.associatedQuest;

    // Keyed by id so a node whose id disagrees with its key survives a round trip
    json nodes = json::object();
    for (NodeId key : tree.sortedNodeIds()) {
        const DialogueNode& node = tree.nodes.at(key);

        json n;
        n["id"] = node.id;
        n["text"] = node.text;
        n["isTerminal"] = node.isTerminal;
        if (node.speakerOverride) n["speakerOverride"] = *node.speakerOverride;
        n["conditions"] = conditionsToJson(node.conditions);
        n["actions"] = actionsToJson(node.actions);

        n["choices"] = json::array();
        for (const auto& choice : node.choices) {
            json c;
            c["text"] = choice.text;
            if (choice.targetNode) c["targetNode"] = *choice.targetNode;
            c["endsDialogue"] = choice.endsDialogue;
            c["conditions"] = conditionsToJson(choice.conditions);
            c["actions"] = actionsToJson(choice.actions);
            n["choices"].push_back(c);
        }

        nodes[std::to_string(key)] = n;
    }
    doc["nodes"] = nodes;
    return doc;
}

DialogueTree treeFromJson(const json& doc) {
    DialogueTree tree;
    tree.id = numberFrom(doc, "id", DialogueId{0});
    tree.name = doc.value("name", "");
    tree.rootNode = numberFrom(doc, "rootNode", NodeId{0});
    tree.repeatable = doc.value("repeatable", true);
    if (doc.contains("speakerName")) tree.speakerName = doc.at("speakerName").get<std::string>();
    if (doc.contains("associatedQuest")) {
        tree.associatedQuest = checkedNumber<QuestId>(doc.at("associatedQuest"), "associatedQuest");
    }

    if (doc.contains("nodes")) {
        const json& nodes = doc.at("nodes");
        for (auto it = nodes.begin(); it != nodes.end(); ++it) {
            const NodeId key = idFromKey(it.key());
            const json& n = it.value();

            DialogueNode node;
            node.id = numberFrom(n, "id", key);
            node.text = n.value("text", "");
            node.isTerminal = n.value("isTerminal", false);
            if (n.contains("speakerOverride")) {
                node.speakerOverride = n.at("speakerOverride").get<std::string>();
            }
            node.conditions = conditionsFromJson(n, "conditions");
            node.actions = actionsFromJson(n);

            if (n.contains("choices")) {
                for (const auto& c : n.at("choices")) {
                    DialogueChoice choice;
                    choice.text = c.value("text", "");
                    if (c.contains("targetNode") && !c.at("targetNode").is_null()) {
                        choice.targetNode = checkedNumber<NodeId>(c.at("targetNode"), "targetNode");
                    }
                    choice.endsDialogue = c.value("endsDialogue", false);
                    choice.conditions = conditionsFromJson(c, "conditions");
                    choice.actions = actionsFromJson(c);
                    node.choices.push_back(std::move(choice));
                }
            }

            tree.nodes[key] = std::move(node);
        }
    }

    return tree;
}

// ============================================================================
// QUESTS
// ============================================================================

json objectiveToJson(const QuestObjective& objective) {
    return std::visit([](const auto& o) -> json {
        using T = std::decay_t<decltype(o)>;

        if constexpr (std::is_same_v<T, Objectives::TalkToNpc>) {
            return {{"type", "talkToNpc"}, {"npcId", o.npcId}, {"mapId", o.mapId}};
        } else if constexpr (std::is_same_v<T, Objectives::KillMonsters>) {
            return {{"type", "killMonsters"}, {"monsterId", o.monsterId}, {"quantity", o.quantity}};
        } else if constexpr (std::is_same_v<T, Objectives::CollectItems>) {
            return {{"type", "collectItems"}, {"itemId", o.itemId}, {"quantity", o.quantity}};
        } else if constexpr (std::is_same_v<T, Objectives::ReachLocation>) {
            return {{"type", "reachLocation"}, {"mapId", o.mapId},
                    {"position", positionToJson(o.position)}, {"radius", o.radius}};
        } else if constexpr (std::is_same_v<T, Objectives::DeliverItem>) {
            return {{"type", "deliverItem"}, {"itemId", o.itemId}, {"npcId", o.npcId},
                    {"quantity", o.quantity}};
        } else if constexpr (std::is_same_v<T, Objectives::EscortNpc>) {
            return {{"type", "escortNpc"}, {"npcId", o.npcId}, {"mapId", o.mapId},
                    {"position", positionToJson(o.position)}};
        } else if constexpr (std::is_same_v<T, Objectives::CustomFlag>) {
            return {{"type", "customFlag"}, {"flagName", o.flagName},
                    {"requiredValue", o.requiredValue}};
        } else {
            static_assert(kUnhandledAlternative<T>, "unhandled objective");
        }
    }, objective.kind);
}

QuestObjective objectiveFromJson(const json& j) {
    const std::string type = typeOf(j);

    if (type == "talkToNpc") {
        return Objectives::TalkToNpc{numberFrom(j, "npcId", NpcId{0}), numberFrom(j, "mapId", MapId{0})};
    } else if (type == "killMonsters") {
        return Objectives::KillMonsters{numberFrom(j, "monsterId", MonsterId{0}),
                                        numberFrom(j, "quantity", uint16_t{1})};
    } else if (type == "collectItems") {
        return Objectives::CollectItems{numberFrom(j, "itemId", ItemId{0}), numberFrom(j, "quantity", uint16_t{1})};
    } else if (type == "reachLocation") {
        Objectives::ReachLocation o;
        o.mapId = numberFrom(j, "mapId", MapId{0});
        if (j.contains("position")) o.position = positionFromJson(j.at("position"));
        o.radius = numberFrom(j, "radius", uint8_t{0});
        return o;
    } else if (type == "deliverItem") {
        return Objectives::DeliverItem{numberFrom(j, "itemId", ItemId{0}), numberFrom(j, "npcId", NpcId{0}),
                                       numberFrom(j, "quantity", uint16_t{1})};
    } else if (type == "escortNpc") {
        Objectives::EscortNpc o;
        o.npcId = numberFrom(j, "npcId", NpcId{0});
        o.mapId = numberFrom(j, "mapId", MapId{0});
        if (j.contains("position")) o.position = positionFromJson(j.at("position"));
        return o;
    } else if (type == "customFlag") {
        return Objectives::CustomFlag{j.value("flagName", std::string()),
                                      j.value("requiredValue", true)};
    }

    throw std::runtime_error("unknown objective type '" + type + "'");
}

json rewardToJson(const QuestReward& reward) {
    return std::visit([](const auto& r) -> json {
        using T = std::decay_t<decltype(r)>;

        if constexpr (std::is_same_v<T, Rewards::Experience>) {
            return {{"type", "experience"}, {"amount", r.amount}};
        } else if constexpr (std::is_same_v<T, Rewards::Gold>) {
            return {{"type", "gold"}, {"amount", r.amount}};
        } else if constexpr (std::is_same_v<T, Rewards::Items>) {
            return {{"type", "items"}, {"items", itemsToJson(r.items)}};
        } else if constexpr (std::is_same_v<T, Rewards::UnlockQuest>) {
            return {{"type", "unlockQuest"}, {"questId", r.questId}};
        } else if constexpr (std::is_same_v<T, Rewards::SetFlag>) {
            return {{"type", "setFlag"}, {"flagName", r.flagName}, {"value", r.value}};
        } else if constexpr (std::is_same_v<T, Rewards::Reputation>) {
            return {{"type", "reputation"}, {"faction", r.faction}, {"change", r.change}};
        } else {
            static_assert(kUnhandledAlternative<T>, "unhandled reward");
        }
    }, reward.kind);
}

QuestReward rewardFromJson(const json& j) {
    const std::string type = typeOf(j);

    if (type == "experience") {
        return Rewards::Experience{numberFrom(j, "amount", uint32_t{0})};
    } else if (type == "gold") {
        return Rewards::Gold{numberFrom(j, "amount", uint32_t{0})};
    } else if (type == "items") {
        return Rewards::Items{itemsFromJson(j)};
    } else if (type == "unlockQuest") {
        return Rewards::UnlockQuest{numberFrom(j, "questId", QuestId{0})};
    } else if (type == "setFlag") {
        return Rewards::SetFlag{j.value("flagName", std::string()), j.value("value", true)};
    } else if (type == "reputation") {
        return Rewards::Reputation{j.value("faction", std::string()),
                                   numberFrom(j, "change", int16_t{0})};
    }

    throw std::runtime_error("unknown reward type '" + type + "'");
}

json questToJson(const Quest& quest) {
    json doc;
    doc["id"] = quest.id;
    doc["name"] = quest.name;
    doc["description"] = quest.description;
    doc["repeatable"] = quest.repeatable;
    doc["isMainQuest"] = quest.isMainQuest;
    doc["requiredQuests"] = quest.requiredQuests;
    if (quest.minLevel) doc["minLevel"] = *quest.minLevel;
    if (quest.maxLevel) doc["maxLevel"] = *quest.maxLevel;
    if (quest.questGiverNpc) doc["questGiverNpc"] = *quest.questGiverNpc;
    if (quest.questGiverMap) doc["questGiverMap"] = *quest.questGiverMap;
    if (quest.questGiverPosition) doc["questGiverPosition"] = positionToJson(*quest.questGiverPosition);

    doc["stages"] = json::array();
    for (const auto& stage : quest.stages) {
        json s;
        s["stageNumber"] = stage.stageNumber;
        s["name"] = stage.name;
        s["description"] = stage.description;
        s["requireAllObjectives"] = stage.requireAllObjectives;
        s["objectives"] = json::array();
        for (const auto& objective : stage.objectives) {
            s["objectives"].push_back(objectiveToJson(objective));
        }
        doc["stages"].push_back(s);
    }

    doc["rewards"] = json::array();
    for (const auto& reward : quest.rewards) {
        doc["rewards"].push_back(rewardToJson(reward));
    }
    return doc;
}

Quest questFromJson(const json& doc) {
    Quest quest;
    quest.id = numberFrom(doc, "id", QuestId{0});
    quest.name = doc.value("name", "");
    quest.description = doc.value("description", "");
    quest.repeatable = doc.value("repeatable", false);
    quest.isMainQuest = doc.value("isMainQuest", false);
    quest.requiredQuests = numbersFrom<std::vector<QuestId>>(doc, "requiredQuests");
    if (doc.contains("minLevel")) quest.minLevel = checkedNumber<uint8_t>(doc.at("minLevel"), "minLevel");
    if (doc.contains("maxLevel")) quest.maxLevel = checkedNumber<uint8_t>(doc.at("maxLevel"), "maxLevel");
    if (doc.contains("questGiverNpc")) {
        quest.questGiverNpc = checkedNumber<NpcId>(doc.at("questGiverNpc"), "questGiverNpc");
    }
    if (doc.contains("questGiverMap")) {
        quest.questGiverMap = checkedNumber<MapId>(doc.at("questGiverMap"), "questGiverMap");
    }
    if (doc.contains("questGiverPosition")) {
        quest.questGiverPosition = positionFromJson(doc.at("questGiverPosition"));
    }

    if (doc.contains("stages")) {
        for (const auto& s : doc.at("stages")) {
            QuestStage stage;
            stage.stageNumber = numberFrom(s, "stageNumber", uint8_t{1});
            stage.name = s.value("name", "");
            stage.description = s.value("description", "");
            stage.requireAllObjectives = s.value("requireAllObjectives", true);
            if (s.contains("objectives")) {
                for (const auto& o : s.at("objectives")) {
                    stage.objectives.push_back(objectiveFromJson(o));
                }
            }
            quest.stages.push_back(std::move(stage));
        }
    }

    if (doc.contains("rewards")) {
        for (const auto& r : doc.at("rewards")) {
            quest.rewards.push_back(rewardFromJson(r));
        }
    }
    return quest;
}

// ============================================================================
// REFERENCES
// ============================================================================

template<typename T>
json sortedArray(const std::unordered_set<T>& values) {
    std::vector<T> sorted(values.begin(), values.end());
    std::sort(sorted.begin(), sorted.end());
    return json(sorted);
}

template<typename T>
void readSet(const json& doc, const char* key, std::unordered_set<T>& out) {
    out.clear();
    if (!doc.contains(key)) return;
    for (const auto& value : doc.at(key)) {
        if constexpr (std::is_integral_v<T>) {
            out.insert(checkedNumber<T>(value, key));
        } else {
            out.insert(value.get<T>());
        }
    }
}

json parseDocument(const std::string& text) {
    return json::parse(text);
}

} // namespace

// ============================================================================
// DIALOGUES
// ============================================================================

std::string CampaignSerializer::dialoguesToString(const std::vector<DialogueTree>& trees) {
    json doc = json::array();
    for (const auto& tree : trees) {
        doc.push_back(treeToJson(tree));
    }
    return doc.dump(2) + "\n";
}

std::string CampaignSerializer::dialoguesToString(const DialogueStore& store) {
    json doc = json::array();
    for (DialogueId id : store.treeIds()) {
        doc.push_back(treeToJson(*store.getTree(id)));
    }
    return doc.dump(2) + "\n";
}

bool CampaignSerializer::dialoguesFromString(const std::string& text, std::vector<DialogueTree>& out,
                                             std::string* error) {
    try {
        json doc = parseDocument(text);
        if (!doc.is_array()) {
            setError(error, "dialogue document must be an array of trees");
            return false;
        }

        std::vector<DialogueTree> trees;
        for (const auto& entry : doc) {
            trees.push_back(treeFromJson(entry));
        }
        out = std::move(trees);
        return true;
    } catch (const std::exception& e) {
        setError(error, e.what());
        return false;
    }
}

// ============================================================================
// QUESTS
// ============================================================================

std::string CampaignSerializer::questsToString(const std::vector<Quest>& quests) {
    json doc = json::array();
    for (const auto& quest : quests) {
        doc.push_back(questToJson(quest));
    }
    return doc.dump(2) + "\n";
}

std::string CampaignSerializer::questsToString(const QuestStore& store) {
    json doc = json::array();
    for (QuestId id : store.questIds()) {
        doc.push_back(questToJson(*store.getQuest(id)));
    }
    return doc.dump(2) + "\n";
}

bool CampaignSerializer::questsFromString(const std::string& text, std::vector<Quest>& out,
                                          std::string* error) {
    try {
        json doc = parseDocument(text);
        if (!doc.is_array()) {
            setError(error, "quest document must be an array of quests");
            return false;
        }

        std::vector<Quest> quests;
        for (const auto& entry : doc) {
            quests.push_back(questFromJson(entry));
        }
        out = std::move(quests);
        return true;
    } catch (const std::exception& e) {
        setError(error, e.what());
        return false;
    }
}

// ============================================================================
// REFERENCES
// ============================================================================

std::string CampaignSerializer::referencesToString(const ContentReferences& references) {
    json doc;
    doc["monsters"] = sortedArray(references.monsters);
    doc["items"] = sortedArray(references.items);
    doc["npcs"] = sortedArray(references.npcs);
    doc["maps"] = sortedArray(references.maps);
    doc["shops"] = sortedArray(references.shops);
    doc["characters"] = sortedArray(references.characters);
    return doc.dump(2) + "\n";
}

bool CampaignSerializer::referencesFromString(const std::string& text, ContentReferences& out,
                                              std::string* error) {
    try {
        json doc = parseDocument(text);
        if (!doc.is_object()) {
            setError(error, "reference document must be an object");
            return false;
        }

        ContentReferences references;
        readSet(doc, "monsters", references.monsters);
        readSet(doc, "items", references.items);
        readSet(doc, "npcs", references.npcs);
        readSet(doc, "maps", references.maps);
        readSet(doc, "shops", references.shops);
        readSet(doc, "characters", references.characters);
        out = std::move(references);
        return true;
    } catch (const std::exception& e) {
        setError(error, e.what());
        return false;
    }
}

// ============================================================================
// GAME STATE
// ============================================================================

std::string CampaignSerializer::gameStateToString(const GameState& state) {
    json doc;
    doc["level"] = state.level;
    doc["experience"] = state.experience;
    doc["gold"] = state.gold;
    doc["flags"] = state.flags;
    doc["reputation"] = state.reputation;
    doc["unlockedQuests"] = state.unlockedQuests;
    doc["completedDialogues"] = state.completedDialogues;

    doc["inventory"] = json::array();
    for (const auto& [itemId, count] : state.inventory) {
        doc["inventory"].push_back({{"itemId", itemId}, {"quantity", count}});
    }

    doc["quests"] = json::array();
    for (const auto& [questId, progress] : state.quests) {
        json q;
        q["questId"] = questId;
        q["currentStage"] = progress.currentStage;
        q["completed"] = progress.completed;
        q["turnedIn"] = progress.turnedIn;
        q["timesCompleted"] = progress.timesCompleted;

        std::vector<std::pair<size_t, uint32_t>> counters(progress.objectiveProgress.begin(),
                                                           progress.objectiveProgress.end());
        std::sort(counters.begin(), counters.end());
        q["objectiveProgress"] = json::array();
        for (const auto& [index, count] : counters) {
            q["objectiveProgress"].push_back({{"index", index}, {"count", count}});
        }

        doc["quests"].push_back(q);
    }

    return doc.dump(2) + "\n";
}

bool CampaignSerializer::gameStateFromString(const std::string& text, GameState& out,
                                             std::string* error) {
    try {
        json doc = parseDocument(text);
        if (!doc.is_object()) {
            setError(error, "save document must be an object");
            return false;
        }

        GameState state;
        state.level = numberFrom(doc, "level", uint32_t{1});
        state.experience = numberFrom(doc, "experience", uint64_t{0});
        state.gold = numberFrom(doc, "gold", uint32_t{0});
        state.flags = doc.value("flags", std::map<std::string, bool>{});
        if (doc.contains("reputation")) {
            const json& reputation = doc.at("reputation");
            for (auto it = reputation.begin(); it != reputation.end(); ++it) {
                state.reputation[it.key()] = checkedNumber<int32_t>(it.value(), "reputation");
            }
        }
        state.unlockedQuests = numbersFrom<std::set<QuestId>>(doc, "unlockedQuests");
        state.completedDialogues = numbersFrom<std::set<DialogueId>>(doc, "completedDialogues");

        if (doc.contains("inventory")) {
            for (const auto& entry : doc.at("inventory")) {
                state.addItem(numberFrom(entry, "itemId", ItemId{0}), numberFrom(entry, "quantity", uint32_t{0}));
            }
        }

        if (doc.contains("quests")) {
            for (const auto& q : doc.at("quests")) {
                QuestProgress progress(numberFrom(q, "questId", QuestId{0}));
                progress.currentStage = numberFrom(q, "currentStage", uint8_t{1});
                progress.completed = q.value("completed", false);
                progress.turnedIn = q.value("turnedIn", false);
                progress.timesCompleted = numberFrom(q, "timesCompleted", uint32_t{0});
                if (q.contains("objectiveProgress")) {
                    for (const auto& counter : q.at("objectiveProgress")) {
                        progress.updateObjective(numberFrom(counter, "index", size_t{0}),
                                                 numberFrom(counter, "count", uint32_t{0}));
                    }
                }
                state.quests[progress.questId] = std::move(progress);
            }
        }

        // Keep callbacks the caller installed on the target
        state.onOpenShop = std::move(out.onOpenShop);
        state.onTriggerEvent = std::move(out.onTriggerEvent);
        out = std::move(state);
        return true;
    } catch (const std::exception& e) {
        setError(error, e.what());
        return false;
    }
}

// ============================================================================
// FILES
// ============================================================================

bool CampaignSerializer::readFile(const std::string& path, std::string& out, std::string* error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        setError(error, "cannot open '" + path + "'");
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

bool CampaignSerializer::writeFile(const std::string& path, const std::string& text,
                                   std::string* error) {
    std::ofstream file(path);
    if (!file.is_open()) {
        setError(error, "cannot write '" + path + "'");
        return false;
    }

    file << text;
    if (!file.good()) {
        setError(error, "write to '" + path + "' failed");
        return false;
    }
    return true;
}

bool CampaignSerializer::loadDialogues(const std::string& path, std::vector<DialogueTree>& out,
                                       std::string* error) {
    std::string text;
    if (!readFile(path, text, error)) return false;
    if (!dialoguesFromString(text, out, error)) {
        if (error) *error = path + ": " + *error;
        return false;
    }
    return true;
}

bool CampaignSerializer::saveDialogues(const std::string& path, const std::vector<DialogueTree>& trees,
                                       std::string* error) {
    return writeFile(path, dialoguesToString(trees), error);
}

bool CampaignSerializer::loadQuests(const std::string& path, std::vector<Quest>& out,
                                    std::string* error) {
    std::string text;
    if (!readFile(path, text, error)) return false;
    if (!questsFromString(text, out, error)) {
        if (error) *error = path + ": " + *error;
        return false;
    }
    return true;
}

bool CampaignSerializer::saveQuests(const std::string& path, const std::vector<Quest>& quests,
                                    std::string* error) {
    return writeFile(path, questsToString(quests), error);
}

bool CampaignSerializer::loadReferences(const std::string& path, ContentReferences& out,
                                        std::string* error) {
    std::string text;
    if (!readFile(path, text, error)) return false;
    if (!referencesFromString(text, out, error)) {
        if (error) *error = path + ": " + *error;
        return false;
    }
    return true;
}

bool CampaignSerializer::loadGameState(const std::string& path, GameState& out, std::string* error) {
    std::string text;
    if (!readFile(path, text, error)) return false;
    if (!gameStateFromString(text, out, error)) {
        if (error) *error = path + ": " + *error;
        return false;
    }
    return true;
}

bool CampaignSerializer::saveGameState(const std::string& path, const GameState& state,
                                       std::string* error) {
    return writeFile(path, gameStateToString(state), error);
}

} // namespace Parley
