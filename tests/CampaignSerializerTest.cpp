#include <gtest/gtest.h>

#include "TestSupport.h"
#include "engine/CampaignSerializer.h"
#include "engine/DialogueBuilder.h"
#include "engine/QuestBuilder.h"
#include <cstdio>

using namespace Parley;

namespace {

DialogueTree richTree() {
    return DialogueBuilder(7, "Smuggler")
        .speaker("Vess")
        .repeatable(false)
        .associatedQuest(3)
        .node(10, "Keep your voice down.")
            .gate(Conditions::Or{{Conditions::MinLevel{2}, Conditions::HasGold{5}}})
            .onEnter(Actions::TriggerEvent{"smuggler_met"})
            .choice("What are you selling?")
                .when(negate(Conditions::FlagSet{"guard_alerted", true}))
                .when(Conditions::ReputationThreshold{"underworld", -10})
                .action(Actions::TakeItems{{ItemStack{4, 2}, ItemStack{9, 1}}})
                .action(Actions::RecruitToInn{"vess", "innkeeper_ada"})
                .to(11)
            .choice("Goodbye.").ends()
        .node(11, "Only the finest.").speakerOverride("Vess, quietly")
            .choice("Deal.")
                .when(Conditions::And{{Conditions::HasQuest{3}, Conditions::QuestStage{3, 1}}})
                .action(Actions::CompleteQuestStage{3, 1})
                .action(Actions::ChangeReputation{"underworld", 5})
                .ends()
        .build();
}

Quest richQuest() {
    return QuestBuilder(3)
        .name("Contraband")
        .description("Move the goods past the watch")
        .mainQuest()
        .minLevel(2)
        .maxLevel(20)
        .prerequisite(1)
        .questGiver(44, 2, Position(12, -3))
        .stage("Collect the crates")
            .collect(4, 2)
            .kill(8, 3)
        .stage("Make the drop", "Any route will do")
            .anyObjective()
            .reach(2, Position(40, 41), 2)
            .escort(45, 2, Position(1, 1))
            .deliver(4, 46, 2)
            .flag("drop_made", false)
        .rewardExperience(300)
        .rewardItem(9, 2)
        .rewardFlag("smuggler_friend")
        .rewardReputation("watch", -5)
        .unlocks(6)
        .build();
}

} // namespace

TEST(CampaignSerializerTest, DialogueStoreRoundTripIsStable) {
    auto store = Fixtures::makeDialogueStore({richTree(), Fixtures::twoNodeTree()});
    const std::string first = CampaignSerializer::dialoguesToString(*store);

    std::vector<DialogueTree> parsed;
    std::string error;
    ASSERT_TRUE(CampaignSerializer::dialoguesFromString(first, parsed, &error)) << error;
    ASSERT_EQ(parsed.size(), 2u);

    auto reloaded = Fixtures::makeDialogueStore(std::move(parsed));
    EXPECT_EQ(CampaignSerializer::dialoguesToString(*reloaded), first);
}

TEST(CampaignSerializerTest, DialogueFieldsSurvive) {
    std::vector<DialogueTree> parsed;
    ASSERT_TRUE(CampaignSerializer::dialoguesFromString(
        CampaignSerializer::dialoguesToString(std::vector<DialogueTree>{richTree()}), parsed));
    ASSERT_EQ(parsed.size(), 1u);

    const DialogueTree& tree = parsed[0];
    EXPECT_EQ(tree.rootNode, 10);
    EXPECT_FALSE(tree.repeatable);
    EXPECT_EQ(tree.associatedQuest, std::optional<QuestId>(3));
    EXPECT_EQ(tree.speakerName, std::optional<std::string>("Vess"));

    const DialogueNode* node = tree.getNode(10);
    ASSERT_NE(node, nullptr);
    ASSERT_EQ(node->choices.size(), 2u);
    EXPECT_EQ(node->choices[0].targetNode, std::optional<NodeId>(11));
    EXPECT_TRUE(node->choices[1].leavesDialogue());
    ASSERT_EQ(node->choices[0].conditions.size(), 2u);

    const auto* negated = node->choices[0].conditions[0].as<Conditions::Not>();
    ASSERT_NE(negated, nullptr);
    ASSERT_NE(negated->condition, nullptr);
    const auto* flag = negated->condition->as<Conditions::FlagSet>();
    ASSERT_NE(flag, nullptr);
    EXPECT_EQ(flag->flagName, "guard_alerted");

    const auto* take = node->choices[0].actions[0].as<Actions::TakeItems>();
    ASSERT_NE(take, nullptr);
    ASSERT_EQ(take->items.size(), 2u);
    EXPECT_EQ(take->items[1].itemId, 9);

    EXPECT_EQ(tree.getNode(11)->speakerOverride, std::optional<std::string>("Vess, quietly"));
}

TEST(CampaignSerializerTest, QuestRoundTripIsStable) {
    auto store = Fixtures::makeQuestStore({richQuest()});
    const std::string first = CampaignSerializer::questsToString(*store);

    std::vector<Quest> parsed;
    std::string error;
    ASSERT_TRUE(CampaignSerializer::questsFromString(first, parsed, &error)) << error;
    ASSERT_EQ(parsed.size(), 1u);

    const Quest& quest = parsed[0];
    EXPECT_EQ(quest.questGiverPosition, std::optional<Position>(Position(12, -3)));
    ASSERT_EQ(quest.stages.size(), 2u);
    EXPECT_FALSE(quest.stages[1].requireAllObjectives);
    ASSERT_EQ(quest.stages[1].objectives.size(), 4u);

    const auto* reach = quest.stages[1].objectives[0].as<Objectives::ReachLocation>();
    ASSERT_NE(reach, nullptr);
    EXPECT_EQ(reach->radius, 2);
    EXPECT_EQ(reach->position, Position(40, 41));

    const auto* flag = quest.stages[1].objectives[3].as<Objectives::CustomFlag>();
    ASSERT_NE(flag, nullptr);
    EXPECT_FALSE(flag->requiredValue);

    EXPECT_EQ(CampaignSerializer::questsToString(parsed), first);
}

TEST(CampaignSerializerTest, UnknownConditionTypeIsKept) {
    const std::string text = R"([
        {"id": 1, "rootNode": 1, "nodes": {"1": {"text": "Hi", "isTerminal": false,
            "choices": [{"text": "Odd", "endsDialogue": true,
                         "conditions": [{"type": "moonPhase", "phase": "full"}]}]}}}
    ])";

    std::vector<DialogueTree> parsed;
    ASSERT_TRUE(CampaignSerializer::dialoguesFromString(text, parsed));
    ASSERT_EQ(parsed.size(), 1u);

    const auto& condition = parsed[0].getNode(1)->choices[0].conditions.at(0);
    const auto* unknown = condition.as<Conditions::Unknown>();
    ASSERT_NE(unknown, nullptr);
    EXPECT_EQ(unknown->tag, "moonPhase");

    // Fields of the unrecognised condition survive a save and reload
    const std::string saved = CampaignSerializer::dialoguesToString(parsed);
    EXPECT_NE(saved.find("\"phase\": \"full\""), std::string::npos);

    std::vector<DialogueTree> reloaded;
    ASSERT_TRUE(CampaignSerializer::dialoguesFromString(saved, reloaded));
    const auto* again = reloaded[0].getNode(1)->choices[0].conditions.at(0).as<Conditions::Unknown>();
    ASSERT_NE(again, nullptr);
    EXPECT_EQ(again->tag, "moonPhase");
    EXPECT_EQ(again->payload, unknown->payload);
    EXPECT_EQ(CampaignSerializer::dialoguesToString(reloaded), saved);
}

TEST(CampaignSerializerTest, OutOfRangeIdsFailTheLoad) {
    // 65537 would wrap to node 1, which exists
    const std::string badTarget = R"([
        {"id": 1, "rootNode": 1, "nodes": {"1": {"text": "Hi", "isTerminal": false,
            "choices": [{"text": "Go", "targetNode": 65537}]}}}
    ])";

    std::vector<DialogueTree> trees;
    std::string error;
    EXPECT_FALSE(CampaignSerializer::dialoguesFromString(badTarget, trees, &error));
    EXPECT_NE(error.find("targetNode"), std::string::npos);
    EXPECT_TRUE(trees.empty());

    error.clear();
    EXPECT_FALSE(CampaignSerializer::dialoguesFromString(
        R"([{"id": 1, "rootNode": -1, "nodes": {}}])", trees, &error));
    EXPECT_NE(error.find("rootNode"), std::string::npos);

    error.clear();
    EXPECT_FALSE(CampaignSerializer::dialoguesFromString(
        R"([{"id": 1, "rootNode": 1, "nodes": {"1": {"text": "Hi", "isTerminal": true,
            "actions": [{"type": "giveItems", "items": [{"itemId": 3, "quantity": 70000}]}]}}}])",
        trees, &error));
    EXPECT_NE(error.find("quantity"), std::string::npos);

    std::vector<Quest> quests;
    error.clear();
    EXPECT_FALSE(CampaignSerializer::questsFromString(
        R"([{"id": 2, "stages": [{"stageNumber": 257, "requireAllObjectives": false}]}])",
        quests, &error));
    EXPECT_NE(error.find("stageNumber"), std::string::npos);
    EXPECT_TRUE(quests.empty());

    error.clear();
    EXPECT_FALSE(CampaignSerializer::questsFromString(
        R"([{"id": 2, "requiredQuests": [1, 70000]}])", quests, &error));
    EXPECT_NE(error.find("requiredQuests"), std::string::npos);

    error.clear();
    EXPECT_FALSE(CampaignSerializer::questsFromString(
        R"([{"id": 2, "minLevel": "ten"}])", quests, &error));
    EXPECT_NE(error.find("minLevel"), std::string::npos);
}

TEST(CampaignSerializerTest, LargestIdsAreAccepted) {
    const std::string text = R"([
        {"id": 65535, "rootNode": 65535, "nodes": {"65535": {"text": "Edge", "isTerminal": true,
            "actions": [{"type": "changeReputation", "faction": "guild", "change": -32768}]}}}
    ])";

    std::vector<DialogueTree> trees;
    std::string error;
    ASSERT_TRUE(CampaignSerializer::dialoguesFromString(text, trees, &error)) << error;
    EXPECT_EQ(trees[0].id, 65535);
    EXPECT_EQ(trees[0].rootNode, 65535);

    const auto* change = trees[0].getNode(65535)->actions.at(0).as<Actions::ChangeReputation>();
    ASSERT_NE(change, nullptr);
    EXPECT_EQ(change->change, -32768);
}

TEST(CampaignSerializerTest, ParseFailuresLeaveOutputUntouched) {
    std::vector<DialogueTree> trees = {Fixtures::twoNodeTree()};
    std::string error;

    EXPECT_FALSE(CampaignSerializer::dialoguesFromString("{ not json", trees, &error));
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(trees.size(), 1u);

    error.clear();
    EXPECT_FALSE(CampaignSerializer::dialoguesFromString(R"({"id": 1})", trees, &error));
    EXPECT_FALSE(error.empty());

    const std::string badAction = R"([
        {"id": 1, "rootNode": 1, "nodes": {"1": {"text": "Hi",
            "actions": [{"type": "summonDragon"}], "isTerminal": true}}}
    ])";
    error.clear();
    EXPECT_FALSE(CampaignSerializer::dialoguesFromString(badAction, trees, &error));
    EXPECT_NE(error.find("summonDragon"), std::string::npos);
    EXPECT_EQ(trees.size(), 1u);

    std::vector<Quest> quests;
    EXPECT_FALSE(CampaignSerializer::questsFromString(
        R"([{"id": 2, "stages": [{"objectives": [{"type": "pray"}]}]}])", quests, &error));
    EXPECT_TRUE(quests.empty());
}

TEST(CampaignSerializerTest, References) {
    ContentReferences references;
    ASSERT_TRUE(CampaignSerializer::referencesFromString(
        R"({"items": [3, 1], "characters": ["mira"], "shops": []})", references));

    EXPECT_EQ(references.items.size(), 2u);
    EXPECT_TRUE(references.hasItem(3));
    EXPECT_FALSE(references.hasItem(2));
    EXPECT_TRUE(references.hasCharacter("mira"));
    EXPECT_TRUE(references.hasShop(12));

    ContentReferences reparsed;
    ASSERT_TRUE(CampaignSerializer::referencesFromString(
        CampaignSerializer::referencesToString(references), reparsed));
    EXPECT_EQ(reparsed.items, references.items);

    EXPECT_FALSE(CampaignSerializer::referencesFromString("[1, 2]", reparsed));
}

TEST(CampaignSerializerTest, GameStateSaveAndLoad) {
    GameState state;
    state.level = 6;
    state.experience = 1234;
    state.gold = 77;
    state.setFlag("met_elder", true);
    state.changeReputation("guild", -4);
    state.addItem(9, 2);
    state.unlockQuest(6);
    state.markDialogueCompleted(7);

    QuestProgress& progress = state.beginQuestProgress(3);
    progress.currentStage = 2;
    progress.updateObjective(2, 1);
    progress.updateObjective(0, 1);
    progress.timesCompleted = 1;

    const std::string path = ::testing::TempDir() + "parley_save_test.json";
    std::string error;
    ASSERT_TRUE(CampaignSerializer::saveGameState(path, state, &error)) << error;

    GameState loaded;
    int shopsOpened = 0;
    loaded.onOpenShop = [&shopsOpened](ShopId) { ++shopsOpened; };
    ASSERT_TRUE(CampaignSerializer::loadGameState(path, loaded, &error)) << error;
    std::remove(path.c_str());

    EXPECT_EQ(loaded.level, 6u);
    EXPECT_EQ(loaded.experience, 1234u);
    EXPECT_EQ(loaded.gold, 77u);
    EXPECT_TRUE(loaded.getFlag("met_elder"));
    EXPECT_EQ(loaded.getReputation("guild"), -4);
    EXPECT_EQ(loaded.getItemCount(9), 2u);
    EXPECT_TRUE(loaded.isQuestUnlocked(6));
    EXPECT_TRUE(loaded.isDialogueCompleted(7));

    const QuestProgress* restored = loaded.getQuestProgress(3);
    ASSERT_NE(restored, nullptr);
    EXPECT_EQ(restored->currentStage, 2);
    EXPECT_EQ(restored->getObjectiveProgress(2), 1u);
    EXPECT_EQ(restored->timesCompleted, 1u);
    EXPECT_TRUE(restored->isActive());

    EXPECT_EQ(CampaignSerializer::gameStateToString(loaded),
              CampaignSerializer::gameStateToString(state));

    loaded.openShop(1);
    EXPECT_EQ(shopsOpened, 1);
}

TEST(CampaignSerializerTest, MissingFileReportsError) {
    std::vector<Quest> quests;
    std::string error;
    EXPECT_FALSE(CampaignSerializer::loadQuests("/nonexistent/parley/quests.json", quests, &error));
    EXPECT_FALSE(error.empty());
}
