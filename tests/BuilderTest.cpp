#include <gtest/gtest.h>

#include "TestSupport.h"
#include "engine/DialogueBuilder.h"
#include "engine/QuestBuilder.h"

using namespace Parley;
using Parley::Fixtures::ScopedLogCapture;

TEST(DialogueBuilderTest, FirstNodeIsRootByDefault) {
    DialogueTree tree = Fixtures::twoNodeTree();

    EXPECT_EQ(tree.id, 100);
    EXPECT_EQ(tree.name, "Gate Guard");
    EXPECT_EQ(tree.rootNode, 1);
    EXPECT_EQ(tree.nodeCount(), 2u);
    EXPECT_TRUE(tree.repeatable);

    const DialogueNode* root = tree.getRootNode();
    ASSERT_NE(root, nullptr);
    ASSERT_EQ(root->choices.size(), 2u);
    EXPECT_EQ(root->choices[0].targetNode, std::optional<NodeId>(2));
    EXPECT_FALSE(root->choices[0].leavesDialogue());
    EXPECT_TRUE(root->choices[1].endsDialogue);
    EXPECT_TRUE(tree.getNode(2)->isTerminal);
}

TEST(DialogueBuilderTest, ExplicitRootAndNodeSettings) {
    DialogueTree tree = DialogueBuilder(5, "Ferryman")
        .node(1, "Far shore.").terminal()
        .node(2, "Fare, please.")
            .speakerOverride("Ferryman")
            .gate(Conditions::HasGold{1})
            .onEnter(Actions::TriggerEvent{"ferry_bell"})
            .choice("Pay").when(Conditions::HasGold{3}).action(Actions::TakeGold{3}).to(1)
        .root(2)
        .build();

    EXPECT_EQ(tree.rootNode, 2);
    EXPECT_EQ(tree.sortedNodeIds(), (std::vector<NodeId>{1, 2}));

    const DialogueNode* fare = tree.getNode(2);
    ASSERT_NE(fare, nullptr);
    EXPECT_EQ(fare->speakerOverride, std::optional<std::string>("Ferryman"));
    EXPECT_EQ(fare->conditions.size(), 1u);
    EXPECT_EQ(fare->actions.size(), 1u);
    ASSERT_EQ(fare->choices.size(), 1u);
    EXPECT_EQ(fare->choices[0].conditions.size(), 1u);
    ASSERT_EQ(fare->choices[0].actions.size(), 1u);
    EXPECT_NE(fare->choices[0].actions[0].as<Actions::TakeGold>(), nullptr);
}

TEST(DialogueBuilderTest, ChoiceBeforeNodeIsIgnored) {
    ScopedLogCapture capture;

    DialogueTree tree = DialogueBuilder(6).choice("Lost").to(1).build();

    EXPECT_EQ(tree.nodeCount(), 0u);
    EXPECT_TRUE(capture.contains(LogLevel::Warning, "Lost"));
}

TEST(QuestBuilderTest, StagesAreNumberedInOrder) {
    Quest quest = QuestBuilder(9)
        .name("Three Steps")
        .stage("One").kill(1)
        .stage("Two").collect(2, 4)
        .stage("Three").anyObjective().talkTo(3, 1).flag("done")
        .build();

    ASSERT_EQ(quest.stageCount(), 3u);
    for (size_t i = 0; i < quest.stages.size(); ++i) {
        EXPECT_EQ(static_cast<size_t>(quest.stages[i].stageNumber), i + 1);
    }
    EXPECT_TRUE(quest.stages[0].requireAllObjectives);
    EXPECT_FALSE(quest.stages[2].requireAllObjectives);
    EXPECT_EQ(quest.stages[2].objectives.size(), 2u);
    EXPECT_EQ(quest.getStage(2)->name, "Two");
    EXPECT_EQ(quest.getStage(0), nullptr);
    EXPECT_EQ(quest.getStage(4), nullptr);
}

TEST(QuestBuilderTest, ObjectiveBeforeStageCreatesOne) {
    ScopedLogCapture capture;

    Quest quest = QuestBuilder(4).kill(7, 2).build();

    ASSERT_EQ(quest.stageCount(), 1u);
    EXPECT_EQ(quest.stages[0].stageNumber, 1);
    EXPECT_EQ(quest.stages[0].objectives.size(), 1u);
    EXPECT_EQ(capture.count(LogLevel::Warning), 1u);
}

TEST(QuestBuilderTest, ConsecutiveItemRewardsMerge) {
    Quest quest = QuestBuilder(2)
        .rewardItem(10)
        .rewardItem(11, 3)
        .rewardGold(5)
        .rewardItem(12)
        .build();

    ASSERT_EQ(quest.rewards.size(), 3u);
    const auto* first = quest.rewards[0].as<Rewards::Items>();
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->items.size(), 2u);
    EXPECT_EQ(first->items[1].quantity, 3);
    EXPECT_NE(quest.rewards[1].as<Rewards::Gold>(), nullptr);
    EXPECT_NE(quest.rewards[2].as<Rewards::Items>(), nullptr);
}

TEST(QuestBuilderTest, AvailabilityAndGiver) {
    Quest quest = QuestBuilder(3)
        .minLevel(3)
        .maxLevel(6)
        .prerequisite(1)
        .prerequisite(2)
        .repeatable()
        .mainQuest()
        .questGiver(8, 2, Position(5, 6))
        .build();

    EXPECT_FALSE(quest.isAvailableForLevel(2));
    EXPECT_TRUE(quest.isAvailableForLevel(3));
    EXPECT_TRUE(quest.isAvailableForLevel(6));
    EXPECT_FALSE(quest.isAvailableForLevel(7));
    EXPECT_EQ(quest.requiredQuests, (std::vector<QuestId>{1, 2}));
    EXPECT_TRUE(quest.repeatable);
    EXPECT_TRUE(quest.isMainQuest);
    EXPECT_EQ(quest.questGiverNpc, std::optional<NpcId>(8));
}
