#include <gtest/gtest.h>

#include "TestSupport.h"
#include "engine/QuestBuilder.h"
#include "engine/QuestTracker.h"

using namespace Parley;

namespace {

constexpr QuestId kWolves = 1;
constexpr QuestId kShrine = 2;
constexpr QuestId kSequel = 3;
constexpr QuestId kBounty = 4;
constexpr QuestId kVeteran = 5;

constexpr MonsterId kWolf = 7;
constexpr ItemId kPelt = 40;
constexpr ItemId kIdol = 41;
constexpr NpcId kHunter = 3;
constexpr MapId kForest = 1;
constexpr MapId kHills = 2;

std::vector<Quest> campaignQuests() {
    return {
        QuestBuilder(kWolves)
            .name("Wolf Trouble")
            .stage("Thin the pack")
                .kill(kWolf, 5)
                .collect(kPelt, 2)
            .stage("Report to the hunter")
                .talkTo(kHunter, kForest)
            .rewardExperience(200)
            .rewardGold(50)
            .rewardItem(kIdol, 1)
            .rewardReputation("hunters", 10)
            .unlocks(kSequel)
            .build(),
        QuestBuilder(kShrine)
            .name("The Hill Shrine")
            .stage("Find the shrine or ask about it")
                .anyObjective()
                .reach(kHills, Position(20, 30), 3)
                .talkTo(kHunter, kForest)
            .rewardFlag("shrine_found")
            .build(),
        QuestBuilder(kSequel)
            .name("Den Mother")
            .prerequisite(kShrine)
            .stage("Slay the den mother")
                .kill(8, 1)
            .build(),
        QuestBuilder(kBounty)
            .name("Standing Bounty")
            .repeatable()
            .stage("Bring pelts")
                .deliver(kPelt, kHunter, 3)
            .rewardGold(10)
            .build(),
        QuestBuilder(kVeteran)
            .name("Veteran's Trial")
            .minLevel(5)
            .maxLevel(9)
            .stage("Wait for the shrine")
                .flag("shrine_found")
            .build(),
    };
}

} // namespace

class QuestTrackerTest : public ::testing::Test {
protected:
    QuestTrackerTest()
        : tracker(Fixtures::makeQuestStore(campaignQuests()))
    {
    }

    QuestTracker tracker;
    GameState state;
};

TEST_F(QuestTrackerTest, StartCreatesProgressAtFirstStage) {
    ASSERT_TRUE(tracker.startQuest(kWolves, state).success);

    const QuestProgress* progress = state.getQuestProgress(kWolves);
    ASSERT_NE(progress, nullptr);
    EXPECT_EQ(progress->currentStage, 1);
    EXPECT_TRUE(progress->isActive());
    EXPECT_EQ(tracker.activeQuests(state), std::vector<QuestId>{kWolves});
}

TEST_F(QuestTrackerTest, AllObjectivesRequiredByDefault) {
    ASSERT_TRUE(tracker.startQuest(kWolves, state).success);

    tracker.processEvent(QuestEvent::monsterKilled(kWolf, 5), state);
    EXPECT_EQ(state.getQuestProgress(kWolves)->currentStage, 1);

    tracker.processEvent(QuestEvent::itemCollected(kPelt, 2), state);
    EXPECT_EQ(state.getQuestProgress(kWolves)->currentStage, 2);
    EXPECT_TRUE(state.getQuestProgress(kWolves)->objectiveProgress.empty());
}

TEST_F(QuestTrackerTest, CountersClampAtGoal) {
    ASSERT_TRUE(tracker.startQuest(kWolves, state).success);

    tracker.processEvent(QuestEvent::monsterKilled(kWolf, 3), state);
    tracker.processEvent(QuestEvent::monsterKilled(kWolf, 9), state);
    tracker.processEvent(QuestEvent::monsterKilled(99, 4), state);

    EXPECT_EQ(state.getQuestProgress(kWolves)->getObjectiveProgress(0), 5u);
    EXPECT_EQ(state.getQuestProgress(kWolves)->getObjectiveProgress(1), 0u);
}

TEST_F(QuestTrackerTest, EventsOnlyAffectCurrentStage) {
    ASSERT_TRUE(tracker.startQuest(kWolves, state).success);

    tracker.processEvent(QuestEvent::npcTalkedTo(kHunter), state);
    EXPECT_EQ(state.getQuestProgress(kWolves)->currentStage, 1);
    EXPECT_TRUE(state.getQuestProgress(kWolves)->objectiveProgress.empty());
}

TEST_F(QuestTrackerTest, AnyObjectiveCompletesStage) {
    ASSERT_TRUE(tracker.startQuest(kShrine, state).success);

    tracker.processEvent(QuestEvent::npcTalkedTo(kHunter, kForest), state);

    const QuestProgress* progress = state.getQuestProgress(kShrine);
    EXPECT_TRUE(progress->completed);
    EXPECT_TRUE(state.getFlag("shrine_found"));
}

TEST_F(QuestTrackerTest, TalkToRespectsMapWhenGiven) {
    ASSERT_TRUE(tracker.startQuest(kShrine, state).success);

    tracker.processEvent(QuestEvent::npcTalkedTo(kHunter, kHills), state);
    EXPECT_FALSE(state.getQuestProgress(kShrine)->completed);
}

TEST_F(QuestTrackerTest, ReachLocationUsesRadius) {
    ASSERT_TRUE(tracker.startQuest(kShrine, state).success);

    tracker.processEvent(QuestEvent::locationReached(kHills, Position(23, 31)), state);
    EXPECT_FALSE(state.getQuestProgress(kShrine)->completed);

    tracker.processEvent(QuestEvent::locationReached(kForest, Position(20, 30)), state);
    EXPECT_FALSE(state.getQuestProgress(kShrine)->completed);

    tracker.processEvent(QuestEvent::locationReached(kHills, Position(23, 30)), state);
    EXPECT_TRUE(state.getQuestProgress(kShrine)->completed);
}

TEST_F(QuestTrackerTest, CompletionAppliesRewards) {
    ASSERT_TRUE(tracker.startQuest(kWolves, state).success);

    tracker.processEvent(QuestEvent::monsterKilled(kWolf, 5), state);
    tracker.processEvent(QuestEvent::itemCollected(kPelt, 2), state);
    tracker.processEvent(QuestEvent::npcTalkedTo(kHunter, kForest), state);

    const QuestProgress* progress = state.getQuestProgress(kWolves);
    EXPECT_TRUE(progress->completed);
    EXPECT_EQ(progress->timesCompleted, 1u);
    EXPECT_EQ(state.experience, 200u);
    EXPECT_EQ(state.gold, 50u);
    EXPECT_EQ(state.getItemCount(kIdol), 1u);
    EXPECT_EQ(state.getReputation("hunters"), 10);
    EXPECT_TRUE(state.isQuestUnlocked(kSequel));
    EXPECT_TRUE(tracker.activeQuests(state).empty());
}

TEST_F(QuestTrackerTest, UnlockOverridesRequiredQuests) {
    ActionResult locked = tracker.startQuest(kSequel, state);
    EXPECT_EQ(locked.error, ActionError::PrerequisitesNotMet);
    EXPECT_EQ(state.getQuestProgress(kSequel), nullptr);

    state.unlockQuest(kSequel);
    EXPECT_TRUE(tracker.startQuest(kSequel, state).success);
}

TEST_F(QuestTrackerTest, RequiredQuestCompletionAllowsStart) {
    ASSERT_TRUE(tracker.startQuest(kShrine, state).success);
    tracker.processEvent(QuestEvent::npcTalkedTo(kHunter), state);

    EXPECT_TRUE(tracker.checkCanStart(kSequel, state).success);
}

TEST_F(QuestTrackerTest, LevelBoundsAreInclusive) {
    state.level = 4;
    EXPECT_EQ(tracker.startQuest(kVeteran, state).error, ActionError::PrerequisitesNotMet);

    state.level = 10;
    EXPECT_EQ(tracker.checkCanStart(kVeteran, state).error, ActionError::PrerequisitesNotMet);

    state.level = 9;
    EXPECT_TRUE(tracker.startQuest(kVeteran, state).success);
}

TEST_F(QuestTrackerTest, RewardFlagCascadesToOtherQuests) {
    state.level = 5;
    ASSERT_TRUE(tracker.startQuest(kVeteran, state).success);
    ASSERT_TRUE(tracker.startQuest(kShrine, state).success);

    tracker.processEvent(QuestEvent::npcTalkedTo(kHunter), state);

    EXPECT_TRUE(state.getQuestProgress(kShrine)->completed);
    EXPECT_TRUE(state.getQuestProgress(kVeteran)->completed);
}

TEST_F(QuestTrackerTest, CompleteStageForcesAdvance) {
    ASSERT_TRUE(tracker.startQuest(kWolves, state).success);

    EXPECT_EQ(tracker.completeStage(kWolves, 2, state).error, ActionError::PrerequisitesNotMet);
    ASSERT_TRUE(tracker.completeStage(kWolves, 1, state).success);
    EXPECT_EQ(state.getQuestProgress(kWolves)->currentStage, 2);

    EXPECT_TRUE(tracker.completeStage(kWolves, 1, state).success);
    EXPECT_EQ(state.getQuestProgress(kWolves)->currentStage, 2);

    ASSERT_TRUE(tracker.completeStage(kWolves, 2, state).success);
    EXPECT_TRUE(state.getQuestProgress(kWolves)->completed);
    EXPECT_EQ(state.gold, 50u);
}

TEST_F(QuestTrackerTest, TurnInRequiresCompletion) {
    ASSERT_TRUE(tracker.startQuest(kShrine, state).success);
    EXPECT_EQ(tracker.turnIn(kShrine, state).error, ActionError::PrerequisitesNotMet);

    tracker.processEvent(QuestEvent::npcTalkedTo(kHunter), state);
    ASSERT_TRUE(tracker.turnIn(kShrine, state).success);
    EXPECT_TRUE(state.getQuestProgress(kShrine)->turnedIn);

    EXPECT_EQ(tracker.turnIn(42, state).error, ActionError::InvalidTarget);
}

TEST_F(QuestTrackerTest, CompletedQuestDoesNotRestartUnlessRepeatable) {
    ASSERT_TRUE(tracker.startQuest(kShrine, state).success);
    tracker.processEvent(QuestEvent::npcTalkedTo(kHunter), state);

    ASSERT_TRUE(tracker.startQuest(kShrine, state).success);
    EXPECT_TRUE(state.getQuestProgress(kShrine)->completed);

    ASSERT_TRUE(tracker.startQuest(kBounty, state).success);
    tracker.processEvent(QuestEvent::itemDelivered(kPelt, kHunter, 3), state);
    ASSERT_TRUE(state.getQuestProgress(kBounty)->completed);

    ASSERT_TRUE(tracker.startQuest(kBounty, state).success);
    const QuestProgress* rerun = state.getQuestProgress(kBounty);
    EXPECT_TRUE(rerun->isActive());
    EXPECT_EQ(rerun->timesCompleted, 1u);
    EXPECT_TRUE(state.isQuestCompleted(kBounty));
}

TEST_F(QuestTrackerTest, AbandonRemovesFirstRunProgress) {
    ASSERT_TRUE(tracker.startQuest(kWolves, state).success);

    EXPECT_TRUE(tracker.abandonQuest(kWolves, state));
    EXPECT_EQ(state.getQuestProgress(kWolves), nullptr);
    EXPECT_FALSE(tracker.abandonQuest(kWolves, state));
}

TEST_F(QuestTrackerTest, AbandonRepeatRunKeepsCompletion) {
    ASSERT_TRUE(tracker.startQuest(kBounty, state).success);
    tracker.processEvent(QuestEvent::itemDelivered(kPelt, kHunter, 3), state);
    ASSERT_TRUE(tracker.startQuest(kBounty, state).success);

    EXPECT_TRUE(tracker.abandonQuest(kBounty, state));
    const QuestProgress* progress = state.getQuestProgress(kBounty);
    ASSERT_NE(progress, nullptr);
    EXPECT_TRUE(progress->completed);
    EXPECT_EQ(progress->timesCompleted, 1u);
}

TEST_F(QuestTrackerTest, AvailableQuests) {
    state.level = 1;
    EXPECT_EQ(tracker.availableQuests(state), (std::vector<QuestId>{kWolves, kShrine, kBounty}));

    ASSERT_TRUE(tracker.startQuest(kWolves, state).success);
    EXPECT_EQ(tracker.availableQuests(state), (std::vector<QuestId>{kShrine, kBounty}));
}

TEST_F(QuestTrackerTest, CallbacksFireInOrder) {
    std::vector<std::string> calls;
    tracker.setOnQuestStarted([&](const Quest& quest) {
        calls.push_back("started " + quest.name);
    });
    tracker.setOnStageAdvanced([&](const Quest&, uint8_t stage) {
        calls.push_back("stage " + std::to_string(stage));
    });
    tracker.setOnQuestCompleted([&](const Quest& quest) {
        calls.push_back("completed " + quest.name);
    });

    ASSERT_TRUE(tracker.startQuest(kWolves, state).success);
    tracker.processEvent(QuestEvent::monsterKilled(kWolf, 5), state);
    tracker.processEvent(QuestEvent::itemCollected(kPelt, 2), state);
    tracker.processEvent(QuestEvent::npcTalkedTo(kHunter), state);

    EXPECT_EQ(calls, (std::vector<std::string>{
        "started Wolf Trouble", "stage 2", "completed Wolf Trouble"}));
}

TEST_F(QuestTrackerTest, UnknownQuestIsInvalidTarget) {
    EXPECT_EQ(tracker.startQuest(42, state).error, ActionError::InvalidTarget);
    EXPECT_EQ(tracker.completeStage(42, 1, state).error, ActionError::InvalidTarget);
    EXPECT_FALSE(tracker.abandonQuest(42, state));
}

TEST(QuestTrackerEmptyStoreTest, NullStoreBehavesAsEmpty) {
    QuestTracker tracker(nullptr);
    GameState state;

    EXPECT_EQ(tracker.store().questCount(), 0u);
    EXPECT_TRUE(tracker.availableQuests(state).empty());
    tracker.processEvent(QuestEvent::monsterKilled(1), state);
}
