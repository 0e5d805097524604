#include <gtest/gtest.h>

#include "TestSupport.h"
#include "engine/QuestBuilder.h"
#include "engine/QuestStore.h"
#include <type_traits>

using namespace Parley;
using Parley::Fixtures::ScopedLogCapture;

TEST(QuestStoreTest, LoadsAndLooksUpQuests) {
    auto result = QuestStore::load({
        QuestBuilder(2).name("Second").stage("Only").kill(1, 1).build(),
        QuestBuilder(1).name("First").stage("Only").collect(3, 2).build(),
    });

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.store->questCount(), 2u);
    EXPECT_EQ(result.store->questIds(), (std::vector<QuestId>{1, 2}));
    ASSERT_NE(result.store->getQuest(1), nullptr);
    EXPECT_EQ(result.store->getQuest(1)->name, "First");
    EXPECT_EQ(result.store->getQuest(3), nullptr);
}

TEST(QuestStoreTest, RejectsDuplicateIds) {
    ScopedLogCapture capture;

    auto result = QuestStore::load({
        QuestBuilder(5).stage("A").kill(1).build(),
        QuestBuilder(5).stage("B").kill(2).build(),
    });

    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].code, LoadError::Code::DuplicateId);
}

TEST(QuestStoreTest, RejectsStageGap) {
    ScopedLogCapture capture;

    Quest quest = QuestBuilder(9).stage("One").kill(1).stage("Three").kill(2).build();
    quest.stages[1].stageNumber = 3;

    auto result = QuestStore::load({quest});
    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].code, LoadError::Code::NonSequentialStage);
    EXPECT_TRUE(capture.contains(LogLevel::Error, "is numbered 3"));
}

TEST(QuestStoreTest, RejectsRequireAllStageWithoutObjectives) {
    ScopedLogCapture capture;

    auto result = QuestStore::load({QuestBuilder(4).stage("Empty").build()});
    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].code, LoadError::Code::EmptyRequiredStage);
}

TEST(QuestStoreTest, AnyObjectiveStageMayBeEmpty) {
    auto result = QuestStore::load({QuestBuilder(4).stage("Open").anyObjective().build()});
    EXPECT_TRUE(result.success);
}

TEST(QuestStoreTest, EmptyStoreHasNoQuests) {
    auto store = QuestStore::empty();
    ASSERT_NE(store, nullptr);
    EXPECT_EQ(store->questCount(), 0u);
}

TEST(QuestStoreTest, OnlyBuiltThroughFactories) {
    static_assert(!std::is_default_constructible_v<QuestStore>);

    auto first = QuestStore::empty();
    auto second = QuestStore::empty();
    ASSERT_NE(first, nullptr);
    EXPECT_NE(first, second);
    EXPECT_EQ(first.use_count(), 1);
}
