#include <gtest/gtest.h>

#include "engine/CampaignSerializer.h"
#include "engine/ValidatorConfig.h"
#include <cstdio>

using namespace Parley;

TEST(ValidatorConfigTest, Defaults) {
    ValidatorConfig config;

    EXPECT_FALSE(config.warningsAsErrors);
    EXPECT_EQ(config.logLevel, LogLevel::Info);

    DialogueValidator::Options options = config.validatorOptions();
    EXPECT_TRUE(options.checkReachability);
    EXPECT_TRUE(options.checkReferences);
    EXPECT_TRUE(options.warnOnDeadEnds);
}

TEST(ValidatorConfigTest, OverlaysPresentKeysOnly) {
    ValidatorConfig config;
    config.checkReferences = false;

    ASSERT_TRUE(config.loadFromString(R"({"warningsAsErrors": true, "logLevel": "debug"})"));

    EXPECT_TRUE(config.warningsAsErrors);
    EXPECT_EQ(config.logLevel, LogLevel::Debug);
    EXPECT_FALSE(config.checkReferences);
    EXPECT_TRUE(config.checkReachability);
}

TEST(ValidatorConfigTest, OptionsFollowConfig) {
    ValidatorConfig config;
    ASSERT_TRUE(config.loadFromString(
        R"({"checkReachability": false, "warnOnDeadEnds": false})"));

    DialogueValidator::Options options = config.validatorOptions();
    EXPECT_FALSE(options.checkReachability);
    EXPECT_FALSE(options.warnOnDeadEnds);
    EXPECT_TRUE(options.checkReferences);
}

TEST(ValidatorConfigTest, RejectsBadDocumentsWithoutChanges) {
    ValidatorConfig config;
    std::string error;

    EXPECT_FALSE(config.loadFromString("{", &error));
    EXPECT_FALSE(error.empty());

    error.clear();
    EXPECT_FALSE(config.loadFromString("[true]", &error));
    EXPECT_FALSE(error.empty());

    error.clear();
    EXPECT_FALSE(config.loadFromString(R"({"warningsAsErrors": true, "logLevel": "loud"})", &error));
    EXPECT_NE(error.find("loud"), std::string::npos);
    EXPECT_FALSE(config.warningsAsErrors);

    error.clear();
    EXPECT_FALSE(config.loadFromString(R"({"checkReferences": "yes"})", &error));
    EXPECT_TRUE(config.checkReferences);
}

TEST(ValidatorConfigTest, LoadFromFile) {
    const std::string path = ::testing::TempDir() + "parley_validator_config.json";
    ASSERT_TRUE(CampaignSerializer::writeFile(path, R"({"logLevel": "error"})"));

    ValidatorConfig config;
    std::string error;
    EXPECT_TRUE(config.loadFromFile(path, &error)) << error;
    EXPECT_EQ(config.logLevel, LogLevel::Error);
    std::remove(path.c_str());

    EXPECT_FALSE(config.loadFromFile(path, &error));
    EXPECT_NE(error.find(path), std::string::npos);
}
