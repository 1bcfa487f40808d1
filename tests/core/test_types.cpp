#include <cadence/cadence.hpp>
#include <gtest/gtest.h>

// ============================================
// Types Tests
// ============================================

TEST(Types, VersionString) {
    EXPECT_STREQ(cadence::Version(), CADENCE_VERSION_STR(CADENCE_VERSION_MAJOR,
                                                         CADENCE_VERSION_MINOR,
                                                         CADENCE_VERSION_PATCH));
}

TEST(Types, VersionComponents) {
    EXPECT_EQ(cadence::VersionMajor(), CADENCE_VERSION_MAJOR);
    EXPECT_EQ(cadence::VersionMinor(), CADENCE_VERSION_MINOR);
    EXPECT_EQ(cadence::VersionPatch(), CADENCE_VERSION_PATCH);
}

TEST(Types, StageNames) {
    using cadence::DefinitionStage;
    EXPECT_STREQ(cadence::StageName(DefinitionStage::Uninitialized), "uninitialized");
    EXPECT_STREQ(cadence::StageName(DefinitionStage::ConnectionsDefined), "connections");
    EXPECT_STREQ(cadence::StageName(DefinitionStage::ObjectsDefined), "objects");
    EXPECT_STREQ(cadence::StageName(DefinitionStage::KinematicsDefined), "kinematics");
    EXPECT_STREQ(cadence::StageName(DefinitionStage::LoadsDefined), "loads");
    EXPECT_STREQ(cadence::StageName(DefinitionStage::ConstraintsDefined), "constraints");
}

TEST(Types, PreviousStage) {
    using cadence::DefinitionStage;
    EXPECT_EQ(cadence::PreviousStage(DefinitionStage::ObjectsDefined),
              DefinitionStage::ConnectionsDefined);
    EXPECT_EQ(cadence::PreviousStage(DefinitionStage::Uninitialized),
              DefinitionStage::Uninitialized);
}

// ============================================
// Naming Tests
// ============================================

TEST(Naming, FullPath) {
    EXPECT_EQ(cadence::MakeFullPath("", "bicycle"), "bicycle");
    EXPECT_EQ(cadence::MakeFullPath("bicycle", "front_wheel"), "bicycle.front_wheel");
}

TEST(Naming, Identifiers) {
    EXPECT_TRUE(cadence::IsIdentifier("q1"));
    EXPECT_TRUE(cadence::IsIdentifier("_hub"));
    EXPECT_FALSE(cadence::IsIdentifier("1q"));
    EXPECT_FALSE(cadence::IsIdentifier("front.wheel"));
    EXPECT_FALSE(cadence::IsIdentifier(""));
}
