#include <gtest/gtest.h>
#include <string>
#include "diagramsim/core/debug.hpp"

class DebugLogTest : public ::testing::Test {
protected:
    void TearDown() override {
        Debug::setLevel(DEBUG_LEVEL_WARNING);
    }
};

TEST_F(DebugLogTest, MacrosRespectRuntimeLevel) {
    Debug::setLevel(DEBUG_LEVEL_INFO);

    testing::internal::CaptureStderr();
    DIAGRAMSIM_WARN("x=" << 3);
    DIAGRAMSIM_INFO("loaded " << 2 << " bodies");
    DIAGRAMSIM_VERBOSE("hidden");
    std::string const out = testing::internal::GetCapturedStderr();

    EXPECT_NE(out.find("[diagramsim] warning: x=3\n"), std::string::npos);
    EXPECT_NE(out.find("[diagramsim] loaded 2 bodies\n"), std::string::npos);
    EXPECT_EQ(out.find("hidden"), std::string::npos);
}

TEST_F(DebugLogTest, LevelNoneSilencesWarnings) {
    Debug::setLevel(DEBUG_LEVEL_NONE);

    testing::internal::CaptureStderr();
    DIAGRAMSIM_WARN("quiet");
    EXPECT_TRUE(testing::internal::GetCapturedStderr().empty());
    EXPECT_EQ(Debug::level(), DEBUG_LEVEL_NONE);
}
