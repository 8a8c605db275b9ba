#include "config/Config.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace roi_capture;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
            ("roi_capture_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".ini");
        std::filesystem::remove(path_);
    }
    void TearDown() override { std::filesystem::remove(path_); }

    void Write(const std::string& text) {
        std::ofstream f(path_);
        f << text;
    }

    std::filesystem::path path_;
};

TEST_F(ConfigTest, MissingFileKeepsDefaults) {
    CaptureConfig cfg;
    EXPECT_FALSE(LoadConfig(cfg, path_));
    EXPECT_EQ(cfg.outputIndex, 0u);
    EXPECT_FALSE(cfg.useACESFilmToneMapping);
    EXPECT_FLOAT_EQ(cfg.sdrBrightness, 250.0f);
}

TEST_F(ConfigTest, SaveThenLoadRestoresEveryKey) {
    CaptureConfig saved;
    saved.outputIndex = 2;
    saved.useACESFilmToneMapping = true;
    saved.sdrBrightness = 320.0f;
    saved.debugMode = true;
    saved.logFile = "capture-debug.log";
    ASSERT_TRUE(SaveConfig(saved, path_));

    CaptureConfig loaded;
    ASSERT_TRUE(LoadConfig(loaded, path_));
    EXPECT_EQ(loaded.outputIndex, 2u);
    EXPECT_TRUE(loaded.useACESFilmToneMapping);
    EXPECT_FLOAT_EQ(loaded.sdrBrightness, 320.0f);
    EXPECT_TRUE(loaded.debugMode);
    EXPECT_EQ(loaded.logFile, "capture-debug.log");
}

TEST_F(ConfigTest, ClampsOutOfRangeValues) {
    Write("OutputIndex=99\nSDRBrightness=5\n");
    CaptureConfig cfg;
    ASSERT_TRUE(LoadConfig(cfg, path_));
    EXPECT_EQ(cfg.outputIndex, 15u);
    EXPECT_FLOAT_EQ(cfg.sdrBrightness, 80.0f);
}

TEST_F(ConfigTest, SkipsCommentsUnknownKeysAndMalformedNumbers) {
    Write("; comment\n# another\nUnknownKey=1\nnot a pair\n  SDRBrightness = abc \n  DebugMode = 1  \n");
    CaptureConfig cfg;
    ASSERT_TRUE(LoadConfig(cfg, path_));
    EXPECT_FLOAT_EQ(cfg.sdrBrightness, 250.0f);
    EXPECT_TRUE(cfg.debugMode);
}

TEST_F(ConfigTest, EnsureConfigFileCreatesDefaults) {
    ASSERT_FALSE(std::filesystem::exists(path_));
    ASSERT_TRUE(EnsureConfigFile(CaptureConfig{}, path_));
    ASSERT_TRUE(std::filesystem::exists(path_));

    CaptureConfig cfg;
    cfg.outputIndex = 7;
    ASSERT_TRUE(LoadConfig(cfg, path_));
    EXPECT_EQ(cfg.outputIndex, 0u);
}

TEST_F(ConfigTest, EnsureConfigFileKeepsExistingValues) {
    Write("SDRBrightness=400\n");
    ASSERT_TRUE(EnsureConfigFile(CaptureConfig{}, path_));

    CaptureConfig cfg;
    ASSERT_TRUE(LoadConfig(cfg, path_));
    EXPECT_FLOAT_EQ(cfg.sdrBrightness, 400.0f);
    EXPECT_FALSE(cfg.debugMode);
}

TEST_F(ConfigTest, FramePollingKeysAreNotConfigurable) {
    Write("AcquireTimeoutMs=500\nAllowHdrFormat=false\n");
    ASSERT_TRUE(EnsureConfigFile(CaptureConfig{}, path_));

    std::ifstream f(path_);
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    EXPECT_EQ(text.find("AcquireTimeoutMs"), std::string::npos);
    EXPECT_EQ(text.find("AllowHdrFormat"), std::string::npos);
}
