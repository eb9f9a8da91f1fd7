#include <gtest/gtest.h>
#include "bootstrap_config.hpp"

#include <fstream>

namespace fs = std::filesystem;

// Fresh scratch directory per test
class BootstrapConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("nekotoki_cfg_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir);
        fs::create_directories(dir);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void write(const fs::path& p, const std::string& text) {
        std::ofstream out(p);
        out << text;
    }

    nlohmann::json readBack(const fs::path& p) {
        std::ifstream in(p);
        return nlohmann::json::parse(in);
    }

    fs::path dir;
};

TEST_F(BootstrapConfigTest, MissingFileIsCreatedWithDefaults) {
    fs::path p = dir / "nekotoki_config.json";
    nlohmann::json cfg;

    EXPECT_TRUE(bootstrap_config::loadConfig(p, bootstrap_config::defaultSettings(), cfg, "Widget config"));
    EXPECT_TRUE(fs::exists(p));
    EXPECT_EQ(cfg, bootstrap_config::defaultSettings());
    EXPECT_EQ(readBack(p), bootstrap_config::defaultSettings());
}

TEST_F(BootstrapConfigTest, InvalidJsonResetsToDefaults) {
    fs::path p = dir / "nekotoki_config.json";
    write(p, "{ \"window\": [1, 2,");
    nlohmann::json cfg;

    EXPECT_FALSE(bootstrap_config::loadConfig(p, bootstrap_config::defaultSettings(), cfg, "Widget config"));
    EXPECT_EQ(cfg, bootstrap_config::defaultSettings());
    EXPECT_EQ(readBack(p), bootstrap_config::defaultSettings());
}

TEST_F(BootstrapConfigTest, NonObjectTopLevelResetsToDefaults) {
    fs::path p = dir / "nekotoki_config.json";
    write(p, "[1, 2, 3]");
    nlohmann::json cfg;

    EXPECT_FALSE(bootstrap_config::loadConfig(p, bootstrap_config::defaultSettings(), cfg, "Widget config"));
    EXPECT_TRUE(cfg.is_object());
}

TEST_F(BootstrapConfigTest, MissingKeysArePatchedAndSaved) {
    fs::path p = dir / "nekotoki_config.json";
    write(p, R"({"window": {"width": 320}, "stars": {"count": 10}})");
    nlohmann::json cfg;

    EXPECT_TRUE(bootstrap_config::loadConfig(p, bootstrap_config::defaultSettings(), cfg, "Widget config"));
    EXPECT_EQ(cfg["window"]["width"], 320);
    EXPECT_EQ(cfg["window"]["height"], 100);
    EXPECT_EQ(cfg["stars"]["count"], 10);
    EXPECT_EQ(cfg["timer"]["tick_interval_ms"], 50);

    nlohmann::json saved = readBack(p);
    EXPECT_EQ(saved["window"]["width"], 320);
    EXPECT_TRUE(saved["background"].contains("image_alpha"));
}

TEST_F(BootstrapConfigTest, MergeReplacesMistypedValues) {
    nlohmann::json cfg = {
        {"window", {{"width", "wide"}, {"height", 120.0}}},
        {"stars", 7}
    };
    int patched = 0;
    EXPECT_TRUE(bootstrap_config::mergeDefaults(cfg, bootstrap_config::defaultSettings(), &patched));

    EXPECT_EQ(cfg["window"]["width"], 200);
    EXPECT_EQ(cfg["window"]["height"], 120.0);      // float spelling of a number is kept
    EXPECT_TRUE(cfg["stars"].is_object());
    EXPECT_GT(patched, 0);

    int again = 0;
    EXPECT_FALSE(bootstrap_config::mergeDefaults(cfg, bootstrap_config::defaultSettings(), &again));
    EXPECT_EQ(again, 0);
}

TEST_F(BootstrapConfigTest, SettingsFromDefaults) {
    WidgetSettings s = bootstrap_config::settingsFromJson(bootstrap_config::defaultSettings());

    EXPECT_EQ(s.width, 200u);
    EXPECT_EQ(s.height, 100u);
    EXPECT_EQ(s.posX, -1);
    EXPECT_EQ(s.minWidth, 150u);
    EXPECT_EQ(s.minHeight, 80u);
    EXPECT_EQ(s.borderMargin, 5);
    EXPECT_EQ(s.tickIntervalMs, 50);
    EXPECT_EQ(s.alpha, 120);
    EXPECT_EQ(s.imageAlpha, 150);
    EXPECT_EQ(s.starCount, 50u);
    EXPECT_TRUE(s.twinkle);
    EXPECT_TRUE(s.imagePath.empty());
    EXPECT_EQ(s.logFile, "nekotoki.log");
    EXPECT_EQ(s.logLevel, "debug");
}

TEST_F(BootstrapConfigTest, SettingsAreClamped) {
    nlohmann::json cfg = bootstrap_config::defaultSettings();
    cfg["window"]["width"] = 10;
    cfg["window"]["height"] = 90000;
    cfg["timer"]["tick_interval_ms"] = 1;
    cfg["background"]["alpha"] = 999;
    cfg["background"]["image_alpha"] = -4;
    cfg["stars"]["twinkle"] = "yes";

    WidgetSettings s = bootstrap_config::settingsFromJson(cfg);
    EXPECT_EQ(s.width, 150u);            // never below the minimum width
    EXPECT_EQ(s.height, 4096u);
    EXPECT_EQ(s.tickIntervalMs, 10);
    EXPECT_EQ(s.alpha, 255);
    EXPECT_EQ(s.imageAlpha, 0);
    EXPECT_TRUE(s.twinkle);              // mistyped -> default
}

TEST_F(BootstrapConfigTest, StoreSettingsWritesGeometryAndBackground) {
    nlohmann::json cfg = bootstrap_config::defaultSettings();
    WidgetSettings s = bootstrap_config::settingsFromJson(cfg);
    s.width = 260;
    s.height = 130;
    s.posX = 40;
    s.posY = 50;
    s.imagePath = "/tmp/cat.png";
    s.alpha = 200;

    bootstrap_config::storeSettings(s, cfg);
    EXPECT_EQ(cfg["window"]["width"], 260);
    EXPECT_EQ(cfg["window"]["x"], 40);
    EXPECT_EQ(cfg["background"]["image_path"], "/tmp/cat.png");
    EXPECT_EQ(cfg["background"]["alpha"], 200);

    fs::path p = dir / "nekotoki_config.json";
    ASSERT_TRUE(bootstrap_config::saveConfig(p, cfg));
    WidgetSettings back = bootstrap_config::settingsFromJson(readBack(p));
    EXPECT_EQ(back.width, 260u);
    EXPECT_EQ(back.posY, 50);
    EXPECT_EQ(back.imagePath, "/tmp/cat.png");
    EXPECT_EQ(back.alpha, 200);
}

TEST_F(BootstrapConfigTest, SaveFailsForMissingDirectory) {
    EXPECT_FALSE(bootstrap_config::saveConfig(dir / "no" / "such" / "dir.json",
                                              bootstrap_config::defaultSettings()));
}
