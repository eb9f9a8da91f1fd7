#include <gtest/gtest.h>
#include "error_manager.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ErrorManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorManager::setCatalogue({
            {"ERR_BG_LOAD_FAILED", {{"user", "Could not load that image."},
                                    {"debug", "texture load failed"}}}
        });
    }
    void TearDown() override {
        ErrorManager::setCatalogue(nlohmann::json::object());
    }
};

TEST_F(ErrorManagerTest, KnownCodeMessages) {
    EXPECT_EQ(ErrorManager::getUserMessage("ERR_BG_LOAD_FAILED"), "Could not load that image.");
    EXPECT_EQ(ErrorManager::getDebugMessage("ERR_BG_LOAD_FAILED"), "texture load failed");
}

TEST_F(ErrorManagerTest, UnknownCodeIsGeneric) {
    EXPECT_EQ(ErrorManager::getUserMessage("ERR_NOPE"), "[Error] Unknown error code: ERR_NOPE");
    EXPECT_EQ(ErrorManager::getDebugMessage("ERR_NOPE"), "[Debug] No debug message for code: ERR_NOPE");
}

TEST_F(ErrorManagerTest, ReportBuildsFailedResult) {
    ActionResult r = ErrorManager::report("ERR_BG_LOAD_FAILED", "/tmp/missing.png");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorCode, "ERR_BG_LOAD_FAILED");
    EXPECT_EQ(r.message, "Could not load that image.");
    EXPECT_EQ(r.color, sf::Color(220, 150, 150));
}

TEST_F(ErrorManagerTest, WrappedCatalogueAccepted) {
    ErrorManager::setCatalogue({
        {"errors", {{"ERR_FONT_MISSING", {{"user", "No font found."}, {"debug", "d"}}}}}
    });
    EXPECT_EQ(ErrorManager::getUserMessage("ERR_FONT_MISSING"), "No font found.");
    EXPECT_EQ(ErrorManager::getUserMessage("ERR_BG_LOAD_FAILED"),
              "[Error] Unknown error code: ERR_BG_LOAD_FAILED");
}

TEST_F(ErrorManagerTest, LoadFromFile) {
    fs::path path = fs::temp_directory_path() / "nekotoki_errors_test.json";
    {
        std::ofstream out(path);
        out << R"({"ERR_PICKER_UNAVAILABLE": {"user": "No picker.", "debug": "none"}})";
    }
    EXPECT_TRUE(ErrorManager::load(path.string()));
    EXPECT_EQ(ErrorManager::getUserMessage("ERR_PICKER_UNAVAILABLE"), "No picker.");
    fs::remove(path);
}

TEST_F(ErrorManagerTest, LoadRejectsBadFiles) {
    EXPECT_FALSE(ErrorManager::load("/nonexistent/nekotoki/errors.json"));

    fs::path path = fs::temp_directory_path() / "nekotoki_errors_bad.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_FALSE(ErrorManager::load(path.string()));
    // Previous catalogue survives a failed load
    EXPECT_EQ(ErrorManager::getUserMessage("ERR_BG_LOAD_FAILED"), "Could not load that image.");
    fs::remove(path);
}
