#include <gtest/gtest.h>
#include "valtime/core/frame.hpp"
#include "valtime/core/overlay_settings.hpp"

#include <filesystem>
#include <fstream>

using namespace valtime;

class OverlaySettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = std::filesystem::temp_directory_path() / "valtime_overlay_settings_test";
        std::filesystem::remove_all(tempDir);
        std::filesystem::create_directories(tempDir);
        settingsPath = tempDir / "overlay.conf";
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir);
    }

    void writeSettings(const std::string& text) {
        std::ofstream out(settingsPath);
        out << text;
    }

    std::filesystem::path tempDir;
    std::filesystem::path settingsPath;
};

TEST_F(OverlaySettingsTest, MissingFileGivesDefaults) {
    OverlaySettings settings;
    EXPECT_FALSE(settings.load(settingsPath));

    EXPECT_EQ(settings.screenWidth(), DEFAULT_SCREEN_WIDTH);
    EXPECT_EQ(settings.backgroundGlyph(), DEFAULT_BACKGROUND_GLYPH);
    EXPECT_FALSE(settings.dryRun());
    EXPECT_EQ(settings.animationConfigPath(), tempDir / "animation_config.json");
    EXPECT_EQ(settings.keyBindings(), getDefaultKeyBindings());
}

TEST_F(OverlaySettingsTest, ReadsConfiguredValues) {
    writeSettings(
        "animation.config_path: anims/custom.json\n"
        "animation.screen_width: 40\n"
        "animation.background_glyph: #\n"
        "injector.dry_run: yes\n"
        "hotkey.toggle: 192\n");

    OverlaySettings settings;
    ASSERT_TRUE(settings.load(settingsPath));
    EXPECT_EQ(settings.animationConfigPath(), tempDir / "anims" / "custom.json");
    EXPECT_EQ(settings.screenWidth(), 40u);
    EXPECT_EQ(settings.backgroundGlyph(), U'#');
    EXPECT_TRUE(settings.dryRun());
    EXPECT_EQ(settings.keyBindings()[0].keyCode, 192);
}

TEST_F(OverlaySettingsTest, AbsoluteConfigPathIsKept) {
    auto absolute = tempDir / "elsewhere" / "config.json";
    writeSettings("animation.config_path: " + absolute.string() + "\n");

    OverlaySettings settings;
    ASSERT_TRUE(settings.load(settingsPath));
    EXPECT_EQ(settings.animationConfigPath(), absolute);
}

TEST_F(OverlaySettingsTest, InvalidValuesFallBack) {
    writeSettings(
        "animation.screen_width: wide\n"
        "animation.background_glyph: ab\n"
        "injector.dry_run: maybe\n");

    OverlaySettings settings;
    ASSERT_TRUE(settings.load(settingsPath));
    EXPECT_EQ(settings.screenWidth(), DEFAULT_SCREEN_WIDTH);
    EXPECT_EQ(settings.backgroundGlyph(), DEFAULT_BACKGROUND_GLYPH);
    EXPECT_FALSE(settings.dryRun());
}

TEST_F(OverlaySettingsTest, NarrowWidthIsClampedToSprite) {
    writeSettings("animation.screen_width: 10\n");

    OverlaySettings settings;
    ASSERT_TRUE(settings.load(settingsPath));
    EXPECT_EQ(settings.screenWidth(), 26u);
}

TEST_F(OverlaySettingsTest, FillDefaultsWritesEveryKey) {
    writeSettings("# mine\nanimation.screen_width: 30\n");

    OverlaySettings settings;
    ASSERT_TRUE(settings.load(settingsPath));
    settings.fillDefaults();
    ASSERT_TRUE(settings.save());

    OverlaySettings reloaded;
    ASSERT_TRUE(reloaded.load(settingsPath));
    const ConfigFile& file = reloaded.file();
    EXPECT_EQ(file.getInt("animation.screen_width"), 30);  // kept
    EXPECT_EQ(file.getString("animation.config_path"), "animation_config.json");
    EXPECT_EQ(file.getString("animation.background_glyph"), "▒");
    EXPECT_EQ(file.getString("injector.dry_run"), "false");
    EXPECT_EQ(file.getInt("hotkey.toggle"), 190);
    EXPECT_EQ(file.getInt("hotkey.select.9"), 57);
    EXPECT_EQ(reloaded.backgroundGlyph(), DEFAULT_BACKGROUND_GLYPH);
}

TEST_F(OverlaySettingsTest, NewFileGetsHeader) {
    OverlaySettings settings;
    EXPECT_FALSE(settings.load(settingsPath));
    settings.setDryRun(true);
    ASSERT_TRUE(settings.save());

    OverlaySettings reloaded;
    ASSERT_TRUE(reloaded.load(settingsPath));
    EXPECT_TRUE(reloaded.dryRun());
}

TEST(OverlaySettingsNoFileTest, SaveWithoutPathFails) {
    OverlaySettings settings;
    settings.setScreenWidth(30);
    EXPECT_FALSE(settings.save());
    EXPECT_EQ(settings.screenWidth(), 30u);
}
