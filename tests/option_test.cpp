#include <gtest/gtest.h>
#include "option.hpp"
#include "settings.hpp"
#include "controller.hpp"
#include "file_menu.hpp"
#include "test_utils.hpp"

namespace rotarymenu::option {
namespace {

class OptionTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(m_dir.IsValid());
        m_dir.CreateFile("config.ini",
            "[display]\n"
            "cols=16\n"
            "rows=2\n"
            "[menu]\n"
            "timeout=3\n"
            "scroll_delay=1\n"
            "log=false\n"
            "[files]\n"
            "show_folders=false\n"
            "name=hello\n"
        );

        m_old_path = GetConfigPath();
        SetConfigPath(m_dir.Join("config.ini"));
    }

    void TearDown() override {
        SetConfigPath(m_old_path);
    }

    test::TempDir m_dir;
    std::string m_old_path;
};

TEST_F(OptionTest, ReadsValues) {
    OptionLong cols{"display", "cols", 20};
    OptionBool show_folders{"files", "show_folders", true};
    OptionString name{"files", "name", "default"};

    EXPECT_EQ(16, cols.Get());
    EXPECT_FALSE(show_folders.Get());
    EXPECT_EQ("hello", name.Get());
}

TEST_F(OptionTest, MissingKeysUseDefault) {
    OptionLong value{"display", "missing", 7};
    OptionString str{"nope", "missing", "x"};

    EXPECT_EQ(7, value.Get());
    EXPECT_EQ("x", str.Get());
}

TEST_F(OptionTest, NotFileBacked) {
    OptionLong cols{"display", "cols", 20, false};
    EXPECT_EQ(20, cols.Get());
}

TEST_F(OptionTest, SetWritesThrough) {
    OptionLong cols{"display", "cols", 20};
    cols.Set(40);
    EXPECT_EQ(40, cols.Get());

    OptionLong other{"display", "cols", 20};
    EXPECT_EQ(40, other.Get());

    OptionString name{"files", "name", ""};
    name.Set("world");
    OptionString other_name{"files", "name", ""};
    EXPECT_EQ("world", other_name.Get());
}

TEST_F(OptionTest, ResetRereads) {
    OptionLong rows{"display", "rows", 4};
    EXPECT_EQ(2, rows.Get());

    OptionLong writer{"display", "rows", 4};
    writer.Set(3);

    EXPECT_EQ(2, rows.Get());
    rows.Reset();
    EXPECT_EQ(3, rows.Get());
}

TEST_F(OptionTest, SettingsGeometry) {
    Settings settings;
    const auto geometry = settings.GetGeometry();
    EXPECT_EQ(16, geometry.cols);
    EXPECT_EQ(2, geometry.rows);
}

TEST_F(OptionTest, SettingsBadGeometryUsesDefault) {
    OptionLong{"display", "rows", 4}.Set(0);

    Settings settings;
    const auto geometry = settings.GetGeometry();
    EXPECT_EQ(16, geometry.cols);
    EXPECT_EQ(4, geometry.rows);
}

TEST_F(OptionTest, SettingsApply) {
    Settings settings;
    display::BufferDisplay display{settings.GetGeometry()};

    auto root = menu::Menu::Root({"#+#a#+#"}, {});
    auto nested = menu::Menu::Nested({"#+#b#+#"}, {});

    Controller controller{&display, settings.GetGeometry(), &root};
    settings.Apply(controller);

    ASSERT_TRUE(R_SUCCEEDED(controller.Set(&nested)));
    EXPECT_TRUE(R_SUCCEEDED(controller.TimerTick()));
    EXPECT_TRUE(R_SUCCEEDED(controller.TimerTick()));
    EXPECT_EQ(&nested, controller.GetMenu());
    EXPECT_TRUE(R_SUCCEEDED(controller.TimerTick()));
    EXPECT_EQ(&root, controller.GetMenu());
}

TEST_F(OptionTest, SettingsFileMenuConfig) {
    m_dir.CreateDir("files");
    m_dir.CreateDir("files/sub");
    m_dir.CreateFile("files/a.py");

    fs::FsStdio fs;
    menu::FileMenuConfig config{};
    config.fs = &fs;
    config.path = m_dir.Join("files");
    ASSERT_TRUE(config.show_folders);

    Settings settings;
    settings.Apply(config);
    EXPECT_FALSE(config.show_folders);

    std::unique_ptr<menu::FileMenu> menu;
    ASSERT_TRUE(R_SUCCEEDED(menu::FileMenu::Create(config, menu)));
    ASSERT_EQ(1, menu->GetSlotCount());
    EXPECT_EQ("a.py", menu->GetEntries()[0].name);
}

} // namespace
} // namespace rotarymenu::option
