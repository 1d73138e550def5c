#include <gtest/gtest.h>
#include "file_menu.hpp"
#include "test_utils.hpp"

namespace rotarymenu::menu {
namespace {

auto GetEntryTexts(const Menu& menu) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto& slot : menu.GetSlots()) {
        slot::SlotText text{};
        EXPECT_TRUE(R_SUCCEEDED(slot.Resolve(text)));
        out.emplace_back(text.Compose());
    }
    return out;
}

class FileMenuTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(m_dir.IsValid());
        m_dir.CreateFile("a.py");
        m_dir.CreateFile("b.txt");
        m_dir.CreateDir("sub");
        m_dir.CreateFile("sub/c.py");
        m_dir.CreateDir("sub/deeper");
        m_dir.CreateDir("__pycache__");
    }

    auto MakeConfig() -> FileMenuConfig {
        FileMenuConfig config{};
        config.fs = &m_fs;
        config.path = m_dir.GetPath();
        config.extension_filter = {".py"};
        return config;
    }

    test::TempDir m_dir;
    fs::FsStdio m_fs;
};

TEST_F(FileMenuTest, ListEntries) {
    std::unique_ptr<FileMenu> menu;
    ASSERT_TRUE(R_SUCCEEDED(FileMenu::Create(MakeConfig(), menu)));
    ASSERT_TRUE(menu != nullptr);
    EXPECT_EQ(MenuKind::File, menu->GetKind());
    EXPECT_EQ(menu.get(), menu->AsFileMenu());

    fs::DirEntries entries;
    ASSERT_TRUE(R_SUCCEEDED(menu->ListEntries(entries)));
    ASSERT_EQ(2u, entries.size());
    EXPECT_EQ("sub", entries[0].name);
    EXPECT_TRUE(entries[0].is_dir);
    EXPECT_EQ("a.py", entries[1].name);
    EXPECT_FALSE(entries[1].is_dir);

    const std::vector<std::string> expected{"sub", "a.py"};
    EXPECT_EQ(expected, GetEntryTexts(*menu));
}

TEST_F(FileMenuTest, ListingIsSorted) {
    m_dir.CreateFile("Z.py");
    m_dir.CreateFile("m.PY");
    m_dir.CreateDir("aaa");

    std::unique_ptr<FileMenu> menu;
    ASSERT_TRUE(R_SUCCEEDED(FileMenu::Create(MakeConfig(), menu)));

    const std::vector<std::string> expected{"aaa", "sub", "Z.py", "a.py", "m.PY"};
    EXPECT_EQ(expected, GetEntryTexts(*menu));
}

TEST_F(FileMenuTest, HideFolders) {
    auto config = MakeConfig();
    config.show_folders = false;

    std::unique_ptr<FileMenu> menu;
    ASSERT_TRUE(R_SUCCEEDED(FileMenu::Create(config, menu)));

    const std::vector<std::string> expected{"a.py"};
    EXPECT_EQ(expected, GetEntryTexts(*menu));
}

TEST_F(FileMenuTest, FilterWithoutDot) {
    auto config = MakeConfig();
    config.extension_filter = {"txt", "PY"};

    std::unique_ptr<FileMenu> menu;
    ASSERT_TRUE(R_SUCCEEDED(FileMenu::Create(config, menu)));

    const std::vector<std::string> expected{"sub", "a.py", "b.txt"};
    EXPECT_EQ(expected, GetEntryTexts(*menu));
}

TEST_F(FileMenuTest, Navigation) {
    std::unique_ptr<FileMenu> menu;
    ASSERT_TRUE(R_SUCCEEDED(FileMenu::Create(MakeConfig(), menu)));

    ASSERT_TRUE(R_SUCCEEDED(menu->EnterDirectory("sub")));
    EXPECT_EQ(1, menu->GetDepth());
    EXPECT_STREQ(m_dir.Join("sub").c_str(), menu->GetPath().s);

    // ".." is first at depth > 0.
    const std::vector<std::string> expected{"..", "deeper", "c.py"};
    EXPECT_EQ(expected, GetEntryTexts(*menu));

    ASSERT_TRUE(R_SUCCEEDED(menu->EnterDirectory("deeper")));
    EXPECT_EQ(2, menu->GetDepth());

    ASSERT_TRUE(R_SUCCEEDED(menu->ReturnToParent()));
    EXPECT_EQ(1, menu->GetDepth());
    EXPECT_STREQ(m_dir.Join("sub").c_str(), menu->GetPath().s);

    ASSERT_TRUE(R_SUCCEEDED(menu->ReturnToParent()));
    EXPECT_EQ(0, menu->GetDepth());
    EXPECT_STREQ(m_dir.GetPath().s, menu->GetPath().s);
}

TEST_F(FileMenuTest, ReturnToParentAboveDefault) {
    std::unique_ptr<FileMenu> menu;
    ASSERT_TRUE(R_SUCCEEDED(FileMenu::Create(MakeConfig(), menu)));

    // leaving the default path upwards is allowed, the depth goes negative.
    ASSERT_TRUE(R_SUCCEEDED(menu->ReturnToParent()));
    EXPECT_EQ(-1, menu->GetDepth());
    EXPECT_STREQ("/tmp", menu->GetPath().s);

    ASSERT_TRUE(R_SUCCEEDED(menu->ReturnToDefault()));
    EXPECT_EQ(0, menu->GetDepth());
    EXPECT_STREQ(m_dir.GetPath().s, menu->GetPath().s);
}

TEST_F(FileMenuTest, ReturnToParentAtFilesystemRoot) {
    std::unique_ptr<FileMenu> menu;
    ASSERT_TRUE(R_SUCCEEDED(FileMenu::Create(MakeConfig(), menu)));

    ASSERT_TRUE(R_SUCCEEDED(menu->SetPath("/", 0)));
    const auto rc = menu->ReturnToParent();
    EXPECT_EQ(Result_FileMenuAtRoot, rc);
    EXPECT_TRUE(IsBoundaryError(rc));
    EXPECT_STREQ("/", menu->GetPath().s);
    EXPECT_EQ(0, menu->GetDepth());
}

TEST_F(FileMenuTest, ReturnToDefault) {
    std::unique_ptr<FileMenu> menu;
    ASSERT_TRUE(R_SUCCEEDED(FileMenu::Create(MakeConfig(), menu)));

    ASSERT_TRUE(R_SUCCEEDED(menu->EnterDirectory("sub")));
    ASSERT_TRUE(R_SUCCEEDED(menu->EnterDirectory("deeper")));
    ASSERT_TRUE(R_SUCCEEDED(menu->ReturnToParent()));
    ASSERT_TRUE(R_SUCCEEDED(menu->EnterDirectory("deeper")));

    ASSERT_TRUE(R_SUCCEEDED(menu->ReturnToDefault()));
    EXPECT_EQ(0, menu->GetDepth());
    EXPECT_TRUE(menu->GetPath() == menu->GetDefaultPath());
}

TEST_F(FileMenuTest, EnterDirectoryNotFound) {
    std::unique_ptr<FileMenu> menu;
    ASSERT_TRUE(R_SUCCEEDED(FileMenu::Create(MakeConfig(), menu)));

    EXPECT_EQ(Result_FileMenuDirNotFound, menu->EnterDirectory("missing"));
    // files and hidden directories are not enterable.
    EXPECT_EQ(Result_FileMenuDirNotFound, menu->EnterDirectory("a.py"));
    EXPECT_EQ(Result_FileMenuDirNotFound, menu->EnterDirectory("__pycache__"));
    EXPECT_TRUE(IsNotFoundError(menu->EnterDirectory("missing")));
    EXPECT_EQ(0, menu->GetDepth());
    EXPECT_STREQ(m_dir.GetPath().s, menu->GetPath().s);
}

TEST_F(FileMenuTest, SetPath) {
    std::unique_ptr<FileMenu> menu;
    ASSERT_TRUE(R_SUCCEEDED(FileMenu::Create(MakeConfig(), menu)));

    ASSERT_TRUE(R_SUCCEEDED(menu->SetPath(m_dir.Join("sub/deeper"))));
    EXPECT_EQ(2, menu->GetDepth());

    ASSERT_TRUE(R_SUCCEEDED(menu->SetPath(m_dir.Join("sub"), 5)));
    EXPECT_EQ(5, menu->GetDepth());

    EXPECT_EQ(Result_FileMenuBadDepth, menu->SetPath(m_dir.Join("sub"), -1));

    // a failed change keeps the old state.
    EXPECT_EQ(Result_FsPathNotFound, menu->SetPath(m_dir.Join("missing")));
    EXPECT_EQ(5, menu->GetDepth());
    EXPECT_STREQ(m_dir.Join("sub").c_str(), menu->GetPath().s);
}

TEST_F(FileMenuTest, PrefixAndRootSlots) {
    auto config = MakeConfig();
    config.prefix_slots = {"#+#Back#+#"};
    config.root_slots = {"#+#Home#+#"};

    std::unique_ptr<FileMenu> menu;
    ASSERT_TRUE(R_SUCCEEDED(FileMenu::Create(config, menu)));

    EXPECT_EQ(2, menu->GetPrefixCount());
    const std::vector<std::string> root{"Back", "Home", "sub", "a.py"};
    EXPECT_EQ(root, GetEntryTexts(*menu));

    ASSERT_TRUE(R_SUCCEEDED(menu->EnterDirectory("sub")));
    EXPECT_EQ(1, menu->GetPrefixCount());
    const std::vector<std::string> sub{"Back", "..", "deeper", "c.py"};
    EXPECT_EQ(sub, GetEntryTexts(*menu));
}

TEST_F(FileMenuTest, GetSelection) {
    auto config = MakeConfig();
    config.prefix_slots = {"#+#Back#+#"};

    std::unique_ptr<FileMenu> menu;
    ASSERT_TRUE(R_SUCCEEDED(FileMenu::Create(config, menu)));
    ASSERT_TRUE(R_SUCCEEDED(menu->EnterDirectory("sub")));

    Selection selection{};
    ASSERT_TRUE(R_SUCCEEDED(menu->GetSelection(0, selection)));
    EXPECT_EQ(SelectionType::Slot, selection.type);

    ASSERT_TRUE(R_SUCCEEDED(menu->GetSelection(1, selection)));
    EXPECT_EQ(SelectionType::Parent, selection.type);
    EXPECT_STREQ(m_dir.GetPath().s, selection.path.s);

    ASSERT_TRUE(R_SUCCEEDED(menu->GetSelection(2, selection)));
    EXPECT_EQ(SelectionType::Dir, selection.type);
    EXPECT_EQ("deeper", selection.name);

    ASSERT_TRUE(R_SUCCEEDED(menu->GetSelection(3, selection)));
    EXPECT_EQ(SelectionType::File, selection.type);
    EXPECT_STREQ(m_dir.Join("sub/c.py").c_str(), selection.path.s);

    EXPECT_EQ(Result_MenuSlotOutOfRange, menu->GetSelection(4, selection));
}

TEST_F(FileMenuTest, Affixes) {
    m_dir.CreateFile("d.tar.py");

    auto config = MakeConfig();
    config.dir_affix = "[#+#]";
    config.file_affix = {
        {"py", "#+# *"},
        {".tar.py", "#+# t"},
    };

    std::unique_ptr<FileMenu> menu;
    ASSERT_TRUE(R_SUCCEEDED(FileMenu::Create(config, menu)));

    const std::vector<std::string> root{"[sub]", "a.py *", "d.tar.py t"};
    EXPECT_EQ(root, GetEntryTexts(*menu));

    ASSERT_TRUE(R_SUCCEEDED(menu->EnterDirectory("sub")));
    const std::vector<std::string> sub{"[..]", "[deeper]", "c.py *"};
    EXPECT_EQ(sub, GetEntryTexts(*menu));
}

TEST_F(FileMenuTest, ConfigurationErrors) {
    std::unique_ptr<FileMenu> menu;

    auto config = MakeConfig();
    config.file_affix = {{".txt", "#+# *"}};
    EXPECT_EQ(Result_FileMenuConflictingAffix, FileMenu::Create(config, menu));

    config = MakeConfig();
    config.file_affix = {{".py", "no divider"}};
    EXPECT_EQ(Result_FileMenuBadAffix, FileMenu::Create(config, menu));

    config = MakeConfig();
    config.dir_affix = "#+##+#";
    EXPECT_EQ(Result_FileMenuBadAffix, FileMenu::Create(config, menu));

    config = MakeConfig();
    config.path = m_dir.Join("missing");
    EXPECT_EQ(Result_FileMenuUnreadablePath, FileMenu::Create(config, menu));

    config = MakeConfig();
    config.fs = nullptr;
    const auto rc = FileMenu::Create(config, menu);
    EXPECT_EQ(Result_FileMenuNoFs, rc);
    EXPECT_TRUE(IsConfigurationError(rc));

    EXPECT_TRUE(menu == nullptr);
}

TEST_F(FileMenuTest, RefreshPicksUpChanges) {
    std::unique_ptr<FileMenu> menu;
    ASSERT_TRUE(R_SUCCEEDED(FileMenu::Create(MakeConfig(), menu)));
    EXPECT_EQ(2, menu->GetSlotCount());

    m_dir.CreateFile("e.py");
    EXPECT_EQ(2, menu->GetSlotCount());

    ASSERT_TRUE(R_SUCCEEDED(menu->RefreshSlots()));
    EXPECT_EQ(3, menu->GetSlotCount());
}

TEST(FileMenuExtensionTest, Extensions) {
    EXPECT_EQ(".py", NormaliseExtension("PY"));
    EXPECT_EQ(".py", NormaliseExtension(".py"));
    EXPECT_EQ("", NormaliseExtension(""));

    EXPECT_EQ(".gz", GetExtension("a.tar.gz"));
    EXPECT_EQ(".tar.gz", GetExtensionChain("a.tar.GZ"));
    EXPECT_EQ("", GetExtension("README"));
    EXPECT_EQ("", GetExtension(".bashrc"));
}

} // namespace
} // namespace rotarymenu::menu
