#pragma once

#include "menu.hpp"
#include <map>
#include <memory>
#include <optional>

namespace rotarymenu::menu {

struct FileMenuConfig {
    // not owned, must outlive the menu.
    fs::Fs* fs{};
    // starting (default) directory.
    fs::FsPath path{};
    Callback callback{};
    // files are only shown if their extension is listed, case insensitive.
    std::vector<std::string> extension_filter{".py"};
    bool show_folders{true};
    // shown before the directory entries, presses are passed on as CallbackType::Press.
    slot::Slots prefix_slots{};
    // shown after the prefix slots, only while depth is 0.
    slot::Slots root_slots{};
    // "prefix#+#suffix" used for directories and the parent entry.
    std::string dir_affix{"#+#"};
    // extension (".tar.gz" or ".gz") -> "prefix#+#suffix".
    std::map<std::string, std::string> file_affix{};
    // directories are passed on as CallbackType::DirPress instead of being opened.
    bool custom_folder_behavior{};
    u32 flags{MenuFlag_None};
};

enum class SelectionType {
    // prefix or root slot.
    Slot,
    // the ".." entry.
    Parent,
    Dir,
    File,
};

struct Selection {
    SelectionType type{};
    std::string name{};
    fs::FsPath path{};
};

// menu that lists a directory, see FileMenuConfig.
// the slots are prefix slots ++ root slots (depth 0) ++ ".." (depth > 0) ++ entries.
class FileMenu final : public Menu {
private:
    // only Create() can construct.
    struct Token {
        explicit Token() = default;
    };

public:
    FileMenu(Token, const FileMenuConfig& config);

    // fails with a configuration error if the affixes conflict with the filter
    // or the starting path cannot be read.
    static auto Create(const FileMenuConfig& config, std::unique_ptr<FileMenu>& out) -> Result;

    // reads the current directory, directories first then files, each sorted by name.
    auto ListEntries(fs::DirEntries& out) -> Result;
    // rebuilds the slots from the current directory.
    auto RefreshSlots() -> Result;

    // name must be a directory from the last listing.
    auto EnterDirectory(std::string_view name) -> Result;
    auto ReturnToParent() -> Result;
    // if depth is not set, it is the segment difference to the default path.
    auto SetPath(const fs::FsPath& path, std::optional<s64> depth = std::nullopt) -> Result;
    auto ReturnToDefault() -> Result;

    auto GetSelection(s64 index, Selection& out) const -> Result;

    // these do not refresh, call RefreshSlots() after.
    void SetPrefixSlots(const slot::Slots& slots) {
        m_prefix_slots = slots;
    }

    void SetRootSlots(const slot::Slots& slots) {
        m_root_slots = slots;
    }

    auto SetDirAffix(const std::string& affix) -> Result;
    auto SetFileAffix(const std::string& extension, const std::string& affix) -> Result;

    auto GetPath() const -> const fs::FsPath& {
        return m_current_path;
    }

    auto GetDefaultPath() const -> const fs::FsPath& {
        return m_path;
    }

    auto GetDepth() const -> s64 {
        return m_depth;
    }

    auto GetEntries() const -> const fs::DirEntries& {
        return m_entries;
    }

    auto IsCustomFolderBehavior() const -> bool {
        return m_custom_folder_behavior;
    }

    // number of slots before the directory derived slots.
    auto GetPrefixCount() const -> s64;

private:
    struct Affix {
        std::string prefix{};
        std::string suffix{};
    };

private:
    auto ScanPath(const fs::FsPath& path, fs::DirEntries& out) const -> Result;
    auto ChangePath(const fs::FsPath& path, s64 depth) -> Result;
    void BuildSlots();
    auto IsExtensionAllowed(const std::string& name) const -> bool;
    auto FindAffix(const fs::DirEntry& entry) const -> const Affix&;

    static auto ParseAffix(const std::string& affix, Affix& out) -> Result;

private:
    fs::Fs* m_fs{};
    const fs::FsPath m_path;
    fs::FsPath m_current_path{};
    s64 m_depth{};
    std::vector<std::string> m_extension_filter{};
    const bool m_show_folders;
    slot::Slots m_prefix_slots{};
    slot::Slots m_root_slots{};
    Affix m_dir_affix{};
    Affix m_default_affix{};
    std::map<std::string, Affix> m_file_affix{};
    const bool m_custom_folder_behavior;
    fs::DirEntries m_entries{};
};

// lower case, with a leading dot.
auto NormaliseExtension(std::string_view ext) -> std::string;
// ".gz" for "a.tar.gz", empty if there is none.
auto GetExtension(std::string_view name) -> std::string;
// ".tar.gz" for "a.tar.gz", empty if there is none.
auto GetExtensionChain(std::string_view name) -> std::string;

} // namespace rotarymenu::menu
