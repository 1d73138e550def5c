#include "file_menu.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>

namespace rotarymenu::menu {
namespace {

// directories starting with this are never shown.
constexpr std::string_view HIDDEN_DIR_PREFIX{"__"};
constexpr std::string_view PARENT_NAME{".."};

auto StripLeadingDots(std::string_view name) -> std::string_view {
    while (!name.empty() && name.front() == '.') {
        name.remove_prefix(1);
    }
    return name;
}

auto ToLower(std::string_view str) -> std::string {
    std::string out{str};
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){
        return std::tolower(c);
    });
    return out;
}

auto MakeSlot(const std::string& prefix, std::string_view name, const std::string& suffix) -> slot::Slot {
    std::string source{prefix};
    source += slot::DIVIDER;
    source += name;
    source += slot::DIVIDER;
    source += suffix;
    return slot::Slot{std::move(source)};
}

} // namespace

auto NormaliseExtension(std::string_view ext) -> std::string {
    if (ext.empty()) {
        return {};
    }

    auto out = ToLower(ext);
    if (out.front() != '.') {
        out.insert(out.begin(), '.');
    }
    return out;
}

auto GetExtension(std::string_view name) -> std::string {
    name = StripLeadingDots(name);
    const auto i = name.find_last_of('.');
    if (i == std::string_view::npos) {
        return {};
    }
    return ToLower(name.substr(i));
}

auto GetExtensionChain(std::string_view name) -> std::string {
    name = StripLeadingDots(name);
    const auto i = name.find_first_of('.');
    if (i == std::string_view::npos) {
        return {};
    }
    return ToLower(name.substr(i));
}

FileMenu::FileMenu(Token, const FileMenuConfig& config)
: Menu{MenuKind::File, {}, config.callback, config.flags}
, m_fs{config.fs}
, m_path{fs::NormalisePath(config.path)}
, m_current_path{m_path}
, m_show_folders{config.show_folders}
, m_prefix_slots{config.prefix_slots}
, m_root_slots{config.root_slots}
, m_custom_folder_behavior{config.custom_folder_behavior} {
    for (const auto& e : config.extension_filter) {
        if (!e.empty()) {
            m_extension_filter.emplace_back(NormaliseExtension(e));
        }
    }
}

auto FileMenu::Create(const FileMenuConfig& config, std::unique_ptr<FileMenu>& out) -> Result {
    if (!config.fs) {
        log_write("[FILEMENU] no fs given\n");
        R_THROW(Result_FileMenuNoFs);
    }

    auto menu = std::make_unique<FileMenu>(Token{}, config);

    R_TRY(menu->SetDirAffix(config.dir_affix));
    for (const auto& [ext, affix] : config.file_affix) {
        R_TRY(menu->SetFileAffix(ext, affix));
    }

    if (const auto rc = menu->RefreshSlots(); R_FAILED(rc)) {
        log_write("[FILEMENU] unreadable starting path: %s rc: %s\n", menu->m_path.s, GetResultName(rc));
        R_THROW(Result_FileMenuUnreadablePath);
    }

    out = std::move(menu);
    R_SUCCEED();
}

auto FileMenu::ParseAffix(const std::string& affix, Affix& out) -> Result {
    R_UNLESS(slot::CountDivider(affix) == 1, Result_FileMenuBadAffix);

    const auto i = affix.find(slot::DIVIDER);
    out.prefix = affix.substr(0, i);
    out.suffix = affix.substr(i + slot::DIVIDER.length());
    R_SUCCEED();
}

auto FileMenu::SetDirAffix(const std::string& affix) -> Result {
    if (const auto rc = ParseAffix(affix, m_dir_affix); R_FAILED(rc)) {
        log_write("[FILEMENU] bad dir affix: \"%s\"\n", affix.c_str());
        return rc;
    }
    R_SUCCEED();
}

auto FileMenu::SetFileAffix(const std::string& extension, const std::string& affix) -> Result {
    const auto key = NormaliseExtension(extension);
    const auto last = key.substr(std::min(key.find_last_of('.'), key.length()));

    // an affix for a file type that is filtered out can never be used.
    if (key.empty() || std::find(m_extension_filter.cbegin(), m_extension_filter.cend(), last) == m_extension_filter.cend()) {
        log_write("[FILEMENU] affix for \"%s\" conflicts with the extension filter\n", extension.c_str());
        R_THROW(Result_FileMenuConflictingAffix);
    }

    Affix out{};
    if (const auto rc = ParseAffix(affix, out); R_FAILED(rc)) {
        log_write("[FILEMENU] bad affix for \"%s\": \"%s\"\n", extension.c_str(), affix.c_str());
        return rc;
    }

    m_file_affix[key] = out;
    R_SUCCEED();
}

auto FileMenu::IsExtensionAllowed(const std::string& name) const -> bool {
    const auto ext = GetExtension(name);
    if (ext.empty()) {
        return false;
    }
    return std::find(m_extension_filter.cbegin(), m_extension_filter.cend(), ext) != m_extension_filter.cend();
}

auto FileMenu::FindAffix(const fs::DirEntry& entry) const -> const Affix& {
    if (entry.is_dir) {
        return m_dir_affix;
    }

    if (auto it = m_file_affix.find(GetExtensionChain(entry.name)); it != m_file_affix.cend()) {
        return it->second;
    }

    if (auto it = m_file_affix.find(GetExtension(entry.name)); it != m_file_affix.cend()) {
        return it->second;
    }

    return m_default_affix;
}

auto FileMenu::ScanPath(const fs::FsPath& path, fs::DirEntries& out) const -> Result {
    fs::DirEntries entries{};
    R_TRY(m_fs->ReadDir(path, entries));

    fs::DirEntries dirs{};
    fs::DirEntries files{};
    for (auto& e : entries) {
        if (e.is_dir) {
            if (m_show_folders && !e.name.starts_with(HIDDEN_DIR_PREFIX)) {
                dirs.emplace_back(std::move(e));
            }
        } else if (IsExtensionAllowed(e.name)) {
            files.emplace_back(std::move(e));
        }
    }

    const auto sorter = [](const fs::DirEntry& a, const fs::DirEntry& b) {
        return a.name < b.name;
    };

    std::sort(dirs.begin(), dirs.end(), sorter);
    std::sort(files.begin(), files.end(), sorter);

    out = std::move(dirs);
    out.insert(out.end(), std::make_move_iterator(files.begin()), std::make_move_iterator(files.end()));
    R_SUCCEED();
}

auto FileMenu::ListEntries(fs::DirEntries& out) -> Result {
    R_TRY(ScanPath(m_current_path, out));
    m_entries = out;
    R_SUCCEED();
}

auto FileMenu::RefreshSlots() -> Result {
    fs::DirEntries entries{};
    R_TRY(ListEntries(entries));
    BuildSlots();
    R_SUCCEED();
}

void FileMenu::BuildSlots() {
    slot::Slots slots{m_prefix_slots};

    if (m_depth == 0) {
        slots.insert(slots.end(), m_root_slots.cbegin(), m_root_slots.cend());
    } else if (m_depth > 0) {
        slots.emplace_back(MakeSlot(m_dir_affix.prefix, PARENT_NAME, m_dir_affix.suffix));
    }

    for (const auto& e : m_entries) {
        const auto& affix = FindAffix(e);
        slots.emplace_back(MakeSlot(affix.prefix, e.name, affix.suffix));
    }

    m_slots = std::move(slots);
}

auto FileMenu::GetPrefixCount() const -> s64 {
    s64 count = m_prefix_slots.size();
    if (m_depth == 0) {
        count += m_root_slots.size();
    }
    return count;
}

auto FileMenu::ChangePath(const fs::FsPath& path, s64 depth) -> Result {
    const auto new_path = fs::NormalisePath(path);

    fs::DirEntries entries{};
    if (const auto rc = ScanPath(new_path, entries); R_FAILED(rc)) {
        log_write("[FILEMENU] failed to change path to: %s rc: %s\n", new_path.s, GetResultName(rc));
        return rc;
    }

    m_current_path = new_path;
    m_depth = depth;
    m_entries = std::move(entries);
    BuildSlots();

    log_write("[FILEMENU] path: %s depth: %ld\n", m_current_path.s, m_depth);
    R_SUCCEED();
}

auto FileMenu::EnterDirectory(std::string_view name) -> Result {
    const auto it = std::find_if(m_entries.cbegin(), m_entries.cend(), [name](const fs::DirEntry& e) {
        return e.is_dir && e.name == name;
    });

    if (it == m_entries.cend()) {
        log_write("[FILEMENU] no such directory: %.*s\n", (int)name.length(), name.data());
        R_THROW(Result_FileMenuDirNotFound);
    }

    return ChangePath(fs::AppendPath(m_current_path, it->name), m_depth + 1);
}

auto FileMenu::ReturnToParent() -> Result {
    fs::FsPath parent{};
    if (!fs::GetParentPath(m_current_path, parent)) {
        log_write("[FILEMENU] already at root: %s\n", m_current_path.s);
        R_THROW(Result_FileMenuAtRoot);
    }

    return ChangePath(parent, m_depth - 1);
}

auto FileMenu::SetPath(const fs::FsPath& path, std::optional<s64> depth) -> Result {
    if (depth.has_value() && depth.value() < 0) {
        log_write("[FILEMENU] bad depth: %ld\n", depth.value());
        R_THROW(Result_FileMenuBadDepth);
    }

    const auto new_depth = depth.value_or(fs::GetSegmentCount(path) - fs::GetSegmentCount(m_path));
    return ChangePath(path, new_depth);
}

auto FileMenu::ReturnToDefault() -> Result {
    return ChangePath(m_path, 0);
}

auto FileMenu::GetSelection(s64 index, Selection& out) const -> Result {
    R_UNLESS(index >= 0 && index < GetSlotCount(), Result_MenuSlotOutOfRange);

    auto offset = GetPrefixCount();
    if (index < offset) {
        out = Selection{SelectionType::Slot, {}, {}};
        R_SUCCEED();
    }

    if (m_depth > 0) {
        if (index == offset) {
            out = Selection{SelectionType::Parent, std::string{PARENT_NAME}, {}};
            fs::GetParentPath(m_current_path, out.path);
            R_SUCCEED();
        }
        offset++;
    }

    const auto entry_index = index - offset;
    R_UNLESS(entry_index < (s64)m_entries.size(), Result_MenuSlotOutOfRange);

    const auto& e = m_entries[entry_index];
    out.type = e.is_dir ? SelectionType::Dir : SelectionType::File;
    out.name = e.name;
    out.path = fs::AppendPath(m_current_path, e.name);
    R_SUCCEED();
}

} // namespace rotarymenu::menu
