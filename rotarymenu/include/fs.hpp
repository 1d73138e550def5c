#pragma once

#include "defines.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <cstring>
#include <climits>

namespace rotarymenu::fs {

constexpr s64 FS_MAX_PATH = PATH_MAX;

struct FsPath {
    FsPath() = default;

    FsPath(const char* str) {
        Set(str);
    }

    FsPath(std::string_view str) {
        Set(str);
    }

    FsPath(const std::string& str) {
        Set(str);
    }

    auto toString() const -> std::string {
        return s;
    }

    auto c_str() const -> const char* {
        return s;
    }

    auto empty() const -> bool {
        return s[0] == '\0';
    }

    auto size() const -> std::size_t {
        return std::strlen(s);
    }

    auto length() const -> std::size_t {
        return size();
    }

    operator const char*() const {
        return s;
    }

    auto operator+=(std::string_view v) -> FsPath& {
        const auto len = size();
        const auto n = std::min<std::size_t>(v.size(), sizeof(s) - 1 - len);
        std::memcpy(s + len, v.data(), n);
        s[len + n] = '\0';
        return *this;
    }

    friend auto operator==(const FsPath& a, const FsPath& b) -> bool {
        return !std::strcmp(a.s, b.s);
    }

    friend auto operator==(const FsPath& a, const char* b) -> bool {
        return !std::strcmp(a.s, b);
    }

    char s[FS_MAX_PATH]{};

private:
    void Set(std::string_view v) {
        const auto n = std::min<std::size_t>(v.size(), sizeof(s) - 1);
        std::memcpy(s, v.data(), n);
        s[n] = '\0';
    }
};

struct DirEntry {
    std::string name{};
    bool is_dir{};
};

using DirEntries = std::vector<DirEntry>;

// minimal filesystem interface used by file menus.
struct Fs {
    virtual ~Fs() = default;

    // lists all entries of the directory, excluding "." and "..".
    virtual Result ReadDir(const FsPath& path, DirEntries& out) = 0;
    virtual bool IsDir(const FsPath& path) = 0;
};

// posix backed filesystem.
struct FsStdio final : Fs {
    Result ReadDir(const FsPath& path, DirEntries& out) override;
    bool IsDir(const FsPath& path) override;
};

// strips trailing slashes, "/" is kept as is.
auto NormalisePath(const FsPath& path) -> FsPath;
auto AppendPath(const FsPath& root, const FsPath& name) -> FsPath;
// returns false if the path has no parent (filesystem root).
auto GetParentPath(const FsPath& path, FsPath& out) -> bool;
auto GetSegmentCount(const FsPath& path) -> s64;

} // namespace rotarymenu::fs
