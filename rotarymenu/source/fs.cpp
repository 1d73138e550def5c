#include "fs.hpp"
#include "log.hpp"

#include <dirent.h>
#include <sys/stat.h>
#include <cerrno>

namespace rotarymenu::fs {

Result FsStdio::ReadDir(const FsPath& path, DirEntries& out) {
    out.clear();

    auto dir = opendir(path);
    if (!dir) {
        const auto err = errno;
        log_write("[FS] failed to open dir: %s errno: %d\n", path.s, err);
        if (err == ENOENT || err == ENOTDIR) {
            R_THROW(Result_FsPathNotFound);
        }
        R_THROW(Result_FsReadDirFailed);
    }
    ON_SCOPE_EXIT(closedir(dir));

    while (auto d = readdir(dir)) {
        if (!std::strcmp(d->d_name, ".") || !std::strcmp(d->d_name, "..")) {
            continue;
        }

        DirEntry entry{};
        entry.name = d->d_name;

        // d_type is not filled by every filesystem.
        if (d->d_type == DT_UNKNOWN || d->d_type == DT_LNK) {
            entry.is_dir = IsDir(AppendPath(path, entry.name));
        } else {
            entry.is_dir = d->d_type == DT_DIR;
        }

        out.emplace_back(std::move(entry));
    }

    R_SUCCEED();
}

bool FsStdio::IsDir(const FsPath& path) {
    struct stat st{};
    if (stat(path, &st)) {
        return false;
    }
    return S_ISDIR(st.st_mode);
}

auto NormalisePath(const FsPath& path) -> FsPath {
    FsPath out{path};
    auto len = out.size();
    while (len > 1 && out.s[len - 1] == '/') {
        out.s[--len] = '\0';
    }
    return out;
}

auto AppendPath(const FsPath& root, const FsPath& name) -> FsPath {
    auto out = NormalisePath(root);
    if (out.empty() || out.s[out.size() - 1] != '/') {
        out += "/";
    }

    std::string_view v{name.s};
    while (!v.empty() && v.front() == '/') {
        v.remove_prefix(1);
    }
    out += v;
    return NormalisePath(out);
}

auto GetParentPath(const FsPath& path, FsPath& out) -> bool {
    const auto norm = NormalisePath(path);
    const std::string_view v{norm.s};

    const auto i = v.find_last_of('/');
    if (v.empty() || v == "/" || i == std::string_view::npos) {
        return false;
    }

    if (i == 0) {
        out = "/";
    } else {
        out = v.substr(0, i);
    }
    return true;
}

auto GetSegmentCount(const FsPath& path) -> s64 {
    const auto norm = NormalisePath(path);
    s64 count{};
    bool in_segment{};
    for (const char* p = norm.s; *p; p++) {
        if (*p == '/') {
            in_segment = false;
        } else if (!in_segment) {
            in_segment = true;
            count++;
        }
    }
    return count;
}

} // namespace rotarymenu::fs
