#pragma once

#include <cstdint>
#include <cstddef>
#include <utility>

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using s8 = std::int8_t;
using s16 = std::int16_t;
using s32 = std::int32_t;
using s64 = std::int64_t;

// module in the low 9 bits, description in the next 13.
using Result = u32;

#ifndef BIT
#define BIT(n) (1U << (n))
#endif

#define MAKERESULT(module, description) \
    ((((module) & 0x1FF)) | ((description) & 0x1FFF) << 9)

#define R_MODULE(res) ((res) & 0x1FF)
#define R_DESCRIPTION(res) (((res) >> 9) & 0x1FFF)

#define R_SUCCEEDED(res) ((res) == 0)
#define R_FAILED(res) ((res) != 0)

#define R_SUCCEED() return (Result)0

#define R_THROW(res) return (res)

#define R_TRY(r) { \
    if (const auto _rc = (r); R_FAILED(_rc)) { \
        return _rc; \
    } \
}

#define R_UNLESS(expr, res) { \
    if (!(expr)) { \
        R_THROW(res); \
    } \
}

#define ANONYMOUS_VARIABLE_CONCAT(a, b) a##b
#define ANONYMOUS_VARIABLE(line) ANONYMOUS_VARIABLE_CONCAT(scope_exit_, line)
#define ON_SCOPE_EXIT(...) auto ANONYMOUS_VARIABLE(__LINE__) = ::rotarymenu::ScopeGuard{[&]() { __VA_ARGS__; }}

namespace rotarymenu {

template<typename F>
struct ScopeGuard {
    ScopeGuard(F f) : m_f{std::move(f)} {}
    ~ScopeGuard() { m_f(); }
    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

private:
    F m_f;
};

enum { Module_RotaryMenu = 421 };

enum RotaryMenuResult : Result {
    // format errors.
    RotaryMenuResult_SlotBadDivider = 1,

    // not found errors.
    RotaryMenuResult_FileMenuDirNotFound = 100,
    RotaryMenuResult_FsPathNotFound,

    // boundary errors.
    RotaryMenuResult_FileMenuAtRoot = 200,
    RotaryMenuResult_MenuSlotOutOfRange,
    RotaryMenuResult_FileMenuBadDepth,

    // configuration errors.
    RotaryMenuResult_FileMenuConflictingAffix = 300,
    RotaryMenuResult_FileMenuBadAffix,
    RotaryMenuResult_FileMenuUnreadablePath,
    RotaryMenuResult_FileMenuNoFs,

    // filesystem errors.
    RotaryMenuResult_FsReadDirFailed = 400,
};

#define MAKE_ROTARYMENU_RESULT_ENUM(x) Result_##x = MAKERESULT(Module_RotaryMenu, RotaryMenuResult_##x)

enum : Result {
    MAKE_ROTARYMENU_RESULT_ENUM(SlotBadDivider),
    MAKE_ROTARYMENU_RESULT_ENUM(FileMenuDirNotFound),
    MAKE_ROTARYMENU_RESULT_ENUM(FsPathNotFound),
    MAKE_ROTARYMENU_RESULT_ENUM(FileMenuAtRoot),
    MAKE_ROTARYMENU_RESULT_ENUM(MenuSlotOutOfRange),
    MAKE_ROTARYMENU_RESULT_ENUM(FileMenuBadDepth),
    MAKE_ROTARYMENU_RESULT_ENUM(FileMenuConflictingAffix),
    MAKE_ROTARYMENU_RESULT_ENUM(FileMenuBadAffix),
    MAKE_ROTARYMENU_RESULT_ENUM(FileMenuUnreadablePath),
    MAKE_ROTARYMENU_RESULT_ENUM(FileMenuNoFs),
    MAKE_ROTARYMENU_RESULT_ENUM(FsReadDirFailed),
};

#undef MAKE_ROTARYMENU_RESULT_ENUM

// returns a printable name, "Unknown" for codes of other modules.
auto GetResultName(Result rc) -> const char*;

auto IsFormatError(Result rc) -> bool;
auto IsNotFoundError(Result rc) -> bool;
auto IsBoundaryError(Result rc) -> bool;
auto IsConfigurationError(Result rc) -> bool;

} // namespace rotarymenu
