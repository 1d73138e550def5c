#include "defines.hpp"

namespace rotarymenu {
namespace {

auto GetDescription(Result rc) -> u32 {
    if (R_MODULE(rc) != Module_RotaryMenu) {
        return 0;
    }
    return R_DESCRIPTION(rc);
}

} // namespace

auto GetResultName(Result rc) -> const char* {
    if (R_SUCCEEDED(rc)) {
        return "Success";
    }

    switch (GetDescription(rc)) {
        case RotaryMenuResult_SlotBadDivider: return "SlotBadDivider";
        case RotaryMenuResult_FileMenuDirNotFound: return "FileMenuDirNotFound";
        case RotaryMenuResult_FsPathNotFound: return "FsPathNotFound";
        case RotaryMenuResult_FileMenuAtRoot: return "FileMenuAtRoot";
        case RotaryMenuResult_MenuSlotOutOfRange: return "MenuSlotOutOfRange";
        case RotaryMenuResult_FileMenuBadDepth: return "FileMenuBadDepth";
        case RotaryMenuResult_FileMenuConflictingAffix: return "FileMenuConflictingAffix";
        case RotaryMenuResult_FileMenuBadAffix: return "FileMenuBadAffix";
        case RotaryMenuResult_FileMenuUnreadablePath: return "FileMenuUnreadablePath";
        case RotaryMenuResult_FileMenuNoFs: return "FileMenuNoFs";
        case RotaryMenuResult_FsReadDirFailed: return "FsReadDirFailed";
    }

    return "Unknown";
}

// descriptions are grouped in blocks of 100, see RotaryMenuResult.
auto IsFormatError(Result rc) -> bool {
    const auto desc = GetDescription(rc);
    return desc >= 1 && desc < 100;
}

auto IsNotFoundError(Result rc) -> bool {
    const auto desc = GetDescription(rc);
    return desc >= 100 && desc < 200;
}

auto IsBoundaryError(Result rc) -> bool {
    const auto desc = GetDescription(rc);
    return desc >= 200 && desc < 300;
}

auto IsConfigurationError(Result rc) -> bool {
    const auto desc = GetDescription(rc);
    return desc >= 300 && desc < 400;
}

} // namespace rotarymenu
