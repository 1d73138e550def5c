#pragma once

#include "option.hpp"
#include "display.hpp"

namespace rotarymenu {

class Controller;

namespace menu {
struct FileMenuConfig;
} // namespace menu

// options read from the config file, see option::SetConfigPath().
struct Settings {
    auto GetGeometry() -> display::Geometry;
    // pushes the timeout and scroll delay into the controller.
    void Apply(Controller& controller);
    // fills the listing options of a file menu.
    void Apply(menu::FileMenuConfig& config);
    // starts logging to stderr if enabled.
    void InitLog();

    option::OptionLong m_cols{"display", "cols", 20};
    option::OptionLong m_rows{"display", "rows", 4};

    option::OptionLong m_timeout{"menu", "timeout", 0};
    option::OptionLong m_scroll_delay{"menu", "scroll_delay", 4};
    option::OptionBool m_log{"menu", "log", false};

    option::OptionBool m_show_folders{"files", "show_folders", true};
};

} // namespace rotarymenu
