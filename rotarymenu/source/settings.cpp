#include "settings.hpp"
#include "controller.hpp"
#include "file_menu.hpp"
#include "log.hpp"

#include <algorithm>

namespace rotarymenu {

auto Settings::GetGeometry() -> display::Geometry {
    display::Geometry geometry{};

    if (const auto cols = m_cols.Get(); cols > 0) {
        geometry.cols = cols;
    } else {
        log_write("[OPTION] bad cols: %ld, using %ld\n", cols, geometry.cols);
    }

    if (const auto rows = m_rows.Get(); rows > 0) {
        geometry.rows = rows;
    } else {
        log_write("[OPTION] bad rows: %ld, using %ld\n", rows, geometry.rows);
    }

    return geometry;
}

void Settings::Apply(Controller& controller) {
    controller.SetTimeout(std::max<long>(0, m_timeout.Get()));
    controller.SetScrollDelay(m_scroll_delay.Get());
}

void Settings::Apply(menu::FileMenuConfig& config) {
    config.show_folders = m_show_folders.Get();
}

void Settings::InitLog() {
    if (m_log.Get() && !log_is_init()) {
        log_stderr_init();
    }
}

} // namespace rotarymenu
