#include "display.hpp"
#include "log.hpp"

namespace rotarymenu::display {

BufferDisplay::BufferDisplay(const Geometry& geometry)
: m_geometry{geometry} {
    m_lines.resize(std::max<s64>(0, m_geometry.rows), std::string(std::max<s64>(0, m_geometry.cols), ' '));
}

void BufferDisplay::WriteLine(s64 row, std::string_view text) {
    if (row < 0 || row >= m_geometry.rows) {
        log_write("[DISPLAY] write out of range row: %ld\n", row);
        return;
    }

    m_lines[row] = text;
    m_write_count++;
}

void BufferDisplay::SetCursor(s64 row, s64 col) {
    if (row < 0 || row >= m_geometry.rows || col < 0 || col >= m_geometry.cols) {
        log_write("[DISPLAY] cursor out of range row: %ld col: %ld\n", row, col);
        return;
    }

    m_cursor = Cursor{row, col};
}

void BufferDisplay::Clear() {
    for (auto& line : m_lines) {
        line.assign(m_geometry.cols, ' ');
    }
    m_cursor.reset();
    m_clear_count++;
}

} // namespace rotarymenu::display
