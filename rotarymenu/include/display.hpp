#pragma once

#include "defines.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <algorithm>

namespace rotarymenu::display {

struct Geometry {
    s64 cols{20};
    s64 rows{4};

    // -1 when there is nothing to select.
    constexpr auto GetMaxIndex(s64 count) const -> s64 {
        return count - 1;
    }

    constexpr auto GetMaxShift(s64 count) const -> s64 {
        return std::max<s64>(0, count - rows);
    }

    // -1 when count is 0, no cursor is drawn then.
    constexpr auto GetMaxCursorRow(s64 count) const -> s64 {
        return std::min(rows, count) - 1;
    }

    constexpr auto GetVisibleRows(s64 count) const -> s64 {
        return std::max<s64>(0, std::min(rows, count));
    }
};

// character display the controller writes to, eg a hd44780 over i2c.
struct Display {
    virtual ~Display() = default;

    // text is always exactly cols characters long.
    virtual void WriteLine(s64 row, std::string_view text) = 0;
    virtual void SetCursor(s64 row, s64 col) = 0;
    // clears all rows and removes the cursor.
    virtual void Clear() = 0;
};

// keeps the display contents in memory, used for tests and headless setups.
class BufferDisplay final : public Display {
public:
    struct Cursor {
        s64 row;
        s64 col;
    };

public:
    explicit BufferDisplay(const Geometry& geometry);

    void WriteLine(s64 row, std::string_view text) override;
    void SetCursor(s64 row, s64 col) override;
    void Clear() override;

    auto GetGeometry() const -> const Geometry& {
        return m_geometry;
    }

    auto GetLine(s64 row) const -> const std::string& {
        return m_lines[row];
    }

    auto GetLines() const -> const std::vector<std::string>& {
        return m_lines;
    }

    auto GetCursor() const -> std::optional<Cursor> {
        return m_cursor;
    }

    auto GetWriteCount() const -> s64 {
        return m_write_count;
    }

    auto GetClearCount() const -> s64 {
        return m_clear_count;
    }

    void ResetCounters() {
        m_write_count = 0;
        m_clear_count = 0;
    }

private:
    const Geometry m_geometry;
    std::vector<std::string> m_lines{};
    std::optional<Cursor> m_cursor{};
    s64 m_write_count{};
    s64 m_clear_count{};
};

} // namespace rotarymenu::display
