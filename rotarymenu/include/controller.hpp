#pragma once

#include "menu.hpp"
#include "display.hpp"

namespace rotarymenu {

namespace menu {
class FileMenu;
} // namespace menu

enum class InputEvent {
    RotateLeft,
    RotateRight,
    Press,
};

auto GetInputEventStr(InputEvent event) -> const char*;

// drives the active menu on a character display.
// events are handled one at a time, each one runs to completion
// (state update, redraw, callback) before returning.
class Controller {
public:
    // root must outlive the controller, nothing is drawn until Set() is called.
    Controller(display::Display* display, const display::Geometry& geometry, menu::Menu* root);

    auto OnInput(InputEvent event) -> Result;
    auto RotateLeft() -> Result;
    auto RotateRight() -> Result;
    auto Press() -> Result;

    // sets the active menu, nullptr sets the root menu.
    auto Set(menu::Menu* menu = nullptr) -> Result;

    // moves the cursor to the top row, the shift is kept.
    void ResetCursor();
    // call after slots were added or removed outside of a file menu refresh.
    auto ResetMenu() -> Result;
    // redraws the selected row only, eg after Menu::ReplaceSlot().
    auto UpdateCurrentSlot(bool keep_scrolled = false) -> Result;
    // keep_scrolled keeps the marquee offset of the selected row if the
    // entry text and the prefix / suffix lengths did not change.
    auto Render(bool keep_scrolled = false) -> Result;

    auto IfOverflow(s64 index, bool& out) const -> Result;

    // seconds of inactivity before the root menu is set again, 0 disables.
    void SetTimeout(s64 seconds);
    // called once a second by the owner of the timer.
    auto TimerTick() -> Result;

    // ticks to wait before an overflowing row starts scrolling.
    void SetScrollDelay(s64 ticks);
    // advances the marquee of the selected row by one character.
    auto ScrollTick() -> Result;

    auto GetMenu() const -> menu::Menu* {
        return m_menu;
    }

    auto GetRoot() const -> menu::Menu* {
        return m_root;
    }

    auto GetGeometry() const -> const display::Geometry& {
        return m_geometry;
    }

    auto GetIndex() const -> s64 {
        return m_index;
    }

    auto GetShift() const -> s64 {
        return m_shift;
    }

    auto GetCursorRow() const -> s64 {
        return m_cursor_row;
    }

    auto GetMaxIndex() const -> s64 {
        return m_geometry.GetMaxIndex(GetSlotCount());
    }

    auto GetMaxShift() const -> s64 {
        return m_geometry.GetMaxShift(GetSlotCount());
    }

    auto GetMaxCursorRow() const -> s64 {
        return m_geometry.GetMaxCursorRow(GetSlotCount());
    }

    auto GetScrollOffset() const -> s64 {
        return m_scroll_offset;
    }

    auto GetTimeoutClock() const -> s64 {
        return m_clock;
    }

private:
    auto GetSlotCount() const -> s64 {
        return m_menu->GetSlotCount();
    }

    auto Rotate(menu::Direction direction) -> Result;
    auto PressFileMenu(menu::FileMenu* menu) -> Result;

    auto ComposeLine(const slot::SlotText& text, s64 offset) const -> std::string;
    auto GetMaxScrollOffset(const slot::SlotText& text) const -> s64;
    auto WriteRow(s64 row, s64 index, bool keep_scrolled) -> Result;
    void DrawCursor();

    void ResetNavigation();
    void ClampNavigation();
    void ResetScroll();
    auto IsSameScroll(const slot::SlotText& text) const -> bool;
    // clears and redraws after the active menu changed its directory.
    auto Redraw() -> Result;

private:
    display::Display* const m_display;
    const display::Geometry m_geometry;
    menu::Menu* const m_root;
    menu::Menu* m_menu;

    s64 m_index{};
    s64 m_shift{};
    s64 m_cursor_row{};

    s64 m_timeout{};
    s64 m_clock{};

    // marquee of the selected row.
    s64 m_scroll_delay{4};
    s64 m_scroll_ticks{};
    s64 m_scroll_offset{};
    bool m_scroll_active{};
    bool m_scroll_done{};
    slot::SlotText m_scroll_text{};
};

} // namespace rotarymenu
