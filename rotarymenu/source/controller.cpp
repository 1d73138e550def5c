#include "controller.hpp"
#include "file_menu.hpp"
#include "log.hpp"

#include <algorithm>

namespace rotarymenu {

auto GetInputEventStr(InputEvent event) -> const char* {
    switch (event) {
        case InputEvent::RotateLeft: return "RotateLeft";
        case InputEvent::RotateRight: return "RotateRight";
        case InputEvent::Press: return "Press";
    }
    return "Unknown";
}

Controller::Controller(display::Display* display, const display::Geometry& geometry, menu::Menu* root)
: m_display{display}
, m_geometry{geometry}
, m_root{root}
, m_menu{root} {

}

auto Controller::OnInput(InputEvent event) -> Result {
    switch (event) {
        case InputEvent::RotateLeft: return RotateLeft();
        case InputEvent::RotateRight: return RotateRight();
        case InputEvent::Press: return Press();
    }

    log_write("[CONTROLLER] unknown input event: %d\n", (int)event);
    R_SUCCEED();
}

auto Controller::RotateLeft() -> Result {
    return Rotate(menu::Direction::Left);
}

auto Controller::RotateRight() -> Result {
    return Rotate(menu::Direction::Right);
}

auto Controller::Rotate(menu::Direction direction) -> Result {
    m_clock = 0;

    const auto prev_index = m_index;
    const auto prev_shift = m_shift;
    const auto prev_row = m_cursor_row;
    const auto was_scrolled = m_scroll_active && m_scroll_offset;

    // at either end of the list the state stays as is, no wrap around.
    if (direction == menu::Direction::Right) {
        if (GetSlotCount() && m_index < GetMaxIndex()) {
            m_index++;
            if (m_index > m_shift + m_geometry.rows - 1) {
                m_shift++;
            } else {
                m_cursor_row = std::min(m_cursor_row + 1, GetMaxCursorRow());
            }
        }
    } else {
        if (m_index > 0) {
            m_index--;
            if (m_index < m_shift) {
                m_shift--;
            } else {
                m_cursor_row = std::max<s64>(m_cursor_row - 1, 0);
            }
        }
    }

    Result rc{};
    if (m_index != prev_index) {
        ResetScroll();

        if (m_shift != prev_shift) {
            rc = Render();
        } else {
            // restore the start of the row that was scrolling.
            if (was_scrolled) {
                rc = WriteRow(prev_row, prev_index, false);
            }
            DrawCursor();
        }
    }

    m_menu->Dispatch(menu::CallbackType::Direction, direction, this);
    return rc;
}

auto Controller::Press() -> Result {
    m_clock = 0;

    if (auto file_menu = m_menu->AsFileMenu(); file_menu && GetSlotCount()) {
        return PressFileMenu(file_menu);
    }

    m_menu->Dispatch(menu::CallbackType::Press, m_index, this);
    R_SUCCEED();
}

auto Controller::PressFileMenu(menu::FileMenu* menu) -> Result {
    menu::Selection selection{};
    R_TRY(menu->GetSelection(m_index, selection));

    switch (selection.type) {
        case menu::SelectionType::Slot:
            menu->Dispatch(menu::CallbackType::Press, m_index, this);
            break;

        case menu::SelectionType::Parent:
            R_TRY(menu->ReturnToParent());
            return Redraw();

        case menu::SelectionType::Dir:
            if (!menu->IsCustomFolderBehavior()) {
                R_TRY(menu->EnterDirectory(selection.name));
                return Redraw();
            }
            menu->Dispatch(menu::CallbackType::DirPress, selection.path, this);
            break;

        case menu::SelectionType::File:
            menu->Dispatch(menu::CallbackType::Press, m_index, this);
            menu->Dispatch(menu::CallbackType::FilePress, selection.path, this);
            break;
    }

    R_SUCCEED();
}

auto Controller::Set(menu::Menu* menu) -> Result {
    m_menu = menu ? menu : m_root;
    m_clock = 0;

    log_write("[CONTROLLER] set menu kind: %d slots: %ld\n", (int)m_menu->GetKind(), GetSlotCount());

    Result rc{};
    auto target = m_menu;
    target->Activate(this, [this, target, &rc](){
        if (auto file_menu = target->AsFileMenu()) {
            if (const auto refresh_rc = file_menu->RefreshSlots(); R_FAILED(refresh_rc)) {
                log_write("[CONTROLLER] failed to refresh file menu: %s\n", GetResultName(refresh_rc));
                rc = refresh_rc;
            }
        }

        // the setup callback may have set another menu.
        if (m_menu == target) {
            if (const auto redraw_rc = Redraw(); R_SUCCEEDED(rc)) {
                rc = redraw_rc;
            }
        }
    });

    return rc;
}

void Controller::ResetCursor() {
    m_index -= m_cursor_row;
    m_cursor_row = 0;
    ResetScroll();
    DrawCursor();
}

auto Controller::ResetMenu() -> Result {
    ClampNavigation();
    ResetScroll();
    m_display->Clear();
    return Render();
}

auto Controller::Redraw() -> Result {
    ResetNavigation();
    ResetScroll();
    m_display->Clear();
    return Render();
}

auto Controller::UpdateCurrentSlot(bool keep_scrolled) -> Result {
    if (!GetSlotCount()) {
        R_SUCCEED();
    }

    // slots removed without ResetMenu().
    R_UNLESS(m_index < GetSlotCount(), Result_MenuSlotOutOfRange);

    const auto rc = WriteRow(m_cursor_row, m_index, keep_scrolled);
    DrawCursor();
    return rc;
}

auto Controller::Render(bool keep_scrolled) -> Result {
    const auto count = GetSlotCount();
    const auto visible = m_geometry.GetVisibleRows(count);

    // a bad slot only fails its own row, the first error is returned.
    Result rc{};
    for (s64 row = 0; row < visible && m_shift + row < count; row++) {
        if (const auto row_rc = WriteRow(row, m_shift + row, keep_scrolled); R_FAILED(row_rc) && R_SUCCEEDED(rc)) {
            rc = row_rc;
        }
    }

    DrawCursor();
    return rc;
}

auto Controller::IfOverflow(s64 index, bool& out) const -> Result {
    R_UNLESS(index >= 0 && index < GetSlotCount(), Result_MenuSlotOutOfRange);

    slot::SlotText text{};
    R_TRY(m_menu->GetSlots()[index].Resolve(text));
    out = (s64)text.Length() > m_geometry.cols;
    R_SUCCEED();
}

void Controller::SetTimeout(s64 seconds) {
    m_timeout = seconds;
    m_clock = 0;
}

auto Controller::TimerTick() -> Result {
    if (m_timeout <= 0 || m_menu == m_root) {
        m_clock = 0;
        R_SUCCEED();
    }

    if (++m_clock >= m_timeout) {
        log_write("[CONTROLLER] timeout after %ld seconds, setting root menu\n", m_clock);
        m_clock = 0;
        return Set(m_root);
    }

    R_SUCCEED();
}

void Controller::SetScrollDelay(s64 ticks) {
    m_scroll_delay = std::max<s64>(0, ticks);
}

auto Controller::ScrollTick() -> Result {
    if (m_menu->IsCustomCursor() || !GetSlotCount() || m_scroll_done) {
        R_SUCCEED();
    }

    if (m_scroll_ticks < m_scroll_delay) {
        m_scroll_ticks++;
        R_SUCCEED();
    }

    if (m_index >= GetSlotCount()) {
        log_write("[CONTROLLER] stale index: %ld slots: %ld, ResetMenu() was not called\n", m_index, GetSlotCount());
        m_scroll_done = true;
        R_THROW(Result_MenuSlotOutOfRange);
    }

    if (!m_scroll_active) {
        if (const auto rc = m_menu->GetSlots()[m_index].Resolve(m_scroll_text); R_FAILED(rc)) {
            m_scroll_done = true;
            return rc;
        }

        if ((s64)m_scroll_text.Length() <= m_geometry.cols) {
            m_scroll_done = true;
            R_SUCCEED();
        }

        m_scroll_active = true;
    }

    if (m_scroll_offset >= GetMaxScrollOffset(m_scroll_text)) {
        m_scroll_done = true;
        R_SUCCEED();
    }

    m_scroll_offset++;
    m_display->WriteLine(m_cursor_row, ComposeLine(m_scroll_text, m_scroll_offset));
    DrawCursor();
    R_SUCCEED();
}

auto Controller::ComposeLine(const slot::SlotText& text, s64 offset) const -> std::string {
    const auto cols = std::max<s64>(0, m_geometry.cols);
    const s64 width = cols - (s64)text.prefix.length() - (s64)text.suffix.length();

    // prefix and suffix alone do not fit, cut the whole line.
    if (width <= 0) {
        auto line = text.Compose();
        line.resize(cols, ' ');
        return line;
    }

    // the entry is cut or padded so that the suffix ends on the last column.
    offset = std::clamp<s64>(offset, 0, (s64)text.entry.length());
    auto entry = text.entry.substr(offset, width);
    entry.resize(width, ' ');

    return text.prefix + entry + text.suffix;
}

auto Controller::GetMaxScrollOffset(const slot::SlotText& text) const -> s64 {
    const s64 width = m_geometry.cols - (s64)text.prefix.length() - (s64)text.suffix.length();
    if (width <= 0) {
        return 0;
    }
    return std::max<s64>(0, (s64)text.entry.length() - width);
}

auto Controller::WriteRow(s64 row, s64 index, bool keep_scrolled) -> Result {
    R_UNLESS(index >= 0 && index < GetSlotCount(), Result_MenuSlotOutOfRange);

    slot::SlotText text{};
    if (const auto rc = m_menu->GetSlots()[index].Resolve(text); R_FAILED(rc)) {
        log_write("[CONTROLLER] failed to resolve slot: %ld row: %ld rc: %s\n", index, row, GetResultName(rc));
        m_display->WriteLine(row, std::string(std::max<s64>(0, m_geometry.cols), ' '));
        if (index == m_index) {
            ResetScroll();
        }
        return rc;
    }

    s64 offset{};
    if (index == m_index && m_scroll_active) {
        if (keep_scrolled && IsSameScroll(text)) {
            offset = m_scroll_offset;
            m_scroll_text = text;
        } else {
            ResetScroll();
        }
    }

    m_display->WriteLine(row, ComposeLine(text, offset));
    R_SUCCEED();
}

void Controller::DrawCursor() {
    if (m_menu->IsCustomCursor() || !GetSlotCount()) {
        return;
    }

    m_display->SetCursor(m_cursor_row, 0);
}

void Controller::ResetNavigation() {
    m_index = 0;
    m_shift = 0;
    m_cursor_row = 0;
}

void Controller::ClampNavigation() {
    const auto count = GetSlotCount();
    if (!count) {
        ResetNavigation();
        return;
    }

    m_index = std::clamp<s64>(m_index, 0, GetMaxIndex());
    m_shift = std::clamp<s64>(m_shift, 0, GetMaxShift());

    // keep the selected index inside the visible window.
    if (m_index < m_shift) {
        m_shift = m_index;
    } else if (m_index > m_shift + m_geometry.rows - 1) {
        m_shift = m_index - m_geometry.rows + 1;
    }

    m_cursor_row = m_index - m_shift;
}

void Controller::ResetScroll() {
    m_scroll_ticks = 0;
    m_scroll_offset = 0;
    m_scroll_active = false;
    m_scroll_done = false;
    m_scroll_text = {};
}

auto Controller::IsSameScroll(const slot::SlotText& text) const -> bool {
    return text.entry == m_scroll_text.entry &&
        text.prefix.length() == m_scroll_text.prefix.length() &&
        text.suffix.length() == m_scroll_text.suffix.length();
}

} // namespace rotarymenu
