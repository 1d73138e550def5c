#include "menu.hpp"
#include "file_menu.hpp"
#include "log.hpp"

namespace rotarymenu::menu {

auto GetCallbackTypeStr(CallbackType type) -> const char* {
    switch (type) {
        case CallbackType::Setup: return "setup";
        case CallbackType::AfterSetup: return "after_setup";
        case CallbackType::Press: return "press";
        case CallbackType::DirPress: return "dir_press";
        case CallbackType::FilePress: return "file_press";
        case CallbackType::Direction: return "direction";
    }
    return "unknown";
}

auto GetDirectionStr(Direction direction) -> const char* {
    return direction == Direction::Left ? "L" : "R";
}

Menu::Menu(MenuKind kind, const slot::Slots& slots, const Callback& cb, u32 flags)
: m_kind{kind}
, m_slots{slots}
, m_callback{cb}
, m_flags{flags} {

}

auto Menu::AsFileMenu() -> FileMenu* {
    if (!IsFileMenu()) {
        return nullptr;
    }
    return static_cast<FileMenu*>(this);
}

auto Menu::AsFileMenu() const -> const FileMenu* {
    if (!IsFileMenu()) {
        return nullptr;
    }
    return static_cast<const FileMenu*>(this);
}

auto Menu::ReplaceSlot(s64 index, const slot::Slot& slot) -> Result {
    R_UNLESS(index >= 0 && index < GetSlotCount(), Result_MenuSlotOutOfRange);
    m_slots[index] = slot;
    R_SUCCEED();
}

void Menu::AddSlot(const slot::Slot& slot) {
    m_slots.emplace_back(slot);
}

auto Menu::RemoveSlot(s64 index) -> Result {
    R_UNLESS(index >= 0 && index < GetSlotCount(), Result_MenuSlotOutOfRange);
    m_slots.erase(m_slots.begin() + index);
    R_SUCCEED();
}

void Menu::SetSlots(const slot::Slots& slots) {
    m_slots = slots;
}

void Menu::Activate(Controller* controller, const std::function<void()>& on_set) {
    if (HasSetup()) {
        Dispatch(CallbackType::Setup, std::monostate{}, controller);
    }

    if (on_set) {
        on_set();
    }

    if (HasAfterSetup()) {
        Dispatch(CallbackType::AfterSetup, std::monostate{}, controller);
    }
}

void Menu::Dispatch(CallbackType type, const Value& value, Controller* controller) {
    if (!m_callback) {
        log_write("[MENU] no callback set for: %s\n", GetCallbackTypeStr(type));
        return;
    }

    // the callback may replace itself.
    const auto cb = m_callback;
    cb(Event{type, value, this, controller});
}

} // namespace rotarymenu::menu
