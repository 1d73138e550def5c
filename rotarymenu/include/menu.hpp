#pragma once

#include "slot.hpp"
#include "fs.hpp"
#include <functional>
#include <variant>

namespace rotarymenu {

class Controller;

namespace menu {

enum class MenuKind {
    Root,
    Nested,
    File,
};

enum MenuFlag : u32 {
    MenuFlag_None = 0,
    // callback with CallbackType::Setup before the menu is set.
    MenuFlag_Setup = BIT(0),
    // callback with CallbackType::AfterSetup after the menu is set.
    MenuFlag_AfterSetup = BIT(1),
    // the controller does not draw the cursor, the menu does.
    MenuFlag_CustomCursor = BIT(2),
};

enum class CallbackType {
    Setup,
    AfterSetup,
    Press,
    DirPress,
    FilePress,
    Direction,
};

enum class Direction {
    Left,
    Right,
};

// monostate for setup / after setup, index for press, path for
// dir / file press and the turned direction for direction.
using Value = std::variant<std::monostate, s64, fs::FsPath, Direction>;

class Menu;
class FileMenu;

struct Event {
    CallbackType type;
    Value value;
    Menu* menu;
    Controller* controller;

    auto GetIndex() const -> s64 {
        return std::get<s64>(value);
    }

    auto GetPath() const -> const fs::FsPath& {
        return std::get<fs::FsPath>(value);
    }

    auto GetDirection() const -> Direction {
        return std::get<Direction>(value);
    }
};

using Callback = std::function<void(const Event& event)>;

auto GetCallbackTypeStr(CallbackType type) -> const char*;
// "L" or "R".
auto GetDirectionStr(Direction direction) -> const char*;

// an ordered list of slots plus the callback for that list.
// root and nested menus are plain Menu objects, only the tag differs,
// the menu stack is owned by the caller.
class Menu {
public:
    Menu(MenuKind kind, const slot::Slots& slots, const Callback& cb, u32 flags = MenuFlag_None);
    virtual ~Menu() = default;

    static auto Root(const slot::Slots& slots, const Callback& cb, u32 flags = MenuFlag_None) -> Menu {
        return Menu{MenuKind::Root, slots, cb, flags};
    }

    static auto Nested(const slot::Slots& slots, const Callback& cb, u32 flags = MenuFlag_None) -> Menu {
        return Menu{MenuKind::Nested, slots, cb, flags};
    }

    auto GetKind() const -> MenuKind {
        return m_kind;
    }

    auto IsFileMenu() const -> bool {
        return m_kind == MenuKind::File;
    }

    auto AsFileMenu() -> FileMenu*;
    auto AsFileMenu() const -> const FileMenu*;

    auto GetSlots() const -> const slot::Slots& {
        return m_slots;
    }

    auto GetSlotCount() const -> s64 {
        return m_slots.size();
    }

    // index must be in range, does not redraw.
    auto ReplaceSlot(s64 index, const slot::Slot& slot) -> Result;

    // structural changes, the controller must be told with ResetMenu().
    void AddSlot(const slot::Slot& slot);
    auto RemoveSlot(s64 index) -> Result;
    void SetSlots(const slot::Slots& slots);

    auto GetFlags() const -> u32 {
        return m_flags;
    }

    auto HasSetup() const -> bool {
        return m_flags & MenuFlag_Setup;
    }

    auto HasAfterSetup() const -> bool {
        return m_flags & MenuFlag_AfterSetup;
    }

    auto IsCustomCursor() const -> bool {
        return m_flags & MenuFlag_CustomCursor;
    }

    void SetCallback(const Callback& cb) {
        m_callback = cb;
    }

    // fires Setup, runs on_set then fires AfterSetup, each only if flagged.
    void Activate(Controller* controller, const std::function<void()>& on_set);

    void Dispatch(CallbackType type, const Value& value, Controller* controller);

protected:
    // copying through a Menu would slice a FileMenu.
    Menu(const Menu&) = default;
    Menu& operator=(const Menu&) = delete;

protected:
    const MenuKind m_kind;
    slot::Slots m_slots{};

private:
    Callback m_callback{};
    const u32 m_flags;
};

} // namespace menu
} // namespace rotarymenu
