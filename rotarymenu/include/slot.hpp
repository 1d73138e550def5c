#pragma once

#include "defines.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <functional>
#include <tuple>
#include <type_traits>
#include <concepts>
#include <cstdio>

namespace rotarymenu::slot {

// separates prefix, entry and suffix in every slot source.
inline constexpr std::string_view DIVIDER{"#+#"};

enum class SlotKind {
    Static,
    Dynamic,
};

struct SlotText {
    std::string prefix{};
    std::string entry{};
    std::string suffix{};

    auto Compose() const -> std::string {
        return prefix + entry + suffix;
    }

    auto Length() const -> std::size_t {
        return prefix.length() + entry.length() + suffix.length();
    }
};

// produces the text for one {name} marker.
using Generator = std::function<std::string()>;

struct Placeholder {
    std::string name{};
    Generator func{};
};

using Placeholders = std::vector<Placeholder>;

inline auto ToString(const std::string& v) -> std::string { return v; }
inline auto ToString(std::string_view v) -> std::string { return std::string{v}; }
inline auto ToString(const char* v) -> std::string { return v ? v : ""; }
inline auto ToString(char v) -> std::string { return std::string(1, v); }
inline auto ToString(bool v) -> std::string { return v ? "true" : "false"; }

template<std::integral T>
auto ToString(T v) -> std::string {
    return std::to_string(v);
}

template<std::floating_point T>
auto ToString(T v) -> std::string {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%g", static_cast<double>(v));
    return buf;
}

// binds func with a fixed set of arguments, the arguments are copied and
// passed again on every resolve.
template<typename F, typename... Args>
auto Bind(std::string name, F&& func, Args&&... args) -> Placeholder {
    return Placeholder{
        std::move(name),
        [f = std::forward<F>(func), t = std::make_tuple(std::forward<Args>(args)...)]() mutable {
            return ToString(std::apply(f, t));
        }
    };
}

// splits source on DIVIDER, fails unless the divider appears exactly twice.
auto Split(std::string_view source, SlotText& out) -> Result;
auto CountDivider(std::string_view source) -> s64;

class Slot {
public:
    Slot() = default;
    // static slot.
    Slot(const char* source);
    Slot(std::string source);
    // dynamic slot, placeholders are applied in the order given.
    Slot(std::string source, Placeholders placeholders);

    auto GetKind() const -> SlotKind {
        return m_kind;
    }

    auto GetSource() const -> const std::string& {
        return m_source;
    }

    auto GetPlaceholders() const -> const Placeholders& {
        return m_placeholders;
    }

    // dynamic slots call every generator exactly once per resolve.
    auto Resolve(SlotText& out) const -> Result;

private:
    SlotKind m_kind{SlotKind::Static};
    std::string m_source{};
    Placeholders m_placeholders{};
};

using Slots = std::vector<Slot>;

} // namespace rotarymenu::slot
