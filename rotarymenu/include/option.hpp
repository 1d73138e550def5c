#pragma once

#include <string>
#include <optional>

namespace rotarymenu::option {

void SetConfigPath(const std::string& path);
auto GetConfigPath() -> const char*;

template<typename T>
struct OptionBase {
    OptionBase(const std::string& section, const std::string& name, T default_value, bool file = true)
    : m_section{section}
    , m_name{name}
    , m_default_value{default_value}
    , m_file{file} {
    }

    auto Get() -> T;
    void Set(T value);
    // drops the cached value, the next Get() reads the file again.
    void Reset() {
        m_value.reset();
    }

    auto GetName() const -> const std::string& {
        return m_name;
    }

private:
    auto GetInternal(const char* name) -> T;

private:
    const std::string m_section;
    const std::string m_name;
    const T m_default_value;
    const bool m_file;
    std::optional<T> m_value;
};

using OptionBool = OptionBase<bool>;
using OptionLong = OptionBase<long>;
using OptionString = OptionBase<std::string>;

} // namespace rotarymenu::option
