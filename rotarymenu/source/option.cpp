#include <minIni.h>
#include <type_traits>
#include "option.hpp"
#include "log.hpp"

#include <climits>

namespace rotarymenu::option {
namespace {

std::string g_config_path{"/etc/rotarymenu/config.ini"};

} // namespace

void SetConfigPath(const std::string& path) {
    log_write("[OPTION] config path: %s\n", path.c_str());
    g_config_path = path;
}

auto GetConfigPath() -> const char* {
    return g_config_path.c_str();
}

template<typename T>
auto OptionBase<T>::GetInternal(const char* name) -> T {
    if (!m_value.has_value()) {
        if (m_file) {
            if constexpr(std::is_same_v<T, bool>) {
                m_value = ini_getbool(m_section.c_str(), name, m_default_value, GetConfigPath());
            } else if constexpr(std::is_same_v<T, long>) {
                m_value = ini_getl(m_section.c_str(), name, m_default_value, GetConfigPath());
            } else if constexpr(std::is_same_v<T, std::string>) {
                char buf[PATH_MAX]{};
                ini_gets(m_section.c_str(), name, m_default_value.c_str(), buf, sizeof(buf), GetConfigPath());
                m_value = buf;
            }
        } else {
            m_value = m_default_value;
        }
    }

    return m_value.value();
}

template<typename T>
auto OptionBase<T>::Get() -> T {
    return GetInternal(m_name.c_str());
}

template<typename T>
void OptionBase<T>::Set(T value) {
    m_value = value;
    if (m_file) {
        int rc{1};
        if constexpr(std::is_same_v<T, bool>) {
            rc = ini_putl(m_section.c_str(), m_name.c_str(), value, GetConfigPath());
        } else if constexpr(std::is_same_v<T, long>) {
            rc = ini_putl(m_section.c_str(), m_name.c_str(), value, GetConfigPath());
        } else if constexpr(std::is_same_v<T, std::string>) {
            rc = ini_puts(m_section.c_str(), m_name.c_str(), value.c_str(), GetConfigPath());
        }

        if (!rc) {
            log_write("[OPTION] failed to write [%s] %s to %s\n", m_section.c_str(), m_name.c_str(), GetConfigPath());
        }
    }
}

template struct OptionBase<bool>;
template struct OptionBase<long>;
template struct OptionBase<std::string>;

} // namespace rotarymenu::option
