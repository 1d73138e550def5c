#include "slot.hpp"
#include "log.hpp"

namespace rotarymenu::slot {
namespace {

void ReplaceAll(std::string& str, std::string_view from, std::string_view to) {
    if (from.empty()) {
        return;
    }

    std::size_t pos{};
    while ((pos = str.find(from, pos)) != std::string::npos) {
        str.replace(pos, from.length(), to);
        pos += to.length();
    }
}

} // namespace

auto CountDivider(std::string_view source) -> s64 {
    s64 count{};
    std::size_t pos{};
    while ((pos = source.find(DIVIDER, pos)) != std::string_view::npos) {
        count++;
        pos += DIVIDER.length();
    }
    return count;
}

auto Split(std::string_view source, SlotText& out) -> Result {
    R_UNLESS(CountDivider(source) == 2, Result_SlotBadDivider);

    const auto first = source.find(DIVIDER);
    const auto second = source.find(DIVIDER, first + DIVIDER.length());

    out.prefix = source.substr(0, first);
    out.entry = source.substr(first + DIVIDER.length(), second - first - DIVIDER.length());
    out.suffix = source.substr(second + DIVIDER.length());
    R_SUCCEED();
}

Slot::Slot(const char* source)
: m_kind{SlotKind::Static}
, m_source{source ? source : ""} {

}

Slot::Slot(std::string source)
: m_kind{SlotKind::Static}
, m_source{std::move(source)} {

}

Slot::Slot(std::string source, Placeholders placeholders)
: m_kind{SlotKind::Dynamic}
, m_source{std::move(source)}
, m_placeholders{std::move(placeholders)} {

}

auto Slot::Resolve(SlotText& out) const -> Result {
    if (m_kind == SlotKind::Static) {
        if (const auto rc = Split(m_source, out); R_FAILED(rc)) {
            log_write("[SLOT] bad static slot: \"%s\"\n", m_source.c_str());
            return rc;
        }
        R_SUCCEED();
    }

    auto source = m_source;
    for (const auto& e : m_placeholders) {
        const auto value = e.func ? e.func() : std::string{};
        ReplaceAll(source, "{" + e.name + "}", value);
    }

    if (const auto rc = Split(source, out); R_FAILED(rc)) {
        log_write("[SLOT] bad dynamic slot: \"%s\" resolved: \"%s\"\n", m_source.c_str(), source.c_str());
        return rc;
    }

    R_SUCCEED();
}

} // namespace rotarymenu::slot
