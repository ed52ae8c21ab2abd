#include "scene/SceneState.hpp"

#include <charconv>
#include <cstdio>

namespace GS {
namespace {

auto parseNumber(std::string_view text, int& out) -> bool {
    if (text.empty())
        return false;
    auto result = std::from_chars(text.data(), text.data() + text.size(), out);
    return result.ec == std::errc{} && result.ptr == text.data() + text.size();
}

} // namespace

auto parseIsoDate(std::string_view text) -> Expected<std::chrono::sys_days> {
    auto malformed = [&] {
        return std::unexpected(
            makeError(Error::Code::MalformedInput, "expected a YYYY-MM-DD date, got '" + std::string(text) + "'"));
    };
    if (text.size() != 10 || text[4] != '-' || text[7] != '-')
        return malformed();
    int year = 0;
    int month = 0;
    int day = 0;
    if (!parseNumber(text.substr(0, 4), year) || !parseNumber(text.substr(5, 2), month)
        || !parseNumber(text.substr(8, 2), day))
        return malformed();
    std::chrono::year_month_day ymd{std::chrono::year{year},
                                    std::chrono::month{static_cast<unsigned>(month)},
                                    std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok())
        return malformed();
    return std::chrono::sys_days{ymd};
}

auto formatIsoDate(std::chrono::sys_days day) -> std::string {
    std::chrono::year_month_day ymd{day};
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
    return buffer;
}

auto SceneDateTime::displayText() const -> std::string {
    std::chrono::year_month_day ymd{day};
    int  hour   = minuteOfDay / 60;
    int  minute = minuteOfDay % 60;
    bool pm     = hour >= 12;
    int  hour12 = hour % 12 == 0 ? 12 : hour % 12;
    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%d:%02d %s\n%u/%u/%d", hour12, minute, pm ? "PM" : "AM",
                  static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()), static_cast<int>(ymd.year()));
    return buffer;
}

auto SceneState::findIcon(IconGroup group, std::string_view id) const -> IconPlacement const* {
    for (auto const& icon : icons(group)) {
        if (icon.elementId == id)
            return &icon;
    }
    return nullptr;
}

} // namespace GS
