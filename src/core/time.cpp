#include <relq/core/time.hpp>

#include <fmt/core.h>

#include <chrono>

namespace relq {

auto make_date(int year, unsigned month, unsigned day) -> Date {
    using namespace std::chrono;
    sys_days d{std::chrono::year{year} / std::chrono::month{month} / std::chrono::day{day}};
    return Date{.days = static_cast<std::int32_t>(d.time_since_epoch().count())};
}

auto format_date(Date date) -> std::string {
    using namespace std::chrono;
    sys_days day = sys_days{days{date.days}};
    year_month_day ymd{day};
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

}  // namespace relq
