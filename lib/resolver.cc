#include <charconv>
#include <stdexcept>
#include <reldate/resolver.hh>

using namespace reldate;
namespace chr = std::chrono;

namespace {
auto AddMonths(Date reference, i64 count) -> Date {
    auto ym = chr::year_month{reference.year(), reference.month()} + chr::months(count);
    auto last = chr::year_month_day_last{ym.year(), chr::month_day_last{ym.month()}}.day();
    return Date{ym.year(), ym.month(), std::min(reference.day(), last)};
}

auto NthWeekdayOfMonth(chr::year y, const expr::OrdinalWeekdayOfMonth& o) -> Date {
    auto m = chr::month{unsigned(o.month)};
    auto last = chr::year_month_weekday_last{y, m, ToChrono(o.weekday)[chr::last]};
    if (o.ordinal == Ordinal::Last) return Date{chr::sys_days{last}};

    // Not every month has a fifth occurrence of every weekday.
    auto nth = chr::year_month_weekday{y, m, ToChrono(o.weekday)[unsigned(o.ordinal)]};
    if (not nth.ok()) return Date{chr::sys_days{last}};
    return Date{chr::sys_days{nth}};
}
} // namespace

auto reldate::Resolve(const RelativeExpression& e, Date reference) -> Date {
    auto ref = chr::sys_days{reference};
    auto wd = chr::weekday{ref};
    return e.visit(utils::Overloaded{ // clang-format off
        [&](const expr::Today&) { return reference; },
        [&](const expr::Tomorrow&) { return Date{ref + chr::days{1}}; },
        [&](const expr::Yesterday&) { return Date{ref - chr::days{1}}; },
        [&](const expr::OffsetDays& o) { return Date{ref + chr::days(o.count)}; },
        [&](const expr::OffsetWeeks& o) { return Date{ref + chr::weeks(o.count)}; },
        [&](const expr::OffsetMonths& o) { return AddMonths(reference, o.count); },
        [&](const expr::NamedWeekdayNext& n) {
            auto d = ToChrono(n.weekday) - wd;
            return Date{ref + (d == chr::days{0} ? chr::days{7} : d)};
        },
        [&](const expr::NamedWeekdayLast& n) {
            auto d = wd - ToChrono(n.weekday);
            return Date{ref - (d == chr::days{0} ? chr::days{7} : d)};
        },
        [&](const expr::NamedWeekdayThis& n) { return Date{ref + (ToChrono(n.weekday) - wd)}; },
        [&](const expr::OrdinalWeekdayOfMonth& o) { return NthWeekdayOfMonth(reference.year(), o); },
    }); // clang-format on
}

auto reldate::CurrentDate() -> Date {
    auto now = chr::system_clock::now();
    try {
        auto local = chr::zoned_time{chr::current_zone(), now}.get_local_time();
        return Date{chr::floor<chr::days>(local)};
    } catch (const std::runtime_error&) {
        return Date{chr::floor<chr::days>(now)};
    }
}

auto reldate::ParseIsoDate(str text) -> Result<Date> {
    auto Invalid = [&] { return Error("Invalid date '{}'; expected YYYY-MM-DD", text.text()); };
    auto Number = [](std::string_view s) -> std::optional<int> {
        int value{};
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (s.empty() or ec != std::errc{} or ptr != s.data() + s.size()) return std::nullopt;
        return value;
    };

    auto input = text;
    input.trim();
    auto y = Number(input.take_until('-').text());
    if (not input.consume('-')) return Invalid();
    auto m = Number(input.take_until('-').text());
    if (not input.consume('-')) return Invalid();
    auto d = Number(input.text());
    if (not y or not m or not d or *m < 1 or *d < 1) return Invalid();

    Date date{chr::year{*y}, chr::month{unsigned(*m)}, chr::day{unsigned(*d)}};
    if (not date.ok()) return Error("Date '{}' does not exist", text.text());
    return date;
}
