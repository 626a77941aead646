#include <reldate/json.hh>
#include <reldate/resolver.hh>

using namespace reldate;

auto reldate::ToJson(const RelativeExpression& e, const Lexicon& lexicon, Date reference) -> json {
    json j;
    j["kind"] = std::string{KindName(e)};
    j["text"] = ToString(e);
    j["date"] = std::format("{}", Resolve(e, reference));

    auto SetWeekday = [&](Weekday w) {
        j["weekday"] = std::format("{}", w);
        j["day-of-week"] = lexicon.weekday_number(w) + 1;
    };

    e.visit(utils::Overloaded{ // clang-format off
        [&](const expr::OffsetDays& o) { j["count"] = o.count; },
        [&](const expr::OffsetWeeks& o) { j["count"] = o.count; },
        [&](const expr::OffsetMonths& o) { j["count"] = o.count; },
        [&](const expr::NamedWeekdayNext& n) { SetWeekday(n.weekday); },
        [&](const expr::NamedWeekdayLast& n) { SetWeekday(n.weekday); },
        [&](const expr::NamedWeekdayThis& n) { SetWeekday(n.weekday); },
        [&](const expr::OrdinalWeekdayOfMonth& o) {
            SetWeekday(o.weekday);
            j["ordinal"] = std::format("{}", o.ordinal);
            j["month"] = std::format("{}", o.month);
        },
        [](const auto&) {},
    }); // clang-format on

    return j;
}

auto reldate::ToJson(
    std::string_view phrase,
    const Lexicon& lexicon,
    Date reference,
    std::span<const RelativeExpression> exprs
) -> json {
    json out;
    out["phrase"] = std::string{phrase};
    out["locale"] = std::string{LocaleTag(lexicon.locale)};
    out["reference"] = std::format("{}", reference);
    auto& arr = out["expressions"] = json::array();
    for (const auto& e : exprs) arr.push_back(ToJson(e, lexicon, reference));
    return out;
}
