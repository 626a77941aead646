#include <reldate/core.hh>
#include <reldate/normaliser.hh>

using namespace reldate;

auto reldate::KindName(const RelativeExpression& e) -> std::string_view {
    return e.visit([](const auto& v) { return std::remove_cvref_t<decltype(v)>::Name; });
}

auto reldate::LocaleTag(Locale locale) -> std::string_view {
    switch (locale) {
        case Locale::BrazilianPortuguese: return "pt-BR";
        case Locale::English: return "en";
    }

    Unreachable("Invalid locale");
}

auto reldate::ParseLocale(str tag) -> ParseResult<Locale> {
    // Accept any capitalisation and either separator.
    auto canonical = str(Normalise(tag.text())).replace("_", "-");
    if (canonical == "pt-br") return Locale::BrazilianPortuguese;
    if (canonical == "en" or canonical == "en-us" or canonical == "en-gb") return Locale::English;
    return Fail(ParseError::Kind::UnsupportedLocale, "Unsupported locale '{}'", tag.text());
}

auto reldate::ToString(const RelativeExpression& e) -> std::string { // clang-format off
    return e.visit(utils::Overloaded{
        [](const expr::OffsetDays& o) { return std::format("{}({})", o.Name, o.count); },
        [](const expr::OffsetWeeks& o) { return std::format("{}({})", o.Name, o.count); },
        [](const expr::OffsetMonths& o) { return std::format("{}({})", o.Name, o.count); },
        [](const expr::NamedWeekdayNext& n) { return std::format("{}({})", n.Name, n.weekday); },
        [](const expr::NamedWeekdayLast& n) { return std::format("{}({})", n.Name, n.weekday); },
        [](const expr::NamedWeekdayThis& n) { return std::format("{}({})", n.Name, n.weekday); },
        [](const expr::OrdinalWeekdayOfMonth& o) { return std::format("{}({}, {}, {})", o.Name, o.ordinal, o.weekday, o.month); },
        [](const auto& v) { return std::string{v.Name}; },
    });
} // clang-format on
