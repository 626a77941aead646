#include <reldate/lexicon.hh>

using namespace reldate;

namespace {
struct Unit {
    str words;
    Builder forward;
    Builder backward;
};

constexpr Unit Units[]{
    {"day|days", build::Offset<expr::OffsetDays, 1>, build::Offset<expr::OffsetDays, -1>},
    {"week|weeks", build::Offset<expr::OffsetWeeks, 1>, build::Offset<expr::OffsetWeeks, -1>},
    {"month|months", build::Offset<expr::OffsetMonths, 1>, build::Offset<expr::OffsetMonths, -1>},
};

constexpr std::pair<str, i64> Numerals[]{
    {"a", 1},
    {"an", 1},
    {"one", 1},
    {"two", 2},
    {"three", 3},
    {"four", 4},
    {"five", 5},
    {"six", 6},
    {"seven", 7},
    {"eight", 8},
    {"nine", 9},
    {"ten", 10},
    {"eleven", 11},
    {"twelve", 12},
    {"thirteen", 13},
    {"fourteen", 14},
    {"fifteen", 15},
    {"sixteen", 16},
    {"seventeen", 17},
    {"eighteen", 18},
    {"nineteen", 19},
};

/// Units that combine with tens, e.g. ‘twenty-one’.
constexpr std::pair<str, i64> Units1To9[]{
    {"one", 1},
    {"two", 2},
    {"three", 3},
    {"four", 4},
    {"five", 5},
    {"six", 6},
    {"seven", 7},
    {"eight", 8},
    {"nine", 9},
};

constexpr std::tuple<str, i64, i64> Tens[]{
    {"twenty", 20, 9},
    {"thirty", 30, 1},
};

constexpr std::pair<str, Weekday> Weekdays[]{
    {"monday", Weekday::Monday},
    {"tuesday", Weekday::Tuesday},
    {"wednesday", Weekday::Wednesday},
    {"thursday", Weekday::Thursday},
    {"friday", Weekday::Friday},
    {"saturday", Weekday::Saturday},
    {"sunday", Weekday::Sunday},
};

/// Only recognised after a keyword, e.g. ‘next sat’.
constexpr std::pair<str, Weekday> Abbreviations[]{
    {"mon", Weekday::Monday},
    {"tues", Weekday::Tuesday},
    {"tue", Weekday::Tuesday},
    {"wed", Weekday::Wednesday},
    {"thurs", Weekday::Thursday},
    {"thur", Weekday::Thursday},
    {"thu", Weekday::Thursday},
    {"fri", Weekday::Friday},
    {"sat", Weekday::Saturday},
    {"sun", Weekday::Sunday},
};

constexpr std::pair<str, Ordinal> Ordinals[]{
    {"first", Ordinal::First},
    {"1st", Ordinal::First},
    {"second", Ordinal::Second},
    {"2nd", Ordinal::Second},
    {"third", Ordinal::Third},
    {"3rd", Ordinal::Third},
    {"fourth", Ordinal::Fourth},
    {"4th", Ordinal::Fourth},
    {"fifth", Ordinal::Fifth},
    {"5th", Ordinal::Fifth},
    {"last", Ordinal::Last},
};

constexpr std::pair<str, Month> Months[]{
    {"january", Month::January},
    {"jan", Month::January},
    {"february", Month::February},
    {"feb", Month::February},
    {"march", Month::March},
    {"mar", Month::March},
    {"april", Month::April},
    {"apr", Month::April},
    {"may", Month::May},
    {"june", Month::June},
    {"jun", Month::June},
    {"july", Month::July},
    {"jul", Month::July},
    {"august", Month::August},
    {"aug", Month::August},
    {"september", Month::September},
    {"sept", Month::September},
    {"sep", Month::September},
    {"october", Month::October},
    {"oct", Month::October},
    {"november", Month::November},
    {"nov", Month::November},
    {"december", Month::December},
    {"dec", Month::December},
};
} // namespace

auto locales::English() -> Lexicon {
    Lexicon lex{Locale::English, Weekday::Sunday};

    // Names.
    for (auto [name, n] : Numerals) lex.numerals.add(name.text(), n);
    for (auto [name, w] : Weekdays) lex.weekdays.add(name.text(), w);
    for (auto [name, w] : Weekdays) lex.weekday_names.add(name.text(), w);
    for (auto [name, w] : Abbreviations) lex.weekdays.add(name.text(), w);
    for (auto [name, o] : Ordinals) lex.ordinals.add(name.text(), o);
    for (auto [name, m] : Months) lex.months.add(name.text(), m);

    // 20–31, both as ‘twenty-one’ and ‘twenty one’.
    for (auto [tens, value, max_units] : Tens) {
        lex.numerals.add(tens.text(), value);
        for (auto [name, n] : Units1To9) {
            if (n > max_units) break;
            lex.numerals.add(std::format("{}-{}", tens.text(), name.text()), value + n);
            lex.numerals.add(std::format("{} {}", tens.text(), name.text()), value + n);
        }
    }

    // Keywords.
    lex.phrase("today", expr::Today{});
    lex.phrase("tomorrow", expr::Tomorrow{});
    lex.phrase("yesterday", expr::Yesterday{});
    lex.phrase("day after tomorrow", expr::OffsetDays{2});
    lex.phrase("the day after tomorrow", expr::OffsetDays{2});
    lex.phrase("day before yesterday", expr::OffsetDays{-2});
    lex.phrase("the day before yesterday", expr::OffsetDays{-2});
    lex.phrase("next week", expr::OffsetWeeks{1});
    lex.phrase("last week", expr::OffsetWeeks{-1});
    lex.phrase("next month", expr::OffsetMonths{1});
    lex.phrase("last month", expr::OffsetMonths{-1});

    // ‘in 3 days’, ‘two weeks ago’, …
    for (const auto& u : Units) {
        auto w = u.words.text();
        lex.pattern(std::format("in|after {{N}} {}", w), u.forward);
        lex.pattern(std::format("{{N}} {} from now", w), u.forward);
        lex.pattern(std::format("{{N}} {} ago", w), u.backward);
    }

    // Weekdays.
    lex.pattern("the? next|following {W}", build::OnWeekday<expr::NamedWeekdayNext>);
    lex.pattern("last|past {W}", build::OnWeekday<expr::NamedWeekdayLast>);
    lex.pattern("this {W}", build::OnWeekday<expr::NamedWeekdayThis>);
    lex.pattern("the current {W}", build::OnWeekday<expr::NamedWeekdayThis>);
    lex.pattern("the? {O} {W} of {M}", build::OrdinalOfMonth);
    lex.pattern("{D}", build::OnWeekday<expr::NamedWeekdayThis>);
    return lex;
}
