#ifndef RELDATE_CORE_HH
#define RELDATE_CORE_HH

#include <base/Assert.hh>
#include <base/Base.hh>
#include <base/Text.hh>
#include <chrono>
#include <enchantum/enchantum.hpp>
#include <expected>
#include <format>

namespace reldate {
using namespace base;

/// A calendar date. We never deal with time of day or time zones.
using Date = std::chrono::year_month_day;

/// Day of the week. The values match the C encoding used by
/// std::chrono::weekday, i.e. Sunday is 0.
enum struct Weekday : u8 {
    Sunday,
    Monday,
    Tuesday,
    Wednesday,
    Thursday,
    Friday,
    Saturday,
};

enum struct Month : u8 {
    January = 1,
    February,
    March,
    April,
    May,
    June,
    July,
    August,
    September,
    October,
    November,
    December,
};

/// Which occurrence of a weekday in a month we mean.
enum struct Ordinal : u8 {
    First = 1,
    Second,
    Third,
    Fourth,
    Fifth,
    Last,
};

/// Locales we have a lexicon for.
enum struct Locale : u8 {
    BrazilianPortuguese,
    English,
};

// Relative date expressions.
//
// These are plain values that know nothing about the text or the locale
// they were parsed from; resolving one only requires a reference date.
namespace expr {
struct Today {
    static constexpr std::string_view Name = "Today";
    bool operator==(const Today&) const = default;
};

struct Tomorrow {
    static constexpr std::string_view Name = "Tomorrow";
    bool operator==(const Tomorrow&) const = default;
};

struct Yesterday {
    static constexpr std::string_view Name = "Yesterday";
    bool operator==(const Yesterday&) const = default;
};

/// Signed number of days; negative counts point into the past.
struct OffsetDays {
    static constexpr std::string_view Name = "OffsetDays";
    i64 count;
    bool operator==(const OffsetDays&) const = default;
};

struct OffsetWeeks {
    static constexpr std::string_view Name = "OffsetWeeks";
    i64 count;
    bool operator==(const OffsetWeeks&) const = default;
};

/// Calendar months; the day of the month is clamped if the target
/// month is too short.
struct OffsetMonths {
    static constexpr std::string_view Name = "OffsetMonths";
    i64 count;
    bool operator==(const OffsetMonths&) const = default;
};

/// The first occurrence of a weekday strictly after the reference date.
struct NamedWeekdayNext {
    static constexpr std::string_view Name = "NamedWeekdayNext";
    Weekday weekday;
    bool operator==(const NamedWeekdayNext&) const = default;
};

/// The last occurrence of a weekday strictly before the reference date.
struct NamedWeekdayLast {
    static constexpr std::string_view Name = "NamedWeekdayLast";
    Weekday weekday;
    bool operator==(const NamedWeekdayLast&) const = default;
};

/// The first occurrence of a weekday on or after the reference date.
struct NamedWeekdayThis {
    static constexpr std::string_view Name = "NamedWeekdayThis";
    Weekday weekday;
    bool operator==(const NamedWeekdayThis&) const = default;
};

/// E.g. ‘the second sunday of october’, in the reference date’s year.
///
/// ‘Last’ is the last occurrence in the month. A ‘Fifth’ occurrence that
/// does not exist also resolves to the last one, i.e. the fourth.
struct OrdinalWeekdayOfMonth {
    static constexpr std::string_view Name = "OrdinalWeekdayOfMonth";
    Ordinal ordinal;
    Weekday weekday;
    Month month;
    bool operator==(const OrdinalWeekdayOfMonth&) const = default;
};
} // namespace expr

using RelativeExpression = Variant< // clang-format off
    expr::Today,
    expr::Tomorrow,
    expr::Yesterday,
    expr::OffsetDays,
    expr::OffsetWeeks,
    expr::OffsetMonths,
    expr::NamedWeekdayNext,
    expr::NamedWeekdayLast,
    expr::NamedWeekdayThis,
    expr::OrdinalWeekdayOfMonth
>; // clang-format on

/// Error produced by the parsing pipeline.
struct ParseError {
    enum struct Kind : u8 {
        UnsupportedLocale,
        NoMatch,
        InvalidQuantity,
    };

    Kind kind;
    std::string message;
};

template <typename T = void>
using ParseResult = std::expected<T, ParseError>;

/// Create a parse error.
template <typename... Args>
auto Fail(ParseError::Kind kind, std::format_string<Args...> fmt, Args&&... args) -> std::unexpected<ParseError> {
    return std::unexpected(ParseError{kind, std::format(fmt, LIBBASE_FWD(args)...)});
}

/// Get the name of the variant an expression holds.
auto KindName(const RelativeExpression& e) -> std::string_view;

/// Get the canonical tag of a locale, e.g. ‘pt-BR’.
auto LocaleTag(Locale locale) -> std::string_view;

/// Map a locale tag to a locale.
auto ParseLocale(str tag) -> ParseResult<Locale>;

/// Render an expression as e.g. ‘OffsetDays(3)’.
auto ToString(const RelativeExpression& e) -> std::string;

/// Convert between our weekdays and the standard library’s.
[[nodiscard]] constexpr auto ToChrono(Weekday w) -> std::chrono::weekday {
    return std::chrono::weekday{unsigned(w)};
}

[[nodiscard]] constexpr auto FromChrono(std::chrono::weekday w) -> Weekday {
    return Weekday(w.c_encoding());
}
} // namespace reldate

template <>
struct std::formatter<reldate::RelativeExpression> : std::formatter<std::string_view> {
    auto format(const reldate::RelativeExpression& e, std::format_context& ctx) const {
        return std::format_to(ctx.out(), "{}", reldate::ToString(e));
    }
};

template <typename Enum>
requires std::same_as<Enum, reldate::Weekday>
      or std::same_as<Enum, reldate::Month>
      or std::same_as<Enum, reldate::Ordinal>
      or std::same_as<Enum, reldate::Locale>
struct std::formatter<Enum> : std::formatter<std::string_view> {
    auto format(Enum e, std::format_context& ctx) const {
        using Base = std::formatter<std::string_view>;
        if constexpr (std::same_as<Enum, reldate::Locale>) return Base::format(reldate::LocaleTag(e), ctx);
        else return Base::format(enchantum::to_string(e), ctx);
    }
};

template <>
struct std::formatter<reldate::ParseError> : std::formatter<std::string_view> {
    auto format(const reldate::ParseError& e, std::format_context& ctx) const {
        return std::format_to(ctx.out(), "{}", e.message);
    }
};

#endif // RELDATE_CORE_HH
