#include <catch2/catch_all.hpp>
#include <catch2/catch_test_macros.hpp>
#include <reldate/parser.hh>
#include <reldate/resolver.hh>

using namespace reldate;
using namespace reldate::expr;
using namespace std::chrono_literals;

static constexpr Date Reference = 2024y / 8 / 13;

static auto Extract(std::string_view text, Locale locale = Locale::BrazilianPortuguese) -> std::vector<RelativeExpression> {
    auto e = ExtractAll(text, locale);
    if (not e) throw std::runtime_error(e.error().message);
    return std::move(e.value());
}

static auto ResolveText(std::string_view text, Locale locale = Locale::BrazilianPortuguese) -> Date {
    auto e = Parse(text, locale);
    if (not e) throw std::runtime_error(e.error().message);
    return Resolve(e.value(), Reference);
}

TEST_CASE("Parsing and resolving Portuguese phrases") {
    CHECK(ResolveText("amanhã") == 2024y / 8 / 14);
    CHECK(ResolveText("ontem") == 2024y / 8 / 12);
    CHECK(ResolveText("em 3 dias") == 2024y / 8 / 16);
    CHECK(ResolveText("próxima segunda") == 2024y / 8 / 19);
    CHECK(ResolveText("semana passada") == 2024y / 8 / 6);
    CHECK(ResolveText("depois de amanhã") == 2024y / 8 / 15);
    CHECK(ResolveText("há duas semanas") == 2024y / 7 / 30);
    CHECK(ResolveText("terça que vem") == 2024y / 8 / 20);
    CHECK(ResolveText("esta terça") == 2024y / 8 / 13);
    CHECK(ResolveText("este domingo") == 2024y / 8 / 18);
    CHECK(ResolveText("sexta passada") == 2024y / 8 / 9);
    CHECK(ResolveText("segundo domingo de outubro") == 2024y / 10 / 13);
    CHECK(ResolveText("mês que vem") == 2024y / 9 / 13);
}

TEST_CASE("Parsing and resolving English phrases") {
    auto en = Locale::English;
    CHECK(ResolveText("tomorrow", en) == 2024y / 8 / 14);
    CHECK(ResolveText("in 3 days", en) == 2024y / 8 / 16);
    CHECK(ResolveText("next monday", en) == 2024y / 8 / 19);
    CHECK(ResolveText("last week", en) == 2024y / 8 / 6);
    CHECK(ResolveText("two months ago", en) == 2024y / 6 / 13);
    CHECK(ResolveText("the last friday of august", en) == 2024y / 8 / 30);
    CHECK(ResolveText("first sunday of october", en) == 2024y / 10 / 6);
}

TEST_CASE("Parse errors are reported, not resolved") {
    auto e = Parse("hoje xyz", Locale::BrazilianPortuguese);
    REQUIRE(not e.has_value());
    CHECK(e.error().kind == ParseError::Kind::NoMatch);

    e = Parse("em 0 dias", Locale::BrazilianPortuguese);
    REQUIRE(not e.has_value());
    CHECK(e.error().kind == ParseError::Kind::InvalidQuantity);
}

TEST_CASE("Extracting expressions from text") {
    CHECK(
        Extract("hoje e depois de amanhã e quinta-feira")
        == std::vector<RelativeExpression>{Today{}, OffsetDays{2}, NamedWeekdayThis{Weekday::Thursday}}
    );

    CHECK(Extract("prefixo hoje meio amanhã sufixo") == std::vector<RelativeExpression>{Today{}, Tomorrow{}});
    CHECK(
        Extract("Vamos nos ver em 3 dias ou na próxima sexta")
        == std::vector<RelativeExpression>{OffsetDays{3}, NamedWeekdayNext{Weekday::Friday}}
    );

    CHECK(
        Extract("see you in 3 days or next friday", Locale::English)
        == std::vector<RelativeExpression>{OffsetDays{3}, NamedWeekdayNext{Weekday::Friday}}
    );
}

TEST_CASE("Extraction prefers the longest match") {
    // Not ‘Tomorrow’ after some unmatched words.
    CHECK(Extract("depois de amanhã") == std::vector<RelativeExpression>{OffsetDays{2}});

    // Not ‘NamedWeekdayThis(Monday)’.
    CHECK(Extract("segunda que vem") == std::vector<RelativeExpression>{NamedWeekdayNext{Weekday::Monday}});

    // Not ‘NamedWeekdayLast(Friday)’.
    CHECK(
        Extract("last friday of august", Locale::English)
        == std::vector<RelativeExpression>{OrdinalWeekdayOfMonth{Ordinal::Last, Weekday::Friday, Month::August}}
    );
}

TEST_CASE("Extraction ignores words that look like weekday abbreviations") {
    CHECK(Extract("vou ter uma reunião amanhã") == std::vector<RelativeExpression>{Tomorrow{}});
    CHECK(Extract("sex e dom") == std::vector<RelativeExpression>{});
    CHECK(Extract("I sat down yesterday", Locale::English) == std::vector<RelativeExpression>{Yesterday{}});
    CHECK(Extract("the sun sets on sunday", Locale::English) == std::vector<RelativeExpression>{NamedWeekdayThis{Weekday::Sunday}});
}

TEST_CASE("Extraction skips what it can’t parse") {
    CHECK(Extract("").empty());
    CHECK(Extract("nada aqui").empty());
    CHECK(Extract("em 0 dias").empty());
    CHECK(Extract("em 0 dias ou amanhã") == std::vector<RelativeExpression>{Tomorrow{}});
}

TEST_CASE("Extraction in an unsupported locale") {
    auto e = ExtractAll("hoje", Locale(42));
    REQUIRE(not e.has_value());
    CHECK(e.error().kind == ParseError::Kind::UnsupportedLocale);
}
