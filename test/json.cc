#include <catch2/catch_all.hpp>
#include <catch2/catch_test_macros.hpp>
#include <reldate/json.hh>
#include <reldate/parser.hh>

using namespace reldate;
using namespace std::chrono_literals;

static constexpr Date Reference = 2024y / 8 / 13;

static auto Get(Locale locale) -> const Lexicon& {
    auto lex = Lookup(locale);
    if (not lex) throw std::runtime_error(lex.error().message);
    return **lex;
}

static auto Emit(std::string_view input, Locale locale) -> std::string {
    auto e = Parse(input, locale);
    if (not e) throw std::runtime_error(e.error().message);
    return ToJson(e.value(), Get(locale), Reference).dump();
}

static void CheckExact(std::string_view input, std::string_view expected, Locale locale = Locale::BrazilianPortuguese) {
    INFO("Input: " << input);
    CHECK(Emit(input, locale) == expected);
}

TEST_CASE("JSON: keywords have no payload") {
    CheckExact("hoje", R"({"date":"2024-08-13","kind":"Today","text":"Today"})");
    CheckExact("yesterday", R"({"date":"2024-08-12","kind":"Yesterday","text":"Yesterday"})", Locale::English);
}

TEST_CASE("JSON: offsets carry their signed count") {
    CheckExact("em 3 dias", R"({"count":3,"date":"2024-08-16","kind":"OffsetDays","text":"OffsetDays(3)"})");
    CheckExact("há duas semanas", R"({"count":-2,"date":"2024-07-30","kind":"OffsetWeeks","text":"OffsetWeeks(-2)"})");
    CheckExact(
        "a month ago",
        R"({"count":-1,"date":"2024-07-13","kind":"OffsetMonths","text":"OffsetMonths(-1)"})",
        Locale::English
    );
}

TEST_CASE("JSON: weekdays carry their name and position in the week") {
    CheckExact(
        "próxima segunda",
        R"({"date":"2024-08-19","day-of-week":2,"kind":"NamedWeekdayNext","text":"NamedWeekdayNext(Monday)","weekday":"Monday"})"
    );

    CheckExact(
        "sábado passado",
        R"({"date":"2024-08-10","day-of-week":7,"kind":"NamedWeekdayLast","text":"NamedWeekdayLast(Saturday)","weekday":"Saturday"})"
    );

    CheckExact(
        "this sunday",
        R"({"date":"2024-08-18","day-of-week":1,"kind":"NamedWeekdayThis","text":"NamedWeekdayThis(Sunday)","weekday":"Sunday"})",
        Locale::English
    );
}

TEST_CASE("JSON: ordinal weekday of a month") {
    CheckExact(
        "segundo domingo de outubro",
        R"({"date":"2024-10-13","day-of-week":1,"kind":"OrdinalWeekdayOfMonth","month":"October","ordinal":"Second","text":"OrdinalWeekdayOfMonth(Second, Sunday, October)","weekday":"Sunday"})"
    );
}

TEST_CASE("JSON: document") {
    auto& pt = Get(Locale::BrazilianPortuguese);
    std::vector<RelativeExpression> exprs{expr::Tomorrow{}, expr::OffsetDays{2}};
    auto doc = ToJson("amanhã ou depois de amanhã", pt, Reference, exprs);

    CHECK(doc["phrase"] == "amanhã ou depois de amanhã");
    CHECK(doc["locale"] == "pt-BR");
    CHECK(doc["reference"] == "2024-08-13");
    REQUIRE(doc["expressions"].size() == 2);
    CHECK(doc["expressions"][0]["kind"] == "Tomorrow");
    CHECK(doc["expressions"][0]["date"] == "2024-08-14");
    CHECK(doc["expressions"][1]["count"] == 2);
    CHECK(doc["expressions"][1]["date"] == "2024-08-15");
}

TEST_CASE("JSON: document without expressions") {
    auto doc = ToJson("nada", Get(Locale::English), Reference, {});
    CHECK(doc.dump() == R"({"expressions":[],"locale":"en","phrase":"nada","reference":"2024-08-13"})");
}
