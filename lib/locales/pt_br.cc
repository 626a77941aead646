#include <reldate/lexicon.hh>

using namespace reldate;

namespace {
struct Unit {
    str words;
    Builder forward;
    Builder backward;
};

constexpr Unit Units[]{
    {"dia|dias", build::Offset<expr::OffsetDays, 1>, build::Offset<expr::OffsetDays, -1>},
    {"semana|semanas", build::Offset<expr::OffsetWeeks, 1>, build::Offset<expr::OffsetWeeks, -1>},
    {"mês|meses", build::Offset<expr::OffsetMonths, 1>, build::Offset<expr::OffsetMonths, -1>},
};

constexpr std::pair<str, i64> Numerals[]{
    {"um", 1},
    {"uma", 1},
    {"dois", 2},
    {"duas", 2},
    {"três", 3},
    {"quatro", 4},
    {"cinco", 5},
    {"seis", 6},
    {"sete", 7},
    {"oito", 8},
    {"nove", 9},
    {"dez", 10},
    {"onze", 11},
    {"doze", 12},
    {"treze", 13},
    {"quatorze", 14},
    {"catorze", 14}, // Pre-1990 spelling.
    {"quinze", 15},
    {"dezesseis", 16},
    {"dezessete", 17},
    {"dezoito", 18},
    {"dezenove", 19},
};

/// Tens we combine with units, and the largest unit we combine them with.
constexpr std::tuple<str, i64, i64> Tens[]{
    {"vinte", 20, 9},
    {"trinta", 30, 1},
};

constexpr std::pair<str, Weekday> Weekdays[]{
    {"segunda-feira", Weekday::Monday},
    {"segunda feira", Weekday::Monday},
    {"segunda", Weekday::Monday},
    {"seg.", Weekday::Monday},
    {"terça-feira", Weekday::Tuesday},
    {"terça feira", Weekday::Tuesday},
    {"terça", Weekday::Tuesday},
    {"ter.", Weekday::Tuesday},
    {"quarta-feira", Weekday::Wednesday},
    {"quarta feira", Weekday::Wednesday},
    {"quarta", Weekday::Wednesday},
    {"qua.", Weekday::Wednesday},
    {"quinta-feira", Weekday::Thursday},
    {"quinta feira", Weekday::Thursday},
    {"quinta", Weekday::Thursday},
    {"qui.", Weekday::Thursday},
    {"sexta-feira", Weekday::Friday},
    {"sexta feira", Weekday::Friday},
    {"sexta", Weekday::Friday},
    {"sex.", Weekday::Friday},
    {"sábado", Weekday::Saturday},
    {"sáb.", Weekday::Saturday},
    {"domingo", Weekday::Sunday},
    {"dom.", Weekday::Sunday},
};

/// Also common words (‘ter’ is ‘to have’), so these need a keyword.
constexpr std::pair<str, Weekday> Abbreviations[]{
    {"seg", Weekday::Monday},
    {"ter", Weekday::Tuesday},
    {"qua", Weekday::Wednesday},
    {"qui", Weekday::Thursday},
    {"sex", Weekday::Friday},
    {"sáb", Weekday::Saturday},
    {"dom", Weekday::Sunday},
};

constexpr std::pair<str, Ordinal> Ordinals[]{
    {"primeiro", Ordinal::First},
    {"primeira", Ordinal::First},
    {"segundo", Ordinal::Second},
    {"segunda", Ordinal::Second},
    {"terceiro", Ordinal::Third},
    {"terceira", Ordinal::Third},
    {"quarto", Ordinal::Fourth},
    {"quarta", Ordinal::Fourth},
    {"quinto", Ordinal::Fifth},
    {"quinta", Ordinal::Fifth},
    {"último", Ordinal::Last},
    {"última", Ordinal::Last},
};

constexpr std::pair<str, Month> Months[]{
    {"janeiro", Month::January},
    {"jan", Month::January},
    {"fevereiro", Month::February},
    {"fev", Month::February},
    {"março", Month::March},
    {"mar", Month::March},
    {"abril", Month::April},
    {"abr", Month::April},
    {"maio", Month::May},
    {"mai", Month::May},
    {"junho", Month::June},
    {"jun", Month::June},
    {"julho", Month::July},
    {"jul", Month::July},
    {"agosto", Month::August},
    {"ago", Month::August},
    {"setembro", Month::September},
    {"set", Month::September},
    {"outubro", Month::October},
    {"out", Month::October},
    {"novembro", Month::November},
    {"nov", Month::November},
    {"dezembro", Month::December},
    {"dez", Month::December},
};
} // namespace

auto locales::BrazilianPortuguese() -> Lexicon {
    Lexicon lex{Locale::BrazilianPortuguese, Weekday::Sunday};

    // Names.
    for (auto [name, n] : Numerals) lex.numerals.add(name.text(), n);
    for (auto [name, w] : Weekdays) lex.weekdays.add(name.text(), w);
    for (auto [name, w] : Weekdays) lex.weekday_names.add(name.text(), w);
    for (auto [name, w] : Abbreviations) lex.weekdays.add(name.text(), w);
    for (auto [name, o] : Ordinals) lex.ordinals.add(name.text(), o);
    for (auto [name, m] : Months) lex.months.add(name.text(), m);

    // 20–31: ‘vinte’, ‘vinte e um’, ‘vinte e uma’, …
    for (auto [tens, value, max_units] : Tens) {
        lex.numerals.add(tens.text(), value);
        for (auto [name, n] : Numerals) {
            if (n > max_units) continue;
            lex.numerals.add(std::format("{} e {}", tens.text(), name.text()), value + n);
        }
    }

    // Keywords.
    lex.phrase("hoje", expr::Today{});
    lex.phrase("amanhã", expr::Tomorrow{});
    lex.phrase("ontem", expr::Yesterday{});
    lex.phrase("depois de amanhã", expr::OffsetDays{2});
    lex.phrase("anteontem", expr::OffsetDays{-2});
    lex.phrase("antes de ontem", expr::OffsetDays{-2});
    lex.phrase("semana que vem", expr::OffsetWeeks{1});
    lex.phrase("próxima semana", expr::OffsetWeeks{1});
    lex.phrase("semana passada", expr::OffsetWeeks{-1});
    lex.phrase("mês que vem", expr::OffsetMonths{1});
    lex.phrase("próximo mês", expr::OffsetMonths{1});
    lex.phrase("mês passado", expr::OffsetMonths{-1});

    // ‘em 3 dias’, ‘há duas semanas’, ‘um mês atrás’, …
    for (const auto& u : Units) {
        auto w = u.words.text();
        lex.pattern(std::format("em {{N}} {}", w), u.forward);
        lex.pattern(std::format("daqui a? {{N}} {}", w), u.forward);
        lex.pattern(std::format("dentro de {{N}} {}", w), u.forward);
        lex.pattern(std::format("há {{N}} {}", w), u.backward);
        lex.pattern(std::format("{{N}} {} atrás", w), u.backward);
    }

    // Weekdays.
    lex.pattern("próxima|próximo|próx|próx. {W}", build::OnWeekday<expr::NamedWeekdayNext>);
    lex.pattern("{W} que vem", build::OnWeekday<expr::NamedWeekdayNext>);
    lex.pattern("última|último {W}", build::OnWeekday<expr::NamedWeekdayLast>);
    lex.pattern("{W} passada|passado", build::OnWeekday<expr::NamedWeekdayLast>);
    lex.pattern("esta|essa|este|esse|nesta|nessa|neste|nesse {W}", build::OnWeekday<expr::NamedWeekdayThis>);
    lex.pattern("{O} {W} de {M}", build::OrdinalOfMonth);
    lex.pattern("{D}", build::OnWeekday<expr::NamedWeekdayThis>);
    return lex;
}
