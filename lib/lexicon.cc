#include <charconv>
#include <reldate/lexicon.hh>

using namespace reldate;

auto Template::Compile(str pattern, Builder build) -> Template {
    Template t{std::string{pattern.text()}, {}, build};
    for (auto part : pattern.split(" ")) {
        if (part.empty()) continue;
        auto& el = t.elements.emplace_back();

        // Slots.
        if (part.starts_with('{')) {
            if (part == "{N}") el.slot = Slot::Quantity;
            else if (part == "{W}") el.slot = Slot::Weekday;
            else if (part == "{D}") el.slot = Slot::WeekdayName;
            else if (part == "{O}") el.slot = Slot::Ordinal;
            else if (part == "{M}") el.slot = Slot::Month;
            else Unreachable("Unknown slot '{}' in template '{}'", part.text(), t.pattern);
            continue;
        }

        // Fixed token.
        if (part.ends_with('?')) {
            el.optional = true;
            part.drop_back();
        }

        for (auto alt : part.split("|")) el.alternatives.push_back(Normalise(alt.text()));
        Assert(not el.alternatives.empty(), "Empty token in template '{}'", t.pattern);
    }

    Assert(not t.elements.empty(), "Empty template");
    return t;
}

void Lexicon::phrase(str text, RelativeExpression e) {
    auto normalised = Normalise(text.text());
    longest_phrase = std::max(longest_phrase, Tokenise(normalised).size());
    auto [_, inserted] = phrase_table.emplace(std::move(normalised), std::move(e));
    Assert(inserted, "Duplicate phrase '{}'", text.text());
}

void Lexicon::pattern(str pattern, Builder build) {
    templates.push_back(Template::Compile(pattern, build));
}

auto Lexicon::find_phrase(std::string_view normalised) const -> const RelativeExpression* {
    auto it = phrase_table.find(std::string{normalised});
    return it == phrase_table.end() ? nullptr : &it->second;
}

auto Lexicon::quantity(Tokens tokens) const -> Quantity {
    Assert(not tokens.empty());

    // Number words; these are all in range.
    if (auto n = numerals.match(tokens)) return {n->first, n->second};

    // Digit sequence.
    auto tok = tokens.front();
    if (not str(tok).starts_with_any("0123456789")) return {
        Fail(ParseError::Kind::InvalidQuantity, "'{}' is not a valid quantity", tok),
        1,
    };

    i64 value{};
    auto [ptr, ec] = std::from_chars(tok.data(), tok.data() + tok.size(), value);
    if (ec != std::errc{} or ptr != tok.data() + tok.size()) {
        if (ec == std::errc::result_out_of_range) return {
            Fail(ParseError::Kind::InvalidQuantity, "Quantity '{}' is too large", tok),
            1,
        };

        return {Fail(ParseError::Kind::InvalidQuantity, "'{}' is not a valid quantity", tok), 1};
    }

    if (value <= 0) return {Fail(ParseError::Kind::InvalidQuantity, "Quantity must be positive, but was {}", value), 1};
    if (value > MaxQuantity) return {
        Fail(ParseError::Kind::InvalidQuantity, "Quantity {} exceeds the maximum of {}", value, MaxQuantity),
        1,
    };

    return {value, 1};
}

auto Lexicon::parse_quantity(std::string_view text) const -> ParseResult<i64> {
    auto normalised = Normalise(text);
    auto tokens = Tokenise(normalised);
    if (tokens.empty()) return Fail(ParseError::Kind::InvalidQuantity, "Expected a quantity");
    auto q = quantity(tokens);
    if (q.value and q.tokens != tokens.size())
        return Fail(ParseError::Kind::InvalidQuantity, "'{}' is not a valid quantity", normalised);
    return std::move(q.value);
}

auto Lexicon::weekday_number(Weekday w) const -> i32 {
    return (i32(w) - i32(first_day_of_week) + 7) % 7;
}

auto reldate::Lookup(Locale locale) -> ParseResult<const Lexicon*> {
    switch (locale) {
        case Locale::BrazilianPortuguese: {
            static const Lexicon lexicon = locales::BrazilianPortuguese();
            return &lexicon;
        }

        case Locale::English: {
            static const Lexicon lexicon = locales::English();
            return &lexicon;
        }
    }

    return Fail(
        ParseError::Kind::UnsupportedLocale,
        "No lexicon is registered for locale #{}",
        std::to_underlying(locale)
    );
}
