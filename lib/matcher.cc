#include <reldate/normaliser.hh>
#include <reldate/parser.hh>

using namespace reldate;

namespace {
/// A successful skeleton match.
struct TemplateMatch {
    /// Number of tokens the template spans.
    usz tokens;

    /// The expression, or an error if a quantity was invalid.
    ParseResult<RelativeExpression> result;
};

/// Match a template against the start of 'tokens'.
///
/// Returns nothing if the skeleton does not match. Optional tokens
/// are consumed if present, and names are matched greedily; there is
/// no backtracking.
auto MatchTemplate(const Lexicon& lex, const Template& t, Tokens tokens) -> std::optional<TemplateMatch> {
    Captures captures;
    std::optional<ParseError> bad_quantity;
    usz pos = 0;

    for (const auto& el : t.elements) {
        auto rest = tokens.subspan(pos);

        // Fixed token.
        if (not el.slot.has_value()) {
            if (not rest.empty() and rgs::contains(el.alternatives, rest.front())) pos++;
            else if (not el.optional) return std::nullopt;
            continue;
        }

        // Every slot needs at least one token.
        if (rest.empty()) return std::nullopt;
        switch (*el.slot) {
            case Slot::Quantity: {
                auto q = lex.quantity(rest);
                pos += q.tokens;
                if (q.value.has_value()) captures.quantity = q.value.value();
                else if (not bad_quantity) bad_quantity = std::move(q.value.error());
            } break;

            case Slot::Weekday:
            case Slot::WeekdayName: {
                auto& names = *el.slot == Slot::Weekday ? lex.weekdays : lex.weekday_names;
                auto w = names.match(rest);
                if (not w) return std::nullopt;
                captures.weekday = w->first;
                pos += w->second;
            } break;

            case Slot::Ordinal: {
                auto o = lex.ordinals.match(rest);
                if (not o) return std::nullopt;
                captures.ordinal = o->first;
                pos += o->second;
            } break;

            case Slot::Month: {
                auto m = lex.months.match(rest);
                if (not m) return std::nullopt;
                captures.month = m->first;
                pos += m->second;
            } break;
        }
    }

    if (bad_quantity) return TemplateMatch{pos, std::unexpected(std::move(*bad_quantity))};
    return TemplateMatch{pos, t.build(captures)};
}

/// Find the longest phrase or template that matches at the start of 'tokens'.
auto LongestMatch(const Lexicon& lex, Tokens tokens) -> std::optional<std::pair<usz, RelativeExpression>> {
    std::optional<std::pair<usz, RelativeExpression>> best;

    // Exact phrases.
    for (usz n = std::min(lex.max_phrase_tokens(), tokens.size()); n > 0; n--) {
        if (auto e = lex.find_phrase(utils::join(tokens.first(n), " "))) {
            best.emplace(n, *e);
            break;
        }
    }

    // Templates; on a tie, the earlier entry wins.
    for (const auto& t : lex.templates) {
        auto m = MatchTemplate(lex, t, tokens);
        if (not m or not m->result.has_value()) continue;
        if (best and best->first >= m->tokens) continue;
        best.emplace(m->tokens, std::move(m->result.value()));
    }

    return best;
}
} // namespace

auto reldate::Match(std::string_view normalised, const Lexicon& lexicon) -> ParseResult<RelativeExpression> {
    if (auto e = lexicon.find_phrase(normalised)) return *e;

    auto tokens = Tokenise(normalised);
    if (not tokens.empty()) {
        for (const auto& t : lexicon.templates) {
            auto m = MatchTemplate(lexicon, t, tokens);
            if (m and m->tokens == tokens.size()) return std::move(m->result);
        }
    }

    return Fail(
        ParseError::Kind::NoMatch,
        "'{}' is not a relative date in locale '{}'",
        normalised,
        LocaleTag(lexicon.locale)
    );
}

auto reldate::Parse(std::string_view text, Locale locale) -> ParseResult<RelativeExpression> {
    auto lexicon = Lookup(locale);
    if (not lexicon) return std::unexpected(std::move(lexicon.error()));
    return Match(Normalise(text), **lexicon);
}

auto reldate::ExtractAll(std::string_view text, Locale locale) -> ParseResult<std::vector<RelativeExpression>> {
    auto lexicon = Lookup(locale);
    if (not lexicon) return std::unexpected(std::move(lexicon.error()));

    auto normalised = Normalise(text);
    auto tokens = Tokenise(normalised);
    std::vector<RelativeExpression> found;
    for (usz i = 0; i < tokens.size();) {
        auto m = LongestMatch(**lexicon, Tokens{tokens}.subspan(i));
        if (not m) {
            i++;
            continue;
        }

        found.push_back(std::move(m->second));
        i += m->first;
    }

    return found;
}
