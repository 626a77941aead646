#ifndef RELDATE_LEXICON_HH
#define RELDATE_LEXICON_HH

#include <reldate/core.hh>
#include <reldate/normaliser.hh>
#include <span>
#include <unordered_map>

namespace reldate {
class Lexicon;
using Tokens = std::span<const std::string_view>;

/// Largest count we accept in a quantity slot.
constexpr i64 MaxQuantity = 100'000;

/// A table of names that may span several tokens (e.g. ‘segunda feira’).
///
/// Lookups are greedy: the longest name that matches wins.
template <typename T>
class NameTable {
public:
    struct Entry {
        std::vector<std::string> tokens;
        T value;
    };

private:
    /// Sorted by token count, longest first.
    std::vector<Entry> entries;

public:
    /// Add a name; it is normalised first.
    void add(std::string_view name, T value) {
        auto normalised = Normalise(name);
        Entry e{{}, value};
        for (auto t : Tokenise(normalised)) e.tokens.emplace_back(t);
        Assert(not e.tokens.empty(), "Empty name in lexicon");
        auto it = rgs::find_if(entries, [&](const Entry& x) { return x.tokens.size() < e.tokens.size(); });
        entries.insert(it, std::move(e));
    }

    /// Match the longest name at the start of 'tokens'.
    ///
    /// \return The value and the number of tokens the name spans.
    [[nodiscard]] auto match(Tokens tokens) const -> std::optional<std::pair<T, usz>> {
        for (const auto& e : entries) {
            if (e.tokens.size() > tokens.size()) continue;
            if (rgs::equal(e.tokens, tokens.first(e.tokens.size())))
                return std::pair{e.value, e.tokens.size()};
        }

        return std::nullopt;
    }

    [[nodiscard]] auto all() const -> std::span<const Entry> { return entries; }
};

/// Kinds of variable positions in a template.
enum struct Slot : u8 {
    Quantity, ///< {N}
    Weekday,  ///< {W}
    WeekdayName, ///< {D}, a weekday that stands on its own
    Ordinal,  ///< {O}
    Month,    ///< {M}
};

/// Values captured by the slots of a matched template.
struct Captures {
    i64 quantity = 0;
    Weekday weekday = Weekday::Sunday;
    Ordinal ordinal = Ordinal::First;
    Month month = Month::January;
};

/// Constructs the expression for a matched template.
using Builder = auto (*)(const Captures&) -> RelativeExpression;

/// A phrase template, e.g. ‘daqui a? {N} dia|dias’.
///
/// Every space-separated part of the pattern is one token position. A
/// position is either a slot, or a fixed token with one or more spellings
/// separated by '|'; a trailing '?' makes a fixed token optional.
struct Template {
    struct Element {
        /// Accepted spellings of a fixed token. Empty for slots.
        std::vector<std::string> alternatives;

        /// Set if this is a variable position.
        std::optional<Slot> slot;

        /// Whether a fixed token may be omitted.
        bool optional = false;
    };

    std::string pattern;
    std::vector<Element> elements;
    Builder build;

    /// Compile a pattern.
    static auto Compile(str pattern, Builder build) -> Template;
};

/// Result of reading a quantity slot.
struct Quantity {
    ParseResult<i64> value;

    /// Number of tokens the slot spans.
    usz tokens;
};

/// Per-locale table of phrases, templates, and names.
///
/// A lexicon is populated once when its locale is first used and is
/// read-only afterwards, so it can be shared between threads freely.
class Lexicon {
    /// Exact phrases, keyed by their normalised text.
    std::unordered_map<std::string, RelativeExpression> phrase_table;

    /// Number of tokens in the longest phrase.
    usz longest_phrase = 0;

public:
    const Locale locale;

    /// First day of the week in this locale.
    const Weekday first_day_of_week;

    /// Templates, in the order in which they are tried.
    std::vector<Template> templates;

    NameTable<i64> numerals;
    NameTable<Weekday> weekdays;

    /// Weekdays that may appear without a keyword. Bare abbreviations
    /// like ‘ter’ or ‘sat’ are also ordinary words and are excluded.
    NameTable<Weekday> weekday_names;
    NameTable<Ordinal> ordinals;
    NameTable<Month> months;

    explicit Lexicon(Locale locale, Weekday first_day_of_week)
        : locale{locale}, first_day_of_week{first_day_of_week} {}

    /// Add an exact phrase.
    void phrase(str text, RelativeExpression e);

    /// Add a template.
    void pattern(str pattern, Builder build);

    /// Look up an exact phrase.
    [[nodiscard]] auto find_phrase(std::string_view normalised) const -> const RelativeExpression*;

    /// Get all exact phrases.
    [[nodiscard]] auto phrases() const -> const std::unordered_map<std::string, RelativeExpression>& {
        return phrase_table;
    }

    /// Get the number of tokens in the longest exact phrase.
    [[nodiscard]] auto max_phrase_tokens() const -> usz { return longest_phrase; }

    /// Read a quantity at the start of 'tokens', which must not be empty.
    ///
    /// Number words are tried before digit sequences. A quantity that
    /// is neither spans exactly one token.
    [[nodiscard]] auto quantity(Tokens tokens) const -> Quantity;

    /// Parse a complete piece of text as a quantity.
    [[nodiscard]] auto parse_quantity(std::string_view text) const -> ParseResult<i64>;

    /// Get the 0-based position of a weekday in this locale’s week.
    [[nodiscard]] auto weekday_number(Weekday w) const -> i32;
};

/// Get the lexicon for a locale.
auto Lookup(Locale locale) -> ParseResult<const Lexicon*>;

/// Helpers for the ‘Builder’ of a template.
namespace build {
template <typename Expr, i64 Sign>
auto Offset(const Captures& c) -> RelativeExpression {
    return Expr{Sign * c.quantity};
}

template <typename Expr>
auto OnWeekday(const Captures& c) -> RelativeExpression {
    return Expr{c.weekday};
}

inline auto OrdinalOfMonth(const Captures& c) -> RelativeExpression {
    return expr::OrdinalWeekdayOfMonth{c.ordinal, c.weekday, c.month};
}
} // namespace build

/// Locale data.
namespace locales {
auto BrazilianPortuguese() -> Lexicon;
auto English() -> Lexicon;
} // namespace locales
} // namespace reldate

#endif // RELDATE_LEXICON_HH
