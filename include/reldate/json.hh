#ifndef RELDATE_JSON_HH
#define RELDATE_JSON_HH

#include <nlohmann/json.hpp>
#include <reldate/core.hh>
#include <reldate/lexicon.hh>
#include <span>

namespace reldate {
using nlohmann::json;

/// Describe a single expression: its kind, its textual form, the
/// date it resolves to, and its payload fields.
///
/// Weekdays also get a 1-based ‘day-of-week’ that depends on the
/// first day of the week in the lexicon’s locale.
auto ToJson(const RelativeExpression& e, const Lexicon& lexicon, Date reference) -> json;

/// Build the document printed by ‘reldate --json’.
auto ToJson(
    std::string_view phrase,
    const Lexicon& lexicon,
    Date reference,
    std::span<const RelativeExpression> exprs
) -> json;
} // namespace reldate

#endif // RELDATE_JSON_HH
