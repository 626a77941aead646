#ifndef RELDATE_PARSER_HH
#define RELDATE_PARSER_HH

#include <reldate/core.hh>
#include <reldate/lexicon.hh>

namespace reldate {
/// Match normalised text against a lexicon.
///
/// Exact phrases are tried first, then the templates in the order in
/// which the lexicon declares them. The entire input must be matched;
/// ‘hoje xyz’ is an error, not ‘hoje’.
auto Match(std::string_view normalised, const Lexicon& lexicon) -> ParseResult<RelativeExpression>;

/// Parse a phrase in a locale.
auto Parse(std::string_view text, Locale locale) -> ParseResult<RelativeExpression>;

/// Find every relative date expression in a piece of text.
///
/// Words that don’t start an expression are skipped. At each position,
/// the longest phrase or template match is taken.
auto ExtractAll(std::string_view text, Locale locale) -> ParseResult<std::vector<RelativeExpression>>;
} // namespace reldate

#endif // RELDATE_PARSER_HH
