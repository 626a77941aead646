#ifndef RELDATE_NORMALISER_HH
#define RELDATE_NORMALISER_HH

#include <reldate/core.hh>

namespace reldate {
/// Canonicalise text for lexicon lookups.
///
/// This lower-cases the input, strips diacritics, folds runs of
/// whitespace into a single space, and trims the result. It never
/// fails; empty input yields an empty string.
auto Normalise(std::string_view input) -> std::string;

/// Split normalised text into tokens on spaces. The tokens point
/// into 'normalised', which must outlive them.
auto Tokenise(std::string_view normalised) -> std::vector<std::string_view>;
} // namespace reldate

#endif // RELDATE_NORMALISER_HH
