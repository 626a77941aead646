#ifndef RELDATE_RESOLVER_HH
#define RELDATE_RESOLVER_HH

#include <reldate/core.hh>

namespace reldate {
/// Resolve an expression against a reference date.
///
/// This cannot fail: all validation happens during parsing. Weekday
/// expressions never resolve to the reference date itself, except for
/// ‘NamedWeekdayThis’; month offsets clamp the day of the month to the
/// end of the target month.
auto Resolve(const RelativeExpression& e, Date reference) -> Date;

/// Get today’s date in the local time zone.
///
/// Falls back to the UTC date if the time zone database is unavailable.
auto CurrentDate() -> Date;

/// Parse a date in ‘YYYY-MM-DD’ format.
auto ParseIsoDate(str text) -> Result<Date>;
} // namespace reldate

#endif // RELDATE_RESOLVER_HH
