#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace gatefile::http_date {

using TimePoint = std::chrono::system_clock::time_point;

// IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT". Sub-second precision
// is dropped.
std::string format(TimePoint tp);

// Accepts IMF-fixdate, RFC 850 ("Sunday, 06-Nov-94 08:49:37 GMT") and
// asctime ("Sun Nov  6 08:49:37 1994"). nullopt for anything else.
std::optional<TimePoint> parse(std::string_view text);

// Truncates to whole seconds
TimePoint truncate_to_seconds(TimePoint tp);

// Zero time point or the Unix epoch: the modification time is unknown
bool is_unspecified(TimePoint tp);

} // namespace gatefile::http_date
