#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace chronicle::common {

/// UTC wall-clock instant at microsecond precision, the resolution records carry on disk.
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

[[nodiscard]] Timestamp now_timestamp();
[[nodiscard]] Timestamp to_timestamp(std::chrono::system_clock::time_point point);

/// `YYYY-MM-DDTHH:MM:SS.ffffffZ`
[[nodiscard]] std::string format_iso8601(Timestamp timestamp);

/// Accepts an optional fractional part and a `Z`, `+HH:MM` or `-HH:MM` suffix.
/// A missing zone designator is read as UTC.
[[nodiscard]] std::optional<Timestamp> parse_iso8601(const std::string &text);

/// `YYYYMM` of the UTC month containing `timestamp`.
[[nodiscard]] std::string month_partition(Timestamp timestamp);

} // namespace chronicle::common
