#pragma once

#include "feedrank/common/result.hpp"

#include <functional>
#include <string>

namespace feedrank::common {

/// Source of "now" as unix seconds. Injected wherever age windows are computed so a
/// ranking pass can be replayed against a fixed instant.
using Clock = std::function<double()>;

[[nodiscard]] double unix_now();
[[nodiscard]] Clock system_clock();
[[nodiscard]] Clock fixed_clock(double now);

/// Parse an RFC 3339 UTC timestamp ("2024-05-01T12:30:00Z", fractional seconds and
/// numeric offsets accepted) into unix seconds.
[[nodiscard]] Result<double> parse_rfc3339(const std::string &value);

} // namespace feedrank::common
