#pragma once

#include "feedrank/ranking/types.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace feedrank::ranking {

/// Pluggable producer of out-of-network candidates from outside the store. `fetch` never
/// throws; any failure yields an empty list.
class IExternalSource {
public:
  virtual ~IExternalSource() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual bool available() const = 0;
  [[nodiscard]] virtual std::vector<Candidate> fetch(std::size_t limit) = 0;
};

} // namespace feedrank::ranking
