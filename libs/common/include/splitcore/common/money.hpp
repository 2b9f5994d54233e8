#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "splitcore/common/types.hpp"

namespace splitcore {
namespace common {

inline constexpr unsigned kMaxMinorUnits = 6;

// 10^minor_units, the number of minor units in one whole currency unit.
[[nodiscard]] std::int64_t minor_scale(unsigned minor_units) noexcept;

// Exact decimal parse: "300", "300.5", "-12.05". Rejects more fractional
// digits than minor_units and magnitudes above kMaxAmount.
[[nodiscard]] std::optional<Amount> parse_amount(std::string_view text, unsigned minor_units);

[[nodiscard]] std::string format_amount(Amount amount, unsigned minor_units);

}  // namespace common
}  // namespace splitcore
