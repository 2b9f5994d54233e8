#include "splitcore/common/money.hpp"

namespace splitcore {
namespace common {

std::int64_t minor_scale(unsigned minor_units) noexcept {
  std::int64_t scale = 1;
  for (unsigned i = 0; i < minor_units; ++i) {
    scale *= 10;
  }
  return scale;
}

std::optional<Amount> parse_amount(std::string_view text, unsigned minor_units) {
  if (minor_units > kMaxMinorUnits || text.empty()) {
    return std::nullopt;
  }

  bool negative = false;
  if (text.front() == '-' || text.front() == '+') {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  std::int64_t whole = 0;
  std::int64_t fraction = 0;
  unsigned fraction_digits = 0;
  bool seen_point = false;
  bool seen_digit = false;

  for (const char c : text) {
    if (c == '.') {
      if (seen_point || minor_units == 0) {
        return std::nullopt;
      }
      seen_point = true;
      continue;
    }
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    seen_digit = true;
    const std::int64_t digit = c - '0';
    if (seen_point) {
      if (++fraction_digits > minor_units) {
        return std::nullopt;
      }
      fraction = fraction * 10 + digit;
    } else {
      whole = whole * 10 + digit;
      if (whole > kMaxAmount) {
        return std::nullopt;
      }
    }
  }

  if (!seen_digit) {
    return std::nullopt;
  }

  for (unsigned i = fraction_digits; i < minor_units; ++i) {
    fraction *= 10;
  }

  const std::int64_t scale = minor_scale(minor_units);
  if (whole > (kMaxAmount - fraction) / scale) {
    return std::nullopt;
  }
  const Amount magnitude = whole * scale + fraction;
  return negative ? -magnitude : magnitude;
}

std::string format_amount(Amount amount, unsigned minor_units) {
  if (minor_units > kMaxMinorUnits) {
    minor_units = kMaxMinorUnits;
  }
  const std::int64_t scale = minor_scale(minor_units);
  const bool negative = amount < 0;
  const std::uint64_t magnitude = negative ? static_cast<std::uint64_t>(-(amount + 1)) + 1
                                           : static_cast<std::uint64_t>(amount);

  std::string out = negative ? "-" : "";
  out += std::to_string(magnitude / static_cast<std::uint64_t>(scale));
  if (minor_units > 0) {
    std::string fraction = std::to_string(magnitude % static_cast<std::uint64_t>(scale));
    out += '.';
    out.append(minor_units - fraction.size(), '0');
    out += fraction;
  }
  return out;
}

}  // namespace common
}  // namespace splitcore
