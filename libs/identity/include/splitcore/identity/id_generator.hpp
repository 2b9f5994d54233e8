#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace splitcore {
namespace identity {

// Random bytes behind every identifier (128 bits).
constexpr std::size_t kIdEntropyBytes = 16;

using IdBytes = std::array<std::uint8_t, kIdEntropyBytes>;

enum class IdKind : std::uint8_t {
  kParticipant,
  kExpense,
  kLedger,
};

// Opaque identifier wire format:
// <kind prefix>_<32 lowercase hex chars>
// e.g. usr_9f1c0a2e4b7d4c1e8a5f3b2d6e0c7a91
class IdGenerator {
 public:
  IdGenerator();

  // Fresh identifier from the libsodium CSPRNG. Thread-safe.
  [[nodiscard]] std::string next(IdKind kind) const;

  // Hex-encodes caller-supplied bytes; deterministic, for fixtures and replays.
  [[nodiscard]] static std::string format(IdKind kind, const IdBytes& bytes);

  [[nodiscard]] static std::string_view prefix(IdKind kind) noexcept;

  // True if text has the shape produced by next()/format() for this kind.
  [[nodiscard]] static bool is_well_formed(IdKind kind, std::string_view text) noexcept;
};

// Process-wide generator; libsodium is initialised on first use.
const IdGenerator& default_generator();

}  // namespace identity
}  // namespace splitcore
