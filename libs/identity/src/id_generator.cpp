#include "splitcore/identity/id_generator.hpp"

#include <sodium.h>

#include <stdexcept>

namespace splitcore {
namespace identity {

namespace {

constexpr std::size_t kHexChars = kIdEntropyBytes * 2;

class SodiumInitializer {
 public:
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};

// Ensure sodium is initialized before any randombytes call
void ensure_sodium_init() {
  static SodiumInitializer init;
}

}  // namespace

IdGenerator::IdGenerator() {
  ensure_sodium_init();
}

std::string IdGenerator::next(IdKind kind) const {
  IdBytes bytes{};
  randombytes_buf(bytes.data(), bytes.size());
  return format(kind, bytes);
}

std::string IdGenerator::format(IdKind kind, const IdBytes& bytes) {
  std::array<char, kHexChars + 1> hex{};
  sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());

  std::string id{prefix(kind)};
  id += '_';
  id.append(hex.data(), kHexChars);
  return id;
}

std::string_view IdGenerator::prefix(IdKind kind) noexcept {
  switch (kind) {
    case IdKind::kParticipant:
      return "usr";
    case IdKind::kExpense:
      return "exp";
    case IdKind::kLedger:
      return "grp";
  }
  return "id";
}

bool IdGenerator::is_well_formed(IdKind kind, std::string_view text) noexcept {
  const std::string_view expected_prefix = prefix(kind);
  if (text.size() != expected_prefix.size() + 1 + kHexChars) {
    return false;
  }
  if (text.substr(0, expected_prefix.size()) != expected_prefix || text[expected_prefix.size()] != '_') {
    return false;
  }
  for (const char c : text.substr(expected_prefix.size() + 1)) {
    const bool digit = c >= '0' && c <= '9';
    const bool lower_hex = c >= 'a' && c <= 'f';
    if (!digit && !lower_hex) {
      return false;
    }
  }
  return true;
}

const IdGenerator& default_generator() {
  static const IdGenerator generator;
  return generator;
}

}  // namespace identity
}  // namespace splitcore
