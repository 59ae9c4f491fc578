#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <system_error>

namespace splat::transfer {

// BLAKE2b output length. Matches the 8 + 8 + 4 byte hash fields of INIT_TRANS.
inline constexpr std::size_t kDigestSize = 20;

using Digest = std::array<std::uint8_t, kDigestSize>;

// Digest as carried in INIT_TRANS (big-endian words).
struct DigestWords {
  std::uint64_t msb{0};
  std::uint64_t mid{0};
  std::uint32_t lsb{0};
};

// Incremental digest over a byte stream.
class DigestBuilder {
 public:
  DigestBuilder();
  ~DigestBuilder();

  DigestBuilder(const DigestBuilder&) = delete;
  DigestBuilder& operator=(const DigestBuilder&) = delete;

  void update(std::span<const std::uint8_t> data);

  // Produces the digest. The builder must not be updated afterwards.
  Digest finish();

 private:
  struct State;
  std::unique_ptr<State> state_;
};

Digest compute_digest(std::span<const std::uint8_t> data);

// Hashes a file in chunks. Returns nullopt and sets ec when the file cannot be read.
std::optional<Digest> digest_file(const std::string& path, std::error_code& ec);

DigestWords split_digest(const Digest& digest);
Digest join_digest(const DigestWords& words);

std::string to_hex(std::span<const std::uint8_t> bytes);

}  // namespace splat::transfer
