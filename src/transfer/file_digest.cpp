#include "transfer/file_digest.h"

#include <sodium.h>

#include <fstream>
#include <stdexcept>
#include <vector>

#include "transfer/transfer_error.h"

namespace {
void ensure_sodium_ready() {
  static const bool ready = [] { return sodium_init() >= 0; }();
  if (!ready) {
    throw std::runtime_error("libsodium initialization failed");
  }
}

constexpr std::size_t kReadChunkSize = 64 * 1024;
}  // namespace

namespace splat::transfer {

struct DigestBuilder::State {
  crypto_generichash_state hash;
};

DigestBuilder::DigestBuilder() : state_(std::make_unique<State>()) {
  static_assert(kDigestSize >= crypto_generichash_BYTES_MIN);
  ensure_sodium_ready();
  crypto_generichash_init(&state_->hash, nullptr, 0, kDigestSize);
}

DigestBuilder::~DigestBuilder() {
  sodium_memzero(&state_->hash, sizeof(state_->hash));
}

void DigestBuilder::update(std::span<const std::uint8_t> data) {
  crypto_generichash_update(&state_->hash, data.data(), data.size());
}

Digest DigestBuilder::finish() {
  Digest out{};
  crypto_generichash_final(&state_->hash, out.data(), out.size());
  return out;
}

Digest compute_digest(std::span<const std::uint8_t> data) {
  DigestBuilder builder;
  builder.update(data);
  return builder.finish();
}

std::optional<Digest> digest_file(const std::string& path, std::error_code& ec) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    ec = make_error_code(TransferErrc::kSourceUnavailable);
    return std::nullopt;
  }

  DigestBuilder builder;
  std::vector<std::uint8_t> chunk(kReadChunkSize);
  while (file) {
    file.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
    const auto got = file.gcount();
    if (got > 0) {
      builder.update(std::span<const std::uint8_t>(chunk.data(), static_cast<std::size_t>(got)));
    }
  }
  if (file.bad()) {
    ec = make_error_code(TransferErrc::kIoError);
    return std::nullopt;
  }
  return builder.finish();
}

DigestWords split_digest(const Digest& digest) {
  DigestWords words;
  for (std::size_t i = 0; i < 8; ++i) {
    words.msb = (words.msb << 8) | digest[i];
    words.mid = (words.mid << 8) | digest[8 + i];
  }
  for (std::size_t i = 0; i < 4; ++i) {
    words.lsb = (words.lsb << 8) | digest[16 + i];
  }
  return words;
}

Digest join_digest(const DigestWords& words) {
  Digest digest{};
  for (std::size_t i = 0; i < 8; ++i) {
    digest[i] = static_cast<std::uint8_t>((words.msb >> (8 * (7 - i))) & 0xFF);
    digest[8 + i] = static_cast<std::uint8_t>((words.mid >> (8 * (7 - i))) & 0xFF);
  }
  for (std::size_t i = 0; i < 4; ++i) {
    digest[16 + i] = static_cast<std::uint8_t>((words.lsb >> (8 * (3 - i))) & 0xFF);
  }
  return digest;
}

std::string to_hex(std::span<const std::uint8_t> bytes) {
  static constexpr char kHexDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (const auto b : bytes) {
    out.push_back(kHexDigits[(b >> 4) & 0x0F]);
    out.push_back(kHexDigits[b & 0x0F]);
  }
  return out;
}

}  // namespace splat::transfer
