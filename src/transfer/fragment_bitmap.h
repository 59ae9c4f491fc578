#pragma once

#include <cstddef>
#include <cstdint>
#include <set>
#include <vector>

namespace splat::transfer {

using FragmentIndex = std::uint32_t;

// Fragment indices not yet confirmed held, ascending.
using MissingSet = std::set<FragmentIndex>;

// Number of fragments described by one UPDATE_MISSING_FRAGMENTS window.
inline constexpr std::uint32_t kWindowSize = 32;

// One 32-fragment window as carried by UPDATE_MISSING_FRAGMENTS.
// Bit 31 of (msb << 16 | lsb) describes seq_offset, bit 30 seq_offset + 1, and
// so on. A set bit means the fragment is held, a clear bit that it is missing.
struct BitmapWindow {
  std::uint32_t seq_offset{0};
  std::uint16_t msb{0};
  std::uint16_t lsb{0};

  [[nodiscard]] std::uint32_t bitmap() const {
    return (static_cast<std::uint32_t>(msb) << 16) | lsb;
  }

  bool operator==(const BitmapWindow&) const = default;
};

BitmapWindow make_window(std::uint32_t seq_offset, std::uint32_t bitmap);

// Number of indices of [seq_offset, seq_offset + 32) that are below num_packets.
std::uint32_t window_span(std::uint32_t seq_offset, std::uint32_t num_packets);

// Reconciles missing with a received window. Held bits remove their index,
// clear bits insert it. Bits at or beyond num_packets are ignored.
// Returns the number of indices whose membership changed.
std::size_t apply_update(MissingSet& missing, std::uint32_t num_packets, std::uint32_t seq_offset,
                         std::uint16_t msb, std::uint16_t lsb);

// Describes one window of missing. Bits past num_packets are zero.
BitmapWindow encode_window(const MissingSet& missing, std::uint32_t seq_offset,
                           std::uint32_t num_packets);

// One window per 32 fragments covering [0, num_packets), in order.
std::vector<BitmapWindow> encode_missing_set(const MissingSet& missing, std::uint32_t num_packets);

}  // namespace splat::transfer
