#include "transfer/fragment_bitmap.h"

#include <algorithm>

namespace splat::transfer {

namespace {
constexpr std::uint32_t kTopBit = 31;

std::uint32_t bit_for(std::uint32_t position) { return 1U << (kTopBit - position); }
}  // namespace

BitmapWindow make_window(std::uint32_t seq_offset, std::uint32_t bitmap) {
  BitmapWindow window;
  window.seq_offset = seq_offset;
  window.msb = static_cast<std::uint16_t>((bitmap >> 16) & 0xFFFF);
  window.lsb = static_cast<std::uint16_t>(bitmap & 0xFFFF);
  return window;
}

std::uint32_t window_span(std::uint32_t seq_offset, std::uint32_t num_packets) {
  if (seq_offset >= num_packets) {
    return 0;
  }
  return std::min(kWindowSize, num_packets - seq_offset);
}

std::size_t apply_update(MissingSet& missing, std::uint32_t num_packets, std::uint32_t seq_offset,
                         std::uint16_t msb, std::uint16_t lsb) {
  const std::uint32_t bitmap = (static_cast<std::uint32_t>(msb) << 16) | lsb;
  const std::uint32_t span = window_span(seq_offset, num_packets);
  std::size_t changed = 0;

  for (std::uint32_t position = 0; position < span; ++position) {
    const FragmentIndex index = seq_offset + position;
    if ((bitmap & bit_for(position)) != 0U) {
      changed += missing.erase(index);
    } else if (missing.insert(index).second) {
      ++changed;
    }
  }
  return changed;
}

BitmapWindow encode_window(const MissingSet& missing, std::uint32_t seq_offset,
                           std::uint32_t num_packets) {
  const std::uint32_t span = window_span(seq_offset, num_packets);
  std::uint32_t bitmap = 0;
  if (span > 0) {
    // Start with every in-range bit held, then clear the missing ones.
    bitmap = span == kWindowSize ? 0xFFFFFFFFU : ~(0xFFFFFFFFU >> span);
    const auto end = missing.lower_bound(seq_offset + span);
    for (auto it = missing.lower_bound(seq_offset); it != end; ++it) {
      bitmap &= ~bit_for(*it - seq_offset);
    }
  }
  return make_window(seq_offset, bitmap);
}

std::vector<BitmapWindow> encode_missing_set(const MissingSet& missing, std::uint32_t num_packets) {
  std::vector<BitmapWindow> windows;
  windows.reserve((num_packets + kWindowSize - 1) / kWindowSize);
  for (std::uint32_t offset = 0; offset < num_packets; offset += kWindowSize) {
    windows.push_back(encode_window(missing, offset, num_packets));
  }
  return windows;
}

}  // namespace splat::transfer
