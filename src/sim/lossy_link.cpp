#include "sim/lossy_link.h"

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace splat::sim {

namespace {
bool is_bulk(const command::TransferMessage& message) {
  return message.kind == command::MessageKind::kTransPayload ||
         message.kind == command::MessageKind::kUpdateMissingFragments;
}
}  // namespace

LossyLink::LossyLink(LinkConfig config) : config_(config), rng_(config.seed) {}

bool LossyLink::chance(double probability) {
  if (probability <= 0.0) {
    return false;
  }
  return unit_(rng_) < probability;
}

std::vector<command::TransferMessage> LossyLink::carry(
    std::vector<command::TransferMessage> messages) {
  std::vector<command::TransferMessage> delivered;
  delivered.reserve(messages.size());

  for (auto& message : messages) {
    stats_.sent++;
    if (is_bulk(message) && chance(config_.drop_rate)) {
      stats_.dropped++;
      continue;
    }
    if (is_bulk(message) && chance(config_.duplicate_rate)) {
      stats_.duplicated++;
      delivered.push_back(message);
    }
    delivered.push_back(std::move(message));
  }

  if (config_.reorder) {
    // Commands keep their slots; bulk messages are shuffled among the bulk slots.
    std::vector<std::size_t> slots;
    for (std::size_t i = 0; i < delivered.size(); ++i) {
      if (is_bulk(delivered[i])) {
        slots.push_back(i);
      }
    }
    std::vector<std::size_t> order = slots;
    std::shuffle(order.begin(), order.end(), rng_);

    std::vector<command::TransferMessage> reordered = delivered;
    for (std::size_t i = 0; i < slots.size(); ++i) {
      reordered[slots[i]] = std::move(delivered[order[i]]);
    }
    delivered = std::move(reordered);
  }

  stats_.delivered += delivered.size();
  return delivered;
}

}  // namespace splat::sim
