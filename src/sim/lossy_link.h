#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include "command/message.h"

namespace splat::sim {

struct LinkConfig {
  // Probability that a TRANS_PAYLOAD or UPDATE_MISSING_FRAGMENTS is lost.
  double drop_rate{0.1};
  // Probability that a delivered message arrives twice.
  double duplicate_rate{0.0};
  // Shuffle bulk traffic within each batch. Commands keep their positions.
  bool reorder{false};
  std::uint32_t seed{1};
};

struct LinkStats {
  std::uint64_t sent{0};
  std::uint64_t dropped{0};
  std::uint64_t duplicated{0};
  std::uint64_t delivered{0};
};

// In-memory stand-in for the half-duplex radio link. Commands (CREATE_TRANS,
// INIT_TRANS, GENERATE_*, GET_SINGLE_PACKET) travel over the acknowledged
// command channel and are never lost; bulk traffic is subject to the model.
class LossyLink {
 public:
  explicit LossyLink(LinkConfig config);

  std::vector<command::TransferMessage> carry(std::vector<command::TransferMessage> messages);

  [[nodiscard]] const LinkStats& stats() const { return stats_; }

 private:
  bool chance(double probability);

  LinkConfig config_;
  std::mt19937 rng_;
  std::uniform_real_distribution<double> unit_{0.0, 1.0};
  LinkStats stats_;
};

}  // namespace splat::sim
