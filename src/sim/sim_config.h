#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

#include "sim/lossy_link.h"
#include "transfer/transaction.h"

namespace splat::sim {

// Configuration of the loopback transfer simulator.
struct SimConfig {
  // General settings.
  std::string config_file;
  bool verbose{false};
  std::string log_file;

  // Transfer.
  std::string source_file;
  std::size_t fragment_size{transfer::kDefaultFragmentSize};
  std::uint16_t batch_size{32};     // x of each GENERATE_X_PACKETS
  std::size_t max_rounds{200};
  std::size_t max_outbound_bytes{0};
  std::string download_directory{"downloads"};

  // Diagnostics.
  bool dump{false};
  bool dump_fragments{false};
  std::string dump_directory{"transaction_history"};

  // Link model.
  LinkConfig link;
};

// Parse command-line arguments into configuration.
bool parse_args(int argc, char* argv[], SimConfig& config, std::error_code& ec);

// Load configuration from INI file.
bool load_config_file(const std::string& path, SimConfig& config, std::error_code& ec);

// Validate configuration.
bool validate_config(const SimConfig& config, std::string& error);

}  // namespace splat::sim
