#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "command/command_dispatcher.h"
#include "common/logging/logger.h"
#include "sim/lossy_link.h"
#include "sim/sim_config.h"
#include "transfer/transaction_manager.h"
#include "transfer/transfer_error.h"

using namespace splat;

namespace {

void print_row(const std::string& label, const std::string& value) {
  std::cout << "  " << label;
  for (std::size_t i = label.size(); i < 22; ++i) {
    std::cout << ' ';
  }
  std::cout << value << '\n';
}

void print_configuration(const sim::SimConfig& config) {
  std::cout << "Simulation Configuration\n";
  print_row("Source", config.source_file);
  print_row("Fragment Size", std::to_string(config.fragment_size));
  print_row("Batch Size", std::to_string(config.batch_size));
  print_row("Max Rounds", std::to_string(config.max_rounds));
  print_row("Drop Rate", std::to_string(config.link.drop_rate));
  print_row("Duplicate Rate", std::to_string(config.link.duplicate_rate));
  print_row("Reorder", config.link.reorder ? "Yes" : "No");
  print_row("Download Directory", config.download_directory);
  std::cout << '\n';
}

// Delivers every message to the dispatcher; rejected messages are logged by it.
void deliver(command::CommandDispatcher& dispatcher,
             const std::vector<command::TransferMessage>& messages) {
  for (const auto& message : messages) {
    (void)dispatcher.dispatch(message);
  }
}

std::optional<transfer::TransactionId> first_receiving(const transfer::TransactionManager& manager) {
  const auto rows = manager.list(transfer::Direction::kRx);
  if (rows.empty()) {
    return std::nullopt;
  }
  return rows.front().tid;
}

void dump_transaction(const transfer::TransactionManager& manager, transfer::Direction direction,
                      transfer::TransactionId tid, bool include_fragments) {
  std::error_code ec;
  const auto path = manager.dump(direction, tid, ec, include_fragments);
  if (!path) {
    LOG_ERROR("Failed to dump {} tid {}: {}", transfer::to_string(direction), tid, ec.message());
    return;
  }
  print_row(std::string("Dump ") + transfer::to_string(direction), *path);
}

}  // namespace

int main(int argc, char* argv[]) {
  sim::SimConfig config;
  std::error_code ec;

  if (!sim::parse_args(argc, argv, config, ec)) {
    std::cerr << "Failed to parse arguments: " << ec.message() << '\n';
    std::cerr << "Usage: splat-transfer-sim -f <file> [options]" << '\n';
    return EXIT_FAILURE;
  }

  std::string error;
  if (!sim::validate_config(config, error)) {
    std::cerr << "Configuration error: " << error << '\n';
    return EXIT_FAILURE;
  }

  logging::configure_logging(config.verbose ? logging::LogLevel::debug : logging::LogLevel::info,
                             true, config.log_file);
  print_configuration(config);

  transfer::ManagerConfig manager_config;
  manager_config.fragment_size = config.fragment_size;
  manager_config.dump_directory = config.dump_directory;

  transfer::TransactionManager spacecraft(manager_config);
  transfer::TransactionManager ground(manager_config);

  command::DispatcherConfig spacecraft_config;
  spacecraft_config.max_outbound_bytes = config.max_outbound_bytes;
  command::CommandDispatcher uplink_handler(spacecraft, spacecraft_config);

  std::optional<command::FinalizeOutcome> outcome;
  command::DispatcherConfig ground_config;
  ground_config.download_directory = config.download_directory;
  command::CommandDispatcher downlink_handler(
      ground, ground_config, [&outcome](const command::FinalizeOutcome& result) {
        outcome = result;
      });

  sim::LossyLink link(config.link);

  // CREATE_TRANS up, INIT_TRANS down.
  downlink_handler.request_file(config.source_file);
  deliver(uplink_handler, link.carry(downlink_handler.drain_outbound()));
  deliver(downlink_handler, link.carry(uplink_handler.drain_outbound()));

  const auto rx_tid = first_receiving(ground);
  if (!rx_tid) {
    LOG_ERROR("Spacecraft did not open {}", config.source_file);
    std::cerr << "Transfer could not be started" << '\n';
    return EXIT_FAILURE;
  }
  LOG_INFO("Downlinking {} as tid {}", config.source_file, *rx_tid);

  std::size_t rounds = 0;
  while (!outcome && rounds < config.max_rounds) {
    ++rounds;
    if (rounds > 1) {
      if (auto report_ec = downlink_handler.report_missing(*rx_tid)) {
        LOG_ERROR("Cannot report missing fragments: {}", report_ec.message());
        break;
      }
    }
    downlink_handler.send(command::make_generate_x_packets(*rx_tid, config.batch_size));
    deliver(uplink_handler, link.carry(downlink_handler.drain_outbound()));
    deliver(downlink_handler, link.carry(uplink_handler.drain_outbound()));

    std::error_code get_ec;
    if (const auto* trans = ground.get(transfer::Direction::kRx, *rx_tid, get_ec)) {
      LOG_DEBUG("Round {}: {} of {} fragments missing", rounds, trans->missing_count(),
                trans->num_packets());
    }
  }

  const auto& link_stats = link.stats();
  std::cout << '\n' << "Transfer Summary\n";
  print_row("Rounds", std::to_string(rounds));
  print_row("Messages Sent", std::to_string(link_stats.sent));
  print_row("Messages Dropped", std::to_string(link_stats.dropped));
  print_row("Messages Duplicated", std::to_string(link_stats.duplicated));
  print_row("Fragments Sent", std::to_string(uplink_handler.stats().fragments_queued));
  print_row("Fragments Stored", std::to_string(downlink_handler.stats().fragments_ingested));

  bool verified = false;
  if (!outcome) {
    print_row("Result", "gave up after " + std::to_string(rounds) + " rounds");
  } else if (outcome->status) {
    print_row("Result", "FAILED (" + outcome->status.message() + ")");
  } else {
    print_row("Result", "verified");
    verified = true;
  }
  if (outcome && !outcome->destination.empty()) {
    print_row("Destination", outcome->destination);
  }

  if (config.dump) {
    dump_transaction(ground, transfer::Direction::kRx, *rx_tid, config.dump_fragments);
    for (const auto& row : spacecraft.list(transfer::Direction::kTx)) {
      dump_transaction(spacecraft, transfer::Direction::kTx, row.tid, false);
    }
  }

  return verified ? EXIT_SUCCESS : EXIT_FAILURE;
}
