/**
 * End-to-end downlink tests
 *
 * These tests run a complete file transfer between two independent
 * TransactionManager / CommandDispatcher pairs (spacecraft and ground
 * station) over an in-memory link that drops, duplicates and reorders
 * bulk traffic:
 *
 * Ground: CREATE_TRANS -> Spacecraft: INIT_TRANS -> Ground
 * Ground: UPDATE_MISSING_FRAGMENTS + GENERATE_X_PACKETS -> Spacecraft
 * Spacecraft: TRANS_PAYLOAD x N -> Ground (lossy)
 *
 * The loop repeats until the ground side finalizes, and the received file
 * must match the source byte for byte.
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include "command/command_dispatcher.h"
#include "sim/lossy_link.h"
#include "transfer/transfer_error.h"

namespace splat::integration_tests {

using command::CommandDispatcher;
using command::TransferMessage;
using transfer::Direction;
using transfer::TransactionState;

/**
 * Test fixture holding both ends of the link.
 *
 * Each test writes its own source file under a scratch directory and
 * removes the directory afterwards.
 */
class TransferIntegrationTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = std::filesystem::temp_directory_path() /
           (std::string("splat_integration_") + info->name());
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  std::string write_source(std::size_t size) {
    source_data_.resize(size);
    std::uint32_t state = 0x12345678U;
    for (auto& byte : source_data_) {
      state = state * 1664525U + 1013904223U;
      byte = static_cast<std::uint8_t>(state >> 24);
    }
    const auto path = (dir_ / "science.dat").string();
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(source_data_.data()),
              static_cast<std::streamsize>(source_data_.size()));
    return path;
  }

  static void deliver(CommandDispatcher& to, const std::vector<TransferMessage>& messages) {
    for (const auto& message : messages) {
      (void)to.dispatch(message);
    }
  }

  struct Result {
    std::optional<command::FinalizeOutcome> outcome;
    std::size_t rounds{0};
  };

  // Runs the request / generate / report loop over a lossy link.
  Result run_transfer(const std::string& source, const sim::LinkConfig& link_config,
                      std::uint16_t batch, std::size_t max_rounds) {
    command::DispatcherConfig ground_config;
    ground_config.download_directory = (dir_ / "downloads").string();

    Result result;
    CommandDispatcher spacecraft(spacecraft_manager_);
    CommandDispatcher ground(ground_manager_, ground_config,
                             [&result](const command::FinalizeOutcome& outcome) {
                               result.outcome = outcome;
                             });
    sim::LossyLink link(link_config);

    ground.request_file(source);
    deliver(spacecraft, link.carry(ground.drain_outbound()));
    deliver(ground, link.carry(spacecraft.drain_outbound()));

    const auto rows = ground_manager_.list_by_state(Direction::kRx, TransactionState::kCreated);
    EXPECT_EQ(rows.size(), 1U);
    if (rows.empty()) {
      return result;
    }
    const auto tid = rows.front().tid;

    while (!result.outcome && result.rounds < max_rounds) {
      ++result.rounds;
      if (result.rounds > 1) {
        EXPECT_FALSE(ground.report_missing(tid));
      }
      ground.send(command::make_generate_x_packets(tid, batch));
      deliver(spacecraft, link.carry(ground.drain_outbound()));
      deliver(ground, link.carry(spacecraft.drain_outbound()));
    }

    // Final report closes the sender side.
    if (result.outcome && !result.outcome->status) {
      EXPECT_FALSE(ground.report_missing(tid));
      deliver(spacecraft, ground.drain_outbound());
    }
    link_stats_ = link.stats();
    return result;
  }

  std::vector<std::uint8_t> read_file(const std::string& path) const {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  }

  std::filesystem::path dir_;
  std::vector<std::uint8_t> source_data_;
  transfer::TransactionManager spacecraft_manager_;
  transfer::TransactionManager ground_manager_;
  sim::LinkStats link_stats_;
};

TEST_F(TransferIntegrationTest, PerfectLinkDeliversInMinimalRounds) {
  const auto source = write_source(100 * transfer::kDefaultFragmentSize);
  sim::LinkConfig link;
  link.drop_rate = 0.0;

  const auto result = run_transfer(source, link, 25, 50);
  ASSERT_TRUE(result.outcome.has_value());
  EXPECT_FALSE(result.outcome->status) << result.outcome->status.message();
  EXPECT_EQ(result.rounds, 4U);
  EXPECT_EQ(read_file(result.outcome->destination), source_data_);
}

TEST_F(TransferIntegrationTest, LossyLinkStillConverges) {
  const auto source = write_source(20000);  // 87 fragments, short tail
  sim::LinkConfig link;
  link.drop_rate = 0.3;
  link.duplicate_rate = 0.1;
  link.reorder = true;
  link.seed = 2024;

  const auto result = run_transfer(source, link, 32, 300);
  ASSERT_TRUE(result.outcome.has_value()) << "gave up after " << result.rounds << " rounds";
  EXPECT_FALSE(result.outcome->status) << result.outcome->status.message();
  EXPECT_GT(link_stats_.dropped, 0U);
  EXPECT_EQ(read_file(result.outcome->destination), source_data_);

  std::error_code ec;
  const auto* rx = ground_manager_.get(Direction::kRx, result.outcome->tid, ec);
  ASSERT_NE(rx, nullptr);
  EXPECT_EQ(rx->state(), TransactionState::kComplete);

  const auto* tx = spacecraft_manager_.get(Direction::kTx, result.outcome->tid, ec);
  ASSERT_NE(tx, nullptr);
  EXPECT_EQ(tx->state(), TransactionState::kComplete);
  EXPECT_EQ(tx->missing_count(), 0U);
}

TEST_F(TransferIntegrationTest, SingleFragmentFile) {
  const auto source = write_source(17);
  sim::LinkConfig link;
  link.drop_rate = 0.5;
  link.seed = 7;

  const auto result = run_transfer(source, link, 4, 100);
  ASSERT_TRUE(result.outcome.has_value());
  EXPECT_FALSE(result.outcome->status);
  EXPECT_EQ(read_file(result.outcome->destination), source_data_);
}

TEST_F(TransferIntegrationTest, ManagersAreIsolatedPerTransaction) {
  const auto source = write_source(3000);
  sim::LinkConfig link;
  link.drop_rate = 0.0;

  // A broken neighbour under another tid must not disturb the transfer.
  std::error_code ec;
  ASSERT_TRUE(ground_manager_.create_receiver(200, transfer::Digest{}, 2, ec).has_value());
  ground_manager_.get(Direction::kRx, 200, ec)->abort();

  const auto result = run_transfer(source, link, 64, 10);
  ASSERT_TRUE(result.outcome.has_value());
  EXPECT_FALSE(result.outcome->status);
  EXPECT_EQ(ground_manager_.list_by_state(Direction::kRx, TransactionState::kAborted).size(), 1U);
}

TEST(LossyLinkTests, CommandsAreNeverDropped) {
  sim::LinkConfig config;
  config.drop_rate = 0.99;
  config.seed = 3;
  sim::LossyLink link(config);

  std::vector<TransferMessage> batch;
  for (int i = 0; i < 50; ++i) {
    batch.push_back(command::make_generate_x_packets(1, 8));
    batch.push_back(command::make_trans_payload(1, static_cast<std::uint16_t>(i), {0x01}));
  }
  const auto delivered = link.carry(std::move(batch));

  std::size_t commands = 0;
  for (const auto& message : delivered) {
    if (message.kind == command::MessageKind::kGenerateXPackets) {
      ++commands;
    }
  }
  EXPECT_EQ(commands, 50U);
  EXPECT_GT(link.stats().dropped, 0U);
  EXPECT_EQ(link.stats().sent, 100U);
  EXPECT_EQ(link.stats().delivered, delivered.size());
}

TEST(LossyLinkTests, ReorderKeepsCommandsInPlace) {
  sim::LinkConfig config;
  config.drop_rate = 0.0;
  config.reorder = true;
  config.seed = 11;
  sim::LossyLink link(config);

  // UPDATE windows first, then the GENERATE_X that relies on them.
  std::vector<TransferMessage> batch;
  for (std::uint16_t i = 0; i < 6; ++i) {
    batch.push_back(command::make_update_missing_fragments(1, static_cast<std::uint16_t>(i * 32),
                                                           0xFFFF, i));
  }
  batch.push_back(command::make_generate_x_packets(1, 32));
  batch.push_back(command::make_trans_payload(1, 0, {0x03}));

  const auto delivered = link.carry(batch);
  ASSERT_EQ(delivered.size(), batch.size());
  EXPECT_EQ(delivered[6].kind, command::MessageKind::kGenerateXPackets);
  for (std::size_t i = 0; i < 6; ++i) {
    EXPECT_NE(delivered[i].kind, command::MessageKind::kGenerateXPackets);
  }

  std::vector<std::uint16_t> lsbs;
  for (const auto& message : delivered) {
    if (message.kind == command::MessageKind::kUpdateMissingFragments) {
      lsbs.push_back(message.update.lsb);
    }
  }
  std::sort(lsbs.begin(), lsbs.end());
  EXPECT_EQ(lsbs, std::vector<std::uint16_t>({0, 1, 2, 3, 4, 5}));
}

TEST(LossyLinkTests, PerfectLinkPreservesOrder) {
  sim::LinkConfig config;
  config.drop_rate = 0.0;
  sim::LossyLink link(config);

  std::vector<TransferMessage> batch;
  for (std::uint16_t i = 0; i < 10; ++i) {
    batch.push_back(command::make_trans_payload(2, i, {0x02}));
  }
  const auto delivered = link.carry(batch);
  ASSERT_EQ(delivered.size(), 10U);
  for (std::uint16_t i = 0; i < 10; ++i) {
    EXPECT_EQ(delivered[i].payload.seq_number, i);
  }
}

}  // namespace splat::integration_tests
