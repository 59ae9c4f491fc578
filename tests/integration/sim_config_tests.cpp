#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "sim/sim_config.h"

namespace splat::tests {

namespace {
bool parse(std::vector<std::string> args, sim::SimConfig& config, std::error_code& ec) {
  args.insert(args.begin(), "splat-transfer-sim");
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  return sim::parse_args(static_cast<int>(argv.size()), argv.data(), config, ec);
}
}  // namespace

class SimConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    path_ = std::filesystem::temp_directory_path() / "splat_sim_config_tests.ini";
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  void write_ini(const std::string& text) {
    std::ofstream out(path_, std::ios::trunc);
    out << text;
  }

  std::filesystem::path path_;
};

TEST_F(SimConfigTest, CommandLineOverridesDefaults) {
  sim::SimConfig config;
  std::error_code ec;
  ASSERT_TRUE(parse({"-f", "image.raw", "--fragment-size", "200", "-x", "16", "--drop", "0.25",
                     "--reorder", "--seed", "99"},
                    config, ec))
      << ec.message();

  EXPECT_EQ(config.source_file, "image.raw");
  EXPECT_EQ(config.fragment_size, 200U);
  EXPECT_EQ(config.batch_size, 16);
  EXPECT_DOUBLE_EQ(config.link.drop_rate, 0.25);
  EXPECT_TRUE(config.link.reorder);
  EXPECT_EQ(config.link.seed, 99U);
  EXPECT_EQ(config.max_rounds, 200U);
}

TEST_F(SimConfigTest, UnknownOptionFails) {
  sim::SimConfig config;
  std::error_code ec;
  EXPECT_FALSE(parse({"--no-such-option"}, config, ec));
  EXPECT_EQ(ec, std::errc::invalid_argument);
}

TEST_F(SimConfigTest, LoadsIniSections) {
  write_ini(
      "# simulator settings\n"
      "[transfer]\n"
      "source_file = /data/housekeeping.bin\n"
      "fragment_size = 128\n"
      "batch_size = 8\n"
      "max_rounds = 40\n"
      "\n"
      "[link]\n"
      "drop_rate = 0.4\n"
      "duplicate_rate = 0.05\n"
      "reorder = yes\n"
      "seed = 5\n"
      "\n"
      "[logging]\n"
      "verbose = true\n"
      "dump = 1\n"
      "dump_directory = /tmp/splat_history\n");

  sim::SimConfig config;
  std::error_code ec;
  ASSERT_TRUE(sim::load_config_file(path_.string(), config, ec)) << ec.message();

  EXPECT_EQ(config.source_file, "/data/housekeeping.bin");
  EXPECT_EQ(config.fragment_size, 128U);
  EXPECT_EQ(config.batch_size, 8);
  EXPECT_EQ(config.max_rounds, 40U);
  EXPECT_DOUBLE_EQ(config.link.drop_rate, 0.4);
  EXPECT_DOUBLE_EQ(config.link.duplicate_rate, 0.05);
  EXPECT_TRUE(config.link.reorder);
  EXPECT_EQ(config.link.seed, 5U);
  EXPECT_TRUE(config.verbose);
  EXPECT_TRUE(config.dump);
  EXPECT_EQ(config.dump_directory, "/tmp/splat_history");
}

TEST_F(SimConfigTest, RejectsMalformedNumbers) {
  sim::SimConfig config;
  std::error_code ec;

  write_ini("[transfer]\nbatch_size = 70000\n");
  EXPECT_FALSE(sim::load_config_file(path_.string(), config, ec));
  EXPECT_EQ(ec, std::errc::result_out_of_range);

  ec.clear();
  write_ini("[transfer]\nfragment_size = -4\n");
  EXPECT_FALSE(sim::load_config_file(path_.string(), config, ec));

  ec.clear();
  write_ini("[link]\ndrop_rate = often\n");
  EXPECT_FALSE(sim::load_config_file(path_.string(), config, ec));
  EXPECT_EQ(ec, std::errc::invalid_argument);
}

TEST_F(SimConfigTest, MissingFileFails) {
  sim::SimConfig config;
  std::error_code ec;
  EXPECT_FALSE(sim::load_config_file("/nonexistent/splat.ini", config, ec));
  EXPECT_TRUE(ec);
}

TEST_F(SimConfigTest, ValidateChecksRanges) {
  sim::SimConfig config;
  std::string error;
  EXPECT_FALSE(sim::validate_config(config, error));  // no source file

  config.source_file = "data.bin";
  EXPECT_TRUE(sim::validate_config(config, error)) << error;

  config.fragment_size = 0;
  EXPECT_FALSE(sim::validate_config(config, error));
  config.fragment_size = 230;

  config.link.drop_rate = 1.0;
  EXPECT_FALSE(sim::validate_config(config, error));
  config.link.drop_rate = 0.1;

  config.batch_size = 0;
  EXPECT_FALSE(sim::validate_config(config, error));
}

}  // namespace splat::tests
