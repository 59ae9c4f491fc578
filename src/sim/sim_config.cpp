#include "sim/sim_config.h"

#include <cerrno>
#include <fstream>
#include <limits>
#include <stdexcept>

#include <CLI/CLI.hpp>

#include "common/logging/logger.h"

namespace splat::sim {

namespace {
// Helper to safely parse integer with validation
template <typename T>
bool safe_parse_int(const std::string& value, T& out, const std::string& field_name,
                    std::error_code& ec) {
  try {
    if (!value.empty() && value[0] == '-') {
      LOG_ERROR("Configuration error: {} value '{}' cannot be negative", field_name, value);
      ec = std::make_error_code(std::errc::result_out_of_range);
      return false;
    }
    unsigned long long parsed = std::stoull(value);
    if (parsed > std::numeric_limits<T>::max()) {
      LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
      ec = std::make_error_code(std::errc::result_out_of_range);
      return false;
    }
    out = static_cast<T>(parsed);
    return true;
  } catch (const std::invalid_argument&) {
    LOG_ERROR("Configuration error: {} value '{}' is not a valid number", field_name, value);
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  } catch (const std::out_of_range&) {
    LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
    ec = std::make_error_code(std::errc::result_out_of_range);
    return false;
  }
}

bool safe_parse_probability(const std::string& value, double& out, const std::string& field_name,
                            std::error_code& ec) {
  try {
    std::size_t consumed = 0;
    const double parsed = std::stod(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument(value);
    }
    out = parsed;
    return true;
  } catch (const std::exception&) {
    LOG_ERROR("Configuration error: {} value '{}' is not a valid probability", field_name, value);
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
}

bool parse_bool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes";
}

bool parse_ini_value(const std::string& line, std::string& key, std::string& value) {
  if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[') {
    return false;
  }

  auto pos = line.find('=');
  if (pos == std::string::npos) {
    return false;
  }

  key = line.substr(0, pos);
  value = line.substr(pos + 1);

  auto trim = [](std::string& s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
      s.pop_back();
    }
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
      s.erase(0, 1);
    }
  };
  trim(key);
  trim(value);

  return !key.empty();
}

std::string get_current_section(const std::string& line) {
  std::string trimmed = line;
  while (!trimmed.empty() && (trimmed.back() == '\r' || trimmed.back() == ' ')) {
    trimmed.pop_back();
  }
  if (trimmed.size() >= 2 && trimmed.front() == '[' && trimmed.back() == ']') {
    return trimmed.substr(1, trimmed.size() - 2);
  }
  return "";
}
}  // namespace

bool parse_args(int argc, char* argv[], SimConfig& config, std::error_code& ec) {
  CLI::App app{"SPLAT loopback file transfer simulator"};

  // General options.
  app.add_option("-c,--config", config.config_file, "Configuration file path");
  app.add_flag("-v,--verbose", config.verbose, "Enable verbose logging");
  app.add_option("--log-file", config.log_file, "Log file path");

  // Transfer.
  app.add_option("-f,--file", config.source_file, "File to downlink");
  app.add_option("--fragment-size", config.fragment_size, "Bytes per fragment")
      ->default_val(transfer::kDefaultFragmentSize);
  app.add_option("-x,--batch", config.batch_size, "Fragments requested per round")
      ->default_val(32);
  app.add_option("--max-rounds", config.max_rounds, "Give up after this many rounds")
      ->default_val(200);
  app.add_option("--max-outbound-bytes", config.max_outbound_bytes,
                 "Spacecraft outbound queue limit (0 = unlimited)")
      ->default_val(0);
  app.add_option("-o,--download-dir", config.download_directory, "Directory for received files")
      ->default_val("downloads");

  // Diagnostics.
  app.add_flag("--dump", config.dump, "Dump both transactions when done");
  app.add_flag("--dump-fragments", config.dump_fragments, "Include fragment bytes in dumps");
  app.add_option("--dump-dir", config.dump_directory, "Directory for transaction dumps")
      ->default_val("transaction_history");

  // Link model.
  app.add_option("--drop", config.link.drop_rate, "Bulk message loss probability")
      ->default_val(0.1);
  app.add_option("--duplicate", config.link.duplicate_rate, "Bulk message duplication probability")
      ->default_val(0.0);
  app.add_flag("--reorder", config.link.reorder, "Shuffle bulk traffic");
  app.add_option("--seed", config.link.seed, "Link random seed")->default_val(1);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    if (e.get_exit_code() == 0) {
      app.exit(e);
    }
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }

  // Load config file if specified.
  if (!config.config_file.empty()) {
    if (!load_config_file(config.config_file, config, ec)) {
      return false;
    }
  }

  return true;
}

bool load_config_file(const std::string& path, SimConfig& config, std::error_code& ec) {
  std::ifstream file(path);
  if (!file) {
    ec = std::error_code(errno, std::generic_category());
    LOG_ERROR("Failed to open config file: {}", path);
    return false;
  }

  std::string line;
  std::string section;

  while (std::getline(file, line)) {
    std::string new_section = get_current_section(line);
    if (!new_section.empty()) {
      section = new_section;
      continue;
    }

    std::string key;
    std::string value;
    if (!parse_ini_value(line, key, value)) {
      continue;
    }

    if (section == "transfer" || section.empty()) {
      if (key == "source_file") {
        config.source_file = value;
      } else if (key == "fragment_size") {
        if (!safe_parse_int(value, config.fragment_size, "fragment_size", ec)) {
          return false;
        }
      } else if (key == "batch_size") {
        if (!safe_parse_int(value, config.batch_size, "batch_size", ec)) {
          return false;
        }
      } else if (key == "max_rounds") {
        if (!safe_parse_int(value, config.max_rounds, "max_rounds", ec)) {
          return false;
        }
      } else if (key == "max_outbound_bytes") {
        if (!safe_parse_int(value, config.max_outbound_bytes, "max_outbound_bytes", ec)) {
          return false;
        }
      } else if (key == "download_directory") {
        config.download_directory = value;
      }
    } else if (section == "link") {
      if (key == "drop_rate") {
        if (!safe_parse_probability(value, config.link.drop_rate, "drop_rate", ec)) {
          return false;
        }
      } else if (key == "duplicate_rate") {
        if (!safe_parse_probability(value, config.link.duplicate_rate, "duplicate_rate", ec)) {
          return false;
        }
      } else if (key == "reorder") {
        config.link.reorder = parse_bool(value);
      } else if (key == "seed") {
        if (!safe_parse_int(value, config.link.seed, "seed", ec)) {
          return false;
        }
      }
    } else if (section == "logging") {
      if (key == "verbose") {
        config.verbose = parse_bool(value);
      } else if (key == "log_file") {
        config.log_file = value;
      } else if (key == "dump") {
        config.dump = parse_bool(value);
      } else if (key == "dump_fragments") {
        config.dump_fragments = parse_bool(value);
      } else if (key == "dump_directory") {
        config.dump_directory = value;
      }
    }
  }

  LOG_DEBUG("Loaded configuration from {}", path);
  return true;
}

bool validate_config(const SimConfig& config, std::string& error) {
  if (config.source_file.empty()) {
    error = "A source file is required (--file)";
    return false;
  }

  if (config.fragment_size == 0 || config.fragment_size > transfer::kMaxFragmentSize) {
    error = "Fragment size must be between 1 and " + std::to_string(transfer::kMaxFragmentSize);
    return false;
  }

  if (config.batch_size == 0) {
    error = "Batch size must be greater than 0";
    return false;
  }

  if (config.max_rounds == 0) {
    error = "Max rounds must be greater than 0";
    return false;
  }

  if (config.link.drop_rate < 0.0 || config.link.drop_rate >= 1.0) {
    error = "Drop rate must be in [0, 1)";
    return false;
  }

  if (config.link.duplicate_rate < 0.0 || config.link.duplicate_rate > 1.0) {
    error = "Duplicate rate must be in [0, 1]";
    return false;
  }

  return true;
}

}  // namespace splat::sim
