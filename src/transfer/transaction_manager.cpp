#include "transfer/transaction_manager.h"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

#include "common/logging/logger.h"
#include "transfer/transfer_error.h"

using json = nlohmann::json;

namespace splat::transfer {

namespace {
std::string format_timestamp(Transaction::TimePoint when) {
  const std::time_t t = Transaction::Clock::to_time_t(when);
  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  std::ostringstream out;
  out << std::put_time(&tm, "%Y_%m_%d-%H_%M_%S");
  return out.str();
}

TransactionSummary summarize(const Transaction& trans) {
  TransactionSummary summary;
  summary.tid = trans.tid();
  summary.state = trans.state();
  summary.missing_count = trans.missing_count();
  summary.num_packets = trans.num_packets();
  return summary;
}

json transaction_to_json(const Transaction& trans, bool include_fragments,
                          const std::string& timestamp) {
  const auto received = trans.received_indices();
  json j = {
      {"tid", trans.tid()},
      {"direction", to_string(trans.direction())},
      {"state", static_cast<int>(trans.state())},
      {"state_name", to_string(trans.state())},
      {"timestamp", timestamp},
      {"file_reference", trans.file_reference()},
      {"fragment_size", trans.fragment_size()},
      {"num_packets", trans.num_packets()},
      {"hash", to_hex(trans.expected_hash())},
      {"missing_count", trans.missing_count()},
      {"missing", std::vector<FragmentIndex>(trans.missing().begin(), trans.missing().end())},
      {"received_count", received.size()},
      {"dump_fragments", include_fragments},
  };
  if (trans.file_size()) {
    j["file_size"] = *trans.file_size();
  } else {
    j["file_size"] = nullptr;
  }

  if (include_fragments && !received.empty()) {
    json fragments = json::object();
    for (const auto index : received) {
      const auto bytes = trans.received_fragment(index);
      fragments[std::to_string(index)] = {{"size", bytes.size()}, {"bytes", to_hex(bytes)}};
    }
    j["received_fragments"] = std::move(fragments);
  }
  return j;
}
}  // namespace

TransactionManager::TransactionManager(ManagerConfig config) : config_(std::move(config)) {
  LOG_DEBUG("Transaction manager ready (fragment size {}, {} transactions per direction)",
            config_.fragment_size, capacity());
}

std::size_t TransactionManager::capacity() const {
  return std::min(config_.max_transactions, kTransactionIdSpace);
}

std::optional<TransactionId> TransactionManager::allocate_tid() const {
  if (tx_.size() + reserved_tx_.size() >= capacity()) {
    return std::nullopt;
  }
  // Lowest tid neither registered nor held by a create_sender() in progress.
  for (std::size_t candidate = 0; candidate < kTransactionIdSpace; ++candidate) {
    const auto tid = static_cast<TransactionId>(candidate);
    if (tx_.count(tid) == 0 && reserved_tx_.count(tid) == 0) {
      return tid;
    }
  }
  return std::nullopt;
}

std::size_t TransactionManager::rx_buffered_bytes_locked() const {
  std::size_t total = 0;
  for (const auto& [tid, trans] : rx_) {
    total += trans->reserved_bytes();
  }
  return total;
}

std::optional<TransactionId> TransactionManager::create_sender(const std::string& file_reference,
                                                               std::error_code& ec) {
  std::optional<TransactionId> tid;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    tid = allocate_tid();
    if (!tid) {
      rejected_no_tid_++;
      LOG_WARN("No free TX transaction id, rejecting {}", file_reference);
      ec = make_error_code(TransferErrc::kNoFreeTransactionId);
      return std::nullopt;
    }
    reserved_tx_.insert(*tid);
  }

  // Opening hashes the whole source, so it runs without the registry lock.
  auto trans = Transaction::open_sender(*tid, file_reference, config_.fragment_size, ec);

  std::lock_guard<std::mutex> lock(mutex_);
  reserved_tx_.erase(*tid);
  if (!trans) {
    return std::nullopt;
  }

  LOG_INFO("Created TX transaction {} for {} ({} fragments)", *tid, file_reference,
           trans->num_packets());
  tx_[*tid] = std::move(trans);
  total_created_++;
  return tid;
}

std::optional<TransactionId> TransactionManager::create_receiver(TransactionId tid,
                                                                 const Digest& expected_hash,
                                                                 std::uint32_t num_packets,
                                                                 std::error_code& ec,
                                                                 ReceiverOptions options) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (rx_.count(tid) != 0) {
    rejected_duplicate_++;
    LOG_WARN("RX transaction {} already exists", tid);
    ec = make_error_code(TransferErrc::kDuplicateTransaction);
    return std::nullopt;
  }
  if (rx_.size() >= capacity()) {
    rejected_no_tid_++;
    LOG_WARN("RX namespace full, rejecting transaction {}", tid);
    ec = make_error_code(TransferErrc::kResourceExhausted);
    return std::nullopt;
  }
  if (config_.max_rx_buffer_bytes != 0) {
    const std::size_t needed = static_cast<std::size_t>(num_packets) * config_.fragment_size;
    if (rx_buffered_bytes_locked() + needed > config_.max_rx_buffer_bytes) {
      rejected_memory_++;
      LOG_WARN("RX transaction {} needs {} bytes, buffer limit {} reached", tid, needed,
               config_.max_rx_buffer_bytes);
      ec = make_error_code(TransferErrc::kResourceExhausted);
      return std::nullopt;
    }
  }

  auto trans = Transaction::open_receiver(tid, expected_hash, num_packets, config_.fragment_size,
                                          std::move(options), ec);
  if (!trans) {
    return std::nullopt;
  }

  LOG_INFO("Created RX transaction {} ({} fragments, digest {})", tid, num_packets,
           to_hex(expected_hash));
  rx_[tid] = std::move(trans);
  total_created_++;
  return tid;
}

Transaction* TransactionManager::get(Direction direction, TransactionId tid, std::error_code& ec) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& entries = table(direction);
  auto it = entries.find(tid);
  if (it == entries.end()) {
    ec = make_error_code(TransferErrc::kNotFound);
    return nullptr;
  }
  return it->second.get();
}

const Transaction* TransactionManager::get(Direction direction, TransactionId tid,
                                           std::error_code& ec) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto& entries = table(direction);
  auto it = entries.find(tid);
  if (it == entries.end()) {
    ec = make_error_code(TransferErrc::kNotFound);
    return nullptr;
  }
  return it->second.get();
}

bool TransactionManager::remove(Direction direction, TransactionId tid) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& entries = table(direction);
  auto it = entries.find(tid);
  if (it == entries.end()) {
    return false;
  }
  LOG_INFO("Removed {} transaction {} ({})", to_string(direction), tid,
           to_string(it->second->state()));
  entries.erase(it);
  total_removed_++;
  return true;
}

std::vector<TransactionSummary> TransactionManager::list(Direction direction) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto& entries = table(direction);
  std::vector<TransactionSummary> result;
  result.reserve(entries.size());
  for (const auto& [tid, trans] : entries) {
    result.push_back(summarize(*trans));
  }
  return result;
}

std::vector<TransactionSummary> TransactionManager::list_by_state(Direction direction,
                                                                  TransactionState state) const {
  auto all = list(direction);
  all.erase(std::remove_if(all.begin(), all.end(),
                           [state](const TransactionSummary& s) { return s.state != state; }),
            all.end());
  return all;
}

std::optional<std::string> TransactionManager::dump(Direction direction, TransactionId tid,
                                                    std::error_code& ec,
                                                    bool include_fragments) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto& entries = table(direction);
  auto it = entries.find(tid);
  if (it == entries.end()) {
    LOG_ERROR("Cannot dump {} transaction {}: not found", to_string(direction), tid);
    ec = make_error_code(TransferErrc::kNotFound);
    return std::nullopt;
  }
  const Transaction& trans = *it->second;

  std::error_code fs_ec;
  std::filesystem::create_directories(config_.dump_directory, fs_ec);
  if (fs_ec) {
    LOG_ERROR("Cannot create dump directory {}: {}", config_.dump_directory, fs_ec.message());
    ec = fs_ec;
    return std::nullopt;
  }

  const std::string timestamp = format_timestamp(trans.created_at());
  const std::string filename = timestamp + "_tid" + std::to_string(tid) + "_" +
                               to_string(trans.state()) + "_" + to_string(direction) + ".json";
  const auto path = (std::filesystem::path(config_.dump_directory) / filename).string();

  std::ofstream out(path, std::ios::trunc);
  out << transaction_to_json(trans, include_fragments, timestamp).dump(2) << '\n';
  if (!out) {
    LOG_ERROR("Failed to write transaction dump {}", path);
    ec = make_error_code(TransferErrc::kIoError);
    return std::nullopt;
  }

  LOG_INFO("Transaction dump saved to {}", path);
  return path;
}

std::size_t TransactionManager::clear_aborted(Direction direction) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& entries = table(direction);
  std::size_t cleared = 0;
  for (auto it = entries.begin(); it != entries.end();) {
    if (it->second->state() == TransactionState::kAborted) {
      LOG_INFO("Clearing aborted {} transaction {}", to_string(direction), it->first);
      it = entries.erase(it);
      ++cleared;
    } else {
      ++it;
    }
  }
  total_removed_ += cleared;
  return cleared;
}

std::size_t TransactionManager::count(Direction direction) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return table(direction).size();
}

bool TransactionManager::is_full(Direction direction) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return table(direction).size() >= capacity();
}

ManagerStats TransactionManager::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  ManagerStats stats;
  stats.tx_count = tx_.size();
  stats.rx_count = rx_.size();
  stats.rx_buffered_bytes = rx_buffered_bytes_locked();
  stats.total_created = total_created_;
  stats.total_removed = total_removed_;
  stats.rejected_no_tid = rejected_no_tid_;
  stats.rejected_duplicate = rejected_duplicate_;
  stats.rejected_memory = rejected_memory_;
  for (const auto* entries : {&tx_, &rx_}) {
    for (const auto& [tid, trans] : *entries) {
      stats.by_state[static_cast<std::size_t>(trans->state())]++;
    }
  }
  return stats;
}

}  // namespace splat::transfer
