#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <vector>

#include "transfer/transaction.h"

namespace splat::transfer {

// Size of the one-byte tid space per direction.
inline constexpr std::size_t kTransactionIdSpace = 256;

struct ManagerConfig {
  // Bytes of file data per fragment for transactions created here.
  std::size_t fragment_size{kDefaultFragmentSize};

  // Cap on concurrent transactions per direction (at most kTransactionIdSpace).
  std::size_t max_transactions{kTransactionIdSpace};

  // Cap on RX assembly buffers across all receiving transactions (0 = unlimited).
  std::size_t max_rx_buffer_bytes{0};

  // Directory for diagnostic dumps.
  std::string dump_directory{"transaction_history"};
};

// Row of list().
struct TransactionSummary {
  TransactionId tid{0};
  TransactionState state{TransactionState::kCreated};
  std::size_t missing_count{0};
  std::uint32_t num_packets{0};

  bool operator==(const TransactionSummary&) const = default;
};

struct ManagerStats {
  std::size_t tx_count{0};
  std::size_t rx_count{0};
  std::size_t rx_buffered_bytes{0};
  std::size_t total_created{0};
  std::size_t total_removed{0};
  std::size_t rejected_no_tid{0};
  std::size_t rejected_duplicate{0};
  std::size_t rejected_memory{0};
  // Indexed by TransactionState.
  std::array<std::size_t, 4> by_state{};
};

/**
 * Registry and sole owner of all transactions, in two independent tid
 * namespaces: TX (tids allocated here) and RX (tids taken from INIT_TRANS).
 *
 * Thread Safety:
 *   Registry operations are internally synchronized. Pointers returned by get()
 *   stay valid until the transaction is removed; callers serialize commands
 *   for the same transaction.
 */
class TransactionManager {
 public:
  explicit TransactionManager(ManagerConfig config = {});

  TransactionManager(const TransactionManager&) = delete;
  TransactionManager& operator=(const TransactionManager&) = delete;

  // Opens file_reference as a new TX transaction under the lowest free tid.
  std::optional<TransactionId> create_sender(const std::string& file_reference,
                                             std::error_code& ec);

  // Registers the receiving side of a transfer announced with tid.
  std::optional<TransactionId> create_receiver(TransactionId tid, const Digest& expected_hash,
                                               std::uint32_t num_packets, std::error_code& ec,
                                               ReceiverOptions options = {});

  // Returns nullptr and sets ec to kNotFound when absent.
  Transaction* get(Direction direction, TransactionId tid, std::error_code& ec);
  const Transaction* get(Direction direction, TransactionId tid, std::error_code& ec) const;

  // Drops a transaction and everything it holds. Absent tids are ignored.
  // Returns true if something was removed.
  bool remove(Direction direction, TransactionId tid);

  std::vector<TransactionSummary> list(Direction direction) const;
  std::vector<TransactionSummary> list_by_state(Direction direction, TransactionState state) const;

  // Writes a JSON snapshot of the transaction to the dump directory and
  // returns its path. include_fragments adds the received bytes (RX) as hex.
  std::optional<std::string> dump(Direction direction, TransactionId tid, std::error_code& ec,
                                  bool include_fragments = false) const;

  // Removes every ABORTED transaction in the namespace. Returns the count.
  std::size_t clear_aborted(Direction direction);

  std::size_t count(Direction direction) const;
  bool is_full(Direction direction) const;
  ManagerStats stats() const;

  const ManagerConfig& config() const { return config_; }

 private:
  using Table = std::map<TransactionId, std::unique_ptr<Transaction>>;

  Table& table(Direction direction) { return direction == Direction::kTx ? tx_ : rx_; }
  const Table& table(Direction direction) const {
    return direction == Direction::kTx ? tx_ : rx_;
  }

  std::optional<TransactionId> allocate_tid() const;
  std::size_t rx_buffered_bytes_locked() const;
  std::size_t capacity() const;

  ManagerConfig config_;
  Table tx_;
  Table rx_;

  // TX tids handed out by create_sender() while the source is being opened.
  std::set<TransactionId> reserved_tx_;

  std::size_t total_created_{0};
  std::size_t total_removed_{0};
  std::size_t rejected_no_tid_{0};
  std::size_t rejected_duplicate_{0};
  std::size_t rejected_memory_{0};

  mutable std::mutex mutex_;
};

}  // namespace splat::transfer
