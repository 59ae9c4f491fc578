#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include "transfer/file_digest.h"
#include "transfer/fragment_bitmap.h"

namespace splat::transfer {

using TransactionId = std::uint8_t;

// Fragment size of the original downlink (bytes of file data per TRANS_PAYLOAD).
inline constexpr std::size_t kDefaultFragmentSize = 230;

// TRANS_PAYLOAD carries a 2-byte length; INIT_TRANS a 2-byte fragment count.
inline constexpr std::size_t kMaxFragmentSize = 65535;
inline constexpr std::uint32_t kMaxFragments = 65535;

enum class Direction : std::uint8_t {
  kTx = 0,  // local side is the source
  kRx = 1,  // local side is the destination
};

enum class TransactionState : std::uint8_t {
  kCreated = 0,
  kActive = 1,
  kComplete = 2,
  kAborted = 3,
};

const char* to_string(Direction direction);
const char* to_string(TransactionState state);

struct FragmentPayload {
  FragmentIndex index{0};
  std::vector<std::uint8_t> data;
};

// Options for a receiving transaction.
struct ReceiverOptions {
  // Where try_finalize() writes the assembled file. Empty keeps it in memory only.
  std::string destination;
  // Exact source size, when the receiver knows it. Pins the last fragment length.
  std::optional<std::uint64_t> file_size;
};

class Transaction;

// Snapshot of fragment indices to emit, read from the source on demand.
// The owning Transaction must outlive the sequence.
class FragmentSequence {
 public:
  FragmentSequence() = default;

  // Reads the next fragment. Returns nullopt at the end or on a read error (ec set).
  std::optional<FragmentPayload> next(std::error_code& ec);

  // Rewinds to the first index.
  void reset() { cursor_ = 0; }

  [[nodiscard]] std::size_t size() const { return indices_.size(); }
  [[nodiscard]] bool empty() const { return indices_.empty(); }
  [[nodiscard]] std::size_t remaining() const { return indices_.size() - cursor_; }
  [[nodiscard]] const std::vector<FragmentIndex>& indices() const { return indices_; }

 private:
  friend class Transaction;
  FragmentSequence(Transaction* owner, std::vector<FragmentIndex> indices)
      : owner_(owner), indices_(std::move(indices)) {}

  Transaction* owner_{nullptr};
  std::vector<FragmentIndex> indices_;
  std::size_t cursor_{0};
};

/**
 * State of one file transfer, either as source (TX) or destination (RX).
 *
 * A TX transaction reads fragments from its source file on demand and never
 * buffers the file. An RX transaction assembles fragments into a buffer sized
 * num_packets * fragment_size and verifies the digest in try_finalize().
 *
 * The missing set only shrinks on proof of delivery: ingest on the RX side,
 * peer reports (apply_missing_update, acknowledge_fragments) on either side.
 * Generating a fragment never touches it.
 *
 * Thread Safety:
 *   Not thread-safe. Commands for one transaction are processed serially.
 */
class Transaction {
 public:
  using Clock = std::chrono::system_clock;
  using TimePoint = Clock::time_point;

  // Opens file_reference as a transfer source. Fails with kSourceUnavailable,
  // kEmpty, kInvalidArgument (fragment size) or kResourceExhausted (too many fragments).
  static std::unique_ptr<Transaction> open_sender(TransactionId tid, const std::string& file_reference,
                                                  std::size_t fragment_size, std::error_code& ec,
                                                  TimePoint created_at = Clock::now());

  // Creates the destination side of a transfer announced by INIT_TRANS.
  // Every fragment starts missing.
  static std::unique_ptr<Transaction> open_receiver(TransactionId tid, const Digest& expected_hash,
                                                    std::uint32_t num_packets,
                                                    std::size_t fragment_size,
                                                    ReceiverOptions options, std::error_code& ec,
                                                    TimePoint created_at = Clock::now());

  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  [[nodiscard]] TransactionId tid() const { return tid_; }
  [[nodiscard]] Direction direction() const { return direction_; }
  [[nodiscard]] TransactionState state() const { return state_; }
  [[nodiscard]] const std::string& file_reference() const { return file_reference_; }
  [[nodiscard]] std::size_t fragment_size() const { return fragment_size_; }
  [[nodiscard]] std::uint32_t num_packets() const { return num_packets_; }
  [[nodiscard]] const Digest& expected_hash() const { return expected_hash_; }
  [[nodiscard]] DigestWords digest_words() const { return split_digest(expected_hash_); }
  [[nodiscard]] const MissingSet& missing() const { return missing_; }
  [[nodiscard]] std::size_t missing_count() const { return missing_.size(); }
  [[nodiscard]] std::optional<std::uint64_t> file_size() const { return file_size_; }
  [[nodiscard]] TimePoint created_at() const { return created_at_; }
  [[nodiscard]] bool is_terminal() const {
    return state_ == TransactionState::kComplete || state_ == TransactionState::kAborted;
  }

  // Bytes of assembly buffer held by an RX transaction (0 for TX).
  [[nodiscard]] std::size_t reserved_bytes() const { return buffer_.size(); }

  // RX: fragments actually written, ascending.
  std::vector<FragmentIndex> received_indices() const;

  // RX: bytes of a written fragment, empty if it was never received.
  std::span<const std::uint8_t> received_fragment(FragmentIndex index) const;

  // RX: bytes assembled by the last try_finalize() call (kept after a digest mismatch).
  std::span<const std::uint8_t> assembled_data() const;

  // TX: every missing fragment in ascending order.
  FragmentSequence generate_all_fragments(std::error_code& ec);

  // TX: the n lowest missing fragments. Empty when nothing is missing.
  FragmentSequence generate_n_fragments(std::size_t n, std::error_code& ec);

  // TX: one fragment, which must still be missing (kUnknownFragment otherwise).
  std::optional<FragmentPayload> generate_fragment(FragmentIndex index, std::error_code& ec);

  // RX: stores a TRANS_PAYLOAD fragment. Nothing changes on failure.
  std::error_code ingest_fragment(FragmentIndex index, std::span<const std::uint8_t> payload);

  // RX: verifies the assembled file. kIncomplete while fragments are missing;
  // kIntegrityFailure (and ABORTED) on a digest mismatch.
  std::error_code try_finalize();

  // Applies one UPDATE_MISSING_FRAGMENTS window. On an RX transaction a held
  // bit cannot clear a fragment that was never stored.
  std::error_code apply_missing_update(std::uint32_t seq_offset, std::uint16_t msb,
                                       std::uint16_t lsb);

  // Removes indices the peer reports as held.
  std::error_code acknowledge_fragments(std::span<const FragmentIndex> held);

  // Overwrites the missing set with the peer's explicit list.
  std::error_code replace_missing(MissingSet missing);

  std::vector<BitmapWindow> describe_missing() const;

  // Cancels the transfer. No effect on a terminal transaction.
  void abort();

  // Length a fragment must have, or nullopt when the receiver does not know it yet
  // (last fragment of a transfer of unknown size).
  std::optional<std::size_t> expected_length(FragmentIndex index) const;

 private:
  friend class FragmentSequence;

  Transaction(TransactionId tid, Direction direction, std::string file_reference,
              std::size_t fragment_size, std::uint32_t num_packets, TimePoint created_at);

  std::optional<FragmentPayload> read_fragment(FragmentIndex index, std::error_code& ec);
  std::error_code check_direction(Direction required) const;
  void mark_active();
  void complete_if_drained();
  void restore_unreceived();
  std::size_t assembled_length() const;

  TransactionId tid_;
  Direction direction_;
  TransactionState state_{TransactionState::kCreated};
  std::string file_reference_;
  std::size_t fragment_size_;
  std::uint32_t num_packets_;
  std::optional<std::uint64_t> file_size_;
  Digest expected_hash_{};
  MissingSet missing_;
  TimePoint created_at_;

  // TX source.
  std::ifstream source_;

  // RX assembly.
  std::vector<std::uint8_t> buffer_;
  std::vector<bool> received_;
  std::size_t last_length_{0};
  std::size_t assembled_length_{0};
};

}  // namespace splat::transfer
