#include "transfer/transaction.h"

#include <algorithm>
#include <filesystem>
#include <utility>

#include "common/logging/logger.h"
#include "transfer/transfer_error.h"

namespace splat::transfer {

namespace {
bool valid_fragment_size(std::size_t fragment_size) {
  return fragment_size > 0 && fragment_size <= kMaxFragmentSize;
}
}  // namespace

const char* to_string(Direction direction) {
  return direction == Direction::kTx ? "TX" : "RX";
}

const char* to_string(TransactionState state) {
  switch (state) {
    case TransactionState::kCreated:
      return "CREATED";
    case TransactionState::kActive:
      return "ACTIVE";
    case TransactionState::kComplete:
      return "COMPLETE";
    case TransactionState::kAborted:
      return "ABORTED";
  }
  return "UNKNOWN";
}

std::optional<FragmentPayload> FragmentSequence::next(std::error_code& ec) {
  if (owner_ == nullptr || cursor_ >= indices_.size()) {
    return std::nullopt;
  }
  auto fragment = owner_->read_fragment(indices_[cursor_], ec);
  if (fragment) {
    ++cursor_;
  }
  return fragment;
}

Transaction::Transaction(TransactionId tid, Direction direction, std::string file_reference,
                         std::size_t fragment_size, std::uint32_t num_packets, TimePoint created_at)
    : tid_(tid),
      direction_(direction),
      file_reference_(std::move(file_reference)),
      fragment_size_(fragment_size),
      num_packets_(num_packets),
      created_at_(created_at) {}

Transaction::~Transaction() = default;

std::unique_ptr<Transaction> Transaction::open_sender(TransactionId tid,
                                                      const std::string& file_reference,
                                                      std::size_t fragment_size,
                                                      std::error_code& ec, TimePoint created_at) {
  if (!valid_fragment_size(fragment_size)) {
    LOG_ERROR("Invalid fragment size {} for TX transaction {}", fragment_size, tid);
    ec = make_error_code(TransferErrc::kInvalidArgument);
    return nullptr;
  }

  std::error_code fs_ec;
  if (!std::filesystem::is_regular_file(file_reference, fs_ec)) {
    LOG_WARN("Source {} is not a readable file", file_reference);
    ec = make_error_code(TransferErrc::kSourceUnavailable);
    return nullptr;
  }
  const auto size = std::filesystem::file_size(file_reference, fs_ec);
  if (fs_ec) {
    LOG_WARN("Cannot stat source {}: {}", file_reference, fs_ec.message());
    ec = make_error_code(TransferErrc::kSourceUnavailable);
    return nullptr;
  }
  if (size == 0) {
    LOG_WARN("Source {} is empty, refusing zero-length transfer", file_reference);
    ec = make_error_code(TransferErrc::kEmpty);
    return nullptr;
  }

  const std::uint64_t packets = (size + fragment_size - 1) / fragment_size;
  if (packets > kMaxFragments) {
    LOG_WARN("Source {} needs {} fragments, limit is {}", file_reference, packets, kMaxFragments);
    ec = make_error_code(TransferErrc::kResourceExhausted);
    return nullptr;
  }

  auto hash = digest_file(file_reference, ec);
  if (!hash) {
    LOG_WARN("Cannot hash source {}: {}", file_reference, ec.message());
    return nullptr;
  }

  std::unique_ptr<Transaction> trans(new Transaction(tid, Direction::kTx, file_reference,
                                                     fragment_size,
                                                     static_cast<std::uint32_t>(packets),
                                                     created_at));
  trans->source_.open(file_reference, std::ios::binary);
  if (!trans->source_) {
    ec = make_error_code(TransferErrc::kSourceUnavailable);
    return nullptr;
  }
  trans->file_size_ = size;
  trans->expected_hash_ = *hash;
  for (std::uint32_t i = 0; i < trans->num_packets_; ++i) {
    trans->missing_.insert(trans->missing_.end(), i);
  }

  LOG_DEBUG("Opened TX source {} ({} bytes, {} fragments of {}, digest {})", file_reference, size,
            packets, fragment_size, to_hex(trans->expected_hash_));
  return trans;
}

std::unique_ptr<Transaction> Transaction::open_receiver(TransactionId tid,
                                                        const Digest& expected_hash,
                                                        std::uint32_t num_packets,
                                                        std::size_t fragment_size,
                                                        ReceiverOptions options,
                                                        std::error_code& ec, TimePoint created_at) {
  if (!valid_fragment_size(fragment_size)) {
    LOG_ERROR("Invalid fragment size {} for RX transaction {}", fragment_size, tid);
    ec = make_error_code(TransferErrc::kInvalidArgument);
    return nullptr;
  }
  if (num_packets == 0 || num_packets > kMaxFragments) {
    LOG_WARN("Rejecting RX transaction {} with {} fragments", tid, num_packets);
    ec = make_error_code(TransferErrc::kInvalidArgument);
    return nullptr;
  }
  if (options.file_size) {
    const std::uint64_t size = *options.file_size;
    const std::uint64_t full = static_cast<std::uint64_t>(fragment_size) * (num_packets - 1);
    if (size <= full || size > full + fragment_size) {
      LOG_WARN("File size {} is inconsistent with {} fragments of {}", size, num_packets,
               fragment_size);
      ec = make_error_code(TransferErrc::kInvalidArgument);
      return nullptr;
    }
  }

  std::unique_ptr<Transaction> trans(new Transaction(tid, Direction::kRx,
                                                     std::move(options.destination), fragment_size,
                                                     num_packets, created_at));
  trans->file_size_ = options.file_size;
  trans->expected_hash_ = expected_hash;
  trans->buffer_.resize(static_cast<std::size_t>(num_packets) * fragment_size);
  trans->received_.assign(num_packets, false);
  for (std::uint32_t i = 0; i < num_packets; ++i) {
    trans->missing_.insert(trans->missing_.end(), i);
  }
  return trans;
}

std::optional<std::size_t> Transaction::expected_length(FragmentIndex index) const {
  if (index >= num_packets_) {
    return std::nullopt;
  }
  if (index + 1 < num_packets_) {
    return fragment_size_;
  }
  if (file_size_) {
    return static_cast<std::size_t>(*file_size_ - static_cast<std::uint64_t>(fragment_size_) *
                                                      (num_packets_ - 1));
  }
  if (last_length_ != 0) {
    return last_length_;
  }
  return std::nullopt;
}

std::error_code Transaction::check_direction(Direction required) const {
  if (direction_ != required) {
    LOG_WARN("Operation needs a {} transaction, tid {} is {}", to_string(required), tid_,
             to_string(direction_));
    return make_error_code(TransferErrc::kInvalidArgument);
  }
  if (state_ == TransactionState::kAborted) {
    return make_error_code(TransferErrc::kTransactionClosed);
  }
  return {};
}

void Transaction::mark_active() {
  if (state_ == TransactionState::kCreated) {
    state_ = TransactionState::kActive;
    LOG_INFO("{} transaction {} is now ACTIVE", to_string(direction_), tid_);
  }
}

void Transaction::complete_if_drained() {
  // An RX transaction completes only through try_finalize().
  if (direction_ == Direction::kTx && missing_.empty() && !is_terminal()) {
    state_ = TransactionState::kComplete;
    LOG_INFO("TX transaction {} COMPLETE, peer holds all {} fragments", tid_, num_packets_);
  }
}

void Transaction::restore_unreceived() {
  if (direction_ != Direction::kRx) {
    return;
  }
  for (std::size_t i = 0; i < received_.size(); ++i) {
    if (!received_[i] && missing_.insert(static_cast<FragmentIndex>(i)).second) {
      LOG_WARN("RX transaction {}: peer claims fragment {} held, but it was never stored", tid_,
               i);
    }
  }
}

std::optional<FragmentPayload> Transaction::read_fragment(FragmentIndex index,
                                                          std::error_code& ec) {
  const auto length = expected_length(index);
  if (!length) {
    ec = make_error_code(TransferErrc::kUnknownFragment);
    return std::nullopt;
  }

  FragmentPayload fragment;
  fragment.index = index;
  fragment.data.resize(*length);

  source_.clear();
  source_.seekg(static_cast<std::streamoff>(static_cast<std::uint64_t>(index) * fragment_size_));
  source_.read(reinterpret_cast<char*>(fragment.data.data()),
               static_cast<std::streamsize>(fragment.data.size()));
  if (source_.gcount() != static_cast<std::streamsize>(fragment.data.size())) {
    LOG_ERROR("Short read of fragment {} from {} (tid {})", index, file_reference_, tid_);
    ec = make_error_code(TransferErrc::kIoError);
    return std::nullopt;
  }
  LOG_TRACE("Read fragment {} ({} bytes) for TX transaction {}", index, fragment.data.size(), tid_);
  return fragment;
}

FragmentSequence Transaction::generate_all_fragments(std::error_code& ec) {
  return generate_n_fragments(missing_.size(), ec);
}

FragmentSequence Transaction::generate_n_fragments(std::size_t n, std::error_code& ec) {
  if (auto err = check_direction(Direction::kTx)) {
    ec = err;
    return {};
  }

  std::vector<FragmentIndex> indices;
  indices.reserve(std::min(n, missing_.size()));
  for (auto it = missing_.begin(); it != missing_.end() && indices.size() < n; ++it) {
    indices.push_back(*it);
  }
  if (!indices.empty()) {
    mark_active();
  }
  LOG_DEBUG("TX transaction {} generating {} of {} missing fragments", tid_, indices.size(),
            missing_.size());
  return FragmentSequence(this, std::move(indices));
}

std::optional<FragmentPayload> Transaction::generate_fragment(FragmentIndex index,
                                                              std::error_code& ec) {
  if (auto err = check_direction(Direction::kTx)) {
    ec = err;
    return std::nullopt;
  }
  if (index >= num_packets_ || missing_.count(index) == 0) {
    LOG_WARN("TX transaction {}: fragment {} is not pending", tid_, index);
    ec = make_error_code(TransferErrc::kUnknownFragment);
    return std::nullopt;
  }
  auto fragment = read_fragment(index, ec);
  if (fragment) {
    mark_active();
  }
  return fragment;
}

std::error_code Transaction::ingest_fragment(FragmentIndex index,
                                             std::span<const std::uint8_t> payload) {
  if (auto err = check_direction(Direction::kRx)) {
    return err;
  }
  if (index >= num_packets_) {
    LOG_WARN("RX transaction {}: fragment {} out of range (num_packets {})", tid_, index,
             num_packets_);
    return make_error_code(TransferErrc::kUnknownFragment);
  }

  const auto expected = expected_length(index);
  const bool length_ok = expected ? payload.size() == *expected
                                  : !payload.empty() && payload.size() <= fragment_size_;
  if (!length_ok) {
    LOG_WARN("RX transaction {}: fragment {} has {} bytes, expected {}", tid_, index,
             payload.size(), expected ? *expected : fragment_size_);
    return make_error_code(TransferErrc::kLengthMismatch);
  }

  const auto offset = static_cast<std::size_t>(index) * fragment_size_;
  auto slot = buffer_.begin() + static_cast<std::ptrdiff_t>(offset);
  if (received_[index]) {
    const bool same = std::equal(payload.begin(), payload.end(), slot);
    if (same || state_ == TransactionState::kComplete) {
      LOG_DEBUG("RX transaction {}: duplicate fragment {}", tid_, index);
      missing_.erase(index);
      return {};
    }
    LOG_WARN("RX transaction {}: fragment {} received again with different content, overwriting",
             tid_, index);
  }

  std::copy(payload.begin(), payload.end(), slot);
  received_[index] = true;
  if (index + 1 == num_packets_) {
    last_length_ = payload.size();
  }
  missing_.erase(index);
  mark_active();
  LOG_DEBUG("RX transaction {}: stored fragment {} ({} bytes), {} missing", tid_, index,
            payload.size(), missing_.size());
  return {};
}

std::size_t Transaction::assembled_length() const {
  if (file_size_) {
    return static_cast<std::size_t>(*file_size_);
  }
  const std::size_t last = last_length_ != 0 ? last_length_ : fragment_size_;
  return fragment_size_ * (num_packets_ - 1) + last;
}

std::error_code Transaction::try_finalize() {
  if (direction_ != Direction::kRx) {
    return make_error_code(TransferErrc::kInvalidArgument);
  }
  if (state_ == TransactionState::kComplete) {
    return {};
  }
  if (state_ == TransactionState::kAborted) {
    return make_error_code(TransferErrc::kTransactionClosed);
  }
  const bool all_stored = std::all_of(received_.begin(), received_.end(), [](bool b) { return b; });
  if (!missing_.empty() || !all_stored) {
    LOG_DEBUG("RX transaction {} not ready, {} fragments missing", tid_, missing_.size());
    return make_error_code(TransferErrc::kIncomplete);
  }

  assembled_length_ = assembled_length();
  const auto data = assembled_data();
  const Digest computed = compute_digest(data);

  if (!file_reference_.empty()) {
    std::ofstream out(file_reference_, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
      LOG_ERROR("RX transaction {}: failed to write {}", tid_, file_reference_);
      return make_error_code(TransferErrc::kIoError);
    }
  }

  if (computed != expected_hash_) {
    state_ = TransactionState::kAborted;
    LOG_ERROR("RX transaction {} integrity check FAILED: expected {}, got {}", tid_,
              to_hex(expected_hash_), to_hex(computed));
    return make_error_code(TransferErrc::kIntegrityFailure);
  }

  state_ = TransactionState::kComplete;
  LOG_INFO("RX transaction {} COMPLETE: {} bytes verified ({})", tid_, data.size(),
           to_hex(computed));
  return {};
}

std::error_code Transaction::apply_missing_update(std::uint32_t seq_offset, std::uint16_t msb,
                                                  std::uint16_t lsb) {
  if (state_ == TransactionState::kAborted) {
    return make_error_code(TransferErrc::kTransactionClosed);
  }
  if (seq_offset >= num_packets_) {
    LOG_WARN("{} transaction {}: update window offset {} beyond {} fragments",
             to_string(direction_), tid_, seq_offset, num_packets_);
    return make_error_code(TransferErrc::kInvalidArgument);
  }
  if (state_ == TransactionState::kComplete) {
    LOG_DEBUG("{} transaction {} already complete, ignoring update at {}", to_string(direction_),
              tid_, seq_offset);
    return {};
  }

  const auto changed = apply_update(missing_, num_packets_, seq_offset, msb, lsb);
  restore_unreceived();
  LOG_DEBUG("{} transaction {}: window {} ({:04x}{:04x}) changed {}, {} missing",
            to_string(direction_), tid_, seq_offset, msb, lsb, changed, missing_.size());
  complete_if_drained();
  return {};
}

std::error_code Transaction::acknowledge_fragments(std::span<const FragmentIndex> held) {
  if (state_ == TransactionState::kAborted) {
    return make_error_code(TransferErrc::kTransactionClosed);
  }
  const bool in_range = std::all_of(held.begin(), held.end(),
                                    [this](FragmentIndex i) { return i < num_packets_; });
  if (!in_range) {
    return make_error_code(TransferErrc::kInvalidArgument);
  }
  for (const auto index : held) {
    missing_.erase(index);
  }
  restore_unreceived();
  complete_if_drained();
  return {};
}

std::error_code Transaction::replace_missing(MissingSet missing) {
  if (state_ == TransactionState::kAborted) {
    return make_error_code(TransferErrc::kTransactionClosed);
  }
  if (!missing.empty() && *missing.rbegin() >= num_packets_) {
    return make_error_code(TransferErrc::kInvalidArgument);
  }
  missing_ = std::move(missing);
  restore_unreceived();
  complete_if_drained();
  return {};
}

std::vector<BitmapWindow> Transaction::describe_missing() const {
  return encode_missing_set(missing_, num_packets_);
}

void Transaction::abort() {
  if (is_terminal()) {
    return;
  }
  state_ = TransactionState::kAborted;
  LOG_INFO("{} transaction {} ABORTED", to_string(direction_), tid_);
}

std::vector<FragmentIndex> Transaction::received_indices() const {
  std::vector<FragmentIndex> indices;
  for (std::size_t i = 0; i < received_.size(); ++i) {
    if (received_[i]) {
      indices.push_back(static_cast<FragmentIndex>(i));
    }
  }
  return indices;
}

std::span<const std::uint8_t> Transaction::received_fragment(FragmentIndex index) const {
  if (index >= received_.size() || !received_[index]) {
    return {};
  }
  const auto length = index + 1 == num_packets_ ? last_length_ : fragment_size_;
  return std::span<const std::uint8_t>(buffer_).subspan(
      static_cast<std::size_t>(index) * fragment_size_, length);
}

std::span<const std::uint8_t> Transaction::assembled_data() const {
  return std::span<const std::uint8_t>(buffer_).first(assembled_length_);
}

}  // namespace splat::transfer
