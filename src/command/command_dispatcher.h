#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <system_error>
#include <vector>

#include "command/message.h"
#include "transfer/transaction_manager.h"

namespace splat::command {

struct DispatcherConfig {
  // Where received files are written. Empty keeps them in memory only.
  std::string download_directory;

  // Payload bytes the outbound queue may hold before GENERATE_* commands are
  // rejected with kResourceExhausted (0 = unlimited).
  std::size_t max_outbound_bytes{0};
};

// Result of finalizing a receiving transaction.
struct FinalizeOutcome {
  TransactionId tid{0};
  std::error_code status;
  std::string destination;
};

struct DispatcherStats {
  std::uint64_t messages_handled{0};
  std::uint64_t messages_rejected{0};
  std::uint64_t fragments_queued{0};
  std::uint64_t fragments_ingested{0};
  std::uint64_t transfers_completed{0};
  std::uint64_t transfers_failed{0};
};

/**
 * Applies decoded transfer messages to a TransactionManager and queues the
 * messages to send back.
 *
 * The same dispatcher type serves both ends of the link: the spacecraft
 * handles CREATE_TRANS, GENERATE_* and UPDATE_MISSING_FRAGMENTS against its TX
 * namespace; the ground station handles INIT_TRANS and TRANS_PAYLOAD against
 * its RX namespace and uses request_file() / report_missing() to drive the
 * transfer.
 *
 * Thread Safety:
 *   Not thread-safe. Messages for one link are dispatched serially.
 */
class CommandDispatcher {
 public:
  using CompletionCallback = std::function<void(const FinalizeOutcome&)>;

  CommandDispatcher(transfer::TransactionManager& manager, DispatcherConfig config = {},
                    CompletionCallback on_complete = {});

  // Handles one inbound message. Responses land in the outbound queue.
  std::error_code dispatch(const TransferMessage& message);

  // Queues CREATE_TRANS. The name is used for the received file when it is the
  // only request outstanding at INIT_TRANS time.
  void request_file(const std::string& file_reference);

  // Queues one UPDATE_MISSING_FRAGMENTS per 32 fragments of an RX transaction.
  std::error_code report_missing(TransactionId tid);

  void send(TransferMessage message);

  // Hands every queued message to the caller, oldest first.
  std::vector<TransferMessage> drain_outbound();

  [[nodiscard]] std::size_t outbound_count() const { return outbound_.size(); }
  [[nodiscard]] std::size_t outbound_bytes() const { return outbound_bytes_; }
  [[nodiscard]] std::size_t pending_requests() const { return pending_requests_.size(); }
  [[nodiscard]] const DispatcherStats& stats() const { return stats_; }

 private:
  std::error_code handle_create(const CreateTrans& create);
  std::error_code handle_init(const InitTrans& init);
  std::error_code handle_payload(const TransPayload& payload);
  std::error_code handle_generate(TransactionId tid, std::size_t limit);
  std::error_code handle_single(const GetSinglePacket& request);
  std::error_code handle_update(const UpdateMissingFragments& update);

  std::error_code check_outbound_capacity(TransactionId tid) const;
  std::string destination_for(TransactionId tid) const;

  transfer::TransactionManager& manager_;
  DispatcherConfig config_;
  CompletionCallback on_complete_;

  std::deque<TransferMessage> outbound_;
  std::size_t outbound_bytes_{0};

  // Names requested with CREATE_TRANS since the last accepted INIT_TRANS.
  std::deque<std::string> pending_requests_;

  DispatcherStats stats_;
};

}  // namespace splat::command
