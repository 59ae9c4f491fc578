#include "command/command_dispatcher.h"

#include <filesystem>
#include <limits>
#include <utility>

#include "common/logging/logger.h"
#include "transfer/transfer_error.h"

namespace splat::command {

using transfer::Direction;
using transfer::TransferErrc;

CommandDispatcher::CommandDispatcher(transfer::TransactionManager& manager,
                                     DispatcherConfig config, CompletionCallback on_complete)
    : manager_(manager), config_(std::move(config)), on_complete_(std::move(on_complete)) {}

std::error_code CommandDispatcher::dispatch(const TransferMessage& message) {
  LOG_DEBUG("Dispatching {} (tid {})", to_string(message.kind), tid_of(message));

  std::error_code ec;
  switch (message.kind) {
    case MessageKind::kCreateTrans:
      ec = handle_create(message.create);
      break;
    case MessageKind::kInitTrans:
      ec = handle_init(message.init);
      break;
    case MessageKind::kTransPayload:
      ec = handle_payload(message.payload);
      break;
    case MessageKind::kGenerateAllPackets:
      ec = handle_generate(message.generate_all.tid, std::numeric_limits<std::size_t>::max());
      break;
    case MessageKind::kGenerateXPackets:
      ec = handle_generate(message.generate_x.tid, message.generate_x.x);
      break;
    case MessageKind::kGetSinglePacket:
      ec = handle_single(message.get_single);
      break;
    case MessageKind::kUpdateMissingFragments:
      ec = handle_update(message.update);
      break;
    default:
      ec = transfer::make_error_code(TransferErrc::kInvalidArgument);
      break;
  }

  stats_.messages_handled++;
  if (ec) {
    stats_.messages_rejected++;
    LOG_WARN("{} for tid {} rejected: {} ({})", to_string(message.kind), tid_of(message),
             ec.message(), transfer::to_string(transfer::classify(ec)));
  }
  return ec;
}

std::error_code CommandDispatcher::handle_create(const CreateTrans& create) {
  std::error_code ec;
  const auto tid = manager_.create_sender(create.file_reference, ec);
  if (!tid) {
    return ec;
  }
  const auto* trans = manager_.get(Direction::kTx, *tid, ec);
  if (trans == nullptr) {
    return ec;
  }
  send(make_init_trans(*tid, static_cast<std::uint16_t>(trans->num_packets()),
                       trans->digest_words()));
  return {};
}

std::string CommandDispatcher::destination_for(TransactionId tid) const {
  if (config_.download_directory.empty()) {
    return {};
  }
  // INIT_TRANS does not echo the requested name, so it is only trusted when a
  // single request is outstanding.
  std::string name = "rx_tid" + std::to_string(tid) + ".bin";
  if (pending_requests_.size() == 1) {
    const auto requested = std::filesystem::path(pending_requests_.front()).filename();
    if (!requested.empty()) {
      name = requested.string();
    }
  } else if (pending_requests_.size() > 1) {
    LOG_WARN("{} requests outstanding, naming tid {} {}", pending_requests_.size(), tid, name);
  }
  return (std::filesystem::path(config_.download_directory) / name).string();
}

std::error_code CommandDispatcher::handle_init(const InitTrans& init) {
  transfer::ReceiverOptions options;
  options.destination = destination_for(init.tid);
  if (!options.destination.empty()) {
    std::error_code fs_ec;
    std::filesystem::create_directories(config_.download_directory, fs_ec);
    if (fs_ec) {
      LOG_ERROR("Cannot create download directory {}: {}", config_.download_directory,
                fs_ec.message());
      return fs_ec;
    }
  }

  std::error_code ec;
  const auto tid = manager_.create_receiver(init.tid, transfer::join_digest(init.hash),
                                            init.num_packets, ec, std::move(options));
  if (!tid) {
    return ec;
  }
  // Outstanding names are ambiguous once an INIT_TRANS has been matched.
  pending_requests_.clear();
  return {};
}

std::error_code CommandDispatcher::handle_payload(const TransPayload& payload) {
  std::error_code ec;
  auto* trans = manager_.get(Direction::kRx, payload.tid, ec);
  if (trans == nullptr) {
    return ec;
  }

  ec = trans->ingest_fragment(payload.seq_number, payload.fragment_data);
  if (ec) {
    return ec;
  }
  stats_.fragments_ingested++;

  if (trans->missing_count() != 0 || trans->is_terminal()) {
    return {};
  }

  FinalizeOutcome outcome;
  outcome.tid = payload.tid;
  outcome.destination = trans->file_reference();
  outcome.status = trans->try_finalize();
  if (outcome.status == transfer::make_error_code(TransferErrc::kIntegrityFailure)) {
    stats_.transfers_failed++;
  } else if (!outcome.status) {
    stats_.transfers_completed++;
  }
  if (on_complete_) {
    on_complete_(outcome);
  }
  return outcome.status;
}

std::error_code CommandDispatcher::check_outbound_capacity(TransactionId tid) const {
  if (config_.max_outbound_bytes != 0 && outbound_bytes_ >= config_.max_outbound_bytes) {
    LOG_WARN("Outbound queue holds {} bytes, refusing to generate for tid {}", outbound_bytes_,
             tid);
    return transfer::make_error_code(TransferErrc::kResourceExhausted);
  }
  return {};
}

std::error_code CommandDispatcher::handle_generate(TransactionId tid, std::size_t limit) {
  std::error_code ec;
  auto* trans = manager_.get(Direction::kTx, tid, ec);
  if (trans == nullptr) {
    return ec;
  }
  if (auto err = check_outbound_capacity(tid)) {
    return err;
  }

  auto fragments = trans->generate_n_fragments(limit, ec);
  if (ec) {
    return ec;
  }
  while (auto fragment = fragments.next(ec)) {
    send(make_trans_payload(tid, static_cast<std::uint16_t>(fragment->index),
                            std::move(fragment->data)));
    stats_.fragments_queued++;
  }
  return ec;
}

std::error_code CommandDispatcher::handle_single(const GetSinglePacket& request) {
  std::error_code ec;
  auto* trans = manager_.get(Direction::kTx, request.tid, ec);
  if (trans == nullptr) {
    return ec;
  }
  if (auto err = check_outbound_capacity(request.tid)) {
    return err;
  }

  auto fragment = trans->generate_fragment(request.seq_number, ec);
  if (!fragment) {
    return ec;
  }
  send(make_trans_payload(request.tid, request.seq_number, std::move(fragment->data)));
  stats_.fragments_queued++;
  return {};
}

std::error_code CommandDispatcher::handle_update(const UpdateMissingFragments& update) {
  std::error_code ec;
  auto* trans = manager_.get(Direction::kTx, update.tid, ec);
  if (trans == nullptr) {
    return ec;
  }
  return trans->apply_missing_update(update.seq_offset, update.msb, update.lsb);
}

void CommandDispatcher::request_file(const std::string& file_reference) {
  pending_requests_.push_back(file_reference);
  send(make_create_trans(file_reference));
}

std::error_code CommandDispatcher::report_missing(TransactionId tid) {
  std::error_code ec;
  const auto* trans = manager_.get(Direction::kRx, tid, ec);
  if (trans == nullptr) {
    return ec;
  }
  for (const auto& window : trans->describe_missing()) {
    send(make_update_missing_fragments(tid, static_cast<std::uint16_t>(window.seq_offset),
                                       window.msb, window.lsb));
  }
  return {};
}

void CommandDispatcher::send(TransferMessage message) {
  outbound_bytes_ += payload_bytes(message);
  outbound_.push_back(std::move(message));
}

std::vector<TransferMessage> CommandDispatcher::drain_outbound() {
  std::vector<TransferMessage> drained(std::make_move_iterator(outbound_.begin()),
                                       std::make_move_iterator(outbound_.end()));
  outbound_.clear();
  outbound_bytes_ = 0;
  return drained;
}

}  // namespace splat::command
