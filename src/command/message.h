#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "transfer/file_digest.h"
#include "transfer/transaction.h"

namespace splat::command {

using transfer::TransactionId;

// Ground station asks the spacecraft to open a file for downlink.
struct CreateTrans {
  std::string file_reference;
};

// Spacecraft announces the transaction it opened.
struct InitTrans {
  TransactionId tid{0};
  std::uint16_t num_packets{0};
  transfer::DigestWords hash;
};

struct TransPayload {
  TransactionId tid{0};
  std::uint16_t seq_number{0};
  std::vector<std::uint8_t> fragment_data;
};

struct GenerateAllPackets {
  TransactionId tid{0};
};

struct GenerateXPackets {
  TransactionId tid{0};
  std::uint16_t x{0};
};

struct GetSinglePacket {
  TransactionId tid{0};
  std::uint16_t seq_number{0};
};

// One 32-fragment window of the sender's view of what the receiver holds.
struct UpdateMissingFragments {
  TransactionId tid{0};
  std::uint16_t seq_offset{0};
  std::uint16_t msb{0};
  std::uint16_t lsb{0};
};

enum class MessageKind : std::uint8_t {
  kCreateTrans = 1,
  kInitTrans = 2,
  kTransPayload = 3,
  kGenerateAllPackets = 4,
  kGenerateXPackets = 5,
  kGetSinglePacket = 6,
  kUpdateMissingFragments = 7,
};

// Transfer message as handed over by the codec. Only the member selected by
// kind is meaningful.
struct TransferMessage {
  MessageKind kind{};
  CreateTrans create;
  InitTrans init;
  TransPayload payload;
  GenerateAllPackets generate_all;
  GenerateXPackets generate_x;
  GetSinglePacket get_single;
  UpdateMissingFragments update;
};

const char* to_string(MessageKind kind);

// Tid the message refers to. CREATE_TRANS has none and reports 0.
TransactionId tid_of(const TransferMessage& message);

// Bytes of file data the message carries (TRANS_PAYLOAD only).
std::size_t payload_bytes(const TransferMessage& message);

TransferMessage make_create_trans(std::string file_reference);
TransferMessage make_init_trans(TransactionId tid, std::uint16_t num_packets,
                                const transfer::DigestWords& hash);
TransferMessage make_trans_payload(TransactionId tid, std::uint16_t seq_number,
                                   std::vector<std::uint8_t> fragment_data);
TransferMessage make_generate_all_packets(TransactionId tid);
TransferMessage make_generate_x_packets(TransactionId tid, std::uint16_t x);
TransferMessage make_get_single_packet(TransactionId tid, std::uint16_t seq_number);
TransferMessage make_update_missing_fragments(TransactionId tid, std::uint16_t seq_offset,
                                              std::uint16_t msb, std::uint16_t lsb);

}  // namespace splat::command
