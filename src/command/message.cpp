#include "command/message.h"

#include <utility>

namespace splat::command {

const char* to_string(MessageKind kind) {
  switch (kind) {
    case MessageKind::kCreateTrans:
      return "CREATE_TRANS";
    case MessageKind::kInitTrans:
      return "INIT_TRANS";
    case MessageKind::kTransPayload:
      return "TRANS_PAYLOAD";
    case MessageKind::kGenerateAllPackets:
      return "GENERATE_ALL_PACKETS";
    case MessageKind::kGenerateXPackets:
      return "GENERATE_X_PACKETS";
    case MessageKind::kGetSinglePacket:
      return "GET_SINGLE_PACKET";
    case MessageKind::kUpdateMissingFragments:
      return "UPDATE_MISSING_FRAGMENTS";
  }
  return "UNKNOWN";
}

TransactionId tid_of(const TransferMessage& message) {
  switch (message.kind) {
    case MessageKind::kCreateTrans:
      return 0;
    case MessageKind::kInitTrans:
      return message.init.tid;
    case MessageKind::kTransPayload:
      return message.payload.tid;
    case MessageKind::kGenerateAllPackets:
      return message.generate_all.tid;
    case MessageKind::kGenerateXPackets:
      return message.generate_x.tid;
    case MessageKind::kGetSinglePacket:
      return message.get_single.tid;
    case MessageKind::kUpdateMissingFragments:
      return message.update.tid;
  }
  return 0;
}

std::size_t payload_bytes(const TransferMessage& message) {
  return message.kind == MessageKind::kTransPayload ? message.payload.fragment_data.size() : 0;
}

TransferMessage make_create_trans(std::string file_reference) {
  TransferMessage message{};
  message.kind = MessageKind::kCreateTrans;
  message.create.file_reference = std::move(file_reference);
  return message;
}

TransferMessage make_init_trans(TransactionId tid, std::uint16_t num_packets,
                                const transfer::DigestWords& hash) {
  TransferMessage message{};
  message.kind = MessageKind::kInitTrans;
  message.init.tid = tid;
  message.init.num_packets = num_packets;
  message.init.hash = hash;
  return message;
}

TransferMessage make_trans_payload(TransactionId tid, std::uint16_t seq_number,
                                   std::vector<std::uint8_t> fragment_data) {
  TransferMessage message{};
  message.kind = MessageKind::kTransPayload;
  message.payload.tid = tid;
  message.payload.seq_number = seq_number;
  message.payload.fragment_data = std::move(fragment_data);
  return message;
}

TransferMessage make_generate_all_packets(TransactionId tid) {
  TransferMessage message{};
  message.kind = MessageKind::kGenerateAllPackets;
  message.generate_all.tid = tid;
  return message;
}

TransferMessage make_generate_x_packets(TransactionId tid, std::uint16_t x) {
  TransferMessage message{};
  message.kind = MessageKind::kGenerateXPackets;
  message.generate_x.tid = tid;
  message.generate_x.x = x;
  return message;
}

TransferMessage make_get_single_packet(TransactionId tid, std::uint16_t seq_number) {
  TransferMessage message{};
  message.kind = MessageKind::kGetSinglePacket;
  message.get_single.tid = tid;
  message.get_single.seq_number = seq_number;
  return message;
}

TransferMessage make_update_missing_fragments(TransactionId tid, std::uint16_t seq_offset,
                                              std::uint16_t msb, std::uint16_t lsb) {
  TransferMessage message{};
  message.kind = MessageKind::kUpdateMissingFragments;
  message.update.tid = tid;
  message.update.seq_offset = seq_offset;
  message.update.msb = msb;
  message.update.lsb = lsb;
  return message;
}

}  // namespace splat::command
