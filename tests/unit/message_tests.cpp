#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "command/message.h"

namespace splat::tests {

using command::MessageKind;

TEST(MessageTests, BuildersSetKindAndFields) {
  const auto generate = command::make_generate_x_packets(9, 16);
  EXPECT_EQ(generate.kind, MessageKind::kGenerateXPackets);
  EXPECT_EQ(generate.generate_x.tid, 9);
  EXPECT_EQ(generate.generate_x.x, 16);

  const auto update = command::make_update_missing_fragments(3, 64, 0x4028, 0x0001);
  EXPECT_EQ(update.kind, MessageKind::kUpdateMissingFragments);
  EXPECT_EQ(update.update.seq_offset, 64);
  EXPECT_EQ(update.update.msb, 0x4028);
  EXPECT_EQ(update.update.lsb, 0x0001);

  transfer::DigestWords words{1, 2, 3};
  const auto init = command::make_init_trans(4, 12, words);
  EXPECT_EQ(init.init.num_packets, 12);
  EXPECT_EQ(init.init.hash.mid, 2U);
}

TEST(MessageTests, TidOfFollowsKind) {
  EXPECT_EQ(command::tid_of(command::make_create_trans("a.txt")), 0);
  EXPECT_EQ(command::tid_of(command::make_generate_all_packets(17)), 17);
  EXPECT_EQ(command::tid_of(command::make_get_single_packet(200, 5)), 200);
  EXPECT_EQ(command::tid_of(command::make_trans_payload(8, 1, {1, 2})), 8);
}

TEST(MessageTests, OnlyPayloadsCarryFileBytes) {
  EXPECT_EQ(command::payload_bytes(command::make_trans_payload(1, 0, std::vector<std::uint8_t>(230))),
            230U);
  EXPECT_EQ(command::payload_bytes(command::make_create_trans("big.bin")), 0U);
  EXPECT_EQ(command::payload_bytes(command::make_update_missing_fragments(1, 0, 0, 0)), 0U);
}

TEST(MessageTests, KindNames) {
  EXPECT_STREQ(command::to_string(MessageKind::kCreateTrans), "CREATE_TRANS");
  EXPECT_STREQ(command::to_string(MessageKind::kTransPayload), "TRANS_PAYLOAD");
  EXPECT_STREQ(command::to_string(MessageKind::kUpdateMissingFragments),
               "UPDATE_MISSING_FRAGMENTS");
}

}  // namespace splat::tests
