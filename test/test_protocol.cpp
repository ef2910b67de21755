#include <unity.h>

#include <string.h>

#include "SdProtocol.h"

using namespace SdGate::internal;

void test_command_frame_crc_matches_known_frames() {
  uint8_t frame[6];

  buildCommandFrame(CMD0, 0, frame);
  TEST_ASSERT_EQUAL_HEX8(0x40, frame[0]);
  TEST_ASSERT_EQUAL_HEX8(0x95, frame[5]);

  buildCommandFrame(CMD8, IF_COND_ARG, frame);
  TEST_ASSERT_EQUAL_HEX8(0x48, frame[0]);
  TEST_ASSERT_EQUAL_HEX8(0x01, frame[3]);
  TEST_ASSERT_EQUAL_HEX8(0xAA, frame[4]);
  TEST_ASSERT_EQUAL_HEX8(0x87, frame[5]);

  buildCommandFrame(CMD55, 0, frame);
  TEST_ASSERT_EQUAL_HEX8(0x65, frame[5]);

  buildCommandFrame(ACMD41, ACMD41_HCS, frame);
  TEST_ASSERT_EQUAL_HEX8(0x69, frame[0]);
  TEST_ASSERT_EQUAL_HEX8(0x40, frame[1]);
  TEST_ASSERT_EQUAL_HEX8(0x77, frame[5]);

  buildCommandFrame(CMD17, 0, frame);
  TEST_ASSERT_EQUAL_HEX8(0x55, frame[5]);
}

void test_command_frame_argument_is_big_endian() {
  uint8_t frame[6];
  buildCommandFrame(CMD17, 0x00012345, frame);
  TEST_ASSERT_EQUAL_HEX8(0x51, frame[0]);
  TEST_ASSERT_EQUAL_HEX8(0x00, frame[1]);
  TEST_ASSERT_EQUAL_HEX8(0x01, frame[2]);
  TEST_ASSERT_EQUAL_HEX8(0x23, frame[3]);
  TEST_ASSERT_EQUAL_HEX8(0x45, frame[4]);
  TEST_ASSERT_EQUAL_HEX8(0x01, frame[5] & 0x01);
}

void test_r1_detection() {
  TEST_ASSERT_TRUE(isR1(0x00));
  TEST_ASSERT_TRUE(isR1(0x01));
  TEST_ASSERT_TRUE(isR1(0x05));
  TEST_ASSERT_FALSE(isR1(0xFF));
  TEST_ASSERT_FALSE(isR1(0x80));
}

void test_csd_v2_block_count() {
  uint8_t csd[16] = {};
  csd[0] = 0x40;
  // C_SIZE = 15193 (a card sold as 8 GB)
  csd[7] = 0x00;
  csd[8] = 0x3B;
  csd[9] = 0x59;
  TEST_ASSERT_EQUAL_UINT32(15558656UL, csdBlockCount(csd));
}

void test_csd_v1_block_count() {
  uint8_t csd[16] = {};
  csd[0] = 0x00;
  csd[5] = 0x09;  // READ_BL_LEN = 9
  // C_SIZE = 3839, C_SIZE_MULT = 7
  csd[6] = 0x03;
  csd[7] = 0xBF;
  csd[8] = 0xC0;
  csd[9] = 0x03;
  csd[10] = 0x80;
  TEST_ASSERT_EQUAL_UINT32(3840UL * 512UL, csdBlockCount(csd));
}

void test_csd_unknown_structure_is_rejected() {
  uint8_t csd[16] = {};
  csd[0] = 0x80;
  TEST_ASSERT_EQUAL_UINT32(0, csdBlockCount(csd));
}

void test_mbr_signature_and_partition_class() {
  uint8_t block[512];
  memset(block, 0, sizeof(block));
  TEST_ASSERT_FALSE(mbrSignatureValid(block));

  block[510] = 0x55;
  block[511] = 0xAA;
  TEST_ASSERT_TRUE(mbrSignatureValid(block));

  block[511] = 0x55;
  TEST_ASSERT_FALSE(mbrSignatureValid(block));

  TEST_ASSERT_EQUAL_UINT32(450, MBR_PARTITION_TYPE_OFFSET);
  TEST_ASSERT_EQUAL_INT(static_cast<int>(SdGate::PartitionType::Fat32),
                        static_cast<int>(classifyPartition(0x0B)));
  TEST_ASSERT_EQUAL_INT(static_cast<int>(SdGate::PartitionType::Fat32Lba),
                        static_cast<int>(classifyPartition(0x0C)));
  TEST_ASSERT_EQUAL_INT(static_cast<int>(SdGate::PartitionType::Unknown),
                        static_cast<int>(classifyPartition(0x07)));
}
