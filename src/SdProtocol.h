/**
 * @file SdProtocol.h
 * @brief SD SPI-mode protocol constants and pure helpers (host-testable).
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "SdGate/Status.h"

namespace SdGate {
namespace internal {

// Commands
static constexpr uint8_t CMD0 = 0;     // GO_IDLE_STATE
static constexpr uint8_t CMD8 = 8;     // SEND_IF_COND
static constexpr uint8_t CMD9 = 9;     // SEND_CSD
static constexpr uint8_t CMD16 = 16;   // SET_BLOCKLEN
static constexpr uint8_t CMD17 = 17;   // READ_SINGLE_BLOCK
static constexpr uint8_t CMD55 = 55;   // APP_CMD
static constexpr uint8_t CMD58 = 58;   // READ_OCR
static constexpr uint8_t ACMD41 = 41;  // SD_SEND_OP_COND

// R1 bits
static constexpr uint8_t R1_READY_STATE = 0x00;
static constexpr uint8_t R1_IDLE_STATE = 0x01;
static constexpr uint8_t R1_ILLEGAL_COMMAND = 0x04;
static constexpr uint8_t R1_NO_RESPONSE = 0xFF;

// Tokens and arguments
static constexpr uint8_t DATA_START_BLOCK = 0xFE;
static constexpr uint8_t IDLE_BYTE = 0xFF;
static constexpr uint32_t IF_COND_ARG = 0x000001AA;
static constexpr uint8_t IF_COND_ECHO = 0xAA;
static constexpr uint32_t ACMD41_HCS = 0x40000000;
static constexpr uint32_t OCR_CCS = 0x40000000;

// Wake-up clocks sent with chip-select high (>= 74 clocks).
static constexpr uint8_t WAKE_CLOCK_BYTES = 10;

// MBR layout
static constexpr size_t MBR_PARTITION_TYPE_OFFSET = 0x1BE + 4;
static constexpr size_t MBR_SIGNATURE_OFFSET = 510;
static constexpr uint8_t MBR_SIGNATURE_0 = 0x55;
static constexpr uint8_t MBR_SIGNATURE_1 = 0xAA;
static constexpr uint8_t PARTITION_FAT32 = 0x0B;
static constexpr uint8_t PARTITION_FAT32_LBA = 0x0C;

/// @brief CRC7 over a command frame prefix.
/// @return 7-bit CRC (not shifted, no end bit).
inline uint8_t crc7(const uint8_t* data, size_t len) {
  uint8_t crc = 0;
  for (size_t i = 0; i < len; ++i) {
    uint8_t d = data[i];
    for (uint8_t bit = 0; bit < 8; ++bit) {
      crc = static_cast<uint8_t>(crc << 1);
      if ((d & 0x80) ^ (crc & 0x80)) {
        crc ^= 0x09;
      }
      d = static_cast<uint8_t>(d << 1);
    }
  }
  return static_cast<uint8_t>(crc & 0x7F);
}

/// @brief Build the 6-byte command frame (start bits, argument, CRC7, end bit).
inline void buildCommandFrame(uint8_t cmd, uint32_t arg, uint8_t* frame) {
  frame[0] = static_cast<uint8_t>(0x40 | (cmd & 0x3F));
  frame[1] = static_cast<uint8_t>(arg >> 24);
  frame[2] = static_cast<uint8_t>(arg >> 16);
  frame[3] = static_cast<uint8_t>(arg >> 8);
  frame[4] = static_cast<uint8_t>(arg);
  frame[5] = static_cast<uint8_t>((crc7(frame, 5) << 1) | 0x01);
}

/// @brief True if a response byte is a complete R1 (bit 7 clear).
inline bool isR1(uint8_t value) {
  return (value & 0x80) == 0;
}

/// @brief Block count from a CSD register.
/// @return Block count, or 0 for an unknown CSD structure.
inline uint32_t csdBlockCount(const uint8_t* csd) {
  const uint8_t structure = static_cast<uint8_t>(csd[0] >> 6);
  if (structure == 0) {
    const uint8_t readBlLen = static_cast<uint8_t>(csd[5] & 0x0F);
    const uint32_t cSize = (static_cast<uint32_t>(csd[6] & 0x03) << 10) |
                           (static_cast<uint32_t>(csd[7]) << 2) |
                           (static_cast<uint32_t>(csd[8]) >> 6);
    const uint8_t cSizeMult =
        static_cast<uint8_t>(((csd[9] & 0x03) << 1) | (csd[10] >> 7));
    const int shift = static_cast<int>(cSizeMult) + static_cast<int>(readBlLen) - 7;
    if (shift < 0) {
      return 0;
    }
    return (cSize + 1U) << shift;
  }
  if (structure == 1) {
    const uint32_t cSize = (static_cast<uint32_t>(csd[7] & 0x3F) << 16) |
                           (static_cast<uint32_t>(csd[8]) << 8) |
                           static_cast<uint32_t>(csd[9]);
    return (cSize + 1U) << 10;
  }
  return 0;
}

/// @brief True if the block carries the 0x55 0xAA boot signature.
inline bool mbrSignatureValid(const uint8_t* block) {
  return block[MBR_SIGNATURE_OFFSET] == MBR_SIGNATURE_0 &&
         block[MBR_SIGNATURE_OFFSET + 1] == MBR_SIGNATURE_1;
}

/// @brief Map the first partition type byte to a mount-relevant class.
inline PartitionType classifyPartition(uint8_t typeByte) {
  switch (typeByte) {
    case PARTITION_FAT32:
      return PartitionType::Fat32;
    case PARTITION_FAT32_LBA:
      return PartitionType::Fat32Lba;
    default:
      return PartitionType::Unknown;
  }
}

}  // namespace internal
}  // namespace SdGate
