#pragma once
#include <cstddef>
#include <cstdint>

/////////////
// Currency id space
/////////////
constexpr uint32_t RESERVED_OFFSET = 0x2000'0000; // native token ids are below, registered ERC20 ids are at or above this value
constexpr uint32_t MAX_ERC20_SEQUENCE = UINT32_MAX - RESERVED_OFFSET; // last registration sequence number that still yields a valid id
constexpr size_t MAX_ERC20_ENTRIES = size_t(MAX_ERC20_SEQUENCE) + 1;

/////////////
// Slot layout (32 bytes, big endian fields)
/////////////
constexpr size_t SLOT_SIZE = 32;
constexpr size_t SLOT_DISCRIMINANT = 11; // 0 = single currency, 1 = dex share
constexpr size_t SLOT_PAYLOAD = 12; // payload occupies the remaining 20 bytes

/////////////
// Address layout
/////////////
constexpr size_t EVM_ADDRESS_SIZE = 20;
constexpr uint8_t PLACEHOLDER_MARKER = 0x20; // first byte of addresses reconstructed from dex share legs
