#pragma once
#include <bit>
#include <climits>
#include <cstdint>
#include <cstring>
static_assert(CHAR_BIT == 8);

constexpr inline uint32_t byte_swap32(uint32_t x)
{
    return (((x & 0xff000000U) >> 24) | ((x & 0x00ff0000U) >> 8) | ((x & 0x0000ff00U) << 8) | ((x & 0x000000ffU) << 24));
}

constexpr inline uint32_t hton32(uint32_t x)
{
    if constexpr (std::endian::native != std::endian::big) {
        return byte_swap32(x);
    }
    return x;
}
constexpr inline uint32_t ntoh32(uint32_t x)
{
    return hton32(x);
}

// big endian write to unaligned memory
inline void writeuint32(uint8_t* pos, uint32_t v)
{
    uint32_t network { hton32(v) };
    memcpy(pos, &network, 4);
}
