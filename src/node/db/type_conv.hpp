#pragma once

#include "crypto/evm_address.hpp"
#include "db/sqlite_fwd.hpp"
#include <cstring>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>

namespace sqlite {
class ColumnConverter {
    const Column& c;

    template <size_t size>
    std::array<uint8_t, size> get_array() const
    {
        std::array<uint8_t, size> res;
        if (c.getBytes() != size)
            throw std::runtime_error(
                "Database corrupted, cannot load " + std::to_string(size) + " bytes");
        memcpy(res.data(), c.getBlob(), size);
        return res;
    }

public:
    int64_t getInt64() const noexcept { return c.getInt64(); }
    uint64_t getUInt64() const
    {
        auto i { getInt64() };
        if (i < 0) {
            throw std::runtime_error("Database might be corrupted. Expected non-negative value.");
        }
        return i;
    }

    uint32_t getUInt32() const
    {
        auto i { getUInt64() };
        if (i > std::numeric_limits<uint32_t>::max())
            throw std::runtime_error("Database might be corrupted. Value overflows uint32_t.");
        return i;
    }
    ColumnConverter(const Column& c)
        : c(c)
    {
    }

    operator EvmAddress() const { return get_array<EVM_ADDRESS_SIZE>(); }
    operator int64_t() const { return getInt64(); }
    operator uint32_t() const { return getUInt32(); }
    operator uint8_t() const
    {
        auto i { getUInt64() };
        if (i > std::numeric_limits<uint8_t>::max())
            throw std::runtime_error("Database might be corrupted. Value overflows uint8_t.");
        return i;
    }
    operator std::string() const { return c.getString(); }
};

namespace bind_convert {
    template <size_t N>
    inline auto convert(const std::array<uint8_t, N>& v) { return std::span<const uint8_t>(v); }
    inline auto convert(const EvmAddress& a) { return std::span<const uint8_t>(a.data(), a.size()); }
    inline auto convert(int64_t i) { return i; }
    inline auto convert(uint32_t i) { return (int64_t)i; }
    inline auto convert(uint8_t i) { return (int64_t)i; }
    inline const auto& convert(const std::string& s) { return s; }
}
}
