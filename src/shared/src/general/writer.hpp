#pragma once

#include "general/byte_order.hpp"
#include <array>
#include <cassert>
#include <cstdint>
#include <cstring>
#include <span>

class Writer {
public:
    Writer(uint8_t* pos, size_t n)
        : pos(pos)
        , end(pos + n)
    {
    }
    Writer(std::span<uint8_t> s)
        : Writer(s.data(), s.size())
    {
    }
    ~Writer() { assert(pos <= end); }

    void write(const std::span<const uint8_t>& s)
    {
        assert(remaining() >= s.size());
        memcpy(pos, s.data(), s.size());
        pos += s.size();
    }

    Writer& operator<<(uint8_t v)
    {
        assert(remaining() >= 1);
        *(pos++) = v;
        return *this;
    }
    Writer& operator<<(uint32_t v)
    {
        assert(remaining() >= 4);
        writeuint32(pos, v);
        pos += 4;
        return *this;
    }
    template <size_t N>
    Writer& operator<<(const std::array<uint8_t, N>& a)
    {
        write(a);
        return *this;
    }

    // writes zero bytes
    Writer& zeros(size_t n)
    {
        assert(remaining() >= n);
        memset(pos, 0, n);
        pos += n;
        return *this;
    }

    size_t remaining()
    {
        assert(end >= pos);
        return end - pos;
    }

private:
    uint8_t* pos;
    uint8_t* const end;
};
