#pragma once

#include "general/byte_order.hpp"
#include "general/errors.hpp"
#include <algorithm>
#include <cstring>
#include <span>

// byte sequence stream-like reader with self-advancing cursor
class Reader {
    inline void read(void* out, size_t bytes)
    {
        auto newpos { pos + bytes };
        if (newpos > end)
            throw Error(EINV_SLOT);
        memcpy(out, pos, bytes);
        pos = newpos;
    }

public:
    Reader(std::span<const uint8_t> s)
        : pos(s.data())
        , end(s.data() + s.size())
    {
    }
    uint32_t uint32()
    {
        uint32_t res;
        read(&res, sizeof(res));
        return ntoh32(res);
    }
    uint8_t uint8()
    {
        uint8_t res;
        read(&res, 1);
        return res;
    }
    // true if the next len bytes are zero, cursor does not move
    bool peek_zero(size_t len) const
    {
        if (pos + len > end)
            throw Error(EINV_SLOT);
        return std::all_of(pos, pos + len, [](uint8_t b) { return b == 0; });
    }

    void skip(size_t nbytes)
    {
        if (pos + nbytes > end)
            throw Error(EINV_SLOT);
        pos += nbytes;
    };
    size_t remaining() const { return end - pos; }

private:
    const uint8_t* pos;
    const uint8_t* end;
};
