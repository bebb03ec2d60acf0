#pragma once

#include "general/errors_forward.hpp"
#include <cstdint>
////////////////////////////////////
// LIST OF ERROR CODES            //
////////////////////////////////////
// These codes describe why a registry or codec
// operation was refused.

// Registration errors, range [1-99]
// Parsing errors, range [100-199]
#define ERRNO_MAP(XX)                                                             \
    XX(0, ENOERROR, "no error")                                                   \
    XX(1, ECURRENCYIDEXISTED, "currency id already belongs to another contract")  \
    XX(2, EINVALIDERC20, "address does not host a valid ERC20 contract")          \
    XX(3, EREGISTRYFULL, "ERC20 id space exhausted")                              \
    XX(56, ENOTFOUND, "not found")                                                \
    XX(100, EBADADDRESS, "invalid address")                                       \
    XX(101, EINV_HEX, "cannot parse hexadecimal input")                           \
    XX(102, EINV_SLOT, "malformed currency slot")                                 \
    XX(2000, EBUG, "bug-related error")

#define ERR_DEFINE(code, name, _) constexpr int32_t name = code;
ERRNO_MAP(ERR_DEFINE)
#undef ERR_DEFINE
