//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Miscellaneous utility functions
//
// Trivial functions are defined inline for performance optimization.
// All others are defined in "utils.cc".

#pragma once

#include <pxeboot/types.h>

namespace pxeboot {
    namespace util {
        // Min and max functions
        inline constexpr u32 min_u32(u32 a, u32 b)
            {return (a < b) ? a : b;}
        inline constexpr unsigned min_unsigned(unsigned a, unsigned b)
            {return (a < b) ? a : b;}
        inline constexpr unsigned max_unsigned(unsigned a, unsigned b)
            {return (a > b) ? a : b;}

        // Absolute value of a signed integer.
        inline constexpr u32 abs_s32(s32 a)
            {return (a < 0) ? u32(-(a+1)) + 1 : u32(a);}

        // Count the number of set bits in a word.
        unsigned popcount(u32 x);

        // Extract fields from a big-endian byte array.
        u16 extract_be_u16(const u8* src);
        u32 extract_be_u32(const u8* src);

        // Store fields into a big-endian byte array.
        void write_be_u16(u8* dst, u16 val);
        void write_be_u32(u8* dst, u32 val);

        // Copy a string into a fixed-length field, zero-filling the rest.
        // The last byte is always left as a null terminator.
        // Returns false if the string was truncated to fit.
        bool copy_field(u8* dst, unsigned dst_len, const char* src);
    }
}
