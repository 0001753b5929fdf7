//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <cstring>
#include <pxeboot/utils.h>

namespace util = pxeboot::util;

unsigned util::popcount(u32 x) {
    unsigned count = 0;
    while (x) {x &= x - 1; ++count;}
    return count;
}

u16 util::extract_be_u16(const u8* src) {
    return (u16(src[0]) << 8) | u16(src[1]);
}

u32 util::extract_be_u32(const u8* src) {
    return (u32(src[0]) << 24)
         | (u32(src[1]) << 16)
         | (u32(src[2]) << 8)
         | (u32(src[3]) << 0);
}

void util::write_be_u16(u8* dst, u16 val) {
    dst[0] = (u8)(val >> 8);
    dst[1] = (u8)(val >> 0);
}

void util::write_be_u32(u8* dst, u32 val) {
    dst[0] = (u8)(val >> 24);
    dst[1] = (u8)(val >> 16);
    dst[2] = (u8)(val >> 8);
    dst[3] = (u8)(val >> 0);
}

bool util::copy_field(u8* dst, unsigned dst_len, const char* src) {
    memset(dst, 0, dst_len);
    if (!src) return true;
    unsigned len = (unsigned)strlen(src);
    unsigned ncopy = min_unsigned(len, dst_len ? dst_len - 1 : 0);
    memcpy(dst, src, ncopy);
    return (ncopy == len);
}
