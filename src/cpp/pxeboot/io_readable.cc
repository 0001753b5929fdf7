//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <cstring>
#include <pxeboot/io_readable.h>

using pxeboot::io::ArrayRead;
using pxeboot::io::Readable;

u8 Readable::read_u8() {
    if (get_read_ready() >= 1) {
        return read_next();
    } else {
        read_underflow();
        return 0;
    }
}

u16 Readable::read_u16() {
    if (get_read_ready() >= 2) {
        u16 temp = read_next();    // Big-endian
        return (temp << 8) | read_next();
    } else {
        read_underflow();
        return 0;
    }
}

u32 Readable::read_u32() {
    if (get_read_ready() >= 4) {
        u32 temp = read_next();    // Big-endian
        temp = (temp << 8) | read_next();
        temp = (temp << 8) | read_next();
        return (temp << 8) | read_next();
    } else {
        read_underflow();
        return 0;
    }
}

unsigned Readable::read_str(unsigned dst_size, char* dst) {
    unsigned nwrite = 0;
    while (get_read_ready() > 0) {  // Stop at end-of-input?
        u8 tmp = read_next();       // Read next byte.
        if (tmp == 0) break;        // Null-termination?
        if (nwrite+1 < dst_size) dst[nwrite++] = (char)tmp;
    }
    dst[nwrite] = 0;                // Always null-terminate
    return nwrite;
}

bool Readable::read_bytes(unsigned nbytes, void* dst) {
    u8* dst_u8 = (u8*)dst;
    if (get_read_ready() >= nbytes) {
        while (nbytes) {
            *dst_u8 = read_next();
            ++dst_u8; --nbytes;
        }
        return true;
    } else {
        read_underflow();
        return false;
    }
}

bool Readable::read_consume(unsigned nbytes) {
    if (get_read_ready() >= nbytes) {
        while (nbytes) {read_next(); --nbytes;}
        return true;
    } else {
        read_underflow();
        return false;
    }
}

void Readable::read_finalize()  {}
void Readable::read_underflow() {}

unsigned ArrayRead::get_read_ready() const {
    return m_len - m_rdidx;
}

bool ArrayRead::read_bytes(unsigned nbytes, void* dst) {
    if (get_read_ready() < nbytes) {
        read_underflow();
        return false;
    }
    memcpy(dst, m_src + m_rdidx, nbytes);
    m_rdidx += nbytes;
    return true;
}

bool ArrayRead::read_consume(unsigned nbytes) {
    if (get_read_ready() < nbytes) {
        read_underflow();
        return false;
    }
    m_rdidx += nbytes;
    return true;
}

void ArrayRead::read_finalize() {
    m_rdidx = m_len;
}

void ArrayRead::read_reset(unsigned len) {
    m_len = len;
    m_rdidx = 0;
}

u8 ArrayRead::read_next() {
    return m_src[m_rdidx++];
}
