//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <cstring>
#include <pxeboot/io_writeable.h>

using pxeboot::io::ArrayWrite;
using pxeboot::io::Writeable;

void Writeable::write_u8(u8 data) {
    if (get_write_space() >= 1) {
        write_next(data);
    } else {write_overflow();}
}

void Writeable::write_u16(u16 data) {
    if (get_write_space() >= 2) {
        write_next((u8)(data >> 8));   // Big-endian
        write_next((u8)(data >> 0));
    } else {write_overflow();}
}

void Writeable::write_u32(u32 data) {
    if (get_write_space() >= 4) {
        write_next((u8)(data >> 24));  // Big-endian
        write_next((u8)(data >> 16));
        write_next((u8)(data >> 8));
        write_next((u8)(data >> 0));
    } else {write_overflow();}
}

void Writeable::write_bytes(unsigned nbytes, const void* src) {
    const u8* src8 = reinterpret_cast<const u8*>(src);
    if (get_write_space() >= nbytes) {
        while (nbytes) {
            write_next(*src8);
            src8++; nbytes--;
        }
    } else {write_overflow();}
}

void Writeable::write_str(const char* str) {
    unsigned nbytes = (unsigned)strlen(str);
    write_bytes(nbytes, str);
}

bool Writeable::write_finalize()   {return true;}
void Writeable::write_abort()      {}
void Writeable::write_overflow()   {}

unsigned ArrayWrite::get_write_space() const {
    return m_len - m_wridx;     // Remaining space in array
}

void ArrayWrite::write_bytes(unsigned nbytes, const void* src) {
    if (get_write_space() >= nbytes) {
        m_wrlen = 0;
        memcpy(m_dst + m_wridx, src, nbytes);
        m_wridx += nbytes;
    } else {write_overflow();}
}

void ArrayWrite::write_abort() {
    m_ovr   = false;            // Clear overflow flag
    m_wrlen = 0;                // Clear prior contents
    m_wridx = 0;                // Restart at beginning
}

bool ArrayWrite::write_finalize() {
    bool ok = !m_ovr;           // Fail on overflow
    m_ovr   = false;            // Clear overflow flag
    m_wrlen = ok ? m_wridx : 0; // Note current length
    m_wridx = 0;                // Next write wraps to start
    return ok;
}

void ArrayWrite::write_overflow() {
    m_ovr = true;
}

void ArrayWrite::write_next(u8 data) {
    m_wrlen = 0;                // Clear prior contents
    m_dst[m_wridx++] = data;    // Write the new byte
}
