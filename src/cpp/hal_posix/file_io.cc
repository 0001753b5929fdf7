//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <hal_posix/file_io.h>
#include <sys/types.h>      // For off_t

using pxeboot::io::FileReader;
using pxeboot::io::FileWriter;

FileWriter::FileWriter(const char* filename)
    : m_file(0)
    , m_error(false)
{
    // Open file if specified, otherwise remain idle.
    if (filename) open(filename);
}

FileWriter::~FileWriter()
{
    close();
}

void FileWriter::open(const char* filename)
{
    // Cleanup before attempting to open the new file.
    close();
    if (filename) m_file = fopen(filename, "wb");
}

void FileWriter::close()
{
    // Close file object and revert to idle state.
    if (m_file) fclose(m_file);
    m_file = 0;
    m_error = false;
}

unsigned FileWriter::get_write_space() const
{
    // If a file is open, max write length is effectively unlimited.
    return m_file ? UINT32_MAX : 0;
}

void FileWriter::write_bytes(unsigned nbytes, const void* src)
{
    if (!m_file) return;
    if (fwrite(src, 1, nbytes, m_file) != nbytes) m_error = true;
}

bool FileWriter::write_finalize()
{
    // Flush to disk and report any errors since the last call.
    bool ok = m_file && !m_error && (fflush(m_file) == 0);
    m_error = false;
    return ok;
}

void FileWriter::write_next(u8 data)
{
    if (m_file && fputc(data, m_file) == EOF) m_error = true;
}

FileReader::FileReader(const char* filename)
    : m_file(0)
    , m_rem(0)
{
    // Open filename if specified, otherwise remain idle.
    if (filename) open(filename);
}

FileReader::~FileReader()
{
    close();
}

bool FileReader::open(const char* filename)
{
    // Close current input file before attempting to open the new one.
    close();
    if (filename) m_file = fopen(filename, "rb");
    if (!m_file) return false;

    // Auto-sense file size.
    if (fseeko(m_file, 0, SEEK_END) == 0) {
        off_t len = ftello(m_file);
        m_rem = (len > 0) ? u64(len) : 0;
    }
    if (fseeko(m_file, 0, SEEK_SET) != 0) {
        close();
        return false;
    }
    return true;
}

void FileReader::close()
{
    // Close file object and revert to idle state.
    if (m_file) fclose(m_file);
    m_file = 0;
    m_rem  = 0;
}

unsigned FileReader::get_read_ready() const
{
    if (!m_file) return 0;
    return (m_rem > UINT32_MAX) ? UINT32_MAX : unsigned(m_rem);
}

bool FileReader::read_bytes(unsigned nbytes, void* dst)
{
    size_t result = 0;
    if (m_file && m_rem >= nbytes) {
        result = fread(dst, 1, nbytes, m_file);
        m_rem -= result;
    }
    if (result != nbytes) read_underflow();
    return (result == nbytes);
}

bool FileReader::read_consume(unsigned nbytes)
{
    if (m_file && m_rem >= nbytes && fseeko(m_file, off_t(nbytes), SEEK_CUR) == 0) {
        m_rem -= nbytes;
        return true;
    } else {
        read_underflow();
        return false;
    }
}

void FileReader::read_finalize()
{
    close();
}

u8 FileReader::read_next()
{
    if (m_file && m_rem) {
        --m_rem;
        return (u8)fgetc(m_file);
    } else {
        return 0;
    }
}
