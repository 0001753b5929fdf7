//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// File I/O wrappers

#pragma once

#include <cstdio>
#include <pxeboot/io_readable.h>
#include <pxeboot/io_writeable.h>

namespace pxeboot {
    namespace io {
        //! Write bytes to a file.
        class FileWriter : public pxeboot::io::Writeable {
        public:
            //! Create the FileWriter object.
            //! \param filename Optionally open a file immediately.
            explicit FileWriter(const char* filename = 0);
            virtual ~FileWriter();

            //! Open the specified file, replacing any previous contents.
            void open(const char* filename);
            void close();

            //! Is there an open file?
            inline bool is_open() const {return m_file != 0;}

            // Required and optional function overrides.
            unsigned get_write_space() const override;
            void write_bytes(unsigned nbytes, const void* src) override;
            bool write_finalize() override;
        protected:
            void write_next(u8 data) override;
            FILE* m_file;           // Current file object
            bool m_error;           // Write error since last finalize?
        };

        //! Stream bytes from a file, one read at a time.
        //! Files larger than 4 GiB report get_read_ready() = UINT32_MAX
        //! until the remainder fits in 32 bits.
        class FileReader : public pxeboot::io::Readable {
        public:
            //! Create the FileReader object.
            //! \param filename Optionally open a file immediately.
            explicit FileReader(const char* filename = 0);
            virtual ~FileReader();

            //! Open the specified file for reading.
            //! Returns true if successful.
            bool open(const char* filename);
            void close();

            //! Is there an open file?  (An empty file is still open.)
            inline bool is_open() const {return m_file != 0;}

            //! Total bytes remaining in the file.
            inline u64 remaining() const {return m_rem;}

            // Required and optional function overrides.
            unsigned get_read_ready() const override;
            bool read_bytes(unsigned nbytes, void* dst) override;
            bool read_consume(unsigned nbytes) override;
            void read_finalize() override;
        protected:
            u8 read_next() override;
            FILE* m_file;       // Current file object
            u64 m_rem;          // Remaining readable bytes
        };
    }
}
