//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//! \file
//! "Readable" I/O interface core definitions
//!
//! \details
//! The core of all PxeBoot I/O are the "Writeable" interface (io_writeable.h)
//! and "Readable" interface (io_readable.h).  Protocol parsers read from a
//! `Readable` so the same code can handle a received datagram (`ArrayRead`)
//! or a file on disk (`FileReader`, see hal_posix/file_io.h).

#pragma once

#include <pxeboot/types.h>

namespace pxeboot {
    namespace io {
        //! Abstract API for reading byte-streams.
        //! All multi-byte integers are read in big-endian (network) order.
        //! Reading past the end of the available data calls read_underflow()
        //! and returns zero; parsers check get_read_ready() to avoid this.
        class Readable {
        public:
            //! How many bytes can be read without blocking?
            //! Child objects of io::Readable MUST override this method.
            virtual unsigned get_read_ready() const = 0;

            //! Read various data types in big-endian format.
            //!@{
            u8 read_u8();
            u16 read_u16();
            u32 read_u32();
            //!@}

            //! Read 0 or more bytes into a buffer.
            //! Child objects of io::Readable MAY override this method for
            //! improved performance.
            virtual bool read_bytes(unsigned nbytes, void* dst);

            //! Read and discard 0 or more bytes.
            virtual bool read_consume(unsigned nbytes);

            //! Safely read a null-terminated input string.
            //! The input is always consumed up to the end-of-input or the
            //! first zero byte, whichever comes first.
            //! \returns The length of the output string, which may
            //! be truncated as needed to fit in the provided buffer.
            unsigned read_str(unsigned dst_size, char* dst);

            //! Release the underlying resource, if applicable.
            virtual void read_finalize();

            //! Templated wrapper for any object with the following method:
            //! `bool read_from(pxeboot::io::Readable* rd);`
            template <class T> inline bool read_obj(T& t)
                {return t.read_from(this);}

            virtual ~Readable() {}

        protected:
            //! Only children should create the base class.
            Readable() {}

            //! Read the next byte from the underlying buffer or device.
            //! Child objects of io::Readable MUST override this method.
            virtual u8 read_next() = 0;

            //! Optional error handling for read underflow.
            virtual void read_underflow();
        };

        //! Ephemeral `Readable` interface for a simple array.
        //! This class can be used to parse structured data from a byte-array.
        //! It does not take ownership of the backing array.
        class ArrayRead : public pxeboot::io::Readable {
        public:
            ArrayRead(const void* src, unsigned len)
                : m_src((const u8*)src), m_len(len), m_rdidx(0) {}

            // Implement the public Readable API.
            unsigned get_read_ready() const override;
            bool read_bytes(unsigned nbytes, void* dst) override;
            bool read_consume(unsigned nbytes) override;
            void read_finalize() override;

            //! Current read position, measured from start of array.
            inline unsigned read_pos() const {return m_rdidx;}

            //! Reset read position to the start of the backing array.
            void read_reset(unsigned len);

        private:
            u8 read_next() override;

            const u8* const m_src;
            unsigned m_len;     // Length of the backing array
            unsigned m_rdidx;   // Current read position
        };
    }
}
