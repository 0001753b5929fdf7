//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//! \file
//! "Writeable" I/O interface core definitions
//!
//! \details
//! Counterpart to io_readable.h.  Packet encoders write to a `Writeable`;
//! the `ArrayWrite` implementation records any attempt to write past the
//! end of its buffer, so that `write_finalize()` can report the overflow
//! instead of emitting a silently truncated packet.

#pragma once

#include <pxeboot/types.h>

namespace pxeboot {
    namespace io {
        //! Abstract API for writing byte-streams.
        class Writeable {
        public:
            //! How many bytes can be written without blocking?
            //! Child objects of io::Writeable MUST override this method.
            virtual unsigned get_write_space() const = 0;

            //! Write various data types in big-endian format.
            //! If there is not enough space, the write is discarded
            //! and write_overflow() is called instead.
            //!@{
            void write_u8(u8 data);
            void write_u16(u16 data);
            void write_u32(u32 data);
            //!@}

            //! Write an array of bytes.
            virtual void write_bytes(unsigned nbytes, const void* src);

            //! Write a string, excluding the null terminator.
            void write_str(const char* str);

            //! Mark the end of a frame.
            //! \returns True if the frame was written without error.
            virtual bool write_finalize();

            //! Discard any partially written frame.
            virtual void write_abort();

            //! Templated wrapper for any object with the following method:
            //! `void write_to(pxeboot::io::Writeable* wr) const;`
            template <class T> inline void write_obj(const T& obj)
                {obj.write_to(this);}

            virtual ~Writeable() {}

        protected:
            //! Only children should create the base class.
            Writeable() {}

            //! Write the next byte to the underlying buffer or device.
            //! Child objects of io::Writeable MUST override this method.
            virtual void write_next(u8 data) = 0;

            //! Optional error handling for write overflow.
            virtual void write_overflow();
        };

        //! Ephemeral `Writeable` interface for a simple array.
        class ArrayWrite : public pxeboot::io::Writeable {
        public:
            ArrayWrite(void* dst, unsigned len)
                : m_dst((u8*)dst), m_len(len), m_ovr(false), m_wridx(0), m_wrlen(0) {}

            // Implement the public Writeable API.
            unsigned get_write_space() const override;
            void write_bytes(unsigned nbytes, const void* src) override;
            void write_abort() override;
            bool write_finalize() override;

            //! Read-only access to the working buffer.
            inline const u8* buffer() const
                { return m_dst; }

            //! Report total length after write_finalize() is called.
            inline unsigned written_len() const
                { return m_wrlen; }

            //! Report length of the frame in progress.
            inline unsigned written_pos() const
                { return m_wridx; }

        private:
            void write_next(u8 data) override;
            void write_overflow() override;

            u8* const       m_dst;
            const unsigned  m_len;
            bool            m_ovr;
            unsigned        m_wridx;
            unsigned        m_wrlen;
        };
    }
}
