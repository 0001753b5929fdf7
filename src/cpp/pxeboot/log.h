//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Diagnostic logging for the PXE boot services
//!
//!\details
//! Each `Log` object formats and emits a single human-readable message.
//! The `Log` object is ephemeral, with chaining for readable syntax.
//! Additional "write" calls append information to the message; the final
//! message is sent when the `Log` object falls out of scope.
//!\code
//!      using pxeboot::log::Log;
//!
//!      void example(const pxeboot::ip::Addr& client, u32 nblocks) {
//!          Log(pxeboot::log::INFO, "TFTP", "Transfer complete")
//!              .write(client).write10(nblocks);
//!      }
//!\endcode
//!
//! When the `Log` object falls out of scope, the message contents are
//! written to every object that defines the `log::EventHandler` interface.
//! The DHCP and TFTP services handle each request on its own thread, so
//! delivery to the handler list is serialized by a global mutex; each
//! message reaches each handler as a single unbroken line.

#pragma once

#include <pxeboot/list.h>
#include <pxeboot/types.h>

// Default parameters:
#ifndef PXEBOOT_LOG_MAXLEN      // Maximum string length per message
#define PXEBOOT_LOG_MAXLEN  255
#endif

#ifndef PXEBOOT_LOG_CONCISE     // Enable concise syntax?
#define PXEBOOT_LOG_CONCISE 1
#endif

namespace pxeboot {
    namespace log {
        //! Defines the interface for accepting Log messages.
        //!
        //! To receive `Log` messages, derive a child class and override the
        //! `log_event` method.  The constructor automatically appends new
        //! `EventHandler` objects to a global list of Log recipients, and
        //! the destructor removes them.
        class EventHandler {
        public:
            //! Callback for each formatted Log message.
            //! Child class must override this method.
            virtual void log_event(s8 priority, unsigned nbytes, const char* msg) = 0;
        protected:
            //! Constructor automatically manages the list of active handler objects.
            EventHandler();
            virtual ~EventHandler();
        private:
            friend pxeboot::util::ListCore;
            pxeboot::log::EventHandler* m_next;
        };

        //! Define basic priority codes for log messages.
        //! Larger numeric codes indicate greater message priority.
        //!@{
        constexpr s8 DEBUG      = -20;
        constexpr s8 INFO       = -10;
        constexpr s8 WARNING    =   0;
        constexpr s8 ERROR      = +10;
        constexpr s8 CRITICAL   = +20;
        //!@}

        //! Convert priority code to a fixed-width plaintext label.
        //! (e.g., "Warn" or "Error")
        const char* priority_label(s8 priority);

        //! Fixed-size text buffer for one `Log` message.
        //! Writes past PXEBOOT_LOG_MAXLEN characters are discarded.
        //! Objects with a `log_to` method format themselves through
        //! this interface (e.g., ip::Addr or udp::Endpoint).
        class LogBuffer final {
        public:
            LogBuffer() : m_wridx(0) {}

            //! Null-terminated buffer contents.
            const char* c_str();

            //! Append text.
            //!@{
            void wr_fix(const char* str, unsigned len);
            void wr_str(const char* str);
            //!@}

            //! Append an integer with exactly "ndigits" hex digits.
            void wr_hex(u32 val, unsigned ndigits);
            //! Append an unsigned integer in decimal.
            void wr_dec(u64 val);
            //! Append a signed integer in decimal, always with a sign.
            void wr_sdec(s32 val);

            //! Number of characters written so far.
            unsigned len() const {return m_wridx;}

        private:
            friend pxeboot::log::Log;

            LogBuffer(const LogBuffer&) = delete;
            LogBuffer& operator=(const LogBuffer&) = delete;

            inline void terminate() {m_buff[m_wridx] = 0;}

            unsigned m_wridx;
            char m_buff[PXEBOOT_LOG_MAXLEN+1];
        };

        //! One log message, sent to each `EventHandler` on destruction.
        class Log final {
        public:
            //! Constructor sets priority and the start of the message.
            //! The two-string form is intended for "subsystem: message".
            //!@{
            Log(s8 priority, const char* str);
            Log(s8 priority, const char* str1, const char* str2);
            Log(s8 priority, const void* str, unsigned nbytes);
            //!@}

            //! Destructor sends the message.
            ~Log();

            //! Formatting methods for various data types.
            //! Each "write" method appends text to the `Log` message.
            //! By convention, integer types add prefix " = 0x" and print
            //! as a fixed-width hexadecimal value. Use "write10" for decimal.
            //! Other values, except strings, add prefix " = " instead.
            //! Network types use conventional form (e.g., "192.168.1.42").
            //! Returns reference to itself to make chaining easy.
            //!@{
            Log& write(const char* str);
            Log& write(bool val);
            Log& write(u8 val);
            Log& write(u16 val);
            Log& write(u32 val);
            Log& write(const u8* val, unsigned nbytes);
            Log& write(const pxeboot::eth::MacAddr& mac);
            Log& write(const pxeboot::ip::Addr& ip);
            //!@}

            //! Print integer as a decimal value with no leading zeros.
            //! Signed values also include a leading "+" or "-" token.
            //!@{
            Log& write10(s32 val);
            Log& write10(u32 val);
            Log& write10(u64 val);
            inline Log& write10(u8  val)    {return write10(u32(val));}
            inline Log& write10(u16 val)    {return write10(u32(val));}
            //!@}

            //! Append any object that defines this method:
            //!     void log_to(pxeboot::log::LogBuffer& wr) const;
            template <class T> inline Log& write_obj(const T& obj)
                {obj.log_to(m_buff); return *this;}

        private:
            Log(const Log&) = delete;
            Log& operator=(const Log&) = delete;

            const s8 m_priority;
            pxeboot::log::LogBuffer m_buff;
        };

        //! Hard-reset of global variables at the start of each unit test.
        //! Returns true if globals were already in the expected state.
        bool pre_test_reset();
    }
}

// Enable concise syntax?
#if PXEBOOT_LOG_CONCISE
    using pxeboot::log::Log;
#endif
