//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//! \file
//! Miscellaneous POSIX wrappers (e.g., log to console, folders...)
//! \details
//! Classes in the main "pxeboot" folder make no operating-system calls.
//! This file defines the wrappers and extensions used by the server
//! executable and the unit tests on Linux and other POSIX platforms.

#pragma once

#include <pxeboot/log.h>
#include <string>
#include <vector>

namespace pxeboot {
    namespace io {
        //! Read the remaining contents of a Readable as a string.
        std::string read_str(pxeboot::io::Readable* src);
    }

    namespace util {
        //! Monotonic millisecond counter.
        class PosixTimer {
        public:
            PosixTimer();

            //! Milliseconds since an arbitrary fixed epoch.
            u64 now_msec() const;

            //! Milliseconds elapsed since creation of this object.
            inline u64 elapsed_msec() const
                {return now_msec() - m_tref;}

        protected:
            const u64 m_tref;
        };

        //! Cross-platform wrapper for sleep()/usleep()/etc.
        void sleep_msec(unsigned msec);

        //! Does the designated path exist and name a folder?
        bool is_folder(const char* path);

        //! Create a folder and any missing parents (i.e., "mkdir -p").
        //! Returns true if the folder exists when the call returns.
        bool make_folder(const char* path);

        //! Does the designated path exist and name a regular file?
        bool is_file(const char* path);
    }

    namespace log {
        //! Human-readable formatting for an Ethernet address.
        std::string format(const pxeboot::eth::MacAddr& addr);
        //! Human-readable formatting for an IPv4 address.
        std::string format(const pxeboot::ip::Addr& addr);

        //! Helper object that prints log::Log messages to console.
        //! Stores the most recent log message, to facilitate unit tests.
        class ToConsole final : public pxeboot::log::EventHandler {
        public:
            //! On creation, optionally specify the minimum priority to print.
            explicit ToConsole(s8 threshold=pxeboot::log::DEBUG);

            //! Disable all output messages until threshold is lowered.
            void disable() {m_threshold = INT8_MAX;}

            //! Suppress messages containing a specific string.
            //! Filters are added to an internal list; null pointer clears the list.
            void suppress(const char* msg);

            //! Does the last logged message contain the provided substring?
            bool contains(const char* msg) const;

            //! Clear the stored copy of the most recent log message.
            void clear() {m_last_msg.clear();}
            //! Is there a stored log message?
            bool empty() const {return m_last_msg.empty();}

            // Publically accessible members:
            s8 m_threshold;             //!< Print only if priority >= threshold
            std::string m_last_msg;     //!< Most recent message (ignores threshold)

        protected:
            void log_event(s8 priority, unsigned nbytes, const char* msg) override;
            std::vector<std::string> m_suppress;
            pxeboot::util::PosixTimer m_timer;
        };
    }
}
