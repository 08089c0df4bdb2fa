// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2019 The Bitcoin Core developers
// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_LOGGING_H
#define QOBI_LOGGING_H

#include "fs.h"
#include "sync.h"

#include <atomic>
#include <cstdint>
#include <list>
#include <stdexcept>
#include <string>
#include <vector>

// Report malformed format strings as exceptions instead of asserting.
#ifndef TINYFORMAT_ERROR
#define TINYFORMAT_ERROR(reason) throw std::runtime_error(reason)
#endif
#include <tinyformat.h>

#define strprintf tfm::format

static const bool DEFAULT_LOGTIMEMICROS = false;
static const bool DEFAULT_LOGTIMESTAMPS = true;
extern const char * const DEFAULT_DEBUGLOGFILE;

namespace BCLog {
    enum LogFlags : uint32_t {
        NONE            = 0,
        DISTRIBUTION    = (1 <<  0),
        CLAIM           = (1 <<  1),
        RELAYER         = (1 <<  2),
        DB              = (1 <<  3),
        MERKLE          = (1 <<  4),
        ESCROW          = (1 <<  5),
        BENCHMARK       = (1 <<  6),
        ALL             = ~(uint32_t)0,
    };

    class Logger
    {
    private:
        FILE* m_fileout = nullptr;
        Mutex m_file_mutex;
        std::list<std::string> m_msgs_before_open;

        /**
         * m_started_new_line is a state variable that will suppress printing of
         * the timestamp when multiple calls are made that don't end in a
         * newline.
         */
        std::atomic_bool m_started_new_line{true};

        /** Log categories bitfield. */
        std::atomic<uint32_t> m_categories{0};

        std::string LogTimestampStr(const std::string& str);

    public:
        bool m_print_to_console = false;
        bool m_print_to_file = false;

        bool m_log_timestamps = DEFAULT_LOGTIMESTAMPS;
        bool m_log_time_micros = DEFAULT_LOGTIMEMICROS;

        fs::path m_file_path;
        std::atomic<bool> m_reopen_file{false};

        ~Logger();

        /** Send a string to the log output */
        void LogPrintStr(const std::string& str);

        /** Returns whether logs will be written to any output */
        bool Enabled() const { return m_print_to_console || m_print_to_file; }

        bool OpenDebugLog();
        void ShrinkDebugFile();

        void EnableCategory(LogFlags flag);
        bool EnableCategory(const std::string& str);
        void DisableCategory(LogFlags flag);
        bool DisableCategory(const std::string& str);

        bool WillLogCategory(LogFlags category) const;

        bool DefaultShrinkDebugFile() const;
    };

} // namespace BCLog

BCLog::Logger& LogInstance();

/** Return true if log accepts specified category */
static inline bool LogAcceptCategory(BCLog::LogFlags category)
{
    return LogInstance().WillLogCategory(category);
}

/** Return true if str parses as a log category and set the flag */
bool GetLogCategory(BCLog::LogFlags& flag, const std::string& str);

/** Configure the global logger from -debug, -printtoconsole, -logtimestamps and -debuglogfile. */
bool InitLogging(std::string& strError);

// LogPrintf writes unconditionally. Per-claim and per-leaf paths log through
// LogPrint with a category so a busy claim window cannot flood debug.log.

template <typename... Args>
static inline void LogPrintf(const char* fmt, const Args&... args)
{
    if (LogInstance().Enabled()) {
        std::string log_msg;
        try {
            log_msg = tfm::format(fmt, args...);
        } catch (const std::runtime_error& fmterr) {
            /* Original format string will have newline so don't add one here */
            log_msg = "Error \"" + std::string(fmterr.what()) + "\" while formatting log message: " + fmt;
        }
        LogInstance().LogPrintStr(log_msg);
    }
}

// Use a macro instead of a function for conditional logging to prevent
// evaluating arguments when logging for the category is not enabled.
#define LogPrint(category, ...)              \
    do {                                     \
        if (LogAcceptCategory((category))) { \
            LogPrintf(__VA_ARGS__);          \
        }                                    \
    } while (0)

/** Log an error and return false, for the `return error("...")` idiom. */
template <typename... Args>
bool error(const char* fmt, const Args&... args)
{
    LogPrintf("ERROR: %s\n", tfm::format(fmt, args...));
    return false;
}

#endif // QOBI_LOGGING_H
