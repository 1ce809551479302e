#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Initializers/RollingFileInitializer.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <iomanip>
#include "phash.hpp"
#include "tracelog.hpp"

namespace tracelog
{
    constexpr size_t MAX_TRACE_FILESIZE = 10 * 1024 * 1024; // 10MB
    constexpr size_t MAX_TRACE_FILECOUNT = 10;

    // Trace log category indicator.
    constexpr const char *TRACE_CATEGORY = "][phs] ";

    // Custom formatter adopted from:
    // https://github.com/SergiusTheBest/plog/blob/master/include/plog/Formatters/TxtFormatter.h
    class phash_plog_formatter
    {
    public:
        static plog::util::nstring header()
        {
            return plog::util::nstring();
        }

        static inline const char *severity_to_string(plog::Severity severity)
        {
            switch (severity)
            {
            case plog::Severity::fatal:
                return "fat";
            case plog::Severity::error:
                return "err";
            case plog::Severity::warning:
                return "wrn";
            case plog::Severity::info:
                return "inf";
            case plog::Severity::debug:
                return "dbg";
            case plog::Severity::verbose:
                return "ver";
            default:
                return "def";
            }
        }

        static plog::util::nstring format(const plog::Record &record)
        {
            tm t;
            plog::util::localtime_s(&t, &record.getTime().time); // local time

            plog::util::nostringstream ss;
            ss << t.tm_year + 1900 << std::setfill(PLOG_NSTR('0')) << std::setw(2) << t.tm_mon + 1 << std::setfill(PLOG_NSTR('0')) << std::setw(2) << t.tm_mday << PLOG_NSTR(" ");
            ss << std::setfill(PLOG_NSTR('0')) << std::setw(2) << t.tm_hour << PLOG_NSTR(":") << std::setfill(PLOG_NSTR('0')) << std::setw(2) << t.tm_min << PLOG_NSTR(":") << std::setfill(PLOG_NSTR('0')) << std::setw(2) << t.tm_sec << PLOG_NSTR(" ");
            ss << PLOG_NSTR("[") << severity_to_string(record.getSeverity()) << PLOG_NSTR(TRACE_CATEGORY);
            ss << record.getMessage() << PLOG_NSTR("\n");

            return ss.str();
        }
    };

    // Digests are written to stdout so traces go to stderr.
    static plog::ConsoleAppender<phash_plog_formatter> consoleAppender(plog::streamStdErr);

    int init()
    {
        if (phash::ctx.trace_level == phash::TRACE_LEVEL::NONE)
            return 0;

        plog::Severity level;
        if (phash::ctx.trace_level == phash::TRACE_LEVEL::DEBUG)
            level = plog::Severity::debug;
        else if (phash::ctx.trace_level == phash::TRACE_LEVEL::INFO)
            level = plog::Severity::info;
        else if (phash::ctx.trace_level == phash::TRACE_LEVEL::WARN)
            level = plog::Severity::warning;
        else
            level = plog::Severity::error;

        if (phash::ctx.trace_file.empty())
        {
            plog::init(level, &consoleAppender);
        }
        else
        {
            plog::init<phash_plog_formatter>(level, phash::ctx.trace_file.c_str(), MAX_TRACE_FILESIZE, MAX_TRACE_FILECOUNT)
                .addAppender(&consoleAppender);
        }

        return 0;
    }

} // namespace tracelog
