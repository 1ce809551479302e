#ifndef _PHASH_PHASH_
#define _PHASH_PHASH_

#include <string>
#include "hash/make_hash.hpp"

namespace phash
{
    enum RUN_MODE
    {
        HELP,    // Help printing.
        VALUE,   // Hash a value literal.
        FOLDER,  // Hash a folder tree.
        VERSION  // Version printing.
    };

    enum TRACE_LEVEL
    {
        NONE,
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    struct phash_context
    {
        RUN_MODE run_mode = RUN_MODE::HELP;
        TRACE_LEVEL trace_level = TRACE_LEVEL::WARN;
        std::string trace_file;    // Optional trace log file. Console only if empty.
        std::string input;         // Value literal or folder path depending on run mode.
        std::string expected_hash; // If set, the computed digest is verified against this.
        hash::hash_options options;
    };
    extern phash_context ctx;

    int init(int argc, char **argv);
    int run_hash();
    int parse_cmd(int argc, char **argv);
    int read_trace_arg(std::string_view arg);
    void std_terminate() noexcept;

} // namespace phash

#endif
