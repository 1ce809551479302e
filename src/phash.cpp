#include <iostream>
#include <exception>
#include <stdlib.h>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "phash.hpp"
#include "tracelog.hpp"
#include "version.hpp"
#include "value.hpp"
#include "hash/h32.hpp"
#include "hash/make_hash.hpp"
#include "reader/value_reader.hpp"

namespace phash
{
    phash_context ctx;

    int init(int argc, char **argv)
    {
        if (parse_cmd(argc, argv) != 0)
            return -1;

        if (ctx.run_mode == RUN_MODE::HELP)
            return 0;

        if (ctx.run_mode == RUN_MODE::VERSION)
        {
            // Print the version
            std::cout << version::PHASH_VERSION << " (hash scheme " << version::HASH_SCHEME_VERSION << ")" << std::endl;
            return 0;
        }

        if (tracelog::init() == -1)
            return -1;

        // Register exception handler for std exceptions.
        // This needs to be done after trace log init because we are logging exceptions there.
        std::set_terminate(&std_terminate);

        LOG_DEBUG << "phash " << version::PHASH_VERSION;

        return run_hash();
    }

    /**
     * Hashes the value or folder given in the context and prints the hex digest.
     * If an expected digest was given, prints whether it matched.
     * @return 0 on success and match. -1 on failure or mismatch.
     */
    int run_hash()
    {
        value v;
        if (ctx.run_mode == RUN_MODE::VALUE)
        {
            std::string error;
            if (reader::read_value(v, ctx.input, error) == -1)
            {
                std::cerr << "Invalid value literal. " << error << "\n";
                return -1;
            }
        }
        else
        {
            v = make_folder(ctx.input);
        }

        hash::h32 expected;
        if (!ctx.expected_hash.empty() && hash::h32_from_hex(expected, ctx.expected_hash) == -1)
        {
            std::cerr << "Invalid expected hash " << ctx.expected_hash << "\n";
            return -1;
        }

        hash::h32 digest;
        const int ret = hash::make_digest(digest, v, ctx.options);
        if (ret < 0)
        {
            LOG_ERROR << "Hashing " << type_name(v) << " failed. " << hash::error_to_string(ret);
            std::cerr << "Hashing failed: " << hash::error_to_string(ret) << "\n";
            return -1;
        }

        std::cout << digest << std::endl;

        if (!ctx.expected_hash.empty())
        {
            if (digest != expected)
            {
                std::cout << "mismatch" << std::endl;
                return -1;
            }
            std::cout << "match" << std::endl;
        }

        return 0;
    }

    int parse_cmd(int argc, char **argv)
    {
        // Initialize CLI.
        CLI::App app("Canonical structural hashing");
        app.set_help_all_flag("--help-all", "Expand all help");

        // Initialize subcommands.
        CLI::App *version = app.add_subcommand("version", "phash version");
        CLI::App *hash_value = app.add_subcommand("value", "Hash a value literal");
        CLI::App *hash_folder = app.add_subcommand("folder", "Hash the content of a folder");

        // Initialize options.
        std::string input, expected_hash, trace_mode, trace_file;
        int precision = hash::FLOAT_PRECISION;
        bool odict_as_unordered = false;
        std::vector<std::string> ignore_names;

        // value
        hash_value->add_option("literal", input, "Value literal, eg. '{\"a\": [1, 2.5, none]}'")->required();
        hash_value->add_option("-p,--precision", precision, "Significant digits kept for reals")->check(CLI::Range(1, hash::MAX_FLOAT_PRECISION))->default_str("14");
        hash_value->add_flag("-u,--unordered-odict", odict_as_unordered, "Hash ordered mappings as unordered mappings");

        // folder
        hash_folder->add_option("dir", input, "Folder to hash")->required()->check(CLI::ExistingDirectory);

        for (CLI::App *sub : {hash_value, hash_folder})
        {
            sub->add_option("-i,--ignore", ignore_names, "Folder entry names to leave out of the hash");
            sub->add_option("-e,--expect", expected_hash, "Expected hex digest to verify against");
            sub->add_option("-t,--trace", trace_mode, "Trace mode")->check(CLI::IsMember({"dbg", "none", "inf", "wrn", "err"}))->default_str("wrn");
            sub->add_option("--trace-file", trace_file, "Trace log file");
        }

        CLI11_PARSE(app, argc, argv);

        // Verifying subcommands.
        if (version->parsed())
        {
            ctx.run_mode = RUN_MODE::VERSION;
            return 0;
        }
        else if (hash_value->parsed() || hash_folder->parsed())
        {
            ctx.run_mode = hash_value->parsed() ? RUN_MODE::VALUE : RUN_MODE::FOLDER;
            ctx.input = input;
            ctx.expected_hash = expected_hash;
            ctx.trace_file = trace_file;
            ctx.options.float_precision = precision;
            ctx.options.treat_ordered_map_as_unordered = odict_as_unordered;
            ctx.options.folder_ignore_names.insert(ignore_names.begin(), ignore_names.end());

            if (!trace_mode.empty() && read_trace_arg(trace_mode) == -1)
                return -1;

            return 0;
        }

        std::cout << app.help();
        return -1;
    }

    int read_trace_arg(std::string_view arg)
    {
        if (arg == "dbg")
            ctx.trace_level = TRACE_LEVEL::DEBUG;
        else if (arg == "none")
            ctx.trace_level = TRACE_LEVEL::NONE;
        else if (arg == "inf")
            ctx.trace_level = TRACE_LEVEL::INFO;
        else if (arg == "wrn")
            ctx.trace_level = TRACE_LEVEL::WARN;
        else if (arg == "err")
            ctx.trace_level = TRACE_LEVEL::ERROR;
        else
            return -1;

        return 0;
    }

    /**
     * Global exception handler for std exceptions.
     */
    void std_terminate() noexcept
    {
        std::exception_ptr exptr = std::current_exception();
        if (exptr != 0)
        {
            try
            {
                std::rethrow_exception(exptr);
            }
            catch (std::exception &ex)
            {
                LOG_ERROR << "std error: " << ex.what();
            }
            catch (...)
            {
                LOG_ERROR << "std error: Terminated due to unknown exception.";
            }
        }
        else
        {
            LOG_ERROR << "std error: Terminated due to unknown reason.";
        }

        exit(1);
    }

} // namespace phash
