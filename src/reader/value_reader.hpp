#ifndef _PHASH_READER_VALUE_READER_
#define _PHASH_READER_VALUE_READER_

#include <optional>
#include <string>
#include <string_view>
#include "../value.hpp"

namespace phash::reader
{
    // Deepest nesting of values a literal may have.
    constexpr size_t MAX_NESTING_DEPTH = 512;

    /**
     * Reads the textual value literal notation accepted by the command line.
     * none | true | false | 12 | 1.5 | "text" | b"bytes" | [a, b] | {a, b} | set{} |
     * {"k": v} | odict{"k": v} | complex(re, im) | uuid("...") | datetime("...") |
     * folder("...") | opaque("...")
     */
    class value_reader
    {
    private:
        std::string_view text;
        size_t pos = 0;
        size_t depth = 0; // Values currently being read.
        std::string error;

        void skip_whitespace();
        bool consume(const char c);
        bool peek(const char c);
        int fail(std::string_view message);
        int read_value(value &v);
        int read_any(value &v);
        void read_word(std::string &word);
        int read_number(value &v);
        int read_real(double &d);
        int read_string(std::string &str);
        int read_list(value &v);
        int read_braced(value &v, const bool force_set, const bool ordered);
        int read_entries(std::vector<entry> &entries, std::string first_key);
        int read_set_items(std::vector<value> &items);
        int read_tagged_string(std::string &str);
        int read_complex(value &v);
        int read_datetime(value &v);

    public:
        value_reader(std::string_view text);
        int read(value &v);
        const std::string &get_error() const;
    };

    int read_value(value &v, std::string_view text, std::string &error);
    int parse_datetime(timestamp &ts, std::string_view str);

} // namespace phash::reader

#endif
