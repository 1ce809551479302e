#include <ctype.h>
#include <errno.h>
#include <stdlib.h>
#include <string>
#include <unordered_set>
#include "value_reader.hpp"
#include "../tracelog.hpp"

namespace phash::reader
{
    value_reader::value_reader(std::string_view text) : text(text)
    {
    }

    /**
     * Reads the entire text as a single value.
     * @param v The value to be populated. Untouched on failure.
     * @return 0 on success. -1 on failure with the reason available via get_error().
     */
    int value_reader::read(value &v)
    {
        value parsed;
        if (read_value(parsed) == -1)
            return -1;

        skip_whitespace();
        if (pos != text.size())
            return fail("Unexpected trailing characters");

        v = std::move(parsed);
        return 0;
    }

    const std::string &value_reader::get_error() const
    {
        return error;
    }

    void value_reader::skip_whitespace()
    {
        while (pos < text.size() && isspace((unsigned char)text[pos]))
            pos++;
    }

    bool value_reader::peek(const char c)
    {
        skip_whitespace();
        return pos < text.size() && text[pos] == c;
    }

    bool value_reader::consume(const char c)
    {
        if (!peek(c))
            return false;

        pos++;
        return true;
    }

    int value_reader::fail(std::string_view message)
    {
        error = std::string(message).append(" at offset ").append(std::to_string(pos));
        LOG_DEBUG << "Value read failed. " << error;
        return -1;
    }

    int value_reader::read_value(value &v)
    {
        skip_whitespace();
        if (depth >= MAX_NESTING_DEPTH)
            return fail("Nesting deeper than " + std::to_string(MAX_NESTING_DEPTH) + " levels");

        depth++;
        const int ret = read_any(v);
        depth--;
        return ret;
    }

    int value_reader::read_any(value &v)
    {
        if (pos >= text.size())
            return fail("Unexpected end of input");

        const char c = text[pos];
        if (c == '[')
            return read_list(v);

        if (c == '{')
            return read_braced(v, false, false);

        if (c == '"')
        {
            std::string str;
            if (read_string(str) == -1)
                return -1;
            v = make_str(str);
            return 0;
        }

        if (c == 'b' && pos + 1 < text.size() && text[pos + 1] == '"')
        {
            pos++;
            std::string str;
            if (read_string(str) == -1)
                return -1;
            v = make_bytes(bytes(str.begin(), str.end()));
            return 0;
        }

        if (isdigit((unsigned char)c) || c == '-' || c == '+' || c == '.')
            return read_number(v);

        if (!isalpha((unsigned char)c))
            return fail("Unexpected character");

        const size_t word_start = pos;
        std::string word;
        read_word(word);

        if (word == "none")
        {
            v = make_none();
        }
        else if (word == "true" || word == "false")
        {
            v = make_bool(word == "true");
        }
        else if (word == "inf" || word == "nan")
        {
            pos = word_start;
            return read_number(v);
        }
        else if (word == "set" || word == "odict")
        {
            if (!peek('{'))
                return fail("Expected '{'");
            return read_braced(v, word == "set", word == "odict");
        }
        else if (word == "complex")
        {
            return read_complex(v);
        }
        else if (word == "datetime")
        {
            return read_datetime(v);
        }
        else if (word == "uuid" || word == "folder" || word == "opaque")
        {
            std::string str;
            if (read_tagged_string(str) == -1)
                return -1;

            if (word == "uuid")
            {
                uuid_bytes uuid;
                if (parse_uuid(uuid, str) == -1)
                    return fail("Invalid uuid");
                v = make_uuid(uuid);
            }
            else if (word == "folder")
            {
                v = make_folder(str);
            }
            else
            {
                v = make_opaque(str);
            }
        }
        else
        {
            pos = word_start;
            return fail("Unknown word '" + word + "'");
        }

        return 0;
    }

    void value_reader::read_word(std::string &word)
    {
        const size_t start = pos;
        while (pos < text.size() && (isalpha((unsigned char)text[pos]) || text[pos] == '_'))
            pos++;

        word = std::string(text.substr(start, pos - start));
    }

    /**
     * Reads an integer or a real. Numbers with a decimal point or an exponent are reals.
     */
    int value_reader::read_number(value &v)
    {
        const size_t start = pos;
        if (text[pos] == '-' || text[pos] == '+')
            pos++;

        bool is_real = false;
        if (pos < text.size() && isalpha((unsigned char)text[pos]))
        {
            std::string word;
            read_word(word);
            if (word != "inf" && word != "nan")
            {
                pos = start;
                return fail("Invalid number");
            }
            is_real = true;
        }
        else
        {
            while (pos < text.size())
            {
                const char c = text[pos];
                if (c == '.' || c == 'e' || c == 'E')
                    is_real = true;
                else if ((c == '-' || c == '+') && (text[pos - 1] == 'e' || text[pos - 1] == 'E'))
                    is_real = true;
                else if (!isdigit((unsigned char)c))
                    break;
                pos++;
            }
        }

        const std::string token(text.substr(start, pos - start));
        char *end = NULL;
        errno = 0;

        if (is_real)
        {
            const double d = strtod(token.c_str(), &end);
            if (end != token.c_str() + token.size())
            {
                pos = start;
                return fail("Invalid real '" + token + "'");
            }
            v = make_float(d);
        }
        else
        {
            const long long i = strtoll(token.c_str(), &end, 10);
            if (end != token.c_str() + token.size() || token.empty())
            {
                pos = start;
                return fail("Invalid integer '" + token + "'");
            }
            if (errno == ERANGE)
            {
                pos = start;
                return fail("Integer out of range '" + token + "'");
            }
            v = make_int(i);
        }

        return 0;
    }

    int value_reader::read_real(double &d)
    {
        skip_whitespace();
        if (pos >= text.size())
            return fail("Unexpected end of input");

        value v;
        if (read_number(v) == -1)
            return -1;

        if (const int64_t *i = std::get_if<int64_t>(&v.data))
            d = static_cast<double>(*i);
        else
            d = std::get<double>(v.data);

        return 0;
    }

    /**
     * Reads a double quoted string. Supports \" \\ \n \r and \t escapes.
     */
    int value_reader::read_string(std::string &str)
    {
        if (pos >= text.size() || text[pos] != '"')
            return fail("Expected '\"'");
        pos++;

        std::string result;
        while (pos < text.size() && text[pos] != '"')
        {
            char c = text[pos++];
            if (c == '\\')
            {
                if (pos >= text.size())
                    break;

                const char escaped = text[pos++];
                if (escaped == 'n')
                    c = '\n';
                else if (escaped == 't')
                    c = '\t';
                else if (escaped == 'r')
                    c = '\r';
                else if (escaped == '"' || escaped == '\\')
                    c = escaped;
                else
                {
                    pos--;
                    return fail("Invalid escape sequence");
                }
            }
            result.push_back(c);
        }

        if (pos >= text.size())
            return fail("Unterminated string");

        pos++; // Closing quote.
        str = std::move(result);
        return 0;
    }

    int value_reader::read_list(value &v)
    {
        pos++; // '['
        std::vector<value> items;

        if (!consume(']'))
        {
            while (true)
            {
                value item;
                if (read_value(item) == -1)
                    return -1;
                items.push_back(std::move(item));

                if (consume(','))
                    continue;
                if (consume(']'))
                    break;
                return fail("Expected ',' or ']'");
            }
        }

        v = make_list(std::move(items));
        return 0;
    }

    /**
     * Reads a braced container. Without a prefix word "{}" is an empty mapping and the
     * presence of ':' after the first element decides between mapping and set.
     */
    int value_reader::read_braced(value &v, const bool force_set, const bool ordered)
    {
        pos++; // '{'

        if (consume('}'))
        {
            if (force_set)
                v = make_set({});
            else if (ordered)
                v = make_odict({});
            else
                v = make_dict({});
            return 0;
        }

        const size_t first_start = pos;
        value first;
        if (read_value(first) == -1)
            return -1;

        if (!force_set && consume(':'))
        {
            const std::string *key = std::get_if<std::string>(&first.data);
            if (key == NULL)
            {
                pos = first_start;
                return fail("Mapping keys must be text");
            }

            std::vector<entry> entries;
            if (read_entries(entries, *key) == -1)
                return -1;

            v = ordered ? make_odict(std::move(entries)) : make_dict(std::move(entries));
            return 0;
        }

        if (ordered)
            return fail("Expected ':'");

        std::vector<value> items;
        items.push_back(std::move(first));
        if (read_set_items(items) == -1)
            return -1;

        v = make_set(std::move(items));
        return 0;
    }

    int value_reader::read_entries(std::vector<entry> &entries, std::string first_key)
    {
        std::unordered_set<std::string> keys;
        std::string key = std::move(first_key);

        while (true)
        {
            if (!keys.emplace(key).second)
                return fail("Duplicate key '" + key + "'");

            value val;
            if (read_value(val) == -1)
                return -1;
            entries.emplace_back(key, std::move(val));

            if (consume('}'))
                return 0;
            if (!consume(','))
                return fail("Expected ',' or '}'");

            if (!peek('"'))
                return fail("Expected text key");
            if (read_string(key) == -1)
                return -1;
            if (!consume(':'))
                return fail("Expected ':'");
        }
    }

    int value_reader::read_set_items(std::vector<value> &items)
    {
        while (true)
        {
            if (consume('}'))
                return 0;
            if (!consume(','))
                return fail("Expected ',' or '}'");

            value item;
            if (read_value(item) == -1)
                return -1;
            items.push_back(std::move(item));
        }
    }

    int value_reader::read_tagged_string(std::string &str)
    {
        if (!consume('('))
            return fail("Expected '('");
        if (!peek('"'))
            return fail("Expected '\"'");
        if (read_string(str) == -1)
            return -1;
        if (!consume(')'))
            return fail("Expected ')'");
        return 0;
    }

    int value_reader::read_complex(value &v)
    {
        double real, imag;
        if (!consume('('))
            return fail("Expected '('");
        if (read_real(real) == -1)
            return -1;
        if (!consume(','))
            return fail("Expected ','");
        if (read_real(imag) == -1)
            return -1;
        if (!consume(')'))
            return fail("Expected ')'");

        v = make_complex(real, imag);
        return 0;
    }

    int value_reader::read_datetime(value &v)
    {
        const size_t start = pos;
        std::string str;
        if (read_tagged_string(str) == -1)
            return -1;

        timestamp ts;
        if (parse_datetime(ts, str) == -1)
        {
            pos = start;
            return fail("Invalid datetime '" + str + "'");
        }

        v = value{ts};
        return 0;
    }

    /**
     * Parses an ISO 8601 timestamp: YYYY-MM-DD[(T| )HH:MM:SS[.ffffff]][Z|+HH:MM|-HH:MM]
     * A timestamp without a zone designator is naive.
     * @return 0 on success. -1 if the text is malformed or out of range.
     */
    int parse_datetime(timestamp &ts, std::string_view str)
    {
        size_t p = 0;
        const auto read_digits = [&](const size_t count, int &out) {
            if (p + count > str.size())
                return false;

            out = 0;
            for (size_t i = 0; i < count; i++, p++)
            {
                if (!isdigit((unsigned char)str[p]))
                    return false;
                out = out * 10 + (str[p] - '0');
            }
            return true;
        };
        const auto expect = [&](const char c) {
            if (p >= str.size() || str[p] != c)
                return false;
            p++;
            return true;
        };

        int year, month, day, hour = 0, minute = 0, second = 0, microseconds = 0;
        if (!read_digits(4, year) || !expect('-') || !read_digits(2, month) || !expect('-') || !read_digits(2, day))
            return -1;

        if (p < str.size() && (str[p] == 'T' || str[p] == ' '))
        {
            p++;
            if (!read_digits(2, hour) || !expect(':') || !read_digits(2, minute) || !expect(':') || !read_digits(2, second))
                return -1;

            if (expect('.'))
            {
                int digits = 0;
                while (p < str.size() && isdigit((unsigned char)str[p]) && digits < 6)
                {
                    microseconds = microseconds * 10 + (str[p++] - '0');
                    digits++;
                }
                if (digits == 0)
                    return -1;
                for (; digits < 6; digits++)
                    microseconds *= 10;
            }
        }

        std::optional<int32_t> utc_offset;
        if (expect('Z'))
        {
            utc_offset = 0;
        }
        else if (p < str.size() && (str[p] == '+' || str[p] == '-'))
        {
            const int sign = str[p++] == '-' ? -1 : 1;
            int offset_hour, offset_minute;
            if (!read_digits(2, offset_hour) || !expect(':') || !read_digits(2, offset_minute) ||
                offset_hour > 23 || offset_minute > 59)
                return -1;
            utc_offset = sign * (offset_hour * 3600 + offset_minute * 60);
        }

        if (p != str.size())
            return -1;

        return make_timestamp(ts, year, month, day, hour, minute, second, microseconds, utc_offset);
    }

    /**
     * Reads a value literal.
     * @param v The value to be populated.
     * @param text The literal text.
     * @param error Populated with the failure reason and offset.
     * @return 0 on success. -1 on failure.
     */
    int read_value(value &v, std::string_view text, std::string &error)
    {
        value_reader reader(text);
        if (reader.read(v) == -1)
        {
            error = reader.get_error();
            return -1;
        }

        return 0;
    }

} // namespace phash::reader
