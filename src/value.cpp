#include <string.h>
#include <unordered_map>
#include "value.hpp"

namespace phash
{
    /**
     * Collapses entries with repeated keys. The first occurrence keeps its position and
     * receives the value of the last occurrence.
     */
    void unique_entries(std::vector<entry> &entries)
    {
        std::unordered_map<std::string, size_t> positions;
        std::vector<entry> unique;
        unique.reserve(entries.size());

        for (entry &e : entries)
        {
            const auto [itr, inserted] = positions.try_emplace(e.first, unique.size());
            if (inserted)
                unique.push_back(std::move(e));
            else
                unique[itr->second].second = std::move(e.second);
        }

        entries = std::move(unique);
    }

    value make_none()
    {
        return value{none_t{}};
    }

    value make_bool(const bool v)
    {
        return value{v};
    }

    value make_int(const int64_t v)
    {
        return value{v};
    }

    value make_float(const double v)
    {
        return value{v};
    }

    value make_complex(const double real, const double imag)
    {
        return value{std::complex<double>(real, imag)};
    }

    value make_str(std::string_view v)
    {
        return value{std::string(v)};
    }

    value make_bytes(const bytes &v)
    {
        return value{v};
    }

    value make_list(std::vector<value> items)
    {
        return value{list_t{std::move(items)}};
    }

    value make_set(std::vector<value> items)
    {
        return value{set_t{std::move(items)}};
    }

    value make_dict(std::vector<entry> entries)
    {
        unique_entries(entries);
        return value{dict_t{std::move(entries)}};
    }

    value make_odict(std::vector<entry> entries)
    {
        unique_entries(entries);
        return value{odict_t{std::move(entries)}};
    }

    /**
     * Builds a timestamp from calendar fields.
     * @param ts The timestamp to be populated. Untouched on failure.
     * @param utc_offset Offset from UTC in seconds, less than a day either way. Empty for naive timestamps.
     * @return 0 on success. -1 if any field is out of range.
     */
    int make_timestamp(timestamp &ts, const int year, const int month, const int day,
                       const int hour, const int minute, const int second,
                       const uint32_t microseconds, std::optional<int32_t> utc_offset)
    {
        static const int month_days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

        if (year < MIN_YEAR || year > MAX_YEAR || month < 1 || month > 12 || day < 1 ||
            hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59 ||
            microseconds > 999999)
            return -1;

        const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        if (day > month_days[month - 1] + (month == 2 && leap ? 1 : 0))
            return -1;

        if (utc_offset.has_value() && (*utc_offset <= -86400 || *utc_offset >= 86400))
            return -1;

        ts.seconds = days_from_civil(year, month, day) * 86400 + hour * 3600 + minute * 60 + second;
        ts.microseconds = microseconds;
        ts.utc_offset = utc_offset;
        return 0;
    }

    /**
     * Builds a timestamp value from calendar fields.
     * @param v The value to be populated. Untouched on failure.
     * @return 0 on success. -1 if any field is out of range.
     */
    int make_datetime(value &v, const int year, const int month, const int day,
                      const int hour, const int minute, const int second,
                      const uint32_t microseconds, std::optional<int32_t> utc_offset)
    {
        timestamp ts;
        if (make_timestamp(ts, year, month, day, hour, minute, second, microseconds, utc_offset) == -1)
            return -1;

        v = value{ts};
        return 0;
    }

    value make_uuid(const uuid_bytes &v)
    {
        return value{uuid_value{v}};
    }

    value make_folder(std::string_view path)
    {
        return value{folder_ref{std::string(path)}};
    }

    value make_opaque(std::string_view type_name)
    {
        return value{opaque_t{std::string(type_name)}};
    }

    /**
     * Number of days between 1970-01-01 and the given proleptic gregorian date.
     * Based on http://howardhinnant.github.io/date_algorithms.html#days_from_civil
     */
    int64_t days_from_civil(int64_t year, const unsigned month, const unsigned day)
    {
        year -= month <= 2;
        const int64_t era = (year >= 0 ? year : year - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(year - era * 400);                // [0, 399]
        const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1; // [0, 365]
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;                  // [0, 146096]
        return era * 146097 + static_cast<int64_t>(doe) - 719468;
    }

    /**
     * Microseconds since the UNIX epoch. Naive timestamps are taken as UTC.
     */
    int64_t epoch_microseconds(const timestamp &ts)
    {
        const int64_t utc_seconds = ts.seconds - ts.utc_offset.value_or(0);
        return utc_seconds * 1000000 + ts.microseconds;
    }

    /**
     * Parses the canonical 8-4-4-4-12 hex form of a uuid. Braces and a "urn:uuid:" prefix
     * are not accepted.
     * @return 0 on success. -1 if the string is malformed.
     */
    int parse_uuid(uuid_bytes &uuid, std::string_view str)
    {
        if (str.size() != 36)
            return -1;

        uuid_bytes parsed;
        size_t pos = 0;
        for (size_t i = 0; i < parsed.size(); i++)
        {
            if (pos == 8 || pos == 13 || pos == 18 || pos == 23)
            {
                if (str[pos] != '-')
                    return -1;
                pos++;
            }

            uint8_t byte = 0;
            for (int j = 0; j < 2; j++, pos++)
            {
                const char c = str[pos];
                byte <<= 4;
                if (c >= '0' && c <= '9')
                    byte |= c - '0';
                else if (c >= 'a' && c <= 'f')
                    byte |= c - 'a' + 10;
                else if (c >= 'A' && c <= 'F')
                    byte |= c - 'A' + 10;
                else
                    return -1;
            }
            parsed[i] = byte;
        }

        uuid = parsed;
        return 0;
    }

    const char *type_name(const value &v)
    {
        static const char *names[] = {"none", "bool", "int", "float", "complex", "str", "bytes",
                                      "list", "set", "dict", "odict", "datetime", "uuid", "folder", "opaque"};
        return names[v.data.index()];
    }

} // namespace phash
