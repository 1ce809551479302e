#ifndef _PHASH_VALUE_
#define _PHASH_VALUE_

#include <stdint.h>
#include <array>
#include <complex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace phash
{
    struct value;

    struct none_t
    {
    };

    using bytes = std::vector<uint8_t>;
    using entry = std::pair<std::string, value>;
    using uuid_bytes = std::array<uint8_t, 16>;

    // Elements in original order.
    struct list_t
    {
        std::vector<value> items;
    };

    // Element order is irrelevant.
    struct set_t
    {
        std::vector<value> items;
    };

    // Unique keys. Key order is irrelevant.
    struct dict_t
    {
        std::vector<entry> entries;
    };

    // Unique keys in insertion order.
    struct odict_t
    {
        std::vector<entry> entries;
    };

    // Calendar range of timestamps. Years outside of it are rejected.
    constexpr int MIN_YEAR = 1;
    constexpr int MAX_YEAR = 9999;

    struct timestamp
    {
        int64_t seconds = 0;                   // Wall clock seconds since 1970-01-01T00:00:00.
        uint32_t microseconds = 0;             // Sub second fraction [0, 999999].
        std::optional<int32_t> utc_offset;     // Offset from UTC in seconds. Empty for naive timestamps.
    };

    struct uuid_value
    {
        uuid_bytes id;
    };

    // Reference to a directory tree on disk. Only the content of the tree is hashed.
    struct folder_ref
    {
        std::string path;
    };

    // A runtime object with no structural representation (eg. an open socket).
    struct opaque_t
    {
        std::string type_name;
    };

    struct value
    {
        std::variant<none_t, bool, int64_t, double, std::complex<double>, std::string, bytes,
                     list_t, set_t, dict_t, odict_t, timestamp, uuid_value, folder_ref, opaque_t>
            data;
    };

    value make_none();
    value make_bool(const bool v);
    value make_int(const int64_t v);
    value make_float(const double v);
    value make_complex(const double real, const double imag);
    value make_str(std::string_view v);
    value make_bytes(const bytes &v);
    value make_list(std::vector<value> items);
    value make_set(std::vector<value> items);
    value make_dict(std::vector<entry> entries);
    value make_odict(std::vector<entry> entries);
    int make_datetime(value &v, const int year, const int month, const int day,
                      const int hour = 0, const int minute = 0, const int second = 0,
                      const uint32_t microseconds = 0, std::optional<int32_t> utc_offset = std::nullopt);
    value make_uuid(const uuid_bytes &v);
    value make_folder(std::string_view path);
    value make_opaque(std::string_view type_name);

    int make_timestamp(timestamp &ts, const int year, const int month, const int day,
                       const int hour, const int minute, const int second,
                       const uint32_t microseconds, std::optional<int32_t> utc_offset);
    int64_t days_from_civil(int64_t year, const unsigned month, const unsigned day);
    int64_t epoch_microseconds(const timestamp &ts);
    int parse_uuid(uuid_bytes &uuid, std::string_view str);
    const char *type_name(const value &v);

} // namespace phash

#endif
