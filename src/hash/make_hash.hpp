#ifndef _PHASH_HASH_MAKE_HASH_
#define _PHASH_HASH_MAKE_HASH_

#include <string>
#include <unordered_set>
#include <vector>
#include "h32.hpp"
#include "../value.hpp"

namespace phash::hash
{
    // Number of significant digits kept when hashing real numbers.
    constexpr int FLOAT_PRECISION = 14;

    // Upper bound of the significant digits option. A double never needs more than 767.
    constexpr int MAX_FLOAT_PRECISION = 1000;

    // The key external stores use to attach a digest to a persisted record.
    constexpr const char *HASH_EXTRA_KEY = "_aiida_hash";

    enum HASH_ERROR
    {
        UNHASHABLE_TYPE = -1, // Value has no structural hashing rule.
        IO_FAILURE = -2,      // Folder content could not be listed or read.
        INVALID_OPTIONS = -3, // Hash options out of range.
        DIGEST_FAILURE = -4   // The blake2b primitive reported an error.
    };

    struct hash_options
    {
        int float_precision = FLOAT_PRECISION;
        bool treat_ordered_map_as_unordered = false;   // Hash ordered mappings as unordered ones.
        std::unordered_set<std::string> folder_ignore_names; // Entry names skipped at every folder level.
    };

    int make_hash(std::string &hex, const value &v, const hash_options &options = {});
    int make_digest(h32 &hash, const value &v, const hash_options &options = {});
    int collect_digests(std::vector<h32> &digests, const value &v, const hash_options &options = {});
    const char *error_to_string(const int error);

} // namespace phash::hash

#endif
