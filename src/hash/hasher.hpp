#ifndef _PHASH_HASH_HASHER_
#define _PHASH_HASH_HASHER_

#include <string>
#include <string_view>
#include <vector>
#include "h32.hpp"

namespace phash::hash::hasher
{
    // Leaf tags bound into the digest derivation as blake2b personalization.
    constexpr const char *TAG_STR = "str";
    constexpr const char *TAG_BOOL = "bool";
    constexpr const char *TAG_NONE = "none";
    constexpr const char *TAG_INT = "int";
    constexpr const char *TAG_FLOAT = "float";
    constexpr const char *TAG_COMPLEX = "complex";
    constexpr const char *TAG_LIST = "list(";
    constexpr const char *TAG_SET = "set(";
    constexpr const char *TAG_DICT = "dict(";
    constexpr const char *TAG_ODICT = "odict(";
    constexpr const char *TAG_DATETIME = "datetime";
    constexpr const char *TAG_UUID = "uuid";
    constexpr const char *TAG_FOLDER = "folder";
    constexpr const char *TAG_FNAME = "fname";
    constexpr const char *TAG_FCONTENT = "fcontent";
    constexpr const char *TAG_DIR = "dir(";
    constexpr const char *TAG_END = ")";

    int single_digest(h32 &hash, std::string_view tag, const void *buf, const size_t len);
    int single_digest(h32 &hash, std::string_view tag, std::string_view payload = {});
    int combine_digests(h32 &hash, const std::vector<h32> &digests);
    int float_to_text(std::string &text, const double value, const int sig);

} // namespace phash::hash::hasher

#endif
