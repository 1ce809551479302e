#include <algorithm>
#include <string>
#include <variant>
#include <vector>
#include "hasher.hpp"
#include "folder.hpp"
#include "make_hash.hpp"
#include "../tracelog.hpp"

namespace phash::hash
{
    /**
     * Walks a value and appends its leaf digests in canonical order. Every value category
     * has its own overload so the set of hashable categories is closed.
     */
    class digest_walker
    {
    private:
        std::vector<h32> &digests;
        const hash_options &options;

        int push(std::string_view tag, std::string_view payload = {});
        int push_real(std::string_view tag, const double v);
        int push_entry(const entry &e);
        int walk_unordered(const std::vector<entry> &entries);

    public:
        digest_walker(std::vector<h32> &digests, const hash_options &options);
        int walk(const value &v);

        int operator()(const none_t &v);
        int operator()(const bool v);
        int operator()(const int64_t v);
        int operator()(const double v);
        int operator()(const std::complex<double> &v);
        int operator()(const std::string &v);
        int operator()(const bytes &v);
        int operator()(const list_t &v);
        int operator()(const set_t &v);
        int operator()(const dict_t &v);
        int operator()(const odict_t &v);
        int operator()(const timestamp &v);
        int operator()(const uuid_value &v);
        int operator()(const folder_ref &v);
        int operator()(const opaque_t &v);
    };

    digest_walker::digest_walker(std::vector<h32> &digests, const hash_options &options)
        : digests(digests), options(options)
    {
    }

    int digest_walker::walk(const value &v)
    {
        return std::visit(*this, v.data);
    }

    int digest_walker::push(std::string_view tag, std::string_view payload)
    {
        h32 h;
        if (hasher::single_digest(h, tag, payload) == -1)
            return DIGEST_FAILURE;

        digests.push_back(h);
        return 0;
    }

    int digest_walker::push_real(std::string_view tag, const double v)
    {
        std::string text;
        if (hasher::float_to_text(text, v, options.float_precision) == -1)
            return INVALID_OPTIONS;

        return push(tag, text);
    }

    int digest_walker::push_entry(const entry &e)
    {
        int ret = push(hasher::TAG_STR, e.first);
        if (ret < 0)
            return ret;

        return walk(e.second);
    }

    int digest_walker::operator()(const none_t &)
    {
        return push(hasher::TAG_NONE);
    }

    int digest_walker::operator()(const bool v)
    {
        return push(hasher::TAG_BOOL, v ? std::string_view("\x01", 1) : std::string_view("\x00", 1));
    }

    int digest_walker::operator()(const int64_t v)
    {
        return push(hasher::TAG_INT, std::to_string(v));
    }

    int digest_walker::operator()(const double v)
    {
        return push_real(hasher::TAG_FLOAT, v);
    }

    int digest_walker::operator()(const std::complex<double> &v)
    {
        std::string real, imag;
        if (hasher::float_to_text(real, v.real(), options.float_precision) == -1 ||
            hasher::float_to_text(imag, v.imag(), options.float_precision) == -1)
            return INVALID_OPTIONS;

        // '!' never appears in a %g rendering so the two components cannot run into each other.
        return push(hasher::TAG_COMPLEX, real + "!" + imag);
    }

    int digest_walker::operator()(const std::string &v)
    {
        return push(hasher::TAG_STR, v);
    }

    // Byte strings share the text tag so a text and its utf-8 bytes hash the same.
    int digest_walker::operator()(const bytes &v)
    {
        return push(hasher::TAG_STR, std::string_view(reinterpret_cast<const char *>(v.data()), v.size()));
    }

    int digest_walker::operator()(const list_t &v)
    {
        int ret = push(hasher::TAG_LIST);
        if (ret < 0)
            return ret;

        for (const value &item : v.items)
        {
            if ((ret = walk(item)) < 0)
                return ret;
        }

        return push(hasher::TAG_END);
    }

    int digest_walker::operator()(const set_t &v)
    {
        // Hash every element on its own and order the elements by their digest sequences.
        std::vector<std::vector<h32>> elements(v.items.size());
        for (size_t i = 0; i < v.items.size(); i++)
        {
            digest_walker element_walker(elements[i], options);
            const int ret = element_walker.walk(v.items[i]);
            if (ret < 0)
                return ret;
        }

        std::sort(elements.begin(), elements.end());

        // Identical digest sequences belong to equal elements.
        elements.erase(std::unique(elements.begin(), elements.end()), elements.end());

        const int ret = push(hasher::TAG_SET);
        if (ret < 0)
            return ret;

        for (const std::vector<h32> &element : elements)
            digests.insert(digests.end(), element.begin(), element.end());

        return push(hasher::TAG_END);
    }

    int digest_walker::walk_unordered(const std::vector<entry> &entries)
    {
        // Entries are ordered by the digest of their key rather than the key itself.
        std::vector<std::pair<h32, const entry *>> keyed(entries.size());
        for (size_t i = 0; i < entries.size(); i++)
        {
            if (hasher::single_digest(keyed[i].first, hasher::TAG_STR, entries[i].first) == -1)
                return DIGEST_FAILURE;
            keyed[i].second = &entries[i];
        }

        std::stable_sort(keyed.begin(), keyed.end(),
                         [](const auto &a, const auto &b) { return a.first < b.first; });

        int ret = push(hasher::TAG_DICT);
        if (ret < 0)
            return ret;

        for (const auto &[key_hash, e] : keyed)
        {
            digests.push_back(key_hash);
            if ((ret = walk(e->second)) < 0)
                return ret;
        }

        return push(hasher::TAG_END);
    }

    int digest_walker::operator()(const dict_t &v)
    {
        return walk_unordered(v.entries);
    }

    int digest_walker::operator()(const odict_t &v)
    {
        if (options.treat_ordered_map_as_unordered)
            return walk_unordered(v.entries);

        int ret = push(hasher::TAG_ODICT);
        if (ret < 0)
            return ret;

        for (const entry &e : v.entries)
        {
            if ((ret = push_entry(e)) < 0)
                return ret;
        }

        return push(hasher::TAG_END);
    }

    int digest_walker::operator()(const timestamp &v)
    {
        // Seconds since the epoch including the sub second fraction.
        const double seconds = static_cast<double>(epoch_microseconds(v)) / 1000000;
        return push_real(hasher::TAG_DATETIME, seconds);
    }

    int digest_walker::operator()(const uuid_value &v)
    {
        return push(hasher::TAG_UUID, std::string_view(reinterpret_cast<const char *>(v.id.data()), v.id.size()));
    }

    int digest_walker::operator()(const folder_ref &v)
    {
        return folder_digests(digests, v.path, options);
    }

    int digest_walker::operator()(const opaque_t &v)
    {
        LOG_ERROR << "Value of type " << v.type_name << " cannot be hashed.";
        return UNHASHABLE_TYPE;
    }

    /**
     * Collects the leaf digests of a value in canonical order.
     * @param digests Vector to be populated with the leaf digests.
     * @param v The value to hash.
     * @param options Hash options.
     * @return 0 on success. Negative HASH_ERROR on failure. Digests are untouched on failure.
     */
    int collect_digests(std::vector<h32> &digests, const value &v, const hash_options &options)
    {
        if (options.float_precision < 1 || options.float_precision > MAX_FLOAT_PRECISION)
        {
            LOG_ERROR << "Invalid float precision " << options.float_precision;
            return INVALID_OPTIONS;
        }

        std::vector<h32> collected;
        digest_walker walker(collected, options);
        const int ret = walker.walk(v);
        if (ret < 0)
            return ret;

        digests.insert(digests.end(), collected.begin(), collected.end());
        return 0;
    }

    /**
     * Computes the combined digest of a value.
     * @return 0 on success. Negative HASH_ERROR on failure.
     */
    int make_digest(h32 &hash, const value &v, const hash_options &options)
    {
        std::vector<h32> digests;
        const int ret = collect_digests(digests, v, options);
        if (ret < 0)
            return ret;

        if (hasher::combine_digests(hash, digests) == -1)
            return DIGEST_FAILURE;

        LOG_DEBUG << "Hashed " << type_name(v) << " from " << digests.size() << " leaf digests.";
        return 0;
    }

    /**
     * Computes the combined digest of a value as a lowercase hex string.
     * @return 0 on success. Negative HASH_ERROR on failure. hex is untouched on failure.
     */
    int make_hash(std::string &hex, const value &v, const hash_options &options)
    {
        h32 hash;
        const int ret = make_digest(hash, v, options);
        if (ret < 0)
            return ret;

        hex = hash.to_hex();
        return 0;
    }

    const char *error_to_string(const int error)
    {
        switch (error)
        {
        case UNHASHABLE_TYPE:
            return "unhashable type";
        case IO_FAILURE:
            return "io failure";
        case INVALID_OPTIONS:
            return "invalid options";
        case DIGEST_FAILURE:
            return "digest failure";
        default:
            return "unknown error";
        }
    }

} // namespace phash::hash
