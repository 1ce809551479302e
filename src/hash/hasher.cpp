#include <blake2.h>
#include <string.h>
#include <stdio.h>
#include <math.h>
#include <errno.h>
#include "hasher.hpp"
#include "../tracelog.hpp"

namespace phash::hash::hasher
{
    /**
     * All digests are derived with the blake2b tree parameters of the unlimited fanout
     * hashing protocol described in https://blake2.net/blake2_20130129.pdf
     * Leaves are hashed at node depth 0 and the combined digest is taken at node depth 1.
     */
    constexpr uint8_t FANOUT = 0;        // Unlimited fanout.
    constexpr uint8_t DEPTH = 2;         // Fixed tree depth.
    constexpr uint8_t INNER_LENGTH = 64; // Inner hash length of the tree nodes.

    /**
     * Initializes a blake2b state with the tree parameters used for all digests.
     * @param state The state to initialize.
     * @param node_depth Tree node depth. 0 for leaves.
     * @param last_node Whether the state hashes the last node of its level.
     * @param tag Personalization string. Must not exceed the blake2b personalization size.
     * @return 0 on success. -1 on failure.
     */
    int init_state(blake2b_state &state, const uint8_t node_depth, const bool last_node, std::string_view tag)
    {
        if (tag.size() > BLAKE2B_PERSONALBYTES)
        {
            LOG_ERROR << "Hash tag too long: " << tag;
            return -1;
        }

        blake2b_param param;
        memset(&param, 0, sizeof(param));
        param.digest_length = sizeof(h32);
        param.key_length = 0;
        param.fanout = FANOUT;
        param.depth = DEPTH;
        param.node_depth = node_depth;
        param.inner_length = INNER_LENGTH;
        if (!tag.empty())
            memcpy(param.personal, tag.data(), tag.size());

        if (blake2b_init_param(&state, &param) < 0)
        {
            LOG_ERROR << "blake2b state init failed.";
            return -1;
        }

        if (last_node)
            state.last_node = 1;

        return 0;
    }

    /**
     * Hashes a single leaf payload with the given tag bound as personalization.
     * Equal payloads with different tags never produce the same digest.
     * @return 0 on success. -1 on failure.
     */
    int single_digest(h32 &hash, std::string_view tag, const void *buf, const size_t len)
    {
        blake2b_state state;
        if (init_state(state, 0, false, tag) == -1 ||
            blake2b_update(&state, reinterpret_cast<const uint8_t *>(buf), len) < 0 ||
            blake2b_final(&state, hash.bytes(), sizeof(h32)) < 0)
            return -1;

        return 0;
    }

    int single_digest(h32 &hash, std::string_view tag, std::string_view payload)
    {
        return single_digest(hash, tag, payload.data(), payload.size());
    }

    /**
     * Folds the leaf digest sequence into one digest. The accumulator runs as the last node
     * at depth 1 and the sequence is closed with an empty last leaf node.
     * @param hash The combined digest.
     * @param digests Leaf digests in canonical order.
     * @return 0 on success. -1 on failure.
     */
    int combine_digests(h32 &hash, const std::vector<h32> &digests)
    {
        blake2b_state final_state;
        if (init_state(final_state, 1, true, {}) == -1)
            return -1;

        for (const h32 &sub : digests)
        {
            if (blake2b_update(&final_state, sub.bytes(), sizeof(h32)) < 0)
                return -1;
        }

        // Add an empty last leaf node.
        h32 last_leaf;
        blake2b_state leaf_state;
        if (init_state(leaf_state, 0, true, {}) == -1 ||
            blake2b_final(&leaf_state, last_leaf.bytes(), sizeof(h32)) < 0 ||
            blake2b_update(&final_state, last_leaf.bytes(), sizeof(h32)) < 0 ||
            blake2b_final(&final_state, hash.bytes(), sizeof(h32)) < 0)
        {
            LOG_ERROR << "blake2b digest combination failed.";
            return -1;
        }

        return 0;
    }

    /**
     * Renders a real number with a fixed number of significant digits in general notation.
     * Values equal within the precision render to the same text.
     * @param text String to be populated with the rendering. Untouched on failure.
     * @param value The value to render.
     * @param sig Number of significant digits.
     * @return 0 on success. -1 if the value cannot be rendered at the given precision.
     */
    int float_to_text(std::string &text, const double value, const int sig)
    {
        // The sign bit of a nan carries no meaning and some libc versions print it.
        if (isnan(value))
        {
            text = "nan";
            return 0;
        }

        const int len = snprintf(NULL, 0, "%.*g", sig, value);
        if (len < 0)
        {
            LOG_ERROR << errno << ": Error rendering real with precision " << sig;
            return -1;
        }

        std::string rendered(len + 1, '\0');
        if (snprintf(rendered.data(), rendered.size(), "%.*g", sig, value) != len)
        {
            LOG_ERROR << "Inconsistent real rendering with precision " << sig;
            return -1;
        }

        rendered.resize(len);
        text = std::move(rendered);
        return 0;
    }

} // namespace phash::hash::hasher
