#ifndef _PHASH_HASH_H32_
#define _PHASH_HASH_H32_

#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <stdint.h>

namespace phash::hash
{

    // blake2b hash is 32 bytes which we store as 4 quad words
    // Originally from https://github.com/codetsunami/file-ptracer/blob/master/merkle.cpp
    struct h32
    {
        uint64_t data[4];

        bool operator==(const h32 rhs) const;
        bool operator!=(const h32 rhs) const;
        bool operator<(const h32 rhs) const;
        uint8_t *bytes();
        const uint8_t *bytes() const;
        std::string to_hex() const;
    };

    std::ostream &operator<<(std::ostream &output, const h32 &h);
    int h32_from_hex(h32 &hash, std::string_view hex);

} // namespace phash::hash

#endif
