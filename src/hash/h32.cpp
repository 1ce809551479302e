#include <string.h>
#include <iomanip>
#include "h32.hpp"

/**
 * Based on https://github.com/codetsunami/file-ptracer/blob/master/merkle.cpp
 */
namespace phash::hash
{
    /**
     * Helper functions for working with 32 byte hash type h32.
     */

    bool h32::operator==(const h32 rhs) const
    {
        return this->data[0] == rhs.data[0] && this->data[1] == rhs.data[1] && this->data[2] == rhs.data[2] && this->data[3] == rhs.data[3];
    }

    bool h32::operator!=(const h32 rhs) const
    {
        return this->data[0] != rhs.data[0] || this->data[1] != rhs.data[1] || this->data[2] != rhs.data[2] || this->data[3] != rhs.data[3];
    }

    /**
     * Orders digests by their raw byte sequence. Quad word comparison would depend on
     * host endianness so we compare bytes.
     */
    bool h32::operator<(const h32 rhs) const
    {
        return memcmp(this->bytes(), rhs.bytes(), sizeof(h32)) < 0;
    }

    uint8_t *h32::bytes()
    {
        return reinterpret_cast<uint8_t *>(data);
    }

    const uint8_t *h32::bytes() const
    {
        return reinterpret_cast<const uint8_t *>(data);
    }

    std::string h32::to_hex() const
    {
        std::stringstream ss;
        ss << *this;
        return ss.str();
    }

    std::ostream &operator<<(std::ostream &output, const h32 &h)
    {
        const uint8_t *buf = h.bytes();
        for (size_t i = 0; i < sizeof(h32); i++)
            output << std::hex << std::setfill('0') << std::setw(2) << (int)buf[i];

        output << std::dec;
        return output;
    }

    /**
     * Populates the hash from its 64 character hex representation (either case).
     * @return 0 on success. -1 if the hex string is malformed.
     */
    int h32_from_hex(h32 &hash, std::string_view hex)
    {
        if (hex.size() != sizeof(h32) * 2)
            return -1;

        h32 parsed;
        uint8_t *buf = parsed.bytes();
        for (size_t i = 0; i < sizeof(h32); i++)
        {
            int nibbles[2];
            for (int j = 0; j < 2; j++)
            {
                const char c = hex[i * 2 + j];
                if (c >= '0' && c <= '9')
                    nibbles[j] = c - '0';
                else if (c >= 'a' && c <= 'f')
                    nibbles[j] = c - 'a' + 10;
                else if (c >= 'A' && c <= 'F')
                    nibbles[j] = c - 'A' + 10;
                else
                    return -1;
            }
            buf[i] = (uint8_t)((nibbles[0] << 4) | nibbles[1]);
        }

        hash = parsed;
        return 0;
    }

} // namespace phash::hash
