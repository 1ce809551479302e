#ifndef _PHASH_VERSION_
#define _PHASH_VERSION_

namespace version
{
    // phash version.
    constexpr const char *PHASH_VERSION = "1.0.0";

    // Version of the leaf tag and digest combination scheme. Digests only stay comparable
    // between builds with the same scheme version.
    constexpr const char *HASH_SCHEME_VERSION = "1";

} // namespace version

#endif
