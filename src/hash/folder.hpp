#ifndef _PHASH_HASH_FOLDER_
#define _PHASH_HASH_FOLDER_

#include <string>
#include <vector>
#include "h32.hpp"
#include "make_hash.hpp"

namespace phash::hash
{
    int folder_digests(std::vector<h32> &digests, const std::string &path, const hash_options &options);
    int folder_content_digests(std::vector<h32> &digests, const std::string &path, const hash_options &options);

} // namespace phash::hash

#endif
