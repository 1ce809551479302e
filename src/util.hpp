#ifndef _PHASH_UTIL_
#define _PHASH_UTIL_

#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>
#include <sys/stat.h>

// Read() buffer size used when loading file content.
constexpr size_t READ_BLOCK_SIZE = 65536;

namespace util
{
    // Directory entry names paired with their (symlink followed) stat.
    typedef std::vector<std::pair<std::string, struct stat>> dir_children;

    bool is_dir_exists(std::string_view path);
    const std::string join_path(std::string_view parent, std::string_view name);
    int get_dir_children(dir_children &children, const std::string &path,
                         const std::unordered_set<std::string> &skip_names = {});
    int read_file(std::string &content, const std::string &path);

} // namespace util

#endif
