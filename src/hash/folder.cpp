#include <sys/stat.h>
#include <algorithm>
#include <string>
#include <vector>
#include "folder.hpp"
#include "hasher.hpp"
#include "../tracelog.hpp"
#include "../util.hpp"

namespace phash::hash
{
    /**
     * Appends the digests of a folder tree. The name of the folder itself never takes part,
     * only its content.
     * @param digests Vector to be populated with the folder leaf digests.
     * @param path Path of the folder on disk.
     * @param options Hash options. Entries named in folder_ignore_names are skipped.
     * @return 0 on success. Negative HASH_ERROR on failure.
     */
    int folder_digests(std::vector<h32> &digests, const std::string &path, const hash_options &options)
    {
        if (!util::is_dir_exists(path))
        {
            LOG_ERROR << "Folder " << path << " does not exist.";
            return IO_FAILURE;
        }

        h32 folder_hash;
        if (hasher::single_digest(folder_hash, hasher::TAG_FOLDER) == -1)
            return DIGEST_FAILURE;

        std::vector<h32> collected{folder_hash};
        const int ret = folder_content_digests(collected, path, options);
        if (ret < 0)
            return ret;

        digests.insert(digests.end(), collected.begin(), collected.end());
        LOG_DEBUG << "Folder " << path << " hashed into " << collected.size() << " digests.";
        return 0;
    }

    /**
     * Walks the entries of a folder in name order. Files contribute their name and content,
     * sub folders their name followed by their own content and the close marker.
     */
    int folder_content_digests(std::vector<h32> &digests, const std::string &path, const hash_options &options)
    {
        util::dir_children children;
        if (util::get_dir_children(children, path, options.folder_ignore_names) == -1)
            return IO_FAILURE;

        std::sort(children.begin(), children.end(),
                  [](const auto &a, const auto &b) { return a.first < b.first; });

        for (const auto &[name, st] : children)
        {
            const std::string child_path = util::join_path(path, name);
            h32 h;

            if (S_ISREG(st.st_mode))
            {
                if (hasher::single_digest(h, hasher::TAG_FNAME, name) == -1)
                    return DIGEST_FAILURE;
                digests.push_back(h);

                std::string content;
                if (util::read_file(content, child_path) == -1)
                    return IO_FAILURE;

                if (hasher::single_digest(h, hasher::TAG_FCONTENT, content) == -1)
                    return DIGEST_FAILURE;
                digests.push_back(h);
            }
            else if (S_ISDIR(st.st_mode))
            {
                if (hasher::single_digest(h, hasher::TAG_DIR, name) == -1)
                    return DIGEST_FAILURE;
                digests.push_back(h);

                const int ret = folder_content_digests(digests, child_path, options);
                if (ret < 0)
                    return ret;

                if (hasher::single_digest(h, hasher::TAG_END) == -1)
                    return DIGEST_FAILURE;
                digests.push_back(h);
            }
            else
            {
                LOG_ERROR << "Unsupported folder entry type " << child_path;
                return IO_FAILURE;
            }
        }

        return 0;
    }

} // namespace phash::hash
