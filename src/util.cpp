#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <dirent.h>
#include <errno.h>
#include <string.h>
#include <string>
#include "util.hpp"
#include "tracelog.hpp"

namespace util
{

    bool is_dir_exists(std::string_view path)
    {
        struct stat st;
        return (stat(std::string(path).c_str(), &st) == 0 && S_ISDIR(st.st_mode));
    }

    const std::string join_path(std::string_view parent, std::string_view name)
    {
        std::string path(parent);
        if (path.empty() || path.back() != '/')
            path.append("/");
        path.append(name);
        return path;
    }

    /**
     * Lists the immediate children of a directory. "." and ".." are excluded. The stat of each
     * child follows symbolic links.
     * @param children List to be populated with the child names and stats.
     * @param path Directory path.
     * @param skip_names Child names left out of the listing. They are never stat'ed.
     * @return Returns 0 on success. -1 if the directory or any child cannot be read.
     */
    int get_dir_children(dir_children &children, const std::string &path,
                         const std::unordered_set<std::string> &skip_names)
    {
        DIR *dir = opendir(path.c_str());
        if (dir == NULL)
        {
            LOG_ERROR << errno << ": Error opening dir " << path;
            return -1;
        }

        dir_children found;
        int ret = 0;
        errno = 0;
        dirent *de;
        while ((de = readdir(dir)) != NULL)
        {
            if (strcmp(de->d_name, ".") == 0 || strcmp(de->d_name, "..") == 0 ||
                skip_names.count(de->d_name) > 0)
                continue;

            struct stat st;
            const std::string child_path = join_path(path, de->d_name);
            if (stat(child_path.c_str(), &st) == -1)
            {
                LOG_ERROR << errno << ": Error in stat of " << child_path;
                ret = -1;
                break;
            }

            found.emplace_back(de->d_name, st);
        }

        if (ret == 0 && errno != 0)
        {
            LOG_ERROR << errno << ": Error reading dir " << path;
            ret = -1;
        }

        closedir(dir);

        if (ret == 0)
            children = std::move(found);
        return ret;
    }

    /**
     * Reads the entire content of a file.
     * @param content String to be populated with the file bytes.
     * @param path File path.
     * @return Returns 0 on success. -1 on error.
     */
    int read_file(std::string &content, const std::string &path)
    {
        const int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd == -1)
        {
            LOG_ERROR << errno << ": Error opening file " << path;
            return -1;
        }

        std::string buf;
        char block[READ_BLOCK_SIZE];
        while (true)
        {
            const ssize_t res = read(fd, block, READ_BLOCK_SIZE);
            if (res == -1)
            {
                if (errno == EINTR)
                    continue;

                LOG_ERROR << errno << ": Error reading file " << path;
                close(fd);
                return -1;
            }

            if (res == 0)
                break;

            buf.append(block, res);
        }

        close(fd);
        content = std::move(buf);
        return 0;
    }

} // namespace util
