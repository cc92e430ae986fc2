#include "PathPlanner.hpp"
#include "Assert.hpp"
#include "ScopedFileDescriptor.hpp"
#include <algorithm>
#include <cstring>
#include <deque>
#include <filesystem>
#include <fcntl.h>
#include <dirent.h>
#include <sys/stat.h>

namespace
{
    // basename of the path as the user sees it, so "src/", "src/." and "/abs/src" all give "src"
    std::string baseName(const std::string& path)
    {
        std::error_code ec;
        std::filesystem::path p = std::filesystem::absolute(path, ec);
        if (ec)
            p = path;

        p = p.lexically_normal();
        if (!p.has_filename()) // This is needed to account for a trailing slash
            p = p.parent_path();

        return p.filename().string();
    }

    std::string joinPath(const std::string& directory, const std::string& name)
    {
        if (!directory.empty() && directory.back() == '/')
            return directory + name;
        return directory + "/" + name;
    }

    bool isSameOrInside(const std::filesystem::path& inner, const std::filesystem::path& outer)
    {
        std::filesystem::path relative = inner.lexically_relative(outer);
        return !relative.empty() && *relative.begin() != "..";
    }

    int statPath(const std::string& path, struct statx& buf)
    {
        int ret = 0;
        int err = retrySyscall([&]()
        {
            ret = statx(AT_FDCWD, path.c_str(), 0, STATX_BASIC_STATS, &buf);
        });
        return ret == 0 ? 0 : err;
    }

    CopyTask makeDirectoryTask(std::string source, std::string destination)
    {
        CopyTask task;
        task.sourcePath = std::move(source);
        task.destinationPath = std::move(destination);
        task.kind = CopyTask::Kind::Directory;
        task.mode = 0777; // masked by umask, and never read-only so the files that follow can be written
        return task;
    }

    CopyTask makeFileTask(std::string source, std::string destination, const struct statx& st)
    {
        CopyTask task;
        task.sourcePath = std::move(source);
        task.destinationPath = std::move(destination);
        task.sizeBytes = st.stx_size;
        task.kind = CopyTask::Kind::File;
        task.mode = st.stx_mode & 07777;
        return task;
    }
}

PathPlanner::PathPlanner()
{
    this->dirBuffer.resize(256 * 1024);
}

PlanResult PathPlanner::plan(const std::string& source, const std::string& destination)
{
    if (source.empty())
        return Error(ErrorKind::NotFound, "Source path is empty");
    if (destination.empty())
        return Error(ErrorKind::InvalidDestination, "Destination path is empty");

    struct statx sourceStat = {};
    {
        Result result = myStatx(AT_FDCWD, source, 0, STATX_BASIC_STATS, sourceStat);
        if (std::holds_alternative<Error>(result))
        {
            Error& error = std::get<Error>(result);
            if (error.kind == ErrorKind::NotFound)
                return Error(ErrorKind::NotFound, "Source path \"" + source + "\" does not exist");
            return std::move(error);
        }
    }

    struct statx destStat = {};
    int destStatResult = statPath(destination, destStat);
    if (destStatResult != 0 && destStatResult != ENOENT)
    {
        return Error(ErrorKind::InvalidDestination,
                     "Can't use destination \"" + destination + "\": \"" + strerror(destStatResult) + "\"");
    }

    bool destinationExists = destStatResult == 0;
    bool destinationIsDirectory = destinationExists && S_ISDIR(destStat.stx_mode);

    CopyPlan plan;
    plan.sourceRoot = source;

    if (S_ISDIR(sourceStat.stx_mode))
    {
        if (destinationExists && !destinationIsDirectory)
            return Error(ErrorKind::InvalidDestination, "Cannot copy directory \"" + source + "\" onto file \"" + destination + "\"");

        // Copying into an existing directory puts the source inside it, otherwise the destination becomes the copy
        std::string destinationRoot = destination;
        std::string name = baseName(source);
        if (destinationIsDirectory && !name.empty())
        {
            destinationRoot = joinPath(destination, name);

            struct statx rootStat = {};
            if (statPath(destinationRoot, rootStat) == 0 && !S_ISDIR(rootStat.stx_mode))
                return Error(ErrorKind::InvalidDestination, "Cannot copy directory \"" + source + "\" onto file \"" + destinationRoot + "\"");
        }

        {
            std::error_code ec;
            std::filesystem::path canonicalSource = std::filesystem::canonical(source, ec);
            std::filesystem::path canonicalDestination;
            if (!ec)
                canonicalDestination = std::filesystem::weakly_canonical(destinationRoot, ec);

            if (!ec && isSameOrInside(canonicalDestination, canonicalSource))
                return Error(ErrorKind::InvalidDestination, "Cannot copy directory \"" + source + "\" into itself (\"" + destinationRoot + "\")");
        }

        Result result = this->planDirectory(source, destinationRoot, plan);
        if (std::holds_alternative<Error>(result))
            return Error(std::move(std::get<Error>(result)));

        plan.destinationRoot = destinationRoot;
    }
    else if (S_ISREG(sourceStat.stx_mode))
    {
        // A trailing slash names a directory, even one that doesn't exist yet
        bool destinationNamesDirectory = destinationIsDirectory || (!destinationExists && destination.back() == '/');

        Result result = this->planSingleFile(source, sourceStat, destination, destinationNamesDirectory, plan);
        if (std::holds_alternative<Error>(result))
            return Error(std::move(std::get<Error>(result)));
    }
    else
    {
        return Error("\"" + source + "\" is not a regular file or directory");
    }

    for (const CopyTask& task : plan.tasks)
    {
        if (task.kind == CopyTask::Kind::File)
        {
            plan.fileCount++;
            plan.byteCount += task.sizeBytes;
        }
    }

    return plan;
}

Result PathPlanner::planSingleFile(const std::string& source, const struct statx& sourceStat,
                                   const std::string& destination, bool destinationIsDirectory, CopyPlan& plan)
{
    std::string destinationFile = destination;
    if (destinationIsDirectory)
        destinationFile = joinPath(destination, baseName(source));

    std::string parent = std::filesystem::path(destinationFile).parent_path().string();
    if (parent.empty())
        parent = ".";

    struct statx parentStat = {};
    int parentStatResult = statPath(parent, parentStat);
    if (parentStatResult == ENOENT)
    {
        plan.tasks.emplace_back(makeDirectoryTask("", parent));
    }
    else if (parentStatResult != 0)
    {
        return Error(ErrorKind::InvalidDestination,
                     "Can't use destination \"" + destinationFile + "\": \"" + strerror(parentStatResult) + "\"");
    }
    else if (!S_ISDIR(parentStat.stx_mode))
    {
        return Error(ErrorKind::InvalidDestination, "Can't use destination \"" + destinationFile + "\": \"" + parent + "\" is not a directory");
    }

    struct statx existingStat = {};
    if (statPath(destinationFile, existingStat) == 0)
    {
        if (S_ISDIR(existingStat.stx_mode))
            return Error(ErrorKind::InvalidDestination, "Cannot overwrite directory \"" + destinationFile + "\" with a file");

        bool sameFile = existingStat.stx_dev_major == sourceStat.stx_dev_major &&
                        existingStat.stx_dev_minor == sourceStat.stx_dev_minor &&
                        existingStat.stx_ino == sourceStat.stx_ino;
        if (sameFile)
            return Error(ErrorKind::InvalidDestination, "\"" + source + "\" and \"" + destinationFile + "\" are the same file");
    }

    plan.destinationRoot = destinationFile;
    plan.tasks.emplace_back(makeFileTask(source, destinationFile, sourceStat));

    return Success();
}

Result PathPlanner::planDirectory(const std::string& source, const std::string& destinationRoot, CopyPlan& plan)
{
    std::string from = source;
    if (from.back() != '/')
        from += '/';
    std::string dest = destinationRoot;
    if (dest.back() != '/')
        dest += '/';

    plan.tasks.emplace_back(makeDirectoryTask(source, destinationRoot));

    std::vector<CopyTask> fileTasks;

    // Breadth first, so every directory task lands after the task for its parent
    std::deque<std::string> pendingDirectories;
    pendingDirectories.emplace_back(from);

    std::vector<DirectoryEntry> entries;

    while (!pendingDirectories.empty())
    {
        std::string current = std::move(pendingDirectories.front());
        pendingDirectories.pop_front();

        entries.clear();
        {
            Result result = this->readDirectory(current, entries);
            if (std::holds_alternative<Error>(result))
                return result;
        }

        std::sort(entries.begin(), entries.end(), [](const DirectoryEntry& a, const DirectoryEntry& b) { return a.name < b.name; });

        for (const DirectoryEntry& entry : entries)
        {
            std::string fullPath = current + entry.name;
            std::string destPath = dest + (fullPath.data() + from.length());

            unsigned char type = entry.type;
            struct statx sb = {};

            if (type == DT_UNKNOWN)
            {
                Result result = myStatx(AT_FDCWD, fullPath, AT_SYMLINK_NOFOLLOW, STATX_BASIC_STATS, sb);
                if (std::holds_alternative<Error>(result))
                {
                    if (std::get<Error>(result).kind != ErrorKind::NotFound)
                        return result;

                    plan.skipped.emplace_back("\"" + fullPath + "\": vanished while planning");
                    continue;
                }

                if (S_ISDIR(sb.stx_mode))
                    type = DT_DIR;
                else if (S_ISREG(sb.stx_mode))
                    type = DT_REG;
                else if (S_ISLNK(sb.stx_mode))
                    type = DT_LNK;
                else
                    type = DT_FIFO; // anything else is skipped below
            }

            if (type == DT_DIR)
            {
                plan.tasks.emplace_back(makeDirectoryTask(fullPath, destPath));
                fullPath += '/';
                pendingDirectories.emplace_back(std::move(fullPath));
            }
            else if (type == DT_REG || type == DT_LNK)
            {
                // statx without AT_SYMLINK_NOFOLLOW, so symlinked files are copied by content
                Result result = myStatx(AT_FDCWD, fullPath, 0, STATX_BASIC_STATS, sb);
                if (std::holds_alternative<Error>(result))
                {
                    if (std::get<Error>(result).kind != ErrorKind::NotFound)
                        return result;

                    plan.skipped.emplace_back("\"" + fullPath + "\": " + (type == DT_LNK ? "dangling symbolic link" : "vanished while planning"));
                    continue;
                }

                if (S_ISREG(sb.stx_mode))
                    fileTasks.emplace_back(makeFileTask(fullPath, destPath, sb));
                else if (S_ISDIR(sb.stx_mode))
                    plan.skipped.emplace_back("\"" + fullPath + "\": symbolic link to a directory is not followed");
                else
                    plan.skipped.emplace_back("\"" + fullPath + "\": not a regular file or directory");
            }
            else
            {
                plan.skipped.emplace_back("\"" + fullPath + "\": not a regular file or directory");
            }
        }
    }

    for (CopyTask& task : fileTasks)
        plan.tasks.emplace_back(std::move(task));

    return Success();
}

Result PathPlanner::readDirectory(const std::string& path, std::vector<DirectoryEntry>& entries)
{
    ScopedFileDescriptor directoryFd;
    {
        Result result = directoryFd.open(path, O_RDONLY | O_DIRECTORY | O_CLOEXEC, 0);
        if (std::holds_alternative<Error>(result))
            return result;
    }

    size_t written = 0;
    do
    {
        {
            GetDentsResult result = myGetDents(directoryFd.getFd(), path, this->dirBuffer.data(), this->dirBuffer.size());
            if (std::holds_alternative<Error>(result))
                return Error(std::move(std::get<Error>(result)));

            written = std::get<size_t>(result);
        }

        uint8_t* nextPtr = this->dirBuffer.data();
        while (nextPtr < this->dirBuffer.data() + written)
        {
            linux_dirent64* currentEntry = reinterpret_cast<linux_dirent64*>(nextPtr);
            nextPtr += currentEntry->d_reclen;

            if (strcmp(currentEntry->d_name, ".") == 0 || strcmp(currentEntry->d_name, "..") == 0)
                continue;

            entries.emplace_back(DirectoryEntry{currentEntry->d_name, currentEntry->d_type});
        }
    } while (written != 0);

    return directoryFd.close();
}
