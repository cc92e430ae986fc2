#pragma once
#include <string>
#include <vector>
#include "CopyTask.hpp"
#include "Util.hpp"

struct CopyPlan
{
    std::string sourceRoot;
    std::string destinationRoot;

    // All Directory tasks come first, parents before children, then all File tasks
    std::vector<CopyTask> tasks;

    size_t fileCount = 0;
    size_t byteCount = 0;

    // Human readable notes for entries that were left out (sockets, fifos, devices, symlinks to directories, ...)
    std::vector<std::string> skipped;
};

using PlanResult = std::variant<Error, CopyPlan>;

// Turns a source / destination pair into the full list of copy tasks. Planning only reads the file system, nothing is
// created until the tasks run, so a failed plan leaves no trace behind.
class PathPlanner
{
public:
    PathPlanner();

    PathPlanner(const PathPlanner&) = delete;
    PathPlanner& operator=(const PathPlanner&) = delete;

    [[nodiscard]] PlanResult plan(const std::string& source, const std::string& destination);

private:
    struct DirectoryEntry
    {
        std::string name;
        unsigned char type;
    };

    [[nodiscard]] Result planSingleFile(const std::string& source, const struct statx& sourceStat,
                                        const std::string& destination, bool destinationIsDirectory, CopyPlan& plan);
    [[nodiscard]] Result planDirectory(const std::string& source, const std::string& destinationRoot, CopyPlan& plan);

    [[nodiscard]] Result readDirectory(const std::string& path, std::vector<DirectoryEntry>& entries);

private:
    std::vector<uint8_t> dirBuffer;
};
