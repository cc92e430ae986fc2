#include "Util.hpp"
#include "Assert.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <cstring>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <unistd.h>
#include <dirent.h>

const char* errorKindName(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::InvalidDestination:
            return "InvalidDestination";
        case ErrorKind::IOError:
            return "IOError";
        case ErrorKind::SizeMismatch:
            return "SizeMismatch";
        case ErrorKind::VerifyMismatch:
            return "VerifyMismatch";
    }

    message_and_abort("unknown ErrorKind");
}

Result recursiveMkdir(const std::string& path, mode_t mode)
{
    auto mkdirOne = [mode](const char* onePath) -> Result
    {
        int err = retrySyscall([&]()
        {
            mkdir(onePath, mode);
        });

        if (err == EEXIST)
        {
            struct stat64 st = {};
            if (stat64(onePath, &st) != 0)
                return Error("Failed to stat \"" + std::string(onePath) + "\": \"" + strerror(errno) + "\"");
            if (!S_ISDIR(st.st_mode))
                return Error("Can't create directory \"" + std::string(onePath) + "\": a file with that name exists");
        }
        else if (err != 0)
        {
            return Error("Couldn't create directory \"" + std::string(onePath) + "\": \"" + strerror(err) + "\"");
        }

        return Success();
    };

    std::string copy(path);
    while (copy.size() > 1 && copy.back() == '/')
        copy.pop_back();

    for (size_t i = 1; i < copy.size(); i++)
    {
        if (copy[i] == '/' && copy[i - 1] != '/')
        {
            copy[i] = '\0';
            Result result = mkdirOne(copy.data());
            copy[i] = '/';

            if (std::holds_alternative<Error>(result))
                return result;
        }
    }

    return mkdirOne(copy.c_str());
}

OpenResult myOpen(const std::string& path, int oflag, mode_t mode)
{
    using namespace std::string_literals;

    int fd = -1;

    for (int32_t tries = 0; tries < 5; tries++)
    {
        fd = open(path.c_str(), oflag, mode);

        if (fd < 0 && (errno == EINTR || errno == EAGAIN))
            continue;

        break;
    }

    if (fd < 0)
        return Error("Couldn't open \""s + path + "\": \""s + strerror(errno) + "\""s);

    return fd;
}

Result myClose(int fd, const std::string& path)
{
    using namespace std::string_literals;

#   ifndef __linux__
#       error "Need to handle EINTR if this is ever ported. See notes here https://www.man7.org/linux/man-pages/man2/close.2.html"
#   endif

    int err = close(fd);

    if (err < 0)
        return Error("Failure on closing file \""s + path + "\": \""s + strerror(errno) + "\""s);

    return Success();
}

Result myStatx(int fd, const std::string& path, int flags, unsigned int mask, struct statx& buf)
{
    int ret = 0;
    int err = retrySyscall([&]()
    {
        ret = statx(fd, path.c_str(), flags, mask, &buf);
    });

    if (ret != 0)
    {
        ErrorKind kind = (err == ENOENT || err == ENOTDIR) ? ErrorKind::NotFound : ErrorKind::IOError;
        return Error(kind, "Failed to stat \"" + path + "\": \"" + strerror(err) + "\"");
    }

    return Success();
}

GetDentsResult myGetDents(int dfd, const std::string& path, void* buffer, size_t bufferSize)
{
    ssize_t retval = 0;
    int err = retrySyscall([&]()
    {
        retval = getdents64(dfd, buffer, bufferSize);
    });

    if (retval < 0)
        return Error("Couldn't read directory \"" + path + "\": \"" + strerror(err) + "\"");

    return size_t(retval);
}

size_t getLogicalCoreCount()
{
    long cores = sysconf(_SC_NPROCESSORS_ONLN);
    if (cores < 1)
        return 1;
    return size_t(cores);
}

std::string humanFriendlyFileSize(size_t bytes)
{
    size_t kibibyte = 1024;
    size_t mebibyte = kibibyte * 1024;
    size_t gibibyte = mebibyte * 1024;
    size_t tebibyte = gibibyte * 1024;

    double final = double(bytes);
    std::string unit = "B";

    if (bytes >= tebibyte)
    {
        final = double(bytes) / double(tebibyte);
        unit = "TiB";
    }
    else if (bytes >= gibibyte)
    {
        final = double(bytes) / double(gibibyte);
        unit = "GiB";
    }
    else if (bytes >= mebibyte)
    {
        final = double(bytes) / double(mebibyte);
        unit = "MiB";
    }
    else if (bytes >= kibibyte)
    {
        final = double(bytes) / double(kibibyte);
        unit = "KiB";
    }

    std::stringstream ss;
    ss << std::fixed << std::setprecision(2) << final;

    return ss.str() + " " + unit;
}

std::string humanFriendlyTime(double seconds)
{
    auto twoDigits = [](uint32_t value)
    {
        std::string str = std::to_string(value);
        if (str.size() < 2)
            str.insert(str.begin(), '0');
        return str;
    };

    double minute = 60;
    double hour = 60 * 60;

    uint32_t hours = uint32_t(std::floor(seconds / hour));
    seconds -= hours * hour;

    uint32_t minutes = uint32_t(std::floor(seconds / minute));
    seconds -= minutes * minute;

    if (hours > 0)
        return std::to_string(hours) + "h" + twoDigits(minutes) + "m";
    if (minutes > 0)
        return std::to_string(minutes) + "m" + twoDigits(uint32_t(std::floor(seconds))) + "s";

    std::stringstream ss;
    ss << std::fixed << std::setprecision(1) << seconds << "s";
    return ss.str();
}
