#pragma once
#include <string>
#include <memory>
#include <variant>
#include <functional>
#include <cerrno>
#include <cstdint>
#include <sys/types.h>

struct statx;

enum class ErrorKind : uint8_t
{
    NotFound,
    InvalidDestination,
    IOError,
    SizeMismatch,
    VerifyMismatch,
};

const char* errorKindName(ErrorKind kind);

class Error
{
public:
    ErrorKind kind;
    std::unique_ptr<std::string> humanFriendlyErrorMessage;

    Error() = delete;
    explicit Error(std::string&& message) : Error(ErrorKind::IOError, std::move(message)) {}
    Error(ErrorKind kind, std::string&& message)
        : kind(kind)
        , humanFriendlyErrorMessage(std::make_unique<std::string>(std::move(message)))
    {}

    const std::string& message() const { return *this->humanFriendlyErrorMessage; }
};

using Result = std::variant<Error, std::nullptr_t>;
static constexpr std::nullptr_t Success() { return nullptr; }

// Creates path and any missing parents. An already existing directory is not an error.
[[nodiscard]] Result recursiveMkdir(const std::string& path, mode_t mode = 0777);

using OpenResult = std::variant<Error, int>;
[[nodiscard]] OpenResult myOpen(const std::string& path, int oflag, mode_t mode);
[[nodiscard]] Result myClose(int fd, const std::string& path);

[[maybe_unused]] static int retrySyscall(const std::function<void(void)>& func)
{
    errno = 0;
    for (int32_t tries = 0; tries < 5; tries++)
    {
        func();

        if (errno == EINTR || errno == EAGAIN)
            continue;

        break;
    }

    return errno;
}

// Taken from the manpage for getdents64() https://man7.org/linux/man-pages/man2/getdents64.2.html
struct linux_dirent64
{
    ino64_t             d_ino;    /* 64-bit inode number */
    off64_t             d_off;    /* 64-bit offset to next structure */
    unsigned short      d_reclen; /* Size of this dirent */
    unsigned char       d_type;   /* File type */
    __extension__ char  d_name[]; /* Filename (null-terminated). __extension__ allows use of flexible array members in g++ (normally only allowed in plain C) */
};

using GetDentsResult = std::variant<Error, size_t>;
[[nodiscard]] GetDentsResult myGetDents(int dfd, const std::string& path, void* buffer, size_t bufferSize);

// Unlike the other wrappers, a missing path is reported with ErrorKind::NotFound
[[nodiscard]] Result myStatx(int fd, const std::string& path, int flags, unsigned int mask, struct statx& buf);

size_t getLogicalCoreCount();

std::string humanFriendlyFileSize(size_t bytes);
std::string humanFriendlyTime(double seconds);
