#pragma once
#include "Util.hpp"

class ScopedFileDescriptor
{
public:
    ScopedFileDescriptor() = default;
    ~ScopedFileDescriptor();

    ScopedFileDescriptor(const ScopedFileDescriptor&) = delete;
    ScopedFileDescriptor& operator=(const ScopedFileDescriptor&) = delete;

    [[nodiscard]] Result open(const std::string& path, int oflag, mode_t mode = 0);

    // Closes explicitly so the caller sees close() errors, which matter for writes on some filesystems (eg NFS)
    [[nodiscard]] Result close();

    bool isOpen() const { return this->fd >= 0; }
    int getFd() const;
    const std::string& getPath() const { return this->path; }

private:
    std::string path;
    int fd = -1;
};
