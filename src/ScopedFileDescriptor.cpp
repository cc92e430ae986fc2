#include <unistd.h>
#include "ScopedFileDescriptor.hpp"
#include "Assert.hpp"

ScopedFileDescriptor::~ScopedFileDescriptor()
{
    // Only reached with an open fd on error paths, where the original error is what gets reported
    if (this->isOpen())
        ::close(this->fd);
}

Result ScopedFileDescriptor::open(const std::string& openPath, int oflag, mode_t mode)
{
    debug_assert(!this->isOpen());

    OpenResult result = myOpen(openPath, oflag, mode);
    if (std::holds_alternative<Error>(result))
        return Error(std::move(std::get<Error>(result)));

    this->path = openPath;
    this->fd = std::get<int>(result);
    return Success();
}

Result ScopedFileDescriptor::close()
{
    debug_assert(this->isOpen());

    int closing = this->fd;
    this->fd = -1; // Even when close() returns an error, the file is always closed

    return myClose(closing, this->path);
}

int ScopedFileDescriptor::getFd() const
{
    debug_assert(this->isOpen());
    return this->fd;
}
