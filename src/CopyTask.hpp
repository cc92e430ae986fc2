#pragma once
#include <string>
#include <optional>
#include <chrono>
#include <sys/types.h>
#include "Util.hpp"

struct CopyTask
{
    enum class Kind : uint8_t
    {
        File,
        Directory,
    };

    std::string sourcePath;
    std::string destinationPath;
    size_t sizeBytes = 0;
    Kind kind = Kind::File;
    mode_t mode = 0644;
};

struct TaskResult
{
    enum class Status : uint8_t
    {
        Success,
        Failed,
        VerifyMismatch,
    };

    CopyTask task;
    Status status = Status::Success;
    std::optional<Error> error;
    size_t bytesTransferred = 0;
    std::chrono::steady_clock::duration duration = {};

    bool succeeded() const { return this->status == Status::Success; }
};
