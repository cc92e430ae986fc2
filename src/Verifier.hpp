#pragma once
#include <array>
#include <string>
#include <cstdint>
#include "Util.hpp"

class IoRing;

using Sha256Digest = std::array<uint8_t, 32>;
using DigestResult = std::variant<Error, Sha256Digest>;

std::string digestToHex(const Sha256Digest& digest);

// Compares a copied file against its source by SHA-256. Both files are streamed through the caller's buffer, so memory
// use is bounded by the copy buffer size no matter how large the files are.
class Verifier
{
public:
    Verifier(IoRing& ioRing, uint8_t* buffer, size_t bufferSize);

    [[nodiscard]] DigestResult digestFile(const std::string& path);

    // Fails with ErrorKind::VerifyMismatch when the digests differ, ErrorKind::IOError when either file can't be read
    [[nodiscard]] Result verify(const std::string& sourcePath, const std::string& destinationPath);

    // Bytes read by the digest passes so far
    size_t getBytesHashed() const { return this->bytesHashed; }

private:
    IoRing& ioRing;
    uint8_t* buffer;
    size_t bufferSize;
    size_t bytesHashed = 0;
};
