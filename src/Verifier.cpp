#include "Verifier.hpp"
#include "Assert.hpp"
#include "IoRing.hpp"
#include "ScopedFileDescriptor.hpp"
#include <openssl/evp.h>
#include <fcntl.h>
#include <memory>

namespace
{
    struct EvpContextDeleter
    {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };

    using EvpContext = std::unique_ptr<EVP_MD_CTX, EvpContextDeleter>;
}

std::string digestToHex(const Sha256Digest& digest)
{
    static constexpr char hexDigits[] = "0123456789abcdef";

    std::string hex;
    hex.reserve(digest.size() * 2);
    for (uint8_t byte : digest)
    {
        hex.push_back(hexDigits[byte >> 4]);
        hex.push_back(hexDigits[byte & 0xF]);
    }
    return hex;
}

Verifier::Verifier(IoRing& ioRing, uint8_t* buffer, size_t bufferSize)
    : ioRing(ioRing)
    , buffer(buffer)
    , bufferSize(bufferSize)
{
    release_assert(this->buffer != nullptr && this->bufferSize > 0);
}

DigestResult Verifier::digestFile(const std::string& path)
{
    ScopedFileDescriptor fd;
    {
        Result result = fd.open(path, O_RDONLY | O_CLOEXEC);
        if (std::holds_alternative<Error>(result))
            return Error(std::move(std::get<Error>(result)));
    }

    EvpContext ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        return Error("Couldn't initialise SHA-256 for \"" + path + "\"");

    off_t offset = 0;
    while (true)
    {
        IoRing::IoResult readResult = this->ioRing.read(fd, this->buffer, this->bufferSize, offset);
        if (std::holds_alternative<Error>(readResult))
            return Error(std::move(std::get<Error>(readResult)));

        size_t bytesRead = std::get<size_t>(readResult);
        if (bytesRead == 0)
            break;

        if (EVP_DigestUpdate(ctx.get(), this->buffer, bytesRead) != 1)
            return Error("SHA-256 update failed for \"" + path + "\"");

        offset += off_t(bytesRead);
        this->bytesHashed += bytesRead;
    }

    Sha256Digest digest = {};
    unsigned int digestLength = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digestLength) != 1 || digestLength != digest.size())
        return Error("SHA-256 finalisation failed for \"" + path + "\"");

    Result closeResult = fd.close();
    if (std::holds_alternative<Error>(closeResult))
        return Error(std::move(std::get<Error>(closeResult)));

    return digest;
}

Result Verifier::verify(const std::string& sourcePath, const std::string& destinationPath)
{
    DigestResult sourceDigest = this->digestFile(sourcePath);
    if (std::holds_alternative<Error>(sourceDigest))
        return Error(std::move(std::get<Error>(sourceDigest)));

    DigestResult destinationDigest = this->digestFile(destinationPath);
    if (std::holds_alternative<Error>(destinationDigest))
        return Error(std::move(std::get<Error>(destinationDigest)));

    const Sha256Digest& a = std::get<Sha256Digest>(sourceDigest);
    const Sha256Digest& b = std::get<Sha256Digest>(destinationDigest);

    if (a != b)
    {
        return Error(ErrorKind::VerifyMismatch,
                     "Checksum mismatch for \"" + destinationPath + "\": source " + digestToHex(a) + ", destination " + digestToHex(b));
    }

    return Success();
}
