#include "FileHasher.hpp"

#include <blake3.h>
#include <openssl/evp.h>

#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>
#include <cstdint>

namespace
{
    constexpr size_t HASH_CHUNK_SIZE = 64 * 1024;

    struct DigestContextDeleter
    {
        void operator()(EVP_MD_CTX* Ctx) const { EVP_MD_CTX_free(Ctx); }
    };
}

std::string FileHasher::ToHex(const unsigned char* Data, size_t Length)
{
    static const char Digits[] = "0123456789abcdef";
    std::string Hex;
    Hex.reserve(Length * 2);
    for (size_t i = 0; i < Length; ++i)
    {
        Hex.push_back(Digits[Data[i] >> 4]);
        Hex.push_back(Digits[Data[i] & 0x0F]);
    }
    return Hex;
}

std::string FileHasher::ContentSha256(const std::filesystem::path& FilePath)
{
    std::ifstream In(FilePath, std::ios::binary);
    if (!In)
    {
        throw std::runtime_error("Cannot open for hashing: " + FilePath.string());
    }

    std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> Ctx(EVP_MD_CTX_new());
    if (!Ctx || EVP_DigestInit_ex(Ctx.get(), EVP_sha256(), nullptr) != 1)
    {
        throw std::runtime_error("SHA-256 initialisation failed");
    }

    std::vector<char> Buffer(HASH_CHUNK_SIZE);
    while (In)
    {
        In.read(Buffer.data(), static_cast<std::streamsize>(Buffer.size()));
        std::streamsize Got = In.gcount();
        if (Got > 0 && EVP_DigestUpdate(Ctx.get(), Buffer.data(), static_cast<size_t>(Got)) != 1)
        {
            throw std::runtime_error("SHA-256 update failed");
        }
    }
    if (In.bad())
    {
        throw std::runtime_error("Read error while hashing: " + FilePath.string());
    }

    unsigned char Digest[EVP_MAX_MD_SIZE];
    unsigned int DigestLength = 0;
    if (EVP_DigestFinal_ex(Ctx.get(), Digest, &DigestLength) != 1)
    {
        throw std::runtime_error("SHA-256 finalisation failed");
    }
    return ToHex(Digest, DigestLength);
}

std::string FileHasher::PathFingerprint(const std::string& Host, const std::string& RemotePath)
{
    std::vector<uint8_t> Buffer;
    Buffer.insert(Buffer.end(), Host.begin(), Host.end());
    Buffer.push_back(':');
    Buffer.insert(Buffer.end(), RemotePath.begin(), RemotePath.end());

    uint8_t OutHash[16] = { 0 };

    blake3_hasher Hasher;
    blake3_hasher_init(&Hasher);
    blake3_hasher_update(&Hasher, Buffer.data(), Buffer.size());
    blake3_hasher_finalize(&Hasher, OutHash, sizeof(OutHash));

    return ToHex(OutHash, sizeof(OutHash));
}
