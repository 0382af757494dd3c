#pragma once

#include <filesystem>
#include <string>

class FileHasher
{
public:
    // Lowercase hex SHA-256 of the file contents. Throws std::runtime_error on I/O or digest failure.
    static std::string ContentSha256(const std::filesystem::path& FilePath);

    // Short BLAKE3 fingerprint of "host:path", used to name staged copies
    static std::string PathFingerprint(const std::string& Host, const std::string& RemotePath);

    static std::string ToHex(const unsigned char* Data, size_t Length);
};
