#include "IntegrityVerifier.hpp"
#include "FileHasher.hpp"
#include "RemoteOps.hpp"
#include "Logger.hpp"

#include <fstream>
#include <stdexcept>
#include <vector>
#include <cstring>

namespace FS = std::filesystem;

namespace IntegrityVerifier
{
    constexpr size_t COMPARE_CHUNK_SIZE = 8 * 1024;

    bool FilesAreIdentical(const FS::path& First, const FS::path& Second)
    {
        std::error_code Ec;
        uintmax_t FirstSize = FS::file_size(First, Ec);
        if (Ec)
        {
            throw std::runtime_error("Cannot stat " + First.string() + ": " + Ec.message());
        }
        uintmax_t SecondSize = FS::file_size(Second, Ec);
        if (Ec)
        {
            throw std::runtime_error("Cannot stat " + Second.string() + ": " + Ec.message());
        }
        if (FirstSize != SecondSize)
        {
            return false;
        }

        std::ifstream A(First, std::ios::binary);
        std::ifstream B(Second, std::ios::binary);
        if (!A || !B)
        {
            throw std::runtime_error("Cannot open " + (A ? Second : First).string() + " for comparison");
        }

        std::vector<char> BufA(COMPARE_CHUNK_SIZE);
        std::vector<char> BufB(COMPARE_CHUNK_SIZE);
        while (true)
        {
            A.read(BufA.data(), static_cast<std::streamsize>(BufA.size()));
            B.read(BufB.data(), static_cast<std::streamsize>(BufB.size()));
            if (A.bad() || B.bad())
            {
                throw std::runtime_error("Read error comparing " + First.string() + " and " + Second.string());
            }

            std::streamsize GotA = A.gcount();
            std::streamsize GotB = B.gcount();
            if (GotA != GotB || std::memcmp(BufA.data(), BufB.data(), static_cast<size_t>(GotA)) != 0)
            {
                return false;
            }
            if (GotA == 0)
            {
                return true;
            }
        }
    }

    bool MatchesRemote(const FS::path& Local, RemoteShell& Shell, const std::string& Host, const std::string& RemotePath)
    {
        std::string LocalDigest;
        try
        {
            LocalDigest = FileHasher::ContentSha256(Local);
        }
        catch (const std::exception& Ex)
        {
            throw std::runtime_error(std::string("local hash error: ") + Ex.what());
        }
        std::string RemoteDigest = RemoteOps::ComputeSha256(Shell, Host, RemotePath);

        if (LocalDigest != RemoteDigest)
        {
            Log.Warn("[Verifier] SHA-256 mismatch: " + Local.string() + " vs " + Host + ":" + RemotePath);
            return false;
        }
        Log.Info("[Verifier] Verified " + Host + ":" + RemotePath);
        return true;
    }
}
