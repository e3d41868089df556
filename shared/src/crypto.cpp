#include "cloudpan/crypto.hpp"

#include <algorithm>
#include <fstream>
#include <memory>

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "cloudpan/error_codes.hpp"

namespace cloudpan::crypto
{

    namespace
    {

        constexpr std::size_t kReadBufferBytes = 64 * 1024;

        struct DigestContextDeleter
        {
            void operator()(EVP_MD_CTX *ctx) const noexcept
            {
                EVP_MD_CTX_free(ctx);
            }
        };

        using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

        // Incremental SHA-1 over an EVP context.
        class Sha1
        {
        public:
            Sha1() : ctx_(EVP_MD_CTX_new())
            {
                if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha1(), nullptr) != 1)
                {
                    throw ApiError(ErrorCode::InternalError, "EVP_DigestInit_ex failed");
                }
            }

            void update(const void *data, std::size_t size)
            {
                if (size == 0)
                {
                    return;
                }
                if (EVP_DigestUpdate(ctx_.get(), data, size) != 1)
                {
                    throw ApiError(ErrorCode::InternalError, "EVP_DigestUpdate failed");
                }
            }

            std::string final_hex()
            {
                unsigned char digest[EVP_MAX_MD_SIZE];
                unsigned int length = 0;
                if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1)
                {
                    throw ApiError(ErrorCode::InternalError, "EVP_DigestFinal_ex failed");
                }
                return to_hex(std::span<const unsigned char>(digest, length));
            }

        private:
            DigestContext ctx_;
        };

        std::ifstream open_for_hashing(const std::filesystem::path &path)
        {
            std::ifstream file(path, std::ios::binary);
            if (!file.is_open())
            {
                throw ApiError(ErrorCode::LocalIo, "Failed to open file for hashing: " + path.string());
            }
            return file;
        }

        void throw_if_read_failed(const std::ifstream &file, const std::filesystem::path &path)
        {
            if (file.bad())
            {
                throw ApiError(ErrorCode::LocalIo, "Read error while hashing: " + path.string());
            }
        }

    } // namespace

    std::string to_hex(std::span<const unsigned char> data)
    {
        static constexpr char kHexDigits[] = "0123456789ABCDEF";
        std::string result;
        result.resize(data.size() * 2);
        for (std::size_t i = 0; i < data.size(); ++i)
        {
            const auto byte = data[i];
            result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
            result[2 * i + 1] = kHexDigits[byte & 0x0F];
        }
        return result;
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        Sha1 sha;
        sha.update(data.data(), data.size());
        return sha.final_hex();
    }

    std::string hash_stream(std::istream &input)
    {
        Sha1 sha;
        std::vector<char> buffer(kReadBufferBytes);
        while (input)
        {
            input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            sha.update(buffer.data(), static_cast<std::size_t>(input.gcount()));
        }
        if (input.bad())
        {
            throw ApiError(ErrorCode::LocalIo, "Read error while hashing stream");
        }
        return sha.final_hex();
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        auto file = open_for_hashing(path);
        return hash_stream(file);
    }

    FileDigests digest_file(const std::filesystem::path &path)
    {
        auto file = open_for_hashing(path);
        Sha1 whole;
        Sha1 prefix;
        std::uint64_t consumed = 0;
        std::vector<char> buffer(kReadBufferBytes);

        while (file)
        {
            file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(file.gcount());
            if (read_count == 0)
            {
                break;
            }
            whole.update(buffer.data(), read_count);
            if (consumed < kPrefixDigestBytes)
            {
                const auto prefix_part = static_cast<std::size_t>(
                    std::min<std::uint64_t>(read_count, kPrefixDigestBytes - consumed));
                prefix.update(buffer.data(), prefix_part);
            }
            consumed += read_count;
        }
        throw_if_read_failed(file, path);

        return FileDigests{
            .size = consumed,
            .whole = whole.final_hex(),
            .prefix = prefix.final_hex(),
        };
    }

    std::string hash_file_range(const std::filesystem::path &path, std::uint64_t first, std::uint64_t last)
    {
        if (last < first)
        {
            throw ApiError(ErrorCode::InvalidArgument, "Invalid byte range for hashing");
        }
        auto file = open_for_hashing(path);
        file.seekg(static_cast<std::streamoff>(first));
        if (!file)
        {
            throw ApiError(ErrorCode::LocalIo, "Failed to seek while hashing: " + path.string());
        }

        Sha1 sha;
        std::uint64_t remaining = last - first + 1;
        std::vector<char> buffer(kReadBufferBytes);
        while (remaining > 0)
        {
            const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
            file.read(buffer.data(), static_cast<std::streamsize>(wanted));
            const auto read_count = static_cast<std::size_t>(file.gcount());
            if (read_count == 0)
            {
                throw_if_read_failed(file, path);
                throw ApiError(ErrorCode::LocalIo, "File ended before requested range: " + path.string());
            }
            sha.update(buffer.data(), read_count);
            remaining -= read_count;
        }
        return sha.final_hex();
    }

    std::vector<std::byte> hmac_sha1(std::string_view key, std::string_view data)
    {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int length = 0;
        if (HMAC(EVP_sha1(), key.data(), static_cast<int>(key.size()),
                 reinterpret_cast<const unsigned char *>(data.data()), data.size(), digest, &length) == nullptr)
        {
            throw ApiError(ErrorCode::InternalError, "HMAC-SHA1 failed");
        }
        std::vector<std::byte> result(length);
        std::transform(digest, digest + length, result.begin(), [](unsigned char byte)
                       { return static_cast<std::byte>(byte); });
        return result;
    }

} // namespace cloudpan::crypto
