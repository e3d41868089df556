/**
 * CloudPan - Content digests built on OpenSSL.
 *
 * The service deduplicates uploads by SHA-1: the whole file, the first 128 KiB
 * of it, and (for second-factor signing) an arbitrary inclusive byte range.
 * Every digest is rendered as upper-case hex.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cloudpan::crypto
{

    inline constexpr std::uint64_t kPrefixDigestBytes = 128 * 1024;

    struct FileDigests
    {
        std::uint64_t size{};
        std::string whole;
        std::string prefix;
    };

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    // Single streaming pass producing both the whole-file and the prefix digest.
    FileDigests digest_file(const std::filesystem::path &path);

    // Inclusive range [first, last]. Throws if the file ends before `last`.
    std::string hash_file_range(const std::filesystem::path &path, std::uint64_t first, std::uint64_t last);

    std::vector<std::byte> hmac_sha1(std::string_view key, std::string_view data);

    std::string to_hex(std::span<const unsigned char> data);

} // namespace cloudpan::crypto
