#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace cloudpan::client
{

    inline constexpr const char *kAccessTokenVariable = "CLOUDPAN_ACCESS_TOKEN";

    struct Credentials
    {
        std::string access_token;
        std::string refresh_token;
    };

    std::filesystem::path default_credentials_path();

    // Reads {"access_token": ..., "refresh_token": ...} from `path` (or the
    // default location). CLOUDPAN_ACCESS_TOKEN, when set, wins over the file.
    // Throws std::runtime_error when no access token can be found.
    Credentials load_credentials(const std::optional<std::filesystem::path> &path);

    Credentials parse_credentials(const std::string &text);

} // namespace cloudpan::client
