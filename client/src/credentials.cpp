#include "cloudpan/client/credentials.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace cloudpan::client
{

    std::filesystem::path default_credentials_path()
    {
#ifdef _WIN32
        if (const char *appdata = std::getenv("APPDATA"))
        {
            return std::filesystem::path(appdata) / "CloudPan" / "credentials.json";
        }
#endif
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".cloudpan" / "credentials.json";
        }
        return std::filesystem::path(".cloudpan") / "credentials.json";
    }

    Credentials parse_credentials(const std::string &text)
    {
        const auto json = nlohmann::json::parse(text, nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            throw std::runtime_error("Credentials file is not a JSON object");
        }
        Credentials credentials;
        credentials.access_token = json.value("access_token", std::string{});
        credentials.refresh_token = json.value("refresh_token", std::string{});
        return credentials;
    }

    Credentials load_credentials(const std::optional<std::filesystem::path> &path)
    {
        Credentials credentials;
        const auto file = path.value_or(default_credentials_path());
        if (std::filesystem::exists(file))
        {
            std::ifstream in(file);
            if (!in.is_open())
            {
                throw std::runtime_error("Cannot open credentials file " + file.string());
            }
            const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            credentials = parse_credentials(text);
        }
        else if (path)
        {
            throw std::runtime_error("Credentials file not found: " + file.string());
        }

        if (const char *token = std::getenv(kAccessTokenVariable); token != nullptr && *token != '\0')
        {
            credentials.access_token = token;
        }
        if (credentials.access_token.empty())
        {
            throw std::runtime_error("No access token: set " + std::string(kAccessTokenVariable) + " or write " +
                                     file.string());
        }
        return credentials;
    }

} // namespace cloudpan::client
