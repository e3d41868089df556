#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cloudpan/api.hpp"
#include "cloudpan/client/downloader.hpp"
#include "cloudpan/client/uploader.hpp"

namespace cloudpan::client
{

    enum class Command : std::uint8_t
    {
        Upload,
        Download,
        List,
        Info,
        Mkdir,
        Copy,
        Move,
        Rename,
        Remove,
        Search,
        Trash,
        WhoAmI,
        Version,
        Help
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    struct ClientConfig
    {
        std::optional<std::filesystem::path> log_path;
        std::optional<std::filesystem::path> credentials_path;
        std::string api_base{api::kDefaultApiBase};
        std::chrono::seconds timeout{60};

        Command command{Command::Help};
        std::vector<std::string> arguments;

        api::RemoteId upload_target{api::kRootFolderId};
        UploadOptions upload;
        DownloadOptions download;

        std::uint64_t limit{api::kMaxListPage};
        std::uint64_t offset{};
        std::optional<api::RemoteId> folder;
        bool allow_duplicates{true};
    };

    // [global options] <command> [arguments and command options]
    // Throws std::runtime_error on malformed usage.
    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage(std::string_view program);

} // namespace cloudpan::client
