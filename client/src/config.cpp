#include "cloudpan/client/config.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <initializer_list>
#include <stdexcept>

namespace cloudpan::client
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        // First label per command is its canonical name.
        constexpr std::array<CommandMapping, 16> kCommandMappings{{
            {Command::Upload, "upload"},
            {Command::Upload, "up"},
            {Command::Download, "download"},
            {Command::Download, "down"},
            {Command::List, "ls"},
            {Command::Info, "info"},
            {Command::Mkdir, "mkdir"},
            {Command::Copy, "cp"},
            {Command::Move, "mv"},
            {Command::Rename, "rename"},
            {Command::Remove, "rm"},
            {Command::Search, "search"},
            {Command::Trash, "trash"},
            {Command::WhoAmI, "whoami"},
            {Command::Version, "version"},
            {Command::Help, "help"},
        }};

        template <typename T>
        T parse_number(const std::string &text, std::string_view option)
        {
            T value{};
            const auto *end = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(text.data(), end, value);
            if (text.empty() || ec != std::errc() || ptr != end)
            {
                throw std::runtime_error(std::string(option) + " expects a non-negative integer, got '" + text + "'");
            }
            return value;
        }

        class ArgumentCursor
        {
        public:
            ArgumentCursor(int argc, char *argv[]) : argc_(argc), argv_(argv) {}

            bool done() const { return index_ >= argc_; }
            std::string next() { return argv_[index_++]; }

            std::string value_for(const std::string &option)
            {
                if (done())
                {
                    throw std::runtime_error(option + " requires a value");
                }
                return next();
            }

        private:
            int argc_;
            char **argv_;
            int index_{1};
        };

        bool accepts(Command command, std::initializer_list<Command> commands)
        {
            return std::find(commands.begin(), commands.end(), command) != commands.end();
        }

        void require(Command command, const std::string &option, std::initializer_list<Command> commands)
        {
            if (!accepts(command, commands))
            {
                throw std::runtime_error(option + " is not an option of '" + std::string(to_string(command)) + "'");
            }
        }

        BatchMode parse_mode(const std::string &value)
        {
            const auto mode = batch_mode_from_string(value);
            if (!mode)
            {
                throw std::runtime_error("--mode must be 'concurrent' or 'loop', got '" + value + "'");
            }
            return *mode;
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string usage(std::string_view program)
    {
        std::string text = "Usage: ";
        text += program;
        text += " [--log FILE] [--credentials FILE] [--api-base URL] [--timeout SECONDS] <command> ...\n"
                "\n"
                "Commands:\n"
                "  upload|up <path> [--target ID] [--create-folder|--no-create-folder]\n"
                "            [--show-progress|--no-progress] [--mode concurrent|loop] [--max-workers N]\n"
                "            [--resume-pick-code CODE]\n"
                "  download|down <id|/remote/path> [save_path] [--filename NAME] [--overwrite]\n"
                "            [--show-progress|--no-progress] [--create-folder|--no-create-folder]\n"
                "            [--mode concurrent|loop] [--max-workers N] [--chunk-size BYTES]\n"
                "  ls [folder_id] [--limit N] [--offset N]\n"
                "  info <id|/remote/path>\n"
                "  mkdir <parent_id> <name>\n"
                "  cp <id,id,...> <target_folder_id> [--no-duplicates]\n"
                "  mv <id,id,...> <target_folder_id>\n"
                "  rename <id> <new_name>\n"
                "  rm <id,id,...> [--parent ID]\n"
                "  search <keyword> [--folder ID] [--limit N] [--offset N]\n"
                "  trash list [--limit N] [--offset N] | trash restore <ids> | trash purge [ids]\n"
                "  whoami\n"
                "  version\n";
        return text;
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;
        ArgumentCursor cursor(argc, argv);

        bool have_command = false;
        while (!cursor.done() && !have_command)
        {
            const auto arg = cursor.next();
            if (arg == "--log")
            {
                config.log_path = std::filesystem::path(cursor.value_for(arg));
            }
            else if (arg == "--credentials")
            {
                config.credentials_path = std::filesystem::path(cursor.value_for(arg));
            }
            else if (arg == "--api-base")
            {
                config.api_base = cursor.value_for(arg);
            }
            else if (arg == "--timeout")
            {
                const auto seconds = parse_number<std::uint32_t>(cursor.value_for(arg), arg);
                if (seconds == 0)
                {
                    throw std::runtime_error("--timeout must be at least one second");
                }
                config.timeout = std::chrono::seconds(seconds);
            }
            else if (arg == "--help" || arg == "-h")
            {
                config.command = Command::Help;
                return config;
            }
            else if (arg == "--version")
            {
                config.command = Command::Version;
                return config;
            }
            else if (!arg.empty() && arg.front() == '-')
            {
                throw std::runtime_error("Unknown option: " + arg);
            }
            else
            {
                const auto command = command_from_string(arg);
                if (!command)
                {
                    throw std::runtime_error("Unknown command: " + arg);
                }
                config.command = *command;
                have_command = true;
            }
        }
        if (!have_command)
        {
            throw std::runtime_error("Missing command");
        }

        const auto command = config.command;
        constexpr auto kUpload = Command::Upload;
        constexpr auto kDownload = Command::Download;

        while (!cursor.done())
        {
            const auto arg = cursor.next();
            if (arg.empty() || arg.front() != '-' || arg == "-")
            {
                config.arguments.push_back(arg);
                continue;
            }

            if (arg == "--target")
            {
                require(command, arg, {kUpload});
                config.upload_target = parse_number<api::RemoteId>(cursor.value_for(arg), arg);
            }
            else if (arg == "--create-folder" || arg == "--no-create-folder")
            {
                require(command, arg, {kUpload, kDownload});
                config.upload.create_folder = config.download.create_folder = arg == "--create-folder";
            }
            else if (arg == "--show-progress" || arg == "--no-progress")
            {
                require(command, arg, {kUpload, kDownload});
                config.upload.show_progress = config.download.show_progress = arg == "--show-progress";
            }
            else if (arg == "--mode")
            {
                require(command, arg, {kUpload, kDownload});
                config.upload.mode = config.download.mode = parse_mode(cursor.value_for(arg));
            }
            else if (arg == "--max-workers")
            {
                require(command, arg, {kUpload, kDownload});
                const auto workers = parse_number<std::size_t>(cursor.value_for(arg), arg);
                config.upload.max_workers = config.download.max_workers = workers;
            }
            else if (arg == "--resume-pick-code")
            {
                require(command, arg, {kUpload});
                config.upload.resume_pick_code = cursor.value_for(arg);
            }
            else if (arg == "--filename")
            {
                require(command, arg, {kDownload});
                config.download.filename = cursor.value_for(arg);
            }
            else if (arg == "--overwrite")
            {
                require(command, arg, {kDownload});
                config.download.overwrite = true;
            }
            else if (arg == "--chunk-size")
            {
                require(command, arg, {kDownload});
                const auto chunk = parse_number<std::size_t>(cursor.value_for(arg), arg);
                if (chunk == 0)
                {
                    throw std::runtime_error("--chunk-size must be positive");
                }
                config.download.chunk_size = chunk;
            }
            else if (arg == "--limit")
            {
                require(command, arg, {Command::List, Command::Search, Command::Trash});
                config.limit = parse_number<std::uint64_t>(cursor.value_for(arg), arg);
            }
            else if (arg == "--offset")
            {
                require(command, arg, {Command::List, Command::Search, Command::Trash});
                config.offset = parse_number<std::uint64_t>(cursor.value_for(arg), arg);
            }
            else if (arg == "--folder" || arg == "--parent")
            {
                require(command, arg, {Command::Search, Command::Remove});
                config.folder = parse_number<api::RemoteId>(cursor.value_for(arg), arg);
            }
            else if (arg == "--no-duplicates")
            {
                require(command, arg, {Command::Copy});
                config.allow_duplicates = false;
            }
            else
            {
                throw std::runtime_error("Unknown option: " + arg);
            }
        }

        if (config.upload.resume_pick_code && config.upload.resume_pick_code->empty())
        {
            throw std::runtime_error("--resume-pick-code must not be empty");
        }
        return config;
    }

} // namespace cloudpan::client
