#include "cloudpan/client/commands.hpp"

#include <charconv>
#include <cstdlib>
#include <ostream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "cloudpan/client/downloader.hpp"
#include "cloudpan/client/recycle_bin.hpp"
#include "cloudpan/client/remote_files.hpp"
#include "cloudpan/client/uploader.hpp"
#include "cloudpan/version.hpp"

namespace cloudpan::client
{

    namespace
    {

        std::optional<api::RemoteId> as_id(const std::string &text)
        {
            api::RemoteId value = 0;
            const auto *end = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(text.data(), end, value);
            if (text.empty() || ec != std::errc() || ptr != end)
            {
                return std::nullopt;
            }
            return value;
        }

        api::RemoteId require_id(const std::string &text)
        {
            const auto id = as_id(text);
            if (!id)
            {
                throw std::runtime_error("Expected a numeric id, got '" + text + "'");
            }
            return *id;
        }

        std::vector<std::string> split_list(const std::string &text)
        {
            std::vector<std::string> parts;
            std::string current;
            for (const char ch : text)
            {
                if (ch == ',')
                {
                    if (!current.empty())
                    {
                        parts.push_back(current);
                    }
                    current.clear();
                }
                else if (ch != ' ')
                {
                    current.push_back(ch);
                }
            }
            if (!current.empty())
            {
                parts.push_back(current);
            }
            return parts;
        }

        std::vector<api::RemoteId> require_ids(const std::string &text)
        {
            std::vector<api::RemoteId> ids;
            for (const auto &part : split_list(text))
            {
                ids.push_back(require_id(part));
            }
            if (ids.empty())
            {
                throw std::runtime_error("Expected a comma separated id list");
            }
            return ids;
        }

        void expect_arguments(const ClientConfig &config, std::size_t min, std::size_t max)
        {
            const auto count = config.arguments.size();
            if (count < min || count > max)
            {
                throw std::runtime_error("Wrong number of arguments for '" + std::string(to_string(config.command)) +
                                         "'");
            }
        }

        nlohmann::json entry_json(const api::RemoteEntry &entry)
        {
            nlohmann::json json = {
                {"id", entry.id},
                {"parent_id", entry.parent_id},
                {"name", entry.name},
                {"folder", entry.is_folder},
            };
            if (!entry.is_folder)
            {
                json["size"] = entry.size;
                json["pick_code"] = entry.pick_code;
                json["sha1"] = entry.sha1;
            }
            return json;
        }

        nlohmann::json page_json(const api::ListPage &page)
        {
            nlohmann::json items = nlohmann::json::array();
            for (const auto &entry : page.items)
            {
                items.push_back(entry_json(entry));
            }
            return {{"count", page.count}, {"offset", page.offset}, {"limit", page.limit}, {"items", items}};
        }

        nlohmann::json info_json(const api::FileInfo &info)
        {
            return {
                {"id", info.id},
                {"name", info.name},
                {"folder", info.is_folder},
                {"size", info.size},
                {"pick_code", info.pick_code},
                {"sha1", info.sha1},
            };
        }

        int print_batch(std::ostream &out, const TransferBatchResult &batch)
        {
            out << nlohmann::json(batch).dump(2) << '\n';
            return batch.success() ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        int run_upload(const ClientConfig &config, CommandContext &context)
        {
            expect_arguments(config, 1, 1);
            Uploader uploader(context.transport, context.objects, context.logger);
            const auto outcome = uploader.upload(config.arguments.front(), config.upload_target, config.upload);
            if (const auto *ok = std::get_if<bool>(&outcome))
            {
                context.out << nlohmann::json({{"success", *ok}, {"path", config.arguments.front()}}).dump(2) << '\n';
                return *ok ? EXIT_SUCCESS : EXIT_FAILURE;
            }
            return print_batch(context.out, std::get<TransferBatchResult>(outcome));
        }

        int run_download(const ClientConfig &config, CommandContext &context)
        {
            expect_arguments(config, 1, 2);
            const auto &target_text = config.arguments.front();
            DownloadTarget target = target_text;
            if (const auto id = as_id(target_text))
            {
                target = *id;
            }
            const std::filesystem::path save_path = config.arguments.size() > 1 ? config.arguments[1] : ".";

            Downloader downloader(context.transport, context.fetcher, context.logger);
            const auto outcome = downloader.download(target, save_path, config.download);
            if (const auto *single = std::get_if<TransferResult>(&outcome))
            {
                context.out << nlohmann::json(*single).dump(2) << '\n';
                return single->success || single->skipped ? EXIT_SUCCESS : EXIT_FAILURE;
            }
            return print_batch(context.out, std::get<TransferBatchResult>(outcome));
        }

        int run_trash(const ClientConfig &config, CommandContext &context)
        {
            if (config.arguments.empty())
            {
                throw std::runtime_error("trash expects list, restore or purge");
            }
            RecycleBin bin(context.transport);
            const auto &action = config.arguments.front();
            if (action == "list")
            {
                expect_arguments(config, 1, 1);
                const auto limit = config.limit > RecycleBin::kMaxPage ? RecycleBin::kMaxPage : config.limit;
                nlohmann::json items = nlohmann::json::array();
                for (const auto &entry : bin.list(limit, config.offset))
                {
                    items.push_back({{"id", entry.id},
                                     {"name", entry.name},
                                     {"size", entry.size},
                                     {"parent_name", entry.parent_name}});
                }
                context.out << items.dump(2) << '\n';
            }
            else if (action == "restore")
            {
                expect_arguments(config, 2, 2);
                bin.restore(split_list(config.arguments[1]));
                context.out << "restored\n";
            }
            else if (action == "purge")
            {
                expect_arguments(config, 1, 2);
                if (config.arguments.size() == 2)
                {
                    bin.purge(split_list(config.arguments[1]));
                }
                else
                {
                    bin.purge_all();
                }
                context.out << "purged\n";
            }
            else
            {
                throw std::runtime_error("Unknown trash action: " + action);
            }
            return EXIT_SUCCESS;
        }

    } // namespace

    int run_command(const ClientConfig &config, CommandContext &context)
    {
        RemoteFiles files(context.transport);
        auto &out = context.out;

        switch (config.command)
        {
        case Command::Upload:
            return run_upload(config, context);
        case Command::Download:
            return run_download(config, context);
        case Command::List:
        {
            expect_arguments(config, 0, 1);
            const auto folder = config.arguments.empty() ? api::kRootFolderId : require_id(config.arguments.front());
            out << page_json(files.list(folder, config.offset, config.limit)).dump(2) << '\n';
            return EXIT_SUCCESS;
        }
        case Command::Info:
        {
            expect_arguments(config, 1, 1);
            const auto &target = config.arguments.front();
            const auto id = as_id(target);
            out << info_json(id ? files.info(*id) : files.info(target)).dump(2) << '\n';
            return EXIT_SUCCESS;
        }
        case Command::Mkdir:
        {
            expect_arguments(config, 2, 2);
            const auto id = files.create_folder(require_id(config.arguments[0]), config.arguments[1]);
            out << nlohmann::json({{"id", id}, {"name", config.arguments[1]}}).dump(2) << '\n';
            return EXIT_SUCCESS;
        }
        case Command::Copy:
            expect_arguments(config, 2, 2);
            files.copy(require_id(config.arguments[1]), require_ids(config.arguments[0]), config.allow_duplicates);
            out << "copied\n";
            return EXIT_SUCCESS;
        case Command::Move:
            expect_arguments(config, 2, 2);
            files.move(require_ids(config.arguments[0]), require_id(config.arguments[1]));
            out << "moved\n";
            return EXIT_SUCCESS;
        case Command::Rename:
            expect_arguments(config, 2, 2);
            files.rename(require_id(config.arguments[0]), config.arguments[1]);
            out << "renamed\n";
            return EXIT_SUCCESS;
        case Command::Remove:
            expect_arguments(config, 1, 1);
            files.remove(require_ids(config.arguments[0]), config.folder);
            out << "removed\n";
            return EXIT_SUCCESS;
        case Command::Search:
            expect_arguments(config, 1, 1);
            out << page_json(files.search(config.arguments[0], config.limit, config.offset, config.folder)).dump(2)
                << '\n';
            return EXIT_SUCCESS;
        case Command::Trash:
            return run_trash(config, context);
        case Command::WhoAmI:
        {
            expect_arguments(config, 0, 0);
            const auto user = files.user_info();
            out << nlohmann::json({{"user_id", user.user_id}, {"user_name", user.user_name}, {"vip", user.vip_level}})
                       .dump(2)
                << '\n';
            return EXIT_SUCCESS;
        }
        case Command::Version:
            out << "cloudpan " << version() << '\n';
            return EXIT_SUCCESS;
        case Command::Help:
            out << usage("cloudpan");
            return EXIT_SUCCESS;
        }
        throw std::runtime_error("Unhandled command");
    }

} // namespace cloudpan::client
