#include <cstdlib>
#include <iostream>
#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "cloudpan/client/commands.hpp"
#include "cloudpan/client/config.hpp"
#include "cloudpan/client/credentials.hpp"
#include "cloudpan/client/http_transport.hpp"
#include "cloudpan/client/logger.hpp"
#include "cloudpan/client/oss_client.hpp"
#include "cloudpan/error_codes.hpp"
#include "cloudpan/version.hpp"

int main(int argc, char *argv[])
{
    using namespace cloudpan::client;

    ClientConfig config;
    try
    {
        config = parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << "\n\n" << usage(argv[0]);
        return EXIT_FAILURE;
    }

    auto console = std::make_shared<spdlog::logger>("cloudpan", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    console->set_level(spdlog::level::info);
    console->set_pattern("[%^%l%$] %v");
    spdlog::set_default_logger(console);

    try
    {
        Logger logger(config.log_path);
        logger.log("main", "cloudpan ", cloudpan::version(), " command ", to_string(config.command));

        if (config.command == Command::Help)
        {
            std::cout << usage(argv[0]);
            return EXIT_SUCCESS;
        }
        if (config.command == Command::Version)
        {
            std::cout << "cloudpan " << cloudpan::version() << '\n';
            return EXIT_SUCCESS;
        }

        const auto credentials = load_credentials(config.credentials_path);
        HttpTransport transport(TransportOptions{
                                    .api_base = config.api_base,
                                    .access_token = credentials.access_token,
                                    .timeout = config.timeout,
                                },
                                logger);
        CurlContentFetcher fetcher(config.timeout);
        OssClient objects(logger, config.timeout);
        CommandContext context{transport, fetcher, objects, logger, std::cout};
        return run_command(config, context);
    }
    catch (const cloudpan::ApiError &ex)
    {
        spdlog::error("{} ({})", ex.what(), cloudpan::to_string(ex.code()));
        return EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        spdlog::error("{}", ex.what());
        return EXIT_FAILURE;
    }
}
