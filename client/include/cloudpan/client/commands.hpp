#pragma once

#include <iosfwd>

#include "cloudpan/client/config.hpp"
#include "cloudpan/client/content_fetcher.hpp"
#include "cloudpan/client/logger.hpp"
#include "cloudpan/client/object_transfer.hpp"
#include "cloudpan/client/transport.hpp"

namespace cloudpan::client
{

    // Collaborators a command runs against. The CLI wires in the curl-backed
    // implementations; tests hand in fakes.
    struct CommandContext
    {
        Transport &transport;
        ContentFetcher &fetcher;
        ObjectTransferClient &objects;
        Logger logger;
        std::ostream &out;
    };

    // Runs one parsed command and prints its JSON result. Returns the process
    // exit code; throws on usage errors and unrecoverable remote failures.
    int run_command(const ClientConfig &config, CommandContext &context);

} // namespace cloudpan::client
