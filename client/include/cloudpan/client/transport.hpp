#pragma once

#include <string_view>

#include "cloudpan/api.hpp"

namespace cloudpan::client
{

    // Authenticated request transport. Network, HTTP and JSON failures throw
    // ApiError; a reply whose `state` is not true comes back with ok == false.
    class Transport
    {
    public:
        virtual ~Transport() = default;

        virtual api::ApiResponse request_json(api::HttpMethod method, std::string_view path,
                                              const api::FormParams &params) = 0;
    };

} // namespace cloudpan::client
