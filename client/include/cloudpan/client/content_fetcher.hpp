#pragma once

#include <cstddef>
#include <functional>
#include <span>
#include <string>

namespace cloudpan::client
{

    using ChunkHandler = std::function<void(std::span<const std::byte>)>;

    // Streams the body behind a resolved download URL. Throws ApiError when the
    // request fails or is cut off; an exception thrown by `on_chunk` aborts the
    // transfer and propagates.
    class ContentFetcher
    {
    public:
        virtual ~ContentFetcher() = default;

        virtual void fetch(const std::string &url, const ChunkHandler &on_chunk) = 0;
    };

} // namespace cloudpan::client
