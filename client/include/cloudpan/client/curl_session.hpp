#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include <curl/curl.h>

#include "cloudpan/client/content_fetcher.hpp"

namespace cloudpan::client
{

    struct HttpReply
    {
        long status{};
        std::string body;
    };

    using HeaderList = std::vector<std::string>;

    // One libcurl easy handle. Not shared between threads: callers create a
    // session per request.
    class CurlSession
    {
    public:
        explicit CurlSession(std::chrono::seconds timeout, std::string user_agent = "cloudpan");
        ~CurlSession();

        CurlSession(const CurlSession &) = delete;
        CurlSession &operator=(const CurlSession &) = delete;

        HttpReply get(const std::string &url, const HeaderList &headers);

        HttpReply post_form(const std::string &url, const std::string &body, const HeaderList &headers);

        // Delivers the body through `on_chunk`; HTTP statuses >= 400 throw.
        void stream(const std::string &url, const HeaderList &headers, const ChunkHandler &on_chunk);

        HttpReply put(const std::string &url, const HeaderList &headers, std::istream &body, std::uint64_t size,
                      const std::function<void(std::uint64_t)> &on_sent);

        static std::string escape(std::string_view value);

    private:
        struct ReadContext
        {
            std::istream *input{};
            const std::function<void(std::uint64_t)> *on_sent{};
            std::exception_ptr error;
        };

        struct WriteContext
        {
            const ChunkHandler *on_chunk{};
            std::string *sink{};
            std::exception_ptr error;
        };

        static std::size_t on_write(char *data, std::size_t size, std::size_t count, void *user);
        static std::size_t on_read(char *buffer, std::size_t size, std::size_t count, void *user);

        void prepare(const std::string &url, curl_slist *headers, WriteContext &writer);
        long perform(const std::string &url, WriteContext &writer);

        CURL *handle_;
        std::chrono::seconds timeout_;
        std::string user_agent_;
        char error_buffer_[CURL_ERROR_SIZE]{};
    };

} // namespace cloudpan::client
