#include "cloudpan/client/curl_session.hpp"

#include <memory>
#include <mutex>
#include <utility>

#include "cloudpan/error_codes.hpp"

namespace cloudpan::client
{

    namespace
    {

        std::once_flag &curl_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_curl_initialized()
        {
            std::call_once(curl_once_flag(), []()
                           {
                if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
                {
                    throw ApiError(ErrorCode::InternalError, "libcurl initialization failed");
                } });
        }

        struct HeaderListDeleter
        {
            void operator()(curl_slist *list) const noexcept
            {
                curl_slist_free_all(list);
            }
        };

        using HeaderListPtr = std::unique_ptr<curl_slist, HeaderListDeleter>;

        HeaderListPtr build_headers(const HeaderList &headers)
        {
            curl_slist *list = nullptr;
            for (const auto &header : headers)
            {
                auto *appended = curl_slist_append(list, header.c_str());
                if (appended == nullptr)
                {
                    curl_slist_free_all(list);
                    throw ApiError(ErrorCode::InternalError, "curl_slist_append failed");
                }
                list = appended;
            }
            return HeaderListPtr(list);
        }

        ErrorCode classify(CURLcode code)
        {
            switch (code)
            {
            case CURLE_OPERATION_TIMEDOUT:
                return ErrorCode::Timeout;
            case CURLE_WRITE_ERROR:
            case CURLE_READ_ERROR:
                return ErrorCode::LocalIo;
            default:
                return ErrorCode::TransportFailure;
            }
        }

    } // namespace

    CurlSession::CurlSession(std::chrono::seconds timeout, std::string user_agent)
        : handle_(nullptr), timeout_(timeout), user_agent_(std::move(user_agent))
    {
        ensure_curl_initialized();
        handle_ = curl_easy_init();
        if (handle_ == nullptr)
        {
            throw ApiError(ErrorCode::InternalError, "curl_easy_init failed");
        }
    }

    CurlSession::~CurlSession()
    {
        curl_easy_cleanup(handle_);
    }

    std::string CurlSession::escape(std::string_view value)
    {
        ensure_curl_initialized();
        char *escaped = curl_easy_escape(nullptr, value.data(), static_cast<int>(value.size()));
        if (escaped == nullptr)
        {
            throw ApiError(ErrorCode::InternalError, "curl_easy_escape failed");
        }
        std::string result(escaped);
        curl_free(escaped);
        return result;
    }

    std::size_t CurlSession::on_write(char *data, std::size_t size, std::size_t count, void *user)
    {
        auto *writer = static_cast<WriteContext *>(user);
        const auto bytes = size * count;
        try
        {
            if (writer->on_chunk != nullptr)
            {
                (*writer->on_chunk)(std::as_bytes(std::span(data, bytes)));
            }
            else if (writer->sink != nullptr)
            {
                writer->sink->append(data, bytes);
            }
        }
        catch (...)
        {
            // Returning short aborts the transfer; perform() rethrows.
            writer->error = std::current_exception();
            return 0;
        }
        return bytes;
    }

    std::size_t CurlSession::on_read(char *buffer, std::size_t size, std::size_t count, void *user)
    {
        auto *reader = static_cast<ReadContext *>(user);
        try
        {
            reader->input->read(buffer, static_cast<std::streamsize>(size * count));
            const auto read_count = static_cast<std::size_t>(reader->input->gcount());
            if (reader->input->bad())
            {
                throw ApiError(ErrorCode::LocalIo, "Read error while uploading");
            }
            if (read_count > 0 && reader->on_sent != nullptr && *reader->on_sent)
            {
                (*reader->on_sent)(read_count);
            }
            return read_count;
        }
        catch (...)
        {
            reader->error = std::current_exception();
            return CURL_READFUNC_ABORT;
        }
    }

    void CurlSession::prepare(const std::string &url, curl_slist *headers, WriteContext &writer)
    {
        curl_easy_reset(handle_);
        error_buffer_[0] = '\0';
        curl_easy_setopt(handle_, CURLOPT_ERRORBUFFER, error_buffer_);
        curl_easy_setopt(handle_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(handle_, CURLOPT_USERAGENT, user_agent_.c_str());
        curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(handle_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(handle_, CURLOPT_ACCEPT_ENCODING, "");
        curl_easy_setopt(handle_, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout_.count()));
        // Stall detection rather than a hard cap, so large bodies are not cut off.
        curl_easy_setopt(handle_, CURLOPT_LOW_SPEED_TIME, static_cast<long>(timeout_.count()));
        curl_easy_setopt(handle_, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(handle_, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION, &CurlSession::on_write);
        curl_easy_setopt(handle_, CURLOPT_WRITEDATA, &writer);
    }

    long CurlSession::perform(const std::string &url, WriteContext &writer)
    {
        const auto code = curl_easy_perform(handle_);
        if (writer.error)
        {
            std::rethrow_exception(writer.error);
        }
        if (code != CURLE_OK)
        {
            const std::string detail = error_buffer_[0] != '\0' ? error_buffer_ : curl_easy_strerror(code);
            throw ApiError(classify(code), "HTTP request to " + url + " failed: " + detail);
        }
        long status = 0;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &status);
        return status;
    }

    HttpReply CurlSession::get(const std::string &url, const HeaderList &headers)
    {
        auto header_list = build_headers(headers);
        HttpReply reply;
        WriteContext writer{.on_chunk = nullptr, .sink = &reply.body, .error = nullptr};
        prepare(url, header_list.get(), writer);
        curl_easy_setopt(handle_, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(handle_, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
        reply.status = perform(url, writer);
        return reply;
    }

    HttpReply CurlSession::post_form(const std::string &url, const std::string &body, const HeaderList &headers)
    {
        auto header_list = build_headers(headers);
        HttpReply reply;
        WriteContext writer{.on_chunk = nullptr, .sink = &reply.body, .error = nullptr};
        prepare(url, header_list.get(), writer);
        curl_easy_setopt(handle_, CURLOPT_POST, 1L);
        curl_easy_setopt(handle_, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(handle_, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        curl_easy_setopt(handle_, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
        reply.status = perform(url, writer);
        return reply;
    }

    void CurlSession::stream(const std::string &url, const HeaderList &headers, const ChunkHandler &on_chunk)
    {
        auto header_list = build_headers(headers);
        WriteContext writer{.on_chunk = &on_chunk, .sink = nullptr, .error = nullptr};
        prepare(url, header_list.get(), writer);
        curl_easy_setopt(handle_, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(handle_, CURLOPT_FAILONERROR, 1L);
        const auto status = perform(url, writer);
        if (status >= 400)
        {
            throw ApiError(ErrorCode::TransportFailure, "Download from " + url + " failed with HTTP " +
                                                            std::to_string(status));
        }
    }

    HttpReply CurlSession::put(const std::string &url, const HeaderList &headers, std::istream &body,
                               std::uint64_t size, const std::function<void(std::uint64_t)> &on_sent)
    {
        auto header_list = build_headers(headers);
        HttpReply reply;
        WriteContext writer{.on_chunk = nullptr, .sink = &reply.body, .error = nullptr};
        ReadContext reader{.input = &body, .on_sent = &on_sent, .error = nullptr};
        prepare(url, header_list.get(), writer);
        curl_easy_setopt(handle_, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(handle_, CURLOPT_READFUNCTION, &CurlSession::on_read);
        curl_easy_setopt(handle_, CURLOPT_READDATA, &reader);
        curl_easy_setopt(handle_, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
        const auto code = curl_easy_perform(handle_);
        if (reader.error)
        {
            std::rethrow_exception(reader.error);
        }
        if (writer.error)
        {
            std::rethrow_exception(writer.error);
        }
        if (code != CURLE_OK)
        {
            const std::string detail = error_buffer_[0] != '\0' ? error_buffer_ : curl_easy_strerror(code);
            throw ApiError(classify(code), "Upload to " + url + " failed: " + detail);
        }
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &reply.status);
        return reply;
    }

} // namespace cloudpan::client
