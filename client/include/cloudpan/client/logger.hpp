#pragma once

#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace cloudpan::client
{

    // Tagged engine log. Copies share one spdlog logger, so a Logger can be handed
    // to every worker by value.
    class Logger
    {
    public:
        explicit Logger(const std::optional<std::filesystem::path> &path = std::nullopt);

        template <typename... Args>
        void log(const std::string &tag, Args &&...args) const
        {
            if (!logger_)
            {
                return;
            }
            logger_->info("[{}] {}", tag, concat(std::forward<Args>(args)...));
        }

        template <typename... Args>
        void warn(const std::string &tag, Args &&...args) const
        {
            if (!logger_)
            {
                return;
            }
            logger_->warn("[{}] {}", tag, concat(std::forward<Args>(args)...));
        }

    private:
        template <typename... Args>
        static std::string concat(Args &&...args)
        {
            spdlog::fmt_lib::memory_buffer buf;
            (spdlog::fmt_lib::format_to(std::back_inserter(buf), "{}", std::forward<Args>(args)), ...);
            return std::string(buf.data(), buf.size());
        }

        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace cloudpan::client
