#include "cloudpan/client/worker_pool.hpp"

#include <array>
#include <thread>

namespace cloudpan::client
{

    namespace
    {

        struct BatchModeMapping
        {
            BatchMode mode;
            std::string_view label;
        };

        constexpr std::array<BatchModeMapping, 2> kBatchModeMappings{{
            {BatchMode::Concurrent, "concurrent"},
            {BatchMode::Loop, "loop"},
        }};

    } // namespace

    std::string_view to_string(BatchMode mode) noexcept
    {
        for (const auto &mapping : kBatchModeMappings)
        {
            if (mapping.mode == mode)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<BatchMode> batch_mode_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kBatchModeMappings)
        {
            if (mapping.label == value)
            {
                return mapping.mode;
            }
        }
        return std::nullopt;
    }

    std::size_t hardware_workers()
    {
        const auto hardware = std::thread::hardware_concurrency();
        return hardware == 0 ? 2 : hardware;
    }

    std::size_t resolve_worker_count(std::optional<std::size_t> requested, std::size_t fallback)
    {
        if (!requested)
        {
            return fallback == 0 ? 1 : fallback;
        }
        if (*requested == 0)
        {
            return hardware_workers();
        }
        return *requested;
    }

} // namespace cloudpan::client
