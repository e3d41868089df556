#pragma once

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace cloudpan::client
{

    enum class BatchMode : std::uint8_t
    {
        Concurrent,
        Loop
    };

    std::string_view to_string(BatchMode mode) noexcept;
    std::optional<BatchMode> batch_mode_from_string(std::string_view value) noexcept;

    std::size_t hardware_workers();

    // requested == 0 asks for one worker per hardware thread; nullopt takes `fallback`.
    std::size_t resolve_worker_count(std::optional<std::size_t> requested, std::size_t fallback);

    // Runs `task` once per item. Loop mode stays on the calling thread; concurrent
    // mode fans out over a pool of `workers` threads and returns after all items
    // are done. `task` must not throw.
    template <typename Item, typename Task>
    void run_batch(const std::vector<Item> &items, BatchMode mode, std::size_t workers, Task &&task)
    {
        if (mode == BatchMode::Loop || items.size() <= 1)
        {
            for (const auto &item : items)
            {
                task(item);
            }
            return;
        }

        asio::thread_pool pool(workers == 0 ? 1 : workers);
        for (const auto &item : items)
        {
            asio::post(pool, [&task, &item]()
                       { task(item); });
        }
        pool.join();
    }

} // namespace cloudpan::client
