#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cloudpan/api.hpp"
#include "cloudpan/client/progress.hpp"

namespace cloudpan::client
{

    // Outcome for one file, identical for uploads and downloads.
    struct TransferResult
    {
        bool success{};
        bool skipped{};
        std::string identifier;
        std::string display_name;
        std::uint64_t byte_size{};
        std::filesystem::path destination_path;
        api::RemoteId remote_folder_id{};
        std::string message;
    };

    struct TransferBatchResult
    {
        api::RemoteId folder_identifier{};
        std::string folder_name;
        std::filesystem::path destination_root;
        std::size_t total_files{};
        std::size_t succeeded{};
        std::size_t failed{};
        std::vector<TransferResult> results;
        std::vector<std::string> omitted_paths;

        bool success() const noexcept { return failed == 0; }
    };

    void to_json(nlohmann::json &json, const TransferResult &result);
    void to_json(nlohmann::json &json, const TransferBatchResult &batch);

    // Per-batch aggregation point shared by all workers. Every worker records
    // exactly one result per file; each record ticks the progress sink once.
    class ResultCollector
    {
    public:
        ResultCollector(std::size_t expected, ProgressSink &progress);

        void record(TransferResult result);

        std::size_t recorded() const;

        // Moves the collected results into `batch` and fills its counters.
        void finalize(TransferBatchResult &batch);

    private:
        mutable std::mutex mutex_;
        ProgressSink &progress_;
        std::vector<TransferResult> results_;
        std::size_t succeeded_{};
        std::size_t failed_{};
    };

    TransferResult failed_result(std::string identifier, std::string display_name, std::string message);

} // namespace cloudpan::client
