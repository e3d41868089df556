#include "cloudpan/client/transfer_result.hpp"

#include <utility>

namespace cloudpan::client
{

    void to_json(nlohmann::json &json, const TransferResult &result)
    {
        json = {
            {"success", result.success},
            {"identifier", result.identifier},
            {"name", result.display_name},
            {"size", result.byte_size},
            {"destination", result.destination_path.generic_string()},
            {"message", result.message},
        };
        if (result.skipped)
        {
            json["skipped"] = true;
        }
        if (result.remote_folder_id != 0)
        {
            json["remote_folder_id"] = result.remote_folder_id;
        }
    }

    void to_json(nlohmann::json &json, const TransferBatchResult &batch)
    {
        json = {
            {"success", batch.success()},
            {"folder_id", batch.folder_identifier},
            {"folder_name", batch.folder_name},
            {"destination", batch.destination_root.generic_string()},
            {"total", batch.total_files},
            {"succeeded", batch.succeeded},
            {"failed", batch.failed},
            {"results", batch.results},
        };
        if (!batch.omitted_paths.empty())
        {
            json["omitted"] = batch.omitted_paths;
        }
    }

    ResultCollector::ResultCollector(std::size_t expected, ProgressSink &progress) : progress_(progress)
    {
        results_.reserve(expected);
    }

    void ResultCollector::record(TransferResult result)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (result.success)
        {
            ++succeeded_;
        }
        else
        {
            ++failed_;
        }
        progress_.advance(1, (result.success ? "ok   " : "fail ") + result.display_name);
        results_.push_back(std::move(result));
    }

    std::size_t ResultCollector::recorded() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return results_.size();
    }

    void ResultCollector::finalize(TransferBatchResult &batch)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.succeeded = succeeded_;
        batch.failed = failed_;
        batch.results = std::move(results_);
        results_.clear();
    }

    TransferResult failed_result(std::string identifier, std::string display_name, std::string message)
    {
        TransferResult result;
        result.success = false;
        result.identifier = std::move(identifier);
        result.display_name = std::move(display_name);
        result.message = std::move(message);
        return result;
    }

} // namespace cloudpan::client
