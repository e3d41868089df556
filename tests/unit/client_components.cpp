#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "cloudpan/client/commands.hpp"
#include "cloudpan/client/config.hpp"
#include "cloudpan/client/credentials.hpp"
#include "cloudpan/client/http_transport.hpp"
#include "cloudpan/client/logger.hpp"
#include "cloudpan/client/oss_client.hpp"
#include "cloudpan/client/progress.hpp"
#include "cloudpan/client/recycle_bin.hpp"
#include "cloudpan/client/remote_files.hpp"
#include "cloudpan/client/transfer_result.hpp"
#include "cloudpan/client/worker_pool.hpp"
#include "cloudpan/error_codes.hpp"
#include "fake_cloud.hpp"

using namespace cloudpan;
using namespace cloudpan::client;
using cloudpan::testing::FakeCloud;
using cloudpan::testing::FakeFetcher;
using cloudpan::testing::FakeObjectStore;
using cloudpan::testing::TempDir;
using cloudpan::testing::read_file;

namespace
{

    template <typename Fn>
    ErrorCode error_of(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const ApiError &ex)
        {
            return ex.code();
        }
        return ErrorCode::Ok;
    }

    ClientConfig parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "cloudpan");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    bool parse_fails(std::vector<std::string> args)
    {
        try
        {
            (void)parse(std::move(args));
        }
        catch (const std::runtime_error &)
        {
            return true;
        }
        return false;
    }

    // Keeps every tick the collector reports.
    class ProgressRecorder final : public ProgressSink
    {
    public:
        void start(const std::string &, std::uint64_t total) override { total_ = total; }
        void advance(std::uint64_t amount, const std::string &note) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            advanced_ += amount;
            notes_.push_back(note);
        }
        void finish() override { finished_ = true; }

        std::uint64_t total_{};
        std::uint64_t advanced_{};
        bool finished_{};
        std::vector<std::string> notes_;

    private:
        std::mutex mutex_;
    };

    void test_upload_arguments()
    {
        const auto config = parse({"--log", "/tmp/cp.log", "--timeout", "15", "up", "photos", "--target", "123",
                                   "--no-create-folder", "--no-progress", "--mode", "loop", "--max-workers", "3"});
        assert(config.command == Command::Upload);
        assert(config.log_path == std::filesystem::path("/tmp/cp.log"));
        assert(config.timeout == std::chrono::seconds(15));
        assert(config.arguments == std::vector<std::string>{"photos"});
        assert(config.upload_target == 123);
        assert(!config.upload.create_folder);
        assert(!config.upload.show_progress);
        assert(config.upload.mode == BatchMode::Loop);
        assert(config.upload.max_workers == std::size_t{3});
        assert(!config.upload.resume_pick_code);

        const auto resumed = parse({"upload", "big.iso", "--resume-pick-code", "abc"});
        assert(resumed.upload.resume_pick_code == std::string("abc"));
        assert(resumed.upload.create_folder);
        assert(resumed.upload.mode == BatchMode::Concurrent);
    }

    void test_download_arguments()
    {
        const auto config = parse({"--credentials", "/tmp/creds.json", "--api-base", "http://localhost:9000", "down",
                                   "/docs/a.pdf", "out", "--filename", "b.pdf", "--overwrite", "--chunk-size",
                                   "65536", "--max-workers", "0"});
        assert(config.command == Command::Download);
        assert(config.credentials_path == std::filesystem::path("/tmp/creds.json"));
        assert(config.api_base == "http://localhost:9000");
        assert(config.arguments.size() == 2);
        assert(config.download.filename == std::string("b.pdf"));
        assert(config.download.overwrite);
        assert(config.download.chunk_size == 65536);
        assert(config.download.max_workers == std::size_t{0});

        const auto defaults = parse({"download", "42"});
        assert(defaults.download.chunk_size == 8192);
        assert(!defaults.download.overwrite);
        assert(defaults.download.create_folder);
        assert(!defaults.download.max_workers);
    }

    void test_argument_errors()
    {
        assert(parse_fails({}));
        assert(parse_fails({"teleport"}));
        assert(parse_fails({"--bogus", "ls"}));
        assert(parse_fails({"upload", "x", "--mode", "parallel"}));
        assert(parse_fails({"upload", "x", "--overwrite"}));
        assert(parse_fails({"download", "1", "--target", "3"}));
        assert(parse_fails({"download", "1", "--chunk-size", "0"}));
        assert(parse_fails({"download", "1", "--max-workers", "-2"}));
        assert(parse_fails({"upload", "x", "--target"}));
        assert(parse_fails({"--timeout", "0", "ls"}));
        assert(parse_fails({"ls", "--folder", "1"}));

        assert(parse({"--help"}).command == Command::Help);
        assert(parse({"--version"}).command == Command::Version);
        assert(command_from_string("rm") == Command::Remove);
        assert(to_string(Command::Download) == "download");
        assert(!command_from_string("delete"));
    }

    void test_credentials()
    {
        const auto parsed = parse_credentials(R"({"access_token": "tok", "refresh_token": "ref"})");
        assert(parsed.access_token == "tok");
        assert(parsed.refresh_token == "ref");

        bool bad = false;
        try
        {
            (void)parse_credentials("[1, 2]");
        }
        catch (const std::runtime_error &)
        {
            bad = true;
        }
        assert(bad);

#ifndef _WIN32
        TempDir dir("credentials");
        const auto file = dir.write("credentials.json", R"({"access_token": "from-file"})");
        ::unsetenv(kAccessTokenVariable);
        assert(load_credentials(file).access_token == "from-file");

        ::setenv(kAccessTokenVariable, "from-env", 1);
        assert(load_credentials(file).access_token == "from-env");
        ::unsetenv(kAccessTokenVariable);

        bool missing = false;
        try
        {
            (void)load_credentials(dir.path() / "absent.json");
        }
        catch (const std::runtime_error &)
        {
            missing = true;
        }
        assert(missing);
#endif
    }

    void test_oss_signature()
    {
        api::UploadCredentials credentials;
        credentials.access_key_id = "STS.id";
        credentials.access_key_secret = "secret";
        const std::map<std::string, std::string> headers = {
            {"x-oss-security-token", "tok"},
            {"x-oss-callback", "Y2I="},
        };
        const auto header = OssClient::authorization(credentials, "PUT", "application/octet-stream",
                                                     "Wed, 01 Jan 2025 00:00:00 GMT", headers, "/bucket/obj/key");
        assert(header == "OSS STS.id:cZuFMHI0VJ1qzwWIBXCvGNR1ZQ8=");
    }

    void test_form_encoding()
    {
        assert(encode_form({}) == "");
        assert(encode_form({{"cid", "0"}, {"file_name", "a b&c"}}) == "cid=0&file_name=a%20b%26c");
    }

    void test_worker_pool()
    {
        assert(batch_mode_from_string("loop") == BatchMode::Loop);
        assert(batch_mode_from_string("concurrent") == BatchMode::Concurrent);
        assert(!batch_mode_from_string("threads"));
        assert(to_string(BatchMode::Loop) == "loop");

        assert(resolve_worker_count(std::nullopt, 5) == 5);
        assert(resolve_worker_count(std::size_t{2}, 5) == 2);
        assert(resolve_worker_count(std::size_t{0}, 5) == hardware_workers());
        assert(hardware_workers() >= 1);

        std::vector<int> items(100);
        for (int i = 0; i < 100; ++i)
        {
            items[i] = i;
        }
        std::atomic<int> sum{0};
        std::atomic<int> calls{0};
        run_batch(items, BatchMode::Concurrent, 8, [&](int item)
                  {
                      sum += item;
                      ++calls;
                  });
        assert(calls == 100);
        assert(sum == 4950);

        const auto caller = std::this_thread::get_id();
        bool same_thread = true;
        run_batch(items, BatchMode::Loop, 8, [&](int)
                  { same_thread = same_thread && std::this_thread::get_id() == caller; });
        assert(same_thread);
    }

    void test_result_collector()
    {
        ProgressRecorder progress;
        ResultCollector collector(3, progress);
        collector.record(TransferResult{.success = true, .display_name = "a"});
        collector.record(failed_result("pc1", "b", "boom"));
        collector.record(TransferResult{.success = false, .skipped = true, .display_name = "c"});
        assert(collector.recorded() == 3);
        assert(progress.advanced_ == 3);
        assert(progress.notes_.front() == "ok   a");

        TransferBatchResult batch;
        batch.total_files = 3;
        collector.finalize(batch);
        assert(batch.succeeded == 1);
        assert(batch.failed == 2);
        assert(!batch.success());
        assert(batch.results.size() == 3);
        assert(batch.results[1].message == "boom");

        const auto json = nlohmann::json(batch);
        assert(json["success"] == false);
        assert(json["results"].size() == 3);
        assert(json["results"][2]["skipped"] == true);
    }

    void test_logger_writes_file()
    {
        TempDir dir("logger");
        const auto path = dir.path() / "engine.log";
        {
            Logger logger(path);
            logger.log("unit", "value=", 42);
            logger.warn("unit", "careful");
            const Logger silent;
            silent.log("unit", "dropped");
        }
        const auto text = read_file(path);
        assert(text.find("[unit] value=42") != std::string::npos);
        assert(text.find("[warning] ") != std::string::npos);
    }

    void test_logger_unopenable_path()
    {
        TempDir dir("logger_dir");
        // A directory cannot be opened as a log file; the logger goes quiet.
        const Logger logger(dir.path());
        logger.log("unit", "dropped");
        logger.warn("unit", "dropped");
        assert(std::filesystem::is_directory(dir.path()));
    }

    void test_progress_stays_off_stdout()
    {
        std::ostringstream captured_out;
        std::ostringstream captured_err;
        auto *const old_out = std::cout.rdbuf(captured_out.rdbuf());
        auto *const old_err = std::cerr.rdbuf(captured_err.rdbuf());
        {
            auto progress = make_progress(true, ProgressUnit::Files);
            progress->start("download folder", 2);
            progress->advance(1, "ok   a.txt");
            progress->finish();
        }
        std::cout.rdbuf(old_out);
        std::cerr.rdbuf(old_err);
        assert(captured_out.str().empty());
        assert(captured_err.str().find("1 / 2 files") != std::string::npos);

        std::ostringstream sink;
        ConsoleProgress bytes(ProgressUnit::Bytes, sink);
        bytes.start("upload", 2048);
        bytes.advance(1024);
        bytes.finish();
        assert(sink.str().find("1.0 KiB / 2.0 KiB") != std::string::npos);
        bytes.advance(1);
        assert(sink.str().back() == '\n');
    }

    void test_remote_files_crud()
    {
        FakeCloud cloud;
        RemoteFiles files(cloud);

        const auto docs = files.create_folder(api::kRootFolderId, "docs");
        const auto archive = files.create_folder(api::kRootFolderId, "archive");
        assert(docs != archive);
        assert(error_of([&]
                        { (void)files.create_folder(api::kRootFolderId, ""); }) == ErrorCode::InvalidArgument);
        assert(error_of([&]
                        { (void)files.create_folder(api::kRootFolderId, "docs"); }) == ErrorCode::RemoteRejected);

        const auto report = cloud.add_file(docs, "report.txt", "numbers");
        const auto info = files.info(report);
        assert(info.name == "report.txt");
        assert(!info.is_folder);
        assert(info.size == 7);
        assert(files.info("docs").is_folder);
        assert(files.info("/docs/report.txt").id == report);
        assert(error_of([&]
                        { (void)files.info(api::kRootFolderId); }) == ErrorCode::InvalidArgument);
        assert(error_of([&]
                        { (void)files.info(std::string(" / ")); }) == ErrorCode::InvalidArgument);
        assert(RemoteFiles::normalize_remote_path(" a/b ") == "/a/b");

        files.rename(report, "summary.txt");
        assert(cloud.node(report)->name == "summary.txt");

        files.copy(archive, {report});
        assert(cloud.find_child(archive, "summary.txt").has_value());

        files.move({report}, archive);
        assert(cloud.node(report)->parent == archive);

        const auto found = files.search("summary", 20, 0);
        assert(found.items.size() == 2);
        assert(error_of([&]
                        { (void)files.search("  ", 20, 0); }) == ErrorCode::InvalidArgument);

        const auto ticket = files.download_url(cloud.node(report)->pick_code);
        assert(ticket.url == "fake://" + cloud.node(report)->pick_code);
        assert(error_of([&]
                        { (void)files.download_url("nothing"); }) == ErrorCode::NotFound);

        files.remove({report}, archive);
        assert(!cloud.node(report).has_value());
        assert(error_of([&]
                        { files.remove({}); }) == ErrorCode::InvalidArgument);

        const auto user = files.user_info();
        assert(user.user_id == "42");
        assert(user.user_name == "tester");
        assert(user.vip_level == "basic");
    }

    void test_recycle_bin()
    {
        FakeCloud cloud;
        RemoteFiles files(cloud);
        const auto a = cloud.add_file(api::kRootFolderId, "a", "1");
        const auto b = cloud.add_file(api::kRootFolderId, "b", "2");
        files.remove({a, b});

        RecycleBin bin(cloud);
        assert(bin.list().size() == 2);
        bin.restore({std::to_string(a)});
        assert(bin.list().size() == 1);
        bin.purge_all();
        assert(bin.list().empty());

        assert(error_of([&]
                        { (void)bin.list(0); }) == ErrorCode::InvalidArgument);
        assert(error_of([&]
                        { (void)bin.list(201); }) == ErrorCode::InvalidArgument);
        assert(error_of([&]
                        { bin.purge({}); }) == ErrorCode::InvalidArgument);
        assert(error_of([&]
                        { bin.restore({}); }) == ErrorCode::InvalidArgument);
    }

    void test_commands()
    {
        FakeCloud cloud;
        FakeFetcher fetcher(cloud);
        FakeObjectStore store(cloud);
        std::ostringstream out;
        CommandContext context{cloud, fetcher, store, Logger(), out};

        assert(run_command(parse({"mkdir", "0", "music"}), context) == EXIT_SUCCESS);
        const auto music = cloud.find_child(api::kRootFolderId, "music");
        assert(music && music->folder);

        out.str("");
        assert(run_command(parse({"ls", "--limit", "10"}), context) == EXIT_SUCCESS);
        const auto listing = nlohmann::json::parse(out.str());
        assert(listing["items"].size() == 1);
        assert(listing["items"][0]["name"] == "music");

        out.str("");
        assert(run_command(parse({"whoami"}), context) == EXIT_SUCCESS);
        assert(nlohmann::json::parse(out.str())["user_name"] == "tester");

        TempDir dir("commands");
        dir.write("song.mp3", "la la la");
        out.str("");
        assert(run_command(parse({"up", (dir.path() / "song.mp3").string(), "--target", std::to_string(music->id),
                                  "--no-progress"}),
                           context) == EXIT_SUCCESS);
        const auto song = cloud.find_child(music->id, "song.mp3");
        assert(song.has_value());

        out.str("");
        assert(run_command(parse({"down", std::to_string(song->id), (dir.path() / "out").string(), "--no-progress"}),
                           context) == EXIT_SUCCESS);
        assert(read_file(dir.path() / "out" / "song.mp3") == "la la la");
        assert(nlohmann::json::parse(out.str())["success"] == true);

        out.str("");
        assert(run_command(parse({"rm", std::to_string(song->id)}), context) == EXIT_SUCCESS);
        out.str("");
        assert(run_command(parse({"trash", "list"}), context) == EXIT_SUCCESS);
        assert(nlohmann::json::parse(out.str()).size() == 1);

        bool rejected = false;
        try
        {
            (void)run_command(parse({"mkdir", "zero", "x"}), context);
        }
        catch (const std::runtime_error &)
        {
            rejected = true;
        }
        assert(rejected);
    }

} // namespace

void run_client_component_tests()
{
    test_upload_arguments();
    test_download_arguments();
    test_argument_errors();
    test_credentials();
    test_oss_signature();
    test_form_encoding();
    test_worker_pool();
    test_result_collector();
    test_logger_writes_file();
    test_logger_unopenable_path();
    test_progress_stays_off_stdout();
    test_remote_files_crud();
    test_recycle_bin();
    test_commands();
}
