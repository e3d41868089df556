#include <algorithm>
#include <cassert>
#include <filesystem>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "cloudpan/client/downloader.hpp"
#include "cloudpan/client/remote_files.hpp"
#include "cloudpan/client/tree_walker.hpp"
#include "cloudpan/error_codes.hpp"
#include "fake_cloud.hpp"

using namespace cloudpan;
using namespace cloudpan::client;
using cloudpan::testing::FakeCloud;
using cloudpan::testing::FakeFetcher;
using cloudpan::testing::TempDir;
using cloudpan::testing::read_file;

namespace
{

    DownloadOptions quiet(BatchMode mode = BatchMode::Concurrent)
    {
        DownloadOptions options;
        options.show_progress = false;
        options.mode = mode;
        return options;
    }

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

    struct SampleTree
    {
        api::RemoteId top{};
        api::RemoteId sub{};
        api::RemoteId a{};
        api::RemoteId b{};
        api::RemoteId c{};
    };

    // top/{a.txt, c.bin, sub/b.txt}
    SampleTree make_tree(FakeCloud &cloud)
    {
        SampleTree tree;
        tree.top = cloud.add_folder(api::kRootFolderId, "top");
        tree.sub = cloud.add_folder(tree.top, "sub");
        tree.a = cloud.add_file(tree.top, "a.txt", "alpha");
        tree.c = cloud.add_file(tree.top, "c.bin", std::string(20000, 'c'));
        tree.b = cloud.add_file(tree.sub, "b.txt", "bravo");
        return tree;
    }

    void test_name_and_path_guards()
    {
        assert(is_safe_entry_name("report.pdf"));
        assert(!is_safe_entry_name(""));
        assert(!is_safe_entry_name("."));
        assert(!is_safe_entry_name(".."));
        assert(!is_safe_entry_name("a/b"));
        assert(!is_safe_entry_name("a\\b"));
        assert(!is_safe_entry_name(std::string("a\0b", 3)));

        const std::filesystem::path base = "/tmp/save";
        assert(is_within(base, base / "x" / "y.txt"));
        assert(!is_within(base, base / ".." / "escape.txt"));
        assert(!is_within(base, base));
        assert(!is_within(base, "/etc/passwd"));
    }

    void test_flatten_pagination()
    {
        FakeCloud cloud;
        const auto big = cloud.add_folder(api::kRootFolderId, "big");
        for (int i = 0; i < 2300; ++i)
        {
            cloud.add_file(big, "f" + std::to_string(i), "x" + std::to_string(i));
        }

        RemoteFiles files(cloud);
        TreeWalker walker(files, Logger());
        const auto flat = walker.flatten(big, "/tmp/base");
        assert(flat.files.size() == 2300);
        assert(flat.omitted_paths.empty());
        assert(cloud.calls(api::endpoint::kFiles) == 2);

        const auto requests = cloud.requests(api::endpoint::kFiles);
        for (const auto &[key, value] : requests[1])
        {
            if (key == "offset")
            {
                assert(value == "1150");
            }
            if (key == "limit")
            {
                assert(value == "1150");
            }
            if (key == "show_dir")
            {
                assert(value == "1");
            }
        }
    }

    void test_pagination_stops_on_short_page()
    {
        FakeCloud cloud;
        const auto folder = cloud.add_folder(api::kRootFolderId, "few");
        cloud.add_file(folder, "one", "1");
        cloud.add_file(folder, "two", "2");

        RemoteFiles files(cloud);
        assert(files.list_all(folder).size() == 2);
        assert(cloud.calls(api::endpoint::kFiles) == 1);

        assert(files.list_all(folder, 1).size() == 2);
        assert(cloud.calls(api::endpoint::kFiles) == 3);

        const auto empty = cloud.add_folder(api::kRootFolderId, "empty");
        assert(files.list_all(empty).empty());
    }

    void test_flatten_records_omissions()
    {
        FakeCloud cloud;
        const auto tree = make_tree(cloud);
        const auto broken = cloud.add_folder(tree.top, "broken");
        cloud.add_file(broken, "lost.txt", "lost");
        cloud.fail_listing(broken);
        cloud.add_raw_entry(tree.top, {{"fid", "9001"}, {"pid", std::to_string(tree.top)}, {"fn", ".."}, {"fc", "1"}, {"pc", "evil1"}});
        cloud.add_raw_entry(tree.top, {{"fid", "9002"}, {"pid", std::to_string(tree.top)}, {"fn", "../../x"}, {"fc", "1"}, {"pc", "evil2"}});
        cloud.add_raw_entry(tree.top, {{"fid", "9003"}, {"pid", std::to_string(tree.top)}, {"fn", "nopick"}, {"fc", "1"}});

        RemoteFiles files(cloud);
        TreeWalker walker(files, Logger());
        const std::filesystem::path base = "/tmp/cloudpan_walk_base";
        const auto flat = walker.flatten(tree.top, base);

        assert(flat.files.size() == 3);
        std::set<std::string> relative;
        for (const auto &file : flat.files)
        {
            relative.insert(file.relative_path);
            assert(is_within(base, file.target_path));
            assert(file.target_path == base / std::filesystem::path(file.relative_path));
        }
        assert(relative == (std::set<std::string>{"a.txt", "c.bin", "sub/b.txt"}));

        const std::set<std::string> omitted(flat.omitted_paths.begin(), flat.omitted_paths.end());
        assert(omitted.count("broken") == 1);
        assert(omitted.count("..") == 1);
        assert(omitted.count("../../x") == 1);
        assert(omitted.count("nopick") == 1);
    }

    void test_flatten_top_failure_propagates()
    {
        FakeCloud cloud;
        const auto folder = cloud.add_folder(api::kRootFolderId, "dead");
        cloud.fail_listing(folder);
        RemoteFiles files(cloud);
        TreeWalker walker(files, Logger());
        assert(error_of([&]
                        { (void)walker.flatten(folder, "/tmp/x"); }) == ErrorCode::RemoteRejected);
    }

    void test_folder_download_and_rerun()
    {
        FakeCloud cloud;
        const auto tree = make_tree(cloud);
        FakeFetcher fetcher(cloud);
        TempDir save("folder_download");

        Downloader downloader(cloud, fetcher, Logger());
        auto options = quiet();
        options.max_workers = 3;
        const auto outcome = downloader.download(tree.top, save.path(), options);
        const auto &batch = std::get<TransferBatchResult>(outcome);
        assert(batch.total_files == 3);
        assert(batch.succeeded == 3);
        assert(batch.success());
        assert(batch.folder_name == "top");
        assert(batch.destination_root == save.path() / "top");
        assert(read_file(save.path() / "top" / "a.txt") == "alpha");
        assert(read_file(save.path() / "top" / "sub" / "b.txt") == "bravo");
        assert(read_file(save.path() / "top" / "c.bin") == std::string(20000, 'c'));
        for (const auto &result : batch.results)
        {
            assert(is_within(save.path() / "top", result.destination_path));
        }
        assert(fetcher.fetches() == 3);

        const auto again = downloader.download_folder(tree.top, save.path(), options);
        assert(again.total_files == 3);
        assert(again.succeeded == 0);
        assert(!again.success());
        for (const auto &result : again.results)
        {
            assert(result.skipped);
            assert(!result.success);
        }
        assert(fetcher.fetches() == 3);

        options.overwrite = true;
        const auto forced = downloader.download_folder(tree.top, save.path(), options);
        assert(forced.success());
        assert(fetcher.fetches() == 6);
    }

    void test_duplicate_names_download_once()
    {
        FakeCloud cloud;
        const auto folder = cloud.add_folder(api::kRootFolderId, "twins");
        cloud.add_file(folder, "same.txt", "first");
        cloud.add_file(folder, "same.txt", "second");
        cloud.add_file(folder, "other.txt", "other");
        FakeFetcher fetcher(cloud);
        TempDir save("duplicate_names");

        Downloader downloader(cloud, fetcher, Logger());
        const auto batch = downloader.download_folder(folder, save.path(), quiet());
        assert(batch.total_files == 2);
        assert(batch.succeeded == 2);
        assert(batch.success());
        assert(batch.omitted_paths == std::vector<std::string>{"same.txt"});
        assert(fetcher.fetches() == 2);
        assert(read_file(save.path() / "twins" / "same.txt") == "first");
        assert(read_file(save.path() / "twins" / "other.txt") == "other");
    }

    void test_folder_download_flat_into_save_path()
    {
        FakeCloud cloud;
        const auto tree = make_tree(cloud);
        FakeFetcher fetcher(cloud);
        TempDir save("flat_download");

        auto options = quiet(BatchMode::Loop);
        options.create_folder = false;
        Downloader downloader(cloud, fetcher, Logger());
        const auto batch = downloader.download_folder(tree.top, save.path(), options);
        assert(batch.success());
        assert(batch.destination_root == save.path());
        assert(std::filesystem::exists(save.path() / "sub" / "b.txt"));
        assert(!std::filesystem::exists(save.path() / "top"));
    }

    void test_dead_url_among_siblings()
    {
        FakeCloud cloud;
        const auto tree = make_tree(cloud);
        FakeFetcher fetcher(cloud);
        fetcher.kill(cloud.node(tree.a)->pick_code);
        TempDir save("dead_url");

        Downloader downloader(cloud, fetcher, Logger());
        const auto batch = downloader.download_folder(tree.top, save.path(), quiet());
        assert(batch.total_files == 3);
        assert(batch.failed == 1);
        assert(batch.succeeded == 2);
        assert(!batch.success());
        assert(!std::filesystem::exists(save.path() / "top" / "a.txt"));
        assert(std::filesystem::exists(save.path() / "top" / "sub" / "b.txt"));

        std::size_t failures = 0;
        for (const auto &result : batch.results)
        {
            if (!result.success)
            {
                ++failures;
                assert(result.display_name == "a.txt");
                assert(!result.skipped);
                assert(!result.message.empty());
            }
        }
        assert(failures == 1);
    }

    void test_interrupted_stream_leaves_no_file()
    {
        FakeCloud cloud;
        const auto tree = make_tree(cloud);
        const auto pick_code = cloud.node(tree.c)->pick_code;
        FakeFetcher fetcher(cloud);
        fetcher.interrupt(pick_code);
        TempDir save("interrupted");

        Downloader downloader(cloud, fetcher, Logger());
        auto options = quiet();
        options.chunk_size = 4096;
        const auto result = downloader.download_one(DownloadRequest{.pick_code = pick_code, .save_dir = save.path()},
                                                    options);
        assert(!result.success);
        assert(!result.skipped);
        assert(!std::filesystem::exists(save.path() / "c.bin"));
    }

    void test_single_file_targets()
    {
        FakeCloud cloud;
        const auto tree = make_tree(cloud);
        FakeFetcher fetcher(cloud);
        TempDir save("single_targets");
        Downloader downloader(cloud, fetcher, Logger());

        auto options = quiet();
        options.chunk_size = 7;
        const auto by_path = std::get<TransferResult>(downloader.download(std::string("top/sub/b.txt"), save.path(), options));
        assert(by_path.success);
        assert(by_path.destination_path == save.path() / "b.txt");
        assert(read_file(save.path() / "b.txt") == "bravo");

        options.filename = "renamed.bin";
        const auto by_id = std::get<TransferResult>(downloader.download(tree.c, save.path(), options));
        assert(by_id.success);
        assert(by_id.byte_size == 20000);
        assert(read_file(save.path() / "renamed.bin") == std::string(20000, 'c'));

        options.filename = "../outside.txt";
        const auto unsafe = std::get<TransferResult>(downloader.download(tree.a, save.path(), options));
        assert(!unsafe.success);
        assert(!std::filesystem::exists(save.path().parent_path() / "outside.txt"));
    }

    void test_target_resolution_errors()
    {
        FakeCloud cloud;
        make_tree(cloud);
        FakeFetcher fetcher(cloud);
        TempDir save("resolution");
        Downloader downloader(cloud, fetcher, Logger());
        const auto options = quiet();

        assert(error_of([&]
                        { (void)downloader.download(std::string("   "), save.path(), options); }) ==
               ErrorCode::InvalidArgument);
        assert(error_of([&]
                        { (void)downloader.download(std::string("/"), save.path(), options); }) ==
               ErrorCode::InvalidArgument);
        assert(error_of([&]
                        { (void)downloader.download(api::RemoteId{0}, save.path(), options); }) ==
               ErrorCode::InvalidArgument);
        assert(cloud.calls(api::endpoint::kFolderInfo) == 0);

        assert(error_of([&]
                        { (void)downloader.download(std::string("/top"), save.path(), options); }) ==
               ErrorCode::InvalidArgument);
        assert(error_of([&]
                        { (void)downloader.download(std::string("/top/missing.txt"), save.path(), options); }) ==
               ErrorCode::RemoteRejected);
        assert(error_of([&]
                        { (void)downloader.download(api::RemoteId{424242}, save.path(), options); }) ==
               ErrorCode::RemoteRejected);

        auto zero_chunk = options;
        zero_chunk.chunk_size = 0;
        assert(error_of([&]
                        { (void)downloader.download(std::string("/top/a.txt"), save.path(), zero_chunk); }) ==
               ErrorCode::InvalidArgument);
    }

    void test_loop_and_concurrent_downloads_agree()
    {
        FakeCloud cloud;
        const auto top = cloud.add_folder(api::kRootFolderId, "many");
        std::vector<api::RemoteId> folders;
        for (int i = 0; i < 4; ++i)
        {
            folders.push_back(cloud.add_folder(top, "d" + std::to_string(i)));
        }
        for (int i = 0; i < 20; ++i)
        {
            cloud.add_file(folders[i % 4], "f" + std::to_string(i), "payload " + std::to_string(i));
        }
        FakeFetcher fetcher(cloud);
        TempDir loop_dir("download_loop");
        TempDir pool_dir("download_pool");

        Downloader downloader(cloud, fetcher, Logger());
        auto pool_options = quiet(BatchMode::Concurrent);
        pool_options.max_workers = 0;
        const auto loop = downloader.download_folder(top, loop_dir.path(), quiet(BatchMode::Loop));
        const auto pool = downloader.download_folder(top, pool_dir.path(), pool_options);

        assert(loop.total_files == 20 && pool.total_files == 20);
        assert(loop.succeeded == 20 && pool.succeeded == 20);
        std::set<std::string> loop_names;
        std::set<std::string> pool_names;
        for (const auto &result : loop.results)
        {
            loop_names.insert(result.display_name);
        }
        for (const auto &result : pool.results)
        {
            pool_names.insert(result.display_name);
        }
        assert(loop_names == pool_names);
    }

} // namespace

void run_download_tests()
{
    test_name_and_path_guards();
    test_flatten_pagination();
    test_pagination_stops_on_short_page();
    test_flatten_records_omissions();
    test_flatten_top_failure_propagates();
    test_folder_download_and_rerun();
    test_duplicate_names_download_once();
    test_folder_download_flat_into_save_path();
    test_dead_url_among_siblings();
    test_interrupted_stream_leaves_no_file();
    test_single_file_targets();
    test_target_resolution_errors();
    test_loop_and_concurrent_downloads_agree();
}
