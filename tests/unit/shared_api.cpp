#include <array>
#include <cassert>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <span>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cloudpan/api.hpp"
#include "cloudpan/crypto.hpp"
#include "cloudpan/encoding/base64.hpp"
#include "cloudpan/error_codes.hpp"

using namespace cloudpan;

void run_client_component_tests();
void run_upload_tests();
void run_download_tests();

namespace
{

    std::string hex(const std::vector<std::byte> &bytes)
    {
        return crypto::to_hex(std::span<const unsigned char>(reinterpret_cast<const unsigned char *>(bytes.data()),
                                                             bytes.size()));
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

    void test_sha1_vectors()
    {
        const std::string abc = "abc";
        const auto digest = crypto::hash_bytes(std::as_bytes(std::span<const char>(abc.data(), abc.size())));
        assert(digest == "A9993E364706816ABA3E25717850C26C9CD0D89D");

        std::istringstream stream(abc);
        assert(crypto::hash_stream(stream) == digest);

        const auto mac = crypto::hmac_sha1("Jefe", "what do ya want for nothing?");
        assert(mac.size() == 20);
        assert(hex(mac) == "EFFCDF6AE5EB2FA2D27416D5F184DF9C259A7C79");
    }

    void test_file_digests()
    {
        const auto path = std::filesystem::temp_directory_path() / "cloudpan_digest_test.bin";
        {
            std::ofstream file(path, std::ios::binary | std::ios::trunc);
            for (int round = 0; round < 1024; ++round)
            {
                for (int value = 0; value < 256; ++value)
                {
                    file.put(static_cast<char>(value));
                }
            }
        }

        const auto digests = crypto::digest_file(path);
        assert(digests.size == 262144);
        assert(digests.whole == "37EF77696FC255BF53B4CDD014B223676F2DC8BB");
        assert(digests.prefix == "F826028ED472B1FADEDDBF54FC1912A095D28795");
        assert(crypto::hash_file(path) == digests.whole);
        assert(crypto::hash_file_range(path, 0, crypto::kPrefixDigestBytes - 1) == digests.prefix);
        assert(crypto::hash_file_range(path, 1000, 2000) == "3D842FD3A70EC430DA4BF45C0DDF0C57A6A0FA8F");

        assert(error_of([&]
                        { (void)crypto::hash_file_range(path, 262000, 300000); }) == ErrorCode::LocalIo);
        assert(error_of([&]
                        { (void)crypto::hash_file_range(path, 10, 5); }) == ErrorCode::InvalidArgument);

        std::filesystem::remove(path);
        assert(error_of([&]
                        { (void)crypto::digest_file(path); }) == ErrorCode::LocalIo);
    }

    void test_small_file_prefix_is_whole_file()
    {
        const auto path = std::filesystem::temp_directory_path() / "cloudpan_small_digest.bin";
        {
            std::ofstream file(path, std::ios::binary | std::ios::trunc);
            file << "abc";
        }
        const auto digests = crypto::digest_file(path);
        assert(digests.size == 3);
        assert(digests.whole == "A9993E364706816ABA3E25717850C26C9CD0D89D");
        assert(digests.prefix == digests.whole);
        std::filesystem::remove(path);
    }

    void test_base64()
    {
        assert(encoding::encode_base64(std::string_view("")) == "");
        assert(encoding::encode_base64(std::string_view("fo")) == "Zm8=");
        assert(encoding::encode_base64(std::string_view("foo")) == "Zm9v");
        assert(encoding::encode_base64(std::string_view("foobar")) == "Zm9vYmFy");

        const std::array<std::byte, 3> raw = {std::byte{0xFB}, std::byte{0xFF}, std::byte{0x00}};
        assert(encoding::encode_base64(raw) == "+/8A");
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::RemoteRejected) == "remote_rejected");
        assert(error_code_from_int(to_int(ErrorCode::LocalIo)) == ErrorCode::LocalIo);
        assert(error_code_from_int(999) == ErrorCode::InternalError);

        const ApiError error(ErrorCode::RemoteRejected, "nope", 20004);
        assert(error.code() == ErrorCode::RemoteRejected);
        assert(error.remote_code() == 20004);
        assert(std::string(error.what()) == "nope");
    }

    void test_response_envelope()
    {
        const auto ok = api::parse_response(nlohmann::json{{"state", true}, {"code", 0}, {"data", {{"a", 1}}}});
        assert(ok.ok);
        assert(ok.data["a"] == 1);
        api::ensure_ok(ok, "noop");

        const auto failed = api::parse_response(nlohmann::json{{"state", false}, {"code", 40140125}, {"message", "token expired"}});
        assert(!failed.ok);
        bool thrown = false;
        try
        {
            api::ensure_ok(failed, "List");
        }
        catch (const ApiError &ex)
        {
            thrown = true;
            assert(ex.code() == ErrorCode::RemoteRejected);
            assert(ex.remote_code() == 40140125);
            assert(std::string(ex.what()).find("token expired") != std::string::npos);
        }
        assert(thrown);

        assert(error_of([]
                        { (void)api::parse_response(nlohmann::json::array()); }) == ErrorCode::ProtocolViolation);
    }

    void test_listing_parse()
    {
        const auto body = nlohmann::json::parse(R"({
            "state": true, "code": 0, "count": "2300", "offset": 0, "limit": 1150,
            "data": [
                {"fid": "11", "pid": "0", "fn": "docs", "fc": "0"},
                {"fid": 12, "pid": "0", "fn": "a.txt", "fc": "1", "fs": "5", "pc": "abc", "sha1": "FF"}
            ]
        })");
        const auto page = api::parse_list_page(api::parse_response(body));
        assert(page.count == 2300);
        assert(page.items.size() == 2);
        assert(page.items[0].is_folder);
        assert(page.items[0].id == 11);
        assert(!page.items[1].is_folder);
        assert(page.items[1].size == 5);
        assert(page.items[1].pick_code == "abc");

        const auto bad = nlohmann::json{{"state", true}, {"data", "oops"}};
        assert(error_of([&]
                        { (void)api::parse_list_page(api::parse_response(bad)); }) == ErrorCode::ProtocolViolation);
    }

    void test_numeric_fields_out_of_range()
    {
        const auto body = nlohmann::json::parse(R"({
            "state": true, "code": 18446744073709551615, "count": -1e300,
            "data": [
                {"fid": 1, "fn": "neg", "fc": "1", "fs": -3.5},
                {"fid": 2, "fn": "huge", "fc": "1", "fs": 1e30},
                {"fid": 3, "fn": "whole", "fc": "1", "fs": 12.0}
            ]
        })");
        const auto response = api::parse_response(body);
        assert(response.code == 0);
        const auto page = api::parse_list_page(response);
        assert(page.count == 3);
        assert(page.items[0].size == 0);
        assert(page.items[1].size == 0);
        assert(page.items[2].size == 12);

        assert(api::parse_response(nlohmann::json{{"state", false}, {"code", -7}}).code == -7);
        assert(api::parse_response(nlohmann::json{{"state", false}, {"code", 1e300}}).code == 0);
        assert(api::parse_response(nlohmann::json{{"state", false}, {"code", 990001.0}}).code == 990001);
    }

    void test_upload_init_parse()
    {
        const auto body = nlohmann::json::parse(R"({
            "state": true, "code": 0,
            "data": {"status": 7, "code": 701, "sign_key": "k", "sign_check": "0-9", "pick_code": "p",
                     "bucket": "b", "object": "o",
                     "callback": {"callback": "cb", "callback_var": "cv"}}
        })");
        const auto reply = api::parse_upload_init(api::parse_response(body));
        assert(reply.status == 7);
        assert(reply.code == 701);
        assert(reply.sign_check == "0-9");
        assert(reply.callback == "cb");
        assert(reply.callback_var == "cv");

        const auto listed = nlohmann::json::parse(R"({"state": true, "data": [{"status": "2", "pick_code": "x"}]})");
        const auto instant = api::parse_upload_init(api::parse_response(listed));
        assert(instant.status == 2);
        assert(instant.pick_code == "x");
    }

    void test_download_ticket_parse()
    {
        const auto body = nlohmann::json::parse(R"({
            "state": true,
            "data": {"998": {"file_name": "a.bin", "file_size": "10", "pick_code": "pc",
                             "url": {"url": "https://cdn.example/a.bin"}}}
        })");
        const auto ticket = api::parse_download_ticket(api::parse_response(body));
        assert(ticket.url == "https://cdn.example/a.bin");
        assert(ticket.file_name == "a.bin");
        assert(ticket.file_size == 10);

        const auto empty = nlohmann::json{{"state", true}, {"data", nlohmann::json::array()}};
        assert(error_of([&]
                        { (void)api::parse_download_ticket(api::parse_response(empty)); }) == ErrorCode::NotFound);
    }

    void test_credentials_parse()
    {
        const auto body = nlohmann::json::parse(R"({
            "state": true,
            "data": [{"endpoint": "https://oss-cn-shenzhen.aliyuncs.com", "AccessKeyId": "id",
                      "AccessKeySecret": "secret", "SecurityToken": "token", "Expiration": "later"}]
        })");
        const auto credentials = api::parse_upload_credentials(api::parse_response(body));
        assert(credentials.endpoint == "https://oss-cn-shenzhen.aliyuncs.com");
        assert(credentials.security_token == "token");

        const auto missing = nlohmann::json{{"state", true}, {"data", {{"endpoint", "x"}}}};
        assert(error_of([&]
                        { (void)api::parse_upload_credentials(api::parse_response(missing)); }) ==
               ErrorCode::ProtocolViolation);
    }

    void test_join_ids()
    {
        assert(api::join_ids({}) == "");
        assert(api::join_ids({1, 22, 333}) == "1,22,333");
    }

} // namespace

int main()
{
    try
    {
        test_sha1_vectors();
        test_file_digests();
        test_small_file_prefix_is_whole_file();
        test_base64();
        test_error_codes();
        test_response_envelope();
        test_listing_parse();
        test_numeric_fields_out_of_range();
        test_upload_init_parse();
        test_download_ticket_parse();
        test_credentials_parse();
        test_join_ids();
        run_client_component_tests();
        run_upload_tests();
        run_download_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "all tests passed\n";
    return 0;
}
