#include <catch2/catch.hpp>

#include "fake_object_store.hpp"

#include "irods/private/chunked_transfer/checksum_accumulator.hpp"
#include "irods/private/chunked_transfer/transfer_engine.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstring>
#include <sstream>
#include <string>

namespace ct = irods::experimental::io::chunked_transfer;

using chunked_transfer_test::fake_object_store;
using chunked_transfer_test::make_pattern;
using chunked_transfer_test::pattern_data_source;
using chunked_transfer_test::virtual_clock;

using namespace std::chrono_literals;

namespace
{
    const std::int64_t mebibyte = ct::constants::MEBIBYTE;

    // Zero filled source for transfers too large to generate byte by byte.
    class zero_data_source : public ct::data_source
    {
    public:

        explicit zero_data_source(std::int64_t _size)
            : remaining_{_size}
        {
        }

        irods::error read(char* _buffer, std::int64_t _length, std::int64_t& _bytes_read) override
        {
            _bytes_read = std::min(_length, remaining_);
            std::memset(_buffer, 0, _bytes_read);
            remaining_ -= _bytes_read;
            return SUCCESS();
        }

    private:

        std::int64_t remaining_;

    }; // end class zero_data_source

    std::string md5_of(const std::string& _bytes)
    {
        std::istringstream stream{_bytes};
        ct::istream_data_source source{stream};
        ct::checksum_accumulator accumulator{source};

        std::string buffer(_bytes.size() + 1, '\0');
        std::int64_t bytes_read = 0;
        REQUIRE(ct::read_fully(accumulator, buffer.data(), buffer.size(), bytes_read).ok());

        std::string digest;
        REQUIRE(accumulator.digest(digest).ok());
        return digest;
    }
}

TEST_CASE("small objects are uploaded with a single put", "[engine][upload]")
{
    fake_object_store store;
    virtual_clock clock;
    ct::transfer_config config;

    ct::transfer_engine engine{store, config, clock};

    SECTION("an empty object")
    {
        pattern_data_source source{0};
        const auto result = engine.upload(ct::transfer_request{"engine/empty", 0, source});

        REQUIRE(result.ok());
        CHECK(result.mode == ct::transfer_mode::SIMPLE);
        CHECK(store.put_calls == 1);
        CHECK(store.create_calls == 0);
        CHECK(store.objects.at("engine/empty").empty());
        CHECK(result.checksum == "1B2M2Y8AsgTpgAmY7PhCfg==");
    }

    SECTION("checksum is attached as metadata and content digest")
    {
        std::istringstream stream{"hello world"};
        ct::istream_data_source source{stream};
        const auto result = engine.upload(ct::transfer_request{"engine/hello", 11, source});

        REQUIRE(result.ok());
        CHECK(result.bytes_transferred == 11);
        CHECK(store.objects.at("engine/hello") == "hello world");

        const auto& properties = store.object_properties.at("engine/hello");
        CHECK(properties.content_md5 == "XrY7u+Ae7tCTyyK7j1rNww==");
        CHECK(properties.metadata.at("md5chksum") == "XrY7u+Ae7tCTyyK7j1rNww==");
        CHECK(properties.tier == ct::storage_tier::STANDARD);

        const nlohmann::json json = result;
        CHECK(json.at("mode") == "simple");
        CHECK(json.at("checksum") == "XrY7u+Ae7tCTyyK7j1rNww==");
        CHECK(json.count("state") == 0);
    }

    SECTION("the request tier overrides the configured tier")
    {
        pattern_data_source source{1000};
        ct::transfer_request request{"engine/archived", 1000, source};
        request.tier = ct::storage_tier::ARCHIVE;

        REQUIRE(engine.upload(request).ok());
        CHECK(store.object_properties.at("engine/archived").tier == ct::storage_tier::ARCHIVE);
    }
}

TEST_CASE("checksums can be disabled", "[engine][upload]")
{
    fake_object_store store;
    virtual_clock clock;
    ct::transfer_config config;
    config.disable_checksum = true;

    ct::transfer_engine engine{store, config, clock};

    pattern_data_source source{100};
    const auto result = engine.upload(ct::transfer_request{"engine/no_checksum", 100, source});

    REQUIRE(result.ok());
    CHECK(result.checksum.empty());
    CHECK(store.object_properties.at("engine/no_checksum").content_md5.empty());
    CHECK(store.object_properties.at("engine/no_checksum").metadata.empty());
}

TEST_CASE("a rejected digest is a checksum mismatch", "[engine][upload]")
{
    fake_object_store store;
    store.reject_digest = true;

    virtual_clock clock;
    ct::transfer_engine engine{store, ct::transfer_config{}, clock};

    pattern_data_source source{64};
    const auto result = engine.upload(ct::transfer_request{"engine/bad_digest", 64, source});

    CHECK(result.code == ct::error_codes::CHECKSUM_MISMATCH);
    CHECK(store.objects.count("engine/bad_digest") == 0);
}

TEST_CASE("transient put failures are retried", "[engine][upload]")
{
    fake_object_store store;
    store.transient_put_failures = 2;

    virtual_clock clock;
    ct::transfer_engine engine{store, ct::transfer_config{}, clock};

    pattern_data_source source{64};
    const auto result = engine.upload(ct::transfer_request{"engine/retried", 64, source});

    REQUIRE(result.ok());
    CHECK(store.put_calls == 3);
    CHECK(clock.sleeps().size() == 2);
}

TEST_CASE("a source that does not match its declared size fails", "[engine][upload]")
{
    fake_object_store store;
    virtual_clock clock;
    ct::transfer_config config;
    config.upload_cutoff = 5 * mebibyte;

    ct::transfer_engine engine{store, config, clock};

    SECTION("longer than declared, single put")
    {
        pattern_data_source source{101};
        const auto result = engine.upload(ct::transfer_request{"engine/long", 100, source});

        CHECK(result.code == ct::error_codes::SOURCE_READ_ERROR);
        CHECK(store.put_calls == 0);
    }

    SECTION("shorter than declared, single put")
    {
        pattern_data_source source{99};
        const auto result = engine.upload(ct::transfer_request{"engine/short", 100, source});

        CHECK(result.code == ct::error_codes::SOURCE_READ_ERROR);
        CHECK(store.put_calls == 0);
    }

    SECTION("longer than declared, multipart")
    {
        pattern_data_source source{2 * ct::constants::MINIMUM_CHUNK_SIZE + 1};
        const auto result = engine.upload(ct::transfer_request{"engine/long_multipart", 2 * ct::constants::MINIMUM_CHUNK_SIZE, source});

        CHECK(result.code == ct::error_codes::SOURCE_READ_ERROR);
        CHECK(result.state == ct::session_state::ABORTED);
        CHECK(store.complete_calls == 0);
        CHECK(store.abort_calls == 1);
    }

    SECTION("shorter than declared, multipart")
    {
        pattern_data_source source{ct::constants::MINIMUM_CHUNK_SIZE + 1};
        const auto result = engine.upload(ct::transfer_request{"engine/short_multipart", 3 * ct::constants::MINIMUM_CHUNK_SIZE, source});

        CHECK(result.code == ct::error_codes::SOURCE_READ_ERROR);
        CHECK(result.state == ct::session_state::ABORTED);
        CHECK(store.abort_calls == 1);
    }
}

TEST_CASE("large objects are uploaded in parts", "[engine][upload]")
{
    fake_object_store store;
    virtual_clock clock;
    ct::transfer_config config;
    config.upload_cutoff = 5 * mebibyte;
    config.upload_concurrency = 3;

    ct::transfer_engine engine{store, config, clock};

    const std::int64_t size = 2 * ct::constants::MINIMUM_CHUNK_SIZE + 100;
    pattern_data_source source{size};

    const auto result = engine.upload(ct::transfer_request{"engine/multipart", size, source});

    REQUIRE(result.ok());
    CHECK(result.mode == ct::transfer_mode::CHUNKED);
    CHECK(result.state == ct::session_state::COMPLETED);
    CHECK(result.part_count == 3);
    CHECK(result.bytes_transferred == size);
    CHECK(store.completed_part_numbers == std::vector<int>{1, 2, 3});

    const auto expected = make_pattern(size);
    CHECK(store.objects.at("engine/multipart") == expected);
    CHECK(result.checksum == md5_of(expected));

    const nlohmann::json json = result;
    CHECK(json.at("mode") == "chunked");
    CHECK(json.at("state") == "COMPLETED");
    CHECK(json.at("completed_parts").size() == 3);
    CHECK(json.count("upload_id") == 0);
}

TEST_CASE("a one gibibyte object is split into 205 parts", "[engine][upload]")
{
    fake_object_store store;
    store.retain_data = false;

    virtual_clock clock;
    ct::transfer_config config;
    config.disable_checksum = true;

    ct::transfer_engine engine{store, config, clock};

    const std::int64_t size = ct::constants::GIBIBYTE;
    zero_data_source source{size};

    const auto result = engine.upload(ct::transfer_request{"engine/gibibyte", size, source});

    REQUIRE(result.ok());
    CHECK(result.part_count == 205);
    CHECK(store.upload_part_calls == 205);
    CHECK(store.completed_part_numbers.size() == 205);
    CHECK(store.completed_part_numbers.front() == 1);
    CHECK(store.completed_part_numbers.back() == 205);
    CHECK(store.max_in_flight <= config.upload_concurrency);
}

TEST_CASE("streams of unknown size", "[engine][upload]")
{
    fake_object_store store;
    virtual_clock clock;
    ct::transfer_config config;
    config.maximum_part_count = 3;

    ct::transfer_engine engine{store, config, clock};

    SECTION("an empty stream becomes one empty part")
    {
        pattern_data_source source{0};
        const auto result = engine.upload(ct::transfer_request{"engine/empty_stream", ct::constants::UNKNOWN_OBJECT_SIZE, source});

        REQUIRE(result.ok());
        CHECK(result.mode == ct::transfer_mode::CHUNKED);
        CHECK(result.part_count == 1);
        CHECK(store.upload_part_calls == 1);
        CHECK(store.completed_part_numbers == std::vector<int>{1});
        CHECK(store.objects.at("engine/empty_stream").empty());
        CHECK(result.checksum == "1B2M2Y8AsgTpgAmY7PhCfg==");
    }

    SECTION("a stream that fits under the part ceiling")
    {
        const std::int64_t size = 2 * ct::constants::MINIMUM_CHUNK_SIZE + 17;
        pattern_data_source source{size};
        const auto result = engine.upload(ct::transfer_request{"engine/stream", ct::constants::UNKNOWN_OBJECT_SIZE, source});

        REQUIRE(result.ok());
        CHECK(result.bytes_transferred == size);
        CHECK(store.objects.at("engine/stream") == make_pattern(size));
    }

    SECTION("a stream beyond the part ceiling is aborted")
    {
        pattern_data_source source{3 * ct::constants::MINIMUM_CHUNK_SIZE + 1};
        const auto result = engine.upload(ct::transfer_request{"engine/overflow", ct::constants::UNKNOWN_OBJECT_SIZE, source});

        CHECK(result.code == ct::error_codes::PART_COUNT_EXCEEDED);
        CHECK(result.state == ct::session_state::ABORTED);
        CHECK(store.complete_calls == 0);
        CHECK(store.abort_calls == 1);
        CHECK(store.uploads.empty());
    }
}

TEST_CASE("multipart failures are cleaned up", "[engine][upload]")
{
    fake_object_store store;
    virtual_clock clock;
    ct::transfer_config config;
    config.upload_cutoff = 5 * mebibyte;

    const std::int64_t size = 3 * ct::constants::MINIMUM_CHUNK_SIZE;

    SECTION("a failed create leaves nothing to abort")
    {
        store.fail_create = true;
        ct::transfer_engine engine{store, config, clock};

        pattern_data_source source{size};
        const auto result = engine.upload(ct::transfer_request{"engine/no_session", size, source});

        CHECK(result.code == ct::error_codes::INITIATE_MULTIPART_UPLOAD_ERROR);
        CHECK(result.state == ct::session_state::ABORTED);
        CHECK(store.upload_part_calls == 0);
        CHECK(store.abort_calls == 0);
    }

    SECTION("a failed part aborts the session")
    {
        store.failing_parts = {2};
        ct::transfer_engine engine{store, config, clock};

        pattern_data_source source{size};
        const auto result = engine.upload(ct::transfer_request{"engine/part_fails", size, source});

        CHECK(result.code == ct::error_codes::UPLOAD_PART_ERROR);
        CHECK(result.failed_part_number == 2);
        CHECK(result.state == ct::session_state::ABORTED);
        CHECK(store.abort_calls == 1);
        CHECK(store.objects.count("engine/part_fails") == 0);
    }

    SECTION("a failed part leaves the session open when asked to")
    {
        store.failing_parts = {3};
        config.leave_parts_on_error = true;
        config.upload_concurrency = 1;
        ct::transfer_engine engine{store, config, clock};

        pattern_data_source source{size};
        const auto result = engine.upload(ct::transfer_request{"engine/left_open", size, source});

        CHECK(result.code == ct::error_codes::UPLOAD_PART_ERROR);
        CHECK(result.state == ct::session_state::LEFT_OPEN);
        CHECK_FALSE(result.upload_id.empty());
        CHECK(result.completed_parts.size() == 2);
        CHECK(store.abort_calls == 0);
        CHECK(store.uploads.count(result.upload_id) == 1);
    }
}

TEST_CASE("invalid configuration is rejected before any remote call", "[engine]")
{
    fake_object_store store;
    virtual_clock clock;
    ct::transfer_config config;
    config.chunk_size = mebibyte;

    ct::transfer_engine engine{store, config, clock};

    pattern_data_source source{10};
    const auto result = engine.upload(ct::transfer_request{"engine/invalid", 10, source});

    CHECK(result.code == ct::error_codes::INVALID_SIZE_CONFIGURATION);
    CHECK(store.put_calls == 0);
    CHECK(store.create_calls == 0);

    const auto copied = engine.copy("engine/a", "engine/b");
    CHECK(copied.code == ct::error_codes::INVALID_SIZE_CONFIGURATION);
    CHECK(store.head_calls == 0);
}

TEST_CASE("a cancelled transfer stops", "[engine]")
{
    fake_object_store store;
    virtual_clock clock;
    ct::transfer_config config;
    config.upload_cutoff = 5 * mebibyte;
    config.upload_concurrency = 1;

    ct::transfer_engine engine{store, config, clock};

    SECTION("before it starts")
    {
        ct::cancellation_token token;
        token.request_cancellation();

        pattern_data_source source{10};
        const auto result = engine.upload(ct::transfer_request{"engine/cancelled_early", 10, source}, token);

        CHECK(result.code == ct::error_codes::CANCELLED);
        CHECK(store.put_calls == 0);
    }

    SECTION("while parts are in flight")
    {
        ct::cancellation_token token;
        store.on_upload_part = [&token](int _part_number) {
            if (2 == _part_number) {
                token.request_cancellation();
            }
        };

        const std::int64_t size = 4 * ct::constants::MINIMUM_CHUNK_SIZE;
        pattern_data_source source{size};
        const auto result = engine.upload(ct::transfer_request{"engine/cancelled", size, source}, token);

        CHECK(result.code == ct::error_codes::CANCELLED);
        CHECK(result.state == ct::session_state::ABORTED);
        CHECK(store.abort_calls == 1);
        CHECK(store.complete_calls == 0);
        CHECK(source.position() < size);
    }
}

TEST_CASE("server side copies", "[engine][copy]")
{
    fake_object_store store;
    store.objects["copy/source"] = "some bytes";

    virtual_clock clock;
    ct::transfer_config config;
    config.copy_timeout = 10s;

    SECTION("a copy finished within the request")
    {
        ct::transfer_engine engine{store, config, clock};
        const auto result = engine.copy("copy/source", "copy/destination", ct::storage_tier::INFREQUENT_ACCESS);

        REQUIRE(result.ok());
        CHECK(result.state == ct::copy_state::SUCCEEDED);
        CHECK(result.size == 10);
        CHECK_FALSE(result.multipart);
        CHECK(result.status_polls == 0);
        CHECK(store.objects.at("copy/destination") == "some bytes");
        CHECK(store.object_properties.at("copy/destination").tier == ct::storage_tier::INFREQUENT_ACCESS);
    }

    SECTION("an asynchronous copy is polled until it finishes")
    {
        store.asynchronous_copies = true;
        store.polls_until_copy_done = 3;

        ct::transfer_engine engine{store, config, clock};
        const auto result = engine.copy("copy/source", "copy/destination");

        REQUIRE(result.ok());
        CHECK(result.state == ct::copy_state::SUCCEEDED);
        CHECK(result.status_polls == 3);
        CHECK_FALSE(result.operation_token.empty());

        const nlohmann::json json = result;
        CHECK(json.at("state") == "SUCCEEDED");
        CHECK(json.at("status_polls") == 3);
    }

    SECTION("an asynchronous copy that never finishes times out")
    {
        store.asynchronous_copies = true;
        store.polls_until_copy_done = -1;

        const auto start = clock.now();
        ct::transfer_engine engine{store, config, clock};
        const auto result = engine.copy("copy/source", "copy/destination");

        CHECK(result.code == ct::error_codes::COPY_TIMEOUT);
        CHECK(result.state == ct::copy_state::TIMED_OUT);
        CHECK(clock.now() - start >= config.copy_timeout);
        CHECK(result.status_polls > 1);
    }

    SECTION("a copy the service reports as failed")
    {
        store.asynchronous_copies = true;
        store.remote_copy_fails = true;

        ct::transfer_engine engine{store, config, clock};
        const auto result = engine.copy("copy/source", "copy/destination");

        CHECK(result.code == ct::error_codes::COPY_OBJECT_ERROR);
        CHECK(result.state == ct::copy_state::FAILED);
    }

    SECTION("a missing source")
    {
        ct::transfer_engine engine{store, config, clock};
        const auto result = engine.copy("copy/missing", "copy/destination");

        CHECK(result.code == ct::error_codes::HEAD_OBJECT_ERROR);
        CHECK(result.state == ct::copy_state::FAILED);
        CHECK(store.copy_calls == 0);
    }

    SECTION("a copy above the copy cutoff is done in parts")
    {
        store.retain_data = false;
        store.sizes["copy/source"] = 12 * mebibyte;
        config.copy_cutoff = 5 * mebibyte;

        ct::transfer_engine engine{store, config, clock};
        const auto result = engine.copy("copy/source", "copy/destination");

        REQUIRE(result.ok());
        CHECK(result.multipart);
        CHECK(result.state == ct::copy_state::SUCCEEDED);
        CHECK(store.copy_calls == 0);
        CHECK(store.upload_part_copy_calls == 3);
        CHECK(store.completed_part_numbers == std::vector<int>{1, 2, 3});
        CHECK(result.multipart_result.state == ct::session_state::COMPLETED);

        const nlohmann::json json = result;
        CHECK(json.at("multipart").at("part_count") == 3);
    }

    SECTION("a failed part copy aborts the session")
    {
        store.retain_data = false;
        store.sizes["copy/source"] = 12 * mebibyte;
        store.failing_parts = {2};
        config.copy_cutoff = 5 * mebibyte;

        ct::transfer_engine engine{store, config, clock};
        const auto result = engine.copy("copy/source", "copy/destination");

        CHECK(result.code == ct::error_codes::UPLOAD_PART_ERROR);
        CHECK(result.state == ct::copy_state::FAILED);
        CHECK(result.multipart_result.state == ct::session_state::ABORTED);
        CHECK(store.abort_calls == 1);
    }
}
