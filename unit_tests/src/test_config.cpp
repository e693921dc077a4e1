#include <catch2/catch.hpp>

#include "irods/private/chunked_transfer/config.hpp"
#include "irods/private/chunked_transfer/types.hpp"

#include <irods/rodsErrorTable.h>

#include <chrono>

namespace ct = irods::experimental::io::chunked_transfer;

using namespace std::chrono_literals;

TEST_CASE("default configuration", "[config]")
{
    ct::transfer_config config;

    CHECK(config.upload_cutoff == 200 * ct::constants::MEBIBYTE);
    CHECK(config.chunk_size == 5 * ct::constants::MEBIBYTE);
    CHECK(config.upload_concurrency == 10);
    CHECK(config.copy_cutoff == 4768 * ct::constants::MEBIBYTE);
    CHECK(config.copy_timeout == 1min);
    CHECK_FALSE(config.disable_checksum);
    CHECK_FALSE(config.leave_parts_on_error);
    CHECK(config.tier == ct::storage_tier::STANDARD);
    CHECK(config.copy_min_sleep == 100ms);
    CHECK(config.copy_max_sleep == 5min);

    CHECK(ct::validate_config(config).ok());
}

TEST_CASE("validate_config rejects out of range sizes", "[config]")
{
    ct::transfer_config config;

    SECTION("chunk size below the minimum")
    {
        config.chunk_size = ct::constants::MINIMUM_CHUNK_SIZE - 1;
        CHECK(ct::validate_config(config).code() == SYS_INVALID_INPUT_PARAM);
    }

    SECTION("upload cutoff above the maximum")
    {
        config.upload_cutoff = ct::constants::MAXIMUM_UPLOAD_CUTOFF + 1;
        CHECK_FALSE(ct::validate_config(config).ok());
    }

    SECTION("copy cutoff above the maximum")
    {
        config.copy_cutoff = ct::constants::MAXIMUM_COPY_CUTOFF + 1;
        CHECK_FALSE(ct::validate_config(config).ok());
    }

    SECTION("no concurrency")
    {
        config.upload_concurrency = 0;
        CHECK_FALSE(ct::validate_config(config).ok());
    }

    SECTION("concurrency above the maximum")
    {
        config.upload_concurrency = ct::constants::MAXIMUM_UPLOAD_CONCURRENCY + 1;
        CHECK_FALSE(ct::validate_config(config).ok());

        config.upload_concurrency = ct::constants::MAXIMUM_UPLOAD_CONCURRENCY;
        CHECK(ct::validate_config(config).ok());
    }

    SECTION("part ceiling above the service limit")
    {
        config.maximum_part_count = ct::constants::MAXIMUM_NUMBER_OF_PARTS + 1;
        CHECK_FALSE(ct::validate_config(config).ok());
    }

    SECTION("pacer bounds inverted")
    {
        config.copy_min_sleep = 10s;
        config.copy_max_sleep = 1s;
        CHECK_FALSE(ct::validate_config(config).ok());
    }
}

TEST_CASE("parse_size", "[config]")
{
    std::int64_t bytes = 0;

    CHECK(ct::parse_size("1024", bytes).ok());
    CHECK(bytes == 1024);

    CHECK(ct::parse_size("5M", bytes).ok());
    CHECK(bytes == 5 * ct::constants::MEBIBYTE);

    CHECK(ct::parse_size("16Mi", bytes).ok());
    CHECK(bytes == 16 * ct::constants::MEBIBYTE);

    CHECK(ct::parse_size("2GiB", bytes).ok());
    CHECK(bytes == 2 * ct::constants::GIBIBYTE);

    CHECK(ct::parse_size("4k", bytes).ok());
    CHECK(bytes == 4096);

    CHECK(ct::parse_size(" 1.5G ", bytes).ok());
    CHECK(bytes == 3 * ct::constants::GIBIBYTE / 2);

    CHECK_FALSE(ct::parse_size("", bytes).ok());
    CHECK_FALSE(ct::parse_size("M", bytes).ok());
    CHECK_FALSE(ct::parse_size("10Q", bytes).ok());
    CHECK_FALSE(ct::parse_size("1.2.3M", bytes).ok());
}

TEST_CASE("parse_duration", "[config]")
{
    std::chrono::milliseconds duration{};

    CHECK(ct::parse_duration("500ms", duration).ok());
    CHECK(duration == 500ms);

    CHECK(ct::parse_duration("30s", duration).ok());
    CHECK(duration == 30s);

    CHECK(ct::parse_duration("90", duration).ok());
    CHECK(duration == 90s);

    CHECK(ct::parse_duration("2m", duration).ok());
    CHECK(duration == 2min);

    CHECK(ct::parse_duration("1h", duration).ok());
    CHECK(duration == 1h);

    CHECK_FALSE(ct::parse_duration("1d", duration).ok());
    CHECK_FALSE(ct::parse_duration("soon", duration).ok());
}

TEST_CASE("parse_bool", "[config]")
{
    bool flag = false;

    CHECK(ct::parse_bool("TRUE", flag).ok());
    CHECK(flag);
    CHECK(ct::parse_bool("no", flag).ok());
    CHECK_FALSE(flag);
    CHECK(ct::parse_bool("1", flag).ok());
    CHECK(flag);
    CHECK_FALSE(ct::parse_bool("maybe", flag).ok());
}

TEST_CASE("parse_config reads a context string", "[config]")
{
    ct::transfer_config config;

    const std::string context = "UPLOAD_CUTOFF=100M;CHUNK_SIZE=16Mi;UPLOAD_CONCURRENCY=4;COPY_CUTOFF=1G;"
                                "COPY_TIMEOUT=5m;DISABLE_CHECKSUM=true;LEAVE_PARTS_ON_ERROR=yes;"
                                "STORAGE_TIER=infrequentaccess;RETRY_COUNT=7;RETRY_WAIT=2s;MAX_RETRY_WAIT=1m;"
                                "S3_DEFAULT_HOSTNAME=example.org";

    REQUIRE(ct::parse_config(context, config).ok());

    CHECK(config.upload_cutoff == 100 * ct::constants::MEBIBYTE);
    CHECK(config.chunk_size == 16 * ct::constants::MEBIBYTE);
    CHECK(config.upload_concurrency == 4);
    CHECK(config.copy_cutoff == ct::constants::GIBIBYTE);
    CHECK(config.copy_timeout == 5min);
    CHECK(config.disable_checksum);
    CHECK(config.leave_parts_on_error);
    CHECK(config.tier == ct::storage_tier::INFREQUENT_ACCESS);
    CHECK(config.retry_count_limit == 7);
    CHECK(config.retry_wait == 2s);
    CHECK(config.max_retry_wait == 1min);
}

TEST_CASE("parse_config leaves the configuration alone on error", "[config]")
{
    ct::transfer_config config;
    config.upload_concurrency = 3;

    SECTION("malformed value")
    {
        CHECK_FALSE(ct::parse_config("UPLOAD_CONCURRENCY=many", config).ok());
    }

    SECTION("value outside the limits")
    {
        CHECK_FALSE(ct::parse_config("UPLOAD_CONCURRENCY=8;CHUNK_SIZE=1M", config).ok());
    }

    SECTION("unknown tier")
    {
        CHECK_FALSE(ct::parse_config("STORAGE_TIER=Glacier", config).ok());
    }

    SECTION("negative retry count")
    {
        const auto ret = ct::parse_config("RETRY_COUNT=-1", config);
        CHECK(ret.code() == SYS_INVALID_INPUT_PARAM);
        CHECK(config.retry_count_limit == ct::constants::DEFAULT_RETRY_COUNT_LIMIT);
    }

    SECTION("retry count out of range")
    {
        CHECK_FALSE(ct::parse_config("RETRY_COUNT=99999999999", config).ok());
        CHECK(config.retry_count_limit == ct::constants::DEFAULT_RETRY_COUNT_LIMIT);
    }

    SECTION("concurrency above the maximum")
    {
        CHECK_FALSE(ct::parse_config("UPLOAD_CONCURRENCY=100000", config).ok());
    }

    CHECK(config.upload_concurrency == 3);
}

TEST_CASE("storage tier names", "[config]")
{
    ct::storage_tier tier = ct::storage_tier::STANDARD;

    CHECK(ct::parse_storage_tier("Archive", tier).ok());
    CHECK(tier == ct::storage_tier::ARCHIVE);
    CHECK(ct::to_string(tier) == "Archive");

    CHECK(ct::parse_storage_tier("standard", tier).ok());
    CHECK(tier == ct::storage_tier::STANDARD);

    CHECK(ct::parse_storage_tier("Cold", tier).code() == SYS_INVALID_INPUT_PARAM);
}

TEST_CASE("a retry count of zero disables retries", "[config]")
{
    ct::transfer_config config;
    REQUIRE(ct::parse_config("RETRY_COUNT=0", config).ok());
    CHECK(config.retry_count_limit == 0);
}
