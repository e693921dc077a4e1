#ifndef IRODS_CHUNKED_TRANSFER_CONFIG_HPP
#define IRODS_CHUNKED_TRANSFER_CONFIG_HPP

#include "irods/private/chunked_transfer/types.hpp"

#include <irods/irods_error.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace irods::experimental::io::chunked_transfer
{

    struct constants
    {
        static constexpr std::int64_t UNKNOWN_OBJECT_SIZE{-1};
        static constexpr std::int64_t MEBIBYTE{1024 * 1024};
        static constexpr std::int64_t GIBIBYTE{1024 * MEBIBYTE};

        static constexpr std::int64_t MINIMUM_CHUNK_SIZE{5 * MEBIBYTE};
        static constexpr std::int64_t CHUNK_SIZE_GRANULARITY{MEBIBYTE};
        static constexpr std::int64_t MAXIMUM_NUMBER_OF_PARTS{10000};

        static constexpr std::int64_t DEFAULT_UPLOAD_CUTOFF{200 * MEBIBYTE};
        static constexpr std::int64_t MAXIMUM_UPLOAD_CUTOFF{5 * GIBIBYTE};
        static constexpr std::int64_t DEFAULT_COPY_CUTOFF{4768 * MEBIBYTE};
        static constexpr std::int64_t MAXIMUM_COPY_CUTOFF{5 * GIBIBYTE};

        static constexpr int          DEFAULT_UPLOAD_CONCURRENCY{10};
        static constexpr int          MAXIMUM_UPLOAD_CONCURRENCY{100};
        static constexpr unsigned int DEFAULT_RETRY_COUNT_LIMIT{3};
        static constexpr unsigned int DEFAULT_COPY_DECAY_CONSTANT{1};
    };

    // Immutable per transfer.  Read once when a transfer starts and passed by
    // const reference to every component.
    struct transfer_config
    {
        transfer_config()
            : upload_cutoff{constants::DEFAULT_UPLOAD_CUTOFF}
            , chunk_size{constants::MINIMUM_CHUNK_SIZE}
            , upload_concurrency{constants::DEFAULT_UPLOAD_CONCURRENCY}
            , maximum_part_count{constants::MAXIMUM_NUMBER_OF_PARTS}
            , copy_cutoff{constants::DEFAULT_COPY_CUTOFF}
            , copy_timeout{std::chrono::minutes{1}}
            , disable_checksum{false}
            , leave_parts_on_error{false}
            , tier{storage_tier::STANDARD}
            , retry_count_limit{constants::DEFAULT_RETRY_COUNT_LIMIT}
            , retry_wait{std::chrono::seconds{1}}
            , max_retry_wait{std::chrono::seconds{30}}
            , copy_min_sleep{std::chrono::milliseconds{100}}
            , copy_max_sleep{std::chrono::minutes{5}}
            , copy_decay_constant{constants::DEFAULT_COPY_DECAY_CONSTANT}
        {}

        std::int64_t              upload_cutoff;          // objects larger than this are chunked
        std::int64_t              chunk_size;             // configured part size, grown to respect the part ceiling
        int                       upload_concurrency;     // parts of one object in flight at once
        std::int64_t              maximum_part_count;     // part ceiling of the service, at most MAXIMUM_NUMBER_OF_PARTS
        std::int64_t              copy_cutoff;            // server-side copies larger than this are multipart
        std::chrono::milliseconds copy_timeout;
        bool                      disable_checksum;
        bool                      leave_parts_on_error;
        storage_tier              tier;

        unsigned int              retry_count_limit;
        std::chrono::milliseconds retry_wait;
        std::chrono::milliseconds max_retry_wait;

        // copy status polling
        std::chrono::milliseconds copy_min_sleep;
        std::chrono::milliseconds copy_max_sleep;
        unsigned int              copy_decay_constant;    // bigger for slower growth toward copy_max_sleep
    };

    irods::error validate_config(const transfer_config& _config);

    // Builds a configuration from a resource context string such as
    // "UPLOAD_CUTOFF=100M;CHUNK_SIZE=16Mi;LEAVE_PARTS_ON_ERROR=true".
    // Keys that are absent keep their defaults.
    irods::error parse_config(const std::string& _context_string, transfer_config& _config);

    // "5M", "5Mi", "5MiB", "1G", "1024" (bytes).  Suffixes are binary.
    irods::error parse_size(const std::string& _value, std::int64_t& _bytes);

    // "500ms", "30s", "1m", "2h".  A bare number is seconds.
    irods::error parse_duration(const std::string& _value, std::chrono::milliseconds& _duration);

    irods::error parse_bool(const std::string& _value, bool& _flag);

} // irods::experimental::io::chunked_transfer

#endif // IRODS_CHUNKED_TRANSFER_CONFIG_HPP
