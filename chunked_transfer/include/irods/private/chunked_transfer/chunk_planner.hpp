#ifndef IRODS_CHUNKED_TRANSFER_CHUNK_PLANNER_HPP
#define IRODS_CHUNKED_TRANSFER_CHUNK_PLANNER_HPP

#include "irods/private/chunked_transfer/config.hpp"

#include <irods/irods_error.hpp>

#include <cstdint>

namespace irods::experimental::io::chunked_transfer
{

    struct chunk_plan
    {
        std::int64_t object_size{constants::UNKNOWN_OBJECT_SIZE};
        std::int64_t chunk_size{constants::MINIMUM_CHUNK_SIZE};

        // UNKNOWN_OBJECT_SIZE when the object size is unknown
        std::int64_t expected_chunk_count{constants::UNKNOWN_OBJECT_SIZE};
        std::int64_t maximum_chunk_count{constants::MAXIMUM_NUMBER_OF_PARTS};

        auto size_is_known() const noexcept -> bool { return object_size >= 0; }

        // Size of the 1-based part _part_number.  Every part is chunk_size
        // except the last one of a known size object.
        auto part_size(std::int64_t _part_number) const noexcept -> std::int64_t;

        auto part_offset(std::int64_t _part_number) const noexcept -> std::int64_t
        {
            return (_part_number - 1) * chunk_size;
        }
    };

    // Smallest chunk size no smaller than _configured_chunk_size that splits
    // _object_size into at most _maximum_chunk_count parts, rounded up to
    // CHUNK_SIZE_GRANULARITY when it has to grow.
    auto calculate_chunk_size(std::int64_t _object_size,
                              std::int64_t _configured_chunk_size,
                              std::int64_t _maximum_chunk_count) noexcept -> std::int64_t;

    irods::error plan_chunks(std::int64_t _object_size,
                             std::int64_t _configured_chunk_size,
                             std::int64_t _maximum_chunk_count,
                             chunk_plan&  _plan);

    // plan_chunks using the configured chunk size after checking the size limits
    irods::error plan_upload(std::int64_t _object_size, const transfer_config& _config, chunk_plan& _plan);

} // irods::experimental::io::chunked_transfer

#endif // IRODS_CHUNKED_TRANSFER_CHUNK_PLANNER_HPP
