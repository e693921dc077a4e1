#include "irods/private/chunked_transfer/chunk_planner.hpp"
#include "irods/private/chunked_transfer/logging_category.hpp"

#include <irods/rodsErrorTable.h>

#include <fmt/format.h>

#include <algorithm>

namespace irods::experimental::io::chunked_transfer
{

    namespace
    {
        auto divide_rounding_up(std::int64_t _numerator, std::int64_t _denominator) noexcept -> std::int64_t
        {
            return (_numerator + _denominator - 1) / _denominator;
        }
    } // namespace

    auto chunk_plan::part_size(std::int64_t _part_number) const noexcept -> std::int64_t
    {
        if (!size_is_known()) {
            return chunk_size;
        }

        const std::int64_t remaining = object_size - part_offset(_part_number);
        return std::clamp<std::int64_t>(remaining, 0, chunk_size);
    } // end chunk_plan::part_size

    auto calculate_chunk_size(std::int64_t _object_size,
                              std::int64_t _configured_chunk_size,
                              std::int64_t _maximum_chunk_count) noexcept -> std::int64_t
    {
        if (_object_size < 0 || _maximum_chunk_count <= 0) {
            return _configured_chunk_size;
        }

        if (divide_rounding_up(_object_size, _configured_chunk_size) <= _maximum_chunk_count) {
            return _configured_chunk_size;
        }

        const std::int64_t minimum = divide_rounding_up(_object_size, _maximum_chunk_count);
        const std::int64_t granularity = constants::CHUNK_SIZE_GRANULARITY;
        return std::max(_configured_chunk_size, divide_rounding_up(minimum, granularity) * granularity);
    } // end calculate_chunk_size

    irods::error plan_chunks(std::int64_t _object_size,
                             std::int64_t _configured_chunk_size,
                             std::int64_t _maximum_chunk_count,
                             chunk_plan&  _plan)
    {
        if (_configured_chunk_size < constants::MINIMUM_CHUNK_SIZE) {
            return ERROR(SYS_INVALID_INPUT_PARAM,
                    fmt::format("chunk size {} is less than the minimum of {}",
                        _configured_chunk_size, constants::MINIMUM_CHUNK_SIZE));
        }

        if (_maximum_chunk_count < 1 || _maximum_chunk_count > constants::MAXIMUM_NUMBER_OF_PARTS) {
            return ERROR(SYS_INVALID_INPUT_PARAM,
                    fmt::format("maximum part count {} is outside of [1, {}]",
                        _maximum_chunk_count, constants::MAXIMUM_NUMBER_OF_PARTS));
        }

        chunk_plan plan;
        plan.object_size = _object_size < 0 ? constants::UNKNOWN_OBJECT_SIZE : _object_size;
        plan.maximum_chunk_count = _maximum_chunk_count;
        plan.chunk_size = calculate_chunk_size(plan.object_size, _configured_chunk_size, plan.maximum_chunk_count);

        if (plan.size_is_known()) {
            // an empty object still needs one (empty) part
            plan.expected_chunk_count = std::max<std::int64_t>(1, divide_rounding_up(plan.object_size, plan.chunk_size));
        }

        if (plan.chunk_size != _configured_chunk_size) {
            logger::debug("{}:{} ({}) chunk size grown from {} to {} to fit {} bytes in {} parts",
                    __FILE__, __LINE__, __func__, _configured_chunk_size, plan.chunk_size,
                    plan.object_size, plan.maximum_chunk_count);
        }

        _plan = plan;
        return SUCCESS();
    } // end plan_chunks

    irods::error plan_upload(std::int64_t _object_size, const transfer_config& _config, chunk_plan& _plan)
    {
        if (_config.upload_cutoff > constants::MAXIMUM_UPLOAD_CUTOFF) {
            return ERROR(SYS_INVALID_INPUT_PARAM,
                    fmt::format("upload cutoff {} is greater than the maximum of {}",
                        _config.upload_cutoff, constants::MAXIMUM_UPLOAD_CUTOFF));
        }

        irods::error ret = plan_chunks(_object_size, _config.chunk_size, _config.maximum_part_count, _plan);
        if (!ret.ok()) {
            return PASS(ret);
        }

        return SUCCESS();
    } // end plan_upload

} // irods::experimental::io::chunked_transfer
