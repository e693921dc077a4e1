#ifndef IRODS_CHUNKED_TRANSFER_TYPES_HPP
#define IRODS_CHUNKED_TRANSFER_TYPES_HPP

#include <irods/irods_error.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace irods::experimental::io::chunked_transfer
{

    enum class error_codes
    {
        SUCCESS,
        INVALID_SIZE_CONFIGURATION,
        PART_COUNT_EXCEEDED,
        SOURCE_READ_ERROR,
        INITIATE_MULTIPART_UPLOAD_ERROR,
        UPLOAD_PART_ERROR,
        COMPLETE_MULTIPART_UPLOAD_ERROR,
        ABORT_MULTIPART_UPLOAD_ERROR,
        PUT_OBJECT_ERROR,
        CHECKSUM_MISMATCH,
        HEAD_OBJECT_ERROR,
        COPY_OBJECT_ERROR,
        COPY_TIMEOUT,
        CANCELLED
    };

    enum class transfer_mode
    {
        SIMPLE,
        CHUNKED
    };

    enum class storage_tier
    {
        STANDARD,
        INFREQUENT_ACCESS,
        ARCHIVE
    };

    enum class part_state
    {
        PENDING,
        IN_FLIGHT,
        SUCCEEDED,
        FAILED
    };

    enum class session_state
    {
        OPEN,
        COMPLETING,
        COMPLETED,
        ABORTED,
        LEFT_OPEN
    };

    enum class copy_state
    {
        REQUESTED,
        IN_PROGRESS,
        SUCCEEDED,
        FAILED,
        TIMED_OUT
    };

    // status of an asynchronous copy as reported by the remote service
    enum class copy_status
    {
        IN_PROGRESS,
        SUCCEEDED,
        FAILED
    };

    auto to_string(error_codes _code) noexcept -> std::string_view;
    auto to_string(storage_tier _tier) noexcept -> std::string_view;
    auto to_string(session_state _state) noexcept -> std::string_view;
    auto to_string(copy_state _state) noexcept -> std::string_view;

    // accepts Standard, InfrequentAccess and Archive, ignoring case
    irods::error parse_storage_tier(const std::string& _value, storage_tier& _tier);

} // irods::experimental::io::chunked_transfer

#endif // IRODS_CHUNKED_TRANSFER_TYPES_HPP
