#include "irods/private/chunked_transfer/types.hpp"

#include <irods/rodsErrorTable.h>

#include <boost/algorithm/string/predicate.hpp>

#include <fmt/format.h>

namespace irods::experimental::io::chunked_transfer
{

    auto to_string(error_codes _code) noexcept -> std::string_view
    {
        switch (_code) {
            case error_codes::SUCCESS:                          return "SUCCESS";
            case error_codes::INVALID_SIZE_CONFIGURATION:       return "INVALID_SIZE_CONFIGURATION";
            case error_codes::PART_COUNT_EXCEEDED:              return "PART_COUNT_EXCEEDED";
            case error_codes::SOURCE_READ_ERROR:                return "SOURCE_READ_ERROR";
            case error_codes::INITIATE_MULTIPART_UPLOAD_ERROR:  return "INITIATE_MULTIPART_UPLOAD_ERROR";
            case error_codes::UPLOAD_PART_ERROR:                return "UPLOAD_PART_ERROR";
            case error_codes::COMPLETE_MULTIPART_UPLOAD_ERROR:  return "COMPLETE_MULTIPART_UPLOAD_ERROR";
            case error_codes::ABORT_MULTIPART_UPLOAD_ERROR:     return "ABORT_MULTIPART_UPLOAD_ERROR";
            case error_codes::PUT_OBJECT_ERROR:                 return "PUT_OBJECT_ERROR";
            case error_codes::CHECKSUM_MISMATCH:                return "CHECKSUM_MISMATCH";
            case error_codes::HEAD_OBJECT_ERROR:                return "HEAD_OBJECT_ERROR";
            case error_codes::COPY_OBJECT_ERROR:                return "COPY_OBJECT_ERROR";
            case error_codes::COPY_TIMEOUT:                     return "COPY_TIMEOUT";
            case error_codes::CANCELLED:                        return "CANCELLED";
        }
        return "UNKNOWN";
    } // end to_string

    auto to_string(storage_tier _tier) noexcept -> std::string_view
    {
        switch (_tier) {
            case storage_tier::STANDARD:          return "Standard";
            case storage_tier::INFREQUENT_ACCESS: return "InfrequentAccess";
            case storage_tier::ARCHIVE:           return "Archive";
        }
        return "Unknown";
    } // end to_string

    auto to_string(session_state _state) noexcept -> std::string_view
    {
        switch (_state) {
            case session_state::OPEN:       return "OPEN";
            case session_state::COMPLETING: return "COMPLETING";
            case session_state::COMPLETED:  return "COMPLETED";
            case session_state::ABORTED:    return "ABORTED";
            case session_state::LEFT_OPEN:  return "LEFT_OPEN";
        }
        return "UNKNOWN";
    } // end to_string

    auto to_string(copy_state _state) noexcept -> std::string_view
    {
        switch (_state) {
            case copy_state::REQUESTED:   return "REQUESTED";
            case copy_state::IN_PROGRESS: return "IN_PROGRESS";
            case copy_state::SUCCEEDED:   return "SUCCEEDED";
            case copy_state::FAILED:      return "FAILED";
            case copy_state::TIMED_OUT:   return "TIMED_OUT";
        }
        return "UNKNOWN";
    } // end to_string

    irods::error parse_storage_tier(const std::string& _value, storage_tier& _tier)
    {
        for (auto tier : {storage_tier::STANDARD, storage_tier::INFREQUENT_ACCESS, storage_tier::ARCHIVE}) {
            if (boost::iequals(_value, to_string(tier))) {
                _tier = tier;
                return SUCCESS();
            }
        }

        return ERROR(SYS_INVALID_INPUT_PARAM,
                fmt::format("invalid storage tier [{}], expected Standard, InfrequentAccess or Archive", _value));
    } // end parse_storage_tier

} // irods::experimental::io::chunked_transfer
