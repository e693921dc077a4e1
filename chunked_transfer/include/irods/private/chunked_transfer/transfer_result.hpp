#ifndef IRODS_CHUNKED_TRANSFER_TRANSFER_RESULT_HPP
#define IRODS_CHUNKED_TRANSFER_TRANSFER_RESULT_HPP

#include "irods/private/chunked_transfer/object_store.hpp"
#include "irods/private/chunked_transfer/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace irods::experimental::io::chunked_transfer
{

    // Outcome of an upload or of the multipart phase of a copy.  On failure
    // it carries what recovery tooling needs: the parts that made it, the
    // failing part and the upload id of a session left open.
    struct transfer_result
    {
        error_codes                 code{error_codes::SUCCESS};
        transfer_mode               mode{transfer_mode::SIMPLE};
        session_state               state{session_state::OPEN};     // chunked transfers only
        std::string                 key;
        std::string                 upload_id;                      // set when the session was left open
        std::int64_t                bytes_transferred{0};
        std::int64_t                part_count{0};
        std::vector<completed_part> completed_parts;
        int                         failed_part_number{0};
        std::string                 checksum;                       // base64 MD5, empty when disabled
        std::string                 message;

        bool                        abort_attempted{false};
        bool                        abort_failed{false};
        std::string                 abort_message;

        auto ok() const noexcept -> bool { return error_codes::SUCCESS == code; }
    };

    struct copy_result
    {
        error_codes     code{error_codes::SUCCESS};
        copy_state      state{copy_state::REQUESTED};
        std::string     source_key;
        std::string     destination_key;
        std::string     operation_token;
        std::int64_t    size{0};
        bool            multipart{false};
        int             status_polls{0};
        transfer_result multipart_result;     // meaningful when multipart is set
        std::string     message;

        auto ok() const noexcept -> bool { return error_codes::SUCCESS == code; }
    };

    void to_json(nlohmann::json& _json, const completed_part& _part);
    void to_json(nlohmann::json& _json, const transfer_result& _result);
    void to_json(nlohmann::json& _json, const copy_result& _result);

} // irods::experimental::io::chunked_transfer

#endif // IRODS_CHUNKED_TRANSFER_TRANSFER_RESULT_HPP
