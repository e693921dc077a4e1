#include "irods/private/chunked_transfer/transfer_result.hpp"

namespace irods::experimental::io::chunked_transfer
{

    void to_json(nlohmann::json& _json, const completed_part& _part)
    {
        _json = nlohmann::json{{"part_number", _part.part_number}, {"etag", _part.etag}};
    }

    void to_json(nlohmann::json& _json, const transfer_result& _result)
    {
        _json = nlohmann::json{
            {"code", std::string{to_string(_result.code)}},
            {"mode", transfer_mode::SIMPLE == _result.mode ? "simple" : "chunked"},
            {"key", _result.key},
            {"bytes_transferred", _result.bytes_transferred},
            {"message", _result.message}
        };

        if (!_result.checksum.empty()) {
            _json["checksum"] = _result.checksum;
        }

        if (transfer_mode::SIMPLE == _result.mode) {
            return;
        }

        _json["state"] = std::string{to_string(_result.state)};
        _json["part_count"] = _result.part_count;
        _json["completed_parts"] = _result.completed_parts;

        if (!_result.upload_id.empty()) {
            _json["upload_id"] = _result.upload_id;
        }

        if (_result.failed_part_number > 0) {
            _json["failed_part_number"] = _result.failed_part_number;
        }

        if (_result.abort_attempted) {
            _json["abort"] = nlohmann::json{{"failed", _result.abort_failed}, {"message", _result.abort_message}};
        }
    } // end to_json

    void to_json(nlohmann::json& _json, const copy_result& _result)
    {
        _json = nlohmann::json{
            {"code", std::string{to_string(_result.code)}},
            {"state", std::string{to_string(_result.state)}},
            {"source_key", _result.source_key},
            {"destination_key", _result.destination_key},
            {"size", _result.size},
            {"status_polls", _result.status_polls},
            {"message", _result.message}
        };

        if (!_result.operation_token.empty()) {
            _json["operation_token"] = _result.operation_token;
        }

        if (_result.multipart) {
            _json["multipart"] = _result.multipart_result;
        }
    } // end to_json

} // irods::experimental::io::chunked_transfer
