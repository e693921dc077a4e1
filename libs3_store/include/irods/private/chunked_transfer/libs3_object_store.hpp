#ifndef IRODS_CHUNKED_TRANSFER_LIBS3_OBJECT_STORE_HPP
#define IRODS_CHUNKED_TRANSFER_LIBS3_OBJECT_STORE_HPP

#include "irods/private/chunked_transfer/object_store.hpp"

#include "libs3/libs3.h"

#include <irods/irods_error.hpp>

#include <fmt/format.h>

#include <chrono>
#include <string>
#include <string_view>

namespace irods::experimental::io::chunked_transfer
{

    struct libs3_store_config
    {
        libs3_store_config()
            : region{"us-east-1"}
            , protocol{S3ProtocolHTTPS}
            , uri_style{S3UriStylePath}
            , sts_date{S3STSAmzOnly}
            , request_timeout{std::chrono::seconds{300}}
        {}

        std::string               hostname;
        std::string               bucket_name;
        std::string               access_key_id;
        std::string               secret_access_key;
        std::string               region;
        S3Protocol                protocol;
        S3UriStyle                uri_style;
        S3STSDate                 sts_date;
        std::chrono::milliseconds request_timeout;
    };

    // Initializes libs3 for the process.  Later calls return the result of
    // the first one.
    irods::error initialize_libs3(const std::string& _hostname);

    // object_store over an S3 compatible endpoint.  Copies are synchronous in
    // S3 so copy_object always returns a completed handle.
    class libs3_object_store : public object_store
    {
    public:

        explicit libs3_object_store(const libs3_store_config& _config);

        libs3_object_store(const libs3_object_store&) = delete;
        auto operator=(const libs3_object_store&) -> libs3_object_store& = delete;

        irods::error create_multipart_upload(const std::string&        _key,
                                             const put_properties&     _properties,
                                             std::string&              _upload_id,
                                             const cancellation_token& _token) override;

        irods::error upload_part(const std::string&        _key,
                                 const std::string&        _upload_id,
                                 int                       _part_number,
                                 const char*               _buffer,
                                 std::int64_t              _length,
                                 std::string&              _etag,
                                 const cancellation_token& _token) override;

        irods::error upload_part_copy(const std::string&        _source_key,
                                      const std::string&        _key,
                                      const std::string&        _upload_id,
                                      int                       _part_number,
                                      std::int64_t              _offset,
                                      std::int64_t              _length,
                                      std::string&              _etag,
                                      const cancellation_token& _token) override;

        irods::error complete_multipart_upload(const std::string&                 _key,
                                               const std::string&                 _upload_id,
                                               const std::vector<completed_part>& _parts,
                                               const cancellation_token&          _token) override;

        irods::error abort_multipart_upload(const std::string&        _key,
                                            const std::string&        _upload_id,
                                            const cancellation_token& _token) override;

        irods::error put_object(const std::string&        _key,
                                const char*               _buffer,
                                std::int64_t              _length,
                                const put_properties&     _properties,
                                const cancellation_token& _token) override;

        irods::error copy_object(const std::string&        _source_key,
                                 const std::string&        _destination_key,
                                 const put_properties&     _properties,
                                 copy_handle&              _handle,
                                 const cancellation_token& _token) override;

        irods::error get_copy_status(const copy_handle&        _handle,
                                     copy_status&              _status,
                                     const cancellation_token& _token) override;

        irods::error head_object(const std::string&        _key,
                                 object_info&              _info,
                                 const cancellation_token& _token) override;

        // The S3Status is carried in the low digits of the error code.
        bool is_retryable(const irods::error& _error) const override;

    private:

        auto timeout_in_milliseconds() const -> int;

        libs3_store_config config_;
        S3BucketContext    bucket_context_;

    }; // end class libs3_object_store

} // irods::experimental::io::chunked_transfer

template <>
struct fmt::formatter<S3Status> : fmt::formatter<std::string_view>
{
    auto format(const S3Status& e, format_context& ctx) const
    {
        return fmt::formatter<std::string_view>::format(S3_get_status_name(e), ctx);
    }
};

#endif // IRODS_CHUNKED_TRANSFER_LIBS3_OBJECT_STORE_HPP
