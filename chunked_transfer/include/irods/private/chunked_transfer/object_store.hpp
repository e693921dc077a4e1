#ifndef IRODS_CHUNKED_TRANSFER_OBJECT_STORE_HPP
#define IRODS_CHUNKED_TRANSFER_OBJECT_STORE_HPP

#include "irods/private/chunked_transfer/cancellation.hpp"
#include "irods/private/chunked_transfer/types.hpp"

#include <irods/irods_error.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace irods::experimental::io::chunked_transfer
{

    struct completed_part
    {
        int         part_number;
        std::string etag;
    };

    struct object_info
    {
        std::int64_t size{0};
        std::string  etag;
    };

    struct put_properties
    {
        storage_tier                       tier{storage_tier::STANDARD};
        std::string                        content_md5;    // base64, empty when checksums are disabled
        std::map<std::string, std::string> metadata;
    };

    // Returned by copy_object.  A copy the service finished within the request
    // has completed set and needs no polling.
    struct copy_handle
    {
        std::string token;
        bool        completed{false};
    };

    // The remote calls the engine needs from an object storage service.
    // Every call blocks until the service answers, the request times out or
    // _token is cancelled.  Implementations must be callable from several
    // threads at once.
    class object_store
    {
    public:

        virtual ~object_store() = default;

        virtual irods::error create_multipart_upload(const std::string&        _key,
                                                     const put_properties&     _properties,
                                                     std::string&              _upload_id,
                                                     const cancellation_token& _token) = 0;

        virtual irods::error upload_part(const std::string&        _key,
                                         const std::string&        _upload_id,
                                         int                       _part_number,
                                         const char*               _buffer,
                                         std::int64_t              _length,
                                         std::string&              _etag,
                                         const cancellation_token& _token) = 0;

        // uploads the byte range [_offset, _offset + _length) of _source_key as a part
        virtual irods::error upload_part_copy(const std::string&        _source_key,
                                              const std::string&        _key,
                                              const std::string&        _upload_id,
                                              int                       _part_number,
                                              std::int64_t              _offset,
                                              std::int64_t              _length,
                                              std::string&              _etag,
                                              const cancellation_token& _token) = 0;

        // _parts is sorted by ascending part number
        virtual irods::error complete_multipart_upload(const std::string&                 _key,
                                                       const std::string&                 _upload_id,
                                                       const std::vector<completed_part>& _parts,
                                                       const cancellation_token&          _token) = 0;

        virtual irods::error abort_multipart_upload(const std::string&        _key,
                                                    const std::string&        _upload_id,
                                                    const cancellation_token& _token) = 0;

        virtual irods::error put_object(const std::string&        _key,
                                        const char*               _buffer,
                                        std::int64_t              _length,
                                        const put_properties&     _properties,
                                        const cancellation_token& _token) = 0;

        virtual irods::error copy_object(const std::string&        _source_key,
                                         const std::string&        _destination_key,
                                         const put_properties&     _properties,
                                         copy_handle&              _handle,
                                         const cancellation_token& _token) = 0;

        virtual irods::error get_copy_status(const copy_handle&        _handle,
                                             copy_status&              _status,
                                             const cancellation_token& _token) = 0;

        virtual irods::error head_object(const std::string&        _key,
                                         object_info&              _info,
                                         const cancellation_token& _token) = 0;

        // true when the call that produced _error may succeed if repeated
        virtual bool is_retryable(const irods::error& _error) const = 0;

    }; // end class object_store

} // irods::experimental::io::chunked_transfer

#endif // IRODS_CHUNKED_TRANSFER_OBJECT_STORE_HPP
