#include "irods/private/chunked_transfer/libs3_object_store.hpp"
#include "irods/private/chunked_transfer/logging_category.hpp"
#include "irods/private/chunked_transfer/util.hpp"

#include <irods/rcMisc.h>
#include <irods/rodsErrorTable.h>

#include <fmt/format.h>

#include <algorithm>
#include <cstring>
#include <mutex>
#include <vector>

namespace irods::experimental::io::chunked_transfer
{

    namespace
    {
        // Carries one request's input and output through the libs3 callbacks.
        struct request_data
        {
            request_data(const S3BucketContext& _bucket_context, const cancellation_token& _token)
                : bucket_context{_bucket_context}
                , token{_token}
                , status{S3StatusOK}
                , buffer{nullptr}
                , remaining{0}
                , offset{0}
                , content_length{0}
                , thread_identifier{get_thread_identifier()}
            {}

            const S3BucketContext&    bucket_context;   // to enable more detailed error messages
            const cancellation_token& token;
            S3Status                  status;

            const char*               buffer;
            std::int64_t              remaining;
            std::int64_t              offset;

            std::string               etag;
            std::string               upload_id;
            std::int64_t              content_length;
            std::uint64_t             thread_identifier;
        };

        void store_and_log_status(S3Status               _status,
                                  const S3ErrorDetails*  _error,
                                  const std::string&     _function,
                                  const S3BucketContext& _bucket_context,
                                  S3Status&              _saved_status,
                                  std::uint64_t          _thread_id)
        {
            _saved_status = _status;

            if (S3StatusOK == _status) {
                logger::debug("{}:{} ({}) [[{}]] [function={}][status={}]", __FILE__, __LINE__, __func__,
                        _thread_id, _function, _status);
                return;
            }

            // a missing object is an answer, not a failure
            const bool not_found = S3StatusHttpErrorNotFound == _status || S3StatusErrorNoSuchKey == _status;
            const auto message = fmt::format("[[{}]] [function={}][status={}][host={}][bucket={}]", _thread_id, _function,
                    _status, _bucket_context.hostName ? _bucket_context.hostName : "",
                    _bucket_context.bucketName ? _bucket_context.bucketName : "");

            std::string details;
            if (_error) {
                if (_error->message) {
                    details += fmt::format(" [message={}]", _error->message);
                }
                if (_error->resource) {
                    details += fmt::format(" [resource={}]", _error->resource);
                }
                if (_error->furtherDetails) {
                    details += fmt::format(" [further_details={}]", _error->furtherDetails);
                }
                for (int i = 0; i < _error->extraDetailsCount; ++i) {
                    details += fmt::format(" [{}={}]", _error->extraDetails[i].name, _error->extraDetails[i].value);
                }
            }

            if (not_found) {
                logger::debug("{}:{} ({}) {}{}", __FILE__, __LINE__, __func__, message, details);
            }
            else {
                logger::error("{}:{} ({}) {}{}", __FILE__, __LINE__, __func__, message, details);
            }
        } // end store_and_log_status

        // Status of a request that failed before reaching the service, or the
        // status the completion callback stored.
        auto request_error(long long _category, S3Status _status, const std::string& _what) -> irods::error
        {
            return ERROR(_category - static_cast<int>(_status), fmt::format("{} - \"{}\"", _what, S3_get_status_name(_status)));
        } // end request_error

        namespace callbacks
        {
            S3Status on_response_properties(const S3ResponseProperties* _properties, void* _callback_data)
            {
                auto* data = static_cast<request_data*>(_callback_data);

                if (data->token.is_cancellation_requested()) {
                    return S3StatusAbortedByCallback;
                }

                if (_properties->eTag) {
                    data->etag = _properties->eTag;
                }
                data->content_length = static_cast<std::int64_t>(_properties->contentLength);

                return S3StatusOK;
            } // end on_response_properties

            void on_response_completion(S3Status _status, const S3ErrorDetails* _error, void* _callback_data)
            {
                auto* data = static_cast<request_data*>(_callback_data);
                store_and_log_status(_status, _error, "on_response_completion", data->bucket_context, data->status,
                        data->thread_identifier);
            } // end on_response_completion

            // Hands the caller's buffer to libs3 for a put, a part upload or
            // the completion XML.  Returning a negative count aborts the request.
            int on_put_data(int _buffer_size, char* _buffer, void* _callback_data)
            {
                auto* data = static_cast<request_data*>(_callback_data);

                if (data->token.is_cancellation_requested()) {
                    return -1;
                }

                const std::int64_t length = std::min<std::int64_t>(_buffer_size, data->remaining);
                if (length > 0) {
                    std::memcpy(_buffer, data->buffer + data->offset, length);
                }

                data->remaining -= length;
                data->offset += length;

                return static_cast<int>(length);
            } // end on_put_data

            S3Status on_upload_id(const char* _upload_id, void* _callback_data)
            {
                auto* data = static_cast<request_data*>(_callback_data);
                data->upload_id = _upload_id;
                return S3StatusOK;
            } // end on_upload_id

            // S3_abort_multipart_upload() does not allow a callback_data parameter, so the
            // final status is passed through these globals.  abort_mutex serializes aborts.
            std::mutex             abort_mutex;
            S3Status               abort_status = S3StatusOK;
            const S3BucketContext* abort_bucket_context = nullptr;

            S3Status on_abort_response_properties(const S3ResponseProperties*, void*)
            {
                return S3StatusOK;
            } // end on_abort_response_properties

            void on_abort_response_completion(S3Status _status, const S3ErrorDetails* _error, void*)
            {
                store_and_log_status(_status, _error, "on_abort_response_completion", *abort_bucket_context, abort_status,
                        get_thread_identifier());
            } // end on_abort_response_completion

        } // namespace callbacks

        std::once_flag libs3_initialized;
        S3Status       libs3_initialization_status = S3StatusOK;

        const std::string storage_tier_warning{"libs3 cannot request a storage tier, the bucket default applies"};

        void warn_unsupported_tier(const std::string& _key, storage_tier _tier)
        {
            if (storage_tier::STANDARD != _tier) {
                logger::warn("{}:{} ({}) [key={}][tier={}] {}", __FILE__, __LINE__, __func__, _key, _tier, storage_tier_warning);
            }
        } // end warn_unsupported_tier

    } // namespace

    irods::error initialize_libs3(const std::string& _hostname)
    {
        std::call_once(libs3_initialized, [&_hostname]() {
            libs3_initialization_status = S3_initialize("s3", S3_INIT_ALL, _hostname.c_str());
            logger::debug("{}:{} ({}) S3_initialize [host={}][status={}]", __FILE__, __LINE__, __func__,
                    _hostname, libs3_initialization_status);
        });

        if (S3StatusOK != libs3_initialization_status) {
            return request_error(S3_INIT_ERROR, libs3_initialization_status, "S3_initialize returned error");
        }

        return SUCCESS();
    } // end initialize_libs3

    libs3_object_store::libs3_object_store(const libs3_store_config& _config)
        : config_{_config}
        , bucket_context_{}
    {
        bucket_context_.hostName = config_.hostname.c_str();
        bucket_context_.bucketName = config_.bucket_name.c_str();
        bucket_context_.protocol = config_.protocol;
        bucket_context_.uriStyle = config_.uri_style;
        bucket_context_.accessKeyId = config_.access_key_id.c_str();
        bucket_context_.secretAccessKey = config_.secret_access_key.c_str();
        bucket_context_.securityToken = nullptr;
        bucket_context_.authRegion = config_.region.c_str();
        bucket_context_.stsDate = config_.sts_date;

        logger::debug("{}:{} ({}) [host={}][bucket={}][protocol={}][uri_style={}][region={}]", __FILE__, __LINE__, __func__,
                config_.hostname, config_.bucket_name, static_cast<int>(config_.protocol),
                static_cast<int>(config_.uri_style), config_.region);
    }

    auto libs3_object_store::timeout_in_milliseconds() const -> int
    {
        return static_cast<int>(config_.request_timeout.count());
    }

    irods::error libs3_object_store::create_multipart_upload(const std::string&        _key,
                                                             const put_properties&     _properties,
                                                             std::string&              _upload_id,
                                                             const cancellation_token& _token)
    {
        warn_unsupported_tier(_key, _properties.tier);

        request_data data{bucket_context_, _token};

        S3PutProperties put_props{};
        put_props.expires = -1;

        S3MultipartInitialHandler handler = { {callbacks::on_response_properties, callbacks::on_response_completion},
                                              callbacks::on_upload_id };

        S3_initiate_multipart(&bucket_context_, _key.c_str(), &put_props, &handler, nullptr, timeout_in_milliseconds(), &data);

        if (S3StatusOK != data.status) {
            return request_error(S3_PUT_ERROR, data.status, fmt::format("S3_initiate_multipart failed for [{}]", _key));
        }

        _upload_id = data.upload_id;

        logger::debug("{}:{} ({}) [[{}]] [key={}][upload_id={}]", __FILE__, __LINE__, __func__,
                data.thread_identifier, _key, _upload_id);

        return SUCCESS();
    } // end create_multipart_upload

    irods::error libs3_object_store::upload_part(const std::string&        _key,
                                                 const std::string&        _upload_id,
                                                 int                       _part_number,
                                                 const char*               _buffer,
                                                 std::int64_t              _length,
                                                 std::string&              _etag,
                                                 const cancellation_token& _token)
    {
        request_data data{bucket_context_, _token};
        data.buffer = _buffer;
        data.remaining = _length;

        S3PutProperties put_props{};
        put_props.expires = -1;

        S3PutObjectHandler handler = { {callbacks::on_response_properties, callbacks::on_response_completion},
                                       callbacks::on_put_data };

        S3_upload_part(&bucket_context_, _key.c_str(), &put_props, &handler, _part_number, _upload_id.c_str(),
                static_cast<int>(_length), nullptr, timeout_in_milliseconds(), &data);

        if (S3StatusOK != data.status) {
            return request_error(S3_PUT_ERROR, data.status,
                    fmt::format("S3_upload_part failed for part {} of [{}]", _part_number, _key));
        }

        _etag = data.etag;
        return SUCCESS();
    } // end upload_part

    irods::error libs3_object_store::upload_part_copy(const std::string&        _source_key,
                                                      const std::string&        _key,
                                                      const std::string&        _upload_id,
                                                      int                       _part_number,
                                                      std::int64_t              _offset,
                                                      std::int64_t              _length,
                                                      std::string&              _etag,
                                                      const cancellation_token& _token)
    {
        request_data data{bucket_context_, _token};

        S3PutProperties put_props{};
        put_props.expires = -1;

        S3ResponseHandler handler = {callbacks::on_response_properties, callbacks::on_response_completion};

        std::int64_t last_modified = 0;
        std::vector<char> etag(512, '\0');

        S3_copy_object_range(&bucket_context_, _source_key.c_str(), bucket_context_.bucketName, _key.c_str(),
                _part_number, _upload_id.c_str(), _offset, _length, &put_props, &last_modified,
                static_cast<int>(etag.size()), etag.data(), nullptr, timeout_in_milliseconds(), &handler, &data);

        if (S3StatusOK != data.status) {
            return request_error(S3_FILE_COPY_ERR, data.status,
                    fmt::format("S3_copy_object_range failed for part {} of [{}] from [{}]", _part_number, _key, _source_key));
        }

        _etag = etag.data();
        return SUCCESS();
    } // end upload_part_copy

    irods::error libs3_object_store::complete_multipart_upload(const std::string&                 _key,
                                                               const std::string&                 _upload_id,
                                                               const std::vector<completed_part>& _parts,
                                                               const cancellation_token&          _token)
    {
        std::string xml{"<CompleteMultipartUpload>\n"};
        for (const auto& part : _parts) {
            xml += fmt::format("<Part><PartNumber>{}</PartNumber><ETag>{}</ETag></Part>\n", part.part_number, part.etag);
        }
        xml += "</CompleteMultipartUpload>\n";

        logger::debug("{}:{} ({}) [key={}] Request: {}", __FILE__, __LINE__, __func__, _key, xml);

        request_data data{bucket_context_, _token};
        data.buffer = xml.c_str();
        data.remaining = static_cast<std::int64_t>(xml.size());

        S3MultipartCommitHandler handler = { {callbacks::on_response_properties, callbacks::on_response_completion},
                                             callbacks::on_put_data, nullptr };

        S3_complete_multipart_upload(&bucket_context_, _key.c_str(), &handler, _upload_id.c_str(),
                static_cast<int>(xml.size()), nullptr, timeout_in_milliseconds(), &data);

        if (S3StatusOK != data.status) {
            return request_error(S3_PUT_ERROR, data.status,
                    fmt::format("S3_complete_multipart_upload failed for [{}][upload_id={}]", _key, _upload_id));
        }

        return SUCCESS();
    } // end complete_multipart_upload

    irods::error libs3_object_store::abort_multipart_upload(const std::string&        _key,
                                                            const std::string&        _upload_id,
                                                            const cancellation_token& _token)
    {
        if (_token.is_cancellation_requested()) {
            return request_error(S3_PUT_ERROR, S3StatusAbortedByCallback,
                    fmt::format("abort of [{}][upload_id={}] cancelled", _key, _upload_id));
        }

        S3AbortMultipartUploadHandler handler = { {callbacks::on_abort_response_properties,
                                                   callbacks::on_abort_response_completion} };

        S3Status status = S3StatusOK;
        {
            std::lock_guard<std::mutex> lk(callbacks::abort_mutex);
            callbacks::abort_status = S3StatusOK;
            callbacks::abort_bucket_context = &bucket_context_;
            S3_abort_multipart_upload(&bucket_context_, _key.c_str(), _upload_id.c_str(), timeout_in_milliseconds(), &handler);
            status = callbacks::abort_status;
        }

        if (S3StatusOK != status) {
            return request_error(S3_PUT_ERROR, status,
                    fmt::format("Error cancelling the multipart upload of [{}][upload_id={}]", _key, _upload_id));
        }

        return SUCCESS();
    } // end abort_multipart_upload

    irods::error libs3_object_store::put_object(const std::string&        _key,
                                                const char*               _buffer,
                                                std::int64_t              _length,
                                                const put_properties&     _properties,
                                                const cancellation_token& _token)
    {
        warn_unsupported_tier(_key, _properties.tier);

        request_data data{bucket_context_, _token};
        data.buffer = _buffer;
        data.remaining = _length;

        std::vector<S3NameValue> metadata;
        metadata.reserve(_properties.metadata.size());
        for (const auto& [name, value] : _properties.metadata) {
            metadata.push_back(S3NameValue{name.c_str(), value.c_str()});
        }

        S3PutProperties put_props{};
        put_props.expires = -1;
        put_props.md5 = _properties.content_md5.empty() ? nullptr : _properties.content_md5.c_str();
        put_props.metaDataCount = static_cast<int>(metadata.size());
        put_props.metaData = metadata.empty() ? nullptr : metadata.data();

        S3PutObjectHandler handler = { {callbacks::on_response_properties, callbacks::on_response_completion},
                                       callbacks::on_put_data };

        S3_put_object(&bucket_context_, _key.c_str(), _length, &put_props, nullptr, timeout_in_milliseconds(), &handler, &data);

        if (S3StatusErrorBadDigest == data.status) {
            return ERROR(USER_CHKSUM_MISMATCH, fmt::format("the service rejected the Content-MD5 of [{}] - \"{}\"",
                    _key, S3_get_status_name(data.status)));
        }

        if (S3StatusOK != data.status) {
            return request_error(S3_PUT_ERROR, data.status, fmt::format("Error putting the S3 object: \"{}\"", _key));
        }

        return SUCCESS();
    } // end put_object

    irods::error libs3_object_store::copy_object(const std::string&        _source_key,
                                                 const std::string&        _destination_key,
                                                 const put_properties&     _properties,
                                                 copy_handle&              _handle,
                                                 const cancellation_token& _token)
    {
        warn_unsupported_tier(_destination_key, _properties.tier);

        request_data data{bucket_context_, _token};

        S3PutProperties put_props{};
        put_props.expires = -1;

        S3ResponseHandler handler = {callbacks::on_response_properties, callbacks::on_response_completion};

        std::int64_t last_modified = 0;
        std::vector<char> etag(512, '\0');

        S3_copy_object(&bucket_context_, _source_key.c_str(), bucket_context_.bucketName, _destination_key.c_str(),
                &put_props, &last_modified, static_cast<int>(etag.size()), etag.data(), nullptr,
                timeout_in_milliseconds(), &handler, &data);

        if (S3StatusOK != data.status) {
            return request_error(S3_FILE_COPY_ERR, data.status,
                    fmt::format("Error copying the S3 object: \"{}\" to S3 object \"{}\"", _source_key, _destination_key));
        }

        _handle.token = etag.data();
        _handle.completed = true;
        return SUCCESS();
    } // end copy_object

    irods::error libs3_object_store::get_copy_status(const copy_handle&        _handle,
                                                     copy_status&              _status,
                                                     const cancellation_token& _token)
    {
        if (!_handle.completed) {
            return ERROR(SYS_NOT_SUPPORTED, fmt::format("no asynchronous copy [{}] is known to libs3", _handle.token));
        }

        _status = copy_status::SUCCEEDED;
        return SUCCESS();
    } // end get_copy_status

    irods::error libs3_object_store::head_object(const std::string&        _key,
                                                 object_info&              _info,
                                                 const cancellation_token& _token)
    {
        request_data data{bucket_context_, _token};

        S3ResponseHandler handler = {callbacks::on_response_properties, callbacks::on_response_completion};

        S3_head_object(&bucket_context_, _key.c_str(), nullptr, timeout_in_milliseconds(), &handler, &data);

        if (S3StatusOK != data.status) {
            return request_error(S3_FILE_STAT_ERR, data.status, fmt::format("S3_head_object failed for [{}]", _key));
        }

        _info.size = data.content_length;
        _info.etag = data.etag;
        return SUCCESS();
    } // end head_object

    bool libs3_object_store::is_retryable(const irods::error& _error) const
    {
        if (_error.ok()) {
            return false;
        }

        const auto status = static_cast<S3Status>(getErrno(static_cast<int>(_error.code())));
        return S3_status_is_retryable(status) || S3StatusErrorUnknown == status;
    } // end is_retryable

} // irods::experimental::io::chunked_transfer
