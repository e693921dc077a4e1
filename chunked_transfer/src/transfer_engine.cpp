#include "irods/private/chunked_transfer/transfer_engine.hpp"
#include "irods/private/chunked_transfer/checksum_accumulator.hpp"
#include "irods/private/chunked_transfer/chunk_planner.hpp"
#include "irods/private/chunked_transfer/copy_pacer.hpp"
#include "irods/private/chunked_transfer/logging_category.hpp"
#include "irods/private/chunked_transfer/multipart_session.hpp"
#include "irods/private/chunked_transfer/outcome_resolver.hpp"
#include "irods/private/chunked_transfer/size_classifier.hpp"
#include "irods/private/chunked_transfer/upload_scheduler.hpp"
#include "irods/private/chunked_transfer/util.hpp"

#include <irods/rodsErrorTable.h>

#include <fmt/format.h>

#include <algorithm>
#include <memory>
#include <new>
#include <vector>

namespace irods::experimental::io::chunked_transfer
{

    namespace
    {
        const std::string checksum_metadata_key{"md5chksum"};

        void fail(transfer_result& _result, error_codes _code, const irods::error& _error)
        {
            _result.code = _code;
            _result.message = _error.result();
            logger::error("{}:{} ({}) [[{}]] [key={}] transfer failed [{}] {}", __FILE__, __LINE__, __func__,
                    get_thread_identifier(), _result.key, _code, _error.result());
        } // end fail

        // A known size source must end where its size says.
        irods::error check_end_of_source(data_source& _source, const std::string& _key, std::int64_t _size)
        {
            char probe = 0;
            std::int64_t bytes_read = 0;

            irods::error ret = _source.read(&probe, 1, bytes_read);
            if (!ret.ok()) {
                return PASS(ret);
            }

            if (bytes_read > 0) {
                return ERROR(UNIX_FILE_READ_ERR, fmt::format("source for [{}] is longer than {} bytes", _key, _size));
            }

            return SUCCESS();
        } // end check_end_of_source

        auto copy_state_for(session_state _state, error_codes _code) -> copy_state
        {
            if (session_state::COMPLETED == _state) {
                return copy_state::SUCCEEDED;
            }
            return error_codes::CANCELLED == _code ? copy_state::TIMED_OUT : copy_state::FAILED;
        } // end copy_state_for

    } // namespace

    transfer_engine::transfer_engine(object_store& _store, const transfer_config& _config, transfer_clock& _clock)
        : store_{_store}
        , config_{_config}
        , clock_{_clock}
    {
    }

    auto transfer_engine::upload(const transfer_request& _request, const cancellation_token& _token) -> transfer_result
    {
        transfer_result result;
        result.key = _request.key;

        if (irods::error ret = validate_config(config_); !ret.ok()) {
            fail(result, error_codes::INVALID_SIZE_CONFIGURATION, ret);
            return result;
        }

        if (_token.is_cancellation_requested()) {
            fail(result, error_codes::CANCELLED, ERROR(S3_PUT_ERROR, "transfer cancelled before it started"));
            return result;
        }

        const auto tier = _request.tier.value_or(config_.tier);
        result.mode = classify_transfer(_request.size, config_.upload_cutoff);

        logger::info("{}:{} ({}) [[{}]] [key={}][size={}][mode={}][tier={}] starting upload", __FILE__, __LINE__, __func__,
                get_thread_identifier(), _request.key, _request.size,
                transfer_mode::SIMPLE == result.mode ? "simple" : "chunked", tier);

        result = transfer_mode::SIMPLE == result.mode
            ? simple_upload(_request, tier, _token)
            : chunked_upload(_request, tier, _token);

        if (result.ok()) {
            logger::info("{}:{} ({}) [[{}]] [key={}] uploaded {} bytes in {} parts", __FILE__, __LINE__, __func__,
                    get_thread_identifier(), _request.key, result.bytes_transferred, std::max<std::int64_t>(1, result.part_count));
        }

        return result;
    } // end upload

    auto transfer_engine::simple_upload(const transfer_request&   _request,
                                        storage_tier              _tier,
                                        const cancellation_token& _token) -> transfer_result
    {
        transfer_result result;
        result.key = _request.key;
        result.mode = transfer_mode::SIMPLE;

        std::vector<char> buffer;
        try {
            buffer.resize(_request.size);
        }
        catch (const std::bad_alloc&) {
            fail(result, error_codes::SOURCE_READ_ERROR,
                    ERROR(SYS_MALLOC_ERR, fmt::format("failed to allocate {} bytes", _request.size)));
            return result;
        }

        std::unique_ptr<checksum_accumulator> accumulator;
        data_source* source = &_request.source;
        if (!config_.disable_checksum) {
            accumulator = std::make_unique<checksum_accumulator>(_request.source);
            source = accumulator.get();
        }

        std::int64_t bytes_read = 0;
        irods::error ret = read_fully(*source, buffer.data(), _request.size, bytes_read);
        if (!ret.ok()) {
            fail(result, error_codes::SOURCE_READ_ERROR, ret);
            return result;
        }

        if (bytes_read < _request.size) {
            fail(result, error_codes::SOURCE_READ_ERROR,
                    ERROR(UNIX_FILE_READ_ERR, fmt::format("source for [{}] ended after {} of {} bytes",
                        _request.key, bytes_read, _request.size)));
            return result;
        }

        ret = check_end_of_source(*source, _request.key, _request.size);
        if (!ret.ok()) {
            fail(result, error_codes::SOURCE_READ_ERROR, ret);
            return result;
        }

        put_properties properties;
        properties.tier = _tier;

        if (accumulator) {
            ret = accumulator->digest(result.checksum);
            if (!ret.ok()) {
                fail(result, error_codes::SOURCE_READ_ERROR, ret);
                return result;
            }
            properties.content_md5 = result.checksum;
            properties.metadata[checksum_metadata_key] = result.checksum;
        }

        ret = retry_remote_call(store_, config_, clock_, _token, "put_object",
                [&]() { return store_.put_object(_request.key, buffer.data(), _request.size, properties, _token); });

        if (!ret.ok()) {
            auto code = error_codes::PUT_OBJECT_ERROR;
            if (_token.is_cancellation_requested()) {
                code = error_codes::CANCELLED;
            }
            else if (USER_CHKSUM_MISMATCH == ret.code()) {
                code = error_codes::CHECKSUM_MISMATCH;
            }
            fail(result, code, ret);
            return result;
        }

        result.bytes_transferred = _request.size;
        result.part_count = 1;
        return result;
    } // end simple_upload

    auto transfer_engine::chunked_upload(const transfer_request&   _request,
                                         storage_tier              _tier,
                                         const cancellation_token& _token) -> transfer_result
    {
        transfer_result result;
        result.key = _request.key;
        result.mode = transfer_mode::CHUNKED;

        chunk_plan plan;
        irods::error ret = plan_upload(_request.size, config_, plan);
        if (!ret.ok()) {
            fail(result, error_codes::INVALID_SIZE_CONFIGURATION, ret);
            return result;
        }

        std::unique_ptr<checksum_accumulator> accumulator;
        data_source* source = &_request.source;
        if (!config_.disable_checksum) {
            accumulator = std::make_unique<checksum_accumulator>(_request.source);
            source = accumulator.get();
        }

        multipart_session session{_request.key};
        outcome_resolver resolver{store_, config_, clock_, _token};

        put_properties properties;
        properties.tier = _tier;

        ret = retry_remote_call(store_, config_, clock_, _token, "create_multipart_upload",
                [&]() { return store_.create_multipart_upload(_request.key, properties, session.upload_id, _token); });

        if (!ret.ok()) {
            const auto code = _token.is_cancellation_requested()
                ? error_codes::CANCELLED
                : error_codes::INITIATE_MULTIPART_UPLOAD_ERROR;
            session.upload_id.clear();
            ret = resolver.clean_up(session, code, ret, result);
            return result;
        }

        logger::debug("{}:{} ({}) [[{}]] [key={}][upload_id={}][chunk_size={}][expected_parts={}]", __FILE__, __LINE__,
                __func__, get_thread_identifier(), _request.key, session.upload_id, plan.chunk_size, plan.expected_chunk_count);

        upload_scheduler scheduler{store_, config_, clock_, _token};
        scheduler_result scheduled = scheduler.upload(*source, plan, session);

        if (error_codes::SUCCESS == scheduled.code && plan.size_is_known()) {
            ret = check_end_of_source(*source, _request.key, _request.size);
            if (!ret.ok()) {
                scheduled.code = error_codes::SOURCE_READ_ERROR;
                scheduled.error = ret;
            }
        }

        // resolve() reports failures through result
        ret = resolver.resolve(session, scheduled, result);
        result.bytes_transferred = scheduled.bytes_dispatched;

        if (!ret.ok()) {
            return result;
        }

        if (accumulator) {
            ret = accumulator->digest(result.checksum);
            if (!ret.ok()) {
                logger::warn("{}:{} ({}) [key={}] no checksum available [{}]", __FILE__, __LINE__, __func__,
                        _request.key, ret.result());
            }
        }

        return result;
    } // end chunked_upload

    auto transfer_engine::copy(const std::string&          _source_key,
                               const std::string&          _destination_key,
                               std::optional<storage_tier> _tier,
                               const cancellation_token&   _token) -> copy_result
    {
        copy_result result;
        result.source_key = _source_key;
        result.destination_key = _destination_key;
        result.state = copy_state::REQUESTED;

        const auto deadline = clock_.now() + config_.copy_timeout;
        const auto tier = _tier.value_or(config_.tier);

        auto fail_copy = [&result](error_codes _code, copy_state _state, const irods::error& _error) {
            result.code = _code;
            result.state = _state;
            result.message = _error.result();
            logger::error("{}:{} ({}) [[{}]] [{} -> {}] copy failed [{}] {}", __FILE__, __LINE__, __func__,
                    get_thread_identifier(), result.source_key, result.destination_key, _code, _error.result());
        };

        if (irods::error ret = validate_config(config_); !ret.ok()) {
            fail_copy(error_codes::INVALID_SIZE_CONFIGURATION, copy_state::FAILED, ret);
            return result;
        }

        if (_token.is_cancellation_requested()) {
            fail_copy(error_codes::CANCELLED, copy_state::TIMED_OUT, ERROR(S3_FILE_COPY_ERR, "copy cancelled before it started"));
            return result;
        }

        object_info info;
        irods::error ret = retry_remote_call(store_, config_, clock_, _token, "head_object",
                [&]() { return store_.head_object(_source_key, info, _token); });

        if (!ret.ok()) {
            fail_copy(error_codes::HEAD_OBJECT_ERROR, copy_state::FAILED, ret);
            return result;
        }

        result.size = info.size;

        logger::info("{}:{} ({}) [[{}]] [{} -> {}][size={}][tier={}] starting copy", __FILE__, __LINE__, __func__,
                get_thread_identifier(), _source_key, _destination_key, info.size, tier);

        if (info.size > config_.copy_cutoff) {
            multipart_copy(result, tier, _token);
            return result;
        }

        put_properties properties;
        properties.tier = tier;

        copy_handle handle;
        ret = retry_remote_call(store_, config_, clock_, _token, "copy_object",
                [&]() { return store_.copy_object(_source_key, _destination_key, properties, handle, _token); });

        if (!ret.ok()) {
            if (_token.is_cancellation_requested()) {
                fail_copy(error_codes::CANCELLED, copy_state::TIMED_OUT, ret);
            }
            else {
                fail_copy(error_codes::COPY_OBJECT_ERROR, copy_state::FAILED, ret);
            }
            return result;
        }

        result.operation_token = handle.token;
        result.state = copy_state::IN_PROGRESS;

        copy_pacer pacer{store_, pacer_settings::from_config(config_), clock_, _token};
        copy_state state = copy_state::IN_PROGRESS;
        ret = pacer.wait_for_copy(handle, deadline, state);
        result.status_polls = pacer.poll_count();

        if (!ret.ok()) {
            if (copy_state::TIMED_OUT == state) {
                fail_copy(_token.is_cancellation_requested() ? error_codes::CANCELLED : error_codes::COPY_TIMEOUT, state, ret);
            }
            else {
                fail_copy(error_codes::COPY_OBJECT_ERROR, state, ret);
            }
            return result;
        }

        result.state = copy_state::SUCCEEDED;

        logger::info("{}:{} ({}) [[{}]] [{} -> {}] copied {} bytes", __FILE__, __LINE__, __func__,
                get_thread_identifier(), _source_key, _destination_key, info.size);

        return result;
    } // end copy

    void transfer_engine::multipart_copy(copy_result& _result, storage_tier _tier, const cancellation_token& _token)
    {
        _result.multipart = true;
        _result.state = copy_state::IN_PROGRESS;

        transfer_result& transfer = _result.multipart_result;
        transfer.key = _result.destination_key;
        transfer.mode = transfer_mode::CHUNKED;

        chunk_plan plan;
        irods::error ret = plan_chunks(_result.size, std::max(config_.copy_cutoff, constants::MINIMUM_CHUNK_SIZE),
                config_.maximum_part_count, plan);
        if (!ret.ok()) {
            fail(transfer, error_codes::INVALID_SIZE_CONFIGURATION, ret);
            _result.code = transfer.code;
            _result.state = copy_state::FAILED;
            _result.message = transfer.message;
            return;
        }

        multipart_session session{_result.destination_key};
        outcome_resolver resolver{store_, config_, clock_, _token};

        put_properties properties;
        properties.tier = _tier;

        ret = retry_remote_call(store_, config_, clock_, _token, "create_multipart_upload",
                [&]() { return store_.create_multipart_upload(_result.destination_key, properties, session.upload_id, _token); });

        if (!ret.ok()) {
            const auto code = _token.is_cancellation_requested()
                ? error_codes::CANCELLED
                : error_codes::INITIATE_MULTIPART_UPLOAD_ERROR;
            session.upload_id.clear();
            ret = resolver.clean_up(session, code, ret, transfer);
        }
        else {
            upload_scheduler scheduler{store_, config_, clock_, _token};
            const scheduler_result scheduled = scheduler.copy(_result.source_key, plan, session);
            ret = resolver.resolve(session, scheduled, transfer);
            transfer.bytes_transferred = scheduled.bytes_dispatched;
        }

        _result.code = transfer.code;
        _result.message = transfer.message;
        _result.state = copy_state_for(transfer.state, transfer.code);

        if (ret.ok()) {
            logger::info("{}:{} ({}) [[{}]] [{} -> {}] copied {} bytes in {} parts", __FILE__, __LINE__, __func__,
                    get_thread_identifier(), _result.source_key, _result.destination_key, _result.size, transfer.part_count);
        }
    } // end multipart_copy

} // irods::experimental::io::chunked_transfer
