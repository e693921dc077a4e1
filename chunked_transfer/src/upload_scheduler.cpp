#include "irods/private/chunked_transfer/upload_scheduler.hpp"
#include "irods/private/chunked_transfer/logging_category.hpp"
#include "irods/private/chunked_transfer/util.hpp"

#include <irods/rodsErrorTable.h>
#include <irods/thread_pool.hpp>

#include <fmt/format.h>

#include <condition_variable>
#include <mutex>
#include <new>
#include <vector>

namespace irods::experimental::io::chunked_transfer
{

    upload_scheduler::upload_scheduler(object_store&             _store,
                                       const transfer_config&    _config,
                                       transfer_clock&           _clock,
                                       const cancellation_token& _token)
        : store_{_store}
        , config_{_config}
        , clock_{_clock}
        , token_{_token}
    {
    }

    auto upload_scheduler::upload(data_source& _source, const chunk_plan& _plan, multipart_session& _session) -> scheduler_result
    {
        std::int64_t part_number = 0;

        auto produce = [&](chunk_task& _task, bool& _produced, bool& _last, error_codes& _code) -> irods::error
        {
            ++part_number;
            _produced = false;

            if (part_number > _plan.maximum_chunk_count) {

                // the ceiling is reached, any further byte cannot be uploaded
                char probe = 0;
                std::int64_t bytes_read = 0;
                irods::error ret = _source.read(&probe, 1, bytes_read);
                if (!ret.ok()) {
                    _code = error_codes::SOURCE_READ_ERROR;
                    return PASS(ret);
                }

                if (bytes_read > 0) {
                    _code = error_codes::PART_COUNT_EXCEEDED;
                    return ERROR(SYS_INVALID_INPUT_PARAM,
                            fmt::format("[{}] is larger than {} parts of {} bytes", _session.key,
                                _plan.maximum_chunk_count, _plan.chunk_size));
                }

                return SUCCESS();
            }

            const std::int64_t expected_length = _plan.part_size(part_number);

            auto payload = std::make_shared<std::vector<char>>();
            try {
                payload->resize(expected_length);
            }
            catch (const std::bad_alloc&) {
                _code = error_codes::SOURCE_READ_ERROR;
                return ERROR(SYS_MALLOC_ERR, fmt::format("failed to allocate {} bytes for part {}", expected_length, part_number));
            }

            std::int64_t bytes_read = 0;
            irods::error ret = read_fully(_source, payload->data(), expected_length, bytes_read);
            if (!ret.ok()) {
                _code = error_codes::SOURCE_READ_ERROR;
                return PASS(ret);
            }

            if (_plan.size_is_known()) {

                if (bytes_read < expected_length) {
                    _code = error_codes::SOURCE_READ_ERROR;
                    return ERROR(UNIX_FILE_READ_ERR,
                            fmt::format("source for [{}] ended after {} of {} bytes", _session.key,
                                _plan.part_offset(part_number) + bytes_read, _plan.object_size));
                }

                _last = part_number >= _plan.expected_chunk_count;
            }
            else {

                // an empty stream is still uploaded as one empty part
                if (0 == bytes_read && part_number > 1) {
                    return SUCCESS();
                }

                _last = bytes_read < expected_length;
                payload->resize(bytes_read);
            }

            _task.part_number = static_cast<int>(part_number);
            _task.offset = _plan.part_offset(part_number);
            _task.length = bytes_read;
            _task.payload = std::move(payload);
            _produced = true;

            return SUCCESS();
        };

        return dispatch("", _session, produce);
    } // end upload

    auto upload_scheduler::copy(const std::string& _source_key, const chunk_plan& _plan, multipart_session& _session) -> scheduler_result
    {
        std::int64_t part_number = 0;

        auto produce = [&](chunk_task& _task, bool& _produced, bool& _last, error_codes& _code) -> irods::error
        {
            ++part_number;

            if (!_plan.size_is_known() || _plan.expected_chunk_count > _plan.maximum_chunk_count) {
                _code = error_codes::PART_COUNT_EXCEEDED;
                return ERROR(SYS_INVALID_INPUT_PARAM, fmt::format("no valid copy plan for [{}]", _source_key));
            }

            _task.part_number = static_cast<int>(part_number);
            _task.offset = _plan.part_offset(part_number);
            _task.length = _plan.part_size(part_number);
            _produced = true;
            _last = part_number >= _plan.expected_chunk_count;

            return SUCCESS();
        };

        return dispatch(_source_key, _session, produce);
    } // end copy

    auto upload_scheduler::transfer_part(const std::string&       _source_key,
                                         const multipart_session& _session,
                                         const chunk_task&        _task,
                                         std::string&             _etag) -> irods::error
    {
        if (_task.payload) {
            return retry_remote_call(store_, config_, clock_, token_, fmt::format("upload_part {}", _task.part_number),
                    [&]() {
                        return store_.upload_part(_session.key, _session.upload_id, _task.part_number,
                                _task.payload->data(), _task.length, _etag, token_);
                    });
        }

        return retry_remote_call(store_, config_, clock_, token_, fmt::format("upload_part_copy {}", _task.part_number),
                [&]() {
                    return store_.upload_part_copy(_source_key, _session.key, _session.upload_id, _task.part_number,
                            _task.offset, _task.length, _etag, token_);
                });
    } // end transfer_part

    auto upload_scheduler::dispatch(const std::string&   _source_key,
                                    multipart_session&   _session,
                                    const task_producer& _produce) -> scheduler_result
    {
        scheduler_result result;

        std::mutex              mutex;
        std::condition_variable cv;
        int                     in_flight = 0;
        bool                    failed = false;

        // records the failure with the lowest part number
        auto record_failure = [&result, &failed](int _part_number, error_codes _code, const irods::error& _error) {
            if (!failed || (_part_number > 0 && (0 == result.failed_part_number || _part_number < result.failed_part_number))) {
                result.code = _code;
                result.error = _error;
                result.failed_part_number = _part_number;
            }
            failed = true;
        };

        {
            irods::thread_pool workers{config_.upload_concurrency};

            bool last = false;
            while (!last) {

                {
                    std::unique_lock<std::mutex> lk(mutex);
                    cv.wait(lk, [&] { return in_flight < config_.upload_concurrency || failed; });
                    if (failed) {
                        break;
                    }
                }

                if (token_.is_cancellation_requested()) {
                    std::lock_guard<std::mutex> lk(mutex);
                    record_failure(0, error_codes::CANCELLED, ERROR(S3_PUT_ERROR, "transfer cancelled"));
                    break;
                }

                chunk_task task;
                bool produced = false;
                error_codes code = error_codes::SUCCESS;
                irods::error ret = _produce(task, produced, last, code);
                if (!ret.ok()) {
                    logger::error("{}:{} ({}) [[{}]] [key={}] {}", __FILE__, __LINE__, __func__,
                            get_thread_identifier(), _session.key, ret.result());
                    std::lock_guard<std::mutex> lk(mutex);
                    record_failure(0, code, ret);
                    break;
                }

                if (!produced) {
                    break;
                }

                task.state = part_state::IN_FLIGHT;
                const std::size_t index = _session.tasks.size();

                {
                    std::lock_guard<std::mutex> lk(mutex);
                    _session.tasks.push_back(task);
                    ++in_flight;
                }

                ++result.parts_dispatched;
                result.bytes_dispatched += task.length;

                logger::debug("{}:{} ({}) [[{}]] [key={}] dispatching part {} [offset={}][length={}]",
                        __FILE__, __LINE__, __func__, get_thread_identifier(), _session.key,
                        task.part_number, task.offset, task.length);

                irods::thread_pool::post(workers, [this, &_source_key, &_session, &mutex, &cv, &in_flight, &record_failure, task, index] () {

                    std::string etag;
                    irods::error ret = transfer_part(_source_key, _session, task, etag);

                    {
                        std::lock_guard<std::mutex> lk(mutex);

                        chunk_task& settled = _session.tasks[index];
                        settled.payload.reset();

                        if (ret.ok()) {
                            settled.state = part_state::SUCCEEDED;
                            settled.etag = etag;
                        }
                        else {
                            settled.state = part_state::FAILED;
                            settled.error_message = ret.result();

                            const auto code = token_.is_cancellation_requested()
                                ? error_codes::CANCELLED
                                : error_codes::UPLOAD_PART_ERROR;
                            record_failure(task.part_number, code, ret);
                        }

                        --in_flight;
                    }

                    if (ret.ok()) {
                        logger::debug("{}:{} ({}) [[{}]] [key={}] part {} done [etag={}]", __FILE__, __LINE__, __func__,
                                get_thread_identifier(), _session.key, task.part_number, etag);
                    }
                    else {
                        logger::error("{}:{} ({}) [[{}]] [key={}] part {} failed [{}]", __FILE__, __LINE__, __func__,
                                get_thread_identifier(), _session.key, task.part_number, ret.result());
                    }

                    cv.notify_all();
                });
            }

            workers.join();
        }

        return result;
    } // end dispatch

} // irods::experimental::io::chunked_transfer
