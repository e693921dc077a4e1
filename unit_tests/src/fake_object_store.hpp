#ifndef IRODS_CHUNKED_TRANSFER_FAKE_OBJECT_STORE_HPP
#define IRODS_CHUNKED_TRANSFER_FAKE_OBJECT_STORE_HPP

#include "irods/private/chunked_transfer/clock.hpp"
#include "irods/private/chunked_transfer/data_source.hpp"
#include "irods/private/chunked_transfer/object_store.hpp"

#include <irods/rodsErrorTable.h>

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace chunked_transfer_test
{
    namespace ct = irods::experimental::io::chunked_transfer;

    // In-memory object store.  Records every call, tracks how many part
    // uploads run at once and injects failures on request.
    class fake_object_store : public ct::object_store
    {
    public:

        // low digits of a retryable error code
        static constexpr int RETRYABLE_STATUS = 1;

        struct multipart_upload
        {
            std::string                key;
            ct::put_properties         properties;
            std::map<int, std::string> parts;          // part number -> bytes (or size only)
            std::map<int, std::int64_t> part_sizes;
        };

        fake_object_store() = default;

        // ---- configuration, set before a transfer starts ----
        bool                        retain_data{true};
        std::set<int>               failing_parts;
        std::map<int, int>          transient_part_failures;   // part -> retryable failures before success
        bool                        fail_create{false};
        bool                        fail_complete{false};
        bool                        fail_abort{false};
        bool                        reject_digest{false};
        int                         transient_put_failures{0};
        std::chrono::milliseconds   part_delay{0};
        bool                        asynchronous_copies{false};
        int                         polls_until_copy_done{-1};   // -1 never finishes
        bool                        remote_copy_fails{false};
        int                         transient_status_failures{0};
        std::function<void(int)>    on_upload_part;              // called with the part number

        // ---- observations ----
        mutable std::mutex                 mutex;
        std::map<std::string, std::string> objects;
        std::map<std::string, ct::put_properties> object_properties;
        std::map<std::string, multipart_upload> uploads;
        std::vector<int>                   completed_part_numbers;
        std::vector<std::string>           aborted_upload_ids;
        int                                current_in_flight{0};
        int                                max_in_flight{0};
        int                                create_calls{0};
        int                                upload_part_calls{0};
        int                                upload_part_copy_calls{0};
        int                                complete_calls{0};
        int                                abort_calls{0};
        int                                put_calls{0};
        int                                copy_calls{0};
        int                                status_calls{0};
        int                                head_calls{0};

        irods::error create_multipart_upload(const std::string&            _key,
                                             const ct::put_properties&     _properties,
                                             std::string&                  _upload_id,
                                             const ct::cancellation_token& _token) override
        {
            std::lock_guard<std::mutex> lk(mutex);
            ++create_calls;

            if (fail_create || _token.is_cancellation_requested()) {
                return ERROR(S3_PUT_ERROR, "create_multipart_upload failed");
            }

            _upload_id = fmt::format("upload-{}", create_calls);
            uploads[_upload_id] = multipart_upload{_key, _properties, {}, {}};
            return SUCCESS();
        }

        irods::error upload_part(const std::string&            _key,
                                 const std::string&            _upload_id,
                                 int                           _part_number,
                                 const char*                   _buffer,
                                 std::int64_t                  _length,
                                 std::string&                  _etag,
                                 const ct::cancellation_token& _token) override
        {
            enter_part(_part_number);

            irods::error ret = SUCCESS();
            if (part_delay.count() > 0) {
                std::this_thread::sleep_for(part_delay);
            }

            {
                std::lock_guard<std::mutex> lk(mutex);
                ++upload_part_calls;

                if (_token.is_cancellation_requested()) {
                    ret = ERROR(S3_PUT_ERROR, fmt::format("part {} cancelled", _part_number));
                }
                else if (failing_parts.count(_part_number)) {
                    ret = ERROR(S3_PUT_ERROR, fmt::format("part {} failed", _part_number));
                }
                else if (transient_part_failures[_part_number] > 0) {
                    --transient_part_failures[_part_number];
                    ret = ERROR(S3_PUT_ERROR - RETRYABLE_STATUS, fmt::format("part {} failed, try again", _part_number));
                }
                else if (0 == uploads.count(_upload_id) || uploads[_upload_id].key != _key) {
                    ret = ERROR(S3_PUT_ERROR, fmt::format("no upload [{}] for [{}]", _upload_id, _key));
                }
                else {
                    auto& upload = uploads[_upload_id];
                    upload.parts[_part_number] = retain_data ? std::string(_buffer, _length) : std::string{};
                    upload.part_sizes[_part_number] = _length;
                    _etag = fmt::format("etag-{}", _part_number);
                }
            }

            leave_part();
            return ret;
        }

        irods::error upload_part_copy(const std::string&            _source_key,
                                      const std::string&            _key,
                                      const std::string&            _upload_id,
                                      int                           _part_number,
                                      std::int64_t                  _offset,
                                      std::int64_t                  _length,
                                      std::string&                  _etag,
                                      const ct::cancellation_token& _token) override
        {
            enter_part(_part_number);

            irods::error ret = SUCCESS();
            {
                std::lock_guard<std::mutex> lk(mutex);
                ++upload_part_copy_calls;

                if (_token.is_cancellation_requested() || failing_parts.count(_part_number)) {
                    ret = ERROR(S3_FILE_COPY_ERR, fmt::format("part copy {} failed", _part_number));
                }
                else if (0 == uploads.count(_upload_id)) {
                    ret = ERROR(S3_FILE_COPY_ERR, fmt::format("no upload [{}] for [{}]", _upload_id, _key));
                }
                else {
                    auto& upload = uploads[_upload_id];
                    const auto& source = objects[_source_key];
                    upload.parts[_part_number] = retain_data ? source.substr(_offset, _length) : std::string{};
                    upload.part_sizes[_part_number] = _length;
                    _etag = fmt::format("copy-etag-{}", _part_number);
                }
            }

            leave_part();
            return ret;
        }

        irods::error complete_multipart_upload(const std::string&                     _key,
                                               const std::string&                     _upload_id,
                                               const std::vector<ct::completed_part>& _parts,
                                               const ct::cancellation_token&          _token) override
        {
            std::lock_guard<std::mutex> lk(mutex);
            ++complete_calls;

            completed_part_numbers.clear();
            for (const auto& part : _parts) {
                completed_part_numbers.push_back(part.part_number);
            }

            if (fail_complete || _token.is_cancellation_requested()) {
                return ERROR(S3_PUT_ERROR, "complete_multipart_upload rejected");
            }

            auto it = uploads.find(_upload_id);
            if (uploads.end() == it) {
                return ERROR(S3_PUT_ERROR, fmt::format("no upload [{}]", _upload_id));
            }

            std::string object;
            for (const auto& part : _parts) {
                object += it->second.parts.at(part.part_number);
            }

            objects[_key] = object;
            object_properties[_key] = it->second.properties;
            uploads.erase(it);
            return SUCCESS();
        }

        irods::error abort_multipart_upload(const std::string&            _key,
                                            const std::string&            _upload_id,
                                            const ct::cancellation_token& _token) override
        {
            std::lock_guard<std::mutex> lk(mutex);
            ++abort_calls;
            aborted_upload_ids.push_back(_upload_id);

            if (fail_abort || _token.is_cancellation_requested()) {
                return ERROR(S3_PUT_ERROR, fmt::format("abort of [{}] failed", _upload_id));
            }

            uploads.erase(_upload_id);
            return SUCCESS();
        }

        irods::error put_object(const std::string&            _key,
                                const char*                   _buffer,
                                std::int64_t                  _length,
                                const ct::put_properties&     _properties,
                                const ct::cancellation_token& _token) override
        {
            std::lock_guard<std::mutex> lk(mutex);
            ++put_calls;

            if (_token.is_cancellation_requested()) {
                return ERROR(S3_PUT_ERROR, "put cancelled");
            }

            if (transient_put_failures > 0) {
                --transient_put_failures;
                return ERROR(S3_PUT_ERROR - RETRYABLE_STATUS, "put failed, try again");
            }

            if (reject_digest) {
                return ERROR(USER_CHKSUM_MISMATCH, "BadDigest");
            }

            objects[_key] = std::string(_buffer, _length);
            object_properties[_key] = _properties;
            return SUCCESS();
        }

        irods::error copy_object(const std::string&            _source_key,
                                 const std::string&            _destination_key,
                                 const ct::put_properties&     _properties,
                                 ct::copy_handle&              _handle,
                                 const ct::cancellation_token& _token) override
        {
            std::lock_guard<std::mutex> lk(mutex);
            ++copy_calls;

            if (_token.is_cancellation_requested() || 0 == objects.count(_source_key)) {
                return ERROR(S3_FILE_COPY_ERR, fmt::format("cannot copy [{}]", _source_key));
            }

            objects[_destination_key] = objects[_source_key];
            object_properties[_destination_key] = _properties;
            _handle.token = fmt::format("copy-{}", copy_calls);
            _handle.completed = !asynchronous_copies;
            return SUCCESS();
        }

        irods::error get_copy_status(const ct::copy_handle&        _handle,
                                     ct::copy_status&              _status,
                                     const ct::cancellation_token& _token) override
        {
            std::lock_guard<std::mutex> lk(mutex);
            ++status_calls;

            if (transient_status_failures > 0) {
                --transient_status_failures;
                return ERROR(S3_FILE_COPY_ERR - RETRYABLE_STATUS, "status unavailable");
            }

            if (remote_copy_fails) {
                _status = ct::copy_status::FAILED;
            }
            else if (polls_until_copy_done >= 0 && status_calls >= polls_until_copy_done) {
                _status = ct::copy_status::SUCCEEDED;
            }
            else {
                _status = ct::copy_status::IN_PROGRESS;
            }

            return SUCCESS();
        }

        irods::error head_object(const std::string&            _key,
                                 ct::object_info&              _info,
                                 const ct::cancellation_token& _token) override
        {
            std::lock_guard<std::mutex> lk(mutex);
            ++head_calls;

            auto it = objects.find(_key);
            if (objects.end() == it) {
                return ERROR(S3_FILE_STAT_ERR, fmt::format("[{}] not found", _key));
            }

            auto size = sizes.find(_key);
            _info.size = sizes.end() == size ? static_cast<std::int64_t>(it->second.size()) : size->second;
            _info.etag = "etag";
            return SUCCESS();
        }

        bool is_retryable(const irods::error& _error) const override
        {
            return !_error.ok() && RETRYABLE_STATUS == (-_error.code()) % 1000;
        }

        // reports _size from head_object without holding that many bytes
        std::map<std::string, std::int64_t> sizes;

    private:

        void enter_part(int _part_number)
        {
            {
                std::lock_guard<std::mutex> lk(mutex);
                ++current_in_flight;
                max_in_flight = std::max(max_in_flight, current_in_flight);
            }

            if (on_upload_part) {
                on_upload_part(_part_number);
            }
        }

        void leave_part()
        {
            std::lock_guard<std::mutex> lk(mutex);
            --current_in_flight;
        }

    }; // end class fake_object_store

    // Time only moves when something sleeps on it.
    class virtual_clock : public ct::transfer_clock
    {
    public:

        virtual_clock()
            : now_{std::chrono::steady_clock::time_point{} + std::chrono::hours{1}}
        {
        }

        auto now() const -> time_point override
        {
            std::lock_guard<std::mutex> lk(mutex_);
            return now_;
        }

        bool sleep_for(std::chrono::milliseconds _duration, const ct::cancellation_token& _token) override
        {
            if (_token.is_cancellation_requested()) {
                return false;
            }

            {
                std::lock_guard<std::mutex> lk(mutex_);
                now_ += _duration;
                sleeps_.push_back(_duration);
            }

            if (on_sleep) {
                on_sleep(_duration);
            }

            return !_token.is_cancellation_requested();
        }

        auto sleeps() const -> std::vector<std::chrono::milliseconds>
        {
            std::lock_guard<std::mutex> lk(mutex_);
            return sleeps_;
        }

        std::function<void(std::chrono::milliseconds)> on_sleep;

    private:

        mutable std::mutex                     mutex_;
        time_point                             now_;
        std::vector<std::chrono::milliseconds> sleeps_;

    }; // end class virtual_clock

    // Deterministic bytes generated on the fly, byte i is i % 251.
    class pattern_data_source : public ct::data_source
    {
    public:

        explicit pattern_data_source(std::int64_t _size)
            : size_{_size}
            , position_{0}
        {
        }

        irods::error read(char* _buffer, std::int64_t _length, std::int64_t& _bytes_read) override
        {
            _bytes_read = std::min(_length, size_ - position_);
            for (std::int64_t i = 0; i < _bytes_read; ++i) {
                _buffer[i] = static_cast<char>((position_ + i) % 251);
            }
            position_ += _bytes_read;
            return SUCCESS();
        }

        auto position() const -> std::int64_t { return position_; }

    private:

        std::int64_t size_;
        std::int64_t position_;

    }; // end class pattern_data_source

    inline auto make_pattern(std::int64_t _size) -> std::string
    {
        std::string bytes(_size, '\0');
        for (std::int64_t i = 0; i < _size; ++i) {
            bytes[i] = static_cast<char>(i % 251);
        }
        return bytes;
    }

    // Source that fails once it has handed out _fail_after bytes.
    class failing_data_source : public ct::data_source
    {
    public:

        failing_data_source(std::int64_t _size, std::int64_t _fail_after)
            : pattern_{_size}
            , fail_after_{_fail_after}
        {
        }

        irods::error read(char* _buffer, std::int64_t _length, std::int64_t& _bytes_read) override
        {
            if (pattern_.position() >= fail_after_) {
                _bytes_read = 0;
                return ERROR(UNIX_FILE_READ_ERR, "injected read failure");
            }
            return pattern_.read(_buffer, std::min(_length, fail_after_ - pattern_.position()), _bytes_read);
        }

    private:

        pattern_data_source pattern_;
        std::int64_t        fail_after_;

    }; // end class failing_data_source

} // namespace chunked_transfer_test

#endif // IRODS_CHUNKED_TRANSFER_FAKE_OBJECT_STORE_HPP
