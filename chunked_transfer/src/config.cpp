#include "irods/private/chunked_transfer/config.hpp"
#include "irods/private/chunked_transfer/logging_category.hpp"

#include <irods/irods_kvp_string_parser.hpp>
#include <irods/rodsErrorTable.h>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include <fmt/format.h>

#include <cctype>
#include <cmath>
#include <limits>

namespace irods::experimental::io::chunked_transfer
{

    namespace
    {
        const std::string upload_cutoff_key{"UPLOAD_CUTOFF"};
        const std::string chunk_size_key{"CHUNK_SIZE"};
        const std::string upload_concurrency_key{"UPLOAD_CONCURRENCY"};
        const std::string maximum_part_count_key{"MAXIMUM_PART_COUNT"};
        const std::string copy_cutoff_key{"COPY_CUTOFF"};
        const std::string copy_timeout_key{"COPY_TIMEOUT"};
        const std::string disable_checksum_key{"DISABLE_CHECKSUM"};
        const std::string leave_parts_on_error_key{"LEAVE_PARTS_ON_ERROR"};
        const std::string storage_tier_key{"STORAGE_TIER"};
        const std::string retry_count_key{"RETRY_COUNT"};
        const std::string retry_wait_key{"RETRY_WAIT"};
        const std::string max_retry_wait_key{"MAX_RETRY_WAIT"};

        // splits "15Mi" into "15" and "Mi"
        void split_number_and_suffix(const std::string& _value, std::string& _number, std::string& _suffix)
        {
            auto pos = _value.find_first_not_of("0123456789.");
            if (std::string::npos == pos) {
                _number = _value;
                _suffix.clear();
                return;
            }
            _number = _value.substr(0, pos);
            _suffix = _value.substr(pos);
        } // end split_number_and_suffix

        template <typename T>
        irods::error lexical_cast_value(const std::string& _key, const std::string& _value, T& _out)
        {
            try {
                _out = boost::lexical_cast<T>(_value);
            }
            catch (const boost::bad_lexical_cast&) {
                return ERROR(SYS_INVALID_INPUT_PARAM, fmt::format("failed to convert {} [{}]", _key, _value));
            }
            return SUCCESS();
        } // end lexical_cast_value

    } // namespace

    irods::error validate_config(const transfer_config& _config)
    {
        if (_config.chunk_size < constants::MINIMUM_CHUNK_SIZE) {
            return ERROR(SYS_INVALID_INPUT_PARAM,
                    fmt::format("chunk_size {} is less than the minimum of {}", _config.chunk_size, constants::MINIMUM_CHUNK_SIZE));
        }

        if (_config.upload_cutoff < 0 || _config.upload_cutoff > constants::MAXIMUM_UPLOAD_CUTOFF) {
            return ERROR(SYS_INVALID_INPUT_PARAM,
                    fmt::format("upload_cutoff {} must be between 0 and {}", _config.upload_cutoff, constants::MAXIMUM_UPLOAD_CUTOFF));
        }

        if (_config.copy_cutoff < 0 || _config.copy_cutoff > constants::MAXIMUM_COPY_CUTOFF) {
            return ERROR(SYS_INVALID_INPUT_PARAM,
                    fmt::format("copy_cutoff {} must be between 0 and {}", _config.copy_cutoff, constants::MAXIMUM_COPY_CUTOFF));
        }

        if (_config.upload_concurrency < 1 || _config.upload_concurrency > constants::MAXIMUM_UPLOAD_CONCURRENCY) {
            return ERROR(SYS_INVALID_INPUT_PARAM,
                    fmt::format("upload_concurrency must be between 1 and {}, got {}",
                        constants::MAXIMUM_UPLOAD_CONCURRENCY, _config.upload_concurrency));
        }

        if (_config.maximum_part_count < 1 || _config.maximum_part_count > constants::MAXIMUM_NUMBER_OF_PARTS) {
            return ERROR(SYS_INVALID_INPUT_PARAM,
                    fmt::format("maximum_part_count must be between 1 and {}, got {}",
                        constants::MAXIMUM_NUMBER_OF_PARTS, _config.maximum_part_count));
        }

        if (_config.copy_timeout.count() <= 0) {
            return ERROR(SYS_INVALID_INPUT_PARAM, "copy_timeout must be positive");
        }

        if (_config.copy_min_sleep.count() <= 0 || _config.copy_min_sleep > _config.copy_max_sleep) {
            return ERROR(SYS_INVALID_INPUT_PARAM,
                    fmt::format("copy pacer sleep bounds are invalid [min={}ms][max={}ms]",
                        _config.copy_min_sleep.count(), _config.copy_max_sleep.count()));
        }

        if (_config.copy_decay_constant < 1 || _config.copy_decay_constant > 16) {
            return ERROR(SYS_INVALID_INPUT_PARAM,
                    fmt::format("copy_decay_constant must be between 1 and 16, got {}", _config.copy_decay_constant));
        }

        if (_config.retry_wait.count() < 0 || _config.retry_wait > _config.max_retry_wait) {
            return ERROR(SYS_INVALID_INPUT_PARAM,
                    fmt::format("retry wait bounds are invalid [retry_wait={}ms][max_retry_wait={}ms]",
                        _config.retry_wait.count(), _config.max_retry_wait.count()));
        }

        return SUCCESS();
    } // end validate_config

    irods::error parse_size(const std::string& _value, std::int64_t& _bytes)
    {
        const auto value = boost::trim_copy(_value);

        std::string number;
        std::string suffix;
        split_number_and_suffix(value, number, suffix);

        if (number.empty()) {
            return ERROR(SYS_INVALID_INPUT_PARAM, fmt::format("invalid size [{}]", _value));
        }

        double amount = 0;
        if (irods::error ret = lexical_cast_value("size", number, amount); !ret.ok()) {
            return PASS(ret);
        }

        // "Mi" and "MiB" are accepted as aliases of "M"
        if (boost::iends_with(suffix, "ib")) {
            suffix.erase(suffix.size() - 2);
        }
        else if (boost::iends_with(suffix, "i")) {
            suffix.erase(suffix.size() - 1);
        }

        std::int64_t multiplier = 1;
        if (suffix.empty() || boost::iequals(suffix, "b")) {
            multiplier = 1;
        }
        else if (boost::iequals(suffix, "k")) {
            multiplier = 1024;
        }
        else if (boost::iequals(suffix, "m")) {
            multiplier = constants::MEBIBYTE;
        }
        else if (boost::iequals(suffix, "g")) {
            multiplier = constants::GIBIBYTE;
        }
        else if (boost::iequals(suffix, "t")) {
            multiplier = 1024 * constants::GIBIBYTE;
        }
        else {
            return ERROR(SYS_INVALID_INPUT_PARAM, fmt::format("invalid size suffix [{}] in [{}]", suffix, _value));
        }

        const double bytes = std::ceil(amount * static_cast<double>(multiplier));
        if (bytes > static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
            return ERROR(SYS_INVALID_INPUT_PARAM, fmt::format("size [{}] is too large", _value));
        }

        _bytes = static_cast<std::int64_t>(bytes);
        return SUCCESS();
    } // end parse_size

    irods::error parse_duration(const std::string& _value, std::chrono::milliseconds& _duration)
    {
        const auto value = boost::trim_copy(_value);

        std::string number;
        std::string suffix;
        split_number_and_suffix(value, number, suffix);

        if (number.empty()) {
            return ERROR(SYS_INVALID_INPUT_PARAM, fmt::format("invalid duration [{}]", _value));
        }

        double amount = 0;
        if (irods::error ret = lexical_cast_value("duration", number, amount); !ret.ok()) {
            return PASS(ret);
        }

        double milliseconds_per_unit = 0;
        if (boost::iequals(suffix, "ms")) {
            milliseconds_per_unit = 1;
        }
        else if (suffix.empty() || boost::iequals(suffix, "s")) {
            milliseconds_per_unit = 1000;
        }
        else if (boost::iequals(suffix, "m")) {
            milliseconds_per_unit = 60 * 1000;
        }
        else if (boost::iequals(suffix, "h")) {
            milliseconds_per_unit = 60 * 60 * 1000;
        }
        else {
            return ERROR(SYS_INVALID_INPUT_PARAM, fmt::format("invalid duration suffix [{}] in [{}]", suffix, _value));
        }

        _duration = std::chrono::milliseconds{static_cast<std::int64_t>(std::llround(amount * milliseconds_per_unit))};
        return SUCCESS();
    } // end parse_duration

    irods::error parse_bool(const std::string& _value, bool& _flag)
    {
        const auto value = boost::trim_copy(_value);

        if (boost::iequals(value, "true") || boost::iequals(value, "yes") || value == "1") {
            _flag = true;
            return SUCCESS();
        }

        if (boost::iequals(value, "false") || boost::iequals(value, "no") || value == "0") {
            _flag = false;
            return SUCCESS();
        }

        return ERROR(SYS_INVALID_INPUT_PARAM, fmt::format("invalid boolean [{}]", _value));
    } // end parse_bool

    irods::error parse_config(const std::string& _context_string, transfer_config& _config)
    {
        irods::kvp_map_t kvp;
        irods::error ret = irods::parse_kvp_string(_context_string, kvp);
        if (!ret.ok()) {
            return PASS(ret);
        }

        transfer_config config;

        for (const auto& [key, value] : kvp) {

            if (boost::iequals(key, upload_cutoff_key)) {
                ret = parse_size(value, config.upload_cutoff);
            }
            else if (boost::iequals(key, chunk_size_key)) {
                ret = parse_size(value, config.chunk_size);
            }
            else if (boost::iequals(key, upload_concurrency_key)) {
                ret = lexical_cast_value(key, value, config.upload_concurrency);
            }
            else if (boost::iequals(key, maximum_part_count_key)) {
                ret = lexical_cast_value(key, value, config.maximum_part_count);
            }
            else if (boost::iequals(key, copy_cutoff_key)) {
                ret = parse_size(value, config.copy_cutoff);
            }
            else if (boost::iequals(key, copy_timeout_key)) {
                ret = parse_duration(value, config.copy_timeout);
            }
            else if (boost::iequals(key, disable_checksum_key)) {
                ret = parse_bool(value, config.disable_checksum);
            }
            else if (boost::iequals(key, leave_parts_on_error_key)) {
                ret = parse_bool(value, config.leave_parts_on_error);
            }
            else if (boost::iequals(key, storage_tier_key)) {
                ret = parse_storage_tier(value, config.tier);
            }
            else if (boost::iequals(key, retry_count_key)) {
                // signed, a negative count must not wrap around
                std::int64_t retry_count = 0;
                ret = lexical_cast_value(key, value, retry_count);
                if (ret.ok()) {
                    if (retry_count < 0 || retry_count > std::numeric_limits<unsigned int>::max()) {
                        ret = ERROR(SYS_INVALID_INPUT_PARAM, fmt::format("invalid {} [{}]", key, value));
                    }
                    else {
                        config.retry_count_limit = static_cast<unsigned int>(retry_count);
                    }
                }
            }
            else if (boost::iequals(key, retry_wait_key)) {
                ret = parse_duration(value, config.retry_wait);
            }
            else if (boost::iequals(key, max_retry_wait_key)) {
                ret = parse_duration(value, config.max_retry_wait);
            }
            else {
                logger::debug("{}:{} ({}) ignoring unknown configuration key [{}]", __FILE__, __LINE__, __func__, key);
                continue;
            }

            if (!ret.ok()) {
                return PASS(ret);
            }
        }

        ret = validate_config(config);
        if (!ret.ok()) {
            return PASS(ret);
        }

        _config = config;
        return SUCCESS();
    } // end parse_config

} // irods::experimental::io::chunked_transfer
