#ifndef IRODS_CHUNKED_TRANSFER_LOGGING_CATEGORY_HPP
#define IRODS_CHUNKED_TRANSFER_LOGGING_CATEGORY_HPP

#include "irods/private/chunked_transfer/types.hpp"

#include <irods/irods_logger.hpp>

#include <fmt/format.h>

#include <string_view>

// 1. Declare the custom category tag.
//    This structure does not need to define a body.
//    This tag allows the logger to locate data specific to the new category.
struct chunked_transfer_logging_category;

// 2. Specialize the logger configuration for the new category.
//    This also defines the default configuration for the new category.
namespace irods::experimental
{
    template <>
    class log::logger_config<chunked_transfer_logging_category>
    {
        // This defines the name that will appear in the log under the "log_category" key.
        static constexpr const char* name = "chunked_transfer_logging_category";

        // This is the current log level for the category. This also represents the initial
        // log level. Use the "set_level()" function to adjust the level.
        static inline log::level level = log::level::info;

        // This is required since the fields above are private.
        // This allows the logger to access and modify the configuration.
        friend class logger<chunked_transfer_logging_category>;

    public:

        static auto get_level() -> log::level
        {
            return level;
        }
    };
} // namespace irods::experimental

namespace irods::experimental::io::chunked_transfer
{
    using logger = irods::experimental::log::logger<chunked_transfer_logging_category>;
} // namespace irods::experimental::io::chunked_transfer

// The project enums print by name.
template <>
struct fmt::formatter<irods::experimental::io::chunked_transfer::error_codes> : fmt::formatter<std::string_view>
{
    auto format(irods::experimental::io::chunked_transfer::error_codes e, format_context& ctx) const
    {
        return fmt::formatter<std::string_view>::format(irods::experimental::io::chunked_transfer::to_string(e), ctx);
    }
};

template <>
struct fmt::formatter<irods::experimental::io::chunked_transfer::storage_tier> : fmt::formatter<std::string_view>
{
    auto format(irods::experimental::io::chunked_transfer::storage_tier e, format_context& ctx) const
    {
        return fmt::formatter<std::string_view>::format(irods::experimental::io::chunked_transfer::to_string(e), ctx);
    }
};

template <>
struct fmt::formatter<irods::experimental::io::chunked_transfer::session_state> : fmt::formatter<std::string_view>
{
    auto format(irods::experimental::io::chunked_transfer::session_state e, format_context& ctx) const
    {
        return fmt::formatter<std::string_view>::format(irods::experimental::io::chunked_transfer::to_string(e), ctx);
    }
};

template <>
struct fmt::formatter<irods::experimental::io::chunked_transfer::copy_state> : fmt::formatter<std::string_view>
{
    auto format(irods::experimental::io::chunked_transfer::copy_state e, format_context& ctx) const
    {
        return fmt::formatter<std::string_view>::format(irods::experimental::io::chunked_transfer::to_string(e), ctx);
    }
};

#endif // IRODS_CHUNKED_TRANSFER_LOGGING_CATEGORY_HPP
