#ifndef IRODS_CHUNKED_TRANSFER_MULTIPART_SESSION_HPP
#define IRODS_CHUNKED_TRANSFER_MULTIPART_SESSION_HPP

#include "irods/private/chunked_transfer/object_store.hpp"
#include "irods/private/chunked_transfer/types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace irods::experimental::io::chunked_transfer
{

    struct chunk_task
    {
        int          part_number{0};     // 1-based, defines assembly order
        std::int64_t offset{0};
        std::int64_t length{0};

        // buffered bytes for an upload, null for a server side copy part
        std::shared_ptr<std::vector<char>> payload;

        part_state   state{part_state::PENDING};
        std::string  etag;
        std::string  error_message;
    };

    // One remote multipart upload.  Owned by a single transfer.
    struct multipart_session
    {
        explicit multipart_session(const std::string& _key)
            : key{_key}
            , state{session_state::OPEN}
        {
        }

        std::string             key;
        std::string             upload_id;
        session_state           state;
        std::vector<chunk_task> tasks;     // tasks[i] holds part i + 1

        // succeeded parts in ascending part number order
        auto completed_parts() const -> std::vector<completed_part>;

        auto all_parts_succeeded() const -> bool;
    };

} // irods::experimental::io::chunked_transfer

#endif // IRODS_CHUNKED_TRANSFER_MULTIPART_SESSION_HPP
