#include "irods/private/chunked_transfer/multipart_session.hpp"

#include <algorithm>

namespace irods::experimental::io::chunked_transfer
{

    auto multipart_session::completed_parts() const -> std::vector<completed_part>
    {
        std::vector<completed_part> parts;
        parts.reserve(tasks.size());

        for (const auto& task : tasks) {
            if (part_state::SUCCEEDED == task.state) {
                parts.push_back({task.part_number, task.etag});
            }
        }

        std::sort(parts.begin(), parts.end(),
                [](const completed_part& _lhs, const completed_part& _rhs) { return _lhs.part_number < _rhs.part_number; });

        return parts;
    } // end completed_parts

    auto multipart_session::all_parts_succeeded() const -> bool
    {
        return !tasks.empty() && std::all_of(tasks.begin(), tasks.end(),
                [](const chunk_task& _task) { return part_state::SUCCEEDED == _task.state; });
    } // end all_parts_succeeded

} // irods::experimental::io::chunked_transfer
