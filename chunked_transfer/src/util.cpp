#include "irods/private/chunked_transfer/util.hpp"

#include <functional>
#include <random>
#include <thread>

namespace irods::experimental::io::chunked_transfer
{

    auto get_thread_identifier() -> std::uint64_t
    {
        return std::hash<std::thread::id>{}(std::this_thread::get_id());
    } // end get_thread_identifier

    bool sleep_with_jitter(transfer_clock& _clock, std::chrono::milliseconds _wait, const cancellation_token& _token)
    {
        thread_local std::default_random_engine engine{std::random_device{}()};

        const auto half = _wait.count() / 2;
        std::uniform_int_distribution<std::chrono::milliseconds::rep> uniform_dist(half, _wait.count());

        return _clock.sleep_for(std::chrono::milliseconds{uniform_dist(engine)}, _token);
    } // end sleep_with_jitter

} // irods::experimental::io::chunked_transfer
