#pragma once

#include "deepseek/types.hpp"
#include <boost/json.hpp>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace deepseek {

// Append-only audit trail of completed calls, kept for the lifetime of the
// owning client. Safe for concurrent append; records keep append order.
class CallHistory {
public:
    CallHistory() = default;
    CallHistory(const CallHistory&) = delete;
    CallHistory& operator=(const CallHistory&) = delete;

    void append(CallRecord record);

    // Copy of every record so far, oldest first.
    std::vector<CallRecord> snapshot() const;

    std::size_t size() const;
    bool empty() const { return size() == 0; }

    boost::json::array to_json() const;

private:
    mutable std::mutex mutex_;
    std::vector<CallRecord> records_;
};

// ISO-8601 UTC with microseconds, e.g. "2024-05-01T12:00:00.123456Z".
std::string format_timestamp(std::chrono::system_clock::time_point timestamp);

boost::json::object to_json(const CallRecord& record);

} // namespace deepseek
