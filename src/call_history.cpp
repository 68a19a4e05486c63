#include "deepseek/call_history.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace deepseek {

std::string format_timestamp(std::chrono::system_clock::time_point timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        timestamp.time_since_epoch()) % 1000000;
    if (micros.count() < 0) {
        micros += std::chrono::seconds(1);
        --time_t;
    }

    std::tm tm = {};
    gmtime_r(&time_t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setfill('0') << std::setw(6) << micros.count() << 'Z';
    return ss.str();
}

boost::json::object to_json(const CallRecord& record) {
    boost::json::object object;
    object["timestamp"] = format_timestamp(record.timestamp);
    object["model"] = record.model;
    object["messages"] = messages_to_json(record.messages);
    object["duration"] = record.duration.count();
    object["status"] = record.status;
    object["tokens_used"] = record.tokens_used;
    return object;
}

void CallHistory::append(CallRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(std::move(record));
}

std::vector<CallRecord> CallHistory::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::size_t CallHistory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

boost::json::array CallHistory::to_json() const {
    boost::json::array array;
    for (const auto& record : snapshot()) {
        array.push_back(deepseek::to_json(record));
    }
    return array;
}

} // namespace deepseek
