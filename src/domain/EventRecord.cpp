/**
 * @file EventRecord.cpp
 * @brief Implementation of EventRecord.
 */

#include "domain/EventRecord.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace runrelay::domain {

namespace {

std::tm ToUtcTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

std::string StringField(const EventRecord::Json& body, const char* key) {
    auto it = body.find(key);
    if (it != body.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return {};
}

} // namespace

EventRecord::EventRecord(Json body)
    : m_body(std::move(body)), m_kind(StringField(m_body, "event")) {}

EventRecord EventRecord::Create(const std::string& kind,
                                const std::string& runId,
                                const std::string& timestamp,
                                const Json& fields) {
    Json body = Json::object();
    body["event"] = kind;
    body["timestamp"] = timestamp;
    body["runId"] = runId;

    if (fields.is_object()) {
        for (auto it = fields.begin(); it != fields.end(); ++it) {
            if (it.key() == "event" || it.key() == "timestamp" || it.key() == "runId") {
                continue;
            }
            body[it.key()] = it.value();
        }
    }
    return EventRecord(std::move(body));
}

std::string EventRecord::NowTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::tm tm = ToUtcTime(std::chrono::system_clock::to_time_t(now));

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

std::string EventRecord::runId() const {
    return StringField(m_body, "runId");
}

std::string EventRecord::timestamp() const {
    return StringField(m_body, "timestamp");
}

std::string EventRecord::serialize() const {
    return m_body.dump(-1, ' ', false, Json::error_handler_t::replace);
}

} // namespace runrelay::domain
