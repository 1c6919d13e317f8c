/**
 * @file EventRecord.hpp
 * @brief Immutable outbound event carried by the streaming connection.
 */

#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace runrelay::domain {

/**
 * @class EventRecord
 * @brief Opaque JSON payload with a kind discriminator and run identity.
 *
 * Field order is preserved exactly as built. The transport never inspects or
 * rewrites the body; it only serializes it.
 */
class EventRecord {
public:
    using Json = nlohmann::ordered_json;

    /**
     * @brief Builds a record whose first fields are event, timestamp and runId.
     * @param kind Event discriminator (e.g. "onTestEnd").
     * @param runId Identifier shared by every record of the run.
     * @param timestamp ISO-8601 emission time.
     * @param fields Extra fields appended after the identity fields. Keys that
     *        collide with the identity fields are ignored.
     */
    static EventRecord Create(const std::string& kind,
                              const std::string& runId,
                              const std::string& timestamp,
                              const Json& fields = Json::object());

    /** @brief Current UTC time as "YYYY-MM-DDTHH:MM:SS.mmmZ". */
    static std::string NowTimestamp();

    const std::string& kind() const { return m_kind; }
    std::string runId() const;
    std::string timestamp() const;
    const Json& body() const { return m_body; }

    /** @brief Compact JSON text. Invalid UTF-8 is replaced, never thrown. */
    std::string serialize() const;

private:
    explicit EventRecord(Json body);

    Json m_body;
    std::string m_kind;
};

} // namespace runrelay::domain
