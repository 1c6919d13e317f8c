/**
 * @file ReconnectPolicy.hpp
 * @brief Exponential backoff with jitter for streaming reconnects.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <random>
#include "domain/ReporterConfig.hpp"

namespace runrelay::application {

/**
 * @class ReconnectPolicy
 * @brief delay(n) = min(initial * 2^n, max) + U[0, 0.25 * min(initial * 2^n, max)).
 *
 * Holds no attempt counter; the connection manager owns that.
 */
class ReconnectPolicy {
public:
    explicit ReconnectPolicy(domain::ReconnectSettings settings);
    ReconnectPolicy(domain::ReconnectSettings settings, std::uint32_t seed);

    bool enabled() const { return m_settings.enabled; }
    int maxAttempts() const { return m_settings.maxAttempts; }

    /** @brief True if attempt number @p attempt (0-based) may still be scheduled. */
    bool allowsAttempt(int attempt) const;

    /** @brief Backoff before jitter, capped at maxDelay. */
    std::chrono::milliseconds cappedDelay(int attempt) const;

    /** @brief Backoff for the given attempt with jitter applied. */
    std::chrono::milliseconds nextDelay(int attempt);

private:
    double cappedDelayMs(int attempt) const;

    domain::ReconnectSettings m_settings;
    std::mt19937 m_rng;
};

} // namespace runrelay::application
