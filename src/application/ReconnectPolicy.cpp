#include "application/ReconnectPolicy.hpp"
#include <algorithm>
#include <cmath>

namespace runrelay::application {

ReconnectPolicy::ReconnectPolicy(domain::ReconnectSettings settings)
    : ReconnectPolicy(settings, std::random_device{}()) {}

ReconnectPolicy::ReconnectPolicy(domain::ReconnectSettings settings, std::uint32_t seed)
    : m_settings(settings), m_rng(seed) {
    m_settings.initialDelayMs = std::max(m_settings.initialDelayMs, 0);
    m_settings.maxDelayMs = std::max(m_settings.maxDelayMs, m_settings.initialDelayMs);
    m_settings.maxAttempts = std::max(m_settings.maxAttempts, 0);
}

bool ReconnectPolicy::allowsAttempt(int attempt) const {
    return m_settings.enabled && attempt < m_settings.maxAttempts;
}

double ReconnectPolicy::cappedDelayMs(int attempt) const {
    // pow() in double keeps large attempt numbers from overflowing before the cap.
    double exponential = static_cast<double>(m_settings.initialDelayMs) * std::pow(2.0, std::max(attempt, 0));
    return std::min(exponential, static_cast<double>(m_settings.maxDelayMs));
}

std::chrono::milliseconds ReconnectPolicy::cappedDelay(int attempt) const {
    return std::chrono::milliseconds(static_cast<long long>(cappedDelayMs(attempt)));
}

std::chrono::milliseconds ReconnectPolicy::nextDelay(int attempt) {
    double capped = cappedDelayMs(attempt);
    std::uniform_real_distribution<double> jitter(0.0, capped * 0.25);
    return std::chrono::milliseconds(static_cast<long long>(capped + jitter(m_rng)));
}

} // namespace runrelay::application
