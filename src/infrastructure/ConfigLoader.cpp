/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace runrelay::infrastructure {

namespace {

template <typename T>
bool ReadKey(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key) || j[key].is_null()) {
        return true;
    }
    try {
        out = j[key].get<T>();
        return true;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
        return false;
    }
}

// Durations and intervals: zero or negative keeps the current value.
bool ReadPositiveKey(const nlohmann::json& j, const char* key, int& out) {
    int value = out;
    if (!ReadKey(j, key, value)) {
        return false;
    }
    if (value <= 0) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': must be positive, got " << value << std::endl;
        return false;
    }
    out = value;
    return true;
}

bool ReadReconnect(const nlohmann::json& j, domain::ReconnectSettings& out) {
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] Ignoring 'reconnect': expected an object" << std::endl;
        return false;
    }
    bool ok = true;
    ok &= ReadKey(j, "enabled", out.enabled);
    ok &= ReadKey(j, "maxAttempts", out.maxAttempts);
    ok &= ReadKey(j, "initialDelayMs", out.initialDelayMs);
    ok &= ReadKey(j, "maxDelayMs", out.maxDelayMs);
    return ok;
}

bool ReadUpload(const nlohmann::json& j, domain::UploadSettings& out) {
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] Ignoring 'upload': expected an object" << std::endl;
        return false;
    }
    bool ok = true;
    ok &= ReadKey(j, "enabled", out.enabled);
    ok &= ReadKey(j, "parallel", out.parallel);
    ok &= ReadKey(j, "chunkSizeMb", out.chunkSizeMb);
    ok &= ReadKey(j, "retries", out.retries);
    return ok;
}

} // namespace

domain::ReporterConfig ConfigLoader::Load(const std::optional<std::string>& configPath) {
    domain::ReporterConfig config;

    if (configPath) {
        std::filesystem::path path(*configPath);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            std::cerr << "[ConfigLoader] " << *configPath << " not found, using defaults" << std::endl;
        } else {
            try {
                std::ifstream f(path);
                nlohmann::json j;
                f >> j;
                if (!j.is_object()) {
                    std::cerr << "[ConfigLoader] " << *configPath << " is not a JSON object, using defaults" << std::endl;
                } else {
                    ApplyJson(j, config);
                }
            } catch (const std::exception& e) {
                std::cerr << "[ConfigLoader] Error reading " << *configPath << ": " << e.what() << std::endl;
                config = domain::ReporterConfig{};
            }
        }
    }

    ApplyEnvironment(config, &ConfigLoader::SystemEnv);
    return config;
}

bool ConfigLoader::ApplyJson(const nlohmann::json& j, domain::ReporterConfig& config) {
    bool ok = true;
    ok &= ReadKey(j, "apiKey", config.apiKey);
    ok &= ReadKey(j, "endpoint", config.endpoint);
    ok &= ReadKey(j, "debug", config.debug);
    ok &= ReadKey(j, "artifactsDir", config.artifactsDir);
    ok &= ReadKey(j, "bufferCapacity", config.bufferCapacity);
    ok &= ReadPositiveKey(j, "heartbeatIntervalMs", config.heartbeatIntervalMs);
    ok &= ReadPositiveKey(j, "healthTimeoutMs", config.healthTimeoutMs);
    ok &= ReadPositiveKey(j, "handshakeTimeoutMs", config.handshakeTimeoutMs);
    ok &= ReadPositiveKey(j, "closeTimeoutMs", config.closeTimeoutMs);

    if (j.contains("secure") && !j["secure"].is_null()) {
        bool secure = false;
        if (ReadKey(j, "secure", secure)) {
            config.secure = secure;
        } else {
            ok = false;
        }
    }
    if (j.contains("uploadEndpoint") && !j["uploadEndpoint"].is_null()) {
        std::string uploadEndpoint;
        if (ReadKey(j, "uploadEndpoint", uploadEndpoint)) {
            config.uploadEndpoint = uploadEndpoint;
        } else {
            ok = false;
        }
    }

    if (j.contains("reconnect")) {
        ok &= ReadReconnect(j["reconnect"], config.reconnect);
    }
    if (j.contains("upload")) {
        ok &= ReadUpload(j["upload"], config.upload);
    }
    return ok;
}

void ConfigLoader::ApplyEnvironment(domain::ReporterConfig& config, const EnvLookup& lookup) {
    if (auto apiKey = lookup("RUNRELAY_API_KEY")) {
        config.apiKey = *apiKey;
    }
    if (auto endpoint = lookup("RUNRELAY_ENDPOINT"); endpoint && !endpoint->empty()) {
        config.endpoint = *endpoint;
    }
    if (auto secure = lookup("RUNRELAY_SECURE")) {
        if (auto parsed = ParseBool(*secure)) {
            config.secure = *parsed;
        } else {
            std::cerr << "[ConfigLoader] Ignoring RUNRELAY_SECURE=" << *secure << std::endl;
        }
    }
    if (auto debug = lookup("RUNRELAY_DEBUG")) {
        if (auto parsed = ParseBool(*debug)) {
            config.debug = *parsed;
        } else {
            std::cerr << "[ConfigLoader] Ignoring RUNRELAY_DEBUG=" << *debug << std::endl;
        }
    }
}

std::optional<std::string> ConfigLoader::SystemEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<bool> ConfigLoader::ParseBool(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        return false;
    }
    return std::nullopt;
}

} // namespace runrelay::infrastructure
