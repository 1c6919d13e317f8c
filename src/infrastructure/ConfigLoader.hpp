/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the reporter configuration (runrelay.json + environment).
 *
 * Keeps JSON parsing of settings in one place. Environment variables
 * RUNRELAY_API_KEY, RUNRELAY_ENDPOINT, RUNRELAY_SECURE and RUNRELAY_DEBUG
 * win over values from the file.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/ReporterConfig.hpp"

namespace runrelay::infrastructure {

class ConfigLoader {
public:
    /// Returns the value of an environment variable, or nullopt when unset.
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Loads the file at @p configPath (if any) and applies the process environment.
     * @param configPath Path to a JSON file. A missing file is not an error.
     * @return Resolved configuration; defaults where nothing was given.
     */
    static domain::ReporterConfig Load(const std::optional<std::string>& configPath);

    /**
     * @brief Reads known keys from @p j into @p config. Unknown keys are ignored.
     * @return false if a known key had the wrong type (other keys are still applied).
     */
    static bool ApplyJson(const nlohmann::json& j, domain::ReporterConfig& config);

    static void ApplyEnvironment(domain::ReporterConfig& config, const EnvLookup& lookup);

    /// Process environment via std::getenv.
    static std::optional<std::string> SystemEnv(const std::string& name);

    /// Accepts 1/0, true/false, yes/no, on/off (case-insensitive).
    static std::optional<bool> ParseBool(const std::string& value);
};

} // namespace runrelay::infrastructure
