#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include "infrastructure/ConfigLoader.hpp"

namespace fs = std::filesystem;
using runrelay::domain::ReporterConfig;
using runrelay::infrastructure::ConfigLoader;

namespace {

ConfigLoader::EnvLookup FakeEnv(std::map<std::string, std::string> values) {
    return [values](const std::string& name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

void TestDefaults() {
    std::cout << "[Test] Defaults..." << std::endl;
    ReporterConfig config;
    assert(config.endpoint == "api.runrelay.dev/reporter");
    assert(config.useSecureTransport());
    assert(config.bufferCapacity == 1000);
    assert(config.heartbeatIntervalMs == 30000);
    assert(config.healthTimeoutMs == 3000);
    assert(config.reconnect.enabled && config.reconnect.maxAttempts == 10);
    assert(config.reconnect.initialDelayMs == 1000 && config.reconnect.maxDelayMs == 30000);
    assert(config.upload.enabled && config.upload.parallel == 3);
    assert(config.upload.chunkSizeMb == 5 && config.upload.retries == 3);

    config.endpoint = "localhost:5555";
    assert(!config.useSecureTransport());
    config.endpoint = "127.0.0.1:8080/reporter";
    assert(!config.useSecureTransport());
    config.secure = true;
    assert(config.useSecureTransport());
    std::cout << "[PASS] Defaults" << std::endl;
}

void TestApplyJson() {
    std::cout << "[Test] JSON keys map onto the config, nested sections included..." << std::endl;
    auto j = nlohmann::json::parse(R"({
        "apiKey": "file-key",
        "endpoint": "localhost:5555",
        "secure": false,
        "artifactsDir": "out",
        "uploadEndpoint": "http://localhost:6000/upload",
        "heartbeatIntervalMs": 1000,
        "reconnect": { "maxAttempts": 2, "initialDelayMs": 50 },
        "upload": { "enabled": false, "parallel": 6 },
        "unknownKey": 1
    })");

    ReporterConfig config;
    assert(ConfigLoader::ApplyJson(j, config));
    assert(config.apiKey == "file-key");
    assert(config.endpoint == "localhost:5555");
    assert(config.secure && !*config.secure);
    assert(config.artifactsDir == "out");
    assert(config.uploadEndpoint && *config.uploadEndpoint == "http://localhost:6000/upload");
    assert(config.heartbeatIntervalMs == 1000);
    assert(config.reconnect.maxAttempts == 2);
    assert(config.reconnect.initialDelayMs == 50);
    assert(config.reconnect.maxDelayMs == 30000);
    assert(!config.upload.enabled);
    assert(config.upload.parallel == 6);
    assert(config.upload.retries == 3);
    std::cout << "[PASS] Apply JSON" << std::endl;
}

void TestWrongTypesAreSkipped() {
    std::cout << "[Test] Wrongly typed keys are skipped, the rest applied..." << std::endl;
    auto j = nlohmann::json::parse(R"({ "apiKey": 12, "debug": true, "reconnect": "fast" })");
    ReporterConfig config;
    assert(!ConfigLoader::ApplyJson(j, config));
    assert(config.apiKey.empty());
    assert(config.debug);
    assert(config.reconnect.maxAttempts == 10);
    std::cout << "[PASS] Wrong types" << std::endl;
}

void TestNonPositiveTimingsKeepDefaults() {
    std::cout << "[Test] Zero or negative timings are rejected and defaults kept..." << std::endl;
    auto j = nlohmann::json::parse(R"({
        "heartbeatIntervalMs": 0,
        "healthTimeoutMs": -5,
        "handshakeTimeoutMs": 0,
        "closeTimeoutMs": -1,
        "artifactsDir": "still-applied"
    })");

    ReporterConfig config;
    assert(!ConfigLoader::ApplyJson(j, config));
    assert(config.heartbeatIntervalMs == 30000);
    assert(config.healthTimeoutMs == 3000);
    assert(config.handshakeTimeoutMs == 3000);
    assert(config.closeTimeoutMs == 3000);
    assert(config.artifactsDir == "still-applied");

    auto valid = nlohmann::json::parse(R"({ "heartbeatIntervalMs": 250, "closeTimeoutMs": 1 })");
    assert(ConfigLoader::ApplyJson(valid, config));
    assert(config.heartbeatIntervalMs == 250);
    assert(config.closeTimeoutMs == 1);
    std::cout << "[PASS] Non-positive timings" << std::endl;
}

void TestEnvironmentWins() {
    std::cout << "[Test] Environment overrides file values..." << std::endl;
    ReporterConfig config;
    config.apiKey = "file-key";
    config.endpoint = "file-host/reporter";

    ConfigLoader::ApplyEnvironment(config, FakeEnv({
        {"RUNRELAY_API_KEY", "env-key"},
        {"RUNRELAY_ENDPOINT", "localhost:5555"},
        {"RUNRELAY_SECURE", "TRUE"},
        {"RUNRELAY_DEBUG", "1"},
    }));
    assert(config.apiKey == "env-key");
    assert(config.endpoint == "localhost:5555");
    assert(config.secure && *config.secure);
    assert(config.debug);

    ConfigLoader::ApplyEnvironment(config, FakeEnv({{"RUNRELAY_SECURE", "maybe"}, {"RUNRELAY_ENDPOINT", ""}}));
    assert(config.secure && *config.secure);
    assert(config.endpoint == "localhost:5555");
    std::cout << "[PASS] Environment" << std::endl;
}

void TestLoadFile() {
    std::cout << "[Test] Load reads a file and falls back on malformed JSON..." << std::endl;
    fs::path dir = fs::temp_directory_path() / "runrelay_config_test";
    fs::create_directories(dir);

    fs::path good = dir / "runrelay.json";
    std::ofstream(good) << R"({ "artifactsDir": "custom-results", "upload": { "retries": 5 } })";
    ReporterConfig config = ConfigLoader::Load(good.string());
    assert(config.artifactsDir == "custom-results");
    assert(config.upload.retries == 5);

    fs::path bad = dir / "broken.json";
    std::ofstream(bad) << R"({ "artifactsDir": )";
    config = ConfigLoader::Load(bad.string());
    assert(config.artifactsDir == "test-results");

    config = ConfigLoader::Load((dir / "absent.json").string());
    assert(config.artifactsDir == "test-results");

    fs::remove_all(dir);
    std::cout << "[PASS] Load" << std::endl;
}

void TestParseBool() {
    std::cout << "[Test] Boolean parsing..." << std::endl;
    assert(ConfigLoader::ParseBool("yes") == true);
    assert(ConfigLoader::ParseBool("Off") == false);
    assert(ConfigLoader::ParseBool("0") == false);
    assert(!ConfigLoader::ParseBool("2"));
    std::cout << "[PASS] ParseBool" << std::endl;
}

} // namespace

int main() {
    TestDefaults();
    TestApplyJson();
    TestWrongTypesAreSkipped();
    TestNonPositiveTimingsKeepDefaults();
    TestEnvironmentWins();
    TestLoadFile();
    TestParseBool();
    std::cout << "[Test] ConfigLoader tests passed." << std::endl;
    return 0;
}
