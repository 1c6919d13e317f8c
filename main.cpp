/**
 * @file main.cpp
 * @brief Command-line host: forwards newline-delimited JSON events from stdin to the reporter.
 *
 * Usage: runrelay [--config <file>] [--artifacts <dir>]
 */

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "application/ReporterService.hpp"
#include "infrastructure/ArtifactManifestBuilder.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/HttpClient.hpp"
#include "infrastructure/WebSocketTransport.hpp"

namespace fs = std::filesystem;
using namespace runrelay;

namespace {

constexpr int kUsageError = 2;

struct CommandLine {
    std::optional<std::string> configPath;
    std::optional<std::string> artifactsDir;
};

void PrintUsage() {
    std::cerr << "Usage: runrelay [--config <file>] [--artifacts <dir>]" << std::endl;
}

std::optional<CommandLine> ParseArguments(int argc, char** argv) {
    CommandLine cli;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "--artifacts") && i + 1 < argc) {
            (arg == "--config" ? cli.configPath : cli.artifactsDir) = std::string(argv[++i]);
        } else {
            std::cerr << "[runrelay] Unexpected argument: " << arg << std::endl;
            return std::nullopt;
        }
    }
    if (!cli.configPath && fs::exists("runrelay.json")) {
        cli.configPath = "runrelay.json";
    }
    return cli;
}

void RegisterAttachments(application::ReporterService& reporter, const nlohmann::ordered_json& event) {
    auto it = event.find("attachments");
    if (it == event.end() || !it->is_array()) {
        return;
    }
    for (const auto& attachment : *it) {
        if (!attachment.is_object() || !attachment.contains("path") || !attachment.contains("testId") ||
            !attachment["path"].is_string() || !attachment["testId"].is_string()) {
            continue;
        }
        fs::path path = fs::absolute(attachment["path"].get<std::string>()).lexically_normal();
        reporter.registerAttachment(path.string(), attachment["testId"].get<std::string>());
    }
}

void PrintSummary(const domain::UploadSummary& summary) {
    std::cout << "[runrelay] Uploaded " << summary.successCount << "/" << summary.totalFiles << " files ("
              << infrastructure::ArtifactManifestBuilder::FormatSize(summary.totalBytes) << ")";
    if (summary.failedCount > 0) {
        std::cout << ", " << summary.failedCount << " failed";
    }
    std::cout << std::endl;
    for (const auto& failure : summary.failures) {
        std::cout << "  " << failure.file.relativePath << ": " << failure.error.value_or("unknown error") << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    auto cli = ParseArguments(argc, argv);
    if (!cli) {
        PrintUsage();
        return kUsageError;
    }

    domain::ReporterConfig config = infrastructure::ConfigLoader::Load(cli->configPath);
    if (cli->artifactsDir) {
        config.artifactsDir = *cli->artifactsDir;
    }

    auto streamTransport = std::make_shared<infrastructure::WebSocketTransport>(config.debug);
    auto httpTransport = std::make_shared<infrastructure::HttpClient>(std::chrono::seconds(30), config.debug);
    application::ReporterService reporter(config, streamTransport, httpTransport);

    if (!reporter.begin()) {
        std::cerr << "[runrelay] Server unreachable, events will not be reported" << std::endl;
    }

    auto endFields = nlohmann::ordered_json::object();
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(std::cin, line)) {
        ++lineNumber;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        auto event = nlohmann::ordered_json::parse(line, nullptr, false);
        if (event.is_discarded() || !event.is_object() || !event.contains("event") || !event["event"].is_string()) {
            std::cerr << "[runrelay] Skipping line " << lineNumber << ": expected a JSON object with an \"event\" string" << std::endl;
            continue;
        }

        RegisterAttachments(reporter, event);

        const std::string name = event["event"].get<std::string>();
        if (name == "onEnd") {
            endFields = event;
        } else if (name == "onExit") {
            std::cerr << "[runrelay] Ignoring onExit on line " << lineNumber << ", sent at end of input" << std::endl;
        } else {
            reporter.emit(name, event);
        }
    }

    reporter.end(endFields);
    if (auto summary = reporter.exit()) {
        PrintSummary(*summary);
    }
    return 0;
}
