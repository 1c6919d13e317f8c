#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include "application/ChunkedTransferClient.hpp"
#include "Fakes.hpp"

namespace fs = std::filesystem;
using namespace runrelay;
using std::chrono::milliseconds;

namespace {

const fs::path kWorkDir = fs::temp_directory_path() / "runrelay_transfer_test";

domain::FileManifestEntry MakeFile(const std::string& name, std::size_t bytes) {
    fs::create_directories(kWorkDir);
    fs::path path = kWorkDir / name;
    std::ofstream out(path, std::ios::binary);
    for (std::size_t i = 0; i < bytes; ++i) {
        out.put(static_cast<char>('a' + i % 26));
    }
    out.close();

    domain::FileManifestEntry entry;
    entry.path = path.string();
    entry.sizeBytes = bytes;
    entry.filename = name;
    entry.relativePath = "results/" + name;
    return entry;
}

application::TransferSettings SmallChunks() {
    application::TransferSettings settings;
    settings.endpoint = "http://localhost:5555/upload";
    settings.apiKey = "key";
    settings.chunkSizeBytes = 10;
    settings.retries = 3;
    settings.retryBaseDelay = milliseconds(1);
    settings.retryMaxDelay = milliseconds(4);
    return settings;
}

void TestExactThresholdIsWholeFile() {
    std::cout << "[Test] A file of exactly the chunk size goes out whole..." << std::endl;
    auto http = std::make_shared<test::FakeHttpTransport>();
    application::ChunkedTransferClient client(http, SmallChunks());
    auto entry = MakeFile("exact.bin", 10);
    entry.testId = "t-1";

    auto outcome = client.transfer(entry, "run_1");
    assert(outcome.success);
    assert(outcome.attempts == 1);
    assert(!outcome.error);

    auto posts = http->posts();
    assert(posts.size() == 1);
    assert(posts[0].url == "http://localhost:5555/upload");
    assert(posts[0].bearerToken == "key");
    assert(posts[0].field("file")->content == "abcdefghij");
    assert(posts[0].field("file")->filename == "exact.bin");
    assert(posts[0].field("runId")->content == "run_1");
    assert(posts[0].field("relativePath")->content == "results/exact.bin");
    assert(posts[0].field("testId")->content == "t-1");
    assert(posts[0].field("uploadId") == nullptr);
    assert(posts[0].field("chunkIndex") == nullptr);
    std::cout << "[PASS] Whole file at threshold" << std::endl;
}

void TestOneByteOverThresholdIsTwoChunks() {
    std::cout << "[Test] One byte over the threshold uploads two chunks..." << std::endl;
    auto http = std::make_shared<test::FakeHttpTransport>();
    application::ChunkedTransferClient client(http, SmallChunks());
    auto entry = MakeFile("over.bin", 11);

    assert(client.chunkCount(10) == 0);
    assert(client.chunkCount(11) == 2);
    assert(client.chunkCount(25) == 3);

    auto outcome = client.transfer(entry, "run_1");
    assert(outcome.success);

    auto posts = http->posts();
    assert(posts.size() == 2);
    for (std::size_t i = 0; i < posts.size(); ++i) {
        assert(posts[i].url == "http://localhost:5555/upload/chunk");
        assert(posts[i].field("chunkIndex")->content == std::to_string(i));
        assert(posts[i].field("totalChunks")->content == "2");
        assert(posts[i].field("relativePath")->content == "results/over.bin");
    }
    assert(posts[0].field("uploadId")->content == posts[1].field("uploadId")->content);
    assert(posts[0].field("uploadId")->content.rfind("run_1_", 0) == 0);
    assert(posts[0].field("file")->content == "abcdefghij");
    assert(posts[1].field("file")->content == "k");
    assert(posts[0].field("testId") == nullptr);
    std::cout << "[PASS] Two chunks" << std::endl;
}

void TestChunksCoverTheFileInOrder() {
    std::cout << "[Test] Chunks are sent in index order and reassemble the file..." << std::endl;
    auto http = std::make_shared<test::FakeHttpTransport>();
    application::ChunkedTransferClient client(http, SmallChunks());
    auto entry = MakeFile("many.bin", 25);

    assert(client.transfer(entry, "run_1").success);
    auto posts = http->posts();
    assert(posts.size() == 3);

    std::string reassembled;
    for (std::size_t i = 0; i < posts.size(); ++i) {
        assert(posts[i].field("chunkIndex")->content == std::to_string(i));
        assert(posts[i].field("totalChunks")->content == "3");
        reassembled += posts[i].field("file")->content;
    }
    assert(reassembled.size() == 25);
    assert(reassembled.substr(20) == "uvwxy");
    std::cout << "[PASS] Chunk order" << std::endl;
}

void TestFailureExhaustsRetries() {
    std::cout << "[Test] Persistent failure makes retries + 1 attempts and reports the error..." << std::endl;
    auto http = std::make_shared<test::FakeHttpTransport>();
    http->respond = [](const test::FakeHttpTransport::Request&, int) {
        domain::HttpResponse response;
        response.status = 500;
        return response;
    };
    auto settings = SmallChunks();
    settings.retries = 2;
    application::ChunkedTransferClient client(http, settings);
    auto entry = MakeFile("fail.bin", 4);

    auto outcome = client.transfer(entry, "run_1");
    assert(!outcome.success);
    assert(outcome.attempts == 3);
    assert(outcome.error && *outcome.error == "HTTP 500");
    assert(http->posts().size() == 3);
    std::cout << "[PASS] Retries exhausted" << std::endl;
}

void TestTransportExceptionIsAFailedAttempt() {
    std::cout << "[Test] An exception from the transport counts as one failed attempt..." << std::endl;
    auto http = std::make_shared<test::FakeHttpTransport>();
    http->respond = [](const test::FakeHttpTransport::Request&, int index) {
        if (index == 0) {
            throw std::runtime_error("socket torn down");
        }
        domain::HttpResponse response;
        response.status = 200;
        return response;
    };
    application::ChunkedTransferClient client(http, SmallChunks());
    auto entry = MakeFile("throws_once.bin", 4);

    auto outcome = client.transfer(entry, "run_1");
    assert(outcome.success);
    assert(outcome.attempts == 2);
    assert(!outcome.error);

    http->respond = [](const test::FakeHttpTransport::Request&, int) -> domain::HttpResponse {
        throw std::runtime_error("socket torn down");
    };
    auto settings = SmallChunks();
    settings.retries = 1;
    application::ChunkedTransferClient failing(http, settings);
    outcome = failing.transfer(entry, "run_1");
    assert(!outcome.success);
    assert(outcome.attempts == 2);
    assert(outcome.error && *outcome.error == "Exception: socket torn down");
    std::cout << "[PASS] Transport exception" << std::endl;
}

void TestSuccessOnLastAttempt() {
    std::cout << "[Test] Success on the final attempt counts as success..." << std::endl;
    auto http = std::make_shared<test::FakeHttpTransport>();
    http->respond = [](const test::FakeHttpTransport::Request&, int index) {
        domain::HttpResponse response;
        response.status = index < 3 ? 0 : 201;
        if (response.status == 0) {
            response.error = "Connection failed: 2";
        }
        return response;
    };
    application::ChunkedTransferClient client(http, SmallChunks());
    auto outcome = client.transfer(MakeFile("late.bin", 4), "run_1");
    assert(outcome.success);
    assert(outcome.attempts == 4);
    assert(!outcome.error);
    std::cout << "[PASS] Success on last attempt" << std::endl;
}

void TestFailedChunkRestartsSequence() {
    std::cout << "[Test] A failed chunk restarts the sequence under a new upload id..." << std::endl;
    auto http = std::make_shared<test::FakeHttpTransport>();
    // Second request (chunk 1 of the first attempt) fails.
    http->respond = [](const test::FakeHttpTransport::Request&, int index) {
        domain::HttpResponse response;
        response.status = index == 1 ? 503 : 200;
        return response;
    };
    application::ChunkedTransferClient client(http, SmallChunks());
    auto outcome = client.transfer(MakeFile("restart.bin", 15), "run_1");
    assert(outcome.success);
    assert(outcome.attempts == 2);

    auto posts = http->posts();
    assert(posts.size() == 4);
    assert(posts[2].field("chunkIndex")->content == "0");
    assert(posts[3].field("chunkIndex")->content == "1");
    std::set<std::string> ids{posts[0].field("uploadId")->content, posts[2].field("uploadId")->content};
    assert(ids.size() == 2);
    std::cout << "[PASS] Chunk restart" << std::endl;
}

void TestMissingFileIsReportedNotThrown() {
    std::cout << "[Test] An unreadable file becomes a failed outcome..." << std::endl;
    auto http = std::make_shared<test::FakeHttpTransport>();
    auto settings = SmallChunks();
    settings.retries = 0;
    application::ChunkedTransferClient client(http, settings);

    domain::FileManifestEntry entry;
    entry.path = (kWorkDir / "does-not-exist.bin").string();
    entry.sizeBytes = 3;
    entry.filename = "does-not-exist.bin";
    entry.relativePath = "does-not-exist.bin";

    auto outcome = client.transfer(entry, "run_1");
    assert(!outcome.success);
    assert(outcome.attempts == 1);
    assert(outcome.error);
    assert(http->posts().empty());
    std::cout << "[PASS] Missing file" << std::endl;
}

void TestBackoffSchedule() {
    std::cout << "[Test] Retry delays double from 1s and cap at 10s..." << std::endl;
    auto http = std::make_shared<test::FakeHttpTransport>();
    application::ChunkedTransferClient client(http, application::TransferSettings{});
    assert(client.settings().chunkSizeBytes == 5ull * 1024 * 1024);
    assert(client.retryDelay(0) == milliseconds(1000));
    assert(client.retryDelay(1) == milliseconds(2000));
    assert(client.retryDelay(2) == milliseconds(4000));
    assert(client.retryDelay(3) == milliseconds(8000));
    assert(client.retryDelay(4) == milliseconds(10000));
    std::cout << "[PASS] Backoff" << std::endl;
}

} // namespace

int main() {
    TestExactThresholdIsWholeFile();
    TestOneByteOverThresholdIsTwoChunks();
    TestChunksCoverTheFileInOrder();
    TestFailureExhaustsRetries();
    TestTransportExceptionIsAFailedAttempt();
    TestSuccessOnLastAttempt();
    TestFailedChunkRestartsSequence();
    TestMissingFileIsReportedNotThrown();
    TestBackoffSchedule();
    fs::remove_all(kWorkDir);
    std::cout << "[Test] ChunkedTransferClient tests passed." << std::endl;
    return 0;
}
