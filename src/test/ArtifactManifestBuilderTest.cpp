#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include "infrastructure/ArtifactManifestBuilder.hpp"

namespace fs = std::filesystem;
using runrelay::infrastructure::ArtifactManifestBuilder;

namespace {

void WriteFile(const fs::path& path, std::size_t bytes) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << std::string(bytes, 'x');
}

fs::path MakeTree() {
    fs::path root = fs::temp_directory_path() / "runrelay_manifest_test";
    fs::remove_all(root);
    WriteFile(root / "a.txt", 10);
    WriteFile(root / "sub" / "b.bin", 2048);
    WriteFile(root / "sub" / "nested" / "c.txt", 0);
    WriteFile(root / "z.log", 5);
    fs::create_directories(root / "empty");
    return root;
}

void TestRecursiveScan() {
    std::cout << "[Test] Scan lists every regular file with relative paths..." << std::endl;
    fs::path root = MakeTree();
    ArtifactManifestBuilder builder;
    auto entries = builder.scan(root.string());

    assert(entries.size() == 4);
    assert(entries[0].relativePath == "a.txt");
    assert(entries[1].relativePath == "sub/b.bin");
    assert(entries[2].relativePath == "sub/nested/c.txt");
    assert(entries[3].relativePath == "z.log");

    assert(entries[1].filename == "b.bin");
    assert(entries[1].sizeBytes == 2048);
    assert(entries[2].sizeBytes == 0);
    assert(fs::path(entries[0].path).is_absolute());
    assert(fs::equivalent(entries[0].path, root / "a.txt"));
    for (const auto& entry : entries) {
        assert(!entry.testId);
    }
    assert(ArtifactManifestBuilder::TotalSize(entries) == 2063);

    fs::remove_all(root);
    std::cout << "[PASS] Recursive scan" << std::endl;
}

void TestLinksAreNotFollowed() {
    std::cout << "[Test] Symbolic links to files and directories are skipped..." << std::endl;
    fs::path root = MakeTree();
    fs::create_symlink(root / "a.txt", root / "link.txt");
    fs::create_directory_symlink(root / "sub", root / "sublink");

    ArtifactManifestBuilder builder;
    auto entries = builder.scan(root.string());

    assert(entries.size() == 4);
    for (const auto& entry : entries) {
        assert(entry.relativePath != "link.txt");
        assert(entry.relativePath.rfind("sublink", 0) != 0);
    }

    fs::remove_all(root);
    std::cout << "[PASS] Links skipped" << std::endl;
}

void TestMissingRootIsEmpty() {
    std::cout << "[Test] A missing root yields an empty manifest..." << std::endl;
    ArtifactManifestBuilder builder;
    auto entries = builder.scan((fs::temp_directory_path() / "runrelay_no_such_dir_1234").string());
    assert(entries.empty());
    std::cout << "[PASS] Missing root" << std::endl;
}

void TestEnrichWithTestIds() {
    std::cout << "[Test] Attachments are linked to their tests by absolute path..." << std::endl;
    fs::path root = MakeTree();
    ArtifactManifestBuilder builder;
    auto entries = builder.scan(root.string());

    std::map<std::string, std::string> links;
    links[(fs::absolute(root) / "sub" / "b.bin").lexically_normal().string()] = "test-42";
    links["/somewhere/else.png"] = "test-7";

    std::size_t enriched = ArtifactManifestBuilder::EnrichWithTestIds(entries, links);
    assert(enriched == 1);
    assert(entries[1].testId && *entries[1].testId == "test-42");
    assert(!entries[0].testId);

    fs::remove_all(root);
    std::cout << "[PASS] Enrichment" << std::endl;
}

void TestFormatSize() {
    std::cout << "[Test] Human-readable sizes..." << std::endl;
    assert(ArtifactManifestBuilder::FormatSize(0) == "0.0 B");
    assert(ArtifactManifestBuilder::FormatSize(512) == "512.0 B");
    assert(ArtifactManifestBuilder::FormatSize(1536) == "1.5 KB");
    assert(ArtifactManifestBuilder::FormatSize(5ull * 1024 * 1024) == "5.0 MB");
    assert(ArtifactManifestBuilder::FormatSize(3ull * 1024 * 1024 * 1024) == "3.0 GB");
    std::cout << "[PASS] Format size" << std::endl;
}

} // namespace

int main() {
    TestRecursiveScan();
    TestLinksAreNotFollowed();
    TestMissingRootIsEmpty();
    TestEnrichWithTestIds();
    TestFormatSize();
    std::cout << "[Test] ArtifactManifestBuilder tests passed." << std::endl;
    return 0;
}
