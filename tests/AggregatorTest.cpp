// =================================================================
// tests/AggregatorTest.cpp
// =================================================================
// Unit tests for the traversal orchestrator.

#include "Codefeed/Aggregator.hpp"
#include "Codefeed/Errors.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

// Replays a fixed list of entries
class ScriptedSource : public Codefeed::EntrySource {
public:
    explicit ScriptedSource(std::vector<Codefeed::Entry> entries) : m_entries(std::move(entries)) {}

    bool next(Codefeed::Entry& entry) override {
        if (m_position >= m_entries.size()) {
            return false;
        }
        entry = m_entries[m_position++];
        return true;
    }

private:
    std::vector<Codefeed::Entry> m_entries;
    size_t m_position = 0;
};

// Fails to classify one named file, defers to the real sampler otherwise
class FailingClassifier : public Codefeed::FileClassifier {
public:
    explicit FailingClassifier(std::string failing_name) : m_failing_name(std::move(failing_name)) {}

    bool isTextFile(const fs::path& path) const override {
        if (path.filename() == m_failing_name) {
            throw Codefeed::FileAccessError("Permission denied");
        }
        return Codefeed::FileClassifier::isTextFile(path);
    }

private:
    std::string m_failing_name;
};

class AggregatorTest {
private:
    fs::path test_dir;

    fs::path writeFile(const std::string& relative, const std::string& bytes) {
        fs::path path = test_dir / relative;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        return path;
    }

    Codefeed::Entry root() const {
        return Codefeed::Entry{test_dir, Codefeed::EntryKind::Root, 0};
    }

    Codefeed::Entry file(const std::string& relative, size_t depth = 1) const {
        return Codefeed::Entry{test_dir / relative, Codefeed::EntryKind::File, depth};
    }

    Codefeed::Entry directory(const std::string& relative, size_t depth = 1) const {
        return Codefeed::Entry{test_dir / relative, Codefeed::EntryKind::Directory, depth};
    }

    static Codefeed::Limits makeLimits(size_t max_files, std::uint64_t max_total, std::uint64_t max_file) {
        Codefeed::Limits limits;
        limits.max_files = max_files;
        limits.max_total_size = max_total;
        limits.max_file_size = max_file;
        return limits;
    }

    Codefeed::RunResult runWith(const Codefeed::Limits& limits, std::vector<Codefeed::Entry> entries) {
        Codefeed::Aggregator aggregator(test_dir, limits);
        ScriptedSource source(std::move(entries));
        return aggregator.run(source);
    }

    std::string rootLine() const {
        return "└── " + test_dir.filename().string();
    }

    void setup() {
        cleanup();
        fs::create_directories(test_dir);
    }

    void cleanup() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

public:
    AggregatorTest() : test_dir(fs::temp_directory_path() / "codefeed_aggregator_test") {}

    void testSingleTextFile() {
        std::cout << "Testing single text file..." << std::endl;
        setup();

        writeFile("notes.txt", "ten bytes!");
        auto result = runWith(Codefeed::Limits(), {root(), file("notes.txt")});

        assert(result.admitted_files.size() == 1);
        assert(result.admitted_files[0].relative_path == "notes.txt");
        assert(result.admitted_files[0].content == "ten bytes!");
        assert(result.admitted_files[0].size == 10);
        assert(result.skipped.empty());
        assert(result.totals.files_admitted == 1);
        assert(result.totals.bytes_admitted == 10);
        assert(result.tree == rootLine() + "\n└── notes.txt");
        assert(result.entries_seen == 2);

        cleanup();
        std::cout << "✓ Single text file test passed" << std::endl;
    }

    void testBinaryFile() {
        std::cout << "Testing binary file..." << std::endl;
        setup();

        std::string bytes = "abc";
        bytes += '\0';
        writeFile("image.bin", bytes);
        auto result = runWith(Codefeed::Limits(), {root(), file("image.bin")});

        assert(result.admitted_files.empty() && "Binary content is never emitted");
        assert(result.skipped.empty() && "Binary is an outcome, not a skip");
        assert(result.binary_files == 1);
        assert(result.totals.files_admitted == 0 && "Binary files do not count toward limits");
        assert(result.tree == rootLine() + "\n└── image.bin [Non-text file]");

        cleanup();
        std::cout << "✓ Binary file test passed" << std::endl;
    }

    void testFileCountLimit() {
        std::cout << "Testing file count limit..." << std::endl;
        setup();

        writeFile("a.txt", "first");
        writeFile("b.txt", "second");
        auto result = runWith(makeLimits(1, 1000, 1000), {root(), file("a.txt"), file("b.txt")});

        assert(result.admitted_files.size() == 1);
        assert(result.admitted_files[0].relative_path == "a.txt");
        assert(result.skipped.size() == 1);
        assert(result.skipped[0].reason == Codefeed::SkipReason::FileCountLimit);
        assert(result.skipped[0].message ==
               "Skipping file " + (test_dir / "b.txt").string() + ": Maximum file limit (1) reached");
        assert(result.tree == rootLine() + "\n└── a.txt" && "Skipped files get no tree line");

        cleanup();
        std::cout << "✓ File count limit test passed" << std::endl;
    }

    void testPerFileSizeLimit() {
        std::cout << "Testing per-file size limit..." << std::endl;
        setup();

        writeFile("big.txt", std::string(200, 'x'));
        writeFile("small.txt", "ok");
        auto result = runWith(makeLimits(10, 10000, 100), {root(), file("big.txt"), file("small.txt")});

        assert(result.skipped.size() == 1);
        assert(result.skipped[0].reason == Codefeed::SkipReason::FileSizeLimit);
        assert(result.admitted_files.size() == 1);
        assert(result.totals.files_admitted == 1);
        assert(result.totals.bytes_admitted == 2 && "Rejected file leaves totals unchanged");

        cleanup();
        std::cout << "✓ Per-file size limit test passed" << std::endl;
    }

    void testTotalSizeOnFirstFile() {
        std::cout << "Testing total size limit on the first file..." << std::endl;
        setup();

        writeFile("first.txt", std::string(60, 'y'));
        auto result = runWith(makeLimits(10, 50, 1000), {root(), file("first.txt")});

        assert(result.admitted_files.empty());
        assert(result.skipped.size() == 1);
        assert(result.skipped[0].reason == Codefeed::SkipReason::TotalSizeLimit);
        assert(result.skipped[0].message.find("Total size limit (50 bytes) reached") != std::string::npos);
        assert(result.totals.bytes_admitted == 0);

        cleanup();
        std::cout << "✓ Total size limit test passed" << std::endl;
    }

    void testInvalidUtf8NotCommitted() {
        std::cout << "Testing invalid UTF-8..." << std::endl;
        setup();

        writeFile("latin1.txt", "caf\xe9");
        writeFile("ok.txt", "fine");
        auto result = runWith(makeLimits(1, 1000, 1000), {root(), file("latin1.txt"), file("ok.txt")});

        assert(result.skipped.size() == 1);
        assert(result.skipped[0].reason == Codefeed::SkipReason::ReadError);
        assert(result.skipped[0].message.find("Error reading file ") == 0);
        assert(result.admitted_files.size() == 1 && "Failed read does not use up the file budget");
        assert(result.admitted_files[0].relative_path == "ok.txt");
        assert(result.totals.bytes_admitted == 4);

        cleanup();
        std::cout << "✓ Invalid UTF-8 test passed" << std::endl;
    }

    void testMissingFile() {
        std::cout << "Testing vanished file..." << std::endl;
        setup();

        auto result = runWith(Codefeed::Limits(), {root(), file("gone.txt")});

        assert(result.skipped.size() == 1);
        assert(result.skipped[0].reason == Codefeed::SkipReason::ReadError);
        assert(result.skipped[0].message.find("Failed to get metadata for file: ") == 0);
        assert(result.tree == rootLine());

        cleanup();
        std::cout << "✓ Vanished file test passed" << std::endl;
    }

    void testNestedTree() {
        std::cout << "Testing nested tree..." << std::endl;
        setup();

        writeFile("src/main.cpp", "int main() {}\n");
        writeFile("src/util/strings.cpp", "// strings\n");
        writeFile("README.md", "# readme\n");

        auto result = runWith(Codefeed::Limits(), {
            root(),
            file("README.md"),
            directory("src"),
            file("src/main.cpp", 2),
            directory("src/util", 2),
            file("src/util/strings.cpp", 3),
        });

        const std::string expected =
            rootLine() + "\n"
            "└── README.md\n"
            "├── src\n"
            "    └── main.cpp\n"
            "    ├── util\n"
            "        └── strings.cpp";
        assert(result.tree == expected);
        assert(result.directories == 2);
        assert(result.admitted_files.size() == 3);
        assert(result.admitted_files[2].relative_path == fs::path("src/util/strings.cpp").string());

        std::uint64_t sum = 0;
        for (const auto& admitted : result.admitted_files) {
            sum += admitted.size;
        }
        assert(sum == result.totals.bytes_admitted && "Totals equal the sum of admitted sizes");
        assert(result.totals.files_admitted == result.admitted_files.size());

        cleanup();
        std::cout << "✓ Nested tree test passed" << std::endl;
    }

    void testClassificationErrorNotCommitted() {
        std::cout << "Testing classification failure..." << std::endl;
        setup();

        writeFile("locked.txt", "cannot sample");
        writeFile("open.txt", "readable");

        FailingClassifier classifier("locked.txt");
        Codefeed::Aggregator aggregator(test_dir, makeLimits(1, 1000, 1000), classifier);
        ScriptedSource source({root(), file("locked.txt"), file("open.txt")});
        auto result = aggregator.run(source);

        assert(result.skipped.size() == 1);
        assert(result.skipped[0].reason == Codefeed::SkipReason::ClassificationError);
        assert(result.skipped[0].message ==
               "Error checking if file is text: " + (test_dir / "locked.txt").string() + ": Permission denied");
        assert(result.binary_files == 0);
        assert(result.admitted_files.size() == 1 && "Unclassified file does not use up the file budget");
        assert(result.admitted_files[0].relative_path == "open.txt");
        assert(result.totals.files_admitted == 1);
        assert(result.totals.bytes_admitted == 8);
        assert(result.tree == rootLine() + "\n└── open.txt" && "Unclassified file gets no tree line");

        cleanup();
        std::cout << "✓ Classification failure test passed" << std::endl;
    }

    void testPathOutsideRoot() {
        std::cout << "Testing entry outside the root..." << std::endl;
        setup();

        Codefeed::Aggregator aggregator(test_dir, Codefeed::Limits());
        aggregator.visit(root());

        bool threw = false;
        try {
            aggregator.visit(Codefeed::Entry{test_dir.parent_path() / "elsewhere.txt",
                                             Codefeed::EntryKind::File, 1});
        } catch (const Codefeed::TraversalError& e) {
            threw = std::string(e.what()).find("Failed to strip prefix") != std::string::npos;
        }
        assert(threw && "Entries outside the root are fatal");

        cleanup();
        std::cout << "✓ Outside root test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Aggregator unit tests..." << std::endl;

        testSingleTextFile();
        testBinaryFile();
        testFileCountLimit();
        testPerFileSizeLimit();
        testTotalSizeOnFirstFile();
        testInvalidUtf8NotCommitted();
        testMissingFile();
        testClassificationErrorNotCommitted();
        testNestedTree();
        testPathOutsideRoot();

        std::cout << "All Aggregator tests passed!" << std::endl;
    }
};

int main() {
    try {
        AggregatorTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
