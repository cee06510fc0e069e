// =================================================================
// tests/StructureRendererTest.cpp
// =================================================================
// Unit tests for the directory-tree listing.

#include "DirDump/StructureRenderer.hpp"
#include "DirDump/ExclusionRules.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class StructureRendererTest {
private:
    fs::path test_dir;
    fs::path target;

    void setupTestTree() {
        cleanupTestTree();
        target = test_dir / "proj";
        fs::create_directories(target / "a" / "b");
        fs::create_directories(target / "vendor");
        fs::create_directories(target / "build");

        std::ofstream(target / "a" / "x.txt") << "x";
        std::ofstream(target / "a" / "b" / "y.txt") << "y";
        std::ofstream(target / "vendor" / "lib.php") << "<?php";
        std::ofstream(target / "build" / "o.js") << "o";
        std::ofstream(target / "z.txt") << "z";
    }

    void cleanupTestTree() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

public:
    StructureRendererTest() : test_dir(fs::temp_directory_path() / "dirdump_structure_renderer_test") {}

    void testBasicRendering() {
        std::cout << "Testing basic tree rendering..." << std::endl;

        setupTestTree();

        DirDump::ExclusionRuleSet exclusions;
        DirDump::StructureRenderer renderer(exclusions);
        auto lines = renderer.render(target);

        std::vector<std::string> expected = {
            "proj/",
            "a/",
            "  b/",
            "    y.txt",
            "  x.txt",
            "z.txt"
        };
        assert(lines == expected);

        cleanupTestTree();
        std::cout << "✓ Basic rendering test passed" << std::endl;
    }

    void testIncludeExcluded() {
        std::cout << "Testing collapsed excluded directories..." << std::endl;

        setupTestTree();

        DirDump::ExclusionRuleSet exclusions;
        DirDump::StructureRenderer renderer(exclusions, 0, true);
        auto lines = renderer.render(target);

        std::vector<std::string> expected = {
            "proj/",
            "a/",
            "  b/",
            "    y.txt",
            "  x.txt",
            "build/",
            "vendor/",
            "z.txt"
        };
        assert(lines == expected);

        bool truncated = true;
        auto entries = renderer.collectEntries(target, truncated);
        assert(!truncated);
        // Collapsed directories are listed but never expanded
        for (const auto& entry : entries) {
            assert(entry.relative_path.rfind("build/", 0) != 0);
            assert(entry.relative_path.rfind("vendor/", 0) != 0);
        }
        assert(entries.size() == 7);

        cleanupTestTree();
        std::cout << "✓ Include excluded test passed" << std::endl;
    }

    void testExcludedFilesOmitted() {
        std::cout << "Testing excluded files..." << std::endl;

        setupTestTree();

        DirDump::ExclusionRuleSet exclusions({"a/x.txt"});
        DirDump::StructureRenderer renderer(exclusions, 0, true);
        auto lines = renderer.render(target);

        for (const auto& line : lines) {
            assert(line.find("x.txt") == std::string::npos);
            assert(line.find("lib.php") == std::string::npos);
        }

        cleanupTestTree();
        std::cout << "✓ Excluded files test passed" << std::endl;
    }

    void testTruncation() {
        std::cout << "Testing entry cap..." << std::endl;

        cleanupTestTree();
        target = test_dir / "many";
        fs::create_directories(target);
        for (int i = 0; i < 20; ++i) {
            std::ostringstream name;
            name << "f" << std::setw(2) << std::setfill('0') << i << ".txt";
            std::ofstream(target / name.str()) << i;
        }

        DirDump::ExclusionRuleSet exclusions;
        DirDump::StructureRenderer capped(exclusions, 5);
        auto lines = capped.render(target);

        assert(lines.size() == 1 + 5 + 1);
        assert(lines.front() == "many/");
        assert(lines[1] == "f00.txt");
        assert(lines.back() == DirDump::StructureRenderer::kTruncationMarker);

        // Reaching the cap truncates even when nothing is left to list
        DirDump::StructureRenderer exact(exclusions, 20);
        auto exact_lines = exact.render(target);
        assert(exact_lines.size() == 1 + 20 + 1);
        assert(exact_lines[20] == "f19.txt");
        assert(exact_lines.back() == DirDump::StructureRenderer::kTruncationMarker);

        DirDump::StructureRenderer roomy(exclusions, 21);
        auto roomy_lines = roomy.render(target);
        assert(roomy_lines.size() == 1 + 20);
        assert(roomy_lines.back() == "f19.txt");

        DirDump::StructureRenderer unlimited(exclusions, 0);
        assert(unlimited.render(target).size() == 1 + 20);

        cleanupTestTree();
        std::cout << "✓ Entry cap test passed" << std::endl;
    }

    void testCapEqualsEntryCount() {
        std::cout << "Testing cap equal to the entry count..." << std::endl;

        cleanupTestTree();
        target = test_dir / "five";
        fs::create_directories(target);
        for (int i = 0; i < 5; ++i) {
            std::ofstream(target / ("f" + std::to_string(i) + ".txt")) << i;
        }

        DirDump::ExclusionRuleSet exclusions;
        DirDump::StructureRenderer capped(exclusions, 5);

        bool truncated = false;
        auto entries = capped.collectEntries(target, truncated);
        assert(truncated);
        assert(entries.size() == 5);

        auto lines = capped.render(target);
        assert(lines.size() == 7);
        assert(lines[5] == "f4.txt");
        assert(lines.back() == DirDump::StructureRenderer::kTruncationMarker);

        cleanupTestTree();
        std::cout << "✓ Cap equal to entry count test passed" << std::endl;
    }

    void testEntryHelpers() {
        std::cout << "Testing entry helpers..." << std::endl;

        DirDump::StructureEntry dir("a/b", true);
        DirDump::StructureEntry file("a/b.txt", false);

        assert(dir.sortKey() == "a/b/");
        assert(file.sortKey() == "a/b.txt");
        assert(dir.depth() == 2);
        assert(dir.name() == "b");
        assert(DirDump::StructureEntry("top.txt", false).name() == "top.txt");
        // Directory contents sort right after the directory itself
        assert(dir.sortKey() < DirDump::StructureEntry("a/b/c", false).sortKey());

        std::cout << "✓ Entry helpers test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running StructureRenderer unit tests..." << std::endl;

        testBasicRendering();
        testIncludeExcluded();
        testExcludedFilesOmitted();
        testTruncation();
        testCapEqualsEntryCount();
        testEntryHelpers();

        std::cout << "All StructureRenderer tests passed!" << std::endl;
    }
};

int main() {
    try {
        StructureRendererTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
