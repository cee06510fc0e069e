// =================================================================
// tests/ExclusionRulesTest.cpp
// =================================================================
// Unit tests for directory-name and path-prefix exclusion rules.

#include "DirDump/ExclusionRules.hpp"
#include <iostream>
#include <filesystem>
#include <cassert>
#include <string>
#include <vector>
#include <algorithm>

namespace fs = std::filesystem;

class ExclusionRulesTest {
private:
    fs::path test_dir;

    void setupTestTree() {
        fs::create_directories(test_dir / "app" / "Http" / "cache");
        fs::create_directories(test_dir / "app" / "tmp");
        fs::create_directories(test_dir / "docs");
    }

    void cleanupTestTree() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

public:
    ExclusionRulesTest() : test_dir(fs::temp_directory_path() / "dirdump_exclusion_rules_test") {}

    void testTokenParsing() {
        std::cout << "Testing rule token parsing..." << std::endl;

        DirDump::ExclusionRule rule = DirDump::ExclusionRule::name("");

        assert(DirDump::ExclusionRule::parse("vendor", rule));
        assert(rule.getKind() == DirDump::ExclusionRule::Kind::Name);
        assert(rule.getName() == "vendor");

        assert(DirDump::ExclusionRule::parse("bootstrap/cache", rule));
        assert(rule.getKind() == DirDump::ExclusionRule::Kind::Prefix);
        assert(rule.getSegments().size() == 2);
        assert(rule.toString() == "bootstrap/cache");

        // Backslashes count as separators
        assert(DirDump::ExclusionRule::parse("public\\build", rule));
        assert(rule.getKind() == DirDump::ExclusionRule::Kind::Prefix);
        assert(rule.toString() == "public/build");

        // A trailing slash turns a bare name into a one-segment prefix
        assert(DirDump::ExclusionRule::parse("tmp/", rule));
        assert(rule.getKind() == DirDump::ExclusionRule::Kind::Prefix);
        assert(rule.toString() == "tmp");

        assert(!DirDump::ExclusionRule::parse("   ", rule));
        assert(!DirDump::ExclusionRule::parse("/", rule));
        assert(!DirDump::ExclusionRule::parse(".", rule));

        std::cout << "✓ Token parsing test passed" << std::endl;
    }

    void testDefaultNames() {
        std::cout << "Testing default directory names..." << std::endl;

        DirDump::ExclusionRuleSet rules;

        assert(rules.isExcluded("vendor/autoload.php"));
        assert(rules.isExcluded("src/node_modules/pkg/index.js"));
        assert(rules.isExcluded(".git/config"));
        assert(rules.isExcluded("deep/path/__pycache__/mod.pyc"));

        // Name rules never match the final file name
        assert(!rules.isExcluded("vendor"));
        assert(!rules.isExcluded("docs/storage"));
        assert(!rules.isExcluded("src/main.php"));

        std::cout << "✓ Default names test passed" << std::endl;
    }

    void testPrefixBoundaries() {
        std::cout << "Testing prefix rule boundaries..." << std::endl;

        DirDump::ExclusionRuleSet rules({"app/tmp"});

        assert(rules.isExcluded("app/tmp"));
        assert(rules.isExcluded("app/tmp/x.txt"));
        assert(rules.isExcluded("app/tmp/nested/y.txt"));
        assert(!rules.isExcluded("app/tmpfile.txt"));
        assert(!rules.isExcluded("app/tmp2/x.txt"));
        assert(!rules.isExcluded("other/app/tmp/x.txt"));

        // Default prefixes anchor at the target root
        assert(rules.isExcluded("build/output.js"));
        assert(rules.isExcluded("bootstrap/cache/packages.php"));
        assert(!rules.isExcluded("src/build/output.js"));
        assert(!rules.isExcluded("builder.js"));

        std::cout << "✓ Prefix boundaries test passed" << std::endl;
    }

    void testDirectoryExclusion() {
        std::cout << "Testing directory pruning decisions..." << std::endl;

        DirDump::ExclusionRuleSet rules({"logs", "app/cache"});

        assert(rules.isDirectoryExcluded({"logs"}));
        assert(rules.isDirectoryExcluded({"src", "logs"}));
        assert(rules.isDirectoryExcluded({"vendor"}));
        assert(rules.isDirectoryExcluded({"app", "cache"}));
        assert(rules.isDirectoryExcluded({"dist"}));
        assert(!rules.isDirectoryExcluded({"app"}));
        assert(!rules.isDirectoryExcluded({"src", "logsx"}));
        assert(!rules.isDirectoryExcluded({}));

        std::cout << "✓ Directory exclusion test passed" << std::endl;
    }

    void testMergeOrderAndDeduplication() {
        std::cout << "Testing rule merge order..." << std::endl;

        DirDump::ExclusionRuleSet rules({"vendor", "custom", "a/b", "a/b/"});
        const auto& all = rules.getRules();

        size_t defaults = DirDump::ExclusionRuleSet::getDefaultNames().size() +
                          DirDump::ExclusionRuleSet::getDefaultPrefixes().size();
        // "vendor" is already present, "a/b/" duplicates "a/b"
        assert(rules.size() == defaults + 2);

        assert(all.front().toString() == ".git");
        assert(all[all.size() - 2].toString() == "custom");
        assert(all.back().toString() == "a/b");
        assert(rules.hasName("custom"));

        DirDump::ExclusionRuleSet only_user({"x"}, false);
        assert(only_user.size() == 1);
        assert(!only_user.isExcluded("vendor/a.php"));

        std::cout << "✓ Merge order test passed" << std::endl;
    }

    void testTokenNormalization() {
        std::cout << "Testing exclude token normalization..." << std::endl;

        setupTestTree();
        fs::path project = fs::canonical(test_dir);
        fs::path target = project / "app";

        auto tokens = DirDump::normalizeExcludeTokens(
            {"vendor", "app/Http/cache", "Http/cache", "./tmp", (project / "app" / "tmp").string(), "docs/x"},
            project, target);

        assert(tokens.size() == 6);
        assert(tokens[0] == "vendor");
        // Project-relative and target-relative spellings land on the same prefix
        assert(tokens[1] == "Http/cache");
        assert(tokens[2] == "Http/cache");
        // Single-segment results stay prefix rules
        assert(tokens[3] == "tmp/");
        assert(tokens[4] == "tmp/");
        // Not found under the project: taken relative to the target
        assert(tokens[5] == "docs/x");

        DirDump::ExclusionRuleSet rules(tokens);
        assert(rules.isExcluded("Http/cache/routes.php"));
        assert(rules.isExcluded("tmp/a.txt"));
        assert(!rules.isExcluded("Models/tmp/a.txt"));

        cleanupTestTree();
        std::cout << "✓ Token normalization test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ExclusionRules unit tests..." << std::endl;

        testTokenParsing();
        testDefaultNames();
        testPrefixBoundaries();
        testDirectoryExclusion();
        testMergeOrderAndDeduplication();
        testTokenNormalization();

        std::cout << "All ExclusionRules tests passed!" << std::endl;
    }
};

int main() {
    try {
        ExclusionRulesTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
