// =================================================================
// tests/ExtensionSetTest.cpp
// =================================================================
// Unit tests for the extension filter policy.

#include "DirDump/ExtensionSet.hpp"
#include <iostream>
#include <cassert>
#include <string>
#include <vector>

class ExtensionSetTest {
public:
    void testNormalization() {
        std::cout << "Testing extension normalization..." << std::endl;

        DirDump::ExtensionSet set({"PHP", "js", ".Js", " .md ", ""});
        const auto& exts = set.getExtensions();

        assert(exts.size() == 3);
        assert(exts[0] == ".php");
        assert(exts[1] == ".js");
        assert(exts[2] == ".md");
        assert(!set.isAllText());

        auto from_csv = DirDump::ExtensionSet::fromCsv(" .php, ,twig");
        assert(from_csv.getExtensions().size() == 2);
        assert(from_csv.getExtensions()[1] == ".twig");

        std::cout << "✓ Normalization test passed" << std::endl;
    }

    void testSuffixMatching() {
        std::cout << "Testing suffix matching..." << std::endl;

        DirDump::ExtensionSet set({".php", ".js"});

        assert(set.matches("index.php"));
        assert(set.matches("Index.PHP"));
        assert(set.matches("app.min.js"));
        assert(!set.matches("style.css"));
        assert(!set.matches("README"));
        assert(!set.matches("php"));

        std::cout << "✓ Suffix matching test passed" << std::endl;
    }

    void testDotFiles() {
        std::cout << "Testing dot-file tokens..." << std::endl;

        DirDump::ExtensionSet defaults(DirDump::ExtensionSet::getDefaultExtensions());

        assert(defaults.matches(".gitignore"));
        assert(defaults.matches(".env"));
        assert(defaults.matches(".editorconfig"));
        assert(!defaults.matches(".bashrc"));

        DirDump::ExtensionSet only_php({".php"});
        assert(!only_php.matches(".env"));

        std::cout << "✓ Dot files test passed" << std::endl;
    }

    void testCompoundSuffixes() {
        std::cout << "Testing compound suffixes..." << std::endl;

        DirDump::ExtensionSet blade_only({".blade.php"});
        assert(blade_only.matches("welcome.blade.php"));
        assert(blade_only.matches("Welcome.Blade.PHP"));
        assert(!blade_only.matches("index.php"));

        // A known compound suffix is decided by the compound alone
        DirDump::ExtensionSet php_only({".php"});
        assert(php_only.matches("index.php"));
        assert(!php_only.matches("welcome.blade.php"));

        DirDump::ExtensionSet both({".php", ".blade.php"});
        assert(both.matches("welcome.blade.php"));
        assert(both.matches("index.php"));

        DirDump::ExtensionSet declarations({".d.ts"});
        assert(declarations.matches("types.d.ts"));
        assert(!declarations.matches("app.ts"));

        std::cout << "✓ Compound suffixes test passed" << std::endl;
    }

    void testAllTextMode() {
        std::cout << "Testing all-text mode..." << std::endl;

        auto all = DirDump::ExtensionSet::allText();
        assert(all.isAllText());
        assert(all.getExtensions().empty());
        assert(all.matches("anything.bin"));
        assert(all.matches("Makefile"));

        std::cout << "✓ All-text mode test passed" << std::endl;
    }

    void testLowerSuffix() {
        std::cout << "Testing suffix extraction..." << std::endl;

        assert(DirDump::ExtensionSet::lowerSuffix("archive.TAR.GZ") == ".gz");
        assert(DirDump::ExtensionSet::lowerSuffix("main.cpp") == ".cpp");
        assert(DirDump::ExtensionSet::lowerSuffix(".bashrc").empty());
        assert(DirDump::ExtensionSet::lowerSuffix("Makefile").empty());
        assert(DirDump::ExtensionSet::lowerSuffix("trailing.").empty());

        std::cout << "✓ Suffix extraction test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ExtensionSet unit tests..." << std::endl;

        testNormalization();
        testSuffixMatching();
        testDotFiles();
        testCompoundSuffixes();
        testAllTextMode();
        testLowerSuffix();

        std::cout << "All ExtensionSet tests passed!" << std::endl;
    }
};

int main() {
    try {
        ExtensionSetTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
