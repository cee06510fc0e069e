// =================================================================
// tests/DumpConfigTest.cpp
// =================================================================
// Unit tests for layered dump configuration.

#include "DirDump/DumpConfig.hpp"
#include "DirDump/CliParser.hpp"
#include "DirDump/Errors.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>
#include <cstdlib>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class DumpConfigTest {
private:
    fs::path test_dir;
    fs::path project;

    void setupProject() {
        cleanupProject();
        fs::create_directories(test_dir / "app" / "Http");
        project = fs::canonical(test_dir);
    }

    void cleanupProject() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    void writeConfig(const std::string& text) {
        std::ofstream(project / ".dirdump.yml") << text;
    }

public:
    DumpConfigTest() : test_dir(fs::temp_directory_path() / "dirdump_config_test") {}

    void testDefaults() {
        std::cout << "Testing default configuration..." << std::endl;

        DirDump::DumpConfig config;
        assert(config.format == "md");
        assert(config.target_dir == "app");
        assert(config.extensions == DirDump::ExtensionSet::getDefaultExtensions());
        assert(config.sniff_bytes == 8192);
        assert(config.min_ratio_sample == 512);
        assert(config.getSplitBudget() == 0);
        assert(config.validate());

        std::cout << "✓ Defaults test passed" << std::endl;
    }

    void testLoadFromFile() {
        std::cout << "Testing YAML configuration file..." << std::endl;

        setupProject();
        writeConfig(
            "format: txt\n"
            "extensions: [\".php\", twig]\n"
            "exclude: \"logs, app/tmp\"\n"
            "all_files: true\n"
            "max_bytes: 2048\n"
            "structure_max: 50\n"
            "split_mb: 1.5\n"
            "classifier:\n"
            "  extra_binary_extensions:\n"
            "    - .dump\n"
            "  high_byte_ratio: 0.5\n");

        DirDump::DumpConfig config;
        assert(!config.loadFromFile((project / "missing.yml").string()));
        assert(config.loadFromFile(DirDump::DumpConfig::getDefaultConfigPath(project.string()).string()));

        assert(config.format == "txt");
        assert(config.extensions.size() == 2);
        assert(config.extensions[1] == "twig");
        assert(config.exclude.size() == 2);
        assert(config.exclude[1] == "app/tmp");
        assert(config.all_files);
        assert(config.max_bytes == 2048);
        assert(config.structure_max == 50);
        assert(config.extra_binary_extensions.size() == 1);
        assert(config.high_byte_ratio == 0.5);
        assert(config.getSplitBudget() == static_cast<size_t>(1.5 * 1024 * 1024));

        config.split_bytes = 1000;
        assert(config.getSplitBudget() == 1000);
        assert(config.validate());

        cleanupProject();
        std::cout << "✓ YAML configuration test passed" << std::endl;
    }

    void testMalformedFile() {
        std::cout << "Testing malformed configuration..." << std::endl;

        setupProject();

        writeConfig("format: [unclosed\n");
        bool threw = false;
        try {
            DirDump::DumpConfig config;
            config.loadFromFile((project / ".dirdump.yml").string());
        } catch (const DirDump::ConfigurationError&) {
            threw = true;
        }
        assert(threw && "Broken YAML should raise a configuration error");

        writeConfig("max_bytes: lots\n");
        threw = false;
        try {
            DirDump::DumpConfig config;
            config.loadFromFile((project / ".dirdump.yml").string());
        } catch (const DirDump::ConfigurationError&) {
            threw = true;
        }
        assert(threw && "Non-numeric max_bytes should raise a configuration error");

        cleanupProject();
        std::cout << "✓ Malformed configuration test passed" << std::endl;
    }

    void testCommandOverrides() {
        std::cout << "Testing command-line overrides..." << std::endl;

        DirDump::DumpConfig config;
        config.format = "txt";
        config.max_bytes = 100;
        config.exclude = {"logs"};

        DirDump::Commands commands;
        commands.project_dir = "/srv/site";
        commands.target_dir = ".";
        commands.format = "md";
        commands.max_bytes = 0;
        commands.exclude = "tmp,cache";
        commands.structure_max = 7;
        commands.explicit_options = {"--format", "--exclude"};

        config.applyCommandOverrides(commands);

        assert(config.project_dir == "/srv/site");
        assert(config.target_dir == ".");
        assert(config.format == "md");
        // Not given on the command line: the file value stays
        assert(config.max_bytes == 100);
        assert(config.structure_max == 0);
        assert((config.exclude == std::vector<std::string>{"logs", "tmp", "cache"}));

        std::cout << "✓ Command-line overrides test passed" << std::endl;
    }

    void testValidation() {
        std::cout << "Testing validation..." << std::endl;

        DirDump::DumpConfig bad_format;
        bad_format.format = "html";
        assert(!bad_format.validate());

        DirDump::DumpConfig bad_ratio;
        bad_ratio.high_byte_ratio = 0.0;
        assert(!bad_ratio.validate());

        DirDump::DumpConfig bad_sniff;
        bad_sniff.sniff_bytes = 0;
        assert(!bad_sniff.validate());

        DirDump::DumpConfig no_extensions;
        no_extensions.extensions.clear();
        assert(!no_extensions.validate());
        no_extensions.all_text = true;
        assert(no_extensions.validate());

        DirDump::DumpConfig huge_split;
        huge_split.split_mb = 1e30;
        assert(!huge_split.validate());
        assert(huge_split.getSplitBudget() == 0);
        huge_split.split_mb = -1.0;
        assert(!huge_split.validate());
        huge_split.split_mb = 1.5;
        assert(huge_split.validate());
        assert(huge_split.getSplitBudget() == 1572864);

        std::cout << "✓ Validation test passed" << std::endl;
    }

    void testResolvePaths() {
        std::cout << "Testing path resolution..." << std::endl;

        setupProject();

        DirDump::DumpConfig config;
        config.project_dir = project.string();
        config.target_dir = "app";

        auto options = config.resolve();
        assert(options.project_dir == project);
        assert(options.target_dir == project / "app");
        assert(options.output_path == project / "app_dump.md");
        assert(options.format == DirDump::OutputFormat::Markdown);
        assert(!options.extensions.isAllText());

        config.target_dir = "./";
        options = config.resolve();
        assert(options.target_dir == project);
        assert(options.output_path == project / "project_dump.md");

        config.target_dir = (project / "app" / "Http").string();
        options = config.resolve();
        assert(options.target_dir == project / "app" / "Http");
        assert(options.output_path == project / "Http_dump.md");

        config.target_dir = "app";
        config.output_path = "rel/out.txt";
        options = config.resolve();
        assert(options.output_path == fs::weakly_canonical(fs::current_path() / "rel" / "out.txt"));

        cleanupProject();
        std::cout << "✓ Path resolution test passed" << std::endl;
    }

    void testResolveErrors() {
        std::cout << "Testing resolution errors..." << std::endl;

        setupProject();

        DirDump::DumpConfig missing_target;
        missing_target.project_dir = project.string();
        missing_target.target_dir = "nope";
        bool threw = false;
        try {
            missing_target.resolve();
        } catch (const DirDump::ConfigurationError&) {
            threw = true;
        }
        assert(threw && "Missing target should fail");

        DirDump::DumpConfig missing_project;
        missing_project.project_dir = (project / "does-not-exist").string();
        threw = false;
        try {
            missing_project.resolve();
        } catch (const DirDump::ConfigurationError&) {
            threw = true;
        }
        assert(threw && "Missing project should fail");

        cleanupProject();
        std::cout << "✓ Resolution errors test passed" << std::endl;
    }

    void testResolveRulesAndClassifier() {
        std::cout << "Testing resolved rules and classifier settings..." << std::endl;

        setupProject();

        DirDump::DumpConfig config;
        config.project_dir = project.string();
        config.target_dir = "app";
        config.all_text = true;
        config.exclude = {"app/Http/cache", "logs"};
        config.binary_extensions = {"TXT"};
        config.extra_binary_extensions = {"dump"};
        config.split_mb = 2;
        config.no_structure = true;

        auto options = config.resolve();
        assert(options.extensions.isAllText());
        assert(options.exclusions.isExcluded("Http/cache/routes.php"));
        assert(options.exclusions.isExcluded("x/logs/a.txt"));
        assert(options.exclusions.isExcluded("vendor/a.php"));
        assert(options.classifier.binary_extensions.size() == 2);
        assert(options.classifier.binary_extensions.count(".txt") == 1);
        assert(options.classifier.binary_extensions.count(".dump") == 1);
        assert(options.split_bytes == 2 * 1024 * 1024);
        assert(!options.include_structure);

        cleanupProject();
        std::cout << "✓ Resolved rules test passed" << std::endl;
    }

    void testExpandUser() {
        std::cout << "Testing home directory expansion..." << std::endl;

        assert(DirDump::DumpConfig::expandUser("plain/path") == fs::path("plain/path"));
        assert(DirDump::DumpConfig::expandUser("~other/x") == fs::path("~other/x"));

        const char* home = std::getenv("HOME");
        if (home != nullptr && *home != '\0') {
            assert(DirDump::DumpConfig::expandUser("~") == fs::path(home));
            assert(DirDump::DumpConfig::expandUser("~/work") == fs::path(home) / "work");
        }

        std::cout << "✓ Home expansion test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running DumpConfig unit tests..." << std::endl;

        testDefaults();
        testLoadFromFile();
        testMalformedFile();
        testCommandOverrides();
        testValidation();
        testResolvePaths();
        testResolveErrors();
        testResolveRulesAndClassifier();
        testExpandUser();

        std::cout << "All DumpConfig tests passed!" << std::endl;
    }
};

int main() {
    try {
        DumpConfigTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
