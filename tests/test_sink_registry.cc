#include "secern/config/yaml_loader.h"
#include "secern/sinks/sink_registry.h"
#include "secern/utils/error.h"
#include <cassert>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;
using secern::config::SinkDeclaration;
using secern::config::SinkDestination;
using secern::sinks::SinkRegistry;

static SinkDeclaration declare(const std::string& name, const std::string& file_name,
                               std::vector<std::string> patterns, bool invert = false) {
    SinkDeclaration decl;
    decl.name = name;
    decl.destination = SinkDestination::from_file_name(file_name);
    decl.patterns = std::move(patterns);
    decl.invert = invert;
    return decl;
}

static size_t count_files(const std::string& dir) {
    size_t count = 0;
    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (entry.is_regular_file()) {
            ++count;
        }
    }
    return count;
}

void test_build_creates_outputs() {
    std::cout << "Testing registry construction..." << std::endl;

    std::string test_dir = "test_registry_data";
    fs::remove_all(test_dir);
    fs::create_directories(test_dir);

    std::vector<SinkDeclaration> decls = {
        declare("digits", test_dir + "/digits.txt", {"^[0-9]+$"}),
        declare("nested", test_dir + "/a/b/c/nested.txt", {"nested"}, true),
        declare("discard", "null", {"drop"}),
    };
    auto registry = SinkRegistry::build(decls);

    assert(registry.size() == 3);
    assert(registry[0].name() == "digits");
    assert(registry[1].name() == "nested");
    assert(registry[2].name() == "discard");
    std::cout << "  ✓ Declaration order preserved" << std::endl;

    assert(fs::exists(test_dir + "/digits.txt"));
    assert(fs::exists(test_dir + "/a/b/c/nested.txt"));
    assert(registry[0].writer() != nullptr);
    assert(registry[1].writer() != nullptr);
    std::cout << "  ✓ Output files and parent directories created" << std::endl;

    assert(registry[2].is_discard());
    assert(registry[2].writer() == nullptr);
    assert(registry[2].destination_name() == "null");
    assert(count_files(test_dir) == 2);
    std::cout << "  ✓ Discard sink has no file" << std::endl;

    assert(!registry[0].invert());
    assert(registry[1].invert());
    assert(registry[1].claims("anything else"));
    assert(!registry[1].claims("a nested line"));
    std::cout << "  ✓ Invert flag applied" << std::endl;

    fs::remove_all(test_dir);
}

void test_validation_batching() {
    std::cout << "Testing pattern error batching..." << std::endl;

    std::string test_dir = "test_registry_batch";
    fs::remove_all(test_dir);
    fs::create_directories(test_dir);

    std::vector<SinkDeclaration> decls = {
        declare("first", test_dir + "/first.txt", {"(unclosed"}),
        declare("second", test_dir + "/second.txt", {"fine"}),
        declare("third", test_dir + "/third/third.txt", {"ok", "[z-a]"}),
    };

    bool threw = false;
    try {
        SinkRegistry::build(decls);
    } catch (const secern::ConfigError& e) {
        threw = true;
        assert(e.errors().size() == 2);
        assert(e.errors()[0].find("'first'") != std::string::npos);
        assert(e.errors()[1].find("'third'") != std::string::npos);
    }
    assert(threw);
    assert(count_files(test_dir) == 0);
    assert(!fs::exists(test_dir + "/third"));
    std::cout << "  ✓ Two errors reported, no files created" << std::endl;

    fs::remove_all(test_dir);
}

void test_validate_only() {
    std::cout << "Testing dry validation..." << std::endl;

    std::string test_dir = "test_registry_dry";
    fs::remove_all(test_dir);

    std::vector<SinkDeclaration> decls = {
        declare("one", test_dir + "/one.txt", {"a", "b"}),
        declare("two", "null", {"c"}, true),
    };
    auto registry = SinkRegistry::build(decls, SinkRegistry::BuildMode::kValidateOnly);

    assert(registry.size() == 2);
    assert(!fs::exists(test_dir));
    assert(registry[0].writer() == nullptr);
    assert(!registry[0].is_discard());
    assert(registry[0].destination_name() == test_dir + "/one.txt");
    std::cout << "  ✓ No files touched" << std::endl;

    std::ostringstream summary;
    registry.summary(summary);
    std::string text = summary.str();
    assert(text.find("Sinks: 2") != std::string::npos);
    assert(text.find("one") != std::string::npos);
    assert(text.find("output:   null") != std::string::npos);
    assert(text.find("invert:   true") != std::string::npos);
    assert(text.find("patterns: 2") != std::string::npos);
    std::cout << "  ✓ Summary lists every sink" << std::endl;

    // Dry validation still reports bad patterns
    decls.push_back(declare("bad", "null", {"(a"}));
    bool threw = false;
    try {
        SinkRegistry::build(decls, SinkRegistry::BuildMode::kValidateOnly);
    } catch (const secern::ConfigError& e) {
        threw = true;
        assert(e.errors().size() == 1);
    }
    assert(threw);
    std::cout << "  ✓ Dry validation rejects bad patterns" << std::endl;
}

void test_duplicate_names_allowed() {
    std::cout << "Testing duplicate sink names..." << std::endl;

    std::vector<SinkDeclaration> decls = {
        declare("same", "null", {"a"}),
        declare("same", "null", {"b"}),
    };
    auto registry = SinkRegistry::build(decls);
    assert(registry.size() == 2);
    std::cout << "  ✓ Duplicate names accepted" << std::endl;
}

void test_file_creation_failure() {
    std::cout << "Testing output file creation failure..." << std::endl;

    std::string test_dir = "test_registry_fail";
    fs::remove_all(test_dir);
    fs::create_directories(test_dir + "/occupied");

    // Destination path is an existing directory
    std::vector<SinkDeclaration> decls = {
        declare("blocked", test_dir + "/occupied", {"x"}),
    };

    bool threw = false;
    try {
        SinkRegistry::build(decls);
    } catch (const secern::ResourceError& e) {
        threw = true;
        std::string message = e.what();
        assert(message.find("blocked") != std::string::npos);
        assert(message.find(test_dir + "/occupied") != std::string::npos);
    }
    assert(threw);
    std::cout << "  ✓ Failure names sink and path" << std::endl;

    fs::remove_all(test_dir);
}

void test_example_configs_validate() {
    std::cout << "Testing shipped example configurations..." << std::endl;

    size_t checked = 0;
    for (const auto& entry : fs::directory_iterator(SECERN_EXAMPLE_CONFIG_DIR)) {
        if (entry.path().extension() != ".yaml") {
            continue;
        }
        auto decls = secern::config::load_sinks_from_yaml(entry.path().string());
        assert(!decls.empty());
        auto registry = SinkRegistry::build(decls, SinkRegistry::BuildMode::kValidateOnly);
        assert(registry.size() == decls.size());
        std::cout << "  ✓ " << entry.path().filename().string() << " validates ("
                  << registry.size() << " sinks)" << std::endl;
        ++checked;
    }
    assert(checked >= 2);
}

int main() {
    std::cout << "Running SinkRegistry tests..." << std::endl;
    test_build_creates_outputs();
    test_validation_batching();
    test_validate_only();
    test_duplicate_names_allowed();
    test_file_creation_failure();
    test_example_configs_validate();
    std::cout << "\nAll SinkRegistry tests passed!" << std::endl;
    return 0;
}
