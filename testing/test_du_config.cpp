#include "fs_du/du_config.hpp"
#include <iostream>
#include <string>
#include <vector>

// Test utilities
int test_count = 0;
int passed_count = 0;

void assert_test(bool condition, const std::string& test_name) {
    test_count++;
    if (condition) {
        std::cout << "✓ PASS: " << test_name << std::endl;
        passed_count++;
    } else {
        std::cout << "✗ FAIL: " << test_name << std::endl;
    }
}

// Helper: run ParseArgs over the given arguments (program name prepended)
fs_du::DuConfig parse(const std::vector<std::string>& args) {
    std::vector<const char*> argv = {"fs_du"};
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    return fs_du::ParseArgs(static_cast<int>(argv.size()), argv.data());
}

// Test 1: Defaults
void test_defaults() {
    fs_du::DuConfig config = parse({});
    assert_test(config.valid, "Test 1.1: No arguments is valid");
    assert_test(config.path == ".", "Test 1.2: Default path is .");
    assert_test(config.max_depth == -1, "Test 1.3: Default depth is unlimited");
    assert_test(!config.all && !config.human_readable && !config.print_tree,
                "Test 1.4: Flags default to off");
}

// Test 2: Recognized options
void test_options() {
    fs_du::DuConfig config = parse({"--path", "/var", "--max-depth", "2", "-a", "-h",
                                    "--hidden", "--find", "log"});
    assert_test(config.valid, "Test 2.1: Well-formed arguments are valid");
    assert_test(config.path == "/var", "Test 2.2: --path parsed");
    assert_test(config.max_depth == 2, "Test 2.3: --max-depth parsed");
    assert_test(config.all && config.human_readable && config.include_hidden,
                "Test 2.4: Short and long flags parsed");
    assert_test(config.find == "log", "Test 2.5: --find parsed");

    assert_test(parse({"--max-depth", "0"}).max_depth == 0, "Test 2.6: Depth zero accepted");
    assert_test(parse({"--bogus"}).valid, "Test 2.7: Unknown argument ignored, not fatal");
}

// Test 3: Bad --max-depth values are rejected
void test_bad_max_depth() {
    assert_test(!parse({"--max-depth", "abc"}).valid, "Test 3.1: Non-numeric depth rejected");
    assert_test(!parse({"--max-depth", "-3"}).valid, "Test 3.2: Negative depth rejected");
    assert_test(!parse({"--max-depth", "-1"}).valid, "Test 3.3: Explicit -1 rejected");
    assert_test(!parse({"--max-depth", "2x"}).valid, "Test 3.4: Trailing characters rejected");
    assert_test(!parse({"--max-depth", ""}).valid, "Test 3.5: Empty depth rejected");
    assert_test(!parse({"--max-depth", "99999999999999999999"}).valid,
                "Test 3.6: Out of range depth rejected");
}

int main() {
    std::cout << "=== du Config Test Suite ===" << std::endl << std::endl;

    test_defaults();
    test_options();
    test_bad_max_depth();

    std::cout << std::endl << "=== Test Results ===" << std::endl;
    std::cout << "Passed: " << passed_count << " / " << test_count << std::endl;

    if (passed_count == test_count) {
        std::cout << "All tests passed! ✓" << std::endl;
        return 0;
    } else {
        std::cout << "Some tests failed! ✗" << std::endl;
        return 1;
    }
}
