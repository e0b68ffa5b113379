#include "fs_du/du_report.hpp"
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using SizeTree = fs_tree::TreeMap<uint64_t>;

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

// Layout: a/x 100, a/b/y 50, z 7, e/ (empty)
SizeTree make_tree() {
    SizeTree tree;
    tree.InsertWithParents("a/x", 100);
    tree.InsertWithParents("a/b/y", 50);
    tree.InsertWithParents("z", 7);
    tree.MakeDirectory("e");
    return tree;
}

// "path=bytes" per entry, space separated
std::string summarize(const std::vector<fs_du::ReportEntry>& entries) {
    std::string out;
    for (const auto& entry : entries) {
        if (!out.empty()) {
            out += ' ';
        }
        out += entry.path + "=" + std::to_string(entry.bytes);
    }
    return out;
}

// Test 1: Directories only, post-order, root last
void test_directories_only() {
    auto entries = fs_du::BuildReport(make_tree(), fs_du::ReportOptions());
    assert_test(summarize(entries) == "./a/b=50 ./a=150 ./e=0 .=157",
                "Test 1.1: Post-order directory totals");
    assert_test(entries.back().depth == 0 && entries.back().is_directory,
                "Test 1.2: Root entry is last at depth 0");
    assert_test(entries.front().depth == 2, "Test 1.3: ./a/b sits at depth 2");
}

// Test 2: --all adds files in tree order
void test_all_entries() {
    fs_du::ReportOptions options;
    options.all = true;
    auto entries = fs_du::BuildReport(make_tree(), options);
    assert_test(summarize(entries) == "./a/x=100 ./a/b/y=50 ./a/b=50 ./a=150 ./z=7 ./e=0 .=157",
                "Test 2.1: Files listed before their directory");
    assert_test(!entries.front().is_directory, "Test 2.2: File entries are marked as files");
}

// Test 3: Depth limit hides entries but keeps their bytes
void test_max_depth() {
    fs_du::ReportOptions options;
    options.max_depth = 1;
    assert_test(summarize(fs_du::BuildReport(make_tree(), options)) == "./a=150 ./e=0 .=157",
                "Test 3.1: Depth 1 keeps top-level directories with full totals");

    options.max_depth = 0;
    assert_test(summarize(fs_du::BuildReport(make_tree(), options)) == ".=157",
                "Test 3.2: Depth 0 reports only the root");

    options.max_depth = 1;
    options.all = true;
    assert_test(summarize(fs_du::BuildReport(make_tree(), options)) == "./a=150 ./z=7 ./e=0 .=157",
                "Test 3.3: Depth 1 with files shows top-level files");
}

// Test 4: Empty tree
void test_empty_tree() {
    auto entries = fs_du::BuildReport(SizeTree(), fs_du::ReportOptions());
    assert_test(summarize(entries) == ".=0", "Test 4: Empty tree reports a zero root");
}

// Test 5: Size formatting
void test_format_size() {
    assert_test(fs_du::FormatSize(1536, false) == "1536", "Test 5.1: Raw bytes");
    assert_test(fs_du::FormatSize(500, true) == "500", "Test 5.2: Under 1K stays plain");
    assert_test(fs_du::FormatSize(1023, true) == "1023", "Test 5.3: 1023 stays plain");
    assert_test(fs_du::FormatSize(1536, true) == "1.5K", "Test 5.4: One decimal below 10");
    assert_test(fs_du::FormatSize(2048, true) == "2.0K", "Test 5.5: Whole value keeps its decimal");
    assert_test(fs_du::FormatSize(1100, true) == "1.1K", "Test 5.6: Rounded up like du");
    assert_test(fs_du::FormatSize(10240, true) == "10K", "Test 5.7: No decimal from 10 up");
    assert_test(fs_du::FormatSize(1048576, true) == "1.0M", "Test 5.8: Megabytes");
    assert_test(fs_du::FormatSize(5ULL * 1024 * 1024 * 1024, true) == "5.0G", "Test 5.9: Gigabytes");
}

// Test 7: Rounding up can push a size into the next format or unit
void test_format_size_carry() {
    assert_test(fs_du::FormatSize(10188, true) == "10K",
                "Test 7.1: 9.95K rounds up to 10K without a decimal");
    assert_test(fs_du::FormatSize(1048575, true) == "1.0M",
                "Test 7.2: Just under 1M rounds up into megabytes");
    assert_test(fs_du::FormatSize(1024ULL * 1024 * 1023 + 1, true) == "1.0G",
                "Test 7.3: Just over 1023M rounds up into gigabytes");
    assert_test(fs_du::FormatSize(10 * 1024 - 1, true) == "10K",
                "Test 7.4: One byte under 10K prints as 10K");
    assert_test(fs_du::FormatSize(9 * 1024 + 1, true) == "9.1K",
                "Test 7.5: Just over 9K keeps one decimal");
}

// Test 6: Output lines
void test_write_report() {
    std::ostringstream out;
    fs_du::WriteReport(fs_du::BuildReport(make_tree(), fs_du::ReportOptions()), out, false);
    assert_test(out.str() == "50\t./a/b\n150\t./a\n0\t./e\n157\t.\n",
                "Test 6.1: Tab-separated size and path per line");

    std::ostringstream human;
    SizeTree big;
    big.InsertWithParents("data/blob", 3 * 1024 * 1024);
    fs_du::WriteReport(fs_du::BuildReport(big, fs_du::ReportOptions()), human, true);
    assert_test(human.str() == "3.0M\t./data\n3.0M\t.\n", "Test 6.2: Human readable sizes");
}

int main() {
    std::cout << "=== du Report Test Suite ===" << std::endl << std::endl;

    test_directories_only();
    test_all_entries();
    test_max_depth();
    test_empty_tree();
    test_format_size();
    test_write_report();
    test_format_size_carry();

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
