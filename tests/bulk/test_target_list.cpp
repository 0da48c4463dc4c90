/*
===============================================================================
 bulk::target_list — Unit Tests
===============================================================================

Scope:
------
Validates reading the input list of targets from CSV.

-------------------------------------------------------------------------------
Covered Contracts
-------------------------------------------------------------------------------

L1. split_csv_line: quoting, escaped quotes, empty fields, trimming
L2. parse_targets: identifier column anywhere, numeric extras only,
    BOM and CRLF tolerated, rows without identifier dropped
L3. offset / limit window over valid rows
L4. Errors: missing column, header only
L5. load_targets reads a file and reports a missing one

===============================================================================
*/

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

#include "common/test_check.hpp"

#include "wiredive/bulk/target_list.hpp"

using namespace wiredive::bulk;
namespace fs = std::filesystem;

namespace {

constexpr std::string_view CSV =
    "rank,user_address,name,pnl,volume\n"
    "1,0xaaa,\"Smith, J\",1520.5,98765\n"
    "2,0xbbb,anon,-30,n/a\n"
    "3,,empty,1,2\n"
    "4,0xccc,\"say \"\"hi\"\"\",,7\n"
    "\n"
    "5,0xddd,x,1e3,0\n";

} // namespace


void test_split_csv_line() {
    std::cout << "[TEST] Group L1: split_csv_line\n";

    TEST_CHECK(split_csv_line("a,b,c") == (std::vector<std::string>{"a", "b", "c"}));
    TEST_CHECK(split_csv_line("\"a,b\",c") == (std::vector<std::string>{"a,b", "c"}));
    TEST_CHECK(split_csv_line("\"say \"\"hi\"\"\",x") == (std::vector<std::string>{"say \"hi\"", "x"}));
    TEST_CHECK(split_csv_line("a,,c,") == (std::vector<std::string>{"a", "", "c", ""}));
    TEST_CHECK(split_csv_line(" a , b\t") == (std::vector<std::string>{"a", "b"}));
    TEST_CHECK(split_csv_line("") == (std::vector<std::string>{""}));

    std::cout << "[TEST] OK\n";
}

void test_parse_targets() {
    std::cout << "[TEST] Group L2: parse_targets\n";

    std::vector<Target> targets;
    TEST_CHECK(parse_targets(CSV, 0, std::nullopt, targets) == ListError::None);
    TEST_CHECK(targets.size() == 4);

    TEST_CHECK(targets[0].id == "0xaaa");
    TEST_CHECK(targets[0].extras.size() == 3);
    TEST_CHECK(targets[0].extras[0].first == "rank" && targets[0].extras[0].second == 1.0);
    TEST_CHECK(targets[0].extras[1].first == "pnl" && targets[0].extras[1].second == 1520.5);
    TEST_CHECK(targets[0].extras[2].first == "volume" && targets[0].extras[2].second == 98765.0);

    // Non-numeric cells are not copied
    TEST_CHECK(targets[1].id == "0xbbb");
    TEST_CHECK(targets[1].extras.size() == 2);
    TEST_CHECK(targets[1].extras[1].first == "pnl" && targets[1].extras[1].second == -30.0);

    TEST_CHECK(targets[2].id == "0xccc");
    TEST_CHECK(targets[3].id == "0xddd");
    TEST_CHECK(targets[3].extras[1].second == 1000.0);

    // BOM, CRLF and identifier in the first column
    TEST_CHECK(parse_targets("\xEF\xBB\xBFuser_address,score\r\n0x1,5\r\n0x2,6\r\n", 0, std::nullopt, targets) == ListError::None);
    TEST_CHECK(targets.size() == 2);
    TEST_CHECK(targets[0].id == "0x1");
    TEST_CHECK(targets[1].id == "0x2");
    TEST_CHECK(targets[1].extras.size() == 1 && targets[1].extras[0].second == 6.0);

    std::cout << "[TEST] OK\n";
}

void test_window() {
    std::cout << "[TEST] Group L3: offset and limit\n";

    std::vector<Target> targets;
    TEST_CHECK(parse_targets(CSV, 1, 2, targets) == ListError::None);
    TEST_CHECK(targets.size() == 2);
    TEST_CHECK(targets[0].id == "0xbbb");
    TEST_CHECK(targets[1].id == "0xccc");

    TEST_CHECK(parse_targets(CSV, 3, std::nullopt, targets) == ListError::None);
    TEST_CHECK(targets.size() == 1);
    TEST_CHECK(targets[0].id == "0xddd");

    TEST_CHECK(parse_targets(CSV, 10, std::nullopt, targets) == ListError::None);
    TEST_CHECK(targets.empty());

    TEST_CHECK(parse_targets(CSV, 0, 0, targets) == ListError::None);
    TEST_CHECK(targets.empty());

    std::cout << "[TEST] OK\n";
}

void test_errors() {
    std::cout << "[TEST] Group L4: errors\n";

    std::vector<Target> targets;
    TEST_CHECK(parse_targets("address,pnl\n0x1,2\n", 0, std::nullopt, targets) == ListError::MissingColumn);
    TEST_CHECK(parse_targets("", 0, std::nullopt, targets) == ListError::MissingColumn);
    TEST_CHECK(parse_targets("user_address,pnl\n", 0, std::nullopt, targets) == ListError::Empty);
    TEST_CHECK(parse_targets("user_address,pnl\n,1\n", 0, std::nullopt, targets) == ListError::Empty);
    TEST_CHECK(targets.empty());

    std::cout << "[TEST] OK\n";
}

void test_load_targets() {
    std::cout << "[TEST] Group L5: load_targets\n";

    const fs::path path = fs::temp_directory_path() / ("wiredive_targets_" + std::to_string(::getpid()) + ".csv");
    {
        std::ofstream os(path, std::ios::binary);
        os << CSV;
    }

    std::vector<Target> targets;
    TEST_CHECK(load_targets(path, 0, 3, targets) == ListError::None);
    TEST_CHECK(targets.size() == 3);
    TEST_CHECK(targets[2].id == "0xccc");

    std::error_code ec;
    fs::remove(path, ec);

    TEST_CHECK(load_targets(path, 0, std::nullopt, targets) == ListError::NotFound);
    TEST_CHECK(targets.empty());

    std::cout << "[TEST] OK\n";
}

int main() {
    test_split_csv_line();
    test_parse_targets();
    test_window();
    test_errors();
    test_load_targets();

    std::cout << "\n[TARGET_LIST TESTS PASSED]\n";
    return 0;
}
