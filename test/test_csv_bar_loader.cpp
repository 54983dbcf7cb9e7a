// test_csv_bar_loader.cpp
// CsvBarLoader: header handling, delimiters, optional buy volume and error reporting

#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "../include/barvault/core/exceptions.hpp"
#include "../include/barvault/data/csv_bar_loader.hpp"
#include "test_framework.hpp"

using namespace barvault;
using namespace barvault::testing;

void test_parse_with_header() {
    std::istringstream in(
        "timestamp,open,high,low,close,volume,buy_volume\n"
        "1000,10,11,9,10.5,100,40\n"
        "\n"
        "2000, 10.5 ,12,10,11.5,150\n");
    CsvBarLoader loader;
    const auto records = loader.parse(in);

    CHECK_EQ(records.size(), 2u);
    CHECK_EQ(records[0].bar.timestamp, 1000);
    CHECK_EQ(records[0].bar.close, 10.5);
    CHECK_EQ(records[0].bar.buy_volume, 40.0);
    CHECK_EQ(records[0].line, 2u);
    CHECK_EQ(records[1].bar.open, 10.5);
    CHECK_EQ(records[1].bar.buy_volume, 0.0);
    CHECK_EQ(records[1].line, 4u);
    CHECK(!records[1].amends_previous);
    CHECK_EQ(loader.rowsLoaded(), 2u);
}

void test_custom_delimiter_without_header() {
    CsvBarLoader::CsvConfig config;
    config.has_header = false;
    config.delimiter = ';';
    std::istringstream in("5;1;2;0.5;1.5;10;3\n6;1.5;2;1;1.75;12;4\n");
    CsvBarLoader loader(config);
    const auto records = loader.parse(in);
    CHECK_EQ(records.size(), 2u);
    CHECK_EQ(records[1].bar.timestamp, 6);
    CHECK_EQ(records[1].bar.close, 1.75);
}

void test_same_timestamp_amends() {
    CsvBarLoader::CsvConfig config;
    config.same_timestamp_amends = true;
    std::istringstream in(
        "ts,o,h,l,c,v\n"
        "60000,1,1,1,1,1\n"
        "60000,1,2,1,2,3\n"
        "120000,2,2,2,2,1\n");
    CsvBarLoader loader(config);
    const auto records = loader.parse(in);
    CHECK_EQ(records.size(), 3u);
    CHECK(!records[0].amends_previous);
    CHECK(records[1].amends_previous);
    CHECK(!records[2].amends_previous);
}

void test_errors_name_the_line() {
    CsvBarLoader loader;

    std::istringstream short_row("h\n1,2,3,4,5,6\n7,8,9\n");
    auto e1 = CHECK_THROWS(DataException, loader.parse(short_row));
    CHECK(e1.code() == ErrorCode::DataError);
    CHECK(std::string(e1.what()).find("line 3") != std::string::npos);

    std::istringstream bad_number("h\n1,2,3,4,abc,6\n");
    auto e2 = CHECK_THROWS(DataException, loader.parse(bad_number));
    CHECK(std::string(e2.what()).find("line 2") != std::string::npos);

    std::istringstream bad_ts("h\n1.5,2,3,4,5,6\n");
    CHECK_THROWS(DataException, loader.parse(bad_ts));

    std::istringstream empty("");
    CHECK_THROWS(DataException, loader.parse(empty));

    CHECK_THROWS(DataException, loader.loadFile("/nonexistent/barvault/bars.csv"));
}

void test_load_file() {
    const std::string path = "barvault_test_bars.csv";
    {
        std::ofstream out(path);
        out << "timestamp,open,high,low,close,volume\n";
        for (int i = 0; i < 5; ++i) {
            out << (i * 60000) << "," << 100 + i << "," << 101 + i << "," << 99 + i << ","
                << 100.5 + i << "," << 10 * (i + 1) << "\n";
        }
    }
    CsvBarLoader loader;
    const auto records = loader.loadFile(path);
    std::remove(path.c_str());

    CHECK_EQ(records.size(), 5u);
    CHECK_EQ(records[4].bar.timestamp, 240000);
    CHECK_EQ(records[4].bar.close, 104.5);
    CHECK_EQ(records[4].bar.volume, 50.0);
}

int main() {
    std::cout << "\n=== CsvBarLoader Test Suite ===" << std::endl;

    TestReporter reporter;

    reporter.test("Parse With Header", test_parse_with_header);
    reporter.test("Custom Delimiter Without Header", test_custom_delimiter_without_header);
    reporter.test("Same Timestamp Amends", test_same_timestamp_amends);
    reporter.test("Errors Name The Line", test_errors_name_the_line);
    reporter.test("Load File", test_load_file);

    reporter.report();
    return reporter.exitCode();
}
