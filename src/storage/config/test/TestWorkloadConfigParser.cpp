#include "WorkloadConfigParser.hpp"
#include "StorageError.hpp"
#include <cassert>
#include <functional>
#include <iostream>
#include <set>
#include <string>

static void expect_code(const std::string& uri, StorageErrorCode expected) {
    try {
        WorkloadConfigParser::parse(uri);
        std::cerr << "Expected " << error_code_to_string(expected) << " for " << uri << "\n";
        std::exit(1);
    } catch (const StorageError& e) {
        if (e.code() != expected) {
            std::cerr << "Expected " << error_code_to_string(expected)
                      << " but got " << error_code_to_string(e.code()) << " for " << uri << "\n";
            std::exit(1);
        }
    }
}

void test_parse_bank_accounts() {
    auto config = WorkloadConfigParser::parse("workload:///csv/bank/accounts?version=1.0.0&row-start=0&row-end=10");
    assert(config.format == DataFormat::CSV);
    assert(config.format_name == "csv");
    assert(config.generator == "bank");
    assert(config.table == "accounts");
    assert(config.version == "1.0.0");
    assert(config.row_begin == 0);
    assert(config.row_end == 10);
    assert(config.flags.empty());
    std::cout << "test_parse_bank_accounts passed.\n";
}

void test_parse_path_only_uri() {
    auto config = WorkloadConfigParser::parse("/csv/bank/accounts?version=1.0.0&row-start=0&row-end=10");
    assert(config.generator == "bank");
    assert(config.table == "accounts");
    assert(config.row_end == 10);
    std::cout << "test_parse_path_only_uri passed.\n";
}

void test_segments_kept_verbatim() {
    auto config = WorkloadConfigParser::parse("workload:///CSV/Meters/Devices/?version=v");
    assert(config.format_name == "CSV");
    assert(config.format == DataFormat::CSV);
    assert(config.generator == "Meters");
    assert(config.table == "Devices");
    std::cout << "test_segments_kept_verbatim passed.\n";
}

void test_malformed_paths() {
    expect_code("workload:///csv/bank?version=1.0.0", StorageErrorCode::MalformedPath);
    expect_code("workload:///csv/bank/accounts/extra?version=1.0.0", StorageErrorCode::MalformedPath);
    expect_code("workload:///?version=1.0.0", StorageErrorCode::MalformedPath);
    expect_code("workload:///csv//accounts?version=1.0.0", StorageErrorCode::MalformedPath);
    expect_code("workload:///csv/%zz/accounts?version=1.0.0", StorageErrorCode::MalformedPath);

    try {
        WorkloadConfigParser::parse("workload:///csv/bank?version=1");
    } catch (const StorageError& e) {
        assert(std::string(e.what()).find("/<format>/<generator>/<table>") != std::string::npos);
    }
    std::cout << "test_malformed_paths passed.\n";
}

void test_missing_version() {
    expect_code("/csv/bank/accounts", StorageErrorCode::MissingVersion);
    expect_code("workload:///csv/bank/accounts?row-start=1&row-end=5&rows=9", StorageErrorCode::MissingVersion);
    expect_code("workload:///xml/bank/accounts?rows=9", StorageErrorCode::MissingVersion);

    // Present but empty is still a version
    auto config = WorkloadConfigParser::parse("workload:///csv/bank/accounts?version=");
    assert(config.version.empty());
    std::cout << "test_missing_version passed.\n";
}

void test_version_is_verbatim() {
    auto config = WorkloadConfigParser::parse("workload:///csv/bank/accounts?version=%201.0.0-RC%2B1");
    assert(config.version == " 1.0.0-RC+1");
    std::cout << "test_version_is_verbatim passed.\n";
}

void test_row_bounds() {
    expect_code("workload:///csv/bank/accounts?version=1&row-start=abc", StorageErrorCode::BadRowBound);
    expect_code("workload:///csv/bank/accounts?version=1&row-end=1.5", StorageErrorCode::BadRowBound);
    expect_code("workload:///csv/bank/accounts?version=1&row-end=10x", StorageErrorCode::BadRowBound);
    expect_code("workload:///csv/bank/accounts?version=1&row-start=99999999999999999999", StorageErrorCode::BadRowBound);
    expect_code("workload:///csv/bank/accounts?version=1&row-start=-1", StorageErrorCode::BadRowBound);
    expect_code("workload:///csv/bank/accounts?version=1&row-start=10&row-end=5", StorageErrorCode::BadRowBound);

    auto big = WorkloadConfigParser::parse("workload:///csv/bank/accounts?version=1&row-start=9223372036854775806&row-end=9223372036854775807");
    assert(big.row_begin == 9223372036854775806LL);
    assert(big.row_end == 9223372036854775807LL);

    // Present but empty or undecodable bounds never fall back to unbounded
    expect_code("workload:///csv/bank/accounts?version=1&row-start=&row-end=", StorageErrorCode::BadRowBound);
    expect_code("workload:///csv/bank/accounts?version=1&row-end=", StorageErrorCode::BadRowBound);
    expect_code("workload:///csv/bank/accounts?version=1&row-start=&row-end=10", StorageErrorCode::BadRowBound);
    expect_code("workload:///csv/meters/meters?version=1&row-end=10%", StorageErrorCode::BadRowBound);
    expect_code("workload:///csv/meters/meters?version=1&row-start=%zz1", StorageErrorCode::BadRowBound);

    auto defaults = WorkloadConfigParser::parse("workload:///csv/bank/accounts?version=1");
    assert(defaults.row_begin == 0);
    assert(defaults.row_end == 0);
    assert(defaults.row_end_unbounded());
    assert(defaults.flags.empty());

    auto open_end = WorkloadConfigParser::parse("workload:///csv/bank/accounts?version=1&row-start=%2B7");
    assert(open_end.row_begin == 7);
    assert(open_end.row_end == 0);
    std::cout << "test_row_bounds passed.\n";
}

void test_unsupported_format() {
    expect_code("workload:///json/bank/accounts?version=1.0.0", StorageErrorCode::UnsupportedFormat);
    expect_code("workload:///csvx/bank/accounts?version=1.0.0", StorageErrorCode::UnsupportedFormat);
    try {
        WorkloadConfigParser::parse("workload:///parquet/bank/accounts?version=1");
    } catch (const StorageError& e) {
        assert(std::string(e.what()).find("parquet") != std::string::npos);
    }
    std::cout << "test_unsupported_format passed.\n";
}

void test_extra_params_become_flags() {
    auto config = WorkloadConfigParser::parse(
        "workload:///csv/bank/accounts?version=1.0.0&rows=100&seed=7&tag=b&payload-bytes=20&tag=a");

    std::set<std::string> flags(config.flags.begin(), config.flags.end());
    assert(config.flags.size() == 5);
    assert(flags == (std::set<std::string>{
        "--rows=100", "--seed=7", "--payload-bytes=20", "--tag=b", "--tag=a"}));

    // Values of a repeated key keep their relative order
    size_t pos_b = 0;
    size_t pos_a = 0;
    for (size_t i = 0; i < config.flags.size(); ++i) {
        if (config.flags[i] == "--tag=b") pos_b = i;
        if (config.flags[i] == "--tag=a") pos_a = i;
    }
    assert(pos_b < pos_a);

    // Reserved keys never leak into flags
    for (const auto& flag : config.flags) {
        assert(flag.find("--version") != 0);
        assert(flag.find("--row-") != 0);
    }
    std::cout << "test_extra_params_become_flags passed.\n";
}

int main() {
    test_parse_bank_accounts();
    test_parse_path_only_uri();
    test_segments_kept_verbatim();
    test_malformed_paths();
    test_missing_version();
    test_version_is_verbatim();
    test_row_bounds();
    test_unsupported_format();
    test_extra_params_become_flags();
    std::cout << "All WorkloadConfigParser tests passed!\n";
    return 0;
}
