#include "BankGenerator.hpp"
#include "RowRandom.hpp"

const GeneratorMeta& BankGenerator::metadata() {
    static const GeneratorMeta meta{
        "bank",
        "1.0.0",
        "Bank accounts with random payloads",
        []() -> std::unique_ptr<Generator> { return std::make_unique<BankGenerator>(); }
    };
    return meta;
}

BankGenerator::BankGenerator() : flags_("bank") {
    flags_.add_int("rows", 1000, "Initial number of accounts", 0);
    flags_.add_int("payload-bytes", 100, "Size of the payload field in each account", 0);
    flags_.add_int("seed", 1, "Key hash seed");
}

std::vector<Table> BankGenerator::tables() const {
    const int64_t rows = flags_.get_int("rows");
    const int64_t payload_bytes = flags_.get_int("payload-bytes");
    const int64_t seed = flags_.get_int("seed");

    Table accounts;
    accounts.name = "accounts";
    accounts.columns = {"id", "balance", "payload"};
    accounts.row_count = rows;
    accounts.row = [payload_bytes, seed](int64_t index) -> Row {
        RowRandom rng(seed, index);
        return Row{index, int64_t{0}, rng.letters(static_cast<size_t>(payload_bytes))};
    };

    return {std::move(accounts)};
}
