#pragma once

#include "Generator.hpp"

// Accounts with a zero balance and a random lowercase payload.
class BankGenerator : public Generator {
public:
    static const GeneratorMeta& metadata();

    BankGenerator();
    ~BankGenerator() override = default;

    const GeneratorMeta& meta() const override { return metadata(); }
    std::vector<Table> tables() const override;
    FlagSet* flags() override { return &flags_; }

private:
    FlagSet flags_;
};
