#pragma once

#include "libbnx/model_types.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace libbnx {

using Weights = std::vector<std::pair<Outcome, double>>;

// Authoring form of one distribution: explicit outcome weights, or a scalar p meaning
// {true: p, false: 1 - p}.
class DistributionSpec {
public:
    DistributionSpec(double p) : value_(p) {}
    DistributionSpec(Weights weights) : value_(std::move(weights)) {}
    DistributionSpec(std::initializer_list<std::pair<Outcome, double>> weights) : value_(Weights(weights)) {}

    [[nodiscard]] bool is_binary() const noexcept { return std::holds_alternative<double>(value_); }

    [[nodiscard]] double binary_probability() const { return std::get<double>(value_); }

    [[nodiscard]] const Weights& weights() const { return std::get<Weights>(value_); }

private:
    std::variant<double, Weights> value_;
};

// Authoring form of a CPT row key: a bare outcome (single-parent shorthand) or a full row.
class RowKey {
public:
    RowKey() : value_(Row{}) {}
    RowKey(bool value) : value_(Outcome(value)) {}
    RowKey(int value) : value_(Outcome(value)) {}
    RowKey(std::int64_t value) : value_(Outcome(value)) {}
    RowKey(const char* value) : value_(Outcome(value)) {}
    RowKey(std::string value) : value_(Outcome(std::move(value))) {}
    RowKey(Outcome value) : value_(std::move(value)) {}
    RowKey(Row row) : value_(std::move(row)) {}
    RowKey(std::initializer_list<Outcome> row) : value_(Row(row)) {}

    [[nodiscard]] bool is_bare() const noexcept { return std::holds_alternative<Outcome>(value_); }

    // Canonical row for a table with parent_count parents.
    [[nodiscard]] Row canonical(std::size_t parent_count) const;

private:
    std::variant<Outcome, Row> value_;
};

// CPT specification accepted by Network::add. Either a bare distribution (zero parents) or a
// list of (row key, distribution) entries.
class CptSpec {
public:
    struct Entry {
        RowKey key;
        DistributionSpec distribution;
    };

    [[nodiscard]] static CptSpec prior(DistributionSpec distribution);

    [[nodiscard]] static CptSpec rows(std::vector<Entry> entries);

    [[nodiscard]] bool is_prior() const noexcept { return std::holds_alternative<DistributionSpec>(value_); }

    [[nodiscard]] const DistributionSpec& distribution() const { return std::get<DistributionSpec>(value_); }

    [[nodiscard]] const std::vector<Entry>& entries() const { return std::get<std::vector<Entry>>(value_); }

private:
    explicit CptSpec(std::variant<DistributionSpec, std::vector<Entry>> value) : value_(std::move(value)) {}

    std::variant<DistributionSpec, std::vector<Entry>> value_;
};

}  // namespace libbnx
