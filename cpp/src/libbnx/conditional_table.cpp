#include "libbnx/conditional_table.hpp"

#include "libbnx/errors.hpp"

#include <stdexcept>
#include <string>

namespace libbnx {

ConditionalTable::ConditionalTable(std::size_t parent_count) : parent_count_(parent_count) {}

ConditionalTable ConditionalTable::from_spec(const CptSpec& spec, std::size_t parent_count) {
    ConditionalTable table(parent_count);
    if (spec.is_prior()) {
        if (parent_count != 0) {
            throw std::invalid_argument("bare distribution requires zero parents, got " + std::to_string(parent_count));
        }
        table.set_row(Row{}, ProbabilityTable::from_spec(spec.distribution()));
        return table;
    }
    for (const auto& entry : spec.entries()) {
        table.set_row(entry.key.canonical(parent_count), ProbabilityTable::from_spec(entry.distribution));
    }
    return table;
}

void ConditionalTable::set_row(Row row, ProbabilityTable table) {
    if (row.size() != parent_count_) {
        throw std::invalid_argument("cpt row " + to_string(row) + " does not match parent count " +
                                    std::to_string(parent_count_));
    }
    auto it = index_.find(row);
    if (it != index_.end()) {
        rows_[it->second].second = std::move(table);
        return;
    }
    index_.emplace(row, rows_.size());
    rows_.emplace_back(std::move(row), std::move(table));
}

const ProbabilityTable& ConditionalTable::lookup(const Row& row) const {
    auto it = index_.find(row);
    if (it == index_.end()) {
        throw MissingConditionalRow("no cpt row for parent values " + to_string(row));
    }
    return rows_[it->second].second;
}

bool ConditionalTable::contains(const Row& row) const {
    return index_.contains(row);
}

std::size_t ConditionalTable::parent_count() const noexcept {
    return parent_count_;
}

std::size_t ConditionalTable::size() const noexcept {
    return rows_.size();
}

const std::vector<std::pair<Row, ProbabilityTable>>& ConditionalTable::rows() const noexcept {
    return rows_;
}

}  // namespace libbnx
