#pragma once

#include "libbnx/cpt_spec.hpp"
#include "libbnx/model_types.hpp"
#include "libbnx/probability_table.hpp"

#include <cstddef>
#include <unordered_map>
#include <utility>
#include <vector>

namespace libbnx {

class ConditionalTable {
public:
    explicit ConditionalTable(std::size_t parent_count);

    // Normalizes the zero-parent and single-parent shorthands into canonical rows.
    [[nodiscard]] static ConditionalTable from_spec(const CptSpec& spec, std::size_t parent_count);

    // Inserts a row, replacing an earlier row with the same key.
    void set_row(Row row, ProbabilityTable table);

    [[nodiscard]] const ProbabilityTable& lookup(const Row& row) const;

    [[nodiscard]] bool contains(const Row& row) const;

    [[nodiscard]] std::size_t parent_count() const noexcept;

    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] const std::vector<std::pair<Row, ProbabilityTable>>& rows() const noexcept;

private:
    std::size_t parent_count_;
    std::vector<std::pair<Row, ProbabilityTable>> rows_;
    std::unordered_map<Row, std::size_t, RowHash> index_;
};

}  // namespace libbnx
