#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace libbnx {

// Closed outcome value: boolean, integer or string. Alternatives never compare equal to each
// other, so true and 1 are distinct outcomes.
class Outcome {
public:
    Outcome() = default;
    Outcome(bool value) : value_(value) {}
    Outcome(int value) : value_(static_cast<std::int64_t>(value)) {}
    Outcome(std::int64_t value) : value_(value) {}
    Outcome(const char* value) : value_(std::string(value)) {}
    Outcome(std::string value) : value_(std::move(value)) {}

    [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(value_); }
    [[nodiscard]] bool is_integer() const noexcept { return std::holds_alternative<std::int64_t>(value_); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(value_); }

    [[nodiscard]] bool as_bool() const { return std::get<bool>(value_); }
    [[nodiscard]] std::int64_t as_integer() const { return std::get<std::int64_t>(value_); }
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(value_); }

    [[nodiscard]] const std::variant<bool, std::int64_t, std::string>& value() const noexcept { return value_; }

    friend bool operator==(const Outcome&, const Outcome&) = default;
    friend auto operator<=>(const Outcome&, const Outcome&) = default;

private:
    std::variant<bool, std::int64_t, std::string> value_{false};
};

// Ordered tuple of outcomes: a CPT parent row or a full joint assignment.
using Row = std::vector<Outcome>;

[[nodiscard]] std::string to_string(const Outcome& outcome);

[[nodiscard]] std::string to_string(const Row& row);

struct OutcomeHash {
    [[nodiscard]] std::size_t operator()(const Outcome& outcome) const noexcept {
        return std::hash<std::variant<bool, std::int64_t, std::string>>{}(outcome.value());
    }
};

struct RowHash {
    [[nodiscard]] std::size_t operator()(const Row& row) const noexcept {
        std::size_t seed = row.size();
        for (const auto& outcome : row) {
            seed ^= OutcomeHash{}(outcome) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};

// Stable reference to a network member: the owning network's serial plus the canonical index.
struct VariableHandle {
    std::uint64_t network{0};
    std::size_t index{0};

    friend bool operator==(const VariableHandle&, const VariableHandle&) = default;
    friend auto operator<=>(const VariableHandle&, const VariableHandle&) = default;
};

using Evidence = std::map<VariableHandle, Outcome>;

using NamedEvidence = std::map<std::string, Outcome>;

struct InferenceOptions {
    bool verbose{false};       // Print enumeration diagnostics to stdout
    bool cache_joint{true};    // Reuse the network's joint distribution across queries
    std::size_t max_joint_rows{std::size_t{1} << 24};  // Upper bound on enumerated rows
};

inline constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

}  // namespace libbnx
