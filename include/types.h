// include/types.h
#pragma once

#include <string>
#include <vector>
#include <variant>
#include <cstdint>
#include <optional>

namespace mapstore {

// --- Foundational Data Types ---
using TxnId = uint64_t;
static constexpr TxnId INVALID_TXN_ID = 0;

enum class IndexSortOrder {
    ASCENDING,
    DESCENDING
};

// --- Field values seen by criteria and ordering ---
using ValueType = std::variant<
    std::monostate,         // index 0 (absent value)
    int64_t,                // index 1
    double,                 // index 2
    std::string,            // index 3
    bool                    // index 4
>;

enum class FilterOperator {
    EQUAL,
    NOT_EQUAL,
    LESS_THAN,
    LESS_THAN_OR_EQUAL,
    GREATER_THAN,
    GREATER_THAN_OR_EQUAL,
    LIKE,           // '%' wildcard, case-sensitive
    ILIKE,          // '%' wildcard, case-insensitive; exact match without '%'
    IN,
    EXISTS,
    NOT_EXISTS
};

struct OrderByClause {
    std::string field;
    IndexSortOrder direction = IndexSortOrder::ASCENDING;
};

/**
 * @brief Three-way comparison of two field values.
 *
 * Integers and doubles compare numerically with each other. Values of
 * otherwise different kinds order by kind, with an absent value first.
 */
int compareValues(const ValueType& a, const ValueType& b);

bool valuesEqual(const ValueType& a, const ValueType& b);

std::string valueToString(const ValueType& value);

/**
 * @brief SQL LIKE style match where '%' stands for any (possibly empty)
 * run of characters.
 */
bool likeMatches(const std::string& text, const std::string& pattern, bool case_insensitive);

// Number of operands an operator takes; nullopt means any count.
std::optional<size_t> operandCount(FilterOperator op);

} // namespace mapstore
