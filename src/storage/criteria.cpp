// src/storage/criteria.cpp
#include "../../include/storage/criteria.h"

#include <magic_enum/magic_enum.hpp>

namespace mapstore {

namespace {

    bool isAbsent(const ValueType& v) {
        return std::holds_alternative<std::monostate>(v);
    }

    bool anyOf(const std::vector<ValueType>& values, const std::function<bool(const ValueType&)>& pred) {
        for (const ValueType& v : values) {
            if (!isAbsent(v) && pred(v)) {
                return true;
            }
        }
        return false;
    }

    bool likeValue(const ValueType& v, const ValueType& pattern, bool case_insensitive) {
        const auto* text = std::get_if<std::string>(&v);
        const auto* pat = std::get_if<std::string>(&pattern);
        if (text == nullptr || pat == nullptr) {
            return false;
        }
        return likeMatches(*text, *pat, case_insensitive);
    }

} // end anonymous namespace

bool matchValues(const std::vector<ValueType>& values, FilterOperator op, const std::vector<ValueType>& operands) {
    switch (op) {
        case FilterOperator::EXISTS:
            return anyOf(values, [](const ValueType&) { return true; });
        case FilterOperator::NOT_EXISTS:
            return !anyOf(values, [](const ValueType&) { return true; });
        case FilterOperator::IN:
            return anyOf(values, [&operands](const ValueType& v) {
                for (const ValueType& candidate : operands) {
                    if (valuesEqual(v, candidate)) return true;
                }
                return false;
            });
        default:
            break;
    }

    const ValueType& operand = operands.front();
    switch (op) {
        case FilterOperator::EQUAL:
            return anyOf(values, [&](const ValueType& v) { return valuesEqual(v, operand); });
        case FilterOperator::NOT_EQUAL:
            return !anyOf(values, [&](const ValueType& v) { return valuesEqual(v, operand); });
        case FilterOperator::LESS_THAN:
            return anyOf(values, [&](const ValueType& v) { return compareValues(v, operand) < 0; });
        case FilterOperator::LESS_THAN_OR_EQUAL:
            return anyOf(values, [&](const ValueType& v) { return compareValues(v, operand) <= 0; });
        case FilterOperator::GREATER_THAN:
            return anyOf(values, [&](const ValueType& v) { return compareValues(v, operand) > 0; });
        case FilterOperator::GREATER_THAN_OR_EQUAL:
            return anyOf(values, [&](const ValueType& v) { return compareValues(v, operand) >= 0; });
        case FilterOperator::LIKE:
            return anyOf(values, [&](const ValueType& v) { return likeValue(v, operand, false); });
        case FilterOperator::ILIKE:
            return anyOf(values, [&](const ValueType& v) { return likeValue(v, operand, true); });
        default:
            return false;
    }
}

std::string operatorName(FilterOperator op) {
    return std::string(magic_enum::enum_name(op));
}

} // namespace mapstore
