// src/types.cpp
#include "../include/types.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <type_traits>

namespace mapstore {

namespace {

    bool isNumeric(const ValueType& v) {
        return std::holds_alternative<int64_t>(v) || std::holds_alternative<double>(v);
    }

    double asDouble(const ValueType& v) {
        if (const auto* i = std::get_if<int64_t>(&v)) {
            return static_cast<double>(*i);
        }
        return std::get<double>(v);
    }

    template<typename T>
    int threeWay(const T& a, const T& b) {
        if (a < b) return -1;
        if (b < a) return 1;
        return 0;
    }

    char foldCase(char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

} // end anonymous namespace

int compareValues(const ValueType& a, const ValueType& b) {
    if (isNumeric(a) && isNumeric(b)) {
        if (std::holds_alternative<int64_t>(a) && std::holds_alternative<int64_t>(b)) {
            return threeWay(std::get<int64_t>(a), std::get<int64_t>(b));
        }
        return threeWay(asDouble(a), asDouble(b));
    }
    if (a.index() != b.index()) {
        return threeWay(a.index(), b.index());
    }
    switch (a.index()) {
        case 0: return 0;
        case 3: return threeWay(std::get<std::string>(a), std::get<std::string>(b));
        case 4: return threeWay(std::get<bool>(a), std::get<bool>(b));
        default: return 0;
    }
}

bool valuesEqual(const ValueType& a, const ValueType& b) {
    return compareValues(a, b) == 0;
}

std::string valueToString(const ValueType& value) {
    std::ostringstream oss;
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << '"' << v << '"';
        } else {
            oss << v;
        }
    }, value);
    return oss.str();
}

bool likeMatches(const std::string& text, const std::string& pattern, bool case_insensitive) {
    auto same = [case_insensitive](char a, char b) {
        return case_insensitive ? foldCase(a) == foldCase(b) : a == b;
    };

    // Greedy wildcard matching with backtracking to the last '%'.
    size_t t = 0, p = 0;
    size_t star_p = std::string::npos, star_t = 0;
    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '%') {
            star_p = p++;
            star_t = t;
        } else if (p < pattern.size() && same(text[t], pattern[p])) {
            ++t;
            ++p;
        } else if (star_p != std::string::npos) {
            p = star_p + 1;
            t = ++star_t;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '%') {
        ++p;
    }
    return p == pattern.size();
}

std::optional<size_t> operandCount(FilterOperator op) {
    switch (op) {
        case FilterOperator::EXISTS:
        case FilterOperator::NOT_EXISTS:
            return 0;
        case FilterOperator::IN:
            return std::nullopt;
        default:
            return 1;
    }
}

} // namespace mapstore
