// include/storage/criteria.h
#pragma once

#include "../types.h"
#include "../storage_error/storage_error.h"

#include <algorithm>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

namespace mapstore {

template<typename T>
ValueType makeValue(const T& v) {
    using D = std::decay_t<T>;
    if constexpr (std::is_same_v<D, ValueType>) {
        return v;
    } else if constexpr (std::is_same_v<D, bool>) {
        return ValueType(v);
    } else if constexpr (std::is_integral_v<D>) {
        return ValueType(static_cast<int64_t>(v));
    } else if constexpr (std::is_floating_point_v<D>) {
        return ValueType(static_cast<double>(v));
    } else {
        static_assert(std::is_convertible_v<const T&, std::string>, "unsupported criteria operand type");
        return ValueType(std::string(v));
    }
}

// --- Extractor helpers for field descriptors ---
inline std::vector<ValueType> toValues(const std::string& s) { return {ValueType(s)}; }
inline std::vector<ValueType> toValues(bool b) { return {ValueType(b)}; }
inline std::vector<ValueType> toValues(const std::optional<std::string>& s) {
    return s ? std::vector<ValueType>{ValueType(*s)} : std::vector<ValueType>{};
}
inline std::vector<ValueType> toValues(const std::set<std::string>& items) {
    return std::vector<ValueType>(items.begin(), items.end());
}

/**
 * @brief Generic any-of matching of a field's values against operands.
 *
 * Set-valued fields satisfy a positive operator when any element does;
 * NOT_EQUAL holds when no element equals the operand.
 */
bool matchValues(const std::vector<ValueType>& values, FilterOperator op, const std::vector<ValueType>& operands);

std::string operatorName(FilterOperator op);

/**
 * @brief How a backend resolves one searchable field of entity type V.
 */
template<typename V>
struct FieldDescriptor {
    using Extractor = std::function<std::vector<ValueType>(const V&)>;
    using Matcher = std::function<bool(const V&, FilterOperator, const std::vector<ValueType>&)>;

    std::string name;
    Extractor extract;                      // Empty for matcher-only fields
    Matcher matcher;                        // Overrides matchValues when set
    std::vector<FilterOperator> operators;  // Empty: every generic operator
    std::optional<size_t> operand_count;    // Overrides the operator arity when set

    bool sortable() const { return static_cast<bool>(extract); }

    bool supports(FilterOperator op) const {
        return operators.empty() || std::find(operators.begin(), operators.end(), op) != operators.end();
    }

    bool matches(const V& entity, FilterOperator op, const std::vector<ValueType>& operands) const {
        if (matcher) {
            return matcher(entity, op, operands);
        }
        return matchValues(extract(entity), op, operands);
    }
};

template<typename V>
class FieldDescriptors {
public:
    using Extractor = typename FieldDescriptor<V>::Extractor;
    using Matcher = typename FieldDescriptor<V>::Matcher;

    FieldDescriptors& field(const std::string& name, Extractor extract) {
        FieldDescriptor<V> d;
        d.name = name;
        d.extract = std::move(extract);
        fields_[name] = std::move(d);
        return *this;
    }

    FieldDescriptors& customField(const std::string& name, Matcher matcher,
                                  std::vector<FilterOperator> operators, size_t operand_count) {
        FieldDescriptor<V> d;
        d.name = name;
        d.matcher = std::move(matcher);
        d.operators = std::move(operators);
        d.operand_count = operand_count;
        fields_[name] = std::move(d);
        return *this;
    }

    const FieldDescriptor<V>* find(const std::string& name) const {
        auto it = fields_.find(name);
        return it == fields_.end() ? nullptr : &it->second;
    }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        for (const auto& [name, d] : fields_) {
            out.push_back(name);
        }
        return out;
    }

private:
    std::map<std::string, FieldDescriptor<V>> fields_;
};

struct Criterion {
    std::string field;
    FilterOperator op;
    std::vector<ValueType> operands;
};

/**
 * @brief Conjunction of (field, operator, operands) criteria.
 *
 * Criteria are validated against the store's field descriptors when they
 * are added, so an unknown field or unsupported operator fails while the
 * query is being built and never while it runs.
 */
template<typename V>
class CriteriaBuilder {
public:
    explicit CriteriaBuilder(std::shared_ptr<const FieldDescriptors<V>> fields)
        : fields_(std::move(fields)) {}

    /**
     * @throws StorageError UNSUPPORTED_FIELD for an unknown field or an
     *         operator the field cannot evaluate.
     * @throws StorageError INVALID_VALUE for a wrong operand count.
     */
    CriteriaBuilder& compareOperands(const std::string& field, FilterOperator op, std::vector<ValueType> operands) {
        const FieldDescriptor<V>* d = fields_ ? fields_->find(field) : nullptr;
        if (d == nullptr) {
            throw StorageError::unsupportedField(field, "Field '" + field + "' is not searchable");
        }
        if (!d->supports(op)) {
            throw StorageError::unsupportedField(field,
                "Operator " + operatorName(op) + " is not supported on field '" + field + "'");
        }
        std::optional<size_t> expected = d->operand_count ? d->operand_count : operandCount(op);
        if (expected && *expected != operands.size()) {
            throw StorageError(ErrorCode::INVALID_VALUE, "Wrong number of criteria operands")
                .withDetails(operatorName(op) + " on '" + field + "' takes " + std::to_string(*expected) +
                             " operand(s), got " + std::to_string(operands.size()))
                .withContext("field", field);
        }
        criteria_.push_back(Criterion{field, op, std::move(operands)});
        return *this;
    }

    template<typename... Args>
    CriteriaBuilder& compare(const std::string& field, FilterOperator op, const Args&... operands) {
        return compareOperands(field, op, std::vector<ValueType>{makeValue(operands)...});
    }

    CriteriaBuilder& andAlso(const CriteriaBuilder& other) {
        criteria_.insert(criteria_.end(), other.criteria_.begin(), other.criteria_.end());
        return *this;
    }

    bool matches(const V& entity) const {
        for (const Criterion& c : criteria_) {
            if (!fields_->find(c.field)->matches(entity, c.op, c.operands)) {
                return false;
            }
        }
        return true;
    }

    const std::vector<Criterion>& criteria() const { return criteria_; }
    const std::shared_ptr<const FieldDescriptors<V>>& fields() const { return fields_; }

    std::string toString() const {
        std::ostringstream oss;
        for (size_t i = 0; i < criteria_.size(); ++i) {
            if (i > 0) oss << " AND ";
            oss << criteria_[i].field << ' ' << operatorName(criteria_[i].op);
            for (const ValueType& v : criteria_[i].operands) {
                oss << ' ' << valueToString(v);
            }
        }
        return oss.str();
    }

private:
    std::shared_ptr<const FieldDescriptors<V>> fields_;
    std::vector<Criterion> criteria_;
};

/**
 * @brief Criteria plus optional pagination and ordering for a read.
 */
template<typename V>
class QueryParameters {
public:
    static QueryParameters withCriteria(CriteriaBuilder<V> criteria) {
        return QueryParameters(std::move(criteria));
    }

    // Paginated reads are always ordered; order_field becomes the primary order.
    QueryParameters& pagination(std::optional<size_t> first, std::optional<size_t> max, const std::string& order_field) {
        orderBy(order_field, IndexSortOrder::ASCENDING);
        return pagination(first, max);
    }

    QueryParameters& pagination(std::optional<size_t> first, std::optional<size_t> max) {
        offset_ = first;
        limit_ = max;
        return *this;
    }

    /**
     * @throws StorageError UNSUPPORTED_FIELD when the field has no orderable value.
     */
    QueryParameters& orderBy(const std::string& field, IndexSortOrder direction) {
        const FieldDescriptor<V>* d = criteria_.fields() ? criteria_.fields()->find(field) : nullptr;
        if (d == nullptr || !d->sortable()) {
            throw StorageError::unsupportedField(field, "Field '" + field + "' cannot be used for ordering");
        }
        ordering_.push_back(OrderByClause{field, direction});
        return *this;
    }

    const CriteriaBuilder<V>& criteria() const { return criteria_; }
    std::optional<size_t> offset() const { return offset_; }
    std::optional<size_t> limit() const { return limit_; }
    const std::vector<OrderByClause>& ordering() const { return ordering_; }

    bool isPaginated() const { return offset_.has_value() || limit_.has_value(); }
    bool isOrdered() const { return !ordering_.empty(); }

    QueryParameters withoutPagination() const {
        QueryParameters copy(*this);
        copy.offset_.reset();
        copy.limit_.reset();
        return copy;
    }

    // Three-way comparison over the ordering clauses (first value of each field).
    int compare(const V& a, const V& b) const {
        for (const OrderByClause& clause : ordering_) {
            const FieldDescriptor<V>* d = criteria_.fields()->find(clause.field);
            std::vector<ValueType> va = d->extract(a);
            std::vector<ValueType> vb = d->extract(b);
            ValueType left = va.empty() ? ValueType{} : va.front();
            ValueType right = vb.empty() ? ValueType{} : vb.front();
            int c = mapstore::compareValues(left, right);
            if (c != 0) {
                return clause.direction == IndexSortOrder::ASCENDING ? c : -c;
            }
        }
        return 0;
    }

private:
    explicit QueryParameters(CriteriaBuilder<V> criteria) : criteria_(std::move(criteria)) {}

    CriteriaBuilder<V> criteria_;
    std::optional<size_t> offset_;
    std::optional<size_t> limit_;
    std::vector<OrderByClause> ordering_;
};

/**
 * @brief Applies ordering and the [offset, offset + limit) window.
 *
 * Ties, and paginated reads without ordering, are broken by the key's
 * canonical string so page boundaries are deterministic.
 */
template<typename V, typename KeyString>
std::vector<V> orderAndSlice(std::vector<V> rows, const QueryParameters<V>& params, KeyString key_string) {
    if (params.isOrdered() || params.isPaginated()) {
        std::sort(rows.begin(), rows.end(), [&](const V& a, const V& b) {
            int c = params.compare(a, b);
            if (c != 0) return c < 0;
            return key_string(a) < key_string(b);
        });
    }
    if (params.isPaginated()) {
        size_t first = std::min(params.offset().value_or(0), rows.size());
        size_t last = rows.size();
        if (params.limit()) {
            last = first + std::min(*params.limit(), rows.size() - first);
        }
        using Diff = typename std::vector<V>::difference_type;
        rows = std::vector<V>(std::make_move_iterator(rows.begin() + static_cast<Diff>(first)),
                              std::make_move_iterator(rows.begin() + static_cast<Diff>(last)));
    }
    return rows;
}

} // namespace mapstore
