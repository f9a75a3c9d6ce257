// include/storage_error/error_utils.h
#pragma once

#include "error_codes.h"
#include "storage_error.h"
#include "result.h"

#include <string>
#include <string_view>

namespace mapstore {
namespace error_utils {

    std::string_view errorCodeToString(ErrorCode code);
    std::string_view severityToString(ErrorSeverity severity);

    ErrorSeverity getErrorSeverity(ErrorCode code);
    ErrorCategory getErrorCategory(ErrorCode code);

} // namespace error_utils

// Propagate the error of a Result<T>/Status to the caller
#define MAPSTORE_RETURN_IF_ERROR(result_expression) \
    do { \
        auto&& _tmp_status_macro_result = (result_expression); \
        if (!_tmp_status_macro_result.isOk()) { \
            return std::move(_tmp_status_macro_result.error()); \
        } \
    } while(0)

// Usage: MAPSTORE_ASSIGN_OR_RETURN(my_value, function_that_returns_result());
#define MAPSTORE_ASSIGN_OR_RETURN(var, result_expression) \
    do { \
        auto&& _tmp_assign_macro_result = (result_expression); \
        if (!_tmp_assign_macro_result.isOk()) { \
            return std::move(_tmp_assign_macro_result.error()); \
        } \
        var = std::move(_tmp_assign_macro_result.value()); \
    } while(0)

} // namespace mapstore
