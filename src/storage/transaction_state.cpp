// src/storage/transaction_state.cpp
#include "../../include/storage/transaction_state.h"

#include <magic_enum/magic_enum.hpp>

namespace mapstore {

std::string_view transactionPhaseToString(TransactionPhase phase) {
    return magic_enum::enum_name(phase);
}

} // namespace mapstore
