// include/storage/transaction_resource.h
#pragma once

#include "transaction_state.h"

namespace mapstore {

// What a TransactionManager needs from an enlisted transaction.
class TransactionResource {
public:
    virtual ~TransactionResource() = default;

    virtual TxnId getId() const = 0;
    virtual TransactionPhase getPhase() const = 0;
    // Throws what commit() would, without applying anything.
    virtual void prepare() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;

    bool isActive() const { return getPhase() == TransactionPhase::ACTIVE; }
};

} // namespace mapstore
