// include/mapstore.h
#pragma once

#include "types.h"
#include "debug_utils.h"
#include "key_convertor.h"
#include "config.h"
#include "storage_error/error_utils.h"
#include "storage_error/error_context.h"
#include "storage/lazy_sequence.h"
#include "storage/criteria.h"
#include "storage/entity_store.h"
#include "storage/in_memory_entity_store.h"
#include "storage/file_entity_store.h"
#include "storage/transaction.h"
#include "storage/transaction_manager.h"
#include "events/event_bus.h"
#include "client/removal_coordinator.h"
#include "client/client_provider.h"
#include "role/role_provider.h"
#include "clientscope/client_scope_provider.h"
#include "session.h"
