// include/session.h
#pragma once

#include "client/client_provider.h"
#include "clientscope/client_scope_provider.h"
#include "config.h"
#include "events/event_bus.h"
#include "role/role_provider.h"
#include "storage/transaction_manager.h"

#include <memory>
#include <vector>

namespace mapstore {

template<typename K>
class Session;

/**
 * @brief Process-wide state shared by all sessions: the stores, the event
 * bus, the node registry and the user-domain hook.
 */
template<typename K>
class SessionFactory {
public:
    using ClientStore = EntityStore<K, ClientEntity<K>>;
    using RoleStore = EntityStore<K, RoleEntity<K>>;
    using ClientScopeStore = EntityStore<K, ClientScopeEntity<K>>;

    SessionFactory(const StoreConfig& store_config, ClientProviderConfig client_config,
                   std::shared_ptr<const KeyConvertor<K>> convertor,
                   std::shared_ptr<EventBus> event_bus = std::make_shared<EventBus>())
        : client_store_(makeStore<K, ClientEntity<K>>(store_config, "clients", convertor,
                                                      ClientEntity<K>::fieldDescriptors())),
          role_store_(makeStore<K, RoleEntity<K>>(store_config, "roles", convertor, RoleEntity<K>::fieldDescriptors())),
          client_scope_store_(makeStore<K, ClientScopeEntity<K>>(store_config, "client_scopes", convertor,
                                                                 ClientScopeEntity<K>::fieldDescriptors())),
          client_config_(std::move(client_config)),
          event_bus_(std::move(event_bus)),
          users_(std::make_shared<NoUserClientReferences>()) {
        LOG_INFO("[SessionFactory] Initialized with ", convertor->formatName(), " keys.");
    }

    std::unique_ptr<Session<K>> createSession() { return std::make_unique<Session<K>>(*this); }

    void setUserClientReferences(std::shared_ptr<UserClientReferences> users) {
        users_ = users ? std::move(users) : std::make_shared<NoUserClientReferences>();
    }

    void addClientPostCreateHook(typename ClientProvider<K>::PostCreateHook hook) {
        post_create_hooks_.push_back(std::move(hook));
    }

    ClientStore& clientStore() { return *client_store_; }
    RoleStore& roleStore() { return *role_store_; }
    ClientScopeStore& clientScopeStore() { return *client_scope_store_; }
    EventBus& eventBus() { return *event_bus_; }
    NodeRegistry<K>& nodeRegistry() { return node_registry_; }
    UserClientReferences& userClientReferences() { return *users_; }
    const ClientProviderConfig& clientProviderConfig() const { return client_config_; }
    const std::vector<typename ClientProvider<K>::PostCreateHook>& clientPostCreateHooks() const {
        return post_create_hooks_;
    }

private:
    std::unique_ptr<ClientStore> client_store_;
    std::unique_ptr<RoleStore> role_store_;
    std::unique_ptr<ClientScopeStore> client_scope_store_;
    ClientProviderConfig client_config_;
    std::shared_ptr<EventBus> event_bus_;
    NodeRegistry<K> node_registry_;
    std::shared_ptr<UserClientReferences> users_;
    std::vector<typename ClientProvider<K>::PostCreateHook> post_create_hooks_;
};

/**
 * @brief One request: a TransactionManager and the providers whose
 * transactions it commits together. Used by a single thread. Destroying a
 * session that was neither committed nor rolled back rolls it back.
 */
template<typename K>
class Session {
public:
    explicit Session(SessionFactory<K>& factory)
        : factory_(factory),
          roles_(factory.roleStore(), transaction_manager_),
          client_scopes_(factory.clientScopeStore(), transaction_manager_),
          clients_(factory.clientStore(),
                   typename ClientProvider<K>::Dependencies{transaction_manager_, factory.eventBus(),
                                                             factory.nodeRegistry(), roles_, client_scopes_,
                                                             factory.userClientReferences()},
                   factory.clientProviderConfig(), factory.clientPostCreateHooks()) {}

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    ClientProvider<K>& clients() { return clients_; }
    RoleProvider<K>& roles() { return roles_; }
    ClientScopeProvider<K>& clientScopes() { return client_scopes_; }
    TransactionManager& transactionManager() { return transaction_manager_; }
    SessionFactory<K>& factory() { return factory_; }

    void commit() { transaction_manager_.commit(); }
    void rollback() { transaction_manager_.rollback(); }

private:
    SessionFactory<K>& factory_;
    // Declared first: destroyed after the providers, rolls back what is still open.
    TransactionManager transaction_manager_;
    RoleProvider<K> roles_;
    ClientScopeProvider<K> client_scopes_;
    ClientProvider<K> clients_;
};

} // namespace mapstore
