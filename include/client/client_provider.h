// include/client/client_provider.h
#pragma once

#include "client_adapter.h"
#include "client_entity.h"
#include "node_registry.h"
#include "user_client_references.h"
#include "../clientscope/client_scope_provider.h"
#include "../config.h"
#include "../events/event_bus.h"
#include "../role/role_provider.h"
#include "../storage/transaction.h"
#include "../storage/transaction_manager.h"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mapstore {

/**
 * @brief Client domain provider of one request.
 *
 * Every lookup is scoped to a realm: an entity of another realm is
 * reported as absent, and an empty realm id sees nothing. Mutations are
 * buffered in the provider's transaction, enlisted in the request's
 * TransactionManager, and reach the store when the manager commits.
 */
template<typename K>
class ClientProvider {
public:
    using Entity = ClientEntity<K>;
    using Store = EntityStore<K, Entity>;
    using AdapterPtr = std::shared_ptr<ClientAdapter<K>>;
    using ClientScope = ClientScopeEntity<K>;
    using PostCreateHook = std::function<void(ClientAdapter<K>&)>;

    struct Dependencies {
        TransactionManager& transaction_manager;
        EventBus& event_bus;
        NodeRegistry<K>& node_registry;
        RoleProvider<K>& roles;
        ClientScopeProvider<K>& client_scopes;
        UserClientReferences& users;
    };

    ClientProvider(Store& store, Dependencies deps, ClientProviderConfig config = ClientProviderConfig(),
                   std::vector<PostCreateHook> post_create_hooks = {});

    /**
     * @brief Creates a client with the supplied or a generated key.
     *
     * clientId defaults to the key string; enabled and standard flow start
     * on. Publishes ClientCreatedEvent, then runs updateClient() and the
     * post-create hooks. A hook failure withdraws the buffered create and
     * propagates.
     *
     * @throws StorageError MODEL_DUPLICATE when the key exists,
     *         INVALID_KEY_FORMAT for a malformed `id`.
     */
    AdapterPtr addClient(const std::string& realm_id,
                         const std::optional<std::string>& id = std::nullopt,
                         const std::optional<std::string>& client_id = std::nullopt);

    AdapterPtr getClientById(const std::string& realm_id, const std::string& id);

    // Exact, case-insensitive match on the business key.
    AdapterPtr getClientByClientId(const std::string& realm_id, const std::string& client_id);

    // Ordered by clientId.
    LazySequence<AdapterPtr> getClients(const std::string& realm_id);
    LazySequence<AdapterPtr> getClients(const std::string& realm_id, std::optional<size_t> first,
                                        std::optional<size_t> max);

    // Case-insensitive substring match, ordered by clientId.
    LazySequence<AdapterPtr> searchClientsByClientId(const std::string& realm_id, const std::string& client_id,
                                                     std::optional<size_t> first = std::nullopt,
                                                     std::optional<size_t> max = std::nullopt);

    // Clients carrying every given attribute value, ordered by clientId.
    LazySequence<AdapterPtr> searchClientsByAttributes(const std::string& realm_id,
                                                       const std::map<std::string, std::string>& attributes,
                                                       std::optional<size_t> first = std::nullopt,
                                                       std::optional<size_t> max = std::nullopt);

    LazySequence<AdapterPtr> getAlwaysDisplayInConsoleClients(const std::string& realm_id);

    size_t getClientsCount(const std::string& realm_id);

    // Client storage id -> redirect URIs, for enabled clients that have any.
    std::map<std::string, std::set<std::string>> getAllRedirectUrisOfEnabledClients(const std::string& realm_id);

    /**
     * @brief Removes the client after its dependents.
     *
     * Steps: user references, client roles, then scope mappings to those
     * roles in the realm's clients. ClientRemovedEvent is published while
     * the client is still readable, the delete is buffered and the client's
     * node registrations are dropped.
     *
     * @return false when no such client is visible.
     * @throws StorageError CASCADE_FAILED when a step fails; nothing is
     *         deleted and the request is marked rollback-only.
     */
    bool removeClient(const std::string& realm_id, const std::string& id);

    void removeClients(const std::string& realm_id);

    // Attaches scopes of the client's protocol not yet attached (by id or name).
    void addClientScopes(const std::string& realm_id, ClientAdapter<K>& client,
                         const std::vector<ClientScope>& scopes, bool default_scope);

    void removeClientScope(const std::string& realm_id, ClientAdapter<K>& client, const std::string& scope_id);

    // Attached scopes of the client's protocol, keyed by scope name.
    std::map<std::string, ClientScope> getClientScopes(const std::string& realm_id, ClientAdapter<K>& client,
                                                       bool default_scope);

    // Drops scope mappings to `role_id` from every client of the realm.
    Status preRemove(const std::string& realm_id, const std::string& role_id);

    void addPostCreateHook(PostCreateHook hook) { post_create_hooks_.push_back(std::move(hook)); }

    Transaction<K, Entity>& transaction() { return *tx_; }

private:
    using HandlePtr = typename ClientAdapter<K>::HandlePtr;

    AdapterPtr toAdapter(HandlePtr handle);
    Result<HandlePtr> findClient(const std::string& realm_id, const std::string& id);
    CriteriaBuilder<Entity> realmCriteria(const std::string& realm_id) const;
    LazySequence<AdapterPtr> readAdapters(const QueryParameters<Entity>& params);
    std::string effectiveProtocol(const ClientAdapter<K>& client) const;

    std::shared_ptr<Transaction<K, Entity>> tx_;
    Dependencies deps_;
    ClientProviderConfig config_;
    std::vector<PostCreateHook> post_create_hooks_;
};

} // namespace mapstore
