// src/test/client_provider.test.cpp
#include "gtest/gtest.h"
#include "../../include/mapstore.h"

#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace mapstore;

namespace {

using Session_ = Session<std::string>;
using ClientPtr = ClientProvider<std::string>::AdapterPtr;

class RecordingUserReferences : public UserClientReferences {
public:
    Status preRemove(const std::string& realm_id, const std::string& client_id) override {
        calls.emplace_back(realm_id, client_id);
        if (failure) {
            return *failure;
        }
        return Status();
    }

    std::vector<std::pair<std::string, std::string>> calls;
    std::optional<StorageError> failure;
};

std::vector<std::string> clientIds(const LazySequence<ClientPtr>& clients) {
    std::vector<std::string> out;
    for (const ClientPtr& c : clients) {
        out.push_back(c->getClientId());
    }
    return out;
}

} // anonymous namespace

class ClientProviderTest : public ::testing::Test {
protected:
    std::shared_ptr<EventBus> bus = std::make_shared<EventBus>();
    std::shared_ptr<RecordingUserReferences> users = std::make_shared<RecordingUserReferences>();
    std::unique_ptr<SessionFactory<std::string>> factory;

    void SetUp() override {
        StoreConfig config;
        config.shard_count = 4;
        factory = std::make_unique<SessionFactory<std::string>>(config, ClientProviderConfig(),
                                                                std::make_shared<StringKeyConvertor>(), bus);
        factory->setUserClientReferences(users);
    }

    // Adds and commits clients with the given clientIds in realm `realm`; returns their ids.
    std::vector<std::string> seedClients(const std::string& realm, const std::vector<std::string>& client_ids) {
        auto session = factory->createSession();
        std::vector<std::string> ids;
        for (const std::string& client_id : client_ids) {
            ids.push_back(session->clients().addClient(realm, std::nullopt, client_id)->getId());
        }
        session->commit();
        return ids;
    }
};

TEST_F(ClientProviderTest, BusinessKeyLookupIsTenantScopedAndCaseInsensitive) {
    {
        auto session = factory->createSession();
        ClientPtr app = session->clients().addClient("r1", std::nullopt, "app1");
        EXPECT_TRUE(app->isEnabled());
        EXPECT_TRUE(app->isStandardFlowEnabled());
        EXPECT_EQ(app->getRealmId(), "r1");
        session->commit();
    }

    auto session = factory->createSession();
    ClientPtr found = session->clients().getClientByClientId("r1", "APP1");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->getClientId(), "app1");
    EXPECT_EQ(session->clients().getClientByClientId("r2", "app1"), nullptr);
    EXPECT_EQ(session->clients().getClientByClientId("r1", "app"), nullptr);
    EXPECT_EQ(clientIds(session->clients().getClients("r1")), (std::vector<std::string>{"app1"}));
    EXPECT_EQ(session->clients().getClientsCount("r1"), 1u);
    EXPECT_EQ(session->clients().getClientsCount("r2"), 0u);
}

TEST_F(ClientProviderTest, ClientIdDefaultsToKeyAndSuppliedKeyIsUsed) {
    auto session = factory->createSession();
    ClientPtr generated = session->clients().addClient("r1");
    EXPECT_EQ(generated->getClientId(), generated->getId());

    ClientPtr explicit_key = session->clients().addClient("r1", std::string("fixed-id"), std::string("portal"));
    EXPECT_EQ(explicit_key->getId(), "fixed-id");
    EXPECT_EQ(session->clients().getClientById("r1", "fixed-id")->getClientId(), "portal");
    session->rollback();
}

TEST_F(ClientProviderTest, CreationPublishesCreatedThenUpdated) {
    std::vector<std::string> events;
    bus->subscribe<ClientCreatedEvent<std::string>>(
        [&](const ClientCreatedEvent<std::string>& e) { events.push_back("created:" + e.client.getClientId()); });
    bus->subscribe<ClientUpdatedEvent<std::string>>(
        [&](const ClientUpdatedEvent<std::string>& e) { events.push_back("updated:" + e.client.getClientId()); });

    auto session = factory->createSession();
    session->clients().addClient("r1", std::nullopt, "app1");
    EXPECT_EQ(events, (std::vector<std::string>{"created:app1", "updated:app1"}));
    session->rollback();
}

TEST_F(ClientProviderTest, DuplicateKeyIsModelDuplicate) {
    seedClients("r1", {"app1"});
    auto session = factory->createSession();
    std::string id = session->clients().getClientByClientId("r1", "app1")->getId();
    try {
        session->clients().addClient("r1", id, std::string("other"));
        FAIL() << "Expected MODEL_DUPLICATE";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code, ErrorCode::MODEL_DUPLICATE);
        ASSERT_TRUE(e.underlying_error.has_value());
        EXPECT_EQ(*e.underlying_error, ErrorCode::DUPLICATE_KEY);
    }

    session->clients().addClient("r1", std::string("in-txn"));
    EXPECT_THROW(session->clients().addClient("r1", std::string("in-txn")), StorageError);
    session->rollback();
}

TEST_F(ClientProviderTest, OtherRealmsAndEmptyRealmSeeNothing) {
    std::vector<std::string> ids = seedClients("r1", {"app1"});
    auto session = factory->createSession();
    EXPECT_EQ(session->clients().getClientById("r2", ids[0]), nullptr);
    EXPECT_EQ(session->clients().getClientById("", ids[0]), nullptr);
    EXPECT_EQ(session->clients().getClients("").count(), 0u);
    EXPECT_EQ(session->clients().getClientsCount(""), 0u);
    EXPECT_FALSE(session->clients().removeClient("r2", ids[0]));
    EXPECT_EQ(session->clients().getClientById("r1", "no-such-id"), nullptr);
    EXPECT_THROW(session->clients().addClient(""), StorageError);
}

TEST_F(ClientProviderTest, AdapterChangesAreTrackedUntilCommit) {
    std::vector<std::string> ids = seedClients("r1", {"app1"});
    {
        auto session = factory->createSession();
        ClientPtr client = session->clients().getClientById("r1", ids[0]);
        client->setName("Application One");
        client->addRedirectUri("https://app1.example/cb");
        client->setSingleAttribute("tier", "gold");

        // Another adapter of the same client in the same request sees the change.
        EXPECT_EQ(session->clients().getClientByClientId("r1", "app1")->getName(), "Application One");
        session->rollback();
    }
    {
        auto session = factory->createSession();
        ClientPtr client = session->clients().getClientById("r1", ids[0]);
        EXPECT_EQ(client->getName(), "");
        client->setName("Application One");
        session->commit();
    }
    auto session = factory->createSession();
    EXPECT_EQ(session->clients().getClientById("r1", ids[0])->getName(), "Application One");
}

TEST_F(ClientProviderTest, PaginationAndSearch) {
    seedClients("r1", {"delta", "alpha", "charlie", "bravo", "Alpine"});
    seedClients("r2", {"alpha"});
    auto session = factory->createSession();
    ClientProvider<std::string>& clients = session->clients();

    EXPECT_EQ(clientIds(clients.getClients("r1")),
              (std::vector<std::string>{"Alpine", "alpha", "bravo", "charlie", "delta"}));
    EXPECT_EQ(clientIds(clients.getClients("r1", 1, 2)), (std::vector<std::string>{"alpha", "bravo"}));
    EXPECT_EQ(clientIds(clients.getClients("r1", 4, 10)), (std::vector<std::string>{"delta"}));
    EXPECT_TRUE(clientIds(clients.getClients("r1", 9, 10)).empty());

    EXPECT_EQ(clientIds(clients.searchClientsByClientId("r1", "ALP")), (std::vector<std::string>{"Alpine", "alpha"}));
    EXPECT_EQ(clientIds(clients.searchClientsByClientId("r1", "a", 0, 2)), (std::vector<std::string>{"Alpine", "alpha"}));
}

TEST_F(ClientProviderTest, AttributeSearchRequiresEveryAttribute) {
    std::vector<std::string> ids = seedClients("r1", {"a", "b", "c"});
    {
        auto session = factory->createSession();
        session->clients().getClientById("r1", ids[0])->setAttribute("tier", {"gold"});
        session->clients().getClientById("r1", ids[1])->setAttribute("tier", {"gold", "silver"});
        session->clients().getClientById("r1", ids[1])->setSingleAttribute("region", "eu");
        session->clients().getClientById("r1", ids[2])->setSingleAttribute("region", "eu");
        session->commit();
    }
    auto session = factory->createSession();
    EXPECT_EQ(clientIds(session->clients().searchClientsByAttributes("r1", {{"tier", "gold"}})),
              (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(clientIds(session->clients().searchClientsByAttributes("r1", {{"tier", "silver"}, {"region", "eu"}})),
              (std::vector<std::string>{"b"}));
    EXPECT_TRUE(clientIds(session->clients().searchClientsByAttributes("r1", {{"tier", "bronze"}})).empty());
}

TEST_F(ClientProviderTest, ConsoleAndRedirectUriViews) {
    std::vector<std::string> ids = seedClients("r1", {"console", "plain", "disabled"});
    {
        auto session = factory->createSession();
        ClientProvider<std::string>& clients = session->clients();
        clients.getClientById("r1", ids[0])->setAlwaysDisplayInConsole(true);
        clients.getClientById("r1", ids[0])->addRedirectUri("https://console/cb");
        ClientPtr disabled = clients.getClientById("r1", ids[2]);
        disabled->setEnabled(false);
        disabled->addRedirectUri("https://disabled/cb");
        session->commit();
    }
    auto session = factory->createSession();
    EXPECT_EQ(clientIds(session->clients().getAlwaysDisplayInConsoleClients("r1")),
              (std::vector<std::string>{"console"}));

    auto uris = session->clients().getAllRedirectUrisOfEnabledClients("r1");
    ASSERT_EQ(uris.size(), 1u);
    EXPECT_EQ(uris.at(ids[0]), (std::set<std::string>{"https://console/cb"}));
}

TEST_F(ClientProviderTest, RemovalCascadesToRolesAndScopeMappings) {
    std::string c1, c2, ro1, ro2, realm_role;
    {
        auto session = factory->createSession();
        c1 = session->clients().addClient("r1", std::nullopt, "c1")->getId();
        ClientPtr other = session->clients().addClient("r1", std::nullopt, "c2");
        c2 = other->getId();
        ro1 = session->roles().addRole("r1", "ro1", c1).getId();
        ro2 = session->roles().addRole("r1", "ro2", c1).getId();
        realm_role = session->roles().addRole("r1", "offline_access").getId();
        other->addScopeMapping(ro1);
        other->addScopeMapping(realm_role);
        session->commit();
    }
    {
        auto session = factory->createSession();
        EXPECT_TRUE(session->clients().removeClient("r1", c1));

        EXPECT_EQ(session->clients().getClientById("r1", c1), nullptr);
        EXPECT_TRUE(session->roles().getClientRoles("r1", c1).empty());
        EXPECT_FALSE(session->clients().getClientById("r1", c2)->hasScopeMapping(ro1));
        EXPECT_TRUE(session->clients().getClientById("r1", c2)->hasScopeMapping(realm_role));
        session->commit();
    }
    ASSERT_EQ(users->calls.size(), 1u);
    EXPECT_EQ(users->calls[0], std::make_pair(std::string("r1"), c1));

    auto session = factory->createSession();
    EXPECT_EQ(session->clients().getClientById("r1", c1), nullptr);
    EXPECT_FALSE(session->roles().getRoleById("r1", ro1).has_value());
    EXPECT_FALSE(session->roles().getRoleById("r1", ro2).has_value());
    EXPECT_TRUE(session->roles().getRoleById("r1", realm_role).has_value());
    EXPECT_EQ(session->clients().getClientById("r1", c2)->getScopeMappings(), (std::set<std::string>{realm_role}));
    EXPECT_FALSE(session->clients().removeClient("r1", c1));
}

TEST_F(ClientProviderTest, FailedCascadeStepAbortsBeforeDelete) {
    std::string c1, role_id;
    {
        auto session = factory->createSession();
        c1 = session->clients().addClient("r1", std::nullopt, "c1")->getId();
        role_id = session->roles().addRole("r1", "ro1", c1).getId();
        session->commit();
    }
    users->failure = StorageError(ErrorCode::IO_WRITE_ERROR, "user store unavailable");

    bool removed_event_seen = false;
    bus->subscribe<ClientRemovedEvent<std::string>>(
        [&](const ClientRemovedEvent<std::string>&) { removed_event_seen = true; });

    {
        auto session = factory->createSession();
        try {
            session->clients().removeClient("r1", c1);
            FAIL() << "Expected CASCADE_FAILED";
        } catch (const StorageError& e) {
            EXPECT_EQ(e.code, ErrorCode::CASCADE_FAILED);
            ASSERT_TRUE(e.underlying_error.has_value());
            EXPECT_EQ(*e.underlying_error, ErrorCode::IO_WRITE_ERROR);
            EXPECT_EQ(e.context.at("removal_step"), "user references");
        }
        EXPECT_FALSE(removed_event_seen);
        EXPECT_NE(session->clients().getClientById("r1", c1), nullptr);
        EXPECT_TRUE(session->roles().getRoleById("r1", role_id).has_value());
        EXPECT_TRUE(session->transactionManager().isRollbackOnly());
        EXPECT_THROW(session->commit(), StorageError);
    }

    auto session = factory->createSession();
    EXPECT_NE(session->clients().getClientById("r1", c1), nullptr);
    EXPECT_TRUE(session->roles().getRoleById("r1", role_id).has_value());
}

TEST_F(ClientProviderTest, RemovedEventFiresWhileClientIsStillReadable) {
    std::vector<std::string> ids = seedClients("r1", {"app1"});
    auto session = factory->createSession();

    std::optional<bool> readable_during_event;
    std::string event_client_id;
    bus->subscribe<ClientRemovedEvent<std::string>>([&](const ClientRemovedEvent<std::string>& e) {
        event_client_id = e.client.getClientId();
        readable_during_event = session->clients().getClientById("r1", e.client.getId()) != nullptr;
    });

    EXPECT_TRUE(session->clients().removeClient("r1", ids[0]));
    ASSERT_TRUE(readable_during_event.has_value());
    EXPECT_TRUE(*readable_during_event);
    EXPECT_EQ(event_client_id, "app1");
    EXPECT_EQ(session->clients().getClientById("r1", ids[0]), nullptr);
    session->commit();
}

TEST_F(ClientProviderTest, RemoveClientsClearsOnlyThatRealm) {
    seedClients("r1", {"a", "b", "c"});
    seedClients("r2", {"a"});
    {
        auto session = factory->createSession();
        session->clients().removeClients("r1");
        EXPECT_EQ(session->clients().getClientsCount("r1"), 0u);
        session->commit();
    }
    auto session = factory->createSession();
    EXPECT_EQ(session->clients().getClientsCount("r1"), 0u);
    EXPECT_EQ(session->clients().getClientsCount("r2"), 1u);
    EXPECT_EQ(users->calls.size(), 3u);
}

TEST_F(ClientProviderTest, ClientScopesAttachIdempotentlyByProtocol) {
    std::string client_id, profile_id, email_id, saml_id;
    {
        auto session = factory->createSession();
        ClientPtr client = session->clients().addClient("r1", std::nullopt, "app1");
        client_id = client->getId();
        auto profile = session->clientScopes().addClientScope("r1", "profile", "openid-connect");
        auto email = session->clientScopes().addClientScope("r1", "email", "openid-connect");
        auto saml = session->clientScopes().addClientScope("r1", "role_list", "saml");
        profile_id = profile.getId();
        email_id = email.getId();
        saml_id = saml.getId();

        session->clients().addClientScopes("r1", *client, {profile, saml}, true);
        session->clients().addClientScopes("r1", *client, {email}, false);

        auto defaults = session->clients().getClientScopes("r1", *client, true);
        ASSERT_EQ(defaults.size(), 1u);
        EXPECT_EQ(defaults.at("profile").getId(), profile_id);
        EXPECT_EQ(session->clients().getClientScopes("r1", *client, false).count("email"), 1u);
        session->commit();
    }
    {
        auto session = factory->createSession();
        ClientPtr client = session->clients().getClientById("r1", client_id);
        auto profile = session->clientScopes().getClientScopeById("r1", profile_id);
        ASSERT_TRUE(profile.has_value());

        session->clients().addClientScopes("r1", *client, {*profile}, false);
        EXPECT_FALSE(client->handle()->isDirty());
        EXPECT_EQ(session->clients().getClientScopes("r1", *client, true).count("profile"), 1u);

        session->clients().removeClientScope("r1", *client, profile_id);
        session->clients().removeClientScope("r1", *client, profile_id);
        EXPECT_TRUE(session->clients().getClientScopes("r1", *client, true).empty());
        session->commit();
    }
    auto session = factory->createSession();
    ClientPtr client = session->clients().getClientById("r1", client_id);
    EXPECT_TRUE(client->getClientScopeIds(true).empty());
    EXPECT_EQ(client->getClientScopeIds(false), (std::vector<std::string>{email_id}));
}

TEST_F(ClientProviderTest, SamlClientOnlyGetsSamlScopes) {
    auto session = factory->createSession();
    ClientPtr client = session->clients().addClient("r1", std::nullopt, "sp");
    client->setProtocol(std::string("saml"));
    auto oidc = session->clientScopes().addClientScope("r1", "profile", "openid-connect");
    auto saml = session->clientScopes().addClientScope("r1", "role_list", "saml");

    session->clients().addClientScopes("r1", *client, {oidc, saml}, true);
    auto scopes = session->clients().getClientScopes("r1", *client, true);
    ASSERT_EQ(scopes.size(), 1u);
    EXPECT_EQ(scopes.count("role_list"), 1u);
    session->rollback();
}

TEST_F(ClientProviderTest, PostCreateHookFailureWithdrawsTheClient) {
    factory->addClientPostCreateHook([](ClientAdapter<std::string>& client) {
        if (client.getClientId() == "rejected") {
            throw std::runtime_error("hook rejected client");
        }
        client.setSingleAttribute("created-by", "hook");
    });

    {
        auto session = factory->createSession();
        EXPECT_THROW(session->clients().addClient("r1", std::nullopt, "rejected"), std::runtime_error);
        EXPECT_EQ(session->clients().getClientByClientId("r1", "rejected"), nullptr);

        ClientPtr accepted = session->clients().addClient("r1", std::nullopt, "accepted");
        EXPECT_EQ(accepted->getAttribute("created-by"), (std::vector<std::string>{"hook"}));
        session->commit();
    }
    auto session = factory->createSession();
    EXPECT_EQ(session->clients().getClientsCount("r1"), 1u);
    EXPECT_EQ(session->clients().getClientByClientId("r1", "accepted")->getAttribute("created-by"),
              (std::vector<std::string>{"hook"}));
}

TEST_F(ClientProviderTest, NodeRegistrationsBypassTransactions) {
    std::vector<std::string> ids = seedClients("r1", {"app1"});
    {
        auto writer = factory->createSession();
        writer->clients().getClientById("r1", ids[0])->registerNode("node-a", 100);

        auto reader = factory->createSession();
        EXPECT_EQ(reader->clients().getClientById("r1", ids[0])->getRegisteredNodes(),
                  (std::map<std::string, int>{{"node-a", 100}}));
        writer->rollback();
        reader->rollback();
    }
    {
        auto session = factory->createSession();
        ClientPtr client = session->clients().getClientById("r1", ids[0]);
        EXPECT_EQ(client->getRegisteredNodes().size(), 1u);
        client->registerNode("node-b", 200);
        client->unregisterNode("node-a");
        EXPECT_EQ(client->getRegisteredNodes(), (std::map<std::string, int>{{"node-b", 200}}));

        session->clients().removeClient("r1", ids[0]);
        EXPECT_EQ(factory->nodeRegistry().clientCount(), 0u);
        session->rollback();
    }
    // The client survives the rollback; its registrations do not come back.
    auto session = factory->createSession();
    ClientPtr client = session->clients().getClientById("r1", ids[0]);
    ASSERT_NE(client, nullptr);
    EXPECT_TRUE(client->getRegisteredNodes().empty());
}

TEST(UuidClientProviderTest, UuidKeyedDeployment) {
    SessionFactory<Uuid> factory(StoreConfig(), ClientProviderConfig(), std::make_shared<UuidKeyConvertor>());
    auto session = factory.createSession();

    auto client = session->clients().addClient("r1");
    EXPECT_TRUE(parseUuid(client->getId()).has_value());
    EXPECT_EQ(session->clients().getClientById("r1", client->getId())->getClientId(), client->getId());
    EXPECT_EQ(session->clients().getClientById("r1", "not-a-uuid"), nullptr);

    try {
        session->clients().addClient("r1", std::string("not-a-uuid"));
        FAIL() << "Expected INVALID_KEY_FORMAT";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code, ErrorCode::INVALID_KEY_FORMAT);
    }
    session->commit();
}

TEST(RemovalCoordinatorTest, StopsAtFirstFailingStep) {
    std::vector<std::string> ran;
    RemovalCoordinator coordinator("client c1");
    coordinator.addStep("first", [&]() -> Status {
        ran.push_back("first");
        return Status();
    })
        .addStep("second", [&]() -> Status {
            ran.push_back("second");
            return StorageError(ErrorCode::ILLEGAL_STATE, "still referenced");
        })
        .addStep("third", [&]() -> Status {
            ran.push_back("third");
            return Status();
        });

    Status status = coordinator.run();
    ASSERT_TRUE(status.hasError());
    EXPECT_EQ(status.error().code, ErrorCode::ILLEGAL_STATE);
    EXPECT_EQ(status.error().context.at("removal_step"), "second");
    EXPECT_EQ(ran, (std::vector<std::string>{"first", "second"}));
    EXPECT_EQ(coordinator.stepCount(), 3u);
}

TEST(RemovalCoordinatorTest, EmptyCoordinatorSucceeds) {
    RemovalCoordinator coordinator("client c2");
    EXPECT_TRUE(coordinator.run().isOk());
}
