//src/test/concurrency_stress.test.cpp
#include "gtest/gtest.h"
#include "../../include/storage/in_memory_entity_store.h"
#include "../../include/storage/transaction.h"
#include "../../include/client/node_registry.h"
#include "../../include/role/role_entity.h"

#include <atomic>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace mapstore;

using Role = RoleEntity<std::string>;
using RoleTxn = Transaction<std::string, Role>;

class ConcurrencyStressTest : public ::testing::Test {
protected:
    InMemoryEntityStore<std::string, Role> store{std::make_shared<StringKeyConvertor>(), Role::fieldDescriptors(), 16};

    static Role makeRole(const std::string& id, const std::string& name) {
        Role role(id, "stress");
        role.setName(name);
        return role;
    }

    size_t realmCount() const {
        auto cb = store.createCriteriaBuilder();
        cb.compare(role_fields::REALM_ID, FilterOperator::EQUAL, std::string("stress"));
        return store.count(QueryParameters<Role>::withCriteria(cb));
    }
};

TEST_F(ConcurrencyStressTest, DisjointCommitsAllLand) {
    const int num_threads = 8;
    const int txns_per_thread = 100;
    const int creates_per_txn = 3;
    std::atomic<int> failures{0};

    auto worker_lambda = [&](int thread_id) {
        for (int i = 0; i < txns_per_thread; ++i) {
            try {
                RoleTxn txn(store);
                for (int j = 0; j < creates_per_txn; ++j) {
                    std::string id = "t" + std::to_string(thread_id) + "_" + std::to_string(i) + "_" + std::to_string(j);
                    txn.create(makeRole(id, "role_" + id));
                }
                txn.commit();
            } catch (const StorageError& e) {
                std::cerr << "Thread " << thread_id << " caught exception: " << e.what() << std::endl;
                ++failures;
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back(worker_lambda, i);
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(realmCount(), static_cast<size_t>(num_threads * txns_per_thread * creates_per_txn));
    auto sample = store.read("t3_42_1");
    ASSERT_TRUE(sample.has_value());
    EXPECT_EQ(sample->getName(), "role_t3_42_1");
}

TEST_F(ConcurrencyStressTest, HighContentionCreateUpdateDelete) {
    const int num_threads = 8;
    const int ops_per_thread = 500;
    const int key_space_size = 50;
    std::atomic<int> unexpected{0};

    auto worker_lambda = [&](int thread_id) {
        std::minstd_rand rng(static_cast<unsigned int>(thread_id) * 7919u + 1u);
        for (int i = 0; i < ops_per_thread; ++i) {
            std::string key = "key_" + std::to_string((thread_id * ops_per_thread + i) % key_space_size);
            try {
                RoleTxn txn(store);
                int op_type = static_cast<int>(rng() % 10);
                if (op_type < 4) {
                    if (!txn.read(key)) {
                        txn.create(makeRole(key, "v_" + key));
                    }
                } else if (op_type < 8) {
                    if (auto handle = txn.read(key)) {
                        handle->modify([&](Role& r) { r.setDescription("thread_" + std::to_string(thread_id)); });
                    }
                } else {
                    txn.remove(key);
                }
                txn.commit();
            } catch (const StorageError& e) {
                if (e.code != ErrorCode::DUPLICATE_KEY && e.code != ErrorCode::TRANSACTION_CONFLICT) {
                    std::cerr << "Thread " << thread_id << " caught exception: " << e.what() << std::endl;
                    ++unexpected;
                }
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back(worker_lambda, i);
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(unexpected.load(), 0);
    EXPECT_LE(realmCount(), static_cast<size_t>(key_space_size));
    for (int k = 0; k < key_space_size; ++k) {
        std::string key = "key_" + std::to_string(k);
        auto row = store.read(key);
        if (row) {
            EXPECT_EQ(row->getName(), "v_" + key);
        }
    }
}

TEST_F(ConcurrencyStressTest, NodeRegistrationsVisibleAcrossThreads) {
    NodeRegistry<std::string> registry;
    const int num_threads = 6;
    const int nodes_per_thread = 200;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&registry, t]() {
            for (int i = 0; i < nodes_per_thread; ++i) {
                registry.registerNode("client_" + std::to_string(i % 4), "node_" + std::to_string(t) + "_" + std::to_string(i), i);
                if (i % 10 == 0) {
                    registry.getRegisteredNodes("client_0");
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    size_t total = 0;
    for (int c = 0; c < 4; ++c) {
        total += registry.getRegisteredNodes("client_" + std::to_string(c)).size();
    }
    EXPECT_EQ(total, static_cast<size_t>(num_threads * nodes_per_thread));
    EXPECT_EQ(registry.clientCount(), 4u);
}
