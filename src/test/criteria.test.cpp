// src/test/criteria.test.cpp
#include "gtest/gtest.h"
#include "../../include/client/client_entity.h"
#include "../../include/storage/lazy_sequence.h"

#include <string>
#include <vector>

using namespace mapstore;

using Client = ClientEntity<std::string>;

class CriteriaTest : public ::testing::Test {
protected:
    std::shared_ptr<const FieldDescriptors<Client>> fields = Client::fieldDescriptors();

    CriteriaBuilder<Client> builder() const { return CriteriaBuilder<Client>(fields); }

    static Client makeClient(const std::string& id, const std::string& client_id) {
        Client c(id, "r1");
        c.setClientId(client_id);
        c.setEnabled(true);
        return c;
    }
};

TEST_F(CriteriaTest, EqualityAndConjunction) {
    Client c = makeClient("1", "app1");

    auto cb = builder();
    cb.compare(client_fields::REALM_ID, FilterOperator::EQUAL, "r1")
        .compare(client_fields::ENABLED, FilterOperator::EQUAL, true);
    EXPECT_TRUE(cb.matches(c));

    cb.compare(client_fields::CLIENT_ID, FilterOperator::EQUAL, "app2");
    EXPECT_FALSE(cb.matches(c));
}

TEST_F(CriteriaTest, EmptyBuilderMatchesEverything) {
    EXPECT_TRUE(builder().matches(makeClient("1", "x")));
}

TEST_F(CriteriaTest, LikeIsCaseSensitiveIlikeIsNot) {
    Client c = makeClient("1", "MyApp");

    auto like = builder();
    like.compare(client_fields::CLIENT_ID, FilterOperator::LIKE, "%app%");
    EXPECT_FALSE(like.matches(c));

    auto ilike = builder();
    ilike.compare(client_fields::CLIENT_ID, FilterOperator::ILIKE, "%app%");
    EXPECT_TRUE(ilike.matches(c));

    auto exact = builder();
    exact.compare(client_fields::CLIENT_ID, FilterOperator::ILIKE, "myapp");
    EXPECT_TRUE(exact.matches(c));

    auto prefix_only = builder();
    prefix_only.compare(client_fields::CLIENT_ID, FilterOperator::ILIKE, "my");
    EXPECT_FALSE(prefix_only.matches(c));
}

TEST_F(CriteriaTest, SetFieldsMatchWhenAnyElementMatches) {
    Client c = makeClient("1", "app1");
    c.addScopeMapping("role-a");
    c.addScopeMapping("role-b");

    auto has_b = builder();
    has_b.compare(client_fields::SCOPE_MAPPING_ROLE, FilterOperator::EQUAL, "role-b");
    EXPECT_TRUE(has_b.matches(c));

    auto not_c = builder();
    not_c.compare(client_fields::SCOPE_MAPPING_ROLE, FilterOperator::NOT_EQUAL, "role-c");
    EXPECT_TRUE(not_c.matches(c));

    auto not_a = builder();
    not_a.compare(client_fields::SCOPE_MAPPING_ROLE, FilterOperator::NOT_EQUAL, "role-a");
    EXPECT_FALSE(not_a.matches(c));

    auto in = builder();
    in.compare(client_fields::SCOPE_MAPPING_ROLE, FilterOperator::IN, "role-x", "role-a");
    EXPECT_TRUE(in.matches(c));
}

TEST_F(CriteriaTest, ExistsOnOptionalProtocol) {
    Client no_protocol = makeClient("1", "a");
    Client saml = makeClient("2", "b");
    saml.setProtocol("saml");

    auto exists = builder();
    exists.compare(client_fields::PROTOCOL, FilterOperator::EXISTS);
    EXPECT_FALSE(exists.matches(no_protocol));
    EXPECT_TRUE(exists.matches(saml));

    auto not_exists = builder();
    not_exists.compare(client_fields::PROTOCOL, FilterOperator::NOT_EXISTS);
    EXPECT_TRUE(not_exists.matches(no_protocol));
    EXPECT_FALSE(not_exists.matches(saml));
}

TEST_F(CriteriaTest, AttributeCriterionTakesNameAndValue) {
    Client c = makeClient("1", "app1");
    c.setAttribute("tier", {"gold", "silver"});

    auto gold = builder();
    gold.compare(client_fields::ATTRIBUTE, FilterOperator::EQUAL, "tier", "silver");
    EXPECT_TRUE(gold.matches(c));

    auto bronze = builder();
    bronze.compare(client_fields::ATTRIBUTE, FilterOperator::EQUAL, "tier", "bronze");
    EXPECT_FALSE(bronze.matches(c));

    EXPECT_THROW(builder().compare(client_fields::ATTRIBUTE, FilterOperator::EQUAL, "tier"), StorageError);
    EXPECT_THROW(builder().compare(client_fields::ATTRIBUTE, FilterOperator::LIKE, "tier", "g%"), StorageError);
}

TEST_F(CriteriaTest, UnknownFieldFailsAtBuildTime) {
    try {
        builder().compare("secret", FilterOperator::EQUAL, "x");
        FAIL() << "Expected UNSUPPORTED_FIELD";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code, ErrorCode::UNSUPPORTED_FIELD);
        EXPECT_EQ(e.context.at("field"), "secret");
    }
}

TEST_F(CriteriaTest, WrongOperandCountFailsAtBuildTime) {
    try {
        builder().compare(client_fields::CLIENT_ID, FilterOperator::EQUAL, "a", "b");
        FAIL() << "Expected INVALID_VALUE";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code, ErrorCode::INVALID_VALUE);
    }
    EXPECT_THROW(builder().compare(client_fields::PROTOCOL, FilterOperator::EXISTS, "x"), StorageError);
}

TEST_F(CriteriaTest, OrderingRequiresSortableField) {
    auto params = QueryParameters<Client>::withCriteria(builder());
    EXPECT_NO_THROW(params.orderBy(client_fields::CLIENT_ID, IndexSortOrder::DESCENDING));
    EXPECT_THROW(params.orderBy(client_fields::ATTRIBUTE, IndexSortOrder::ASCENDING), StorageError);
    EXPECT_THROW(params.orderBy("nope", IndexSortOrder::ASCENDING), StorageError);
}

TEST_F(CriteriaTest, OrderAndSliceIsDeterministic) {
    std::vector<Client> rows = {makeClient("c", "beta"), makeClient("a", "alpha"), makeClient("b", "beta"),
                                makeClient("d", "gamma")};
    auto key_of = [](const Client& c) { return c.getId(); };

    auto params = QueryParameters<Client>::withCriteria(builder());
    params.pagination(1, 2, client_fields::CLIENT_ID);
    std::vector<Client> page = orderAndSlice(rows, params, key_of);
    ASSERT_EQ(page.size(), 2u);
    // Equal clientIds fall back to key order.
    EXPECT_EQ(page[0].getId(), "b");
    EXPECT_EQ(page[1].getId(), "c");

    auto past_end = QueryParameters<Client>::withCriteria(builder());
    past_end.pagination(10, 5);
    EXPECT_TRUE(orderAndSlice(rows, past_end, key_of).empty());

    auto unbounded = QueryParameters<Client>::withCriteria(builder());
    unbounded.pagination(3, std::nullopt);
    std::vector<Client> tail = orderAndSlice(rows, unbounded, key_of);
    ASSERT_EQ(tail.size(), 1u);
    EXPECT_EQ(tail[0].getId(), "d");
}

TEST(LazySequenceTest, RestartableAndDeferred) {
    int produced = 0;
    auto seq = LazySequence<int>::deferred([&produced]() {
        ++produced;
        return std::vector<int>{1, 2, 3};
    });
    EXPECT_EQ(produced, 0);

    EXPECT_EQ(seq.toVector(), (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(seq.count(), 3u);
    EXPECT_EQ(produced, 2);
}

TEST(LazySequenceTest, MapFilterConcat) {
    auto seq = LazySequence<int>::fromVector({1, 2, 3, 4})
                   .filter([](const int& v) { return v % 2 == 0; })
                   .map([](const int& v) { return std::to_string(v * 10); });
    EXPECT_EQ(seq.toVector(), (std::vector<std::string>{"20", "40"}));

    auto joined = LazySequence<int>::fromVector({1}).concat(LazySequence<int>::fromVector({2, 3}));
    EXPECT_EQ(joined.toVector(), (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(joined.first().value_or(-1), 1);
    EXPECT_FALSE(LazySequence<int>::empty().first().has_value());

    int sum = 0;
    for (int v : joined) {
        sum += v;
    }
    EXPECT_EQ(sum, 6);
}
