/**
 * @file test_search.cpp
 * @brief Unit tests for the search orchestrator
 *
 * Uses FakeConnection to check the mode, DN, filter and attributes handed
 * to the connection and the mapping of what comes back.
 */

#include <gtest/gtest.h>
#include <adldap/exceptions.h>
#include <adldap/query/search.h>
#include "fake_connection.h"
#include "test_helpers.h"

using namespace adldap;
using namespace adldap::query;
using namespace test_helpers;

static const std::string BASE_DN = "dc=corp,dc=local";

class SearchTest : public ::testing::Test {
protected:
    FakeConnection connection_;

    RawEntries users(const std::vector<std::string>& names) {
        RawEntries entries;
        for (const auto& name : names) {
            entries.push_back(makeUser("CN=" + name + ",OU=Users," + BASE_DN, name));
        }
        return entries;
    }

    static std::vector<std::string> dns(const ResultSet& results) {
        std::vector<std::string> result;
        for (const auto& entry : results.rawEntries()) {
            result.push_back(entry.getDn());
        }
        return result;
    }
};

// ============================================================================
// Mode and DN Resolution
// ============================================================================

TEST_F(SearchTest, Get_DefaultsToSubtreeOnBaseDn) {
    Search search(connection_, BASE_DN);
    search.where("cn", "bob").get();

    ASSERT_EQ(connection_.calls.size(), 1u);
    EXPECT_EQ(connection_.calls[0].operation, "search");
    EXPECT_EQ(connection_.calls[0].dn, std::optional<std::string>(BASE_DN));
    EXPECT_EQ(connection_.calls[0].filter, "(cn=bob)");
}

TEST_F(SearchTest, Read_WinsOverRecursive) {
    Search search(connection_, BASE_DN);
    search.read(true).recursive(true).get();

    ASSERT_EQ(connection_.calls.size(), 1u);
    EXPECT_EQ(connection_.calls[0].operation, "read");
}

TEST_F(SearchTest, NonRecursive_Listing) {
    Search search(connection_, BASE_DN);
    search.recursive(false).get();

    ASSERT_EQ(connection_.calls.size(), 1u);
    EXPECT_EQ(connection_.calls[0].operation, "listing");
}

TEST_F(SearchTest, NullDn_SearchesFromRoot) {
    Search search(connection_, BASE_DN);
    search.setDn(std::nullopt).get();

    ASSERT_EQ(connection_.calls.size(), 1u);
    EXPECT_FALSE(connection_.calls[0].dn.has_value());
}

TEST_F(SearchTest, ExplicitDn_Used) {
    Search search(connection_, BASE_DN);
    search.setDn("OU=Users," + BASE_DN).get();

    EXPECT_EQ(connection_.calls[0].dn.value_or(""), "OU=Users," + BASE_DN);
}

TEST_F(SearchTest, EmptyDn_RestoresBaseDn) {
    Search search(connection_, BASE_DN);
    search.setDn(std::nullopt).setDn(std::string()).get();

    EXPECT_EQ(connection_.calls[0].dn.value_or(""), BASE_DN);
}

TEST_F(SearchTest, Select_PassedToConnection) {
    Search search(connection_, BASE_DN);
    search.select(std::vector<std::string>{"cn", "mail"}).get();

    ASSERT_EQ(connection_.calls[0].attributes.size(), 2u);
    EXPECT_EQ(connection_.calls[0].attributes[0], "cn");
    EXPECT_EQ(connection_.calls[0].attributes[1], "mail");
}

TEST_F(SearchTest, Query_UsesGivenFilter) {
    Search search(connection_, BASE_DN);
    search.where("cn", "ignored").query("(sn=Doe)");

    EXPECT_EQ(connection_.calls[0].filter, "(sn=Doe)");
}

// ============================================================================
// Results
// ============================================================================

TEST_F(SearchTest, Failure_DistinguishableFromEmpty) {
    Search search(connection_, BASE_DN);

    auto empty = search.get();
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());

    connection_.failSearches = true;
    EXPECT_FALSE(search.get().has_value());
}

TEST_F(SearchTest, Get_MapsEntries) {
    connection_.defaultEntries = users({"alice", "bob"});
    Search search(connection_, BASE_DN);

    auto results = search.get();
    ASSERT_TRUE(results.has_value());
    ASSERT_EQ(results->entries().size(), 2u);
    EXPECT_FALSE(results->isRaw());
    EXPECT_TRUE(std::holds_alternative<models::User>(results->entries()[0]));
    EXPECT_EQ(models::entryOf(results->entries()[1]).getDn(), "CN=bob,OU=Users," + BASE_DN);
}

TEST_F(SearchTest, Raw_SkipsMapping) {
    connection_.defaultEntries = users({"alice", "bob"});
    Search search(connection_, BASE_DN);

    auto results = search.raw().get();
    ASSERT_TRUE(results.has_value());
    EXPECT_TRUE(results->isRaw());
    EXPECT_TRUE(results->entries().empty());
    EXPECT_EQ(results->rawEntries().size(), 2u);
}

TEST_F(SearchTest, First_NoResults_ReturnsNulloptWithoutThrow) {
    Search search(connection_, BASE_DN);

    std::optional<models::MappedEntry> entry;
    EXPECT_NO_THROW(entry = search.where("cn", "nobody").first());
    EXPECT_FALSE(entry.has_value());
}

TEST_F(SearchTest, First_ReturnsRowZero) {
    connection_.defaultEntries = users({"carol", "alice"});
    Search search(connection_, BASE_DN);

    auto entry = search.first();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(models::entryOf(*entry).getDn(), "CN=carol,OU=Users," + BASE_DN);
}

TEST_F(SearchTest, First_RawMode_StillMaps) {
    connection_.defaultEntries = users({"carol"});
    Search search(connection_, BASE_DN);

    auto entry = search.raw().first();
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(std::holds_alternative<models::User>(*entry));
}

TEST_F(SearchTest, FirstRaw_ReturnsAttributes) {
    connection_.defaultEntries = users({"carol"});
    Search search(connection_, BASE_DN);

    auto attributes = search.firstRaw();
    ASSERT_TRUE(attributes.has_value());
    EXPECT_EQ(attributes->first("samaccountname").value_or(""), "carol");
}

TEST_F(SearchTest, FindOrFail_NoResults_Throws) {
    Search search(connection_, BASE_DN);

    EXPECT_THROW(search.findOrFail("nobody"), EntryNotFoundException);
    EXPECT_EQ(connection_.calls[0].filter, "(anr=nobody)");
}

TEST_F(SearchTest, FindOrFail_ReturnsFirstMatch) {
    connection_.entriesByFilter["(anr=jdoe)"] = users({"jdoe", "jdoe2"});
    Search search(connection_, BASE_DN);

    auto entry = search.findOrFail("jdoe");
    EXPECT_EQ(models::entryOf(entry).getDn(), "CN=jdoe,OU=Users," + BASE_DN);
}

TEST_F(SearchTest, FindByDn_ReadsEntry) {
    const std::string dn = "CN=alice,OU=Users," + BASE_DN;
    connection_.setEntries(dn, "(objectclass=*)", users({"alice"}));
    Search search(connection_, BASE_DN);

    auto entry = search.findByDn(dn);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(connection_.calls[0].operation, "read");
    EXPECT_EQ(connection_.calls[0].dn.value_or(""), dn);
}

TEST_F(SearchTest, All_AddsCommonNameWildcard) {
    Search search(connection_, BASE_DN);
    search.all();

    EXPECT_EQ(connection_.calls[0].filter, "(cn=*)");
}

// ============================================================================
// Sorting
// ============================================================================

TEST_F(SearchTest, SortBy_Ascending) {
    connection_.defaultEntries = users({"bob", "alice", "carol"});
    Search search(connection_, BASE_DN);

    auto results = search.sortBy("cn", "ASC").get();
    ASSERT_TRUE(results.has_value());

    auto order = dns(*results);
    EXPECT_EQ(order[0], "CN=alice,OU=Users," + BASE_DN);
    EXPECT_EQ(order[1], "CN=bob,OU=Users," + BASE_DN);
    EXPECT_EQ(order[2], "CN=carol,OU=Users," + BASE_DN);

    // Mapped rows follow the raw rows
    EXPECT_EQ(models::entryOf(results->entries()[0]).getDn(), order[0]);
}

TEST_F(SearchTest, SortBy_DescendingByDefault) {
    connection_.defaultEntries = users({"bob", "alice", "carol"});
    Search search(connection_, BASE_DN);

    auto results = search.sortBy("cn").get();
    auto order = dns(*results);
    EXPECT_EQ(order[0], "CN=carol,OU=Users," + BASE_DN);
    EXPECT_EQ(order[2], "CN=alice,OU=Users," + BASE_DN);
}

// A row missing the sort field leaves the key map incomplete; the rows then
// keep server order instead of being partially sorted.
TEST_F(SearchTest, SortBy_MissingField_KeepsServerOrder) {
    RawEntries entries = users({"bob", "alice"});
    entries.push_back(makeEntry("CN=nocn," + BASE_DN, {{"objectCategory", {categoryDn("Person")}}}));
    connection_.defaultEntries = entries;
    Search search(connection_, BASE_DN);

    auto results = search.sortBy("cn", "asc").get();
    auto order = dns(*results);
    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0], "CN=bob,OU=Users," + BASE_DN);
    EXPECT_EQ(order[1], "CN=alice,OU=Users," + BASE_DN);
    EXPECT_EQ(order[2], "CN=nocn," + BASE_DN);
}

TEST_F(SearchTest, SortBy_Stable) {
    RawEntries entries;
    entries.push_back(makeEntry("CN=1", {{"department", {"IT"}}}));
    entries.push_back(makeEntry("CN=2", {{"department", {"HR"}}}));
    entries.push_back(makeEntry("CN=3", {{"department", {"IT"}}}));
    connection_.defaultEntries = entries;
    Search search(connection_, BASE_DN);

    auto order = dns(*search.raw().sortBy("department", "asc").get());
    EXPECT_EQ(order, (std::vector<std::string>{"CN=2", "CN=1", "CN=3"}));
}

TEST(ResultSetTest, SortBy_MappedRowsFollowRawRows) {
    RawEntries entries;
    for (const auto& name : {"delta", "alpha", "charlie", "bravo"}) {
        entries.push_back(makeUser(std::string("CN=") + name + "," + BASE_DN, name));
    }
    ResultSet results = ResultSet::fromMapped(entries);

    ASSERT_TRUE(results.sortBy(SortOrder{"cn", SortDirection::ASC}));
    ASSERT_EQ(results.entries().size(), results.rawEntries().size());
    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(models::entryOf(results.entries()[i]).getDn(), results.rawEntries()[i].getDn());
    }
    EXPECT_EQ(results.rawEntries().front().getDn(), "CN=alpha," + BASE_DN);
}

TEST(ResultSetTest, SortBy_RawResultsStayUnmapped) {
    ResultSet results = ResultSet::fromRaw({makeEntry("CN=b", {{"cn", {"b"}}}),
                                            makeEntry("CN=a", {{"cn", {"a"}}})});

    ASSERT_TRUE(results.sortBy(SortOrder{"cn", SortDirection::ASC}));
    EXPECT_TRUE(results.isRaw());
    EXPECT_TRUE(results.entries().empty());
    EXPECT_EQ(results.rawEntries()[0].getDn(), "CN=a");
}

// ============================================================================
// Base DN Discovery
// ============================================================================

TEST_F(SearchTest, FindBaseDn_ReadsRootDse) {
    connection_.setEntries(std::nullopt, "(objectclass=*)",
                           {makeEntry("", {{"defaultNamingContext", {BASE_DN}}})});
    Search search(connection_, "");

    auto baseDn = search.findBaseDn();
    ASSERT_TRUE(baseDn.has_value());
    EXPECT_EQ(*baseDn, BASE_DN);

    ASSERT_EQ(connection_.calls.size(), 1u);
    EXPECT_EQ(connection_.calls[0].operation, "read");
    EXPECT_FALSE(connection_.calls[0].dn.has_value());
    ASSERT_EQ(connection_.calls[0].attributes.size(), 1u);
    EXPECT_EQ(connection_.calls[0].attributes[0], "defaultnamingcontext");
}

TEST_F(SearchTest, FindBaseDn_Absent_ReturnsNullopt) {
    Search search(connection_, "");
    EXPECT_FALSE(search.findBaseDn().has_value());

    connection_.failSearches = true;
    EXPECT_FALSE(search.findBaseDn().has_value());
}

TEST_F(SearchTest, EmptyBaseDn_DiscoveredBeforeQuery) {
    connection_.setEntries(std::nullopt, "(objectclass=*)",
                           {makeEntry("", {{"defaultNamingContext", {BASE_DN}}})});
    Search search(connection_, "");
    search.where("cn", "bob").get();

    ASSERT_EQ(connection_.calls.size(), 2u);
    EXPECT_EQ(connection_.calls[1].operation, "search");
    EXPECT_EQ(connection_.calls[1].dn.value_or(""), BASE_DN);
    EXPECT_EQ(search.getBaseDn(), BASE_DN);
}

TEST_F(SearchTest, EmptyBaseDn_DiscoveryFails_SearchesRoot) {
    Search search(connection_, "");
    auto results = search.where("cn", "bob").get();

    ASSERT_TRUE(results.has_value());
    ASSERT_EQ(connection_.calls.size(), 2u);
    EXPECT_FALSE(connection_.calls[1].dn.has_value());
}

// ============================================================================
// Snapshot
// ============================================================================

TEST_F(SearchTest, Snapshot_ImmutableAndRenderedFresh) {
    Search search(connection_, BASE_DN);
    search.where("cn", "bob").select("mail").read();

    QueryState first = search.snapshot();
    search.orWhere("cn", "alice");
    QueryState second = search.snapshot();

    EXPECT_EQ(first.getFilter(), "(cn=bob)");
    EXPECT_EQ(second.getFilter(), "(|(cn=bob)(cn=alice))");
    EXPECT_EQ(first.getMode(), SearchMode::READ);
    EXPECT_EQ(first.getDn().value_or(""), BASE_DN);
    ASSERT_EQ(first.getSelects().size(), 1u);

    search.execute(first);
    EXPECT_EQ(connection_.calls[0].filter, "(cn=bob)");
    EXPECT_EQ(connection_.calls[0].operation, "read");
}

TEST(QueryStateTest, ResolveMode_ReadWins) {
    EXPECT_EQ(resolveMode(true, true), SearchMode::READ);
    EXPECT_EQ(resolveMode(true, false), SearchMode::READ);
    EXPECT_EQ(resolveMode(false, true), SearchMode::RECURSIVE);
    EXPECT_EQ(resolveMode(false, false), SearchMode::LISTING);
}

TEST(QueryStateTest, SortDirection_OnlyAscIsAscending) {
    EXPECT_EQ(sortDirectionFromString("asc"), SortDirection::ASC);
    EXPECT_EQ(sortDirectionFromString("ASC"), SortDirection::ASC);
    EXPECT_EQ(sortDirectionFromString("desc"), SortDirection::DESC);
    EXPECT_EQ(sortDirectionFromString("sideways"), SortDirection::DESC);
}
