/**
 * @file search.h
 * @brief Search orchestrator
 *
 * Owns a filter Builder and the query options, resolves them into a
 * QueryState, runs it through the connection and maps the results.
 *
 * Usage:
 * @code
 *   Search search(connection, "dc=corp,dc=local");
 *   auto users = search.select(std::vector<std::string>{"cn", "mail"})
 *                      .where("objectcategory", "person")
 *                      .whereStartsWith("cn", "jo")
 *                      .sortBy("cn", "asc")
 *                      .get();
 * @endcode
 *
 * A Search instance is not thread-safe.
 */

#pragma once

#include "adldap/connection.h"
#include "adldap/models/mapped_entry.h"
#include "adldap/query/builder.h"
#include "adldap/query/paged_search.h"
#include "adldap/query/paginator.h"
#include "adldap/query/query_state.h"
#include "adldap/query/result_set.h"

#include <optional>
#include <string>
#include <vector>

namespace adldap::query {

class Search {
public:
    /**
     * @param connection Directory connection (non-owning)
     * @param baseDn Default search DN; empty means discover it with findBaseDn()
     */
    Search(IConnection& connection, std::string baseDn);

    // ========== Execution ==========

    /**
     * @brief Run a filter with the current options
     * @return Results, or std::nullopt if the connection produced no result
     *         container. An empty ResultSet means nothing matched.
     */
    std::optional<ResultSet> query(const std::string& filter);

    /**
     * @brief Run the current filter
     */
    std::optional<ResultSet> get();

    /**
     * @brief Add (cn=*) and run
     */
    std::optional<ResultSet> all();

    /**
     * @brief First mapped row of get(), std::nullopt when nothing matched
     */
    std::optional<models::MappedEntry> first();

    /**
     * @brief First raw row of get(), std::nullopt when nothing matched
     */
    std::optional<Attributes> firstRaw();

    /**
     * @brief Run a prepared query
     */
    std::optional<ResultSet> execute(const QueryState& state);

    /**
     * @brief Resolve the current options into an immutable query
     *
     * The filter is rendered fresh on every call.
     */
    QueryState snapshot();

    // ========== Filter ==========

    Search& select(const std::vector<std::string>& fields);
    Search& select(const std::string& field);

    Search& where(const std::string& field, Operator op, const std::string& value = "");
    Search& where(const std::string& field, const std::string& value);
    Search& whereContains(const std::string& field, const std::string& value);
    Search& whereStartsWith(const std::string& field, const std::string& value);
    Search& whereEndsWith(const std::string& field, const std::string& value);
    Search& whereHas(const std::string& field);

    Search& orWhere(const std::string& field, Operator op, const std::string& value = "");
    Search& orWhere(const std::string& field, const std::string& value);
    Search& orWhereContains(const std::string& field, const std::string& value);
    Search& orWhereStartsWith(const std::string& field, const std::string& value);
    Search& orWhereEndsWith(const std::string& field, const std::string& value);
    Search& orWhereHas(const std::string& field);

    /**
     * @brief Current rendered filter
     */
    std::string getQuery() const;

    Builder& getQueryBuilder() { return query_; }
    const Builder& getQueryBuilder() const { return query_; }

    // ========== Paging ==========

    /**
     * @brief Fetch every page of the current query
     * @param perPage Page size requested from the server, getPageSize() if unset
     * @param currentPage Page exposed by Paginator::getCurrentPageEntries()
     * @param isCritical Fail rather than truncate when the server cannot
     *        honour the page size
     * @return Paginator, or std::nullopt if not a single page was retrieved
     */
    std::optional<Paginator> paginate(std::optional<int> perPage = std::nullopt, int currentPage = 0,
                                     bool isCritical = true);

    /**
     * @brief Page cursor over the current query
     */
    PagedSearch pagedSearch(std::optional<int> perPage = std::nullopt, bool isCritical = true);

    /// Default page size of paginate() and pagedSearch()
    Search& setPageSize(int pageSize);
    int getPageSize() const { return pageSize_; }

    // ========== Options ==========

    /**
     * @brief Sort results by field
     * @param direction "asc" (case-insensitive) or anything else for descending
     */
    Search& sortBy(const std::string& field, const std::string& direction = "desc");

    /**
     * @brief Set the DN to search on
     *
     * std::nullopt searches from the directory root; an empty string
     * restores the base DN default.
     */
    Search& setDn(const std::optional<std::string>& dn);

    /**
     * @brief DN the next query will use
     */
    std::optional<std::string> getDn();

    /**
     * @brief Configured base DN, discovered through findBaseDn() if empty
     */
    std::string getBaseDn();

    Search& recursive(bool recursive = true);
    Search& read(bool read = true);
    Search& raw(bool raw = true);

    // ========== Lookups ==========

    /**
     * @brief First entry matching ambiguous name resolution
     */
    std::optional<models::MappedEntry> find(const std::string& anr);

    /**
     * @brief Like find(), but a miss is an error
     * @throws EntryNotFoundException if nothing matched
     */
    models::MappedEntry findOrFail(const std::string& anr);

    /**
     * @brief Read the entry at dn
     */
    std::optional<models::MappedEntry> findByDn(const std::string& dn);

    /**
     * @brief Read defaultNamingContext from the root DSE
     * @return Base DN or std::nullopt if the root DSE does not provide one
     */
    std::optional<std::string> findBaseDn();

private:
    ResultSet processResults(const ResultHandle& results, bool raw);

    IConnection& connection_;
    std::string baseDn_;
    Builder query_;

    // nullopt: directory root, "": base DN, otherwise explicit
    std::optional<std::string> dn_ = std::string();

    bool recursive_ = true;
    bool read_ = false;
    bool raw_ = false;
    int pageSize_ = 50;
    std::optional<SortOrder> sort_;
};

} // namespace adldap::query
