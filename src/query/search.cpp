/**
 * @file search.cpp
 * @brief Search orchestrator
 */

#include "adldap/query/search.h"
#include "adldap/exceptions.h"
#include "adldap/schema.h"

#include <spdlog/spdlog.h>

namespace adldap::query {

Search::Search(IConnection& connection, std::string baseDn)
    : connection_(connection), baseDn_(std::move(baseDn)) {}

// ========== Execution ==========

std::optional<ResultSet> Search::query(const std::string& filter) {
    return execute(snapshot().withFilter(filter));
}

std::optional<ResultSet> Search::get() {
    return execute(snapshot());
}

std::optional<ResultSet> Search::all() {
    query_.whereHas(schema::COMMON_NAME);
    return get();
}

std::optional<models::MappedEntry> Search::first() {
    auto results = get();
    if (!results || results->empty()) {
        return std::nullopt;
    }
    if (results->isRaw()) {
        return models::EntryMapper::map(results->rawEntries().front());
    }
    return results->entries().front();
}

std::optional<Attributes> Search::firstRaw() {
    auto results = get();
    if (!results || results->empty()) {
        return std::nullopt;
    }
    return results->rawEntries().front();
}

std::optional<ResultSet> Search::execute(const QueryState& state) {
    spdlog::debug("LDAP {} dn='{}' filter='{}'", toString(state.getMode()),
                  state.getDn().value_or("<root>"), state.getFilter());

    ResultHandlePtr results;
    switch (state.getMode()) {
        case SearchMode::READ:
            results = connection_.read(state.getDn(), state.getFilter(), state.getSelects());
            break;
        case SearchMode::RECURSIVE:
            results = connection_.search(state.getDn(), state.getFilter(), state.getSelects());
            break;
        case SearchMode::LISTING:
            results = connection_.listing(state.getDn(), state.getFilter(), state.getSelects());
            break;
    }

    if (!results) {
        spdlog::warn("LDAP {} returned no results container (dn='{}', filter='{}')",
                     toString(state.getMode()), state.getDn().value_or("<root>"), state.getFilter());
        return std::nullopt;
    }

    ResultSet resultSet = processResults(*results, state.isRaw());
    if (state.getSort()) {
        resultSet.sortBy(*state.getSort());
    }

    spdlog::debug("LDAP {} matched {} entries", toString(state.getMode()), resultSet.size());
    return resultSet;
}

ResultSet Search::processResults(const ResultHandle& results, bool raw) {
    RawEntries entries = connection_.getEntries(results);
    return raw ? ResultSet::fromRaw(std::move(entries)) : ResultSet::fromMapped(std::move(entries));
}

QueryState Search::snapshot() {
    return QueryState(query_.getSelects(), query_.render(), getDn(),
                      resolveMode(read_, recursive_), raw_, sort_);
}

// ========== Filter ==========

Search& Search::select(const std::vector<std::string>& fields) {
    query_.select(fields);
    return *this;
}

Search& Search::select(const std::string& field) {
    query_.select(field);
    return *this;
}

Search& Search::where(const std::string& field, Operator op, const std::string& value) {
    query_.where(field, op, value);
    return *this;
}

Search& Search::where(const std::string& field, const std::string& value) {
    query_.where(field, value);
    return *this;
}

Search& Search::whereContains(const std::string& field, const std::string& value) {
    query_.whereContains(field, value);
    return *this;
}

Search& Search::whereStartsWith(const std::string& field, const std::string& value) {
    query_.whereStartsWith(field, value);
    return *this;
}

Search& Search::whereEndsWith(const std::string& field, const std::string& value) {
    query_.whereEndsWith(field, value);
    return *this;
}

Search& Search::whereHas(const std::string& field) {
    query_.whereHas(field);
    return *this;
}

Search& Search::orWhere(const std::string& field, Operator op, const std::string& value) {
    query_.orWhere(field, op, value);
    return *this;
}

Search& Search::orWhere(const std::string& field, const std::string& value) {
    query_.orWhere(field, value);
    return *this;
}

Search& Search::orWhereContains(const std::string& field, const std::string& value) {
    query_.orWhereContains(field, value);
    return *this;
}

Search& Search::orWhereStartsWith(const std::string& field, const std::string& value) {
    query_.orWhereStartsWith(field, value);
    return *this;
}

Search& Search::orWhereEndsWith(const std::string& field, const std::string& value) {
    query_.orWhereEndsWith(field, value);
    return *this;
}

Search& Search::orWhereHas(const std::string& field) {
    query_.orWhereHas(field);
    return *this;
}

std::string Search::getQuery() const {
    return query_.render();
}

// ========== Paging ==========

std::optional<Paginator> Search::paginate(std::optional<int> perPage, int currentPage, bool isCritical) {
    PagedSearch pages = pagedSearch(perPage, isCritical);

    RawEntries rows;
    while (auto page = pages.next()) {
        rows.insert(rows.end(), std::make_move_iterator(page->begin()), std::make_move_iterator(page->end()));
    }

    if (pages.pagesFetched() == 0) {
        spdlog::warn("Paged search retrieved no pages (filter '{}')", pages.getState().getFilter());
        return std::nullopt;
    }

    ResultSet results = raw_ ? ResultSet::fromRaw(std::move(rows)) : ResultSet::fromMapped(std::move(rows));
    if (sort_) {
        results.sortBy(*sort_);
    }

    spdlog::debug("Paged search collected {} entries in {} pages", results.size(), pages.pagesFetched());
    return Paginator(std::move(results), perPage.value_or(pageSize_), currentPage, pages.pagesFetched());
}

PagedSearch Search::pagedSearch(std::optional<int> perPage, bool isCritical) {
    QueryState state = snapshot();
    QueryState subtree(state.getSelects(), state.getFilter(), state.getDn(),
                       SearchMode::RECURSIVE, state.isRaw(), state.getSort());
    return PagedSearch(connection_, std::move(subtree), perPage.value_or(pageSize_), isCritical);
}

Search& Search::setPageSize(int pageSize) {
    if (pageSize < 1) {
        throw ValidationException("Page size must be positive: " + std::to_string(pageSize));
    }
    pageSize_ = pageSize;
    return *this;
}

// ========== Options ==========

Search& Search::sortBy(const std::string& field, const std::string& direction) {
    sort_ = SortOrder{field, sortDirectionFromString(direction)};
    return *this;
}

Search& Search::setDn(const std::optional<std::string>& dn) {
    dn_ = dn;
    return *this;
}

std::optional<std::string> Search::getDn() {
    if (!dn_) {
        return std::nullopt;
    }
    if (!dn_->empty()) {
        return dn_;
    }

    std::string baseDn = getBaseDn();
    if (baseDn.empty()) {
        spdlog::warn("No base DN configured or discoverable, searching from the directory root");
        return std::nullopt;
    }
    return baseDn;
}

std::string Search::getBaseDn() {
    if (baseDn_.empty()) {
        if (auto discovered = findBaseDn()) {
            baseDn_ = *discovered;
        }
    }
    return baseDn_;
}

Search& Search::recursive(bool recursive) {
    recursive_ = recursive;
    return *this;
}

Search& Search::read(bool read) {
    read_ = read;
    return *this;
}

Search& Search::raw(bool raw) {
    raw_ = raw;
    return *this;
}

// ========== Lookups ==========

std::optional<models::MappedEntry> Search::find(const std::string& anr) {
    return where(schema::ANR, Operator::EQUALS, anr).first();
}

models::MappedEntry Search::findOrFail(const std::string& anr) {
    auto entry = find(anr);
    if (!entry) {
        throw EntryNotFoundException("Unable to find record in Active Directory.");
    }
    return std::move(*entry);
}

std::optional<models::MappedEntry> Search::findByDn(const std::string& dn) {
    return setDn(dn).read(true).whereHas(schema::OBJECT_CLASS).first();
}

std::optional<std::string> Search::findBaseDn() {
    Search probe(connection_, std::string());
    auto rootDse = probe.setDn(std::nullopt)
                        .read(true)
                        .raw(true)
                        .select(schema::DEFAULT_NAMING_CONTEXT)
                        .whereHas(schema::OBJECT_CLASS)
                        .firstRaw();

    if (!rootDse) {
        spdlog::warn("Root DSE could not be read");
        return std::nullopt;
    }

    auto namingContext = rootDse->first(schema::DEFAULT_NAMING_CONTEXT);
    if (!namingContext || namingContext->empty()) {
        spdlog::warn("Root DSE has no defaultNamingContext");
        return std::nullopt;
    }
    return namingContext;
}

} // namespace adldap::query
