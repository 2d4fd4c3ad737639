/**
 * @file adldap_search.cpp
 * @brief Command line directory search
 *
 * Builds a filter from the command line, runs it against the directory
 * configured through LDAP_* environment variables and prints the results
 * as JSON on stdout. Logs go to stderr.
 *
 * Usage:
 *   ./adldap-search [--base DN|--root] [--scope sub|one|base] [--select a,b]
 *                   [--where F OP V]... [--or-where F OP V]...
 *                   [--sort FIELD [asc|desc]] [--raw] [--paged] [--page-size N]
 *                   [--first] [--filter-only]
 *
 * Exit codes: 0 success, 1 connection/configuration/search failure,
 * 2 usage error.
 */

#include "adldap/client.h"
#include "adldap/common/config_manager.h"
#include "adldap/common/logger.h"
#include "adldap/exceptions.h"
#include "adldap/openldap/openldap_connection.h"
#include "adldap/utils/string_utils.h"
#include "adldap/version.h"

#include <json/json.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace adldap;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_RUNTIME = 1;
constexpr int EXIT_USAGE = 2;

struct Condition {
    std::string field;
    query::Operator op;
    std::string value;
    query::Boolean boolean;
};

struct Options {
    std::optional<std::string> base;
    bool root = false;
    std::string scope = "sub";
    std::vector<std::string> select;
    std::vector<Condition> conditions;
    std::optional<std::string> sortField;
    std::string sortDirection = "desc";
    bool raw = false;
    bool paged = false;
    std::optional<int> pageSize;
    bool first = false;
    bool filterOnly = false;
};

void printUsage(const char* program) {
    std::cout << "adldap-search " << ADLDAP_VERSION_STRING << "\n"
              << "Usage: " << program << " [options]\n"
              << "  --base DN            Search below DN (default: base DN)\n"
              << "  --root               Search from the directory root\n"
              << "  --scope S            sub (default), one or base\n"
              << "  --select a,b         Attributes to retrieve\n"
              << "  --where F OP V       AND condition (OP: = ! * >= <= ~= starts_with ends_with contains has)\n"
              << "  --or-where F OP V    OR condition\n"
              << "  --sort FIELD [DIR]   Sort by FIELD, DIR asc or desc (default: desc)\n"
              << "  --raw                Print raw attributes without category mapping\n"
              << "  --paged              Use paged search with LDAP_PAGE_SIZE entries per page\n"
              << "  --page-size N        Use paged search with N entries per page\n"
              << "  --first              Print only the first entry\n"
              << "  --filter-only        Print the rendered filter and exit\n"
              << "  --help               Show this help\n"
              << "\n"
              << "Connection settings: LDAP_HOST, LDAP_PORT, LDAP_BASE_DN, LDAP_BIND_DN,\n"
              << "LDAP_BIND_PASSWORD, LDAP_NETWORK_TIMEOUT, LDAP_PAGE_SIZE. Logging: LOG_LEVEL, LOG_FILE.\n";
}

/**
 * @return true on success; on failure error holds the reason
 */
bool parseArguments(int argc, char* argv[], Options& options, std::string& error) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--base" && i + 1 < argc) {
            options.base = argv[++i];
        } else if (arg == "--root") {
            options.root = true;
        } else if (arg == "--scope" && i + 1 < argc) {
            options.scope = argv[++i];
            if (options.scope != "sub" && options.scope != "one" && options.scope != "base") {
                error = "Invalid scope: " + options.scope;
                return false;
            }
        } else if (arg == "--select" && i + 1 < argc) {
            for (const auto& field : utils::split(argv[++i], ',')) {
                std::string trimmed = utils::trim(field);
                if (!trimmed.empty()) {
                    options.select.push_back(trimmed);
                }
            }
        } else if ((arg == "--where" || arg == "--or-where") && i + 3 < argc) {
            std::string field = argv[++i];
            std::string token = argv[++i];
            std::string value = argv[++i];

            auto op = query::operatorFromString(token);
            if (!op) {
                error = "Unknown operator: " + token;
                return false;
            }
            options.conditions.push_back(Condition{
                field, *op, value, arg == "--where" ? query::Boolean::AND : query::Boolean::OR});
        } else if (arg == "--sort" && i + 1 < argc) {
            options.sortField = argv[++i];
            if (i + 1 < argc) {
                std::string direction = utils::toLower(argv[i + 1]);
                if (direction == "asc" || direction == "desc") {
                    options.sortDirection = direction;
                    ++i;
                }
            }
        } else if (arg == "--raw") {
            options.raw = true;
        } else if (arg == "--paged") {
            options.paged = true;
        } else if (arg == "--page-size" && i + 1 < argc) {
            options.paged = true;
            try {
                options.pageSize = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                error = std::string("Invalid page size: ") + argv[i];
                return false;
            }
            if (*options.pageSize <= 0) {
                error = "Page size must be positive";
                return false;
            }
        } else if (arg == "--first") {
            options.first = true;
        } else if (arg == "--filter-only") {
            options.filterOnly = true;
        } else {
            error = "Unknown or incomplete argument: " + arg;
            return false;
        }
    }

    if (options.root && options.base) {
        error = "--base and --root are mutually exclusive";
        return false;
    }
    return true;
}

void applyConditions(const Options& options, query::Builder& builder) {
    for (const auto& condition : options.conditions) {
        builder.addPredicate(condition.field, condition.op, condition.value, condition.boolean);
    }
    builder.select(options.select);
}

void printJson(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    std::cout << Json::writeString(writer, value) << std::endl;
}

int run(const Options& options) {
    auto& config = common::ConfigManager::getInstance();

    Configuration settings = Configuration::fromConfigManager(config);
    settings.validate();

    openldap::OpenLdapConnection connection(settings);
    connection.connect();

    Client client(connection, settings);
    query::Search search = client.search();

    applyConditions(options, search.getQueryBuilder());

    if (options.root) {
        search.setDn(std::nullopt);
    } else if (options.base) {
        search.setDn(*options.base);
    }

    search.read(options.scope == "base").recursive(options.scope == "sub").raw(options.raw);

    if (options.sortField) {
        search.sortBy(*options.sortField, options.sortDirection);
    }

    spdlog::info("Searching with filter '{}'", search.getQuery());

    if (options.paged) {
        auto paginator = search.paginate(options.pageSize, 0, true);
        if (!paginator) {
            spdlog::error("Paged search failed");
            return EXIT_FAILURE_RUNTIME;
        }
        printJson(paginator->toJson());
        return EXIT_OK;
    }

    auto results = search.get();
    if (!results) {
        spdlog::error("Search failed");
        return EXIT_FAILURE_RUNTIME;
    }

    if (options.first) {
        if (results->empty()) {
            printJson(Json::Value(Json::nullValue));
        } else if (results->isRaw()) {
            printJson(models::toJson(results->rawEntries().front()));
        } else {
            printJson(models::toJson(results->entries().front()));
        }
        return EXIT_OK;
    }

    printJson(results->toJson());
    return EXIT_OK;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        if (std::string(argv[i]) == "--help") {
            printUsage(argv[0]);
            return EXIT_OK;
        }
    }

    Options options;
    std::string error;
    if (!parseArguments(argc, argv, options, error)) {
        std::cerr << error << "\n";
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    if (options.filterOnly) {
        query::Builder builder;
        applyConditions(options, builder);
        std::cout << builder.render() << std::endl;
        return EXIT_OK;
    }

    auto& config = common::ConfigManager::getInstance();
    common::Logger::initialize("adldap-search",
                               config.getString(common::ConfigManager::LOG_LEVEL, "warn"),
                               config.has(common::ConfigManager::LOG_FILE),
                               config.getString(common::ConfigManager::LOG_FILE));

    try {
        return run(options);
    } catch (const ConfigException& e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE_RUNTIME;
    } catch (const ConnectionException& e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE_RUNTIME;
    } catch (const AdldapException& e) {
        spdlog::error("Search failed: {}", e.what());
        return EXIT_FAILURE_RUNTIME;
    }
}
