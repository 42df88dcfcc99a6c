#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "temporal/strategy_schema.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace tempo {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars, arrays append.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10 (circular include?)");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base, the including file wins
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

std::optional<int> toml_optional_int(const toml::table& tbl, const std::string_view key) {
    if (const auto v = tbl[key].value<int64_t>()) {
        return static_cast<int>(*v);
    }
    return std::nullopt;
}

/**
 * @brief Column default as a SQL expression
 *
 * Strings are taken verbatim ("'draft'", "now()"); numbers and booleans are
 * rendered as literals.
 */
std::optional<std::string> toml_default_expression(const toml::table& tbl) {
    const auto node = tbl["default"];
    if (!node) return std::nullopt;
    if (const auto* s = node.as_string()) return std::string(s->get());
    if (const auto* i = node.as_integer()) return std::to_string(i->get());
    if (const auto* f = node.as_floating_point()) return std::format("{}", f->get());
    if (const auto* b = node.as_boolean()) return b->get() ? "true"s : "false"s;
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

DatabaseConfig ConfigLoader::extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* database = root["database"].as_table();
    if (!database) return cfg;
    const auto& db = *database;

    cfg.name = db["name"].value_or("default"s);
    cfg.pool.connection_string = db["connection_string"].value_or(""s);
    cfg.pool.min_connections = static_cast<size_t>(db["min_connections"].value_or(2));
    cfg.pool.max_connections = static_cast<size_t>(db["max_connections"].value_or(10));
    cfg.pool.connection_timeout = std::chrono::milliseconds(db["connection_timeout_ms"].value_or(5000));
    cfg.pool.idle_timeout = std::chrono::seconds(db["idle_timeout_seconds"].value_or(300));
    cfg.pool.health_check_query = db["health_check_query"].value_or("SELECT 1"s);
    cfg.pool.max_lifetime = std::chrono::seconds(db["max_lifetime_seconds"].value_or(3600));
    cfg.acquire_timeout = std::chrono::milliseconds(db["pool_acquire_timeout_ms"].value_or(5000));

    if (const auto* breaker = db["circuit_breaker"].as_table()) {
        const auto& cb = *breaker;
        auto& out = cfg.pool.circuit_breaker;
        cfg.pool.circuit_breaker_enabled = cb["enabled"].value_or(true);
        out.failure_threshold = cb["failure_threshold"].value_or(out.failure_threshold);
        out.success_threshold = cb["success_threshold"].value_or(out.success_threshold);
        out.timeout = std::chrono::milliseconds(cb["timeout_ms"].value_or(out.timeout.count()));
        out.half_open_max_calls = cb["half_open_max_calls"].value_or(out.half_open_max_calls);
    }

    auto schemas = toml_string_array(db, "schemas");
    if (!schemas.empty()) cfg.schemas = std::move(schemas);
    return cfg;
}

SyncConfig ConfigLoader::extract_sync(const toml::table& root) {
    SyncConfig cfg;
    const auto* sync = root["sync"].as_table();
    if (!sync) return cfg;
    const auto& s = *sync;

    cfg.allow_destructive = s["allow_destructive"].value_or(false);
    cfg.dry_run = s["dry_run"].value_or(false);
    cfg.authorized_by = s["authorized_by"].value_or(""s);
    cfg.reason = s["reason"].value_or(""s);
    cfg.max_history_entries = static_cast<size_t>(s["max_history_entries"].value_or(1000));
    return cfg;
}

RepositoryConfig ConfigLoader::extract_repository(const toml::table& root) {
    RepositoryConfig cfg;
    const auto* repository = root["repository"].as_table();
    if (!repository) return cfg;
    const auto& r = *repository;

    cfg.acquire_timeout = std::chrono::milliseconds(r["acquire_timeout_ms"].value_or(cfg.acquire_timeout.count()));
    cfg.cache_enabled = r["cache_enabled"].value_or(false);
    cfg.cache_ttl = std::chrono::seconds(r["cache_ttl_seconds"].value_or(cfg.cache_ttl.count()));
    cfg.retry.max_retries = r["max_retries"].value_or(cfg.retry.max_retries);
    cfg.retry.initial_backoff = std::chrono::milliseconds(
        r["initial_backoff_ms"].value_or(cfg.retry.initial_backoff.count()));
    cfg.retry.max_backoff = std::chrono::milliseconds(
        r["max_backoff_ms"].value_or(cfg.retry.max_backoff.count()));
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = utils::to_lower((*logging)["level"].value_or("info"s));
    return cfg;
}

std::vector<TableDefinition> ConfigLoader::extract_tables(const toml::table& root,
                                                          std::vector<std::string>& errors) {
    std::vector<TableDefinition> result;
    const auto* arr = root["tables"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* t = (*arr)[i].as_table();
        if (!t) {
            errors.push_back(std::format("tables[{}] must be a table", i));
            continue;
        }

        TableDefinition table;
        table.name = (*t)["name"].value_or(""s);
        table.schema = (*t)["schema"].value_or("public"s);
        table.multi_tenant = (*t)["multi_tenant"].value_or(false);
        table.soft_delete = (*t)["soft_delete"].value_or(true);
        table.tenant_field = (*t)["tenant_field"].value_or("tenant_id"s);

        const auto strategy = utils::to_lower((*t)["strategy"].value_or("none"s));
        if (auto parsed = parse_strategy(strategy)) {
            table.strategy = *parsed;
        } else {
            errors.push_back(std::format(
                "tables[{}].strategy '{}' must be none, copy_on_change or scd2", i, strategy));
        }

        if (const auto* columns = (*t)["columns"].as_array()) {
            for (size_t j = 0; j < columns->size(); ++j) {
                const auto* c = (*columns)[j].as_table();
                if (!c) continue;

                ColumnDefinition col;
                col.name = (*c)["name"].value_or(""s);
                col.nullable = (*c)["nullable"].value_or(true);
                col.max_length = toml_optional_int(*c, "max_length");
                col.precision = toml_optional_int(*c, "precision");
                col.scale = toml_optional_int(*c, "scale");
                col.default_value = toml_default_expression(*c);

                const auto type_name = utils::to_lower((*c)["type"].value_or(""s));
                if (auto lt = parse_logical_type(type_name)) {
                    col.logical_type = *lt;
                } else {
                    errors.push_back(std::format(
                        "tables[{}].columns[{}].type '{}' is not a supported type", i, j, type_name));
                }
                table.columns.emplace_back(std::move(col));
            }
        }

        if (const auto* indexes = (*t)["indexes"].as_array()) {
            for (const auto& elem : *indexes) {
                const auto* x = elem.as_table();
                if (!x) continue;

                IndexDefinition index;
                index.name = (*x)["name"].value_or(""s);
                index.table = table.name;
                index.columns = toml_string_array(*x, "columns");
                index.unique = (*x)["unique"].value_or(false);
                index.method = utils::to_lower((*x)["method"].value_or("btree"s));
                index.where = toml_optional_string(*x, "where");
                table.indexes.emplace_back(std::move(index));
            }
        }

        result.emplace_back(std::move(table));
    }
    return result;
}

ConfigLoader::LoadResult ConfigLoader::extract_and_validate(const toml::table& root) {
    std::vector<std::string> errors;

    TempoConfig config;
    config.database = extract_database(root);
    config.sync = extract_sync(root);
    config.repository = extract_repository(root);
    config.logging = extract_logging(root);
    config.tables = extract_tables(root, errors);

    auto validation = validate_config(config);
    errors.insert(errors.end(), validation.begin(), validation.end());

    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const TempoConfig& config) {
    std::vector<std::string> errors;

    const auto& db = config.database;
    if (db.pool.connection_string.empty()) {
        errors.emplace_back("database.connection_string must not be empty");
    }
    if (db.pool.max_connections == 0) {
        errors.emplace_back("database.max_connections must be > 0");
    }
    if (db.pool.min_connections > db.pool.max_connections) {
        errors.push_back(std::format(
            "database.min_connections ({}) > max_connections ({})",
            db.pool.min_connections, db.pool.max_connections));
    }

    const auto& breaker = db.pool.circuit_breaker;
    if (db.pool.circuit_breaker_enabled
        && (breaker.failure_threshold == 0 || breaker.success_threshold == 0
            || breaker.half_open_max_calls == 0)) {
        errors.emplace_back("database.circuit_breaker thresholds and half_open_max_calls must be > 0");
    }

    const auto& repo = config.repository;
    if (repo.cache_enabled && repo.cache_ttl.count() <= 0) {
        errors.emplace_back("repository.cache_ttl_seconds must be > 0 when cache_enabled is true");
    }
    if (repo.retry.initial_backoff.count() < 0 || repo.retry.max_backoff < repo.retry.initial_backoff) {
        errors.push_back(std::format(
            "repository.initial_backoff_ms ({}) must be >= 0 and <= max_backoff_ms ({})",
            repo.retry.initial_backoff.count(), repo.retry.max_backoff.count()));
    }

    if (config.sync.allow_destructive
        && (config.sync.authorized_by.empty() || config.sync.reason.empty())) {
        errors.emplace_back("sync.authorized_by and sync.reason required when allow_destructive is true");
    }

    static const std::unordered_set<std::string> kLevels = {"info", "warn", "warning", "error"};
    if (!kLevels.contains(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' must be info, warn or error",
                                     config.logging.level));
    }

    std::unordered_set<std::string> table_names;
    for (size_t i = 0; i < config.tables.size(); ++i) {
        const auto& table = config.tables[i];
        if (table.name.empty()) {
            errors.push_back(std::format("tables[{}].name must not be empty", i));
            continue;
        }
        if (!table_names.insert(table.qualified_name()).second) {
            errors.push_back(std::format("tables[{}]: {} declared twice", i, table.qualified_name()));
        }

        std::unordered_set<std::string> column_names;
        for (size_t j = 0; j < table.columns.size(); ++j) {
            const auto& col = table.columns[j];
            if (col.name.empty()) {
                errors.push_back(std::format("tables[{}].columns[{}].name must not be empty", i, j));
                continue;
            }
            if (!column_names.insert(col.name).second) {
                errors.push_back(std::format("{}.{} declared twice", table.name, col.name));
            }
            if (StrategySchema::is_managed_column(table, col.name)) {
                errors.push_back(std::format(
                    "{}.{} is managed by the {} strategy and cannot be declared",
                    table.name, col.name, strategy_to_string(table.strategy)));
            }
            if (col.precision && col.scale && *col.scale > *col.precision) {
                errors.push_back(std::format("{}.{}: scale ({}) > precision ({})",
                    table.name, col.name, *col.scale, *col.precision));
            }
        }

        for (const auto& index : table.indexes) {
            if (index.name.empty()) {
                errors.push_back(std::format("{}: index name must not be empty", table.name));
            }
            if (index.columns.empty()) {
                errors.push_back(std::format("{}.{}: index needs at least one column",
                                             table.name, index.name));
            }
            for (const auto& column : index.columns) {
                if (!column_names.contains(column) && !StrategySchema::is_managed_column(table, column)) {
                    errors.push_back(std::format("{}.{}: unknown column '{}'",
                                                 table.name, index.name, column));
                }
            }
        }
    }

    return errors;
}

} // namespace tempo
