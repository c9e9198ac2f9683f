#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "identity/name_sanitizer.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <optional>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace kvault {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;

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
 * @brief Deep-merge two toml::tables. Overlay wins for scalars and arrays.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(std::format(
            "Config include depth exceeds {}, possible circular include", kMaxIncludeDepth));
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

        // Included is base, root is overlay (including file wins)
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

// ---- Section extractors ----------------------------------------------------

AuthConfig extract_auth(const toml::table& root, std::vector<std::string>& errors) {
    AuthConfig cfg;
    const auto* auth = root["auth"].as_table();
    if (!auth) return cfg;
    const auto& a = *auth;

    const auto method = a["method"].value_or("environment"s);
    if (const auto parsed = ConfigLoader::parse_auth_method(method)) {
        cfg.method = *parsed;
    } else {
        errors.push_back(std::format(
            "auth.method must be client_secret, static_token or environment, got '{}'", method));
    }

    cfg.tenant_id = a["tenant_id"].value_or(""s);
    cfg.client_id = a["client_id"].value_or(""s);
    cfg.client_secret = a["client_secret"].value_or(""s);
    cfg.access_token = a["access_token"].value_or(""s);
    cfg.authority_host = a["authority_host"].value_or(cfg.authority_host);
    cfg.scope = a["scope"].value_or(cfg.scope);
    cfg.refresh_margin = std::chrono::seconds(a["refresh_margin_seconds"].value_or(int64_t{300}));
    return cfg;
}

VaultConfig extract_vault(const toml::table& root) {
    VaultConfig cfg;
    const auto* vault = root["vault"].as_table();
    if (!vault) return cfg;
    const auto& v = *vault;

    cfg.default_vault = v["default_vault"].value_or(""s);
    cfg.dns_suffix = v["dns_suffix"].value_or(cfg.dns_suffix);
    cfg.api_version = v["api_version"].value_or(cfg.api_version);
    cfg.page_size = static_cast<uint32_t>(v["page_size"].value_or(int64_t{25}));
    return cfg;
}

HttpClientConfig extract_http(const toml::table& root) {
    HttpClientConfig cfg;
    const auto* http = root["http"].as_table();
    if (!http) return cfg;
    const auto& h = *http;

    cfg.connect_timeout = std::chrono::milliseconds(h["connect_timeout_ms"].value_or(int64_t{30000}));
    cfg.read_timeout = std::chrono::milliseconds(h["read_timeout_ms"].value_or(int64_t{120000}));
    cfg.user_agent = h["user_agent"].value_or(cfg.user_agent);
    return cfg;
}

RetryPolicy extract_retry(const toml::table& root) {
    RetryPolicy cfg;
    const auto* retry = root["retry"].as_table();
    if (!retry) return cfg;
    const auto& r = *retry;

    cfg.max_attempts = static_cast<uint32_t>(r["max_attempts"].value_or(int64_t{4}));
    cfg.initial_backoff = std::chrono::milliseconds(r["initial_backoff_ms"].value_or(int64_t{1000}));
    cfg.max_backoff = std::chrono::milliseconds(r["max_backoff_ms"].value_or(int64_t{30000}));
    cfg.multiplier = r["multiplier"].value_or(2.0);
    cfg.jitter = r["jitter"].value_or(0.2);
    cfg.max_elapsed = std::chrono::milliseconds(r["max_elapsed_ms"].value_or(int64_t{120000}));
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

ClientConfig extract_all_sections(const toml::table& tbl, std::vector<std::string>& errors) {
    ClientConfig config;
    config.auth = extract_auth(tbl, errors);
    config.vault = extract_vault(tbl);
    config.http = extract_http(tbl);
    config.retry = extract_retry(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::optional<AuthMethod> ConfigLoader::parse_auth_method(const std::string& name) {
    const auto lower = utils::to_lower(name);
    if (lower == "environment" || lower == "env") return AuthMethod::ENVIRONMENT;
    if (lower == "client_secret") return AuthMethod::CLIENT_SECRET;
    if (lower == "static_token" || lower == "token") return AuthMethod::STATIC_TOKEN;
    return std::nullopt;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(ClientConfig config) {
    const auto errors = validate_config(config);
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
        std::vector<std::string> errors;
        auto config = extract_all_sections(tbl, errors);
        if (!errors.empty()) {
            return LoadResult::error(std::format("Config validation failed:\n  - {}", errors.front()));
        }
        return validate_and_return(std::move(config));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        std::vector<std::string> errors;
        auto config = extract_all_sections(tbl, errors);
        if (!errors.empty()) {
            return LoadResult::error(std::format("Config validation failed:\n  - {}", errors.front()));
        }
        return validate_and_return(std::move(config));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ClientConfig& config) {
    std::vector<std::string> errors;

    if (config.auth.method == AuthMethod::CLIENT_SECRET) {
        if (config.auth.tenant_id.empty()) {
            errors.push_back("auth.tenant_id required for client_secret auth");
        }
        if (config.auth.client_id.empty()) {
            errors.push_back("auth.client_id required for client_secret auth");
        }
        if (config.auth.client_secret.empty()) {
            errors.push_back("auth.client_secret required for client_secret auth");
        }
    }
    if (config.auth.scope.empty()) {
        errors.push_back("auth.scope must not be empty");
    }
    if (config.auth.refresh_margin.count() < 0) {
        errors.push_back("auth.refresh_margin_seconds must be >= 0");
    }

    if (!config.vault.default_vault.empty()) {
        if (auto v = NameSanitizer::validate_vault_name(config.vault.default_vault); v.is_error()) {
            errors.push_back(std::format("vault.default_vault: {}", v.error_message()));
        }
    }
    if (config.vault.page_size < 1 || config.vault.page_size > 25) {
        errors.push_back(std::format("vault.page_size must be 1-25, got {}", config.vault.page_size));
    }
    if (config.vault.dns_suffix.empty()) {
        errors.push_back("vault.dns_suffix must not be empty");
    }

    if (config.http.connect_timeout.count() <= 0) {
        errors.push_back("http.connect_timeout_ms must be > 0");
    }
    if (config.http.read_timeout.count() <= 0) {
        errors.push_back("http.read_timeout_ms must be > 0");
    }

    if (config.retry.max_attempts < 1) {
        errors.push_back("retry.max_attempts must be >= 1");
    }
    if (config.retry.initial_backoff.count() < 0) {
        errors.push_back("retry.initial_backoff_ms must be >= 0");
    }
    if (config.retry.max_backoff < config.retry.initial_backoff) {
        errors.push_back(std::format("retry.max_backoff_ms ({}) < initial_backoff_ms ({})",
            config.retry.max_backoff.count(), config.retry.initial_backoff.count()));
    }
    if (config.retry.multiplier < 1.0) {
        errors.push_back("retry.multiplier must be >= 1.0");
    }
    if (config.retry.jitter < 0.0 || config.retry.jitter > 1.0) {
        errors.push_back("retry.jitter must be between 0.0 and 1.0");
    }
    if (config.retry.max_elapsed.count() <= 0) {
        errors.push_back("retry.max_elapsed_ms must be > 0");
    }

    const auto level = utils::to_lower(config.logging.level);
    if (level != "debug" && level != "info" && level != "warn" && level != "warning" &&
        level != "error") {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
                                     config.logging.level));
    }

    return errors;
}

} // namespace kvault
