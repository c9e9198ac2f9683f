#include "auth/token_credential.hpp"
#include "auth/token_provider.hpp"
#include "backend/key_vault_backend.hpp"
#include "config/config_loader.hpp"
#include "core/cancellation.hpp"
#include "core/utils.hpp"
#include "executor/operation_executor.hpp"
#include "lifecycle/lifecycle_manager.hpp"
#include "lifecycle/value_generator.hpp"
#include "transport/httplib_transport.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace kvault;

// Cancelled on SIGINT/SIGTERM so in-flight backoffs wake up
CancellationToken g_cancel;

// The handler only flags; a CancellationWatcher cancels from a normal thread
std::atomic<bool> g_stop{false};
static_assert(std::atomic<bool>::is_always_lock_free);

void signal_handler(int /*signal*/) {
    g_stop.store(true);
}

namespace {

constexpr const char* kDefaultConfigFile = "config/kvault.toml";

void print_usage() {
    std::cerr <<
        "usage: kvault [--config FILE] [--vault NAME] <command> [args]\n"
        "\n"
        "commands:\n"
        "  get NAME [--version ID]\n"
        "  set NAME VALUE [--group G]... [--expires ISO8601] [--attr KEY=VALUE]...\n"
        "  list [--deleted] [--group G]\n"
        "  groups\n"
        "  history NAME [--values]\n"
        "  rotate NAME [--length N] [--charset NAME]\n"
        "  rollback NAME VERSION\n"
        "  delete NAME\n"
        "  recover NAME\n"
        "  purge NAME\n"
        "  copy NAME TARGET_VAULT\n"
        "  move NAME TARGET_VAULT\n"
        "  rename NAME NEW_NAME\n";
}

struct CommandLine {
    std::string config_file = kDefaultConfigFile;
    std::string vault;
    std::string command;
    std::vector<std::string> positional;
    std::vector<std::string> groups;
    std::vector<std::string> attrs;
    std::string version;
    std::string expires;
    std::string charset;
    size_t length = RandomValueGenerator::kDefaultLength;
    bool deleted = false;
    bool values = false;
};

// Returns false on a malformed command line.
bool parse_args(int argc, char* argv[], CommandLine& cl) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };
        std::string tmp;
        if (arg == "--config") {
            if (!next(cl.config_file)) return false;
        } else if (arg == "--vault") {
            if (!next(cl.vault)) return false;
        } else if (arg == "--version") {
            if (!next(cl.version)) return false;
        } else if (arg == "--group") {
            if (!next(tmp)) return false;
            cl.groups.push_back(tmp);
        } else if (arg == "--attr") {
            if (!next(tmp)) return false;
            cl.attrs.push_back(tmp);
        } else if (arg == "--expires") {
            if (!next(cl.expires)) return false;
        } else if (arg == "--charset") {
            if (!next(cl.charset)) return false;
        } else if (arg == "--length") {
            if (!next(tmp)) return false;
            const auto n = utils::try_parse_int<size_t>(tmp);
            if (!n) return false;
            cl.length = *n;
        } else if (arg == "--deleted") {
            cl.deleted = true;
        } else if (arg == "--values") {
            cl.values = true;
        } else if (cl.command.empty()) {
            cl.command = arg;
        } else {
            cl.positional.push_back(arg);
        }
    }
    return !cl.command.empty();
}

int fail(const Error& err) {
    utils::log::error(err.describe());
    return err.code == ErrorCode::NOT_FOUND ? 2 : 1;
}

void print_record(const SecretRecord& rec, bool with_value) {
    std::cout << std::format("name:     {}\n", rec.identity.user_name);
    std::cout << std::format("id:       {}{}\n", rec.identity.backend_id,
                             rec.identity.hashed ? " (hashed)" : "");
    std::cout << std::format("version:  {}\n", rec.version_id);
    std::cout << std::format("updated:  {}\n", utils::format_iso8601(rec.updated_at));
    if (!rec.metadata.groups.empty()) {
        std::string groups;
        for (const auto& g : rec.metadata.groups) {
            if (!groups.empty()) groups += ",";
            groups += g;
        }
        std::cout << std::format("groups:   {}\n", groups);
    }
    if (rec.metadata.expires_at) {
        std::cout << std::format("expires:  {}\n", utils::format_iso8601(*rec.metadata.expires_at));
    }
    for (const auto& [k, v] : rec.metadata.custom) {
        std::cout << std::format("attr:     {}={}\n", k, v);
    }
    if (with_value && rec.value) {
        std::cout << rec.value->view() << "\n";
    }
}

Result<MetadataUpdate> build_update(const CommandLine& cl) {
    MetadataUpdate update;
    if (!cl.groups.empty()) {
        update.groups = std::set<std::string>(cl.groups.begin(), cl.groups.end());
    }
    if (!cl.expires.empty()) {
        const auto tp = utils::parse_iso8601(cl.expires);
        if (!tp) {
            return Result<MetadataUpdate>::error(ErrorCode::VALIDATION,
                std::format("Invalid --expires timestamp '{}'", cl.expires));
        }
        update.expires_at = *tp;
    }
    for (const auto& attr : cl.attrs) {
        const auto eq = attr.find('=');
        if (eq == std::string::npos || eq == 0) {
            return Result<MetadataUpdate>::error(ErrorCode::VALIDATION,
                std::format("--attr expects KEY=VALUE, got '{}'", attr));
        }
        update.custom[attr.substr(0, eq)] = attr.substr(eq + 1);
    }
    return Result<MetadataUpdate>::ok(std::move(update));
}

int run_command(LifecycleManager& manager, const std::string& vault, CommandLine& cl) {
    const auto& cmd = cl.command;
    const auto& pos = cl.positional;
    auto need = [&](size_t n) {
        if (pos.size() < n) {
            print_usage();
            return false;
        }
        return true;
    };

    if (cmd == "get") {
        if (!need(1)) return 64;
        auto r = manager.get(vault, pos[0], cl.version, g_cancel);
        if (r.is_error()) return fail(r.error());
        print_record(r.value(), true);
        return 0;
    }
    if (cmd == "set") {
        if (!need(2)) return 64;
        auto update = build_update(cl);
        if (update.is_error()) return fail(update.error());
        std::string raw = pos[1];
        auto r = manager.set(vault, pos[0], SecureString::adopt(raw), update.value(), g_cancel);
        if (r.is_error()) return fail(r.error());
        print_record(r.value(), false);
        return 0;
    }
    if (cmd == "list") {
        ListOptions opts;
        opts.include_deleted = cl.deleted;
        if (!cl.groups.empty()) opts.group = cl.groups.front();
        auto seq = manager.list_secrets(vault, opts, g_cancel);
        auto entries = seq.collect();
        if (entries.is_error()) return fail(entries.error());
        for (const auto& e : entries.value()) {
            std::cout << std::format("{:<40} {:<12} {}\n", e.identity.user_name,
                                     secret_state_to_string(e.state),
                                     utils::format_iso8601(e.updated_at));
        }
        return 0;
    }
    if (cmd == "groups") {
        auto index = manager.group_index(vault, g_cancel);
        if (index.is_error()) return fail(index.error());
        for (const auto& [group, names] : index.value()) {
            std::cout << group << ":\n";
            for (const auto& n : names) std::cout << "  " << n << "\n";
        }
        return 0;
    }
    if (cmd == "history") {
        if (!need(1)) return 64;
        auto seq = manager.get_versions(vault, pos[0], cl.values, g_cancel);
        auto versions = seq.collect();
        if (versions.is_error()) return fail(versions.error());
        for (const auto& v : versions.value()) {
            std::cout << std::format("{}  {}  {}", v.version_id,
                                     utils::format_iso8601(v.created_at),
                                     v.enabled ? "enabled" : "disabled");
            if (v.value) std::cout << "  " << v.value->view();
            std::cout << "\n";
        }
        return 0;
    }
    if (cmd == "rotate") {
        if (!need(1)) return 64;
        RandomValueGenerator gen;
        gen.length = cl.length;
        if (!cl.charset.empty()) {
            const auto cs = RandomValueGenerator::parse_charset(cl.charset);
            if (!cs) {
                return fail(Error{.code = ErrorCode::VALIDATION,
                                  .message = std::format("Unknown charset '{}'", cl.charset)});
            }
            gen.charset = *cs;
        }
        auto r = manager.rotate(vault, pos[0], gen, g_cancel);
        if (r.is_error()) return fail(r.error());
        print_record(r.value(), false);
        return 0;
    }
    if (cmd == "rollback") {
        if (!need(2)) return 64;
        auto r = manager.rollback(vault, pos[0], pos[1], g_cancel);
        if (r.is_error()) return fail(r.error());
        print_record(r.value(), false);
        return 0;
    }
    if (cmd == "delete" || cmd == "recover" || cmd == "purge") {
        if (!need(1)) return 64;
        auto r = cmd == "delete"  ? manager.remove(vault, pos[0], g_cancel)
               : cmd == "recover" ? manager.recover(vault, pos[0], g_cancel)
                                  : manager.purge(vault, pos[0], g_cancel);
        if (r.is_error()) return fail(r.error());
        std::cout << std::format("{} {}\n", r.value().identity.user_name,
                                 secret_state_to_string(r.value().state));
        return 0;
    }
    if (cmd == "copy" || cmd == "move") {
        if (!need(2)) return 64;
        auto r = cmd == "copy" ? manager.copy(vault, pos[1], pos[0], g_cancel)
                               : manager.move(vault, pos[1], pos[0], g_cancel);
        if (r.is_error()) return fail(r.error());
        print_record(r.value(), false);
        return 0;
    }

    if (cmd == "rename") {
        if (!need(2)) return 64;
        auto r = manager.rename(vault, pos[0], pos[1], g_cancel);
        if (r.is_error()) return fail(r.error());
        print_record(r.value(), false);
        return 0;
    }

    print_usage();
    return 64;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        CommandLine cl;
        if (!parse_args(argc, argv, cl)) {
            print_usage();
            return 64;
        }

        CancellationWatcher watcher(g_stop, g_cancel);
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        ClientConfig config;
        if (std::filesystem::exists(cl.config_file)) {
            auto loaded = ConfigLoader::load_from_file(cl.config_file);
            if (!loaded.success) {
                utils::log::error(loaded.error_message);
                return 78;
            }
            config = std::move(loaded.config);
        } else if (cl.config_file != kDefaultConfigFile) {
            utils::log::error(std::format("Config file not found: {}", cl.config_file));
            return 78;
        }
        utils::log::set_level(utils::log::parse_level(config.logging.level));

        const std::string vault = cl.vault.empty() ? config.vault.default_vault : cl.vault;
        if (vault.empty()) {
            utils::log::error("No vault given: pass --vault or set vault.default_vault");
            return 64;
        }

        auto transport = std::make_shared<HttplibTransport>(config.http);

        auto credential = make_credential(config.auth, transport);
        if (credential.is_error()) return fail(credential.error());
        utils::log::debug(std::format("Credential: {}", credential.value()->name()));

        AuthTokenProvider::Config token_cfg;
        token_cfg.refresh_margin = config.auth.refresh_margin;
        auto tokens = std::make_shared<AuthTokenProvider>(credential.value(), token_cfg);

        auto executor = std::make_shared<OperationExecutor>(transport, tokens, config.retry);
        auto backend = std::make_shared<KeyVaultBackend>(executor, config.vault, config.auth.scope);
        LifecycleManager manager(backend);

        const int rc = run_command(manager, vault, cl);

        const auto stats = executor->stats();
        utils::log::debug(std::format("Requests: {} attempts, {} retries, {} token refreshes",
                                      stats.attempts, stats.retries, tokens->refresh_count()));
        tokens->shutdown();
        return rc;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}
