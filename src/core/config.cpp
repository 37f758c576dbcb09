#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <cstdint>
#include <fstream>
#include <limits>

using nlohmann::json;

const char* selection_mode_name(SelectionMode mode) {
    switch (mode) {
    case SelectionMode::FLAT:             return "flat";
    case SelectionMode::RECURSIVE_CLONE:  return "recursive_clone";
    case SelectionMode::EXACT_DIRECTORY:  return "exact_directory";
    case SelectionMode::PATTERN_FILTERED: return "pattern_filtered";
    case SelectionMode::MIRROR:           return "mirror";
    }
    return "mirror";
}

// ── YAML → JSON ──────────────────────────────────────────────
// Scalars stay strings unless they read cleanly as bool or integer, which is
// what the JSON keys expect ("port: 2222", "delete_after_sync: true").

static json yaml_scalar_to_json(const YAML::Node& node) {
    const std::string raw = node.Scalar();
    if (node.Tag() == "!") return raw;  // explicitly quoted

    bool b;
    if (YAML::convert<bool>::decode(node, b)) return b;

    long long n;
    if (!raw.empty() && YAML::convert<long long>::decode(node, n)) return n;

    return raw;
}

static json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Map: {
        json obj = json::object();
        for (const auto& kv : node) {
            obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
        }
        return obj;
    }
    case YAML::NodeType::Sequence: {
        json arr = json::array();
        for (const auto& item : node) arr.push_back(yaml_to_json(item));
        return arr;
    }
    case YAML::NodeType::Scalar:
        return yaml_scalar_to_json(node);
    default:
        return nullptr;
    }
}

json yaml_file_to_json(const fs::path& path) {
    return yaml_to_json(YAML::LoadFile(path.string()));
}

// ── Field helpers ────────────────────────────────────────────

static bool read_bool(const json& root, const char* key, bool fallback, std::string& err) {
    if (!root.contains(key) || root[key].is_null()) return fallback;
    const auto& v = root[key];
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_string()) {
        std::string s = v.get<std::string>();
        if (s == "true" || s == "True") return true;
        if (s == "false" || s == "False") return false;
    }
    err = fmt::format("'{}' must be a boolean", key);
    return fallback;
}

static std::optional<std::string> read_string(const json& root, const char* key, std::string& err) {
    if (!root.contains(key) || root[key].is_null()) return std::nullopt;
    if (!root[key].is_string()) {
        err = fmt::format("'{}' must be a string", key);
        return std::nullopt;
    }
    return root[key].get<std::string>();
}

// Accepts 22 or "22"; an empty string means "not set"
static std::optional<int> read_int(const json& root, const char* key, std::string& err) {
    if (!root.contains(key) || root[key].is_null()) return std::nullopt;
    const auto& v = root[key];
    if (v.is_number_unsigned()) {
        auto u = v.get<uint64_t>();
        if (u <= static_cast<uint64_t>(std::numeric_limits<int>::max())) return static_cast<int>(u);
        err = fmt::format("'{}' out of range: {}", key, u);
        return std::nullopt;
    }
    if (v.is_number_integer()) {
        auto i = v.get<int64_t>();
        if (i >= std::numeric_limits<int>::min() && i <= std::numeric_limits<int>::max()) {
            return static_cast<int>(i);
        }
        err = fmt::format("'{}' out of range: {}", key, i);
        return std::nullopt;
    }
    if (v.is_string()) {
        std::string s = v.get<std::string>();
        trim(s);
        if (s.empty()) return std::nullopt;
        int parsed = safe_stoi(s, -1);
        if (parsed >= 0 && std::to_string(parsed) == s) return parsed;
    }
    err = fmt::format("'{}' must be an integer", key);
    return std::nullopt;
}

static std::vector<std::string> read_string_list(const json& root, const char* key, std::string& err) {
    std::vector<std::string> out;
    if (!root.contains(key) || root[key].is_null()) return out;
    if (!root[key].is_array()) {
        err = fmt::format("'{}' must be a list of strings", key);
        return out;
    }
    for (const auto& item : root[key]) {
        if (!item.is_string()) {
            err = fmt::format("'{}' must be a list of strings", key);
            return {};
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

// ── Config ───────────────────────────────────────────────────

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config file not found: " + path.string());
    }

    json root;
    auto ext = path.extension().string();
    try {
        if (ext == ".yaml" || ext == ".yml") {
            root = yaml_file_to_json(path);
        } else {
            std::ifstream in(path);
            if (!in) {
                return Result<Config>::Err("Cannot read config file: " + path.string());
            }
            root = json::parse(in);
        }
    } catch (const json::parse_error& e) {
        return Result<Config>::Err(fmt::format("Invalid JSON in {}: {}", path.string(), e.what()));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Invalid YAML in {}: {}", path.string(), e.what()));
    }

    auto result = parse(root);
    if (result.is_ok()) {
        result.value.source_path_ = path;
    }
    return result;
}

Result<Config> Config::parse(const json& root) {
    if (!root.is_object()) {
        return Result<Config>::Err("Config must be a JSON object");
    }

    std::string err;
    Config config;
    SyncSettings& s = config.settings_;

    // Connection
    auto host = read_string(root, "host", err);
    auto user = read_string(root, "username", err);
    auto port = read_int(root, "port", err);
    auto timeout = read_int(root, "timeout", err);
    s.remote.password = read_string(root, "password", err);
    s.remote.private_key = read_string(root, "private_key", err);
    s.remote.private_key_passphrase = read_string(root, "private_key_passphrase", err);
    if (!err.empty()) return Result<Config>::Err(err);

    if (!host || host->empty()) return Result<Config>::Err("Missing required key 'host'");
    if (!user || user->empty()) return Result<Config>::Err("Missing required key 'username'");
    s.remote.host = *host;
    s.remote.user = *user;
    s.remote.port = port.value_or(DEFAULT_SFTP_PORT);
    s.remote.timeout = timeout.value_or(DEFAULT_CONNECT_TIMEOUT);
    if (s.remote.port <= 0 || s.remote.port > 65535) {
        return Result<Config>::Err(fmt::format("'port' out of range: {}", s.remote.port));
    }
    if (s.remote.timeout <= 0) {
        return Result<Config>::Err(fmt::format("'timeout' must be a positive number of seconds: {}",
                                               s.remote.timeout));
    }

    // Empty strings count as absent, matching how the credentials are chosen
    if (s.remote.password && s.remote.password->empty()) s.remote.password.reset();
    if (s.remote.private_key && s.remote.private_key->empty()) s.remote.private_key.reset();
    if (!s.remote.password && !s.remote.private_key) {
        return Result<Config>::Err("One of 'password' or 'private_key' must be set");
    }

    // Source selection
    auto prefix = read_string(root, "path_prefix", err);
    s.files = read_string_list(root, "files", err);
    s.tables = read_string_list(root, "tables", err);
    bool recursive_clone = read_bool(root, "recursive_clone", false, err);
    bool exact_directory = read_bool(root, "exact_directory", false, err);
    auto target = read_string(root, "target_dir", err);
    if (!err.empty()) return Result<Config>::Err(err);

    if (!target || target->empty()) return Result<Config>::Err("Missing required key 'target_dir'");
    s.target_dir = *target;
    s.path_prefix = prefix ? remote_normalize(*prefix) : "";

    if (!s.files.empty()) {
        s.mode = SelectionMode::FLAT;
    } else if (s.path_prefix.empty()) {
        return Result<Config>::Err("One of the parameters 'path_prefix' or 'files' must be defined");
    } else if (!s.tables.empty()) {
        s.mode = SelectionMode::PATTERN_FILTERED;
    } else if (recursive_clone) {
        s.mode = SelectionMode::RECURSIVE_CLONE;
    } else if (exact_directory) {
        s.mode = SelectionMode::EXACT_DIRECTORY;
    } else {
        s.mode = SelectionMode::MIRROR;
    }

    // Deletion and incremental behaviour
    s.delete_after_sync = read_bool(root, "delete_after_sync", false, err);
    s.incremental_mode = read_bool(root, "incremental_mode", false, err);
    s.max_file_count = read_int(root, "max_file_count", err);
    if (!err.empty()) return Result<Config>::Err(err);

    if (s.max_file_count) {
        if (!s.delete_after_sync) {
            return Result<Config>::Err("'max_file_count' requires 'delete_after_sync' to be enabled");
        }
        if (*s.max_file_count <= 0) {
            return Result<Config>::Err("'max_file_count' must be a positive integer");
        }
    }

    return Result<Config>::Ok(config);
}
