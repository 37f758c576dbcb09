#pragma once

#include <string>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load a run config from JSON (or YAML when the extension is .yaml/.yml)
    static Result<Config> load(const fs::path& path);

    // Validate an already-parsed config object and resolve the selection mode
    static Result<Config> parse(const nlohmann::json& root);

    // Accessors
    const SyncSettings& settings() const { return settings_; }
    const RemoteConfig& remote() const { return settings_.remote; }
    SelectionMode mode() const { return settings_.mode; }
    const fs::path& source_path() const { return source_path_; }

public:
    Config() = default;

private:
    SyncSettings settings_;
    fs::path source_path_;
};

// Read a YAML document into the equivalent JSON value (maps, sequences, scalars)
nlohmann::json yaml_file_to_json(const fs::path& path);
