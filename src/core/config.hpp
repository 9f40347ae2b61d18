#pragma once

#include <string>
#include <optional>
#include <map>
#include <filesystem>
#include "constants.hpp"
#include "types.hpp"

namespace fs = std::filesystem;

// `defaults:` section
struct ConfigDefaults {
    PtyType pty = PtyType::Vanilla;
    int connect_timeout = CONNECT_TIMEOUT_SECS;   // seconds
    int request_timeout = REQUEST_TIMEOUT_SECS;   // seconds, 0 = none
    std::string log_file;                         // empty = <tmp>/sshlink_debug.log
};

// One entry under `hosts:`
struct HostProfile {
    std::string name;
    std::string host;
    int port = SSH_DEFAULT_PORT;
    std::string user;
    std::optional<std::string> password;
    std::optional<std::string> key_file;
    std::optional<std::string> public_key_file;
    std::optional<std::string> passphrase;
};

class Config {
public:
    // Load ~/.sshlink/config.yaml (or the given file)
    static Result<Config> load(const fs::path& path);
    static Result<Config> load();

    // Parse YAML text directly
    static Result<Config> parse(const std::string& text);

    const ConfigDefaults& defaults() const { return defaults_; }
    const std::map<std::string, HostProfile>& hosts() const { return hosts_; }

    Result<HostProfile> profile(const std::string& name) const;

public:
    Config() = default;

private:
    ConfigDefaults defaults_;
    std::map<std::string, HostProfile> hosts_;
};

// Reads key files from disk; a profile with a password yields a PasswordCredential.
Result<Credential> load_credential(const HostProfile& profile);

// Expands a leading "~/" to the home directory.
fs::path expand_home(const std::string& path);

bool config_exists();
fs::path get_config_dir();
fs::path get_config_path();

// Writes a commented template; leaves an existing file alone.
Result<void> create_default_config(const fs::path& path);
Result<void> create_default_config();
