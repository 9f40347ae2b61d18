#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

bool config_exists() {
    return fs::exists(get_config_path());
}

fs::path get_config_dir() {
    return platform::home_dir() / CONFIG_DIR_NAME;
}

fs::path get_config_path() {
    return get_config_dir() / CONFIG_FILE_NAME;
}

fs::path expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir();
    if (path.rfind("~/", 0) == 0) return platform::home_dir() / path.substr(2);
    return fs::path(path);
}

Result<void> create_default_config() {
    return create_default_config(get_config_path());
}

Result<void> create_default_config(const fs::path& config_path) {
    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::ConfigError,
            fmt::format("Failed to create {}: {}", config_path.parent_path().string(), ec.message()));
    }

    const char* default_config = R"(# sshlink configuration

defaults:
  pty: vanilla            # vanilla, vt100, vt102, vt220, ansi, xterm
  connect_timeout: 30     # seconds
  request_timeout: 0      # seconds per request, 0 = wait forever
  # log_file: /tmp/sshlink_debug.log

hosts:
  # example:
  #   host: "example.com"
  #   port: 22
  #   user: "me"
  #   key_file: "~/.ssh/id_ed25519"
  #   public_key_file: "~/.ssh/id_ed25519.pub"   # optional
  #   passphrase: ""                              # optional
  #
  # with-password:
  #   host: "10.0.0.5"
  #   user: "admin"
  #   password: "secret"
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err(ErrorKind::ConfigError,
            "Failed to create config file at " + config_path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}

// ── Parsing ────────────────────────────────────────────────────

static Result<ConfigDefaults> parse_defaults(const YAML::Node& node) {
    ConfigDefaults defaults;
    if (!node) return Result<ConfigDefaults>::Ok(defaults);

    auto pty = parse_pty_type(node["pty"].as<std::string>("vanilla"));
    if (pty.is_err()) {
        return Result<ConfigDefaults>::Err(ErrorKind::ConfigError,
            "defaults.pty: " + pty.error.message);
    }
    defaults.pty = pty.value;
    defaults.connect_timeout = node["connect_timeout"].as<int>(CONNECT_TIMEOUT_SECS);
    defaults.request_timeout = node["request_timeout"].as<int>(REQUEST_TIMEOUT_SECS);
    defaults.log_file = node["log_file"].as<std::string>("");

    if (defaults.connect_timeout < 0 || defaults.request_timeout < 0) {
        return Result<ConfigDefaults>::Err(ErrorKind::ConfigError,
            "defaults: timeouts must not be negative");
    }
    return Result<ConfigDefaults>::Ok(defaults);
}

static Result<HostProfile> parse_host(const std::string& name, const YAML::Node& node) {
    HostProfile profile;
    profile.name = name;
    profile.host = node["host"].as<std::string>("");
    profile.port = node["port"].as<int>(SSH_DEFAULT_PORT);
    profile.user = node["user"].as<std::string>("");

    if (node["password"]) profile.password = node["password"].as<std::string>();
    if (node["key_file"]) profile.key_file = node["key_file"].as<std::string>();
    if (node["public_key_file"]) profile.public_key_file = node["public_key_file"].as<std::string>();
    if (node["passphrase"]) profile.passphrase = node["passphrase"].as<std::string>();

    if (profile.host.empty()) {
        return Result<HostProfile>::Err(ErrorKind::ConfigError,
            fmt::format("hosts.{}: missing host", name));
    }
    if (profile.user.empty()) {
        return Result<HostProfile>::Err(ErrorKind::ConfigError,
            fmt::format("hosts.{}: missing user", name));
    }
    if (profile.port <= 0 || profile.port > 65535) {
        return Result<HostProfile>::Err(ErrorKind::ConfigError,
            fmt::format("hosts.{}: invalid port {}", name, profile.port));
    }
    if (!profile.password && !profile.key_file) {
        return Result<HostProfile>::Err(ErrorKind::ConfigError,
            fmt::format("hosts.{}: needs a password or a key_file", name));
    }
    return Result<HostProfile>::Ok(profile);
}

Result<Config> Config::parse(const std::string& text) {
    try {
        YAML::Node root = YAML::Load(text);
        Config config;
        if (!root || root.IsNull()) return Result<Config>::Ok(config);
        if (!root.IsMap()) {
            return Result<Config>::Err(ErrorKind::ConfigError, "Config root must be a map");
        }

        auto defaults = parse_defaults(root["defaults"]);
        if (defaults.is_err()) return Result<Config>::Err(defaults.error);
        config.defaults_ = defaults.value;

        YAML::Node host_nodes = root["hosts"];
        if (host_nodes && !host_nodes.IsNull()) {
            if (!host_nodes.IsMap()) {
                return Result<Config>::Err(ErrorKind::ConfigError, "hosts: expected a map");
            }
            for (const auto& entry : host_nodes) {
                std::string name = entry.first.as<std::string>();
                auto profile = parse_host(name, entry.second);
                if (profile.is_err()) return Result<Config>::Err(profile.error);
                config.hosts_[name] = profile.value;
            }
        }
        return Result<Config>::Ok(config);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::ConfigError,
            std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load() {
    return load(get_config_path());
}

Result<Config> Config::load(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err(ErrorKind::ConfigError,
            "Config not found at " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto result = parse(buffer.str());
    if (result.is_err()) {
        result.error.message = fmt::format("{}: {}", path.string(), result.error.message);
    }
    return result;
}

Result<HostProfile> Config::profile(const std::string& name) const {
    auto it = hosts_.find(name);
    if (it == hosts_.end()) {
        return Result<HostProfile>::Err(ErrorKind::ConfigError,
            fmt::format("No host profile named '{}'", name));
    }
    return Result<HostProfile>::Ok(it->second);
}

// ── Credentials ────────────────────────────────────────────────

static Result<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::Err(ErrorKind::ConfigError,
            "Cannot read " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return Result<std::string>::Ok(buffer.str());
}

Result<Credential> load_credential(const HostProfile& profile) {
    if (!profile.key_file) {
        return Result<Credential>::Ok(PasswordCredential{profile.password.value_or("")});
    }

    auto private_key = read_file(expand_home(*profile.key_file));
    if (private_key.is_err()) return Result<Credential>::Err(private_key.error);

    KeyPair pair;
    pair.private_key = private_key.value;
    pair.passphrase = profile.passphrase;
    if (profile.public_key_file) {
        auto public_key = read_file(expand_home(*profile.public_key_file));
        if (public_key.is_err()) return Result<Credential>::Err(public_key.error);
        pair.public_key = public_key.value;
    }
    return Result<Credential>::Ok(pair);
}
