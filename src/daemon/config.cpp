#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// A missing or mistyped key keeps its default; the rest of the file still applies.
template <typename T>
void read_key(const json& obj, const char* key, T& out) {
    if (!obj.is_object() || !obj.contains(key)) return;
    try {
        out = obj[key].get<T>();
    } catch (const json::type_error&) {
        std::println(stderr, "config: '{}' has the wrong type ({}), using the default",
                     key, obj[key].type_name());
    }
}

} // namespace

std::string Config::Remote::resolved_api_key() const {
    if (!api_key.empty()) return api_key;
    if (api_key_env.empty()) return {};
    const char* env = std::getenv(api_key_env.c_str());
    return env ? std::string(env) : std::string();
}

fs::path Config::Local::resolved_model_dir() const {
    if (!model_dir.empty()) return fs::path(model_dir);
    auto data = platform::data_dir();
    if (data.empty()) return fs::path("/tmp/voxpaste/models");
    return fs::path(data) / "models";
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("transcription")) {
            auto& t = j["transcription"];
            read_key(t, "mode", cfg.transcription.mode);
            read_key(t, "language", cfg.transcription.language);
        }

        if (j.contains("remote")) {
            auto& r = j["remote"];
            read_key(r, "url", cfg.remote.url);
            read_key(r, "api_format", cfg.remote.api_format);
            read_key(r, "model", cfg.remote.model);
            read_key(r, "temperature", cfg.remote.temperature);
            read_key(r, "api_key", cfg.remote.api_key);
            read_key(r, "api_key_env", cfg.remote.api_key_env);
            read_key(r, "timeout_s", cfg.remote.timeout_s);
        }

        if (j.contains("local")) {
            auto& l = j["local"];
            read_key(l, "model_dir", cfg.local.model_dir);
            read_key(l, "model", cfg.local.model);
            read_key(l, "use_gpu", cfg.local.use_gpu);
            read_key(l, "threads", cfg.local.threads);
        }

        if (j.contains("insertion")) {
            auto& i = j["insertion"];
            read_key(i, "write_attempts", cfg.insertion.write_attempts);
            read_key(i, "commit_timeout_ms", cfg.insertion.commit_timeout_ms);
            read_key(i, "commit_poll_ms", cfg.insertion.commit_poll_ms);
            read_key(i, "retry_backoff_ms", cfg.insertion.retry_backoff_ms);
            read_key(i, "stabilize_ms", cfg.insertion.stabilize_ms);
            read_key(i, "settle_ms", cfg.insertion.settle_ms);
            read_key(i, "paste_shortcut", cfg.insertion.paste_shortcut);
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            read_key(a, "sample_rate", cfg.audio.sample_rate);
            read_key(a, "max_seconds", cfg.audio.max_seconds);
        }

        if (j.contains("presentation")) {
            read_key(j["presentation"], "dismiss_ms", cfg.presentation.dismiss_ms);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    if (cfg.transcription.mode != "local" && cfg.transcription.mode != "remote") {
        std::println(stderr, "config: unknown transcription mode '{}', using local",
                     cfg.transcription.mode);
        cfg.transcription.mode = "local";
    }
    if (cfg.insertion.write_attempts < 1) cfg.insertion.write_attempts = 1;

    return cfg;
}

std::string Config::default_path() {
    auto dir = platform::config_dir();
    if (dir.empty()) return {};
    return (fs::path(dir) / "config.json").string();
}

Config Config::load_default() {
    auto config_path = default_path();
    if (config_path.empty()) return Config{};

    if (fs::exists(config_path)) {
        return load(config_path);
    }
    return Config{};
}

ConfigStore::ConfigStore(Config initial, std::string path)
    : current_(std::move(initial)), path_(std::move(path)) {
    std::error_code ec;
    if (!path_.empty()) {
        auto mtime = fs::last_write_time(path_, ec);
        if (!ec) loaded_mtime_ = mtime;
    }
}

Config ConfigStore::snapshot() {
    std::lock_guard lock(mu_);
    if (path_.empty()) return current_;

    std::error_code ec;
    auto mtime = fs::last_write_time(path_, ec);
    if (!ec && mtime != loaded_mtime_) {
        current_ = Config::load(path_);
        loaded_mtime_ = mtime;
    }
    return current_;
}
