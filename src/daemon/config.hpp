#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

enum class TranscriptionMode { Local, Remote };

struct Config {
    struct Transcription {
        std::string mode = "local"; // "local" or "remote"
        std::string language = "auto";

        TranscriptionMode parsed_mode() const {
            return mode == "remote" ? TranscriptionMode::Remote : TranscriptionMode::Local;
        }
    } transcription;

    struct Remote {
        std::string url = "https://api.openai.com/v1";
        std::string api_format = "openai"; // "openai" or "whisper.cpp"
        std::string model = "whisper-1";
        double temperature = 0.0;
        std::string api_key;
        std::string api_key_env = "OPENAI_API_KEY";
        long timeout_s = 120;

        // api_key wins over the environment variable named by api_key_env.
        std::string resolved_api_key() const;
    } remote;

    struct Local {
        std::string model_dir;  // empty: <data_dir>/models
        std::string model;      // e.g. "ggml-base.en"; empty picks any installed model
        bool use_gpu = true;    // if whisper.cpp was built with a GPU backend
        int threads = 4;

        std::filesystem::path resolved_model_dir() const;
    } local;

    struct Insertion {
        int write_attempts = 3;
        int commit_timeout_ms = 200;
        int commit_poll_ms = 10;
        int retry_backoff_ms = 50;
        int stabilize_ms = 50;
        int settle_ms = 150;
        std::string paste_shortcut = "ctrl+v";
    } insertion;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t max_seconds = 120;

        // Capacity in samples (no independent config key).
        size_t ring_capacity_samples() const {
            return static_cast<size_t>(max_seconds) * sample_rate;
        }
    } audio;

    struct Presentation {
        int dismiss_ms = 1500;
    } presentation;

    static Config load(const std::string& path);
    static Config load_default();
    static std::string default_path();
};

// Read-only view of the persisted configuration. The file is re-read when its
// modification time changes, so edits apply to the next transcription.
class ConfigStore {
public:
    ConfigStore(Config initial, std::string path);

    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    Config snapshot();
    const std::string& path() const { return path_; }

private:
    std::mutex mu_;
    Config current_;
    std::string path_;
    std::filesystem::file_time_type loaded_mtime_{};
};
