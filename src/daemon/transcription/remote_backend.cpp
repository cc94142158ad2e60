#include "remote_backend.hpp"

#include <chrono>
#include <curl/curl.h>
#include <format>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <print>

using json = nlohmann::json;

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

// Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<std::stop_token*>(userdata);
    return stop->stop_requested() ? 1 : 0;
}

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, last - first + 1);
}

void add_field(curl_mime* mime, const char* name, const std::string& value) {
    auto* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

} // namespace

RemoteBackend::RemoteBackend() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

RemoteBackend::~RemoteBackend() {
    curl_global_cleanup();
}

std::string RemoteBackend::endpoint_for(const Config::Remote& remote) {
    if (remote.api_format == "whisper.cpp") {
        std::string base = remote.url;
        if (!base.empty() && base.back() == '/') base.pop_back();
        return base + "/inference";
    }

    if (remote.url.empty()) {
        return "https://api.openai.com/v1/audio/transcriptions";
    }
    if (remote.url.find("audio/transcriptions") != std::string::npos) {
        return remote.url;
    }
    std::string base = remote.url;
    if (base.back() == '/') base.pop_back();
    return base + "/audio/transcriptions";
}

bool RemoteBackend::is_azure(const std::string& url) {
    return url.find(".openai.azure.com") != std::string::npos;
}

std::optional<std::string> RemoteBackend::validate(const Config& config) const {
    // A self-hosted whisper.cpp server takes no key.
    if (config.remote.api_format == "whisper.cpp") return std::nullopt;
    if (config.remote.resolved_api_key().empty()) {
        return std::format("No API key. Set remote.api_key or ${} in the environment.",
                           config.remote.api_key_env.empty() ? "OPENAI_API_KEY"
                                                             : config.remote.api_key_env);
    }
    return std::nullopt;
}

std::expected<std::string, TranscriptionError>
RemoteBackend::parse_response(long http_status, const std::string& body) {
    using Kind = TranscriptionError::Kind;

    if (http_status < 200 || http_status > 299) {
        std::string message;
        try {
            auto j = json::parse(body);
            if (j.contains("error")) {
                auto& e = j["error"];
                if (e.is_object() && e.contains("message")) {
                    message = e["message"].get<std::string>();
                } else if (e.is_string()) {
                    message = e.get<std::string>();
                }
            }
        } catch (const json::exception&) {
            // not JSON, fall back to the raw body
        }
        if (message.empty()) message = body.substr(0, 200);
        if (message.empty()) message = "Unknown error";
        return std::unexpected(TranscriptionError{
            Kind::BackendRejected, std::format("Server error ({}): {}", http_status, message)});
    }

    try {
        auto j = json::parse(body);
        if (j.contains("error")) {
            auto& e = j["error"];
            std::string message = e.is_string() ? e.get<std::string>() : e.dump();
            return std::unexpected(TranscriptionError{Kind::BackendRejected,
                                                      "Server error: " + message});
        }
        if (!j.contains("text") || !j["text"].is_string()) {
            return std::unexpected(TranscriptionError{
                Kind::BackendRejected, "Received an unexpected response from the server."});
        }
        auto text = trim(j["text"].get<std::string>());
        if (text.empty()) {
            return std::unexpected(TranscriptionError{Kind::NoTextReturned, {}});
        }
        return text;
    } catch (const json::exception& e) {
        return std::unexpected(TranscriptionError{
            Kind::BackendRejected, std::string("Received an unexpected response: ") + e.what()});
    }
}

TranscriptionOutcome RemoteBackend::transcribe(const AudioArtifact& audio, const Config& config,
                                               std::stop_token stop) {
    using Kind = TranscriptionError::Kind;
    const auto& remote = config.remote;

    auto api_key = remote.resolved_api_key();
    if (remote.api_format != "whisper.cpp" && api_key.empty()) {
        return std::unexpected(TranscriptionError{Kind::BackendRejected,
                                                  "No API key. Add one to the config."});
    }

    std::ifstream f(audio.path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected(TranscriptionError{Kind::AudioUnreadable, "audio file not found"});
    }
    std::string wav_data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (wav_data.empty()) {
        return std::unexpected(TranscriptionError{Kind::AudioUnreadable, "audio file is empty"});
    }

    auto start = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(TranscriptionError{Kind::NetworkError, "curl_easy_init failed"});
    }

    auto endpoint = endpoint_for(remote);
    curl_mime* mime = curl_mime_init(curl);

    auto* part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_data(part, wav_data.data(), wav_data.size());
    curl_mime_filename(part, audio.path.filename().c_str());
    curl_mime_type(part, "audio/wav");

    add_field(mime, "response_format", "json");
    add_field(mime, "temperature", std::format("{}", remote.temperature));
    if (remote.api_format != "whisper.cpp") {
        add_field(mime, "model", remote.model.empty() ? "whisper-1" : remote.model);
    }
    const auto& language = config.transcription.language;
    if (!language.empty() && language != "auto") {
        add_field(mime, "language", language);
    }

    curl_slist* headers = nullptr;
    if (!api_key.empty()) {
        auto header = is_azure(remote.url) ? "api-key: " + api_key
                                           : "Authorization: Bearer " + api_key;
        headers = curl_slist_append(headers, header.c_str());
    }

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, remote.timeout_s);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);

    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_slist_free_all(headers);
    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    auto end = std::chrono::steady_clock::now();
    double processing_s = std::chrono::duration<double>(end - start).count();

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return std::unexpected(TranscriptionError::cancelled());
    }
    if (res != CURLE_OK) {
        return std::unexpected(TranscriptionError{Kind::NetworkError, curl_easy_strerror(res)});
    }

    auto text = parse_response(http_status, response_body);
    if (!text) {
        std::println(stderr, "remote: {}", text.error().message());
        return std::unexpected(text.error());
    }

    return TranscriptResult{
        .text = std::move(*text),
        .duration_s = audio.duration_s,
        .processing_s = processing_s,
    };
}
