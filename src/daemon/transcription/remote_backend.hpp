#pragma once

#include "backend.hpp"

#include <string>

// OpenAI-compatible transcription API (OpenAI, Groq, Azure OpenAI) or a
// whisper.cpp server's /inference endpoint, over libcurl.
class RemoteBackend : public TranscriptionBackend {
public:
    RemoteBackend();
    ~RemoteBackend() override;

    RemoteBackend(const RemoteBackend&) = delete;
    RemoteBackend& operator=(const RemoteBackend&) = delete;

    TranscriptionOutcome transcribe(const AudioArtifact& audio, const Config& config,
                                    std::stop_token stop) override;
    std::optional<std::string> validate(const Config& config) const override;

    // A URL that already names the transcriptions path is used as-is
    // (Azure deployments); otherwise the path is appended to the base URL.
    static std::string endpoint_for(const Config::Remote& remote);
    static bool is_azure(const std::string& url);

    // Maps an HTTP status and body to text or a typed failure.
    static std::expected<std::string, TranscriptionError>
        parse_response(long http_status, const std::string& body);
};
