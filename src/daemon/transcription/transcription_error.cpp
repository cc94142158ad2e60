#include "transcription/backend.hpp"

#include <format>

std::string TranscriptionError::message() const {
    switch (kind) {
        case Kind::NoModelAvailable:
            return "No speech model installed.";
        case Kind::ModelLoadFailed:
            return detail.empty() ? "Couldn't load the speech model."
                                  : std::format("Couldn't load the speech model: {}", detail);
        case Kind::AudioUnreadable:
            return detail.empty() ? "Couldn't read the recording."
                                  : std::format("Couldn't read the recording: {}", detail);
        case Kind::NetworkError:
            return std::format("Couldn't connect: {}", detail);
        case Kind::BackendRejected:
            return detail;
        case Kind::NoTextReturned:
            return "The server didn't return any text.";
        case Kind::Cancelled:
            return "Transcription cancelled.";
    }
    return "Transcription failed.";
}
