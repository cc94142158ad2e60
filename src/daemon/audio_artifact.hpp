#pragma once

#include <cstdint>
#include <filesystem>

// Captured audio handed from recording to transcription. The file is owned by
// the session and deleted once transcription finishes or the session ends.
struct AudioArtifact {
    std::filesystem::path path;
    double duration_s = 0.0;
    uint32_t sample_rate = 16000;
};
