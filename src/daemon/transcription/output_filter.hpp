#pragma once

#include <string>

namespace output_filter {

// Strips whisper artifacts from local transcripts: <TAG>...</TAG> blocks,
// [BLANK_AUDIO]/(music)/{inaudible} annotations, filler words ("uh", "um", ...)
// with trailing comma or period. Collapses repeated whitespace and trims.
std::string apply(const std::string& text);

} // namespace output_filter
