#pragma once

#include "platform/clipboard.hpp"

// The Wayland clipboard through the wl-clipboard tools (wl-copy, wl-paste).
// Used when the compositor lacks the data-control protocol.
//
// wl-copy serves a single MIME type, so restore() re-offers one item of a
// snapshot: the first plain-text item, or the first item when there is none.
class WaylandClipboard : public Clipboard {
public:
    std::expected<ClipboardSnapshot, std::string> snapshot() override;
    std::expected<void, std::string> restore(const ClipboardSnapshot& snap) override;

    std::expected<void, std::string> write_text(const std::string& text) override;
    std::optional<std::string> read_text() override;

    // Fingerprint of the offered type list and text, as wl-paste sees them.
    // wl-copy returns before the compositor switches the selection, so this
    // only moves once the new content is actually served.
    uint64_t revision() override;

private:
    std::expected<void, std::string> copy(const std::string& mime, const std::string& data);
};
