#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Plain text under its MIME name or one of the X11 atom aliases.
inline bool is_text_mime(std::string_view mime) {
    return mime.starts_with("text/plain") || mime == "UTF8_STRING" || mime == "STRING" ||
           mime == "TEXT";
}

struct ClipboardItem {
    std::string mime_type;
    std::string data;  // raw bytes
};

// Everything the clipboard offered at one instant, in the order offered.
struct ClipboardSnapshot {
    std::vector<ClipboardItem> items;

    bool empty() const { return items.empty(); }
    // The first plain-text item, if any.
    std::optional<std::string> text() const {
        for (auto& item : items) {
            if (is_text_mime(item.mime_type)) return item.data;
        }
        return std::nullopt;
    }
};

class Clipboard {
public:
    virtual ~Clipboard() = default;

    virtual std::expected<ClipboardSnapshot, std::string> snapshot() = 0;
    virtual std::expected<void, std::string> restore(const ClipboardSnapshot& snap) = 0;

    virtual std::expected<void, std::string> write_text(const std::string& text) = 0;
    virtual std::optional<std::string> read_text() = 0;

    // Changes whenever the clipboard contents change.
    virtual uint64_t revision() = 0;
};
