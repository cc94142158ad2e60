#pragma once

#include "platform/clipboard.hpp"

#include <expected>
#include <string>
#include <vector>

// Content this process offers as the clipboard selection, answering the
// compositor's per-type transfer requests.
class ServedSelection {
public:
    explicit ServedSelection(std::vector<ClipboardItem> items) : items_(std::move(items)) {}

    // Dictated text under the UTF-8 type and its aliases, as wl-copy offers it.
    static ServedSelection text(const std::string& text);

    std::vector<std::string> mime_types() const;
    bool offers(const std::string& mime) const;

    // Writes the data for `mime` to `fd` and closes it. A reader that stalls
    // for longer than `timeout_ms` gets a truncated transfer. Returns false if
    // the type isn't offered or the write failed.
    bool send(const std::string& mime, int fd, int timeout_ms = 2000) const;

private:
    const ClipboardItem* find(const std::string& mime) const;

    std::vector<ClipboardItem> items_;
};

// Reads one transfer from the pipe `fd` until the sender closes it, then
// closes `fd`. Fails if no data arrives for `timeout_ms`.
std::expected<std::string, std::string> read_transfer(int fd, int timeout_ms = 2000);
