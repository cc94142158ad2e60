#include "platform/linux/wayland_clipboard.hpp"
#include "platform/linux/subprocess.hpp"

#include <algorithm>
#include <functional>
#include <sstream>

namespace {

constexpr const char* kTextMime = "text/plain;charset=utf-8";

} // namespace

std::expected<ClipboardSnapshot, std::string> WaylandClipboard::snapshot() {
    auto types = platform::run_process({"wl-paste", "--list-types"},
                                       {.capture_output = true, .quiet = true});
    if (!types) return std::unexpected(types.error());
    if (types->exit_code == 127) return std::unexpected(std::string("wl-paste is not installed"));

    ClipboardSnapshot snap;
    // wl-paste exits non-zero when nothing is copied.
    if (types->exit_code != 0) return snap;

    std::istringstream lines(types->output);
    std::string mime;
    while (std::getline(lines, mime)) {
        if (mime.empty()) continue;
        auto data = platform::run_process({"wl-paste", "--no-newline", "--type", mime},
                                          {.capture_output = true, .quiet = true});
        if (!data) return std::unexpected(data.error());
        if (data->exit_code != 0) {
            return std::unexpected("wl-paste couldn't read " + mime);
        }
        snap.items.push_back({mime, std::move(data->output)});
    }
    return snap;
}

std::expected<void, std::string> WaylandClipboard::restore(const ClipboardSnapshot& snap) {
    if (snap.empty()) {
        auto res = platform::run_process({"wl-copy", "--clear"}, {.quiet = true});
        if (!res) return std::unexpected(res.error());
        if (res->exit_code != 0) {
            return std::unexpected("wl-copy --clear exited with code " +
                                   std::to_string(res->exit_code));
        }
        return {};
    }
    auto item = std::ranges::find_if(snap.items, [](const ClipboardItem& i) {
        return is_text_mime(i.mime_type);
    });
    if (item == snap.items.end()) item = snap.items.begin();
    return copy(item->mime_type, item->data);
}

std::expected<void, std::string> WaylandClipboard::write_text(const std::string& text) {
    return copy(kTextMime, text);
}

std::expected<void, std::string> WaylandClipboard::copy(const std::string& mime,
                                                        const std::string& data) {
    auto res = platform::run_process({"wl-copy", "--type", mime}, {.input = data});
    if (!res) return std::unexpected(res.error());
    if (res->exit_code != 0) {
        return std::unexpected("wl-copy exited with code " + std::to_string(res->exit_code));
    }
    return {};
}

std::optional<std::string> WaylandClipboard::read_text() {
    auto res = platform::run_process({"wl-paste", "--no-newline", "--type", "text"},
                                     {.capture_output = true, .quiet = true});
    if (!res || res->exit_code != 0) return std::nullopt;
    return std::move(res->output);
}

uint64_t WaylandClipboard::revision() {
    auto types = platform::run_process({"wl-paste", "--list-types"},
                                       {.capture_output = true, .quiet = true});
    if (!types || types->exit_code != 0) return 0;
    auto text = read_text();
    return std::hash<std::string>{}(types->output + '\0' + text.value_or(""));
}
