#include "platform/linux/served_selection.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

ServedSelection ServedSelection::text(const std::string& text) {
    std::vector<ClipboardItem> items;
    for (const char* mime : {"text/plain;charset=utf-8", "text/plain", "UTF8_STRING", "STRING",
                             "TEXT"}) {
        items.push_back({mime, text});
    }
    return ServedSelection(std::move(items));
}

std::vector<std::string> ServedSelection::mime_types() const {
    std::vector<std::string> out;
    out.reserve(items_.size());
    for (auto& item : items_) out.push_back(item.mime_type);
    return out;
}

const ClipboardItem* ServedSelection::find(const std::string& mime) const {
    for (auto& item : items_) {
        if (item.mime_type == mime) return &item;
    }
    return nullptr;
}

bool ServedSelection::offers(const std::string& mime) const {
    return find(mime) != nullptr;
}

bool ServedSelection::send(const std::string& mime, int fd, int timeout_ms) const {
    auto item = find(mime);
    if (!item) {
        ::close(fd);
        return false;
    }

    ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
    const char* p = item->data.data();
    size_t left = item->data.size();
    bool ok = true;
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n > 0) {
            p += n;
            left -= static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && errno != EAGAIN) {
            ok = false;
            break;
        }
        pollfd pfd = {fd, POLLOUT, 0};
        int ready = ::poll(&pfd, 1, timeout_ms);
        if (ready < 0 && errno == EINTR) continue;
        if (ready <= 0 || (pfd.revents & (POLLERR | POLLHUP))) {
            ok = false;
            break;
        }
    }
    ::close(fd);
    return ok;
}

std::expected<std::string, std::string> read_transfer(int fd, int timeout_ms) {
    std::string out;
    char buf[8192];
    while (true) {
        pollfd pfd = {fd, POLLIN, 0};
        int ready = ::poll(&pfd, 1, timeout_ms);
        if (ready < 0 && errno == EINTR) continue;
        if (ready == 0) {
            ::close(fd);
            return std::unexpected(std::string("clipboard owner stopped sending"));
        }
        ssize_t n = ready < 0 ? -1 : ::read(fd, buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) {
            int err = errno;
            ::close(fd);
            return std::unexpected("clipboard read failed: " + std::string(std::strerror(err)));
        }
        if (n == 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    ::close(fd);
    return out;
}
