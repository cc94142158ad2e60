#include "platform/linux/data_control_clipboard.hpp"

#include "ext-data-control-v1-client-protocol.h"
#include <wayland-client.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <future>
#include <poll.h>
#include <print>
#include <sys/eventfd.h>
#include <unistd.h>

namespace {

constexpr auto kCallTimeout = std::chrono::seconds(2);
constexpr const char* kTextMime = "text/plain;charset=utf-8";

std::optional<std::string> pick_text_type(const std::vector<std::string>& types) {
    for (auto& mime : types) {
        if (mime == kTextMime) return mime;
    }
    for (auto& mime : types) {
        if (is_text_mime(mime)) return mime;
    }
    return std::nullopt;
}

} // namespace

DataControlClipboard::DataControlClipboard(bool verbose) : verbose_(verbose) {}

std::expected<std::unique_ptr<DataControlClipboard>, std::string>
DataControlClipboard::connect(bool verbose) {
    std::unique_ptr<DataControlClipboard> self(new DataControlClipboard(verbose));

    self->display_ = wl_display_connect(nullptr);
    if (!self->display_) return std::unexpected(std::string("no Wayland display"));

    static const wl_registry_listener registry_listener = {
        .global = on_global,
        .global_remove = on_global_remove,
    };
    self->registry_ = wl_display_get_registry(self->display_);
    wl_registry_add_listener(self->registry_, &registry_listener, self.get());
    if (wl_display_roundtrip(self->display_) < 0) {
        return std::unexpected(std::string("Wayland roundtrip failed"));
    }
    if (!self->manager_) {
        return std::unexpected(std::string("compositor doesn't support ext-data-control-v1"));
    }
    if (!self->seat_) return std::unexpected(std::string("compositor has no seat"));

    static const ext_data_control_device_v1_listener device_listener = {
        .data_offer = on_data_offer,
        .selection = on_selection,
        .finished = on_finished,
        .primary_selection = on_primary_selection,
    };
    self->device_ = ext_data_control_manager_v1_get_data_device(self->manager_, self->seat_);
    ext_data_control_device_v1_add_listener(self->device_, &device_listener, self.get());
    // Delivers the current selection.
    if (wl_display_roundtrip(self->display_) < 0) {
        return std::unexpected(std::string("Wayland roundtrip failed"));
    }

    self->wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (self->wake_fd_ < 0) {
        return std::unexpected("eventfd failed: " + std::string(std::strerror(errno)));
    }

    self->alive_ = true;
    self->thread_ = std::jthread([s = self.get()](std::stop_token stop) { s->run(stop); });
    self->log("using ext-data-control-v1");
    return self;
}

DataControlClipboard::~DataControlClipboard() {
    if (thread_.joinable()) {
        thread_.request_stop();
        wake();
        thread_.join();
    }
    jobs_.clear();

    for (auto& [source, content] : sources_) ext_data_control_source_v1_destroy(source);
    for (auto& [offer, types] : offers_) ext_data_control_offer_v1_destroy(offer);
    if (device_) ext_data_control_device_v1_destroy(device_);
    if (manager_) ext_data_control_manager_v1_destroy(manager_);
    if (seat_) wl_seat_destroy(seat_);
    if (registry_) wl_registry_destroy(registry_);
    if (display_) {
        wl_display_flush(display_);
        wl_display_disconnect(display_);
    }
    if (wake_fd_ >= 0) ::close(wake_fd_);
}

// --- Wayland listeners ------------------------------------------------------

void DataControlClipboard::on_global(void* data, wl_registry* registry, uint32_t name,
                                     const char* interface, uint32_t /*version*/) {
    auto* self = static_cast<DataControlClipboard*>(data);
    if (std::strcmp(interface, wl_seat_interface.name) == 0 && !self->seat_) {
        self->seat_ = static_cast<wl_seat*>(wl_registry_bind(registry, name, &wl_seat_interface, 1));
    } else if (std::strcmp(interface, ext_data_control_manager_v1_interface.name) == 0) {
        self->manager_ = static_cast<ext_data_control_manager_v1*>(
            wl_registry_bind(registry, name, &ext_data_control_manager_v1_interface, 1));
    }
}

void DataControlClipboard::on_global_remove(void*, wl_registry*, uint32_t) {}

void DataControlClipboard::on_data_offer(void* data, ext_data_control_device_v1*,
                                         ext_data_control_offer_v1* offer) {
    static const ext_data_control_offer_v1_listener offer_listener = {
        .offer = on_offer,
    };
    auto* self = static_cast<DataControlClipboard*>(data);
    self->offers_.try_emplace(offer);
    ext_data_control_offer_v1_add_listener(offer, &offer_listener, self);
}

void DataControlClipboard::on_offer(void* data, ext_data_control_offer_v1* offer,
                                    const char* mime) {
    auto* self = static_cast<DataControlClipboard*>(data);
    self->offers_[offer].emplace_back(mime);
}

void DataControlClipboard::on_selection(void* data, ext_data_control_device_v1*,
                                        ext_data_control_offer_v1* offer) {
    auto* self = static_cast<DataControlClipboard*>(data);
    if (self->selection_ && self->selection_ != offer) self->drop_offer(self->selection_);
    self->selection_ = offer;
    ++self->revision_;
}

void DataControlClipboard::on_primary_selection(void* data, ext_data_control_device_v1*,
                                                ext_data_control_offer_v1* offer) {
    // Middle-click selection isn't ours to manage.
    if (offer) static_cast<DataControlClipboard*>(data)->drop_offer(offer);
}

void DataControlClipboard::on_finished(void* data, ext_data_control_device_v1* device) {
    auto* self = static_cast<DataControlClipboard*>(data);
    std::println(stderr, "clipboard: compositor withdrew the data-control device");
    self->alive_ = false;
    ext_data_control_device_v1_destroy(device);
    self->device_ = nullptr;
}

void DataControlClipboard::on_send(void* data, ext_data_control_source_v1* source,
                                   const char* mime, int32_t fd) {
    auto* self = static_cast<DataControlClipboard*>(data);
    auto it = self->sources_.find(source);
    if (it == self->sources_.end()) {
        ::close(fd);
        return;
    }
    if (!it->second.send(mime, fd)) {
        self->log(std::format("transfer of {} failed", mime));
    }
}

void DataControlClipboard::on_cancelled(void* data, ext_data_control_source_v1* source) {
    auto* self = static_cast<DataControlClipboard*>(data);
    self->sources_.erase(source);
    ext_data_control_source_v1_destroy(source);
}

void DataControlClipboard::drop_offer(ext_data_control_offer_v1* offer) {
    offers_.erase(offer);
    ext_data_control_offer_v1_destroy(offer);
}

// --- Event thread -----------------------------------------------------------

void DataControlClipboard::wake() {
    uint64_t val = 1;
    if (::write(wake_fd_, &val, sizeof(val)) < 0) {
        std::println(stderr, "clipboard: eventfd write failed: {}", std::strerror(errno));
    }
}

void DataControlClipboard::run(std::stop_token stop) {
    int display_fd = wl_display_get_fd(display_);
    bool lost = false;

    while (!stop.stop_requested() && !lost) {
        while (wl_display_prepare_read(display_) != 0) {
            if (wl_display_dispatch_pending(display_) < 0) {
                lost = true;
                break;
            }
        }
        if (lost) break;
        wl_display_flush(display_);

        pollfd fds[2] = {{display_fd, POLLIN, 0}, {wake_fd_, POLLIN, 0}};
        if (::poll(fds, 2, -1) < 0) {
            wl_display_cancel_read(display_);
            if (errno == EINTR) continue;
            std::println(stderr, "clipboard: poll failed: {}", std::strerror(errno));
            break;
        }

        if (fds[0].revents & POLLIN) {
            if (wl_display_read_events(display_) < 0) lost = true;
        } else {
            wl_display_cancel_read(display_);
        }
        if (!lost && wl_display_dispatch_pending(display_) < 0) lost = true;
        if (fds[0].revents & (POLLERR | POLLHUP)) lost = true;

        if (fds[1].revents & POLLIN) {
            uint64_t val;
            while (::read(wake_fd_, &val, sizeof(val)) > 0) {}
            if (!lost) run_jobs();
        }
    }

    if (lost) std::println(stderr, "clipboard: lost the Wayland connection");
    alive_ = false;
    std::lock_guard lock(jobs_mutex_);
    // Pending callers see a broken promise.
    jobs_.clear();
}

void DataControlClipboard::run_jobs() {
    std::vector<std::function<void()>> jobs;
    {
        std::lock_guard lock(jobs_mutex_);
        jobs.swap(jobs_);
    }
    for (auto& job : jobs) job();
}

template <typename T>
std::expected<T, std::string> DataControlClipboard::call(std::function<T()> job) {
    if (!alive_) return std::unexpected(std::string("clipboard connection is closed"));

    auto result = std::make_shared<std::promise<T>>();
    auto future = result->get_future();
    {
        std::lock_guard lock(jobs_mutex_);
        jobs_.push_back([job = std::move(job), result] { result->set_value(job()); });
    }
    wake();

    if (future.wait_for(kCallTimeout) != std::future_status::ready) {
        return std::unexpected(std::string("clipboard thread is not responding"));
    }
    try {
        return future.get();
    } catch (const std::future_error&) {
        return std::unexpected(std::string("clipboard connection is closed"));
    }
}

void DataControlClipboard::set_selection(std::optional<ServedSelection> content) {
    if (!device_) return;
    if (!content) {
        ext_data_control_device_v1_set_selection(device_, nullptr);
        return;
    }

    static const ext_data_control_source_v1_listener source_listener = {
        .send = on_send,
        .cancelled = on_cancelled,
    };
    auto* source = ext_data_control_manager_v1_create_data_source(manager_);
    ext_data_control_source_v1_add_listener(source, &source_listener, this);
    for (auto& mime : content->mime_types()) {
        ext_data_control_source_v1_offer(source, mime.c_str());
    }
    sources_.emplace(source, std::move(*content));
    ext_data_control_device_v1_set_selection(device_, source);
}

std::vector<DataControlClipboard::Transfer> DataControlClipboard::start_transfers(bool text_only) {
    std::vector<Transfer> out;
    if (!selection_) return out;

    auto& offered = offers_[selection_];
    std::vector<std::string> wanted;
    if (!text_only) {
        wanted = offered;
    } else if (auto mime = pick_text_type(offered)) {
        wanted.push_back(*mime);
    }

    for (auto& mime : wanted) {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) < 0) {
            std::println(stderr, "clipboard: pipe failed: {}", std::strerror(errno));
            break;
        }
        ext_data_control_offer_v1_receive(selection_, mime.c_str(), fds[1]);
        ::close(fds[1]);
        out.push_back({mime, fds[0]});
    }
    wl_display_flush(display_);
    return out;
}

// --- Clipboard --------------------------------------------------------------

std::expected<ClipboardSnapshot, std::string> DataControlClipboard::snapshot() {
    auto transfers = call<std::vector<Transfer>>([this] { return start_transfers(false); });
    if (!transfers) return std::unexpected(transfers.error());

    ClipboardSnapshot snap;
    std::optional<std::string> error;
    for (auto& t : *transfers) {
        if (error) {
            ::close(t.fd);
            continue;
        }
        auto data = read_transfer(t.fd);
        if (!data) {
            error = std::format("couldn't read {}: {}", t.mime, data.error());
            continue;
        }
        snap.items.push_back({t.mime, std::move(*data)});
    }
    if (error) return std::unexpected(*error);
    return snap;
}

std::expected<void, std::string> DataControlClipboard::restore(const ClipboardSnapshot& snap) {
    std::optional<ServedSelection> content;
    if (!snap.empty()) content.emplace(snap.items);
    auto done = call<bool>([this, content = std::move(content)] {
        set_selection(content);
        return true;
    });
    if (!done) return std::unexpected(done.error());
    return {};
}

std::expected<void, std::string> DataControlClipboard::write_text(const std::string& text) {
    auto done = call<bool>([this, text] {
        set_selection(ServedSelection::text(text));
        return true;
    });
    if (!done) return std::unexpected(done.error());
    return {};
}

std::optional<std::string> DataControlClipboard::read_text() {
    auto transfers = call<std::vector<Transfer>>([this] { return start_transfers(true); });
    if (!transfers || transfers->empty()) return std::nullopt;
    auto data = read_transfer(transfers->front().fd);
    if (!data) {
        log(data.error());
        return std::nullopt;
    }
    return std::move(*data);
}

void DataControlClipboard::log(const std::string& msg) {
    if (verbose_) std::println(stderr, "[voxpaste] clipboard: {}", msg);
}
