#pragma once

#include "platform/clipboard.hpp"
#include "platform/linux/served_selection.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

struct wl_display;
struct wl_registry;
struct wl_seat;
struct ext_data_control_manager_v1;
struct ext_data_control_device_v1;
struct ext_data_control_source_v1;
struct ext_data_control_offer_v1;

// The Wayland clipboard through the ext-data-control-v1 protocol. One source
// offers every type of a snapshot, so restore() puts back exactly what the
// user had copied.
//
// A private thread owns the connection and answers paste requests for as long
// as we hold the selection. Public calls hand their work to that thread.
class DataControlClipboard : public Clipboard {
public:
    // Fails without a Wayland display or when the compositor doesn't offer
    // the protocol (GNOME, for one).
    static std::expected<std::unique_ptr<DataControlClipboard>, std::string> connect(bool verbose);

    ~DataControlClipboard() override;

    DataControlClipboard(const DataControlClipboard&) = delete;
    DataControlClipboard& operator=(const DataControlClipboard&) = delete;

    std::expected<ClipboardSnapshot, std::string> snapshot() override;
    std::expected<void, std::string> restore(const ClipboardSnapshot& snap) override;

    std::expected<void, std::string> write_text(const std::string& text) override;
    std::optional<std::string> read_text() override;

    // Selection changes announced by the compositor, ours included.
    uint64_t revision() override { return revision_.load(); }

private:
    explicit DataControlClipboard(bool verbose);

    struct Transfer {
        std::string mime;
        int fd;  // read end of the pipe
    };

    static void on_global(void* data, wl_registry* registry, uint32_t name,
                          const char* interface, uint32_t version);
    static void on_global_remove(void* data, wl_registry* registry, uint32_t name);
    static void on_data_offer(void* data, ext_data_control_device_v1* device,
                              ext_data_control_offer_v1* offer);
    static void on_selection(void* data, ext_data_control_device_v1* device,
                             ext_data_control_offer_v1* offer);
    static void on_finished(void* data, ext_data_control_device_v1* device);
    static void on_primary_selection(void* data, ext_data_control_device_v1* device,
                                     ext_data_control_offer_v1* offer);
    static void on_offer(void* data, ext_data_control_offer_v1* offer, const char* mime);
    static void on_send(void* data, ext_data_control_source_v1* source, const char* mime,
                        int32_t fd);
    static void on_cancelled(void* data, ext_data_control_source_v1* source);

    template <typename T>
    std::expected<T, std::string> call(std::function<T()> job);
    void wake();
    void run(std::stop_token stop);
    void run_jobs();

    // Event thread only.
    void set_selection(std::optional<ServedSelection> content);
    std::vector<Transfer> start_transfers(bool text_only);
    void drop_offer(ext_data_control_offer_v1* offer);

    void log(const std::string& msg);

    bool verbose_;
    wl_display* display_ = nullptr;
    wl_registry* registry_ = nullptr;
    wl_seat* seat_ = nullptr;
    ext_data_control_manager_v1* manager_ = nullptr;
    ext_data_control_device_v1* device_ = nullptr;

    std::map<ext_data_control_offer_v1*, std::vector<std::string>> offers_;
    ext_data_control_offer_v1* selection_ = nullptr;
    std::map<ext_data_control_source_v1*, ServedSelection> sources_;

    std::atomic<uint64_t> revision_{0};
    std::atomic<bool> alive_{false};
    std::mutex jobs_mutex_;
    std::vector<std::function<void()>> jobs_;
    int wake_fd_ = -1;
    std::jthread thread_;
};
