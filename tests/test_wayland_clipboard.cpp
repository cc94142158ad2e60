#include <catch2/catch_test_macros.hpp>

#include "insertion/text_inserter.hpp"
#include "platform/linux/served_selection.hpp"
#include "platform/linux/wayland_clipboard.hpp"
#include "test_support.hpp"

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <optional>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

// wl-copy stand-in. Commits in the background after $FAKE_COMMIT_DELAY
// seconds, the way the compositor switches selections after wl-copy returns.
constexpr const char* kFakeWlCopy = R"(#!/bin/sh
dir="$FAKE_CLIP_DIR"
if [ "$1" = "--clear" ]; then
    rm -f "$dir"/types "$dir"/item_*
    exit 0
fi
mime="text/plain;charset=utf-8"
[ "$1" = "--type" ] && mime="$2"
key=$(printf '%s' "$mime" | tr -c 'A-Za-z0-9' '_')
cat > "$dir/pending"
(
    sleep "${FAKE_COMMIT_DELAY:-0}"
    mv "$dir/pending" "$dir/item_$key"
    printf '%s\n' "$mime" > "$dir/types.new"
    mv "$dir/types.new" "$dir/types"
    for f in "$dir"/item_*; do
        [ "$f" = "$dir/item_$key" ] || rm -f "$f"
    done
) </dev/null >/dev/null 2>&1 &
exit 0
)";

constexpr const char* kFakeWlPaste = R"(#!/bin/sh
dir="$FAKE_CLIP_DIR"
list=0
mime=""
while [ $# -gt 0 ]; do
    case "$1" in
        --list-types) list=1 ;;
        --type) shift; mime="$1" ;;
    esac
    shift
done
if [ ! -s "$dir/types" ]; then
    echo "Nothing is copied" >&2
    exit 1
fi
if [ $list = 1 ]; then
    cat "$dir/types"
    exit 0
fi
if [ "$mime" = text ]; then
    mime=$(grep -m1 '^text/plain' "$dir/types") || exit 1
fi
key=$(printf '%s' "$mime" | tr -c 'A-Za-z0-9' '_')
[ -f "$dir/item_$key" ] || exit 1
cat "$dir/item_$key"
)";

class ScopedEnv {
public:
    ScopedEnv(const char* name, const std::string& value) : name_(name) {
        if (const char* old = std::getenv(name)) old_ = old;
        ::setenv(name, value.c_str(), 1);
    }
    ~ScopedEnv() {
        if (old_) ::setenv(name_, old_->c_str(), 1);
        else ::unsetenv(name_);
    }

private:
    const char* name_;
    std::optional<std::string> old_;
};

// A directory of fake wl-clipboard tools put first on PATH.
struct FakeWlClipboard {
    test::TmpDir dir{"wlclip"};
    fs::path state = dir.path / "state";
    std::optional<ScopedEnv> path_env;
    std::optional<ScopedEnv> state_env;

    FakeWlClipboard() {
        auto bin = dir.path / "bin";
        fs::create_directories(bin);
        fs::create_directories(state);
        install(bin / "wl-copy", kFakeWlCopy);
        install(bin / "wl-paste", kFakeWlPaste);

        const char* path = std::getenv("PATH");
        path_env.emplace("PATH", bin.string() + ":" + (path ? path : "/usr/bin:/bin"));
        state_env.emplace("FAKE_CLIP_DIR", state.string());
    }

    static void install(const fs::path& p, const char* body) {
        std::ofstream(p) << body;
        fs::permissions(p, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
    }

    static std::string key(const std::string& mime) {
        std::string out = mime;
        for (auto& c : out) {
            if (!std::isalnum(static_cast<unsigned char>(c))) c = '_';
        }
        return out;
    }

    // Puts items on the clipboard as if another application had copied them.
    void preset(const std::vector<ClipboardItem>& items) {
        std::ofstream types(state / "types");
        for (auto& item : items) {
            types << item.mime_type << "\n";
            std::ofstream(state / ("item_" + key(item.mime_type))) << item.data;
        }
    }
};

bool eventually(const std::function<bool()>& cond, std::chrono::milliseconds limit = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(20ms);
    }
    return cond();
}

} // namespace

TEST_CASE("wl-clipboard fallback", "[platform][clipboard]") {
    FakeWlClipboard fake;
    WaylandClipboard clipboard;

    SECTION("SnapshotKeepsEveryType") {
        fake.preset({{"text/html", "<b>hi</b>"}, {"text/plain;charset=utf-8", "hi"}});

        auto snap = clipboard.snapshot();
        REQUIRE(snap);
        REQUIRE(snap->items.size() == 2);
        REQUIRE(snap->items[0].mime_type == "text/html");
        REQUIRE(snap->items[0].data == "<b>hi</b>");
        REQUIRE(snap->items[1].data == "hi");
        REQUIRE(snap->text() == "hi");
    }

    SECTION("EmptyClipboard") {
        auto snap = clipboard.snapshot();
        REQUIRE(snap);
        REQUIRE(snap->empty());
        REQUIRE_FALSE(clipboard.read_text());
    }

    SECTION("RevisionWaitsForLateCommit") {
        fake.preset({{"text/plain;charset=utf-8", "before"}});
        ScopedEnv delay("FAKE_COMMIT_DELAY", "0.6");

        auto before = clipboard.revision();
        REQUIRE(clipboard.write_text("after"));
        // wl-copy has returned but the new selection isn't served yet.
        REQUIRE(clipboard.revision() == before);
        REQUIRE(clipboard.read_text() == "before");

        REQUIRE(eventually([&] { return clipboard.revision() != before; }));
        REQUIRE(clipboard.read_text() == "after");
    }

    SECTION("RevisionSeesTypeOnlyChange") {
        fake.preset({{"text/plain;charset=utf-8", "same"}});
        auto before = clipboard.revision();
        fake.preset({{"text/html", "same"}, {"text/plain;charset=utf-8", "same"}});
        REQUIRE(clipboard.revision() != before);
    }

    SECTION("RestorePrefersTextItem") {
        ClipboardSnapshot snap{{{"image/png", "\x89PNG"}, {"text/plain", "caption"}}};
        REQUIRE(clipboard.restore(snap));
        REQUIRE(eventually([&] { return clipboard.read_text() == "caption"; }));

        auto now = clipboard.snapshot();
        REQUIRE(now);
        REQUIRE(now->items.size() == 1);
        REQUIRE(now->items[0].mime_type == "text/plain");
    }

    SECTION("RestoreWithoutTextUsesFirstItem") {
        ClipboardSnapshot snap{{{"image/png", "png-bytes"}, {"image/jpeg", "jpeg-bytes"}}};
        REQUIRE(clipboard.restore(snap));
        REQUIRE(eventually([&] {
            auto now = clipboard.snapshot();
            return now && now->items.size() == 1 && now->items[0].data == "png-bytes";
        }));
    }

    SECTION("RestoreEmptyClears") {
        fake.preset({{"text/plain;charset=utf-8", "x"}});
        REQUIRE(clipboard.restore({}));
        auto snap = clipboard.snapshot();
        REQUIRE(snap);
        REQUIRE(snap->empty());
    }

    SECTION("InserterWaitsForLateCommit") {
        fake.preset({{"text/plain;charset=utf-8", "previous"}});
        ScopedEnv delay("FAKE_COMMIT_DELAY", "0.3");

        test::FakeKeys keys;
        std::optional<std::string> pasted;
        keys.on_post = [&] { pasted = clipboard.read_text(); };

        Config::Insertion opts;
        opts.commit_timeout_ms = 2000;
        opts.commit_poll_ms = 20;
        opts.stabilize_ms = 0;
        opts.settle_ms = 0;

        TextInserter inserter(clipboard, keys, false);
        REQUIRE(inserter.insert("dictated", opts) == InsertionResult::Inserted);
        REQUIRE(pasted == "dictated");
        REQUIRE(eventually([&] { return clipboard.read_text() == "previous"; }));
    }
}

TEST_CASE("Served selection", "[platform][clipboard]") {
    ServedSelection served({{"text/html", "<i>x</i>"},
                            {"image/png", std::string(200000, 'p')},
                            {"text/plain;charset=utf-8", "x"}});

    SECTION("OffersEveryType") {
        REQUIRE(served.mime_types() ==
                std::vector<std::string>{"text/html", "image/png", "text/plain;charset=utf-8"});
        REQUIRE(served.offers("image/png"));
        REQUIRE_FALSE(served.offers("text/uri-list"));
    }

    SECTION("SendsEachTypeThroughPipe") {
        for (auto mime : served.mime_types()) {
            int fds[2];
            REQUIRE(::pipe(fds) == 0);
            // Larger than a pipe buffer, so the reader has to run concurrently.
            std::jthread writer([&] { served.send(mime, fds[1]); });
            auto data = read_transfer(fds[0]);
            writer.join();
            REQUIRE(data);
            if (mime == "image/png") REQUIRE(data->size() == 200000);
            if (mime == "text/html") REQUIRE(*data == "<i>x</i>");
            if (mime == "text/plain;charset=utf-8") REQUIRE(*data == "x");
        }
    }

    SECTION("UnknownTypeClosesPipe") {
        int fds[2];
        REQUIRE(::pipe(fds) == 0);
        REQUIRE_FALSE(served.send("text/uri-list", fds[1]));
        auto data = read_transfer(fds[0]);
        REQUIRE(data);
        REQUIRE(data->empty());
    }

    SECTION("StalledReaderTimesOut") {
        int fds[2];
        REQUIRE(::pipe(fds) == 0);
        auto start = std::chrono::steady_clock::now();
        REQUIRE_FALSE(served.send("image/png", fds[1], 100));
        REQUIRE(std::chrono::steady_clock::now() - start < 2s);
        ::close(fds[0]);
    }

    SECTION("ReadTimesOutWithoutSender") {
        int fds[2];
        REQUIRE(::pipe(fds) == 0);
        auto data = read_transfer(fds[0], 100);
        REQUIRE_FALSE(data);
        ::close(fds[1]);
    }

    SECTION("TextOffersAliases") {
        auto text = ServedSelection::text("hello");
        REQUIRE(text.offers("text/plain;charset=utf-8"));
        REQUIRE(text.offers("UTF8_STRING"));
        REQUIRE(text.offers("TEXT"));
    }
}
