#include "insertion/text_inserter.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <print>
#include <thread>

using namespace std::chrono;

std::mutex TextInserter::in_flight_;

TextInserter::TextInserter(Clipboard& clipboard, KeyInjector& keys, bool verbose)
    : clipboard_(clipboard), keys_(keys), verbose_(verbose) {}

void TextInserter::log(const std::string& msg) {
    if (verbose_) std::println(stderr, "[voxpaste] insert: {}", msg);
}

InsertionResult TextInserter::insert(const std::string& text, const Config::Insertion& opts) {
    std::unique_lock lock(in_flight_, std::try_to_lock);
    if (!lock.owns_lock()) {
        std::println(stderr, "insert: another insertion is in progress");
        return InsertionResult::Failed;
    }

    if (!keys_.has_permission()) {
        log("no input simulation available, copying only");
        if (auto res = clipboard_.write_text(text); !res) {
            std::println(stderr, "insert: clipboard write failed: {}", res.error());
            return InsertionResult::Failed;
        }
        return InsertionResult::CopiedToClipboardOnly;
    }

    return paste_with_restore(text, opts);
}

InsertionResult TextInserter::paste_with_restore(const std::string& text,
                                                 const Config::Insertion& opts) {
    auto snap = clipboard_.snapshot();
    if (!snap) {
        std::println(stderr, "insert: couldn't save the clipboard: {}", snap.error());
        return InsertionResult::Failed;
    }
    log(std::format("saved {} clipboard item(s)", snap->items.size()));

    if (!write_and_verify(text, opts)) {
        std::println(stderr, "insert: clipboard write never verified");
        restore(*snap);
        return InsertionResult::Failed;
    }

    std::this_thread::sleep_for(milliseconds(opts.stabilize_ms));

    auto strokes = paste_sequence(opts.paste_shortcut);
    if (strokes.empty()) strokes = paste_sequence("ctrl+v");
    if (auto res = keys_.post_sequence(strokes); !res) {
        std::println(stderr, "insert: paste failed: {}", res.error());
        restore(*snap);
        return InsertionResult::Failed;
    }

    // The target application reads the clipboard asynchronously.
    std::this_thread::sleep_for(milliseconds(opts.settle_ms));

    auto current = clipboard_.read_text();
    if (current && *current == text) {
        restore(*snap);
    } else {
        log("clipboard changed since paste, leaving it alone");
    }
    return InsertionResult::Inserted;
}

bool TextInserter::write_and_verify(const std::string& text, const Config::Insertion& opts) {
    int attempts = std::max(1, opts.write_attempts);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto before = clipboard_.revision();
        if (auto res = clipboard_.write_text(text); !res) {
            log(std::format("write attempt {} failed: {}", attempt, res.error()));
        } else if (wait_for_commit(before, opts)) {
            auto current = clipboard_.read_text();
            if (current && *current == text) {
                if (attempt > 1) log(std::format("verified on attempt {}", attempt));
                return true;
            }
            log(std::format("attempt {}: clipboard holds different content", attempt));
        } else {
            log(std::format("attempt {}: write did not commit", attempt));
        }

        if (attempt < attempts) {
            std::this_thread::sleep_for(milliseconds(opts.retry_backoff_ms * attempt));
        }
    }
    return false;
}

bool TextInserter::wait_for_commit(uint64_t before, const Config::Insertion& opts) {
    auto deadline = steady_clock::now() + milliseconds(opts.commit_timeout_ms);
    auto poll = milliseconds(std::max(1, opts.commit_poll_ms));
    while (true) {
        if (clipboard_.revision() != before) return true;
        if (steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(poll);
    }
}

void TextInserter::restore(const ClipboardSnapshot& snap) {
    if (auto res = clipboard_.restore(snap); !res) {
        std::println(stderr, "insert: couldn't restore the clipboard: {}", res.error());
        return;
    }
    log("clipboard restored");
}
