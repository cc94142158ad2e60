#pragma once

#include "config.hpp"
#include "platform/clipboard.hpp"
#include "platform/key_injector.hpp"
#include "session_state.hpp"

#include <mutex>
#include <string>

// Puts text into the focused application through the clipboard and a
// synthesized paste, then gives the user's clipboard back.
//
// At most one insertion runs per process. A call made while another is in
// flight fails at once instead of queueing, and never touches the clipboard.
class TextInserter {
public:
    TextInserter(Clipboard& clipboard, KeyInjector& keys, bool verbose = false);

    TextInserter(const TextInserter&) = delete;
    TextInserter& operator=(const TextInserter&) = delete;

    InsertionResult insert(const std::string& text, const Config::Insertion& opts);

private:
    InsertionResult paste_with_restore(const std::string& text, const Config::Insertion& opts);
    bool write_and_verify(const std::string& text, const Config::Insertion& opts);
    bool wait_for_commit(uint64_t before, const Config::Insertion& opts);
    void restore(const ClipboardSnapshot& snap);
    void log(const std::string& msg);

    Clipboard& clipboard_;
    KeyInjector& keys_;
    bool verbose_;

    static std::mutex in_flight_;
};
