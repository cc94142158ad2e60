#include "output_filter.hpp"

#include <array>
#include <regex>

namespace output_filter {

namespace {

const std::array<const char*, 15> kFillerWords = {
    "uh", "um", "uhm", "umm", "uhh", "uhhh",
    "ah", "eh", "hmm", "hm", "mmm", "mm", "mh", "ha", "ehh",
};

const std::regex& tag_block_re() {
    static const std::regex re(R"(<([A-Za-z][A-Za-z0-9:_-]*)[^>]*>[\s\S]*?</\1>)");
    return re;
}

const std::regex& annotations_re() {
    static const std::regex re(R"(\[[^\]]*\]|\([^)]*\)|\{[^}]*\})");
    return re;
}

const std::regex& fillers_re() {
    static const std::regex re = [] {
        std::string alternatives;
        for (const char* w : kFillerWords) {
            if (!alternatives.empty()) alternatives += '|';
            alternatives += w;
        }
        return std::regex("\\b(?:" + alternatives + ")\\b[,.]?", std::regex::icase);
    }();
    return re;
}

const std::regex& spaces_re() {
    static const std::regex re(R"(\s{2,})");
    return re;
}

} // namespace

std::string apply(const std::string& text) {
    auto out = std::regex_replace(text, tag_block_re(), "");
    out = std::regex_replace(out, annotations_re(), "");
    out = std::regex_replace(out, fillers_re(), "");
    out = std::regex_replace(out, spaces_re(), " ");

    auto first = out.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return {};
    auto last = out.find_last_not_of(" \t\n\r");
    return out.substr(first, last - first + 1);
}

} // namespace output_filter
