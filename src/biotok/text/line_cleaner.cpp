#include <biotok/text/line_cleaner.hpp>

#include <algorithm>
#include <cctype>
#include <regex>
#include <string_view>

namespace biotok::text {

namespace {

// Removed outright, not replaced by a space
constexpr std::string_view DELETED_SYMBOLS = "!\"#$%&*<=>?@\\|~";

const std::regex& punctuation_before_space() {
    static const std::regex re("[.:;,] ");
    return re;
}

// X is anything but ')'; for brackets too, so X may contain ']'
const std::regex& spaced_parentheses() {
    static const std::regex re(R"( \(([^)]*)\) )");
    return re;
}

const std::regex& spaced_brackets() {
    static const std::regex re(R"( \[([^)]*)\] )");
    return re;
}

// Only an apostrophe with a space on both sides; one opening a word stays
const std::regex& standalone_apostrophe() {
    static const std::regex re(" '(?= )");
    return re;
}

const std::regex& backtick_before_space() {
    static const std::regex re("` ");
    return re;
}

const std::regex& contraction_before_space() {
    static const std::regex re("'[st] ");
    return re;
}

const std::regex& slashes_before_space() {
    static const std::regex re("/+ ");
    return re;
}

std::string replace_all(const std::string& s, const std::regex& re, const char* with) {
    return std::regex_replace(s, re, with);
}

}  // namespace

std::string LineCleaner::clean(const std::string& line) {
    std::string s;
    s.reserve(line.size() + 2);
    s += ' ';
    s += line;
    s += ' ';

    s.erase(std::remove_if(s.begin(), s.end(),
                           [](char c) {
                               return DELETED_SYMBOLS.find(c) != std::string_view::npos;
                           }),
            s.end());

    s = replace_all(s, punctuation_before_space(), " ");

    for (int pass = 0; pass < 2; ++pass) {
        s = replace_all(s, spaced_parentheses(), " $1 ");
        s = replace_all(s, spaced_brackets(), " $1 ");
    }

    s = replace_all(s, standalone_apostrophe(), " ");
    s = replace_all(s, backtick_before_space(), " ");
    s = replace_all(s, contraction_before_space(), " ");
    s = replace_all(s, punctuation_before_space(), " ");
    s = replace_all(s, slashes_before_space(), " ");

    return s;
}

std::vector<std::string> LineCleaner::split(const std::string& cleaned) {
    std::vector<std::string> tokens;
    std::string current;

    for (char c : cleaned) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }

    return tokens;
}

std::vector<std::string> LineCleaner::raw_tokens(const std::string& line) {
    return split(clean(line));
}

}  // namespace biotok::text
