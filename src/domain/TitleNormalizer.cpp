#include "domain/TitleNormalizer.hpp"
#include <cctype>
#include <cstring>

namespace omnisplit::domain {

namespace {
    bool IsSpace(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    bool IsRomanDigit(char c) {
        return std::strchr("IVXLCDM", c) != nullptr && c != '\0';
    }

    // Length of an index separator at pos: whitespace, '.', '-', or a UTF-8 en/em dash.
    size_t SeparatorLength(const std::string& s, size_t pos) {
        if (pos >= s.size()) return 0;
        char c = s[pos];
        if (IsSpace(c) || c == '.' || c == '-') return 1;
        if (s.compare(pos, 3, "\xE2\x80\x93") == 0 || s.compare(pos, 3, "\xE2\x80\x94") == 0) return 3;
        return 0;
    }

    size_t SkipSeparators(const std::string& s, size_t pos) {
        size_t len;
        while ((len = SeparatorLength(s, pos)) > 0) pos += len;
        return pos;
    }

    void StripLeadingIndex(std::string& s) {
        size_t pos = 0;
        size_t end = 0;

        if (!s.empty() && std::isdigit(static_cast<unsigned char>(s[0]))) {
            while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
            if (SeparatorLength(s, pos) == 0) return;
            end = SkipSeparators(s, pos);
        } else if (!s.empty() && IsRomanDigit(s[0])) {
            while (pos < s.size() && IsRomanDigit(s[pos])) ++pos;
            // Roman index needs "." plus whitespace, otherwise "I Am Legend" would lose a word.
            if (pos + 1 >= s.size() || s[pos] != '.' || !IsSpace(s[pos + 1])) return;
            end = SkipSeparators(s, pos);
        } else {
            return;
        }

        // Keep bare numbers such as "1984." intact.
        if (end >= s.size()) return;
        s.erase(0, end);
    }

    bool IsOpener(char c) { return c == '[' || c == '(' || c == '{'; }
    bool IsCloser(char c) { return c == ']' || c == ')' || c == '}'; }

    void StripAnnotations(std::string& s) {
        std::string out;
        out.reserve(s.size());
        size_t i = 0;
        while (i < s.size()) {
            if (IsOpener(s[i])) {
                size_t close = i + 1;
                while (close < s.size() && !IsCloser(s[close])) ++close;
                if (close < s.size()) {
                    i = close + 1;
                    // Avoid leaving a double space where the annotation was.
                    if (!out.empty() && IsSpace(out.back())) {
                        while (i < s.size() && IsSpace(s[i])) ++i;
                    }
                    continue;
                }
            }
            out.push_back(s[i]);
            ++i;
        }
        s.swap(out);
    }

    void StripTrailingPunctuation(std::string& s) {
        while (!s.empty()) {
            char c = s.back();
            if (IsSpace(c) || c == '.' || c == ',' || c == ';' || c == ':') {
                s.pop_back();
            } else {
                break;
            }
        }
    }

    void Trim(std::string& s) {
        size_t first = 0;
        while (first < s.size() && IsSpace(s[first])) ++first;
        s.erase(0, first);
        while (!s.empty() && IsSpace(s.back())) s.pop_back();
    }
}

std::string TitleNormalizer::Normalize(const std::string& raw) {
    std::string current = raw;
    Trim(current);

    // Each pass only removes characters, so this terminates.
    while (true) {
        std::string next = current;
        StripLeadingIndex(next);
        StripAnnotations(next);
        StripTrailingPunctuation(next);
        Trim(next);
        if (next == current) break;
        current.swap(next);
    }
    return current;
}

} // namespace omnisplit::domain
