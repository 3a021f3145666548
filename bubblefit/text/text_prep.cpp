#include "bubblefit/text/text_prep.h"
#include "bubblefit/core/string_utils.h"

namespace bubblefit::text {

namespace {

bool isSpaceCodepoint(std::uint32_t cp) {
    return cp == ' ' || cp == '\t' || cp == '\r' || cp == '\f' || cp == '\v' || cp == 0x3000 || cp == 0x00A0;
}

// Closing punctuation that must not start a line (kinsoku shori).
bool isClosingPunctuation(std::uint32_t cp) {
    switch (cp) {
        case 0x3001: // 、
        case 0x3002: // 。
        case 0x300D: // 」
        case 0x300F: // 』
        case 0x3011: // 】
        case 0x30FC: // ー
        case 0xFF01: // ！
        case 0xFF09: // ）
        case 0xFF0C: // ，
        case 0xFF0E: // ．
        case 0xFF1F: // ？
            return true;
        default:
            return false;
    }
}

// Blank bytes between periods, line breaks included
bool isAsciiBlank(char ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

// Replace every occurrence of `from` with `to`.
void replaceAll(std::string& s, std::string_view from, std::string_view to) {
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

std::string normalizeTranslatedText(std::string_view text) {
    std::string s(text);
    replaceAll(s, "\xEF\xBC\x8E", ".");  // U+FF0E FULLWIDTH FULL STOP
    replaceAll(s, "\xE2\x80\xA6", ".");  // U+2026 HORIZONTAL ELLIPSIS

    // ". ." -> ".." until no period is followed by blanks and another period
    std::string collapsed;
    collapsed.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        collapsed.push_back(s[i]);
        if (s[i] != '.') continue;
        std::size_t j = i + 1;
        while (j < s.size() && isAsciiBlank(s[j])) ++j;
        if (j > i + 1 && j < s.size() && s[j] == '.') {
            i = j - 1;
        }
    }

    // 3+ periods -> "..."
    std::string out;
    out.reserve(collapsed.size());
    std::size_t run = 0;
    for (const char ch : collapsed) {
        if (ch == '.') {
            ++run;
            if (run <= 3) out.push_back(ch);
        } else {
            run = 0;
            out.push_back(ch);
        }
    }
    return out;
}

std::vector<Token> tokenize(std::string_view text) {
    std::vector<Token> tokens;
    Token current;
    bool pendingSpace = false;
    bool pendingBreak = false;
    std::uint32_t pendingBlankLines = 0;

    auto flush = [&]() {
        if (current.text.empty()) return;
        tokens.push_back(std::move(current));
        current = Token{};
    };

    std::size_t pos = 0;
    while (pos < text.size()) {
        std::uint32_t byteLen = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(text, pos, byteLen);
        if (byteLen == 0) break;
        const std::string_view unit = text.substr(pos, byteLen);
        pos += byteLen;

        if (cp == '\n') {
            flush();
            if (!tokens.empty()) {
                // Every newline after the first one adds an empty line
                if (pendingBreak) ++pendingBlankLines;
                pendingBreak = true;
            }
            pendingSpace = false;
            continue;
        }
        if (isSpaceCodepoint(cp)) {
            flush();
            pendingSpace = !tokens.empty();
            continue;
        }

        if (isWideCodepoint(cp)) {
            if (isClosingPunctuation(cp) && !pendingSpace && !pendingBreak) {
                if (!current.text.empty()) {
                    current.text.append(unit);
                    continue;
                }
                if (!tokens.empty()) {
                    tokens.back().text.append(unit);
                    continue;
                }
            }
            flush();
            Token wide;
            wide.text = std::string(unit);
            wide.spaceBefore = pendingSpace;
            wide.breakBefore = pendingBreak;
            wide.blankLinesBefore = pendingBlankLines;
            tokens.push_back(std::move(wide));
            pendingSpace = false;
            pendingBreak = false;
            pendingBlankLines = 0;
            continue;
        }

        if (current.text.empty()) {
            current.spaceBefore = pendingSpace;
            current.breakBefore = pendingBreak;
            current.blankLinesBefore = pendingBlankLines;
            pendingSpace = false;
            pendingBreak = false;
            pendingBlankLines = 0;
        }
        current.text.append(unit);
    }
    flush();
    return tokens;
}

std::string joinTokens(const std::vector<Token>& tokens) {
    std::string out;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0 && tokens[i].spaceBefore) out.push_back(' ');
        out += tokens[i].text;
    }
    return out;
}

bool isBlank(std::string_view text) {
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::uint32_t byteLen = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(text, pos, byteLen);
        if (byteLen == 0) break;
        if (cp != '\n' && !isSpaceCodepoint(cp)) return false;
        pos += byteLen;
    }
    return true;
}

} // namespace bubblefit::text
