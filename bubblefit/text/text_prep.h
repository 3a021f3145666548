#ifndef BUBBLEFIT_TEXT_TEXT_PREP_H
#define BUBBLEFIT_TEXT_TEXT_PREP_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace bubblefit::text {

/**
 * A breakable unit of text. Tokens are never split by the line breaker.
 */
struct Token {
    std::string text;
    bool spaceBefore = false;  // joined to the previous token with " "
    bool breakBefore = false;  // an explicit '\n' precedes this token
    std::uint32_t blankLinesBefore = 0;  // empty lines between the break and this token
};

/**
 * Clean up punctuation produced by translation services:
 * full-width period and ellipsis become '.', ". ." collapses to "..",
 * and runs of three or more periods collapse to "...".
 */
std::string normalizeTranslatedText(std::string_view text);

/**
 * Split text into tokens. Whitespace separates tokens; every wide (CJK)
 * code point is its own token joined without a space, except closing
 * punctuation which stays attached to the preceding token.
 */
std::vector<Token> tokenize(std::string_view text);

/**
 * Concatenate tokens back into a single line string.
 */
std::string joinTokens(const std::vector<Token>& tokens);

bool isBlank(std::string_view text);

} // namespace bubblefit::text

#endif // BUBBLEFIT_TEXT_TEXT_PREP_H
