#include "bubblefit/text/line_breaker.h"
#include "bubblefit/core/string_utils.h"

#include <algorithm>
#include <unordered_map>
#include <utility>

namespace bubblefit::text {

LineBreaker::LineBreaker(MeasureFn measure)
    : measure_(std::move(measure)) {
}

LineBreakResult LineBreaker::breakText(
    std::string_view text,
    std::string_view family,
    float fontSizePx,
    float maxExtent,
    Orientation orientation
) const {
    return breakTokens(tokenize(text), family, fontSizePx, maxExtent, orientation);
}

LineBreakResult LineBreaker::breakTokens(
    const std::vector<Token>& tokens,
    std::string_view family,
    float fontSizePx,
    float maxExtent,
    Orientation orientation
) const {
    if (orientation == Orientation::Vertical) {
        return breakVertical(tokens, family, fontSizePx, maxExtent);
    }
    return breakHorizontal(tokens, family, fontSizePx, maxExtent);
}

LineBreakResult LineBreaker::breakHorizontal(
    const std::vector<Token>& tokens,
    std::string_view family,
    float fontSizePx,
    float maxWidth
) const {
    LineBreakResult result;
    const TextMetrics base = measure_(family, fontSizePx, std::string_view());
    result.lineGap = base.lineGap;
    result.usedFallback = base.usedFallback;

    BrokenLine current;
    bool open = false;

    auto closeLine = [&]() {
        if (!open) return;
        result.lines.push_back(std::move(current));
        current = BrokenLine{};
        open = false;
    };

    auto startLine = [&](const Token& token) {
        const TextMetrics m = measure_(family, fontSizePx, token.text);
        current.text = token.text;
        current.width = m.width;
        current.height = m.height;
        current.overflow = m.width > maxWidth;
        open = true;
        if (current.overflow) {
            // Oversized token sits alone; the next token starts a fresh line
            result.hadForcedBreak = true;
            closeLine();
        }
    };

    for (const Token& token : tokens) {
        if (token.breakBefore) {
            closeLine();
            for (std::uint32_t i = 0; i < token.blankLinesBefore; ++i) {
                BrokenLine blank;
                blank.height = base.height;
                result.lines.push_back(std::move(blank));
            }
        }
        if (!open) {
            startLine(token);
            continue;
        }

        std::string candidate = current.text;
        if (token.spaceBefore) candidate.push_back(' ');
        candidate += token.text;

        const TextMetrics m = measure_(family, fontSizePx, candidate);
        if (m.width <= maxWidth) {
            current.text = std::move(candidate);
            current.width = m.width;
            current.height = std::max(current.height, m.height);
        } else {
            closeLine();
            startLine(token);
        }
    }
    closeLine();

    return result;
}

LineBreakResult LineBreaker::breakVertical(
    const std::vector<Token>& tokens,
    std::string_view family,
    float fontSizePx,
    float maxHeight
) const {
    LineBreakResult result;
    const TextMetrics base = measure_(family, fontSizePx, std::string_view());
    result.lineGap = base.lineGap;
    result.usedFallback = base.usedFallback;

    // Cell metrics per code point; a column stacks cells top to bottom
    std::unordered_map<std::string, TextMetrics> cellCache;
    auto cell = [&](std::string_view unit) -> const TextMetrics& {
        auto it = cellCache.find(std::string(unit));
        if (it == cellCache.end()) {
            it = cellCache.emplace(std::string(unit), measure_(family, fontSizePx, unit)).first;
        }
        return it->second;
    };

    struct Extent {
        float length = 0.0f;
        float thickness = 0.0f;
    };
    auto extentOf = [&](std::string_view text) {
        Extent e;
        for (std::string_view unit : splitCodepoints(text)) {
            const TextMetrics& m = cell(unit);
            e.length += m.height;
            e.thickness = std::max(e.thickness, m.width);
        }
        return e;
    };
    const Extent spaceCell = extentOf(" ");

    BrokenLine current;
    bool open = false;

    auto closeColumn = [&]() {
        if (!open) return;
        result.lines.push_back(std::move(current));
        current = BrokenLine{};
        open = false;
    };

    auto startColumn = [&](const Token& token, const Extent& e) {
        current.text = token.text;
        current.width = e.thickness;
        current.height = e.length;
        current.overflow = e.length > maxHeight;
        open = true;
        if (current.overflow) {
            result.hadForcedBreak = true;
            closeColumn();
        }
    };

    for (const Token& token : tokens) {
        if (token.breakBefore) {
            closeColumn();
            for (std::uint32_t i = 0; i < token.blankLinesBefore; ++i) {
                BrokenLine blank;
                blank.width = spaceCell.thickness;
                result.lines.push_back(std::move(blank));
            }
        }
        const Extent e = extentOf(token.text);
        if (!open) {
            startColumn(token, e);
            continue;
        }

        const float sep = token.spaceBefore ? spaceCell.length : 0.0f;
        const float length = current.height + sep + e.length;
        if (length <= maxHeight) {
            if (token.spaceBefore) {
                current.text.push_back(' ');
                current.width = std::max(current.width, spaceCell.thickness);
            }
            current.text += token.text;
            current.height = length;
            current.width = std::max(current.width, e.thickness);
        } else {
            closeColumn();
            startColumn(token, e);
        }
    }
    closeColumn();

    return result;
}

} // namespace bubblefit::text
