#ifndef BUBBLEFIT_TEXT_LINE_BREAKER_H
#define BUBBLEFIT_TEXT_LINE_BREAKER_H

#include "bubblefit/core/types.h"
#include "bubblefit/text/text_metrics.h"
#include "bubblefit/text/text_prep.h"
#include <string>
#include <string_view>
#include <vector>

namespace bubblefit::text {

// One wrapped line (or, for vertical text, one column).
// width/height are in screen axes: a column's height is its length.
struct BrokenLine {
    std::string text;
    float width = 0.0f;
    float height = 0.0f;
    bool overflow = false;  // a single token longer than the available extent
};

struct LineBreakResult {
    std::vector<BrokenLine> lines;
    float lineGap = 0.0f;
    bool hadForcedBreak = false;
    bool usedFallback = false;
};

/**
 * LineBreaker: greedy word wrap over a MeasureFn.
 *
 * Tokens are appended to the current line while the measured line still
 * fits `maxExtent`; otherwise the token starts a new line. A token longer
 * than `maxExtent` is placed alone on its line and flagged, never split.
 * Each blank line in the input becomes an empty line of the base height.
 *
 * Vertical orientation wraps columns on the available column height; a
 * column stacks one code point per cell.
 */
class LineBreaker {
public:
    explicit LineBreaker(MeasureFn measure);

    LineBreakResult breakText(
        std::string_view text,
        std::string_view family,
        float fontSizePx,
        float maxExtent,
        Orientation orientation
    ) const;

    LineBreakResult breakTokens(
        const std::vector<Token>& tokens,
        std::string_view family,
        float fontSizePx,
        float maxExtent,
        Orientation orientation
    ) const;

private:
    MeasureFn measure_;

    LineBreakResult breakHorizontal(
        const std::vector<Token>& tokens,
        std::string_view family,
        float fontSizePx,
        float maxWidth
    ) const;

    LineBreakResult breakVertical(
        const std::vector<Token>& tokens,
        std::string_view family,
        float fontSizePx,
        float maxHeight
    ) const;
};

} // namespace bubblefit::text

#endif // BUBBLEFIT_TEXT_LINE_BREAKER_H
