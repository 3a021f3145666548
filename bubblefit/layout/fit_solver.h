#ifndef BUBBLEFIT_LAYOUT_FIT_SOLVER_H
#define BUBBLEFIT_LAYOUT_FIT_SOLVER_H

#include "bubblefit/core/engine_config.h"
#include "bubblefit/core/types.h"
#include "bubblefit/text/line_breaker.h"
#include "bubblefit/text/text_metrics.h"
#include <optional>
#include <string_view>

namespace bubblefit::layout {

struct FitRequest {
    std::string_view text;
    std::string_view family;
    std::optional<int> sizeHint;
    Rect editBox;
    Orientation orientation = Orientation::Horizontal;
};

struct FitResult {
    RegionIssue issue = RegionIssue::None;
    int fontSizePx = 0;
    text::LineBreakResult layout;
    float blockWidth = 0.0f;
    float blockHeight = 0.0f;
    Rect interior;

    bool overflow = false;
    bool degenerate = false;
    bool hintRejected = false;
    bool fontFallback = false;
};

/**
 * FitSolver: picks the largest integer font size in [minFontPx, maxFontPx]
 * whose wrapped block fits editBox minus the inner padding.
 *
 * The block extent across lines is the sum of line thicknesses plus
 * (lineCount - 1) line gaps; along lines it is the longest line. Both must
 * fit the interior. When nothing fits, the minimum size is used and the
 * result is flagged as overflowing; text is never dropped.
 */
class FitSolver {
public:
    FitSolver(text::MeasureFn measure, FitConfig config);

    FitResult solve(const FitRequest& request) const;

    const FitConfig& config() const { return config_; }

    struct Candidate {
        int fontSizePx = 0;
        text::LineBreakResult layout;
        float blockWidth = 0.0f;
        float blockHeight = 0.0f;
        bool feasible = false;
    };

    /**
     * Break tokens at one size and test the block against the interior.
     */
    Candidate evaluate(
        const std::vector<text::Token>& tokens,
        std::string_view family,
        int fontSizePx,
        const Rect& interior,
        Orientation orientation
    ) const;

private:
    text::LineBreaker breaker_;
    FitConfig config_;

    static FitResult fromCandidate(Candidate&& candidate, const Rect& interior);
};

} // namespace bubblefit::layout

#endif // BUBBLEFIT_LAYOUT_FIT_SOLVER_H
