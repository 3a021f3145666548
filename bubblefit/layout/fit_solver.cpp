#include "bubblefit/layout/fit_solver.h"
#include "bubblefit/core/logging.h"

#include <algorithm>
#include <utility>

namespace bubblefit::layout {

FitSolver::FitSolver(text::MeasureFn measure, FitConfig config)
    : breaker_(std::move(measure)), config_(config) {
}

FitSolver::Candidate FitSolver::evaluate(
    const std::vector<text::Token>& tokens,
    std::string_view family,
    int fontSizePx,
    const Rect& interior,
    Orientation orientation
) const {
    Candidate c;
    c.fontSizePx = fontSizePx;

    const bool vertical = orientation == Orientation::Vertical;
    const float maxExtent = static_cast<float>(vertical ? interior.h : interior.w);
    c.layout = breaker_.breakTokens(tokens, family, static_cast<float>(fontSizePx), maxExtent, orientation);

    // Stack thickness across lines, longest line along them
    float stacked = 0.0f;
    float longest = 0.0f;
    for (const text::BrokenLine& line : c.layout.lines) {
        stacked += vertical ? line.width : line.height;
        longest = std::max(longest, vertical ? line.height : line.width);
    }
    if (c.layout.lines.size() > 1) {
        stacked += static_cast<float>(c.layout.lines.size() - 1) * c.layout.lineGap;
    }

    c.blockWidth = vertical ? stacked : longest;
    c.blockHeight = vertical ? longest : stacked;
    c.feasible = c.blockWidth <= static_cast<float>(interior.w) &&
                 c.blockHeight <= static_cast<float>(interior.h);
    return c;
}

FitResult FitSolver::fromCandidate(Candidate&& candidate, const Rect& interior) {
    FitResult result;
    result.fontSizePx = candidate.fontSizePx;
    result.blockWidth = candidate.blockWidth;
    result.blockHeight = candidate.blockHeight;
    result.fontFallback = candidate.layout.usedFallback;
    result.layout = std::move(candidate.layout);
    result.interior = interior;
    return result;
}

FitResult FitSolver::solve(const FitRequest& request) const {
    const Rect interior = request.editBox.inset(config_.innerPaddingPx);
    if (interior.empty()) {
        FitResult result;
        result.interior = interior;
        result.degenerate = true;
        result.issue = RegionIssue::DegenerateBox;
        BUBBLEFIT_LOG_WARN("degenerate box %dx%d after %dpx padding",
                           request.editBox.w, request.editBox.h, config_.innerPaddingPx);
        return result;
    }

    const std::vector<text::Token> tokens = text::tokenize(request.text);
    if (tokens.empty()) {
        FitResult result;
        result.interior = interior;
        return result;
    }

    bool hintRejected = false;
    if (request.sizeHint && *request.sizeHint > 0) {
        Candidate pinned = evaluate(tokens, request.family, *request.sizeHint, interior, request.orientation);
        if (pinned.feasible) {
            FitResult result = fromCandidate(std::move(pinned), interior);
            if (result.fontFallback) result.issue = RegionIssue::UnknownFont;
            return result;
        }
        hintRejected = true;
        BUBBLEFIT_LOG_WARN("pinned size %dpx does not fit %dx%d, searching",
                           *request.sizeHint, interior.w, interior.h);
    }

    int lo = config_.minFontPx;
    int hi = config_.maxFontPx;
    std::optional<Candidate> best;
    while (lo <= hi) {
        const int mid = lo + (hi - lo) / 2;
        Candidate c = evaluate(tokens, request.family, mid, interior, request.orientation);
        if (c.feasible) {
            best = std::move(c);
            lo = mid + 1;
        } else {
            hi = mid - 1;
        }
    }

    FitResult result;
    if (best) {
        result = fromCandidate(std::move(*best), interior);
        result.overflow = hintRejected;
    } else {
        result = fromCandidate(
            evaluate(tokens, request.family, config_.minFontPx, interior, request.orientation),
            interior);
        result.overflow = true;
        BUBBLEFIT_LOG_WARN("text does not fit %dx%d even at %dpx",
                           interior.w, interior.h, config_.minFontPx);
    }
    result.hintRejected = hintRejected;

    if (result.overflow) {
        result.issue = RegionIssue::InfeasibleFit;
    } else if (result.fontFallback) {
        result.issue = RegionIssue::UnknownFont;
    }
    return result;
}

} // namespace bubblefit::layout
