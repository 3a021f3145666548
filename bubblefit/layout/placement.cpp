#include "bubblefit/layout/placement.h"

#include <algorithm>
#include <utility>

namespace bubblefit::layout {

namespace {

// Offset of an item of `size` inside a span of `span` for the given alignment.
float alignOffset(TextAlign align, float span, float size) {
    switch (align) {
        case TextAlign::Center: return (span - size) * 0.5f;
        case TextAlign::Right: return span - size;
        case TextAlign::Left:
        default: return 0.0f;
    }
}

} // namespace

void placeLines(
    const FitResult& fit,
    const Rect& editBox,
    int innerPaddingPx,
    TextAlign align,
    Orientation orientation,
    RenderPlan& plan
) {
    const Rect interior = editBox.inset(innerPaddingPx);

    plan.lines.clear();
    plan.interior = interior;
    plan.fontSizePx = fit.fontSizePx;
    plan.blockWidth = fit.blockWidth;
    plan.blockHeight = fit.blockHeight;
    plan.lineGap = fit.layout.lineGap;
    plan.orientation = orientation;
    plan.align = align;
    plan.issue = fit.issue;
    plan.overflow = fit.overflow;
    plan.degenerate = fit.degenerate;
    plan.hintRejected = fit.hintRejected;
    plan.hadForcedBreak = fit.layout.hadForcedBreak;
    plan.fontFallback = fit.fontFallback;

    if (fit.degenerate || fit.layout.lines.empty()) {
        return;
    }

    const float ix = static_cast<float>(interior.x);
    const float iy = static_cast<float>(interior.y);
    const float iw = static_cast<float>(interior.w);
    const float ih = static_cast<float>(interior.h);

    plan.lines.reserve(fit.layout.lines.size());

    if (orientation == Orientation::Horizontal) {
        // Block is centered top-to-bottom regardless of alignment
        float y = std::max(iy, iy + (ih - fit.blockHeight) * 0.5f);
        for (const text::BrokenLine& line : fit.layout.lines) {
            PlacedLine placed;
            placed.text = line.text;
            placed.width = line.width;
            placed.height = line.height;
            placed.overflow = line.overflow;
            placed.x = std::max(ix, ix + alignOffset(align, iw, line.width));
            placed.y = y;
            plan.lines.push_back(std::move(placed));
            y += line.height + fit.layout.lineGap;
        }
        return;
    }

    // Vertical: first column is rightmost, block centered left-to-right
    const float left = std::max(ix, ix + (iw - fit.blockWidth) * 0.5f);
    float x = left + fit.blockWidth;
    for (const text::BrokenLine& column : fit.layout.lines) {
        x -= column.width;
        PlacedLine placed;
        placed.text = column.text;
        placed.width = column.width;
        placed.height = column.height;
        placed.overflow = column.overflow;
        placed.x = x;
        placed.y = std::max(iy, iy + alignOffset(align, ih, column.height));
        plan.lines.push_back(std::move(placed));
        x -= fit.layout.lineGap;
    }
}

} // namespace bubblefit::layout
