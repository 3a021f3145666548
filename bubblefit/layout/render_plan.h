#ifndef BUBBLEFIT_LAYOUT_RENDER_PLAN_H
#define BUBBLEFIT_LAYOUT_RENDER_PLAN_H

#include "bubblefit/core/types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace bubblefit::layout {

// A line (or column) positioned in image pixel space.
// (x, y) is the top-left corner of the line box.
struct PlacedLine {
    std::string text;
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
    bool overflow = false;
};

/**
 * RenderPlan: everything the rasterizing collaborator needs for one region.
 * Derived data only; produced by TypesetEngine and cached by the ledger.
 */
struct RenderPlan {
    std::uint32_t regionId = 0;
    std::uint64_t version = 0;   // ledger version the plan was computed from

    int fontSizePx = 0;          // 0 when there is nothing to draw
    std::string fontFamily;
    std::uint32_t colorRGBA = 0x000000FF;
    Orientation orientation = Orientation::Horizontal;
    TextAlign align = TextAlign::Center;

    std::vector<PlacedLine> lines;
    float blockWidth = 0.0f;
    float blockHeight = 0.0f;
    float lineGap = 0.0f;
    Rect interior;               // editBox minus inner padding

    RegionIssue issue = RegionIssue::None;
    bool overflow = false;
    bool degenerate = false;
    bool hintRejected = false;   // pinned size did not fit, searched size used
    bool hadForcedBreak = false;
    bool fontFallback = false;

    // Whether the renderer has anything to draw for this region.
    bool renderable() const { return !degenerate && !lines.empty(); }
};

} // namespace bubblefit::layout

#endif // BUBBLEFIT_LAYOUT_RENDER_PLAN_H
