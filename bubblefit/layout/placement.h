#ifndef BUBBLEFIT_LAYOUT_PLACEMENT_H
#define BUBBLEFIT_LAYOUT_PLACEMENT_H

#include "bubblefit/core/types.h"
#include "bubblefit/layout/fit_solver.h"
#include "bubblefit/layout/render_plan.h"

namespace bubblefit::layout {

/**
 * Position solved lines inside editBox minus the inner padding and write
 * the result into `plan` (lines, block size, font size and fit flags).
 *
 * Horizontal text: alignment picks the line's x; the block is always
 * centered vertically. Vertical text: columns run right to left, the block
 * is centered horizontally and alignment picks the column's y
 * (Left = top, Center = middle, Right = bottom).
 *
 * A block larger than the interior starts at the interior's left/top edge.
 */
void placeLines(
    const FitResult& fit,
    const Rect& editBox,
    int innerPaddingPx,
    TextAlign align,
    Orientation orientation,
    RenderPlan& plan
);

} // namespace bubblefit::layout

#endif // BUBBLEFIT_LAYOUT_PLACEMENT_H
