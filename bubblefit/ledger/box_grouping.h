#ifndef BUBBLEFIT_LEDGER_BOX_GROUPING_H
#define BUBBLEFIT_LEDGER_BOX_GROUPING_H

#include "bubblefit/core/types.h"
#include "bubblefit/ledger/region_ledger.h"
#include <string>
#include <vector>

namespace bubblefit::ledger {

/**
 * Group detector boxes that belong to one speech bubble.
 * Boxes are sorted by (y, x); a box joins the previous group when the gap
 * between the previous box's bottom and its top lies in [0, yThreshold].
 */
std::vector<std::vector<Rect>> groupBoxes(std::vector<Rect> boxes, int yThreshold);

// Union of every box in the group. Empty groups give an empty Rect.
Rect groupBounds(const std::vector<Rect>& group);

// One detector box with the text recognized inside it.
struct DetectedBox {
    Rect box;
    std::string text;
};

/**
 * Turn detector output into region seeds, one per group.
 * Texts of a group are joined with a single space in reading order; boxes
 * with blank text are left out of the group bounds, and groups without any
 * text produce no seed.
 */
std::vector<RegionSeed> seedsFromDetections(
    const std::vector<DetectedBox>& detections,
    int yThreshold,
    const TextStyle& style,
    Orientation orientation = Orientation::Horizontal
);

} // namespace bubblefit::ledger

#endif // BUBBLEFIT_LEDGER_BOX_GROUPING_H
