#include "bubblefit/ledger/box_grouping.h"
#include "bubblefit/core/logging.h"
#include "bubblefit/text/text_prep.h"

#include <algorithm>
#include <numeric>

namespace bubblefit::ledger {

namespace {

// Reading-order grouping over indices into `boxes`.
std::vector<std::vector<std::size_t>> groupIndices(const std::vector<Rect>& boxes, int yThreshold) {
    std::vector<std::vector<std::size_t>> groups;
    if (boxes.empty()) return groups;

    std::vector<std::size_t> order(boxes.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        if (boxes[a].y != boxes[b].y) return boxes[a].y < boxes[b].y;
        return boxes[a].x < boxes[b].x;
    });

    groups.push_back({order[0]});
    for (std::size_t i = 1; i < order.size(); ++i) {
        const Rect& prev = boxes[order[i - 1]];
        const Rect& cur = boxes[order[i]];
        const std::int32_t gap = cur.y - prev.bottom();
        if (gap >= 0 && gap <= yThreshold) {
            groups.back().push_back(order[i]);
        } else {
            groups.push_back({order[i]});
        }
    }
    return groups;
}

} // namespace

std::vector<std::vector<Rect>> groupBoxes(std::vector<Rect> boxes, int yThreshold) {
    std::vector<std::vector<Rect>> out;
    for (const auto& indices : groupIndices(boxes, yThreshold)) {
        std::vector<Rect> group;
        group.reserve(indices.size());
        for (std::size_t i : indices) group.push_back(boxes[i]);
        out.push_back(std::move(group));
    }
    return out;
}

Rect groupBounds(const std::vector<Rect>& group) {
    if (group.empty()) return Rect{};
    Rect bounds = group.front();
    for (std::size_t i = 1; i < group.size(); ++i) {
        bounds = bounds.unite(group[i]);
    }
    return bounds;
}

std::vector<RegionSeed> seedsFromDetections(
    const std::vector<DetectedBox>& detections,
    int yThreshold,
    const TextStyle& style,
    Orientation orientation
) {
    std::vector<Rect> boxes;
    boxes.reserve(detections.size());
    for (const DetectedBox& d : detections) boxes.push_back(d.box);

    const auto groups = groupIndices(boxes, yThreshold);
    BUBBLEFIT_LOG_INFO("grouped %zu boxes into %zu units", boxes.size(), groups.size());

    std::vector<RegionSeed> seeds;
    for (const auto& indices : groups) {
        std::vector<Rect> withText;
        std::string joined;
        for (std::size_t i : indices) {
            const DetectedBox& d = detections[i];
            if (text::isBlank(d.text)) continue;
            if (!joined.empty()) joined.push_back(' ');
            joined += d.text;
            withText.push_back(d.box);
        }
        if (withText.empty()) continue;

        RegionSeed seed;
        seed.sourceBox = groupBounds(withText);
        seed.sourceText = std::move(joined);
        seed.orientation = orientation;
        seed.style = style;
        seeds.push_back(std::move(seed));
    }
    return seeds;
}

} // namespace bubblefit::ledger
