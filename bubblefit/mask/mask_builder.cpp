#include "bubblefit/mask/mask_builder.h"
#include "bubblefit/core/logging.h"
#include "bubblefit/core/string_utils.h"

#include <algorithm>
#include <cstring>

namespace bubblefit::mask {

namespace {

// floor(sqrt(v)) for v >= 0, exact for integers
std::int32_t isqrt(std::int64_t v) {
    if (v <= 0) return 0;
    std::int64_t r = 0;
    std::int64_t bit = std::int64_t{1} << 62;
    while (bit > v) bit >>= 2;
    while (bit != 0) {
        if (v >= r + bit) {
            v -= r + bit;
            r = (r >> 1) + bit;
        } else {
            r >>= 1;
        }
        bit >>= 2;
    }
    return static_cast<std::int32_t>(r);
}

} // namespace

std::size_t Mask::erasedCount() const {
    return static_cast<std::size_t>(std::count(pixels.begin(), pixels.end(), kMaskErase));
}

MaskBuilder::MaskBuilder(MaskConfig config)
    : config_(config) {
}

MaskBuildResult MaskBuilder::build(std::vector<MaskSource> sources, std::int32_t imageWidth, std::int32_t imageHeight) const {
    MaskBuildResult result;
    if (imageWidth <= 0 || imageHeight <= 0) {
        result.status = EngineError::InvalidOperation;
        return result;
    }

    result.mask.width = imageWidth;
    result.mask.height = imageHeight;
    result.mask.pixels.assign(static_cast<std::size_t>(imageWidth) * static_cast<std::size_t>(imageHeight), kMaskKeep);

    // Process in id order so output never depends on caller ordering
    std::stable_sort(sources.begin(), sources.end(), [](const MaskSource& a, const MaskSource& b) {
        return a.regionId < b.regionId;
    });

    for (const MaskSource& src : sources) {
        const Rect footprint = src.box.expanded(config_.paddingPx).clampedTo(imageWidth, imageHeight);
        if (footprint.empty()) {
            result.skipped.push_back(MaskSkip{src.regionId, RegionIssue::MaskClampedToZero});
            BUBBLEFIT_LOG_INFO("mask: region %u lies outside the %dx%d canvas, skipped",
                               src.regionId, imageWidth, imageHeight);
            continue;
        }
        result.footprints.push_back(footprint);
        stampDilated(result.mask, footprint);
    }

    result.components = findComponents(result.mask);
    BUBBLEFIT_LOG_DEBUG("mask: %zu boxes -> %zu components",
                        result.footprints.size(), result.components.size());
    return result;
}

void MaskBuilder::stampDilated(Mask& mask, const Rect& r) const {
    const std::int32_t radius = std::max(0, config_.dilationPx);
    const std::int32_t top = r.y;
    const std::int32_t lastRow = r.bottom() - 1;
    const std::int64_t r2 = static_cast<std::int64_t>(radius) * radius;

    const std::int32_t y0 = std::max(0, top - radius);
    const std::int32_t y1 = std::min(mask.height, r.bottom() + radius);
    for (std::int32_t py = y0; py < y1; ++py) {
        // Vertical distance from this row to the rectangle
        std::int32_t dy = 0;
        if (py < top) dy = top - py;
        else if (py > lastRow) dy = py - lastRow;

        const std::int32_t dx = isqrt(r2 - static_cast<std::int64_t>(dy) * dy);
        const std::int32_t x0 = std::max(0, r.x - dx);
        const std::int32_t x1 = std::min(mask.width, r.right() + dx);
        if (x0 >= x1) continue;

        std::uint8_t* row = mask.pixels.data() + static_cast<std::size_t>(py) * static_cast<std::size_t>(mask.width);
        std::memset(row + x0, kMaskErase, static_cast<std::size_t>(x1 - x0));
    }
}

std::vector<MaskComponent> findComponents(const Mask& mask) {
    std::vector<MaskComponent> components;
    if (mask.width <= 0 || mask.height <= 0) {
        return components;
    }

    const std::size_t w = static_cast<std::size_t>(mask.width);
    std::vector<std::uint8_t> visited(mask.pixels.size(), 0);
    std::vector<std::size_t> stack;

    for (std::size_t start = 0; start < mask.pixels.size(); ++start) {
        if (mask.pixels[start] != kMaskErase || visited[start]) continue;

        std::int32_t minX = mask.width, minY = mask.height, maxX = -1, maxY = -1;
        std::uint32_t count = 0;
        visited[start] = 1;
        stack.push_back(start);

        while (!stack.empty()) {
            const std::size_t idx = stack.back();
            stack.pop_back();
            const std::int32_t x = static_cast<std::int32_t>(idx % w);
            const std::int32_t y = static_cast<std::int32_t>(idx / w);
            ++count;
            minX = std::min(minX, x);
            minY = std::min(minY, y);
            maxX = std::max(maxX, x);
            maxY = std::max(maxY, y);

            auto visit = [&](std::size_t n) {
                if (mask.pixels[n] == kMaskErase && !visited[n]) {
                    visited[n] = 1;
                    stack.push_back(n);
                }
            };
            // 8-neighbourhood: boxes meeting only at a corner are one area
            const bool left = x > 0;
            const bool right = x + 1 < mask.width;
            if (left) visit(idx - 1);
            if (right) visit(idx + 1);
            if (y > 0) {
                visit(idx - w);
                if (left) visit(idx - w - 1);
                if (right) visit(idx - w + 1);
            }
            if (y + 1 < mask.height) {
                visit(idx + w);
                if (left) visit(idx + w - 1);
                if (right) visit(idx + w + 1);
            }
        }

        MaskComponent comp;
        comp.bounds = Rect{minX, minY, maxX - minX + 1, maxY - minY + 1};
        comp.pixelCount = count;
        components.push_back(comp);
    }

    return components;
}

std::uint64_t maskDigest(const Mask& mask) {
    std::uint64_t h = kDigestOffset;
    h = hashU32(h, 0x4B53414Du); // "MASK" marker
    h = hashU32(h, static_cast<std::uint32_t>(mask.width));
    h = hashU32(h, static_cast<std::uint32_t>(mask.height));
    return hashBytes(h, mask.pixels.data(), mask.pixels.size());
}

} // namespace bubblefit::mask
