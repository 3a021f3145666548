#ifndef BUBBLEFIT_MASK_MASK_BUILDER_H
#define BUBBLEFIT_MASK_MASK_BUILDER_H

#include "bubblefit/core/engine_config.h"
#include "bubblefit/core/types.h"
#include <cstdint>
#include <vector>

namespace bubblefit::mask {

static constexpr std::uint8_t kMaskKeep = 0;
static constexpr std::uint8_t kMaskErase = 255;

// Single-channel binary raster, row-major, one byte per pixel.
struct Mask {
    std::int32_t width = 0;
    std::int32_t height = 0;
    std::vector<std::uint8_t> pixels;

    std::uint8_t at(std::int32_t x, std::int32_t y) const {
        return pixels[static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)];
    }
    bool erased(std::int32_t x, std::int32_t y) const { return at(x, y) == kMaskErase; }
    std::size_t erasedCount() const;
};

struct MaskSource {
    std::uint32_t regionId = 0;
    Rect box;
};

// One 8-connected erase area.
struct MaskComponent {
    Rect bounds;
    std::uint32_t pixelCount = 0;
};

// A source box that contributed nothing to the raster.
struct MaskSkip {
    std::uint32_t regionId = 0;
    RegionIssue issue = RegionIssue::MaskClampedToZero;
};

struct MaskBuildResult {
    EngineError status = EngineError::Ok;
    Mask mask;
    std::vector<MaskComponent> components;  // scan order (top-to-bottom, left-to-right)
    std::vector<MaskSkip> skipped;          // boxes clamped to zero area
    std::vector<Rect> footprints;           // expanded+clamped rects, region id order
};

/**
 * MaskBuilder: builds the erasure mask handed to the inpainting step.
 *
 * Every box is expanded by the padding, clamped to the canvas, dilated by a
 * disc of the configured radius and OR-ed into the raster, so overlapping or
 * touching boxes become one connected area. The raster is always rebuilt
 * from the full source set; identical inputs give byte-identical output.
 */
class MaskBuilder {
public:
    explicit MaskBuilder(MaskConfig config);

    MaskBuildResult build(std::vector<MaskSource> sources, std::int32_t imageWidth, std::int32_t imageHeight) const;

    const MaskConfig& config() const { return config_; }

private:
    MaskConfig config_;

    void stampDilated(Mask& mask, const Rect& r) const;
};

/**
 * Label 8-connected erase areas. Pixels touching at a corner belong to the
 * same area.
 */
std::vector<MaskComponent> findComponents(const Mask& mask);

/**
 * FNV-1a digest of dimensions and pixels.
 */
std::uint64_t maskDigest(const Mask& mask);

} // namespace bubblefit::mask

#endif // BUBBLEFIT_MASK_MASK_BUILDER_H
