#ifndef BUBBLEFIT_CORE_TYPES_H
#define BUBBLEFIT_CORE_TYPES_H

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>

// Lightweight value types shared by the typesetting and mask stages.

namespace bubblefit {

enum class EngineError : std::uint32_t {
    Ok = 0,
    NotFound = 1,
    InvalidOperation = 2,
    InvalidValue = 3,
    FileNotFound = 4,
    ParseError = 5,
};

// Per-region diagnostics. None of these abort a pipeline run.
enum class RegionIssue : std::uint8_t {
    None = 0,
    InfeasibleFit = 1,      // no size in range fits; rendered at minimum size
    DegenerateBox = 2,      // padded interior has no writable pixels
    UnknownFont = 3,        // family missing, default family used
    MaskClampedToZero = 4,  // expanded box lies outside the canvas
};

enum class Orientation : std::uint8_t {
    Horizontal = 0,
    Vertical = 1,
};

enum class TextAlign : std::uint8_t {
    Left = 0,
    Center = 1,
    Right = 2,
};

const char* toString(EngineError err);
const char* toString(RegionIssue issue);

// Axis-aligned rectangle in image pixel space. (x, y) is the top-left corner.
struct Rect {
    std::int32_t x = 0;
    std::int32_t y = 0;
    std::int32_t w = 0;
    std::int32_t h = 0;

    std::int32_t right() const { return x + w; }
    std::int32_t bottom() const { return y + h; }
    bool empty() const { return w <= 0 || h <= 0; }
    std::int64_t area() const { return empty() ? 0 : static_cast<std::int64_t>(w) * h; }

    Rect inset(std::int32_t p) const { return Rect{x + p, y + p, w - 2 * p, h - 2 * p}; }
    Rect expanded(std::int32_t p) const { return Rect{x - p, y - p, w + 2 * p, h + 2 * p}; }

    // Clamp to [0, width) x [0, height). The result may be zero-area.
    Rect clampedTo(std::int32_t width, std::int32_t height) const {
        const std::int32_t x0 = std::clamp(x, 0, std::max(width, 0));
        const std::int32_t y0 = std::clamp(y, 0, std::max(height, 0));
        const std::int32_t x1 = std::clamp(right(), 0, std::max(width, 0));
        const std::int32_t y1 = std::clamp(bottom(), 0, std::max(height, 0));
        return Rect{x0, y0, std::max(0, x1 - x0), std::max(0, y1 - y0)};
    }

    Rect unite(const Rect& o) const {
        const std::int32_t x0 = std::min(x, o.x);
        const std::int32_t y0 = std::min(y, o.y);
        return Rect{x0, y0, std::max(right(), o.right()) - x0, std::max(bottom(), o.bottom()) - y0};
    }

    bool operator==(const Rect& o) const { return x == o.x && y == o.y && w == o.w && h == o.h; }
    bool operator!=(const Rect& o) const { return !(*this == o); }
};

struct TextStyle {
    std::string fontFamily;
    std::optional<int> fontSizeHint; // pixels; pins the size when feasible
    std::uint32_t colorRGBA = 0x000000FF;
    TextAlign align = TextAlign::Center;
};

} // namespace bubblefit

#endif // BUBBLEFIT_CORE_TYPES_H
