#ifndef BUBBLEFIT_TEXT_METRICS_H
#define BUBBLEFIT_TEXT_METRICS_H

#include <functional>
#include <string_view>

namespace bubblefit::text {

// Measured extent of a single run of text set on one line.
struct TextMetrics {
    float width = 0.0f;
    float height = 0.0f;        // line box height (ascent + descent)
    float lineGap = 0.0f;       // extra spacing between consecutive lines
    bool usedFallback = false;  // requested family was unknown
};

/**
 * The only capability the layout stages need from a font backend:
 * measure(fontFamily, fontSizePx, text).
 *
 * Implementations must be deterministic for a given font asset and must not
 * depend on any rendering surface.
 */
using MeasureFn = std::function<TextMetrics(std::string_view family, float fontSizePx, std::string_view text)>;

} // namespace bubblefit::text

#endif // BUBBLEFIT_TEXT_METRICS_H
