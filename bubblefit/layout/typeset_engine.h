#ifndef BUBBLEFIT_LAYOUT_TYPESET_ENGINE_H
#define BUBBLEFIT_LAYOUT_TYPESET_ENGINE_H

#include "bubblefit/core/engine_config.h"
#include "bubblefit/core/types.h"
#include "bubblefit/layout/fit_solver.h"
#include "bubblefit/layout/render_plan.h"
#include "bubblefit/text/text_metrics.h"
#include <cstdint>
#include <string>

namespace bubblefit::layout {

// Immutable inputs for laying out one region.
struct TypesetInput {
    std::uint32_t regionId = 0;
    std::uint64_t version = 0;
    Rect editBox;
    std::string text;
    Orientation orientation = Orientation::Horizontal;
    TextStyle style;
};

/**
 * TypesetEngine: Fit Solver + Placement for a single region.
 *
 * Stateless apart from its configuration and metrics backend, so one
 * instance may be shared by the editor thread and pipeline workers as long
 * as the MeasureFn is itself thread-safe.
 */
class TypesetEngine {
public:
    TypesetEngine(text::MeasureFn measure, EngineConfig config);

    /**
     * Normalize the text, solve the font size and place the lines.
     * Family resolution uses the configured default when the style's
     * family is empty.
     */
    RenderPlan layout(const TypesetInput& input) const;

    const EngineConfig& config() const { return config_; }

private:
    EngineConfig config_;
    FitSolver solver_;
};

} // namespace bubblefit::layout

#endif // BUBBLEFIT_LAYOUT_TYPESET_ENGINE_H
