#include "bubblefit/layout/typeset_engine.h"
#include "bubblefit/layout/placement.h"
#include "bubblefit/core/logging.h"
#include "bubblefit/text/text_prep.h"

#include <utility>

namespace bubblefit::layout {

TypesetEngine::TypesetEngine(text::MeasureFn measure, EngineConfig config)
    : config_(std::move(config)), solver_(std::move(measure), config_.fit) {
}

RenderPlan TypesetEngine::layout(const TypesetInput& input) const {
    RenderPlan plan;
    plan.regionId = input.regionId;
    plan.version = input.version;
    plan.colorRGBA = input.style.colorRGBA;
    plan.fontFamily = input.style.fontFamily.empty() ? config_.font.defaultFamily : input.style.fontFamily;

    const std::string normalized = text::normalizeTranslatedText(input.text);

    FitRequest request;
    request.text = normalized;
    request.family = plan.fontFamily;
    request.sizeHint = input.style.fontSizeHint;
    request.editBox = input.editBox;
    request.orientation = input.orientation;

    const FitResult fit = solver_.solve(request);
    placeLines(fit, input.editBox, config_.fit.innerPaddingPx, input.style.align, input.orientation, plan);

    if (plan.degenerate) {
        BUBBLEFIT_LOG_WARN("region %u: degenerate edit box, skipped from rendering", input.regionId);
    } else if (plan.overflow) {
        BUBBLEFIT_LOG_WARN("region %u: overflow at %dpx (%zu lines)",
                           input.regionId, plan.fontSizePx, plan.lines.size());
    } else {
        BUBBLEFIT_LOG_DEBUG("region %u: %dpx, %zu lines", input.regionId, plan.fontSizePx, plan.lines.size());
    }
    return plan;
}

} // namespace bubblefit::layout
