#ifndef BUBBLEFIT_TEXT_FIXED_ADVANCE_METRICS_H
#define BUBBLEFIT_TEXT_FIXED_ADVANCE_METRICS_H

#include "bubblefit/core/string_utils.h"
#include "bubblefit/text/text_metrics.h"
#include <string>
#include <unordered_set>

namespace bubblefit::text {

/**
 * FixedAdvanceMetrics: font-free metrics backend.
 *
 * Every code point advances `advanceRatio` em (wide CJK code points advance
 * one full em); lines are `heightRatio` em tall with `lineGapRatio` em between
 * them. Used for headless previews and for exact layout tests.
 *
 * Families listed in `knownFamilies` are reported as found; when the set is
 * empty every family is accepted.
 */
struct FixedAdvanceMetrics {
    float advanceRatio = 0.6f;
    float heightRatio = 1.0f;
    float lineGapRatio = 0.2f;
    std::unordered_set<std::string> knownFamilies;

    TextMetrics operator()(std::string_view family, float fontSizePx, std::string_view content) const {
        TextMetrics m;
        float ems = 0.0f;
        std::size_t pos = 0;
        while (pos < content.size()) {
            std::uint32_t byteLen = 0;
            const std::uint32_t cp = decodeUtf8Codepoint(content, pos, byteLen);
            if (byteLen == 0) break;
            ems += isWideCodepoint(cp) ? 1.0f : advanceRatio;
            pos += byteLen;
        }
        m.width = ems * fontSizePx;
        m.height = heightRatio * fontSizePx;
        m.lineGap = lineGapRatio * fontSizePx;
        m.usedFallback = !knownFamilies.empty() && knownFamilies.count(std::string(family)) == 0;
        return m;
    }
};

} // namespace bubblefit::text

#endif // BUBBLEFIT_TEXT_FIXED_ADVANCE_METRICS_H
