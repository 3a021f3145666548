#ifndef BUBBLEFIT_CORE_ENGINE_CONFIG_H
#define BUBBLEFIT_CORE_ENGINE_CONFIG_H

#include "bubblefit/core/types.h"
#include <cstdint>
#include <string>
#include <string_view>

namespace bubblefit {

struct FitConfig {
    int minFontPx = 10;
    int maxFontPx = 50;
    int innerPaddingPx = 5;  // subtracted from every side of editBox
};

struct MaskConfig {
    int paddingPx = 10;
    int dilationPx = 2;
};

struct FontConfig {
    std::string defaultFamily = "Wild Words Roman";
};

struct GroupingConfig {
    int yThreshold = 50;  // max vertical gap between boxes of one bubble
};

struct EngineConfig {
    FitConfig fit;
    MaskConfig mask;
    FontConfig font;
    GroupingConfig grouping;
};

/**
 * Apply a single `key=value` setting.
 * Unknown keys are logged and ignored (returns Ok); malformed numbers
 * return ParseError and leave `config` unchanged.
 */
EngineError applyConfigValue(EngineConfig& config, std::string_view key, std::string_view value);

/**
 * Parse `key=value` lines. Blank lines and lines starting with '#' are skipped.
 * On error `out` is left untouched and `errorLine` (if given) receives the
 * 1-based line number.
 */
EngineError parseEngineConfig(std::string_view text, EngineConfig& out, int* errorLine = nullptr);

/**
 * Load and parse a configuration file, then validate it.
 */
EngineError loadEngineConfig(const std::string& path, EngineConfig& out);

/**
 * Reject configurations the fit solver or mask builder cannot honor.
 */
EngineError validateEngineConfig(const EngineConfig& config);

} // namespace bubblefit

#endif // BUBBLEFIT_CORE_ENGINE_CONFIG_H
