#include "bubblefit/core/engine_config.h"
#include "bubblefit/core/logging.h"

#include <charconv>
#include <fstream>
#include <sstream>

namespace bubblefit {

namespace {

std::string_view trim(std::string_view s) {
    const std::size_t first = s.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) return {};
    const std::size_t last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

bool parseInt(std::string_view value, int& out) {
    if (value.empty()) return false;
    int parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc() || ptr != end) return false;
    out = parsed;
    return true;
}

} // namespace

EngineError applyConfigValue(EngineConfig& config, std::string_view key, std::string_view value) {
    int* target = nullptr;
    if (key == "fit.min_font_px") target = &config.fit.minFontPx;
    else if (key == "fit.max_font_px") target = &config.fit.maxFontPx;
    else if (key == "fit.inner_padding_px") target = &config.fit.innerPaddingPx;
    else if (key == "mask.padding_px") target = &config.mask.paddingPx;
    else if (key == "mask.dilation_px") target = &config.mask.dilationPx;
    else if (key == "grouping.y_threshold") target = &config.grouping.yThreshold;
    else if (key == "font.default_family") {
        if (value.empty()) return EngineError::InvalidValue;
        config.font.defaultFamily = std::string(value);
        return EngineError::Ok;
    } else {
        BUBBLEFIT_LOG_WARN("ignoring unknown config key '%.*s'",
                           static_cast<int>(key.size()), key.data());
        return EngineError::Ok;
    }

    int parsed = 0;
    if (!parseInt(value, parsed)) {
        return EngineError::ParseError;
    }
    *target = parsed;
    return EngineError::Ok;
}

EngineError parseEngineConfig(std::string_view text, EngineConfig& out, int* errorLine) {
    EngineConfig staged = out;
    int lineNo = 0;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        std::size_t eol = text.find('\n', pos);
        if (eol == std::string_view::npos) eol = text.size();
        std::string_view line = trim(text.substr(pos, eol - pos));
        pos = eol + 1;
        ++lineNo;

        if (line.empty() || line.front() == '#') {
            continue;
        }

        const std::size_t eq = line.find('=');
        if (eq == std::string_view::npos) {
            if (errorLine) *errorLine = lineNo;
            return EngineError::ParseError;
        }

        const EngineError err = applyConfigValue(staged, trim(line.substr(0, eq)), trim(line.substr(eq + 1)));
        if (err != EngineError::Ok) {
            if (errorLine) *errorLine = lineNo;
            return err;
        }
    }

    out = std::move(staged);
    return EngineError::Ok;
}

EngineError loadEngineConfig(const std::string& path, EngineConfig& out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return EngineError::FileNotFound;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    const std::string text = buffer.str();

    EngineConfig staged = out;
    int errorLine = 0;
    EngineError err = parseEngineConfig(text, staged, &errorLine);
    if (err != EngineError::Ok) {
        BUBBLEFIT_LOG_WARN("config %s: %s at line %d", path.c_str(), toString(err), errorLine);
        return err;
    }

    err = validateEngineConfig(staged);
    if (err != EngineError::Ok) {
        BUBBLEFIT_LOG_WARN("config %s: rejected (%s)", path.c_str(), toString(err));
        return err;
    }

    out = std::move(staged);
    return EngineError::Ok;
}

EngineError validateEngineConfig(const EngineConfig& config) {
    if (config.fit.minFontPx <= 0 || config.fit.minFontPx > config.fit.maxFontPx) {
        return EngineError::InvalidValue;
    }
    if (config.fit.innerPaddingPx < 0 || config.mask.paddingPx < 0 || config.mask.dilationPx < 0) {
        return EngineError::InvalidValue;
    }
    if (config.grouping.yThreshold < 0 || config.font.defaultFamily.empty()) {
        return EngineError::InvalidValue;
    }
    return EngineError::Ok;
}

} // namespace bubblefit
