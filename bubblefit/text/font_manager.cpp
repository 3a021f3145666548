#include "bubblefit/text/font_manager.h"
#include "bubblefit/core/logging.h"
#include "bubblefit/core/string_utils.h"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_TRUETYPE_TABLES_H

#include <hb.h>
#include <hb-ft.h>

#include <algorithm>
#include <fstream>

namespace bubblefit::text {

namespace {

// Generic em-relative metrics used when no face can be resolved.
constexpr float kFallbackAscent = 0.8f;
constexpr float kFallbackDescent = -0.2f;
constexpr float kFallbackLineGap = 0.1f;
constexpr float kFallbackAdvance = 0.5f;

} // namespace

FontManager::FontManager() = default;

FontManager::~FontManager() {
    shutdown();
}

bool FontManager::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        return true;
    }

    FT_Error error = FT_Init_FreeType(&ftLibrary_);
    if (error) {
        BUBBLEFIT_LOG_WARN("FreeType initialization failed (error %d)", static_cast<int>(error));
        return false;
    }

    hbBuffer_ = hb_buffer_create();
    initialized_ = true;
    return true;
}

void FontManager::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        return;
    }

    for (auto& [id, handle] : fonts_) {
        if (handle) {
            if (handle->hbFont) {
                hb_font_destroy(handle->hbFont);
                handle->hbFont = nullptr;
            }
            if (handle->ftFace) {
                FT_Done_Face(handle->ftFace);
                handle->ftFace = nullptr;
            }
        }
    }
    fonts_.clear();
    familyMap_.clear();
    warnedFamilies_.clear();

    if (hbBuffer_) {
        hb_buffer_destroy(hbBuffer_);
        hbBuffer_ = nullptr;
    }
    if (ftLibrary_) {
        FT_Done_FreeType(ftLibrary_);
        ftLibrary_ = nullptr;
    }

    initialized_ = false;
}

std::uint32_t FontManager::loadFontFromMemory(
    const std::uint8_t* fontData,
    std::size_t dataSize,
    const std::string& familyName
) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_ || !fontData || dataSize == 0) {
        return 0;
    }

    // Copy font data (FreeType requires data to stay valid)
    std::vector<std::uint8_t> dataCopy(fontData, fontData + dataSize);

    FT_Face face = nullptr;
    FT_Error error = FT_New_Memory_Face(
        ftLibrary_,
        dataCopy.data(),
        static_cast<FT_Long>(dataCopy.size()),
        0,  // face index
        &face
    );

    if (error || !face) {
        return 0;
    }

    std::string family = familyName;
    if (family.empty() && face->family_name) {
        family = face->family_name;
    }
    if (family.empty()) {
        family = "Unknown";
    }

    std::uint32_t fontId = nextFontId_++;
    auto handle = createFontHandle(fontId, face, std::move(dataCopy), family);

    if (!handle) {
        FT_Done_Face(face);
        return 0;
    }

    fonts_[fontId] = std::move(handle);
    familyMap_.emplace(family, fontId);

    if (defaultFamily_.empty()) {
        defaultFamily_ = family;
    }

    BUBBLEFIT_LOG_DEBUG("loaded font %u as family '%s'", fontId, family.c_str());
    return fontId;
}

std::uint32_t FontManager::loadFontFromFile(const std::string& filePath, const std::string& familyName) {
    if (!isInitialized()) {
        return 0;
    }

    std::ifstream file(filePath, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return 0;
    }

    std::streamsize size = file.tellg();
    if (size <= 0) {
        return 0;
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return 0;
    }

    return loadFontFromMemory(buffer.data(), buffer.size(), familyName);
}

bool FontManager::unloadFont(std::uint32_t fontId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = fonts_.find(fontId);
    if (it == fonts_.end()) {
        return false;
    }

    auto& handle = it->second;
    const std::string family = handle->familyName;
    if (handle->hbFont) {
        hb_font_destroy(handle->hbFont);
    }
    if (handle->ftFace) {
        FT_Done_Face(handle->ftFace);
    }
    fonts_.erase(it);

    auto famIt = familyMap_.find(family);
    if (famIt != familyMap_.end() && famIt->second == fontId) {
        familyMap_.erase(famIt);
        // Another face of the same family takes over, lowest id first
        std::uint32_t replacement = 0;
        for (const auto& [id, h] : fonts_) {
            if (h->familyName == family && (replacement == 0 || id < replacement)) {
                replacement = id;
            }
        }
        if (replacement != 0) {
            familyMap_.emplace(family, replacement);
        }
    }

    if (defaultFamily_ == family && familyMap_.find(family) == familyMap_.end()) {
        std::uint32_t lowest = 0;
        for (const auto& [id, h] : fonts_) {
            if (lowest == 0 || id < lowest) lowest = id;
        }
        defaultFamily_ = lowest != 0 ? fonts_[lowest]->familyName : std::string();
    }

    return true;
}

bool FontManager::hasFamily(std::string_view family) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return familyMap_.find(std::string(family)) != familyMap_.end();
}

void FontManager::setDefaultFamily(const std::string& family) {
    std::lock_guard<std::mutex> lock(mutex_);
    defaultFamily_ = family;
}

std::string FontManager::getDefaultFamily() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return defaultFamily_;
}

std::vector<std::string> FontManager::getLoadedFamilies() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> families;
    families.reserve(familyMap_.size());
    for (const auto& [name, _] : familyMap_) {
        families.push_back(name);
    }
    std::sort(families.begin(), families.end());
    return families;
}

std::vector<std::string> FontManager::getFallbackFamilies() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> families(warnedFamilies_.begin(), warnedFamilies_.end());
    std::sort(families.begin(), families.end());
    return families;
}

void FontManager::resetFallbackWarnings() {
    std::lock_guard<std::mutex> lock(mutex_);
    warnedFamilies_.clear();
}

const FontHandle* FontManager::resolveLocked(std::string_view family, bool& usedFallback) const {
    usedFallback = false;
    const std::string key(family);
    if (!key.empty()) {
        auto it = familyMap_.find(key);
        if (it != familyMap_.end()) {
            return fonts_.at(it->second).get();
        }
        usedFallback = true;
        if (warnedFamilies_.insert(key).second) {
            BUBBLEFIT_LOG_WARN("font family '%s' not loaded, using '%s'",
                               key.c_str(), defaultFamily_.empty() ? "<builtin metrics>" : defaultFamily_.c_str());
        }
    }

    auto def = familyMap_.find(defaultFamily_);
    if (def != familyMap_.end()) {
        return fonts_.at(def->second).get();
    }
    return nullptr;
}

FontMetrics FontManager::scaleMetrics(const FontHandle* handle, float fontSize) {
    FontMetrics scaled{};
    if (!handle) {
        scaled.unitsPerEM = 1000.0f;
        scaled.ascender = fontSize * kFallbackAscent;
        scaled.descender = fontSize * kFallbackDescent;
        scaled.lineGap = fontSize * kFallbackLineGap;
        return scaled;
    }

    float scale = fontSize / handle->metrics.unitsPerEM;
    scaled.unitsPerEM = handle->metrics.unitsPerEM;
    scaled.ascender = handle->metrics.ascender * scale;
    scaled.descender = handle->metrics.descender * scale;
    scaled.lineGap = handle->metrics.lineGap * scale;
    return scaled;
}

FontMetrics FontManager::getScaledMetrics(std::string_view family, float fontSize) const {
    std::lock_guard<std::mutex> lock(mutex_);
    bool usedFallback = false;
    return scaleMetrics(resolveLocked(family, usedFallback), fontSize);
}

TextMetrics FontManager::measure(std::string_view family, float fontSizePx, std::string_view content) const {
    std::lock_guard<std::mutex> lock(mutex_);

    TextMetrics result;
    const FontHandle* handle = resolveLocked(family, result.usedFallback);
    const FontMetrics vm = scaleMetrics(handle, fontSizePx);
    result.height = vm.ascender - vm.descender;
    result.lineGap = vm.lineGap;

    if (content.empty()) {
        return result;
    }

    if (!handle || !handle->hbFont || !hbBuffer_) {
        float ems = 0.0f;
        std::size_t pos = 0;
        while (pos < content.size()) {
            std::uint32_t byteLen = 0;
            const std::uint32_t cp = decodeUtf8Codepoint(content, pos, byteLen);
            if (byteLen == 0) break;
            ems += isWideCodepoint(cp) ? 1.0f : kFallbackAdvance;
            pos += byteLen;
        }
        result.width = ems * fontSizePx;
        return result;
    }

    // Set char size (fontSize in 26.6 fixed point, 72 DPI)
    FT_Error error = FT_Set_Char_Size(
        handle->ftFace,
        0,
        static_cast<FT_F26Dot6>(fontSizePx * 64),
        72,
        72
    );
    if (error) {
        BUBBLEFIT_LOG_WARN("FT_Set_Char_Size failed for '%s' at %.1fpx", handle->familyName.c_str(), fontSizePx);
    }
    hb_font_set_scale(
        handle->hbFont,
        static_cast<int>(fontSizePx * 64),
        static_cast<int>(fontSizePx * 64)
    );

    hb_buffer_reset(hbBuffer_);
    hb_buffer_add_utf8(hbBuffer_, content.data(), static_cast<int>(content.size()), 0, -1);
    hb_buffer_guess_segment_properties(hbBuffer_);

    // Ligatures off so measured width matches per-glyph rendering
    hb_feature_t features[2];
    hb_feature_from_string("-liga", -1, &features[0]);
    hb_feature_from_string("-clig", -1, &features[1]);
    hb_shape(handle->hbFont, hbBuffer_, features, 2);

    unsigned int glyphCount = 0;
    hb_glyph_position_t* glyphPos = hb_buffer_get_glyph_positions(hbBuffer_, &glyphCount);
    if (!glyphPos) {
        return result;
    }

    std::int64_t advance = 0;
    for (unsigned int i = 0; i < glyphCount; ++i) {
        advance += glyphPos[i].x_advance;
    }
    result.width = static_cast<float>(advance) / 64.0f;
    return result;
}

MeasureFn FontManager::measureFn() const {
    return [this](std::string_view family, float fontSizePx, std::string_view content) {
        return measure(family, fontSizePx, content);
    };
}

std::unique_ptr<FontHandle> FontManager::createFontHandle(
    std::uint32_t id,
    FT_Face face,
    std::vector<std::uint8_t>&& fontData,
    const std::string& familyName
) {
    auto handle = std::make_unique<FontHandle>();
    handle->id = id;
    handle->familyName = familyName;
    handle->ftFace = face;
    handle->fontData = std::move(fontData);

    handle->hbFont = hb_ft_font_create(face, nullptr);
    if (!handle->hbFont) {
        return nullptr;
    }

    handle->metrics = extractMetrics(face);
    return handle;
}

FontMetrics FontManager::extractMetrics(FT_Face face) const {
    FontMetrics metrics{};

    metrics.unitsPerEM = static_cast<float>(face->units_per_EM);
    metrics.ascender = static_cast<float>(face->ascender);
    metrics.descender = static_cast<float>(face->descender);
    metrics.lineGap = static_cast<float>(face->height - face->ascender + face->descender);

    // OS/2 typo metrics are more reliable when present
    TT_OS2* os2 = static_cast<TT_OS2*>(FT_Get_Sfnt_Table(face, FT_SFNT_OS2));
    if (os2) {
        if (os2->sTypoAscender != 0 || os2->sTypoDescender != 0) {
            metrics.ascender = static_cast<float>(os2->sTypoAscender);
            metrics.descender = static_cast<float>(os2->sTypoDescender);
            metrics.lineGap = static_cast<float>(os2->sTypoLineGap);
        }
    }

    if (metrics.unitsPerEM <= 0.0f) {
        // Bitmap-only faces report 0 units per EM
        metrics.unitsPerEM = 1000.0f;
        metrics.ascender = 800.0f;
        metrics.descender = -200.0f;
        metrics.lineGap = 0.0f;
    }

    return metrics;
}

} // namespace bubblefit::text
