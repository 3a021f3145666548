#ifndef BUBBLEFIT_TEXT_FONT_MANAGER_H
#define BUBBLEFIT_TEXT_FONT_MANAGER_H

#include "bubblefit/text/text_metrics.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Forward declarations for FreeType/HarfBuzz
typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;
typedef struct hb_font_t hb_font_t;
typedef struct hb_buffer_t hb_buffer_t;

namespace bubblefit::text {

// Font-wide vertical metrics in font units (multiply by size / unitsPerEM).
struct FontMetrics {
    float unitsPerEM;
    float ascender;   // Positive, above baseline
    float descender;  // Negative, below baseline
    float lineGap;
};

/**
 * FontHandle: a loaded face with its HarfBuzz font.
 */
struct FontHandle {
    std::uint32_t id;
    std::string familyName;

    FT_Face ftFace;
    hb_font_t* hbFont;

    FontMetrics metrics;

    // Font data storage (kept alive while face is loaded)
    std::vector<std::uint8_t> fontData;
};

/**
 * FontManager: FreeType/HarfBuzz backed metrics provider.
 *
 * Responsibilities:
 * - Initialize/cleanup FreeType library
 * - Load fonts from memory or file and index them by family name
 * - Resolve unknown families to the default family, warning once per family
 * - Measure shaped text (measure / measureFn)
 *
 * measure() is safe to call from several threads; FreeType size state is
 * guarded by an internal mutex.
 */
class FontManager {
public:
    FontManager();
    ~FontManager();

    // Non-copyable
    FontManager(const FontManager&) = delete;
    FontManager& operator=(const FontManager&) = delete;

    /**
     * Initialize the font system. Must be called before loading fonts.
     * @return True if initialization succeeded
     */
    bool initialize();

    /**
     * Shutdown and cleanup all resources.
     */
    void shutdown();

    bool isInitialized() const { return initialized_; }

    // =========================================================================
    // Font Loading
    // =========================================================================

    /**
     * Load a font from memory.
     * @param fontData Raw TTF/OTF data (copied and owned by FontManager)
     * @param dataSize Size of font data in bytes
     * @param familyName Family name override; the face's own name when empty
     * @return Font ID, or 0 on failure
     */
    std::uint32_t loadFontFromMemory(
        const std::uint8_t* fontData,
        std::size_t dataSize,
        const std::string& familyName = ""
    );

    /**
     * Load a font from a file path.
     * @return Font ID, or 0 on failure
     */
    std::uint32_t loadFontFromFile(const std::string& filePath, const std::string& familyName = "");

    /**
     * Unload a font by ID.
     * @return True if font was found and unloaded
     */
    bool unloadFont(std::uint32_t fontId);

    // =========================================================================
    // Family Resolution
    // =========================================================================

    bool hasFamily(std::string_view family) const;

    /**
     * Family used when a requested family is not loaded.
     * The first loaded font's family is the default until this is called.
     */
    void setDefaultFamily(const std::string& family);
    std::string getDefaultFamily() const;

    std::vector<std::string> getLoadedFamilies() const;

    /**
     * Families that were requested but not found since the last
     * resetFallbackWarnings().
     */
    std::vector<std::string> getFallbackFamilies() const;
    void resetFallbackWarnings();

    // =========================================================================
    // Measurement
    // =========================================================================

    /**
     * Scaled vertical metrics for a family at a size. Unknown families
     * resolve like measure(); with no font loaded, generic metrics are used.
     */
    FontMetrics getScaledMetrics(std::string_view family, float fontSize) const;

    /**
     * Shape `text` with HarfBuzz and return its advance width and line box.
     */
    TextMetrics measure(std::string_view family, float fontSizePx, std::string_view text) const;

    /**
     * Bind measure() as a MeasureFn. The FontManager must outlive the result.
     */
    MeasureFn measureFn() const;

private:
    bool initialized_ = false;
    FT_Library ftLibrary_ = nullptr;
    hb_buffer_t* hbBuffer_ = nullptr;

    std::unordered_map<std::uint32_t, std::unique_ptr<FontHandle>> fonts_;
    // Family name -> font ID (the first face registered for that family)
    std::unordered_map<std::string, std::uint32_t> familyMap_;

    std::uint32_t nextFontId_ = 1;
    std::string defaultFamily_;

    mutable std::mutex mutex_;
    mutable std::unordered_set<std::string> warnedFamilies_;

    // Resolve a family to a handle; sets usedFallback when the family is missing.
    // Caller holds mutex_.
    const FontHandle* resolveLocked(std::string_view family, bool& usedFallback) const;

    static FontMetrics scaleMetrics(const FontHandle* handle, float fontSize);

    std::unique_ptr<FontHandle> createFontHandle(
        std::uint32_t id,
        FT_Face face,
        std::vector<std::uint8_t>&& fontData,
        const std::string& familyName
    );

    FontMetrics extractMetrics(FT_Face face) const;
};

} // namespace bubblefit::text

#endif // BUBBLEFIT_TEXT_FONT_MANAGER_H
