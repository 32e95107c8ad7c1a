#ifndef BALLOON_TEXT_FONT_MANAGER_H
#define BALLOON_TEXT_FONT_MANAGER_H

#include "balloon/text/text_types.h"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

// Forward declarations for FreeType/HarfBuzz
typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;
typedef struct hb_font_t hb_font_t;

namespace balloon::text {

/**
 * FontHandle: a loaded face with its HarfBuzz font.
 */
struct FontHandle {
    std::uint32_t id;
    std::string familyName;
    bool bold;
    bool italic;

    FT_Face ftFace;
    hb_font_t* hbFont;

    // Unscaled metrics (font units)
    FontMetrics metrics;

    // Font data storage (kept alive while face is loaded)
    std::vector<std::uint8_t> fontData;
};

/**
 * FontManager: owns FreeType, the loaded faces and the family lookup used
 * when a style names a font family.
 *
 * Faces are grouped by case-insensitive family name. Lookups for an unknown
 * family fall back to the default face (the first one loaded unless
 * overridden), so measurement degrades instead of failing.
 */
class FontManager {
public:
    FontManager();
    ~FontManager();

    FontManager(const FontManager&) = delete;
    FontManager& operator=(const FontManager&) = delete;

    /**
     * Initialize FreeType. Must be called before loading fonts.
     * @return True if initialization succeeded
     */
    bool initialize();

    /**
     * Release every face and the FreeType library.
     */
    void shutdown();

    bool isInitialized() const { return initialized_; }

    /**
     * Load a font from memory.
     * @param fontData Raw TTF/OTF data (copied and owned by the manager)
     * @param dataSize Size of font data in bytes
     * @param familyName Family to register under; empty uses the face's own name
     * @param bold Whether this is a bold variant
     * @param italic Whether this is an italic variant
     * @return Font ID, or 0 on failure
     */
    std::uint32_t loadFontFromMemory(
        const std::uint8_t* fontData,
        std::size_t dataSize,
        const std::string& familyName = "",
        bool bold = false,
        bool italic = false
    );

    /**
     * Load a font from a file path.
     * @return Font ID, or 0 on failure
     */
    std::uint32_t loadFontFromFile(
        const std::string& filePath,
        const std::string& familyName = "",
        bool bold = false,
        bool italic = false
    );

    bool unloadFont(std::uint32_t fontId);

    /**
     * Get a font handle by ID (0 = default font).
     */
    const FontHandle* getFont(std::uint32_t fontId) const;

    bool hasFont(std::uint32_t fontId) const;
    bool hasAnyFont() const { return !fonts_.empty(); }

    std::uint32_t getDefaultFontId() const { return defaultFontId_; }
    void setDefaultFontId(std::uint32_t fontId) { defaultFontId_ = fontId; }

    /**
     * Resolve a family and variant to a loaded face.
     * Prefers an exact variant match, then the family's regular face, then
     * any face of the family, then the default font.
     * @return Font ID, or 0 when nothing is loaded
     */
    std::uint32_t findFont(const std::string& family, bool bold, bool italic) const;

    /**
     * Metrics scaled to fontSize. Unknown fonts get generic proportions.
     */
    FontMetrics getScaledMetrics(std::uint32_t fontId, float fontSize) const;

    /**
     * Set the pixel size used by FreeType and HarfBuzz for a face.
     */
    bool setFontSize(std::uint32_t fontId, float fontSize);

private:
    bool initialized_ = false;
    FT_Library ftLibrary_ = nullptr;

    std::unordered_map<std::uint32_t, std::unique_ptr<FontHandle>> fonts_;
    // Lowercased family name -> font IDs in load order
    std::unordered_map<std::string, std::vector<std::uint32_t>> familyMap_;

    std::uint32_t nextFontId_ = 1;
    std::uint32_t defaultFontId_ = 0;

    std::unique_ptr<FontHandle> createFontHandle(
        std::uint32_t id,
        FT_Face face,
        std::vector<std::uint8_t>&& fontData,
        const std::string& familyName,
        bool bold,
        bool italic
    );

    FontMetrics extractMetrics(FT_Face face) const;
    void releaseHandle(FontHandle& handle);
};

std::string normalizeFamilyName(const std::string& family);

} // namespace balloon::text

#endif // BALLOON_TEXT_FONT_MANAGER_H
