#include "balloon/text/font_manager.h"
#include "balloon/core/logging.h"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_TRUETYPE_TABLES_H

#include <hb.h>
#include <hb-ft.h>

#include <algorithm>
#include <cctype>
#include <fstream>

namespace balloon::text {

std::string normalizeFamilyName(const std::string& family) {
    std::string out;
    out.reserve(family.size());
    for (char c : family) {
        if (c == '"' || c == '\'') continue;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    const auto first = out.find_first_not_of(' ');
    if (first == std::string::npos) return std::string();
    const auto last = out.find_last_not_of(' ');
    return out.substr(first, last - first + 1);
}

FontManager::FontManager() = default;

FontManager::~FontManager() {
    shutdown();
}

bool FontManager::initialize() {
    if (initialized_) {
        return true;
    }

    FT_Error error = FT_Init_FreeType(&ftLibrary_);
    if (error) {
        BALLOON_LOG_WARN("FT_Init_FreeType failed (%d)", static_cast<int>(error));
        return false;
    }

    initialized_ = true;
    return true;
}

void FontManager::releaseHandle(FontHandle& handle) {
    if (handle.hbFont) {
        hb_font_destroy(handle.hbFont);
        handle.hbFont = nullptr;
    }
    if (handle.ftFace) {
        FT_Done_Face(handle.ftFace);
        handle.ftFace = nullptr;
    }
}

void FontManager::shutdown() {
    if (!initialized_) {
        return;
    }

    for (auto& [id, handle] : fonts_) {
        if (handle) releaseHandle(*handle);
    }
    fonts_.clear();
    familyMap_.clear();
    defaultFontId_ = 0;

    if (ftLibrary_) {
        FT_Done_FreeType(ftLibrary_);
        ftLibrary_ = nullptr;
    }

    initialized_ = false;
}

std::uint32_t FontManager::loadFontFromMemory(
    const std::uint8_t* fontData,
    std::size_t dataSize,
    const std::string& familyName,
    bool bold,
    bool italic
) {
    if (!initialized_ || !fontData || dataSize == 0) {
        return 0;
    }

    // FreeType reads from the buffer for the face's lifetime.
    std::vector<std::uint8_t> dataCopy(fontData, fontData + dataSize);

    FT_Face face = nullptr;
    FT_Error error = FT_New_Memory_Face(
        ftLibrary_,
        dataCopy.data(),
        static_cast<FT_Long>(dataCopy.size()),
        0,
        &face
    );

    if (error || !face) {
        BALLOON_LOG_WARN("FT_New_Memory_Face failed (%d)", static_cast<int>(error));
        return 0;
    }

    std::string family = familyName;
    if (family.empty() && face->family_name) {
        family = face->family_name;
    }
    if (family.empty()) {
        family = "Unknown";
    }

    const std::uint32_t fontId = nextFontId_++;
    auto handle = createFontHandle(fontId, face, std::move(dataCopy), family, bold, italic);
    if (!handle) {
        FT_Done_Face(face);
        return 0;
    }

    fonts_[fontId] = std::move(handle);
    familyMap_[normalizeFamilyName(family)].push_back(fontId);

    if (defaultFontId_ == 0) {
        defaultFontId_ = fontId;
    }

    BALLOON_LOG_DEBUG("loaded font %u '%s' bold=%d italic=%d", fontId, family.c_str(), bold ? 1 : 0, italic ? 1 : 0);
    return fontId;
}

std::uint32_t FontManager::loadFontFromFile(
    const std::string& filePath,
    const std::string& familyName,
    bool bold,
    bool italic
) {
    if (!initialized_) {
        return 0;
    }

    std::ifstream file(filePath, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        BALLOON_LOG_WARN("cannot open font file %s", filePath.c_str());
        return 0;
    }

    const std::streamsize size = file.tellg();
    if (size <= 0) {
        return 0;
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return 0;
    }

    return loadFontFromMemory(buffer.data(), buffer.size(), familyName, bold, italic);
}

bool FontManager::unloadFont(std::uint32_t fontId) {
    auto it = fonts_.find(fontId);
    if (it == fonts_.end()) {
        return false;
    }

    if (it->second) {
        auto fam = familyMap_.find(normalizeFamilyName(it->second->familyName));
        if (fam != familyMap_.end()) {
            auto& ids = fam->second;
            ids.erase(std::remove(ids.begin(), ids.end(), fontId), ids.end());
            if (ids.empty()) familyMap_.erase(fam);
        }
        releaseHandle(*it->second);
    }
    fonts_.erase(it);

    if (defaultFontId_ == fontId) {
        defaultFontId_ = fonts_.empty() ? 0 : fonts_.begin()->first;
    }
    return true;
}

const FontHandle* FontManager::getFont(std::uint32_t fontId) const {
    const std::uint32_t actualId = (fontId == 0) ? defaultFontId_ : fontId;
    auto it = fonts_.find(actualId);
    return (it != fonts_.end()) ? it->second.get() : nullptr;
}

bool FontManager::hasFont(std::uint32_t fontId) const {
    return getFont(fontId) != nullptr;
}

std::uint32_t FontManager::findFont(const std::string& family, bool bold, bool italic) const {
    auto it = familyMap_.find(normalizeFamilyName(family));
    if (it == familyMap_.end() || it->second.empty()) {
        return getFont(0) ? defaultFontId_ : 0;
    }

    std::uint32_t regular = 0;
    for (std::uint32_t id : it->second) {
        const FontHandle* h = getFont(id);
        if (!h) continue;
        if (h->bold == bold && h->italic == italic) return id;
        if (!h->bold && !h->italic && regular == 0) regular = id;
    }
    return regular != 0 ? regular : it->second.front();
}

FontMetrics FontManager::getScaledMetrics(std::uint32_t fontId, float fontSize) const {
    const FontHandle* handle = getFont(fontId);
    if (!handle) {
        FontMetrics defaults{};
        defaults.unitsPerEM = 1000.0f;
        defaults.ascender = fontSize * 0.8f;
        defaults.descender = fontSize * -0.2f;
        defaults.lineGap = fontSize * 0.1f;
        defaults.underlinePosition = fontSize * -0.1f;
        defaults.underlineThickness = fontSize * 0.05f;
        return defaults;
    }

    const float scale = fontSize / handle->metrics.unitsPerEM;

    FontMetrics scaled{};
    scaled.unitsPerEM = handle->metrics.unitsPerEM;
    scaled.ascender = handle->metrics.ascender * scale;
    scaled.descender = handle->metrics.descender * scale;
    scaled.lineGap = handle->metrics.lineGap * scale;
    scaled.underlinePosition = handle->metrics.underlinePosition * scale;
    scaled.underlineThickness = handle->metrics.underlineThickness * scale;
    return scaled;
}

bool FontManager::setFontSize(std::uint32_t fontId, float fontSize) {
    const FontHandle* handle = getFont(fontId);
    if (!handle || !handle->ftFace || !(fontSize > 0.0f)) {
        return false;
    }

    // 26.6 fixed point at 72 DPI, so one point is one pixel.
    FT_Error error = FT_Set_Char_Size(
        handle->ftFace,
        0,
        static_cast<FT_F26Dot6>(fontSize * 64),
        72,
        72
    );
    if (error) {
        return false;
    }

    if (handle->hbFont) {
        hb_font_set_scale(
            handle->hbFont,
            static_cast<int>(fontSize * 64),
            static_cast<int>(fontSize * 64)
        );
    }
    return true;
}

std::unique_ptr<FontHandle> FontManager::createFontHandle(
    std::uint32_t id,
    FT_Face face,
    std::vector<std::uint8_t>&& fontData,
    const std::string& familyName,
    bool bold,
    bool italic
) {
    auto handle = std::make_unique<FontHandle>();
    handle->id = id;
    handle->familyName = familyName;
    handle->bold = bold;
    handle->italic = italic;
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

    metrics.unitsPerEM = face->units_per_EM > 0 ? static_cast<float>(face->units_per_EM) : 1000.0f;
    metrics.ascender = static_cast<float>(face->ascender);
    metrics.descender = static_cast<float>(face->descender);
    metrics.lineGap = static_cast<float>(face->height - face->ascender + face->descender);
    metrics.underlinePosition = static_cast<float>(face->underline_position);
    metrics.underlineThickness = static_cast<float>(face->underline_thickness);

    // OS/2 typo metrics are more consistent across faces when present.
    TT_OS2* os2 = static_cast<TT_OS2*>(FT_Get_Sfnt_Table(face, FT_SFNT_OS2));
    if (os2 && (os2->sTypoAscender != 0 || os2->sTypoDescender != 0)) {
        metrics.ascender = static_cast<float>(os2->sTypoAscender);
        metrics.descender = static_cast<float>(os2->sTypoDescender);
        metrics.lineGap = static_cast<float>(os2->sTypoLineGap);
    }
    return metrics;
}

} // namespace balloon::text
