/*
 * fonthandle.h — Parsed font program: metrics, cmap and shaping
 *
 * Uses FreeType for font-wide metrics and cmap enumeration,
 * and HarfBuzz for advances and shaping.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FONTEMBED_FONTHANDLE_H
#define FONTEMBED_FONTHANDLE_H

#include <memory>

#include <QByteArray>
#include <QList>
#include <QString>

#include <ft2build.h>
#include FT_FREETYPE_H

#include <hb.h>

struct Glyph {
    uint id = 0;
    qreal advanceWidth = 0;  // font units
    QList<uint> codePoints;  // filled by glyph lookup, empty for shaped glyphs
};

struct FontBBox {
    qreal xMin = 0;
    qreal yMin = 0;
    qreal xMax = 0;
    qreal yMax = 0;
};

enum class OutlineFormat { TrueType, Cff };

class FontHandle {
public:
    ~FontHandle();

    FontHandle(const FontHandle &) = delete;
    FontHandle &operator=(const FontHandle &) = delete;

    // Returns nullptr if the data is not a scalable SFNT font.
    static std::unique_ptr<FontHandle> parse(const QByteArray &fontData,
                                             int faceIndex = 0,
                                             QString *errorMessage = nullptr);

    // Metrics (all in font units)
    int unitsPerEm() const;
    int ascent() const;
    int descent() const;
    int capHeight() const;
    int xHeight() const;
    FontBBox bbox() const;

    qreal italicAngle() const;
    OutlineFormat outlineFormat() const { return m_format; }
    bool isCff() const { return m_format == OutlineFormat::Cff; }

    // Classification inputs for the FontDescriptor /Flags
    QString postScriptName() const;
    bool isFixedPitch() const;
    bool isItalic() const;
    int familyClass() const;

    // Unicode code points covered by the font's cmap, in cmap order
    QList<uint> characterSet() const;
    Glyph glyphForCodePoint(uint codePoint) const;

    // Shaped glyphs in visual order; advances include kerning
    QList<Glyph> layout(const QString &text) const;

    const QByteArray &rawData() const { return m_rawData; }

private:
    FontHandle() = default;

    qreal advanceOf(uint glyphId) const;

    QByteArray m_rawData; // kept alive for FreeType/HarfBuzz
    OutlineFormat m_format = OutlineFormat::TrueType;

    FT_Library m_ftLibrary = nullptr;
    FT_Face m_ftFace = nullptr;
    hb_blob_t *m_hbBlob = nullptr;
    hb_face_t *m_hbFace = nullptr;
    hb_font_t *m_hbFont = nullptr;
};

#endif // FONTEMBED_FONTHANDLE_H
