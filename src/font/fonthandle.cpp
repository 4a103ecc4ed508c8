/*
 * fonthandle.cpp — Parsed font program: metrics, cmap and shaping
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "fonthandle.h"

#include <QDebug>

#include <cstring>

#include FT_FONT_FORMATS_H
#include FT_TRUETYPE_TABLES_H

namespace {

struct HbBufferDeleter {
    void operator()(hb_buffer_t *b) const { if (b) hb_buffer_destroy(b); }
};

void setError(QString *errorMessage, const QString &message)
{
    if (errorMessage)
        *errorMessage = message;
}

} // anonymous namespace

FontHandle::~FontHandle()
{
    if (m_hbFont) {
        hb_font_destroy(m_hbFont);
        m_hbFont = nullptr;
    }
    if (m_hbFace) {
        hb_face_destroy(m_hbFace);
        m_hbFace = nullptr;
    }
    if (m_hbBlob) {
        hb_blob_destroy(m_hbBlob);
        m_hbBlob = nullptr;
    }
    if (m_ftFace) {
        FT_Done_Face(m_ftFace);
        m_ftFace = nullptr;
    }
    if (m_ftLibrary) {
        FT_Done_FreeType(m_ftLibrary);
        m_ftLibrary = nullptr;
    }
}

std::unique_ptr<FontHandle> FontHandle::parse(const QByteArray &fontData, int faceIndex,
                                              QString *errorMessage)
{
    if (fontData.isEmpty()) {
        setError(errorMessage, QStringLiteral("empty font data"));
        return nullptr;
    }

    std::unique_ptr<FontHandle> handle(new FontHandle);
    handle->m_rawData = fontData;

    FT_Error err = FT_Init_FreeType(&handle->m_ftLibrary);
    if (err) {
        handle->m_ftLibrary = nullptr;
        setError(errorMessage, QStringLiteral("FreeType initialization failed (error %1)").arg(err));
        return nullptr;
    }

    err = FT_New_Memory_Face(
        handle->m_ftLibrary,
        reinterpret_cast<const FT_Byte *>(handle->m_rawData.constData()),
        handle->m_rawData.size(),
        faceIndex,
        &handle->m_ftFace);
    if (err) {
        handle->m_ftFace = nullptr;
        setError(errorMessage, QStringLiteral("FreeType failed to load font (error %1)").arg(err));
        return nullptr;
    }

    if (!FT_IS_SFNT(handle->m_ftFace) || !FT_IS_SCALABLE(handle->m_ftFace)) {
        setError(errorMessage, QStringLiteral("not a scalable TrueType/OpenType font"));
        return nullptr;
    }
    if (handle->m_ftFace->units_per_EM == 0) {
        setError(errorMessage, QStringLiteral("font reports zero units per em"));
        return nullptr;
    }

    // FT_Get_Font_Format() reports "CFF" for OpenType fonts with CFF outlines
    const char *format = FT_Get_Font_Format(handle->m_ftFace);
    handle->m_format = (format && std::strcmp(format, "CFF") == 0)
        ? OutlineFormat::Cff : OutlineFormat::TrueType;

    handle->m_hbBlob = hb_blob_create(handle->m_rawData.constData(),
                                      static_cast<unsigned int>(handle->m_rawData.size()),
                                      HB_MEMORY_MODE_READONLY, nullptr, nullptr);
    handle->m_hbFace = hb_face_create(handle->m_hbBlob, static_cast<unsigned int>(faceIndex));
    handle->m_hbFont = hb_font_create(handle->m_hbFace);
    if (!handle->m_hbFont || hb_face_get_glyph_count(handle->m_hbFace) == 0) {
        setError(errorMessage, QStringLiteral("HarfBuzz font creation failed"));
        return nullptr;
    }

    // Advances and positions in font units
    int upem = static_cast<int>(hb_face_get_upem(handle->m_hbFace));
    hb_font_set_scale(handle->m_hbFont, upem, upem);

    return handle;
}

// --- Metrics ---

int FontHandle::unitsPerEm() const
{
    return m_ftFace->units_per_EM;
}

int FontHandle::ascent() const
{
    auto *hhea = static_cast<TT_HoriHeader *>(FT_Get_Sfnt_Table(m_ftFace, FT_SFNT_HHEA));
    if (hhea)
        return hhea->Ascender;
    return m_ftFace->ascender;
}

int FontHandle::descent() const
{
    auto *hhea = static_cast<TT_HoriHeader *>(FT_Get_Sfnt_Table(m_ftFace, FT_SFNT_HHEA));
    if (hhea)
        return hhea->Descender;
    return m_ftFace->descender;
}

int FontHandle::capHeight() const
{
    // sCapHeight exists from OS/2 version 2 on; FreeType marks a missing table 0xFFFF
    auto *os2 = static_cast<TT_OS2 *>(FT_Get_Sfnt_Table(m_ftFace, FT_SFNT_OS2));
    if (os2 && os2->version != 0xFFFF && os2->version >= 2)
        return os2->sCapHeight;
    return 0;
}

int FontHandle::xHeight() const
{
    auto *os2 = static_cast<TT_OS2 *>(FT_Get_Sfnt_Table(m_ftFace, FT_SFNT_OS2));
    if (os2 && os2->version != 0xFFFF && os2->version >= 2)
        return os2->sxHeight;
    return 0;
}

FontBBox FontHandle::bbox() const
{
    const FT_BBox &b = m_ftFace->bbox;
    return {static_cast<qreal>(b.xMin), static_cast<qreal>(b.yMin),
            static_cast<qreal>(b.xMax), static_cast<qreal>(b.yMax)};
}

qreal FontHandle::italicAngle() const
{
    auto *post = static_cast<TT_Postscript *>(FT_Get_Sfnt_Table(m_ftFace, FT_SFNT_POST));
    if (post)
        return static_cast<qreal>(post->italicAngle) / 65536.0;
    return 0;
}

QString FontHandle::postScriptName() const
{
    const char *psName = FT_Get_Postscript_Name(m_ftFace);
    return psName ? QString::fromLatin1(psName) : QString();
}

bool FontHandle::isFixedPitch() const
{
    auto *post = static_cast<TT_Postscript *>(FT_Get_Sfnt_Table(m_ftFace, FT_SFNT_POST));
    if (post)
        return post->isFixedPitch != 0;
    return FT_IS_FIXED_WIDTH(m_ftFace);
}

bool FontHandle::isItalic() const
{
    auto *head = static_cast<TT_Header *>(FT_Get_Sfnt_Table(m_ftFace, FT_SFNT_HEAD));
    if (head)
        return (head->Mac_Style & 0x02) != 0;
    return (m_ftFace->style_flags & FT_STYLE_FLAG_ITALIC) != 0;
}

int FontHandle::familyClass() const
{
    // High byte of sFamilyClass is the IBM class ID, low byte the subclass
    auto *os2 = static_cast<TT_OS2 *>(FT_Get_Sfnt_Table(m_ftFace, FT_SFNT_OS2));
    if (os2 && os2->version != 0xFFFF)
        return (static_cast<quint16>(os2->sFamilyClass) >> 8) & 0xff;
    return 0;
}

// --- Character set and glyphs ---

QList<uint> FontHandle::characterSet() const
{
    QList<uint> codePoints;
    FT_UInt gid = 0;
    FT_ULong charcode = FT_Get_First_Char(m_ftFace, &gid);
    while (gid != 0) {
        codePoints.append(static_cast<uint>(charcode));
        charcode = FT_Get_Next_Char(m_ftFace, charcode, &gid);
    }
    return codePoints;
}

qreal FontHandle::advanceOf(uint glyphId) const
{
    return hb_font_get_glyph_h_advance(m_hbFont, glyphId);
}

Glyph FontHandle::glyphForCodePoint(uint codePoint) const
{
    Glyph glyph;
    glyph.id = FT_Get_Char_Index(m_ftFace, codePoint);
    glyph.advanceWidth = advanceOf(glyph.id);
    glyph.codePoints.append(codePoint);
    return glyph;
}

QList<Glyph> FontHandle::layout(const QString &text) const
{
    QList<Glyph> glyphs;
    if (text.isEmpty())
        return glyphs;

    std::unique_ptr<hb_buffer_t, HbBufferDeleter> buffer(hb_buffer_create());
    if (!hb_buffer_allocation_successful(buffer.get())) {
        qWarning() << "FontHandle: HarfBuzz buffer allocation failed";
        return glyphs;
    }

    hb_buffer_add_utf16(buffer.get(), reinterpret_cast<const uint16_t *>(text.utf16()),
                        text.length(), 0, text.length());
    hb_buffer_guess_segment_properties(buffer.get());
    hb_shape(m_hbFont, buffer.get(), nullptr, 0);

    unsigned int count = 0;
    const hb_glyph_info_t *infos = hb_buffer_get_glyph_infos(buffer.get(), &count);
    const hb_glyph_position_t *positions = hb_buffer_get_glyph_positions(buffer.get(), &count);

    glyphs.reserve(static_cast<int>(count));
    for (unsigned int i = 0; i < count; ++i) {
        Glyph glyph;
        glyph.id = infos[i].codepoint; // glyph index after hb_shape()
        glyph.advanceWidth = positions[i].x_advance;
        glyphs.append(glyph);
    }
    return glyphs;
}
