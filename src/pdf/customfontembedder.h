/*
 * customfontembedder.h — Embeds a TrueType/OpenType font as a Type0 CIDFont
 *
 * Writes the font program, FontDescriptor, CIDFont (with /W widths),
 * ToUnicode CMap and the Type0 font dictionary with Identity-H encoding,
 * and measures text in the same 1000-units-per-em glyph space.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FONTEMBED_CUSTOMFONTEMBEDDER_H
#define FONTEMBED_CUSTOMFONTEMBEDDER_H

#include <memory>

#include <QByteArray>
#include <QList>
#include <QRandomGenerator>
#include <QString>

#include "embedoptions.h"
#include "fonthandle.h"
#include "pdfwriter.h"
#include "widthtable.h"

struct HeightOptions {
    // false measures baseline to ascender only
    bool includeDescender = true;
};

class CustomFontEmbedder {
public:
    // Returns nullptr if fontData cannot be parsed
    static std::unique_ptr<CustomFontEmbedder> create(const QByteArray &fontData,
                                                      const EmbedOptions &options = {});

    CustomFontEmbedder(const CustomFontEmbedder &) = delete;
    CustomFontEmbedder &operator=(const CustomFontEmbedder &) = delete;

    // --- Text measurement (user space units at the given size) ---

    // Shaped glyph ids as 4 hex digits each, e.g. "00240025"
    QByteArray encodeText(const QString &text) const;
    // encodeText() wrapped as a PDF hex string, ready for Tj
    QByteArray encodeTextAsHexString(const QString &text) const;

    qreal widthOfTextAtSize(const QString &text, qreal size) const;
    qreal heightOfFontAtSize(qreal size, const HeightOptions &options = {}) const;
    // Inverse of heightOfFontAtSize(); sets *ok to false for a zero-height font
    qreal sizeOfFontAtHeight(qreal height, bool *ok = nullptr) const;

    QList<uint> characterSet() const;

    // --- Embedding ---

    // Returns the Type0 font object, or 0 if writing failed. On failure
    // everything written by this call has been rolled back.
    Pdf::ObjId embed(Pdf::Writer &writer);

    // BaseFont assigned by the most recent embed()
    QByteArray fontName() const { return m_fontName; }

    const FontHandle &font() const { return *m_font; }
    qreal scale() const { return m_scale; }

    // Computed on first access, then cached
    const QList<Glyph> &glyphCatalog() const;
    Pdf::WidthTable computeWidths() const;

    // Defaults to QRandomGenerator::global(); not owned
    void setRandomGenerator(QRandomGenerator *generator);

    static QByteArray randomSuffix(quint32 value, int length);
    static QByteArray outputFontName(const QString &postScriptName,
                                     const QByteArray &fallback,
                                     const QByteArray &suffix);
    static QByteArray cidFontSubtype(OutlineFormat format);
    static QByteArray fontFileKey(OutlineFormat format);

private:
    CustomFontEmbedder(std::unique_ptr<FontHandle> font, const QByteArray &fontData,
                       const EmbedOptions &options);

    Pdf::ObjId embedFontDict(Pdf::Writer &writer);
    Pdf::ObjId embedCidFontDict(Pdf::Writer &writer);
    Pdf::ObjId embedFontDescriptor(Pdf::Writer &writer);
    Pdf::ObjId embedFontStream(Pdf::Writer &writer);
    Pdf::ObjId embedUnicodeCmap(Pdf::Writer &writer);

    static int glyphId(const Glyph *glyph);

    // Ascent/descent in glyph space, with the bbox fallback
    qreal yTop() const;
    qreal yBottom() const;

    std::unique_ptr<FontHandle> m_font;
    QByteArray m_fontData;
    qreal m_scale = 1.0;
    EmbedOptions m_options;
    QRandomGenerator *m_random = nullptr;

    QByteArray m_fontName;

    mutable QList<Glyph> m_glyphCatalog;
    mutable bool m_glyphCatalogReady = false;
};

#endif // FONTEMBED_CUSTOMFONTEMBEDDER_H
