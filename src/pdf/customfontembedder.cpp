/*
 * customfontembedder.cpp — Embeds a TrueType/OpenType font as a Type0 CIDFont
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "customfontembedder.h"
#include "fontflags.h"
#include "glyphcatalog.h"
#include "tounicodecmap.h"

#include <QDebug>

#include <cmath>

std::unique_ptr<CustomFontEmbedder> CustomFontEmbedder::create(const QByteArray &fontData,
                                                               const EmbedOptions &options)
{
    QString error;
    std::unique_ptr<FontHandle> font = FontHandle::parse(fontData, 0, &error);
    if (!font) {
        qWarning() << "CustomFontEmbedder: Cannot parse font:" << error;
        return nullptr;
    }
    return std::unique_ptr<CustomFontEmbedder>(
        new CustomFontEmbedder(std::move(font), fontData, options));
}

CustomFontEmbedder::CustomFontEmbedder(std::unique_ptr<FontHandle> font,
                                       const QByteArray &fontData,
                                       const EmbedOptions &options)
    : m_font(std::move(font))
    , m_fontData(fontData)
    , m_scale(1000.0 / m_font->unitsPerEm())
    , m_options(options)
    , m_random(QRandomGenerator::global())
{
}

void CustomFontEmbedder::setRandomGenerator(QRandomGenerator *generator)
{
    m_random = generator ? generator : QRandomGenerator::global();
}

// --- Text measurement ---

QByteArray CustomFontEmbedder::encodeText(const QString &text) const
{
    const QList<Glyph> glyphs = m_font->layout(text);
    QByteArray hex;
    hex.reserve(glyphs.size() * 4);
    for (const Glyph &glyph : glyphs)
        hex += QByteArray::number(glyph.id, 16).toUpper().rightJustified(4, '0');
    return hex;
}

QByteArray CustomFontEmbedder::encodeTextAsHexString(const QString &text) const
{
    return "<" + encodeText(text) + ">";
}

// Advances from the shaper already include kerning
qreal CustomFontEmbedder::widthOfTextAtSize(const QString &text, qreal size) const
{
    const QList<Glyph> glyphs = m_font->layout(text);
    qreal totalWidth = 0;
    for (const Glyph &glyph : glyphs)
        totalWidth += glyph.advanceWidth * m_scale;
    return totalWidth * (size / 1000.0);
}

qreal CustomFontEmbedder::yTop() const
{
    int ascent = m_font->ascent();
    return (ascent ? ascent : m_font->bbox().yMax) * m_scale;
}

qreal CustomFontEmbedder::yBottom() const
{
    int descent = m_font->descent();
    return (descent ? descent : m_font->bbox().yMin) * m_scale;
}

qreal CustomFontEmbedder::heightOfFontAtSize(qreal size, const HeightOptions &options) const
{
    qreal height = yTop() - yBottom();
    // yBottom() carries the bbox fallback, so this leaves baseline to top
    if (!options.includeDescender)
        height -= std::abs(yBottom());
    return (height / 1000.0) * size;
}

qreal CustomFontEmbedder::sizeOfFontAtHeight(qreal height, bool *ok) const
{
    qreal span = yTop() - yBottom();
    if (span == 0) {
        qWarning() << "CustomFontEmbedder: Font" << m_font->postScriptName()
                   << "has zero height, cannot derive a size";
        if (ok)
            *ok = false;
        return 0;
    }
    if (ok)
        *ok = true;
    return (1000.0 * height) / span;
}

QList<uint> CustomFontEmbedder::characterSet() const
{
    return m_font->characterSet();
}

// --- Glyph catalog and widths ---

const QList<Glyph> &CustomFontEmbedder::glyphCatalog() const
{
    if (!m_glyphCatalogReady) {
        m_glyphCatalog = glyphCatalogOf(*m_font);
        m_glyphCatalogReady = true;
    }
    return m_glyphCatalog;
}

Pdf::WidthTable CustomFontEmbedder::computeWidths() const
{
    return Pdf::computeWidths(glyphCatalog(), m_scale);
}

int CustomFontEmbedder::glyphId(const Glyph *glyph)
{
    return glyph ? static_cast<int>(glyph->id) : -1;
}

// --- Naming ---

QByteArray CustomFontEmbedder::randomSuffix(quint32 value, int length)
{
    length = qBound(1, length, 9);
    quint32 modulus = 1;
    for (int i = 0; i < length; ++i)
        modulus *= 10;
    return QByteArray::number(value % modulus).rightJustified(length, '0');
}

QByteArray CustomFontEmbedder::outputFontName(const QString &postScriptName,
                                              const QByteArray &fallback,
                                              const QByteArray &suffix)
{
    QByteArray base = postScriptName.isEmpty() ? fallback : postScriptName.toLatin1();
    return base + "-" + suffix;
}

QByteArray CustomFontEmbedder::cidFontSubtype(OutlineFormat format)
{
    return format == OutlineFormat::Cff ? "CIDFontType0" : "CIDFontType2";
}

QByteArray CustomFontEmbedder::fontFileKey(OutlineFormat format)
{
    return format == OutlineFormat::Cff ? "FontFile3" : "FontFile2";
}

// --- Embedding ---

Pdf::ObjId CustomFontEmbedder::embed(Pdf::Writer &writer)
{
    if (writer.hasError()) {
        qWarning() << "CustomFontEmbedder: Writer is in an error state, not embedding";
        return 0;
    }

    m_fontName = outputFontName(m_font->postScriptName(), m_options.fallbackFontName,
                                randomSuffix(m_random->generate(), m_options.suffixLength));

    const Pdf::Writer::Checkpoint cp = writer.checkpoint();
    Pdf::ObjId fontObj = embedFontDict(writer);
    if (!fontObj || writer.hasError()) {
        qWarning() << "CustomFontEmbedder: Embedding" << m_fontName << "failed, rolling back";
        writer.rollback(cp);
        return 0;
    }

    qDebug() << "CustomFontEmbedder: Embedded" << m_fontName << "as object" << fontObj;
    return fontObj;
}

Pdf::ObjId CustomFontEmbedder::embedFontDict(Pdf::Writer &writer)
{
    Pdf::ObjId cidFontObj = embedCidFontDict(writer);
    if (!cidFontObj)
        return 0;
    Pdf::ObjId cmapObj = embedUnicodeCmap(writer);
    if (!cmapObj)
        return 0;

    Pdf::Dict fontDict;
    fontDict.insert("Type", "/Font")
        .insert("Subtype", "/Type0")
        .insert("BaseFont", Pdf::toName(m_fontName))
        .insert("Encoding", "/Identity-H")
        .insert("DescendantFonts", Pdf::toArray({Pdf::toObjRef(cidFontObj)}))
        .insert("ToUnicode", Pdf::toObjRef(cmapObj));
    return writer.writeObject(fontDict);
}

Pdf::ObjId CustomFontEmbedder::embedCidFontDict(Pdf::Writer &writer)
{
    Pdf::ObjId fontDescObj = embedFontDescriptor(writer);
    if (!fontDescObj)
        return 0;

    // Registry/Ordering Identity: CIDs are glyph ids, matching Identity-H
    Pdf::Dict cidFont;
    cidFont.insert("Type", "/Font")
        .insert("Subtype", Pdf::toName(cidFontSubtype(m_font->outlineFormat())))
        .insert("BaseFont", Pdf::toName(m_fontName))
        .insert("CIDSystemInfo",
                "<< /Registry (Adobe) /Ordering (Identity) /Supplement 0 >>")
        .insert("FontDescriptor", Pdf::toObjRef(fontDescObj))
        .insert("W", Pdf::toWidthArray(computeWidths()));
    return writer.writeObject(cidFont);
}

Pdf::ObjId CustomFontEmbedder::embedFontDescriptor(Pdf::Writer &writer)
{
    Pdf::ObjId fontStreamObj = embedFontStream(writer);
    if (!fontStreamObj)
        return 0;

    const FontBBox bbox = m_font->bbox();
    const int ascent = m_font->ascent();
    const int capHeight = m_font->capHeight();

    Pdf::Dict fontDesc;
    fontDesc.insert("Type", "/FontDescriptor")
        .insert("FontName", Pdf::toName(m_fontName))
        .insert("Flags", Pdf::toPdf(deriveFontFlags(*m_font)))
        .insert("FontBBox", Pdf::toArray({Pdf::toPdfNumber(bbox.xMin * m_scale),
                                          Pdf::toPdfNumber(bbox.yMin * m_scale),
                                          Pdf::toPdfNumber(bbox.xMax * m_scale),
                                          Pdf::toPdfNumber(bbox.yMax * m_scale)}))
        .insert("ItalicAngle", Pdf::toPdfNumber(m_font->italicAngle()))
        .insert("Ascent", Pdf::toPdfNumber(ascent * m_scale))
        .insert("Descent", Pdf::toPdfNumber(m_font->descent() * m_scale))
        .insert("CapHeight", Pdf::toPdfNumber((capHeight ? capHeight : ascent) * m_scale))
        .insert("XHeight", Pdf::toPdfNumber(m_font->xHeight() * m_scale))
        // No reliable source for the dominant stem width of TrueType/CFF fonts
        .insert("StemV", "0")
        .insert(fontFileKey(m_font->outlineFormat()), Pdf::toObjRef(fontStreamObj));
    return writer.writeObject(fontDesc);
}

Pdf::ObjId CustomFontEmbedder::embedFontStream(Pdf::Writer &writer)
{
    // Tagged CIDFontType0C for both outline formats
    Pdf::Dict streamDict;
    streamDict.insert("Subtype", "/CIDFontType0C");
    return writer.writeStreamObject(streamDict, m_fontData, m_options.compressStreams);
}

Pdf::ObjId CustomFontEmbedder::embedUnicodeCmap(Pdf::Writer &writer)
{
    QByteArray cmap = Pdf::buildToUnicodeCMap(glyphCatalog(), &CustomFontEmbedder::glyphId);
    return writer.writeStreamObject(Pdf::Dict(), cmap, m_options.compressStreams);
}
