/*
 * tounicodecmap.cpp — ToUnicode CMap for Identity-H encoded CID fonts
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "tounicodecmap.h"
#include "pdfwriter.h"

#include <QPair>

namespace Pdf {

namespace {

// PDF32000-2008 9.10.3: at most 100 entries per beginbfchar block
constexpr int maxBfCharEntries = 100;

QByteArray hex4(uint value)
{
    return QByteArray::number(value, 16).toUpper().rightJustified(4, '0');
}

} // anonymous namespace

QByteArray toUtf16Hex(uint codePoint)
{
    if (codePoint < 0x10000)
        return hex4(codePoint);
    uint v = codePoint - 0x10000;
    uint high = 0xD800 + (v >> 10);
    uint low = 0xDC00 + (v & 0x3FF);
    return hex4(high) + hex4(low);
}

QByteArray buildToUnicodeCMap(const QList<Glyph> &glyphs, const GlyphIdFunction &glyphId)
{
    QByteArray cmap;
    cmap += "/CIDInit /ProcSet findresource begin\n";
    cmap += "12 dict begin\n";
    cmap += "begincmap\n";
    cmap += "/CIDSystemInfo << /Registry (Adobe) /Ordering (UCS) /Supplement 0 >> def\n";
    cmap += "/CMapName /Adobe-Identity-UCS def\n";
    cmap += "/CMapType 2 def\n";
    cmap += "1 begincodespacerange\n<0000> <FFFF>\nendcodespacerange\n";

    // A glyph shared by several code points maps back to the first of them
    QList<QPair<int, uint>> mappings; // CID → unicode
    mappings.reserve(glyphs.size());
    for (const Glyph &glyph : glyphs) {
        int cid = glyphId(&glyph);
        if (cid < 0 || glyph.codePoints.isEmpty())
            continue;
        mappings.append({cid, glyph.codePoints.first()});
    }

    // Write in batches of 100
    int pos = 0;
    while (pos < mappings.size()) {
        int batchSize = qMin(maxBfCharEntries, static_cast<int>(mappings.size()) - pos);
        cmap += toPdf(batchSize) + " beginbfchar\n";
        for (int i = 0; i < batchSize; ++i) {
            auto [cid, unicode] = mappings[pos + i];
            cmap += "<" + hex4(static_cast<uint>(cid)) + "> <" + toUtf16Hex(unicode) + ">\n";
        }
        cmap += "endbfchar\n";
        pos += batchSize;
    }

    cmap += "endcmap\n";
    cmap += "CMapName currentdict /CMap defineresource pop\n";
    cmap += "end\nend\n";
    return cmap;
}

} // namespace Pdf
