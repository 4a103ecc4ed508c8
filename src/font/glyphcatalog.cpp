/*
 * glyphcatalog.cpp — Id-ordered, deduplicated glyph catalog of a font
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "glyphcatalog.h"

#include <algorithm>

QList<Glyph> buildGlyphCatalog(QList<Glyph> glyphs)
{
    std::stable_sort(glyphs.begin(), glyphs.end(),
                     [](const Glyph &a, const Glyph &b) { return a.id < b.id; });

    QList<Glyph> catalog;
    catalog.reserve(glyphs.size());
    for (const Glyph &glyph : glyphs) {
        if (!catalog.isEmpty() && catalog.last().id == glyph.id) {
            Glyph &kept = catalog.last();
            for (uint cp : glyph.codePoints) {
                if (!kept.codePoints.contains(cp))
                    kept.codePoints.append(cp);
            }
            continue;
        }
        catalog.append(glyph);
    }
    return catalog;
}

QList<Glyph> glyphCatalogOf(const FontHandle &font)
{
    const QList<uint> characterSet = font.characterSet();

    QList<Glyph> glyphs;
    glyphs.reserve(characterSet.size());
    for (uint codePoint : characterSet)
        glyphs.append(font.glyphForCodePoint(codePoint));

    return buildGlyphCatalog(glyphs);
}
