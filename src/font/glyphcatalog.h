/*
 * glyphcatalog.h — Id-ordered, deduplicated glyph catalog of a font
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FONTEMBED_GLYPHCATALOG_H
#define FONTEMBED_GLYPHCATALOG_H

#include <QList>

#include "fonthandle.h"

// Sorts by ascending glyph id and collapses entries sharing an id.
// The first entry's width is kept; code points of later entries are merged in.
QList<Glyph> buildGlyphCatalog(QList<Glyph> glyphs);

// One glyph per code point of the font's character set, as a catalog
QList<Glyph> glyphCatalogOf(const FontHandle &font);

#endif // FONTEMBED_GLYPHCATALOG_H
