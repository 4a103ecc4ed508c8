/*
 * tounicodecmap.h — ToUnicode CMap for Identity-H encoded CID fonts
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FONTEMBED_TOUNICODECMAP_H
#define FONTEMBED_TOUNICODECMAP_H

#include <functional>

#include <QByteArray>
#include <QList>

#include "fonthandle.h"

namespace Pdf {

// Maps a glyph to its CID; -1 means "no glyph" and the entry is skipped
using GlyphIdFunction = std::function<int(const Glyph *)>;

QByteArray buildToUnicodeCMap(const QList<Glyph> &glyphs, const GlyphIdFunction &glyphId);

// UTF-16BE hex of one code point, surrogate pair above U+FFFF
QByteArray toUtf16Hex(uint codePoint);

} // namespace Pdf

#endif // FONTEMBED_TOUNICODECMAP_H
