/*
 * testfont.h — In-memory SFNT font with chosen metrics
 *
 * Drives FreeType and HarfBuzz from the tests without font files on disk.
 * Glyphs have no outlines; only metrics, cmap and names are meaningful.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FONTEMBED_TESTFONT_H
#define FONTEMBED_TESTFONT_H

#include <QByteArray>
#include <QList>
#include <QPair>

struct TestFontSpec {
    quint16 unitsPerEm = 2000;

    // hhea
    qint16 ascender = 1800;
    qint16 descender = -400;

    // head
    qint16 xMin = -100;
    qint16 yMin = -500;
    qint16 xMax = 2000;
    qint16 yMax = 1900;
    quint16 macStyle = 0;

    // OS/2 (version 2)
    qint16 capHeight = 1400;
    qint16 xHeight = 1000;
    quint16 familyClass = 0;

    // post
    qint32 italicAngle = 0;   // 16.16 fixed
    quint32 isFixedPitch = 0;

    // hmtx, indexed by glyph id
    QList<quint16> advances;

    // cmap format 4: BMP code point -> glyph id
    QList<QPair<quint16, quint16>> cmap;

    // name id 6; no name record when empty
    QByteArray postScriptName = "TestSans-Regular";

    // OpenType 'OTTO' with a CFF table instead of TrueType glyf/loca
    bool cff = false;
};

// Ten glyphs; ' '->1, 'A'->3, 'B'->4, 'C'->5, 'a'->5, 'x'->7, 'D'->9
TestFontSpec defaultTestFontSpec();

QByteArray buildTestFont(const TestFontSpec &spec);

// The bare CFF table of a 'cff' font; every charstring is endchar
QByteArray buildTestCffTable(const TestFontSpec &spec);

#endif // FONTEMBED_TESTFONT_H
