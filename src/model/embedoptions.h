/*
 * embedoptions.h — Options structs for font embedding and specimen output
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FONTEMBED_EMBEDOPTIONS_H
#define FONTEMBED_EMBEDOPTIONS_H

#include <QByteArray>
#include <QString>

struct EmbedOptions {
    // BaseFont prefix when the font carries no PostScript name
    QByteArray fallbackFontName = "Font";

    // Decimal digits of the random suffix appended to BaseFont ("Name-1234")
    int suffixLength = 4;

    // Deflate the font program and ToUnicode streams
    bool compressStreams = true;
};

struct SpecimenOptions {
    // Document info
    QString title;

    // Text
    qreal fontSize = 24.0;      // points
    qreal lineSpacing = 1.2;    // multiple of the font height

    // Page
    qreal margin = 36.0;        // points, all four sides
};

#endif // FONTEMBED_EMBEDOPTIONS_H
