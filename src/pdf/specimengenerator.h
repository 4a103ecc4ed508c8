/*
 * specimengenerator.h — Single-page PDF specimen of an embedded font
 *
 * Lays out lines of text with CustomFontEmbedder's measurements and
 * writes a complete document around the embedded Type0 font.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FONTEMBED_SPECIMENGENERATOR_H
#define FONTEMBED_SPECIMENGENERATOR_H

#include <QByteArray>
#include <QString>
#include <QStringList>

#include "embedoptions.h"
#include "pdfwriter.h"

class CustomFontEmbedder;

class SpecimenGenerator {
public:
    explicit SpecimenGenerator(CustomFontEmbedder *embedder);

    // Empty result on failure
    QByteArray generate(const QStringList &lines, const SpecimenOptions &options);
    bool generateToFile(const QStringList &lines, const SpecimenOptions &options,
                        const QString &filePath);

private:
    struct PageGeometry {
        qreal width = 0;
        qreal height = 0;
        qreal lineHeight = 0;
        qreal ascent = 0;
    };

    PageGeometry measure(const QStringList &lines, const SpecimenOptions &options) const;
    QByteArray renderPage(const QStringList &lines, const SpecimenOptions &options,
                          const PageGeometry &geometry) const;
    bool writeDocument(Pdf::Writer &writer, const QStringList &lines,
                       const SpecimenOptions &options);

    static QByteArray pdfCoord(qreal v);

    CustomFontEmbedder *m_embedder;
};

#endif // FONTEMBED_SPECIMENGENERATOR_H
