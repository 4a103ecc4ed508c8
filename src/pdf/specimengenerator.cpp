/*
 * specimengenerator.cpp — Single-page PDF specimen of an embedded font
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "specimengenerator.h"
#include "customfontembedder.h"

#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QtMath>

namespace {

const QByteArray specimenFontName("F0");

} // anonymous namespace

SpecimenGenerator::SpecimenGenerator(CustomFontEmbedder *embedder)
    : m_embedder(embedder)
{
}

// --- PDF coordinate helpers ---

QByteArray SpecimenGenerator::pdfCoord(qreal v)
{
    return QByteArray::number(v, 'f', 2);
}

// --- Layout ---

SpecimenGenerator::PageGeometry SpecimenGenerator::measure(const QStringList &lines,
                                                           const SpecimenOptions &options) const
{
    PageGeometry geometry;
    geometry.lineHeight = m_embedder->heightOfFontAtSize(options.fontSize) * options.lineSpacing;
    geometry.ascent = m_embedder->heightOfFontAtSize(options.fontSize, {false});

    qreal textWidth = 0;
    for (const QString &line : lines)
        textWidth = qMax(textWidth, m_embedder->widthOfTextAtSize(line, options.fontSize));

    geometry.width = qCeil(textWidth + 2 * options.margin);
    geometry.height = qCeil(lines.size() * geometry.lineHeight + 2 * options.margin);
    return geometry;
}

QByteArray SpecimenGenerator::renderPage(const QStringList &lines,
                                         const SpecimenOptions &options,
                                         const PageGeometry &geometry) const
{
    QByteArray stream;
    stream += "BT\n";
    stream += "/" + specimenFontName + " " + pdfCoord(options.fontSize) + " Tf\n";
    // PDF y grows upwards; first baseline sits one ascent below the top margin
    qreal y = geometry.height - options.margin - geometry.ascent;
    for (const QString &line : lines) {
        if (!line.isEmpty()) {
            stream += "1 0 0 1 " + pdfCoord(options.margin) + " " + pdfCoord(y) + " Tm\n";
            stream += m_embedder->encodeTextAsHexString(line) + " Tj\n";
        }
        y -= geometry.lineHeight;
    }
    stream += "ET\n";
    return stream;
}

// --- Main generate ---

QByteArray SpecimenGenerator::generate(const QStringList &lines, const SpecimenOptions &options)
{
    if (!m_embedder)
        return {};

    QByteArray output;
    Pdf::Writer writer;
    if (!writer.openBuffer(&output))
        return {};

    bool ok = writeDocument(writer, lines, options);
    if (!writer.close(!ok))
        return {};
    return output;
}

bool SpecimenGenerator::generateToFile(const QStringList &lines, const SpecimenOptions &options,
                                       const QString &filePath)
{
    QByteArray data = generate(lines, options);
    if (data.isEmpty())
        return false;
    QFile f(filePath);
    if (!f.open(QIODevice::WriteOnly)) {
        qWarning() << "SpecimenGenerator: Cannot open" << filePath << f.errorString();
        return false;
    }
    if (f.write(data) != data.size()) {
        qWarning() << "SpecimenGenerator: Short write to" << filePath << f.errorString();
        return false;
    }
    return true;
}

bool SpecimenGenerator::writeDocument(Pdf::Writer &writer, const QStringList &lines,
                                      const SpecimenOptions &options)
{
    writer.writeHeader();

    // Embed font
    Pdf::ObjId fontObj = m_embedder->embed(writer);
    if (!fontObj)
        return false;

    Pdf::ResourceDict resources;
    resources.fonts[specimenFontName] = fontObj;

    const PageGeometry geometry = measure(lines, options);

    // Content stream object
    Pdf::ObjId contentObj = writer.startObj();
    writer.write("<<\n");
    writer.endObjectWithStream(contentObj, renderPage(lines, options, geometry));

    // Page object
    Pdf::ObjId pageObj = writer.startObj();
    writer.write("<<\n");
    writer.write("/Type /Page\n");
    writer.write("/Parent " + Pdf::toObjRef(writer.pagesObj()) + "\n");
    writer.write("/MediaBox [0 0 " + Pdf::toPdfNumber(geometry.width) + " "
                 + Pdf::toPdfNumber(geometry.height) + "]\n");
    writer.write("/Contents " + Pdf::toObjRef(contentObj) + "\n");
    writer.write("/Resources ");
    writer.writeResourceDict(resources);
    writer.write(">>");
    writer.endObj(pageObj);

    // Pages object
    writer.startObj(writer.pagesObj());
    writer.write("<<\n/Type /Pages\n/Kids [" + Pdf::toObjRef(pageObj) + "]\n/Count 1\n>>");
    writer.endObj(writer.pagesObj());

    // Info object
    writer.startObj(writer.infoObj());
    writer.write("<<\n");
    writer.write("/Producer " + Pdf::toLiteralString(QByteArrayLiteral("fontembed")) + "\n");
    if (!options.title.isEmpty())
        writer.write("/Title " + Pdf::toLiteralString(Pdf::toUTF16(options.title)) + "\n");
    writer.write("/CreationDate " + Pdf::toDateString(QDateTime::currentDateTime()) + "\n");
    writer.write(">>");
    writer.endObj(writer.infoObj());

    // Catalog object
    writer.startObj(writer.catalogObj());
    writer.write("<<\n/Type /Catalog\n/Pages " + Pdf::toObjRef(writer.pagesObj()) + "\n>>");
    writer.endObj(writer.catalogObj());

    // XRef and trailer
    writer.writeXrefAndTrailer();
    return !writer.hasError();
}
