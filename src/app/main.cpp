/*
 * main.cpp — fontembed: embed a font into a PDF specimen page
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFileInfo>

#include "customfontembedder.h"
#include "embedoptions.h"
#include "fontmanager.h"
#include "specimengenerator.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("fontembed"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Embed a TrueType/OpenType font as a Type0 CIDFont and write a specimen PDF"));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption fontOption(QStringLiteral("font"),
                                  QStringLiteral("Font file to embed."),
                                  QStringLiteral("path"));
    QCommandLineOption familyOption(QStringLiteral("family"),
                                    QStringLiteral("Font family to resolve with fontconfig."),
                                    QStringLiteral("name"));
    QCommandLineOption boldOption(QStringLiteral("bold"),
                                  QStringLiteral("Resolve the bold face of --family."));
    QCommandLineOption italicOption(QStringLiteral("italic"),
                                    QStringLiteral("Resolve the italic face of --family."));
    QCommandLineOption sizeOption(QStringLiteral("size"),
                                  QStringLiteral("Font size in points (default 24)."),
                                  QStringLiteral("pt"), QStringLiteral("24"));
    QCommandLineOption marginOption(QStringLiteral("margin"),
                                    QStringLiteral("Page margin in points (default 36)."),
                                    QStringLiteral("pt"), QStringLiteral("36"));
    QCommandLineOption nameOption(QStringLiteral("name"),
                                  QStringLiteral("BaseFont prefix for fonts without a PostScript name."),
                                  QStringLiteral("name"), QStringLiteral("Font"));
    QCommandLineOption noCompressOption(QStringLiteral("no-compress"),
                                        QStringLiteral("Write font streams uncompressed."));
    parser.addOptions({fontOption, familyOption, boldOption, italicOption,
                       sizeOption, marginOption, nameOption, noCompressOption});

    parser.addPositionalArgument(QStringLiteral("output"),
                                 QStringLiteral("PDF file to write."));
    parser.addPositionalArgument(QStringLiteral("text"),
                                 QStringLiteral("Lines of sample text."),
                                 QStringLiteral("[text...]"));
    parser.process(app);

    QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        qCritical().noquote() << "fontembed: missing output file";
        parser.showHelp(1);
    }
    const QString outputPath = args.takeFirst();

    if (parser.isSet(fontOption) == parser.isSet(familyOption)) {
        qCritical().noquote() << "fontembed: exactly one of --font or --family is required";
        return 1;
    }

    bool sizeOk = false;
    bool marginOk = false;
    SpecimenOptions specimen;
    specimen.fontSize = parser.value(sizeOption).toDouble(&sizeOk);
    specimen.margin = parser.value(marginOption).toDouble(&marginOk);
    if (!sizeOk || specimen.fontSize <= 0 || !marginOk || specimen.margin < 0) {
        qCritical().noquote() << "fontembed: --size must be positive and --margin non-negative";
        return 1;
    }

    EmbedOptions embedOptions;
    embedOptions.fallbackFontName = parser.value(nameOption).toLatin1();
    embedOptions.compressStreams = !parser.isSet(noCompressOption);

    FontManager fontManager;
    QByteArray fontData;
    if (parser.isSet(fontOption)) {
        fontData = fontManager.fontDataFromPath(parser.value(fontOption));
    } else {
        fontData = fontManager.fontData(parser.value(familyOption),
                                        parser.isSet(boldOption) ? 700 : 400,
                                        parser.isSet(italicOption));
    }
    if (fontData.isEmpty())
        return 1;

    std::unique_ptr<CustomFontEmbedder> embedder = CustomFontEmbedder::create(fontData, embedOptions);
    if (!embedder)
        return 1;

    QStringList lines = args;
    if (lines.isEmpty()) {
        QString psName = embedder->font().postScriptName();
        lines << (psName.isEmpty() ? QString::fromLatin1(embedOptions.fallbackFontName) : psName)
              << QStringLiteral("The quick brown fox jumps over the lazy dog.")
              << QStringLiteral("0123456789 !?&@#%()[]{}");
    }
    specimen.title = lines.first();

    SpecimenGenerator generator(embedder.get());
    if (!generator.generateToFile(lines, specimen, outputPath)) {
        qCritical().noquote() << "fontembed: failed to write" << QFileInfo(outputPath).absoluteFilePath();
        return 1;
    }
    return 0;
}
