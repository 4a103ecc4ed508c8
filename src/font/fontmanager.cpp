/*
 * fontmanager.cpp — Font file resolution and loading
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "fontmanager.h"

#include <QDebug>
#include <QFile>

#include <fontconfig/fontconfig.h>

int FontManager::fontconfigWeight(int weight)
{
    // Only regular and bold are ever requested
    return weight >= 600 ? FC_WEIGHT_BOLD : FC_WEIGHT_REGULAR;
}

QString FontManager::resolveFontPath(const QString &family, int weight, bool italic) const
{
    if (!FcInit()) {
        qWarning() << "FontManager: fontconfig initialization failed";
        return {};
    }

    const QByteArray familyUtf8 = family.toUtf8();
    FcPattern *pattern = FcPatternBuild(nullptr,
        FC_FAMILY, FcTypeString, familyUtf8.constData(),
        FC_WEIGHT, FcTypeInteger, fontconfigWeight(weight),
        FC_SLANT, FcTypeInteger, italic ? FC_SLANT_ITALIC : FC_SLANT_ROMAN,
        FC_SCALABLE, FcTypeBool, FcTrue,
        static_cast<char *>(nullptr));
    if (!pattern)
        return {};

    // nullptr selects the current (default) configuration
    FcConfigSubstitute(nullptr, pattern, FcMatchPattern);
    FcDefaultSubstitute(pattern);

    FcResult result = FcResultNoMatch;
    FcPattern *match = FcFontMatch(nullptr, pattern, &result);
    FcPatternDestroy(pattern);
    if (!match)
        return {};

    QString path;
    FcChar8 *file = nullptr;
    if (FcPatternGetString(match, FC_FILE, 0, &file) == FcResultMatch && file)
        path = QString::fromUtf8(reinterpret_cast<const char *>(file));
    FcPatternDestroy(match);
    return path;
}

QByteArray FontManager::fontData(const QString &family, int weight, bool italic)
{
    FontKey key{family, weight, italic};
    QString path = m_paths.value(key);
    if (path.isEmpty()) {
        path = resolveFontPath(family, weight, italic);
        if (path.isEmpty()) {
            qWarning() << "FontManager: Could not resolve font:" << family << weight << italic;
            return {};
        }
        m_paths.insert(key, path);
    }
    return fontDataFromPath(path);
}

QByteArray FontManager::fontDataFromPath(const QString &filePath)
{
    auto it = m_dataByPath.constFind(filePath);
    if (it != m_dataByPath.constEnd())
        return it.value();

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "FontManager: Cannot open font file:" << filePath;
        return {};
    }

    QByteArray data = file.readAll();
    if (data.isEmpty()) {
        qWarning() << "FontManager: Font file is empty:" << filePath;
        return {};
    }

    m_dataByPath.insert(filePath, data);
    return data;
}
