/*
 * fontmanager.h — Font file resolution and loading
 *
 * Uses fontconfig to resolve a family/weight/slant request to a font file,
 * and caches the raw font programs read from disk.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FONTEMBED_FONTMANAGER_H
#define FONTEMBED_FONTMANAGER_H

#include <QByteArray>
#include <QHash>
#include <QString>

struct FontKey {
    QString family;
    int weight;   // CSS-style weight (400=Normal, 700=Bold, etc.)
    bool italic;

    bool operator==(const FontKey &o) const
    {
        return family == o.family && weight == o.weight && italic == o.italic;
    }
};

inline size_t qHash(const FontKey &k, size_t seed = 0)
{
    return qHash(k.family, seed) ^ qHash(k.weight, seed) ^ qHash(k.italic, seed);
}

class FontManager {
public:
    FontManager() = default;

    // Raw font program bytes; empty if the font cannot be found or read
    QByteArray fontData(const QString &family, int weight = 400, bool italic = false);
    QByteArray fontDataFromPath(const QString &filePath);

    QString resolveFontPath(const QString &family, int weight, bool italic) const;

    // CSS weight to FC_WEIGHT_REGULAR or FC_WEIGHT_BOLD
    static int fontconfigWeight(int weight);

private:
    QHash<FontKey, QString> m_paths;
    QHash<QString, QByteArray> m_dataByPath;
};

#endif // FONTEMBED_FONTMANAGER_H
