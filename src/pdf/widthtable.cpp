/*
 * widthtable.cpp — CIDFont /W array construction
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "widthtable.h"
#include "pdfwriter.h"

namespace Pdf {

WidthTable computeWidths(const QList<Glyph> &catalog, qreal scale)
{
    WidthTable table;
    for (int i = 0; i < catalog.size(); ++i) {
        const Glyph &glyph = catalog[i];
        if (i == 0 || glyph.id - catalog[i - 1].id != 1) {
            WidthRun run;
            run.firstId = glyph.id;
            table.append(run);
        }
        table.last().widths.append(glyph.advanceWidth * scale);
    }
    return table;
}

QByteArray toWidthArray(const WidthTable &table)
{
    QList<QByteArray> items;
    items.reserve(table.size() * 2);
    for (const WidthRun &run : table) {
        QList<QByteArray> widths;
        widths.reserve(run.widths.size());
        for (qreal w : run.widths)
            widths.append(toPdfNumber(w));
        items.append(toPdf(run.firstId));
        items.append(toArray(widths));
    }
    return toArray(items);
}

} // namespace Pdf
