/*
 * widthtable.h — CIDFont /W array construction
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FONTEMBED_WIDTHTABLE_H
#define FONTEMBED_WIDTHTABLE_H

#include <QByteArray>
#include <QList>

#include "fonthandle.h"

namespace Pdf {

// Consecutive CIDs starting at firstId, one width each (c [w1 w2 ...] form)
struct WidthRun {
    uint firstId = 0;
    QList<qreal> widths;
};

using WidthTable = QList<WidthRun>;

// catalog must be ascending by id without duplicates. A new run starts
// whenever an id is not exactly one past its predecessor.
WidthTable computeWidths(const QList<Glyph> &catalog, qreal scale);

QByteArray toWidthArray(const WidthTable &table);

} // namespace Pdf

#endif // FONTEMBED_WIDTHTABLE_H
