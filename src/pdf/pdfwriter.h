/*
 * pdfwriter.h — Low-level PDF writer
 *
 * Extracted from Scribus (Andreas Vox, 2014) and simplified:
 *   - No encryption, no PDFVersion enum, no ScStreamFilter
 *   - Hardcoded PDF-1.7
 *   - In-memory QByteArray output alongside file output
 *   - Dictionary records written as whole objects
 *   - Checkpoint/rollback for all-or-nothing multi-object writes
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FONTEMBED_PDFWRITER_H
#define FONTEMBED_PDFWRITER_H

#include <type_traits>

#include <QByteArray>
#include <QDateTime>
#include <QFile>
#include <QHash>
#include <QList>
#include <QPair>
#include <QString>

namespace Pdf {

using ObjId = uint32_t;

// --- PDF serialization helpers (cf. PDF32000-2008) ---

template <typename T, std::enable_if_t<std::is_integral_v<T> || std::is_enum_v<T>, bool> = true>
inline QByteArray toPdf(T v) { return QByteArray::number(static_cast<qlonglong>(v)); }

// Shortest fixed-point form: 500 -> "500", 0.25 -> "0.25", at most 4 decimals
QByteArray toPdfNumber(qreal v);

QByteArray toObjRef(ObjId id);

// Octal escapes for bytes outside printable ASCII
QByteArray toLiteralString(const QByteArray &s);
QByteArray toHexString(const QByteArray &s);

// Big-endian UTF-16 with byte order mark, for text strings such as /Title
QByteArray toUTF16(const QString &s);

// '#'-escapes delimiters, whitespace and non-ASCII bytes
QByteArray toName(const QByteArray &s);

QByteArray toDateString(const QDateTime &dt);

QByteArray toArray(const QList<QByteArray> &items);

// --- Dictionary record ---

// Keys are stored without the leading slash; values are already serialized.
class Dict {
public:
    Dict &insert(const QByteArray &key, const QByteArray &value);

    bool contains(const QByteArray &key) const;
    QByteArray value(const QByteArray &key) const;
    bool isEmpty() const { return m_entries.isEmpty(); }
    int size() const { return m_entries.size(); }

    const QList<QPair<QByteArray, QByteArray>> &entries() const { return m_entries; }

private:
    QList<QPair<QByteArray, QByteArray>> m_entries;
};

QByteArray toPdf(const Dict &dict);

// --- Resource dictionary (simplified from Scribus) ---

struct ResourceDict {
    QHash<QByteArray, ObjId> fonts;
};

// --- PDF Writer ---

class Writer {
public:
    Writer();

    // Output targets (mutually exclusive)
    bool openFile(const QString &filename);
    bool openBuffer(QByteArray *buffer);
    bool close(bool aborted = false);

    qint64 bytesWritten() const;

    // Latched on the first failed write; cleared only by a successful rollback
    bool hasError() const { return m_error; }

    // PDF structure
    void writeHeader();
    void writeXrefAndTrailer();
    void write(const QByteArray &bytes);
    void writeResourceDict(const ResourceDict &dict);

    // Object management
    ObjId reserveObjects(unsigned int n);
    ObjId newObject() { return reserveObjects(1); }
    void startObj(ObjId id);
    ObjId startObj();
    void endObj(ObjId id);
    void endObjectWithStream(ObjId id, const QByteArray &streamContent,
                             bool compress = true);

    // Whole-object helpers; return 0 if the writer is in error
    ObjId writeObject(const Dict &dict);
    ObjId writeStreamObject(const Dict &dict, const QByteArray &streamContent,
                            bool compress = true);

    // Everything written after a checkpoint can be discarded again
    struct Checkpoint {
        ObjId objCounter = 0;
        qint64 bytesWritten = 0;
        int xrefSize = 0;
    };
    Checkpoint checkpoint() const;
    bool rollback(const Checkpoint &cp);

    // Well-known object IDs (assigned when a target is opened)
    ObjId catalogObj() const { return m_catalogObj; }
    ObjId infoObj() const { return m_infoObj; }
    ObjId pagesObj() const { return m_pagesObj; }

private:
    ObjId m_objCounter = 0;
    ObjId m_currentObj = 0;

    // Output: either file or buffer
    QFile m_file;
    QByteArray *m_buffer = nullptr;
    bool m_usingBuffer = false;
    bool m_error = false;

    QList<qint64> m_xref;
    qint64 m_bytesWritten = 0;

    // Well-known objects
    ObjId m_catalogObj = 0;
    ObjId m_infoObj = 0;
    ObjId m_pagesObj = 0;

    QByteArray m_fileId;

    void reset();
    void writeRaw(const QByteArray &bytes);
};

} // namespace Pdf

#endif // FONTEMBED_PDFWRITER_H
