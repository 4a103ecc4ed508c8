/*
 * pdfwriter.cpp — Low-level PDF writer
 *
 * Extracted from Scribus (Andreas Vox, 2014) and simplified.
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pdfwriter.h"

#include <QCryptographicHash>
#include <QDebug>
#include <cassert>
#include <utility>

#include <zlib.h>

namespace Pdf {

namespace {

const char hexDigits[] = "0123456789ABCDEF";

bool isDelimiter(uchar c)
{
    return QByteArray("()<>[]{}/%").contains(static_cast<char>(c));
}

bool deflate(const QByteArray &input, QByteArray *output)
{
    uLongf destLen = compressBound(static_cast<uLong>(input.size()));
    QByteArray data(static_cast<qsizetype>(destLen), Qt::Uninitialized);
    int zret = ::compress2(reinterpret_cast<Bytef *>(data.data()), &destLen,
                           reinterpret_cast<const Bytef *>(input.constData()),
                           static_cast<uLong>(input.size()), Z_DEFAULT_COMPRESSION);
    if (zret != Z_OK) {
        qWarning() << "Pdf::Writer: zlib compression failed (" << zret
                   << "), writing stream uncompressed";
        return false;
    }
    data.resize(static_cast<qsizetype>(destLen));
    *output = data;
    return true;
}

} // anonymous namespace

// --- Scalars and strings ---

QByteArray toPdfNumber(qreal v)
{
    QByteArray result = QByteArray::number(v, 'f', 4);
    while (result.endsWith('0'))
        result.chop(1);
    if (result.endsWith('.'))
        result.chop(1);
    if (result == "-0")
        result = "0";
    return result;
}

QByteArray toObjRef(ObjId id)
{
    return toPdf(id) + " 0 R";
}

QByteArray toLiteralString(const QByteArray &s)
{
    QByteArray result("(");
    for (char ch : s) {
        const uchar v = static_cast<uchar>(ch);
        if (v == '(' || v == ')' || v == '\\') {
            result.append('\\').append(ch);
        } else if (v < 32 || v >= 127) {
            result.append('\\');
            result.append(QByteArray::number(v, 8).rightJustified(3, '0'));
        } else {
            result.append(ch);
        }
    }
    result.append(')');
    return result;
}

QByteArray toHexString(const QByteArray &s)
{
    return "<" + s.toHex().toUpper() + ">";
}

QByteArray toUTF16(const QString &s)
{
    QByteArray result("\xfe\xff", 2);
    for (QChar c : s) {
        result.append(static_cast<char>(c.row()));
        result.append(static_cast<char>(c.cell()));
    }
    return result;
}

QByteArray toName(const QByteArray &s)
{
    QByteArray result("/");
    for (char ch : s) {
        const uchar c = static_cast<uchar>(ch);
        if (c <= 32 || c >= 127 || c == '#' || isDelimiter(c)) {
            result.append('#');
            result.append(hexDigits[c / 16]);
            result.append(hexDigits[c % 16]);
        } else {
            result.append(ch);
        }
    }
    return result;
}

QByteArray toDateString(const QDateTime &dt)
{
    return "D:" + dt.toUTC().toString(QStringLiteral("yyyyMMddHHmmss")).toLatin1() + "Z";
}

QByteArray toArray(const QList<QByteArray> &items)
{
    return "[" + items.join(' ') + "]";
}

// --- Dictionary record ---

namespace {

// One "/Key value" line per entry, without the surrounding << >>
QByteArray dictEntries(const Dict &dict)
{
    QByteArray result;
    for (const auto &entry : dict.entries())
        result += toName(entry.first) + " " + entry.second + "\n";
    return result;
}

} // anonymous namespace

Dict &Dict::insert(const QByteArray &key, const QByteArray &value)
{
    for (auto &entry : m_entries) {
        if (entry.first == key) {
            entry.second = value;
            return *this;
        }
    }
    m_entries.append({key, value});
    return *this;
}

bool Dict::contains(const QByteArray &key) const
{
    for (const auto &entry : m_entries) {
        if (entry.first == key)
            return true;
    }
    return false;
}

QByteArray Dict::value(const QByteArray &key) const
{
    for (const auto &entry : m_entries) {
        if (entry.first == key)
            return entry.second;
    }
    return {};
}

QByteArray toPdf(const Dict &dict)
{
    return "<<\n" + dictEntries(dict) + ">>";
}

// --- Writer implementation ---

Writer::Writer()
{
    m_fileId = QCryptographicHash::hash(
        QDateTime::currentDateTime().toString().toUtf8(),
        QCryptographicHash::Md5);
}

void Writer::reset()
{
    m_bytesWritten = 0;
    m_objCounter = 4; // reserve 1=catalog, 2=info, 3=pages
    m_currentObj = 0;
    m_catalogObj = 1;
    m_infoObj = 2;
    m_pagesObj = 3;
    m_xref.clear();
    m_error = false;
}

bool Writer::openFile(const QString &filename)
{
    m_file.setFileName(filename);
    if (!m_file.open(QIODevice::WriteOnly)) {
        qWarning() << "Pdf::Writer: Cannot open" << filename << m_file.errorString();
        return false;
    }
    m_usingBuffer = false;
    m_buffer = nullptr;
    reset();
    return true;
}

bool Writer::openBuffer(QByteArray *buffer)
{
    if (!buffer)
        return false;
    m_buffer = buffer;
    m_buffer->clear();
    m_usingBuffer = true;
    reset();
    return true;
}

bool Writer::close(bool aborted)
{
    if (m_usingBuffer) {
        if (aborted || m_error)
            m_buffer->clear();
        m_buffer = nullptr;
        m_usingBuffer = false;
        return !aborted && !m_error;
    }
    bool ok = !m_error && m_file.flush() && m_file.error() == QFile::NoError;
    m_file.close();
    if (aborted || !ok) {
        if (m_file.exists())
            m_file.remove();
    }
    return ok && !aborted;
}

qint64 Writer::bytesWritten() const
{
    return m_bytesWritten;
}

void Writer::writeRaw(const QByteArray &bytes)
{
    if (m_usingBuffer) {
        m_buffer->append(bytes);
    } else if (m_file.write(bytes) != bytes.size()) {
        if (!m_error)
            qWarning() << "Pdf::Writer: Write failed:" << m_file.errorString();
        m_error = true;
    }
    m_bytesWritten += bytes.size();
}

void Writer::write(const QByteArray &bytes)
{
    writeRaw(bytes);
}

void Writer::writeHeader()
{
    // The comment line of high-bit bytes marks the file as binary
    write("%PDF-1.7\n%\xc7\xec\x8f\xa2\n");
}

void Writer::writeXrefAndTrailer()
{
    while (static_cast<ObjId>(m_xref.size()) < m_objCounter)
        m_xref.append(0);

    const qint64 startXref = m_bytesWritten;
    QByteArray table = "xref\n0 " + toPdf(m_xref.size()) + "\n";
    for (qint64 offset : std::as_const(m_xref)) {
        if (offset > 0)
            table += QByteArray::number(offset).rightJustified(10, '0') + " 00000 n \n";
        else
            table += "0000000000 65535 f \n";
    }
    write(table);

    const QByteArray id = toHexString(m_fileId);
    Dict trailer;
    trailer.insert("Size", toPdf(m_xref.size()))
        .insert("Root", toObjRef(m_catalogObj))
        .insert("Info", toObjRef(m_infoObj))
        .insert("ID", "[" + id + id + "]");
    write("trailer\n" + toPdf(trailer) + "\nstartxref\n" + toPdf(startXref) + "\n%%EOF\n");
}

void Writer::writeResourceDict(const ResourceDict &dict)
{
    write("<< /ProcSet [/PDF /Text]\n");
    if (!dict.fonts.isEmpty()) {
        write("/Font <<\n");
        for (auto it = dict.fonts.begin(); it != dict.fonts.end(); ++it)
            write(toName(it.key()) + " " + toObjRef(it.value()) + "\n");
        write(">>\n");
    }
    write(">>\n");
}

ObjId Writer::reserveObjects(unsigned int n)
{
    assert(n < (1u << 30));
    ObjId result = m_objCounter;
    m_objCounter += n;
    return result;
}

void Writer::startObj(ObjId id)
{
    assert(m_currentObj == 0);
    m_currentObj = id;
    while (static_cast<uint>(m_xref.length()) <= id)
        m_xref.append(0);
    m_xref[id] = m_bytesWritten;
    write(toPdf(id) + " 0 obj\n");
}

ObjId Writer::startObj()
{
    ObjId id = newObject();
    startObj(id);
    return id;
}

void Writer::endObj(ObjId id)
{
    assert(m_currentObj == id);
    m_currentObj = 0;
    write("\nendobj\n");
}

void Writer::endObjectWithStream(ObjId id, const QByteArray &streamContent, bool compress)
{
    assert(m_currentObj == id);

    QByteArray data = streamContent;
    bool compressed = false;
    if (compress && !streamContent.isEmpty()) {
        compressed = deflate(streamContent, &data);
        if (!compressed)
            data = streamContent;
    }

    QByteArray entries = "/Length " + toPdf(data.size()) + "\n";
    if (compressed)
        entries += "/Filter /FlateDecode\n/Length1 " + toPdf(streamContent.size()) + "\n";
    write(entries + ">>\nstream\n");
    write(data);
    write("\nendstream");
    endObj(id);
}

ObjId Writer::writeObject(const Dict &dict)
{
    ObjId id = startObj();
    write(toPdf(dict));
    endObj(id);
    return m_error ? 0 : id;
}

// The stream dictionary stays open for /Length and /Filter
ObjId Writer::writeStreamObject(const Dict &dict, const QByteArray &streamContent,
                                bool compress)
{
    ObjId id = startObj();
    write(dictEntries(dict).prepend("<<\n"));
    endObjectWithStream(id, streamContent, compress);
    return m_error ? 0 : id;
}

Writer::Checkpoint Writer::checkpoint() const
{
    Checkpoint cp;
    cp.objCounter = m_objCounter;
    cp.bytesWritten = m_bytesWritten;
    cp.xrefSize = m_xref.size();
    return cp;
}

bool Writer::rollback(const Checkpoint &cp)
{
    bool ok = true;
    if (m_usingBuffer) {
        m_buffer->truncate(static_cast<int>(cp.bytesWritten));
    } else if (m_file.isOpen()) {
        ok = m_file.flush() && m_file.resize(cp.bytesWritten) && m_file.seek(cp.bytesWritten);
        if (!ok)
            qWarning() << "Pdf::Writer: Rollback failed:" << m_file.errorString();
    }

    m_currentObj = 0;
    m_objCounter = cp.objCounter;
    m_bytesWritten = cp.bytesWritten;
    while (m_xref.size() > cp.xrefSize)
        m_xref.removeLast();
    // reserved before the checkpoint, written after it
    for (auto &offset : m_xref) {
        if (offset >= cp.bytesWritten)
            offset = 0;
    }

    if (ok)
        m_error = false;
    return ok;
}

} // namespace Pdf
