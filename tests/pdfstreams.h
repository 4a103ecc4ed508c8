/*
 * pdfstreams.h — Stream extraction from serialized PDF output
 *
 * Lets tests inspect the stream payloads the writer and the embedder
 * produced, inflating FlateDecode streams with zlib.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FONTEMBED_PDFSTREAMS_H
#define FONTEMBED_PDFSTREAMS_H

#include <QByteArray>
#include <QList>

struct StreamPayload {
    QByteArray data;          // bytes between "stream\n" and "\nendstream"
    bool flate = false;
    int decodedLength = -1;   // /Length1, -1 when absent
};

// Every stream in document order
QList<StreamPayload> streamPayloads(const QByteArray &pdf);

// Empty on zlib failure
QByteArray inflate(const StreamPayload &stream);

#endif // FONTEMBED_PDFSTREAMS_H
