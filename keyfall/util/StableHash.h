#pragma once

#include <QByteArray>
#include <QString>
#include <QtGlobal>

namespace keyfall::util {

// Hashes that name files on disk. Must give the same value in every process and on
// every Qt version, which rules out qHash().
struct StableHash final {
    static constexpr quint32 kOffsetBasis = 2166136261u;
    static constexpr quint32 kPrime = 16777619u;

    static quint32 fnv1a32(const QByteArray& bytes) {
        quint32 h = kOffsetBasis;
        for (int i = 0; i < bytes.size(); ++i) {
            h = (h ^ quint32(quint8(bytes.at(i)))) * kPrime;
        }
        return h;
    }

    // Cache file name suffix: 8 lowercase hex digits of the UTF-8 path hash.
    static QString hexKey(const QString& text) {
        return QString("%1").arg(fnv1a32(text.toUtf8()), 8, 16, QLatin1Char('0'));
    }
};

} // namespace keyfall::util
