#include "keyfall/input/SmfReader.h"

#include <QDebug>
#include <QFile>

namespace keyfall::input {

using core::ErrorKind;
using core::Outcome;
using core::RawEvent;
using core::SourceTracks;

namespace {

static constexpr int kFallbackResolution = 480;

// Bounds-checked big-endian reader over a byte range. Every read reports
// success; after the first failure the cursor stays failed.
class ByteCursor {
public:
    ByteCursor(const QByteArray& data, int begin, int end)
        : m_data(data), m_pos(begin), m_end(end) {}

    bool atEnd() const { return m_pos >= m_end; }
    int pos() const { return m_pos; }
    bool failed() const { return m_failed; }

    bool u8(quint8& out) {
        if (m_failed || m_pos >= m_end) return fail();
        out = quint8(m_data.at(m_pos++));
        return true;
    }
    bool be16(quint16& out) {
        quint8 a = 0, b = 0;
        if (!u8(a) || !u8(b)) return false;
        out = quint16(a << 8 | b);
        return true;
    }
    bool be32(quint32& out) {
        quint16 a = 0, b = 0;
        if (!be16(a) || !be16(b)) return false;
        out = quint32(a) << 16 | b;
        return true;
    }
    // Variable-length quantity, at most 4 bytes.
    bool vlq(quint32& out) {
        out = 0;
        for (int i = 0; i < 4; ++i) {
            quint8 c = 0;
            if (!u8(c)) return false;
            out = (out << 7) | (c & 0x7F);
            if ((c & 0x80) == 0) return true;
        }
        return fail();
    }
    bool skip(quint32 n) {
        if (m_failed || qint64(m_pos) + qint64(n) > qint64(m_end)) return fail();
        m_pos += int(n);
        return true;
    }

private:
    bool fail() {
        m_failed = true;
        return false;
    }

    const QByteArray& m_data;
    int m_pos = 0;
    int m_end = 0;
    bool m_failed = false;
};

static Outcome<QVector<RawEvent>> malformed(const QString& msg) {
    return Outcome<QVector<RawEvent>>::failure(ErrorKind::MalformedTimeline, msg);
}

static Outcome<QVector<RawEvent>> readTrack(ByteCursor& tr, int trackIndex) {
    QVector<RawEvent> events;
    qint64 pendingDelta = 0; // deltas of skipped events carry over to the next kept one
    quint8 running = 0;

    auto keep = [&](RawEvent ev) {
        ev.tickDelta = pendingDelta;
        ev.sourceTrack = trackIndex;
        pendingDelta = 0;
        events.push_back(ev);
    };

    while (!tr.atEnd()) {
        quint32 delta = 0;
        quint8 first = 0;
        if (!tr.vlq(delta) || !tr.u8(first)) return malformed(QString("track %1: truncated event").arg(trackIndex));
        pendingDelta += delta;

        quint8 status = first;
        bool haveData1 = false;
        quint8 data1 = 0;
        if (first & 0x80) {
            if (first < 0xF0) running = first;
        } else {
            if (running == 0) return malformed(QString("track %1: running status before any status").arg(trackIndex));
            status = running;
            haveData1 = true;
            data1 = first;
        }

        const quint8 type = status & 0xF0;
        const int ch = status & 0x0F;

        if (type == 0x80 || type == 0x90 || type == 0xA0 || type == 0xB0 || type == 0xE0) {
            quint8 d2 = 0;
            if (!haveData1 && !tr.u8(data1)) return malformed(QString("track %1: truncated channel message").arg(trackIndex));
            if (!tr.u8(d2)) return malformed(QString("track %1: truncated channel message").arg(trackIndex));
            data1 &= 0x7F;
            d2 &= 0x7F;
            if (type == 0x90) {
                keep(RawEvent::noteOn(ch, data1, d2));
            } else if (type == 0x80) {
                keep(RawEvent::noteOff(ch, data1));
            } else if (type == 0xB0) {
                keep(RawEvent::controlChange(ch, data1, d2));
            }
            continue;
        }

        if (type == 0xC0 || type == 0xD0) {
            if (!haveData1 && !tr.u8(data1)) return malformed(QString("track %1: truncated channel message").arg(trackIndex));
            continue;
        }

        if (status == 0xFF) {
            quint8 metaType = 0;
            quint32 len = 0;
            if (!tr.u8(metaType) || !tr.vlq(len)) return malformed(QString("track %1: truncated meta event").arg(trackIndex));
            if (metaType == 0x2F) {
                RawEvent eot;
                eot.kind = core::EventKind::Meta;
                eot.metaType = core::MetaType::EndOfTrack;
                keep(eot);
                if (!tr.skip(len)) return malformed(QString("track %1: truncated end of track").arg(trackIndex));
                break;
            }
            if (metaType == 0x51 && len == 3) {
                quint8 a = 0, b = 0, c = 0;
                if (!tr.u8(a) || !tr.u8(b) || !tr.u8(c)) return malformed(QString("track %1: truncated tempo").arg(trackIndex));
                const quint32 us = quint32(a) << 16 | quint32(b) << 8 | c;
                if (us == 0) {
                    qWarning().noquote() << QString("SmfReader: track %1: ignoring zero tempo").arg(trackIndex);
                    continue;
                }
                keep(RawEvent::tempo(us));
                continue;
            }
            if (!tr.skip(len)) return malformed(QString("track %1: meta payload out of range").arg(trackIndex));
            continue;
        }

        if (status == 0xF0 || status == 0xF7) {
            quint32 len = 0;
            if (!tr.vlq(len) || !tr.skip(len)) return malformed(QString("track %1: truncated sysex").arg(trackIndex));
            continue;
        }

        return malformed(QString("track %1: unsupported status byte 0x%2").arg(trackIndex).arg(int(status), 2, 16, QLatin1Char('0')));
    }
    return Outcome<QVector<RawEvent>>::success(std::move(events));
}

} // namespace

Outcome<SourceTracks> readSmf(const QByteArray& bytes) {
    ByteCursor r(bytes, 0, bytes.size());
    quint32 id = 0, len = 0;
    quint16 format = 0, nTracks = 0, division = 0;
    if (!r.be32(id) || id != 0x4D546864) {
        return Outcome<SourceTracks>::failure(ErrorKind::MalformedTimeline, "not a MIDI file (missing MThd)");
    }
    if (!r.be32(len) || len < 6 || !r.be16(format) || !r.be16(nTracks) || !r.be16(division) || !r.skip(len - 6)) {
        return Outcome<SourceTracks>::failure(ErrorKind::MalformedTimeline, "truncated header chunk");
    }
    if (format > 1) {
        return Outcome<SourceTracks>::failure(ErrorKind::MalformedTimeline,
                                              QString("SMF format %1 is not supported").arg(format));
    }

    SourceTracks out;
    if (division & 0x8000) {
        qWarning().noquote() << "SmfReader: SMPTE division, assuming" << kFallbackResolution << "ticks per beat";
        out.resolution = kFallbackResolution;
    } else {
        out.resolution = int(division & 0x7FFF);
        if (out.resolution == 0) {
            return Outcome<SourceTracks>::failure(ErrorKind::MalformedTimeline, "resolution must be > 0");
        }
    }

    // Non-MTrk chunks are skipped; MTrk chunks are read in file order.
    while (!r.atEnd() && out.tracks.size() < int(nTracks)) {
        quint32 chunkId = 0, chunkLen = 0;
        if (!r.be32(chunkId) || !r.be32(chunkLen)) {
            return Outcome<SourceTracks>::failure(ErrorKind::MalformedTimeline, "truncated chunk header");
        }
        const int start = r.pos();
        if (!r.skip(chunkLen)) {
            return Outcome<SourceTracks>::failure(ErrorKind::MalformedTimeline, "chunk extends past end of file");
        }
        if (chunkId != 0x4D54726B) continue;

        ByteCursor tr(bytes, start, start + int(chunkLen));
        auto track = readTrack(tr, out.tracks.size());
        if (!track.ok()) return Outcome<SourceTracks>::failure(track.error);
        out.tracks.push_back(std::move(track.value));
    }

    if (out.tracks.size() != int(nTracks)) {
        qWarning().noquote() << QString("SmfReader: header announces %1 tracks, found %2").arg(nTracks).arg(out.tracks.size());
    }
    return Outcome<SourceTracks>::success(std::move(out));
}

Outcome<SourceTracks> readSmfFile(const QString& path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        return Outcome<SourceTracks>::failure(ErrorKind::MalformedTimeline,
                                              QString("cannot open %1: %2").arg(path, f.errorString()));
    }
    return readSmf(f.readAll());
}

void assignChannelsByTrack(SourceTracks& source) {
    const int offset = source.tracks.size() == 2 ? 1 : 0;
    for (int k = 0; k < source.tracks.size(); ++k) {
        const int channel = (k + offset) % core::kChannelCount;
        for (RawEvent& ev : source.tracks[k]) {
            if (ev.isNote()) ev.channel = channel;
        }
    }
}

} // namespace keyfall::input
