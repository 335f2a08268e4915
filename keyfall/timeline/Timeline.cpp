#include "keyfall/timeline/Timeline.h"

#include "keyfall/timing/TimeConverter.h"

#include <QDebug>
#include <algorithm>

namespace keyfall::timeline {

using core::ErrorKind;
using core::EventKind;
using core::Outcome;
using core::RawEvent;

namespace {

struct PendingEntry {
    qint64 tick = 0;
    int rank = 0; // 0 = release / control / meta, 1 = note start
    int track = 0;
    int seq = 0;
    RawEvent event;
};

static RawEvent normalized(const RawEvent& ev) {
    if (ev.kind != EventKind::NoteOff) return ev;
    RawEvent out = ev;
    out.kind = EventKind::NoteOn;
    out.velocity = 0;
    return out;
}

static bool pendingLess(const PendingEntry& a, const PendingEntry& b) {
    if (a.tick != b.tick) return a.tick < b.tick;
    if (a.rank != b.rank) return a.rank < b.rank;
    if (a.track != b.track) return a.track < b.track;
    return a.seq < b.seq;
}

} // namespace

bool operator==(const TimelineEntry& a, const TimelineEntry& b) {
    return a.absoluteTick == b.absoluteTick && a.trackOrder == b.trackOrder && a.event == b.event
        && qAbs(a.absoluteSeconds - b.absoluteSeconds) < 1e-9;
}

Outcome<Timeline> Timeline::build(const QVector<QVector<RawEvent>>& tracks, int resolution, quint32 initialMicrosPerBeat) {
    if (resolution <= 0) {
        return Outcome<Timeline>::failure(ErrorKind::MalformedTimeline,
                                          QString("resolution must be > 0 (got %1)").arg(resolution));
    }

    QVector<PendingEntry> pending;
    int total = 0;
    for (const auto& t : tracks) total += t.size();
    pending.reserve(total);

    // (a) normalize, (b) relative deltas -> absolute ticks
    for (int k = 0; k < tracks.size(); ++k) {
        qint64 tick = 0;
        const auto& track = tracks[k];
        for (int i = 0; i < track.size(); ++i) {
            const RawEvent& ev = track[i];
            if (ev.tickDelta < 0) {
                return Outcome<Timeline>::failure(
                    ErrorKind::MalformedTimeline,
                    QString("track %1 event %2 has negative tick delta %3").arg(k).arg(i).arg(ev.tickDelta));
            }
            tick += ev.tickDelta;

            PendingEntry p;
            p.tick = tick;
            p.event = normalized(ev);
            p.rank = p.event.isNoteStart() ? 1 : 0;
            p.track = k;
            p.seq = i;
            pending.push_back(p);
        }
    }

    // (c) merge
    std::sort(pending.begin(), pending.end(), pendingLess);

    // (d) seconds, with tempo changes applied as they are passed
    Timeline out;
    out.m_tempo = timing::TempoMap(resolution, initialMicrosPerBeat);
    out.m_entries.reserve(pending.size());
    for (const auto& p : pending) {
        const auto sec = timing::ticksToSeconds(p.tick, out.m_tempo);
        if (!sec.ok()) return Outcome<Timeline>::failure(sec.error);

        TimelineEntry e;
        e.absoluteTick = p.tick;
        e.absoluteSeconds = sec.value;
        e.event = p.event;
        e.trackOrder = p.track;
        out.m_entries.push_back(e);

        if (p.event.isTempo() && !out.m_tempo.appendChange(p.tick, p.event.microsPerBeat)) {
            qWarning().noquote() << QString("Timeline: ignoring invalid tempo %1 at tick %2")
                                        .arg(p.event.microsPerBeat)
                                        .arg(p.tick);
        }
    }
    return Outcome<Timeline>::success(std::move(out));
}

Outcome<Timeline> Timeline::build(const core::SourceTracks& source) {
    return build(source.tracks, source.resolution, source.initialMicrosPerBeat);
}

Outcome<Timeline> Timeline::fromEntries(QVector<TimelineEntry> entries, timing::TempoMap tempo) {
    if (tempo.resolution() <= 0) {
        return Outcome<Timeline>::failure(ErrorKind::MalformedTimeline, "stored resolution must be > 0");
    }
    for (int i = 1; i < entries.size(); ++i) {
        if (entries[i].absoluteTick < entries[i - 1].absoluteTick
            || entries[i].absoluteSeconds < entries[i - 1].absoluteSeconds) {
            return Outcome<Timeline>::failure(ErrorKind::MalformedTimeline,
                                              QString("stored entries out of order at index %1").arg(i));
        }
    }
    Timeline out;
    out.m_entries = std::move(entries);
    out.m_tempo = std::move(tempo);
    return Outcome<Timeline>::success(std::move(out));
}

int Timeline::noteStartCount() const {
    return int(std::count_if(m_entries.begin(), m_entries.end(),
                             [](const TimelineEntry& e) { return e.event.isNoteStart(); }));
}

int Timeline::indexAfterSeconds(double seconds) const {
    const auto it = std::upper_bound(m_entries.begin(), m_entries.end(), seconds,
                                     [](double s, const TimelineEntry& e) { return s < e.absoluteSeconds; });
    return int(it - m_entries.begin());
}

} // namespace keyfall::timeline
