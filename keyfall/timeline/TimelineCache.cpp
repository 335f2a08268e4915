#include "keyfall/timeline/TimelineCache.h"

#include "keyfall/util/StableHash.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

namespace keyfall::timeline {

using core::Error;
using core::ErrorKind;
using core::EventKind;
using core::MetaType;
using core::Outcome;
using core::RawEvent;

namespace {

// Entry array layout: [tick, seconds, kind, channel, note, velocity, controller,
// controlValue, metaType, microsPerBeat, tickDelta, sourceTrack, trackOrder]
static constexpr int kEntryFields = 13;

static QJsonArray entryToJson(const TimelineEntry& e) {
    const RawEvent& ev = e.event;
    return QJsonArray{qint64(e.absoluteTick), e.absoluteSeconds, int(ev.kind), ev.channel, ev.note, ev.velocity,
                      ev.controller, ev.controlValue, int(ev.metaType), qint64(ev.microsPerBeat), qint64(ev.tickDelta),
                      ev.sourceTrack, e.trackOrder};
}

static bool entryFromJson(const QJsonArray& a, TimelineEntry& out) {
    if (a.size() != kEntryFields) return false;
    const int kind = a[2].toInt(-1);
    const int meta = a[8].toInt(-1);
    if (kind < int(EventKind::NoteOn) || kind > int(EventKind::Meta)) return false;
    if (meta < int(MetaType::None) || meta > int(MetaType::EndOfTrack)) return false;

    out.absoluteTick = qint64(a[0].toDouble());
    out.absoluteSeconds = a[1].toDouble();
    out.event.kind = EventKind(kind);
    out.event.channel = a[3].toInt();
    out.event.note = a[4].toInt();
    out.event.velocity = a[5].toInt();
    out.event.controller = a[6].toInt();
    out.event.controlValue = a[7].toInt();
    out.event.metaType = MetaType(meta);
    out.event.microsPerBeat = quint32(a[9].toDouble());
    out.event.tickDelta = qint64(a[10].toDouble());
    out.event.sourceTrack = a[11].toInt();
    out.trackOrder = a[12].toInt();
    return true;
}

static CacheLookup miss(ErrorKind kind, const QString& message) {
    CacheLookup l;
    l.reason = Error{kind, message};
    return l;
}

} // namespace

SourceIdentity SourceIdentity::fromFile(const QString& path) {
    const QFileInfo fi(path);
    SourceIdentity id;
    id.path = fi.absoluteFilePath();
    id.modifiedMs = fi.exists() ? fi.lastModified().toMSecsSinceEpoch() : 0;
    return id;
}

TimelineCache::TimelineCache(const QString& directory)
    : m_dir(directory) {}

QString TimelineCache::pathFor(const SourceIdentity& source) const {
    const QString base = QFileInfo(source.path).completeBaseName();
    return QDir(m_dir).filePath(QString("%1-%2.timeline.json").arg(base, util::StableHash::hexKey(source.path)));
}

QByteArray TimelineCache::serialize(const CacheRecord& record) {
    QJsonArray tempo;
    for (const auto& seg : record.timeline.tempoMap().segments()) {
        tempo.append(QJsonArray{qint64(seg.startTick), qint64(seg.microsPerBeat)});
    }
    QJsonArray entries;
    for (const auto& e : record.timeline.entries()) entries.append(entryToJson(e));

    QJsonObject o;
    o.insert("formatVersion", record.formatVersion);
    o.insert("sourcePath", record.source.path);
    o.insert("sourceModifiedMs", record.source.modifiedMs);
    o.insert("resolution", record.timeline.resolution());
    o.insert("tempoMap", tempo);
    o.insert("entries", entries);
    return QJsonDocument(o).toJson(QJsonDocument::Compact);
}

Outcome<CacheRecord> TimelineCache::deserialize(const QByteArray& bytes) {
    QJsonParseError err{};
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return Outcome<CacheRecord>::failure(ErrorKind::CacheCorrupt, err.errorString());
    }
    const QJsonObject o = doc.object();

    CacheRecord rec;
    rec.formatVersion = o.value("formatVersion").toInt(-1);
    rec.source.path = o.value("sourcePath").toString();
    rec.source.modifiedMs = qint64(o.value("sourceModifiedMs").toDouble());
    if (rec.formatVersion != kFormatVersion) {
        // Layout of the rest is unknown; report what we know and stop.
        return Outcome<CacheRecord>::success(rec);
    }

    const QJsonArray tempoArr = o.value("tempoMap").toArray();
    if (tempoArr.isEmpty()) return Outcome<CacheRecord>::failure(ErrorKind::CacheCorrupt, "empty tempo map");
    const QJsonArray first = tempoArr.first().toArray();
    timing::TempoMap tempo(o.value("resolution").toInt(0), quint32(first.at(1).toDouble()));
    for (int i = 1; i < tempoArr.size(); ++i) {
        const QJsonArray seg = tempoArr[i].toArray();
        if (seg.size() != 2 || !tempo.appendChange(qint64(seg[0].toDouble()), quint32(seg[1].toDouble()))) {
            return Outcome<CacheRecord>::failure(ErrorKind::CacheCorrupt, QString("bad tempo segment %1").arg(i));
        }
    }

    const QJsonArray entryArr = o.value("entries").toArray();
    QVector<TimelineEntry> entries;
    entries.reserve(entryArr.size());
    for (int i = 0; i < entryArr.size(); ++i) {
        TimelineEntry e;
        if (!entryFromJson(entryArr[i].toArray(), e)) {
            return Outcome<CacheRecord>::failure(ErrorKind::CacheCorrupt, QString("bad entry %1").arg(i));
        }
        entries.push_back(e);
    }

    auto tl = Timeline::fromEntries(std::move(entries), std::move(tempo));
    if (!tl.ok()) return Outcome<CacheRecord>::failure(ErrorKind::CacheCorrupt, tl.error.message);
    rec.timeline = std::move(tl.value);
    return Outcome<CacheRecord>::success(std::move(rec));
}

CacheLookup TimelineCache::load(const SourceIdentity& source) const {
    return read(source, true);
}

CacheLookup TimelineCache::loadAnyAge(const SourceIdentity& source) const {
    return read(source, false);
}

CacheLookup TimelineCache::read(const SourceIdentity& source, bool requireFresh) const {
    if (m_dir.isEmpty() || source.path.isEmpty()) return miss(ErrorKind::CacheMiss, "cache disabled");

    QFile f(pathFor(source));
    if (!f.exists()) return miss(ErrorKind::CacheMiss, "no record");
    if (!f.open(QIODevice::ReadOnly)) return miss(ErrorKind::CacheCorrupt, f.errorString());

    auto rec = deserialize(f.readAll());
    if (!rec.ok()) {
        qWarning().noquote() << "TimelineCache: discarding unreadable record" << f.fileName() << "-" << rec.error.message;
        return miss(ErrorKind::CacheCorrupt, rec.error.message);
    }
    if (rec.value.formatVersion != kFormatVersion) {
        return miss(ErrorKind::CacheMiss, QString("format version %1 != %2").arg(rec.value.formatVersion).arg(kFormatVersion));
    }
    if (rec.value.source.path != source.path) return miss(ErrorKind::CacheMiss, "record belongs to another source");
    if (requireFresh && rec.value.source.modifiedMs < source.modifiedMs) {
        return miss(ErrorKind::CacheMiss, "source modified after record was written");
    }

    CacheLookup hit;
    hit.hit = true;
    hit.record = std::move(rec.value);
    return hit;
}

Error TimelineCache::store(const SourceIdentity& source, const Timeline& timeline) const {
    if (m_dir.isEmpty()) return {};
    if (!QDir().mkpath(m_dir)) {
        qWarning().noquote() << "TimelineCache: could not create cache directory" << m_dir;
        return Error{ErrorKind::CacheCorrupt, QString("cannot create %1").arg(m_dir)};
    }

    CacheRecord rec;
    rec.source = source;
    rec.formatVersion = kFormatVersion;
    rec.timeline = timeline;

    QSaveFile f(pathFor(source));
    if (!f.open(QIODevice::WriteOnly)) {
        qWarning().noquote() << "TimelineCache: could not open" << f.fileName() << "-" << f.errorString();
        return Error{ErrorKind::CacheCorrupt, f.errorString()};
    }
    f.write(serialize(rec));
    if (!f.commit()) {
        qWarning().noquote() << "TimelineCache: could not write" << f.fileName() << "-" << f.errorString();
        return Error{ErrorKind::CacheCorrupt, f.errorString()};
    }
    qInfo().noquote() << QString("TimelineCache: stored %1 entries for %2").arg(timeline.size()).arg(source.path);
    return {};
}

} // namespace keyfall::timeline
