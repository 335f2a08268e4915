#pragma once

#include <QByteArray>
#include <QString>
#include <QtGlobal>

#include "keyfall/core/Errors.h"
#include "keyfall/timeline/Timeline.h"

namespace keyfall::timeline {

struct SourceIdentity {
    QString path;          // absolute
    qint64 modifiedMs = 0; // ms since epoch, UTC

    bool isValid() const { return !path.isEmpty() && modifiedMs > 0; }
    static SourceIdentity fromFile(const QString& path);
};

struct CacheRecord {
    SourceIdentity source;
    int formatVersion = 0;
    Timeline timeline; // carries the tempo map
};

struct CacheLookup {
    bool hit = false;
    core::Error reason; // CacheMiss or CacheCorrupt when !hit
    CacheRecord record;
};

// Processed timelines on disk, one JSON file per source, keyed by path hash.
// Lookups never fail loudly: stale, missing, foreign-version or unreadable records
// are all misses and the caller falls through to a fresh build.
class TimelineCache {
public:
    // Bump on any change to the serialized layout; older records become misses.
    static constexpr int kFormatVersion = 1;

    explicit TimelineCache(const QString& directory);

    const QString& directory() const { return m_dir; }
    QString pathFor(const SourceIdentity& source) const;

    // Hit only if the stored modification time is >= the source's current one and the
    // format version matches.
    CacheLookup load(const SourceIdentity& source) const;

    // Ignores freshness (version must still match). Used as the fallback when a fresh
    // build of a changed source fails.
    CacheLookup loadAnyAge(const SourceIdentity& source) const;

    // Best effort. Failures are logged and returned, never fatal.
    core::Error store(const SourceIdentity& source, const Timeline& timeline) const;

    static QByteArray serialize(const CacheRecord& record);
    static core::Outcome<CacheRecord> deserialize(const QByteArray& bytes);

private:
    CacheLookup read(const SourceIdentity& source, bool requireFresh) const;

    QString m_dir;
};

} // namespace keyfall::timeline
