#pragma once

#include <QObject>
#include <QString>
#include <QTimer>
#include <atomic>
#include <memory>

#include "keyfall/config/EngineConfig.h"
#include "keyfall/core/Errors.h"
#include "keyfall/engine/EngineClock.h"
#include "keyfall/engine/Session.h"
#include "keyfall/engine/SnapshotChannel.h"
#include "keyfall/frame/FrameProjector.h"
#include "keyfall/input/EventQueueRouter.h"
#include "keyfall/input/TrackSource.h"
#include "keyfall/state/NoteStateTracker.h"
#include "keyfall/timeline/TimelineCache.h"

namespace keyfall::engine {

// Drives playback: Idle -> Loading -> Playing <-> Paused -> Stopped.
//
// Each tick reads the engine clock once, derives the song cursor from an anchor
// (anchorSong + (now - anchorWall) * scale / 100, re-anchored on tempo change, pause
// and resume), hands the newly reached timeline entries to the router stamped in
// wall time, drains the router into the note tracker, predicts the next group,
// projects the frame and publishes one immutable Snapshot.
//
// Lives on one thread (the one that owns its QTimer). The only calls that may come
// from elsewhere are stop() and the router's live producers.
class SyncScheduler : public QObject {
    Q_OBJECT

public:
    SyncScheduler(const EngineClock* clock, const config::EngineConfig& config, QObject* parent = nullptr);
    ~SyncScheduler() override;

    // Cache is optional; without one every Loading parses.
    void setCache(std::unique_ptr<timeline::TimelineCache> cache);
    void setTrackSource(std::unique_ptr<input::TrackSource> source);

    // Loading. On success the new session replaces the old one and playback starts
    // from the practice range start. On failure the state becomes Stopped, the error
    // is returned and reported through loadFailed(), and the previous session is kept.
    core::Error load(const QString& path);
    core::Error loadTracks(const core::SourceTracks& tracks, const timeline::SourceIdentity& source = {});
    void startLiveOnly();

    void play();   // Stopped/Idle with a session: restart from the range start. Paused: resume.
    void pause();
    void resume();
    // Thread-safe. Observed by the tick loop within one tick when called from another
    // thread; handled immediately on the scheduler thread.
    void stop();

    // Runtime settings. Rejected values return InvalidConfiguration and keep the
    // previous value.
    core::Error setTempoScale(double percent);
    core::Error setLookahead(double skillLevel, double songDifficulty);
    core::Error setPracticeRange(double startPercent, double endPercent);
    void setLoop(bool loop) { m_config.practice.loop = loop; }
    void setPracticeHands(state::HandSelection hands) { m_config.practice.hands = hands; }
    void setShowFutureNotes(bool show) { m_config.practice.showFutureNotes = show; }
    void setHandPolicy(const state::HandPolicy& hands);

    // Starts/stops the periodic tick on this object's thread.
    void startTicking();
    void stopTicking();
    bool isTicking() const { return m_tickTimer.isActive(); }

    // One tick at the given engine-clock time. The timer calls this with the clock
    // reading; tests drive it directly.
    void processTick(double nowSeconds);

    PlaybackState state() const { return m_state; }
    double tempoScale() const { return m_config.playback.tempoScalePercent; }
    double lookaheadSeconds() const { return m_lookaheadSeconds; }
    const core::Error& lastError() const { return m_lastError; }
    const Session* session() const { return m_session.get(); }

    input::EventQueueRouter& router() { return m_router; }
    const state::NoteStateTracker& tracker() const { return m_tracker; }
    const frame::FrameProjector& projector() const { return m_projector; }
    const SnapshotChannel& channel() const { return m_channel; }

signals:
    void stateChanged(keyfall::engine::PlaybackState state);
    void snapshotPublished(quint64 sequence);
    void runtimeError(const keyfall::core::Error& error);
    void loadFailed(const keyfall::core::Error& error);

private slots:
    void onTick();

private:
    core::Error finishLoad(core::Outcome<timeline::Timeline> built, const timeline::SourceIdentity& source, bool fromCache);
    void adoptSession(std::unique_ptr<Session> session);
    void failLoad(const core::Error& error);
    void setState(PlaybackState s);

    void anchorAt(double nowSeconds, double songSeconds);
    double songSecondsAt(double nowSeconds) const;
    double wallSecondsFor(double songSeconds) const;

    void advanceCursor(double nowSeconds);
    void finishStop(double nowSeconds, QVector<core::Error> tickErrors = {});
    void silenceAll();
    void reportRuntime(const core::Error& error, QVector<core::Error>& tickErrors);
    void publishSnapshot(const QVector<core::Error>& tickErrors);

    const EngineClock* m_clock = nullptr; // not owned, shared with the router
    config::EngineConfig m_config;

    input::EventQueueRouter m_router;
    state::NoteStateTracker m_tracker;
    frame::FrameProjector m_projector;
    SnapshotChannel m_channel;

    std::unique_ptr<timeline::TimelineCache> m_cache;
    std::unique_ptr<input::TrackSource> m_source;
    std::unique_ptr<Session> m_session;

    PlaybackState m_state = PlaybackState::Idle;
    core::Error m_lastError;
    double m_lookaheadSeconds = 2.0;

    // Cursor anchor: song time anchorSong was current at engine time anchorWall.
    double m_anchorWall = 0.0;
    double m_anchorSong = 0.0;

    std::atomic<bool> m_stopRequested{false};
    QTimer m_tickTimer;
};

} // namespace keyfall::engine
