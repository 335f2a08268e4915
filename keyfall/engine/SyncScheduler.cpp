#include "keyfall/engine/SyncScheduler.h"

#include "keyfall/predict/PredictionEngine.h"
#include "keyfall/timing/TimeConverter.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QThread>

namespace keyfall::engine {

using core::Error;
using core::ErrorKind;
using core::Outcome;
using timeline::Timeline;

SyncScheduler::SyncScheduler(const EngineClock* clock, const config::EngineConfig& config, QObject* parent)
    : QObject(parent)
    , m_clock(clock)
    , m_config(config)
    , m_router(clock, config.liveInput.queueCapacity)
    , m_tracker(config.hands)
    , m_projector(config.frame)
    , m_source(std::make_unique<input::SmfTrackSource>(config.playback.assignChannelsByTrack)) {
    if (!(m_config.playback.tempoScalePercent > 0.0)) {
        qWarning().noquote() << "SyncScheduler: invalid tempo scale" << m_config.playback.tempoScalePercent << "- using 100";
        m_config.playback.tempoScalePercent = 100.0;
    }

    const auto& la = m_config.lookahead;
    const auto window = predict::PredictionEngine::calculateWindow(la.skillLevel, la.songDifficulty, la.baseSeconds);
    if (window.ok()) {
        m_lookaheadSeconds = qMin(window.value, la.maxSeconds);
    } else {
        qWarning().noquote() << "SyncScheduler:" << window.error.toString();
        m_lookaheadSeconds = predict::PredictionEngine::kBaseWindowSeconds;
    }

    m_tickTimer.setTimerType(Qt::PreciseTimer);
    m_tickTimer.setInterval(qMax(1, m_config.playback.tickIntervalMs));
    connect(&m_tickTimer, &QTimer::timeout, this, &SyncScheduler::onTick);
}

SyncScheduler::~SyncScheduler() {
    m_tickTimer.stop();
}

void SyncScheduler::setCache(std::unique_ptr<timeline::TimelineCache> cache) {
    m_cache = std::move(cache);
}

void SyncScheduler::setTrackSource(std::unique_ptr<input::TrackSource> source) {
    if (source) m_source = std::move(source);
}

void SyncScheduler::setState(PlaybackState s) {
    if (m_state == s) return;
    qInfo().noquote() << QString("SyncScheduler: %1 -> %2").arg(playbackStateName(m_state), playbackStateName(s));
    m_state = s;
    emit stateChanged(s);
}

// --- Loading ---

Error SyncScheduler::load(const QString& path) {
    QElapsedTimer t;
    t.start();
    setState(PlaybackState::Loading);

    const auto id = timeline::SourceIdentity::fromFile(path);
    if (m_cache && id.isValid()) {
        auto cached = m_cache->load(id);
        if (cached.hit) {
            qInfo().noquote() << QString("SyncScheduler: cache hit for %1 (%2 ms)").arg(id.path).arg(t.elapsed());
            return finishLoad(Outcome<Timeline>::success(std::move(cached.record.timeline)), id, true);
        }
        qInfo().noquote() << "SyncScheduler: cache miss for" << id.path << "-" << cached.reason.message;
    }

    const auto tracks = m_source->read(path);
    auto built = tracks.ok() ? Timeline::build(tracks.value) : Outcome<Timeline>::failure(tracks.error);

    if (!built.ok()) {
        if (m_cache && id.isValid()) {
            auto stale = m_cache->loadAnyAge(id);
            if (stale.hit) {
                qWarning().noquote() << "SyncScheduler: parse failed (" << built.error.toString()
                                     << ") - using older cached timeline for" << id.path;
                return finishLoad(Outcome<Timeline>::success(std::move(stale.record.timeline)), id, true);
            }
        }
        return finishLoad(std::move(built), id, false);
    }

    qInfo().noquote() << QString("SyncScheduler: built timeline for %1: %2 entries in %3 ms")
                             .arg(path)
                             .arg(built.value.size())
                             .arg(t.elapsed());
    if (m_cache && id.isValid()) {
        const Error stored = m_cache->store(id, built.value);
        if (stored.isError()) qInfo().noquote() << "SyncScheduler: continuing without a cache record";
    }
    return finishLoad(std::move(built), id, false);
}

Error SyncScheduler::loadTracks(const core::SourceTracks& tracks, const timeline::SourceIdentity& source) {
    setState(PlaybackState::Loading);
    return finishLoad(Timeline::build(tracks), source, false);
}

void SyncScheduler::startLiveOnly() {
    setState(PlaybackState::Loading);
    adoptSession(std::make_unique<Session>(Session::liveOnly()));
}

Error SyncScheduler::finishLoad(Outcome<Timeline> built, const timeline::SourceIdentity& source, bool fromCache) {
    if (!built.ok()) {
        failLoad(built.error);
        return built.error;
    }

    auto session = std::make_unique<Session>(std::move(built.value), source, fromCache);
    const Error rangeErr = session->setPracticeRange(m_config.practice.startPercent, m_config.practice.endPercent);
    if (rangeErr.isError()) {
        qWarning().noquote() << "SyncScheduler:" << rangeErr.toString() << "- playing the whole song";
    }
    qInfo().noquote() << QString("SyncScheduler: session ready: %1 entries, %2 note starts, %3 s, range [%4, %5)")
                             .arg(session->timeline().size())
                             .arg(session->timeline().noteStartCount())
                             .arg(session->timeline().durationSeconds(), 0, 'f', 2)
                             .arg(session->range().begin)
                             .arg(session->range().end);
    adoptSession(std::move(session));
    return {};
}

void SyncScheduler::adoptSession(std::unique_ptr<Session> session) {
    silenceAll();
    m_router.clear();
    m_session = std::move(session);
    m_session->rewindToRangeStart();
    m_lastError = {};
    m_stopRequested.store(false);
    anchorAt(m_clock->nowSeconds(), m_session->cursorSeconds());
    setState(PlaybackState::Playing);
    publishSnapshot({});
}

void SyncScheduler::failLoad(const Error& error) {
    m_lastError = error;
    qWarning().noquote() << "SyncScheduler: loading failed:" << error.toString();
    silenceAll();
    m_router.clear();
    setState(PlaybackState::Stopped);
    emit loadFailed(error);
    publishSnapshot({error});
}

// --- Transport ---

void SyncScheduler::play() {
    if (m_state == PlaybackState::Paused) {
        resume();
        return;
    }
    if (m_state == PlaybackState::Playing || m_state == PlaybackState::Loading) return;
    if (!m_session) {
        qWarning().noquote() << "SyncScheduler: play() without a loaded session";
        return;
    }
    silenceAll();
    m_router.clear();
    m_session->rewindToRangeStart();
    m_stopRequested.store(false);
    anchorAt(m_clock->nowSeconds(), m_session->cursorSeconds());
    setState(PlaybackState::Playing);
}

void SyncScheduler::pause() {
    if (m_state != PlaybackState::Playing) return;
    advanceCursor(m_clock->nowSeconds());
    setState(PlaybackState::Paused);
}

void SyncScheduler::resume() {
    if (m_state != PlaybackState::Paused) return;
    anchorAt(m_clock->nowSeconds(), m_session->cursorSeconds());
    setState(PlaybackState::Playing);
}

void SyncScheduler::stop() {
    m_stopRequested.store(true);
    if (QThread::currentThread() != thread()) return;
    if (m_state == PlaybackState::Playing || m_state == PlaybackState::Paused) {
        finishStop(m_clock->nowSeconds());
    } else {
        m_stopRequested.store(false);
    }
}

void SyncScheduler::finishStop(double /*nowSeconds*/, QVector<Error> tickErrors) {
    m_stopRequested.store(false);
    silenceAll();
    m_router.clear();
    setState(PlaybackState::Stopped);
    publishSnapshot(tickErrors);
}

void SyncScheduler::silenceAll() {
    const auto swept = m_tracker.allNotesOff();
    if (!swept.isEmpty()) {
        qInfo().noquote() << QString("SyncScheduler: all notes off (%1 released)").arg(swept.size());
    }
}

// --- Settings ---

Error SyncScheduler::setTempoScale(double percent) {
    if (!(percent > 0.0)) {
        return Error{ErrorKind::InvalidConfiguration, QString("tempo scale must be > 0 (got %1)").arg(percent)};
    }
    if (m_state == PlaybackState::Playing) {
        const double now = m_clock->nowSeconds();
        const double song = songSecondsAt(now);
        m_config.playback.tempoScalePercent = percent;
        anchorAt(now, song);
    } else {
        m_config.playback.tempoScalePercent = percent;
    }
    return {};
}

Error SyncScheduler::setLookahead(double skillLevel, double songDifficulty) {
    auto& la = m_config.lookahead;
    const auto window = predict::PredictionEngine::calculateWindow(skillLevel, songDifficulty, la.baseSeconds);
    if (!window.ok()) return window.error;
    la.skillLevel = skillLevel;
    la.songDifficulty = songDifficulty;
    m_lookaheadSeconds = qMin(window.value, la.maxSeconds);
    return {};
}

Error SyncScheduler::setPracticeRange(double startPercent, double endPercent) {
    const auto checked = practiceRangeFor(0, startPercent, endPercent);
    if (!checked.ok()) return checked.error;
    m_config.practice.startPercent = startPercent;
    m_config.practice.endPercent = endPercent;
    if (!m_session || m_session->isLiveOnly()) return {};

    const int before = m_session->cursorIndex();
    const Error err = m_session->setPracticeRange(startPercent, endPercent);
    if (err.isError()) return err;
    if (m_session->cursorIndex() != before) {
        silenceAll();
        m_router.clear();
        anchorAt(m_clock->nowSeconds(), m_session->cursorSeconds());
    }
    return {};
}

void SyncScheduler::setHandPolicy(const state::HandPolicy& hands) {
    m_config.hands = hands;
    m_tracker.setHandPolicy(hands);
}

// --- Tick loop ---

void SyncScheduler::startTicking() {
    m_tickTimer.start();
}

void SyncScheduler::stopTicking() {
    m_tickTimer.stop();
}

void SyncScheduler::onTick() {
    processTick(m_clock->nowSeconds());
}

void SyncScheduler::anchorAt(double nowSeconds, double songSeconds) {
    m_anchorWall = nowSeconds;
    m_anchorSong = songSeconds;
}

double SyncScheduler::songSecondsAt(double nowSeconds) const {
    const auto elapsed = timing::removeTempoScale(nowSeconds - m_anchorWall, m_config.playback.tempoScalePercent);
    return m_anchorSong + elapsed.value;
}

double SyncScheduler::wallSecondsFor(double songSeconds) const {
    const auto wall = timing::applyTempoScale(songSeconds - m_anchorSong, m_config.playback.tempoScalePercent);
    return m_anchorWall + wall.value;
}

void SyncScheduler::advanceCursor(double nowSeconds) {
    Session& s = *m_session;
    const double song = songSecondsAt(nowSeconds);
    if (s.isLiveOnly()) {
        s.setCursor(0, song);
        return;
    }

    const Timeline& tl = s.timeline();
    const int next = qMax(s.cursorIndex(), qMin(tl.indexAfterSeconds(song), s.range().end));
    for (int i = s.cursorIndex(); i < next; ++i) {
        const auto& e = tl.at(i);
        if (e.event.kind == core::EventKind::Meta) continue;
        m_router.pushFile(e.event, wallSecondsFor(e.absoluteSeconds));
    }
    s.setCursor(next, song);
}

void SyncScheduler::reportRuntime(const Error& error, QVector<Error>& tickErrors) {
    qWarning().noquote() << "SyncScheduler:" << error.toString();
    m_lastError = error;
    tickErrors.push_back(error);
    emit runtimeError(error);
}

void SyncScheduler::processTick(double nowSeconds) {
    const bool running = m_state == PlaybackState::Playing || m_state == PlaybackState::Paused;
    if (m_stopRequested.load()) {
        if (running) {
            finishStop(nowSeconds);
            return;
        }
        m_stopRequested.store(false);
    }
    if (!running || !m_session) return;

    QVector<Error> tickErrors;
    if (m_state == PlaybackState::Playing) advanceCursor(nowSeconds);

    const auto report = m_router.drainInto(m_tracker);
    for (const auto& e : report.errors) reportRuntime(e, tickErrors);

    if (report.deviceDisconnected && m_session->isLiveOnly()) {
        qWarning().noquote() << "SyncScheduler: live device lost with no timeline to follow, stopping";
        finishStop(nowSeconds, tickErrors);
        return;
    }

    if (m_state == PlaybackState::Playing && m_session->atRangeEnd()) {
        if (m_config.practice.loop && !m_session->range().isEmpty()) {
            silenceAll();
            m_session->rewindToRangeStart();
            anchorAt(nowSeconds, m_session->cursorSeconds());
            qInfo().noquote() << "SyncScheduler: loop back to" << m_session->cursorSeconds() << "s";
        } else {
            finishStop(nowSeconds, tickErrors);
            return;
        }
    }

    publishSnapshot(tickErrors);
}

void SyncScheduler::publishSnapshot(const QVector<Error>& tickErrors) {
    Snapshot snap;
    snap.state = m_state;
    snap.tempoScalePercent = m_config.playback.tempoScalePercent;
    snap.lookaheadSeconds = m_lookaheadSeconds;
    snap.hands = m_tracker.handPolicy();
    snap.tickErrors = tickErrors;

    const auto notes = m_tracker.snapshot();
    for (const auto& k : notes->activeSet()) {
        const auto st = notes->state(k.channel, k.note);
        snap.activeNotes.push_back(ActiveNote{k.channel, k.note, st.onVelocity, st.hand});
    }

    const bool running = m_state == PlaybackState::Playing || m_state == PlaybackState::Paused;
    if (m_session) {
        snap.cursorSeconds = m_session->cursorSeconds();
        snap.cursorIndex = m_session->cursorIndex();
    }
    if (m_session && running) {
        const Timeline& tl = m_session->timeline();
        const auto& practice = m_config.practice;
        if (practice.showFutureNotes && !m_session->isLiveOnly() && !m_session->atRangeEnd()) {
            predict::PredictionRequest req;
            req.cursorIndex = snap.cursorIndex;
            req.cursorSeconds = snap.cursorSeconds;
            req.lookaheadWindowSeconds = m_lookaheadSeconds;
            req.tempoScalePercent = snap.tempoScalePercent;
            req.epsilonSeconds = m_config.lookahead.epsilonSeconds;
            req.maxScanEntries = qMin(m_config.lookahead.maxScanEntries, m_session->range().end - snap.cursorIndex);
            req.hands = practice.hands;
            req.handPolicy = snap.hands;
            snap.predictionBatch = predict::PredictionEngine::predict(req, tl, *notes);
        }
        snap.frame = m_projector.buildFrame(tl, snap.cursorIndex, snap.cursorSeconds, m_lookaheadSeconds,
                                            snap.tempoScalePercent, snap.hands, m_session->range().end,
                                            practice.hands);
    } else {
        snap.frame.keyboard = m_projector.keyboard();
    }

    const quint64 seq = m_channel.publish(std::move(snap));
    emit snapshotPublished(seq);
}

} // namespace keyfall::engine
