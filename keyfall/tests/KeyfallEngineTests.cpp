#include "keyfall/engine/BroadcastPump.h"
#include "keyfall/engine/EngineClock.h"
#include "keyfall/engine/Session.h"
#include "keyfall/engine/SyncScheduler.h"
#include "keyfall/timeline/TimelineCache.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QEventLoop>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include <QTimer>
#include <QtGlobal>
#include <cmath>
#include <functional>
#include <thread>

using keyfall::config::EngineConfig;
using keyfall::core::ErrorKind;
using keyfall::core::RawEvent;
using keyfall::core::SourceTracks;
using keyfall::engine::ManualEngineClock;
using keyfall::engine::PlaybackState;
using keyfall::engine::SyncScheduler;

namespace {

static int g_failures = 0;

static void expect(bool cond, const QString& msg) {
    if (!cond) {
        ++g_failures;
        qWarning().noquote() << "FAIL:" << msg;
    }
}

static void expectEq(int a, int b, const QString& msg) {
    expect(a == b, msg + QString(" (got %1 expected %2)").arg(a).arg(b));
}

static void expectNear(double a, double b, const QString& msg, double tol = 1e-9) {
    expect(std::abs(a - b) <= tol, msg + QString(" (got %1 expected %2)").arg(a, 0, 'g', 12).arg(b, 0, 'g', 12));
}

// 120 BPM, 480 tpq (960 ticks per second).
//   right hand (ch1): 60 from 0 to 1 s, 62 from 1 to 2 s
//   left hand  (ch2): 48 from 0 to 2 s
// Timeline: [on60, on48, off60, on62, off62, off48]
static SourceTracks twoHandSong() {
    SourceTracks s;
    s.resolution = 480;
    s.tracks.push_back({RawEvent::noteOn(1, 60, 80, 0), RawEvent::noteOff(1, 60, 960), RawEvent::noteOn(1, 62, 80, 0),
                        RawEvent::noteOff(1, 62, 960)});
    s.tracks.push_back({RawEvent::noteOn(2, 48, 70, 0), RawEvent::noteOff(2, 48, 1920)});
    return s;
}

static QByteArray twoHandSmf() {
    return QByteArray::fromHex("4d546864" "00000006" "0000" "0001" "01e0"
                               "4d54726b" "0000000d" "00913c50" "8740913c" "00" "00ff2f00");
}

struct StateLog {
    QVector<PlaybackState> states;
    QVector<keyfall::core::Error> runtime;
    QVector<keyfall::core::Error> loadFailures;

    void attach(SyncScheduler& s) {
        QObject::connect(&s, &SyncScheduler::stateChanged, [this](PlaybackState st) { states.push_back(st); });
        QObject::connect(&s, &SyncScheduler::runtimeError, [this](const keyfall::core::Error& e) { runtime.push_back(e); });
        QObject::connect(&s, &SyncScheduler::loadFailed, [this](const keyfall::core::Error& e) { loadFailures.push_back(e); });
    }
};

} // namespace

static void testPlaybackLifecycle() {
    ManualEngineClock clock;
    SyncScheduler sched(&clock, EngineConfig());
    StateLog log;
    log.attach(sched);
    expect(sched.state() == PlaybackState::Idle, "starts idle");

    const auto err = sched.loadTracks(twoHandSong());
    expect(!err.isError(), "load succeeds: " + err.toString());
    expect(sched.state() == PlaybackState::Playing, "loading goes straight to playing");
    expect(log.states.size() == 2 && log.states[0] == PlaybackState::Loading && log.states[1] == PlaybackState::Playing,
           "Idle -> Loading -> Playing");
    expectEq(sched.session()->timeline().size(), 6, "six entries");

    sched.processTick(0.0);
    auto snap = sched.channel().latest();
    expectEq(snap->activeNotes.size(), 2, "both opening notes active");
    expectEq(snap->cursorIndex, 2, "cursor past the opening chord");
    expect(snap->predictionBatch.size() == 1 && snap->predictionBatch.notes[0].entry.event.note == 62, "62 predicted next");
    expectNear(snap->predictionBatch.notes.isEmpty() ? -1.0 : snap->predictionBatch.notes[0].delaySeconds, 1.0,
               "62 is one second away");
    expectEq(snap->frame.visibleNotes.size(), 1, "one falling note");

    sched.processTick(0.5);
    expectEq(sched.channel().latest()->activeNotes.size(), 2, "still holding the chord");

    sched.processTick(1.0);
    snap = sched.channel().latest();
    expect(!sched.tracker().isActive(1, 60), "60 released at 1 s");
    expect(sched.tracker().isActive(1, 62) && sched.tracker().isActive(2, 48), "62 and 48 held at 1 s");
    expectEq(snap->cursorIndex, 4, "cursor at 1 s");

    clock.set(1.25);
    sched.pause();
    expect(sched.state() == PlaybackState::Paused, "paused");
    sched.processTick(5.0);
    snap = sched.channel().latest();
    expectNear(snap->cursorSeconds, 1.25, "cursor frozen while paused");
    expect(snap->state == PlaybackState::Paused, "snapshot reports paused");
    expectEq(snap->activeNotes.size(), 2, "pause keeps note state");

    clock.set(5.0);
    sched.resume();
    sched.processTick(5.5);
    expectNear(sched.channel().latest()->cursorSeconds, 1.75, "cursor resumes from where it paused");

    const quint64 before = sched.channel().sequence();
    sched.processTick(6.0);
    expect(sched.state() == PlaybackState::Stopped, "end of song stops");
    expect(sched.channel().sequence() == before + 1, "final snapshot published");
    expect(sched.channel().latest()->state == PlaybackState::Stopped, "final snapshot is stopped");
    expect(sched.tracker().activeSet().isEmpty(), "nothing left sounding");
    expect(log.runtime.isEmpty(), "no runtime errors");

    sched.processTick(7.0);
    expect(sched.channel().sequence() == before + 1, "no ticks after stop");

    clock.set(10.0);
    sched.play();
    expect(sched.state() == PlaybackState::Playing, "play restarts a stopped session");
    sched.processTick(10.0);
    expectEq(sched.channel().latest()->activeNotes.size(), 2, "restart from the top");
}

static void testDriftAndTempo() {
    ManualEngineClock clock;
    SyncScheduler sched(&clock, EngineConfig());
    sched.loadTracks(twoHandSong());

    // Irregular tick spacing must not affect where the cursor lands.
    double t = 0.0;
    for (int i = 0; i < 200; ++i) {
        t += (i % 3 == 0) ? 0.0011 : 0.0032;
        sched.processTick(t);
    }
    sched.processTick(0.9375);
    expectNear(sched.channel().latest()->cursorSeconds, 0.9375, "cursor follows the clock, not the tick count", 1e-12);

    clock.set(0.9375);
    expect(!sched.setTempoScale(50.0).isError(), "tempo change accepted");
    sched.processTick(1.0625);
    const auto snap = sched.channel().latest();
    expectNear(snap->cursorSeconds, 1.0, "half speed after re-anchoring", 1e-12);
    expectEq(snap->cursorIndex, 4, "entries at 1 s reached");
    expectNear(snap->tempoScalePercent, 50.0, "snapshot carries the tempo scale");

    const auto rejected = sched.setTempoScale(0.0);
    expect(rejected.kind == ErrorKind::InvalidConfiguration, "tempo scale 0 rejected");
    expectNear(sched.tempoScale(), 50.0, "previous tempo scale kept");

    expectNear(sched.lookaheadSeconds(), 2.0, "default lookahead");
    expect(sched.setLookahead(-1.0, 0.0).kind == ErrorKind::InvalidConfiguration, "negative skill rejected");
    expectNear(sched.lookaheadSeconds(), 2.0, "previous lookahead kept");
    expect(!sched.setLookahead(10.0, 5.0).isError(), "lookahead accepted");
    expectNear(sched.lookaheadSeconds(), 8.0, "lookahead widened");
    expect(!sched.setLookahead(100.0, 100.0).isError(), "huge lookahead accepted");
    expectNear(sched.lookaheadSeconds(), 30.0, "lookahead clamped to the maximum");
}

static void testStopSweep() {
    ManualEngineClock clock;
    SyncScheduler sched(&clock, EngineConfig());
    sched.loadTracks(twoHandSong());
    sched.processTick(0.0);
    expectEq(sched.tracker().activeSet().size(), 2, "chord held before stop");

    sched.stop();
    expect(sched.state() == PlaybackState::Stopped, "stop on the scheduler thread is immediate");
    expect(sched.tracker().activeSet().isEmpty(), "stop sweeps all notes off");
    expect(sched.channel().latest()->activeNotes.isEmpty(), "stopped snapshot has no active notes");

    // From another thread the request is picked up by the next tick.
    clock.set(20.0);
    sched.play();
    sched.processTick(20.0);
    std::thread other([&sched]() { sched.stop(); });
    other.join();
    expect(sched.state() == PlaybackState::Playing, "foreign-thread stop waits for the tick");
    sched.processTick(20.016);
    expect(sched.state() == PlaybackState::Stopped, "stop observed within one tick");
    expect(sched.tracker().activeSet().isEmpty(), "no stuck notes after a foreign-thread stop");
}

static void testLeadIn() {
    // First note one second in.
    SourceTracks s;
    s.resolution = 480;
    s.tracks.push_back({RawEvent::noteOn(1, 60, 80, 960), RawEvent::noteOff(1, 60, 960)});

    ManualEngineClock clock;
    SyncScheduler sched(&clock, EngineConfig());
    expect(!sched.loadTracks(s).isError(), "song with a lead-in loads");
    expectNear(sched.session()->cursorSeconds(), 0.0, "playback starts at the top of the song");
    sched.processTick(0.5);
    expect(sched.tracker().activeSet().isEmpty(), "nothing sounds during the lead-in");
    const auto waiting = sched.channel().latest();
    expect(waiting->predictionBatch.size() == 1 && waiting->predictionBatch.notes[0].entry.event.note == 60,
           "first note predicted during the lead-in");
    if (waiting->predictionBatch.size() == 1) {
        expectNear(waiting->predictionBatch.notes[0].delaySeconds, 0.5, "lead-in delay");
    }
    sched.processTick(1.0);
    expect(sched.tracker().isActive(1, 60), "first note on time after the lead-in");
}

static void testPracticeView() {
    ManualEngineClock clock;

    SyncScheduler hidden(&clock, EngineConfig());
    hidden.setShowFutureNotes(false);
    hidden.loadTracks(twoHandSong());
    hidden.processTick(0.0);
    expect(hidden.channel().latest()->predictionBatch.isEmpty(), "upcoming notes switched off");
    expectEq(hidden.tracker().activeSet().size(), 2, "playback unaffected by the hidden preview");

    // Left hand only: the next right-hand note (62) is neither predicted nor drawn.
    SyncScheduler left(&clock, EngineConfig());
    left.setPracticeHands(keyfall::state::HandSelection::Left);
    left.loadTracks(twoHandSong());
    left.processTick(0.0);
    const auto leftSnap = left.channel().latest();
    expect(leftSnap->predictionBatch.isEmpty(), "no right hand prediction");
    expect(leftSnap->frame.visibleNotes.isEmpty(), "no right hand falling notes");
    expectEq(left.tracker().activeSet().size(), 2, "both hands still sound");

    SyncScheduler right(&clock, EngineConfig());
    right.setPracticeHands(keyfall::state::HandSelection::Right);
    right.loadTracks(twoHandSong());
    right.processTick(0.0);
    const auto rightSnap = right.channel().latest();
    expect(rightSnap->predictionBatch.size() == 1 && rightSnap->predictionBatch.notes[0].entry.event.note == 62,
           "right hand prediction kept");
    expect(rightSnap->frame.visibleNotes.size() == 1 && rightSnap->frame.visibleNotes[0].midiNote == 62,
           "right hand falling note kept");

    // Range [0, 3) ends before 62 starts: nothing past the end is shown.
    SyncScheduler ranged(&clock, EngineConfig());
    ranged.loadTracks(twoHandSong());
    expect(!ranged.setPracticeRange(0.0, 50.0).isError(), "first half selected");
    expectEq(ranged.session()->range().end, 3, "range ends before 62");
    ranged.processTick(0.0);
    const auto rangedSnap = ranged.channel().latest();
    expect(rangedSnap->frame.visibleNotes.isEmpty(), "notes past the range end are not drawn");
    expect(rangedSnap->predictionBatch.isEmpty(), "notes past the range end are not predicted");
}

static void testLoopAndPracticeRange() {
    const auto full = keyfall::engine::practiceRangeFor(6, 0.0, 100.0);
    expect(full.ok() && full.value.begin == 0 && full.value.end == 6, "full range");
    const auto inner = keyfall::engine::practiceRangeFor(6, 10.0, 90.0);
    expect(inner.ok() && inner.value.begin == 0 && inner.value.end == 5, "floor of percent times count");
    expect(!keyfall::engine::practiceRangeFor(6, 60.0, 40.0).ok(), "inverted range rejected");
    expect(!keyfall::engine::practiceRangeFor(6, -1.0, 40.0).ok(), "negative start rejected");

    ManualEngineClock clock;
    EngineConfig cfg;
    cfg.practice.loop = true;
    SyncScheduler sched(&clock, cfg);
    sched.loadTracks(twoHandSong());
    sched.processTick(0.0);
    sched.processTick(2.0);
    expect(sched.state() == PlaybackState::Playing, "looping keeps playing");
    expectEq(sched.session()->cursorIndex(), 0, "cursor back at the range start");
    expect(sched.tracker().activeSet().isEmpty(), "loop boundary sweeps notes");
    sched.processTick(2.0);
    expectEq(sched.tracker().activeSet().size(), 2, "second pass replays the opening chord");

    clock.set(3.0);
    expect(!sched.setPracticeRange(50.0, 100.0).isError(), "practice range accepted");
    expectEq(sched.session()->range().begin, 3, "range starts at entry 3");
    expectEq(sched.session()->cursorIndex(), 3, "cursor moved into the range");
    expect(sched.tracker().activeSet().isEmpty(), "range change silences held notes");
    sched.processTick(3.0);
    expect(sched.tracker().isActive(1, 62) && sched.tracker().activeSet().size() == 1, "range start plays 62");
    expect(sched.setPracticeRange(90.0, 10.0).kind == ErrorKind::InvalidConfiguration, "bad range rejected");
    expectEq(sched.session()->range().begin, 3, "previous range kept");

    sched.setLoop(false);
    sched.processTick(4.0);
    expect(sched.state() == PlaybackState::Stopped, "without loop the range end stops");
}

static void testLiveInputHandling() {
    ManualEngineClock clock;
    EngineConfig cfg;
    cfg.liveInput.queueCapacity = 4;
    SyncScheduler sched(&clock, cfg);
    StateLog log;
    log.attach(sched);

    sched.startLiveOnly();
    expect(sched.state() == PlaybackState::Playing, "free play is a playing session");
    expect(sched.session() && sched.session()->isLiveOnly(), "live-only session");

    for (int i = 0; i < 6; ++i) sched.router().pushLiveAt(RawEvent::noteOn(0, 60 + i, 100), 0.001 * i);
    sched.processTick(0.01);
    expectEq(sched.tracker().activeSet().size(), 4, "only the newest four live notes survive");
    expect(log.runtime.size() == 1 && log.runtime[0].kind == ErrorKind::QueueOverflow, "overflow reported on the side channel");
    expect(sched.lastError().kind == ErrorKind::QueueOverflow, "overflow is the last error");
    expect(sched.router().totalLiveDropped() == 2, "dropped events counted");
    expect(sched.state() == PlaybackState::Playing, "overflow does not stop playback");
    const auto snap = sched.channel().latest();
    expect(snap->tickErrors.size() == 1, "overflow carried by the snapshot");
    expect(snap->predictionBatch.isEmpty() && snap->frame.visibleNotes.isEmpty(), "no timeline, nothing to predict");

    sched.router().reportDeviceDisconnected("cable pulled");
    sched.processTick(0.02);
    expect(sched.state() == PlaybackState::Stopped, "device loss without a timeline stops");
    expect(sched.tracker().activeSet().isEmpty(), "device loss sweeps notes");

    // With a timeline the song keeps going.
    SyncScheduler withSong(&clock, EngineConfig());
    StateLog songLog;
    songLog.attach(withSong);
    withSong.loadTracks(twoHandSong());
    withSong.router().reportDeviceDisconnected("cable pulled");
    withSong.processTick(0.0);
    expect(withSong.state() == PlaybackState::Playing, "device loss with a timeline keeps playing");
    expect(songLog.runtime.size() == 1 && songLog.runtime[0].kind == ErrorKind::DeviceDisconnected, "device loss reported");

    // Live notes are merged into the same note table as the file.
    withSong.router().pushLiveAt(RawEvent::noteOn(0, 72, 90), 0.1);
    withSong.processTick(0.2);
    expect(withSong.tracker().isActive(0, 72), "live note applied during the tick");
    expectEq(withSong.channel().latest()->activeNotes.size(), 3, "file and live notes side by side");
}

static void testLoadFailures() {
    ManualEngineClock clock;
    SyncScheduler sched(&clock, EngineConfig());
    StateLog log;
    log.attach(sched);

    const auto missing = sched.load("/nonexistent/keyfall-test.mid");
    expect(missing.kind == ErrorKind::MalformedTimeline, "unreadable source fails Loading");
    expect(sched.state() == PlaybackState::Stopped, "failed Loading ends in Stopped");
    expect(log.loadFailures.size() == 1, "loadFailed emitted");
    expect(sched.session() == nullptr, "no session after a failed first load");

    sched.loadTracks(twoHandSong());
    sched.processTick(0.0);
    expectEq(sched.tracker().activeSet().size(), 2, "opening chord held before the reload");
    SourceTracks broken;
    broken.tracks.push_back({RawEvent::noteOn(0, 60, 80, 0), RawEvent::noteOff(0, 60, -1)});
    const auto bad = sched.loadTracks(broken);
    expect(bad.kind == ErrorKind::MalformedTimeline, "negative delta fails Loading");
    expect(sched.state() == PlaybackState::Stopped, "stopped after the failed load");
    expect(sched.session() && sched.session()->timeline().size() == 6, "prior session untouched");
    expect(sched.lastError().kind == ErrorKind::MalformedTimeline, "last error recorded");
    expect(sched.tracker().activeSet().isEmpty(), "failed load releases held notes");
    expect(sched.channel().latest()->activeNotes.isEmpty(), "published snapshot has no held notes");
    expect(sched.channel().latest()->state == PlaybackState::Stopped, "published snapshot is stopped");
}

static void testCacheBackedLoading() {
    QTemporaryDir dir;
    expect(dir.isValid(), "temporary directory");
    const QString songPath = QDir(dir.path()).filePath("two.mid");
    {
        QFile f(songPath);
        expect(f.open(QIODevice::WriteOnly), "write song");
        f.write(twoHandSmf());
    }
    const QString cacheDir = QDir(dir.path()).filePath("cache");

    ManualEngineClock clock;
    SyncScheduler first(&clock, EngineConfig());
    first.setCache(std::make_unique<keyfall::timeline::TimelineCache>(cacheDir));
    expect(!first.load(songPath).isError(), "cold load parses the file");
    expect(first.session() && !first.session()->loadedFromCache(), "cold load is a fresh build");
    expectEq(first.session() ? first.session()->timeline().size() : 0, 3, "note on, note off, end of track");

    SyncScheduler second(&clock, EngineConfig());
    second.setCache(std::make_unique<keyfall::timeline::TimelineCache>(cacheDir));
    expect(!second.load(songPath).isError(), "warm load succeeds");
    expect(second.session() && second.session()->loadedFromCache(), "warm load comes from the cache");
    expect(second.session() && first.session()
               && second.session()->timeline().entries() == first.session()->timeline().entries(),
           "cached timeline matches the fresh one");

    // Source replaced by garbage and touched: fresh parse fails, the older record is used.
    {
        QFile f(songPath);
        expect(f.open(QIODevice::WriteOnly | QIODevice::Truncate), "overwrite song");
        f.write("garbage");
        f.flush();
        f.setFileTime(QDateTime::currentDateTime().addSecs(120), QFileDevice::FileModificationTime);
    }
    SyncScheduler third(&clock, EngineConfig());
    third.setCache(std::make_unique<keyfall::timeline::TimelineCache>(cacheDir));
    expect(!third.load(songPath).isError(), "parse failure falls back to the cached timeline");
    expect(third.session() && third.session()->loadedFromCache(), "fallback came from the cache");
}

static void testSnapshotBroadcast() {
    ManualEngineClock clock;
    SyncScheduler sched(&clock, EngineConfig());
    keyfall::engine::SnapshotEncoder encoder;

    sched.loadTracks(twoHandSong());
    sched.processTick(0.0);
    auto msgs = encoder.encode(*sched.channel().latest());
    expectEq(msgs.size(), 1, "one frame message");
    const QJsonObject first = QJsonDocument::fromJson(msgs.value(0)).object();
    expect(first.value("type").toString() == "frame_update", "message type");
    expectEq(first.value("cursorIndex").toInt(), 2, "cursor index in JSON");
    expectEq(first.value("activeNotes").toArray().size(), 2, "active notes in JSON");
    const QJsonObject frame = first.value("frame").toObject();
    expect(frame.contains("keyboardLayout"), "first message carries the keyboard layout");
    expectEq(frame.value("keyboardLayout").toObject().value("keys").toArray().size(), 88, "88 keys sent");
    const QJsonArray predicted = first.value("predictedNotes").toArray();
    expect(predicted.size() == 1, "one predicted note");
    if (predicted.size() == 1) {
        const QJsonObject p = predicted[0].toObject();
        expectEq(p.value("note").toInt(), 62, "predicted note");
        expectEq(p.value("channel").toInt(), 1, "predicted channel");
        expectNear(p.value("delaySeconds").toDouble(), 1.0, "predicted delay");
        expect(p.value("hand").toString() == "right", "predicted hand");
        expect(p.value("colorKey").toString() == "right_hand/white_keys/upcoming", "predicted color key");
    }

    expect(encoder.encode(*sched.channel().latest()).isEmpty(), "same snapshot is not sent twice");

    sched.processTick(0.5);
    msgs = encoder.encode(*sched.channel().latest());
    const QJsonObject second = QJsonDocument::fromJson(msgs.value(0)).object().value("frame").toObject();
    expect(!second.contains("keyboardLayout"), "unchanged layout is not resent");
    expect(second.contains("keyboardLayoutRevision"), "layout revision always present");

    sched.stop();
    msgs = encoder.encode(*sched.channel().latest());
    expectEq(msgs.size(), 2, "stopped snapshot plus stop message");
    expect(msgs.size() == 2 && msgs[1] == keyfall::engine::SnapshotEncoder::stopMessage(), "stop message last");
    expect(QJsonDocument::fromJson(keyfall::engine::SnapshotEncoder::stopMessage()).object().value("type").toString() == "stop",
           "stop message type");
}

static void testBroadcastPumpThread() {
    ManualEngineClock clock;
    SyncScheduler sched(&clock, EngineConfig());
    sched.loadTracks(twoHandSong());
    sched.processTick(0.0);

    keyfall::engine::BroadcastPump pump(&sched.channel(), 5);
    QVector<QByteArray> received;
    QEventLoop loop;
    QObject::connect(&pump, &keyfall::engine::BroadcastPump::frameJson, [&](const QByteArray& json) {
        received.push_back(json);
        loop.quit();
    });
    auto waitFor = [&](const std::function<bool()>& done) {
        QTimer guard;
        guard.setSingleShot(true);
        QObject::connect(&guard, &QTimer::timeout, &loop, &QEventLoop::quit);
        guard.start(2000);
        while (!done() && guard.isActive()) loop.exec();
        return done();
    };
    auto sawStop = [&] { return received.contains(keyfall::engine::SnapshotEncoder::stopMessage()); };

    pump.start();
    expect(pump.isRunning(), "pump thread running");
    expect(waitFor([&] { return !received.isEmpty(); }), "first frame arrives from the pump thread");
    const QJsonObject first = QJsonDocument::fromJson(received.value(0)).object();
    expect(first.value("type").toString() == "frame_update", "pump sends frame updates");

    sched.stop();
    expect(waitFor(sawStop), "stop message follows the stopped snapshot");
    pump.stop();
    expect(!pump.isRunning(), "pump thread finished");
    pump.stop();

    // A second run gets a fresh worker and resends the current state.
    received.clear();
    pump.start();
    expect(pump.isRunning(), "pump restarts");
    expect(waitFor(sawStop), "restarted pump resends the stop");
    expect(!received.isEmpty()
               && QJsonDocument::fromJson(received.first()).object().value("frame").toObject().contains("keyboardLayout"),
           "restarted pump resends the keyboard layout");
    pump.stop();
    expect(!pump.isRunning(), "pump thread finished again");
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    testPlaybackLifecycle();
    testDriftAndTempo();
    testStopSweep();
    testLeadIn();
    testPracticeView();
    testLoopAndPracticeRange();
    testLiveInputHandling();
    testLoadFailures();
    testCacheBackedLoading();
    testSnapshotBroadcast();
    testBroadcastPumpThread();

    if (g_failures == 0) {
        qInfo("KeyfallEngineTests: PASS");
        return 0;
    }

    qWarning("KeyfallEngineTests: FAIL (%d failures)", g_failures);
    return 1;
}
