#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QStandardPaths>
#include <QTextStream>
#include <QTimer>

#include "keyfall/config/ConfigLoader.h"
#include "keyfall/engine/BroadcastPump.h"
#include "keyfall/engine/EngineClock.h"
#include "keyfall/engine/SyncScheduler.h"
#include "keyfall/input/LiveMidiInput.h"
#include "keyfall/timeline/TimelineCache.h"

using namespace keyfall;

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("keyfall");

    QCommandLineParser parser;
    parser.setApplicationDescription("Falling-notes MIDI timeline engine");
    parser.addHelpOption();
    QCommandLineOption configOpt("config", "Engine configuration XML.", "file");
    QCommandLineOption jsonOpt("json", "Print frame updates as JSON lines on stdout.");
    QCommandLineOption liveOpt("live", "Open the live MIDI input port from the configuration.");
    QCommandLineOption portsOpt("list-ports", "List MIDI input ports and exit.");
    parser.addOption(configOpt);
    parser.addOption(jsonOpt);
    parser.addOption(liveOpt);
    parser.addOption(portsOpt);
    parser.addPositionalArgument("song", "Standard MIDI file to play (omit with --live for free play).");
    parser.process(app);

    if (parser.isSet(portsOpt)) {
        QTextStream out(stdout);
        for (const QString& p : input::LiveMidiInput::availablePorts()) out << p << "\n";
        return 0;
    }

    config::EngineConfig cfg;
    if (parser.isSet(configOpt)) {
        const auto loaded = config::ConfigLoader().loadFile(parser.value(configOpt));
        if (!loaded.ok()) {
            qWarning().noquote() << "keyfall: bad configuration:" << loaded.error.toString();
            return 2;
        }
        cfg = loaded.value;
    }

    const QStringList args = parser.positionalArguments();
    const bool live = parser.isSet(liveOpt) || cfg.liveInput.enabled;
    if (args.isEmpty() && !live) {
        parser.showHelp(1);
    }

    engine::ElapsedEngineClock clock;
    engine::SyncScheduler scheduler(&clock, cfg);

    if (cfg.cache.enabled) {
        QString dir = cfg.cache.directory;
        if (dir.isEmpty()) {
            dir = QDir(QStandardPaths::writableLocation(QStandardPaths::AppDataLocation)).filePath("timeline-cache");
        }
        scheduler.setCache(std::make_unique<timeline::TimelineCache>(dir));
    }

    input::LiveMidiInput liveInput(&scheduler.router());
    if (live) {
        const core::Error err = liveInput.open(cfg.liveInput.portName, cfg.liveInput.portCheckIntervalMs);
        if (err.isError() && args.isEmpty()) {
            qWarning().noquote() << "keyfall:" << err.toString();
            return 3;
        }
    }

    engine::BroadcastPump pump(&scheduler.channel(), cfg.playback.tickIntervalMs);
    QTextStream out(stdout);
    if (parser.isSet(jsonOpt)) {
        QObject::connect(&pump, &engine::BroadcastPump::frameJson, &app, [&out](const QByteArray& json) {
            out << json << "\n";
            out.flush();
        });
    }

    QObject::connect(&scheduler, &engine::SyncScheduler::stateChanged, &app, [&](engine::PlaybackState s) {
        if (s != engine::PlaybackState::Stopped) return;
        // Let the pump flush the final snapshot and the stop message first.
        QTimer::singleShot(0, &app, [&]() {
            pump.stop();
            if (liveInput.isOpen() || liveInput.receivedCount() > 0) {
                qInfo().noquote() << QString("keyfall: %1 live events received, %2 dropped")
                                         .arg(liveInput.receivedCount())
                                         .arg(scheduler.router().totalLiveDropped());
            }
            QCoreApplication::exit(scheduler.lastError().isError() ? 1 : 0);
        });
    });

    pump.start();
    scheduler.startTicking();

    if (args.isEmpty()) {
        scheduler.startLiveOnly();
    } else {
        const core::Error err = scheduler.load(args.first());
        if (err.isError()) {
            pump.stop();
            return 1;
        }
    }

    return app.exec();
}
