#pragma once

#include <QByteArray>
#include <QObject>
#include <QThread>
#include <QTimer>
#include <QVector>
#include <atomic>
#include <memory>

#include "keyfall/engine/SnapshotChannel.h"

namespace keyfall::engine {

// Turns the stream of published snapshots into broadcast messages. Remembers which
// keyboard layout revision it already sent so the layout goes out only on change,
// and emits a single {"type":"stop"} after the first Stopped snapshot.
class SnapshotEncoder {
public:
    // Empty when the snapshot was already encoded.
    QVector<QByteArray> encode(const Snapshot& s);
    void reset();

    static QByteArray stopMessage();

private:
    quint64 m_lastSequence = 0;
    quint32 m_lastLayoutRevision = 0;
    bool m_layoutSent = false;
    bool m_stopSent = false;
};

class BroadcastPumpWorker;

// Broadcast activity. Reads only the SnapshotChannel, on its own thread and cadence,
// so a slow consumer can never hold up the tick loop.
class BroadcastPump : public QObject {
    Q_OBJECT

public:
    explicit BroadcastPump(const SnapshotChannel* channel, int intervalMs = 16, QObject* parent = nullptr);
    ~BroadcastPump() override;

    void start();
    void stop();
    bool isRunning() const;

signals:
    // Queued from the pump thread.
    void frameJson(const QByteArray& json);

private:
    const SnapshotChannel* m_channel = nullptr; // not owned
    int m_intervalMs = 16;
    BroadcastPumpWorker* m_worker = nullptr; // one per run, deleted when its thread finishes
    QThread* m_thread = nullptr;
};

// Lives on the pump thread.
class BroadcastPumpWorker : public QObject {
    Q_OBJECT

public:
    BroadcastPumpWorker(const SnapshotChannel* channel, int intervalMs, QObject* parent = nullptr);

public slots:
    void start();
    void stop();
    void poll();

signals:
    void frameJson(const QByteArray& json);

private:
    const SnapshotChannel* m_channel = nullptr; // not owned
    int m_intervalMs = 16;
    QTimer* m_timer = nullptr; // created on the pump thread
    SnapshotEncoder m_encoder;
};

} // namespace keyfall::engine
