#include "keyfall/engine/BroadcastPump.h"

#include <QDebug>
#include <QJsonDocument>
#include <QJsonObject>

namespace keyfall::engine {

QByteArray SnapshotEncoder::stopMessage() {
    QJsonObject o;
    o.insert("type", "stop");
    return QJsonDocument(o).toJson(QJsonDocument::Compact);
}

void SnapshotEncoder::reset() {
    m_lastSequence = 0;
    m_lastLayoutRevision = 0;
    m_layoutSent = false;
    m_stopSent = false;
}

QVector<QByteArray> SnapshotEncoder::encode(const Snapshot& s) {
    QVector<QByteArray> out;
    if (s.sequence != 0 && s.sequence == m_lastSequence) return out;
    m_lastSequence = s.sequence;

    bool includeLayout = false;
    if (s.frame.keyboard) {
        includeLayout = !m_layoutSent || s.frame.keyboard->revision != m_lastLayoutRevision;
        m_layoutSent = true;
        m_lastLayoutRevision = s.frame.keyboard->revision;
    }
    out.push_back(QJsonDocument(snapshotToJsonObject(s, includeLayout)).toJson(QJsonDocument::Compact));

    if (s.state == PlaybackState::Stopped) {
        if (!m_stopSent) out.push_back(stopMessage());
        m_stopSent = true;
    } else {
        m_stopSent = false;
    }
    return out;
}

BroadcastPump::BroadcastPump(const SnapshotChannel* channel, int intervalMs, QObject* parent)
    : QObject(parent), m_channel(channel), m_intervalMs(intervalMs) {
    m_thread = new QThread(this);
    m_thread->setObjectName("keyfall-broadcast");
}

BroadcastPump::~BroadcastPump() {
    stop();
}

void BroadcastPump::start() {
    if (m_thread->isRunning()) return;

    m_worker = new BroadcastPumpWorker(m_channel, m_intervalMs);
    m_worker->moveToThread(m_thread);
    connect(m_worker, &BroadcastPumpWorker::frameJson, this, &BroadcastPump::frameJson);
    connect(m_thread, &QThread::started, m_worker, &BroadcastPumpWorker::start);
    connect(m_thread, &QThread::finished, m_worker, &QObject::deleteLater);
    m_thread->start();
}

void BroadcastPump::stop() {
    if (!m_thread->isRunning()) return;
    QMetaObject::invokeMethod(m_worker, "stop", Qt::BlockingQueuedConnection);
    m_thread->quit();
    m_thread->wait();
    m_worker = nullptr;
}

bool BroadcastPump::isRunning() const {
    return m_thread->isRunning();
}

BroadcastPumpWorker::BroadcastPumpWorker(const SnapshotChannel* channel, int intervalMs, QObject* parent)
    : QObject(parent), m_channel(channel), m_intervalMs(qMax(1, intervalMs)) {}

void BroadcastPumpWorker::start() {
    if (!m_timer) {
        m_timer = new QTimer(this);
        m_timer->setTimerType(Qt::PreciseTimer);
        connect(m_timer, &QTimer::timeout, this, &BroadcastPumpWorker::poll);
    }
    m_encoder.reset();
    m_timer->start(m_intervalMs);
    qInfo().noquote() << QString("BroadcastPump: started (%1 ms)").arg(m_intervalMs);
}

void BroadcastPumpWorker::stop() {
    if (m_timer) m_timer->stop();
    // Flush whatever the scheduler published last (typically the Stopped snapshot).
    poll();
}

void BroadcastPumpWorker::poll() {
    if (!m_channel) return;
    const auto latest = m_channel->latest();
    if (!latest) return;
    for (const QByteArray& msg : m_encoder.encode(*latest)) {
        emit frameJson(msg);
    }
}

} // namespace keyfall::engine
