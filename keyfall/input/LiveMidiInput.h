#pragma once

#include <QObject>
#include <QString>
#include <QTimer>
#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "RtMidi.h"
#include "keyfall/core/Errors.h"
#include "keyfall/input/EventQueueRouter.h"

namespace keyfall::input {

// RtMidi input device adapter. The RtMidi callback thread is the producer for the
// router's live queue; it never touches scheduler state.
//
// Loss of the device (RtMidi error callback, a port that vanished from the system
// list, or an RtMidiError while opening) is forwarded to the router as
// DeviceDisconnected and announced through deviceLost().
class LiveMidiInput : public QObject {
    Q_OBJECT

public:
    explicit LiveMidiInput(EventQueueRouter* router, QObject* parent = nullptr);
    ~LiveMidiInput() override;

    static QStringList availablePorts();

    // Opens the first input port whose name contains portName (case-insensitive);
    // an empty name picks port 0. Returns DeviceDisconnected when nothing matches.
    core::Error open(const QString& portName, int portCheckIntervalMs = 1000);
    void close();

    bool isOpen() const { return m_in && m_in->isPortOpen(); }
    const QString& openPortName() const { return m_portName; }
    quint64 receivedCount() const { return m_received.load(); }

signals:
    void deviceLost(const QString& reason);

private slots:
    void checkPort();

private:
    // --- Static Callbacks (Producers) ---
    static void midiCallback(double deltatime, std::vector<unsigned char>* message, void* userData);
    static void errorCallback(RtMidiError::Type type, const std::string& errorText, void* userData);

    void markLost(const QString& reason);

    EventQueueRouter* m_router = nullptr; // not owned
    std::unique_ptr<RtMidiIn> m_in;
    QString m_portName;
    QTimer m_portCheck;
    std::atomic<quint64> m_received{0};
    std::atomic<bool> m_lost{false};
};

} // namespace keyfall::input
