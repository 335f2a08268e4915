#include "keyfall/input/LiveMidiInput.h"

#include "keyfall/input/LiveMessage.h"

#include <QDebug>

namespace keyfall::input {

using core::Error;
using core::ErrorKind;

LiveMidiInput::LiveMidiInput(EventQueueRouter* router, QObject* parent)
    : QObject(parent), m_router(router) {
    connect(&m_portCheck, &QTimer::timeout, this, &LiveMidiInput::checkPort);
}

LiveMidiInput::~LiveMidiInput() {
    close();
}

QStringList LiveMidiInput::availablePorts() {
    QStringList out;
    try {
        RtMidiIn probe;
        for (unsigned int i = 0; i < probe.getPortCount(); ++i) {
            out.push_back(QString::fromStdString(probe.getPortName(i)));
        }
    } catch (const RtMidiError& e) {
        qWarning().noquote() << "LiveMidiInput: cannot enumerate ports:" << QString::fromStdString(e.getMessage());
    }
    return out;
}

Error LiveMidiInput::open(const QString& portName, int portCheckIntervalMs) {
    close();
    m_lost.store(false);

    try {
        m_in = std::make_unique<RtMidiIn>();

        auto find_port = [](RtMidi& midi, const QString& name) {
            if (midi.getPortCount() == 0) return -1;
            if (name.isEmpty()) return 0;
            for (unsigned int i = 0; i < midi.getPortCount(); i++) {
                if (QString::fromStdString(midi.getPortName(i)).contains(name, Qt::CaseInsensitive)) return (int)i;
            }
            return -1;
        };

        const int port = find_port(*m_in, portName);
        if (port < 0) {
            m_in.reset();
            const QString msg = QString("no MIDI input port matching '%1'").arg(portName);
            qWarning().noquote() << "LiveMidiInput:" << msg;
            return Error{ErrorKind::DeviceDisconnected, msg};
        }

        m_portName = QString::fromStdString(m_in->getPortName(unsigned(port)));
        m_in->setErrorCallback(&LiveMidiInput::errorCallback, this);
        m_in->openPort(unsigned(port), "keyfall-in");
        // sysex, timing and active sensing are ignored
        m_in->ignoreTypes(true, true, true);
        m_in->setCallback(&LiveMidiInput::midiCallback, this);
    } catch (const RtMidiError& e) {
        const QString msg = QString::fromStdString(e.getMessage());
        qWarning().noquote() << "LiveMidiInput: open failed:" << msg;
        m_in.reset();
        m_portName.clear();
        return Error{ErrorKind::DeviceDisconnected, msg};
    }

    m_portCheck.start(qMax(100, portCheckIntervalMs));
    qInfo().noquote() << "LiveMidiInput: listening on" << m_portName;
    return {};
}

void LiveMidiInput::close() {
    m_portCheck.stop();
    if (!m_in) return;
    try {
        m_in->cancelCallback();
        m_in->closePort();
    } catch (const RtMidiError& e) {
        qWarning().noquote() << "LiveMidiInput: close failed:" << QString::fromStdString(e.getMessage());
    }
    m_in.reset();
    m_portName.clear();
}

void LiveMidiInput::midiCallback(double /*deltatime*/, std::vector<unsigned char>* message, void* userData) {
    auto* self = static_cast<LiveMidiInput*>(userData);
    if (!self || !message || !self->m_router) return;

    core::RawEvent ev;
    if (!decodeChannelMessage(message->data(), message->size(), ev)) return;
    self->m_router->pushLive(ev);
    self->m_received.fetch_add(1);
}

void LiveMidiInput::errorCallback(RtMidiError::Type type, const std::string& errorText, void* userData) {
    auto* self = static_cast<LiveMidiInput*>(userData);
    if (!self) return;
    // Warnings are not device loss.
    if (type == RtMidiError::WARNING || type == RtMidiError::DEBUG_WARNING) {
        qWarning().noquote() << "LiveMidiInput:" << QString::fromStdString(errorText);
        return;
    }
    self->markLost(QString::fromStdString(errorText));
}

// The driver does not always report an unplugged device, so the port list is polled.
void LiveMidiInput::checkPort() {
    if (!m_in || m_lost.load()) return;
    bool present = false;
    try {
        for (unsigned int i = 0; i < m_in->getPortCount(); ++i) {
            if (QString::fromStdString(m_in->getPortName(i)) == m_portName) {
                present = true;
                break;
            }
        }
    } catch (const RtMidiError& e) {
        markLost(QString::fromStdString(e.getMessage()));
        return;
    }
    if (!present) markLost(QString("port '%1' disappeared").arg(m_portName));
}

void LiveMidiInput::markLost(const QString& reason) {
    if (m_lost.exchange(true)) return;
    qWarning().noquote() << "LiveMidiInput: device lost:" << reason;
    if (m_router) m_router->reportDeviceDisconnected(reason);
    // May be called from the RtMidi thread.
    QMetaObject::invokeMethod(this, [this, reason]() {
        m_portCheck.stop();
        emit deviceLost(reason);
    }, Qt::QueuedConnection);
}

} // namespace keyfall::input
