#include "signalwatcher.h"

#include <QDebug>
#include <QSocketNotifier>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace Encore {

int SignalWatcher::s_socketPair[2] = {-1, -1};

SignalWatcher::SignalWatcher(QObject *parent)
    : QObject(parent)
{
}

SignalWatcher::~SignalWatcher()
{
    teardown();
}

void SignalWatcher::teardown()
{
    if (!m_notifier) {
        return;
    }

    restoreHandlers();
    delete m_notifier;
    m_notifier = nullptr;

    ::close(s_socketPair[0]);
    ::close(s_socketPair[1]);
    s_socketPair[0] = -1;
    s_socketPair[1] = -1;
}

bool SignalWatcher::watch(const QList<int>& signalNumbers)
{
    if (m_notifier || s_socketPair[0] != -1) {
        qWarning() << "[SignalWatcher] Another watcher is already installed";
        return false;
    }

    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, s_socketPair) != 0) {
        qWarning() << "[SignalWatcher] socketpair failed:" << strerror(errno);
        s_socketPair[0] = -1;
        s_socketPair[1] = -1;
        return false;
    }

    m_notifier = new QSocketNotifier(s_socketPair[1], QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, &SignalWatcher::onSocketActivated);

    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = &SignalWatcher::handleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    for (int signalNumber : signalNumbers) {
        if (::sigaction(signalNumber, &action, nullptr) != 0) {
            qWarning() << "[SignalWatcher] Could not watch signal" << signalNumber << ":" << strerror(errno);
            continue;
        }
        m_watched.append(signalNumber);
    }

    if (m_watched.isEmpty()) {
        teardown();
        return false;
    }
    return true;
}

void SignalWatcher::handleSignal(int signalNumber)
{
    // Only async-signal-safe calls here
    const ssize_t written = ::write(s_socketPair[0], &signalNumber, sizeof(signalNumber));
    (void)written;
}

void SignalWatcher::onSocketActivated()
{
    int signalNumber = 0;
    const ssize_t received = ::read(s_socketPair[1], &signalNumber, sizeof(signalNumber));
    if (received != static_cast<ssize_t>(sizeof(signalNumber))) {
        qWarning() << "[SignalWatcher] Short read from signal socket";
        return;
    }

    qDebug() << "[SignalWatcher] Received signal" << signalNumber;
    emit signalReceived(signalNumber);
}

void SignalWatcher::restoreHandlers()
{
    for (int signalNumber : m_watched) {
        std::signal(signalNumber, SIG_DFL);
    }
    m_watched.clear();
}

} // namespace Encore
