#ifndef SIGNALWATCHER_H
#define SIGNALWATCHER_H

#include <QObject>
#include <QList>

class QSocketNotifier;

namespace Encore {

// Turns POSIX signals into a Qt signal delivered by the event loop.
// The handler only writes the signal number to a socket pair; everything
// else happens in onSocketActivated. One watcher may be installed at a time.
class SignalWatcher : public QObject
{
    Q_OBJECT

public:
    explicit SignalWatcher(QObject *parent = nullptr);
    ~SignalWatcher();

    bool watch(const QList<int>& signalNumbers);
    bool isWatching() const { return m_notifier != nullptr; }

signals:
    void signalReceived(int signalNumber);

private slots:
    void onSocketActivated();

private:
    void restoreHandlers();
    void teardown();
    static void handleSignal(int signalNumber);

    static int s_socketPair[2];

    QSocketNotifier* m_notifier = nullptr;
    QList<int> m_watched;
};

} // namespace Encore

#endif // SIGNALWATCHER_H
