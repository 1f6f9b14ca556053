// ShutdownSignals.h
#ifndef SHUTDOWNSIGNALS_H
#define SHUTDOWNSIGNALS_H

#include <QObject>
#include <QTimer>
#include <csignal>

/**
 * @brief Turns SIGINT/SIGTERM into a Qt signal on the owning thread
 *
 * The handler only records the signal number; a timer on the owning thread
 * picks it up and emits shutdownRequested(). Nothing that locks or allocates
 * may run in signal context: the signal can land on the engine thread while
 * it holds the logger mutex.
 */
class ShutdownSignals : public QObject
{
    Q_OBJECT
public:
    explicit ShutdownSignals(QObject *parent = nullptr);
    ~ShutdownSignals() override;

    // Installs the handlers; only one instance may be installed at a time
    bool install(int pollIntervalMs = 200);
    void uninstall();

    bool isInstalled() const { return m_installed; }

signals:
    void shutdownRequested(int signal);

private slots:
    void checkPending();

private:
    static void handleSignal(int signal);

    static volatile std::sig_atomic_t s_pendingSignal;
    static ShutdownSignals* s_installed;

    QTimer m_pollTimer;
    bool m_installed;
    void (*m_previousInt)(int);
    void (*m_previousTerm)(int);
};

#endif // SHUTDOWNSIGNALS_H
