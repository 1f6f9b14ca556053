#ifndef SOUNDIDLESERVICE_H
#define SOUNDIDLESERVICE_H

#include <QObject>
#include <QString>
#include <climits>
#include <memory>
#include <optional>

#include "../core/InactivityEngine.h"
#include "../managers/ConfigManager.h"

class PlatformBackend;
class QThread;

/**
 * @brief Application shell around the inactivity engine
 *
 * Owns the configuration and the single engine of the process, starts the
 * monitor from a one-shot init thread and exposes the "set inactivity
 * timeout" command.
 */
class SoundIdleService : public QObject
{
    Q_OBJECT
public:
    explicit SoundIdleService(QObject *parent = nullptr);
    SoundIdleService(std::unique_ptr<PlatformBackend> backend, int pollIntervalMs, QObject *parent = nullptr);
    ~SoundIdleService() override;

    bool initialize(const QString &configPath = QString());

    ConfigManager* configManager() const { return m_configManager; }
    InactivityEngine* engine() const { return m_engine.get(); }

    /**
     * @brief Starts the engine; failures are logged, never fatal to the app
     * @return True when the monitor loop was spawned
     */
    bool startMonitor();

    // Runs startMonitor() on a dedicated init thread, once
    void startMonitorAsync();

    /**
     * @brief Blocks until the init thread has returned from startMonitor()
     * @return True when no init thread is pending
     */
    bool waitForStartup(unsigned long timeoutMs = ULONG_MAX);

    /**
     * @brief Sets the inactivity timeout
     * @param minutes Whole minutes; no value selects the 5 minute default
     * @param errorMessage Receives a user-facing message on failure
     * @return False for zero minutes or an unsupported platform
     */
    bool setInactivityTimeout(const std::optional<quint64> &minutes, QString *errorMessage = nullptr);

    void stop();

public slots:
    void onInactivityTimeoutChanged(quint64 minutes);
    void onConfigChanged();

private:
    ConfigManager* m_configManager;
    std::unique_ptr<InactivityEngine> m_engine;
    QThread* m_initThread;
    bool m_initialized;
};

#endif // SOUNDIDLESERVICE_H
