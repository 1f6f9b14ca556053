#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QFile>

#include "managers/ConfigManager.h"

class ConfigManagerTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() {
        // Create temporary directory for config files
        m_tempDir.reset(new QTemporaryDir());
        QVERIFY(m_tempDir->isValid());
        qunsetenv("SOUNDIDLE_CONFIG");
    }

    void cleanupTestCase() {
        m_tempDir.reset();
    }

    void init() {
        m_configManager = new ConfigManager();
    }

    void cleanup() {
        delete m_configManager;
        qunsetenv("SOUNDIDLE_CONFIG");
    }

    void testDefaultValues() {
        QCOMPARE(m_configManager->inactivityTimeoutMinutes(), quint64(5));
        QCOMPARE(m_configManager->logLevel(), QString("info"));
        QCOMPARE(m_configManager->logFilePath(), QString(""));
        QCOMPARE(m_configManager->consoleOutput(), true);
    }

    void testMissingFileKeepsDefaults() {
        const QString path = m_tempDir->filePath("absent.conf");
        QVERIFY(m_configManager->loadLocalConfig(path));
        QCOMPARE(m_configManager->configFilePath(), path);
        QCOMPARE(m_configManager->inactivityTimeoutMinutes(), quint64(5));
    }

    void testLoadFromFile() {
        const QString path = writeConfig("full.conf",
                                         "InactivityTimeoutMinutes=15\n"
                                         "LogLevel=Warning\n"
                                         "LogFilePath=/tmp/soundidle-test.log\n"
                                         "ConsoleOutput=false\n");

        QSignalSpy spy(m_configManager, &ConfigManager::configChanged);
        QVERIFY(m_configManager->loadLocalConfig(path));

        QCOMPARE(spy.count(), 1);
        QCOMPARE(m_configManager->inactivityTimeoutMinutes(), quint64(15));
        QCOMPARE(m_configManager->logLevel(), QString("warning"));
        QCOMPARE(m_configManager->logFilePath(), QString("/tmp/soundidle-test.log"));
        QCOMPARE(m_configManager->consoleOutput(), false);
    }

    void testInvalidValuesCorrected_data() {
        QTest::addColumn<QString>("timeout");

        QTest::newRow("zero") << "0";
        QTest::newRow("negative") << "-4";
        QTest::newRow("text") << "soon";
    }

    void testInvalidValuesCorrected() {
        QFETCH(QString, timeout);
        const QString path = writeConfig("invalid.conf",
                                         QString("InactivityTimeoutMinutes=%1\nLogLevel=verbose\n").arg(timeout).toUtf8());

        QVERIFY(m_configManager->loadLocalConfig(path));
        QCOMPARE(m_configManager->inactivityTimeoutMinutes(), quint64(5));
        QCOMPARE(m_configManager->logLevel(), QString("info"));
    }

    void testEnvironmentPath() {
        const QString path = writeConfig("env.conf", "InactivityTimeoutMinutes=9\n");
        qputenv("SOUNDIDLE_CONFIG", path.toUtf8());

        QVERIFY(m_configManager->loadLocalConfig());
        QCOMPARE(m_configManager->configFilePath(), path);
        QCOMPARE(m_configManager->inactivityTimeoutMinutes(), quint64(9));
    }

    void testSetInactivityTimeout() {
        QSignalSpy timeoutSpy(m_configManager, &ConfigManager::inactivityTimeoutChanged);
        QSignalSpy configSpy(m_configManager, &ConfigManager::configChanged);

        QVERIFY(m_configManager->setInactivityTimeoutMinutes(12));
        QCOMPARE(timeoutSpy.count(), 1);
        QCOMPARE(timeoutSpy.takeFirst().at(0).toULongLong(), quint64(12));
        QCOMPARE(configSpy.count(), 1);

        // Same value, no signal
        QVERIFY(m_configManager->setInactivityTimeoutMinutes(12));
        QCOMPARE(timeoutSpy.count(), 0);

        QVERIFY(!m_configManager->setInactivityTimeoutMinutes(0));
        QCOMPARE(m_configManager->inactivityTimeoutMinutes(), quint64(12));
        QCOMPARE(timeoutSpy.count(), 0);
    }

    void testLogSettingsSignals() {
        QSignalSpy spy(m_configManager, &ConfigManager::configChanged);

        m_configManager->setLogLevel("debug");
        m_configManager->setLogFilePath(m_tempDir->filePath("out.log"));
        m_configManager->setConsoleOutput(false);
        QCOMPARE(spy.count(), 3);

        m_configManager->setLogLevel("debug");
        QCOMPARE(spy.count(), 3);
    }

private:
    QString writeConfig(const QString &name, const QByteArray &contents) {
        const QString path = m_tempDir->filePath(name);
        QFile file(path);
        if (file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
            file.write(contents);
        }
        return path;
    }

    QScopedPointer<QTemporaryDir> m_tempDir;
    ConfigManager* m_configManager;
};

QTEST_MAIN(ConfigManagerTest)
#include "ConfigManagerTest.moc"
