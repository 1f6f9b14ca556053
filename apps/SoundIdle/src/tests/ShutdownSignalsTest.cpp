#include <QtTest/QtTest>
#include <QSignalSpy>
#include <csignal>

#include "service/ShutdownSignals.h"

namespace {
volatile std::sig_atomic_t g_previousHandlerCalls = 0;

void previousHandler(int)
{
    g_previousHandlerCalls = g_previousHandlerCalls + 1;
}
}

class ShutdownSignalsTest : public QObject
{
    Q_OBJECT

private slots:
    void testSignalIsDeliveredOnOwningThread_data() {
        QTest::addColumn<int>("signalNumber");

        QTest::newRow("SIGTERM") << int(SIGTERM);
        QTest::newRow("SIGINT") << int(SIGINT);
    }

    void testSignalIsDeliveredOnOwningThread() {
        QFETCH(int, signalNumber);

        ShutdownSignals handlers;
        QVERIFY(handlers.install(10));
        QSignalSpy spy(&handlers, &ShutdownSignals::shutdownRequested);

        QCOMPARE(std::raise(signalNumber), 0);

        // The handler only records the signal; nothing is emitted from signal context
        QCOMPARE(spy.count(), 0);

        QVERIFY(spy.wait(2000));
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.takeFirst().at(0).toInt(), signalNumber);
    }

    void testPendingSignalReportedOnce() {
        ShutdownSignals handlers;
        QVERIFY(handlers.install(10));
        QSignalSpy spy(&handlers, &ShutdownSignals::shutdownRequested);

        QCOMPARE(std::raise(SIGTERM), 0);
        QVERIFY(spy.wait(2000));

        QTest::qWait(100);
        QCOMPARE(spy.count(), 1);
    }

    void testSingleInstallation() {
        ShutdownSignals first;
        ShutdownSignals second;

        QVERIFY(first.install());
        QVERIFY(first.install());
        QVERIFY(!second.install());
        QVERIFY(!second.isInstalled());

        first.uninstall();
        QVERIFY(second.install());
    }

    void testUninstallRestoresPreviousHandler() {
        g_previousHandlerCalls = 0;
        void (*original)(int) = std::signal(SIGTERM, previousHandler);

        {
            ShutdownSignals handlers;
            QVERIFY(handlers.install());
            QVERIFY(handlers.isInstalled());
        }

        QCOMPARE(std::raise(SIGTERM), 0);
        QCOMPARE(int(g_previousHandlerCalls), 1);

        std::signal(SIGTERM, original);
    }
};

QTEST_MAIN(ShutdownSignalsTest)
#include "ShutdownSignalsTest.moc"
