#include <QtTest/QtTest>
#include <QElapsedTimer>
#include <memory>
#include <thread>
#include <vector>

#include "core/InactivityEngine.h"
#include "FakePlatform.h"

namespace {
const int PollMs = 20;

std::unique_ptr<InactivityEngine> makeEngine(std::shared_ptr<FakePlatformState> state, bool supported = true)
{
    return std::unique_ptr<InactivityEngine>(
        new InactivityEngine(std::unique_ptr<PlatformBackend>(new FakePlatformBackend(state, supported)), PollMs));
}
}

class InactivityEngineTest : public QObject
{
    Q_OBJECT

private slots:
    void testDefaults() {
        auto state = std::make_shared<FakePlatformState>();
        auto engine = makeEngine(state);

        QCOMPARE(engine->thresholdSeconds(), quint64(300));
        QVERIFY(engine->isSupported());
        QVERIFY(!engine->isStarted());
        QVERIFY(!engine->isRunning());
        QVERIFY(!engine->lastLoopError().isError());

        InactivityEngine defaultPoll(std::unique_ptr<PlatformBackend>(new FakePlatformBackend(state)));
        QCOMPARE(defaultPoll.pollInterval(), 5000);
    }

    void testStartSpawnsOneLoop() {
        auto state = std::make_shared<FakePlatformState>();
        auto engine = makeEngine(state);

        QVERIFY(!engine->start().isError());
        QVERIFY(engine->isStarted());
        QTRY_VERIFY(state->idleQueries() >= 3);
        QCOMPARE(state->endpointLookups(), 1);

        // Later calls return the first outcome without spawning again
        QVERIFY(!engine->start().isError());
        QVERIFY(!engine->start().isError());
        QCOMPARE(state->sessionsOpened(), 1);
        QVERIFY(engine->isRunning());
    }

    void testConcurrentStartsShareOneOutcome() {
        auto state = std::make_shared<FakePlatformState>();
        auto engine = makeEngine(state);

        const int callers = 8;
        std::vector<EngineError> results(callers);
        std::vector<std::thread> threads;
        for (int i = 0; i < callers; ++i) {
            threads.emplace_back([&engine, &results, i]() {
                results[i] = engine->start();
            });
        }
        for (std::thread &thread : threads) {
            thread.join();
        }

        for (const EngineError &result : results) {
            QVERIFY(!result.isError());
        }
        QTRY_COMPARE(state->sessionsOpened(), 1);
        QTest::qWait(PollMs * 5);
        QCOMPARE(state->sessionsOpened(), 1);
    }

    void testUnsupportedPlatform() {
        auto state = std::make_shared<FakePlatformState>();
        auto engine = makeEngine(state, false);

        QVERIFY(!engine->isSupported());

        EngineError first = engine->start();
        QCOMPARE(first.kind(), EngineError::UnsupportedPlatform);
        QVERIFY(engine->start() == first);
        QVERIFY(!engine->isStarted());
        QVERIFY(!engine->isRunning());
        QCOMPARE(state->sessionsOpened(), 0);
    }

    void testConcurrentFailedStartsShareOneOutcome() {
        auto state = std::make_shared<FakePlatformState>();
        auto engine = makeEngine(state, false);

        const int callers = 8;
        std::vector<EngineError> results(callers);
        std::vector<std::thread> threads;
        for (int i = 0; i < callers; ++i) {
            threads.emplace_back([&engine, &results, i]() {
                results[i] = engine->start();
            });
        }
        for (std::thread &thread : threads) {
            thread.join();
        }

        QCOMPARE(results[0].kind(), EngineError::UnsupportedPlatform);
        QCOMPARE(results[0].context(), QString("Failed to start monitoring"));
        for (const EngineError &result : results) {
            QVERIFY(result == results[0]);
        }
        QVERIFY(engine->start() == results[0]);
        QVERIFY(!engine->isStarted());
        QCOMPARE(state->sessionsOpened(), 0);
    }

    void testLowersAndRestoresAcrossTicks() {
        auto state = std::make_shared<FakePlatformState>();
        state->setAudio(0.73f, false);
        state->setIdle(500);
        auto engine = makeEngine(state);
        QVERIFY(engine->setThresholdSeconds(2));

        QVERIFY(!engine->start().isError());
        QTRY_VERIFY(state->idleQueries() >= 2);
        QCOMPARE(state->commandCalls(), 0);

        state->setIdle(2000);
        QTRY_VERIFY(state->muted());
        QTRY_COMPARE(state->volume(), 0.0f);

        state->setIdle(10);
        QTRY_VERIFY(!state->muted());
        QTRY_COMPARE(state->volume(), 0.73f);
        QVERIFY(engine->isRunning());
    }

    void testThresholdChangeSeenOnNextTick() {
        auto state = std::make_shared<FakePlatformState>();
        state->setAudio(0.5f, false);
        state->setIdle(90000);
        auto engine = makeEngine(state);

        QVERIFY(!engine->start().isError());
        QTRY_VERIFY(state->idleQueries() >= 2);
        QVERIFY(!state->muted());

        QVERIFY(engine->setThreshold(60000));
        QCOMPARE(engine->thresholdSeconds(), quint64(60));
        QTRY_VERIFY(state->muted());

        // A rejected value keeps the previous threshold
        EngineError error;
        QVERIFY(!engine->setThreshold(0, &error));
        QCOMPARE(error.kind(), EngineError::InvalidThreshold);
        QCOMPARE(engine->thresholdSeconds(), quint64(60));
    }

    void testStopRestoresAudio() {
        auto state = std::make_shared<FakePlatformState>();
        state->setAudio(0.6f, false);
        state->setIdle(10 * 60 * 1000);
        auto engine = makeEngine(state);
        QVERIFY(engine->setThresholdSeconds(1));

        QVERIFY(!engine->start().isError());
        QTRY_VERIFY(state->muted());

        engine->requestStop();
        QTRY_VERIFY(!engine->isRunning());

        QCOMPARE(state->muted(), false);
        QCOMPARE(state->volume(), 0.6f);
        QCOMPARE(state->sessionsClosed(), 1);
        QVERIFY(!engine->lastLoopError().isError());
    }

    void testStopInterruptsLongSleep() {
        auto state = std::make_shared<FakePlatformState>();
        InactivityEngine engine(std::unique_ptr<PlatformBackend>(new FakePlatformBackend(state)), 60000);

        QVERIFY(!engine.start().isError());
        QTRY_COMPARE(state->idleQueries(), 1);

        QElapsedTimer timer;
        timer.start();
        engine.requestStop();
        QTRY_VERIFY(!engine.isRunning());
        QVERIFY(timer.elapsed() < 10000);
    }

    void testSessionFailureStopsLoop() {
        auto state = std::make_shared<FakePlatformState>();
        state->failSession(true);
        auto engine = makeEngine(state);

        // The spawn itself succeeds, the failure belongs to the loop
        QVERIFY(!engine->start().isError());
        QTRY_VERIFY(!engine->isRunning());

        QCOMPARE(engine->lastLoopError().kind(), EngineError::PlatformSession);
        QCOMPARE(state->idleQueries(), 0);
    }

    void testEndpointFailureStopsLoop() {
        auto state = std::make_shared<FakePlatformState>();
        state->failInitialize(true);
        auto engine = makeEngine(state);

        QVERIFY(!engine->start().isError());
        QTRY_VERIFY(!engine->isRunning());

        QCOMPARE(engine->lastLoopError().kind(), EngineError::PlatformSession);
        QCOMPARE(state->sessionsOpened(), 1);
        QCOMPARE(state->sessionsClosed(), 1);
        QCOMPARE(state->idleQueries(), 0);
    }

    void testIdleQueryFailureIsNotRetried() {
        auto state = std::make_shared<FakePlatformState>();
        auto engine = makeEngine(state);

        QVERIFY(!engine->start().isError());
        QTRY_VERIFY(state->idleQueries() >= 1);

        state->failIdleQuery(true);
        QTRY_VERIFY(!engine->isRunning());
        const int queries = state->idleQueries();

        QCOMPARE(engine->lastLoopError().kind(), EngineError::PlatformQuery);
        QCOMPARE(state->sessionsClosed(), 1);

        QTest::qWait(PollMs * 5);
        QCOMPARE(state->idleQueries(), queries);

        // start() keeps reporting the first spawn outcome
        QVERIFY(!engine->start().isError());
        QCOMPARE(state->sessionsOpened(), 1);
    }

    void testDestructorJoinsLoop() {
        auto state = std::make_shared<FakePlatformState>();
        state->setAudio(0.3f, true);
        state->setIdle(10 * 60 * 1000);
        {
            auto engine = makeEngine(state);
            QVERIFY(engine->setThresholdSeconds(1));
            QVERIFY(!engine->start().isError());
            QTRY_COMPARE(state->volume(), 0.0f);
        }

        QCOMPARE(state->sessionsClosed(), 1);
        QCOMPARE(state->volume(), 0.3f);
        QCOMPARE(state->muted(), true);
    }
};

QTEST_MAIN(InactivityEngineTest)
#include "InactivityEngineTest.moc"
