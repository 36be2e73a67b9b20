#include <QtTest/QtTest>

#include "hub/janitor_sweep.hpp"
#include "presence/in_memory_presence_store.hpp"
#include "utils/logger.hpp"
#include "test_support.hpp"

#include <thread>

using signalhub::JanitorSweep;
using signalhub::Room;
using signalhub::RoomDirectory;
using namespace std::chrono_literals;

class JanitorSweepTests : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void evictsEmptyRooms();
    void keepsActiveRooms();
    void evictsIdleRoomsAndDropsMembers();
    void purgesExpiredPresence();
    void backgroundSweepEvictsWithinInterval();
    void stopIsIdempotent();
};

void JanitorSweepTests::initTestCase() {
    signalhub::Logger::getInstance().setLevel(signalhub::LogLevel::ERROR);
}

void JanitorSweepTests::evictsEmptyRooms() {
    RoomDirectory directory;
    signalhub::InMemoryPresenceStore store;
    JanitorSweep janitor(directory, store, 300s, 1800s);

    directory.getOrCreateRoom("empty");
    auto a = makePeer("a");
    directory.join("busy", a);
    directory.leave(a);

    QCOMPARE(janitor.sweepOnce(), size_t(2));
    QCOMPARE(directory.roomCount(), size_t(0));
}

void JanitorSweepTests::keepsActiveRooms() {
    RoomDirectory directory;
    signalhub::InMemoryPresenceStore store;
    JanitorSweep janitor(directory, store, 300s, 1800s);

    auto a = makePeer("a");
    directory.join("r1", a);

    QCOMPARE(janitor.sweepOnce(Room::Clock::now() + 29min), size_t(0));
    QCOMPARE(directory.roomCount(), size_t(1));
    QVERIFY(!a->isClosed());
}

void JanitorSweepTests::evictsIdleRoomsAndDropsMembers() {
    RoomDirectory directory;
    signalhub::InMemoryPresenceStore store;
    JanitorSweep janitor(directory, store, 300s, 1800s);

    auto a = makePeer("a");
    auto b = makePeer("b");
    directory.join("r1", a);
    directory.join("r1", b);

    QCOMPARE(janitor.sweepOnce(Room::Clock::now() + 31min), size_t(1));
    QCOMPARE(directory.roomCount(), size_t(0));
    QVERIFY(a->wasDropped());
    QVERIFY(b->wasDropped());
    QCOMPARE(a->droppedCalls(), 1);
    QCOMPARE(a->closedCalls(), 0);
    QVERIFY(a->isClosed());
    QVERIFY(!directory.containsPeer("a"));

    // Leaving an evicted room is a no-op.
    QVERIFY(directory.leave(a) == nullptr);
}

void JanitorSweepTests::purgesExpiredPresence() {
    RoomDirectory directory;
    auto now = signalhub::PresenceStore::Clock::now();
    signalhub::InMemoryPresenceStore store([&now]() { return now; });
    JanitorSweep janitor(directory, store, 300s, 1800s);

    store.setTyping("r1", "a", 5s);
    now += 6s;
    janitor.sweepOnce();
    QCOMPARE(store.keyCount(), size_t(0));
}

void JanitorSweepTests::backgroundSweepEvictsWithinInterval() {
    RoomDirectory directory;
    signalhub::InMemoryPresenceStore store;
    JanitorSweep janitor(directory, store, 1s, 1800s);

    directory.getOrCreateRoom("empty");
    janitor.start();
    QVERIFY(janitor.isRunning());

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (directory.roomCount() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(50ms);
    }
    janitor.stop();
    QCOMPARE(directory.roomCount(), size_t(0));
}

void JanitorSweepTests::stopIsIdempotent() {
    RoomDirectory directory;
    signalhub::InMemoryPresenceStore store;
    JanitorSweep janitor(directory, store, 300s, 1800s);

    janitor.stop();
    janitor.start();
    janitor.start();
    janitor.stop();
    janitor.stop();
    QVERIFY(!janitor.isRunning());
}

QTEST_APPLESS_MAIN(JanitorSweepTests)
#include "test_janitor_sweep.moc"
