#include <QtTest/QtTest>

#include "hub/room_directory.hpp"
#include "utils/logger.hpp"
#include "test_support.hpp"

#include <thread>

using signalhub::Room;
using signalhub::RoomDirectory;
using signalhub::RoomError;
using signalhub::RoomErrorCode;

class RoomTests : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void firstPeerIsInitiator();
    void duplicatePeerRejected();
    void initiatorClearedOnLeaveWithoutPromotion();
    void readySetFollowsMembership();
    void userCountBroadcastOnlyOnChange();
    void unchangedCountGoesToJoinerOnly();
    void admittedCallbackRunsBeforeMembership();
    void allReadyClaimedOnce();
    void broadcastExcludesSender();
    void directoryGetOrCreateIsShared();
    void directoryGetRoomUnknownThrows();
    void directoryRejectsPeerInAnotherRoom();
    void directoryLeaveIgnoresImpostor();
    void directoryEvictHonoursPredicate();
    void snapshotIsACopy();
    void concurrentGetOrCreateYieldsOneRoom();
};

void RoomTests::initTestCase() {
    signalhub::Logger::getInstance().setLevel(signalhub::LogLevel::ERROR);
}

void RoomTests::firstPeerIsInitiator() {
    Room room("r1");
    QVERIFY(room.addPeer(makePeer("a")));
    QVERIFY(!room.addPeer(makePeer("b")));
    QCOMPARE(QString::fromStdString(room.initiatorId()), QString("a"));
    QVERIFY(room.isInitiator("a"));
    QVERIFY(!room.isInitiator("b"));
}

void RoomTests::duplicatePeerRejected() {
    Room room("r1");
    room.addPeer(makePeer("a"));
    try {
        room.addPeer(makePeer("a"));
        QFAIL("expected RoomError");
    } catch (const RoomError& e) {
        QVERIFY(e.code() == RoomErrorCode::PeerAlreadyInRoom);
        QCOMPARE(QString(e.what()), QString("peer already in room"));
    }
    QCOMPARE(room.size(), size_t(1));
}

void RoomTests::initiatorClearedOnLeaveWithoutPromotion() {
    Room room("r1");
    room.addPeer(makePeer("a"));
    room.addPeer(makePeer("b"));

    QVERIFY(room.removePeer("a"));
    QVERIFY(room.initiatorId().empty());
    QVERIFY(!room.isInitiator("b"));
    QVERIFY(!room.removePeer("a"));

    // Re-election happens at the next join.
    QVERIFY(room.addPeer(makePeer("c")));
    QCOMPARE(QString::fromStdString(room.initiatorId()), QString("c"));
}

void RoomTests::readySetFollowsMembership() {
    Room room("r1");
    room.addPeer(makePeer("a"));
    room.addPeer(makePeer("b"));

    QVERIFY(room.setReady("a", true));
    QVERIFY(room.setReady("b", true));
    QVERIFY(!room.setReady("ghost", true));
    QCOMPARE(room.readyCount(), size_t(2));

    QVERIFY(room.setReady("b", false));
    QCOMPARE(room.readyCount(), size_t(1));

    room.removePeer("a");
    QCOMPARE(room.readyCount(), size_t(0));
}

void RoomTests::userCountBroadcastOnlyOnChange() {
    Room room("r1");
    QVERIFY(!room.broadcastUserCountIfChanged());

    auto a = makePeer("a");
    room.addPeer(a);
    QVERIFY(room.broadcastUserCountIfChanged());
    auto frames = a->take();
    QCOMPARE(frames.size(), size_t(1));
    QCOMPARE(frameType(frames[0]), QString("userCount"));
    QCOMPARE(frameObject(frames[0]).value("content").toInt(), 1);
    QVERIFY(!room.broadcastUserCountIfChanged());
    QVERIFY(a->take().empty());

    room.addPeer(makePeer("b"));
    room.removePeer("b");
    QVERIFY(!room.broadcastUserCountIfChanged());
    QCOMPARE(room.lastBroadcastUserCount(), size_t(1));
}

void RoomTests::unchangedCountGoesToJoinerOnly() {
    Room room("r1");
    auto a = makePeer("a");
    auto b = makePeer("b");
    room.addPeer(a);
    room.addPeer(b);
    room.broadcastUserCountIfChanged();
    a->take();
    b->take();

    room.removePeer("b");
    auto c = makePeer("c");
    room.addPeer(c);
    QVERIFY(!room.broadcastUserCountIfChanged(c));
    QVERIFY(a->take().empty());
    auto frames = c->take();
    QCOMPARE(frames.size(), size_t(1));
    QCOMPARE(frameObject(frames[0]).value("content").toInt(), 2);

    // Not a member: nothing is sent.
    QVERIFY(!room.broadcastUserCountIfChanged(b));
    QVERIFY(b->take().empty());
}

void RoomTests::admittedCallbackRunsBeforeMembership() {
    Room room("r1");
    auto a = makePeer("a");
    auto b = makePeer("b");
    std::vector<bool> results;

    room.addPeer(a, [&](bool is_initiator) {
        results.push_back(is_initiator);
        a->send("welcome-a");
    });
    room.addPeer(b, [&](bool is_initiator) {
        results.push_back(is_initiator);
        b->send("welcome-b");
    });
    QCOMPARE(results.size(), size_t(2));
    QVERIFY(results[0]);
    QVERIFY(!results[1]);

    room.broadcast("hello");
    auto frames = b->take();
    QCOMPARE(frames.size(), size_t(2));
    QCOMPARE(QString::fromStdString(frames[0]), QString("welcome-b"));

    bool called = false;
    try {
        room.addPeer(makePeer("a"), [&](bool) { called = true; });
        QFAIL("expected RoomError");
    } catch (const RoomError&) {
    }
    QVERIFY(!called);
}

void RoomTests::allReadyClaimedOnce() {
    Room room("r1");
    room.addPeer(makePeer("a"));
    room.addPeer(makePeer("b"));
    room.setReady("a", true);
    room.setReady("b", true);

    QVERIFY(!room.claimAllReadyAnnouncement());
    room.markMeetingStarted();
    QVERIFY(room.meetingStarted());
    QVERIFY(room.claimAllReadyAnnouncement());
    QVERIFY(!room.claimAllReadyAnnouncement());
}

void RoomTests::broadcastExcludesSender() {
    Room room("r1");
    auto a = makePeer("a");
    auto b = makePeer("b");
    auto c = makePeer("c");
    room.addPeer(a);
    room.addPeer(b);
    room.addPeer(c);

    room.broadcast("hello", "a");
    QVERIFY(a->take().empty());
    QCOMPARE(b->take().size(), size_t(1));
    QCOMPARE(c->take().size(), size_t(1));

    room.closeAll();
    QVERIFY(a->isClosed());
    QVERIFY(c->isClosed());
}

void RoomTests::directoryGetOrCreateIsShared() {
    RoomDirectory directory;
    auto first = directory.getOrCreateRoom("r1");
    auto second = directory.getOrCreateRoom("r1");
    QVERIFY(first == second);
    QCOMPARE(directory.roomCount(), size_t(1));
    QVERIFY(directory.getRoom("r1") == first);
}

void RoomTests::directoryGetRoomUnknownThrows() {
    RoomDirectory directory;
    QVERIFY(directory.findRoom("nope") == nullptr);
    try {
        directory.getRoom("nope");
        QFAIL("expected RoomError");
    } catch (const RoomError& e) {
        QVERIFY(e.code() == RoomErrorCode::RoomNotFound);
        QCOMPARE(QString(e.what()), QString("room not found"));
    }
    QCOMPARE(directory.roomCount(), size_t(0));
}

void RoomTests::directoryRejectsPeerInAnotherRoom() {
    RoomDirectory directory;
    auto a = makePeer("a");
    auto joined = directory.join("r1", a);
    QVERIFY(joined.is_initiator);
    QVERIFY(a->room() == joined.room);

    bool thrown = false;
    try {
        directory.join("r2", makePeer("a"));
    } catch (const RoomError& e) {
        thrown = e.code() == RoomErrorCode::PeerAlreadyInRoom;
    }
    QVERIFY(thrown);
    QVERIFY(directory.containsPeer("a"));
    QCOMPARE(directory.getRoom("r1")->size(), size_t(1));
}

void RoomTests::directoryLeaveIgnoresImpostor() {
    RoomDirectory directory;
    auto a = makePeer("a");
    directory.join("r1", a);

    auto impostor = makePeer("a");
    QVERIFY(directory.leave(impostor) == nullptr);
    QCOMPARE(directory.getRoom("r1")->size(), size_t(1));

    auto left = directory.leave(a);
    QVERIFY(left != nullptr);
    QVERIFY(left->empty());
    QVERIFY(a->room() == nullptr);
    QVERIFY(!directory.containsPeer("a"));
    QVERIFY(directory.leave(a) == nullptr);
}

void RoomTests::directoryEvictHonoursPredicate() {
    RoomDirectory directory;
    auto a = makePeer("a");
    directory.join("r1", a);

    QVERIFY(directory.evict("r1", [](const Room& room) { return room.empty(); }) == nullptr);
    QCOMPARE(directory.roomCount(), size_t(1));

    auto evicted = directory.evict("r1", [](const Room&) { return true; });
    QVERIFY(evicted != nullptr);
    QCOMPARE(directory.roomCount(), size_t(0));
    QVERIFY(!directory.containsPeer("a"));

    // The id is free again once its room is gone.
    directory.join("r2", makePeer("a"));
    QVERIFY(directory.containsPeer("a"));
}

void RoomTests::snapshotIsACopy() {
    RoomDirectory directory;
    directory.getOrCreateRoom("r1");
    auto snapshot = directory.snapshot();
    directory.getOrCreateRoom("r2");
    QCOMPARE(snapshot.size(), size_t(1));
    QCOMPARE(directory.snapshot().size(), size_t(2));
}

void RoomTests::concurrentGetOrCreateYieldsOneRoom() {
    RoomDirectory directory;
    std::vector<std::shared_ptr<Room>> seen(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < seen.size(); i++) {
        threads.emplace_back([&directory, &seen, i]() {
            seen[i] = directory.getOrCreateRoom("shared");
        });
    }
    for (auto& t : threads) t.join();

    for (const auto& room : seen) {
        QVERIFY(room == seen.front());
    }
    QCOMPARE(directory.roomCount(), size_t(1));
}

QTEST_APPLESS_MAIN(RoomTests)
#include "test_room.moc"
