#include <QtTest/QtTest>

#include "hub/presence_broadcaster.hpp"
#include "utils/logger.hpp"
#include "test_support.hpp"

using signalhub::PresenceBroadcaster;
using signalhub::Room;

class PresenceBroadcasterTests : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void userCountOnlyWhenChanged();
    void joinerGetsCountWhenUnchanged();
    void userListNeverSuppressed();
    void joinAndLeaveAnnouncementsSkipSubject();
    void allReadyAfterMeetingStart();
};

void PresenceBroadcasterTests::initTestCase() {
    signalhub::Logger::getInstance().setLevel(signalhub::LogLevel::ERROR);
}

void PresenceBroadcasterTests::userCountOnlyWhenChanged() {
    PresenceBroadcaster presence;
    Room room("r1");
    auto a = makePeer("a");
    room.addPeer(a);

    QVERIFY(presence.broadcastUserCount(room));
    QVERIFY(!presence.broadcastUserCount(room));

    const auto frames = a->take();
    QCOMPARE(frameTypes(frames), QStringList({"userCount"}));
    QCOMPARE(frameObject(frames[0]).value("content").toInt(), 1);
}

void PresenceBroadcasterTests::joinerGetsCountWhenUnchanged() {
    PresenceBroadcaster presence;
    Room room("r1");
    auto a = makePeer("a");
    auto b = makePeer("b");
    room.addPeer(a);
    room.addPeer(b);
    presence.broadcastUserCount(room);
    a->take();
    b->take();

    // b leaves and c joins before anything is broadcast: count stays 2.
    room.removePeer("b");
    auto c = makePeer("c");
    room.addPeer(c);
    presence.publishMembership(room, c);

    QCOMPARE(frameTypes(a->take()), QStringList({"userList"}));
    const auto frames = c->take();
    QCOMPARE(frameTypes(frames), QStringList({"userCount", "userList"}));
    QCOMPARE(frameObject(frames[0]).value("content").toInt(), 2);
}

void PresenceBroadcasterTests::userListNeverSuppressed() {
    PresenceBroadcaster presence;
    Room room("r1");
    auto a = makePeer("a");
    room.addPeer(a);
    presence.broadcastUserList(room);
    presence.broadcastUserList(room);
    presence.sendUserList(room, *a);

    const auto lists = framesOfType(a->take(), "userList");
    QCOMPARE(lists.size(), size_t(3));
    QCOMPARE(toStringList(lists[2].value("content").toObject().value("users").toArray()), QStringList({"a"}));
}

void PresenceBroadcasterTests::joinAndLeaveAnnouncementsSkipSubject() {
    PresenceBroadcaster presence;
    Room room("r1");
    auto a = makePeer("a");
    auto b = makePeer("b");
    room.addPeer(a);
    room.addPeer(b);

    presence.announceJoin(room, "b");
    QVERIFY(b->take().empty());
    const auto joined = framesOfType(a->take(), "userJoined");
    QCOMPARE(joined.size(), size_t(1));
    QCOMPARE(joined[0].value("content").toString(), QString("b"));

    room.removePeer("b");
    presence.announceLeave(room, "b");
    const auto left = framesOfType(a->take(), "userLeft");
    QCOMPARE(left.size(), size_t(1));
    QCOMPARE(left[0].value("content").toString(), QString("b"));
}

void PresenceBroadcasterTests::allReadyAfterMeetingStart() {
    PresenceBroadcaster presence;
    Room room("r1");
    auto a = makePeer("a");
    auto b = makePeer("b");
    room.addPeer(a);
    room.addPeer(b);
    presence.broadcastUserCount(room);
    a->take();
    b->take();

    room.setReady("a", true);
    room.setReady("b", true);
    presence.publishReadiness(room);
    QVERIFY(a->take().empty());

    room.markMeetingStarted();
    presence.publishReadiness(room);
    presence.publishReadiness(room);
    QCOMPARE(frameTypes(a->take()), QStringList({"allReady"}));
    QCOMPARE(frameTypes(b->take()), QStringList({"allReady"}));
}

QTEST_APPLESS_MAIN(PresenceBroadcasterTests)
#include "test_presence_broadcaster.moc"
