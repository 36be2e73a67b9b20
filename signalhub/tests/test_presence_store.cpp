#include <QtTest/QtTest>

#include "presence/in_memory_presence_store.hpp"

using signalhub::InMemoryPresenceStore;
using signalhub::PresenceStore;
using namespace std::chrono_literals;

class PresenceStoreTests : public QObject {
    Q_OBJECT

private slots:
    void typingKeyLayout();
    void setAndExpire();
    void clearRemovesKey();
    void scanIsScopedToRoom();
    void refreshExtendsExpiry();
    void purgeCountsRemovedKeys();
};

void PresenceStoreTests::typingKeyLayout() {
    QCOMPARE(QString::fromStdString(PresenceStore::typingKey("r1", "a")), QString("typing:r1:a"));
}

void PresenceStoreTests::setAndExpire() {
    auto now = PresenceStore::Clock::now();
    InMemoryPresenceStore store([&now]() { return now; });

    QVERIFY(store.setTyping("r1", "a", 5s));
    QVERIFY(store.typingPeers("r1") == std::vector<std::string>({"a"}));

    now += 5s;
    QVERIFY(store.typingPeers("r1").empty());
    QCOMPARE(store.keyCount(), size_t(0));
}

void PresenceStoreTests::clearRemovesKey() {
    InMemoryPresenceStore store;
    store.setTyping("r1", "a", 5s);
    QVERIFY(store.clearTyping("r1", "a"));
    QVERIFY(store.clearTyping("r1", "missing"));
    QCOMPARE(store.keyCount(), size_t(0));
}

void PresenceStoreTests::scanIsScopedToRoom() {
    InMemoryPresenceStore store;
    store.setTyping("r1", "b", 5s);
    store.setTyping("r1", "a", 5s);
    store.setTyping("r10", "c", 5s);
    store.setTyping("r2", "d", 5s);

    QVERIFY(store.typingPeers("r1") == std::vector<std::string>({"a", "b"}));
    QVERIFY(store.typingPeers("r10") == std::vector<std::string>({"c"}));
    QVERIFY(store.typingPeers("r3").empty());
}

void PresenceStoreTests::refreshExtendsExpiry() {
    auto now = PresenceStore::Clock::now();
    InMemoryPresenceStore store([&now]() { return now; });

    store.setTyping("r1", "a", 5s);
    now += 4s;
    store.setTyping("r1", "a", 5s);
    now += 4s;
    QVERIFY(store.typingPeers("r1") == std::vector<std::string>({"a"}));
}

void PresenceStoreTests::purgeCountsRemovedKeys() {
    auto now = PresenceStore::Clock::now();
    InMemoryPresenceStore store([&now]() { return now; });

    store.setTyping("r1", "a", 1s);
    store.setTyping("r1", "b", 1s);
    store.setTyping("r2", "c", 10s);
    now += 2s;
    QCOMPARE(store.purgeExpired(), size_t(2));
    QCOMPARE(store.keyCount(), size_t(1));
}

QTEST_APPLESS_MAIN(PresenceStoreTests)
#include "test_presence_store.moc"
