#include <QTest>
#include <QThread>
#include <atomic>
#include "core/key_hash.h"
#include "provider/key_rotator.h"
#include "provider/rotation_policy.h"

namespace {

const QStringList kKeys = {QStringLiteral("k1"), QStringLiteral("k2"), QStringLiteral("k3")};

}

class TestKeyRotation : public QObject {
    Q_OBJECT

private slots:
    void testRoundRobinWraps() {
        KeyRotator rotator;
        QStringList picked;
        for (int i = 0; i < 7; ++i)
            picked.append(*rotator.next(QStringLiteral("openai"), kKeys));
        QCOMPARE(picked, QStringList({QStringLiteral("k1"), QStringLiteral("k2"), QStringLiteral("k3"),
                                      QStringLiteral("k1"), QStringLiteral("k2"), QStringLiteral("k3"),
                                      QStringLiteral("k1")}));
    }

    void testCursorsArePerProvider() {
        KeyRotator rotator;
        QCOMPARE(*rotator.next(QStringLiteral("openai"), kKeys), QStringLiteral("k1"));
        QCOMPARE(*rotator.next(QStringLiteral("openai"), kKeys), QStringLiteral("k2"));
        QCOMPARE(*rotator.next(QStringLiteral("anthropic"), kKeys), QStringLiteral("k1"));
        QCOMPARE(rotator.cursor(QStringLiteral("openai")), 2);

        rotator.forget(QStringLiteral("openai"));
        QCOMPARE(rotator.cursor(QStringLiteral("openai")), 0);
    }

    void testExcludedKeysAreSkipped() {
        KeyRotator rotator;
        const QSet<QString> exclude = {QStringLiteral("k1"), QStringLiteral("k2")};
        for (int i = 0; i < 5; ++i) {
            auto key = rotator.next(QStringLiteral("openai"), kKeys, exclude);
            QVERIFY(key.has_value());
            QCOMPARE(*key, QStringLiteral("k3"));
        }
    }

    void testExhaustion() {
        KeyRotator rotator;
        auto result = rotator.next(QStringLiteral("openai"), kKeys,
                                   {QStringLiteral("k1"), QStringLiteral("k2"), QStringLiteral("k3")});
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().code, QStringLiteral("all_keys_exhausted"));
        QCOMPARE(result.error().kind, ErrorKind::RateLimited);

        auto none = rotator.next(QStringLiteral("empty"), {});
        QVERIFY(!none.has_value());
        QCOMPARE(none.error().code, QStringLiteral("all_keys_exhausted"));
    }

    void testForeignExcludesStillExhaust() {
        // same size as the key list but not the same keys
        KeyRotator rotator;
        auto result = rotator.next(QStringLiteral("openai"), {QStringLiteral("k1"), QStringLiteral("k2")},
                                   {QStringLiteral("k1"), QStringLiteral("zz")});
        QVERIFY(!result.has_value());
    }

    void testCursorSurvivesShrinkingKeyList() {
        KeyRotator rotator;
        for (int i = 0; i < 2; ++i)
            rotator.next(QStringLiteral("openai"), kKeys);
        // the cursor points at index 2; a reload leaves two keys
        auto key = rotator.next(QStringLiteral("openai"), {QStringLiteral("a"), QStringLiteral("b")});
        QVERIFY(key.has_value());
        QCOMPARE(*key, QStringLiteral("a"));
    }

    void testConcurrentRotationIsFair() {
        KeyRotator rotator;
        constexpr int kThreads = 6;
        constexpr int kPerThread = 300;
        std::atomic<int> counts[3] = {0, 0, 0};
        std::atomic<int> excludedHandedOut{0};

        QList<QThread*> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.append(QThread::create([&, t]() {
                for (int i = 0; i < kPerThread; ++i) {
                    auto key = rotator.next(QStringLiteral("openai"), kKeys);
                    if (key)
                        ++counts[kKeys.indexOf(*key)];

                    // a request that already burned one key
                    const QSet<QString> exclude = {kKeys.at((t + i) % 3)};
                    auto retry = rotator.next(QStringLiteral("shared"), kKeys, exclude);
                    if (!retry || exclude.contains(*retry))
                        ++excludedHandedOut;
                }
            }));
            threads.last()->start();
        }
        for (QThread* t : threads) {
            t->wait();
            delete t;
        }

        constexpr int perKey = kThreads * kPerThread / 3;
        QCOMPARE(counts[0].load(), perKey);
        QCOMPARE(counts[1].load(), perKey);
        QCOMPARE(counts[2].load(), perKey);
        QCOMPARE(excludedHandedOut.load(), 0);
    }

    void testRotationPolicyStatuses() {
        QVERIFY(rotation_policy::shouldRotate(401, {}));
        QVERIFY(rotation_policy::shouldRotate(403, {}));
        QVERIFY(rotation_policy::shouldRotate(429, {}));
        QVERIFY(!rotation_policy::shouldRotate(400, R"({"error":{"message":"bad request"}})"));
        QVERIFY(!rotation_policy::shouldRotate(404, {}));
        QVERIFY(!rotation_policy::shouldRotate(500, {}));
        QVERIFY(!rotation_policy::shouldRotate(503, "quota exceeded"));
        QVERIFY(!rotation_policy::shouldRotate(200, {}));
    }

    void testRotationPolicyQuotaBodies() {
        QVERIFY(rotation_policy::shouldRotate(400, R"({"error":{"code":"insufficient_quota"}})"));
        QVERIFY(rotation_policy::shouldRotate(402, "Please check your Billing details"));
        QVERIFY(rotation_policy::shouldRotate(400, "You exceeded your current quota"));
        QVERIFY(rotation_policy::shouldRotate(418, "QUOTA EXCEEDED"));
        QVERIFY(!rotation_policy::isQuotaError("rate limit"));
    }

    void testApiKeyHash() {
        QCOMPARE(apiKeyHash(QString()), QStringLiteral("REDACTED"));
        const QString hash = apiKeyHash(QStringLiteral("sk-secret"));
        QCOMPARE(hash.size(), 8);
        QVERIFY(!hash.contains(QStringLiteral("secret")));
        QCOMPARE(apiKeyHash(QStringLiteral("sk-secret")), hash);
        QVERIFY(apiKeyHash(QStringLiteral("sk-other")) != hash);
    }
};

QTEST_MAIN(TestKeyRotation)
#include "tst_key_rotation.moc"
