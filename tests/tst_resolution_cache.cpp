#include <QTest>
#include "alias/resolution_cache.h"

namespace {

ResolutionResult result(const QString& provider, const QString& model)
{
    ResolutionResult r;
    r.provider = provider;
    r.resolvedModel = model;
    r.wasResolved = true;
    r.resolutionPath << model;
    return r;
}

}

class TestResolutionCache : public QObject {
    Q_OBJECT

private slots:
    void testKeyIncludesProvider() {
        QCOMPARE(ResolutionCache::key(QStringLiteral(" fast "), QStringLiteral("POE")),
                 QStringLiteral("poe|fast"));
        QVERIFY(ResolutionCache::key(QStringLiteral("fast"), {})
                != ResolutionCache::key(QStringLiteral("fast"), QStringLiteral("poe")));
    }

    void testPutAndGet() {
        ResolutionCache cache(10, 60);
        QVERIFY(!cache.get(QStringLiteral("|fast")).has_value());

        QVERIFY(cache.put(QStringLiteral("|fast"), result(QStringLiteral("poe"), QStringLiteral("gemini-flash"))));
        auto hit = cache.get(QStringLiteral("|fast"));
        QVERIFY(hit.has_value());
        QCOMPARE(hit->provider, QStringLiteral("poe"));
        QCOMPARE(hit->resolvedModel, QStringLiteral("gemini-flash"));
        QCOMPARE(cache.size(), 1);
    }

    void testBoundedSize() {
        ResolutionCache cache(3, 60);
        for (int i = 0; i < 10; ++i)
            cache.put(QStringLiteral("k%1").arg(i), result(QStringLiteral("p"), QStringLiteral("m%1").arg(i)));
        QVERIFY(cache.size() <= 3);
        QCOMPARE(cache.maxSize(), 3);
        // most recent insertions survive
        QVERIFY(cache.get(QStringLiteral("k9")).has_value());
    }

    void testZeroSizeDisablesCaching() {
        ResolutionCache cache(0, 60);
        QVERIFY(!cache.put(QStringLiteral("k"), result(QStringLiteral("p"), QStringLiteral("m"))));
        QVERIFY(!cache.get(QStringLiteral("k")).has_value());
    }

    void testEntriesExpire() {
        ResolutionCache cache(10, 60);
        cache.setTtlMs(20);
        cache.put(QStringLiteral("k"), result(QStringLiteral("p"), QStringLiteral("m")));
        QVERIFY(cache.get(QStringLiteral("k")).has_value());
        QTest::qWait(60);
        QVERIFY(!cache.get(QStringLiteral("k")).has_value());
        QCOMPARE(cache.size(), 0);
    }

    void testInvalidateAllBumpsGeneration() {
        ResolutionCache cache(10, 60);
        cache.put(QStringLiteral("a"), result(QStringLiteral("p"), QStringLiteral("m")));
        cache.put(QStringLiteral("b"), result(QStringLiteral("p"), QStringLiteral("n")));
        const quint64 before = cache.generation();

        cache.invalidateAll();

        QCOMPARE(cache.generation(), before + 1);
        QCOMPARE(cache.size(), 0);
        QVERIFY(!cache.get(QStringLiteral("a")).has_value());
    }

    void testStalePutIsRejected() {
        ResolutionCache cache(10, 60);
        const quint64 started = cache.generation();

        // a reload happens while the lookup is in flight
        cache.invalidateAll();

        QVERIFY(!cache.put(QStringLiteral("k"), result(QStringLiteral("old"), QStringLiteral("m")), started));
        QVERIFY(!cache.get(QStringLiteral("k")).has_value());
        QVERIFY(cache.put(QStringLiteral("k"), result(QStringLiteral("new"), QStringLiteral("m")),
                          cache.generation()));
        QCOMPARE(cache.get(QStringLiteral("k"))->provider, QStringLiteral("new"));
    }

    void testConfigureShrinks() {
        ResolutionCache cache(10, 60);
        for (int i = 0; i < 10; ++i)
            cache.put(QStringLiteral("k%1").arg(i), result(QStringLiteral("p"), QStringLiteral("m")));
        cache.configure(2, 60);
        QVERIFY(cache.size() <= 2);
    }
};

QTEST_MAIN(TestResolutionCache)
#include "tst_resolution_cache.moc"
