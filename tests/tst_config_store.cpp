#include <QTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include "config/config_store.h"
#include "config/config_types.h"

namespace {

const QByteArray kBaseConfig = R"({
    "default_provider": "openai",
    "providers": [
        {"name": "openai", "api_key": "k1 k2", "base_url": "https://api.openai.com/v1", "timeout": 30},
        {"name": "Anthropic", "apiKey": ["a1"], "baseUrl": "https://api.anthropic.com",
         "apiFormat": "anthropic", "customHeaders": {"X-Org": "acme"}},
        {"name": "poe", "api_key": "!PASSTHRU", "base_url": "https://api.poe.com/v1"}
    ],
    "aliases": {"openai": {"Fast": "gpt-4o-mini"}},
    "fallback_aliases": {"openai": {"chat": "gpt-4o"}},
    "cache": {"alias_ttl_seconds": 60, "aliasMaxSize": 50},
    "middleware": {"debug": true, "thought_signatures": false},
    "log": {"level": "debug"}
})";

bool writeFile(const QString& path, const QByteArray& content)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;
    return file.write(content) == content.size();
}

}

class TestConfigStore : public QObject {
    Q_OBJECT

private slots:
    void testParseProvidersInDeclarationOrder() {
        auto config = ConfigStore::parse(QJsonDocument::fromJson(kBaseConfig).object(), QProcessEnvironment());
        QVERIFY(config.has_value());
        QCOMPARE(config->providerNames(),
                 QStringList({QStringLiteral("openai"), QStringLiteral("anthropic"), QStringLiteral("poe")}));
        QCOMPARE(config->defaultProvider, QStringLiteral("openai"));

        const ProviderConfig& openai = config->providers[0];
        QCOMPARE(openai.apiKeys, QStringList({QStringLiteral("k1"), QStringLiteral("k2")}));
        QCOMPARE(openai.timeoutMs, 30000);

        const ProviderConfig& anthropic = config->providers[1];
        QCOMPARE(anthropic.apiFormat, WireFormat::Anthropic);
        QCOMPARE(anthropic.customHeaders.value(QStringLiteral("X-Org")), QStringLiteral("acme"));

        QVERIFY(config->providers[2].passthrough);
    }

    void testParseAliasesAndOptions() {
        auto config = ConfigStore::parse(QJsonDocument::fromJson(kBaseConfig).object(), QProcessEnvironment());
        QVERIFY(config.has_value());
        QCOMPARE(config->aliases.value(QStringLiteral("openai")).value(QStringLiteral("fast")),
                 QStringLiteral("gpt-4o-mini"));
        QCOMPARE(config->fallbackAliases.value(QStringLiteral("openai")).value(QStringLiteral("chat")),
                 QStringLiteral("gpt-4o"));
        QCOMPARE(config->cache.aliasTtlSeconds, 60);
        QCOMPARE(config->cache.aliasMaxSize, 50);
        QCOMPARE(config->cache.aliasMaxChainLength, 8);
        QVERIFY(config->middleware.debug);
        QVERIFY(!config->middleware.thoughtSignatures);
        QCOMPARE(config->log.level, QStringLiteral("debug"));
    }

    void testEnvironmentOverrides() {
        QProcessEnvironment env;
        env.insert(QStringLiteral("OPENAI_API_KEY"), QStringLiteral("e1 e2 e3"));
        env.insert(QStringLiteral("ANTHROPIC_BASE_URL"), QStringLiteral("https://proxy.internal"));
        env.insert(QStringLiteral("OPENAI_ALIAS_SMART"), QStringLiteral("gpt-4o"));
        env.insert(QStringLiteral("OPENAI_CUSTOM_HEADER_X_TEAM_ID"), QStringLiteral("t1"));
        env.insert(QStringLiteral("MODELGATE_DEFAULT_PROVIDER"), QStringLiteral("Anthropic"));

        auto config = ConfigStore::parse(QJsonDocument::fromJson(kBaseConfig).object(), env);
        QVERIFY(config.has_value());
        QCOMPARE(config->providers[0].apiKeys.size(), 3);
        QCOMPARE(config->providers[1].baseUrl, QStringLiteral("https://proxy.internal"));
        QCOMPARE(config->aliases.value(QStringLiteral("openai")).value(QStringLiteral("smart")),
                 QStringLiteral("gpt-4o"));
        QCOMPARE(config->providers[0].customHeaders.value(QStringLiteral("X-Team-Id")), QStringLiteral("t1"));
        QCOMPARE(config->defaultProvider, QStringLiteral("anthropic"));
    }

    void testEnvironmentOnlyProvider() {
        QProcessEnvironment env;
        env.insert(QStringLiteral("GROQ_API_KEY"), QStringLiteral("g1"));
        env.insert(QStringLiteral("GROQ_BASE_URL"), QStringLiteral("https://api.groq.com/openai/v1"));
        env.insert(QStringLiteral("ORPHAN_API_KEY"), QStringLiteral("o1"));

        auto config = ConfigStore::parse(QJsonObject(), env);
        QVERIFY(config.has_value());
        QCOMPARE(config->providerNames(), QStringList({QStringLiteral("groq")}));
        QCOMPARE(config->effectiveDefaultProvider(), QStringLiteral("groq"));
    }

    void testEnvPrefix() {
        QCOMPARE(ConfigStore::envPrefix(QStringLiteral("open-router.ai")), QStringLiteral("OPEN_ROUTER_AI"));
    }

    void testValidationFailures() {
        const QProcessEnvironment env;

        auto notArray = ConfigStore::parse(QJsonObject{{QStringLiteral("providers"), QJsonObject()}}, env);
        QVERIFY(!notArray.has_value());
        QCOMPARE(notArray.error().code, QStringLiteral("configuration_invalid"));

        auto noKey = ConfigStore::parse(QJsonDocument::fromJson(R"({
            "providers": [{"name": "openai", "base_url": "https://api.openai.com/v1"}]
        })").object(), env);
        QVERIFY(!noKey.has_value());

        auto badDefault = ConfigStore::parse(QJsonDocument::fromJson(R"({
            "default_provider": "missing",
            "providers": [{"name": "openai", "api_key": "k", "base_url": "https://api.openai.com/v1"}]
        })").object(), env);
        QVERIFY(!badDefault.has_value());

        auto badChain = ConfigStore::parse(QJsonDocument::fromJson(R"({
            "providers": [{"name": "openai", "api_key": "k", "base_url": "https://api.openai.com/v1"}],
            "cache": {"alias_max_chain_length": 0}
        })").object(), env);
        QVERIFY(!badChain.has_value());
    }

    void testParseProfiles() {
        auto config = ConfigStore::parse(QJsonDocument::fromJson(R"({
            "providers": [
                {"name": "openai", "api_key": "k", "base_url": "https://api.openai.com/v1"},
                {"name": "poe", "api_key": "p", "base_url": "https://api.poe.com/v1"}
            ],
            "profiles": {
                "#Work": {"timeout": 20, "max_retries": 0,
                          "aliases": {"Fast": "openai:gpt-4o-mini", "chat": "poe:claude-sonnet"}},
                "poe": {"aliases": {"fast": "openai:gpt-4o"}}
            }
        })").object(), QProcessEnvironment());
        QVERIFY(config.has_value());
        QCOMPARE(config->profiles.size(), 2);

        const AliasProfile& work = config->profiles[0];
        QCOMPARE(work.name, QStringLiteral("work"));
        QVERIFY(work.timeoutMs.has_value() && work.maxRetries.has_value());
        QCOMPARE(*work.timeoutMs, 20000);
        QCOMPARE(*work.maxRetries, 0);
        QCOMPARE(work.aliases.value(QStringLiteral("fast")), QStringLiteral("openai:gpt-4o-mini"));

        // same name as a provider: accepted, the profile wins at resolution
        const AliasProfile& poe = config->profiles[1];
        QCOMPARE(poe.name, QStringLiteral("poe"));
        QVERIFY(!poe.timeoutMs.has_value());
        QVERIFY(!poe.maxRetries.has_value());
    }

    void testInvalidProfilesAreRejected() {
        const QProcessEnvironment env;
        auto parseWithProfiles = [&env](const QByteArray& profiles) {
            return ConfigStore::parse(QJsonDocument::fromJson(
                R"({"providers": [{"name": "openai", "api_key": "k", "base_url": "https://api.openai.com/v1"}],
                    "profiles": )" + profiles + "}").object(), env);
        };

        auto unprefixed = parseWithProfiles(R"({"work": {"aliases": {"fast": "gpt-4o-mini"}}})");
        QVERIFY(!unprefixed.has_value());
        QCOMPARE(unprefixed.error().code, QStringLiteral("configuration_invalid"));
        QVERIFY(unprefixed.error().message.contains(QStringLiteral("provider:model")));

        auto unknown = parseWithProfiles(R"({"work": {"aliases": {"fast": "mistral:small"}}})");
        QVERIFY(!unknown.has_value());
        QVERIFY(unknown.error().message.contains(QStringLiteral("mistral")));

        QVERIFY(!parseWithProfiles(R"({"work": {"timeout": 0}})").has_value());
        QVERIFY(!parseWithProfiles(R"({"work": {"max_retries": -1}})").has_value());
        QVERIFY(!parseWithProfiles(R"({"a:b": {}})").has_value());
        QVERIFY(parseWithProfiles(R"({"work": {"aliases": {"fast": "OpenAI:gpt-4o"}}})").has_value());
    }

    void testTimeoutOutOfRangeIsRejected() {
        const QProcessEnvironment env;
        auto parseWithTimeout = [&env](const QByteArray& timeout) {
            return ConfigStore::parse(QJsonDocument::fromJson(
                R"({"providers": [{"name": "openai", "api_key": "k",
                                   "base_url": "https://api.openai.com/v1", "timeout": )" + timeout + "}]}").object(), env);
        };

        // would wrap past INT_MAX once scaled to milliseconds
        auto huge = parseWithTimeout("3000000");
        QVERIFY(!huge.has_value());
        QCOMPARE(huge.error().code, QStringLiteral("configuration_invalid"));
        QVERIFY(huge.error().message.contains(QStringLiteral("timeout")));

        QVERIFY(!parseWithTimeout("10000000000000").has_value());
        QVERIFY(!parseWithTimeout("0").has_value());
        QVERIFY(!parseWithTimeout("-5").has_value());

        auto largest = parseWithTimeout("2147483");
        QVERIFY(largest.has_value());
        QCOMPARE(largest->providers[0].timeoutMs, 2147483000);
    }

    void testLoadAndRejectedReload() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.path() + QStringLiteral("/config.json");
        QVERIFY(writeFile(path, kBaseConfig));

        ConfigStore store;
        store.setEnvironment(QProcessEnvironment());
        QSignalSpy changed(&store, &ConfigStore::configChanged);
        QSignalSpy rejected(&store, &ConfigStore::reloadRejected);

        QVERIFY(store.load(path).has_value());
        QCOMPARE(changed.count(), 1);
        QCOMPARE(store.filePath(), path);
        QCOMPARE(store.config().providers.size(), 3);

        QVERIFY(writeFile(path, R"({"providers": [{"name": "openai", "api_key": ""}]})"));
        auto result = store.reload();
        QVERIFY(!result.has_value());
        QCOMPARE(rejected.count(), 1);
        QCOMPARE(changed.count(), 1);
        QCOMPARE(store.config().providers.size(), 3);

        QVERIFY(writeFile(path, "{ not json"));
        QVERIFY(!store.reload().has_value());
        QCOMPARE(rejected.count(), 2);

        QVERIFY(writeFile(path, R"({"providers": [{"name": "solo", "api_key": "s", "base_url": "https://x.example"}]})"));
        QVERIFY(store.reload().has_value());
        QCOMPARE(changed.count(), 2);
        QCOMPARE(store.config().providerNames(), QStringList({QStringLiteral("solo")}));
    }

    void testMissingFile() {
        QTemporaryDir dir;
        ConfigStore store;
        auto result = store.load(dir.path() + QStringLiteral("/absent.json"));
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::Configuration);

        ConfigStore fresh;
        QVERIFY(!fresh.reload().has_value());
    }

    void testLoadFromJson() {
        ConfigStore store;
        store.setEnvironment(QProcessEnvironment());
        QVERIFY(store.loadFromJson(kBaseConfig).has_value());
        QCOMPARE(store.config().effectiveDefaultProvider(), QStringLiteral("openai"));
    }

    void testWatchToggle() {
        ConfigStore store;
        QVERIFY(!store.isWatching());
        store.setWatchEnabled(true);
        QVERIFY(store.isWatching());
        store.setWatchEnabled(false);
        QVERIFY(!store.isWatching());
    }
};

QTEST_MAIN(TestConfigStore)
#include "tst_config_store.moc"
