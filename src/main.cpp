#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStandardPaths>
#include <QTextStream>
#include <QUuid>

#include "config/config_store.h"
#include "core/bootstrap.h"
#include "core/log_manager.h"

namespace {

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err()
{
    static QTextStream stream(stderr);
    return stream;
}

void printFailure(const DomainFailure& failure)
{
    err() << "error: " << failure.code << ": " << failure.message << Qt::endl;
}

int runCheck(const ConfigStore& store)
{
    const GatewayConfig& config = store.config();
    out() << "configuration: " << store.filePath() << Qt::endl;
    out() << "default provider: " << config.effectiveDefaultProvider() << Qt::endl;
    for (const ProviderConfig& p : config.providers) {
        out() << "  " << p.name << "  " << wireFormatName(p.apiFormat) << "  " << p.baseUrl << "  ";
        if (p.passthrough)
            out() << "passthrough";
        else
            out() << p.apiKeys.size() << (p.apiKeys.size() == 1 ? " key" : " keys");
        out() << Qt::endl;
    }
    return 0;
}

int runAliases(Bootstrap& gateway)
{
    const AliasTablePtr table = gateway.aliases().snapshot();
    for (const QString& provider : table->providers()) {
        const QList<AliasEntry> entries = table->entries(provider);
        out() << provider << (provider == table->defaultProvider() ? " (default)" : "")
              << Qt::endl;
        if (entries.isEmpty())
            out() << "  (no aliases)" << Qt::endl;
        for (const AliasEntry& e : entries) {
            out() << "  " << e.alias << " -> " << e.target;
            if (e.fallback)
                out() << "  [fallback]";
            out() << Qt::endl;
        }
    }
    for (const QString& name : table->profileNames()) {
        const auto profile = table->profile(name);
        out() << "#" << name;
        if (profile->timeoutMs)
            out() << "  timeout=" << *profile->timeoutMs / 1000 << "s";
        if (profile->maxRetries)
            out() << "  max_retries=" << *profile->maxRetries;
        out() << Qt::endl;
        for (auto it = profile->aliases.constBegin(); it != profile->aliases.constEnd(); ++it)
            out() << "  " << it.key() << " -> " << it.value() << Qt::endl;
    }
    return 0;
}

int runResolve(Bootstrap& gateway, const QString& model, const QString& provider)
{
    auto resolved = gateway.aliases().resolve(model, provider);
    if (!resolved) {
        printFailure(resolved.error());
        return 1;
    }

    QJsonArray path;
    for (const QString& step : resolved->resolutionPath)
        path.append(step);
    QJsonArray matches;
    for (const AliasMatch& m : resolved->matches) {
        matches.append(QJsonObject{
            {QStringLiteral("provider"), m.provider},
            {QStringLiteral("alias"), m.alias},
            {QStringLiteral("target"), m.target},
            {QStringLiteral("exact"), m.isExact},
        });
    }
    const QJsonObject result{
        {QStringLiteral("provider"), resolved->provider},
        {QStringLiteral("resolved_model"), resolved->resolvedModel},
        {QStringLiteral("was_resolved"), resolved->wasResolved},
        {QStringLiteral("resolution_path"), path},
        {QStringLiteral("matches"), matches},
    };
    out() << QJsonDocument(result).toJson(QJsonDocument::Indented);
    return 0;
}

QJsonObject promptBody(WireFormat format, const QString& model, const QString& prompt)
{
    const QJsonArray messages{QJsonObject{
        {QStringLiteral("role"), QStringLiteral("user")},
        {QStringLiteral("content"), prompt},
    }};
    QJsonObject body{
        {QStringLiteral("model"), model},
        {QStringLiteral("messages"), messages},
    };
    if (format == WireFormat::Anthropic)
        body.insert(QStringLiteral("max_tokens"), 1024);
    return body;
}

int runSend(QCoreApplication& app, Bootstrap& gateway, const InboundRequest& request, bool stream)
{
    RequestDispatcher* dispatcher = gateway.dispatcher();

    if (!stream) {
        auto response = dispatcher->dispatch(request);
        if (!response) {
            out() << QJsonDocument(dispatcher->errorBody(response.error(), request.clientFormat))
                         .toJson(QJsonDocument::Indented);
            return 1;
        }
        out() << QJsonDocument(*response).toJson(QJsonDocument::Indented);
        return 0;
    }

    auto session = dispatcher->dispatchStream(request, &app);
    if (!session) {
        out() << QJsonDocument(dispatcher->errorBody(session.error(), request.clientFormat))
                     .toJson(QJsonDocument::Indented);
        return 1;
    }

    int exitCode = 0;
    GatewayStreamSession* s = *session;
    QObject::connect(s, &GatewayStreamSession::chunkReady, &app, [](const QByteArray& data) {
        out() << QString::fromUtf8(data);
        out().flush();
    });
    QObject::connect(s, &GatewayStreamSession::failed, &app, [&exitCode](const DomainFailure& failure) {
        printFailure(failure);
        exitCode = 1;
    });
    QObject::connect(s, &GatewayStreamSession::finished, &app, [&app]() { app.quit(); },
                     Qt::QueuedConnection);
    s->start();
    if (!s->isFinished())
        app.exec();
    delete s;
    return exitCode;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("modelgate"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));
    app.setOrganizationName(QStringLiteral("modelgate"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("LLM gateway dispatch core"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("check | aliases | resolve <model> | send <model> <prompt>"));

    const QCommandLineOption configOption({QStringLiteral("c"), QStringLiteral("config")},
                                          QStringLiteral("Configuration file."), QStringLiteral("path"));
    const QCommandLineOption logDirOption(QStringLiteral("log-dir"),
                                          QStringLiteral("Directory for modelgate.log."), QStringLiteral("dir"));
    const QCommandLineOption verboseOption({QStringLiteral("v"), QStringLiteral("verbose")},
                                           QStringLiteral("Echo debug logging to stderr."));
    const QCommandLineOption providerOption({QStringLiteral("p"), QStringLiteral("provider")},
                                            QStringLiteral("Provider used for unprefixed models."),
                                            QStringLiteral("name"));
    const QCommandLineOption formatOption({QStringLiteral("f"), QStringLiteral("format")},
                                          QStringLiteral("Client dialect: anthropic or openai."),
                                          QStringLiteral("format"), QStringLiteral("openai"));
    const QCommandLineOption streamOption({QStringLiteral("s"), QStringLiteral("stream")},
                                          QStringLiteral("Stream the response as SSE."));
    parser.addOptions({configOption, logDirOption, verboseOption, providerOption, formatOption, streamOption});
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        parser.showHelp(1);
    const QString command = args.first();

    LogManager& log = LogManager::instance();
    if (parser.isSet(verboseOption)) {
        log.setEchoToStderr(true);
        log.setMinimumLevel(LogManager::Debug);
    }

    ConfigStore configStore;
    if (auto loaded = configStore.load(parser.value(configOption)); !loaded) {
        printFailure(loaded.error());
        return 1;
    }

    const GatewayConfig& config = configStore.config();
    QString logDir = parser.value(logDirOption);
    if (logDir.isEmpty())
        logDir = config.log.dir;
    if (!logDir.isEmpty())
        log.initialize(QDir(logDir).absolutePath());
    if (!parser.isSet(verboseOption))
        log.setMinimumLevel(LogManager::parseLevel(config.log.level));

    if (command == QStringLiteral("check"))
        return runCheck(configStore);

    Bootstrap gateway;
    gateway.setConfig(&configStore);
    if (auto started = gateway.startAll(); !started) {
        printFailure(started.error());
        return 1;
    }

    int exitCode = 1;
    if (command == QStringLiteral("aliases")) {
        exitCode = runAliases(gateway);
    } else if (command == QStringLiteral("resolve")) {
        if (args.size() < 2) {
            err() << "usage: modelgate resolve <model> [--provider name]" << Qt::endl;
        } else {
            exitCode = runResolve(gateway, args.at(1), parser.value(providerOption));
        }
    } else if (command == QStringLiteral("send")) {
        const auto format = parseWireFormat(parser.value(formatOption));
        if (args.size() < 3 || !format) {
            err() << "usage: modelgate send <model> <prompt> [--format anthropic|openai] [--stream]"
                  << Qt::endl;
        } else {
            const bool stream = parser.isSet(streamOption);
            InboundRequest request;
            request.clientFormat = *format;
            request.body = promptBody(*format, args.at(1), args.at(2));
            request.explicitProvider = parser.value(providerOption);
            request.requestId = QUuid::createUuid().toString(QUuid::WithoutBraces);
            exitCode = runSend(app, gateway, request, stream);
        }
    } else {
        err() << "unknown command: " << command << Qt::endl;
    }

    gateway.stopAll();
    return exitCode;
}
