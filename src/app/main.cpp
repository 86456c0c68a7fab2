#include "core/cache/cache_key.h"
#include "core/cache/cache_stack.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"
#include "core/shared/time_source.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitMiss = 1;
constexpr int kExitError = 2;

int usageError(QCommandLineParser& parser, const QString& message)
{
    QTextStream err(stderr);
    err << message << Qt::endl << Qt::endl << parser.helpText();
    return kExitError;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("vidqa-cache"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Inspect and maintain the vidqa response cache."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption(
        QStringLiteral("config"), QStringLiteral("Settings file to load."), QStringLiteral("path"));
    const QCommandLineOption cacheDirOption(
        QStringLiteral("cache-dir"), QStringLiteral("Override the cache directory."),
        QStringLiteral("dir"));
    parser.addOption(configOption);
    parser.addOption(cacheDirOption);
    parser.addPositionalArgument(
        QStringLiteral("command"),
        QStringLiteral("status <video> | mark <video> | get <video> <query> | "
                       "put <video> <query> <response> | purge"));
    parser.process(app);

    const QString configPath = parser.isSet(configOption)
        ? parser.value(configOption)
        : vq::SettingsManager::settingsFilePath();
    vq::Settings settings = vq::SettingsManager::load(configPath)
                                .value_or(vq::SettingsManager::defaults());
    if (parser.isSet(cacheDirOption)) {
        settings.cacheDir = parser.value(cacheDirOption);
    }

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        return usageError(parser, QStringLiteral("missing command"));
    }
    const QString command = args.first();

    auto stack = vq::CacheStack::open(settings, vq::SystemTimeSource::instance());
    if (!stack) {
        QTextStream(stderr) << "cannot open cache at " << settings.cacheDir << Qt::endl;
        return kExitError;
    }
    vq::TieredCacheManager& cache = stack->manager();
    QTextStream out(stdout);

    if (command == QLatin1String("status") && args.size() == 2) {
        const bool processed = cache.hasProcessed(args.at(1));
        out << (processed ? "processed" : "not processed") << Qt::endl;
        return processed ? kExitOk : kExitMiss;
    }

    if (command == QLatin1String("mark") && args.size() == 2) {
        if (!cache.markProcessed(args.at(1))) {
            QTextStream(stderr) << "failed to record processed state" << Qt::endl;
            return kExitError;
        }
        return kExitOk;
    }

    if (command == QLatin1String("get") && args.size() == 3) {
        const std::optional<QString> response = cache.getResponse(args.at(1), args.at(2));
        if (!response) {
            LOG_INFO(vqCore, "No cached response for %s",
                     qUtf8Printable(vq::CacheKey::queryResponse(args.at(1), args.at(2)).encoded()));
            return kExitMiss;
        }
        out << *response << Qt::endl;
        return kExitOk;
    }

    if (command == QLatin1String("put") && args.size() == 4) {
        if (!cache.putResponse(args.at(1), args.at(2), args.at(3))) {
            QTextStream(stderr) << "failed to store response" << Qt::endl;
            return kExitError;
        }
        return kExitOk;
    }

    if (command == QLatin1String("purge") && args.size() == 1) {
        out << "removed " << cache.purgeExpired() << " expired entries" << Qt::endl;
        return kExitOk;
    }

    return usageError(parser, QStringLiteral("unknown command or wrong arguments: %1")
                                  .arg(args.join(QLatin1Char(' '))));
}
