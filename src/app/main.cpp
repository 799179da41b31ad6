#include "core/library/image_library.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTextStream>
#include <QThread>

namespace {

constexpr unsigned long kPollIntervalMs = 250;

void printJson(const QJsonDocument& doc)
{
    QTextStream out(stdout);
    out << doc.toJson(QJsonDocument::Indented);
}

void printJson(const QJsonObject& object)
{
    printJson(QJsonDocument(object));
}

void printJson(const QJsonArray& array)
{
    printJson(QJsonDocument(array));
}

int fail(const QString& message)
{
    QTextStream err(stderr);
    err << message << Qt::endl;
    return 1;
}

vl::Settings loadSettings(const QString& dataDir)
{
    if (!dataDir.isEmpty()) {
        const QString absolute = QDir(dataDir).absolutePath();
        const std::optional<vl::Settings> stored =
            vl::SettingsManager::load(QDir(absolute).filePath(QStringLiteral("settings.json")),
                                      absolute);
        if (stored) {
            return *stored;
        }
        return vl::SettingsManager::defaults(absolute);
    }

    const std::optional<vl::Settings> stored = vl::SettingsManager::load();
    return stored ? *stored : vl::SettingsManager::defaults();
}

int runIndex(vl::ImageLibrary& library, const QString& root, const QString& tag)
{
    const QString absolute = QDir(root).absolutePath();
    const std::optional<QString> label = tag.isEmpty() ? std::nullopt : std::optional<QString>(tag);
    const QString jobId = library.submitIndexJob(absolute, label);

    QTextStream err(stderr);
    int lastProgress = -1;
    for (;;) {
        const std::optional<vl::IndexJob> job = library.jobStatus(jobId);
        if (!job) {
            return fail(QStringLiteral("Job %1 disappeared").arg(jobId));
        }
        if (job->progress != lastProgress) {
            lastProgress = job->progress;
            err << QStringLiteral("[%1] %2% (%3/%4)")
                       .arg(jobId)
                       .arg(job->progress)
                       .arg(job->indexed)
                       .arg(job->total)
                << Qt::endl;
        }
        if (job->done) {
            printJson(vl::indexJobToJson(*job));
            return job->error ? 1 : 0;
        }
        QThread::msleep(kPollIntervalMs);
    }
}

int runSearch(const vl::ImageLibrary& library, const QString& query, int topK)
{
    QJsonArray results;
    for (const vl::SearchHit& hit : library.search(query, topK)) {
        results.append(library.describe(hit));
    }
    printJson(results);
    return 0;
}

int runList(const vl::ImageLibrary& library)
{
    QJsonArray images;
    for (const vl::ImageRecord& record : library.images()) {
        images.append(library.describe(record));
    }
    printJson(images);
    return 0;
}

int runTags(const vl::ImageLibrary& library)
{
    QJsonArray tags;
    for (const vl::Tag& tag : library.tags()) {
        tags.append(vl::tagToJson(tag));
    }
    printJson(tags);
    return 0;
}

QJsonObject changedResult(bool changed)
{
    QJsonObject json;
    json.insert(QStringLiteral("changed"), changed);
    return json;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("visualoom"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Catalog local pictures and find them by tag or description.\n\n"
        "Commands:\n"
        "  index <dir>                  Index new images under dir\n"
        "  search <query>               Search (@person #topic free text)\n"
        "  tag-add <image-id> <name>    Tag an image\n"
        "  tag-remove <image-id> <name> Untag an image\n"
        "  tags                         List tags\n"
        "  list                         List catalogued images\n"
        "  folders                      List folders containing images\n"
        "  remove <image-id>            Remove an image from the catalog"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dataDirOption(
        QStringList{QStringLiteral("d"), QStringLiteral("data-dir")},
        QStringLiteral("Directory holding the catalog and tag files."),
        QStringLiteral("dir"));
    const QCommandLineOption tagOption(
        QStringList{QStringLiteral("t"), QStringLiteral("tag")},
        QStringLiteral("Tag applied to images found by index."),
        QStringLiteral("name"));
    const QCommandLineOption topKOption(
        QStringList{QStringLiteral("k"), QStringLiteral("top-k")},
        QStringLiteral("Maximum semantic matches for search."),
        QStringLiteral("n"));
    parser.addOption(dataDirOption);
    parser.addOption(tagOption);
    parser.addOption(topKOption);
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("Command to run."));
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }

    const vl::Settings settings = loadSettings(parser.value(dataDirOption));
    vl::ImageLibrary library(settings);
    library.open();

    const QString command = args.first();
    if (command == QLatin1String("index") && args.size() == 2) {
        return runIndex(library, args.at(1), parser.value(tagOption));
    }
    if (command == QLatin1String("search") && args.size() >= 2) {
        int topK = 0;
        if (parser.isSet(topKOption)) {
            bool ok = false;
            topK = parser.value(topKOption).toInt(&ok);
            if (!ok || topK <= 0) {
                return fail(QStringLiteral("--top-k expects a positive integer"));
            }
        }
        return runSearch(library, args.mid(1).join(QChar(' ')), topK);
    }
    if (command == QLatin1String("tag-add") && args.size() == 3) {
        printJson(changedResult(library.addTag(args.at(1), args.at(2))));
        return 0;
    }
    if (command == QLatin1String("tag-remove") && args.size() == 3) {
        printJson(changedResult(library.removeTag(args.at(1), args.at(2))));
        return 0;
    }
    if (command == QLatin1String("tags") && args.size() == 1) {
        return runTags(library);
    }
    if (command == QLatin1String("list") && args.size() == 1) {
        return runList(library);
    }
    if (command == QLatin1String("folders") && args.size() == 1) {
        printJson(QJsonArray::fromStringList(library.folders()));
        return 0;
    }
    if (command == QLatin1String("remove") && args.size() == 2) {
        if (!library.removeImage(args.at(1))) {
            return fail(QStringLiteral("Unknown image id: %1").arg(args.at(1)));
        }
        printJson(changedResult(true));
        return 0;
    }

    return fail(QStringLiteral("Unknown command or wrong arguments: %1\nSee --help.")
                    .arg(args.join(QChar(' '))));
}
