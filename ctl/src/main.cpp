#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTextStream>
#include <QTime>

#include "kvital/common.hpp"
#include "kvital/freshness.hpp"
#include "kvital/interpretation.hpp"
#include "kvital/ipc_client.hpp"

namespace {

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

int fail(const QString &message)
{
    err() << "kvitalctl: " << message << Qt::endl;
    return 1;
}

QDate dayArgument(const QStringList &args, int index)
{
    if (args.size() <= index) {
        return QDate::currentDate();
    }
    return kvital::dayFromString(args.at(index));
}

void printScore(const kvital::CompositeScore &score, bool json)
{
    if (json) {
        out() << kvital::scoreToJsonString(score) << Qt::endl;
        return;
    }

    out() << kvital::scoreKindToString(score.kind) << " " << kvital::dayToString(score.day)
          << ": " << score.overall << (score.dataComplete ? "" : " (partial)") << Qt::endl;
    for (const auto &c : score.components) {
        out() << "  " << c.name << " " << QString::number(c.normalizedValue, 'f', 1)
              << " x " << c.weight
              << (c.complete ? QString() : QStringLiteral(" [") + kvital::scoreErrorToString(c.degradation) + QStringLiteral("]"))
              << "  " << c.description << Qt::endl;
    }

    if (score.kind == kvital::ScoreKind::Recovery) {
        out() << "  " << kvital::recoveryDirective(score) << Qt::endl;
    } else {
        out() << "  " << kvital::sleepSummary(score.overall) << Qt::endl;
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("kvitalctl"));
    app.setApplicationVersion(QStringLiteral("0.1"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Query the KVital daemon.\n\n"
        "Commands:\n"
        "  score <recovery|sleep> [day]\n"
        "  history <recovery|sleep> [days]\n"
        "  freshness <recovery|sleep> [day]\n"
        "  baseline <metric> [day]\n"
        "  inject <file|->\n"
        "  watch"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption jsonOption(QStringLiteral("json"),
                                        QStringLiteral("Print raw JSON."));
    parser.addOption(jsonOption);
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("Command to run."));
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }

    const QString command = args.at(0);
    const bool json = parser.isSet(jsonOption);

    kvital::IpcClient client;
    if (!client.connectToDaemon()) {
        return fail(QStringLiteral("cannot reach kvitald: %1").arg(client.lastError()));
    }

    if (command == QLatin1String("score") || command == QLatin1String("freshness")) {
        if (args.size() < 2) {
            return fail(QStringLiteral("%1 needs a score kind").arg(command));
        }
        const auto kind = kvital::scoreKindFromString(args.at(1));
        const QDate day = dayArgument(args, 2);
        if (!kind || !day.isValid()) {
            return fail(QStringLiteral("invalid score kind or day"));
        }

        if (command == QLatin1String("freshness")) {
            const auto status = client.freshnessStatus(*kind, day);
            if (!status) {
                return fail(client.lastError());
            }
            const auto score = client.currentScore(*kind, day);
            const bool complete = score && score->dataComplete;
            const QString message = kvital::freshnessMessage(*status, complete, QTime::currentTime().hour());
            out() << kvital::freshnessStatusToString(*status);
            if (!message.isEmpty()) {
                out() << ": " << message;
            }
            out() << Qt::endl;
            return 0;
        }

        const auto score = client.currentScore(*kind, day);
        if (!score) {
            if (!client.lastError().isEmpty()) {
                return fail(client.lastError());
            }
            out() << "no score for " << kvital::dayToString(day) << Qt::endl;
            return 0;
        }
        printScore(*score, json);
        return 0;
    }

    if (command == QLatin1String("history")) {
        if (args.size() < 2) {
            return fail(QStringLiteral("history needs a score kind"));
        }
        const auto kind = kvital::scoreKindFromString(args.at(1));
        if (!kind) {
            return fail(QStringLiteral("unknown score kind %1").arg(args.at(1)));
        }
        bool ok = true;
        const int days = args.size() > 2 ? args.at(2).toInt(&ok) : 7;
        if (!ok || days <= 0) {
            return fail(QStringLiteral("invalid day count"));
        }

        const auto scores = client.history(*kind, days);
        if (!client.lastError().isEmpty()) {
            return fail(client.lastError());
        }
        for (const auto &score : scores) {
            printScore(score, json);
        }
        return 0;
    }

    if (command == QLatin1String("baseline")) {
        if (args.size() < 2) {
            return fail(QStringLiteral("baseline needs a metric"));
        }
        const auto metric = kvital::metricKindFromString(args.at(1));
        const QDate day = dayArgument(args, 2);
        if (!metric || !day.isValid()) {
            return fail(QStringLiteral("invalid metric or day"));
        }
        const auto baseline = client.baseline(*metric, day);
        if (!baseline) {
            return fail(client.lastError().isEmpty() ? QStringLiteral("no baseline") : client.lastError());
        }
        out() << QString::fromUtf8(QJsonDocument(*baseline).toJson(
                     json ? QJsonDocument::Compact : QJsonDocument::Indented));
        out().flush();
        return 0;
    }

    if (command == QLatin1String("inject")) {
        if (args.size() < 2) {
            return fail(QStringLiteral("inject needs a file, or - for stdin"));
        }
        QFile file;
        bool opened = false;
        if (args.at(1) == QLatin1String("-")) {
            opened = file.open(stdin, QIODevice::ReadOnly);
        } else {
            file.setFileName(args.at(1));
            opened = file.open(QIODevice::ReadOnly);
        }
        if (!opened) {
            return fail(QStringLiteral("cannot read %1: %2").arg(args.at(1), file.errorString()));
        }
        const auto samples = kvital::samplesFromJsonString(QString::fromUtf8(file.readAll()));
        if (samples.empty()) {
            return fail(QStringLiteral("no usable samples"));
        }
        if (!client.injectSamples(samples)) {
            return fail(client.lastError());
        }
        out() << "injected " << samples.size() << " samples" << Qt::endl;
        return 0;
    }

    if (command == QLatin1String("watch")) {
        QObject::connect(&client, &kvital::IpcClient::scoreUpdated,
                         [json](const kvital::CompositeScore &score) { printScore(score, json); });
        QObject::connect(&client, &kvital::IpcClient::connectionChanged, [](bool connected) {
            if (!connected) {
                QCoreApplication::exit(1);
            }
        });
        return app.exec();
    }

    return fail(QStringLiteral("unknown command %1").arg(command));
}
