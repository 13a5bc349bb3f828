#include <QtTest>
#include <QFile>
#include <QTemporaryDir>

#include "kvital/config.hpp"
#include "kvital/freshness.hpp"

using namespace kvital;

class TestFreshness : public QObject
{
    Q_OBJECT

private:
    QString writeConfig(const QByteArray &contents)
    {
        const QString path = dir_.filePath(QStringLiteral("kvitald-%1.conf").arg(counter_++));
        QFile file(path);
        if (!file.open(QIODevice::WriteOnly)) {
            return QString();
        }
        file.write(contents);
        return path;
    }

    QTemporaryDir dir_;
    int counter_ = 0;

private slots:
    void statusStrings()
    {
        const FreshnessStatus all[] = {
            FreshnessStatus::Silent, FreshnessStatus::RecentlyUpdated,
            FreshnessStatus::WaitingForData, FreshnessStatus::Computing,
        };
        for (FreshnessStatus status : all) {
            QCOMPARE(freshnessStatusFromString(freshnessStatusToString(status)), std::optional<FreshnessStatus>(status));
        }
        QCOMPARE(freshnessStatusToString(FreshnessStatus::WaitingForData), QStringLiteral("waiting_for_data"));
        QCOMPARE(freshnessStatusFromString(QStringLiteral(" Computing ")), std::optional<FreshnessStatus>(FreshnessStatus::Computing));
        QVERIFY(!freshnessStatusFromString(QStringLiteral("stale")).has_value());
    }

    void messages_data()
    {
        QTest::addColumn<FreshnessStatus>("status");
        QTest::addColumn<bool>("complete");
        QTest::addColumn<int>("hour");
        QTest::addColumn<QString>("message");

        QTest::newRow("silent") << FreshnessStatus::Silent << true << 14 << QString();
        QTest::newRow("updated complete") << FreshnessStatus::RecentlyUpdated << true << 14
                                          << QStringLiteral("Score updated with complete data");
        QTest::newRow("updated partial") << FreshnessStatus::RecentlyUpdated << false << 14
                                         << QStringLiteral("Score updated, monitoring for more data");
        QTest::newRow("waiting morning") << FreshnessStatus::WaitingForData << false << 7
                                         << QStringLiteral("Waiting for watch sync");
        QTest::newRow("waiting at ten") << FreshnessStatus::WaitingForData << false << 10
                                        << QStringLiteral("Monitoring for health data updates");
        QTest::newRow("computing") << FreshnessStatus::Computing << false << 3
                                   << QStringLiteral("Updating score");
    }

    void messages()
    {
        QFETCH(FreshnessStatus, status);
        QFETCH(bool, complete);
        QFETCH(int, hour);
        QFETCH(QString, message);

        QCOMPARE(freshnessMessage(status, complete, hour), message);
    }

    void missingConfigUsesDefaults()
    {
        const DaemonConfig config = loadConfig(dir_.filePath(QStringLiteral("absent.conf")));
        QCOMPARE(config.baseline.windowDays, 14);
        QCOMPARE(config.baseline.minCoverage, 7);
        QCOMPARE(config.cache.capacity, 100);
        QCOMPARE(config.coordinator.workerThreads, 4);
        QCOMPARE(config.scoring.curve.anchorScore, 75.0);
        QVERIFY(config.feed.command.isEmpty());
        QVERIFY(config.databasePath.isEmpty());
    }

    void configOverridesDefaults()
    {
        const QString path = writeConfig(
            "[baseline]\n"
            "windowDays=21\n"
            "minCoverage=10\n"
            "[curve]\n"
            "anchorScore=70\n"
            "[cache]\n"
            "capacity=500\n"
            "maxWriteRetries=5\n"
            "[coordinator]\n"
            "workerThreads=2\n"
            "recentWindowMinutes=45\n"
            "[feed]\n"
            "command=/usr/bin/health-export\n"
            "arguments=--follow,--json\n"
            "[storage]\n"
            "path=/var/lib/kvital/scores.db\n");
        QVERIFY(!path.isEmpty());

        const DaemonConfig config = loadConfig(path);
        QCOMPARE(config.baseline.windowDays, 21);
        QCOMPARE(config.baseline.minCoverage, 10);
        QCOMPARE(config.scoring.curve.anchorScore, 70.0);
        QCOMPARE(config.cache.capacity, 500);
        QCOMPARE(config.cache.maxWriteRetries, 5);
        QCOMPARE(config.coordinator.workerThreads, 2);
        QCOMPARE(config.coordinator.recentWindowMinutes, 45);
        QCOMPARE(config.feed.command, QStringLiteral("/usr/bin/health-export"));
        QCOMPARE(config.feed.arguments, (QStringList{QStringLiteral("--follow"), QStringLiteral("--json")}));
        QCOMPARE(config.databasePath, QStringLiteral("/var/lib/kvital/scores.db"));
    }

    void outOfRangeValuesFallBack()
    {
        const QString path = writeConfig(
            "[baseline]\n"
            "windowDays=0\n"
            "minCoverage=abc\n"
            "[cache]\n"
            "capacity=-3\n"
            "[curve]\n"
            "anchorScore=150\n");
        QVERIFY(!path.isEmpty());

        const DaemonConfig config = loadConfig(path);
        QCOMPARE(config.baseline.windowDays, 14);
        QCOMPARE(config.baseline.minCoverage, 7);
        QCOMPARE(config.cache.capacity, 100);
        QCOMPARE(config.scoring.curve.anchorScore, 75.0);
    }
};

QTEST_GUILESS_MAIN(TestFreshness)
#include "test_freshness.moc"
