#pragma once

#include <QObject>
#include <QProcess>
#include <QStringList>

#include <vector>

#include "kvital/sample.hpp"

namespace kvital {

// Runs the health-data provider command and turns its newline-delimited
// JSON output into sample batches, one batch per line.
class SampleFeedReader : public QObject
{
    Q_OBJECT
public:
    explicit SampleFeedReader(QObject *parent = nullptr);
    ~SampleFeedReader() override;

    // Returns false if the process cannot be started.
    bool start(const QString &program, const QStringList &arguments);

    // Stop reading and release resources.
    void stop();

    bool isRunning() const { return process_ != nullptr; }

    // Parse one line of provider output. Exposed for tests.
    static std::vector<BiometricSample> parseLine(const QByteArray &line);

signals:
    void samplesReceived(const std::vector<kvital::BiometricSample> &samples);

private slots:
    void handleReadyRead();
    void handleFinished(int exitCode, QProcess::ExitStatus status);

private:
    void processLine(const QByteArray &line);

    QProcess *process_ = nullptr;
    QByteArray buffer_;
};

} // namespace kvital
