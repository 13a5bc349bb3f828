#include "sample_feed_reader.hpp"

#include <QDebug>

namespace kvital {

SampleFeedReader::SampleFeedReader(QObject *parent)
    : QObject(parent)
{
}

SampleFeedReader::~SampleFeedReader()
{
    stop();
}

bool SampleFeedReader::start(const QString &program, const QStringList &arguments)
{
    if (process_) {
        return true;
    }

    process_ = new QProcess(this);
    process_->setProgram(program);
    process_->setArguments(arguments);
    // stdout carries the samples; provider diagnostics go to our stderr.
    process_->setProcessChannelMode(QProcess::ForwardedErrorChannel);

    connect(process_, &QProcess::readyReadStandardOutput,
            this, &SampleFeedReader::handleReadyRead);
    connect(process_,
            QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
            this,
            &SampleFeedReader::handleFinished);

    process_->start();
    if (!process_->waitForStarted(3000)) {
        qWarning() << "SampleFeedReader: failed to start" << program
                   << "-" << process_->errorString();
        delete process_;
        process_ = nullptr;
        return false;
    }

    qInfo() << "SampleFeedReader: started" << program << arguments;
    return true;
}

void SampleFeedReader::stop()
{
    if (!process_) {
        return;
    }
    process_->disconnect(this);
    process_->kill();
    process_->waitForFinished(1000);
    delete process_;
    process_ = nullptr;
    buffer_.clear();
}

void SampleFeedReader::handleReadyRead()
{
    if (!process_) {
        return;
    }

    buffer_.append(process_->readAllStandardOutput());

    int index = 0;
    while (true) {
        const int newline = buffer_.indexOf('\n', index);
        if (newline < 0) {
            break;
        }

        const QByteArray line = buffer_.mid(index, newline - index).trimmed();
        if (!line.isEmpty()) {
            processLine(line);
        }

        index = newline + 1;
    }

    // Keep any partial line for next time.
    if (index > 0) {
        buffer_ = buffer_.mid(index);
    }
}

void SampleFeedReader::handleFinished(int exitCode, QProcess::ExitStatus status)
{
    qWarning() << "SampleFeedReader: provider exited with code" << exitCode
               << (status == QProcess::CrashExit ? "(crashed)" : "");

    // Flush a final line that was not newline-terminated.
    const QByteArray rest = buffer_.trimmed();
    buffer_.clear();
    if (!rest.isEmpty()) {
        processLine(rest);
    }

    process_->deleteLater();
    process_ = nullptr;
}

std::vector<BiometricSample> SampleFeedReader::parseLine(const QByteArray &line)
{
    return samplesFromJsonString(QString::fromUtf8(line));
}

void SampleFeedReader::processLine(const QByteArray &line)
{
    const auto samples = parseLine(line);
    if (samples.empty()) {
        qDebug() << "SampleFeedReader: no usable samples in line" << line.left(120);
        return;
    }

    emit samplesReceived(samples);
}

} // namespace kvital
