#pragma once

#include <QCoreApplication>
#include <QEventLoop>
#include <QTimer>
#include <QTemporaryFile>
#include <QDir>
#include <QTextStream>
#include <QString>
#include <memory>

// Run the event loop for the given time so queued events and timers fire
inline void waitMs(int ms) {
    QEventLoop loop;
    QTimer::singleShot(ms, &loop, &QEventLoop::quit);
    loop.exec();
}

// Deliver queued events without waiting for timers
inline void processEvents() {
    QCoreApplication::processEvents(QEventLoop::AllEvents);
}

// Temporary file holding the given text, removed when the returned object dies
inline std::unique_ptr<QTemporaryFile> writeTempFile(const QString& contents,
                                                     const QString& pattern = "XXXXXX.csv") {
    auto file = std::make_unique<QTemporaryFile>(QDir::tempPath() + "/" + pattern);
    if (!file->open()) return nullptr;
    QTextStream out(file.get());
    out << contents;
    out.flush();
    file->close();
    return file;
}
