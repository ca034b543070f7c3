#pragma once

#include <QObject>
#include <QTimer>
#include <functional>

// A single delayed action that can be withdrawn. Scheduling again replaces
// the pending action. After cancel() the callback never runs.
class CancellableTimer : public QObject {
    Q_OBJECT
public:
    explicit CancellableTimer(QObject* parent = nullptr);
    ~CancellableTimer();

    void schedule(qint64 delayMs, std::function<void()> callback);
    // Returns true if an action was pending
    bool cancel();

private slots:
    void onTimeout();

private:
    QTimer m_timer;
    std::function<void()> m_callback;
};
