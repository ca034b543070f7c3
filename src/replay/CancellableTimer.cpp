#include "CancellableTimer.h"
#include <algorithm>
#include <limits>

CancellableTimer::CancellableTimer(QObject* parent)
    : QObject(parent) {
    m_timer.setSingleShot(true);
    m_timer.setTimerType(Qt::PreciseTimer);
    connect(&m_timer, &QTimer::timeout, this, &CancellableTimer::onTimeout);
}

CancellableTimer::~CancellableTimer() {
    m_timer.stop();
}

void CancellableTimer::schedule(qint64 delayMs, std::function<void()> callback) {
    m_timer.stop();
    m_callback = std::move(callback);
    qint64 clamped = std::clamp<qint64>(delayMs, 0, std::numeric_limits<int>::max());
    m_timer.start(static_cast<int>(clamped));
}

bool CancellableTimer::cancel() {
    bool pending = m_timer.isActive();
    m_timer.stop();
    m_callback = nullptr;
    return pending;
}

void CancellableTimer::onTimeout() {
    auto callback = std::move(m_callback);
    m_callback = nullptr;
    if (callback) callback();
}
