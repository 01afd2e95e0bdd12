#pragma once

#include <QDateTime>
#include <QString>
#include <QtGlobal>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace pickcal {

struct StatusLine {
    quint64 sequence {0};
    QDateTime timestamp;
    QtMsgType level {QtInfoMsg};
    QString text;

    [[nodiscard]] QString formatted() const;
};

/**
 * Append-only channel of human-readable status lines consumed by the log
 * display. Only the most recent `capacity` lines are retained; older lines
 * are dropped from the front. Sequence numbers keep increasing across drops
 * and clears, so pollers can resume with linesAfter().
 *
 * Subscribers are called in order on a delivery thread owned by the log, so
 * append() never waits for a consumer. At most `capacity` lines queue up for
 * a slow subscriber; beyond that the oldest undelivered lines are skipped.
 * Once unsubscribe() returns the subscriber is not called again.
 */
class StatusLog {
public:
    static constexpr std::size_t kDefaultCapacity = 500;

    using Subscriber = std::function<void(const StatusLine &)>;

    explicit StatusLog(std::size_t capacity = kDefaultCapacity);
    ~StatusLog();

    StatusLog(const StatusLog &) = delete;
    StatusLog &operator=(const StatusLog &) = delete;

    void append(QtMsgType level, const QString &text);
    void info(const QString &text) { append(QtInfoMsg, text); }

    std::vector<StatusLine> snapshot() const;
    std::vector<StatusLine> tail(std::size_t count) const;
    std::vector<StatusLine> linesAfter(quint64 sequence) const;

    int subscribe(Subscriber subscriber);
    void unsubscribe(int id);
    // Waits until every queued line has been handed to the subscribers.
    bool waitForDelivery(std::chrono::milliseconds timeout) const;

    void clear();

    std::size_t size() const;
    std::size_t capacity() const { return m_capacity; }
    quint64 droppedCount() const;
    quint64 lastSequence() const;
    quint64 undeliveredCount() const;

private:
    void deliveryLoop();

    const std::size_t m_capacity;
    mutable std::mutex m_mutex;
    std::deque<StatusLine> m_lines;
    quint64 m_nextSequence {1};
    quint64 m_dropped {0};
    std::map<int, Subscriber> m_subscribers;
    int m_nextSubscriberId {1};

    std::deque<StatusLine> m_outbox;
    quint64 m_undelivered {0};
    bool m_delivering {false};
    bool m_stopping {false};
    mutable std::condition_variable m_outboxChanged;
    // Held while subscribers run; unsubscribe() takes it to wait out a batch.
    std::mutex m_deliveryMutex;
    std::thread m_deliveryThread;
};

} // namespace pickcal
