#include "pickcal/StatusLog.h"

#include <QDebug>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <utility>

#include "pickcal/Logger.h"

namespace pickcal {

QString StatusLine::formatted() const
{
    return timestamp.toString(QStringLiteral("hh:mm:ss.zzz")) + QStringLiteral(" [") +
           Logger::levelToken(level) + QStringLiteral("] ") + text;
}

StatusLog::StatusLog(std::size_t capacity)
    : m_capacity(std::max<std::size_t>(1, capacity))
{
    m_deliveryThread = std::thread(&StatusLog::deliveryLoop, this);
}

StatusLog::~StatusLog()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_outboxChanged.notify_all();
    m_deliveryThread.join();
}

void StatusLog::append(QtMsgType level, const QString &text)
{
    StatusLine line;
    line.timestamp = QDateTime::currentDateTime();
    line.level = level;
    line.text = text;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        line.sequence = m_nextSequence++;
        m_lines.push_back(line);
        while (m_lines.size() > m_capacity) {
            m_lines.pop_front();
            ++m_dropped;
        }
        if (m_subscribers.empty()) {
            return;
        }
        m_outbox.push_back(std::move(line));
        while (m_outbox.size() > m_capacity) {
            m_outbox.pop_front();
            ++m_undelivered;
        }
    }
    m_outboxChanged.notify_all();
}

void StatusLog::deliveryLoop()
{
    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            // Drains what is queued before exiting.
            m_outboxChanged.wait(lock, [this]() { return m_stopping || !m_outbox.empty(); });
            if (m_outbox.empty()) {
                return;
            }
        }

        std::lock_guard<std::mutex> deliveryLock(m_deliveryMutex);
        std::deque<StatusLine> batch;
        std::vector<Subscriber> subscribers;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            batch.swap(m_outbox);
            m_delivering = true;
            subscribers.reserve(m_subscribers.size());
            for (const auto &entry : m_subscribers) {
                subscribers.push_back(entry.second);
            }
        }

        // A failing consumer never stops delivery to the others.
        for (const auto &line : batch) {
            for (const auto &subscriber : subscribers) {
                try {
                    subscriber(line);
                } catch (const std::exception &ex) {
                    qWarning() << "Status log subscriber threw:" << ex.what();
                }
            }
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_delivering = false;
        }
        m_outboxChanged.notify_all();
    }
}

std::vector<StatusLine> StatusLog::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<StatusLine>(m_lines.begin(), m_lines.end());
}

std::vector<StatusLine> StatusLog::tail(std::size_t count) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::size_t n = std::min(count, m_lines.size());
    return std::vector<StatusLine>(m_lines.end() - static_cast<std::ptrdiff_t>(n), m_lines.end());
}

std::vector<StatusLine> StatusLog::linesAfter(quint64 sequence) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto first = std::find_if(m_lines.begin(), m_lines.end(), [sequence](const StatusLine &line) {
        return line.sequence > sequence;
    });
    return std::vector<StatusLine>(first, m_lines.end());
}

int StatusLog::subscribe(Subscriber subscriber)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const int id = m_nextSubscriberId++;
    m_subscribers.emplace(id, std::move(subscriber));
    return id;
}

void StatusLog::unsubscribe(int id)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_subscribers.erase(id);
    }
    // A batch already handed out may still include this subscriber.
    if (std::this_thread::get_id() != m_deliveryThread.get_id()) {
        std::lock_guard<std::mutex> deliveryLock(m_deliveryMutex);
    }
}

bool StatusLog::waitForDelivery(std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_outboxChanged.wait_for(lock, timeout, [this]() { return m_outbox.empty() && !m_delivering; });
}

void StatusLog::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lines.clear();
}

std::size_t StatusLog::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lines.size();
}

quint64 StatusLog::droppedCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dropped;
}

quint64 StatusLog::undeliveredCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_undelivered;
}

quint64 StatusLog::lastSequence() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_nextSequence - 1;
}

} // namespace pickcal
