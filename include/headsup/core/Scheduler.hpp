#pragma once

#include <QDateTime>
#include <QObject>
#include <QSet>
#include <QString>
#include <functional>
#include <memory>
#include <vector>

#include "headsup/core/Alert.hpp"
#include "headsup/core/TimingPreferences.hpp"

class QTimer;

namespace headsup {
namespace core {

class PresentationGateway;

/**
 * Owns the time-ordered alert queue for the current event set and fires
 * alerts through a PresentationGateway.
 *
 * All calls must come from the thread that owns the scheduler. The wait loop
 * is a single-shot timer armed for the next deadline, but never for more than
 * a minute so that a suspend is noticed against the wall clock. Every queue
 * mutation cancels the pending wait and re-evaluates it.
 */
class Scheduler : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle,
        Scheduled,
        Stopped
    };

    using Clock = std::function<QDateTime()>;

    explicit Scheduler(QObject *parent = nullptr);
    ~Scheduler() override;

    void setClock(Clock clock);
    QDateTime currentTime() const;

    // Recomputes the queue (keeping pending snoozes) when running.
    void setTimingPreferences(const TimingPreferences &prefs);
    const TimingPreferences &timingPreferences() const;

    // (Re)initialises scheduling for a complete event set. Pending snoozes and
    // alerts already due but not yet shown carry over. The gateway is not
    // owned and must outlive the schedule, or stop() must be called first.
    void start(const std::vector<data::MeetingEvent> &events, PresentationGateway &gateway);
    void stop();
    bool scheduleSnooze(const data::MeetingEvent &event, int minutes);

    // Cancels the current wait and re-evaluates deadlines now, e.g. after the
    // host woke from suspend.
    void refresh();

    State state() const;
    bool hasEvent(const QString &eventId) const;
    PresentationGateway *gateway() const;
    std::vector<Alert> pendingAlerts() const;
    QDateTime nextTriggerTime() const;
    // Interval the wait loop is currently sleeping for, -1 when not armed.
    int waitIntervalMsecs() const;
    int consumedReminderCount() const;

signals:
    void queueChanged();

private:
    void stopTimers();
    void recompute();
    void launchWaitLoop();
    void runWaitIteration();
    void armWaitTimer();
    void dispatchDueAlerts(const QDateTime &now);
    void dispatch(const Alert &alert);
    void insertSorted(Alert alert);
    std::shared_ptr<const data::MeetingEvent> findEvent(const QString &eventId) const;
    static QString occurrenceKey(const Alert &alert);
    static QString occurrenceKey(const data::MeetingEvent &event, AlertChannel channel);

    Clock m_clock;
    TimingPreferences m_timing;
    State m_state = State::Idle;
    std::vector<std::shared_ptr<const data::MeetingEvent>> m_events;
    std::vector<Alert> m_queue;
    // Reminder occurrences already shown or superseded by a snooze; catch-up
    // reminders for these are not raised again.
    QSet<QString> m_consumedReminders;
    PresentationGateway *m_gateway = nullptr;
    QTimer *m_waitTimer = nullptr;
};

} // namespace core
} // namespace headsup
