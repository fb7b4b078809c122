#include "headsup/core/Scheduler.hpp"

#include "headsup/Logging.hpp"
#include "headsup/core/PresentationGateway.hpp"
#include "headsup/core/TimingPolicy.hpp"

#include <QTimer>
#include <algorithm>
#include <exception>
#include <iterator>

namespace headsup {
namespace core {

namespace {
// Timers do not advance while the system sleeps, so never wait longer than
// this before comparing against the wall clock again.
constexpr int kMaxWaitMsecs = 60 * 1000;
constexpr int kErrorBackoffMsecs = 5 * 1000;

bool triggersBefore(const Alert &lhs, const Alert &rhs)
{
    return lhs.triggerAt() < rhs.triggerAt();
}
} // namespace

Scheduler::Scheduler(QObject *parent)
    : QObject(parent)
    , m_clock([] { return QDateTime::currentDateTimeUtc(); })
    , m_waitTimer(new QTimer(this))
{
    m_waitTimer->setSingleShot(true);
    m_waitTimer->setTimerType(Qt::PreciseTimer);
    connect(m_waitTimer, &QTimer::timeout, this, &Scheduler::runWaitIteration);
}

Scheduler::~Scheduler() = default;

void Scheduler::setClock(Clock clock)
{
    if (clock) {
        m_clock = std::move(clock);
    }
}

QDateTime Scheduler::currentTime() const
{
    return m_clock();
}

void Scheduler::setTimingPreferences(const TimingPreferences &prefs)
{
    if (prefs == m_timing) {
        return;
    }
    m_timing = prefs;
    if (m_state != State::Scheduled) {
        return;
    }
    qCInfo(HEADSUP_SCHEDULER_LOG) << "Scheduler::setTimingPreferences: alert preferences changed, rescheduling"
                                  << m_events.size() << "events";
    recompute();
    launchWaitLoop();
}

const TimingPreferences &Scheduler::timingPreferences() const
{
    return m_timing;
}

void Scheduler::start(const std::vector<data::MeetingEvent> &events, PresentationGateway &gateway)
{
    qCInfo(HEADSUP_SCHEDULER_LOG) << "Scheduler::start: scheduling" << events.size() << "events";

    m_events.clear();
    m_events.reserve(events.size());
    for (const auto &event : events) {
        m_events.push_back(std::make_shared<const data::MeetingEvent>(event));
    }
    m_gateway = &gateway;

    recompute();
    m_state = State::Scheduled;
    launchWaitLoop();
}

void Scheduler::stop()
{
    qCInfo(HEADSUP_SCHEDULER_LOG) << "Scheduler::stop: stopping, dropping" << m_queue.size() << "pending alerts";
    const bool hadAlerts = !m_queue.empty();
    stopTimers();
    m_events.clear();
    m_consumedReminders.clear();
    m_gateway = nullptr;
    m_state = State::Stopped;
    if (hadAlerts) {
        emit queueChanged();
    }
}

bool Scheduler::scheduleSnooze(const data::MeetingEvent &event, int minutes)
{
    if (minutes <= 0) {
        qCWarning(HEADSUP_SCHEDULER_LOG) << "Scheduler::scheduleSnooze: rejected non-positive snooze of" << minutes
                                         << "minutes for" << event.title;
        return false;
    }
    if (m_state != State::Scheduled || !m_gateway) {
        qCWarning(HEADSUP_SCHEDULER_LOG) << "Scheduler::scheduleSnooze: not scheduling, ignoring snooze for" << event.title;
        return false;
    }
    auto stored = findEvent(event.id);
    if (!stored) {
        qCWarning(HEADSUP_SCHEDULER_LOG) << "Scheduler::scheduleSnooze: unknown event" << event.id << event.title;
        return false;
    }

    const QDateTime now = currentTime();
    const QDateTime until = now.addSecs(60 * static_cast<qint64>(minutes));

    // Snoozing dismisses the current alert, so anything else pending for the event goes.
    const auto superseded = std::stable_partition(m_queue.begin(), m_queue.end(), [&event](const Alert &alert) {
        return alert.event().id != event.id;
    });
    for (auto it = superseded; it != m_queue.end(); ++it) {
        if (it->kind() == AlertKind::Reminder) {
            m_consumedReminders.insert(occurrenceKey(*it));
        }
        qCDebug(HEADSUP_SCHEDULER_LOG) << "Scheduler::scheduleSnooze: superseding" << it->describe();
    }
    m_queue.erase(superseded, m_queue.end());

    insertSorted(Alert::snooze(stored, until));

    if (stored->start < now) {
        qCInfo(HEADSUP_SCHEDULER_LOG) << "Scheduler::scheduleSnooze: snoozed" << stored->title << "for" << minutes
                                      << "minutes (meeting already started), next alert at" << until.toLocalTime().toString(Qt::ISODate);
    } else {
        qCInfo(HEADSUP_SCHEDULER_LOG) << "Scheduler::scheduleSnooze: snoozed" << stored->title << "for" << minutes
                                      << "minutes, next alert at" << until.toLocalTime().toString(Qt::ISODate);
    }
    emit queueChanged();

    refresh();
    return true;
}

void Scheduler::refresh()
{
    if (m_state != State::Scheduled) {
        return;
    }
    qCDebug(HEADSUP_SCHEDULER_LOG) << "Scheduler::refresh: re-evaluating next deadline";
    launchWaitLoop();
}

Scheduler::State Scheduler::state() const
{
    return m_state;
}

bool Scheduler::hasEvent(const QString &eventId) const
{
    return findEvent(eventId) != nullptr;
}

PresentationGateway *Scheduler::gateway() const
{
    return m_gateway;
}

std::vector<Alert> Scheduler::pendingAlerts() const
{
    return m_queue;
}

QDateTime Scheduler::nextTriggerTime() const
{
    if (m_queue.empty()) {
        return {};
    }
    return m_queue.front().triggerAt();
}

int Scheduler::waitIntervalMsecs() const
{
    return m_waitTimer->isActive() ? m_waitTimer->interval() : -1;
}

int Scheduler::consumedReminderCount() const
{
    return m_consumedReminders.size();
}

void Scheduler::stopTimers()
{
    m_waitTimer->stop();
    m_queue.clear();
}

void Scheduler::recompute()
{
    const QDateTime now = currentTime();

    // Only occurrences that have not started can still produce catch-up reminders.
    QSet<QString> liveOccurrences;
    for (const auto &event : m_events) {
        if (event->start > now) {
            liveOccurrences.insert(occurrenceKey(*event, AlertChannel::Overlay));
            liveOccurrences.insert(occurrenceKey(*event, AlertChannel::Sound));
        }
    }
    m_consumedReminders.intersect(liveOccurrences);

    // Snoozes carry over, and so does anything already due but not yet
    // dispatched (e.g. a timer that fired late after a suspend).
    std::vector<Alert> preserved;
    for (const Alert &alert : m_queue) {
        auto event = findEvent(alert.event().id);
        if (!event) {
            qCDebug(HEADSUP_SCHEDULER_LOG) << "Scheduler::recompute: event gone, dropping" << alert.describe();
            continue;
        }
        if (alert.kind() == AlertKind::Snooze
            || (alert.isDue(now) && event->start == alert.event().start)) {
            preserved.push_back(alert);
            preserved.back().setEvent(std::move(event));
        }
    }

    stopTimers();

    QSet<QString> snoozedEvents;
    QSet<QString> overdueReminders;
    for (const Alert &alert : preserved) {
        if (alert.kind() == AlertKind::Snooze) {
            snoozedEvents.insert(alert.event().id);
        } else if (alert.kind() == AlertKind::Reminder) {
            overdueReminders.insert(occurrenceKey(alert));
        }
    }

    std::vector<Alert> rebuilt;
    for (const auto &event : m_events) {
        if (snoozedEvents.contains(event->id)) {
            qCDebug(HEADSUP_SCHEDULER_LOG) << "Scheduler::recompute: keeping pending snooze for" << event->title;
            continue;
        }
        for (Alert &alert : TimingPolicy::computeFireTimes(event, m_timing, now)) {
            if (alert.kind() == AlertKind::Reminder && overdueReminders.contains(occurrenceKey(alert))) {
                continue;
            }
            if (alert.isCatchUp()) {
                if (m_consumedReminders.contains(occurrenceKey(alert))) {
                    qCDebug(HEADSUP_SCHEDULER_LOG) << "Scheduler::recompute: reminder already delivered for" << event->title;
                    continue;
                }
                qCInfo(HEADSUP_SCHEDULER_LOG) << "Scheduler::recompute: missed alert time for" << event->title
                                              << ", triggering immediately";
            }
            rebuilt.push_back(std::move(alert));
        }
    }

    const auto preservedCount = preserved.size();
    std::move(preserved.begin(), preserved.end(), std::back_inserter(rebuilt));
    std::stable_sort(rebuilt.begin(), rebuilt.end(), triggersBefore);
    m_queue = std::move(rebuilt);

    qCInfo(HEADSUP_SCHEDULER_LOG) << "Scheduler::recompute: scheduled" << m_queue.size() << "alerts (including"
                                  << preservedCount << "carried over)";
    emit queueChanged();
}

void Scheduler::launchWaitLoop()
{
    m_waitTimer->stop();
    m_waitTimer->start(0);
}

void Scheduler::runWaitIteration()
{
    if (m_state != State::Scheduled) {
        return;
    }
    try {
        dispatchDueAlerts(currentTime());
        if (m_state == State::Scheduled) {
            armWaitTimer();
        }
    } catch (const std::exception &error) {
        qCWarning(HEADSUP_SCHEDULER_LOG) << "Scheduler::runWaitIteration: error in wait loop:" << error.what()
                                         << "- retrying in" << kErrorBackoffMsecs / 1000 << "seconds";
        if (m_state == State::Scheduled) {
            m_waitTimer->start(kErrorBackoffMsecs);
        }
    } catch (...) {
        qCWarning(HEADSUP_SCHEDULER_LOG) << "Scheduler::runWaitIteration: unknown error in wait loop - retrying in"
                                         << kErrorBackoffMsecs / 1000 << "seconds";
        if (m_state == State::Scheduled) {
            m_waitTimer->start(kErrorBackoffMsecs);
        }
    }
}

void Scheduler::armWaitTimer()
{
    if (m_queue.empty()) {
        qCDebug(HEADSUP_SCHEDULER_LOG) << "Scheduler::armWaitTimer: no alerts scheduled, rechecking in"
                                       << kMaxWaitMsecs / 1000 << "seconds";
        m_waitTimer->start(kMaxWaitMsecs);
        return;
    }

    const Alert &next = m_queue.front();
    // Overdue alerts (clock skew, resume from suspend) wait zero.
    const qint64 delta = std::clamp<qint64>(next.remainingMsecs(currentTime()), 0, kMaxWaitMsecs);
    qCDebug(HEADSUP_SCHEDULER_LOG) << "Scheduler::armWaitTimer: sleeping" << delta / 1000.0 << "s, next is" << next.describe();
    m_waitTimer->start(static_cast<int>(delta));
}

void Scheduler::dispatchDueAlerts(const QDateTime &now)
{
    const auto firstPending = std::find_if(m_queue.begin(), m_queue.end(), [&now](const Alert &alert) {
        return !alert.isDue(now);
    });
    if (firstPending == m_queue.begin()) {
        return;
    }

    // Remove before dispatching: the gateway may snooze or restart from inside a call.
    std::vector<Alert> due(std::make_move_iterator(m_queue.begin()), std::make_move_iterator(firstPending));
    m_queue.erase(m_queue.begin(), firstPending);

    qCInfo(HEADSUP_SCHEDULER_LOG) << "Scheduler::dispatchDueAlerts: found" << due.size() << "triggered alerts,"
                                  << m_queue.size() << "remaining";
    emit queueChanged();

    for (const Alert &alert : due) {
        if (m_state != State::Scheduled) {
            qCInfo(HEADSUP_SCHEDULER_LOG) << "Scheduler::dispatchDueAlerts: stopped while dispatching, dropping" << alert.describe();
            continue;
        }
        dispatch(alert);
    }
}

void Scheduler::dispatch(const Alert &alert)
{
    qCInfo(HEADSUP_SCHEDULER_LOG) << "Scheduler::dispatch:" << alert.describe();
    if (alert.kind() == AlertKind::Reminder) {
        m_consumedReminders.insert(occurrenceKey(alert));
    }

    try {
        switch (alert.kind()) {
        case AlertKind::Reminder:
            m_gateway->showAlert(alert.event(), false);
            break;
        case AlertKind::Snooze:
            m_gateway->showAlert(alert.event(), true);
            break;
        case AlertKind::MeetingStart:
            if (!m_timing.autoJoinEnabled) {
                qCDebug(HEADSUP_SCHEDULER_LOG) << "Scheduler::dispatch: auto-join disabled, ignoring start of" << alert.event().title;
            } else if (const auto link = alert.event().primaryLink()) {
                qCInfo(HEADSUP_SCHEDULER_LOG) << "Scheduler::dispatch: auto-joining" << alert.event().title << "via" << *link;
                m_gateway->openMeetingLink(alert.event(), *link);
            } else {
                qCDebug(HEADSUP_SCHEDULER_LOG) << "Scheduler::dispatch: no joinable link for" << alert.event().title;
            }
            break;
        }
    } catch (const std::exception &error) {
        qCWarning(HEADSUP_SCHEDULER_LOG) << "Scheduler::dispatch: presentation failed for" << alert.describe() << ":" << error.what();
    }
}

void Scheduler::insertSorted(Alert alert)
{
    const auto position = std::upper_bound(m_queue.begin(), m_queue.end(), alert, triggersBefore);
    m_queue.insert(position, std::move(alert));
}

std::shared_ptr<const data::MeetingEvent> Scheduler::findEvent(const QString &eventId) const
{
    const auto it = std::find_if(m_events.begin(), m_events.end(), [&eventId](const auto &event) {
        return event->id == eventId;
    });
    return it != m_events.end() ? *it : nullptr;
}

QString Scheduler::occurrenceKey(const Alert &alert)
{
    return occurrenceKey(alert.event(), alert.channel());
}

QString Scheduler::occurrenceKey(const data::MeetingEvent &event, AlertChannel channel)
{
    return QStringLiteral("%1|%2|%3")
        .arg(event.id, event.start.toUTC().toString(Qt::ISODateWithMs))
        .arg(channel == AlertChannel::Sound ? QStringLiteral("sound") : QStringLiteral("overlay"));
}

} // namespace core
} // namespace headsup
