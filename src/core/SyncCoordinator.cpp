#include "headsup/core/SyncCoordinator.hpp"

#include "headsup/Logging.hpp"
#include "headsup/core/Scheduler.hpp"
#include "headsup/data/EventRepository.hpp"

#include <QDate>
#include <QTimer>
#include <algorithm>

namespace headsup {
namespace core {

SyncCoordinator::SyncCoordinator(data::EventRepository &repository, Scheduler &scheduler,
                                 PresentationGateway &gateway, QObject *parent)
    : QObject(parent)
    , m_repository(repository)
    , m_scheduler(scheduler)
    , m_gateway(gateway)
    , m_timer(new QTimer(this))
{
    m_timer->setInterval(60 * 1000);
    connect(m_timer, &QTimer::timeout, this, &SyncCoordinator::syncNow);
}

SyncCoordinator::~SyncCoordinator() = default;

void SyncCoordinator::setIntervalSeconds(int seconds)
{
    const int interval = qBound(30, seconds, 3600) * 1000;
    if (interval == m_timer->interval()) {
        return;
    }
    m_timer->setInterval(interval);
    if (m_timer->isActive()) {
        qCInfo(HEADSUP_SYNC_LOG) << "SyncCoordinator::setIntervalSeconds: restarting periodic sync every" << interval / 1000 << "s";
        m_timer->start();
    }
}

int SyncCoordinator::intervalSeconds() const
{
    return m_timer->interval() / 1000;
}

void SyncCoordinator::setIncludeAllDayEvents(bool include)
{
    m_includeAllDayEvents = include;
}

void SyncCoordinator::setLookAheadDays(int days)
{
    m_lookAheadDays = std::max(1, days);
}

void SyncCoordinator::start()
{
    qCInfo(HEADSUP_SYNC_LOG) << "SyncCoordinator::start: syncing every" << intervalSeconds() << "s";
    syncNow();
    m_timer->start();
}

void SyncCoordinator::stop()
{
    m_timer->stop();
}

bool SyncCoordinator::isRunning() const
{
    return m_timer->isActive();
}

bool SyncCoordinator::syncNow()
{
    if (!m_repository.reload()) {
        qCWarning(HEADSUP_SYNC_LOG) << "SyncCoordinator::syncNow: event source reload failed, keeping current schedule";
        emit syncFailed();
        return false;
    }

    const std::vector<data::MeetingEvent> events = collectEvents();
    qCInfo(HEADSUP_SYNC_LOG) << "SyncCoordinator::syncNow:" << events.size() << "events in window";
    m_scheduler.start(events, m_gateway);
    emit synced(static_cast<int>(events.size()));
    return true;
}

std::vector<data::MeetingEvent> SyncCoordinator::collectEvents() const
{
    const QDate today = m_scheduler.currentTime().toLocalTime().date();
    std::vector<data::MeetingEvent> events = m_repository.fetchEvents(today, today.addDays(m_lookAheadDays));
    if (!m_includeAllDayEvents) {
        events.erase(std::remove_if(events.begin(), events.end(),
                                    [](const data::MeetingEvent &event) { return event.isAllDay; }),
                     events.end());
    }
    return events;
}

} // namespace core
} // namespace headsup
