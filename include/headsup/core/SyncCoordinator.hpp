#pragma once

#include <QObject>
#include <vector>

#include "headsup/data/Event.hpp"

class QTimer;

namespace headsup {
namespace data {
class EventRepository;
}

namespace core {

class PresentationGateway;
class Scheduler;

// Periodically re-reads the event source and hands the working set to the scheduler.
class SyncCoordinator : public QObject
{
    Q_OBJECT

public:
    SyncCoordinator(data::EventRepository &repository, Scheduler &scheduler, PresentationGateway &gateway,
                    QObject *parent = nullptr);
    ~SyncCoordinator() override;

    void setIntervalSeconds(int seconds);
    int intervalSeconds() const;
    void setIncludeAllDayEvents(bool include);
    void setLookAheadDays(int days);

    void start();
    void stop();
    bool isRunning() const;

    bool syncNow();

    // The working set for a sync at the current time: today through the look-ahead window.
    std::vector<data::MeetingEvent> collectEvents() const;

signals:
    void synced(int eventCount);
    void syncFailed();

private:
    data::EventRepository &m_repository;
    Scheduler &m_scheduler;
    PresentationGateway &m_gateway;
    QTimer *m_timer = nullptr;
    bool m_includeAllDayEvents = false;
    int m_lookAheadDays = 7;
};

} // namespace core
} // namespace headsup
