#include "headsup/core/AppContext.hpp"

#include "headsup/core/Preferences.hpp"
#include "headsup/core/Scheduler.hpp"
#include "headsup/core/SnoozeController.hpp"
#include "headsup/core/SyncCoordinator.hpp"
#include "headsup/data/EventRepository.hpp"

namespace headsup {
namespace core {

AppContext::AppContext(std::unique_ptr<data::EventRepository> repository, PresentationGateway &gateway)
    : m_preferences(std::make_unique<Preferences>())
    , m_repository(std::move(repository))
    , m_scheduler(std::make_unique<Scheduler>())
    , m_snoozeController(std::make_unique<SnoozeController>(*m_scheduler))
    , m_syncCoordinator(std::make_unique<SyncCoordinator>(*m_repository, *m_scheduler, gateway))
{
    m_scheduler->setTimingPreferences(m_preferences->timing());
    m_snoozeController->setSnoozeAllowed(m_preferences->allowSnooze());
    applySyncSettings();

    QObject::connect(m_preferences.get(), &Preferences::alertTimingChanged, m_preferences.get(), [this]() {
        m_scheduler->setTimingPreferences(m_preferences->timing());
    });
    QObject::connect(m_preferences.get(), &Preferences::snoozeAllowedChanged, m_preferences.get(), [this](bool allowed) {
        m_snoozeController->setSnoozeAllowed(allowed);
    });
    QObject::connect(m_preferences.get(), &Preferences::syncSettingsChanged, m_preferences.get(), [this]() {
        applySyncSettings();
        if (m_syncCoordinator->isRunning()) {
            m_syncCoordinator->syncNow();
        }
    });
}

AppContext::~AppContext()
{
    m_syncCoordinator->stop();
    m_scheduler->stop();
}

Preferences &AppContext::preferences()
{
    return *m_preferences;
}

data::EventRepository &AppContext::eventRepository()
{
    return *m_repository;
}

Scheduler &AppContext::scheduler()
{
    return *m_scheduler;
}

SnoozeController &AppContext::snoozeController()
{
    return *m_snoozeController;
}

SyncCoordinator &AppContext::syncCoordinator()
{
    return *m_syncCoordinator;
}

void AppContext::start()
{
    m_syncCoordinator->start();
}

void AppContext::stop()
{
    m_syncCoordinator->stop();
    m_scheduler->stop();
}

void AppContext::applySyncSettings()
{
    m_syncCoordinator->setIntervalSeconds(m_preferences->syncIntervalSeconds());
    m_syncCoordinator->setIncludeAllDayEvents(m_preferences->includeAllDayEvents());
    m_syncCoordinator->setLookAheadDays(m_preferences->lookAheadDays());
}

} // namespace core
} // namespace headsup
