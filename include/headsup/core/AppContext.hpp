#pragma once

#include <memory>

namespace headsup {
namespace data {
class EventRepository;
}

namespace core {

class Preferences;
class PresentationGateway;
class Scheduler;
class SnoozeController;
class SyncCoordinator;

// Owns the alert engine and wires preference changes into it.
class AppContext
{
public:
    AppContext(std::unique_ptr<data::EventRepository> repository, PresentationGateway &gateway);
    ~AppContext();

    Preferences &preferences();
    data::EventRepository &eventRepository();
    Scheduler &scheduler();
    SnoozeController &snoozeController();
    SyncCoordinator &syncCoordinator();

    void start();
    void stop();

private:
    void applySyncSettings();

    std::unique_ptr<Preferences> m_preferences;
    std::unique_ptr<data::EventRepository> m_repository;
    std::unique_ptr<Scheduler> m_scheduler;
    std::unique_ptr<SnoozeController> m_snoozeController;
    std::unique_ptr<SyncCoordinator> m_syncCoordinator;
};

} // namespace core
} // namespace headsup
