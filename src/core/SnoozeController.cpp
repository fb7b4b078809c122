#include "headsup/core/SnoozeController.hpp"

#include "headsup/Logging.hpp"
#include "headsup/core/PresentationGateway.hpp"
#include "headsup/core/Scheduler.hpp"

namespace headsup {
namespace core {

SnoozeController::SnoozeController(Scheduler &scheduler)
    : m_scheduler(scheduler)
{
}

void SnoozeController::setSnoozeAllowed(bool allowed)
{
    m_snoozeAllowed = allowed;
}

bool SnoozeController::isSnoozeAllowed() const
{
    return m_snoozeAllowed;
}

bool SnoozeController::snooze(const data::MeetingEvent &event, int minutes)
{
    if (!m_snoozeAllowed) {
        qCWarning(HEADSUP_SNOOZE_LOG) << "SnoozeController::snooze: snoozing is disabled, ignoring request for" << event.title;
        return false;
    }
    if (minutes <= 0) {
        qCWarning(HEADSUP_SNOOZE_LOG) << "SnoozeController::snooze: invalid snooze duration" << minutes << "for" << event.title;
        return false;
    }
    if (event.id.isEmpty() || !m_scheduler.hasEvent(event.id)) {
        qCWarning(HEADSUP_SNOOZE_LOG) << "SnoozeController::snooze: event" << event.id << "is not scheduled";
        return false;
    }

    auto *gateway = m_scheduler.gateway();
    if (gateway && gateway->activeEventId() == event.id) {
        gateway->hideAlert();
    }

    if (!m_scheduler.scheduleSnooze(event, minutes)) {
        return false;
    }
    qCInfo(HEADSUP_SNOOZE_LOG) << "SnoozeController::snooze: snoozed" << event.title << "for" << minutes << "minutes";
    return true;
}

} // namespace core
} // namespace headsup
