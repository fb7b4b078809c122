#pragma once

#include <QString>
#include <QUrl>
#include <functional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "headsup/core/PresentationGateway.hpp"

namespace headsup {
namespace test {

// Presentation gateway that records every call for assertions.
class RecordingGateway : public core::PresentationGateway
{
public:
    struct Shown
    {
        QString eventId;
        bool fromSnooze = false;
    };

    void showAlert(const data::MeetingEvent &event, bool isFromSnooze) override
    {
        if (throwOnShow) {
            throw std::runtime_error("presentation unavailable");
        }
        shown.push_back({event.id, isFromSnooze});
        m_activeEventId = event.id;
        if (onShow) {
            onShow(event);
        }
    }

    void hideAlert() override
    {
        ++hideCount;
        m_activeEventId.clear();
    }

    void openMeetingLink(const data::MeetingEvent &event, const QUrl &link) override
    {
        opened.push_back({event.id, link});
    }

    QString activeEventId() const override { return m_activeEventId; }

    std::vector<Shown> shown;
    std::vector<std::pair<QString, QUrl>> opened;
    int hideCount = 0;
    bool throwOnShow = false;
    // Runs inside showAlert, e.g. to snooze or stop from within a dispatch.
    std::function<void(const data::MeetingEvent &)> onShow;

private:
    QString m_activeEventId;
};

} // namespace test
} // namespace headsup
