#include <QtTest/QtTest>

#include <QTextStream>
#include <cstdio>
#include <stdexcept>
#include <unistd.h>

#include "headsup/core/Scheduler.hpp"
#include "headsup/core/SnoozeController.hpp"
#include "headsup/ui/ConsoleGateway.hpp"

using namespace headsup::core;
using headsup::data::MeetingEvent;
using headsup::ui::ConsoleGateway;

namespace {

MeetingEvent makeEvent(const QString &id, const QDateTime &start)
{
    MeetingEvent event;
    event.id = id;
    event.title = QStringLiteral("Roadmap %1").arg(id);
    event.start = start;
    event.end = start.addSecs(3600);
    event.organizer = QStringLiteral("Grace Hopper");
    event.links = {QUrl(QStringLiteral("https://teams.microsoft.com/l/meetup-join/42"))};
    return event;
}

// Points STDIN_FILENO at a pipe for the lifetime of the object.
class StdinPipe
{
public:
    StdinPipe()
    {
        int fds[2];
        if (::pipe(fds) != 0) {
            return;
        }
        m_savedStdin = ::dup(STDIN_FILENO);
        ::dup2(fds[0], STDIN_FILENO);
        ::close(fds[0]);
        m_writeEnd = fds[1];
    }

    ~StdinPipe()
    {
        if (m_writeEnd >= 0) {
            ::close(m_writeEnd);
        }
        if (m_savedStdin >= 0) {
            ::dup2(m_savedStdin, STDIN_FILENO);
            ::close(m_savedStdin);
        }
        std::clearerr(stdin);
    }

    bool isValid() const { return m_writeEnd >= 0 && m_savedStdin >= 0; }

    bool write(const QByteArray &data)
    {
        return ::write(m_writeEnd, data.constData(), data.size()) == data.size();
    }

private:
    int m_savedStdin = -1;
    int m_writeEnd = -1;
};

} // namespace

class ConsoleGatewayTest : public QObject
{
    Q_OBJECT

private slots:
    void init();

    void showPrintsBanner();
    void showSameEventOnce();
    void dismissHides();
    void joinOpensLink();
    void openFailureIsReported();
    void snoozeCommand();
    void rejectsBadCommands();
    void readsCommandsFromStdin();

private:
    QDateTime m_now;
    QString m_buffer;
};

void ConsoleGatewayTest::init()
{
    m_now = QDateTime::currentDateTimeUtc();
    m_buffer.clear();
}

void ConsoleGatewayTest::showPrintsBanner()
{
    QTextStream output(&m_buffer);
    ConsoleGateway gateway(output);

    gateway.showAlert(makeEvent("e1", m_now.addSecs(300)), true);
    QCOMPARE(gateway.activeEventId(), QStringLiteral("e1"));
    QVERIFY(m_buffer.contains(QStringLiteral("Roadmap e1 (snoozed)")));
    QVERIFY(m_buffer.contains(QStringLiteral("Organizer: Grace Hopper")));
    QVERIFY(m_buffer.contains(QStringLiteral("Microsoft Teams: https://teams.microsoft.com/l/meetup-join/42")));
    QVERIFY(m_buffer.contains(QStringLiteral("starts in")));

    gateway.showAlert(makeEvent("e2", m_now.addSecs(-600)), false);
    QCOMPARE(gateway.activeEventId(), QStringLiteral("e2"));
    QVERIFY(m_buffer.contains(QStringLiteral("started 10 min ago")));
}

void ConsoleGatewayTest::showSameEventOnce()
{
    QTextStream output(&m_buffer);
    ConsoleGateway gateway(output);
    const MeetingEvent event = makeEvent("e1", m_now.addSecs(300));

    gateway.showAlert(event, false);
    const int length = m_buffer.size();
    gateway.showAlert(event, false);
    QCOMPARE(m_buffer.size(), length);
}

void ConsoleGatewayTest::dismissHides()
{
    QTextStream output(&m_buffer);
    ConsoleGateway gateway(output);

    gateway.hideAlert();
    QVERIFY(gateway.activeEventId().isEmpty());

    gateway.showAlert(makeEvent("e1", m_now.addSecs(300)), false);
    QVERIFY(gateway.handleCommand(QStringLiteral("dismiss\n")));
    QVERIFY(!gateway.activeEvent().has_value());
    QVERIFY(!gateway.handleCommand(QStringLiteral("dismiss")));
}

void ConsoleGatewayTest::joinOpensLink()
{
    QTextStream output(&m_buffer);
    ConsoleGateway gateway(output);
    QList<QUrl> opened;
    gateway.setLinkOpener([&opened](const QUrl &url) {
        opened.append(url);
        return true;
    });

    gateway.showAlert(makeEvent("e1", m_now.addSecs(60)), false);
    QVERIFY(gateway.handleCommand(QStringLiteral("  JOIN ")));
    QCOMPARE(opened.size(), 1);
    QCOMPARE(opened.front(), QUrl(QStringLiteral("https://teams.microsoft.com/l/meetup-join/42")));
    QVERIFY(gateway.activeEventId().isEmpty());
    QVERIFY(m_buffer.contains(QStringLiteral("Joining Roadmap e1")));

    MeetingEvent offline = makeEvent("e2", m_now.addSecs(60));
    offline.links.clear();
    gateway.showAlert(offline, false);
    QVERIFY(!gateway.handleCommand(QStringLiteral("join")));
    QCOMPARE(opened.size(), 1);
    QCOMPARE(gateway.activeEventId(), QStringLiteral("e2"));
}

void ConsoleGatewayTest::openFailureIsReported()
{
    QTextStream output(&m_buffer);
    ConsoleGateway gateway(output);
    const MeetingEvent event = makeEvent("e1", m_now.addSecs(60));

    gateway.setLinkOpener([](const QUrl &) -> bool { throw std::runtime_error("no launcher"); });
    gateway.openMeetingLink(event, *event.primaryLink());
    QVERIFY(!m_buffer.contains(QStringLiteral("Joining")));

    gateway.setLinkOpener([](const QUrl &) { return false; });
    gateway.openMeetingLink(event, *event.primaryLink());
    QVERIFY(!m_buffer.contains(QStringLiteral("Joining")));
}

void ConsoleGatewayTest::snoozeCommand()
{
    Scheduler scheduler;
    const QDateTime fixedNow = m_now;
    scheduler.setClock([fixedNow] { return fixedNow; });
    SnoozeController controller(scheduler);
    QTextStream output(&m_buffer);
    ConsoleGateway gateway(output);
    const MeetingEvent event = makeEvent("e1", m_now.addSecs(120));

    scheduler.start({event}, gateway);
    QTRY_COMPARE(gateway.activeEventId(), QStringLiteral("e1"));

    // No controller attached yet.
    QVERIFY(!gateway.handleCommand(QStringLiteral("snooze 5")));

    gateway.setSnoozeController(&controller);
    QVERIFY(!gateway.handleCommand(QStringLiteral("snooze")));
    QVERIFY(!gateway.handleCommand(QStringLiteral("snooze soon")));
    QVERIFY(gateway.handleCommand(QStringLiteral("snooze 5")));
    QVERIFY(gateway.activeEventId().isEmpty());
    QVERIFY(m_buffer.contains(QStringLiteral("Snoozed Roadmap e1 for 5 min")));

    const auto alerts = scheduler.pendingAlerts();
    QCOMPARE(alerts.size(), std::size_t(1));
    QCOMPARE(alerts.front().kind(), AlertKind::Snooze);
    QCOMPARE(alerts.front().triggerAt(), fixedNow.addSecs(5 * 60));
}

void ConsoleGatewayTest::rejectsBadCommands()
{
    QTextStream output(&m_buffer);
    ConsoleGateway gateway(output);

    QVERIFY(!gateway.handleCommand(QString()));
    QVERIFY(gateway.handleCommand(QStringLiteral("status")));
    QVERIFY(m_buffer.contains(QStringLiteral("No alert showing")));

    gateway.showAlert(makeEvent("e1", m_now.addSecs(300)), false);
    QVERIFY(!gateway.handleCommand(QStringLiteral("launch")));
    QVERIFY(m_buffer.contains(QStringLiteral("Unknown command: launch")));
    QVERIFY(gateway.handleCommand(QStringLiteral("status")));
    QVERIFY(m_buffer.contains(QStringLiteral("Showing: Roadmap e1")));
}

void ConsoleGatewayTest::readsCommandsFromStdin()
{
    StdinPipe input;
    QVERIFY(input.isValid());

    QTextStream output(&m_buffer);
    ConsoleGateway gateway(output);
    gateway.listenOnStdin();
    gateway.listenOnStdin();

    gateway.showAlert(makeEvent("e1", m_now.addSecs(300)), false);
    QVERIFY(input.write("dismiss\n"));
    QTRY_VERIFY(gateway.activeEventId().isEmpty());
}

QTEST_GUILESS_MAIN(ConsoleGatewayTest)
#include "ConsoleGatewayTest.moc"
