/*
 * This file is part of caldav-client package
 *
 * Copyright (C) 2026 caldav-client contributors.
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public License
 * version 2.1 as published by the Free Software Foundation.
 *
 * This library is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA
 * 02110-1301 USA
 *
 */

#include <QObject>
#include <QSignalSpy>
#include <QtTest>

#include "caldavclient.h"
#include "fakenetworkaccessmanager.h"

#include <SyncResults.h>

static QByteArray multistatus(const QByteArray &responses, const QString &syncToken = QString())
{
    QByteArray data = "<?xml version=\"1.0\"?>"
            "<d:multistatus xmlns:d=\"DAV:\" xmlns:c=\"urn:ietf:params:xml:ns:caldav\""
            " xmlns:a=\"http://apple.com/ns/ical/\">" + responses;
    if (!syncToken.isEmpty()) {
        data += "<d:sync-token>" + syncToken.toUtf8() + "</d:sync-token>";
    }
    return data + "</d:multistatus>";
}

static QByteArray propResponse(const QString &href, const QByteArray &props,
                               const QByteArray &status = "HTTP/1.1 200 OK")
{
    return "<d:response><d:href>" + href.toUtf8() + "</d:href><d:propstat><d:prop>"
            + props + "</d:prop><d:status>" + status + "</d:status></d:propstat></d:response>";
}

static QByteArray calendarProps(const QString &displayName)
{
    return "<d:resourcetype><d:collection/><c:calendar/></d:resourcetype>"
           "<d:displayname>" + displayName.toUtf8() + "</d:displayname>"
           "<c:supported-calendar-component-set><c:comp name=\"VEVENT\"/></c:supported-calendar-component-set>";
}

static const QByteArray EventData("BEGIN:VCALENDAR\r\nBEGIN:VEVENT\r\nUID:1\r\n"
                                  "DTSTART:20240101T100000Z\r\nEND:VEVENT\r\nEND:VCALENDAR\r\n");

class tst_CalDavClient : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void findCurrentUserPrincipal();
    void unauthenticatedPrincipal();
    void findCalendarHomeSet();
    void findCalendars();
    void findCalendarsInvalidSize();
    void getCalendarNotACalendar();
    void updateCalendar();
    void updateCalendarRejected();
    void updateCalendarRejectedResponse();
    void rejectsEmptyInput();
    void listCalendarObjects();
    void listCalendarObjectsWithData();
    void syncCalendarList();
    void syncCalendarListWithoutResourceType();
    void getCalendarObject();
    void getCalendarObjectWrongType();
    void putCalendarObject();
    void putPreconditionFailed();
    void deleteCalendarObject();
    void deleteMissingObject();
    void emptyMultiget();
    void calendarQuery();
    void calendarQueryRange();
    void syncCalendar();
    void oneOperationAtATime();
    void abortOperation();

private:
    FakeNetworkAccessManager *mManager;
    CalDavClient *mClient;
};

void tst_CalDavClient::init()
{
    Settings settings;
    settings.setServerAddress(QStringLiteral("https://dav.example.com"));
    settings.setUsername(QStringLiteral("jane"));
    settings.setPassword(QStringLiteral("secret"));
    mManager = new FakeNetworkAccessManager;
    mClient = new CalDavClient(settings, mManager);
}

void tst_CalDavClient::cleanup()
{
    delete mClient;
    mClient = 0;
    delete mManager;
    mManager = 0;
}

void tst_CalDavClient::findCurrentUserPrincipal()
{
    mManager->queueResponse(207, multistatus(propResponse(
        "/", "<d:current-user-principal><d:href>/principals/jane/</d:href></d:current-user-principal>")));

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->findCurrentUserPrincipal());
    QVERIFY(mClient->isBusy());
    QTRY_COMPARE(finished.count(), 1);

    QVERIFY(!mClient->isBusy());
    QCOMPARE(mClient->operation(), CalDavClient::FindCurrentUserPrincipal);
    QVERIFY(!mClient->error().isError());
    QCOMPARE(mClient->userPrincipal(), QStringLiteral("/principals/jane/"));

    const FakeNetworkAccessManager::SentRequest &sent = mManager->sentRequests.first();
    QCOMPARE(sent.verb, QByteArray("PROPFIND"));
    QCOMPARE(sent.request.url().path(), QStringLiteral("/"));
    QCOMPARE(sent.request.url().userName(), QStringLiteral("jane"));
    QCOMPARE(sent.request.rawHeader("Depth"), QByteArray("0"));
    QVERIFY(sent.body.contains("current-user-principal"));
}

void tst_CalDavClient::unauthenticatedPrincipal()
{
    mManager->queueResponse(207, multistatus(propResponse(
        "/", "<d:current-user-principal><d:unauthenticated/></d:current-user-principal>")));

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->findCurrentUserPrincipal());
    QTRY_COMPARE(finished.count(), 1);

    QVERIFY(mClient->error().isError());
    QCOMPARE(mClient->error().minorCode(), int(Buteo::SyncResults::AUTHENTICATION_FAILURE));
    QVERIFY(mClient->userPrincipal().isEmpty());
}

void tst_CalDavClient::findCalendarHomeSet()
{
    mManager->queueResponse(207, multistatus(propResponse(
        "/principals/jane/", "<c:calendar-home-set><d:href>/calendars/jane/</d:href></c:calendar-home-set>")));

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->findCalendarHomeSet(QStringLiteral("/principals/jane/")));
    QTRY_COMPARE(finished.count(), 1);

    QVERIFY(!mClient->error().isError());
    QCOMPARE(mClient->calendarHomeSet(), QStringLiteral("/calendars/jane/"));
    QCOMPARE(mManager->sentRequests.first().request.url().path(), QStringLiteral("/principals/jane/"));
}

void tst_CalDavClient::findCalendars()
{
    mManager->queueResponse(207, multistatus(
        propResponse("/calendars/jane/", "<d:resourcetype><d:collection/></d:resourcetype>")
        + propResponse("/calendars/jane/work/", calendarProps("Work")
                       + "<a:calendar-color>#00FF00</a:calendar-color>"
                       + "<c:max-resource-size>1000</c:max-resource-size>")
        + propResponse("/calendars/jane/inbox/",
                       "<d:resourcetype><d:collection/><c:schedule-inbox/></d:resourcetype>")
        + propResponse("/calendars/jane/home/", calendarProps("Home"))));

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->findCalendars(QStringLiteral("/calendars/jane/")));
    QTRY_COMPARE(finished.count(), 1);

    QVERIFY(!mClient->error().isError());
    QCOMPARE(mClient->calendars().count(), 2);
    const Calendar work = mClient->calendars().at(0);
    QCOMPARE(work.path, QStringLiteral("/calendars/jane/work/"));
    QCOMPARE(work.displayName, QStringLiteral("Work"));
    QCOMPARE(work.color, QStringLiteral("#00FF00"));
    QCOMPARE(work.maxResourceSize, qint64(1000));
    QCOMPARE(work.supportedComponents, QStringList() << "VEVENT");
    QCOMPARE(mClient->calendars().at(1).displayName, QStringLiteral("Home"));
    QCOMPARE(mManager->sentRequests.first().request.rawHeader("Depth"), QByteArray("1"));
}

void tst_CalDavClient::findCalendarsInvalidSize()
{
    mManager->queueResponse(207, multistatus(
        propResponse("/calendars/jane/work/", calendarProps("Work")
                     + "<c:max-resource-size>-5</c:max-resource-size>")));

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->findCalendars(QStringLiteral("/calendars/jane/")));
    QTRY_COMPARE(finished.count(), 1);

    QCOMPARE(mClient->error().kind(), CalDavError::MalformedResponse);
}

void tst_CalDavClient::getCalendarNotACalendar()
{
    mManager->queueResponse(207, multistatus(
        propResponse("/calendars/jane/", "<d:resourcetype><d:collection/></d:resourcetype>")));

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->getCalendar(QStringLiteral("/calendars/jane/")));
    QTRY_COMPARE(finished.count(), 1);

    QCOMPARE(mClient->error().kind(), CalDavError::NotFound);
    QVERIFY(mClient->calendar().path.isEmpty());
}

void tst_CalDavClient::updateCalendar()
{
    mManager->queueResponse(207, multistatus(
        propResponse("/calendars/jane/work/", "<d:displayname/><a:calendar-color/>")));
    mManager->queueResponse(207, multistatus(
        propResponse("/calendars/jane/work/", calendarProps("Office")
                     + "<a:calendar-color>#0000FF</a:calendar-color>")));

    CalendarUpdate update;
    update.displayName = QStringLiteral("Office");
    update.color = QStringLiteral("#0000FF");

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->updateCalendar(QStringLiteral("/calendars/jane/work/"), update));
    QTRY_COMPARE(finished.count(), 1);

    QVERIFY(!mClient->error().isError());
    QCOMPARE(mClient->calendar().displayName, QStringLiteral("Office"));
    QCOMPARE(mClient->calendar().color, QStringLiteral("#0000FF"));

    QCOMPARE(mManager->sentRequests.count(), 2);
    const FakeNetworkAccessManager::SentRequest &patch = mManager->sentRequests.at(0);
    QCOMPARE(patch.verb, QByteArray("PROPPATCH"));
    QVERIFY(patch.body.contains("<d:set><d:prop><d:displayname>Office</d:displayname>"
                                "<a:calendar-color>#0000FF</a:calendar-color></d:prop></d:set>"));
    QVERIFY(!patch.body.contains("calendar-description"));
    QCOMPARE(mManager->sentRequests.at(1).verb, QByteArray("PROPFIND"));
    QCOMPARE(mManager->sentRequests.at(1).request.rawHeader("Depth"), QByteArray("0"));
}

void tst_CalDavClient::updateCalendarRejected()
{
    mManager->queueResponse(207, multistatus(
        propResponse("/calendars/jane/work/", "<d:displayname/>", "HTTP/1.1 403 Forbidden")));

    CalendarUpdate update;
    update.displayName = QStringLiteral("Office");

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->updateCalendar(QStringLiteral("/calendars/jane/work/"), update));
    QTRY_COMPARE(finished.count(), 1);

    QCOMPARE(mClient->error().kind(), CalDavError::ServerError);
    QCOMPARE(mClient->error().httpStatus(), 207);
    QVERIFY(mClient->error().message().contains(QStringLiteral("displayname")));
    QCOMPARE(mManager->sentRequests.count(), 1);
}

void tst_CalDavClient::updateCalendarRejectedResponse()
{
    mManager->queueResponse(207, multistatus(
        "<d:response><d:href>/calendars/jane/work/</d:href>"
        "<d:status>HTTP/1.1 423 Locked</d:status></d:response>"));

    CalendarUpdate update;
    update.timezone = QString("");

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->updateCalendar(QStringLiteral("/calendars/jane/work/"), update));
    QTRY_COMPARE(finished.count(), 1);

    QCOMPARE(mClient->error().kind(), CalDavError::ServerError);
    QCOMPARE(mClient->error().phase(), CalDavError::DiscoveryPhase);
    QCOMPARE(mManager->sentRequests.count(), 1);
    QVERIFY(mManager->sentRequests.first().body.contains("<c:calendar-timezone></c:calendar-timezone>")
            || mManager->sentRequests.first().body.contains("<c:calendar-timezone/>"));
}

void tst_CalDavClient::rejectsEmptyInput()
{
    QSignalSpy finished(mClient, SIGNAL(finished()));

    QVERIFY(!mClient->updateCalendar(QStringLiteral("/calendars/jane/work/"), CalendarUpdate()));
    QCOMPARE(mClient->error().kind(), CalDavError::InvalidInput);
    QVERIFY(!mClient->isBusy());

    QVERIFY(!mClient->discoverContextUrl(QStringLiteral("  ")));
    QCOMPARE(mClient->error().phase(), CalDavError::DiscoveryPhase);
    QVERIFY(!mClient->getCalendarObject(QString()));
    QCOMPARE(mClient->error().phase(), CalDavError::ObjectPhase);
    QVERIFY(!mClient->syncCalendar(QString(), SyncQuery()));
    QCOMPARE(mClient->error().kind(), CalDavError::InvalidInput);

    QVERIFY(mManager->sentRequests.isEmpty());
    QCOMPARE(finished.count(), 0);
}

void tst_CalDavClient::listCalendarObjects()
{
    mManager->queueResponse(207, multistatus(
        propResponse("/calendars/jane/work/", "<d:resourcetype><d:collection/><c:calendar/></d:resourcetype>")
        + propResponse("/calendars/jane/work/a.ics",
                       "<d:getetag>\"a1\"</d:getetag><d:getcontentlength>120</d:getcontentlength>"
                       "<d:resourcetype/>")
        + propResponse("/calendars/jane/work/sub/", "<d:resourcetype><d:collection/></d:resourcetype>")
        + "<d:response><d:href>/calendars/jane/work/broken.ics</d:href>"
          "<d:status>HTTP/1.1 500 Internal Server Error</d:status></d:response>"
        + propResponse("/calendars/jane/work/b.ics", "<d:getetag>\"b1\"</d:getetag>")));

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->listCalendarObjects(QStringLiteral("/calendars/jane/work"), false));
    QTRY_COMPARE(finished.count(), 1);

    QVERIFY(!mClient->error().isError());
    QCOMPARE(mClient->objects().count(), 2);
    QCOMPARE(mClient->objects().at(0).path, QStringLiteral("/calendars/jane/work/a.ics"));
    QCOMPARE(mClient->objects().at(0).etag, QStringLiteral("a1"));
    QCOMPARE(mClient->objects().at(0).contentLength, qint64(120));
    QVERIFY(mClient->objects().at(0).data.isEmpty());
    QCOMPARE(mClient->objects().at(1).path, QStringLiteral("/calendars/jane/work/b.ics"));
    QCOMPARE(mManager->sentRequests.count(), 1);
}

void tst_CalDavClient::listCalendarObjectsWithData()
{
    mManager->queueResponse(207, multistatus(
        propResponse("/calendars/jane/work/a.ics", "<d:getetag>\"a1\"</d:getetag>")));
    mManager->queueResponse(207, multistatus(
        propResponse("/calendars/jane/work/a.ics", "<d:getetag>\"a1\"</d:getetag>"
                     "<c:calendar-data>" + EventData + "</c:calendar-data>")));

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->listCalendarObjects(QStringLiteral("/calendars/jane/work/"), true));
    QTRY_COMPARE(finished.count(), 1);

    QVERIFY(!mClient->error().isError());
    QCOMPARE(mClient->objects().count(), 1);
    QVERIFY(mClient->objects().first().data.contains("UID:1"));

    QCOMPARE(mManager->sentRequests.count(), 2);
    const FakeNetworkAccessManager::SentRequest &multiGet = mManager->sentRequests.at(1);
    QCOMPARE(multiGet.verb, QByteArray("REPORT"));
    QVERIFY(multiGet.body.contains("<c:comp name=\"VCALENDAR\"><c:allprop/><c:allcomp/></c:comp>"));
    QVERIFY(multiGet.body.contains("<d:href>/calendars/jane/work/a.ics</d:href>"));
}

void tst_CalDavClient::syncCalendarList()
{
    mManager->queueResponse(207, multistatus(
        propResponse("/calendars/jane/", "<d:resourcetype><d:collection/></d:resourcetype>")
        + propResponse("/calendars/jane/work/", calendarProps("Work"))
        + "<d:response><d:href>/calendars/jane/old/</d:href>"
          "<d:status>HTTP/1.1 404 Not Found</d:status></d:response>"
        + propResponse("/calendars/jane/notes/", "<d:resourcetype><d:collection/></d:resourcetype>"),
        QStringLiteral("list-2")));

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->syncCalendarList(QStringLiteral("/calendars/jane/"), QStringLiteral("list-1")));
    QTRY_COMPARE(finished.count(), 1);

    QVERIFY(!mClient->error().isError());
    QCOMPARE(mClient->calendarListSyncToken(), QStringLiteral("list-2"));
    QCOMPARE(mClient->calendars().count(), 1);
    QCOMPARE(mClient->calendars().first().path, QStringLiteral("/calendars/jane/work/"));
    QCOMPARE(mClient->deletedCalendars(), QStringList() << "/calendars/jane/old/");
    QVERIFY(mManager->sentRequests.first().body.contains("<d:sync-token>list-1</d:sync-token>"));
    QCOMPARE(mManager->sentRequests.first().request.rawHeader("Depth"), QByteArray("0"));
}

void tst_CalDavClient::syncCalendarListWithoutResourceType()
{
    mManager->queueResponse(207, multistatus(
        propResponse("/calendars/jane/shared/", "<d:displayname>Shared</d:displayname>"
                     "<a:calendar-color>#FF0000</a:calendar-color>"),
        QStringLiteral("list-3")));

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->syncCalendarList(QStringLiteral("/calendars/jane/"), QStringLiteral("list-2")));
    QTRY_COMPARE(finished.count(), 1);

    QVERIFY(!mClient->error().isError());
    QCOMPARE(mClient->calendars().count(), 1);
    QCOMPARE(mClient->calendars().first().path, QStringLiteral("/calendars/jane/shared/"));
    QCOMPARE(mClient->calendars().first().displayName, QStringLiteral("Shared"));
    QCOMPARE(mClient->calendars().first().color, QStringLiteral("#FF0000"));
    QVERIFY(mClient->deletedCalendars().isEmpty());
}

void tst_CalDavClient::getCalendarObject()
{
    RawHeaderList headers;
    headers << qMakePair(QByteArray("Content-Type"), QByteArray("text/calendar; charset=utf-8"))
            << qMakePair(QByteArray("ETag"), QByteArray("\"v7\""))
            << qMakePair(QByteArray("Last-Modified"), QByteArray("Tue, 12 Mar 2024 10:00:00 GMT"));
    mManager->queueResponse(200, EventData, headers);

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->getCalendarObject(QStringLiteral("/calendars/jane/work/a.ics")));
    QTRY_COMPARE(finished.count(), 1);

    QVERIFY(!mClient->error().isError());
    const CalendarObject object = mClient->object();
    QCOMPARE(object.path, QStringLiteral("/calendars/jane/work/a.ics"));
    QCOMPARE(object.etag, QStringLiteral("v7"));
    QCOMPARE(object.modificationTime, QDateTime(QDate(2024, 3, 12), QTime(10, 0), Qt::UTC));
    QCOMPARE(object.data, EventData);

    const FakeNetworkAccessManager::SentRequest &sent = mManager->sentRequests.first();
    QCOMPARE(sent.verb, QByteArray("GET"));
    QCOMPARE(sent.request.rawHeader("Accept"), QByteArray("text/calendar"));
}

void tst_CalDavClient::getCalendarObjectWrongType()
{
    RawHeaderList headers;
    headers << qMakePair(QByteArray("Content-Type"), QByteArray("text/html"));
    mManager->queueResponse(200, "<html/>", headers);

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->getCalendarObject(QStringLiteral("/calendars/jane/work/a.ics")));
    QTRY_COMPARE(finished.count(), 1);

    QCOMPARE(mClient->error().kind(), CalDavError::MalformedResponse);
    QCOMPARE(mClient->error().phase(), CalDavError::ObjectPhase);
}

void tst_CalDavClient::putCalendarObject()
{
    RawHeaderList headers;
    headers << qMakePair(QByteArray("ETag"), QByteArray("\"v8\""));
    mManager->queueResponse(201, QByteArray(), headers);
    mManager->queueResponse(204, QByteArray(), headers);

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->putCalendarObject(QStringLiteral("/calendars/jane/work/new.ics"), EventData,
                                       QString(), QStringLiteral("*")));
    QTRY_COMPARE(finished.count(), 1);

    QVERIFY(!mClient->error().isError());
    QCOMPARE(mClient->object().path, QStringLiteral("/calendars/jane/work/new.ics"));
    QCOMPARE(mClient->object().etag, QStringLiteral("v8"));

    const FakeNetworkAccessManager::SentRequest &create = mManager->sentRequests.at(0);
    QCOMPARE(create.verb, QByteArray("PUT"));
    QCOMPARE(create.body, EventData);
    QCOMPARE(create.request.rawHeader("If-None-Match"), QByteArray("*"));
    QVERIFY(!create.request.hasRawHeader("If-Match"));
    QCOMPARE(create.request.header(QNetworkRequest::ContentTypeHeader).toString(),
             QStringLiteral("text/calendar; charset=utf-8"));

    QVERIFY(mClient->putCalendarObject(QStringLiteral("/calendars/jane/work/new.ics"), EventData,
                                       QStringLiteral("v8")));
    QTRY_COMPARE(finished.count(), 2);
    QVERIFY(!mClient->error().isError());
    const FakeNetworkAccessManager::SentRequest &replace = mManager->sentRequests.at(1);
    QCOMPARE(replace.request.rawHeader("If-Match"), QByteArray("\"v8\""));
    QVERIFY(!replace.request.hasRawHeader("If-None-Match"));
}

void tst_CalDavClient::putPreconditionFailed()
{
    mManager->queueResponse(412);

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->putCalendarObject(QStringLiteral("/calendars/jane/work/a.ics"), EventData,
                                       QStringLiteral("stale")));
    QTRY_COMPARE(finished.count(), 1);

    QCOMPARE(mClient->error().kind(), CalDavError::PreconditionFailed);
    QCOMPARE(mClient->error().httpStatus(), 412);
}

void tst_CalDavClient::deleteCalendarObject()
{
    mManager->queueResponse(204);

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->deleteCalendarObject(QStringLiteral("/calendars/jane/work/a.ics"), QStringLiteral("v1")));
    QTRY_COMPARE(finished.count(), 1);

    QVERIFY(!mClient->error().isError());
    const FakeNetworkAccessManager::SentRequest &sent = mManager->sentRequests.first();
    QCOMPARE(sent.verb, QByteArray("DELETE"));
    QCOMPARE(sent.request.rawHeader("If-Match"), QByteArray("\"v1\""));
    QVERIFY(sent.body.isEmpty());
}

void tst_CalDavClient::deleteMissingObject()
{
    mManager->queueResponse(404);

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->deleteCalendarObject(QStringLiteral("/calendars/jane/work/a.ics")));
    QTRY_COMPARE(finished.count(), 1);

    QCOMPARE(mClient->error().kind(), CalDavError::NotFound);
    QVERIFY(!mManager->sentRequests.first().request.hasRawHeader("If-Match"));
}

void tst_CalDavClient::emptyMultiget()
{
    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->calendarMultiget(QStringList(), CalendarCompRequest(QStringLiteral("VCALENDAR"))));
    QCOMPARE(finished.count(), 0);
    QTRY_COMPARE(finished.count(), 1);

    QVERIFY(!mClient->error().isError());
    QVERIFY(mClient->objects().isEmpty());
    QVERIFY(mManager->sentRequests.isEmpty());
}

void tst_CalDavClient::calendarQuery()
{
    mManager->queueResponse(207, multistatus(
        propResponse("/calendars/jane/work/a.ics", "<d:getetag>\"a1\"</d:getetag>"
                     "<c:calendar-data>" + EventData + "</c:calendar-data>")));

    CalendarQueryRequest query;
    query.compRequest = CalendarCompRequest(QStringLiteral("VCALENDAR"));
    query.compRequest.allProps = true;
    query.filter = CompFilter(QStringLiteral("VCALENDAR"));
    CompFilter todoFilter(QStringLiteral("VTODO"));
    PropFilter completed;
    completed.name = QStringLiteral("COMPLETED");
    completed.isNotDefined = true;
    todoFilter.props.append(completed);
    query.filter.comps.append(todoFilter);

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->calendarQuery(QStringLiteral("/calendars/jane/work/"), query));
    QTRY_COMPARE(finished.count(), 1);

    QVERIFY(!mClient->error().isError());
    QCOMPARE(mClient->objects().count(), 1);
    QCOMPARE(mClient->objects().first().etag, QStringLiteral("a1"));
    const QByteArray body = mManager->sentRequests.first().body;
    QVERIFY(body.contains("<c:calendar-query"));
    QVERIFY(body.contains("<c:comp-filter name=\"VTODO\"><c:prop-filter name=\"COMPLETED\">"
                          "<c:is-not-defined/></c:prop-filter></c:comp-filter>"));
}

void tst_CalDavClient::calendarQueryRange()
{
    QVERIFY(!mClient->calendarQueryRange(QStringLiteral("/calendars/jane/work/"), QDateTime(), QDateTime()));
    QCOMPARE(mClient->error().kind(), CalDavError::InvalidInput);
    QVERIFY(!mClient->isBusy());

    mManager->queueResponse(207, multistatus(
        propResponse("/calendars/jane/work/a.ics", "<d:getetag>\"a1\"</d:getetag>"
                     "<c:calendar-data>" + EventData + "</c:calendar-data>")));

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->calendarQueryRange(QStringLiteral("/calendars/jane/work/"),
                                        QDateTime(QDate(2024, 1, 1), QTime(0, 0), Qt::UTC),
                                        QDateTime(QDate(2024, 2, 1), QTime(0, 0), Qt::UTC)));
    QTRY_COMPARE(finished.count(), 1);

    QVERIFY(!mClient->error().isError());
    QCOMPARE(mClient->operation(), CalDavClient::CalendarQueryRange);
    QCOMPARE(mClient->objects().count(), 1);
}

void tst_CalDavClient::syncCalendar()
{
    mManager->queueResponse(207, multistatus(
        propResponse("/calendars/jane/work/a.ics", "<d:getetag>\"a1\"</d:getetag>"
                     "<c:calendar-data>" + EventData + "</c:calendar-data>"),
        QStringLiteral("sync-1")));

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->syncCalendar(QStringLiteral("/calendars/jane/work/"), SyncQuery()));
    QTRY_COMPARE(finished.count(), 1);

    QVERIFY(!mClient->error().isError());
    QCOMPARE(mClient->syncResponse().syncToken, QStringLiteral("sync-1"));
    QCOMPARE(mClient->syncResponse().updated.count(), 1);
}

void tst_CalDavClient::oneOperationAtATime()
{
    mManager->queueResponse(204);

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->deleteCalendarObject(QStringLiteral("/calendars/jane/work/a.ics")));
    QVERIFY(!mClient->findCurrentUserPrincipal());
    QVERIFY(!mClient->getCalendarObject(QStringLiteral("/calendars/jane/work/b.ics")));
    QCOMPARE(mClient->operation(), CalDavClient::DeleteCalendarObject);
    QTRY_COMPARE(finished.count(), 1);

    QVERIFY(!mClient->error().isError());
    QCOMPARE(mManager->sentRequests.count(), 1);
}

void tst_CalDavClient::abortOperation()
{
    mManager->setHoldReplies(true);

    QSignalSpy finished(mClient, SIGNAL(finished()));
    QVERIFY(mClient->syncCalendar(QStringLiteral("/calendars/jane/work/"), SyncQuery()));
    mClient->abort();
    QCOMPARE(finished.count(), 1);
    QCOMPARE(mClient->error().kind(), CalDavError::Cancelled);
    QVERIFY(!mClient->isBusy());

    QVERIFY(mClient->getCalendarObject(QStringLiteral("/calendars/jane/work/a.ics")));
    mClient->abort();
    QCOMPARE(finished.count(), 2);
    QCOMPARE(mClient->error().kind(), CalDavError::Cancelled);
    QCOMPARE(mClient->error().phase(), CalDavError::ObjectPhase);
}

#include "tst_caldavclient.moc"
QTEST_MAIN(tst_CalDavClient)
