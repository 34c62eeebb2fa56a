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
#include <QtTest>

#include "reader.h"

class tst_Reader : public QObject
{
    Q_OBJECT

private slots:
    void syncCollection();
    void calendarCollection();
    void principalAndHomeSet();
    void failedPropStat();
    void sharedStatusHrefs();
    void invalidDocuments_data();
    void invalidDocuments();
    void parseStatus();
    void hrefToPath_data();
    void hrefToPath();
    void parseHttpDate();
};

void tst_Reader::syncCollection()
{
    const QByteArray data(
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
        "<d:multistatus xmlns:d=\"DAV:\" xmlns:cal=\"urn:ietf:params:xml:ns:caldav\">"
        "<d:response>"
        "<d:href>/calendars/user/home/event%201.ics</d:href>"
        "<d:propstat><d:prop>"
        "<d:getetag>\"abc-1\"</d:getetag>"
        "<d:getlastmodified>Tue, 12 Mar 2024 10:00:00 GMT</d:getlastmodified>"
        "<d:getcontentlength>321</d:getcontentlength>"
        "<cal:calendar-data>BEGIN:VCALENDAR\r\nEND:VCALENDAR\r\n</cal:calendar-data>"
        "</d:prop><d:status>HTTP/1.1 200 OK</d:status></d:propstat>"
        "</d:response>"
        "<d:response>"
        "<d:href>/calendars/user/home/gone.ics</d:href>"
        "<d:status>HTTP/1.1 404 Not Found</d:status>"
        "</d:response>"
        "<d:sync-token>http://example.com/sync/42</d:sync-token>"
        "</d:multistatus>");

    Reader reader;
    reader.read(data);
    QVERIFY(!reader.hasError());
    QCOMPARE(reader.syncToken(), QStringLiteral("http://example.com/sync/42"));
    QCOMPARE(reader.responses().count(), 2);

    const Reader::Response &updated = reader.responses().at(0);
    QCOMPARE(updated.href, QStringLiteral("/calendars/user/home/event 1.ics"));
    QCOMPARE(updated.status, 0);
    QVERIFY(updated.isSuccess());
    QCOMPARE(updated.etag, QStringLiteral("abc-1"));
    QCOMPARE(updated.lastModified, QDateTime(QDate(2024, 3, 12), QTime(10, 0), Qt::UTC));
    QCOMPARE(updated.contentLength, qint64(321));
    QVERIFY(updated.hasCalendarData);
    QVERIFY(updated.calendarData.startsWith("BEGIN:VCALENDAR"));
    QVERIFY(updated.hasProperty(QStringLiteral("getetag")));
    QVERIFY(!updated.hasResourceType);

    const Reader::Response &deleted = reader.responses().at(1);
    QCOMPARE(deleted.href, QStringLiteral("/calendars/user/home/gone.ics"));
    QCOMPARE(deleted.status, 404);
    QVERIFY(!deleted.isSuccess());
}

void tst_Reader::calendarCollection()
{
    const QByteArray data(
        "<D:multistatus xmlns:D=\"DAV:\" xmlns:C=\"urn:ietf:params:xml:ns:caldav\""
        " xmlns:A=\"http://apple.com/ns/ical/\">"
        "<D:response>"
        "<D:href>https://dav.example.com/calendars/user/work/</D:href>"
        "<D:propstat><D:prop>"
        "<D:resourcetype><D:collection/><C:calendar/></D:resourcetype>"
        "<D:displayname>Work</D:displayname>"
        "<C:calendar-description>Work things</C:calendar-description>"
        "<A:calendar-color>#FF0000FF</A:calendar-color>"
        "<C:max-resource-size>102400</C:max-resource-size>"
        "<C:supported-calendar-component-set><C:comp name=\"VEVENT\"/><C:comp name=\"VTODO\"/>"
        "</C:supported-calendar-component-set>"
        "<D:current-user-privilege-set>"
        "<D:privilege><D:read/></D:privilege><D:privilege><D:write/></D:privilege>"
        "</D:current-user-privilege-set>"
        "<D:sync-token>token-7</D:sync-token>"
        "</D:prop><D:status>HTTP/1.1 200 OK</D:status></D:propstat>"
        "</D:response>"
        "</D:multistatus>");

    Reader reader;
    reader.read(data);
    QVERIFY(!reader.hasError());
    QCOMPARE(reader.responses().count(), 1);

    const Reader::Response &response = reader.responses().first();
    QCOMPARE(response.href, QStringLiteral("/calendars/user/work/"));
    QVERIFY(response.hasResourceType);
    QVERIFY(response.isCollection);
    QVERIFY(response.isCalendar);
    QCOMPARE(response.displayName, QStringLiteral("Work"));
    QCOMPARE(response.description, QStringLiteral("Work things"));
    QCOMPARE(response.color, QStringLiteral("#FF0000FF"));
    QVERIFY(response.hasMaxResourceSize);
    QCOMPARE(response.maxResourceSize, qint64(102400));
    QCOMPARE(response.supportedComponents, QStringList() << "VEVENT" << "VTODO");
    QCOMPARE(response.privileges, QStringList() << "read" << "write");
    QCOMPARE(response.syncToken, QStringLiteral("token-7"));
    QVERIFY(reader.syncToken().isEmpty());
}

void tst_Reader::principalAndHomeSet()
{
    const QByteArray data(
        "<multistatus xmlns=\"DAV:\">"
        "<response><href>/</href>"
        "<propstat><prop>"
        "<current-user-principal><href>/principals/users/jane%40example.com/</href></current-user-principal>"
        "<calendar-home-set xmlns=\"urn:ietf:params:xml:ns:caldav\">"
        "<href xmlns=\"DAV:\">/calendars/jane/</href></calendar-home-set>"
        "</prop><status>HTTP/1.1 200 OK</status></propstat>"
        "</response>"
        "<response><href>/anonymous/</href>"
        "<propstat><prop><current-user-principal><unauthenticated/></current-user-principal></prop>"
        "<status>HTTP/1.1 200 OK</status></propstat>"
        "</response>"
        "</multistatus>");

    Reader reader;
    reader.read(data);
    QVERIFY(!reader.hasError());
    QCOMPARE(reader.responses().count(), 2);
    QCOMPARE(reader.responses().at(0).currentUserPrincipal, QStringLiteral("/principals/users/jane@example.com/"));
    QCOMPARE(reader.responses().at(0).calendarHomeSet, QStringLiteral("/calendars/jane/"));
    QVERIFY(!reader.responses().at(0).unauthenticated);
    QVERIFY(reader.responses().at(1).currentUserPrincipal.isEmpty());
    QVERIFY(reader.responses().at(1).unauthenticated);
}

void tst_Reader::failedPropStat()
{
    const QByteArray data(
        "<d:multistatus xmlns:d=\"DAV:\" xmlns:c=\"urn:ietf:params:xml:ns:caldav\">"
        "<d:response><d:href>/cal/</d:href>"
        "<d:propstat><d:prop><d:displayname>Home</d:displayname></d:prop>"
        "<d:status>HTTP/1.1 200 OK</d:status></d:propstat>"
        "<d:propstat><d:prop><c:calendar-description>Secret</c:calendar-description><d:sync-token/></d:prop>"
        "<d:status>HTTP/1.1 403 Forbidden</d:status></d:propstat>"
        "</d:response>"
        "</d:multistatus>");

    Reader reader;
    reader.read(data);
    QVERIFY(!reader.hasError());
    const Reader::Response &response = reader.responses().first();
    QCOMPARE(response.displayName, QStringLiteral("Home"));
    QVERIFY(response.description.isEmpty());
    QVERIFY(response.hasProperty(QStringLiteral("displayname")));
    QVERIFY(!response.hasProperty(QStringLiteral("calendar-description")));
    QCOMPARE(response.propertyStatus.value(QStringLiteral("sync-token")), 403);
    QVERIFY(response.isSuccess());
}

void tst_Reader::sharedStatusHrefs()
{
    const QByteArray data(
        "<d:multistatus xmlns:d=\"DAV:\">"
        "<d:response><d:href>/cal/a.ics</d:href><d:href>/cal/b.ics</d:href>"
        "<d:href>/cal/c.ics</d:href><d:status>HTTP/1.1 404 Not Found</d:status></d:response>"
        "<d:sync-token>sync-9</d:sync-token>"
        "</d:multistatus>");

    Reader reader;
    reader.read(data);
    QVERIFY(!reader.hasError());
    QCOMPARE(reader.responses().count(), 3);
    QCOMPARE(reader.responses().at(0).href, QStringLiteral("/cal/a.ics"));
    QCOMPARE(reader.responses().at(1).href, QStringLiteral("/cal/b.ics"));
    QCOMPARE(reader.responses().at(2).href, QStringLiteral("/cal/c.ics"));
    Q_FOREACH (const Reader::Response &response, reader.responses()) {
        QCOMPARE(response.status, 404);
    }
}

void tst_Reader::invalidDocuments_data()
{
    QTest::addColumn<QByteArray>("data");

    QTest::newRow("empty") << QByteArray();
    QTest::newRow("not multistatus") << QByteArray("<d:error xmlns:d=\"DAV:\"><d:valid-sync-token/></d:error>");
    QTest::newRow("unterminated") << QByteArray("<d:multistatus xmlns:d=\"DAV:\"><d:response>");
    QTest::newRow("missing href") << QByteArray("<d:multistatus xmlns:d=\"DAV:\"><d:response>"
                                                "<d:status>HTTP/1.1 200 OK</d:status>"
                                                "</d:response></d:multistatus>");
    QTest::newRow("several hrefs with propstat") << QByteArray(
            "<d:multistatus xmlns:d=\"DAV:\"><d:response>"
            "<d:href>/cal/a.ics</d:href><d:href>/cal/b.ics</d:href>"
            "<d:propstat><d:prop><d:getetag>\"1\"</d:getetag></d:prop>"
            "<d:status>HTTP/1.1 200 OK</d:status></d:propstat>"
            "</d:response></d:multistatus>");
}

void tst_Reader::invalidDocuments()
{
    QFETCH(QByteArray, data);

    Reader reader;
    reader.read(data);
    QVERIFY(reader.hasError());
    QVERIFY(!reader.errorString().isEmpty());
}

void tst_Reader::parseStatus()
{
    QCOMPARE(Reader::parseStatus(QStringLiteral("HTTP/1.1 200 OK")), 200);
    QCOMPARE(Reader::parseStatus(QStringLiteral("  HTTP/1.1   507 Insufficient Storage ")), 507);
    QCOMPARE(Reader::parseStatus(QStringLiteral("HTTP/1.1")), 0);
    QCOMPARE(Reader::parseStatus(QString()), 0);
}

void tst_Reader::hrefToPath_data()
{
    QTest::addColumn<QString>("href");
    QTest::addColumn<QString>("path");

    QTest::newRow("path") << "/cal/a.ics" << "/cal/a.ics";
    QTest::newRow("encoded") << "/cal/a%20b.ics" << "/cal/a b.ics";
    QTest::newRow("absolute") << "https://dav.example.com:8443/cal/a%40b.ics" << "/cal/a@b.ics";
    QTest::newRow("whitespace") << "\n  /cal/\n" << "/cal/";
}

void tst_Reader::hrefToPath()
{
    QFETCH(QString, href);
    QFETCH(QString, path);

    QCOMPARE(Reader::hrefToPath(href), path);
}

void tst_Reader::parseHttpDate()
{
    const QDateTime expected(QDate(1994, 11, 6), QTime(8, 49, 37), Qt::UTC);
    QCOMPARE(Reader::parseHttpDate(QStringLiteral("Sun, 06 Nov 1994 08:49:37 GMT")), expected);
    QCOMPARE(Reader::parseHttpDate(QStringLiteral("Sun Nov  6 08:49:37 1994")), expected);
    QVERIFY(!Reader::parseHttpDate(QStringLiteral("yesterday")).isValid());
}

#include "tst_reader.moc"
QTEST_MAIN(tst_Reader)
