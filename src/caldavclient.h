/*
 * This file is part of caldav-client package
 *
 * Copyright (C) 2013 Jolla Ltd. and/or its subsidiary(-ies).
 *
 * Contributors: Mani Chandrasekar <maninc@gmail.com>
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

#ifndef CALDAVCLIENT_H
#define CALDAVCLIENT_H

#include "caldavclient_global.h"
#include "caldaverror.h"
#include "calendar.h"
#include "calendarobject.h"
#include "calendarquery.h"
#include "calendarsyncagent.h"
#include "proppatch.h"
#include "settings.h"

#include <QObject>
#include <QDateTime>
#include <QPointer>
#include <QStringList>

class QDnsLookup;
class QNetworkAccessManager;
class CalendarRangeQuery;
class Request;

/*
    CalDavClient runs CalDAV (RFC 4791) operations against one server, one
    operation at a time. Every start method returns false when another
    operation is running or when its arguments are rejected, in which case
    error() describes the rejection and nothing is sent. Otherwise
    finished() is emitted once the operation completes, and error() and the
    result accessors describe the outcome.

    A typical first contact with a server:

        Settings settings;
        settings.setServerAddress("https://dav.example.com");
        settings.setUsername("user");
        settings.setPassword("secret");
        CalDavClient client(settings);

        client.findCurrentUserPrincipal();      // -> userPrincipal()
        client.findCalendarHomeSet(principal);  // -> calendarHomeSet()
        client.findCalendars(homeSet);          // -> calendars()

    and then, for each calendar to mirror:

        SyncQuery query;
        query.syncToken = storedToken;          // empty the first time
        query.startTime = QDateTime::currentDateTimeUtc().addDays(-30);
        client.syncCalendar(calendar.path, query);   // -> syncResponse()

    The sync token of syncResponse() is to be stored by the caller and
    presented on the next sync.
*/
class CALDAVCLIENT_EXPORT CalDavClient : public QObject
{
    Q_OBJECT

public:
    enum Operation {
        NoOperation,
        DiscoverContextUrl,
        FindCurrentUserPrincipal,
        FindCalendarHomeSet,
        FindCalendars,
        GetCalendar,
        UpdateCalendar,
        ListCalendarObjects,
        SyncCalendarList,
        GetCalendarObject,
        PutCalendarObject,
        DeleteCalendarObject,
        CalendarMultiget,
        CalendarQuery,
        CalendarQueryRange,
        SyncCalendar
    };

    // The client uses networkAccessManager when given, or owns one otherwise.
    explicit CalDavClient(const Settings &settings,
                          QNetworkAccessManager *networkAccessManager = 0,
                          QObject *parent = 0);
    virtual ~CalDavClient();

    Settings *settings();

    bool discoverContextUrl(const QString &domain);
    bool findCurrentUserPrincipal();
    bool findCalendarHomeSet(const QString &userPrincipal);
    bool findCalendars(const QString &calendarHomeSet);
    bool getCalendar(const QString &calendarPath);
    bool updateCalendar(const QString &calendarPath, const CalendarUpdate &update);
    bool listCalendarObjects(const QString &calendarPath, bool fetchData);
    bool syncCalendarList(const QString &calendarHomeSet, const QString &syncToken, int limit = 0);
    bool getCalendarObject(const QString &objectPath);
    bool putCalendarObject(const QString &objectPath, const QByteArray &icalData,
                           const QString &ifMatch = QString(), const QString &ifNoneMatch = QString());
    bool deleteCalendarObject(const QString &objectPath, const QString &ifMatch = QString());
    bool calendarMultiget(const QStringList &objectPaths, const CalendarCompRequest &compRequest);
    bool calendarQuery(const QString &calendarPath, const CalendarQueryRequest &query);
    bool calendarQueryRange(const QString &calendarPath, const QDateTime &start, const QDateTime &end);
    bool syncCalendar(const QString &calendarPath, const SyncQuery &query);

    void abort();

    bool isBusy() const;
    Operation operation() const;
    CalDavError error() const;

    QString contextUrl() const;
    QString userPrincipal() const;
    QString calendarHomeSet() const;
    CalendarList calendars() const;         // findCalendars, syncCalendarList
    QStringList deletedCalendars() const;   // syncCalendarList
    QString calendarListSyncToken() const;  // syncCalendarList
    Calendar calendar() const;              // getCalendar, updateCalendar
    CalendarObjectList objects() const;     // listCalendarObjects, calendarMultiget, calendarQuery, calendarQueryRange
    CalendarObject object() const;          // getCalendarObject, putCalendarObject
    SyncResponse syncResponse() const;      // syncCalendar

Q_SIGNALS:
    void finished();

private Q_SLOTS:
    void srvLookupFinished();
    void requestFinished();
    void rangeQueryFinished();
    void syncAgentFinished();
    void emptyMultigetFinished();

private:
    bool startOperation(Operation operation);
    void finishOperation(const CalDavError &error);
    void startRequest(Request *request);
    CalDavError::Phase operationPhase() const;

    CalDavError handlePrincipal(const QList<Reader::Response> &responses);
    CalDavError handleHomeSet(const QList<Reader::Response> &responses);
    CalDavError handleCalendars(const QList<Reader::Response> &responses);
    CalDavError handleCalendar(const QList<Reader::Response> &responses);
    CalDavError handleObjectList(const QList<Reader::Response> &responses);
    CalDavError handleCalendarList(const QList<Reader::Response> &responses);
    CalDavError decodeObjects(const QList<Reader::Response> &responses);
    void sendMultiget(const QStringList &objectPaths, const CalendarCompRequest &compRequest);

    Settings                    mSettings;
    QNetworkAccessManager*      mNAManager;
    Operation                   mOperation;
    bool                        mBusy;
    bool                        mFetchData;
    QString                     mTargetPath;
    QPointer<Request>           mRequest;
    QPointer<CalendarRangeQuery> mRangeQuery;
    QPointer<CalendarSyncAgent> mSyncAgent;
    QPointer<QDnsLookup>        mDnsLookup;
    CalDavError                 mError;

    QString                     mContextUrl;
    QString                     mUserPrincipal;
    QString                     mCalendarHomeSet;
    CalendarList                mCalendars;
    QStringList                 mDeletedCalendars;
    QString                     mCalendarListSyncToken;
    Calendar                    mCalendar;
    CalendarObjectList          mObjects;
    CalendarObject              mObject;
    SyncResponse                mSyncResponse;
};

#endif // CALDAVCLIENT_H
