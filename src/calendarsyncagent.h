/*
 * This file is part of caldav-client package
 *
 * Copyright (C) 2013 Jolla Ltd. and/or its subsidiary(-ies).
 *
 * Contributors: Bea Lam <bea.lam@jollamobile.com>
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

#ifndef CALENDARSYNCAGENT_H
#define CALENDARSYNCAGENT_H

#include "caldavclient_global.h"
#include "caldaverror.h"
#include "calendar.h"
#include "calendarobject.h"
#include "calendarquery.h"
#include "reader.h"

#include <QObject>
#include <QDateTime>
#include <QHash>
#include <QPointer>
#include <QStringList>

class QNetworkAccessManager;
class Report;
class Settings;

struct SyncQuery
{
    SyncQuery() : limit(0) {}

    QString syncToken;      // empty for an initial sync
    int limit;              // <= 0 for no limit
    QDateTime startTime;    // only honoured when syncToken is empty
};

struct SyncResponse
{
    SyncResponse() : hasCalendar(false), truncated(false) {}

    QString syncToken;
    bool hasCalendar;
    Calendar calendar;
    CalendarObjectList updated;
    QStringList deleted;
    bool truncated;         // more changes are pending on the server
};

// Runs one RFC 6578 sync-collection round on a calendar collection.
class CALDAVCLIENT_EXPORT CalendarSyncAgent : public QObject
{
    Q_OBJECT
public:
    explicit CalendarSyncAgent(QNetworkAccessManager *networkAccessManager,
                               Settings *settings,
                               QObject *parent = 0);
    ~CalendarSyncAgent();

    bool startSync(const QString &calendarPath, const SyncQuery &query);
    void abort();

    bool isFinished() const;
    CalDavError error() const;
    const SyncResponse& response() const;

    // Whether an object is still relevant at or after the cutoff,
    // judged from its first VEVENT, else from its modification time.
    static bool includeForStartCutoff(const CalendarObject &object, const QDateTime &cutoff);
    static CalendarCompRequest standardCompRequest();

signals:
    void finished();

private slots:
    void syncReportFinished();
    void multiGetFinished();

private:
    CalDavError processSyncResponses(const QList<Reader::Response> &responses);
    void emitFinished(const CalDavError &error);

    QNetworkAccessManager *mNetworkManager;
    Settings *mSettings;
    QPointer<Report> mReport;
    QString mCalendarPath;
    QDateTime mStartCutoff;
    SyncResponse mResponse;
    CalDavError mError;
    bool mStarted;
    bool mFinished;

    // objects whose payload was withheld, decided after the backfill
    QStringList mPendingPaths;
    QHash<QString, CalendarObject> mPendingObjects;
};

#endif // CALENDARSYNCAGENT_H
