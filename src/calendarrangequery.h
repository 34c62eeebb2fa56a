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

#ifndef CALENDARRANGEQUERY_H
#define CALENDARRANGEQUERY_H

#include "caldavclient_global.h"
#include "caldaverror.h"
#include "calendarobject.h"
#include "calendarquery.h"
#include "reader.h"

#include <QObject>
#include <QDateTime>
#include <QHash>
#include <QPointer>

class QNetworkAccessManager;
class Report;
class Settings;

// Fetches the events of a calendar intersecting [start, end).
// A bounded range is queried in consecutive windows of
// Settings::rangeWindow(). A window the server refuses with
// 507 Insufficient Storage is split in halves until it reaches
// Settings::minimumRangeWindow().
class CALDAVCLIENT_EXPORT CalendarRangeQuery : public QObject
{
    Q_OBJECT
public:
    struct Window {
        Window() {}
        Window(const QDateTime &windowStart, const QDateTime &windowEnd)
            : start(windowStart), end(windowEnd) {}
        QDateTime start;
        QDateTime end;
    };

    explicit CalendarRangeQuery(QNetworkAccessManager *networkAccessManager,
                                Settings *settings,
                                QObject *parent = 0);
    ~CalendarRangeQuery();

    // Either bound may be invalid, not both. Returns false without
    // sending anything on an invalid range, error() tells why.
    bool start(const QString &calendarPath, const QDateTime &start, const QDateTime &end);
    void abort();

    bool isFinished() const;
    CalDavError error() const;
    const CalendarObjectList& results() const;

    static QList<Window> splitRange(const QDateTime &start, const QDateTime &end, qint64 windowSecs);
    static CalendarQueryRequest windowQuery(const QDateTime &start, const QDateTime &end);

signals:
    void finished();

private slots:
    void reportFinished();

private:
    void sendNextWindow();
    bool bisectCurrentWindow();
    CalDavError mergeResults(const QList<Reader::Response> &responses);
    void emitFinished(const CalDavError &error);

    QNetworkAccessManager *mNetworkManager;
    Settings *mSettings;
    QPointer<Report> mReport;
    QString mCalendarPath;
    QList<Window> mPendingWindows;     // processed from the front
    Window mCurrentWindow;
    CalendarObjectList mResults;
    QHash<QString, int> mResultIndex;  // path to index in mResults
    CalDavError mError;
    bool mStarted;
    bool mFinished;
};

#endif // CALENDARRANGEQUERY_H
