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

#include "calendarrangequery.h"
#include "report.h"
#include "settings.h"

#include <QNetworkAccessManager>

#include <LogMacros.h>

CalendarRangeQuery::CalendarRangeQuery(QNetworkAccessManager *networkAccessManager,
                                       Settings *settings,
                                       QObject *parent)
    : QObject(parent)
    , mNetworkManager(networkAccessManager)
    , mSettings(settings)
    , mStarted(false)
    , mFinished(false)
{
}

CalendarRangeQuery::~CalendarRangeQuery()
{
    delete mReport.data();
}

bool CalendarRangeQuery::start(const QString &calendarPath, const QDateTime &start, const QDateTime &end)
{
    FUNCTION_CALL_TRACE;

    if (mStarted) {
        LOG_WARNING("Range query already started for" << mCalendarPath);
        return false;
    }
    if (!start.isValid() && !end.isValid()) {
        mError = CalDavError::invalidInput(CalDavError::QueryPhase,
                                           QStringLiteral("Time range query requires a start or an end"));
        return false;
    }
    if (start.isValid() && end.isValid() && start >= end) {
        mError = CalDavError::invalidInput(CalDavError::QueryPhase,
                                           QStringLiteral("Time range query start must be before its end"));
        return false;
    }

    mStarted = true;
    mCalendarPath = calendarPath;
    const QDateTime startUtc = start.isValid() ? start.toUTC() : QDateTime();
    const QDateTime endUtc = end.isValid() ? end.toUTC() : QDateTime();
    if (startUtc.isValid() && endUtc.isValid()) {
        mPendingWindows = splitRange(startUtc, endUtc, mSettings->rangeWindow());
    } else {
        mPendingWindows.append(Window(startUtc, endUtc));
    }
    LOG_DEBUG("Querying" << calendarPath << "in" << mPendingWindows.count() << "windows");

    sendNextWindow();
    return true;
}

void CalendarRangeQuery::abort()
{
    if (!mStarted || mFinished) {
        return;
    }
    if (mReport) {
        mReport->abort();
    } else {
        emitFinished(CalDavError(CalDavError::QueryPhase, CalDavError::Cancelled,
                                 Buteo::SyncResults::ABORTED, QStringLiteral("Range query aborted")));
    }
}

bool CalendarRangeQuery::isFinished() const
{
    return mFinished;
}

CalDavError CalendarRangeQuery::error() const
{
    return mError;
}

const CalendarObjectList& CalendarRangeQuery::results() const
{
    return mResults;
}

QList<CalendarRangeQuery::Window> CalendarRangeQuery::splitRange(const QDateTime &start, const QDateTime &end,
                                                                 qint64 windowSecs)
{
    QList<Window> windows;
    if (windowSecs <= 0) {
        windows.append(Window(start, end));
        return windows;
    }
    QDateTime cursor = start;
    while (cursor < end) {
        QDateTime windowEnd = cursor.addSecs(windowSecs);
        if (windowEnd > end) {
            windowEnd = end;
        }
        windows.append(Window(cursor, windowEnd));
        cursor = windowEnd;
    }
    return windows;
}

CalendarQueryRequest CalendarRangeQuery::windowQuery(const QDateTime &start, const QDateTime &end)
{
    CalendarQueryRequest query;
    query.compRequest.name = QStringLiteral("VCALENDAR");
    query.compRequest.allProps = true;
    CalendarCompRequest eventRequest(QStringLiteral("VEVENT"));
    eventRequest.allProps = true;
    query.compRequest.comps.append(eventRequest);
    if (start.isValid() && end.isValid()) {
        query.compRequest.expandStart = start;
        query.compRequest.expandEnd = end;
    }

    CompFilter eventFilter(QStringLiteral("VEVENT"));
    eventFilter.start = start;
    eventFilter.end = end;
    query.filter.name = QStringLiteral("VCALENDAR");
    query.filter.comps.append(eventFilter);
    return query;
}

void CalendarRangeQuery::sendNextWindow()
{
    if (mPendingWindows.isEmpty()) {
        LOG_DEBUG("Range query for" << mCalendarPath << "returned" << mResults.count() << "objects");
        emitFinished(CalDavError());
        return;
    }

    mCurrentWindow = mPendingWindows.takeFirst();
    LOG_DEBUG("Querying window" << mCurrentWindow.start.toString(Qt::ISODate)
              << "-" << mCurrentWindow.end.toString(Qt::ISODate));

    Report *report = new Report(mNetworkManager, mSettings, this);
    mReport = report;
    connect(report, SIGNAL(finished()), this, SLOT(reportFinished()));
    report->calendarQuery(mCalendarPath, windowQuery(mCurrentWindow.start, mCurrentWindow.end));
}

bool CalendarRangeQuery::bisectCurrentWindow()
{
    const Window window = mCurrentWindow;
    if (!window.start.isValid() || !window.end.isValid()) {
        return false;
    }
    const qint64 width = window.start.msecsTo(window.end);
    if (width <= mSettings->minimumRangeWindow() * 1000) {
        return false;
    }
    const QDateTime middle = window.start.addMSecs(width / 2);
    if (middle <= window.start) {
        return false;
    }
    LOG_DEBUG("Server refused window of" << width << "ms, splitting it");
    mPendingWindows.prepend(Window(middle, window.end));
    mPendingWindows.prepend(Window(window.start, middle));
    return true;
}

CalDavError CalendarRangeQuery::mergeResults(const QList<Reader::Response> &responses)
{
    CalendarObjectList objects;
    Q_FOREACH (const Reader::Response &response, responses) {
        if (!response.isSuccess()) {
            CalDavError::Kind kind = CalDavError::ServerError;
            if (response.status == 404) {
                kind = CalDavError::NotFound;
            } else if (response.status == 507) {
                kind = CalDavError::InsufficientStorage;
            }
            return CalDavError(CalDavError::QueryPhase, kind, Buteo::SyncResults::INTERNAL_ERROR,
                               QStringLiteral("Query result %1 has status %2").arg(response.href).arg(response.status));
        }
        objects.append(CalendarObject::fromResponse(response));
    }

    Q_FOREACH (const CalendarObject &object, objects) {
        QHash<QString, int>::const_iterator it = mResultIndex.constFind(object.path);
        if (it != mResultIndex.constEnd()) {
            mResults[it.value()] = object;
        } else {
            mResultIndex.insert(object.path, mResults.count());
            mResults.append(object);
        }
    }
    return CalDavError();
}

void CalendarRangeQuery::reportFinished()
{
    FUNCTION_CALL_TRACE;

    Report *report = qobject_cast<Report*>(sender());
    if (!report) {
        emitFinished(CalDavError::malformedResponse(CalDavError::QueryPhase,
                                                    QStringLiteral("Unexpected sender for range query")));
        return;
    }
    report->deleteLater();
    mReport.clear();

    CalDavError error = CalDavError::fromRequest(CalDavError::QueryPhase, report);
    if (!error.isError()) {
        error = mergeResults(report->responses());
    }

    if (error.kind() == CalDavError::InsufficientStorage && bisectCurrentWindow()) {
        sendNextWindow();
        return;
    }
    if (error.isError()) {
        emitFinished(error);
        return;
    }
    sendNextWindow();
}

void CalendarRangeQuery::emitFinished(const CalDavError &error)
{
    if (mFinished) {
        return;
    }
    mFinished = true;
    mError = error;
    if (error.isError()) {
        LOG_WARNING("Range query for" << mCalendarPath << "failed:" << error.message());
        mResults.clear();
        mResultIndex.clear();
    }
    emit finished();
}
