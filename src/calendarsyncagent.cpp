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

#include "calendarsyncagent.h"
#include "eventmetadata.h"
#include "report.h"
#include "settings.h"

#include <QNetworkAccessManager>

#include <LogMacros.h>

static CalDavError::Kind kindForStatus(int status)
{
    if (status == 404) {
        return CalDavError::NotFound;
    } else if (status == 412) {
        return CalDavError::PreconditionFailed;
    } else if (status == 507) {
        return CalDavError::InsufficientStorage;
    }
    return CalDavError::ServerError;
}

CalendarSyncAgent::CalendarSyncAgent(QNetworkAccessManager *networkAccessManager,
                                     Settings *settings,
                                     QObject *parent)
    : QObject(parent)
    , mNetworkManager(networkAccessManager)
    , mSettings(settings)
    , mStarted(false)
    , mFinished(false)
{
}

CalendarSyncAgent::~CalendarSyncAgent()
{
    delete mReport.data();
}

CalendarCompRequest CalendarSyncAgent::standardCompRequest()
{
    CalendarCompRequest request(QStringLiteral("VCALENDAR"));
    request.allProps = true;
    CalendarCompRequest eventRequest(QStringLiteral("VEVENT"));
    eventRequest.allProps = true;
    request.comps.append(eventRequest);
    return request;
}

bool CalendarSyncAgent::startSync(const QString &calendarPath, const SyncQuery &query)
{
    FUNCTION_CALL_TRACE;

    if (mStarted) {
        LOG_WARNING("Sync already started for" << mCalendarPath);
        return false;
    }
    mStarted = true;
    mCalendarPath = calendarPath;
    if (query.syncToken.isEmpty() && query.startTime.isValid()) {
        mStartCutoff = query.startTime.toUTC();
    }
    LOG_DEBUG("Syncing" << calendarPath << "from token" << query.syncToken
              << "cutoff" << mStartCutoff.toString(Qt::ISODate));

    Report *report = new Report(mNetworkManager, mSettings, this);
    mReport = report;
    connect(report, SIGNAL(finished()), this, SLOT(syncReportFinished()));
    report->syncCollection(calendarPath, query.syncToken, query.limit, standardCompRequest());
    return true;
}

void CalendarSyncAgent::abort()
{
    if (!mStarted || mFinished) {
        return;
    }
    if (mReport) {
        mReport->abort();
    } else {
        emitFinished(CalDavError(CalDavError::SyncPhase, CalDavError::Cancelled,
                                 Buteo::SyncResults::ABORTED, QStringLiteral("Sync aborted")));
    }
}

bool CalendarSyncAgent::isFinished() const
{
    return mFinished;
}

CalDavError CalendarSyncAgent::error() const
{
    return mError;
}

const SyncResponse& CalendarSyncAgent::response() const
{
    return mResponse;
}

bool CalendarSyncAgent::includeForStartCutoff(const CalendarObject &object, const QDateTime &cutoff)
{
    EventMetadata metadata;
    if (EventMetadata::extract(object.data, &metadata)) {
        if (metadata.recurring) {
            if (!metadata.recurrenceEnd.isValid()) {
                return true;
            }
            return metadata.recurrenceEnd >= cutoff;
        }
        if (metadata.end.isValid()) {
            return metadata.end >= cutoff;
        }
        if (metadata.start.isValid()) {
            return metadata.start >= cutoff;
        }
    }

    if (object.modificationTime.isValid()) {
        return object.modificationTime >= cutoff;
    }
    return true;
}

CalDavError CalendarSyncAgent::processSyncResponses(const QList<Reader::Response> &responses)
{
    Q_FOREACH (const Reader::Response &response, responses) {
        if (response.status == 404) {
            mResponse.deleted.append(response.href);
            continue;
        }

        if (Calendar::sameCollectionPath(response.href, mCalendarPath)) {
            if (response.status == 507) {
                LOG_DEBUG("Server truncated the sync result for" << mCalendarPath);
                mResponse.truncated = true;
                continue;
            }
            if (!response.isSuccess()) {
                return CalDavError(CalDavError::SyncPhase, kindForStatus(response.status),
                                   Buteo::SyncResults::INTERNAL_ERROR,
                                   QStringLiteral("Collection entry has status %1").arg(response.status));
            }
            Calendar calendar;
            QString errorString;
            Calendar::DecodeResult result = Calendar::fromResponse(response, &calendar, &errorString);
            if (result == Calendar::InvalidCalendar) {
                return CalDavError::malformedResponse(CalDavError::SyncPhase, errorString);
            } else if (result == Calendar::Decoded) {
                mResponse.hasCalendar = true;
                mResponse.calendar = calendar;
            }
            continue;
        }

        if (!response.isSuccess()) {
            return CalDavError(CalDavError::SyncPhase, kindForStatus(response.status),
                               Buteo::SyncResults::INTERNAL_ERROR,
                               QStringLiteral("Sync entry %1 has status %2").arg(response.href).arg(response.status));
        }

        CalendarObject object = CalendarObject::fromResponse(response);
        if (mStartCutoff.isValid()) {
            if (object.data.isEmpty()) {
                mPendingPaths.append(object.path);
                mPendingObjects.insert(object.path, object);
                continue;
            }
            if (!includeForStartCutoff(object, mStartCutoff)) {
                LOG_DEBUG("Skipping" << object.path << "ending before the cutoff");
                continue;
            }
        }
        mResponse.updated.append(object);
    }
    return CalDavError();
}

void CalendarSyncAgent::syncReportFinished()
{
    FUNCTION_CALL_TRACE;

    Report *report = qobject_cast<Report*>(sender());
    if (!report) {
        emitFinished(CalDavError::malformedResponse(CalDavError::SyncPhase,
                                                    QStringLiteral("Unexpected sender for sync report")));
        return;
    }
    report->deleteLater();
    mReport.clear();

    CalDavError error = CalDavError::fromRequest(CalDavError::SyncPhase, report);
    if (error.isError()) {
        emitFinished(error);
        return;
    }

    mResponse.syncToken = report->syncToken();
    error = processSyncResponses(report->responses());
    if (error.isError()) {
        emitFinished(error);
        return;
    }

    if (mPendingPaths.isEmpty()) {
        emitFinished(CalDavError());
        return;
    }

    LOG_DEBUG("Fetching" << mPendingPaths.count() << "objects without calendar data");
    Report *multiGet = new Report(mNetworkManager, mSettings, this);
    mReport = multiGet;
    connect(multiGet, SIGNAL(finished()), this, SLOT(multiGetFinished()));
    multiGet->multiGet(CalendarObject::multiGetBasePath(mPendingPaths), mPendingPaths,
                       standardCompRequest());
}

void CalendarSyncAgent::multiGetFinished()
{
    FUNCTION_CALL_TRACE;

    Report *report = qobject_cast<Report*>(sender());
    if (!report) {
        emitFinished(CalDavError::malformedResponse(CalDavError::BackfillPhase,
                                                    QStringLiteral("Unexpected sender for multiget")));
        return;
    }
    report->deleteLater();
    mReport.clear();

    CalDavError error = CalDavError::fromRequest(CalDavError::BackfillPhase, report);
    if (error.isError()) {
        emitFinished(error);
        return;
    }

    QHash<QString, CalendarObject> fetchedObjects;
    Q_FOREACH (const Reader::Response &response, report->responses()) {
        if (!response.isSuccess()) {
            emitFinished(CalDavError(CalDavError::BackfillPhase, kindForStatus(response.status),
                                     Buteo::SyncResults::INTERNAL_ERROR,
                                     QStringLiteral("Multiget entry %1 has status %2").arg(response.href).arg(response.status)));
            return;
        }
        fetchedObjects.insert(response.href, CalendarObject::fromResponse(response));
    }

    Q_FOREACH (const QString &path, mPendingPaths) {
        CalendarObject object = mPendingObjects.value(path);
        QHash<QString, CalendarObject>::const_iterator it = fetchedObjects.constFind(path);
        if (it != fetchedObjects.constEnd()) {
            const CalendarObject &fetched = it.value();
            object.data = fetched.data;
            if (fetched.modificationTime.isValid()) {
                object.modificationTime = fetched.modificationTime;
            }
            if (fetched.contentLength != 0) {
                object.contentLength = fetched.contentLength;
            }
            if (!fetched.etag.isEmpty()) {
                object.etag = fetched.etag;
            }
        }
        if (!includeForStartCutoff(object, mStartCutoff)) {
            LOG_DEBUG("Skipping" << path << "ending before the cutoff");
            continue;
        }
        mResponse.updated.append(object);
    }
    mPendingPaths.clear();
    mPendingObjects.clear();

    emitFinished(CalDavError());
}

void CalendarSyncAgent::emitFinished(const CalDavError &error)
{
    if (mFinished) {
        return;
    }
    mFinished = true;
    mError = error;
    if (error.isError()) {
        LOG_WARNING("Sync of" << mCalendarPath << "failed in" << CalDavError::phaseName(error.phase())
                    << "phase:" << error.message());
        mResponse = SyncResponse();
    } else {
        LOG_DEBUG("Sync of" << mCalendarPath << "done:" << mResponse.updated.count() << "updated,"
                  << mResponse.deleted.count() << "deleted");
    }
    emit finished();
}
