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

#include "caldavclient.h"
#include "calendarrangequery.h"
#include "delete.h"
#include "get.h"
#include "propfind.h"
#include "put.h"
#include "report.h"

#include <QDnsLookup>
#include <QNetworkAccessManager>
#include <QTimer>
#include <QUrl>

#include <LogMacros.h>
#include <SyncResults.h>

static const int DEFAULT_CALDAVS_PORT = 443;

CalDavClient::CalDavClient(const Settings &settings,
                           QNetworkAccessManager *networkAccessManager,
                           QObject *parent)
    : QObject(parent)
    , mSettings(settings)
    , mNAManager(networkAccessManager)
    , mOperation(NoOperation)
    , mBusy(false)
    , mFetchData(false)
{
    FUNCTION_CALL_TRACE;

    if (!mNAManager) {
        mNAManager = new QNetworkAccessManager(this);
    }
}

CalDavClient::~CalDavClient()
{
    FUNCTION_CALL_TRACE;
}

Settings *CalDavClient::settings()
{
    return &mSettings;
}

bool CalDavClient::startOperation(Operation operation)
{
    if (mBusy) {
        LOG_WARNING("Cannot start operation" << operation << "while" << mOperation << "is running");
        return false;
    }
    mBusy = true;
    mOperation = operation;
    mError = CalDavError();
    mFetchData = false;
    mTargetPath.clear();
    return true;
}

void CalDavClient::finishOperation(const CalDavError &error)
{
    if (!mBusy) {
        return;
    }
    mBusy = false;
    mError = error;
    if (error.isError()) {
        LOG_WARNING("Operation" << mOperation << "failed in" << CalDavError::phaseName(error.phase())
                    << "phase:" << error.message());
    } else {
        LOG_DEBUG("Operation" << mOperation << "finished");
    }
    emit finished();
}

void CalDavClient::startRequest(Request *request)
{
    mRequest = request;
    connect(request, SIGNAL(finished()), this, SLOT(requestFinished()));
}

CalDavError::Phase CalDavClient::operationPhase() const
{
    switch (mOperation) {
    case DiscoverContextUrl:
    case FindCurrentUserPrincipal:
    case FindCalendarHomeSet:
    case FindCalendars:
    case GetCalendar:
    case UpdateCalendar:
    case SyncCalendarList:
        return CalDavError::DiscoveryPhase;
    case ListCalendarObjects:
    case CalendarMultiget:
    case CalendarQuery:
    case CalendarQueryRange:
        return CalDavError::QueryPhase;
    case GetCalendarObject:
    case PutCalendarObject:
    case DeleteCalendarObject:
        return CalDavError::ObjectPhase;
    case SyncCalendar:
        return CalDavError::SyncPhase;
    case NoOperation:
        break;
    }
    return CalDavError::NoPhase;
}

bool CalDavClient::discoverContextUrl(const QString &domain)
{
    FUNCTION_CALL_TRACE;

    if (mBusy) {
        return false;
    }
    if (domain.trimmed().isEmpty()) {
        mError = CalDavError::invalidInput(CalDavError::DiscoveryPhase,
                                           QStringLiteral("Cannot discover a server without a domain"));
        return false;
    }
    startOperation(DiscoverContextUrl);
    mContextUrl.clear();

    QDnsLookup *lookup = new QDnsLookup(QDnsLookup::SRV,
                                       QStringLiteral("_caldavs._tcp.") + domain.trimmed(), this);
    mDnsLookup = lookup;
    connect(lookup, SIGNAL(finished()), this, SLOT(srvLookupFinished()));
    LOG_DEBUG("Looking up" << lookup->name());
    lookup->lookup();
    return true;
}

void CalDavClient::srvLookupFinished()
{
    FUNCTION_CALL_TRACE;

    QDnsLookup *lookup = qobject_cast<QDnsLookup*>(sender());
    if (!lookup || lookup != mDnsLookup) {
        LOG_WARNING("Ignoring finished signal of a stale DNS lookup");
        return;
    }
    lookup->deleteLater();
    mDnsLookup.clear();

    if (lookup->error() == QDnsLookup::OperationCancelledError) {
        finishOperation(CalDavError(CalDavError::DiscoveryPhase, CalDavError::Cancelled,
                                    Buteo::SyncResults::ABORTED, QStringLiteral("Discovery aborted")));
        return;
    }
    if (lookup->error() != QDnsLookup::NoError && lookup->error() != QDnsLookup::NotFoundError) {
        finishOperation(CalDavError(CalDavError::DiscoveryPhase, CalDavError::TransportError,
                                    Buteo::SyncResults::CONNECTION_ERROR,
                                    QString("SRV lookup of %1 failed: %2").arg(lookup->name()).arg(lookup->errorString())));
        return;
    }

    const QList<QDnsServiceRecord> records = lookup->serviceRecords();
    if (records.isEmpty()) {
        finishOperation(CalDavError(CalDavError::DiscoveryPhase, CalDavError::NotFound,
                                    Buteo::SyncResults::INTERNAL_ERROR,
                                    QString("No SRV record found for %1").arg(lookup->name())));
        return;
    }

    const QDnsServiceRecord &record = records.first();
    QString target = record.target();
    while (target.endsWith(QLatin1Char('.'))) {
        target.chop(1);
    }
    if (target.isEmpty()) {
        finishOperation(CalDavError::malformedResponse(CalDavError::DiscoveryPhase,
                                                       QString("SRV record of %1 has no target").arg(lookup->name())));
        return;
    }

    QUrl url;
    url.setScheme(QStringLiteral("https"));
    url.setHost(target);
    if (record.port() != DEFAULT_CALDAVS_PORT) {
        url.setPort(record.port());
    }
    url.setPath(QStringLiteral("/.well-known/caldav"));
    mContextUrl = url.toString();
    LOG_DEBUG("Discovered context URL" << mContextUrl);
    finishOperation(CalDavError());
}

bool CalDavClient::findCurrentUserPrincipal()
{
    FUNCTION_CALL_TRACE;

    if (!startOperation(FindCurrentUserPrincipal)) {
        return false;
    }
    mUserPrincipal.clear();

    PropFind *propFind = new PropFind(mNAManager, &mSettings, this);
    startRequest(propFind);
    propFind->listCurrentUserPrincipal();
    return true;
}

bool CalDavClient::findCalendarHomeSet(const QString &userPrincipal)
{
    FUNCTION_CALL_TRACE;

    if (mBusy) {
        return false;
    }
    if (userPrincipal.isEmpty()) {
        mError = CalDavError::invalidInput(CalDavError::DiscoveryPhase,
                                           QStringLiteral("Cannot find the calendar home set without a principal"));
        return false;
    }
    startOperation(FindCalendarHomeSet);
    mCalendarHomeSet.clear();

    PropFind *propFind = new PropFind(mNAManager, &mSettings, this);
    startRequest(propFind);
    propFind->listCalendarHomeSet(userPrincipal);
    return true;
}

bool CalDavClient::findCalendars(const QString &calendarHomeSet)
{
    FUNCTION_CALL_TRACE;

    if (mBusy) {
        return false;
    }
    if (calendarHomeSet.isEmpty()) {
        mError = CalDavError::invalidInput(CalDavError::DiscoveryPhase,
                                           QStringLiteral("Cannot list calendars without a home set"));
        return false;
    }
    startOperation(FindCalendars);
    mTargetPath = calendarHomeSet;
    mCalendars.clear();

    PropFind *propFind = new PropFind(mNAManager, &mSettings, this);
    startRequest(propFind);
    propFind->listCalendars(calendarHomeSet);
    return true;
}

bool CalDavClient::getCalendar(const QString &calendarPath)
{
    FUNCTION_CALL_TRACE;

    if (mBusy) {
        return false;
    }
    if (calendarPath.isEmpty()) {
        mError = CalDavError::invalidInput(CalDavError::DiscoveryPhase,
                                           QStringLiteral("Cannot get a calendar without a path"));
        return false;
    }
    startOperation(GetCalendar);
    mTargetPath = calendarPath;
    mCalendar = Calendar();

    PropFind *propFind = new PropFind(mNAManager, &mSettings, this);
    startRequest(propFind);
    propFind->getCalendar(calendarPath);
    return true;
}

bool CalDavClient::updateCalendar(const QString &calendarPath, const CalendarUpdate &update)
{
    FUNCTION_CALL_TRACE;

    if (mBusy) {
        return false;
    }
    if (calendarPath.isEmpty()) {
        mError = CalDavError::invalidInput(CalDavError::DiscoveryPhase,
                                           QStringLiteral("Cannot update a calendar without a path"));
        return false;
    }
    if (update.isEmpty()) {
        mError = CalDavError::invalidInput(CalDavError::DiscoveryPhase,
                                           QStringLiteral("No calendar property to update"));
        return false;
    }
    startOperation(UpdateCalendar);
    mTargetPath = calendarPath;
    mCalendar = Calendar();

    PropPatch *propPatch = new PropPatch(mNAManager, &mSettings, this);
    startRequest(propPatch);
    propPatch->updateCalendar(calendarPath, update);
    return true;
}

bool CalDavClient::listCalendarObjects(const QString &calendarPath, bool fetchData)
{
    FUNCTION_CALL_TRACE;

    if (mBusy) {
        return false;
    }
    if (calendarPath.isEmpty()) {
        mError = CalDavError::invalidInput(CalDavError::QueryPhase,
                                           QStringLiteral("Cannot list objects without a calendar path"));
        return false;
    }
    startOperation(ListCalendarObjects);
    mTargetPath = calendarPath;
    mFetchData = fetchData;
    mObjects.clear();

    PropFind *propFind = new PropFind(mNAManager, &mSettings, this);
    startRequest(propFind);
    propFind->listObjects(calendarPath);
    return true;
}

bool CalDavClient::syncCalendarList(const QString &calendarHomeSet, const QString &syncToken, int limit)
{
    FUNCTION_CALL_TRACE;

    if (mBusy) {
        return false;
    }
    if (calendarHomeSet.isEmpty()) {
        mError = CalDavError::invalidInput(CalDavError::DiscoveryPhase,
                                           QStringLiteral("Cannot sync calendars without a home set"));
        return false;
    }
    startOperation(SyncCalendarList);
    mTargetPath = calendarHomeSet;
    mCalendars.clear();
    mDeletedCalendars.clear();
    mCalendarListSyncToken.clear();

    Report *report = new Report(mNAManager, &mSettings, this);
    startRequest(report);
    report->syncCalendarList(calendarHomeSet, syncToken, limit);
    return true;
}

bool CalDavClient::getCalendarObject(const QString &objectPath)
{
    FUNCTION_CALL_TRACE;

    if (mBusy) {
        return false;
    }
    if (objectPath.isEmpty()) {
        mError = CalDavError::invalidInput(CalDavError::ObjectPhase,
                                           QStringLiteral("Cannot get an object without a path"));
        return false;
    }
    startOperation(GetCalendarObject);
    mTargetPath = objectPath;
    mObject = CalendarObject();

    Get *get = new Get(mNAManager, &mSettings, this);
    startRequest(get);
    get->getObject(objectPath);
    return true;
}

bool CalDavClient::putCalendarObject(const QString &objectPath, const QByteArray &icalData,
                                     const QString &ifMatch, const QString &ifNoneMatch)
{
    FUNCTION_CALL_TRACE;

    if (mBusy) {
        return false;
    }
    if (objectPath.isEmpty()) {
        mError = CalDavError::invalidInput(CalDavError::ObjectPhase,
                                           QStringLiteral("Cannot put an object without a path"));
        return false;
    }
    startOperation(PutCalendarObject);
    mTargetPath = objectPath;
    mObject = CalendarObject();

    Put *put = new Put(mNAManager, &mSettings, this);
    startRequest(put);
    put->putObject(objectPath, icalData, ifMatch, ifNoneMatch);
    return true;
}

bool CalDavClient::deleteCalendarObject(const QString &objectPath, const QString &ifMatch)
{
    FUNCTION_CALL_TRACE;

    if (mBusy) {
        return false;
    }
    if (objectPath.isEmpty()) {
        mError = CalDavError::invalidInput(CalDavError::ObjectPhase,
                                           QStringLiteral("Cannot delete an object without a path"));
        return false;
    }
    startOperation(DeleteCalendarObject);
    mTargetPath = objectPath;

    Delete *del = new Delete(mNAManager, &mSettings, this);
    startRequest(del);
    del->deleteObject(objectPath, ifMatch);
    return true;
}

bool CalDavClient::calendarMultiget(const QStringList &objectPaths, const CalendarCompRequest &compRequest)
{
    FUNCTION_CALL_TRACE;

    if (!startOperation(CalendarMultiget)) {
        return false;
    }
    mObjects.clear();

    if (objectPaths.isEmpty()) {
        QTimer::singleShot(0, this, SLOT(emptyMultigetFinished()));
        return true;
    }
    sendMultiget(objectPaths, compRequest);
    return true;
}

void CalDavClient::emptyMultigetFinished()
{
    if (mOperation == CalendarMultiget) {
        finishOperation(CalDavError());
    }
}

void CalDavClient::sendMultiget(const QStringList &objectPaths, const CalendarCompRequest &compRequest)
{
    Report *report = new Report(mNAManager, &mSettings, this);
    startRequest(report);
    report->multiGet(CalendarObject::multiGetBasePath(objectPaths), objectPaths, compRequest);
}

bool CalDavClient::calendarQuery(const QString &calendarPath, const CalendarQueryRequest &query)
{
    FUNCTION_CALL_TRACE;

    if (mBusy) {
        return false;
    }
    if (calendarPath.isEmpty()) {
        mError = CalDavError::invalidInput(CalDavError::QueryPhase,
                                           QStringLiteral("Cannot query without a calendar path"));
        return false;
    }
    startOperation(CalendarQuery);
    mTargetPath = calendarPath;
    mObjects.clear();

    Report *report = new Report(mNAManager, &mSettings, this);
    startRequest(report);
    report->calendarQuery(calendarPath, query);
    return true;
}

bool CalDavClient::calendarQueryRange(const QString &calendarPath, const QDateTime &start, const QDateTime &end)
{
    FUNCTION_CALL_TRACE;

    if (mBusy) {
        return false;
    }
    CalendarRangeQuery *rangeQuery = new CalendarRangeQuery(mNAManager, &mSettings, this);
    connect(rangeQuery, SIGNAL(finished()), this, SLOT(rangeQueryFinished()));
    startOperation(CalendarQueryRange);
    mTargetPath = calendarPath;
    mObjects.clear();
    mRangeQuery = rangeQuery;
    if (!rangeQuery->start(calendarPath, start, end)) {
        mBusy = false;
        mError = rangeQuery->error();
        mRangeQuery.clear();
        delete rangeQuery;
        return false;
    }
    return true;
}

void CalDavClient::rangeQueryFinished()
{
    FUNCTION_CALL_TRACE;

    CalendarRangeQuery *rangeQuery = qobject_cast<CalendarRangeQuery*>(sender());
    if (!rangeQuery || rangeQuery != mRangeQuery) {
        LOG_WARNING("Ignoring finished signal of a stale range query");
        return;
    }
    rangeQuery->deleteLater();
    mRangeQuery.clear();

    mObjects = rangeQuery->results();
    finishOperation(rangeQuery->error());
}

bool CalDavClient::syncCalendar(const QString &calendarPath, const SyncQuery &query)
{
    FUNCTION_CALL_TRACE;

    if (mBusy) {
        return false;
    }
    if (calendarPath.isEmpty()) {
        mError = CalDavError::invalidInput(CalDavError::SyncPhase,
                                           QStringLiteral("Cannot sync without a calendar path"));
        return false;
    }
    startOperation(SyncCalendar);
    mTargetPath = calendarPath;
    mSyncResponse = SyncResponse();

    CalendarSyncAgent *agent = new CalendarSyncAgent(mNAManager, &mSettings, this);
    connect(agent, SIGNAL(finished()), this, SLOT(syncAgentFinished()));
    mSyncAgent = agent;
    if (!agent->startSync(calendarPath, query)) {
        mBusy = false;
        mError = CalDavError(CalDavError::SyncPhase, CalDavError::InvalidInput,
                             Buteo::SyncResults::INTERNAL_ERROR, QStringLiteral("Cannot start the sync"));
        mSyncAgent.clear();
        delete agent;
        return false;
    }
    return true;
}

void CalDavClient::syncAgentFinished()
{
    FUNCTION_CALL_TRACE;

    CalendarSyncAgent *agent = qobject_cast<CalendarSyncAgent*>(sender());
    if (!agent || agent != mSyncAgent) {
        LOG_WARNING("Ignoring finished signal of a stale sync agent");
        return;
    }
    agent->deleteLater();
    mSyncAgent.clear();

    mSyncResponse = agent->response();
    finishOperation(agent->error());
}

void CalDavClient::abort()
{
    FUNCTION_CALL_TRACE;

    if (!mBusy) {
        return;
    }
    LOG_DEBUG("Aborting operation" << mOperation);
    if (mRequest) {
        mRequest->abort();
    } else if (mRangeQuery) {
        mRangeQuery->abort();
    } else if (mSyncAgent) {
        mSyncAgent->abort();
    } else if (mDnsLookup) {
        mDnsLookup->abort();
    } else {
        finishOperation(CalDavError(operationPhase(), CalDavError::Cancelled,
                                    Buteo::SyncResults::ABORTED, QStringLiteral("Operation aborted")));
    }
}

void CalDavClient::requestFinished()
{
    FUNCTION_CALL_TRACE;

    Request *request = qobject_cast<Request*>(sender());
    if (!request || request != mRequest) {
        LOG_WARNING("Ignoring finished signal of a stale request");
        return;
    }
    request->deleteLater();
    mRequest.clear();

    CalDavError error = CalDavError::fromRequest(operationPhase(), request);
    if (error.isError()) {
        PropPatch *propPatch = qobject_cast<PropPatch*>(request);
        if (propPatch && !propPatch->rejectedProperties().isEmpty()) {
            error = CalDavError(CalDavError::DiscoveryPhase, CalDavError::ServerError,
                                error.minorCode(), error.message());
        }
        finishOperation(error);
        return;
    }

    switch (mOperation) {
    case FindCurrentUserPrincipal:
        error = handlePrincipal(static_cast<PropFind*>(request)->responses());
        break;
    case FindCalendarHomeSet:
        error = handleHomeSet(static_cast<PropFind*>(request)->responses());
        break;
    case FindCalendars:
        error = handleCalendars(static_cast<PropFind*>(request)->responses());
        break;
    case GetCalendar:
        error = handleCalendar(static_cast<PropFind*>(request)->responses());
        break;
    case UpdateCalendar:
        if (qobject_cast<PropPatch*>(request)) {
            LOG_DEBUG("Calendar" << mTargetPath << "updated, fetching its properties");
            PropFind *propFind = new PropFind(mNAManager, &mSettings, this);
            startRequest(propFind);
            propFind->getCalendar(mTargetPath);
            return;
        }
        error = handleCalendar(static_cast<PropFind*>(request)->responses());
        break;
    case ListCalendarObjects:
        if (PropFind *propFind = qobject_cast<PropFind*>(request)) {
            error = handleObjectList(propFind->responses());
            if (!error.isError() && mFetchData && !mObjects.isEmpty()) {
                QStringList paths;
                Q_FOREACH (const CalendarObject &object, mObjects) {
                    paths.append(object.path);
                }
                mObjects.clear();
                CalendarCompRequest compRequest(QStringLiteral("VCALENDAR"));
                compRequest.allProps = true;
                compRequest.allComps = true;
                sendMultiget(paths, compRequest);
                return;
            }
        } else {
            error = decodeObjects(static_cast<Report*>(request)->responses());
        }
        break;
    case SyncCalendarList: {
        Report *report = static_cast<Report*>(request);
        mCalendarListSyncToken = report->syncToken();
        error = handleCalendarList(report->responses());
        break;
    }
    case GetCalendarObject:
        mObject = static_cast<Get*>(request)->object();
        break;
    case PutCalendarObject:
        mObject = static_cast<Put*>(request)->object();
        break;
    case DeleteCalendarObject:
        break;
    case CalendarMultiget:
    case CalendarQuery:
        error = decodeObjects(static_cast<Report*>(request)->responses());
        break;
    default:
        error = CalDavError::malformedResponse(operationPhase(),
                                               QStringLiteral("Unexpected request for the running operation"));
        break;
    }

    finishOperation(error);
}

CalDavError CalDavClient::handlePrincipal(const QList<Reader::Response> &responses)
{
    if (responses.isEmpty()) {
        return CalDavError::malformedResponse(CalDavError::DiscoveryPhase,
                                              QStringLiteral("No response for current-user-principal"));
    }
    const Reader::Response &response = responses.first();
    if (!response.isSuccess()) {
        return CalDavError(CalDavError::DiscoveryPhase, CalDavError::ServerError,
                           Buteo::SyncResults::INTERNAL_ERROR,
                           QString("Principal lookup has status %1").arg(response.status));
    }
    if (response.unauthenticated) {
        return CalDavError(CalDavError::DiscoveryPhase, CalDavError::ServerError,
                           Buteo::SyncResults::AUTHENTICATION_FAILURE,
                           QStringLiteral("Current user is not authenticated"));
    }
    if (response.currentUserPrincipal.isEmpty()) {
        return CalDavError::malformedResponse(CalDavError::DiscoveryPhase,
                                              QStringLiteral("Response has no current-user-principal"));
    }
    mUserPrincipal = response.currentUserPrincipal;
    LOG_DEBUG("Current user principal is" << mUserPrincipal);
    return CalDavError();
}

CalDavError CalDavClient::handleHomeSet(const QList<Reader::Response> &responses)
{
    if (responses.isEmpty()) {
        return CalDavError::malformedResponse(CalDavError::DiscoveryPhase,
                                              QStringLiteral("No response for calendar-home-set"));
    }
    const Reader::Response &response = responses.first();
    if (!response.isSuccess()) {
        return CalDavError(CalDavError::DiscoveryPhase, CalDavError::ServerError,
                           Buteo::SyncResults::INTERNAL_ERROR,
                           QString("Home set lookup has status %1").arg(response.status));
    }
    if (response.calendarHomeSet.isEmpty()) {
        return CalDavError::malformedResponse(CalDavError::DiscoveryPhase,
                                              QStringLiteral("Response has no calendar-home-set"));
    }
    mCalendarHomeSet = response.calendarHomeSet;
    LOG_DEBUG("Calendar home set is" << mCalendarHomeSet);
    return CalDavError();
}

CalDavError CalDavClient::handleCalendars(const QList<Reader::Response> &responses)
{
    Q_FOREACH (const Reader::Response &response, responses) {
        if (!response.isSuccess()) {
            return CalDavError(CalDavError::DiscoveryPhase, CalDavError::ServerError,
                               Buteo::SyncResults::INTERNAL_ERROR,
                               QString("Calendar listing entry %1 has status %2").arg(response.href).arg(response.status));
        }
        Calendar calendar;
        QString errorString;
        const Calendar::DecodeResult result = Calendar::fromResponse(response, &calendar, &errorString);
        if (result == Calendar::InvalidCalendar) {
            return CalDavError::malformedResponse(CalDavError::DiscoveryPhase, errorString);
        }
        if (result == Calendar::NotACalendar) {
            continue;
        }
        mCalendars.append(calendar);
    }
    LOG_DEBUG("Found" << mCalendars.count() << "calendars in" << mTargetPath);
    return CalDavError();
}

CalDavError CalDavClient::handleCalendar(const QList<Reader::Response> &responses)
{
    if (responses.count() != 1) {
        return CalDavError::malformedResponse(CalDavError::DiscoveryPhase,
                                              QString("Expected one calendar response, got %1").arg(responses.count()));
    }
    const Reader::Response &response = responses.first();
    if (response.status == 404) {
        return CalDavError(CalDavError::DiscoveryPhase, CalDavError::NotFound,
                           Buteo::SyncResults::INTERNAL_ERROR,
                           QString("Calendar %1 not found").arg(mTargetPath));
    }
    if (!response.isSuccess()) {
        return CalDavError(CalDavError::DiscoveryPhase, CalDavError::ServerError,
                           Buteo::SyncResults::INTERNAL_ERROR,
                           QString("Calendar %1 has status %2").arg(mTargetPath).arg(response.status));
    }

    Calendar calendar;
    QString errorString;
    switch (Calendar::fromResponse(response, &calendar, &errorString)) {
    case Calendar::NotACalendar:
        return CalDavError(CalDavError::DiscoveryPhase, CalDavError::NotFound,
                           Buteo::SyncResults::INTERNAL_ERROR,
                           QString("%1 is not a calendar").arg(mTargetPath));
    case Calendar::InvalidCalendar:
        return CalDavError::malformedResponse(CalDavError::DiscoveryPhase, errorString);
    case Calendar::Decoded:
        break;
    }
    mCalendar = calendar;
    return CalDavError();
}

CalDavError CalDavClient::handleObjectList(const QList<Reader::Response> &responses)
{
    Q_FOREACH (const Reader::Response &response, responses) {
        if (Calendar::sameCollectionPath(response.href, mTargetPath)) {
            continue;
        }
        if (!response.resourceTypes.isEmpty() || response.isCollection) {
            continue;
        }
        if (!response.isSuccess()) {
            LOG_DEBUG("Skipping" << response.href << "with status" << response.status);
            continue;
        }
        mObjects.append(CalendarObject::fromResponse(response));
    }
    LOG_DEBUG("Listed" << mObjects.count() << "objects in" << mTargetPath);
    return CalDavError();
}

CalDavError CalDavClient::handleCalendarList(const QList<Reader::Response> &responses)
{
    Q_FOREACH (const Reader::Response &response, responses) {
        if (Calendar::sameCollectionPath(response.href, mTargetPath)) {
            continue;
        }
        if (response.status == 404) {
            mDeletedCalendars.append(response.href);
            continue;
        }
        if (!response.isSuccess()) {
            LOG_DEBUG("Skipping" << response.href << "with status" << response.status);
            continue;
        }
        Calendar calendar;
        QString errorString;
        const Calendar::DecodeResult result = Calendar::fromResponse(response, &calendar, &errorString);
        if (result == Calendar::InvalidCalendar) {
            return CalDavError::malformedResponse(CalDavError::DiscoveryPhase, errorString);
        }
        if (result == Calendar::NotACalendar) {
            continue;
        }
        mCalendars.append(calendar);
    }
    LOG_DEBUG("Calendar list of" << mTargetPath << ":" << mCalendars.count() << "changed,"
              << mDeletedCalendars.count() << "deleted");
    return CalDavError();
}

CalDavError CalDavClient::decodeObjects(const QList<Reader::Response> &responses)
{
    Q_FOREACH (const Reader::Response &response, responses) {
        if (!response.isSuccess()) {
            CalDavError::Kind kind = response.status == 404 ? CalDavError::NotFound : CalDavError::ServerError;
            mObjects.clear();
            return CalDavError(CalDavError::QueryPhase, kind, Buteo::SyncResults::INTERNAL_ERROR,
                               QString("Object %1 has status %2").arg(response.href).arg(response.status));
        }
        mObjects.append(CalendarObject::fromResponse(response));
    }
    return CalDavError();
}

bool CalDavClient::isBusy() const
{
    return mBusy;
}

CalDavClient::Operation CalDavClient::operation() const
{
    return mOperation;
}

CalDavError CalDavClient::error() const
{
    return mError;
}

QString CalDavClient::contextUrl() const
{
    return mContextUrl;
}

QString CalDavClient::userPrincipal() const
{
    return mUserPrincipal;
}

QString CalDavClient::calendarHomeSet() const
{
    return mCalendarHomeSet;
}

CalendarList CalDavClient::calendars() const
{
    return mCalendars;
}

QStringList CalDavClient::deletedCalendars() const
{
    return mDeletedCalendars;
}

QString CalDavClient::calendarListSyncToken() const
{
    return mCalendarListSyncToken;
}

Calendar CalDavClient::calendar() const
{
    return mCalendar;
}

CalendarObjectList CalDavClient::objects() const
{
    return mObjects;
}

CalendarObject CalDavClient::object() const
{
    return mObject;
}

SyncResponse CalDavClient::syncResponse() const
{
    return mSyncResponse;
}
