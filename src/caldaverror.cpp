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

#include "caldaverror.h"
#include "request.h"

#include <SyncResults.h>

CalDavError::CalDavError()
    : mPhase(NoPhase)
    , mKind(NoError)
    , mMinorCode(Buteo::SyncResults::NO_ERROR)
    , mHttpStatus(0)
    , mNetworkError(QNetworkReply::NoError)
{
}

CalDavError::CalDavError(Phase phase, Kind kind, int minorCode, const QString &message)
    : mPhase(phase)
    , mKind(kind)
    , mMinorCode(minorCode)
    , mHttpStatus(0)
    , mNetworkError(QNetworkReply::NoError)
    , mMessage(message)
{
}

CalDavError CalDavError::fromRequest(Phase phase, const Request *request)
{
    if (!request->hasError()) {
        return CalDavError();
    }

    Kind kind = MalformedResponse;
    const int status = request->httpStatus();
    if (request->errorCode() == Buteo::SyncResults::ABORTED) {
        kind = Cancelled;
    } else if (status == 404) {
        kind = NotFound;
    } else if (status == 412) {
        kind = PreconditionFailed;
    } else if (status == 507) {
        kind = InsufficientStorage;
    } else if (status > 299) {
        kind = ServerError;
    } else if (request->networkError() != QNetworkReply::NoError
               || request->errorCode() == Buteo::SyncResults::CONNECTION_ERROR) {
        kind = TransportError;
    }

    CalDavError error(phase, kind, request->errorCode(), request->errorString());
    error.mHttpStatus = status;
    error.mNetworkError = request->networkError();
    return error;
}

CalDavError CalDavError::invalidInput(Phase phase, const QString &message)
{
    return CalDavError(phase, InvalidInput, Buteo::SyncResults::INTERNAL_ERROR, message);
}

CalDavError CalDavError::malformedResponse(Phase phase, const QString &message)
{
    return CalDavError(phase, MalformedResponse, Buteo::SyncResults::INTERNAL_ERROR, message);
}

bool CalDavError::isError() const
{
    return mKind != NoError;
}

CalDavError::Phase CalDavError::phase() const
{
    return mPhase;
}

CalDavError::Kind CalDavError::kind() const
{
    return mKind;
}

int CalDavError::minorCode() const
{
    return mMinorCode;
}

int CalDavError::httpStatus() const
{
    return mHttpStatus;
}

QNetworkReply::NetworkError CalDavError::networkError() const
{
    return mNetworkError;
}

QString CalDavError::message() const
{
    return mMessage;
}

QString CalDavError::phaseName(Phase phase)
{
    switch (phase) {
    case DiscoveryPhase:
        return QStringLiteral("discovery");
    case QueryPhase:
        return QStringLiteral("query");
    case SyncPhase:
        return QStringLiteral("sync");
    case BackfillPhase:
        return QStringLiteral("backfill");
    case ObjectPhase:
        return QStringLiteral("object");
    case NoPhase:
        break;
    }
    return QString();
}
