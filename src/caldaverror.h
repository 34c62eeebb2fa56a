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

#ifndef CALDAVERROR_H
#define CALDAVERROR_H

#include "caldavclient_global.h"

#include <QNetworkReply>
#include <QString>

class Request;

// Failure of a client operation, with the phase it happened in.
class CALDAVCLIENT_EXPORT CalDavError
{
public:
    enum Phase {
        NoPhase,
        DiscoveryPhase,
        QueryPhase,
        SyncPhase,
        BackfillPhase,
        ObjectPhase
    };

    enum Kind {
        NoError,
        TransportError,
        Cancelled,
        NotFound,
        PreconditionFailed,
        InsufficientStorage,
        ServerError,
        MalformedResponse,
        InvalidInput
    };

    CalDavError();
    CalDavError(Phase phase, Kind kind, int minorCode, const QString &message);

    static CalDavError fromRequest(Phase phase, const Request *request);
    static CalDavError invalidInput(Phase phase, const QString &message);
    static CalDavError malformedResponse(Phase phase, const QString &message);

    bool isError() const;
    Phase phase() const;
    Kind kind() const;
    int minorCode() const;
    int httpStatus() const;
    QNetworkReply::NetworkError networkError() const;
    QString message() const;

    static QString phaseName(Phase phase);

private:
    Phase mPhase;
    Kind mKind;
    int mMinorCode;
    int mHttpStatus;
    QNetworkReply::NetworkError mNetworkError;
    QString mMessage;
};

#endif // CALDAVERROR_H
