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

#include "delete.h"
#include "calendarobject.h"
#include "settings.h"

#include <QNetworkAccessManager>

#include <LogMacros.h>

Delete::Delete(QNetworkAccessManager *manager, Settings *settings, QObject *parent)
    : Request(manager, settings, "DELETE", parent)
{
    FUNCTION_CALL_TRACE;
}

void Delete::deleteObject(const QString &objectPath, const QString &ifMatch)
{
    FUNCTION_CALL_TRACE;
    mServerPath = objectPath;

    QNetworkRequest request;
    prepareRequest(&request, objectPath);
    if (!ifMatch.isEmpty()) {
        request.setRawHeader("If-Match", CalendarObject::quoteETag(ifMatch));
    }
    sendRequest(request, QByteArray());
}

void Delete::handleReply(QNetworkReply *reply)
{
    FUNCTION_CALL_TRACE;

    debugReplyAndReadAll(reply);
    if (httpStatus() == 412) {
        finishedWithError(Buteo::SyncResults::INTERNAL_ERROR,
                          QString("DELETE precondition failed for %1").arg(mServerPath));
        return;
    }
    if (httpStatus() == 404) {
        finishedWithError(Buteo::SyncResults::INTERNAL_ERROR,
                          QString("DELETE target not found: %1").arg(mServerPath));
        return;
    }
    finishedWithReplyResult(reply);
}
