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

#include "put.h"
#include "settings.h"

#include <QNetworkAccessManager>

#include <LogMacros.h>

Put::Put(QNetworkAccessManager *manager, Settings *settings, QObject *parent)
    : Request(manager, settings, "PUT", parent)
{
}

void Put::putObject(const QString &objectPath, const QByteArray &icalData,
                    const QString &ifMatch, const QString &ifNoneMatch)
{
    FUNCTION_CALL_TRACE;
    mServerPath = objectPath;

    QNetworkRequest request;
    prepareRequest(&request, objectPath);
    if (!ifMatch.isEmpty()) {
        request.setRawHeader("If-Match", CalendarObject::quoteETag(ifMatch));
    }
    if (ifNoneMatch == QStringLiteral("*")) {
        request.setRawHeader("If-None-Match", "*");
    } else if (!ifNoneMatch.isEmpty()) {
        request.setRawHeader("If-None-Match", CalendarObject::quoteETag(ifNoneMatch));
    }
    request.setHeader(QNetworkRequest::ContentLengthHeader, icalData.length());
    request.setHeader(QNetworkRequest::ContentTypeHeader, "text/calendar; charset=utf-8");
    sendRequest(request, icalData);
}

void Put::handleReply(QNetworkReply *reply)
{
    FUNCTION_CALL_TRACE;

    debugReplyAndReadAll(reply);
    if (httpStatus() == 412) {
        finishedWithError(Buteo::SyncResults::INTERNAL_ERROR,
                          QString("PUT precondition failed for %1").arg(mServerPath));
        return;
    }
    if (reply->error() != QNetworkReply::NoError || httpStatus() > 299) {
        finishedWithReplyResult(reply);
        return;
    }

    // Server may update the etag as soon as the modification is received and send back a new etag
    CalendarObject object;
    object.path = mServerPath;
    QString errorString;
    if (!CalendarObject::populateFromHeaders(&object, reply, &errorString)) {
        finishedWithError(Buteo::SyncResults::INTERNAL_ERROR, errorString);
        return;
    }
    mObject = object;
    finishedWithSuccess();
}

CalendarObject Put::object() const
{
    return mObject;
}
