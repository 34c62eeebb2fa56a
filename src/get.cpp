/*
 * This file is part of caldav-client package
 *
 * Copyright (C) 2013 Jolla Ltd. and/or its subsidiary(-ies).
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

#include "get.h"
#include "settings.h"

#include <QNetworkAccessManager>

#include <LogMacros.h>

Get::Get(QNetworkAccessManager *manager, Settings *settings, QObject *parent)
    : Request(manager, settings, "GET", parent)
{
    FUNCTION_CALL_TRACE;
}

void Get::getObject(const QString &objectPath)
{
    FUNCTION_CALL_TRACE;
    mServerPath = objectPath;

    QNetworkRequest request;
    prepareRequest(&request, objectPath);
    request.setRawHeader("Accept", "text/calendar");
    sendRequest(request, QByteArray());
}

void Get::handleReply(QNetworkReply *reply)
{
    FUNCTION_CALL_TRACE;

    if (reply->error() != QNetworkReply::NoError || httpStatus() > 299) {
        debugReplyAndReadAll(reply);
        finishedWithReplyResult(reply);
        return;
    }

    QByteArray data = reply->readAll();
    debugReply(*reply, data);

    const QString contentType = reply->header(QNetworkRequest::ContentTypeHeader).toString();
    const QString mediaType = contentType.section(QChar(';'), 0, 0).trimmed().toLower();
    if (mediaType != QStringLiteral("text/calendar")) {
        finishedWithError(Buteo::SyncResults::INTERNAL_ERROR,
                          QString("Unexpected Content-Type for %1: %2").arg(mServerPath).arg(contentType));
        return;
    }

    CalendarObject object;
    object.path = mServerPath;
    object.data = data;
    QString errorString;
    if (!CalendarObject::populateFromHeaders(&object, reply, &errorString)) {
        finishedWithError(Buteo::SyncResults::INTERNAL_ERROR, errorString);
        return;
    }
    mObject = object;
    finishedWithSuccess();
}

CalendarObject Get::object() const
{
    return mObject;
}
