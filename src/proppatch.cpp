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

#include "proppatch.h"
#include "filterencoder.h"
#include "reader.h"
#include "settings.h"

#include <QNetworkAccessManager>
#include <QStringList>
#include <QXmlStreamWriter>

#include <LogMacros.h>

PropPatch::PropPatch(QNetworkAccessManager *manager, Settings *settings, QObject *parent)
    : Request(manager, settings, "PROPPATCH", parent)
{
}

void PropPatch::updateCalendar(const QString &calendarPath, const CalendarUpdate &update)
{
    FUNCTION_CALL_TRACE;
    mServerPath = calendarPath;
    mRequestedProperties.clear();
    mRejectedProperties.clear();

    QByteArray requestData;
    QXmlStreamWriter writer(&requestData);
    writer.writeStartDocument();
    FilterEncoder::writeNamespaces(&writer);
    writer.writeStartElement(FilterEncoder::DavNamespace, QStringLiteral("propertyupdate"));
    writer.writeStartElement(FilterEncoder::DavNamespace, QStringLiteral("set"));
    writer.writeStartElement(FilterEncoder::DavNamespace, QStringLiteral("prop"));
    if (!update.displayName.isNull()) {
        writer.writeTextElement(FilterEncoder::DavNamespace, QStringLiteral("displayname"), update.displayName);
        mRequestedProperties.append(QStringLiteral("displayname"));
    }
    if (!update.description.isNull()) {
        writer.writeTextElement(FilterEncoder::CalDavNamespace, QStringLiteral("calendar-description"), update.description);
        mRequestedProperties.append(QStringLiteral("calendar-description"));
    }
    if (!update.color.isNull()) {
        writer.writeTextElement(FilterEncoder::AppleNamespace, QStringLiteral("calendar-color"), update.color);
        mRequestedProperties.append(QStringLiteral("calendar-color"));
    }
    if (!update.timezone.isNull()) {
        writer.writeTextElement(FilterEncoder::CalDavNamespace, QStringLiteral("calendar-timezone"), update.timezone);
        mRequestedProperties.append(QStringLiteral("calendar-timezone"));
    }
    writer.writeEndElement();
    writer.writeEndElement();
    writer.writeEndElement();
    writer.writeEndDocument();

    QNetworkRequest request;
    prepareRequest(&request, calendarPath);
    request.setHeader(QNetworkRequest::ContentLengthHeader, requestData.length());
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/xml; charset=utf-8");
    sendRequest(request, requestData);
}

void PropPatch::handleReply(QNetworkReply *reply)
{
    if (reply->error() != QNetworkReply::NoError || httpStatus() > 299) {
        debugReplyAndReadAll(reply);
        finishedWithReplyResult(reply);
        return;
    }

    QByteArray data = reply->readAll();
    debugReply(*reply, data);

    Reader reader;
    reader.read(data);
    if (reader.hasError()) {
        finishedWithError(Buteo::SyncResults::INTERNAL_ERROR,
                          QString("Cannot parse response body for PROPPATCH: %1").arg(reader.errorString()));
        return;
    }
    if (reader.responses().count() != 1) {
        finishedWithError(Buteo::SyncResults::INTERNAL_ERROR,
                          QString("Expected one PROPPATCH response, got %1").arg(reader.responses().count()));
        return;
    }

    const Reader::Response &response = reader.responses().first();
    if (!response.isSuccess()) {
        Q_FOREACH (const QString &name, mRequestedProperties) {
            mRejectedProperties.insert(name, response.status);
        }
        finishedWithError(Buteo::SyncResults::INTERNAL_ERROR,
                          QString("Property update failed with status %1").arg(response.status));
        return;
    }
    QHash<QString, int>::const_iterator it = response.propertyStatus.constBegin();
    for (; it != response.propertyStatus.constEnd(); ++it) {
        if (it.value() < 200 || it.value() > 299) {
            mRejectedProperties.insert(it.key(), it.value());
        }
    }
    if (!mRejectedProperties.isEmpty()) {
        QStringList names = mRejectedProperties.keys();
        names.sort();
        finishedWithError(Buteo::SyncResults::INTERNAL_ERROR,
                          QString("Server rejected the update of %1").arg(names.join(QStringLiteral(", "))));
        return;
    }
    finishedWithSuccess();
}

QString PropPatch::serverPath() const
{
    return mServerPath;
}

QHash<QString, int> PropPatch::rejectedProperties() const
{
    return mRejectedProperties;
}
