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

#include "propfind.h"
#include "calendar.h"
#include "filterencoder.h"
#include "settings.h"

#include <QNetworkAccessManager>
#include <QXmlStreamWriter>

#include <LogMacros.h>

static void writePropFindStart(QXmlStreamWriter *writer)
{
    writer->writeStartDocument();
    FilterEncoder::writeNamespaces(writer);
    writer->writeStartElement(FilterEncoder::DavNamespace, QStringLiteral("propfind"));
    writer->writeStartElement(FilterEncoder::DavNamespace, QStringLiteral("prop"));
}

static void writePropFindEnd(QXmlStreamWriter *writer)
{
    writer->writeEndElement();
    writer->writeEndElement();
    writer->writeEndDocument();
}

PropFind::PropFind(QNetworkAccessManager *manager, Settings *settings, QObject *parent)
    : Request(manager, settings, "PROPFIND", parent)
    , mPropFindRequestType(UserPrincipal)
{
}

void PropFind::listCurrentUserPrincipal()
{
    FUNCTION_CALL_TRACE;

    QByteArray requestData;
    QXmlStreamWriter writer(&requestData);
    writePropFindStart(&writer);
    writer.writeEmptyElement(FilterEncoder::DavNamespace, QStringLiteral("current-user-principal"));
    writePropFindEnd(&writer);

    const QString &rootPath = mSettings->davRootPath();
    sendRequest(rootPath.isEmpty() ? QStringLiteral("/") : rootPath,
                requestData, UserPrincipal);
}

void PropFind::listCalendarHomeSet(const QString &userPrincipal)
{
    FUNCTION_CALL_TRACE;

    QByteArray requestData;
    QXmlStreamWriter writer(&requestData);
    writePropFindStart(&writer);
    writer.writeEmptyElement(FilterEncoder::CalDavNamespace, QStringLiteral("calendar-home-set"));
    writePropFindEnd(&writer);

    sendRequest(userPrincipal, requestData, CalendarHomeSet);
}

void PropFind::listCalendars(const QString &calendarHomeSet)
{
    FUNCTION_CALL_TRACE;

    QByteArray requestData;
    QXmlStreamWriter writer(&requestData);
    writePropFindStart(&writer);
    Calendar::writePropertyNames(&writer);
    writePropFindEnd(&writer);

    sendRequest(calendarHomeSet, requestData, ListCalendars);
}

void PropFind::getCalendar(const QString &calendarPath)
{
    FUNCTION_CALL_TRACE;

    QByteArray requestData;
    QXmlStreamWriter writer(&requestData);
    writePropFindStart(&writer);
    Calendar::writePropertyNames(&writer);
    writePropFindEnd(&writer);

    sendRequest(calendarPath, requestData, CalendarProperties);
}

void PropFind::listObjects(const QString &calendarPath)
{
    FUNCTION_CALL_TRACE;

    QByteArray requestData;
    QXmlStreamWriter writer(&requestData);
    writePropFindStart(&writer);
    writer.writeEmptyElement(FilterEncoder::DavNamespace, QStringLiteral("getetag"));
    writer.writeEmptyElement(FilterEncoder::DavNamespace, QStringLiteral("getlastmodified"));
    writer.writeEmptyElement(FilterEncoder::DavNamespace, QStringLiteral("getcontentlength"));
    writer.writeEmptyElement(FilterEncoder::DavNamespace, QStringLiteral("resourcetype"));
    writePropFindEnd(&writer);

    sendRequest(calendarPath, requestData, ListObjects);
}

void PropFind::sendRequest(const QString &remotePath, const QByteArray &requestData,
                           PropFindRequestType reqType)
{
    mPropFindRequestType = reqType;
    mServerPath = remotePath;

    QNetworkRequest request;
    prepareRequest(&request, remotePath);
    if (reqType == ListCalendars || reqType == ListObjects)
        request.setRawHeader("Depth", "1");
    else
        request.setRawHeader("Depth", "0");
    request.setRawHeader("Prefer", "return-minimal");
    request.setHeader(QNetworkRequest::ContentLengthHeader, requestData.length());
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/xml; charset=utf-8");
    Request::sendRequest(request, requestData);
}

void PropFind::handleReply(QNetworkReply *reply)
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
                          QString("Cannot parse response body for PROPFIND: %1").arg(reader.errorString()));
        return;
    }
    mResponses = reader.responses();
    finishedWithSuccess();
}

PropFind::PropFindRequestType PropFind::requestType() const
{
    return mPropFindRequestType;
}

QString PropFind::serverPath() const
{
    return mServerPath;
}

const QList<Reader::Response>& PropFind::responses() const
{
    return mResponses;
}
