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

#include "report.h"
#include "calendar.h"
#include "filterencoder.h"
#include "settings.h"

#include <QNetworkAccessManager>
#include <QUrl>
#include <QXmlStreamWriter>

#include <LogMacros.h>

static void writeSyncCollectionHeader(QXmlStreamWriter *writer, const QString &syncToken, int limit)
{
    FilterEncoder::writeNamespaces(writer);
    writer->writeStartElement(FilterEncoder::DavNamespace, QStringLiteral("sync-collection"));
    writer->writeTextElement(FilterEncoder::DavNamespace, QStringLiteral("sync-token"), syncToken);
    writer->writeTextElement(FilterEncoder::DavNamespace, QStringLiteral("sync-level"), QStringLiteral("1"));
    if (limit > 0) {
        writer->writeStartElement(FilterEncoder::DavNamespace, QStringLiteral("limit"));
        writer->writeTextElement(FilterEncoder::DavNamespace, QStringLiteral("nresults"), QString::number(limit));
        writer->writeEndElement();
    }
}

Report::Report(QNetworkAccessManager *manager, Settings *settings, QObject *parent)
    : Request(manager, settings, "REPORT", parent)
{
    FUNCTION_CALL_TRACE;
}

void Report::calendarQuery(const QString &serverPath, const CalendarQueryRequest &query)
{
    FUNCTION_CALL_TRACE;

    QByteArray requestData;
    QXmlStreamWriter writer(&requestData);
    writer.writeStartDocument();
    FilterEncoder::writeNamespaces(&writer);
    writer.writeStartElement(FilterEncoder::CalDavNamespace, QStringLiteral("calendar-query"));
    writer.writeStartElement(FilterEncoder::DavNamespace, QStringLiteral("prop"));
    bool encoded = FilterEncoder::writeCalendarDataProperties(&writer, query.compRequest);
    writer.writeEndElement();
    writer.writeStartElement(FilterEncoder::CalDavNamespace, QStringLiteral("filter"));
    encoded = encoded && FilterEncoder::writeCompFilter(&writer, query.filter);
    writer.writeEndElement();
    writer.writeEndElement();
    writer.writeEndDocument();

    if (!encoded) {
        mServerPath = serverPath;
        finishedWithInternalError(QStringLiteral("Cannot encode calendar-query request"));
        return;
    }
    sendRequest(serverPath, requestData, "1");
}

void Report::multiGet(const QString &serverPath, const QStringList &objectPaths,
                      const CalendarCompRequest &compRequest)
{
    FUNCTION_CALL_TRACE;

    QByteArray requestData;
    QXmlStreamWriter writer(&requestData);
    writer.writeStartDocument();
    FilterEncoder::writeNamespaces(&writer);
    writer.writeStartElement(FilterEncoder::CalDavNamespace, QStringLiteral("calendar-multiget"));
    writer.writeStartElement(FilterEncoder::DavNamespace, QStringLiteral("prop"));
    bool encoded = FilterEncoder::writeCalendarDataProperties(&writer, compRequest);
    writer.writeEndElement();
    Q_FOREACH (const QString &objectPath, objectPaths) {
        writer.writeTextElement(FilterEncoder::DavNamespace, QStringLiteral("href"),
                                QString::fromLatin1(QUrl::toPercentEncoding(objectPath, "/")));
    }
    writer.writeEndElement();
    writer.writeEndDocument();

    if (!encoded) {
        mServerPath = serverPath;
        finishedWithInternalError(QStringLiteral("Cannot encode calendar-multiget request"));
        return;
    }
    sendRequest(serverPath, requestData, "1");
}

void Report::syncCollection(const QString &serverPath, const QString &syncToken, int limit,
                            const CalendarCompRequest &compRequest)
{
    FUNCTION_CALL_TRACE;

    QByteArray requestData;
    QXmlStreamWriter writer(&requestData);
    writer.writeStartDocument();
    writeSyncCollectionHeader(&writer, syncToken, limit);
    writer.writeStartElement(FilterEncoder::DavNamespace, QStringLiteral("prop"));
    bool encoded = FilterEncoder::writeCalendarDataProperties(&writer, compRequest);
    writer.writeEndElement();
    writer.writeEndElement();
    writer.writeEndDocument();

    if (!encoded) {
        mServerPath = serverPath;
        finishedWithInternalError(QStringLiteral("Cannot encode sync-collection request"));
        return;
    }
    sendRequest(serverPath, requestData, "0");
}

void Report::syncCalendarList(const QString &serverPath, const QString &syncToken, int limit)
{
    FUNCTION_CALL_TRACE;

    QByteArray requestData;
    QXmlStreamWriter writer(&requestData);
    writer.writeStartDocument();
    writeSyncCollectionHeader(&writer, syncToken, limit);
    writer.writeStartElement(FilterEncoder::DavNamespace, QStringLiteral("prop"));
    Calendar::writePropertyNames(&writer);
    writer.writeEndElement();
    writer.writeEndElement();
    writer.writeEndDocument();

    sendRequest(serverPath, requestData, "0");
}

void Report::sendRequest(const QString& serverPath, const QByteArray &requestData, const QByteArray &depth)
{
    FUNCTION_CALL_TRACE;
    mServerPath = serverPath;

    QNetworkRequest request;
    prepareRequest(&request, serverPath);
    request.setRawHeader("Depth", depth);
    request.setRawHeader("Prefer", "return-minimal");
    request.setHeader(QNetworkRequest::ContentLengthHeader, requestData.length());
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/xml; charset=utf-8");
    Request::sendRequest(request, requestData);
}

void Report::handleReply(QNetworkReply *reply)
{
    FUNCTION_CALL_TRACE;

    LOG_DEBUG("Process " << command() << " response for server path" << mServerPath);

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
                          QString("Cannot parse response body for %1: %2").arg(command()).arg(reader.errorString()));
        return;
    }
    mResponses = reader.responses();
    mSyncToken = reader.syncToken();
    finishedWithSuccess();
}

QString Report::serverPath() const
{
    return mServerPath;
}

QString Report::syncToken() const
{
    return mSyncToken;
}

const QList<Reader::Response>& Report::responses() const
{
    return mResponses;
}
