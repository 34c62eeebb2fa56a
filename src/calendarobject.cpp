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

#include "calendarobject.h"

#include <QNetworkReply>
#include <QStringList>
#include <QUrl>

CalendarObject CalendarObject::fromResponse(const Reader::Response &response)
{
    CalendarObject object;
    object.path = response.href;
    object.modificationTime = response.lastModified;
    object.contentLength = response.contentLength;
    object.etag = response.etag;
    if (response.hasCalendarData) {
        object.data = response.calendarData;
    }
    return object;
}

bool CalendarObject::populateFromHeaders(CalendarObject *object, const QNetworkReply *reply,
                                         QString *errorString)
{
    const QByteArray location = reply->rawHeader("Location");
    if (!location.isEmpty()) {
        QUrl url(QString::fromUtf8(location));
        if (!url.isValid()) {
            *errorString = QStringLiteral("Invalid Location header: %1").arg(QString::fromUtf8(location));
            return false;
        }
        object->path = url.path();
    }

    const QByteArray etag = reply->rawHeader("ETag").trimmed();
    if (!etag.isEmpty()) {
        if (etag.length() < 2 || !etag.startsWith('"') || !etag.endsWith('"')) {
            *errorString = QStringLiteral("Invalid ETag header: %1").arg(QString::fromUtf8(etag));
            return false;
        }
        object->etag = QString::fromUtf8(etag.mid(1, etag.length() - 2));
    }

    const QByteArray contentLength = reply->rawHeader("Content-Length");
    if (!contentLength.isEmpty()) {
        bool ok = false;
        qint64 length = contentLength.trimmed().toLongLong(&ok);
        if (!ok) {
            *errorString = QStringLiteral("Invalid Content-Length header: %1").arg(QString::fromUtf8(contentLength));
            return false;
        }
        object->contentLength = length;
    }

    const QByteArray lastModified = reply->rawHeader("Last-Modified");
    if (!lastModified.isEmpty()) {
        QDateTime modificationTime = Reader::parseHttpDate(QString::fromLatin1(lastModified));
        if (!modificationTime.isValid()) {
            *errorString = QStringLiteral("Invalid Last-Modified header: %1").arg(QString::fromLatin1(lastModified));
            return false;
        }
        object->modificationTime = modificationTime;
    }

    return true;
}

QString CalendarObject::multiGetBasePath(const QStringList &paths)
{
    if (paths.isEmpty()) {
        return QString();
    }
    QString basePath = paths.first();
    int index = basePath.lastIndexOf('/');
    if (index > 0) {
        basePath = basePath.left(index + 1);
    }
    return basePath;
}

QByteArray CalendarObject::quoteETag(const QString &etag)
{
    return '"' + etag.toUtf8() + '"';
}
