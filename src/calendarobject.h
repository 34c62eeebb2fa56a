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

#ifndef CALENDAROBJECT_H
#define CALENDAROBJECT_H

#include "caldavclient_global.h"
#include "reader.h"

#include <QByteArray>
#include <QDateTime>
#include <QList>
#include <QString>
#include <QStringList>

class QNetworkReply;

// A calendar resource on the server, identified by its path.
// An empty data array means the payload was not fetched.
struct CALDAVCLIENT_EXPORT CalendarObject
{
    CalendarObject() : contentLength(0) {}

    QString path;
    QDateTime modificationTime;
    qint64 contentLength;
    QString etag;       // unquoted
    QByteArray data;

    static CalendarObject fromResponse(const Reader::Response &response);

    // Fills in the fields carried by Location, ETag, Content-Length and
    // Last-Modified. Returns false on a malformed header value.
    static bool populateFromHeaders(CalendarObject *object, const QNetworkReply *reply,
                                    QString *errorString);

    // Entity tag as sent in If-Match and If-None-Match.
    static QByteArray quoteETag(const QString &etag);

    // Collection a calendar-multiget for the given paths is sent to.
    static QString multiGetBasePath(const QStringList &paths);
};

typedef QList<CalendarObject> CalendarObjectList;

#endif // CALENDAROBJECT_H
