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

#ifndef CALENDAR_H
#define CALENDAR_H

#include "caldavclient_global.h"
#include "reader.h"

#include <QList>
#include <QString>
#include <QStringList>

class QXmlStreamWriter;

struct CALDAVCLIENT_EXPORT Calendar
{
    Calendar() : maxResourceSize(0) {}

    enum DecodeResult {
        Decoded,
        NotACalendar,
        InvalidCalendar
    };

    QString path;
    QString displayName;
    QString description;
    qint64 maxResourceSize;
    QStringList supportedComponents;
    QString color;
    QString timezone;
    QString syncToken;
    QStringList privileges;

    // A response without resourcetype is taken as a calendar, servers
    // commonly omit it from sync-collection results.
    static DecodeResult fromResponse(const Reader::Response &response, Calendar *calendar,
                                     QString *errorString);

    // Writes the <d:prop> children requested for collection metadata.
    static void writePropertyNames(QXmlStreamWriter *writer);

    // Paths equal once trailing slashes are stripped; "" and "/" stay distinct.
    static bool sameCollectionPath(const QString &a, const QString &b);
    static QString normalizeCollectionPath(const QString &path);
};

typedef QList<Calendar> CalendarList;

#endif // CALENDAR_H
