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

#ifndef FILTERENCODER_H
#define FILTERENCODER_H

#include "caldavclient_global.h"
#include "calendarquery.h"

#include <QString>

class QXmlStreamWriter;

class CALDAVCLIENT_EXPORT FilterEncoder
{
public:
    static const QString DavNamespace;
    static const QString CalDavNamespace;
    static const QString AppleNamespace;

    // Declares the d:, c: and a: prefixes on the next start element.
    static void writeNamespaces(QXmlStreamWriter *writer);

    // Each returns false when the writer is in error state after
    // writing the element and its children.
    static bool writeCompFilter(QXmlStreamWriter *writer, const CompFilter &filter);
    static bool writePropFilter(QXmlStreamWriter *writer, const PropFilter &filter);
    static bool writeParamFilter(QXmlStreamWriter *writer, const ParamFilter &filter);
    static bool writeCompRequest(QXmlStreamWriter *writer, const CalendarCompRequest &request);

    // calendar-data plus getlastmodified, getetag and getcontentlength,
    // written inside the current <d:prop>.
    static bool writeCalendarDataProperties(QXmlStreamWriter *writer, const CalendarCompRequest &request);

    static void writeTimeRange(QXmlStreamWriter *writer, const QString &elementName,
                               const QDateTime &start, const QDateTime &end);
    static QString dateTimeToString(const QDateTime &dateTime);

private:
    static void writeTextMatch(QXmlStreamWriter *writer, const TextMatch &textMatch);
};

#endif // FILTERENCODER_H
