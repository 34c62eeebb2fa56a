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

#ifndef EVENTMETADATA_H
#define EVENTMETADATA_H

#include "caldavclient_global.h"

#include <QByteArray>
#include <QDateTime>
#include <QStringList>

// Time bounds of the first VEVENT of an iCalendar payload.
// This is not a validating parser: malformed DTSTART, DTEND or
// RRULE values are skipped.
struct CALDAVCLIENT_EXPORT EventMetadata
{
    EventMetadata() : recurring(false), recurrenceOpen(false) {}

    QDateTime start;
    QDateTime end;
    bool recurring;
    QDateTime recurrenceEnd;    // invalid when unbounded or COUNT based
    bool recurrenceOpen;

    // Returns false for an empty payload, or for a non-recurring
    // event without DTSTART and DTEND.
    static bool extract(const QByteArray &data, EventMetadata *metadata);

    static QStringList unfoldLines(const QString &data);

    // Accepts yyyyMMddTHHmmssZ, yyyyMMddTHHmmss and yyyyMMdd.
    // Floating times keep their wall clock values and are tagged UTC.
    static QDateTime parseDateTime(const QString &value);
};

#endif // EVENTMETADATA_H
