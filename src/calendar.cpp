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

#include "calendar.h"
#include "filterencoder.h"

#include <QXmlStreamWriter>

Calendar::DecodeResult Calendar::fromResponse(const Reader::Response &response, Calendar *calendar,
                                              QString *errorString)
{
    if (response.hasResourceType && !response.isCalendar) {
        return NotACalendar;
    }
    if (response.hasMaxResourceSize && response.maxResourceSize < 0) {
        *errorString = QStringLiteral("max-resource-size must be a non-negative integer for calendar %1")
                .arg(response.href);
        return InvalidCalendar;
    }

    calendar->path = response.href;
    calendar->displayName = response.displayName;
    calendar->description = response.description;
    calendar->maxResourceSize = response.maxResourceSize;
    calendar->supportedComponents = response.supportedComponents;
    calendar->color = response.color;
    calendar->timezone = response.timezone;
    calendar->syncToken = response.syncToken;
    calendar->privileges = response.privileges;
    return Decoded;
}

void Calendar::writePropertyNames(QXmlStreamWriter *writer)
{
    writer->writeEmptyElement(FilterEncoder::DavNamespace, QStringLiteral("resourcetype"));
    writer->writeEmptyElement(FilterEncoder::DavNamespace, QStringLiteral("displayname"));
    writer->writeEmptyElement(FilterEncoder::CalDavNamespace, QStringLiteral("calendar-description"));
    writer->writeEmptyElement(FilterEncoder::CalDavNamespace, QStringLiteral("max-resource-size"));
    writer->writeEmptyElement(FilterEncoder::CalDavNamespace, QStringLiteral("supported-calendar-component-set"));
    writer->writeEmptyElement(FilterEncoder::AppleNamespace, QStringLiteral("calendar-color"));
    writer->writeEmptyElement(FilterEncoder::CalDavNamespace, QStringLiteral("calendar-timezone"));
    writer->writeEmptyElement(FilterEncoder::DavNamespace, QStringLiteral("sync-token"));
    writer->writeEmptyElement(FilterEncoder::DavNamespace, QStringLiteral("current-user-privilege-set"));
}

QString Calendar::normalizeCollectionPath(const QString &path)
{
    if (path.isEmpty() || path == QStringLiteral("/")) {
        return path;
    }
    QString normalized = path;
    while (normalized.endsWith(QChar('/'))) {
        normalized.chop(1);
    }
    return normalized;
}

bool Calendar::sameCollectionPath(const QString &a, const QString &b)
{
    if (a == b) {
        return true;
    }
    return normalizeCollectionPath(a) == normalizeCollectionPath(b);
}
