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

#include "eventmetadata.h"

#include <QDate>
#include <QTime>

static QString propertyValue(const QString &line)
{
    const int index = line.indexOf(QChar(':'));
    if (index < 0) {
        return QString();
    }
    return line.mid(index + 1).trimmed();
}

static QDateTime parseDateAndTime(const QString &value)
{
    if (value.length() != 15 || value.at(8) != QChar('T')) {
        return QDateTime();
    }
    const QDate date = QDate::fromString(value.left(8), QStringLiteral("yyyyMMdd"));
    const QTime time = QTime::fromString(value.mid(9), QStringLiteral("HHmmss"));
    if (!date.isValid() || !time.isValid()) {
        return QDateTime();
    }
    return QDateTime(date, time, Qt::UTC);
}

QDateTime EventMetadata::parseDateTime(const QString &value)
{
    const QString trimmed = value.trimmed();

    // a trailing Z only ever matches the UTC form
    if (trimmed.endsWith(QChar('Z'))) {
        return parseDateAndTime(trimmed.left(trimmed.length() - 1));
    }

    QDateTime floating = parseDateAndTime(trimmed);
    if (floating.isValid()) {
        return floating;
    }

    if (trimmed.length() == 8) {
        const QDate date = QDate::fromString(trimmed, QStringLiteral("yyyyMMdd"));
        if (date.isValid()) {
            return QDateTime(date, QTime(0, 0), Qt::UTC);
        }
    }
    return QDateTime();
}

QStringList EventMetadata::unfoldLines(const QString &data)
{
    QString text = data;
    text.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));
    text.replace(QChar('\r'), QChar('\n'));

    QStringList lines;
    Q_FOREACH (const QString &line, text.split(QChar('\n'))) {
        if (line.startsWith(QChar(' ')) || line.startsWith(QChar('\t'))) {
            if (lines.isEmpty()) {
                lines.append(line.mid(1));
            } else {
                lines.last().append(line.mid(1));
            }
            continue;
        }
        lines.append(line);
    }
    return lines;
}

bool EventMetadata::extract(const QByteArray &data, EventMetadata *metadata)
{
    if (data.isEmpty()) {
        return false;
    }

    EventMetadata result;
    bool inEvent = false;
    Q_FOREACH (const QString &line, unfoldLines(QString::fromUtf8(data))) {
        const QString trimmed = line.trimmed();
        if (trimmed.compare(QStringLiteral("BEGIN:VEVENT"), Qt::CaseInsensitive) == 0) {
            inEvent = true;
            continue;
        }
        if (!inEvent) {
            continue;
        }
        if (trimmed.compare(QStringLiteral("END:VEVENT"), Qt::CaseInsensitive) == 0) {
            break;
        }

        if (line.startsWith(QStringLiteral("DTSTART"), Qt::CaseInsensitive)) {
            const QDateTime start = parseDateTime(propertyValue(line));
            if (start.isValid()) {
                result.start = start;
            }
        } else if (line.startsWith(QStringLiteral("DTEND"), Qt::CaseInsensitive)) {
            const QDateTime end = parseDateTime(propertyValue(line));
            if (end.isValid()) {
                result.end = end;
            }
        } else if (line.startsWith(QStringLiteral("RRULE"), Qt::CaseInsensitive)) {
            const QString rule = propertyValue(line);
            if (rule.isEmpty()) {
                continue;
            }
            result.recurring = true;
            result.recurrenceOpen = true;
            Q_FOREACH (const QString &part, rule.split(QChar(';'))) {
                const int separator = part.indexOf(QChar('='));
                if (separator < 0) {
                    continue;
                }
                const QString key = part.left(separator).trimmed().toUpper();
                const QString value = part.mid(separator + 1).trimmed();
                if (key == QStringLiteral("UNTIL")) {
                    const QDateTime until = parseDateTime(value);
                    if (until.isValid()) {
                        result.recurrenceEnd = until;
                        result.recurrenceOpen = false;
                    }
                } else if (key == QStringLiteral("COUNT")) {
                    bool ok = false;
                    value.toInt(&ok);
                    if (ok) {
                        result.recurrenceOpen = false;
                    }
                }
            }
        }
    }

    if (!result.recurring && !result.start.isValid() && !result.end.isValid()) {
        return false;
    }
    *metadata = result;
    return true;
}
