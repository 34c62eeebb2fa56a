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

#ifndef CALENDARQUERY_H
#define CALENDARQUERY_H

#include <QDateTime>
#include <QList>
#include <QString>
#include <QStringList>

// calendar-query filter tree, RFC 4791 section 9.7.
// An invalid QDateTime leaves that side of a time range open.

struct TextMatch
{
    TextMatch() : negateCondition(false) {}

    QString text;
    bool negateCondition;
};

struct ParamFilter
{
    ParamFilter() : isNotDefined(false), hasTextMatch(false) {}

    QString name;
    bool isNotDefined;
    bool hasTextMatch;
    TextMatch textMatch;
};

struct PropFilter
{
    PropFilter() : isNotDefined(false), hasTextMatch(false) {}

    QString name;
    bool isNotDefined;
    QDateTime start;
    QDateTime end;
    bool hasTextMatch;
    TextMatch textMatch;
    QList<ParamFilter> params;
};

struct CompFilter
{
    CompFilter() : isNotDefined(false) {}
    explicit CompFilter(const QString &componentName) : name(componentName), isNotDefined(false) {}

    QString name;
    bool isNotDefined;
    QDateTime start;
    QDateTime end;
    QList<PropFilter> props;
    QList<CompFilter> comps;
};

// What calendar-data should carry back, RFC 4791 section 9.6.
struct CalendarCompRequest
{
    CalendarCompRequest() : allProps(false), allComps(false) {}
    explicit CalendarCompRequest(const QString &componentName)
        : name(componentName), allProps(false), allComps(false) {}

    QString name;
    bool allProps;
    QStringList props;
    bool allComps;
    QList<CalendarCompRequest> comps;

    // expand is written only when both are valid
    QDateTime expandStart;
    QDateTime expandEnd;
};

struct CalendarQueryRequest
{
    CalendarCompRequest compRequest;
    CompFilter filter;
};

#endif // CALENDARQUERY_H
