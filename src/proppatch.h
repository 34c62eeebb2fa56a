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

#ifndef PROPPATCH_H
#define PROPPATCH_H

#include "request.h"

#include <QHash>
#include <QObject>
#include <QStringList>

class QNetworkAccessManager;
class Settings;

// A null string leaves the property untouched, an empty one clears it.
struct CalendarUpdate
{
    QString displayName;
    QString description;
    QString color;
    QString timezone;

    bool isEmpty() const
    {
        return displayName.isNull() && description.isNull()
                && color.isNull() && timezone.isNull();
    }
};

class CALDAVCLIENT_EXPORT PropPatch : public Request
{
    Q_OBJECT

public:
    explicit PropPatch(QNetworkAccessManager *manager, Settings *settings, QObject *parent = 0);

    void updateCalendar(const QString &calendarPath, const CalendarUpdate &update);

    QString serverPath() const;
    // Properties the server refused to update, with their propstat status.
    QHash<QString, int> rejectedProperties() const;

protected:
    void handleReply(QNetworkReply *reply);

private:
    QString mServerPath;
    QStringList mRequestedProperties;
    QHash<QString, int> mRejectedProperties;
};

#endif // PROPPATCH_H
