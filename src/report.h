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

#ifndef REPORT_H
#define REPORT_H

#include "request.h"
#include "reader.h"
#include "calendarquery.h"

#include <QObject>
#include <QStringList>

class QNetworkAccessManager;
class Settings;

class CALDAVCLIENT_EXPORT Report : public Request
{
    Q_OBJECT

public:
    explicit Report(QNetworkAccessManager *manager, Settings *settings, QObject *parent = 0);

    void calendarQuery(const QString &serverPath, const CalendarQueryRequest &query);
    void multiGet(const QString &serverPath, const QStringList &objectPaths,
                  const CalendarCompRequest &compRequest);
    // limit <= 0 requests all changes
    void syncCollection(const QString &serverPath, const QString &syncToken, int limit,
                        const CalendarCompRequest &compRequest);
    void syncCalendarList(const QString &serverPath, const QString &syncToken, int limit);

    QString serverPath() const;
    QString syncToken() const;
    const QList<Reader::Response>& responses() const;

protected:
    void handleReply(QNetworkReply *reply);

private:
    // sync-collection is only defined for depth 0, its reach is set by sync-level
    void sendRequest(const QString &serverPath, const QByteArray &requestData, const QByteArray &depth);
    QString mServerPath;
    QString mSyncToken;
    QList<Reader::Response> mResponses;
};

#endif // REPORT_H
