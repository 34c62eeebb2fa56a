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

#ifndef PROPFIND_H
#define PROPFIND_H

#include "request.h"
#include "reader.h"

#include <QObject>

class QNetworkAccessManager;
class Settings;

class CALDAVCLIENT_EXPORT PropFind : public Request
{
    Q_OBJECT

public:
    enum PropFindRequestType {
        UserPrincipal,
        CalendarHomeSet,
        ListCalendars,
        CalendarProperties,
        ListObjects
    };

    explicit PropFind(QNetworkAccessManager *manager, Settings *settings, QObject *parent = 0);

    void listCurrentUserPrincipal();
    void listCalendarHomeSet(const QString &userPrincipal);
    void listCalendars(const QString &calendarHomeSet);
    void getCalendar(const QString &calendarPath);
    void listObjects(const QString &calendarPath);

    PropFindRequestType requestType() const;
    QString serverPath() const;
    const QList<Reader::Response>& responses() const;

protected:
    void handleReply(QNetworkReply *reply);

private:
    void sendRequest(const QString &remotePath, const QByteArray &requestData,
                     PropFindRequestType reqType);

    PropFindRequestType mPropFindRequestType;
    QString mServerPath;
    QList<Reader::Response> mResponses;
};

#endif // PROPFIND_H
