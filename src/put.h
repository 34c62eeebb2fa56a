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

#ifndef PUT_H
#define PUT_H

#include "request.h"
#include "calendarobject.h"

#include <QObject>

class QNetworkAccessManager;
class Settings;

class CALDAVCLIENT_EXPORT Put : public Request
{
    Q_OBJECT

public:
    explicit Put(QNetworkAccessManager *manager, Settings *settings, QObject *parent = 0);

    // ifNoneMatch "*" only creates, ifMatch only replaces that version.
    // Empty values send no precondition.
    void putObject(const QString &objectPath, const QByteArray &icalData,
                   const QString &ifMatch = QString(), const QString &ifNoneMatch = QString());

    CalendarObject object() const;

protected:
    void handleReply(QNetworkReply *reply);

private:
    QString mServerPath;
    CalendarObject mObject;
};

#endif // PUT_H
