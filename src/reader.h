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

#ifndef READER_H
#define READER_H

#include "caldavclient_global.h"

#include <QObject>
#include <QDateTime>
#include <QHash>
#include <QList>
#include <QStringList>

class QXmlStreamReader;

class CALDAVCLIENT_EXPORT Reader : public QObject
{
    Q_OBJECT
public:
    // One DAV:response of a multistatus. Only properties reported
    // within a 2xx propstat are filled in.
    struct Response {
        Response()
            : status(0), contentLength(0), hasCalendarData(false)
            , hasResourceType(false), isCollection(false), isCalendar(false)
            , hasMaxResourceSize(false), maxResourceSize(0), unauthenticated(false) {}

        bool isSuccess() const { return status == 0 || (status >= 200 && status < 300); }
        bool hasProperty(const QString &name) const
        {
            const int propStatus = propertyStatus.value(name, 0);
            return propStatus >= 200 && propStatus < 300;
        }

        QString href;       // percent-decoded path
        int status;         // response level status, 0 when only propstats are given
        QHash<QString, int> propertyStatus;

        QString etag;
        QDateTime lastModified;
        qint64 contentLength;
        QByteArray calendarData;
        bool hasCalendarData;

        bool hasResourceType;
        bool isCollection;
        bool isCalendar;
        QStringList resourceTypes;

        QString displayName;
        QString description;
        QString color;
        QString timezone;
        QString syncToken;
        bool hasMaxResourceSize;
        qint64 maxResourceSize;
        QStringList supportedComponents;
        QStringList privileges;

        QString currentUserPrincipal;
        bool unauthenticated;
        QString calendarHomeSet;
    };

    explicit Reader(QObject *parent = 0);
    ~Reader();

    void read(const QByteArray &data);

    bool hasError() const;
    QString errorString() const;
    QString syncToken() const;
    const QList<Response>& responses() const;

    static int parseStatus(const QString &statusLine);
    static QString hrefToPath(const QString &href);
    static QDateTime parseHttpDate(const QString &value);

private:
    void readMultiStatus();
    void readResponse();
    void readPropStat(Response *response);
    void readProp(Response *props, QStringList *names);
    void readResourceType(Response *props);
    void readPrivilegeSet(Response *props);
    void readComponentSet(Response *props);
    QString readHrefChild(bool *unauthenticated = 0);
    void mergeProperties(Response *response, const Response &props, const QStringList &names);
    void setError(const QString &errorString);

private:
    QXmlStreamReader *mReader;
    QList<Response> mResponses;
    QString mSyncToken;
    QString mErrorString;
    bool mHasError;
};

#endif // READER_H
