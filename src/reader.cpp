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

#include "reader.h"

#include <QLocale>
#include <QUrl>
#include <QXmlStreamReader>

#include <LogMacros.h>

Reader::Reader(QObject *parent)
    : QObject(parent)
    , mReader(0)
    , mHasError(false)
{
}

Reader::~Reader()
{
    delete mReader;
}

void Reader::read(const QByteArray &data)
{
    delete mReader;
    mReader = new QXmlStreamReader(data);
    mResponses.clear();
    mSyncToken.clear();
    mErrorString.clear();
    mHasError = false;

    bool foundMultiStatus = false;
    while (mReader->readNextStartElement()) {
        if (mReader->name() == "multistatus") {
            foundMultiStatus = true;
            readMultiStatus();
        } else {
            mReader->skipCurrentElement();
        }
    }
    if (mReader->hasError()) {
        setError(QStringLiteral("Cannot parse multistatus: %1").arg(mReader->errorString()));
    } else if (!foundMultiStatus) {
        setError(QStringLiteral("Response body is not a multistatus document"));
    }
}

bool Reader::hasError() const
{
    return mHasError;
}

QString Reader::errorString() const
{
    return mErrorString;
}

QString Reader::syncToken() const
{
    return mSyncToken;
}

const QList<Reader::Response>& Reader::responses() const
{
    return mResponses;
}

void Reader::setError(const QString &errorString)
{
    if (!mHasError) {
        LOG_WARNING(errorString);
        mHasError = true;
        mErrorString = errorString;
    }
}

void Reader::readMultiStatus()
{
    while (mReader->readNextStartElement()) {
        if (mReader->name() == "response") {
            readResponse();
        } else if (mReader->name() == "sync-token") {
            mSyncToken = mReader->readElementText().trimmed();
        } else {
            mReader->skipCurrentElement();
        }
    }
}

void Reader::readResponse()
{
    Response response;
    QStringList hrefs;
    while (mReader->readNextStartElement()) {
        if (mReader->name() == "href") {
            hrefs.append(hrefToPath(mReader->readElementText()));
        } else if (mReader->name() == "status") {
            response.status = parseStatus(mReader->readElementText());
        } else if (mReader->name() == "propstat") {
            readPropStat(&response);
        } else {
            mReader->skipCurrentElement();
        }
    }
    if (hrefs.isEmpty() || hrefs.contains(QString())) {
        setError(QStringLiteral("Multistatus response is missing href value"));
        return;
    }
    // several hrefs may only share a response level status
    if (hrefs.count() > 1 && (response.status == 0 || !response.propertyStatus.isEmpty())) {
        setError(QStringLiteral("Multistatus response with several hrefs has no shared status"));
        return;
    }
    Q_FOREACH (const QString &href, hrefs) {
        response.href = href;
        mResponses.append(response);
    }
}

void Reader::readPropStat(Response *response)
{
    // the status usually follows the prop element, so collect first and merge after
    Response props;
    QStringList names;
    int status = 0;
    while (mReader->readNextStartElement()) {
        if (mReader->name() == "prop") {
            readProp(&props, &names);
        } else if (mReader->name() == "status") {
            status = parseStatus(mReader->readElementText());
        } else {
            mReader->skipCurrentElement();
        }
    }
    Q_FOREACH (const QString &name, names) {
        response->propertyStatus.insert(name, status);
    }
    if (status >= 200 && status < 300) {
        mergeProperties(response, props, names);
    }
}

void Reader::readProp(Response *props, QStringList *names)
{
    while (mReader->readNextStartElement()) {
        const QString name = mReader->name().toString();
        names->append(name);
        if (name == "getetag") {
            QString etag = mReader->readElementText().trimmed();
            if (etag.length() >= 2 && etag.startsWith('"') && etag.endsWith('"')) {
                etag = etag.mid(1, etag.length() - 2);
            }
            props->etag = etag;
        } else if (name == "getlastmodified") {
            props->lastModified = parseHttpDate(mReader->readElementText());
        } else if (name == "getcontentlength") {
            props->contentLength = mReader->readElementText().trimmed().toLongLong();
        } else if (name == "calendar-data") {
            props->calendarData = mReader->readElementText().toUtf8();
            props->hasCalendarData = true;
        } else if (name == "resourcetype") {
            readResourceType(props);
        } else if (name == "displayname") {
            props->displayName = mReader->readElementText();
        } else if (name == "calendar-description") {
            props->description = mReader->readElementText();
        } else if (name == "calendar-color") {
            props->color = mReader->readElementText().trimmed();
        } else if (name == "calendar-timezone") {
            props->timezone = mReader->readElementText();
        } else if (name == "sync-token") {
            props->syncToken = mReader->readElementText().trimmed();
        } else if (name == "max-resource-size") {
            bool ok = false;
            props->maxResourceSize = mReader->readElementText().trimmed().toLongLong(&ok);
            if (!ok) {
                LOG_WARNING("Invalid max-resource-size value");
                props->maxResourceSize = -1;
            }
            props->hasMaxResourceSize = true;
        } else if (name == "supported-calendar-component-set") {
            readComponentSet(props);
        } else if (name == "current-user-privilege-set") {
            readPrivilegeSet(props);
        } else if (name == "current-user-principal") {
            props->currentUserPrincipal = readHrefChild(&props->unauthenticated);
        } else if (name == "calendar-home-set") {
            props->calendarHomeSet = readHrefChild();
        } else {
            mReader->skipCurrentElement();
        }
    }
}

void Reader::readResourceType(Response *props)
{
    /* e.g.:
        <D:resourcetype><C:calendar xmlns:C="urn:ietf:params:xml:ns:caldav"/><D:collection/></D:resourcetype>
    */
    props->hasResourceType = true;
    while (mReader->readNextStartElement()) {
        const QString type = mReader->name().toString();
        props->resourceTypes.append(type);
        if (type == "collection") {
            props->isCollection = true;
        } else if (type == "calendar") {
            props->isCalendar = true;
        }
        mReader->skipCurrentElement();
    }
}

void Reader::readPrivilegeSet(Response *props)
{
    /* e.g.:
        <D:current-user-privilege-set>
            <D:privilege><D:read /></D:privilege>
            <D:privilege><D:write /></D:privilege>
        </D:current-user-privilege-set>
    */
    while (mReader->readNextStartElement()) {
        if (mReader->name() == "privilege") {
            while (mReader->readNextStartElement()) {
                props->privileges.append(mReader->name().toString());
                mReader->skipCurrentElement();
            }
        } else {
            mReader->skipCurrentElement();
        }
    }
}

void Reader::readComponentSet(Response *props)
{
    while (mReader->readNextStartElement()) {
        if (mReader->name() == "comp") {
            const QString component = mReader->attributes().value(QStringLiteral("name")).toString();
            if (!component.isEmpty()) {
                props->supportedComponents.append(component);
            }
        }
        mReader->skipCurrentElement();
    }
}

QString Reader::readHrefChild(bool *unauthenticated)
{
    QString href;
    while (mReader->readNextStartElement()) {
        if (mReader->name() == "href" && href.isEmpty()) {
            href = hrefToPath(mReader->readElementText());
        } else {
            if (mReader->name() == "unauthenticated" && unauthenticated) {
                *unauthenticated = true;
            }
            mReader->skipCurrentElement();
        }
    }
    return href;
}

void Reader::mergeProperties(Response *response, const Response &props, const QStringList &names)
{
    Q_FOREACH (const QString &name, names) {
        if (name == "getetag") {
            response->etag = props.etag;
        } else if (name == "getlastmodified") {
            response->lastModified = props.lastModified;
        } else if (name == "getcontentlength") {
            response->contentLength = props.contentLength;
        } else if (name == "calendar-data") {
            response->calendarData = props.calendarData;
            response->hasCalendarData = props.hasCalendarData;
        } else if (name == "resourcetype") {
            response->hasResourceType = props.hasResourceType;
            response->isCollection = props.isCollection;
            response->isCalendar = props.isCalendar;
            response->resourceTypes = props.resourceTypes;
        } else if (name == "displayname") {
            response->displayName = props.displayName;
        } else if (name == "calendar-description") {
            response->description = props.description;
        } else if (name == "calendar-color") {
            response->color = props.color;
        } else if (name == "calendar-timezone") {
            response->timezone = props.timezone;
        } else if (name == "sync-token") {
            response->syncToken = props.syncToken;
        } else if (name == "max-resource-size") {
            response->hasMaxResourceSize = props.hasMaxResourceSize;
            response->maxResourceSize = props.maxResourceSize;
        } else if (name == "supported-calendar-component-set") {
            response->supportedComponents = props.supportedComponents;
        } else if (name == "current-user-privilege-set") {
            response->privileges = props.privileges;
        } else if (name == "current-user-principal") {
            response->currentUserPrincipal = props.currentUserPrincipal;
            response->unauthenticated = props.unauthenticated;
        } else if (name == "calendar-home-set") {
            response->calendarHomeSet = props.calendarHomeSet;
        }
    }
}

int Reader::parseStatus(const QString &statusLine)
{
    // e.g. "HTTP/1.1 404 Not Found"
    const QStringList parts = statusLine.simplified().split(QChar(' '));
    if (parts.count() < 2) {
        return 0;
    }
    return parts.at(1).toInt();
}

QString Reader::hrefToPath(const QString &href)
{
    QString path = href.trimmed();
    if (path.startsWith(QStringLiteral("http://"), Qt::CaseInsensitive)
            || path.startsWith(QStringLiteral("https://"), Qt::CaseInsensitive)) {
        path = QUrl(path).path(QUrl::FullyEncoded);
    }
    return QUrl::fromPercentEncoding(path.toUtf8());
}

QDateTime Reader::parseHttpDate(const QString &value)
{
    static const char *formats[] = {
        "ddd, dd MMM yyyy HH:mm:ss 'GMT'",  // RFC 1123
        "dddd, dd-MMM-yy HH:mm:ss 'GMT'",   // RFC 850
        "ddd MMM d HH:mm:ss yyyy"           // asctime()
    };
    const QString simplified = value.simplified();
    const QLocale c = QLocale::c();
    for (uint i = 0; i < sizeof(formats) / sizeof(formats[0]); ++i) {
        QDateTime dateTime = c.toDateTime(simplified, QLatin1String(formats[i]));
        if (dateTime.isValid()) {
            dateTime.setTimeSpec(Qt::UTC);
            return dateTime;
        }
    }
    return QDateTime();
}
