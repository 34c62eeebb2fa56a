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

#include "settings.h"

static const qint64 SecondsPerDay = 24 * 60 * 60;

Settings::Settings()
    : mIgnoreSSLErrors(false)
    , mRequestTimeout(0)
    , mRangeWindow(90 * SecondsPerDay)
    , mMinimumRangeWindow(SecondsPerDay)
{
}

QString Settings::authToken() const
{
    return mOAuthToken;
}

void Settings::setAuthToken(const QString & token)
{
    mOAuthToken = token;
}

bool Settings::ignoreSSLErrors() const
{
    return mIgnoreSSLErrors;
}

void Settings::setIgnoreSSLErrors(bool ignore)
{
    mIgnoreSSLErrors = ignore;
}

QString Settings::password() const
{
    return mPassword;
}

void Settings::setPassword(const QString & password)
{
    mPassword = password;
}

QString Settings::username() const
{
    return mUsername;
}

void Settings::setUsername(const QString & username)
{
    mUsername = username;
}

void Settings::setServerAddress(const QString &serverAddress)
{
    mServerAddress = serverAddress;
}

QString Settings::serverAddress() const
{
    return mServerAddress;
}

void Settings::setDavRootPath(const QString &davRootPath)
{
    mDavRootPath = davRootPath;
}

QString Settings::davRootPath() const
{
    return mDavRootPath;
}

void Settings::setRequestTimeout(int msecs)
{
    mRequestTimeout = msecs;
}

int Settings::requestTimeout() const
{
    return mRequestTimeout;
}

void Settings::setRangeWindow(qint64 secs)
{
    mRangeWindow = secs;
}

qint64 Settings::rangeWindow() const
{
    return mRangeWindow;
}

void Settings::setMinimumRangeWindow(qint64 secs)
{
    mMinimumRangeWindow = secs;
}

qint64 Settings::minimumRangeWindow() const
{
    return mMinimumRangeWindow;
}
