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

#include "filterencoder.h"

#include <QXmlStreamWriter>

static const QString DateTimeFormatUTC = QStringLiteral("yyyyMMdd'T'HHmmss'Z'");

const QString FilterEncoder::DavNamespace = QStringLiteral("DAV:");
const QString FilterEncoder::CalDavNamespace = QStringLiteral("urn:ietf:params:xml:ns:caldav");
const QString FilterEncoder::AppleNamespace = QStringLiteral("http://apple.com/ns/ical/");

void FilterEncoder::writeNamespaces(QXmlStreamWriter *writer)
{
    writer->writeNamespace(DavNamespace, QStringLiteral("d"));
    writer->writeNamespace(CalDavNamespace, QStringLiteral("c"));
    writer->writeNamespace(AppleNamespace, QStringLiteral("a"));
}

QString FilterEncoder::dateTimeToString(const QDateTime &dateTime)
{
    return dateTime.toUTC().toString(DateTimeFormatUTC);
}

void FilterEncoder::writeTimeRange(QXmlStreamWriter *writer, const QString &elementName,
                                   const QDateTime &start, const QDateTime &end)
{
    writer->writeEmptyElement(CalDavNamespace, elementName);
    if (start.isValid()) {
        writer->writeAttribute(QStringLiteral("start"), dateTimeToString(start));
    }
    if (end.isValid()) {
        writer->writeAttribute(QStringLiteral("end"), dateTimeToString(end));
    }
}

void FilterEncoder::writeTextMatch(QXmlStreamWriter *writer, const TextMatch &textMatch)
{
    writer->writeStartElement(CalDavNamespace, QStringLiteral("text-match"));
    if (textMatch.negateCondition) {
        writer->writeAttribute(QStringLiteral("negate-condition"), QStringLiteral("yes"));
    }
    writer->writeCharacters(textMatch.text);
    writer->writeEndElement();
}

bool FilterEncoder::writeCompFilter(QXmlStreamWriter *writer, const CompFilter &filter)
{
    writer->writeStartElement(CalDavNamespace, QStringLiteral("comp-filter"));
    writer->writeAttribute(QStringLiteral("name"), filter.name);
    if (filter.isNotDefined) {
        writer->writeEmptyElement(CalDavNamespace, QStringLiteral("is-not-defined"));
    }
    if (filter.start.isValid() || filter.end.isValid()) {
        writeTimeRange(writer, QStringLiteral("time-range"), filter.start, filter.end);
    }
    Q_FOREACH (const PropFilter &prop, filter.props) {
        if (!writePropFilter(writer, prop)) {
            return false;
        }
    }
    Q_FOREACH (const CompFilter &comp, filter.comps) {
        if (!writeCompFilter(writer, comp)) {
            return false;
        }
    }
    writer->writeEndElement();
    return !writer->hasError();
}

bool FilterEncoder::writePropFilter(QXmlStreamWriter *writer, const PropFilter &filter)
{
    writer->writeStartElement(CalDavNamespace, QStringLiteral("prop-filter"));
    writer->writeAttribute(QStringLiteral("name"), filter.name);
    if (filter.isNotDefined) {
        writer->writeEmptyElement(CalDavNamespace, QStringLiteral("is-not-defined"));
    }
    if (filter.start.isValid() || filter.end.isValid()) {
        writeTimeRange(writer, QStringLiteral("time-range"), filter.start, filter.end);
    }
    if (filter.hasTextMatch) {
        writeTextMatch(writer, filter.textMatch);
    }
    Q_FOREACH (const ParamFilter &param, filter.params) {
        if (!writeParamFilter(writer, param)) {
            return false;
        }
    }
    writer->writeEndElement();
    return !writer->hasError();
}

bool FilterEncoder::writeParamFilter(QXmlStreamWriter *writer, const ParamFilter &filter)
{
    writer->writeStartElement(CalDavNamespace, QStringLiteral("param-filter"));
    writer->writeAttribute(QStringLiteral("name"), filter.name);
    if (filter.isNotDefined) {
        writer->writeEmptyElement(CalDavNamespace, QStringLiteral("is-not-defined"));
    }
    if (filter.hasTextMatch) {
        writeTextMatch(writer, filter.textMatch);
    }
    writer->writeEndElement();
    return !writer->hasError();
}

bool FilterEncoder::writeCompRequest(QXmlStreamWriter *writer, const CalendarCompRequest &request)
{
    writer->writeStartElement(CalDavNamespace, QStringLiteral("comp"));
    writer->writeAttribute(QStringLiteral("name"), request.name);
    if (request.allProps) {
        writer->writeEmptyElement(CalDavNamespace, QStringLiteral("allprop"));
    }
    Q_FOREACH (const QString &prop, request.props) {
        writer->writeEmptyElement(CalDavNamespace, QStringLiteral("prop"));
        writer->writeAttribute(QStringLiteral("name"), prop);
    }
    if (request.allComps) {
        writer->writeEmptyElement(CalDavNamespace, QStringLiteral("allcomp"));
    }
    Q_FOREACH (const CalendarCompRequest &comp, request.comps) {
        if (!writeCompRequest(writer, comp)) {
            return false;
        }
    }
    writer->writeEndElement();
    return !writer->hasError();
}

bool FilterEncoder::writeCalendarDataProperties(QXmlStreamWriter *writer, const CalendarCompRequest &request)
{
    writer->writeStartElement(CalDavNamespace, QStringLiteral("calendar-data"));
    if (!request.name.isEmpty() && !writeCompRequest(writer, request)) {
        return false;
    }
    if (request.expandStart.isValid() && request.expandEnd.isValid()) {
        writeTimeRange(writer, QStringLiteral("expand"), request.expandStart, request.expandEnd);
    }
    writer->writeEndElement();
    writer->writeEmptyElement(DavNamespace, QStringLiteral("getlastmodified"));
    writer->writeEmptyElement(DavNamespace, QStringLiteral("getetag"));
    writer->writeEmptyElement(DavNamespace, QStringLiteral("getcontentlength"));
    return !writer->hasError();
}
