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

#ifndef CALDAVCLIENT_GLOBAL_H
#define CALDAVCLIENT_GLOBAL_H

#include <QtCore/qglobal.h>

#if defined(CALDAVCLIENT_LIBRARY)
#  define CALDAVCLIENT_EXPORT Q_DECL_EXPORT
#else
#  define CALDAVCLIENT_EXPORT Q_DECL_IMPORT
#endif

#endif // CALDAVCLIENT_GLOBAL_H
