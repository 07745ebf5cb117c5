/*
    Read and write GPX 1.0 and GPX 1.1 documents.

    Copyright (C) 2002-2015 Robert Lipe, gpsbabel.org

    This program is free software; you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation; either version 2 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program; if not, write to the Free Software
    Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.

 */
#ifndef GPXSTREAM_H_INCLUDED_
#define GPXSTREAM_H_INCLUDED_

#include <QByteArray>                  // for QByteArray
#include <QIODevice>                   // for QIODevice
#include <QString>                     // for QString

#include "gpxtypes.h"                  // for Gpx
#include "src/core/error.h"            // for Error, ErrorKind

namespace gpxstream
{

/*
 * All of these throw gpxstream::Error and nothing else of their own.
 * They don't log unless global_opts.debug_level asks for it, and they
 * never exit.
 */

// device must be open for reading.
Gpx read(QIODevice* device);
Gpx read(const QByteArray& data);
Gpx read_file(const QString& fname);

// device must be open for writing.  The version written is gpx.version.
void write(const Gpx& gpx, QIODevice* device);
void write_file(const Gpx& gpx, const QString& fname);

} // namespace gpxstream

#endif // GPXSTREAM_H_INCLUDED_
