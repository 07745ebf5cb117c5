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

#include "gpxstream.h"

#include <QByteArray>                  // for QByteArray
#include <QFile>                       // for QFile
#include <QIODevice>                   // for QIODevice, QIODevice::ReadOnly, QIODevice::WriteOnly
#include <QString>                     // for QString, QStringLiteral

#include "defs.h"                      // for global_options, global_opts
#include "gpxreader.h"                 // for GpxReader
#include "gpxwriter.h"                 // for GpxWriter
#include "gsversion.h"                 // for VERSION
#include "parsecontext.h"              // for ParseContext
#include "src/core/error.h"            // for Error
#include "src/core/logging.h"          // for gsDebug
#include "xmlevents.h"                 // for XmlEventReader


global_options global_opts;
const char gpxstream_version[] = VERSION;

namespace gpxstream
{

namespace
{

Gpx read_events(XmlEventReader& events)
{
  ParseContext context(events);
  GpxReader reader(context);
  Gpx gpx = reader.read_gpx();
  context.verify_end_of_document();
  return gpx;
}

} // namespace

Gpx read(QIODevice* device)
{
  XmlEventReader events(device);
  return read_events(events);
}

Gpx read(const QByteArray& data)
{
  XmlEventReader events(data);
  return read_events(events);
}

Gpx read_file(const QString& fname)
{
  QFile file(fname);
  if (!file.open(QIODevice::ReadOnly)) {
    throw Error::io(QStringLiteral("cannot open '%1' for read: %2").arg(fname, file.errorString()));
  }
  gsDebug(1) << "Reading" << fname;
  return read(&file);
}

void write(const Gpx& gpx, QIODevice* device)
{
  GpxWriter writer(device);
  writer.write(gpx);
}

void write_file(const Gpx& gpx, const QString& fname)
{
  // Leave an existing file alone if we can't write anything anyway.
  if (gpx.version == GpxVersion::Unknown) {
    throw Error::unknownVersion(version_to_string(gpx.version));
  }
  QFile file(fname);
  if (!file.open(QIODevice::WriteOnly)) {
    throw Error::io(QStringLiteral("cannot open '%1' for write: %2").arg(fname, file.errorString()));
  }
  gsDebug(1) << "Writing" << fname;
  write(gpx, &file);
  if (!file.flush()) {
    throw Error::io(QStringLiteral("cannot write '%1': %2").arg(fname, file.errorString()));
  }
}

} // namespace gpxstream
