/*
    Writer for GPX 1.0 and GPX 1.1.

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
#ifndef GPXWRITER_H_INCLUDED_
#define GPXWRITER_H_INCLUDED_

#include <optional>                    // for optional

#include <QIODevice>                   // for QIODevice
#include <QList>                       // for QList
#include <QString>                     // for QString
#include <QtGlobal>                    // for quint16, quint32

#include "gpxtypes.h"                  // for Gpx, GpxVersion, Waypoint, ...
#include "src/core/datetime.h"         // for DateTime
#include "src/core/xmlstreamwriter.h"  // for XmlStreamWriter

namespace gpxstream
{

/*
 * Writes a Gpx in the version it carries.  Whatever the version has no
 * element for is left out.
 */
class GpxWriter
{
public:
  explicit GpxWriter(QIODevice* device);

  // Throws gpxstream::Error on an unknown version, an unwritable email
  // address or a device error.
  void write(const Gpx& gpx);

  static QString toString(double d);
  static QString toString(quint32 n);
  static QString toString(quint16 n);
  static QString toString(int n);

private:
  /* Member Functions */

  void write_string_if_exists(const QString& tag, const std::optional<QString>& value);
  template<typename T>
  void write_value_if_exists(const QString& tag, const std::optional<T>& value);
  void write_time_if_exists(const QString& tag, const std::optional<DateTime>& time);
  void write_email_if_exists(const std::optional<QString>& email);

  void write_links(const QList<Link>& links);
  void write_link(const Link& link);
  void write_person(const QString& tag, const Person& person);
  void write_copyright(const Copyright& copyright);
  void write_bounds(const Rect& bounds);
  void write_extensions(const std::optional<Extensions>& extensions);

  void write_metadata(const Metadata& metadata);
  void write_metadata_gpx10(const Metadata& metadata);
  void write_waypoint(const QString& tag, const Waypoint& wpt);
  void write_track_segment(const TrackSegment& segment);
  void write_track(const Track& track);
  void write_route(const Route& route);

  /* Data Members */

  XmlStreamWriter writer;
  GpxVersion version_{GpxVersion::Unknown};
};

} // namespace gpxstream

#endif // GPXWRITER_H_INCLUDED_
