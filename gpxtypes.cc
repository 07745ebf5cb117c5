/*
    In-memory model of a GPX document.

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

#include "gpxtypes.h"

#include <QDebug>                 // for QDebug, QDebugStateSaver
#include <QLatin1Char>            // for QLatin1Char
#include <QLatin1String>          // for QLatin1String
#include <QString>                // for QString, QStringLiteral

#include "src/core/error.h"       // for Error


namespace gpxstream
{

QString version_to_string(GpxVersion version)
{
  switch (version) {
  case GpxVersion::Gpx10:
    return QStringLiteral("1.0");
  case GpxVersion::Gpx11:
    return QStringLiteral("1.1");
  case GpxVersion::Unknown:
    break;
  }
  return QStringLiteral("unknown");
}

// No forward compatibility; 1.2 is as unknown as 7.
GpxVersion version_from_string(const QString& version)
{
  if (version == QLatin1String("1.0")) {
    return GpxVersion::Gpx10;
  }
  if (version == QLatin1String("1.1")) {
    return GpxVersion::Gpx11;
  }
  return GpxVersion::Unknown;
}

Rect Rect::create(double min_lat, double min_lon, double max_lat, double max_lon)
{
  // Written so that a NaN fails too.
  if (!(min_lon <= max_lon)) {
    throw Error::outOfBounds(QStringLiteral("bounds"),
                             QStringLiteral("minimum longitude %1 larger than maximum longitude %2")
                             .arg(min_lon).arg(max_lon));
  }
  if (!(min_lat <= max_lat)) {
    throw Error::outOfBounds(QStringLiteral("bounds"),
                             QStringLiteral("minimum latitude %1 larger than maximum latitude %2")
                             .arg(min_lat).arg(max_lat));
  }
  return {min_lat, min_lon, max_lat, max_lon};
}

Fix Fix::fromString(const QString& text)
{
  if (text == QLatin1String("none")) {
    return Fix(Kind::None);
  } else if (text == QLatin1String("2d")) {
    return Fix(Kind::TwoDimensional);
  } else if (text == QLatin1String("3d")) {
    return Fix(Kind::ThreeDimensional);
  } else if (text == QLatin1String("dgps")) {
    return Fix(Kind::DGPS);
  } else if (text == QLatin1String("pps")) {
    return Fix(Kind::PPS);
  }
  Fix fix(Kind::Other);
  fix.other_ = text;
  return fix;
}

QString Fix::toString() const
{
  switch (kind_) {
  case Kind::None:
    return QStringLiteral("none");
  case Kind::TwoDimensional:
    return QStringLiteral("2d");
  case Kind::ThreeDimensional:
    return QStringLiteral("3d");
  case Kind::DGPS:
    return QStringLiteral("dgps");
  case Kind::PPS:
    return QStringLiteral("pps");
  case Kind::Other:
    break;
  }
  return other_;
}

void split_email(const QString& address, QString& id, QString& domain)
{
  if (address.count(QLatin1Char('@')) != 1) {
    throw Error::invalidEmail(address, QStringLiteral("needs exactly one '@'"));
  }
  const auto at = address.indexOf(QLatin1Char('@'));
  id = address.left(at);
  domain = address.mid(at + 1);
  if (id.isEmpty() || domain.isEmpty()) {
    throw Error::invalidEmail(address, QStringLiteral("id or domain is missing"));
  }
}

Waypoint::Waypoint(double lat, double lon) : latitude_(lat), longitude_(lon)
{
  if (!(lat >= -90.0 && lat <= 90.0)) {
    throw Error::outOfBounds(QStringLiteral("latitude"),
                             QStringLiteral("%1 is not in [-90, 90]").arg(lat));
  }
  if (!(lon >= -180.0 && lon < 180.0)) {
    throw Error::outOfBounds(QStringLiteral("longitude"),
                             QStringLiteral("%1 is not in [-180, 180)").arg(lon));
  }
}

bool operator==(const Link& lhs, const Link& rhs)
{
  return lhs.href == rhs.href && lhs.text == rhs.text && lhs.type == rhs.type;
}

bool operator==(const Person& lhs, const Person& rhs)
{
  return lhs.name == rhs.name && lhs.email == rhs.email && lhs.link == rhs.link;
}

bool operator==(const Copyright& lhs, const Copyright& rhs)
{
  return lhs.author == rhs.author && lhs.year == rhs.year && lhs.license == rhs.license;
}

bool operator==(const Rect& lhs, const Rect& rhs)
{
  return lhs.min_lat() == rhs.min_lat() && lhs.min_lon() == rhs.min_lon() &&
         lhs.max_lat() == rhs.max_lat() && lhs.max_lon() == rhs.max_lon();
}

bool operator==(const Waypoint& lhs, const Waypoint& rhs)
{
  return lhs.latitude() == rhs.latitude() &&
         lhs.longitude() == rhs.longitude() &&
         lhs.elevation == rhs.elevation &&
         lhs.speed == rhs.speed &&
         lhs.course == rhs.course &&
         lhs.time == rhs.time &&
         lhs.magvar == rhs.magvar &&
         lhs.geoidheight == rhs.geoidheight &&
         lhs.name == rhs.name &&
         lhs.comment == rhs.comment &&
         lhs.description == rhs.description &&
         lhs.source == rhs.source &&
         lhs.links == rhs.links &&
         lhs.symbol == rhs.symbol &&
         lhs.type == rhs.type &&
         lhs.fix == rhs.fix &&
         lhs.sat == rhs.sat &&
         lhs.hdop == rhs.hdop &&
         lhs.vdop == rhs.vdop &&
         lhs.pdop == rhs.pdop &&
         lhs.dgps_age == rhs.dgps_age &&
         lhs.dgpsid == rhs.dgpsid &&
         lhs.extensions == rhs.extensions;
}

bool operator==(const TrackSegment& lhs, const TrackSegment& rhs)
{
  return lhs.points == rhs.points && lhs.extensions == rhs.extensions;
}

bool operator==(const Track& lhs, const Track& rhs)
{
  return lhs.name == rhs.name &&
         lhs.comment == rhs.comment &&
         lhs.description == rhs.description &&
         lhs.source == rhs.source &&
         lhs.links == rhs.links &&
         lhs.type == rhs.type &&
         lhs.number == rhs.number &&
         lhs.extensions == rhs.extensions &&
         lhs.segments == rhs.segments;
}

bool operator==(const Route& lhs, const Route& rhs)
{
  return lhs.name == rhs.name &&
         lhs.comment == rhs.comment &&
         lhs.description == rhs.description &&
         lhs.source == rhs.source &&
         lhs.links == rhs.links &&
         lhs.type == rhs.type &&
         lhs.number == rhs.number &&
         lhs.extensions == rhs.extensions &&
         lhs.points == rhs.points;
}

bool operator==(const Metadata& lhs, const Metadata& rhs)
{
  return lhs.name == rhs.name &&
         lhs.description == rhs.description &&
         lhs.author == rhs.author &&
         lhs.copyright == rhs.copyright &&
         lhs.links == rhs.links &&
         lhs.time == rhs.time &&
         lhs.keywords == rhs.keywords &&
         lhs.bounds == rhs.bounds &&
         lhs.extensions == rhs.extensions;
}

bool operator==(const Gpx& lhs, const Gpx& rhs)
{
  return lhs.version == rhs.version &&
         lhs.creator == rhs.creator &&
         lhs.metadata == rhs.metadata &&
         lhs.waypoints == rhs.waypoints &&
         lhs.tracks == rhs.tracks &&
         lhs.routes == rhs.routes &&
         lhs.extensions == rhs.extensions &&
         lhs.namespaces == rhs.namespaces;
}

QDebug operator<<(QDebug debug, GpxVersion version)
{
  QDebugStateSaver saver(debug);
  debug.nospace().noquote() << "GPX " << version_to_string(version);
  return debug;
}

QDebug operator<<(QDebug debug, const Waypoint& wpt)
{
  QDebugStateSaver saver(debug);
  debug.nospace() << "Waypoint(" << wpt.latitude() << ", " << wpt.longitude();
  if (wpt.name) {
    debug << ", " << *wpt.name;
  }
  if (wpt.time) {
    debug << ", " << wpt.time->toPrettyString();
  }
  debug << ')';
  return debug;
}

} // namespace gpxstream
