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
#ifndef GPXTYPES_H_INCLUDED_
#define GPXTYPES_H_INCLUDED_

#include <optional>                    // for optional

#include <QDebug>                      // for QDebug
#include <QList>                       // for QList
#include <QString>                     // for QString
#include <QXmlStreamAttributes>        // for QXmlStreamAttributes
#include <QtGlobal>                    // for quint16, quint32

#include "src/core/datetime.h"         // for DateTime
#include "src/core/xmltag.h"           // for XmlTag

namespace gpxstream
{

enum class GpxVersion {
  Unknown,
  Gpx10,
  Gpx11
};

QString version_to_string(GpxVersion version);
GpxVersion version_from_string(const QString& version);

/*
 * The unparsed content of an <extensions> element.  The root tag is the
 * <extensions> element itself.
 */
using Extensions = XmlTag;

/*
 * A link to an external resource (Web page, digital photo,
 * video clip, etc) with additional information.
 */
struct Link {
  Link() = default;
  explicit Link(const QString& h) : href(h) {}

  QString href;                    // URL of hyperlink.
  std::optional<QString> text;     // Text of hyperlink.
  std::optional<QString> type;     // Mime type of content (image/jpeg).
};

/*
 * A person or organization.  In GPX 1.0 the pieces live directly in <gpx>
 * as <author>, <email>, <url> and <urlname>.
 */
struct Person {
  std::optional<QString> name;
  std::optional<QString> email;    // id@domain
  std::optional<Link> link;

  bool isEmpty() const
  {
    return !name && !email && !link;
  }
};

// Split an id@domain address.  Throws InvalidEmail unless there is
// exactly one '@' with something on either side of it.
void split_email(const QString& address, QString& id, QString& domain);

struct Copyright {
  std::optional<QString> author;
  std::optional<int> year;
  std::optional<QString> license;  // URL of the license text.
};

/*
 * Two lat/lon pairs defining the extent of an element.
 * Construct with create(), which refuses min > max rather than
 * swapping the corners.
 */
class Rect
{
public:
  static Rect create(double min_lat, double min_lon, double max_lat, double max_lon);

  double min_lat() const
  {
    return min_lat_;
  }
  double min_lon() const
  {
    return min_lon_;
  }
  double max_lat() const
  {
    return max_lat_;
  }
  double max_lon() const
  {
    return max_lon_;
  }

private:
  Rect(double min_lat, double min_lon, double max_lat, double max_lon) :
    min_lat_(min_lat), min_lon_(min_lon), max_lat_(max_lat), max_lon_(max_lon) {}

  double min_lat_;
  double min_lon_;
  double max_lat_;
  double max_lon_;
};

/*
 * Type of GPS fix.  none means the GPS had no fix; to signify "the fix
 * info is unknown" leave the fix out entirely.  Values we don't know are
 * carried verbatim so they are written back unchanged.
 */
class Fix
{
public:
  enum class Kind {
    None,
    TwoDimensional,
    ThreeDimensional,
    DGPS,
    PPS,
    Other
  };

  Fix() = default;
  explicit Fix(Kind kind) : kind_(kind) {}
  static Fix fromString(const QString& text);

  Kind kind() const
  {
    return kind_;
  }
  QString other() const
  {
    return other_;
  }
  QString toString() const;

  friend bool operator==(const Fix& lhs, const Fix& rhs)
  {
    return lhs.kind_ == rhs.kind_ && lhs.other_ == rhs.other_;
  }
  friend bool operator!=(const Fix& lhs, const Fix& rhs)
  {
    return !(lhs == rhs);
  }

private:
  Kind kind_{Kind::None};
  QString other_;
};

/*
 * A waypoint, point of interest, or named feature on a map.  Also used
 * for track points and route points.
 */
class Waypoint
{
public:
  // Throws gpxstream::Error if lat is outside [-90, 90] or lon is
  // outside [-180, 180).
  Waypoint(double lat, double lon);

  double latitude() const
  {
    return latitude_;
  }
  double longitude() const
  {
    return longitude_;
  }

  std::optional<double> elevation;      // meters
  std::optional<double> speed;          // GPX 1.0 only, meters per second
  std::optional<double> course;         // GPX 1.0 only, degrees
  std::optional<DateTime> time;
  std::optional<double> magvar;         // degrees
  std::optional<double> geoidheight;    // meters
  std::optional<QString> name;
  std::optional<QString> comment;
  std::optional<QString> description;
  std::optional<QString> source;
  QList<Link> links;
  std::optional<QString> symbol;
  std::optional<QString> type;
  std::optional<Fix> fix;
  std::optional<quint32> sat;
  std::optional<double> hdop;
  std::optional<double> vdop;
  std::optional<double> pdop;
  std::optional<double> dgps_age;       // seconds since last DGPS update
  std::optional<quint16> dgpsid;        // DGPS station id, 0..1023
  std::optional<Extensions> extensions;

private:
  double latitude_;
  double longitude_;
};

struct TrackSegment {
  QList<Waypoint> points;
  std::optional<Extensions> extensions;
};

struct Track {
  std::optional<QString> name;
  std::optional<QString> comment;
  std::optional<QString> description;
  std::optional<QString> source;
  QList<Link> links;
  std::optional<QString> type;
  std::optional<quint32> number;
  std::optional<Extensions> extensions;
  QList<TrackSegment> segments;
};

struct Route {
  std::optional<QString> name;
  std::optional<QString> comment;
  std::optional<QString> description;
  std::optional<QString> source;
  QList<Link> links;
  std::optional<QString> type;
  std::optional<quint32> number;
  std::optional<Extensions> extensions;
  QList<Waypoint> points;
};

/*
 * Information about the file: author, copyright restrictions and so on.
 * In GPX 1.0 there is no <metadata> element and these are assembled from
 * the children of <gpx>.
 */
struct Metadata {
  std::optional<QString> name;
  std::optional<QString> description;
  std::optional<Person> author;
  std::optional<Copyright> copyright;
  QList<Link> links;
  std::optional<DateTime> time;
  std::optional<QString> keywords;
  std::optional<Rect> bounds;
  std::optional<Extensions> extensions;

  bool isEmpty() const
  {
    return !name && !description && !author && !copyright && links.isEmpty() &&
           !time && !keywords && !bounds && !extensions;
  }
};

struct Gpx {
  GpxVersion version{GpxVersion::Unknown};
  std::optional<QString> creator;
  std::optional<Metadata> metadata;
  QList<Waypoint> waypoints;
  QList<Track> tracks;
  QList<Route> routes;
  std::optional<Extensions> extensions;
  // xmlns:prefix declarations from <gpx>, kept so extension content that
  // uses them can be written back.
  QXmlStreamAttributes namespaces;
};

bool operator==(const Link& lhs, const Link& rhs);
bool operator==(const Person& lhs, const Person& rhs);
bool operator==(const Copyright& lhs, const Copyright& rhs);
bool operator==(const Rect& lhs, const Rect& rhs);
bool operator==(const Waypoint& lhs, const Waypoint& rhs);
bool operator==(const TrackSegment& lhs, const TrackSegment& rhs);
bool operator==(const Track& lhs, const Track& rhs);
bool operator==(const Route& lhs, const Route& rhs);
bool operator==(const Metadata& lhs, const Metadata& rhs);
bool operator==(const Gpx& lhs, const Gpx& rhs);

inline bool operator!=(const Link& lhs, const Link& rhs)
{
  return !(lhs == rhs);
}
inline bool operator!=(const Person& lhs, const Person& rhs)
{
  return !(lhs == rhs);
}
inline bool operator!=(const Copyright& lhs, const Copyright& rhs)
{
  return !(lhs == rhs);
}
inline bool operator!=(const Rect& lhs, const Rect& rhs)
{
  return !(lhs == rhs);
}
inline bool operator!=(const Waypoint& lhs, const Waypoint& rhs)
{
  return !(lhs == rhs);
}
inline bool operator!=(const TrackSegment& lhs, const TrackSegment& rhs)
{
  return !(lhs == rhs);
}
inline bool operator!=(const Track& lhs, const Track& rhs)
{
  return !(lhs == rhs);
}
inline bool operator!=(const Route& lhs, const Route& rhs)
{
  return !(lhs == rhs);
}
inline bool operator!=(const Metadata& lhs, const Metadata& rhs)
{
  return !(lhs == rhs);
}
inline bool operator!=(const Gpx& lhs, const Gpx& rhs)
{
  return !(lhs == rhs);
}

QDebug operator<<(QDebug debug, GpxVersion version);
QDebug operator<<(QDebug debug, const Waypoint& wpt);

} // namespace gpxstream

#endif // GPXTYPES_H_INCLUDED_
