/*
    Recursive descent reader for GPX 1.0 and GPX 1.1.

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
#ifndef GPXREADER_H_INCLUDED_
#define GPXREADER_H_INCLUDED_

#include <optional>                    // for optional

#include <QHash>                       // for QHash
#include <QList>                       // for QList
#include <QSet>                        // for QSet
#include <QString>                     // for QString

#include "gpxtypes.h"                  // for Gpx, Waypoint, Track, ...
#include "parsecontext.h"              // for ParseContext
#include "src/core/datetime.h"         // for DateTime

namespace gpxstream
{

/*
 * One consumer per GPX element type.  Every consumer starts by consuming
 * its own opening tag and returns with the cursor just past its own
 * closing tag, so they can call each other freely.  Anything the grammar
 * doesn't allow throws gpxstream::Error.
 */
class GpxReader
{
public:
  explicit GpxReader(ParseContext& context) : ctx_(context) {}

  /* Primitives */
  QString read_string(const QString& tag, bool allow_empty = false);
  DateTime read_time(const QString& tag = QStringLiteral("time"));
  Fix read_fix();
  Rect read_bounds();
  Extensions read_extensions();

  /* Compounds */
  Link read_link();
  QString read_email();
  Person read_person(const QString& tag = QStringLiteral("author"));
  Copyright read_copyright();
  // tag is one of wpt, trkpt or rtept.
  Waypoint read_waypoint(const QString& tag);

  /* Containers */
  TrackSegment read_track_segment();
  Track read_track();
  Route read_route();
  Metadata read_metadata();

  /* Root */
  Gpx read_gpx();

private:
  /* Types */

  enum class tag_type {
    unknown = 0,

    gpx,
    metadata,
    wpt,
    trk,
    rte,
    trkseg,
    trkpt,
    rtept,
    extensions,

    name,
    cmt,
    desc,
    src,
    link,
    link_text,
    type,
    number,

    ele,
    time,
    magvar,
    geoidheight,
    sym,
    fix,
    sat,
    hdop,
    vdop,
    pdop,
    ageofdgpsdata,
    dgpsid,
    course,			/* Not in GPX 1.1 */
    speed,			/* Not in GPX 1.1 */
    url,			/* Not in GPX 1.1 */
    urlname,		/* Not in GPX 1.1 */

    author,
    email,
    keywords,
    bounds,
    copyright,
    year,
    license
  };

  /* Member Functions */

  tag_type get_tag(const QString& t) const;
  bool gpx10() const
  {
    return ctx_.version() == GpxVersion::Gpx10;
  }
  bool gpx11() const
  {
    return ctx_.version() == GpxVersion::Gpx11;
  }

  template<typename Dispatch>
  void read_children(const QString& parent, Dispatch dispatch);
  template<typename T, typename Read>
  void assign_once(std::optional<T>& field, const QString& tag, const QString& parent, Read read);

  void read_empty_element_end(const QString& tag);
  std::optional<QString> read_optional_string(const QString& tag);
  double read_double(const QString& tag, const QString& parent);
  quint32 read_uint(const QString& tag, const QString& parent);

  /* Data Members */

  ParseContext& ctx_;
  // Single valued children read so far, one set per open parent.  Kept
  // apart from the values since an empty <cmt/> stores nothing.
  QList<QSet<QString>> seen_;

  // Children are dispatched on their local name.  What is allowed where
  // is up to each consumer.
  const QHash<QString, tag_type> hash = {
    {"gpx", tag_type::gpx},
    {"metadata", tag_type::metadata},
    {"wpt", tag_type::wpt},
    {"trk", tag_type::trk},
    {"rte", tag_type::rte},
    {"trkseg", tag_type::trkseg},
    {"trkpt", tag_type::trkpt},
    {"rtept", tag_type::rtept},
    {"extensions", tag_type::extensions},

    {"name", tag_type::name},
    {"cmt", tag_type::cmt},
    {"desc", tag_type::desc},
    {"src", tag_type::src},
    {"link", tag_type::link},
    {"text", tag_type::link_text},
    {"type", tag_type::type},
    {"number", tag_type::number},

    {"ele", tag_type::ele},
    {"time", tag_type::time},
    {"magvar", tag_type::magvar},
    {"geoidheight", tag_type::geoidheight},
    {"sym", tag_type::sym},
    {"fix", tag_type::fix},
    {"sat", tag_type::sat},
    {"hdop", tag_type::hdop},
    {"vdop", tag_type::vdop},
    {"pdop", tag_type::pdop},
    {"ageofdgpsdata", tag_type::ageofdgpsdata},
    {"dgpsid", tag_type::dgpsid},
    {"course", tag_type::course},
    {"speed", tag_type::speed},
    {"url", tag_type::url},
    {"urlname", tag_type::urlname},

    {"author", tag_type::author},
    {"email", tag_type::email},
    {"keywords", tag_type::keywords},
    {"bounds", tag_type::bounds},
    {"copyright", tag_type::copyright},
    {"year", tag_type::year},
    {"license", tag_type::license},
  };
};

} // namespace gpxstream

#endif // GPXREADER_H_INCLUDED_
