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

#include "gpxreader.h"

#include <optional>                         // for optional, nullopt
#include <vector>                           // for vector

#include <QLatin1String>                    // for QLatin1String
#include <QSet>                             // for QSet
#include <QString>                          // for QString, QStringLiteral
#include <QXmlStreamAttribute>              // for QXmlStreamAttribute
#include <QXmlStreamAttributes>             // for QXmlStreamAttributes

#include "gpxtypes.h"                       // for Gpx, Waypoint, ...
#include "parsecontext.h"                   // for ParseContext
#include "src/core/datetime.h"              // for DateTime
#include "src/core/error.h"                 // for Error
#include "src/core/logging.h"               // for gsDebug
#include "src/core/xmltag.h"                // for XmlTag
#include "xmlevents.h"                      // for XmlEvent


namespace gpxstream
{

namespace
{

// GPX 1.0 writers are fond of empty elements; they mean nothing.
std::optional<QString> nonempty(const std::optional<QString>& s)
{
  if (s.has_value() && !s->isEmpty()) {
    return s;
  }
  return std::nullopt;
}

// Only addresses the writer can put back are let in.
QString checked_email(const QString& address)
{
  QString id;
  QString domain;
  split_email(address, id, domain);
  return address;
}

XmlTag make_tag(const XmlEvent& event)
{
  XmlTag tag;
  tag.tagname = event.qualifiedName;
  tag.attributes = event.attributes;
  for (const auto& ns : event.namespaceDeclarations) {
    tag.attributes.append(ns);
  }
  return tag;
}

} // namespace

GpxReader::tag_type
GpxReader::get_tag(const QString& t) const
{
  // returns default constructed value if key not found.
  return hash.value(t);
}

/*
 * Walk the children of parent, whose opening tag has already been
 * consumed, up to and including its closing tag.  dispatch is handed
 * each child element before anything of it is consumed, and returns
 * false if the child isn't allowed here.
 */
template<typename Dispatch>
void GpxReader::read_children(const QString& parent, Dispatch dispatch)
{
  seen_.append(QSet<QString>());
  for (;;) {
    const XmlEvent* event = ctx_.peek();
    if (event == nullptr) {
      throw Error::missingClosingTag(parent);
    }
    if (event->isEndElement()) {
      if (event->name != parent) {
        throw Error::invalidClosingTag(event->qualifiedName, parent);
      }
      ctx_.next();
      seen_.removeLast();
      return;
    }
    if (event->isText()) {
      ctx_.next();
      continue;
    }
    // The event goes away as soon as the child starts reading.
    const QString name = event->name;
    const QString qualifiedName = event->qualifiedName;
    if (!dispatch(get_tag(name), name)) {
      throw Error::invalidChildElement(qualifiedName, parent);
    }
  }
}

template<typename T, typename Read>
void GpxReader::assign_once(std::optional<T>& field, const QString& tag, const QString& parent, Read read)
{
  if (seen_.last().contains(tag)) {
    throw Error::tagOpenedTwice(tag, parent);
  }
  seen_.last().insert(tag);
  field = read();
}

void GpxReader::read_empty_element_end(const QString& tag)
{
  std::optional<XmlEvent> event = ctx_.next();
  if (!event) {
    throw Error::missingClosingTag(tag);
  }
  switch (event->type) {
  case XmlEvent::Type::EndElement:
    if (event->name != tag) {
      throw Error::invalidClosingTag(event->qualifiedName, tag);
    }
    return;
  case XmlEvent::Type::StartElement:
    throw Error::invalidChildElement(event->qualifiedName, tag);
  case XmlEvent::Type::Text:
    break;
  }
  throw Error::unexpectedText(event->text, tag);
}

/*
 * Primitives
 */

QString GpxReader::read_string(const QString& tag, bool allow_empty)
{
  ctx_.verify_starting_tag(tag);

  QString value;
  for (;;) {
    std::optional<XmlEvent> event = ctx_.next();
    if (!event) {
      throw Error::missingClosingTag(tag);
    }
    switch (event->type) {
    case XmlEvent::Type::StartElement:
      throw Error::invalidChildElement(event->qualifiedName, tag);
    case XmlEvent::Type::Text:
      // Entity references and CDATA sections arrive as separate pieces.
      value += event->text;
      break;
    case XmlEvent::Type::EndElement:
      if (event->name != tag) {
        throw Error::invalidClosingTag(event->qualifiedName, tag);
      }
      value = value.trimmed();
      if (value.isEmpty() && !allow_empty) {
        throw Error::noStringContent(tag);
      }
      return value;
    }
  }
}

std::optional<QString> GpxReader::read_optional_string(const QString& tag)
{
  return nonempty(read_string(tag, true));
}

double GpxReader::read_double(const QString& tag, const QString& parent)
{
  return ParseContext::parse_double(read_string(tag), tag, parent);
}

quint32 GpxReader::read_uint(const QString& tag, const QString& parent)
{
  return ParseContext::parse_uint(read_string(tag), tag, parent);
}

DateTime GpxReader::read_time(const QString& tag)
{
  const QString text = read_string(tag);
  std::optional<DateTime> time = DateTime::fromXmlTime(text);
  if (!time) {
    throw Error::invalidTime(text);
  }
  return *time;
}

Fix GpxReader::read_fix()
{
  return Fix::fromString(read_string(QStringLiteral("fix")));
}

Rect GpxReader::read_bounds()
{
  static const QString tag = QStringLiteral("bounds");
  const QXmlStreamAttributes attrs = ctx_.verify_starting_tag(tag);

  auto coordinate = [&attrs](const QString& name)->double {
    return ParseContext::parse_double(ParseContext::required_attribute(attrs, name, tag), name, tag);
  };
  const double minlat = coordinate(QStringLiteral("minlat"));
  const double maxlat = coordinate(QStringLiteral("maxlat"));
  const double minlon = coordinate(QStringLiteral("minlon"));
  const double maxlon = coordinate(QStringLiteral("maxlon"));
  Rect bounds = Rect::create(minlat, minlon, maxlat, maxlon);

  read_empty_element_end(tag);
  return bounds;
}

/*
 * <extensions> may hold anything at all, including more <extensions>.
 * Everything is kept so it can be written back.  depth counts the open
 * <extensions> elements, open holds every element not yet closed with
 * the innermost last.
 */
Extensions GpxReader::read_extensions()
{
  static const QString tag = QStringLiteral("extensions");
  Extensions root = make_tag(ctx_.verify_starting_event(tag));

  int depth = 1;
  // Only the innermost element ever gains children, so pointers to the
  // ones below it stay valid.
  std::vector<XmlTag*> open{&root};
  while (depth > 0) {
    std::optional<XmlEvent> event = ctx_.next();
    if (!event) {
      throw Error::missingClosingTag(tag);
    }
    switch (event->type) {
    case XmlEvent::Type::StartElement: {
      if (event->name == tag) {
        ++depth;
      }
      XmlTag* parent = open.back();
      parent->children.push_back(make_tag(*event));
      open.push_back(&parent->children.back());
      break;
    }
    case XmlEvent::Type::EndElement:
      if (event->qualifiedName != open.back()->tagname) {
        throw Error::invalidClosingTag(event->qualifiedName, open.back()->tagname);
      }
      if (event->name == tag) {
        --depth;
      }
      open.pop_back();
      break;
    case XmlEvent::Type::Text: {
      XmlTag* current = open.back();
      if (current->children.empty()) {
        current->cdata += event->text.trimmed();
      } else {
        current->children.back().parentcdata += event->text.trimmed();
      }
      break;
    }
    }
  }

  gsDebug(3) << "extensions with" << root.count() - 1 << "elements";
  return root;
}

/*
 * Compounds
 */

Link GpxReader::read_link()
{
  static const QString tag = QStringLiteral("link");
  const QXmlStreamAttributes attrs = ctx_.verify_starting_tag(tag);
  Link link(ParseContext::required_attribute(attrs, QStringLiteral("href"), tag));

  read_children(tag, [&](tag_type type, const QString& name) {
    switch (type) {
    case tag_type::link_text:
      assign_once(link.text, name, tag, [&] { return read_string(name); });
      return true;
    case tag_type::type:
      assign_once(link.type, name, tag, [&] { return read_string(name); });
      return true;
    default:
      return false;
    }
  });
  return link;
}

// GPX 1.1 splits the address into two attributes and has no content.
QString GpxReader::read_email()
{
  static const QString tag = QStringLiteral("email");
  const QXmlStreamAttributes attrs = ctx_.verify_starting_tag(tag);
  const QString id = ParseContext::required_attribute(attrs, QStringLiteral("id"), tag);
  const QString domain = ParseContext::required_attribute(attrs, QStringLiteral("domain"), tag);
  read_empty_element_end(tag);
  return checked_email(id + '@' + domain);
}

Person GpxReader::read_person(const QString& tag)
{
  ctx_.verify_starting_tag(tag);
  Person person;

  read_children(tag, [&](tag_type type, const QString& name) {
    switch (type) {
    case tag_type::name:
      assign_once(person.name, name, tag, [&] { return read_string(name); });
      return true;
    case tag_type::email:
      assign_once(person.email, name, tag, [&] { return read_email(); });
      return true;
    case tag_type::link:
      assign_once(person.link, name, tag, [&] { return read_link(); });
      return true;
    default:
      return false;
    }
  });
  return person;
}

Copyright GpxReader::read_copyright()
{
  static const QString tag = QStringLiteral("copyright");
  const QXmlStreamAttributes attrs = ctx_.verify_starting_tag(tag);
  Copyright copyright;
  copyright.author = ParseContext::attribute_value(attrs, QStringLiteral("author"));

  read_children(tag, [&](tag_type type, const QString& name) {
    switch (type) {
    case tag_type::year:
      assign_once(copyright.year, name, tag, [&] {
        const int year = ParseContext::parse_int(read_string(name), name, tag);
        if (year < 0 || year > 9999) {
          throw Error::outOfBounds(name, QStringLiteral("%1 is not in [0, 9999]").arg(year));
        }
        return year;
      });
      return true;
    case tag_type::license:
      assign_once(copyright.license, name, tag, [&] { return read_string(name); });
      return true;
    default:
      return false;
    }
  });
  return copyright;
}

Waypoint GpxReader::read_waypoint(const QString& tag)
{
  const QXmlStreamAttributes attrs = ctx_.verify_starting_tag(tag);
  const double lat = ParseContext::parse_double(
                       ParseContext::required_attribute(attrs, QStringLiteral("lat"), tag), QStringLiteral("lat"), tag);
  const double lon = ParseContext::parse_double(
                       ParseContext::required_attribute(attrs, QStringLiteral("lon"), tag), QStringLiteral("lon"), tag);
  Waypoint wpt(lat, lon);

  // GPX 1.0 has a single url/urlname pair where 1.1 has links.
  std::optional<QString> url;
  std::optional<QString> urlname;

  read_children(tag, [&](tag_type type, const QString& name) {
    switch (type) {
    case tag_type::ele:
      assign_once(wpt.elevation, name, tag, [&] { return read_double(name, tag); });
      return true;
    case tag_type::time:
      assign_once(wpt.time, name, tag, [&] { return read_time(name); });
      return true;
    case tag_type::magvar:
      assign_once(wpt.magvar, name, tag, [&] { return read_double(name, tag); });
      return true;
    case tag_type::geoidheight:
      assign_once(wpt.geoidheight, name, tag, [&] { return read_double(name, tag); });
      return true;
    case tag_type::name:
      assign_once(wpt.name, name, tag, [&] { return read_string(name); });
      return true;
    case tag_type::cmt:
      assign_once(wpt.comment, name, tag, [&] { return read_optional_string(name); });
      return true;
    case tag_type::desc:
      assign_once(wpt.description, name, tag, [&] { return read_optional_string(name); });
      return true;
    case tag_type::src:
      assign_once(wpt.source, name, tag, [&] { return read_optional_string(name); });
      return true;
    case tag_type::link:
      if (!gpx11()) {
        return false;
      }
      wpt.links.append(read_link());
      return true;
    case tag_type::sym:
      assign_once(wpt.symbol, name, tag, [&] { return read_string(name); });
      return true;
    case tag_type::type:
      assign_once(wpt.type, name, tag, [&] { return read_string(name); });
      return true;
    case tag_type::fix:
      assign_once(wpt.fix, name, tag, [&] { return read_fix(); });
      return true;
    case tag_type::sat:
      assign_once(wpt.sat, name, tag, [&] { return read_uint(name, tag); });
      return true;
    case tag_type::hdop:
      assign_once(wpt.hdop, name, tag, [&] { return read_double(name, tag); });
      return true;
    case tag_type::vdop:
      assign_once(wpt.vdop, name, tag, [&] { return read_double(name, tag); });
      return true;
    case tag_type::pdop:
      assign_once(wpt.pdop, name, tag, [&] { return read_double(name, tag); });
      return true;
    case tag_type::ageofdgpsdata:
      assign_once(wpt.dgps_age, name, tag, [&] { return read_double(name, tag); });
      return true;
    case tag_type::dgpsid:
      assign_once(wpt.dgpsid, name, tag, [&] {
        const quint32 id = read_uint(name, tag);
        if (id > 1023) {
          throw Error::outOfBounds(name, QStringLiteral("%1 is not in [0, 1023]").arg(id));
        }
        return static_cast<quint16>(id);
      });
      return true;
    case tag_type::extensions:
      assign_once(wpt.extensions, name, tag, [&] { return read_extensions(); });
      return true;
    case tag_type::course:
      if (!gpx10()) {
        return false;
      }
      assign_once(wpt.course, name, tag, [&] { return read_double(name, tag); });
      return true;
    case tag_type::speed:
      if (!gpx10()) {
        return false;
      }
      assign_once(wpt.speed, name, tag, [&] { return read_double(name, tag); });
      return true;
    case tag_type::url:
      if (!gpx10()) {
        return false;
      }
      assign_once(url, name, tag, [&] { return read_string(name, true); });
      return true;
    case tag_type::urlname:
      if (!gpx10()) {
        return false;
      }
      assign_once(urlname, name, tag, [&] { return read_string(name, true); });
      return true;
    default:
      return false;
    }
  });

  if (nonempty(url)) {
    Link link(*url);
    link.text = nonempty(urlname);
    wpt.links.append(link);
  }

  gsDebug(3) << wpt;
  return wpt;
}

/*
 * Containers
 */

TrackSegment GpxReader::read_track_segment()
{
  static const QString tag = QStringLiteral("trkseg");
  ctx_.verify_starting_tag(tag);
  TrackSegment segment;

  read_children(tag, [&](tag_type type, const QString& name) {
    switch (type) {
    case tag_type::trkpt:
      segment.points.append(read_waypoint(name));
      return true;
    case tag_type::extensions:
      assign_once(segment.extensions, name, tag, [&] { return read_extensions(); });
      return true;
    default:
      return false;
    }
  });
  return segment;
}

Track GpxReader::read_track()
{
  static const QString tag = QStringLiteral("trk");
  ctx_.verify_starting_tag(tag);
  Track track;
  std::optional<QString> url;
  std::optional<QString> urlname;

  read_children(tag, [&](tag_type type, const QString& name) {
    switch (type) {
    case tag_type::name:
      assign_once(track.name, name, tag, [&] { return read_string(name); });
      return true;
    case tag_type::cmt:
      assign_once(track.comment, name, tag, [&] { return read_optional_string(name); });
      return true;
    case tag_type::desc:
      assign_once(track.description, name, tag, [&] { return read_optional_string(name); });
      return true;
    case tag_type::src:
      assign_once(track.source, name, tag, [&] { return read_optional_string(name); });
      return true;
    case tag_type::number:
      assign_once(track.number, name, tag, [&] { return read_uint(name, tag); });
      return true;
    case tag_type::trkseg:
      track.segments.append(read_track_segment());
      return true;
    case tag_type::extensions:
      assign_once(track.extensions, name, tag, [&] { return read_extensions(); });
      return true;
    case tag_type::link:
      if (!gpx11()) {
        return false;
      }
      track.links.append(read_link());
      return true;
    case tag_type::type:
      if (!gpx11()) {
        return false;
      }
      assign_once(track.type, name, tag, [&] { return read_string(name); });
      return true;
    case tag_type::url:
      if (!gpx10()) {
        return false;
      }
      assign_once(url, name, tag, [&] { return read_string(name, true); });
      return true;
    case tag_type::urlname:
      if (!gpx10()) {
        return false;
      }
      assign_once(urlname, name, tag, [&] { return read_string(name, true); });
      return true;
    default:
      return false;
    }
  });

  if (nonempty(url)) {
    Link link(*url);
    link.text = nonempty(urlname);
    track.links.append(link);
  }

  gsDebug(2) << "track" << track.name.value_or(QString()) << "with"
             << track.segments.size() << "segments";
  return track;
}

Route GpxReader::read_route()
{
  static const QString tag = QStringLiteral("rte");
  ctx_.verify_starting_tag(tag);
  Route route;
  std::optional<QString> url;
  std::optional<QString> urlname;

  read_children(tag, [&](tag_type type, const QString& name) {
    switch (type) {
    case tag_type::name:
      assign_once(route.name, name, tag, [&] { return read_string(name); });
      return true;
    case tag_type::cmt:
      assign_once(route.comment, name, tag, [&] { return read_optional_string(name); });
      return true;
    case tag_type::desc:
      assign_once(route.description, name, tag, [&] { return read_optional_string(name); });
      return true;
    case tag_type::src:
      assign_once(route.source, name, tag, [&] { return read_optional_string(name); });
      return true;
    case tag_type::number:
      assign_once(route.number, name, tag, [&] { return read_uint(name, tag); });
      return true;
    case tag_type::rtept:
      route.points.append(read_waypoint(name));
      return true;
    case tag_type::extensions:
      assign_once(route.extensions, name, tag, [&] { return read_extensions(); });
      return true;
    case tag_type::link:
      if (!gpx11()) {
        return false;
      }
      route.links.append(read_link());
      return true;
    case tag_type::type:
      if (!gpx11()) {
        return false;
      }
      assign_once(route.type, name, tag, [&] { return read_string(name); });
      return true;
    case tag_type::url:
      if (!gpx10()) {
        return false;
      }
      assign_once(url, name, tag, [&] { return read_string(name, true); });
      return true;
    case tag_type::urlname:
      if (!gpx10()) {
        return false;
      }
      assign_once(urlname, name, tag, [&] { return read_string(name, true); });
      return true;
    default:
      return false;
    }
  });

  if (nonempty(url)) {
    Link link(*url);
    link.text = nonempty(urlname);
    route.links.append(link);
  }

  gsDebug(2) << "route" << route.name.value_or(QString()) << "with"
             << route.points.size() << "points";
  return route;
}

// GPX 1.1 only.  For GPX 1.0 see read_gpx.
Metadata GpxReader::read_metadata()
{
  static const QString tag = QStringLiteral("metadata");
  ctx_.verify_starting_tag(tag);
  Metadata metadata;

  read_children(tag, [&](tag_type type, const QString& name) {
    switch (type) {
    case tag_type::name:
      assign_once(metadata.name, name, tag, [&] { return read_string(name); });
      return true;
    case tag_type::desc:
      assign_once(metadata.description, name, tag, [&] { return read_optional_string(name); });
      return true;
    case tag_type::author:
      assign_once(metadata.author, name, tag, [&] { return read_person(name); });
      return true;
    case tag_type::copyright:
      assign_once(metadata.copyright, name, tag, [&] { return read_copyright(); });
      return true;
    case tag_type::link:
      metadata.links.append(read_link());
      return true;
    case tag_type::time:
      assign_once(metadata.time, name, tag, [&] { return read_time(name); });
      return true;
    case tag_type::keywords:
      assign_once(metadata.keywords, name, tag, [&] { return read_optional_string(name); });
      return true;
    case tag_type::bounds:
      assign_once(metadata.bounds, name, tag, [&] { return read_bounds(); });
      return true;
    case tag_type::extensions:
      assign_once(metadata.extensions, name, tag, [&] { return read_extensions(); });
      return true;
    default:
      return false;
    }
  });
  return metadata;
}

/*
 * Root
 */

Gpx GpxReader::read_gpx()
{
  static const QString tag = QStringLiteral("gpx");
  const XmlEvent start = ctx_.verify_starting_event(tag);
  Gpx gpx;

  const QString version = ParseContext::required_attribute(start.attributes, QStringLiteral("version"), tag);
  gpx.version = version_from_string(version);
  if (gpx.version == GpxVersion::Unknown) {
    throw Error::unknownVersion(version);
  }
  // Every version dependent decision below is made on this.
  ctx_.set_version(gpx.version);
  gsDebug(2) << "Reading" << gpx.version;

  gpx.creator = ParseContext::attribute_value(start.attributes, QStringLiteral("creator"));
  for (const auto& ns : start.namespaceDeclarations) {
    if (ns.qualifiedName().startsWith(QLatin1String("xmlns:"))) {
      gpx.namespaces.append(ns);
    }
  }

  // The GPX 1.0 flavor of <metadata>, strewn about <gpx>.
  std::optional<QString> name;
  std::optional<QString> desc;
  std::optional<QString> author;
  std::optional<QString> email;
  std::optional<QString> url;
  std::optional<QString> urlname;
  std::optional<QString> keywords;
  std::optional<DateTime> time;
  std::optional<Rect> bounds;

  read_children(tag, [&](tag_type type, const QString& child) {
    switch (type) {
    case tag_type::wpt:
      gpx.waypoints.append(read_waypoint(child));
      return true;
    case tag_type::trk:
      gpx.tracks.append(read_track());
      return true;
    case tag_type::rte:
      gpx.routes.append(read_route());
      return true;
    case tag_type::extensions:
      assign_once(gpx.extensions, child, tag, [&] { return read_extensions(); });
      return true;
    case tag_type::metadata:
      if (!gpx11()) {
        return false;
      }
      assign_once(gpx.metadata, child, tag, [&] { return read_metadata(); });
      return true;
    default:
      break;
    }

    if (!gpx10()) {
      return false;
    }
    switch (type) {
    case tag_type::name:
      assign_once(name, child, tag, [&] { return read_string(child, true); });
      return true;
    case tag_type::desc:
      assign_once(desc, child, tag, [&] { return read_string(child, true); });
      return true;
    case tag_type::author:
      assign_once(author, child, tag, [&] { return read_string(child, true); });
      return true;
    // Plain text in GPX 1.0.
    case tag_type::email:
      assign_once(email, child, tag, [&] {
        const QString address = read_string(child, true);
        return address.isEmpty() ? address : checked_email(address);
      });
      return true;
    case tag_type::url:
      assign_once(url, child, tag, [&] { return read_string(child, true); });
      return true;
    case tag_type::urlname:
      assign_once(urlname, child, tag, [&] { return read_string(child, true); });
      return true;
    case tag_type::keywords:
      assign_once(keywords, child, tag, [&] { return read_string(child, true); });
      return true;
    case tag_type::time:
      assign_once(time, child, tag, [&] { return read_time(child); });
      return true;
    case tag_type::bounds:
      assign_once(bounds, child, tag, [&] { return read_bounds(); });
      return true;
    default:
      return false;
    }
  });

  if (gpx10()) {
    Metadata metadata;
    metadata.name = nonempty(name);
    metadata.description = nonempty(desc);
    metadata.keywords = nonempty(keywords);
    metadata.time = time;
    metadata.bounds = bounds;

    Person person;
    person.name = nonempty(author);
    person.email = nonempty(email);
    if (nonempty(url)) {
      Link link(*url);
      link.text = nonempty(urlname);
      person.link = link;
    }
    if (!person.isEmpty()) {
      metadata.author = person;
    }

    if (!metadata.isEmpty()) {
      gpx.metadata = metadata;
    }
  }

  gsDebug(1) << "Read" << gpx.waypoints.size() << "waypoints,"
             << gpx.tracks.size() << "tracks," << gpx.routes.size() << "routes";
  return gpx;
}

} // namespace gpxstream
