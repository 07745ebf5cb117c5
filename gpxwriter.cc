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

#include "gpxwriter.h"

#include <optional>                         // for optional

#include <QIODevice>                        // for QIODevice
#include <QLocale>                          // for QLocale, QLocale::FloatingPointShortest
#include <QString>                          // for QString, QStringLiteral
#include <QXmlStreamAttribute>              // for QXmlStreamAttribute

#include "defs.h"                           // for CREATOR_NAME_URL
#include "gpxtypes.h"                       // for Gpx, GpxVersion, Waypoint, ...
#include "src/core/error.h"                 // for Error
#include "src/core/logging.h"               // for gsDebug


namespace gpxstream
{

GpxWriter::GpxWriter(QIODevice* device) : writer(device)
{
}

// Shortest text that reads back as the same double.
QString GpxWriter::toString(double d)
{
  return QString::number(d, 'f', QLocale::FloatingPointShortest);
}

QString GpxWriter::toString(quint32 n)
{
  return QString::number(n);
}

QString GpxWriter::toString(quint16 n)
{
  return QString::number(n);
}

QString GpxWriter::toString(int n)
{
  return QString::number(n);
}

void GpxWriter::write_string_if_exists(const QString& tag, const std::optional<QString>& value)
{
  writer.writeOptionalTextElement(tag, value);
}

template<typename T>
void GpxWriter::write_value_if_exists(const QString& tag, const std::optional<T>& value)
{
  if (value.has_value()) {
    writer.writeTextElement(tag, toString(*value));
  }
}

void GpxWriter::write_time_if_exists(const QString& tag, const std::optional<DateTime>& time)
{
  if (time.has_value() && time->isValid()) {
    writer.writeTextElement(tag, time->toPrettyString());
  }
}

/*
 * GPX 1.0 keeps the address as text, GPX 1.1 splits it in two attributes.
 * Either way it has to be id@domain.
 */
void GpxWriter::write_email_if_exists(const std::optional<QString>& email)
{
  if (!email.has_value()) {
    return;
  }
  const QString& address = *email;
  QString id;
  QString domain;
  split_email(address, id, domain);

  if (version_ == GpxVersion::Gpx10) {
    writer.writeTextElement(QStringLiteral("email"), address);
  } else {
    writer.writeStartElement(QStringLiteral("email"));
    writer.writeAttribute(QStringLiteral("id"), id);
    writer.writeAttribute(QStringLiteral("domain"), domain);
    writer.writeEndElement();
  }
}

void GpxWriter::write_link(const Link& link)
{
  writer.writeStartElement(QStringLiteral("link"));
  writer.writeAttribute(QStringLiteral("href"), link.href);
  writer.writeOptionalTextElement(QStringLiteral("text"), link.text);
  writer.writeOptionalTextElement(QStringLiteral("type"), link.type);
  writer.writeEndElement();
}

// GPX 1.0 has room for a single url.
void GpxWriter::write_links(const QList<Link>& links)
{
  if (version_ == GpxVersion::Gpx11) {
    for (const auto& link : links) {
      write_link(link);
    }
  } else if (!links.isEmpty()) {
    const Link& link = links.first();
    writer.writeOptionalTextElement(QStringLiteral("url"), link.href);
    writer.writeOptionalTextElement(QStringLiteral("urlname"), link.text);
  }
}

void GpxWriter::write_person(const QString& tag, const Person& person)
{
  writer.writeStartElement(tag);
  write_string_if_exists(QStringLiteral("name"), person.name);
  write_email_if_exists(person.email);
  if (person.link) {
    write_link(*person.link);
  }
  writer.writeEndElement();
}

void GpxWriter::write_copyright(const Copyright& copyright)
{
  writer.writeStartElement(QStringLiteral("copyright"));
  if (copyright.author) {
    writer.writeAttribute(QStringLiteral("author"), *copyright.author);
  }
  write_value_if_exists(QStringLiteral("year"), copyright.year);
  write_string_if_exists(QStringLiteral("license"), copyright.license);
  writer.writeEndElement();
}

void GpxWriter::write_bounds(const Rect& bounds)
{
  writer.writeStartElement(QStringLiteral("bounds"));
  writer.writeAttribute(QStringLiteral("minlat"), toString(bounds.min_lat()));
  writer.writeAttribute(QStringLiteral("minlon"), toString(bounds.min_lon()));
  writer.writeAttribute(QStringLiteral("maxlat"), toString(bounds.max_lat()));
  writer.writeAttribute(QStringLiteral("maxlon"), toString(bounds.max_lon()));
  writer.writeEndElement();
}

void GpxWriter::write_extensions(const std::optional<Extensions>& extensions)
{
  if (extensions) {
    writer.writeXmlTag(*extensions);
  }
}

void GpxWriter::write_metadata(const Metadata& metadata)
{
  writer.writeStartElement(QStringLiteral("metadata"));
  write_string_if_exists(QStringLiteral("name"), metadata.name);
  write_string_if_exists(QStringLiteral("desc"), metadata.description);
  if (metadata.author) {
    write_person(QStringLiteral("author"), *metadata.author);
  }
  if (metadata.copyright) {
    write_copyright(*metadata.copyright);
  }
  write_links(metadata.links);
  write_time_if_exists(QStringLiteral("time"), metadata.time);
  write_string_if_exists(QStringLiteral("keywords"), metadata.keywords);
  if (metadata.bounds) {
    write_bounds(*metadata.bounds);
  }
  write_extensions(metadata.extensions);
  writer.writeEndElement();
}

/*
 * GPX 1.0 has no <metadata>; what it can hold sits directly in <gpx>.
 * Links besides the author's, copyright and extensions are lost.
 */
void GpxWriter::write_metadata_gpx10(const Metadata& metadata)
{
  write_string_if_exists(QStringLiteral("name"), metadata.name);
  write_string_if_exists(QStringLiteral("desc"), metadata.description);
  if (metadata.author) {
    const Person& author = *metadata.author;
    write_string_if_exists(QStringLiteral("author"), author.name);
    write_email_if_exists(author.email);
    if (author.link) {
      writer.writeOptionalTextElement(QStringLiteral("url"), author.link->href);
      writer.writeOptionalTextElement(QStringLiteral("urlname"), author.link->text);
    }
  }
  if (!metadata.links.isEmpty() || metadata.copyright || metadata.extensions) {
    gsDebug(1) << "GPX 1.0 has no place for metadata links, copyright or extensions, dropping them";
  }
  write_time_if_exists(QStringLiteral("time"), metadata.time);
  write_string_if_exists(QStringLiteral("keywords"), metadata.keywords);
  if (metadata.bounds) {
    write_bounds(*metadata.bounds);
  }
}

void GpxWriter::write_waypoint(const QString& tag, const Waypoint& wpt)
{
  const bool gpx10 = version_ == GpxVersion::Gpx10;

  writer.writeStartElement(tag);
  writer.writeAttribute(QStringLiteral("lat"), toString(wpt.latitude()));
  writer.writeAttribute(QStringLiteral("lon"), toString(wpt.longitude()));

  write_value_if_exists(QStringLiteral("ele"), wpt.elevation);
  write_time_if_exists(QStringLiteral("time"), wpt.time);
  if (gpx10) {
    write_value_if_exists(QStringLiteral("course"), wpt.course);
    write_value_if_exists(QStringLiteral("speed"), wpt.speed);
  }
  write_value_if_exists(QStringLiteral("magvar"), wpt.magvar);
  write_value_if_exists(QStringLiteral("geoidheight"), wpt.geoidheight);
  write_string_if_exists(QStringLiteral("name"), wpt.name);
  write_string_if_exists(QStringLiteral("cmt"), wpt.comment);
  write_string_if_exists(QStringLiteral("desc"), wpt.description);
  write_string_if_exists(QStringLiteral("src"), wpt.source);
  write_links(wpt.links);
  write_string_if_exists(QStringLiteral("sym"), wpt.symbol);
  write_string_if_exists(QStringLiteral("type"), wpt.type);
  if (wpt.fix) {
    writer.writeOptionalTextElement(QStringLiteral("fix"), wpt.fix->toString());
  }
  write_value_if_exists(QStringLiteral("sat"), wpt.sat);
  write_value_if_exists(QStringLiteral("hdop"), wpt.hdop);
  write_value_if_exists(QStringLiteral("vdop"), wpt.vdop);
  write_value_if_exists(QStringLiteral("pdop"), wpt.pdop);
  write_value_if_exists(QStringLiteral("ageofdgpsdata"), wpt.dgps_age);
  write_value_if_exists(QStringLiteral("dgpsid"), wpt.dgpsid);
  write_extensions(wpt.extensions);
  writer.writeEndElement();
}

void GpxWriter::write_track_segment(const TrackSegment& segment)
{
  writer.writeStartElement(QStringLiteral("trkseg"));
  for (const auto& point : segment.points) {
    write_waypoint(QStringLiteral("trkpt"), point);
  }
  write_extensions(segment.extensions);
  writer.writeEndElement();
}

void GpxWriter::write_track(const Track& track)
{
  writer.writeStartElement(QStringLiteral("trk"));
  write_string_if_exists(QStringLiteral("name"), track.name);
  write_string_if_exists(QStringLiteral("cmt"), track.comment);
  write_string_if_exists(QStringLiteral("desc"), track.description);
  write_string_if_exists(QStringLiteral("src"), track.source);
  write_links(track.links);
  write_value_if_exists(QStringLiteral("number"), track.number);
  if (version_ == GpxVersion::Gpx11) {
    write_string_if_exists(QStringLiteral("type"), track.type);
  }
  write_extensions(track.extensions);
  for (const auto& segment : track.segments) {
    write_track_segment(segment);
  }
  writer.writeEndElement();
}

void GpxWriter::write_route(const Route& route)
{
  writer.writeStartElement(QStringLiteral("rte"));
  write_string_if_exists(QStringLiteral("name"), route.name);
  write_string_if_exists(QStringLiteral("cmt"), route.comment);
  write_string_if_exists(QStringLiteral("desc"), route.description);
  write_string_if_exists(QStringLiteral("src"), route.source);
  write_links(route.links);
  write_value_if_exists(QStringLiteral("number"), route.number);
  if (version_ == GpxVersion::Gpx11) {
    write_string_if_exists(QStringLiteral("type"), route.type);
  }
  write_extensions(route.extensions);
  for (const auto& point : route.points) {
    write_waypoint(QStringLiteral("rtept"), point);
  }
  writer.writeEndElement();
}

void GpxWriter::write(const Gpx& gpx)
{
  if (gpx.version == GpxVersion::Unknown) {
    throw Error::unknownVersion(version_to_string(gpx.version));
  }
  version_ = gpx.version;
  gsDebug(2) << "Writing" << version_;

  writer.setAutoFormatting(true);
  writer.setAutoFormattingIndent(2);
  writer.writeStartDocument();

  writer.writeStartElement(QStringLiteral("gpx"));
  writer.writeAttribute(QStringLiteral("version"), version_to_string(version_));
  writer.writeAttribute(QStringLiteral("creator"), gpx.creator.value_or(QStringLiteral(CREATOR_NAME_URL)));
  writer.writeAttribute(QStringLiteral("xmlns"),
                        (version_ == GpxVersion::Gpx10) ?
                        QStringLiteral("http://www.topografix.com/GPX/1/0") :
                        QStringLiteral("http://www.topografix.com/GPX/1/1"));
  for (const auto& ns : gpx.namespaces) {
    writer.writeAttribute(ns.qualifiedName().toString(), ns.value().toString());
  }

  if (gpx.metadata) {
    if (version_ == GpxVersion::Gpx10) {
      write_metadata_gpx10(*gpx.metadata);
    } else {
      write_metadata(*gpx.metadata);
    }
  }
  for (const auto& wpt : gpx.waypoints) {
    write_waypoint(QStringLiteral("wpt"), wpt);
  }
  for (const auto& route : gpx.routes) {
    write_route(route);
  }
  for (const auto& track : gpx.tracks) {
    write_track(track);
  }
  write_extensions(gpx.extensions);

  writer.writeEndElement();
  writer.writeEndDocument();

  if (writer.hasError()) {
    QIODevice* device = writer.device();
    throw Error::io(device != nullptr ? device->errorString() : QStringLiteral("no device"));
  }
}

} // namespace gpxstream
