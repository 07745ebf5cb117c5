/*
    Cursor and shared state for the GPX element consumers.

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
#ifndef PARSECONTEXT_H_INCLUDED_
#define PARSECONTEXT_H_INCLUDED_

#include <optional>                    // for optional

#include <QString>                     // for QString
#include <QXmlStreamAttributes>        // for QXmlStreamAttributes
#include <QtGlobal>                    // for quint32

#include "gpxtypes.h"                  // for GpxVersion
#include "xmlevents.h"                 // for XmlEvent, XmlEventReader

namespace gpxstream
{

/*
 * The single cursor every consumer reads from, plus the schema version
 * of the document being read.  The version is set by the <gpx> consumer
 * before it reads any child and only read afterwards.
 */
class ParseContext
{
public:
  explicit ParseContext(XmlEventReader& events) : events_(events) {}

  ParseContext(const ParseContext&) = delete;
  ParseContext& operator=(const ParseContext&) = delete;

  // nullptr at the end of the stream.
  const XmlEvent* peek()
  {
    return events_.peek();
  }
  std::optional<XmlEvent> next()
  {
    std::optional<XmlEvent> event = events_.next();
    if (event) {
      if (event->isStartElement()) {
        ++depth_;
      } else if (event->isEndElement()) {
        --depth_;
      }
    }
    return event;
  }

  void verify_end_of_document()
  {
    events_.verify_end_of_document();
  }

  // Number of elements opened and not yet closed.
  int depth() const
  {
    return depth_;
  }

  GpxVersion version() const
  {
    return version_;
  }
  void set_version(GpxVersion version)
  {
    version_ = version;
  }

  // Consume the opening tag of the element named expected and return
  // its attributes.  Throws if the next event is anything else.
  QXmlStreamAttributes verify_starting_tag(const QString& expected);
  // Same, but hands back the whole event for callers that need the
  // namespace declarations or the qualified name.
  XmlEvent verify_starting_event(const QString& expected);

  static std::optional<QString> attribute_value(const QXmlStreamAttributes& attrs, const QString& name);
  static QString required_attribute(const QXmlStreamAttributes& attrs, const QString& name,
                                    const QString& element);

  static double parse_double(const QString& text, const QString& what, const QString& element);
  static quint32 parse_uint(const QString& text, const QString& what, const QString& element);
  static int parse_int(const QString& text, const QString& what, const QString& element);

private:
  XmlEventReader& events_;
  GpxVersion version_{GpxVersion::Unknown};
  int depth_{0};
};

} // namespace gpxstream

#endif // PARSECONTEXT_H_INCLUDED_
