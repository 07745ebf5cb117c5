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

#include "parsecontext.h"

#include <cmath>                    // for isfinite
#include <optional>                 // for optional, nullopt

#include <QString>                  // for QString
#include <QXmlStreamAttributes>     // for QXmlStreamAttributes

#include "src/core/error.h"         // for Error
#include "src/core/logging.h"       // for gsDebug, DebugIndent


namespace gpxstream
{

XmlEvent ParseContext::verify_starting_event(const QString& expected)
{
  std::optional<XmlEvent> event = next();
  if (!event) {
    throw Error::missingOpeningTag(expected);
  }

  switch (event->type) {
  case XmlEvent::Type::StartElement:
    if (event->name != expected) {
      throw Error::invalidChildElement(event->qualifiedName, expected);
    }
    gsDebug(3) << DebugIndent(depth_ - 1) << "<" << expected << ">";
    return *event;
  case XmlEvent::Type::EndElement:
    throw Error::invalidClosingTag(event->qualifiedName, expected);
  case XmlEvent::Type::Text:
    break;
  }
  throw Error::unexpectedText(event->text, expected);
}

QXmlStreamAttributes ParseContext::verify_starting_tag(const QString& expected)
{
  return verify_starting_event(expected).attributes;
}

std::optional<QString> ParseContext::attribute_value(const QXmlStreamAttributes& attrs, const QString& name)
{
  if (!attrs.hasAttribute(name)) {
    return std::nullopt;
  }
  return attrs.value(name).toString();
}

QString ParseContext::required_attribute(const QXmlStreamAttributes& attrs, const QString& name,
                                         const QString& element)
{
  std::optional<QString> value = attribute_value(attrs, name);
  if (!value) {
    throw Error::lacksAttribute(name, element);
  }
  return *value;
}

double ParseContext::parse_double(const QString& text, const QString& what, const QString& element)
{
  bool ok;
  double d = text.toDouble(&ok);
  // nan and inf convert, but are no place on Earth.
  if (!ok || !std::isfinite(d)) {
    throw Error::invalidValue(what, element, text);
  }
  return d;
}

quint32 ParseContext::parse_uint(const QString& text, const QString& what, const QString& element)
{
  bool ok;
  quint32 n = text.trimmed().toUInt(&ok);
  if (!ok) {
    throw Error::invalidValue(what, element, text);
  }
  return n;
}

int ParseContext::parse_int(const QString& text, const QString& what, const QString& element)
{
  bool ok;
  int n = text.trimmed().toInt(&ok);
  if (!ok) {
    throw Error::invalidValue(what, element, text);
  }
  return n;
}

} // namespace gpxstream
