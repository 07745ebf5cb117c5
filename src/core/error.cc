/*
    Copyright (C) 2024 Robert Lipe, gpsbabel.org

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

#include "src/core/error.h"

#include <QDebug>             // for QDebug, QDebugStateSaver
#include <QString>            // for QString, QStringLiteral

#include "defs.h"             // for CSTR

namespace gpxstream
{

Error::Error(ErrorKind kind, const QString& message) :
  std::runtime_error(CSTR(message)),
  kind_(kind),
  message_(message)
{
}

Error Error::xml(const QString& reason, qint64 line, qint64 column)
{
  return {ErrorKind::Xml,
          QStringLiteral("error while parsing XML: %1 (line %2, column %3)")
          .arg(reason).arg(line).arg(column)};
}

Error Error::invalidChildElement(const QString& child, const QString& parent)
{
  return {ErrorKind::InvalidChildElement,
          QStringLiteral("invalid child element '%1' in %2").arg(child, parent)};
}

Error Error::invalidClosingTag(const QString& got, const QString& parent)
{
  return {ErrorKind::InvalidClosingTag,
          QStringLiteral("invalid closing tag '%1' in %2").arg(got, parent)};
}

Error Error::missingClosingTag(const QString& parent)
{
  return {ErrorKind::MissingClosingTag,
          QStringLiteral("missing closing tag for %1").arg(parent)};
}

Error Error::missingOpeningTag(const QString& parent)
{
  return {ErrorKind::MissingOpeningTag,
          QStringLiteral("missing opening tag for %1").arg(parent)};
}

Error Error::lacksAttribute(const QString& attribute, const QString& parent)
{
  return {ErrorKind::InvalidElementLacksAttribute,
          QStringLiteral("invalid element %1, lacks required attribute %2").arg(parent, attribute)};
}

Error Error::tagOpenedTwice(const QString& tag, const QString& parent)
{
  return {ErrorKind::TagOpenedTwice,
          QStringLiteral("tag '%1' opened twice in %2").arg(tag, parent)};
}

Error Error::unexpectedText(const QString& text, const QString& parent)
{
  return {ErrorKind::UnexpectedText,
          QStringLiteral("unexpected text \"%1\" where %2 was expected").arg(text.left(40), parent)};
}

Error Error::invalidValue(const QString& what, const QString& parent, const QString& value)
{
  return {ErrorKind::InvalidValue,
          QStringLiteral("invalid value \"%1\" for %2 in %3").arg(value, what, parent)};
}

Error Error::invalidTime(const QString& value)
{
  return {ErrorKind::InvalidTime,
          QStringLiteral("invalid RFC 3339 time \"%1\"").arg(value)};
}

Error Error::outOfBounds(const QString& what, const QString& detail)
{
  return {ErrorKind::OutOfBounds,
          QStringLiteral("%1 out of bounds: %2").arg(what, detail)};
}

Error Error::invalidEmail(const QString& email, const QString& reason)
{
  return {ErrorKind::InvalidEmail,
          QStringLiteral("invalid email \"%1\": %2").arg(email, reason)};
}

Error Error::unknownVersion(const QString& version)
{
  return {ErrorKind::UnknownVersion,
          QStringLiteral("unknown gpx version \"%1\"").arg(version)};
}

Error Error::noStringContent(const QString& tag)
{
  return {ErrorKind::NoStringContent,
          QStringLiteral("no content inside string element %1").arg(tag)};
}

Error Error::io(const QString& reason)
{
  return {ErrorKind::Io, QStringLiteral("i/o error: %1").arg(reason)};
}

QDebug operator<<(QDebug debug, ErrorKind kind)
{
  QDebugStateSaver saver(debug);
  const char* name = "unknown";
  switch (kind) {
  case ErrorKind::Xml:
    name = "Xml";
    break;
  case ErrorKind::InvalidChildElement:
    name = "InvalidChildElement";
    break;
  case ErrorKind::InvalidClosingTag:
    name = "InvalidClosingTag";
    break;
  case ErrorKind::MissingClosingTag:
    name = "MissingClosingTag";
    break;
  case ErrorKind::MissingOpeningTag:
    name = "MissingOpeningTag";
    break;
  case ErrorKind::InvalidElementLacksAttribute:
    name = "InvalidElementLacksAttribute";
    break;
  case ErrorKind::TagOpenedTwice:
    name = "TagOpenedTwice";
    break;
  case ErrorKind::UnexpectedText:
    name = "UnexpectedText";
    break;
  case ErrorKind::InvalidValue:
    name = "InvalidValue";
    break;
  case ErrorKind::InvalidTime:
    name = "InvalidTime";
    break;
  case ErrorKind::OutOfBounds:
    name = "OutOfBounds";
    break;
  case ErrorKind::InvalidEmail:
    name = "InvalidEmail";
    break;
  case ErrorKind::UnknownVersion:
    name = "UnknownVersion";
    break;
  case ErrorKind::NoStringContent:
    name = "NoStringContent";
    break;
  case ErrorKind::Io:
    name = "Io";
    break;
  }
  debug.nospace() << name;
  return debug;
}

} // namespace gpxstream
