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
#ifndef SRC_CORE_ERROR_H_
#define SRC_CORE_ERROR_H_

#include <stdexcept>          // for runtime_error

#include <QDebug>             // for QDebug
#include <QString>            // for QString

namespace gpxstream
{

enum class ErrorKind {
  Xml,                          // the tokenizer rejected the input
  InvalidChildElement,
  InvalidClosingTag,
  MissingClosingTag,
  MissingOpeningTag,
  InvalidElementLacksAttribute,
  TagOpenedTwice,
  UnexpectedText,
  InvalidValue,                 // number that doesn't parse
  InvalidTime,
  OutOfBounds,
  InvalidEmail,
  UnknownVersion,
  NoStringContent,
  Io
};

/*
 * Every failure of the reader or the writer is one of these.
 * The message always names the offending tag, attribute or value and
 * the element it was found in, so callers can print what() as is.
 */
class Error : public std::runtime_error
{
public:
  Error(ErrorKind kind, const QString& message);

  ErrorKind kind() const
  {
    return kind_;
  }
  QString message() const
  {
    return message_;
  }

  static Error xml(const QString& reason, qint64 line, qint64 column);
  static Error invalidChildElement(const QString& child, const QString& parent);
  static Error invalidClosingTag(const QString& got, const QString& parent);
  static Error missingClosingTag(const QString& parent);
  static Error missingOpeningTag(const QString& parent);
  static Error lacksAttribute(const QString& attribute, const QString& parent);
  static Error tagOpenedTwice(const QString& tag, const QString& parent);
  static Error unexpectedText(const QString& text, const QString& parent);
  static Error invalidValue(const QString& what, const QString& parent, const QString& value);
  static Error invalidTime(const QString& value);
  static Error outOfBounds(const QString& what, const QString& detail);
  static Error invalidEmail(const QString& email, const QString& reason);
  static Error unknownVersion(const QString& version);
  static Error noStringContent(const QString& tag);
  static Error io(const QString& reason);

private:
  ErrorKind kind_;
  QString message_;
};

QDebug operator<<(QDebug debug, ErrorKind kind);

} // namespace gpxstream

#endif // SRC_CORE_ERROR_H_
