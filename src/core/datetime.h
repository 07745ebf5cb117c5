/*
    Shim around QDateTime for the xsd:dateTime values found in GPX.

    Copyright (C) 2012, 2013 Robert Lipe, robertlipe@gpsbabel.org

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
    Foundation, Inc., 59 Temple Place - Suite 330, Boston, MA 02111 USA

 */

#ifndef DATETIME_H_INCLUDED_
#define DATETIME_H_INCLUDED_

#include <optional>

#include <QtCore/QtGlobal>
#include <QtCore/QDate>
#include <QtCore/QDateTime>
#include <QtCore/QString>
#include <QtCore/QStringView>
#include <QtCore/QTime>

namespace gpxstream
{

class DateTime : public QDateTime
{
public:
  DateTime() = default;
  DateTime(const QDate& date, const QTime& time);
  DateTime(const QDateTime& dt) : QDateTime(dt) {}

  // Parse an RFC 3339 / ISO 8601 timestamp as found in <time> elements.
  // A missing offset is taken as UTC.  Fractional seconds are rounded to
  // milliseconds.  The result is always in UTC.
  static std::optional<DateTime> fromXmlTime(QStringView text);

  // Like toString, but with subsecond time that's included only when
  // the trailing digits aren't .000.  Always UTC.
  QString toPrettyString() const
  {
    if (time().msec()) {
      return toUTC().toString(QStringLiteral("yyyy-MM-ddTHH:mm:ss.zzzZ"));
    } else {
      return toUTC().toString(QStringLiteral("yyyy-MM-ddTHH:mm:ssZ"));
    }
  }
};

} // namespace gpxstream

#endif // DATETIME_H_INCLUDED_
