/*
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

#include "src/core/datetime.h"

#include <optional>                  // for optional, nullopt

#include <QDate>                     // for QDate
#include <QDateTime>                 // for QDateTime
#include <QRegularExpression>        // for QRegularExpression
#include <QRegularExpressionMatch>   // for QRegularExpressionMatch
#include <QString>                   // for QString
#include <QStringView>               // for QStringView
#include <QTime>                     // for QTime
#include <QTimeZone>                 // for QTimeZone
#include <QtGlobal>                  // for qRound

namespace gpxstream
{

DateTime::DateTime(const QDate& date, const QTime& time) :
  QDateTime(date, time, QTimeZone::utc())
{
}

std::optional<DateTime> DateTime::fromXmlTime(QStringView text)
{
  // yyyy-mm-ddThh:mm:ss[.fff...][Z|+hh:mm|-hh:mm|+hhmm|+hh]
  static const QRegularExpression re(
    QStringLiteral(R"(^(\d{4})-(\d{2})-(\d{2})[Tt](\d{2}):(\d{2}):(\d{2})(?:[.,](\d+))?([Zz]|([+-])(\d{2})(?::?(\d{2}))?)?$)"));

  const QRegularExpressionMatch m = re.match(text.trimmed().toString());
  if (!m.hasMatch()) {
    return std::nullopt;
  }

  QDate date(m.captured(1).toInt(), m.captured(2).toInt(), m.captured(3).toInt());
  QTime time(m.captured(4).toInt(), m.captured(5).toInt(), m.captured(6).toInt());
  if (!date.isValid() || !time.isValid()) {
    return std::nullopt;
  }

  QDateTime dt(date, time, QTimeZone::utc());

  // Fractional part of time.
  if (!m.captured(7).isEmpty()) {
    const double fsec = QStringLiteral("0.%1").arg(m.captured(7)).toDouble();
    dt = dt.addMSecs(qRound(fsec * 1000.0));
  }

  // Any offsets that were stuck at the end.
  if (!m.captured(9).isEmpty()) {
    const int off_sign = (m.captured(9) == u"-") ? -1 : 1;
    const int off_hr = m.captured(10).toInt();
    const int off_min = m.captured(11).toInt();
    if (off_hr > 23 || off_min > 59) {
      return std::nullopt;
    }
    dt = dt.addSecs(-off_sign * off_hr * 3600 - off_sign * off_min * 60);
  }

  return DateTime(dt);
}

} // namespace gpxstream
