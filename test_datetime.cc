#include "test_datetime.h"

#include <optional>                 // for optional

#include <QDate>                    // for QDate
#include <QDateTime>                // for QDateTime
#include <QString>                  // for QString, QStringLiteral
#include <QTime>                    // for QTime
#include <QTimeZone>                // for QTimeZone
#include <QtTest>                   // for QVERIFY, QCOMPARE, QTEST_MAIN

#include "src/core/datetime.h"      // for DateTime

using gpxstream::DateTime;

namespace
{

QDateTime utc(int y, int mo, int d, int h, int mi, int s, int ms = 0)
{
  return QDateTime(QDate(y, mo, d), QTime(h, mi, s, ms), QTimeZone::utc());
}

} // namespace

void DateTimeTest::test_utc()
{
  std::optional<DateTime> dt = DateTime::fromXmlTime(u"2009-10-17T18:37:26Z");
  QVERIFY(dt.has_value());
  QCOMPARE(QDateTime(*dt), utc(2009, 10, 17, 18, 37, 26));
  QVERIFY(dt->timeSpec() == Qt::UTC);

  dt = DateTime::fromXmlTime(u"  2009-10-17t18:37:26z\n");
  QVERIFY(dt.has_value());
  QCOMPARE(QDateTime(*dt), utc(2009, 10, 17, 18, 37, 26));
}

void DateTimeTest::test_offsets()
{
  QCOMPARE(QDateTime(*DateTime::fromXmlTime(u"2001-10-26T21:32:52+02:00")), utc(2001, 10, 26, 19, 32, 52));
  QCOMPARE(QDateTime(*DateTime::fromXmlTime(u"2001-10-26T19:32:52+00:00")), utc(2001, 10, 26, 19, 32, 52));
  QCOMPARE(QDateTime(*DateTime::fromXmlTime(u"2001-10-26T14:02:52-05:30")), utc(2001, 10, 26, 19, 32, 52));
  QCOMPARE(QDateTime(*DateTime::fromXmlTime(u"2001-10-26T21:32:52+0200")), utc(2001, 10, 26, 19, 32, 52));
  QCOMPARE(QDateTime(*DateTime::fromXmlTime(u"2001-10-26T21:32:52+02")), utc(2001, 10, 26, 19, 32, 52));
  // Across midnight and the year.
  QCOMPARE(QDateTime(*DateTime::fromXmlTime(u"2015-01-01T08:00:00+10:00")), utc(2014, 12, 31, 22, 0, 0));
}

void DateTimeTest::test_no_offset()
{
  std::optional<DateTime> dt = DateTime::fromXmlTime(u"2001-10-26T19:32:52");
  QVERIFY(dt.has_value());
  QCOMPARE(QDateTime(*dt), utc(2001, 10, 26, 19, 32, 52));
}

void DateTimeTest::test_fraction()
{
  QCOMPARE(QDateTime(*DateTime::fromXmlTime(u"2015-04-27T23:09:17.123Z")), utc(2015, 4, 27, 23, 9, 17, 123));
  QCOMPARE(QDateTime(*DateTime::fromXmlTime(u"2015-04-27T23:09:17.5Z")), utc(2015, 4, 27, 23, 9, 17, 500));
  QCOMPARE(QDateTime(*DateTime::fromXmlTime(u"2015-04-27T23:09:17,25Z")), utc(2015, 4, 27, 23, 9, 17, 250));
  // Rounded to milliseconds.
  QCOMPARE(QDateTime(*DateTime::fromXmlTime(u"2015-04-27T23:09:17.1236Z")), utc(2015, 4, 27, 23, 9, 17, 124));
  QCOMPARE(QDateTime(*DateTime::fromXmlTime(u"2015-04-27T23:59:59.9999Z")), utc(2015, 4, 28, 0, 0, 0));
}

void DateTimeTest::test_invalid()
{
  QVERIFY(!DateTime::fromXmlTime(u""));
  QVERIFY(!DateTime::fromXmlTime(u"yesterday"));
  QVERIFY(!DateTime::fromXmlTime(u"2001-10-26"));
  QVERIFY(!DateTime::fromXmlTime(u"2001-10-26 19:32:52Z"));
  QVERIFY(!DateTime::fromXmlTime(u"2001-13-26T19:32:52Z"));
  QVERIFY(!DateTime::fromXmlTime(u"2001-02-30T19:32:52Z"));
  QVERIFY(!DateTime::fromXmlTime(u"2001-10-26T25:32:52Z"));
  QVERIFY(!DateTime::fromXmlTime(u"2001-10-26T19:32:52+24:00"));
  QVERIFY(!DateTime::fromXmlTime(u"2001-10-26T19:32:52+02:60"));
  QVERIFY(!DateTime::fromXmlTime(u"2001-10-26T19:32:52Zjunk"));
}

void DateTimeTest::test_pretty_string()
{
  QCOMPARE(DateTime(QDate(2001, 10, 26), QTime(19, 32, 52)).toPrettyString(),
           QStringLiteral("2001-10-26T19:32:52Z"));
  QCOMPARE(DateTime(QDate(2015, 4, 27), QTime(23, 9, 17, 123)).toPrettyString(),
           QStringLiteral("2015-04-27T23:09:17.123Z"));
  QCOMPARE(DateTime(QDate(2015, 4, 27), QTime(1, 0, 5, 500)).toPrettyString(),
           QStringLiteral("2015-04-27T01:00:05.500Z"));

  // Not UTC going in, UTC coming out.
  DateTime local(QDateTime(QDate(2001, 10, 26), QTime(21, 32, 52), QTimeZone(7200)));
  QCOMPARE(local.toPrettyString(), QStringLiteral("2001-10-26T19:32:52Z"));

  QCOMPARE(DateTime::fromXmlTime(u"2001-10-26T21:32:52+02:00")->toPrettyString(),
           QStringLiteral("2001-10-26T19:32:52Z"));
}

QTEST_MAIN(DateTimeTest)
