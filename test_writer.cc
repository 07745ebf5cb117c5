#include "test_writer.h"

#include <optional>                 // for optional, nullopt

#include <QBuffer>                  // for QBuffer
#include <QByteArray>               // for QByteArray
#include <QDate>                    // for QDate
#include <QDebug>                   // for QDebug
#include <QFile>                    // for QFile
#include <QIODevice>                // for QIODevice::ReadOnly, QIODevice::WriteOnly
#include <QLatin1String>            // for QLatin1String
#include <QString>                  // for QString, QStringLiteral
#include <QTemporaryDir>            // for QTemporaryDir
#include <QTime>                    // for QTime
#include <QtGlobal>                 // for qEnvironmentVariableIntValue, qsizetype
#include <QtTest>                   // for QVERIFY, QCOMPARE, QFETCH, QFINDTESTDATA, QTEST_MAIN

#include "defs.h"                   // for global_opts, CREATOR_NAME_URL
#include "gpxstream.h"              // for read, read_file, write, write_file
#include "gpxtypes.h"               // for Gpx, GpxVersion, Waypoint, Fix, Link, Person
#include "gpxwriter.h"              // for GpxWriter
#include "src/core/datetime.h"      // for DateTime
#include "src/core/error.h"         // for Error, ErrorKind

using gpxstream::ErrorKind;
using gpxstream::Fix;
using gpxstream::Gpx;
using gpxstream::GpxVersion;
using gpxstream::Waypoint;

namespace
{

template<typename F>
std::optional<ErrorKind> error_kind(F f)
{
  try {
    f();
  } catch (const gpxstream::Error& e) {
    qDebug().noquote() << e.kind() << e.message();
    return e.kind();
  }
  return std::nullopt;
}

QByteArray to_bytes(const Gpx& gpx)
{
  QBuffer buffer;
  buffer.open(QIODevice::WriteOnly);
  gpxstream::write(gpx, &buffer);
  return buffer.data();
}

Gpx with_waypoint(GpxVersion version, const Waypoint& wpt)
{
  Gpx gpx;
  gpx.version = version;
  gpx.creator = QStringLiteral("test");
  gpx.waypoints.append(wpt);
  return gpx;
}

Gpx with_author_email(GpxVersion version, const QString& email)
{
  Gpx gpx;
  gpx.version = version;
  gpxstream::Person author;
  author.email = email;
  gpxstream::Metadata metadata;
  metadata.author = author;
  gpx.metadata = metadata;
  return gpx;
}

} // namespace

void GpxWriterTest::initTestCase()
{
  global_opts.debug_level = qEnvironmentVariableIntValue("GPXSTREAM_DEBUG_LEVEL");
}

void GpxWriterTest::test_root_element()
{
  Gpx gpx;
  gpx.version = GpxVersion::Gpx11;
  const QString out = QString::fromUtf8(to_bytes(gpx));

  QVERIFY(out.startsWith(QStringLiteral("<?xml version=\"1.0\" encoding=\"UTF-8\"?>")));
  QVERIFY(out.contains(QStringLiteral("version=\"1.1\"")));
  QVERIFY(out.contains(QStringLiteral("creator=\"" CREATOR_NAME_URL "\"")));
  QVERIFY(out.contains(QStringLiteral("xmlns=\"http://www.topografix.com/GPX/1/1\"")));
  QVERIFY(!out.contains(QStringLiteral("<metadata")));

  gpx.version = GpxVersion::Gpx10;
  gpx.creator = QStringLiteral("Unit & test");
  gpx.namespaces.append(QStringLiteral("xmlns:gpxx"), QStringLiteral("http://www.garmin.com/xmlschemas/GpxExtensions/v3"));
  const QString out10 = QString::fromUtf8(to_bytes(gpx));
  QVERIFY(out10.contains(QStringLiteral("version=\"1.0\"")));
  QVERIFY(out10.contains(QStringLiteral("creator=\"Unit &amp; test\"")));
  QVERIFY(out10.contains(QStringLiteral("xmlns=\"http://www.topografix.com/GPX/1/0\"")));
  QVERIFY(out10.contains(QStringLiteral("xmlns:gpxx=\"http://www.garmin.com/xmlschemas/GpxExtensions/v3\"")));
}

void GpxWriterTest::test_numbers()
{
  QCOMPARE(gpxstream::GpxWriter::toString(0.1), QStringLiteral("0.1"));
  QCOMPARE(gpxstream::GpxWriter::toString(4.0), QStringLiteral("4"));
  QCOMPARE(gpxstream::GpxWriter::toString(-122.326897), QStringLiteral("-122.326897"));
  QCOMPARE(gpxstream::GpxWriter::toString(0.0000001), QStringLiteral("0.0000001"));
  QCOMPARE(gpxstream::GpxWriter::toString(quint16(1023)), QStringLiteral("1023"));

  Waypoint wpt(47.644548, -122.326897);
  wpt.elevation = 4.46;
  const QString out = QString::fromUtf8(to_bytes(with_waypoint(GpxVersion::Gpx11, wpt)));
  QVERIFY(out.contains(QStringLiteral("<wpt lat=\"47.644548\" lon=\"-122.326897\">")));
  QVERIFY(out.contains(QStringLiteral("<ele>4.46</ele>")));
}

void GpxWriterTest::test_time_format()
{
  Waypoint wpt(0.0, 0.0);
  wpt.time = gpxstream::DateTime(QDate(2015, 4, 27), QTime(1, 0, 5, 500));
  QString out = QString::fromUtf8(to_bytes(with_waypoint(GpxVersion::Gpx11, wpt)));
  QVERIFY(out.contains(QStringLiteral("<time>2015-04-27T01:00:05.500Z</time>")));

  wpt.time = gpxstream::DateTime(QDate(2001, 10, 26), QTime(19, 32, 52));
  out = QString::fromUtf8(to_bytes(with_waypoint(GpxVersion::Gpx11, wpt)));
  QVERIFY(out.contains(QStringLiteral("<time>2001-10-26T19:32:52Z</time>")));

  // Nothing to say about an invalid time.
  wpt.time = gpxstream::DateTime();
  out = QString::fromUtf8(to_bytes(with_waypoint(GpxVersion::Gpx11, wpt)));
  QVERIFY(!out.contains(QStringLiteral("<time>")));
}

void GpxWriterTest::test_speed_by_version()
{
  Waypoint wpt(1.0, 2.0);
  wpt.speed = 2.5;
  wpt.course = 90.0;

  const QString out10 = QString::fromUtf8(to_bytes(with_waypoint(GpxVersion::Gpx10, wpt)));
  QVERIFY(out10.contains(QStringLiteral("<speed>2.5</speed>")));
  QVERIFY(out10.contains(QStringLiteral("<course>90</course>")));

  const QString out11 = QString::fromUtf8(to_bytes(with_waypoint(GpxVersion::Gpx11, wpt)));
  QVERIFY(!out11.contains(QStringLiteral("<speed>")));
  QVERIFY(!out11.contains(QStringLiteral("<course>")));
}

void GpxWriterTest::test_waypoint_element_order()
{
  Waypoint wpt(1.0, 2.0);
  wpt.elevation = 10.0;
  wpt.time = gpxstream::DateTime(QDate(2020, 1, 1), QTime(0, 0, 0));
  wpt.course = 45.0;
  wpt.speed = 3.0;
  wpt.magvar = 1.0;
  wpt.name = QStringLiteral("P");
  wpt.links.append(gpxstream::Link(QStringLiteral("http://example.com")));
  wpt.symbol = QStringLiteral("Flag");
  wpt.fix = Fix(Fix::Kind::DGPS);
  wpt.sat = 9;
  wpt.dgpsid = 12;

  const QString out = QString::fromUtf8(to_bytes(with_waypoint(GpxVersion::Gpx10, wpt)));
  const char* const order[] = {
    "<ele>", "<time>", "<course>", "<speed>", "<magvar>", "<name>", "<url>",
    "<sym>", "<fix>dgps</fix>", "<sat>", "<dgpsid>12</dgpsid>"
  };
  qsizetype last = -1;
  for (const char* element : order) {
    const qsizetype at = out.indexOf(QLatin1String(element));
    QVERIFY2(at > last, element);
    last = at;
  }
}

void GpxWriterTest::test_gpx10_flattening()
{
  Gpx gpx = gpxstream::read_file(QFINDTESTDATA("reference/gpx11-metadata.gpx"));
  gpx.version = GpxVersion::Gpx10;
  const QByteArray bytes = to_bytes(gpx);
  const QString out = QString::fromUtf8(bytes);

  QVERIFY(!out.contains(QStringLiteral("<metadata")));
  QVERIFY(out.contains(QStringLiteral("<name>Mount Hood loop</name>")));
  QVERIFY(out.contains(QStringLiteral("<author>Jane Hiker</author>")));
  QVERIFY(out.contains(QStringLiteral("<email>jane@example.com</email>")));
  QVERIFY(out.contains(QStringLiteral("<url>http://example.com/jane</url>")));
  QVERIFY(out.contains(QStringLiteral("<urlname>Jane's trail page</urlname>")));
  QVERIFY(!out.contains(QStringLiteral("<link")));

  Gpx back = gpxstream::read(bytes);
  QVERIFY(back.version == GpxVersion::Gpx10);
  QVERIFY(back.metadata == gpx.metadata);

  // Copyright has no GPX 1.0 counterpart.
  gpxstream::Copyright copyright;
  copyright.year = 2015;
  gpx.metadata->copyright = copyright;
  QVERIFY(!QString::fromUtf8(to_bytes(gpx)).contains(QStringLiteral("copyright")));
}

void GpxWriterTest::test_gpx10_links()
{
  Waypoint wpt(1.0, 2.0);
  gpxstream::Link first(QStringLiteral("http://example.com/1"));
  first.text = QStringLiteral("one");
  first.type = QStringLiteral("text/html");
  wpt.links.append(first);
  wpt.links.append(gpxstream::Link(QStringLiteral("http://example.com/2")));

  const QString out10 = QString::fromUtf8(to_bytes(with_waypoint(GpxVersion::Gpx10, wpt)));
  QVERIFY(out10.contains(QStringLiteral("<url>http://example.com/1</url>")));
  QVERIFY(out10.contains(QStringLiteral("<urlname>one</urlname>")));
  QVERIFY(!out10.contains(QStringLiteral("http://example.com/2")));
  QVERIFY(!out10.contains(QStringLiteral("text/html")));

  const QString out11 = QString::fromUtf8(to_bytes(with_waypoint(GpxVersion::Gpx11, wpt)));
  QVERIFY(out11.contains(QStringLiteral("<link href=\"http://example.com/1\">")));
  QVERIFY(out11.contains(QStringLiteral("<type>text/html</type>")));
  QVERIFY(out11.contains(QStringLiteral("<link href=\"http://example.com/2\"/>")));

  gpxstream::Track track;
  track.type = QStringLiteral("boat");
  Gpx gpx;
  gpx.version = GpxVersion::Gpx10;
  gpx.tracks.append(track);
  QVERIFY(!QString::fromUtf8(to_bytes(gpx)).contains(QStringLiteral("boat")));
  gpx.version = GpxVersion::Gpx11;
  QVERIFY(QString::fromUtf8(to_bytes(gpx)).contains(QStringLiteral("<type>boat</type>")));
}

void GpxWriterTest::test_email_gpx11()
{
  const QString out = QString::fromUtf8(to_bytes(with_author_email(GpxVersion::Gpx11, QStringLiteral("me@example.com"))));
  QVERIFY(out.contains(QStringLiteral("<email id=\"me\" domain=\"example.com\"/>")));

  const QString out10 = QString::fromUtf8(to_bytes(with_author_email(GpxVersion::Gpx10, QStringLiteral("me@example.com"))));
  QVERIFY(out10.contains(QStringLiteral("<email>me@example.com</email>")));
}

void GpxWriterTest::test_invalid_email()
{
  const char* const bad[] = {"me@example@com", "nobody", "@example.com", "me@"};
  for (const char* email : bad) {
    for (GpxVersion version : {GpxVersion::Gpx10, GpxVersion::Gpx11}) {
      Gpx gpx = with_author_email(version, QString(email));
      QVERIFY2(error_kind([&gpx] { to_bytes(gpx); }) == ErrorKind::InvalidEmail, email);
    }
  }
}

void GpxWriterTest::test_unknown_version()
{
  Gpx gpx;
  QVERIFY(gpx.version == GpxVersion::Unknown);
  QVERIFY(error_kind([&gpx] { to_bytes(gpx); }) == ErrorKind::UnknownVersion);

  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  const QString path = dir.filePath(QStringLiteral("unknown.gpx"));
  QVERIFY(error_kind([&gpx, &path] { gpxstream::write_file(gpx, path); }) == ErrorKind::UnknownVersion);
  QVERIFY(!QFile::exists(path));
}

void GpxWriterTest::test_fix_literal()
{
  Waypoint wpt(1.0, 2.0);
  wpt.fix = Fix::fromString(QStringLiteral("KF_4SV_OR_MORE"));
  const QByteArray bytes = to_bytes(with_waypoint(GpxVersion::Gpx11, wpt));
  QVERIFY(QString::fromUtf8(bytes).contains(QStringLiteral("<fix>KF_4SV_OR_MORE</fix>")));

  Gpx back = gpxstream::read(bytes);
  QVERIFY(back.waypoints.at(0).fix == wpt.fix);
  QCOMPARE(back.waypoints.at(0).fix->other(), QStringLiteral("KF_4SV_OR_MORE"));

  wpt.fix = Fix(Fix::Kind::None);
  QVERIFY(QString::fromUtf8(to_bytes(with_waypoint(GpxVersion::Gpx11, wpt))).contains(QStringLiteral("<fix>none</fix>")));
}

void GpxWriterTest::test_device_error()
{
  QBuffer buffer;
  buffer.open(QIODevice::ReadOnly);
  Gpx gpx;
  gpx.version = GpxVersion::Gpx11;
  QVERIFY(error_kind([&gpx, &buffer] { gpxstream::write(gpx, &buffer); }) == ErrorKind::Io);

  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  const QString path = dir.filePath(QStringLiteral("no/such/directory/out.gpx"));
  QVERIFY(error_kind([&gpx, &path] { gpxstream::write_file(gpx, path); }) == ErrorKind::Io);
  QVERIFY(error_kind([&path] { gpxstream::read_file(path); }) == ErrorKind::Io);
}

void GpxWriterTest::test_round_trip_data()
{
  QTest::addColumn<QString>("fixture");

  QTest::newRow("wikipedia") << QStringLiteral("reference/wikipedia.gpx");
  QTest::newRow("gpx10 metadata") << QStringLiteral("reference/gpx10-metadata.gpx");
  QTest::newRow("gpx11 metadata") << QStringLiteral("reference/gpx11-metadata.gpx");
  QTest::newRow("gpx10 full") << QStringLiteral("reference/gpx10-full.gpx");
  QTest::newRow("gpx11 full") << QStringLiteral("reference/gpx11-full.gpx");
}

void GpxWriterTest::test_round_trip()
{
  QFETCH(QString, fixture);

  const QString path = QFINDTESTDATA(fixture);
  QVERIFY(!path.isEmpty());
  Gpx gpx = gpxstream::read_file(path);

  const QByteArray first = to_bytes(gpx);
  Gpx back = gpxstream::read(first);
  QVERIFY(back.version == gpx.version);
  QVERIFY(back.metadata == gpx.metadata);
  QVERIFY(back.waypoints == gpx.waypoints);
  QVERIFY(back.routes == gpx.routes);
  QVERIFY(back.tracks == gpx.tracks);
  QVERIFY(back.extensions == gpx.extensions);
  QVERIFY(back == gpx);

  // Once written, the output is stable.
  QCOMPARE(to_bytes(back), first);
}

void GpxWriterTest::test_write_file()
{
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  const QString path = dir.filePath(QStringLiteral("out.gpx"));

  Gpx gpx = gpxstream::read_file(QFINDTESTDATA("reference/gpx11-full.gpx"));
  gpxstream::write_file(gpx, path);
  QVERIFY(gpxstream::read_file(path) == gpx);

  // Down to 1.0 and back drops what 1.0 can't hold, but nothing else.
  gpx.version = GpxVersion::Gpx10;
  gpxstream::write_file(gpx, path);
  Gpx gpx10 = gpxstream::read_file(path);
  QVERIFY(gpx10.version == GpxVersion::Gpx10);
  QCOMPARE(gpx10.waypoints.size(), gpx.waypoints.size());
  QVERIFY(gpx10.waypoints.at(0).name == gpx.waypoints.at(0).name);
  QVERIFY(gpx10.waypoints.at(0).extensions == gpx.waypoints.at(0).extensions);
  QCOMPARE(gpx10.waypoints.at(0).links.size(), qsizetype(1));
  QVERIFY(!gpx10.metadata->copyright);
  QVERIFY(!gpx10.tracks.at(0).type);
}

QTEST_MAIN(GpxWriterTest)
