#include <QObject>  // for QObject, Q_OBJECT, slots


class GpxWriterTest : public QObject
{
  Q_OBJECT

private slots:
  /* Member Functions */

  void initTestCase();

  void test_root_element();
  void test_numbers();
  void test_time_format();
  void test_speed_by_version();
  void test_waypoint_element_order();
  void test_gpx10_flattening();
  void test_gpx10_links();
  void test_email_gpx11();
  void test_invalid_email();
  void test_unknown_version();
  void test_fix_literal();
  void test_device_error();
  void test_round_trip_data();
  void test_round_trip();
  void test_write_file();
};
