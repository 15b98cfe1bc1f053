#include "test_track_codec.h"

#include <cstring>              // for memcmp

#include <QByteArray>           // for QByteArray
#include <QtTest>               // for QCOMPARE, QVERIFY, QVERIFY_THROWS_EXCEPTION, QTEST_GUILESS_MAIN

#include "errors.h"             // for CorruptBlobError
#include "track_codec.h"        // for TrackCodec

using ridelog::ActivityTrack;
using ridelog::Sample;
using ridelog::TrackCodec;

ActivityTrack TrackCodecTest::sample_track()
{
  ridelog::TrackBuilder builder(QStringLiteral("FIT 2.0 profile 21.94"));
  builder.set_device(1, 2713);
  builder.set_time_created(1631065600000LL);
  for (int i = 0; i < 50; ++i) {
    Sample s;
    s.timestamp = 1631065600000LL + i * 1000;
    if (i % 7 != 3) {
      s.latitude = 45.0 + 0.0001 * i;
      s.longitude = -122.5 - 0.0001 * i;
    }
    s.altitude = 100.0 + 0.1 * i;
    s.distance = 4.9 * i;
    if (i % 5 != 0) {
      s.speed = 4.9;
      s.power = 180 + i;
      s.cadence = 88;
    }
    s.heart_rate = 120 + i % 30;
    if (i == 10) {
      s.extra.insert(13, QByteArray(1, 21));
      s.extra.insert(Sample::kDeveloperKey | 7, QByteArray("\x00\x01\xff", 3));
    }
    builder.add_sample(s);
  }
  builder.add_warning(QStringLiteral("File CRC mismatch."));
  return builder.build();
}

void TrackCodecTest::roundTrip()
{
  ActivityTrack track = sample_track();
  ActivityTrack restored = TrackCodec::decode(TrackCodec::encode(track));
  QVERIFY(restored == track);
  QCOMPARE(restored.size(), 50);
  QCOMPARE(restored.source_format(), track.source_format());
  QCOMPARE(restored.warnings(), track.warnings());
  QCOMPARE(restored.at(10).extra, track.at(10).extra);
}

void TrackCodecTest::roundTripIsBitExact()
{
  ridelog::TrackBuilder builder;
  Sample s;
  s.timestamp = -1;
  s.latitude = 0.1 + 0.2;
  s.longitude = -0.0;
  s.altitude = 1e-300;
  s.speed = 123456789.123456789;
  builder.add_sample(s);

  ActivityTrack restored = TrackCodec::decode(TrackCodec::encode(builder.build()));
  QCOMPARE(restored.size(), 1);
  const Sample& r = restored.at(0);
  QCOMPARE(r.timestamp, qint64(-1));
  QVERIFY(std::memcmp(&*r.latitude, &*s.latitude, sizeof(double)) == 0);
  QVERIFY(std::memcmp(&*r.longitude, &*s.longitude, sizeof(double)) == 0);
  QVERIFY(std::memcmp(&*r.altitude, &*s.altitude, sizeof(double)) == 0);
  QVERIFY(std::memcmp(&*r.speed, &*s.speed, sizeof(double)) == 0);
  QVERIFY(!r.distance.has_value());
  QVERIFY(!r.power.has_value());
}

void TrackCodecTest::emptyTrackRoundTrip()
{
  ActivityTrack empty;
  ActivityTrack restored = TrackCodec::decode(TrackCodec::encode(empty));
  QVERIFY(restored == empty);
  QVERIFY(restored.isEmpty());
  QVERIFY(!restored.manufacturer().has_value());
}

void TrackCodecTest::headerLayout()
{
  QByteArray blob = TrackCodec::encode(sample_track());
  QVERIFY(blob.size() > TrackCodec::kHeaderLen);
  QVERIFY(blob.startsWith("RLTK"));
  QCOMPARE(static_cast<uint8_t>(blob.at(4)), uint8_t(0));
  QCOMPARE(static_cast<uint8_t>(blob.at(5)), uint8_t(TrackCodec::kVersion));
  QByteArray compressed = blob.mid(TrackCodec::kHeaderLen);
  quint16 crc = (static_cast<uint8_t>(blob.at(6)) << 8) | static_cast<uint8_t>(blob.at(7));
  QCOMPARE(crc, qChecksum(compressed));
}

void TrackCodecTest::shortBlobRejected()
{
  QVERIFY_THROWS_EXCEPTION(ridelog::CorruptBlobError, TrackCodec::decode(QByteArray()));
  QVERIFY_THROWS_EXCEPTION(ridelog::CorruptBlobError, TrackCodec::decode(QByteArray("RLTK\x00\x01", 6)));
}

void TrackCodecTest::badMagicRejected()
{
  QByteArray blob = TrackCodec::encode(sample_track());
  blob[0] = 'X';
  QVERIFY_THROWS_EXCEPTION(ridelog::CorruptBlobError, TrackCodec::decode(blob));
}

void TrackCodecTest::unknownVersionRejected()
{
  QByteArray blob = TrackCodec::encode(sample_track());
  blob[5] = static_cast<char>(TrackCodec::kVersion + 1);
  QVERIFY_THROWS_EXCEPTION(ridelog::CorruptBlobError, TrackCodec::decode(blob));
}

void TrackCodecTest::checksumMismatchRejected()
{
  QByteArray blob = TrackCodec::encode(sample_track());
  int last = blob.size() - 1;
  blob[last] = static_cast<char>(blob.at(last) ^ 0x55);
  QVERIFY_THROWS_EXCEPTION(ridelog::CorruptBlobError, TrackCodec::decode(blob));
}

void TrackCodecTest::lengthMismatchRejected()
{
  QByteArray blob = TrackCodec::encode(sample_track());
  blob[11] = static_cast<char>(blob.at(11) + 1);
  QVERIFY_THROWS_EXCEPTION(ridelog::CorruptBlobError, TrackCodec::decode(blob));
}

void TrackCodecTest::truncatedBlobRejected()
{
  QByteArray blob = TrackCodec::encode(sample_track());
  blob.chop(8);
  QVERIFY_THROWS_EXCEPTION(ridelog::CorruptBlobError, TrackCodec::decode(blob));
}

QTEST_GUILESS_MAIN(TrackCodecTest)
