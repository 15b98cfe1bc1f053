#include "test_activity_summary.h"

#include <QtTest>               // for QCOMPARE, QVERIFY, QVERIFY_THROWS_EXCEPTION, QTEST_GUILESS_MAIN

#include "activity_summary.h"   // for summarize, cumulativeDistance, smoothAltitudes, ActivitySummary
#include "engine_config.h"      // for AnalyticsConfig
#include "errors.h"             // for EmptyTrackError

using ridelog::ActivitySummary;
using ridelog::ActivityTrack;
using ridelog::AnalyticsConfig;
using ridelog::Sample;

namespace
{

constexpr qint64 kStartMs = 1600000000000LL;

} // namespace

ActivityTrack ActivitySummaryTest::make_track(const QVector<Sample>& samples)
{
  ridelog::TrackBuilder builder(QStringLiteral("test"));
  for (const auto& s : samples) {
    builder.add_sample(s);
  }
  return builder.build();
}

ActivityTrack ActivitySummaryTest::steady_ride(int seconds, int stop_begin, int stop_end)
{
  QVector<Sample> samples;
  for (int i = 0; i <= seconds; ++i) {
    Sample s;
    s.timestamp = kStartMs + i * 1000;
    s.speed = (i >= stop_begin && i <= stop_end) ? 0.0 : 5.0;
    samples.append(s);
  }
  return make_track(samples);
}

void ActivitySummaryTest::threeSampleRide()
{
  const double distances[] = {0.0, 50.0, 120.0};
  const double altitudes[] = {100.0, 100.2, 99.9};
  QVector<Sample> samples;
  for (int i = 0; i < 3; ++i) {
    Sample s;
    s.timestamp = kStartMs + i * 10000;
    s.distance = distances[i];
    s.altitude = altitudes[i];
    samples.append(s);
  }

  ActivitySummary summary = ridelog::summarize(make_track(samples));
  QCOMPARE(summary.distance_meters, 120.0);
  QVERIFY(!summary.distance_incomplete);
  QCOMPARE(summary.elevation_gain, 0.0);
  QCOMPARE(summary.active_seconds, 20.0);
  QCOMPARE(summary.elapsed_seconds, 20.0);
  QCOMPARE(summary.start, kStartMs);
  QCOMPARE(summary.sample_count, 3);
}

void ActivitySummaryTest::summarizeIsIdempotent()
{
  ActivityTrack track = steady_ride(60, 20, 40);
  QCOMPARE(ridelog::summarize(track), ridelog::summarize(track));
}

void ActivitySummaryTest::statistics()
{
  QVector<Sample> samples(3);
  for (int i = 0; i < 3; ++i) {
    samples[i].timestamp = kStartMs + i * 1000;
    samples[i].heart_rate = 120 + 10 * i;
    samples[i].power = 200 + 100 * i;
    samples[i].speed = 4.0 + i;
  }
  samples[1].cadence = 85;

  ActivitySummary summary = ridelog::summarize(make_track(samples));
  QCOMPARE(*summary.avg_hrt, 130.0);
  QCOMPARE(*summary.max_hrt, 140);
  QCOMPARE(*summary.avg_pwr, 300.0);
  QCOMPARE(*summary.max_pwr, 400);
  QCOMPARE(*summary.avg_cad, 85.0);
  QCOMPARE(*summary.max_spd, 6.0);
  QVERIFY(!summary.max_alt.has_value());
  QVERIFY(!summary.min_alt.has_value());
}

void ActivitySummaryTest::emptyTrackThrows()
{
  QVERIFY_THROWS_EXCEPTION(ridelog::EmptyTrackError, ridelog::summarize(ActivityTrack()));
}

void ActivitySummaryTest::deviceDistanceUsed()
{
  QVector<Sample> samples(4);
  for (int i = 0; i < 4; ++i) {
    samples[i].timestamp = kStartMs + i * 1000;
    // Positions far apart must not matter when the odometer is usable.
    samples[i].latitude = 10.0 * i;
    samples[i].longitude = 0.0;
  }
  samples[0].distance = 1000.0;
  samples[2].distance = 1010.0;
  samples[3].distance = 1030.0;

  QVector<double> cumulative = ridelog::cumulativeDistance(make_track(samples));
  QCOMPARE(cumulative, QVector<double>({0.0, 0.0, 10.0, 30.0}));
  QCOMPARE(ridelog::summarize(make_track(samples)).distance_meters, 30.0);
}

void ActivitySummaryTest::decreasingDeviceDistanceFallsBack()
{
  QVector<Sample> samples(3);
  for (int i = 0; i < 3; ++i) {
    samples[i].timestamp = kStartMs + i * 1000;
    samples[i].latitude = 0.001 * i;
    samples[i].longitude = 0.0;
  }
  samples[0].distance = 500.0;
  samples[1].distance = 400.0;

  ActivitySummary summary = ridelog::summarize(make_track(samples));
  QVERIFY(summary.distance_meters > 222.0 && summary.distance_meters < 223.0);
}

void ActivitySummaryTest::positionDistanceIsMonotonic()
{
  QVector<Sample> samples(6);
  for (int i = 0; i < 6; ++i) {
    samples[i].timestamp = kStartMs + i * 1000;
    if (i != 3) {
      samples[i].latitude = 0.001 * ((i % 2 == 0) ? i : -i);
      samples[i].longitude = 0.001 * i;
    }
  }

  ActivityTrack track = make_track(samples);
  QVector<double> cumulative = ridelog::cumulativeDistance(track);
  QCOMPARE(cumulative.size(), qsizetype(6));
  QCOMPARE(cumulative.first(), 0.0);
  for (int i = 1; i < cumulative.size(); ++i) {
    QVERIFY(cumulative.at(i) >= cumulative.at(i - 1));
  }
  QCOMPARE(cumulative.at(3), cumulative.at(2));

  ActivitySummary summary = ridelog::summarize(track);
  QVERIFY(summary.distance_incomplete);
  QCOMPARE(summary.distance_meters, cumulative.last());
}

void ActivitySummaryTest::singleSlowSampleIsNotAStop()
{
  ActivitySummary summary = ridelog::summarize(steady_ride(30, 15, 15));
  QCOMPARE(summary.active_seconds, 30.0);
}

void ActivitySummaryTest::stopShorterThanMinimumKept()
{
  // Intervals closing at 11..19 are stopped, 9 seconds in all.
  ActivitySummary summary = ridelog::summarize(steady_ride(30, 11, 19));
  QCOMPARE(summary.active_seconds, 30.0);
}

void ActivitySummaryTest::stopAtMinimumSubtracted()
{
  ActivitySummary summary = ridelog::summarize(steady_ride(30, 11, 20));
  QCOMPARE(summary.active_seconds, 20.0);
  QCOMPARE(summary.elapsed_seconds, 30.0);

  AnalyticsConfig config;
  config.min_stop_duration = 11.0;
  QCOMPARE(ridelog::summarize(steady_ride(30, 11, 20), config).active_seconds, 30.0);
}

void ActivitySummaryTest::inferredSpeedDetectsStops()
{
  QVector<Sample> samples;
  double odometer = 0.0;
  for (int i = 0; i <= 60; ++i) {
    Sample s;
    s.timestamp = kStartMs + i * 1000;
    if (i <= 20 || i > 40) {
      odometer += 5.0;
    }
    s.distance = odometer;
    samples.append(s);
  }

  ActivitySummary summary = ridelog::summarize(make_track(samples));
  QCOMPARE(summary.elapsed_seconds, 60.0);
  QCOMPARE(summary.active_seconds, 40.0);
}

void ActivitySummaryTest::duplicateTimestampsIgnored()
{
  QVector<Sample> samples(3);
  for (auto& s : samples) {
    s.timestamp = kStartMs;
    s.speed = 0.0;
  }

  ActivitySummary summary = ridelog::summarize(make_track(samples));
  QCOMPARE(summary.elapsed_seconds, 0.0);
  QCOMPARE(summary.active_seconds, 0.0);
}

void ActivitySummaryTest::smoothingPreservesRamp()
{
  QVector<double> ramp;
  for (int i = 0; i < 20; ++i) {
    ramp.append(100.0 + 2.5 * i);
  }
  QVector<double> smoothed = ridelog::smoothAltitudes(ramp, 5);
  QCOMPARE(smoothed.size(), ramp.size());
  for (int i = 0; i < ramp.size(); ++i) {
    QCOMPARE(smoothed.at(i), ramp.at(i));
  }
  QVERIFY(ridelog::smoothAltitudes(QVector<double>(), 5).isEmpty());
}

void ActivitySummaryTest::smoothingEvenWindow()
{
  QVector<double> spike = {0.0, 0.0, 9.0, 0.0, 0.0};
  QVector<double> smoothed = ridelog::smoothAltitudes(spike, 2);
  QCOMPARE(smoothed, QVector<double>({0.0, 3.0, 3.0, 3.0, 0.0}));
  QCOMPARE(ridelog::smoothAltitudes(spike, 1), spike);
}

void ActivitySummaryTest::elevationBelowThresholdIgnored()
{
  QVector<Sample> samples(40);
  for (int i = 0; i < samples.size(); ++i) {
    samples[i].timestamp = kStartMs + i * 1000;
    samples[i].altitude = (i % 2 == 0) ? 200.0 : 200.8;
  }

  AnalyticsConfig config;
  config.elevation_smoothing_window = 1;
  ActivitySummary summary = ridelog::summarize(make_track(samples), config);
  QCOMPARE(summary.elevation_gain, 0.0);
  QCOMPARE(summary.elevation_loss, 0.0);
  QCOMPARE(*summary.max_alt, 200.8);
  QCOMPARE(*summary.min_alt, 200.0);
}

void ActivitySummaryTest::elevationGainAndLoss()
{
  QVector<Sample> samples;
  for (int i = 0; i <= 20; ++i) {
    Sample s;
    s.timestamp = kStartMs + i * 1000;
    s.altitude = 100.0 + 2.0 * (i <= 10 ? i : 20 - i);
    samples.append(s);
  }

  AnalyticsConfig config;
  config.elevation_smoothing_window = 1;
  ActivitySummary summary = ridelog::summarize(make_track(samples), config);
  QCOMPARE(summary.elevation_gain, 20.0);
  QCOMPARE(summary.elevation_loss, 20.0);
}

QTEST_GUILESS_MAIN(ActivitySummaryTest)
