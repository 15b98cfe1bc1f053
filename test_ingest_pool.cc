#include "test_ingest_pool.h"

#include <QFuture>              // for QFuture
#include <QList>                // for QList
#include <QtTest>               // for QCOMPARE, QVERIFY, QVERIFY_THROWS_EXCEPTION, QTEST_GUILESS_MAIN

#include "activity_summary.h"   // for ActivitySummary, summarize
#include "errors.h"             // for MalformedHeaderError, CorruptBlobError, EmptyTrackError
#include "fit_decoder.h"        // for FitDecoder
#include "fit_file_builder.h"   // for FitFileBuilder
#include "ingest_pool.h"        // for IngestPool, IngestResult, takeResult
#include "track_codec.h"        // for TrackCodec

using ridelog::ActivitySummary;
using ridelog::IngestPool;
using ridelog::IngestResult;
using ridelog::takeResult;

QByteArray IngestPoolTest::ride_file(int seconds, double speed)
{
  FitFileBuilder fit;
  fit.write_message_def(0, ridelog::FitDecoder::kIdRecord, FitFileBuilder::record_fields());
  for (int i = 0; i <= seconds; ++i) {
    FitFileBuilder::RecordValues values;
    values.timestamp = 1000000000 + i;
    values.latitude = 46.0 + 0.00005 * i;
    values.longitude = 7.0;
    values.altitude = 500.0;
    values.distance = speed * i;
    values.speed = speed;
    values.heart_rate = 110;
    fit.write_record(0, values);
  }
  return fit.build();
}

void IngestPoolTest::maxThreads()
{
  IngestPool pool(2);
  QCOMPARE(pool.maxThreadCount(), 2);
}

void IngestPoolTest::uploadProducesTrackSummaryAndBlob()
{
  IngestPool pool;
  IngestResult result = takeResult(pool.submitUpload(ride_file(60, 5.0)));
  QCOMPARE(result.track.size(), 61);
  QCOMPARE(result.summary.sample_count, 61);
  QCOMPARE(result.summary.distance_meters, 300.0);
  QCOMPARE(result.summary.active_seconds, 60.0);
  QCOMPARE(result.summary, ridelog::summarize(result.track));
  QVERIFY(ridelog::TrackCodec::decode(result.blob) == result.track);
}

void IngestPoolTest::summaryFromBlob()
{
  IngestPool pool;
  IngestResult result = takeResult(pool.submitUpload(ride_file(30, 4.0)));
  ActivitySummary summary = takeResult(pool.submitSummary(result.blob));
  QCOMPARE(summary, result.summary);
}

void IngestPoolTest::summaryFromFit()
{
  IngestPool pool;
  QByteArray data = ride_file(30, 4.0);
  ActivitySummary summary = takeResult(pool.submitFitSummary(data));
  QCOMPARE(summary, takeResult(pool.submitUpload(data)).summary);
  QCOMPARE(summary.distance_meters, 120.0);
  QVERIFY_THROWS_EXCEPTION(ridelog::MalformedHeaderError,
                           takeResult(pool.submitFitSummary(QByteArray("not a fit file at all"))));
}

void IngestPoolTest::parallelUploads()
{
  IngestPool pool(4);
  QList<QFuture<IngestResult>> futures;
  for (int i = 1; i <= 8; ++i) {
    futures.append(pool.submitUpload(ride_file(10 * i, 2.0)));
  }
  for (int i = 0; i < futures.size(); ++i) {
    IngestResult result = takeResult(futures.at(i));
    QCOMPARE(result.track.size(), 10 * (i + 1) + 1);
    QCOMPARE(result.summary.distance_meters, 20.0 * (i + 1));
  }
  QVERIFY(pool.waitForDone(30000));
}

void IngestPoolTest::decodeErrorIsRethrown()
{
  IngestPool pool;
  QVERIFY_THROWS_EXCEPTION(ridelog::MalformedHeaderError,
                           takeResult(pool.submitUpload(QByteArray("not a fit file at all"))));
}

void IngestPoolTest::corruptBlobIsRethrown()
{
  IngestPool pool;
  QVERIFY_THROWS_EXCEPTION(ridelog::CorruptBlobError, takeResult(pool.submitSummary(QByteArray("RLTK"))));
}

void IngestPoolTest::emptyTrackIsRethrown()
{
  FitFileBuilder fit;
  fit.write_message_def(0, ridelog::FitDecoder::kIdRecord, FitFileBuilder::record_fields());
  IngestPool pool;
  QVERIFY_THROWS_EXCEPTION(ridelog::EmptyTrackError, takeResult(pool.submitUpload(fit.build())));
}

QTEST_GUILESS_MAIN(IngestPoolTest)
