/*
    Background ingestion of uploaded recordings.

    Copyright (C) 2026 The RideLog Authors

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
#ifndef INGEST_POOL_H_INCLUDED_
#define INGEST_POOL_H_INCLUDED_

#include <exception>           // for rethrow_exception

#include <QByteArray>          // for QByteArray
#include <QFuture>             // for QFuture
#include <QThreadPool>         // for QThreadPool
#include <QUnhandledException> // for QUnhandledException

#include "activity_summary.h"  // for ActivitySummary
#include "engine_config.h"     // for AnalyticsConfig
#include "fit_decoder.h"       // for FitDecoder
#include "track.h"             // for ActivityTrack

namespace ridelog
{

struct IngestResult {
  ActivityTrack track;
  ActivitySummary summary;
  QByteArray blob;
};

/*
 * Runs decode, summarize and encode on a bounded pool so a large file
 * never blocks the caller.  Jobs share nothing, independent uploads run
 * in parallel.  Collect results with takeResult().
 */
class IngestPool
{
public:
  explicit IngestPool(int max_threads = 0,
                      FitDecoder::Options decoder_options = FitDecoder::Options(),
                      AnalyticsConfig analytics = AnalyticsConfig());
  ~IngestPool();
  IngestPool(const IngestPool&) = delete;
  IngestPool& operator=(const IngestPool&) = delete;

  QFuture<IngestResult> submitUpload(const QByteArray& fit_data);
  QFuture<ActivitySummary> submitSummary(const QByteArray& blob);
  // Decode and summarize only, nothing is persisted.
  QFuture<ActivitySummary> submitFitSummary(const QByteArray& fit_data);

  int maxThreadCount() const {return pool_.maxThreadCount();}
  bool waitForDone(int msecs = -1) {return pool_.waitForDone(msecs);}

private:
  QThreadPool pool_;
  FitDecoder decoder_;
  AnalyticsConfig analytics_;
};

/*
 * Wait for a job and return its result.  QtConcurrent wraps exceptions
 * that are not QExceptions, this rethrows the job's own error.
 */
template<typename T>
T takeResult(QFuture<T> future)
{
  try {
    return future.result();
  } catch (const QUnhandledException& e) {
    if (e.exception()) {
      std::rethrow_exception(e.exception());
    }
    throw;
  }
}

} // namespace ridelog

#endif // INGEST_POOL_H_INCLUDED_
