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

#include "ingest_pool.h"

#include <QtConcurrent/QtConcurrentRun>  // for run

#include "src/core/logging.h"            // for gbDebug
#include "track_codec.h"                 // for TrackCodec

#define MYNAME "pool"

namespace ridelog
{

IngestPool::IngestPool(int max_threads, FitDecoder::Options decoder_options, AnalyticsConfig analytics) :
  decoder_(decoder_options),
  analytics_(analytics)
{
  if (max_threads > 0) {
    pool_.setMaxThreadCount(max_threads);
  }
  gbDebug(1) << MYNAME ": using up to " << pool_.maxThreadCount() << " threads";
}

IngestPool::~IngestPool()
{
  pool_.waitForDone();
}

QFuture<IngestResult> IngestPool::submitUpload(const QByteArray& fit_data)
{
  // The decoder and config are copied so the job owns everything it reads.
  return QtConcurrent::run(&pool_, [decoder = decoder_, analytics = analytics_, fit_data]() {
    IngestResult result;
    result.track = decoder.decode(fit_data);
    result.summary = summarize(result.track, analytics);
    result.blob = TrackCodec::encode(result.track);
    return result;
  });
}

QFuture<ActivitySummary> IngestPool::submitSummary(const QByteArray& blob)
{
  return QtConcurrent::run(&pool_, [analytics = analytics_, blob]() {
    return summarize(TrackCodec::decode(blob), analytics);
  });
}

QFuture<ActivitySummary> IngestPool::submitFitSummary(const QByteArray& fit_data)
{
  return QtConcurrent::run(&pool_, [decoder = decoder_, analytics = analytics_, fit_data]() {
    return summarize(decoder.decode(fit_data), analytics);
  });
}

} // namespace ridelog
