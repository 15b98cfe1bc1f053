/*
    Hand off of sampled positions to a map rendering service.

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
#ifndef MAP_RENDERER_H_INCLUDED_
#define MAP_RENDERER_H_INCLUDED_

#include <atomic>                         // for atomic
#include <memory>                         // for unique_ptr

#include <QByteArray>                     // for QByteArray
#include <QMutex>                         // for QMutex
#include <QPointer>                       // for QPointer
#include <QUrl>                           // for QUrl
#include <QVector>                        // for QVector
#include <QtNetwork/QNetworkAccessManager> // for QNetworkAccessManager
#include <QtNetwork/QNetworkReply>        // for QNetworkReply

#include "engine_config.h"                // for kDefaultRenderWidth, kDefaultRenderHeight, kDefaultRendererTimeoutMs
#include "map_sampler.h"                  // for GeoPoint
#include "track.h"                        // for ActivityTrack

namespace ridelog
{

struct MapRenderOptions {
  int width{kDefaultRenderWidth};
  int height{kDefaultRenderHeight};
};

class MapRenderer
{
public:
  MapRenderer() = default;
  virtual ~MapRenderer() = default;
  MapRenderer(const MapRenderer&) = delete;
  MapRenderer& operator=(const MapRenderer&) = delete;

  // Returns the encoded image.  Throws MapRenderError.
  virtual QByteArray render(const QVector<GeoPoint>& points, const MapRenderOptions& options) = 0;

  // Abandon a render in progress from any thread.
  virtual void cancel() = 0;
};

/*
 * Posts the points as JSON to an HTTP service and returns the response
 * body.  The calling thread blocks in a local event loop until the reply
 * arrives, the timeout expires or cancel() is called.
 */
class HttpMapRenderer : public MapRenderer
{
public:
  explicit HttpMapRenderer(QUrl endpoint, int timeout_ms = kDefaultRendererTimeoutMs);
  ~HttpMapRenderer() override;

  QByteArray render(const QVector<GeoPoint>& points, const MapRenderOptions& options) override;
  void cancel() override;

  static QByteArray request_body(const QVector<GeoPoint>& points, const MapRenderOptions& options);

private:
  QUrl endpoint_;
  int timeout_ms_;
  std::unique_ptr<QNetworkAccessManager> manager_;
  QMutex reply_mutex_;
  QPointer<QNetworkReply> reply_;
  std::atomic<bool> canceled_{false};
};

/*
 * Samples the track and hands the points to the renderer.  The track is
 * only read.
 */
QByteArray renderActivityMap(const ActivityTrack& track, MapRenderer& renderer,
                             int target_count, const MapRenderOptions& options = MapRenderOptions());

} // namespace ridelog

#endif // MAP_RENDERER_H_INCLUDED_
