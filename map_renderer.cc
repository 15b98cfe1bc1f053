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

#include "map_renderer.h"

#include <utility>                         // for move

#include <QByteArray>                      // for QByteArray
#include <QEventLoop>                      // for QEventLoop
#include <QJsonArray>                      // for QJsonArray
#include <QJsonDocument>                   // for QJsonDocument
#include <QJsonObject>                     // for QJsonObject
#include <QMetaObject>                     // for QMetaObject
#include <QMutexLocker>                    // for QMutexLocker
#include <QTimer>                          // for QTimer
#include <QVariant>                        // for QVariant
#include <QtNetwork/QNetworkAccessManager> // for QNetworkAccessManager
#include <QtNetwork/QNetworkReply>         // for QNetworkReply
#include <QtNetwork/QNetworkRequest>       // for QNetworkRequest

#include "defs.h"                          // for global_opts
#include "errors.h"                        // for MapRenderError
#include "src/core/logging.h"              // for Debug

#define MYNAME "render"

namespace ridelog
{

HttpMapRenderer::HttpMapRenderer(QUrl endpoint, int timeout_ms) :
  endpoint_(std::move(endpoint)),
  timeout_ms_(timeout_ms)
{
}

HttpMapRenderer::~HttpMapRenderer() = default;

QByteArray HttpMapRenderer::request_body(const QVector<GeoPoint>& points, const MapRenderOptions& options)
{
  QJsonArray path;
  for (const auto& point : points) {
    path.append(QJsonArray{point.latitude, point.longitude});
  }
  QJsonObject body{
    {QStringLiteral("width"), options.width},
    {QStringLiteral("height"), options.height},
    {QStringLiteral("path"), path}
  };
  return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

QByteArray HttpMapRenderer::render(const QVector<GeoPoint>& points, const MapRenderOptions& options)
{
  if (!endpoint_.isValid() || endpoint_.isEmpty()) {
    throw MapRenderError(MYNAME ": no renderer url is configured.");
  }

  // The manager must live in the thread that renders.
  if (!manager_) {
    manager_ = std::make_unique<QNetworkAccessManager>();
  }
  canceled_ = false;

  QNetworkRequest request(endpoint_);
  request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
  QNetworkReply* reply = manager_->post(request, request_body(points, options));
  {
    QMutexLocker locker(&reply_mutex_);
    reply_ = reply;
  }
  if (global_opts.debug_level >= 1) {
    Debug(1) << MYNAME ": posted " << points.size() << " points to " << endpoint_.toString();
  }

  bool timed_out = false;
  QEventLoop loop;
  QTimer timer;
  timer.setSingleShot(true);
  QObject::connect(&timer, &QTimer::timeout, &loop, [&timed_out, reply]() {
    timed_out = true;
    reply->abort();
  });
  QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
  timer.start(timeout_ms_);
  if (!reply->isFinished() && !canceled_) {
    loop.exec();
  }
  timer.stop();

  {
    QMutexLocker locker(&reply_mutex_);
    reply_ = nullptr;
  }
  std::unique_ptr<QNetworkReply, void(*)(QNetworkReply*)> guard(reply, [](QNetworkReply* r) {
    r->deleteLater();
  });

  if (canceled_) {
    // A cancel that raced the publication of reply_ never reached it.
    if (!reply->isFinished()) {
      reply->abort();
    }
    throw MapRenderError(MYNAME ": render canceled.");
  }
  if (timed_out) {
    throw MapRenderError(QStringLiteral(MYNAME ": no response from %1 within %2 ms.")
                         .arg(endpoint_.toString()).arg(timeout_ms_));
  }
  if (reply->error() != QNetworkReply::NoError) {
    throw MapRenderError(QStringLiteral(MYNAME ": request to %1 failed: %2")
                         .arg(endpoint_.toString(), reply->errorString()));
  }
  int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
  if (status != 0 && status != 200) {
    QString reason = reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString();
    throw MapRenderError(QStringLiteral(MYNAME ": renderer answered %1 %2.").arg(status).arg(reason));
  }
  QByteArray image = reply->readAll();
  if (image.isEmpty()) {
    throw MapRenderError(MYNAME ": renderer returned an empty image.");
  }
  return image;
}

void HttpMapRenderer::cancel()
{
  canceled_ = true;
  QMutexLocker locker(&reply_mutex_);
  if (reply_) {
    // abort() has to run in the thread that owns the reply.
    QMetaObject::invokeMethod(reply_.data(), &QNetworkReply::abort, Qt::QueuedConnection);
  }
}

QByteArray renderActivityMap(const ActivityTrack& track, MapRenderer& renderer,
                             int target_count, const MapRenderOptions& options)
{
  QVector<GeoPoint> points = sampleForMap(track, target_count);
  return renderer.render(points, options);
}

} // namespace ridelog
