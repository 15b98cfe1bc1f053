#include "test_exporters.h"

#include <stdexcept>            // for invalid_argument

#include <QBuffer>              // for QBuffer
#include <QByteArray>           // for QByteArray
#include <QCborArray>           // for QCborArray
#include <QCborMap>             // for QCborMap
#include <QCborValue>           // for QCborValue
#include <QHostAddress>         // for QHostAddress
#include <QJsonArray>           // for QJsonArray
#include <QJsonDocument>        // for QJsonDocument
#include <QJsonObject>          // for QJsonObject
#include <QTimer>               // for QTimer
#include <QUrl>                 // for QUrl
#include <QVector>              // for QVector
#include <QXmlStreamReader>     // for QXmlStreamReader
#include <QtTest>               // for QCOMPARE, QVERIFY, QVERIFY_THROWS_EXCEPTION, QTEST_GUILESS_MAIN

#include "column_extractor.h"   // for extractColumns, encodeColumnsCbor, ColumnMap
#include "errors.h"             // for NoGeodataError, MapRenderError
#include "gpx_writer.h"         // for GpxWriter
#include "map_renderer.h"       // for MapRenderer, HttpMapRenderer, renderActivityMap
#include "map_sampler.h"        // for sampleForMap, GeoPoint
#include "src/core/xmlstreamwriter.h" // for XmlStreamWriter

using ridelog::ActivityTrack;
using ridelog::GeoPoint;
using ridelog::Sample;

namespace
{

constexpr qint64 kStartMs = 1600000000000LL;

class RecordingRenderer : public ridelog::MapRenderer
{
public:
  QByteArray render(const QVector<GeoPoint>& points, const ridelog::MapRenderOptions& options) override
  {
    points_ = points;
    width_ = options.width;
    return QByteArray("PNG");
  }
  void cancel() override {}

  QVector<GeoPoint> points_;
  int width_{0};
};

int count_elements(const QString& xml, const QString& name)
{
  QXmlStreamReader reader(xml);
  int count = 0;
  while (!reader.atEnd()) {
    if (reader.readNext() == QXmlStreamReader::StartElement && reader.qualifiedName() == name) {
      ++count;
    }
  }
  return reader.hasError() ? -1 : count;
}

} // namespace

ActivityTrack ExportersTest::line_track(int count, int skip_every)
{
  ridelog::TrackBuilder builder(QStringLiteral("test"));
  for (int i = 0; i < count; ++i) {
    Sample s;
    s.timestamp = kStartMs + i * 1000;
    if (skip_every == 0 || i % skip_every != skip_every - 1) {
      s.latitude = 47.0 + 0.0001 * i;
      s.longitude = 8.0 + 0.0001 * i;
      s.altitude = 400.0 + i;
    }
    s.heart_rate = 130;
    s.cadence = 85;
    s.power = 210;
    s.speed = 7.5;
    s.distance = 7.5 * i;
    builder.add_sample(s);
  }
  return builder.build();
}

ActivityTrack ExportersTest::indoor_track()
{
  ridelog::TrackBuilder builder(QStringLiteral("test"));
  for (int i = 0; i < 5; ++i) {
    Sample s;
    s.timestamp = kStartMs + i * 1000;
    s.power = 150 + i;
    if (i != 2) {
      s.speed = 8.0;
    }
    builder.add_sample(s);
  }
  return builder.build();
}

void ExportersTest::gpxDocument()
{
  QString xml = ridelog::GpxWriter(QStringLiteral("Morning Ride")).write(line_track(3));
  QCOMPARE(count_elements(xml, QStringLiteral("trkpt")), 3);
  QCOMPARE(count_elements(xml, QStringLiteral("gpxtpx:hr")), 3);
  QCOMPARE(count_elements(xml, QStringLiteral("gpxtpx:cad")), 3);
  QCOMPARE(count_elements(xml, QStringLiteral("pwr:PowerInWatts")), 3);
  QCOMPARE(count_elements(xml, QStringLiteral("power")), 0);
  QVERIFY(xml.contains(QStringLiteral("xmlns:pwr=\"http://www.garmin.com/xmlschemas/PowerExtension/v1\"")));
  QCOMPARE(count_elements(xml, QStringLiteral("ele")), 3);
  QVERIFY(xml.contains(QStringLiteral("version=\"1.1\"")));
  QVERIFY(xml.contains(QStringLiteral("<name>Morning Ride</name>")));
  QVERIFY(xml.contains(QStringLiteral("lat=\"47.000100000\"")));
  QVERIFY(xml.contains(QStringLiteral("<ele>401.000</ele>")));
  QVERIFY(xml.contains(QStringLiteral("<time>2020-09-13T12:26:40Z</time>")));
}

void ExportersTest::gpxSkipsSamplesWithoutPosition()
{
  QString xml = ridelog::GpxWriter().write(line_track(9, 3));
  QCOMPARE(count_elements(xml, QStringLiteral("trkpt")), 6);
}

void ExportersTest::gpxOmitsEmptyExtensions()
{
  ridelog::TrackBuilder builder;
  Sample s;
  s.timestamp = kStartMs;
  s.latitude = 1.0;
  s.longitude = 2.0;
  builder.add_sample(s);

  QString xml = ridelog::GpxWriter().write(builder.build());
  QCOMPARE(count_elements(xml, QStringLiteral("trkpt")), 1);
  QCOMPARE(count_elements(xml, QStringLiteral("extensions")), 0);
  QCOMPARE(count_elements(xml, QStringLiteral("ele")), 0);
}

void ExportersTest::gpxWithoutPositionsThrows()
{
  QVERIFY_THROWS_EXCEPTION(ridelog::NoGeodataError, ridelog::GpxWriter().write(indoor_track()));
}

void ExportersTest::xmlWriterDropsEmptyOptionalElements()
{
  QByteArray xml;
  QBuffer buffer(&xml);
  buffer.open(QIODevice::WriteOnly);
  ridelog::XmlStreamWriter writer(&buffer);
  writer.writeStartElement(QStringLiteral("root"));
  writer.stackOptionalStartElement(QStringLiteral("outer"));
  writer.stackOptionalStartElement(QStringLiteral("inner"));
  writer.stackOptionalTextElement(QStringLiteral("empty"), QString());
  writer.stackEndElement();
  writer.stackEndElement();
  writer.stackOptionalStartElement(QStringLiteral("kept"));
  writer.stackStartElement(QStringLiteral("wrapper"));
  writer.stackTextElement(QStringLiteral("value"), QStringLiteral("1"));
  writer.stackEndElement();
  writer.stackEndElement();
  writer.writeOptionalTextElement(QStringLiteral("skipped"), QString());
  writer.writeEndElement();
  buffer.close();

  QCOMPARE(xml, QByteArray("<root><kept><wrapper><value>1</value></wrapper></kept></root>"));
}

void ExportersTest::xmlWriterRejectsUnbalancedEnd()
{
  QByteArray xml;
  QBuffer buffer(&xml);
  buffer.open(QIODevice::WriteOnly);
  ridelog::XmlStreamWriter writer(&buffer);
  QVERIFY_THROWS_EXCEPTION(std::logic_error, writer.stackEndElement());
}

void ExportersTest::mapSamplesKeepEnds()
{
  ActivityTrack track = line_track(1000);
  QVector<GeoPoint> points = ridelog::sampleForMap(track, 10);
  QCOMPARE(points.size(), qsizetype(10));
  QCOMPARE(points.first().latitude, *track.at(0).latitude);
  QCOMPARE(points.last().latitude, *track.at(999).latitude);
  QCOMPARE(points.at(1).latitude, *track.at(111).latitude);
  for (int i = 1; i < points.size(); ++i) {
    QVERIFY(points.at(i).latitude > points.at(i - 1).latitude);
  }
  QCOMPARE(points.first().altitude, track.at(0).altitude);
}

void ExportersTest::mapSamplesShortTrack()
{
  ActivityTrack track = line_track(12, 4);
  QVector<GeoPoint> points = ridelog::sampleForMap(track, 200);
  QCOMPARE(points.size(), qsizetype(track.geodata_count()));
  QCOMPARE(points.size(), qsizetype(9));
}

void ExportersTest::mapSamplesTargetOne()
{
  ActivityTrack track = line_track(50);
  QVector<GeoPoint> points = ridelog::sampleForMap(track, 1);
  QCOMPARE(points.size(), qsizetype(1));
  QCOMPARE(points.first().longitude, *track.at(0).longitude);
}

void ExportersTest::mapSamplesInvalidTarget()
{
  QVERIFY_THROWS_EXCEPTION(std::invalid_argument, ridelog::sampleForMap(line_track(5), 0));
  QVERIFY_THROWS_EXCEPTION(std::invalid_argument, ridelog::sampleForMap(line_track(5), -3));
}

void ExportersTest::mapSamplesWithoutPositions()
{
  QVERIFY_THROWS_EXCEPTION(ridelog::NoGeodataError, ridelog::sampleForMap(indoor_track(), 10));
}

void ExportersTest::columnsAligned()
{
  ActivityTrack track = line_track(6, 3);
  ridelog::ColumnMap columns = ridelog::extractColumns(track, {QStringLiteral("timestamp"),
                               QStringLiteral("position_lat"), QStringLiteral("power")});
  QCOMPARE(columns.size(), qsizetype(3));
  for (const auto& column : std::as_const(columns)) {
    QCOMPARE(column.size(), qsizetype(track.size()));
  }
  QCOMPARE(columns.value(QStringLiteral("timestamp")).at(4).toLongLong(), kStartMs + 4000);
  QVERIFY(columns.value(QStringLiteral("position_lat")).at(2).isNull());
  QCOMPARE(columns.value(QStringLiteral("position_lat")).at(3).toDouble(), 47.0003);
  QCOMPARE(columns.value(QStringLiteral("power")).at(5).toInt(), 210);
}

void ExportersTest::columnsWithoutPositions()
{
  ridelog::ColumnMap columns = ridelog::extractColumns(indoor_track(), QStringList());
  QVERIFY(columns.contains(QStringLiteral("position_lat")));
  QVERIFY(columns.value(QStringLiteral("position_lat")).isEmpty());
  QVERIFY(columns.value(QStringLiteral("position_long")).isEmpty());
  QVERIFY(columns.value(QStringLiteral("altitude")).isEmpty());
  QCOMPARE(columns.value(QStringLiteral("power")).size(), qsizetype(5));
  QVERIFY(columns.value(QStringLiteral("speed")).at(2).isNull());
}

void ExportersTest::columnsDefaultAndUnknownNames()
{
  ActivityTrack track = line_track(3);
  ridelog::ColumnMap defaults = ridelog::extractColumns(track, QStringList());
  QCOMPARE(defaults.keys().size(), ridelog::default_column_names().size());

  ridelog::ColumnMap columns = ridelog::extractColumns(track, {QStringLiteral("heart_rate"),
                               QStringLiteral("temperature")});
  QCOMPARE(columns.keys(), QStringList{QStringLiteral("heart_rate")});
  QVERIFY(ridelog::known_column_names().contains(QStringLiteral("cadence")));
}

void ExportersTest::columnsCbor()
{
  ridelog::ColumnMap columns = ridelog::extractColumns(indoor_track(),
                               {QStringLiteral("timestamp"), QStringLiteral("speed"), QStringLiteral("position_lat")});
  QCborValue decoded = QCborValue::fromCbor(ridelog::encodeColumnsCbor(columns));
  QVERIFY(decoded.isMap());
  QCborMap map = decoded.toMap();
  QCOMPARE(map.size(), qsizetype(3));

  QCborArray timestamps = map.value(QStringLiteral("timestamp")).toArray();
  QCOMPARE(timestamps.size(), qsizetype(5));
  QVERIFY(timestamps.at(0).isInteger());
  QCOMPARE(timestamps.at(0).toInteger(), kStartMs);

  QCborArray speeds = map.value(QStringLiteral("speed")).toArray();
  QVERIFY(speeds.at(0).isDouble());
  QCOMPARE(speeds.at(0).toDouble(), 8.0);
  QVERIFY(speeds.at(2).isNull());

  QVERIFY(map.value(QStringLiteral("position_lat")).isArray());
  QVERIFY(map.value(QStringLiteral("position_lat")).toArray().isEmpty());
}

void ExportersTest::renderUsesSampledPoints()
{
  RecordingRenderer renderer;
  ridelog::MapRenderOptions options;
  options.width = 320;
  ActivityTrack track = line_track(500);
  QByteArray image = ridelog::renderActivityMap(track, renderer, 25, options);
  QCOMPARE(image, QByteArray("PNG"));
  QCOMPARE(renderer.points_, ridelog::sampleForMap(track, 25));
  QCOMPARE(renderer.width_, 320);
  QCOMPARE(track.size(), 500);

  QVERIFY_THROWS_EXCEPTION(ridelog::NoGeodataError, ridelog::renderActivityMap(indoor_track(), renderer, 25));
}

void ExportersTest::renderRequestBody()
{
  QVector<GeoPoint> points = {{47.5, 8.25, std::nullopt}, {47.75, 8.5, 410.0}};
  ridelog::MapRenderOptions options;
  options.width = 800;
  options.height = 480;
  QJsonObject body = QJsonDocument::fromJson(ridelog::HttpMapRenderer::request_body(points, options)).object();
  QCOMPARE(body.value(QStringLiteral("width")).toInt(), 800);
  QCOMPARE(body.value(QStringLiteral("height")).toInt(), 480);
  QJsonArray path = body.value(QStringLiteral("path")).toArray();
  QCOMPARE(path.size(), qsizetype(2));
  QCOMPARE(path.at(1).toArray().at(0).toDouble(), 47.75);
  QCOMPARE(path.at(1).toArray().at(1).toDouble(), 8.5);
}

void ExportersTest::renderWithoutUrlThrows()
{
  ridelog::HttpMapRenderer renderer{QUrl()};
  QVERIFY_THROWS_EXCEPTION(ridelog::MapRenderError, ridelog::renderActivityMap(line_track(3), renderer, 10));
}

void ExportersTest::renderUnreachableThrows()
{
  // Nothing listens on the tcpmux port of the loopback interface.
  ridelog::HttpMapRenderer renderer(QUrl(QStringLiteral("http://127.0.0.1:1/render")), 5000);
  QVERIFY_THROWS_EXCEPTION(ridelog::MapRenderError, ridelog::renderActivityMap(line_track(3), renderer, 10));
}

QUrl ExportersTest::silent_server_url(QTcpServer& server)
{
  if (!server.listen(QHostAddress::LocalHost)) {
    return QUrl();
  }
  return QUrl(QStringLiteral("http://127.0.0.1:%1/render").arg(server.serverPort()));
}

void ExportersTest::renderTimesOut()
{
  QTcpServer server;
  QUrl url = silent_server_url(server);
  QVERIFY(url.isValid() && !url.isEmpty());
  ridelog::HttpMapRenderer renderer(url, 200);

  QString message;
  try {
    ridelog::renderActivityMap(line_track(3), renderer, 10);
  } catch (const ridelog::MapRenderError& e) {
    message = QString::fromUtf8(e.what());
  }
  QVERIFY(message.contains(QStringLiteral("within 200 ms")));
}

void ExportersTest::renderCanceled()
{
  QTcpServer server;
  QUrl url = silent_server_url(server);
  QVERIFY(url.isValid() && !url.isEmpty());
  ridelog::HttpMapRenderer renderer(url, 30000);
  const ridelog::ActivityTrack track = line_track(5);
  const ridelog::ActivityTrack before = track;

  QTimer::singleShot(50, [&renderer]() {
    renderer.cancel();
  });
  QString message;
  try {
    ridelog::renderActivityMap(track, renderer, 10);
  } catch (const ridelog::MapRenderError& e) {
    message = QString::fromUtf8(e.what());
  }
  QVERIFY(message.contains(QStringLiteral("render canceled")));
  QVERIFY(track == before);
}

QTEST_GUILESS_MAIN(ExportersTest)
