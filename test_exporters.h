#include <QObject>              // for QObject, Q_OBJECT, slots
#include <QTcpServer>           // for QTcpServer
#include <QUrl>                 // for QUrl

#include "track.h"              // for ActivityTrack

class ExportersTest : public QObject
{
  Q_OBJECT

private:
  /* Member Functions */

  // count samples, every skip_every'th without a position (0 for none).
  static ridelog::ActivityTrack line_track(int count, int skip_every = 0);
  static ridelog::ActivityTrack indoor_track();
  // Url of a server that accepts connections and never answers.
  static QUrl silent_server_url(QTcpServer& server);

private slots:
  void gpxDocument();
  void gpxSkipsSamplesWithoutPosition();
  void gpxOmitsEmptyExtensions();
  void gpxWithoutPositionsThrows();
  void xmlWriterDropsEmptyOptionalElements();
  void xmlWriterRejectsUnbalancedEnd();
  void mapSamplesKeepEnds();
  void mapSamplesShortTrack();
  void mapSamplesTargetOne();
  void mapSamplesInvalidTarget();
  void mapSamplesWithoutPositions();
  void columnsAligned();
  void columnsWithoutPositions();
  void columnsDefaultAndUnknownNames();
  void columnsCbor();
  void renderUsesSampledPoints();
  void renderRequestBody();
  void renderWithoutUrlThrows();
  void renderUnreachableThrows();
  void renderTimesOut();
  void renderCanceled();
};
