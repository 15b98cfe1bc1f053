#include <QObject>              // for QObject, Q_OBJECT, slots

#include "fit_file_builder.h"   // for FitFileBuilder

class FitDecoderTest : public QObject
{
  Q_OBJECT

private:
  /* Member Functions */

  static FitFileBuilder::RecordValues full_record(uint32_t timestamp);
  static QByteArray three_record_file();

  /* Constants */

  static constexpr uint32_t kStart = 1000000000;

private slots:
  void decodesRecords();
  void reportsSourceFormat();
  void invalidValuesAreAbsent();
  void bigEndianDefinitions();
  void enhancedFieldsOverride();
  void vendorTypedFieldsOutOfRange();
  void compressedTimestamps();
  void systemTimeUsesUtcOffset();
  void fileIdMetadata();
  void unknownMessagesSkipped();
  void unknownFieldsDropped();
  void unknownFieldsRetained();
  void untimedRecordsDropped();
  void shortFileRejected();
  void missingSignatureRejected();
  void badHeaderCrcRejected();
  void zeroHeaderCrcAccepted();
  void sizeMismatchRejected();
  void newerProtocolRejected();
  void fileCrcMismatchWarns();
  void truncatedTrailerKeepsSamples();
  void truncatedBeforeFirstSample();
  void undefinedLocalTypeStops();
};
