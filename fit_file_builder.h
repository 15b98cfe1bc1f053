#ifndef FIT_FILE_BUILDER_H_INCLUDED_
#define FIT_FILE_BUILDER_H_INCLUDED_

#include <cstdint>      // for uint8_t, uint16_t, uint32_t, int32_t
#include <optional>     // for optional

#include <QByteArray>   // for QByteArray
#include <QList>        // for QList

// Assembles FIT files in memory for the decoder tests.
class FitFileBuilder
{
public:
  /* Types */

  struct fit_field_t {
    int id;
    int size;
    int type;
  };

  struct RecordValues {
    uint32_t timestamp{0xffffffff};   /* FIT seconds */
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::optional<double> altitude;
    std::optional<int> heart_rate;
    std::optional<int> cadence;
    std::optional<double> distance;
    std::optional<double> speed;
    std::optional<int> power;
  };

  /* Special Member Functions */

  explicit FitFileBuilder(bool big_endian = false) : big_endian_(big_endian) {}

  /* Member Functions */

  static QList<fit_field_t> record_fields();
  static int32_t deg_to_semi(double deg);

  void write_message_def(int local_id, int global_id, const QList<fit_field_t>& fields,
                         const QList<fit_field_t>& dev_fields = QList<fit_field_t>());
  void write_data_header(int local_id);
  void write_compressed_header(int local_id, int time_offset);
  // Data header followed by the fields of record_fields().
  void write_record(int local_id, const RecordValues& values);

  void put8(uint8_t value);
  void put16(uint16_t value);
  void put32(uint32_t value);
  void put_bytes(const QByteArray& bytes);

  // Header, data records and trailing file CRC.
  QByteArray build(int protocol = 0x20, int profile = 2194,
                   bool header_crc = true, bool file_crc = true) const;

  /* Constants */

  static constexpr int kTypeEnum = 0x00;
  static constexpr int kTypeUint8 = 0x02;
  static constexpr int kTypeSint8 = 0x01;
  static constexpr int kTypeUint16 = 0x84;
  static constexpr int kTypeSint32 = 0x85;
  static constexpr int kTypeUint32 = 0x86;
  static constexpr int kTypeBytes = 0x0d;

private:
  QByteArray data_;
  bool big_endian_;
};

#endif // FIT_FILE_BUILDER_H_INCLUDED_
