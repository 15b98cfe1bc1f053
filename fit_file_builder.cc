#include "fit_file_builder.h"

#include <cmath>            // for lround

#include "fit_decoder.h"    // for FitDecoder

QList<FitFileBuilder::fit_field_t>
FitFileBuilder::record_fields()
{
  return {
    {253, 4, kTypeUint32},  // timestamp
    {0, 4, kTypeSint32},    // position_lat
    {1, 4, kTypeSint32},    // position_long
    {2, 2, kTypeUint16},    // altitude
    {3, 1, kTypeUint8},     // heart_rate
    {4, 1, kTypeUint8},     // cadence
    {5, 4, kTypeUint32},    // distance
    {6, 2, kTypeUint16},    // speed
    {7, 2, kTypeUint16}     // power
  };
}

int32_t
FitFileBuilder::deg_to_semi(double deg)
{
  return static_cast<int32_t>(std::lround(deg * 2147483648.0 / 180.0));
}

void
FitFileBuilder::write_message_def(int local_id, int global_id, const QList<fit_field_t>& fields,
                                  const QList<fit_field_t>& dev_fields)
{
  put8(0x40 | (dev_fields.isEmpty() ? 0 : 0x20) | local_id); // Local ID
  put8(0); // Reserved
  put8(big_endian_ ? 1 : 0);
  put16(global_id); // Global ID
  put8(fields.size()); // Number of fields
  for (const auto& field : fields) {
    put8(field.id); // Field definition number
    put8(field.size); // Field size in bytes
    put8(field.type); // Field type
  }
  if (!dev_fields.isEmpty()) {
    put8(dev_fields.size());
    for (const auto& field : dev_fields) {
      put8(field.id);
      put8(field.size);
      put8(field.type); // Developer data index
    }
  }
}

void
FitFileBuilder::write_data_header(int local_id)
{
  put8(local_id & 0x0f);
}

void
FitFileBuilder::write_compressed_header(int local_id, int time_offset)
{
  put8(0x80 | ((local_id & 3) << 5) | (time_offset & 0x1f));
}

void
FitFileBuilder::write_record(int local_id, const RecordValues& values)
{
  write_data_header(local_id);
  put32(values.timestamp);
  put32(values.latitude ? deg_to_semi(*values.latitude) : 0x7fffffff);
  put32(values.longitude ? deg_to_semi(*values.longitude) : 0x7fffffff);
  put16(values.altitude ? std::lround((*values.altitude + 500) * 5) : 0xffff);
  put8(values.heart_rate ? *values.heart_rate : 0xff);
  put8(values.cadence ? *values.cadence : 0xff);
  put32(values.distance ? std::lround(*values.distance * 100) : 0xffffffff);
  put16(values.speed ? std::lround(*values.speed * 1000) : 0xffff);
  put16(values.power ? *values.power : 0xffff);
}

void
FitFileBuilder::put8(uint8_t value)
{
  data_.append(static_cast<char>(value));
}

void
FitFileBuilder::put16(uint16_t value)
{
  if (big_endian_) {
    put8(value >> 8);
    put8(value);
  } else {
    put8(value);
    put8(value >> 8);
  }
}

void
FitFileBuilder::put32(uint32_t value)
{
  if (big_endian_) {
    put16(value >> 16);
    put16(value);
  } else {
    put16(value);
    put16(value >> 16);
  }
}

void
FitFileBuilder::put_bytes(const QByteArray& bytes)
{
  data_.append(bytes);
}

QByteArray
FitFileBuilder::build(int protocol, int profile, bool header_crc, bool file_crc) const
{
  QByteArray out;
  auto le16 = [&out](uint16_t v) {
    out.append(static_cast<char>(v & 0xff));
    out.append(static_cast<char>(v >> 8));
  };

  out.append(static_cast<char>(FitDecoder::kReadHeaderCrcLen));
  out.append(static_cast<char>(protocol));
  le16(profile);
  le16(data_.size() & 0xffff);
  le16(data_.size() >> 16);
  out.append(".FIT");
  le16(header_crc ? FitDecoder::crc16(out.constData(), out.size()) : 0);
  out.append(data_);
  if (file_crc) {
    le16(FitDecoder::crc16(out.constData(), out.size()));
  }
  return out;
}
