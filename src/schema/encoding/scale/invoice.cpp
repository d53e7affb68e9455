#include <invoicedb/schema/encoding/scale/invoice.hpp>

#include <boost/endian/buffers.hpp>
#include <boost/endian/conversion.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

using namespace invoicedb::schema;

namespace invoicedb::schema::encoding::scale {

namespace {

using record_tuple_t = std::tuple<bytes_t,
                                  bytes_t,
                                  bytes_t,
                                  preimage_t,
                                  std::array<uint8_t, 8>,
                                  uint8_t>;

constexpr auto kNanosecondsPerSecond = uint32_t{1'000'000'000};
constexpr auto kMinTimestampSeconds = std::chrono::ceil<std::chrono::seconds>(
    timestamp_t::min().time_since_epoch());
constexpr auto kMaxTimestampSeconds = std::chrono::floor<std::chrono::seconds>(
    timestamp_t::max().time_since_epoch());

std::array<uint8_t, 8> encode_amount(const amount_t value) {
  auto buffer = boost::endian::big_uint64_buf_t{static_cast<uint64_t>(value)};
  auto out = std::array<uint8_t, 8>{};
  std::copy_n(buffer.data(), out.size(), std::begin(out));
  return out;
}

amount_t decode_amount(const std::array<uint8_t, 8>& bytes) {
  auto buffer = boost::endian::big_uint64_buf_t{};
  std::copy_n(std::begin(bytes), bytes.size(), buffer.data());
  return static_cast<amount_t>(buffer.value());
}

struct length_prefix final {
  std::size_t length{};
  std::size_t header_size{};
  // Four-byte mode tops out below 2^30; the big-integer mode only encodes
  // lengths beyond that.
  bool beyond_four_byte_mode{false};
};

// SCALE compact length at the front of bytes.
std::optional<length_prefix> read_length_prefix(const bytes_view_t& bytes) {
  if (bytes.empty()) {
    return std::nullopt;
  }
  switch (bytes[0] & 0x03u) {
    case 0x00:
      return length_prefix{.length = std::size_t{bytes[0]} >> 2u,
                           .header_size = 1};
    case 0x01:
      if (bytes.size() < 2) {
        return std::nullopt;
      }
      return length_prefix{
          .length = std::size_t{boost::endian::load_little_u16(bytes.data())} >>
                    2u,
          .header_size = 2};
    case 0x02:
      if (bytes.size() < 4) {
        return std::nullopt;
      }
      return length_prefix{
          .length = std::size_t{boost::endian::load_little_u32(bytes.data())} >>
                    2u,
          .header_size = 4};
    default:
      return length_prefix{.header_size = 1, .beyond_four_byte_mode = true};
  }
}

// Walks the variable length fields at the head of a record and rejects an
// oversized length prefix before any payload is materialized.
std::optional<std::string> check_field_lengths(const bytes_view_t& bytes) {
  constexpr auto kFieldCaps =
      std::array<std::pair<std::string_view, std::size_t>, 3>{{
          {"memo", kMaxMemoSize},
          {"receipt", kMaxReceiptSize},
          {"creation time", kMaxTimestampSize},
      }};

  auto rest = bytes;
  for (const auto& [name, cap] : kFieldCaps) {
    auto prefix = read_length_prefix(rest);
    if (!prefix.has_value()) {
      return fmt::format("truncated {} length in invoice record", name);
    }
    if (prefix->beyond_four_byte_mode) {
      return fmt::format("{} length prefix exceeds {}", name, cap);
    }
    if (prefix->length > cap) {
      return fmt::format("{} of {} bytes exceeds {}", name, prefix->length,
                         cap);
    }
    if (rest.size() - prefix->header_size < prefix->length) {
      return fmt::format("truncated {} in invoice record", name);
    }
    rest = rest.subspan(prefix->header_size + prefix->length);
  }
  return std::nullopt;
}

}  // namespace

bytes_t encode_timestamp(encoder<scale_encoder_tag>& encoder,
                         const timestamp_t& timestamp) {
  auto since_epoch = timestamp.time_since_epoch();
  auto seconds = std::chrono::floor<std::chrono::seconds>(since_epoch);
  auto nanoseconds = std::chrono::duration_cast<std::chrono::nanoseconds>(
      since_epoch - seconds);
  return encoder.encode(std::tuple{
      kTimestampVersion, static_cast<int64_t>(seconds.count()),
      static_cast<uint32_t>(nanoseconds.count())});
}

std::optional<timestamp_t> decode_timestamp(encoder<scale_encoder_tag>& encoder,
                                            const bytes_view_t& bytes) {
  if (bytes.size() != kTimestampSize) {
    return std::nullopt;
  }
  auto decoded =
      encoder.try_decode<std::tuple<uint8_t, int64_t, uint32_t>>(bytes);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  auto [version, seconds, nanoseconds] = decoded.value();
  if (version != kTimestampVersion || nanoseconds >= kNanosecondsPerSecond) {
    return std::nullopt;
  }
  // Seconds must convert to int64 nanoseconds without overflowing.
  if (seconds < kMinTimestampSeconds.count() ||
      seconds > kMaxTimestampSeconds.count()) {
    return std::nullopt;
  }
  auto whole = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::seconds{seconds});
  if (whole.count() > 0 && timestamp_t::max().time_since_epoch() - whole <
                               std::chrono::nanoseconds{nanoseconds}) {
    return std::nullopt;
  }
  return timestamp_t{whole + std::chrono::nanoseconds{nanoseconds}};
}

bytes_t encode_invoice(encoder<scale_encoder_tag>& encoder,
                       const invoice_t& invoice) {
  return encoder.encode(record_tuple_t{
      invoice.memo, invoice.receipt,
      encode_timestamp(encoder, invoice.creation_time),
      invoice.terms.payment_preimage, encode_amount(invoice.terms.value),
      static_cast<uint8_t>(invoice.terms.settled ? 1 : 0)});
}

operation_result<invoice_t> decode_invoice(encoder<scale_encoder_tag>& encoder,
                                           const bytes_view_t& bytes) {
  auto oversized = check_field_lengths(bytes);
  if (oversized.has_value()) {
    return make_error<invoice_t>(invoice_error_code::malformed_record,
                                 std::move(*oversized));
  }

  auto decoded = encoder.try_decode<record_tuple_t>(bytes);
  if (!decoded.has_value()) {
    return make_error<invoice_t>(
        invoice_error_code::malformed_record,
        fmt::format("truncated invoice record of {} bytes", bytes.size()));
  }

  auto& [memo, receipt, birth, preimage, value, settled] = decoded.value();
  auto creation_time = decode_timestamp(encoder, make_bytes_view(birth));
  if (!creation_time.has_value()) {
    return make_error<invoice_t>(invoice_error_code::malformed_record,
                                 "unparsable invoice creation time");
  }

  auto invoice = invoice_t{};
  invoice.memo = std::move(memo);
  invoice.receipt = std::move(receipt);
  invoice.creation_time = *creation_time;
  invoice.terms.payment_preimage = preimage;
  invoice.terms.value = decode_amount(value);
  invoice.terms.settled = settled == 1;
  return make_ok(std::move(invoice));
}

}  // namespace invoicedb::schema::encoding::scale
