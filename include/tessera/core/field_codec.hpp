#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include <tessera/core/serializer.hpp>

namespace tessera::core::codec {

  constexpr size_t kTypeWidth = 1;
  constexpr size_t kTimestampWidth = 4;
  constexpr size_t kRecipientWidth = 21;
  constexpr size_t kVendorFieldWidth = 64;
  constexpr size_t kAmountWidth = 8;
  constexpr size_t kFeeWidth = 8;

  inline void write_type(ByteWriter& writer, uint8_t type) { writer.write_u8(type); }
  inline void write_timestamp(ByteWriter& writer, uint32_t timestamp) { writer.write_u32(timestamp); }
  inline void write_amount(ByteWriter& writer, uint64_t amount) { writer.write_u64(amount); }

  // Raw decoded key bytes, no length prefix. Throws MalformedKeyError.
  void write_public_key(ByteWriter& writer, const std::string& public_key_hex);

  // Decoded address, or 21 zero bytes when absent. Throws InvalidAddressError.
  void write_recipient(ByteWriter& writer, const std::optional<std::string>& recipient_id);

  // Decoded payload right-padded with zeros to 64 bytes. Throws
  // MalformedHexError or VendorFieldTooLongError.
  void write_vendor_field(ByteWriter& writer, const std::optional<std::string>& vendor_field_hex);

  // Throws MissingFeeError when the fee is unset.
  void write_fee(ByteWriter& writer, const std::optional<uint64_t>& fee);

  // Raw decoded signature bytes. Throws MissingSignatureError when absent.
  void write_signature(ByteWriter& writer, const std::optional<std::string>& signature_hex, const char* which);
}
