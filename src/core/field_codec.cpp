#include "tessera/core/field_codec.hpp"
#include "tessera/core/address.hpp"
#include "tessera/core/errors.hpp"
#include "tessera/core/hash.hpp"

namespace tessera::core::codec {

  namespace {
    constexpr size_t kCompressedKeyLength = 33;
    constexpr size_t kUncompressedKeyLength = 65;
  }

  void write_public_key(ByteWriter& writer, const std::string& public_key_hex) {
    std::vector<uint8_t> public_key;
    try {
      public_key = from_hex(public_key_hex);
    } catch (const MalformedHexError& ex) {
      throw MalformedKeyError(std::string("public key: ") + ex.what());
    }
    if (public_key.size() != kCompressedKeyLength && public_key.size() != kUncompressedKeyLength)
      throw MalformedKeyError("public key: unexpected length " + std::to_string(public_key.size()));
    writer.write_raw(public_key);
  }

  void write_recipient(ByteWriter& writer, const std::optional<std::string>& recipient_id) {
    if (!recipient_id) {
      writer.write_zeros(kRecipientWidth);
      return;
    }
    const auto address = decode_address(*recipient_id);
    writer.write_raw(address);
  }

  void write_vendor_field(ByteWriter& writer, const std::optional<std::string>& vendor_field_hex) {
    if (!vendor_field_hex) {
      writer.write_zeros(kVendorFieldWidth);
      return;
    }
    const auto vendor_field = from_hex(*vendor_field_hex);
    if (vendor_field.size() > kVendorFieldWidth)
      throw VendorFieldTooLongError("vendor field is " + std::to_string(vendor_field.size()) +
        " bytes, limit is " + std::to_string(kVendorFieldWidth));
    writer.write_raw(vendor_field);
    writer.write_zeros(kVendorFieldWidth - vendor_field.size());
  }

  void write_fee(ByteWriter& writer, const std::optional<uint64_t>& fee) {
    if (!fee) throw MissingFeeError("fee must be set before encoding");
    writer.write_u64(*fee);
  }

  void write_signature(ByteWriter& writer, const std::optional<std::string>& signature_hex, const char* which) {
    if (!signature_hex) throw MissingSignatureError(std::string(which) + " is not set");
    writer.write_raw(from_hex(*signature_hex));
  }
}
