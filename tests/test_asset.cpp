#include <gtest/gtest.h>
#include "tessera/core/asset.hpp"
#include "tessera/core/errors.hpp"
#include "tessera/core/hash.hpp"

using namespace tessera::core;

namespace {
  std::vector<uint8_t> encode(TransactionType type, const Asset& asset) {
    ByteWriter writer;
    encode_asset(writer, static_cast<uint8_t>(type), asset);
    return writer.take();
  }

  std::vector<uint8_t> bytes_of(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
  }

  const std::string kKey = "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";
}

TEST(Asset, TransferAppendsNothing) {
  EXPECT_TRUE(encode(TransactionType::Transfer, TransferAsset{}).empty());
}

TEST(Asset, SecondSignatureAppendsRawKey) {
  EXPECT_EQ(encode(TransactionType::SecondSignature, SecondSignatureAsset{kKey}), from_hex(kKey));
}

TEST(Asset, SecondSignatureRejectsMalformedKey) {
  EXPECT_THROW(encode(TransactionType::SecondSignature, SecondSignatureAsset{"nothex"}), MalformedKeyError);
}

TEST(Asset, DelegateAppendsUsername) {
  EXPECT_EQ(encode(TransactionType::Delegate, DelegateAsset{"genesis_1"}), bytes_of("genesis_1"));
}

TEST(Asset, VoteAppendsConcatenatedVotes) {
  VoteAsset vote{{"+" + kKey, "-" + kKey}};
  EXPECT_EQ(encode(TransactionType::Vote, vote), bytes_of("+" + kKey + "-" + kKey));
}

TEST(Asset, MultiSignatureAppendsMinLifetimeAndKeys) {
  MultiSignatureAsset multi{.min = 2, .lifetime = 24, .keysgroup = {"+" + kKey, "+abcd"}};
  auto out = encode(TransactionType::MultiSignature, multi);
  auto expected = bytes_of("+" + kKey + "+abcd");
  expected.insert(expected.begin(), {0x02, 0x18});
  EXPECT_EQ(out, expected);
}

TEST(Asset, OnlyAppendsToExistingBytes) {
  ByteWriter writer;
  writer.write_u32(0xDEADBEEFu);
  encode_asset(writer, static_cast<uint8_t>(TransactionType::Delegate), DelegateAsset{"x"});
  std::vector<uint8_t> expected{0xEF, 0xBE, 0xAD, 0xDE, 'x'};
  EXPECT_EQ(writer.buffer(), expected);
}

TEST(Asset, UnknownTypeIsRejected) {
  ByteWriter writer;
  EXPECT_THROW(encode_asset(writer, 9, TransferAsset{}), UnrecognizedTypeError);
  EXPECT_THROW(encode_asset(writer, 255, TransferAsset{}), UnrecognizedTypeError);
  EXPECT_EQ(writer.size(), 0u);
}

TEST(Asset, TypeMustMatchAsset) {
  ByteWriter writer;
  EXPECT_THROW(encode_asset(writer, static_cast<uint8_t>(TransactionType::Vote), TransferAsset{}),
               UnrecognizedTypeError);
}

TEST(Asset, TypeLookup) {
  EXPECT_EQ(asset_type(VoteAsset{}), TransactionType::Vote);
  EXPECT_EQ(transaction_type_from(2), TransactionType::Delegate);
  EXPECT_FALSE(transaction_type_from(5).has_value());
  EXPECT_STREQ(type_name(TransactionType::MultiSignature), "multisignature");
}

TEST(Asset, OverloadedVisitorDispatchesPerAlternative) {
  auto entries = [](const Asset& asset) {
    return std::visit(overloaded{
      [](const VoteAsset& vote) { return vote.votes.size(); },
      [](const MultiSignatureAsset& multi) { return multi.keysgroup.size(); },
      [](const auto&) -> size_t { return 0; },
    }, asset);
  };
  EXPECT_EQ(entries(VoteAsset{{"+02aa", "-03bb"}}), 2u);
  EXPECT_EQ(entries(MultiSignatureAsset{2, 24, {"+02aa", "+03bb", "+02cc"}}), 3u);
  EXPECT_EQ(entries(DelegateAsset{"genesis"}), 0u);
}
