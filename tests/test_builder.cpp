#include <gtest/gtest.h>
#include "tessera/core/builder.hpp"
#include "tessera/core/address.hpp"
#include "tessera/core/errors.hpp"
#include "tessera/core/keys.hpp"

using namespace tessera::core;

namespace {
  const std::string kSecret = "builder passphrase";
  const std::string kSecondSecret = "builder second passphrase";

  std::string recipient_address() {
    return address_from_public_key(derive_public_key("recipient"), mainnet().address_version);
  }
}

TEST(Builder, TransferFillsDefaults) {
  ASSERT_TRUE(crypto_init());
  auto config = mainnet();
  auto tx = transfer(kSecret, recipient_address(), 250, config, fixed_time_source(1234)).build();

  EXPECT_EQ(tx.type, static_cast<uint8_t>(TransactionType::Transfer));
  EXPECT_EQ(tx.timestamp, 1234u);
  EXPECT_EQ(tx.sender_public_key, derive_public_key(kSecret));
  EXPECT_EQ(tx.amount, 250u);
  EXPECT_EQ(tx.fee, config.fees.transfer);
  EXPECT_EQ(tx.recipient_id, recipient_address());
  EXPECT_FALSE(tx.signature.has_value());
}

TEST(Builder, TimeSourceIsReadOnce) {
  ASSERT_TRUE(crypto_init());
  int calls = 0;
  TimeSource counting = [&calls]() { ++calls; return static_cast<uint32_t>(77); };
  TransactionBuilder builder(TransferAsset{}, kSecret, mainnet(), counting);
  auto first = builder.build();
  auto second = builder.build();
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(first.timestamp, second.timestamp);
  EXPECT_EQ(first.get_id(), second.get_id());
}

TEST(Builder, OverridesApply) {
  ASSERT_TRUE(crypto_init());
  auto requester = derive_public_key("requester");
  TransactionBuilder builder(TransferAsset{}, kSecret, testnet(), fixed_time_source(1));
  builder.fee(5).amount(9).vendor_field_text("hi").requester_public_key(requester);
  auto tx = builder.build();
  EXPECT_EQ(tx.fee, 5u);
  EXPECT_EQ(tx.amount, 9u);
  EXPECT_EQ(tx.vendor_field, "6869");
  EXPECT_EQ(tx.requester_public_key, requester);
  EXPECT_EQ(tx.to_bytes().size(), 139u + 33u);
}

TEST(Builder, BuildSurfacesEncodingErrors) {
  ASSERT_TRUE(crypto_init());
  TransactionBuilder bad_recipient(TransferAsset{}, kSecret, mainnet(), fixed_time_source(1));
  bad_recipient.recipient("1111111111111111111114oLvT3");
  EXPECT_THROW(bad_recipient.build(), InvalidAddressError);

  TransactionBuilder long_vendor(TransferAsset{}, kSecret, mainnet(), fixed_time_source(1));
  long_vendor.vendor_field_text(std::string(65, 'v'));
  EXPECT_THROW(long_vendor.build(), VendorFieldTooLongError);
}

TEST(Builder, BuildSignedVerifies) {
  ASSERT_TRUE(crypto_init());
  auto tx = transfer(kSecret, recipient_address(), 1, mainnet(), fixed_time_source(5))
              .build_signed(kSecret, kSecondSecret);
  EXPECT_TRUE(tx.verify());
  EXPECT_TRUE(tx.second_verify(derive_public_key(kSecondSecret)));
  EXPECT_EQ(tx.id, tx.get_id());
}

TEST(Builder, VoteTargetsOwnAddress) {
  ASSERT_TRUE(crypto_init());
  auto config = mainnet();
  auto delegate_key = derive_public_key("delegate");
  auto tx = vote(kSecret, {"+" + delegate_key}, config, fixed_time_source(1)).build();
  EXPECT_EQ(tx.type, static_cast<uint8_t>(TransactionType::Vote));
  EXPECT_EQ(tx.fee, config.fees.vote);
  EXPECT_EQ(tx.recipient_id, address_from_public_key(derive_public_key(kSecret), config.address_version));
  EXPECT_EQ(tx.to_bytes().size(), 139u + 67u);
}

TEST(Builder, VoteRejectsBadEntries) {
  ASSERT_TRUE(crypto_init());
  EXPECT_THROW(vote(kSecret, {}, mainnet(), fixed_time_source(1)), TransactionError);
  EXPECT_THROW(vote(kSecret, {"abc"}, mainnet(), fixed_time_source(1)), TransactionError);
}

TEST(Builder, DelegateAndSecondSignatureRegistration) {
  ASSERT_TRUE(crypto_init());
  auto config = mainnet();
  auto delegate_tx = register_delegate(kSecret, "alice", config, fixed_time_source(1)).build();
  EXPECT_EQ(delegate_tx.fee, config.fees.delegate);
  EXPECT_EQ(std::get<DelegateAsset>(delegate_tx.asset).username, "alice");
  EXPECT_THROW(register_delegate(kSecret, "", config, fixed_time_source(1)), TransactionError);

  auto second_tx = register_second_signature(kSecret, kSecondSecret, config, fixed_time_source(1)).build();
  EXPECT_EQ(second_tx.fee, config.fees.second_signature);
  EXPECT_EQ(std::get<SecondSignatureAsset>(second_tx.asset).public_key, derive_public_key(kSecondSecret));
  EXPECT_EQ(second_tx.to_bytes().size(), 139u + 33u);
}

TEST(Builder, MultiSignatureFeeScalesWithKeysgroup) {
  ASSERT_TRUE(crypto_init());
  auto config = mainnet();
  std::vector<std::string> keysgroup{"+" + derive_public_key("a"), "+" + derive_public_key("b")};
  auto tx = register_multisignature(kSecret, 2, 24, keysgroup, config, fixed_time_source(1)).build();
  EXPECT_EQ(tx.fee, 3 * config.fees.multisignature);
  EXPECT_EQ(tx.to_bytes().size(), 139u + 2u + 2u * 67u);

  EXPECT_THROW(register_multisignature(kSecret, 3, 24, keysgroup, config, fixed_time_source(1)), TransactionError);
  EXPECT_THROW(register_multisignature(kSecret, 1, 24, {}, config, fixed_time_source(1)), TransactionError);
}

TEST(Builder, DefaultFeeSchedule) {
  FeeSchedule fees;
  EXPECT_EQ(default_fee(fees, TransferAsset{}), 10000000u);
  EXPECT_EQ(default_fee(fees, VoteAsset{}), 100000000u);
  EXPECT_EQ(default_fee(fees, MultiSignatureAsset{.min = 1, .lifetime = 1, .keysgroup = {"+a"}}), 1000000000u);
}
