#include "TransferBuilder.h"
#include "Utilities.h"
#include <gtest/gtest.h>

using dt::tx::Keypair;
using dt::tx::PublicKey;
using dt::tx::TransferBuilder;
using dt::tx::TransferSpec;

namespace {

class TransferBuilderTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto keypair = Keypair::fromSeed(std::string(32, '\x11'));
    ASSERT_TRUE(keypair.isOk());
    sender_ = keypair.value();

    auto receiver = PublicKey::fromBytes(std::string(32, '\x22'));
    ASSERT_TRUE(receiver.isOk());
    spec_.receiver = receiver.value();
    spec_.lamports = 1000;

    blockhash_ = dt::utl::base58Encode(std::string(32, '\x05'));
  }

  Keypair sender_;
  TransferSpec spec_;
  std::string blockhash_;
};

} // namespace

TEST_F(TransferBuilderTest, MessageLayout) {
  auto message = TransferBuilder::buildMessage(sender_.publicKey(), spec_, blockhash_);
  ASSERT_TRUE(message.isOk()) << message.error().message;
  const std::string &m = *message;
  ASSERT_EQ(m.size(), 202u);

  // header and account keys
  EXPECT_EQ(m.substr(0, 4), std::string("\x01\x00\x02\x04", 4));
  EXPECT_EQ(m.substr(4, 32), sender_.publicKey().bytes());
  EXPECT_EQ(m.substr(36, 32), std::string(32, '\x22'));
  EXPECT_EQ(m.substr(68, 32), std::string(32, '\0'));
  EXPECT_EQ(dt::utl::base58Encode(m.substr(100, 32)),
            TransferBuilder::COMPUTE_BUDGET_PROGRAM_ID);
  EXPECT_EQ(m.substr(132, 32), std::string(32, '\x05'));

  // three instructions
  EXPECT_EQ(m[164], '\x03');
  EXPECT_EQ(m.substr(165, 8), std::string("\x03\x00\x05\x02\x50\xc3\x00\x00", 8));
  EXPECT_EQ(m.substr(173, 12),
            std::string("\x03\x00\x09\x03\x10\x27\x00\x00\x00\x00\x00\x00", 12));
  EXPECT_EQ(m.substr(185, 17),
            std::string("\x02\x02\x00\x01\x0c\x02\x00\x00\x00\xe8\x03\x00\x00\x00\x00\x00\x00",
                        17));
}

TEST_F(TransferBuilderTest, SignedWireForm) {
  auto txn = TransferBuilder::build(sender_, spec_, blockhash_);
  ASSERT_TRUE(txn.isOk()) << txn.error().message;

  EXPECT_EQ(txn->signature.size(), 64u);
  EXPECT_EQ(txn->wire.size(), 1u + 64u + txn->message.size());
  EXPECT_EQ(txn->wire[0], '\x01');
  EXPECT_EQ(txn->wire.substr(1, 64), txn->signature);
  EXPECT_EQ(txn->wire.substr(65), txn->message);
  EXPECT_LE(txn->wire.size(), 1232u);

  EXPECT_TRUE(dt::utl::ed25519Verify(sender_.publicKey().bytes(), txn->message,
                                     txn->signature));
  EXPECT_EQ(txn->id(), dt::utl::base58Encode(txn->signature));
}

TEST_F(TransferBuilderTest, FreshBlockhashGivesNewIdentifier) {
  auto first = TransferBuilder::build(sender_, spec_, blockhash_);
  auto second = TransferBuilder::build(sender_, spec_,
                                       dt::utl::base58Encode(std::string(32, '\x06')));
  ASSERT_TRUE(first.isOk() && second.isOk());
  EXPECT_NE(first->id(), second->id());

  // Same inputs sign the same bytes; only the blockhash separates two submissions
  auto repeat = TransferBuilder::build(sender_, spec_, blockhash_);
  ASSERT_TRUE(repeat.isOk());
  EXPECT_EQ(first->id(), repeat->id());
}

TEST_F(TransferBuilderTest, ComputeBudgetValuesAreEncoded) {
  spec_.computeUnitLimit = 200000;
  spec_.computeUnitPrice = 1;
  spec_.lamports = 5;
  auto message = TransferBuilder::buildMessage(sender_.publicKey(), spec_, blockhash_);
  ASSERT_TRUE(message.isOk());
  EXPECT_EQ(message->substr(169, 4), std::string("\x40\x0d\x03\x00", 4));
  EXPECT_EQ(message->substr(177, 8), std::string("\x01\x00\x00\x00\x00\x00\x00\x00", 8));
  EXPECT_EQ(message->substr(194, 8), std::string("\x05\x00\x00\x00\x00\x00\x00\x00", 8));
}

TEST_F(TransferBuilderTest, InvalidBlockhashIsRejected) {
  for (const std::string hash : { "", "not-base58!", "1111" }) {
    auto txn = TransferBuilder::build(sender_, spec_, hash);
    ASSERT_TRUE(txn.isError()) << hash;
    EXPECT_EQ(txn.error().code, TransferBuilder::E_BLOCKHASH);
  }
}

TEST_F(TransferBuilderTest, UnsetKeysAreRejected) {
  TransferSpec noReceiver;
  auto txn = TransferBuilder::build(sender_, noReceiver, blockhash_);
  ASSERT_TRUE(txn.isError());
  EXPECT_EQ(txn.error().code, TransferBuilder::E_SIGN);
}
