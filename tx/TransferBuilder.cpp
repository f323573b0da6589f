#include "TransferBuilder.h"
#include "WireWriter.h"
#include "Utilities.h"

namespace dt {
namespace tx {

const char *const TransferBuilder::SYSTEM_PROGRAM_ID = "11111111111111111111111111111111";
const char *const TransferBuilder::COMPUTE_BUDGET_PROGRAM_ID =
    "ComputeBudget111111111111111111111111111111";

namespace {

// Account indices in the message
constexpr uint8_t SENDER_INDEX = 0;
constexpr uint8_t RECEIVER_INDEX = 1;
constexpr uint8_t SYSTEM_PROGRAM_INDEX = 2;
constexpr uint8_t COMPUTE_BUDGET_INDEX = 3;

// Instruction discriminators
constexpr uint8_t SET_COMPUTE_UNIT_LIMIT = 2;
constexpr uint8_t SET_COMPUTE_UNIT_PRICE = 3;
constexpr uint32_t SYSTEM_TRANSFER = 2;

} // namespace

std::string SignedTransaction::id() const { return utl::base58Encode(signature); }

TransferBuilder::Roe<std::string>
TransferBuilder::buildMessage(const PublicKey &sender, const TransferSpec &spec,
                              const std::string &recentBlockhash) {
  auto blockhash = utl::base58Decode(recentBlockhash);
  if (!blockhash || blockhash.value().size() != 32) {
    return Error(E_BLOCKHASH, "Invalid recent blockhash '" + recentBlockhash + "'");
  }
  if (sender.bytes().size() != PublicKey::SIZE ||
      spec.receiver.bytes().size() != PublicKey::SIZE) {
    return Error(E_SIGN, "Sender and receiver keys must be set");
  }

  // Both program ids are fixed, valid base58 constants
  std::string systemProgram = utl::base58Decode(SYSTEM_PROGRAM_ID).value();
  std::string computeBudget = utl::base58Decode(COMPUTE_BUDGET_PROGRAM_ID).value();

  WireWriter msg;

  // header: sender is the only signer, both programs are read-only unsigned
  msg.addU8(1);
  msg.addU8(0);
  msg.addU8(2);

  msg.addShortVec(4);
  msg.addBytes(sender.bytes());
  msg.addBytes(spec.receiver.bytes());
  msg.addBytes(systemProgram);
  msg.addBytes(computeBudget);

  msg.addBytes(blockhash.value());

  msg.addShortVec(3);

  msg.addU8(COMPUTE_BUDGET_INDEX);
  msg.addShortVec(0);
  msg.addShortVec(5);
  msg.addU8(SET_COMPUTE_UNIT_LIMIT);
  msg.addU32(spec.computeUnitLimit);

  msg.addU8(COMPUTE_BUDGET_INDEX);
  msg.addShortVec(0);
  msg.addShortVec(9);
  msg.addU8(SET_COMPUTE_UNIT_PRICE);
  msg.addU64(spec.computeUnitPrice);

  msg.addU8(SYSTEM_PROGRAM_INDEX);
  msg.addShortVec(2);
  msg.addU8(SENDER_INDEX);
  msg.addU8(RECEIVER_INDEX);
  msg.addShortVec(12);
  msg.addU32(SYSTEM_TRANSFER);
  msg.addU64(spec.lamports);

  return msg.release();
}

TransferBuilder::Roe<SignedTransaction>
TransferBuilder::build(const Keypair &sender, const TransferSpec &spec,
                       const std::string &recentBlockhash) {
  auto message = buildMessage(sender.publicKey(), spec, recentBlockhash);
  if (!message) {
    return message.error();
  }

  auto signature = sender.sign(message.value());
  if (!signature) {
    return Error(E_SIGN, signature.error().message);
  }

  SignedTransaction txn;
  txn.message = message.value();
  txn.signature = signature.value();

  WireWriter wire;
  wire.addShortVec(1);
  wire.addBytes(txn.signature);
  wire.addBytes(txn.message);
  txn.wire = wire.release();
  return txn;
}

} // namespace tx
} // namespace dt
