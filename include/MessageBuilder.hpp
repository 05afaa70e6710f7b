#pragma once

#include <optional>
#include <string>
#include <vector>

#include "solwire.hpp"

namespace solwire {

/**
 * Accumulates instructions and compiles them into a message.
 *
 * Account references are merged as instructions are added. The final account
 * order is only fixed by `compile`/`build`: signer+writable, signers,
 * writables, others, with the fee payer moved to the front. `build` does not
 * modify the builder, calling it again yields the same bytes.
 */
class MessageBuilder {
 public:
  /**
   * Merge the instruction's accounts and program id into the account table
   * and append it to the instruction list
   */
  MessageBuilder &addInstruction(const Instruction &instruction);

  MessageBuilder &setFeePayer(const PublicKey &feePayer);

  /**
   * @param recentBlockhash base58 encoded blockhash
   */
  MessageBuilder &setRecentBlockhash(const std::string &recentBlockhash);

  MessageBuilder &setRecentBlockhash(const Blockhash &recentBlockhash);

  /**
   * Use a durable nonce instead of the recent blockhash. Takes precedence
   * over `setRecentBlockhash`.
   */
  MessageBuilder &setNonceInfo(const NonceInfo &nonceInfo);

  /**
   * Account order of a previously decoded message. When it covers every
   * account of the compiled message, that order is kept so an unmodified
   * message serializes to the same bytes.
   */
  MessageBuilder &setAccountKeys(const std::vector<PublicKey> &accountKeys);

  /**
   * Finalize the account table and compile all instructions
   * @throws MessageError
   */
  CompiledMessage compile() const;

  /**
   * Compile and serialize into the wire format
   * @throws MessageError
   */
  std::vector<uint8_t> build() const;

  /**
   * Builder reproducing a decoded message: the first account becomes the fee
   * payer and the message's account order is kept
   */
  static MessageBuilder fromMessage(const CompiledMessage &message);

  /**
   * Builder from a json message request:
   * {"feePayer", "recentBlockhash", "nonceInfo", "accountKeys",
   * "instructions"}
   */
  static MessageBuilder fromJson(const json &request);

  const std::optional<PublicKey> &feePayer() const { return feePayer_; }

  const std::vector<Instruction> &instructions() const {
    return instructions_;
  }

  const AccountTable &accountTable() const { return accountTable_; }

 private:
  std::vector<AccountMeta> finalizeAccounts(const AccountTable &table) const;

  AccountTable accountTable_;
  std::vector<Instruction> instructions_;
  std::optional<std::string> recentBlockhash_;
  std::optional<NonceInfo> nonceInfo_;
  std::optional<PublicKey> feePayer_;
  std::optional<std::vector<PublicKey>> accountKeys_;
};

}  // namespace solwire
