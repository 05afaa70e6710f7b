#include "MessageBuilder.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace solwire {

namespace {
// signer+writable, signers, writables, others
int privilegeRank(const AccountMeta &meta) {
  return (meta.isSigner ? 0 : 2) + (meta.isWritable ? 0 : 1);
}

PublicKey decodeBlockhash(const std::string &blockhash) {
  std::vector<uint8_t> decoded;
  try {
    decoded = b58decode(blockhash);
  } catch (const std::runtime_error &) {
    throw MessageError(ErrorKind::InvalidBlockhash,
                       "recent blockhash is not valid base58", blockhash);
  }
  if (decoded.size() != PublicKey::SIZE)
    throw MessageError(ErrorKind::InvalidBlockhash,
                       fmt::format("recent blockhash decodes to {} bytes, "
                                   "expected {}",
                                   decoded.size(), PublicKey::SIZE),
                       blockhash);
  PublicKey result;
  std::copy(decoded.begin(), decoded.end(), result.data.begin());
  return result;
}
}  // namespace

MessageBuilder &MessageBuilder::addInstruction(const Instruction &instruction) {
  accountTable_.addAll(instruction.accounts);
  accountTable_.add(AccountMeta::readOnly(instruction.programId, false));
  instructions_.push_back(instruction);
  return *this;
}

MessageBuilder &MessageBuilder::setFeePayer(const PublicKey &feePayer) {
  feePayer_ = feePayer;
  return *this;
}

MessageBuilder &MessageBuilder::setRecentBlockhash(
    const std::string &recentBlockhash) {
  recentBlockhash_ = recentBlockhash;
  return *this;
}

MessageBuilder &MessageBuilder::setRecentBlockhash(
    const Blockhash &recentBlockhash) {
  return setRecentBlockhash(recentBlockhash.publicKey.toBase58());
}

MessageBuilder &MessageBuilder::setNonceInfo(const NonceInfo &nonceInfo) {
  nonceInfo_ = nonceInfo;
  return *this;
}

MessageBuilder &MessageBuilder::setAccountKeys(
    const std::vector<PublicKey> &accountKeys) {
  accountKeys_ = accountKeys;
  return *this;
}

CompiledMessage MessageBuilder::compile() const {
  if (!recentBlockhash_.has_value() && !nonceInfo_.has_value())
    throw MessageError(ErrorKind::MissingBlockhashOrNonce,
                       "recent blockhash or nonce information is required");
  if (instructions_.empty())
    throw MessageError(ErrorKind::NoInstructions,
                       "no instructions provided in the message");

  // the builder state stays untouched, nonce handling works on copies
  AccountTable table;
  std::vector<Instruction> instructions;
  std::string recentBlockhash;
  if (nonceInfo_.has_value()) {
    const auto &advance = nonceInfo_->instruction;
    recentBlockhash = nonceInfo_->nonce;
    table.addAll(advance.accounts);
    table.add(AccountMeta::readOnly(advance.programId, false));
    instructions.push_back(advance);
  } else {
    recentBlockhash = recentBlockhash_.value();
  }
  table.addAll(accountTable_.snapshot());
  instructions.insert(instructions.end(), instructions_.begin(),
                      instructions_.end());

  const auto accounts = finalizeAccounts(table);
  if (accounts.size() > MAX_ACCOUNTS)
    throw MessageError(ErrorKind::AccountIndexOverflow,
                       fmt::format("message references more than {} accounts",
                                   MAX_ACCOUNTS),
                       std::to_string(accounts.size()));

  CompiledMessage message;
  message.header = MessageHeader::fromAccounts(accounts);
  message.accountKeys.reserve(accounts.size());
  for (const auto &meta : accounts) {
    message.accountKeys.push_back(meta.pubkey);
  }
  // dictionary encode individual instructions
  for (const auto &instruction : instructions) {
    message.instructions.push_back(
        CompiledInstruction::fromInstruction(instruction, message.accountKeys));
  }
  message.recentBlockhash = decodeBlockhash(recentBlockhash);

  spdlog::debug("compiled message: {} accounts, {} instructions, header {}/{}/{}",
                message.accountKeys.size(), message.instructions.size(),
                message.header.requiredSignatures,
                message.header.readOnlySignedAccounts,
                message.header.readOnlyUnsignedAccounts);
  return message;
}

std::vector<uint8_t> MessageBuilder::build() const {
  std::vector<uint8_t> buffer;
  compile().serializeTo(buffer);
  if (spdlog::should_log(spdlog::level::trace)) {
    spdlog::trace("message bytes: {}", toHex(buffer));
  }
  return buffer;
}

std::vector<AccountMeta> MessageBuilder::finalizeAccounts(
    const AccountTable &table) const {
  if (!feePayer_.has_value())
    throw MessageError(ErrorKind::MissingFeePayer,
                       "fee payer is required to build the message");

  auto accounts = table.snapshot();
  std::stable_sort(accounts.begin(), accounts.end(),
                   [](const AccountMeta &a, const AccountMeta &b) {
                     return privilegeRank(a) < privilegeRank(b);
                   });

  // fee payer always comes first, whatever it was merged as
  const auto &feePayer = feePayer_.value();
  accounts.erase(std::remove_if(accounts.begin(), accounts.end(),
                                [&feePayer](const AccountMeta &meta) {
                                  return meta.pubkey == feePayer;
                                }),
                 accounts.end());
  accounts.insert(accounts.begin(), AccountMeta::writable(feePayer, true));

  if (!accountKeys_.has_value()) return accounts;

  // keep the account order of a decoded message
  const auto &order = accountKeys_.value();
  const auto position = [&order](const PublicKey &key) {
    return static_cast<size_t>(std::find(order.begin(), order.end(), key) -
                               order.begin());
  };
  const bool covered = std::all_of(
      accounts.begin(), accounts.end(), [&](const AccountMeta &meta) {
        return position(meta.pubkey) < order.size();
      });
  if (!covered) {
    spdlog::warn(
        "account keys order does not cover all {} message accounts, using "
        "computed order",
        accounts.size());
    return accounts;
  }
  std::stable_sort(accounts.begin(), accounts.end(),
                   [&position](const AccountMeta &a, const AccountMeta &b) {
                     return position(a.pubkey) < position(b.pubkey);
                   });
  return accounts;
}

MessageBuilder MessageBuilder::fromMessage(const CompiledMessage &message) {
  if (message.accountKeys.empty())
    throw MessageError(ErrorKind::MalformedMessage,
                       "message has no fee payer account");
  MessageBuilder builder;
  builder.setFeePayer(message.accountKeys.front())
      .setRecentBlockhash(message.recentBlockhash.toBase58())
      .setAccountKeys(message.accountKeys);
  for (const auto &instruction : message.decompileInstructions()) {
    builder.addInstruction(instruction);
  }
  return builder;
}

MessageBuilder MessageBuilder::fromJson(const json &request) {
  MessageBuilder builder;
  if (request.contains("feePayer")) {
    builder.setFeePayer(request["feePayer"].get<PublicKey>());
  }
  if (request.contains("recentBlockhash")) {
    builder.setRecentBlockhash(request["recentBlockhash"].get<std::string>());
  }
  if (request.contains("nonceInfo")) {
    builder.setNonceInfo(request["nonceInfo"].get<NonceInfo>());
  }
  if (request.contains("accountKeys")) {
    builder.setAccountKeys(
        request["accountKeys"].get<std::vector<PublicKey>>());
  }
  for (const auto &instruction : request.value("instructions", json::array())) {
    builder.addInstruction(instruction.get<Instruction>());
  }
  return builder;
}

}  // namespace solwire
