#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include "solwire.hpp"

namespace solwire {

namespace {
/**
 * Sequential reader over a serialized message, every read is bounds checked
 */
class MessageReader {
 public:
  explicit MessageReader(const std::vector<uint8_t> &buffer)
      : buffer_(buffer) {}

  uint8_t readByte(const char *field) {
    require(1, field);
    return buffer_[offset_++];
  }

  uint64_t readCompact() {
    const auto [value, consumed] = CompactU16::decode(buffer_, offset_);
    offset_ += consumed;
    return value;
  }

  std::vector<uint8_t> readBytes(uint64_t size, const char *field) {
    require(size, field);
    const auto begin = buffer_.begin() + offset_;
    offset_ += size;
    return std::vector<uint8_t>(begin, begin + size);
  }

  PublicKey readPublicKey(const char *field) {
    require(PublicKey::SIZE, field);
    PublicKey key;
    std::copy_n(buffer_.begin() + offset_, PublicKey::SIZE, key.data.begin());
    offset_ += PublicKey::SIZE;
    return key;
  }

  size_t remaining() const { return buffer_.size() - offset_; }

 private:
  void require(uint64_t size, const char *field) const {
    if (size > remaining())
      throw MessageError(ErrorKind::MalformedMessage,
                         std::string("message truncated while reading ") +
                             field,
                         "offset " + std::to_string(offset_));
  }

  const std::vector<uint8_t> &buffer_;
  size_t offset_ = 0;
};

// header counts and instruction indices must agree with the account keys
void checkConsistency(const CompiledMessage &message) {
  const auto accountCount = message.accountKeys.size();
  const auto &header = message.header;
  // the fee payer is the first signer and is always writable
  if (header.requiredSignatures == 0 ||
      header.readOnlySignedAccounts >= header.requiredSignatures)
    throw MessageError(ErrorKind::MalformedMessage,
                       "header has no writable fee payer signer",
                       std::to_string(header.requiredSignatures) +
                           " signatures");
  if (header.requiredSignatures > accountCount ||
      header.readOnlyUnsignedAccounts >
          accountCount - header.requiredSignatures)
    throw MessageError(ErrorKind::MalformedMessage,
                       "header counts do not match the account keys",
                       std::to_string(accountCount) + " accounts");

  const auto checkIndex = [accountCount](uint8_t index) {
    if (index >= accountCount)
      throw MessageError(ErrorKind::MalformedMessage,
                         "account index out of range",
                         std::to_string(index));
  };
  for (const auto &ix : message.instructions) {
    checkIndex(ix.programIdIndex);
    std::for_each(ix.accountIndices.begin(), ix.accountIndices.end(),
                  checkIndex);
  }
}
}  // namespace

///
/// CompiledMessage
void CompiledMessage::serializeTo(std::vector<uint8_t> &buffer) const {
  header.serializeTo(buffer);

  CompactU16::encode(accountKeys.size(), buffer);
  for (const auto &account : accountKeys) {
    buffer.insert(buffer.end(), account.data.begin(), account.data.end());
  }

  buffer.insert(buffer.end(), recentBlockhash.data.begin(),
                recentBlockhash.data.end());

  CompactU16::encode(instructions.size(), buffer);
  for (const auto &instruction : instructions) {
    instruction.serializeTo(buffer);
  }
}

std::vector<uint8_t> CompiledMessage::serialize() const {
  std::vector<uint8_t> buffer;
  serializeTo(buffer);
  return buffer;
}

CompiledMessage CompiledMessage::deserialize(
    const std::vector<uint8_t> &buffer) {
  MessageReader reader(buffer);
  CompiledMessage message;
  message.header.requiredSignatures = reader.readByte("header");
  message.header.readOnlySignedAccounts = reader.readByte("header");
  message.header.readOnlyUnsignedAccounts = reader.readByte("header");

  const auto accountCount = reader.readCompact();
  if (accountCount > reader.remaining() / PublicKey::SIZE)
    throw MessageError(ErrorKind::MalformedMessage,
                       "account count exceeds message size",
                       std::to_string(accountCount));
  for (uint64_t i = 0; i < accountCount; i++) {
    message.accountKeys.push_back(reader.readPublicKey("account keys"));
  }
  message.recentBlockhash = reader.readPublicKey("recent blockhash");

  const auto instructionCount = reader.readCompact();
  for (uint64_t i = 0; i < instructionCount; i++) {
    CompiledInstruction ix;
    ix.programIdIndex = reader.readByte("program id index");
    ix.accountIndices =
        reader.readBytes(reader.readCompact(), "account indices");
    ix.data = reader.readBytes(reader.readCompact(), "instruction data");
    message.instructions.push_back(std::move(ix));
  }

  if (reader.remaining() != 0)
    throw MessageError(ErrorKind::MalformedMessage,
                       "trailing bytes after the last instruction",
                       std::to_string(reader.remaining()));
  checkConsistency(message);
  return message;
}

bool CompiledMessage::isSigner(size_t index) const {
  return index < header.requiredSignatures;
}

bool CompiledMessage::isWritable(size_t index) const {
  if (index < header.requiredSignatures)
    return index < static_cast<size_t>(header.requiredSignatures -
                                       header.readOnlySignedAccounts);
  return index + header.readOnlyUnsignedAccounts < accountKeys.size();
}

std::vector<Instruction> CompiledMessage::decompileInstructions() const {
  const auto metaAt = [this](size_t index) -> AccountMeta {
    if (index >= accountKeys.size())
      throw MessageError(ErrorKind::AccountNotFound,
                         "account index out of range",
                         std::to_string(index));
    return {accountKeys[index], isSigner(index), isWritable(index)};
  };

  std::vector<Instruction> result;
  for (const auto &cix : instructions) {
    Instruction ix;
    ix.programId = metaAt(cix.programIdIndex).pubkey;
    for (const auto index : cix.accountIndices) {
      ix.accounts.push_back(metaAt(index));
    }
    ix.data = cix.data;
    result.push_back(std::move(ix));
  }
  return result;
}

void to_json(json &j, const CompiledMessage &message) {
  j["header"] = message.header;
  j["accountKeys"] = message.accountKeys;
  j["recentBlockhash"] = message.recentBlockhash;
  j["instructions"] = message.instructions;
}

void from_json(const json &j, CompiledMessage &message) {
  message.header = j.at("header").get<MessageHeader>();
  message.accountKeys = j.at("accountKeys").get<std::vector<PublicKey>>();
  message.recentBlockhash = j.at("recentBlockhash").get<PublicKey>();
  message.instructions =
      j.at("instructions").get<std::vector<CompiledInstruction>>();
  checkConsistency(message);
}

}  // namespace solwire
