#include "solwire.hpp"

#include <libbase58.h>
#include <sodium.h>

#include <algorithm>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace solwire {

///
/// Errors
std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::MissingBlockhashOrNonce:
      return "MissingBlockhashOrNonce";
    case ErrorKind::NoInstructions:
      return "NoInstructions";
    case ErrorKind::MissingFeePayer:
      return "MissingFeePayer";
    case ErrorKind::InvalidBlockhash:
      return "InvalidBlockhash";
    case ErrorKind::AccountIndexOverflow:
      return "AccountIndexOverflow";
    case ErrorKind::HeaderCountOverflow:
      return "HeaderCountOverflow";
    case ErrorKind::AccountNotFound:
      return "AccountNotFound";
    case ErrorKind::MalformedCompactLength:
      return "MalformedCompactLength";
    case ErrorKind::MalformedMessage:
      return "MalformedMessage";
  }
  return "Unknown";
}

MessageError::MessageError(ErrorKind kind, const std::string &message,
                           const std::string &value)
    : std::runtime_error(to_string(kind) + ": " + message +
                         (value.empty() ? "" : " '" + value + "'")),
      kind_(kind),
      value_(value) {}

///
/// Encoding helpers
std::string b58encode(const std::vector<uint8_t> &bin) {
  if (bin.empty()) return "";
  // base58 needs ~1.37 chars per byte, plus the terminator
  std::string b58(bin.size() * 2 + 1, '\0');
  size_t b58Size = b58.size();
  if (!b58enc(b58.data(), &b58Size, bin.data(), bin.size()))
    throw std::runtime_error("could not base58 encode " +
                             std::to_string(bin.size()) + " bytes");
  // b58Size counts the terminator
  b58.resize(b58Size - 1);
  return b58;
}

std::vector<uint8_t> b58decode(const std::string &b58) {
  if (b58.empty()) return {};
  // every char carries less than a byte of information
  std::vector<uint8_t> bin(b58.size());
  size_t binSize = bin.size();
  if (!b58tobin(bin.data(), &binSize, b58.c_str(), b58.size()))
    throw std::runtime_error("invalid base58 '" + b58 + "'");
  // libbase58 right-aligns the result in the output buffer
  bin.erase(bin.begin(), bin.end() - binSize);
  return bin;
}

std::string toHex(const std::vector<uint8_t> &bin) {
  std::string hex(bin.size() * 2 + 1, '\0');
  sodium_bin2hex(hex.data(), hex.size(), bin.data(), bin.size());
  hex.pop_back();
  return hex;
}

///
/// PublicKey
PublicKey PublicKey::empty() { return {}; }

PublicKey PublicKey::fromBase58(const std::string &b58) {
  PublicKey result = {};
  size_t decodedSize = SIZE;
  const auto ok = b58tobin(result.data.data(), &decodedSize, b58.c_str(),
                           b58.size());
  if (!ok) throw std::runtime_error("invalid base58 '" + b58 + "'");
  if (decodedSize != SIZE)
    throw std::runtime_error("not a valid PublicKey '" +
                             std::to_string(decodedSize) +
                             " != " + std::to_string(SIZE) + "'");
  return result;
}

bool PublicKey::operator==(const PublicKey &other) const {
  return data == other.data;
}

bool PublicKey::operator!=(const PublicKey &other) const {
  return data != other.data;
}

bool PublicKey::operator<(const PublicKey &other) const {
  return data < other.data;
}

std::string PublicKey::toBase58() const {
  return b58encode(std::vector<uint8_t>(data.begin(), data.end()));
}

void to_json(json &j, const PublicKey &key) { j = key.toBase58(); }

void from_json(const json &j, PublicKey &key) {
  key = PublicKey::fromBase58(j.get<std::string>());
}

///
/// AccountMeta
AccountMeta AccountMeta::writable(const PublicKey &pubkey, bool isSigner) {
  return {pubkey, isSigner, true};
}

AccountMeta AccountMeta::readOnly(const PublicKey &pubkey, bool isSigner) {
  return {pubkey, isSigner, false};
}

void to_json(json &j, const AccountMeta &meta) {
  j["pubkey"] = meta.pubkey;
  j["isSigner"] = meta.isSigner;
  j["isWritable"] = meta.isWritable;
}

void from_json(const json &j, AccountMeta &meta) {
  meta.pubkey = j.at("pubkey").get<PublicKey>();
  meta.isSigner = j.value("isSigner", false);
  meta.isWritable = j.value("isWritable", false);
}

///
/// Instruction
void to_json(json &j, const Instruction &ix) {
  j["programId"] = ix.programId;
  j["accounts"] = ix.accounts;
  j["data"] = b58encode(ix.data);
}

void from_json(const json &j, Instruction &ix) {
  ix.programId = j.at("programId").get<PublicKey>();
  ix.accounts = j.value("accounts", std::vector<AccountMeta>{});
  ix.data = b58decode(j.value("data", std::string{}));
}

void to_json(json &j, const NonceInfo &info) {
  j["nonce"] = info.nonce;
  j["instruction"] = info.instruction;
}

void from_json(const json &j, NonceInfo &info) {
  info.nonce = j.at("nonce").get<std::string>();
  info.instruction = j.at("instruction").get<Instruction>();
}

///
/// CompactU16
namespace CompactU16 {
void encode(uint64_t num, std::vector<uint8_t> &buffer) {
  buffer.push_back(num & 0x7f);
  num >>= 7;
  while (num != 0) {
    buffer.back() |= 0x80;
    buffer.push_back(num & 0x7f);
    num >>= 7;
  }
}

void encode(const std::vector<uint8_t> &vec, std::vector<uint8_t> &buffer) {
  encode(vec.size(), buffer);
  buffer.insert(buffer.end(), vec.begin(), vec.end());
}

size_t encodedLength(uint64_t num) {
  size_t length = 1;
  while (num >>= 7) length++;
  return length;
}

std::pair<uint64_t, size_t> decode(const uint8_t *data, size_t size) {
  uint64_t value = 0;
  for (size_t i = 0; i < size; i++) {
    const uint64_t group = data[i] & 0x7f;
    const size_t shift = 7 * i;
    if (shift >= 64 || (shift > 0 && (group >> (64 - shift)) != 0))
      throw MessageError(ErrorKind::MalformedCompactLength,
                         "compact length does not fit 64 bits",
                         std::to_string(i + 1) + " bytes");
    value |= group << shift;
    if ((data[i] & 0x80) == 0) return {value, i + 1};
  }
  throw MessageError(ErrorKind::MalformedCompactLength,
                     "truncated compact length",
                     std::to_string(size) + " bytes");
}

std::pair<uint64_t, size_t> decode(const std::vector<uint8_t> &buffer,
                                   size_t offset) {
  if (offset >= buffer.size()) return decode(nullptr, 0);
  return decode(buffer.data() + offset, buffer.size() - offset);
}
}  // namespace CompactU16

///
/// AccountTable
void AccountTable::add(const AccountMeta &meta) {
  auto dup = std::find_if(
      accounts_.begin(), accounts_.end(),
      [&meta](const auto &u) { return u.pubkey == meta.pubkey; });

  if (dup == accounts_.end()) {
    accounts_.push_back(meta);
  } else {
    // merge, assign maximum privileges
    dup->isSigner |= meta.isSigner;
    dup->isWritable |= meta.isWritable;
  }
}

void AccountTable::addAll(const std::vector<AccountMeta> &metas) {
  for (const auto &meta : metas) {
    add(meta);
  }
}

bool AccountTable::remove(const PublicKey &pubkey) {
  const auto index = indexOf(pubkey);
  if (!index.has_value()) return false;
  accounts_.erase(accounts_.begin() + index.value());
  return true;
}

std::optional<size_t> AccountTable::indexOf(const PublicKey &pubkey) const {
  const auto it = std::find_if(
      accounts_.begin(), accounts_.end(),
      [&pubkey](const auto &u) { return u.pubkey == pubkey; });
  if (it == accounts_.end()) return std::nullopt;
  return static_cast<size_t>(it - accounts_.begin());
}

bool AccountTable::contains(const PublicKey &pubkey) const {
  return indexOf(pubkey).has_value();
}

///
/// MessageHeader
MessageHeader MessageHeader::fromAccounts(
    const std::vector<AccountMeta> &accounts) {
  size_t requiredSignatures = 0;
  size_t readOnlySignedAccounts = 0;
  size_t readOnlyUnsignedAccounts = 0;
  for (const auto &meta : accounts) {
    if (meta.isSigner) {
      requiredSignatures++;
      if (!meta.isWritable) {
        readOnlySignedAccounts++;
      }
    } else if (!meta.isWritable) {
      readOnlyUnsignedAccounts++;
    }
  }

  const auto checkCount = [](const char *field, size_t count) {
    if (count > UINT8_MAX)
      throw MessageError(ErrorKind::HeaderCountOverflow,
                         std::string(field) + " does not fit in a byte",
                         std::to_string(count));
    return static_cast<uint8_t>(count);
  };
  MessageHeader header;
  header.requiredSignatures = checkCount("requiredSignatures",
                                         requiredSignatures);
  header.readOnlySignedAccounts =
      checkCount("readOnlySignedAccounts", readOnlySignedAccounts);
  header.readOnlyUnsignedAccounts =
      checkCount("readOnlyUnsignedAccounts", readOnlyUnsignedAccounts);
  return header;
}

void MessageHeader::serializeTo(std::vector<uint8_t> &buffer) const {
  buffer.push_back(requiredSignatures);
  buffer.push_back(readOnlySignedAccounts);
  buffer.push_back(readOnlyUnsignedAccounts);
}

void to_json(json &j, const MessageHeader &header) {
  j["numRequiredSignatures"] = header.requiredSignatures;
  j["numReadonlySignedAccounts"] = header.readOnlySignedAccounts;
  j["numReadonlyUnsignedAccounts"] = header.readOnlyUnsignedAccounts;
}

namespace {
// json numbers are not narrowed, a byte field outside 0..255 is rejected
uint8_t byteField(const json &j, const std::string &field) {
  if (!j.is_number_integer() ||
      (!j.is_number_unsigned() && j.get<int64_t>() < 0) ||
      j.get<uint64_t>() > UINT8_MAX)
    throw MessageError(ErrorKind::MalformedMessage,
                       field + " does not fit in a byte", j.dump());
  return static_cast<uint8_t>(j.get<uint64_t>());
}
}  // namespace

void from_json(const json &j, MessageHeader &header) {
  header.requiredSignatures =
      byteField(j.at("numRequiredSignatures"), "numRequiredSignatures");
  header.readOnlySignedAccounts = byteField(
      j.at("numReadonlySignedAccounts"), "numReadonlySignedAccounts");
  header.readOnlyUnsignedAccounts = byteField(
      j.at("numReadonlyUnsignedAccounts"), "numReadonlyUnsignedAccounts");
}

///
/// CompiledInstruction
namespace {
uint8_t findAccountIndex(const std::vector<PublicKey> &accounts,
                         const PublicKey &pubkey) {
  const auto it = std::find(accounts.begin(), accounts.end(), pubkey);
  if (it == accounts.end())
    throw MessageError(ErrorKind::AccountNotFound,
                       "account was not found among the message accounts",
                       pubkey.toBase58());
  const auto index = static_cast<size_t>(it - accounts.begin());
  if (index > UINT8_MAX)
    throw MessageError(ErrorKind::AccountIndexOverflow,
                       "account index does not fit in a byte",
                       std::to_string(index));
  return static_cast<uint8_t>(index);
}
}  // namespace

CompiledInstruction CompiledInstruction::fromInstruction(
    const Instruction &ix, const std::vector<PublicKey> &accounts) {
  const auto programIdIndex = findAccountIndex(accounts, ix.programId);
  std::vector<uint8_t> accountIndices;
  accountIndices.reserve(ix.accounts.size());
  for (const auto &account : ix.accounts) {
    accountIndices.push_back(findAccountIndex(accounts, account.pubkey));
  }
  return {programIdIndex, accountIndices, ix.data};
}

void CompiledInstruction::serializeTo(std::vector<uint8_t> &buffer) const {
  buffer.push_back(programIdIndex);
  CompactU16::encode(accountIndices, buffer);
  CompactU16::encode(data, buffer);
}

void to_json(json &j, const CompiledInstruction &ix) {
  j["programIdIndex"] = ix.programIdIndex;
  j["accounts"] = ix.accountIndices;
  j["data"] = b58encode(ix.data);
}

void from_json(const json &j, CompiledInstruction &ix) {
  ix.programIdIndex = byteField(j.at("programIdIndex"), "programIdIndex");
  ix.accountIndices.clear();
  for (const auto &index : j.at("accounts").get<std::vector<json>>()) {
    ix.accountIndices.push_back(byteField(index, "accounts"));
  }
  ix.data = b58decode(j.value("data", std::string{}));
}

}  // namespace solwire
