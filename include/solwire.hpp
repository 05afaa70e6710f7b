#pragma once

#include <sodium.h>

#include <array>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace solwire {
using json = nlohmann::json;

const std::string SYSTEM_PROGRAM_ID = "11111111111111111111111111111111";
const std::string MEMO_PROGRAM_ID =
    "MemoSq4gqABAXKb96qnH8TysNcWxMyWCqXgDLGmfcHr";
const std::string SYSVAR_RECENT_BLOCKHASHES_ID =
    "SysvarRecentB1ockHashes11111111111111111111";

/**
 * Maximum number of accounts a message can address with a single byte index
 */
constexpr size_t MAX_ACCOUNTS = 256;

///
/// Errors
enum class ErrorKind {
  MissingBlockhashOrNonce,
  NoInstructions,
  MissingFeePayer,
  InvalidBlockhash,
  AccountIndexOverflow,
  HeaderCountOverflow,
  AccountNotFound,
  MalformedCompactLength,
  MalformedMessage,
};

std::string to_string(ErrorKind kind);

/**
 * Raised by the message compiler. `value` holds the offending input (a base58
 * key, a count, a blockhash) when there is one.
 */
class MessageError : public std::runtime_error {
 public:
  MessageError(ErrorKind kind, const std::string &message,
               const std::string &value = "");

  ErrorKind kind() const { return kind_; }

  const std::string &value() const { return value_; }

 private:
  ErrorKind kind_;
  std::string value_;
};

///
/// Encoding helpers
std::string b58encode(const std::vector<uint8_t> &bin);

/**
 * Decode base58 text
 * @throws std::runtime_error if the text is not valid base58
 */
std::vector<uint8_t> b58decode(const std::string &b58);

std::string toHex(const std::vector<uint8_t> &bin);

struct PublicKey {
  static constexpr size_t SIZE = crypto_sign_PUBLICKEYBYTES;
  typedef std::array<uint8_t, SIZE> array_t;

  array_t data;

  static PublicKey empty();

  static PublicKey fromBase58(const std::string &b58);

  bool operator==(const PublicKey &other) const;

  bool operator!=(const PublicKey &other) const;

  bool operator<(const PublicKey &other) const;

  std::string toBase58() const;
};

struct Blockhash {
  PublicKey publicKey;
  uint64_t lastValidBlockHeight;
};

/**
 * Account metadata used to define instructions
 */
struct AccountMeta {
  PublicKey pubkey;
  bool isSigner;
  bool isWritable;

  static AccountMeta writable(const PublicKey &pubkey, bool isSigner);

  static AccountMeta readOnly(const PublicKey &pubkey, bool isSigner);
};

struct Instruction {
  PublicKey programId;
  std::vector<AccountMeta> accounts;
  std::vector<uint8_t> data;
};

/**
 * Durable nonce used in place of a recent blockhash
 */
struct NonceInfo {
  /** base58 nonce value, becomes the message's recent blockhash */
  std::string nonce;
  /** advances the nonce, always executed first */
  Instruction instruction;
};

namespace CompactU16 {
void encode(uint64_t num, std::vector<uint8_t> &buffer);

void encode(const std::vector<uint8_t> &vec, std::vector<uint8_t> &buffer);

size_t encodedLength(uint64_t num);

/**
 * Decode a compact length
 * @return the value and the number of bytes it occupied
 * @throws MessageError(MalformedCompactLength) on a truncated sequence
 */
std::pair<uint64_t, size_t> decode(const uint8_t *data, size_t size);

std::pair<uint64_t, size_t> decode(const std::vector<uint8_t> &buffer,
                                   size_t offset);
};  // namespace CompactU16

/**
 * Deduplicating account list. Insertion order is kept, a repeated key has its
 * signer and writable flags OR-ed into the existing entry.
 */
class AccountTable {
 public:
  void add(const AccountMeta &meta);

  void addAll(const std::vector<AccountMeta> &metas);

  /**
   * Drop the entry for `pubkey`
   * @return false if there was none
   */
  bool remove(const PublicKey &pubkey);

  std::optional<size_t> indexOf(const PublicKey &pubkey) const;

  bool contains(const PublicKey &pubkey) const;

  const std::vector<AccountMeta> &snapshot() const { return accounts_; }

  size_t size() const { return accounts_.size(); }

  bool empty() const { return accounts_.empty(); }

 private:
  std::vector<AccountMeta> accounts_;
};

struct MessageHeader {
  static constexpr size_t SIZE = 3;

  uint8_t requiredSignatures = 0;
  uint8_t readOnlySignedAccounts = 0;
  uint8_t readOnlyUnsignedAccounts = 0;

  /**
   * Count signers and read-only accounts of a finalized account list
   * @throws MessageError(HeaderCountOverflow) if a count exceeds 255
   */
  static MessageHeader fromAccounts(const std::vector<AccountMeta> &accounts);

  void serializeTo(std::vector<uint8_t> &buffer) const;
};

/**
 * An instruction to execute by a program, accounts referenced by index
 */
struct CompiledInstruction {
  uint8_t programIdIndex;
  std::vector<uint8_t> accountIndices;
  std::vector<uint8_t> data;

  static CompiledInstruction fromInstruction(
      const Instruction &ix, const std::vector<PublicKey> &accounts);

  void serializeTo(std::vector<uint8_t> &buffer) const;
};

struct CompiledMessage {
  MessageHeader header;
  std::vector<PublicKey> accountKeys;
  PublicKey recentBlockhash;
  std::vector<CompiledInstruction> instructions;

  void serializeTo(std::vector<uint8_t> &buffer) const;

  std::vector<uint8_t> serialize() const;

  /**
   * Parse a message from its wire format
   * @throws MessageError(MalformedCompactLength) on a truncated length prefix
   * @throws MessageError(MalformedMessage) on any other inconsistency
   */
  static CompiledMessage deserialize(const std::vector<uint8_t> &buffer);

  bool isSigner(size_t index) const;

  bool isWritable(size_t index) const;

  /**
   * Expand compiled instructions back to account metas, flags taken from the
   * header
   */
  std::vector<Instruction> decompileInstructions() const;
};

///
/// json
void to_json(json &j, const PublicKey &key);
void from_json(const json &j, PublicKey &key);

void to_json(json &j, const AccountMeta &meta);
void from_json(const json &j, AccountMeta &meta);

void to_json(json &j, const Instruction &ix);
void from_json(const json &j, Instruction &ix);

void to_json(json &j, const NonceInfo &info);
void from_json(const json &j, NonceInfo &info);

void to_json(json &j, const MessageHeader &header);
void from_json(const json &j, MessageHeader &header);

void to_json(json &j, const CompiledInstruction &ix);
void from_json(const json &j, CompiledInstruction &ix);

void to_json(json &j, const CompiledMessage &message);
void from_json(const json &j, CompiledMessage &message);

}  // namespace solwire
