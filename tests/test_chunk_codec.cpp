#include "rxg/storage/chunk_codec.h"

#include <algorithm>
#include <array>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include <sys/stat.h>

#include "rxg/common.h"
#include "rxg/crypto/content_hash.h"
#include "rxg/crypto/hkdf.h"
#include "rxg/crypto/master_key.h"
#include "rxg/crypto/random.h"
#include "rxg/error.h"
#include "rxg/orchestrator/io_util.h"

namespace {

std::unique_ptr<rxg::crypto::MasterKey> FixedKey(uint8_t seed) {
  std::array<uint8_t, rxg::crypto::MasterKey::kSize> bytes{};
  for (size_t i = 0; i < bytes.size(); ++i) {
    bytes[i] = static_cast<uint8_t>(seed + i);
  }
  return std::make_unique<rxg::crypto::MasterKey>(bytes);
}

std::vector<uint8_t> Pattern(size_t size) {
  std::vector<uint8_t> data(size);
  for (size_t i = 0; i < data.size(); ++i) {
    data[i] = static_cast<uint8_t>((i * 31 + 7) & 0xFF);
  }
  return data;
}

void TestContentHashVectors() {
  // XXH64 reference values, seed 0
  assert(rxg::crypto::ContentHash({}) == "ef46db3751d8e999");
  assert(rxg::crypto::ContentHash64({}) == 0xef46db3751d8e999ull);
  assert(rxg::crypto::ContentHash(rxg::AsByteSpan("a")) == "d24ec4f1a98c6e5b");
  auto hash = rxg::storage::ChunkCodec::ComputeHash(Pattern(1000));
  assert(hash.size() == rxg::crypto::kContentHashHexLength);
  assert(rxg::IsHexDigest(hash));
}

void TestHkdfRfc5869Case1() {
  std::vector<uint8_t> ikm(22, 0x0b);
  std::vector<uint8_t> salt;
  for (uint8_t i = 0x00; i <= 0x0c; ++i) {
    salt.push_back(i);
  }
  std::vector<uint8_t> info;
  for (uint8_t i = 0xf0; i <= 0xf9; ++i) {
    info.push_back(i);
  }
  std::array<uint8_t, 42> okm{};
  rxg::crypto::HKDF_SHA256(ikm, salt, info, okm);
  assert(rxg::HexEncode(okm) ==
         "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf34007208d5b887185865");
}

void TestDerivationIsDeterministicPerHash() {
  rxg::storage::ChunkCodec codec(FixedKey(1));
  auto first = codec.DeriveKeyAndNonce("00112233aabbccdd");
  auto again = codec.DeriveKeyAndNonce("00112233aabbccdd");
  auto other = codec.DeriveKeyAndNonce("00112233aabbccde");
  assert(first.key == again.key && first.nonce == again.nonce);
  assert(first.key != other.key);
  assert(first.nonce != other.nonce);
}

void TestRoundTripAndDeterminism() {
  rxg::storage::ChunkCodec codec(FixedKey(1));
  const auto plaintext = Pattern(64 * 1024);

  auto sealed = codec.Encrypt(plaintext);
  assert(sealed.hash == rxg::storage::ChunkCodec::ComputeHash(plaintext));
  assert(sealed.ciphertext.size() == plaintext.size() + rxg::crypto::ChaCha20Poly1305::TAG_SIZE);
  assert(codec.Decrypt(sealed.hash, sealed.ciphertext) == plaintext);

  // identical plaintext under one key gives identical ciphertext
  auto again = codec.Encrypt(plaintext);
  assert(again.ciphertext == sealed.ciphertext);

  rxg::storage::ChunkCodec other(FixedKey(2));
  auto foreign = other.Encrypt(plaintext);
  assert(foreign.hash == sealed.hash);
  assert(foreign.ciphertext != sealed.ciphertext);

  auto empty = codec.Encrypt({});
  assert(empty.ciphertext.size() == rxg::crypto::ChaCha20Poly1305::TAG_SIZE);
  assert(codec.Decrypt(empty.hash, empty.ciphertext).empty());
}

void TestTamperIsRejected() {
  rxg::storage::ChunkCodec codec(FixedKey(1));
  const auto plaintext = Pattern(4096);
  auto sealed = codec.Encrypt(plaintext);

  auto flipped = sealed.ciphertext;
  flipped[flipped.size() / 2] ^= 0x01;
  bool rejected = false;
  try {
    (void)codec.Decrypt(sealed.hash, flipped);
  } catch (const rxg::IntegrityError& err) {
    rejected = err.code == rxg::errors::crypto::kIntegrityFailure;
  }
  assert(rejected && "bit flip must fail authentication");

  rejected = false;
  try {
    (void)codec.Decrypt("0000000000000000", sealed.ciphertext);
  } catch (const rxg::IntegrityError&) {
    rejected = true;
  }
  assert(rejected && "wrong hash must fail authentication");

  rejected = false;
  try {
    std::vector<uint8_t> truncated(sealed.ciphertext.begin(), sealed.ciphertext.begin() + 8);
    (void)codec.Decrypt(sealed.hash, truncated);
  } catch (const rxg::IntegrityError&) {
    rejected = true;
  }
  assert(rejected && "truncated chunk must fail authentication");

  rxg::storage::ChunkCodec other(FixedKey(9));
  rejected = false;
  try {
    (void)other.Decrypt(sealed.hash, sealed.ciphertext);
  } catch (const rxg::IntegrityError&) {
    rejected = true;
  }
  assert(rejected && "wrong key must fail authentication");
}

void TestMasterKeyBootstrap() {
  std::array<uint8_t, 8> token{};
  rxg::crypto::SystemRandomBytes(token);
  const auto dir = std::filesystem::temp_directory_path() / ("rxg_master_key_" + rxg::HexEncode(token));
  std::filesystem::create_directories(dir);
  const auto key_path = dir / "keys" / "master.key";

  auto created = rxg::crypto::LoadOrCreateMasterKey(key_path);
  assert(std::filesystem::file_size(key_path) == rxg::crypto::MasterKey::kSize);
  struct stat st{};
  assert(::stat(key_path.c_str(), &st) == 0);
  assert((st.st_mode & 0777) == 0600);

  auto loaded = rxg::crypto::LoadOrCreateMasterKey(key_path);
  assert(std::equal(created->Bytes().begin(), created->Bytes().end(), loaded->Bytes().begin()));

  const std::array<uint8_t, 16> short_key{};
  rxg::orchestrator::WritePrivateFile(key_path, short_key);
  bool rejected = false;
  try {
    (void)rxg::crypto::LoadOrCreateMasterKey(key_path);
  } catch (const rxg::KeyError&) {
    rejected = true;
  }
  assert(rejected && "a 16-byte key file must be refused");
  assert(std::filesystem::file_size(key_path) == short_key.size());

  rejected = false;
  try {
    (void)rxg::crypto::LoadMasterKey(dir / "missing.key");
  } catch (const rxg::KeyError&) {
    rejected = true;
  }
  assert(rejected);

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

}  // namespace

int main() {
  TestContentHashVectors();
  TestHkdfRfc5869Case1();
  TestDerivationIsDeterministicPerHash();
  TestRoundTripAndDeterminism();
  TestTamperIsRejected();
  TestMasterKeyBootstrap();
  std::cout << "chunk codec tests ok\n";
  return 0;
}
