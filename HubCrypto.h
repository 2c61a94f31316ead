// HubCrypto.h
#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace HubCrypto {

constexpr size_t kBlockSize = 16;
using Block = std::array<uint8_t, kBlockSize>;

// Fixed IV of the gateway LAN protocol.
extern const Block kGatewayIv;

// --- Gateway Write Signature ---
// AES-128-CBC of the 16-char token under the 16-char gateway key, no padding.
// Throws InvalidKeyError on wrong lengths.
Block EncryptGatewayToken(const std::string& key, const std::string& token);
std::string EncryptGatewayTokenHex(const std::string& key, const std::string& token);

// --- miIO Primitives ---
Block Md5Digest(const uint8_t* data, size_t len);
Block Md5Digest(const std::vector<uint8_t>& data);

// key = MD5(token), iv = MD5(key || token)
void DeriveMiioKeyIv(const Block& token, Block& key, Block& iv);

// PKCS#7 padded AES-128-CBC. Decrypt throws ProtocolError on a bad block or padding.
std::vector<uint8_t> Aes128CbcEncrypt(const Block& key, const Block& iv, const std::vector<uint8_t>& plain);
std::vector<uint8_t> Aes128CbcDecrypt(const Block& key, const Block& iv, const std::vector<uint8_t>& cipher);

// --- Hex Helpers ---
std::string ToHex(const uint8_t* data, size_t len, bool upper = false);
bool HexToBytes(const std::string& hex, std::vector<uint8_t>& out);

} // namespace HubCrypto
