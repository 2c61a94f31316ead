#include "HubCrypto.h"
#include "HubErrors.h"

#include <memory>
#include <cstring>

#include <openssl/evp.h>

namespace HubCrypto {

const Block kGatewayIv = {
    0x17, 0x99, 0x6d, 0x09, 0x3d, 0x28, 0xdd, 0xb3,
    0xba, 0x69, 0x5a, 0x2e, 0x6f, 0x58, 0x56, 0x2e
};

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

// Runs one AES-128-CBC pass. Returns false when OpenSSL rejects the input
// (e.g. bad padding on decrypt).
bool RunCipher(bool encrypt, bool padding, const uint8_t* key, const uint8_t* iv,
    const uint8_t* in, size_t in_len, std::vector<uint8_t>& out) {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) return false;

    if (EVP_CipherInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, key, iv, encrypt ? 1 : 0) != 1) {
        return false;
    }
    EVP_CIPHER_CTX_set_padding(ctx.get(), padding ? 1 : 0);

    out.assign(in_len + kBlockSize, 0);
    int out_len = 0;
    if (EVP_CipherUpdate(ctx.get(), out.data(), &out_len, in, static_cast<int>(in_len)) != 1) {
        return false;
    }
    int final_len = 0;
    if (EVP_CipherFinal_ex(ctx.get(), out.data() + out_len, &final_len) != 1) {
        return false;
    }
    out.resize(static_cast<size_t>(out_len + final_len));
    return true;
}

} // namespace

Block EncryptGatewayToken(const std::string& key, const std::string& token) {
    if (key.size() != kBlockSize) {
        throw InvalidKeyError("Gateway key must be 16 characters, got " + std::to_string(key.size()));
    }
    if (token.size() != kBlockSize) {
        throw InvalidKeyError("Gateway token must be 16 characters, got " + std::to_string(token.size()));
    }

    std::vector<uint8_t> out;
    if (!RunCipher(true, false,
        reinterpret_cast<const uint8_t*>(key.data()), kGatewayIv.data(),
        reinterpret_cast<const uint8_t*>(token.data()), token.size(), out) || out.size() != kBlockSize) {
        throw InvalidKeyError("AES-128-CBC failed for gateway token");
    }

    Block block{};
    std::memcpy(block.data(), out.data(), kBlockSize);
    return block;
}

std::string EncryptGatewayTokenHex(const std::string& key, const std::string& token) {
    Block block = EncryptGatewayToken(key, token);
    return ToHex(block.data(), block.size());
}

Block Md5Digest(const uint8_t* data, size_t len) {
    Block digest{};
    unsigned int digest_len = 0;
    if (EVP_Digest(data, len, digest.data(), &digest_len, EVP_md5(), nullptr) != 1 || digest_len != kBlockSize) {
        throw HubError("MD5 digest failed");
    }
    return digest;
}

Block Md5Digest(const std::vector<uint8_t>& data) {
    return Md5Digest(data.data(), data.size());
}

void DeriveMiioKeyIv(const Block& token, Block& key, Block& iv) {
    key = Md5Digest(token.data(), token.size());
    uint8_t tmp[kBlockSize * 2];
    std::memcpy(tmp, key.data(), kBlockSize);
    std::memcpy(tmp + kBlockSize, token.data(), kBlockSize);
    iv = Md5Digest(tmp, sizeof(tmp));
}

std::vector<uint8_t> Aes128CbcEncrypt(const Block& key, const Block& iv, const std::vector<uint8_t>& plain) {
    std::vector<uint8_t> out;
    if (!RunCipher(true, true, key.data(), iv.data(), plain.data(), plain.size(), out)) {
        throw HubError("AES-128-CBC encryption failed");
    }
    return out;
}

std::vector<uint8_t> Aes128CbcDecrypt(const Block& key, const Block& iv, const std::vector<uint8_t>& cipher) {
    if (cipher.empty() || cipher.size() % kBlockSize != 0) {
        throw ProtocolError("Ciphertext is not a whole number of AES blocks (" + std::to_string(cipher.size()) + " bytes)");
    }
    std::vector<uint8_t> out;
    if (!RunCipher(false, true, key.data(), iv.data(), cipher.data(), cipher.size(), out)) {
        throw ProtocolError("AES-128-CBC decryption failed (bad padding)");
    }
    return out;
}

std::string ToHex(const uint8_t* data, size_t len, bool upper) {
    static const char* lower_digits = "0123456789abcdef";
    static const char* upper_digits = "0123456789ABCDEF";
    const char* digits = upper ? upper_digits : lower_digits;
    std::string hex;
    hex.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        hex.push_back(digits[data[i] >> 4]);
        hex.push_back(digits[data[i] & 0x0F]);
    }
    return hex;
}

bool HexToBytes(const std::string& hex, std::vector<uint8_t>& out) {
    if (hex.size() % 2 != 0) return false;
    auto nib = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
        if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
        return -1;
    };
    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int n1 = nib(hex[i]);
        int n2 = nib(hex[i + 1]);
        if (n1 < 0 || n2 < 0) return false;
        bytes.push_back(static_cast<uint8_t>((n1 << 4) | n2));
    }
    out = std::move(bytes);
    return true;
}

} // namespace HubCrypto
