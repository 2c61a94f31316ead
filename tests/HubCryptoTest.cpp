#include <gtest/gtest.h>

#include "HubCrypto.h"
#include "HubErrors.h"

TEST(HubCryptoTest, GatewayTokenMatchesPublishedVector) {
    auto block = HubCrypto::EncryptGatewayToken("0987654321qwerty", "1234567890abcdef");
    EXPECT_EQ(HubCrypto::ToHex(block.data(), block.size(), true), "3EB43E37C20AFF4C5872CC0D04D81314");
}

TEST(HubCryptoTest, GatewayTokenHexIsLowerCase) {
    EXPECT_EQ(HubCrypto::EncryptGatewayTokenHex("0987654321qwerty", "1234567890abcdef"),
        "3eb43e37c20aff4c5872cc0d04d81314");
}

TEST(HubCryptoTest, GatewayTokenIsDeterministic) {
    EXPECT_EQ(HubCrypto::EncryptGatewayTokenHex("0987654321qwerty", "abcdefabcdefabcd"),
        HubCrypto::EncryptGatewayTokenHex("0987654321qwerty", "abcdefabcdefabcd"));
    EXPECT_NE(HubCrypto::EncryptGatewayTokenHex("0987654321qwerty", "abcdefabcdefabcd"),
        HubCrypto::EncryptGatewayTokenHex("0987654321qwerty", "1234567890abcdef"));
}

TEST(HubCryptoTest, WrongLengthsThrowInvalidKey) {
    EXPECT_THROW(HubCrypto::EncryptGatewayToken("short", "1234567890abcdef"), InvalidKeyError);
    EXPECT_THROW(HubCrypto::EncryptGatewayToken("0987654321qwerty", "12345"), InvalidKeyError);
    EXPECT_THROW(HubCrypto::EncryptGatewayToken("0987654321qwerty0", "1234567890abcdef"), InvalidKeyError);
}

TEST(HubCryptoTest, Md5OfAbc) {
    const std::string abc = "abc";
    auto digest = HubCrypto::Md5Digest(reinterpret_cast<const uint8_t*>(abc.data()), abc.size());
    EXPECT_EQ(HubCrypto::ToHex(digest.data(), digest.size()), "900150983cd24fb0d6963f7d28e17f72");
}

TEST(HubCryptoTest, MiioKeyAndIvDerivation) {
    HubCrypto::Block token{};
    for (size_t i = 0; i < token.size(); ++i) token[i] = static_cast<uint8_t>(i);

    HubCrypto::Block key{}, iv{};
    HubCrypto::DeriveMiioKeyIv(token, key, iv);

    EXPECT_EQ(key, HubCrypto::Md5Digest(token.data(), token.size()));
    std::vector<uint8_t> key_token(key.begin(), key.end());
    key_token.insert(key_token.end(), token.begin(), token.end());
    EXPECT_EQ(iv, HubCrypto::Md5Digest(key_token));
}

TEST(HubCryptoTest, CbcPaddingAndCorruption) {
    HubCrypto::Block key{}, iv{};
    key.fill(0x11);
    iv.fill(0x22);

    std::vector<uint8_t> plain = { '{', '"', 'i', 'd', '"', ':', '1', '}' };
    auto cipher = HubCrypto::Aes128CbcEncrypt(key, iv, plain);
    EXPECT_EQ(cipher.size(), 16u);
    EXPECT_EQ(HubCrypto::Aes128CbcDecrypt(key, iv, cipher), plain);

    std::vector<uint8_t> truncated(cipher.begin(), cipher.begin() + 10);
    EXPECT_THROW(HubCrypto::Aes128CbcDecrypt(key, iv, truncated), ProtocolError);
}

TEST(HubCryptoTest, HexHelpers) {
    std::vector<uint8_t> bytes;
    ASSERT_TRUE(HubCrypto::HexToBytes("00ff10Ab", bytes));
    EXPECT_EQ(bytes, (std::vector<uint8_t>{ 0x00, 0xff, 0x10, 0xab }));
    EXPECT_FALSE(HubCrypto::HexToBytes("abc", bytes));
    EXPECT_FALSE(HubCrypto::HexToBytes("zz", bytes));
}
