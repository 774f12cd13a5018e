#include <array>
#include <memory>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <openssl/evp.h>

#include "nostd/cryptography/nip04.hpp"
#include "nostd/errors.hpp"
#include "test_fixtures.hpp"

using namespace nostd;
using namespace nostd::cryptography;
using namespace nostd::data;
using namespace std;
using namespace ::testing;

namespace nostd_test
{
class Nip04Test : public testing::Test
{
public:
    inline static const string RECEIVED_WIRE =
        "sZhES/uuV1uMmt9neb6OQw6mykdLYerAnTN+LodleSI=?iv=eM0mGFqFhxmmMwE4YPsQMQ==";
    inline static const string SENT_WIRE =
        "lPQ9iBd6abUrDBJbHWaL3qqhqsuAxK0aU80IgsZ2aqE=?iv=O1zZfD9HPiig1yuZEWX7uQ==";

    static string str(const Plaintext& plaintext)
    {
        return string(plaintext.data(), plaintext.size());
    }

    static string str(const Content& content)
    {
        return string(content.data(), content.size());
    }

    /**
     * @brief Encrypts a single raw block with no padding, to forge arbitrary final blocks.
     */
    static string encryptRawBlock(const SharedSecret& secret, const Iv& iv, const array<uint8_t, 16>& block)
    {
        EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
        EVP_EncryptInit_ex(ctx, EVP_aes_256_cbc(), nullptr, secret.data(), iv.data());
        EVP_CIPHER_CTX_set_padding(ctx, 0);

        array<uint8_t, 16> ciphertext;
        int length = 0;
        EVP_EncryptUpdate(ctx, ciphertext.data(), &length, block.data(), static_cast<int>(block.size()));
        EVP_CIPHER_CTX_free(ctx);

        char wire[config::MAX_DM_WIRE_LENGTH];
        size_t wireLength = Nip04Cipher::encodeWire(ciphertext.data(), ciphertext.size(), iv, wire, sizeof(wire));

        return string(wire, wireLength);
    }
};

TEST_F(Nip04Test, Shared_Secret_Is_Symmetric)
{
    SharedSecret ours = Nip04Cipher::sharedSecret(privateKey(), peerPublicKey());
    SharedSecret theirs = Nip04Cipher::sharedSecret(peerPrivateKey(), publicKey());

    ASSERT_EQ(ours, theirs);
}

TEST_F(Nip04Test, Decrypts_Received_Message)
{
    SharedSecret secret = Nip04Cipher::sharedSecret(peerPrivateKey(), publicKey());

    ASSERT_EQ(str(Nip04Cipher::decrypt(RECEIVED_WIRE, secret)), DM_PLAINTEXT);
}

TEST_F(Nip04Test, Decrypts_Sent_Message)
{
    SharedSecret secret = Nip04Cipher::sharedSecret(privateKey(), peerPublicKey());

    ASSERT_EQ(str(Nip04Cipher::decrypt(SENT_WIRE, secret)), DM_PLAINTEXT);
}

TEST_F(Nip04Test, Encrypt_Then_Decrypt_Restores_Plaintext)
{
    SharedSecret secret = Nip04Cipher::sharedSecret(privateKey(), peerPublicKey());
    Iv iv{};

    Content wire = Nip04Cipher::encrypt(DM_PLAINTEXT, secret, iv);

    ASSERT_THAT(str(wire), EndsWith("?iv=AAAAAAAAAAAAAAAAAAAAAA=="));
    SharedSecret peerSecret = Nip04Cipher::sharedSecret(peerPrivateKey(), publicKey());
    ASSERT_EQ(str(Nip04Cipher::decrypt(str(wire), peerSecret)), DM_PLAINTEXT);
}

TEST_F(Nip04Test, Pads_To_Whole_Blocks)
{
    SharedSecret secret = Nip04Cipher::sharedSecret(privateKey(), peerPublicKey());
    Iv iv{};
    array<uint8_t, config::MAX_DM_CIPHERTEXT_LENGTH> ciphertext;

    ASSERT_EQ(Nip04Cipher::encryptBlocks("", secret, iv, ciphertext.data(), ciphertext.size()), 16u);
    ASSERT_EQ(Nip04Cipher::encryptBlocks(string(15, 'a'), secret, iv, ciphertext.data(), ciphertext.size()), 16u);
    ASSERT_EQ(Nip04Cipher::encryptBlocks(string(16, 'a'), secret, iv, ciphertext.data(), ciphertext.size()), 32u);
    ASSERT_EQ(
        Nip04Cipher::encryptBlocks(
            string(config::MAX_DM_PLAINTEXT_LENGTH, 'a'), secret, iv, ciphertext.data(), ciphertext.size()),
        config::MAX_DM_CIPHERTEXT_LENGTH);
}

TEST_F(Nip04Test, Round_Trips_Empty_And_Maximum_Plaintexts)
{
    SharedSecret secret = Nip04Cipher::sharedSecret(privateKey(), peerPublicKey());
    Iv iv;
    iv.fill(0x5a);
    string longest(config::MAX_DM_PLAINTEXT_LENGTH, 'z');

    ASSERT_EQ(str(Nip04Cipher::decrypt(str(Nip04Cipher::encrypt("", secret, iv)), secret)), "");
    ASSERT_EQ(str(Nip04Cipher::decrypt(str(Nip04Cipher::encrypt(longest, secret, iv)), secret)), longest);
}

TEST_F(Nip04Test, Rejects_Overlong_Plaintext)
{
    SharedSecret secret = Nip04Cipher::sharedSecret(privateKey(), peerPublicKey());
    Iv iv{};

    ASSERT_THROW(Nip04Cipher::encrypt(string(config::MAX_DM_PLAINTEXT_LENGTH + 1, 'a'), secret, iv), LengthError);
}

TEST_F(Nip04Test, Reports_Small_Ciphertext_Buffer)
{
    SharedSecret secret = Nip04Cipher::sharedSecret(privateKey(), peerPublicKey());
    Iv iv{};
    array<uint8_t, 16> small;

    ASSERT_THROW(
        Nip04Cipher::encryptBlocks(DM_PLAINTEXT, secret, iv, small.data(), small.size()),
        BufferTooSmall);
}

TEST_F(Nip04Test, Draws_Iv_From_Entropy_Source)
{
    auto ivSource = make_shared<MockEntropySource>();
    EXPECT_CALL(*ivSource, fill(_, config::AES_BLOCK_SIZE))
        .WillOnce(Invoke([](uint8_t* buffer, size_t length)
        {
            for (size_t i = 0; i < length; i++)
            {
                buffer[i] = 0;
            }
        }));

    Nip04Cipher cipher(ivSource);
    SharedSecret secret = Nip04Cipher::sharedSecret(privateKey(), peerPublicKey());

    Content wire = cipher.encrypt(DM_PLAINTEXT, secret);

    ASSERT_EQ(str(wire), str(Nip04Cipher::encrypt(DM_PLAINTEXT, secret, Iv{})));
}

TEST_F(Nip04Test, Rejects_Malformed_Wire_Strings)
{
    SharedSecret secret = Nip04Cipher::sharedSecret(privateKey(), peerPublicKey());

    // No delimiter.
    ASSERT_THROW(Nip04Cipher::decrypt("lPQ9iBd6abUrDBJbHWaL3qqhqsuAxK0aU80IgsZ2aqE=", secret), EncodingError);
    // Characters outside the base64 alphabet.
    ASSERT_THROW(
        Nip04Cipher::decrypt("lPQ9iBd6abUrDBJbHWaL3qqhqsuAxK0aU80IgsZ2aq!=?iv=O1zZfD9HPiig1yuZEWX7uQ==", secret),
        EncodingError);
    // IV shorter than a block.
    ASSERT_THROW(
        Nip04Cipher::decrypt("lPQ9iBd6abUrDBJbHWaL3qqhqsuAxK0aU80IgsZ2aqE=?iv=O1zZfD9HPiig", secret),
        EncodingError);
    // Empty ciphertext.
    ASSERT_THROW(Nip04Cipher::decrypt("?iv=O1zZfD9HPiig1yuZEWX7uQ==", secret), EncodingError);
    // Fifteen bytes of ciphertext, not a whole block.
    ASSERT_THROW(Nip04Cipher::decrypt("AAAAAAAAAAAAAAAAAAAA?iv=O1zZfD9HPiig1yuZEWX7uQ==", secret), EncodingError);
}

TEST_F(Nip04Test, Rejects_Oversized_Ciphertext)
{
    SharedSecret secret = Nip04Cipher::sharedSecret(privateKey(), peerPublicKey());
    string wire = string(384, 'A') + "?iv=O1zZfD9HPiig1yuZEWX7uQ==";

    ASSERT_THROW(Nip04Cipher::decrypt(wire, secret), EncodingError);
    ASSERT_THROW(Nip04Cipher::decrypt(wire, secret), CodecError);
}

TEST_F(Nip04Test, Rejects_Padding_Characters_Before_The_End)
{
    SharedSecret secret = Nip04Cipher::sharedSecret(privateKey(), peerPublicKey());

    // '=' inside the ciphertext.
    ASSERT_THROW(
        Nip04Cipher::decrypt("lPQ9iBd6abUrDBJbHWaL3q=hqsuAxK0aU80IgsZ2aqE=?iv=O1zZfD9HPiig1yuZEWX7uQ==", secret),
        EncodingError);
    // '=' at the start of the IV.
    ASSERT_THROW(
        Nip04Cipher::decrypt("lPQ9iBd6abUrDBJbHWaL3qqhqsuAxK0aU80IgsZ2aqE=?iv==1zZfD9HPiig1yuZEWX7uQ==", secret),
        EncodingError);
    // A data character after padding.
    ASSERT_THROW(
        Nip04Cipher::decrypt("lPQ9iBd6abUrDBJbHWaL3qqhqsuAxK0aU80IgsZ2aq=E?iv=O1zZfD9HPiig1yuZEWX7uQ==", secret),
        EncodingError);

    ASSERT_NO_THROW(
        Nip04Cipher::decrypt("lPQ9iBd6abUrDBJbHWaL3qqhqsuAxK0aU80IgsZ2aqE=?iv=O1zZfD9HPiig1yuZEWX7uQ==", secret));
}

TEST_F(Nip04Test, Rejects_Inconsistent_Padding)
{
    SharedSecret secret = Nip04Cipher::sharedSecret(privateKey(), peerPublicKey());
    Iv iv{};

    array<uint8_t, 16> zeroPad{};
    array<uint8_t, 16> oversizedPad{};
    oversizedPad.fill(0x11);
    array<uint8_t, 16> mismatchedPad{};
    mismatchedPad[13] = 0x03;
    mismatchedPad[14] = 0x02;
    mismatchedPad[15] = 0x03;

    ASSERT_THROW(Nip04Cipher::decrypt(encryptRawBlock(secret, iv, zeroPad), secret), PaddingError);
    ASSERT_THROW(Nip04Cipher::decrypt(encryptRawBlock(secret, iv, oversizedPad), secret), PaddingError);
    ASSERT_THROW(Nip04Cipher::decrypt(encryptRawBlock(secret, iv, mismatchedPad), secret), PaddingError);

    array<uint8_t, 16> fullPad;
    fullPad.fill(0x10);
    ASSERT_EQ(str(Nip04Cipher::decrypt(encryptRawBlock(secret, iv, fullPad), secret)), "");
}

TEST_F(Nip04Test, Rejects_Invalid_Keys)
{
    PrivateKey zero{};
    PublicKey offCurve;
    offCurve.fill(0xff);

    ASSERT_THROW(Nip04Cipher::sharedSecret(zero, peerPublicKey()), KeyError);
    ASSERT_THROW(Nip04Cipher::sharedSecret(privateKey(), offCurve), KeyError);
}
} // namespace nostd_test
