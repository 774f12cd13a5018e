#pragma once

#include <memory>
#include <string_view>

#include <gmock/gmock.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>

#include "nostd/cryptography/entropy.hpp"
#include "nostd/data/data.hpp"
#include "nostd/data/hex.hpp"
#include "nostd/signer/signer.hpp"

namespace nostd_test
{
inline constexpr std::string_view PRIVATE_KEY = "a5084b35a58e3e1a26f5efb46cb9dbada73191526aa6d11bccb590cbeb2d8fa3";
inline constexpr std::string_view PUBLIC_KEY = "098ef66bce60dd4cf10b4ae5949d1ec6dd777ddeb4bc49b47f97275a127a63cf";

inline constexpr std::string_view PEER_PRIVATE_KEY = "aecb67d55da9b658cd419013d7026f30ee23c5c5b032948e84e8ae523b559f92";
inline constexpr std::string_view PEER_PUBLIC_KEY = "ed984a5438492bdc75860aad15a59f8e2f858792824d615401fb49d79c2087b0";

inline constexpr std::string_view DM_PLAINTEXT = "hello from the internet";

/**
 * @brief A console appender that outlives every test, since plog keeps a raw pointer to it.
 */
inline std::shared_ptr<plog::IAppender> testAppender()
{
    static auto appender = std::make_shared<plog::ConsoleAppender<plog::TxtFormatter>>();
    return appender;
}

inline nostd::data::PrivateKey privateKey()
{
    return nostd::data::fromHex<32>(PRIVATE_KEY);
}

inline nostd::data::PublicKey publicKey()
{
    return nostd::data::fromHex<32>(PUBLIC_KEY);
}

inline nostd::data::PrivateKey peerPrivateKey()
{
    return nostd::data::fromHex<32>(PEER_PRIVATE_KEY);
}

inline nostd::data::PublicKey peerPublicKey()
{
    return nostd::data::fromHex<32>(PEER_PUBLIC_KEY);
}

class MockSigner : public nostd::signer::ISigner
{
public:
    MOCK_METHOD(nostd::data::PublicKey, derivePublicKey, (const nostd::data::PrivateKey&), (const, override));
    MOCK_METHOD(nostd::data::Signature, sign, (const nostd::data::Digest&, const nostd::data::PrivateKey&), (const, override));
    MOCK_METHOD(
        bool,
        verify,
        (const nostd::data::Digest&, const nostd::data::PublicKey&, const nostd::data::Signature&),
        (const, override));
};

class MockEntropySource : public nostd::cryptography::IEntropySource
{
public:
    MOCK_METHOD(void, fill, (uint8_t* buffer, std::size_t length), (override));
};
} // namespace nostd_test
