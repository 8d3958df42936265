#include <catch2/catch_test_macros.hpp>
#include "chatvault/crypto/message_codec.hpp"
#include "chatvault/crypto/encoding.hpp"
#include "chatvault/crypto/sodium_interop.hpp"
#include "chatvault/core/constants.hpp"
#include "helpers/mock_key_provider.hpp"

#include <memory>
#include <set>
#include <string>
#include <vector>

using namespace chatvault;
using namespace chatvault::crypto;
using chatvault::models::EncryptionMetadata;
using chatvault::test_helpers::MockKeyProvider;

namespace {

EncryptionMetadata MetadataFor(std::string key_id) {
    return EncryptionMetadata{.key_id = std::move(key_id)};
}

std::shared_ptr<MockKeyProvider> ProviderWith(const std::string& key_id, uint8_t fill) {
    auto provider = std::make_shared<MockKeyProvider>();
    const std::vector<uint8_t> key(Constants::AES_KEY_SIZE, fill);
    provider->SetKey(key_id, key);
    return provider;
}

}

TEST_CASE("MessageCodec - Round trip", "[codec]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    MessageCodec codec(ProviderWith("k1", 0x11));

    SECTION("Plaintext survives encrypt then decrypt") {
        auto sealed = codec.Encrypt(std::string_view("Hello, vault"), MetadataFor("k1"));
        REQUIRE(sealed.IsOk());
        auto opened = codec.Decrypt(sealed.Unwrap().ciphertext, sealed.Unwrap().metadata);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == "Hello, vault");
    }
    SECTION("Multi-byte UTF-8 text survives") {
        const std::string text = "Grüße, 世界 🌍";
        auto sealed = codec.Encrypt(text, MetadataFor("k1")).Unwrap();
        REQUIRE(codec.Decrypt(sealed.ciphertext, sealed.metadata).Unwrap() == text);
    }
    SECTION("Ciphertext is plaintext plus a 16-byte tag") {
        auto sealed = codec.Encrypt(std::string_view("12345"), MetadataFor("k1")).Unwrap();
        REQUIRE(sealed.ciphertext.size() == 5 + Constants::AES_GCM_TAG_SIZE);
    }
    SECTION("Outbound metadata keeps algorithm and key id, carries a fresh nonce") {
        auto sealed = codec.Encrypt(std::string_view("x"), MetadataFor("k1")).Unwrap();
        REQUIRE(sealed.metadata.algorithm == models::EncryptionAlgorithm::Aes256Gcm);
        REQUIRE(sealed.metadata.key_id == "k1");
        REQUIRE(Encoding::FromBase64(sealed.metadata.iv).Unwrap().size() == Constants::AES_GCM_NONCE_SIZE);
        REQUIRE(sealed.metadata.created_at.size() == 27);
        REQUIRE(sealed.metadata.created_at.back() == 'Z');
    }
}

TEST_CASE("MessageCodec - Nonce uniqueness", "[codec][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    MessageCodec codec(ProviderWith("k1", 0x22));

    std::set<std::string> nonces;
    std::set<std::vector<uint8_t>> ciphertexts;
    for (int i = 0; i < 200; ++i) {
        auto sealed = codec.Encrypt(std::string_view("same plaintext"), MetadataFor("k1")).Unwrap();
        nonces.insert(sealed.metadata.iv);
        ciphertexts.insert(sealed.ciphertext);
    }
    REQUIRE(nonces.size() == 200);
    REQUIRE(ciphertexts.size() == 200);
}

TEST_CASE("MessageCodec - Nonce problems are decryption failures", "[codec]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    MessageCodec codec(ProviderWith("k1", 0x33));
    auto sealed = codec.Encrypt(std::string_view("payload"), MetadataFor("k1")).Unwrap();

    SECTION("Missing nonce") {
        auto metadata = sealed.metadata;
        metadata.iv.clear();
        auto opened = codec.Decrypt(sealed.ciphertext, metadata);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().Is(VaultFailureType::Decryption));
    }
    SECTION("Nonce that is not base64") {
        auto metadata = sealed.metadata;
        metadata.iv = "%%%not-base64%%%";
        auto opened = codec.Decrypt(sealed.ciphertext, metadata);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().Is(VaultFailureType::Decryption));
    }
    SECTION("Nonce of the wrong length") {
        auto metadata = sealed.metadata;
        metadata.iv = Encoding::ToBase64(std::vector<uint8_t>(16, 0x01));
        auto opened = codec.Decrypt(sealed.ciphertext, metadata);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().Is(VaultFailureType::Decryption));
    }
    SECTION("A different valid nonce fails authentication") {
        auto metadata = sealed.metadata;
        metadata.iv = Encoding::ToBase64(std::vector<uint8_t>(Constants::AES_GCM_NONCE_SIZE, 0x00));
        REQUIRE(codec.Decrypt(sealed.ciphertext, metadata).UnwrapErr().Is(VaultFailureType::Decryption));
    }
}

TEST_CASE("MessageCodec - Key problems", "[codec]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Wrong key fails authentication") {
        MessageCodec writer(ProviderWith("k1", 0x44));
        MessageCodec reader(ProviderWith("k1", 0x45));
        auto sealed = writer.Encrypt(std::string_view("secret"), MetadataFor("k1")).Unwrap();
        auto opened = reader.Decrypt(sealed.ciphertext, sealed.metadata);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().Is(VaultFailureType::Decryption));
    }
    SECTION("Unknown key id surfaces the provider failure") {
        MessageCodec codec(ProviderWith("k1", 0x46));
        auto sealed = codec.Encrypt(std::string_view("secret"), MetadataFor("missing"));
        REQUIRE(sealed.IsErr());
        REQUIRE(sealed.UnwrapErr().Is(VaultFailureType::DeriveKey));
    }
    SECTION("Provider handing out a short key is rejected") {
        auto provider = std::make_shared<MockKeyProvider>();
        provider->SetKey("short", std::vector<uint8_t>(16, 0x47));
        MessageCodec codec(provider);
        auto sealed = codec.Encrypt(std::string_view("secret"), MetadataFor("short"));
        REQUIRE(sealed.IsErr());
        REQUIRE(sealed.UnwrapErr().Is(VaultFailureType::DeriveKey));
    }
}
