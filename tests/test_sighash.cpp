/**
 * @file test_sighash.cpp
 * @brief Тесты SigHashAll и подписи транзакции
 */

#include <gtest/gtest.h>

#include "core/hex.hpp"
#include "crypto/schnorr.hpp"
#include "kaspa/address.hpp"
#include "kaspa/schnorr_signer.hpp"
#include "kaspa/sighash.hpp"
#include "test_helpers.hpp"

namespace kasfaucet::tests {

class SighashTest : public ::testing::Test {
protected:
    void SetUp() override {
        spent_ = {make_utxo(1, 0, 300'000'000), make_utxo(2, 3, 200'004'000)};

        for (std::size_t i = 0; i < spent_.size(); ++i) {
            kaspa::TransactionInput input;
            input.previous_outpoint = spent_[i].outpoint;
            input.sequence = i;
            input.sig_op_count = 1;
            tx_.inputs.push_back(input);
        }

        kaspa::Address destination{"kaspatest", kaspa::AddressVersion::PubKey, Bytes(32, 0x00)};
        kaspa::Address change{"kaspatest", kaspa::AddressVersion::PubKey, Bytes(32, 0x11)};
        tx_.outputs.push_back({100'000'000, kaspa::pay_to_address_script(destination)});
        tx_.outputs.push_back({399'996'000, kaspa::pay_to_address_script(change)});
    }

    kaspa::Transaction tx_;
    std::vector<kaspa::UtxoEntry> spent_;
};

/**
 * @brief Тест: эталонные хеши для двух входов
 */
TEST_F(SighashTest, KnownAnswer) {
    auto ctx = kaspa::SighashContext::create(tx_, spent_);
    ASSERT_TRUE(ctx.has_value());

    auto first = ctx->hash_for_input(0);
    auto second = ctx->hash_for_input(1);

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(core::to_hex(*first),
              "fd8e89e715e08873812b2ad5b20a356e11be33e4dfbaec5e9fd37c8053e98fff");
    EXPECT_EQ(core::to_hex(*second),
              "808619ab76dd2a8bc06f7fd21416f5ab318bf86304a0bd3a6a62b7971f28dd51");
}

/**
 * @brief Тест: контекст и свободная функция совпадают
 */
TEST_F(SighashTest, ContextMatchesFreeFunction) {
    auto ctx = kaspa::SighashContext::create(tx_, spent_);
    ASSERT_TRUE(ctx.has_value());

    for (std::size_t i = 0; i < tx_.inputs.size(); ++i) {
        auto direct = kaspa::calc_schnorr_signature_hash(tx_, spent_, i);
        ASSERT_TRUE(direct.has_value());
        EXPECT_EQ(*direct, *ctx->hash_for_input(i));
    }
}

/**
 * @brief Тест: signature_script не входит в хеш
 */
TEST_F(SighashTest, IgnoresSignatureScripts) {
    auto before = kaspa::calc_schnorr_signature_hash(tx_, spent_, 0);

    tx_.inputs[1].signature_script = {0x41, 0x01, 0x02};
    auto after = kaspa::calc_schnorr_signature_hash(tx_, spent_, 0);

    ASSERT_TRUE(before.has_value());
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(*before, *after);
}

/**
 * @brief Тест: любой подписываемый параметр меняет хеш
 */
TEST_F(SighashTest, CommitsToOutputsAndSpentAmounts) {
    auto base = kaspa::calc_schnorr_signature_hash(tx_, spent_, 0);
    ASSERT_TRUE(base.has_value());

    auto changed_output = tx_;
    changed_output.outputs[0].amount += 1;
    EXPECT_NE(*kaspa::calc_schnorr_signature_hash(changed_output, spent_, 0), *base);

    auto changed_spent = spent_;
    changed_spent[0].amount += 1;
    EXPECT_NE(*kaspa::calc_schnorr_signature_hash(tx_, changed_spent, 0), *base);

    auto changed_sequence = tx_;
    changed_sequence.inputs[1].sequence = 7;
    EXPECT_NE(*kaspa::calc_schnorr_signature_hash(changed_sequence, spent_, 0), *base);

    auto with_payload = tx_;
    with_payload.payload = {0x01};
    EXPECT_NE(*kaspa::calc_schnorr_signature_hash(with_payload, spent_, 0), *base);
}

TEST_F(SighashTest, RejectsMismatchedUtxoCount) {
    std::vector<kaspa::UtxoEntry> one = {spent_[0]};

    auto ctx = kaspa::SighashContext::create(tx_, one);

    ASSERT_FALSE(ctx.has_value());
    EXPECT_EQ(ctx.error().code, ErrorCode::CryptoFailure);
}

TEST_F(SighashTest, RejectsOutOfRangeInput) {
    auto hash = kaspa::calc_schnorr_signature_hash(tx_, spent_, 2);
    EXPECT_FALSE(hash.has_value());
}

// =============================================================================
// SchnorrSigner
// =============================================================================

/**
 * @brief Тест: каждый вход подписан, подпись проверяется по sighash
 */
TEST_F(SighashTest, SignerProducesVerifiableScripts) {
    auto key = crypto::SecretKey::from_hex(TEST_PRIVATE_KEY);
    ASSERT_TRUE(key.has_value());
    auto public_key = crypto::derive_public_key(*key);
    ASSERT_TRUE(public_key.has_value());

    faucet::PendingTransaction pending;
    pending.selected_inputs = spent_;
    pending.transaction = tx_;
    pending.fee = 8000;
    pending.change = 399'996'000;

    kaspa::SchnorrSigner signer;
    auto signed_tx = signer.sign(pending, *key);

    ASSERT_TRUE(signed_tx.has_value()) << signed_tx.error().message;
    EXPECT_EQ(signed_tx->fee, 8000u);
    EXPECT_EQ(signed_tx->change, 399'996'000u);
    ASSERT_EQ(signed_tx->spent_outpoints.size(), 2u);
    EXPECT_EQ(signed_tx->spent_outpoints[0], spent_[0].outpoint);
    EXPECT_EQ(signed_tx->spent_outpoints[1], spent_[1].outpoint);

    for (std::size_t i = 0; i < tx_.inputs.size(); ++i) {
        const auto& script = signed_tx->transaction.inputs[i].signature_script;
        ASSERT_EQ(script.size(), 66u);
        EXPECT_EQ(script.front(), 0x41);
        EXPECT_EQ(script.back(), 0x01);

        crypto::SchnorrSignature signature{};
        std::copy(script.begin() + 1, script.begin() + 65, signature.begin());

        auto sighash = kaspa::calc_schnorr_signature_hash(tx_, spent_, i);
        ASSERT_TRUE(sighash.has_value());
        EXPECT_TRUE(crypto::schnorr_verify(*public_key, *sighash, signature));
    }
}

TEST_F(SighashTest, SignerRejectsEmptyTransaction) {
    auto key = crypto::SecretKey::from_hex(TEST_PRIVATE_KEY);
    ASSERT_TRUE(key.has_value());

    kaspa::SchnorrSigner signer;
    auto result = signer.sign(faucet::PendingTransaction{}, *key);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::SigningFailure);
}

/**
 * @brief Тест: ошибки ключа и UTXO отображаются в SigningFailure
 */
TEST_F(SighashTest, SignerMapsErrorsToSigningFailure) {
    auto zero = crypto::SecretKey::from_hex(std::string(64, '0'));
    ASSERT_TRUE(zero.has_value());

    faucet::PendingTransaction pending;
    pending.selected_inputs = spent_;
    pending.transaction = tx_;

    kaspa::SchnorrSigner signer;
    auto bad_key = signer.sign(pending, *zero);
    ASSERT_FALSE(bad_key.has_value());
    EXPECT_EQ(bad_key.error().code, ErrorCode::SigningFailure);

    auto key = crypto::SecretKey::from_hex(TEST_PRIVATE_KEY);
    ASSERT_TRUE(key.has_value());
    pending.selected_inputs.pop_back();
    auto missing_utxo = signer.sign(pending, *key);
    ASSERT_FALSE(missing_utxo.has_value());
    EXPECT_EQ(missing_utxo.error().code, ErrorCode::SigningFailure);
}

} // namespace kasfaucet::tests
