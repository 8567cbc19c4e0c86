// VALSET - Validator Manager Tests
// Copyright (c) 2024 VALSET Developers
// MIT License

#include <gtest/gtest.h>

#include <valset/util/time.h>
#include <valset/validator/messages.h>
#include <valset/validator/validator_manager.h>
#include <valset/validator/warp.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

namespace valset {
namespace validator {
namespace test {

namespace {

Hash256 FilledHash(Byte b) {
    Hash256 h;
    std::fill(h.begin(), h.end(), b);
    return h;
}

Address MakeAddress(Byte b) {
    Address a;
    std::fill(a.begin(), a.end(), b);
    return a;
}

Bytes MakeNodeID(Byte b) {
    return Bytes(NODE_ID_LENGTH, b);
}

} // namespace

// ============================================================================
// Test Fixtures
// ============================================================================

class ValidatorManagerTest : public ::testing::Test {
protected:
    static constexpr int64_t START = 1700000000;
    static constexpr uint64_t CHURN_PERIOD = 3600;

    static constexpr uint32_t CONVERSION_INDEX = 0;
    static constexpr uint32_t ACK_INDEX = 1;

    ValidatorManagerTest() : warp_(FilledHash(0xC1)) {
        settings_.admin = MakeAddress(0xAD);
        settings_.subnetID = FilledHash(0x5B);
        settings_.churnPeriodSeconds = CHURN_PERIOD;
        settings_.maximumChurnPercentage = 20;
        settings_.managerAddress = MakeAddress(0x3A);
    }

    void SetUp() override {
        util::SetMockTime(START);
        manager_ = std::make_unique<ValidatorManager>(settings_, warp_);
        manager_->SetEventCallback([this](const Event& e) { events_.push_back(e); });
    }

    void TearDown() override {
        util::DisableMockTime();
    }

    Timestamp Now() const { return static_cast<Timestamp>(util::GetTime()); }

    ConversionData MakeConversion(size_t count, Weight weight) const {
        ConversionData data;
        data.subnetID = settings_.subnetID;
        data.validatorManagerBlockchainID = warp_.GetBlockchainID();
        data.validatorManagerAddress = settings_.managerAddress;
        for (size_t i = 0; i < count; ++i) {
            data.initialValidators.push_back(
                {MakeNodeID(static_cast<Byte>(0xA0 + i)), Bytes(BLS_PUBLIC_KEY_LENGTH, 0x0B), weight});
        }
        return data;
    }

    bool Initialize(const ConversionData& data) {
        warp_.SetPChainMessage(CONVERSION_INDEX, PackSubnetToL1ConversionMessage(ConversionID(data)));
        return manager_->InitializeValidatorSet(data, CONVERSION_INDEX, state_);
    }

    /// Five validators of weight 100
    void InitializeDefault() {
        ASSERT_TRUE(Initialize(MakeConversion(5, 100))) << state_.ToString();
        events_.clear();
    }

    ValidatorRegistrationInput MakeInput(Byte node) const {
        ValidatorRegistrationInput input;
        input.nodeID = MakeNodeID(node);
        input.blsPublicKey = Bytes(BLS_PUBLIC_KEY_LENGTH, node);
        input.registrationExpiry = Now() + 3600;
        return input;
    }

    std::optional<Hash256> Register(Byte node, Weight weight) {
        return manager_->InitiateValidatorRegistration(settings_.admin, MakeInput(node), weight,
                                                       state_);
    }

    void AckRegistration(const Hash256& validationID, bool valid) {
        warp_.SetPChainMessage(ACK_INDEX, PackL1ValidatorRegistrationMessage({validationID, valid}));
    }

    void AckWeight(const Hash256& validationID, uint64_t nonce, Weight weight) {
        warp_.SetPChainMessage(ACK_INDEX, PackL1ValidatorWeightMessage({validationID, nonce, weight}));
    }

    /// Register and complete, leaving the churn window fresh
    Hash256 RegisterActive(Byte node, Weight weight) {
        auto id = Register(node, weight);
        EXPECT_TRUE(id.has_value()) << state_.ToString();
        AckRegistration(*id, true);
        EXPECT_TRUE(
            manager_->CompleteValidatorRegistration(settings_.admin, ACK_INDEX, state_).has_value())
            << state_.ToString();
        util::AdvanceMockTime(util::Seconds(CHURN_PERIOD));
        return *id;
    }

    Hash256 InitialID(uint32_t index) const {
        return InitialValidationID(settings_.subnetID, index);
    }

    ValidatorManagerSettings settings_;
    LocalWarpMessenger warp_;
    std::unique_ptr<ValidatorManager> manager_;
    std::vector<Event> events_;
    ManagerState state_;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(ValidatorManagerTest, RejectsBadSettings) {
    ValidatorManagerSettings bad = settings_;
    bad.maximumChurnPercentage = 25;
    EXPECT_THROW({ ValidatorManager rejected(bad, warp_); }, std::invalid_argument);

    bad = settings_;
    bad.admin = Address();
    ManagerState state;
    EXPECT_FALSE(ValidatorManager::CheckSettings(bad, state));
    EXPECT_EQ(state.GetCode(), ErrorCode::InvalidOwnerAddress);
}

// ============================================================================
// Initial Validator Set
// ============================================================================

TEST_F(ValidatorManagerTest, InitializeValidatorSet) {
    ASSERT_TRUE(Initialize(MakeConversion(5, 100))) << state_.ToString();

    EXPECT_TRUE(manager_->IsInitialized());
    EXPECT_EQ(manager_->L1TotalWeight(), 500u);
    EXPECT_EQ(manager_->ValidatorCount(), 5u);

    auto v = manager_->GetValidator(InitialID(2));
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->status, ValidatorStatus::Active);
    EXPECT_EQ(v->weight, 100u);
    EXPECT_EQ(v->startingWeight, 100u);
    EXPECT_EQ(v->startTime, static_cast<Timestamp>(START));
    EXPECT_EQ(v->nodeID, NodeID(MakeNodeID(0xA2).data(), NODE_ID_LENGTH));

    auto owner = manager_->GetNodeValidationID(NodeID(MakeNodeID(0xA4).data(), NODE_ID_LENGTH));
    ASSERT_TRUE(owner.has_value());
    EXPECT_EQ(*owner, InitialID(4));

    ASSERT_EQ(events_.size(), 5u);
    EXPECT_EQ(events_[0].type, EventType::RegisteredInitialValidator);
    EXPECT_EQ(events_[0].validationID, InitialID(0));
}

TEST_F(ValidatorManagerTest, InitializeOnlyOnce) {
    InitializeDefault();
    EXPECT_FALSE(Initialize(MakeConversion(5, 100)));
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidInitializationStatus);
}

TEST_F(ValidatorManagerTest, InitializeRejectsConversionMismatch) {
    ConversionData data = MakeConversion(5, 100);
    warp_.SetPChainMessage(CONVERSION_INDEX, PackSubnetToL1ConversionMessage(ConversionID(data)));
    data.initialValidators[0].weight = 101;

    EXPECT_FALSE(manager_->InitializeValidatorSet(data, CONVERSION_INDEX, state_));
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidConversionID);
    EXPECT_FALSE(manager_->IsInitialized());
    EXPECT_EQ(manager_->ValidatorCount(), 0u);
    EXPECT_EQ(manager_->L1TotalWeight(), 0u);
}

TEST_F(ValidatorManagerTest, InitializeRejectsForeignManager) {
    ConversionData data = MakeConversion(5, 100);
    data.validatorManagerBlockchainID = FilledHash(0xC2);
    EXPECT_FALSE(Initialize(data));
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidValidatorManagerBlockchainID);

    data = MakeConversion(5, 100);
    data.validatorManagerAddress = MakeAddress(0x3B);
    state_.Clear();
    EXPECT_FALSE(Initialize(data));
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidValidatorManagerAddress);
}

TEST_F(ValidatorManagerTest, InitializeRejectsDuplicateNode) {
    ConversionData data = MakeConversion(3, 100);
    data.initialValidators[2].nodeID = data.initialValidators[0].nodeID;
    EXPECT_FALSE(Initialize(data));
    EXPECT_EQ(state_.GetCode(), ErrorCode::NodeAlreadyRegistered);
    EXPECT_EQ(manager_->ValidatorCount(), 0u);
}

TEST_F(ValidatorManagerTest, InitializeRejectsTinyTotalWeight) {
    // 4 * 20% is below one unit of churn
    EXPECT_FALSE(Initialize(MakeConversion(4, 1)));
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidTotalWeight);
    EXPECT_EQ(state_.GetValue(), 4u);
}

TEST_F(ValidatorManagerTest, InitializeRequiresConversionMessage) {
    EXPECT_FALSE(manager_->InitializeValidatorSet(MakeConversion(5, 100), 9, state_));
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidWarpMessage);
}

// ============================================================================
// Registration
// ============================================================================

TEST_F(ValidatorManagerTest, RegistrationRespectsChurn) {
    InitializeDefault();

    EXPECT_FALSE(Register(0x01, 150).has_value());
    EXPECT_EQ(state_.GetCode(), ErrorCode::MaxChurnRateExceeded);
    EXPECT_EQ(manager_->ValidatorCount(), 5u);
    EXPECT_EQ(warp_.SentCount(), 0u);
    EXPECT_TRUE(events_.empty());

    state_.Clear();
    auto id = Register(0x01, 90);
    ASSERT_TRUE(id.has_value()) << state_.ToString();
    EXPECT_EQ(manager_->L1TotalWeight(), 590u);

    auto v = manager_->GetValidator(*id);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->status, ValidatorStatus::PendingAdded);
    EXPECT_EQ(v->weight, 90u);

    // The sent payload is the pending message and hashes to the validationID
    ASSERT_EQ(warp_.SentCount(), 1u);
    EXPECT_EQ(WarpMessageID(warp_.LastSentMessage()), *id);
    EXPECT_EQ(manager_->GetPendingMessage(*id), warp_.LastSentMessage());

    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0].type, EventType::InitiatedValidatorRegistration);
    EXPECT_EQ(events_[0].messageID, *id);
    EXPECT_EQ(events_[0].timestamp, static_cast<Timestamp>(START + 3600));
}

TEST_F(ValidatorManagerTest, RegistrationRejectsShortBLSKey) {
    InitializeDefault();
    ValidatorRegistrationInput input = MakeInput(0x01);
    input.blsPublicKey.resize(47);

    EXPECT_FALSE(manager_->InitiateValidatorRegistration(settings_.admin, input, 50, state_));
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidBLSKeyLength);
    EXPECT_EQ(state_.GetValue(), 47u);
    EXPECT_EQ(state_.GetKind(), ErrorKind::InputValidation);
    EXPECT_EQ(manager_->L1TotalWeight(), 500u);
}

TEST_F(ValidatorManagerTest, RegistrationRejectsBadNodeID) {
    InitializeDefault();
    ValidatorRegistrationInput input = MakeInput(0x01);
    input.nodeID.resize(32);
    EXPECT_FALSE(manager_->InitiateValidatorRegistration(settings_.admin, input, 50, state_));
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidNodeID);

    input = MakeInput(0x00);
    state_.Clear();
    EXPECT_FALSE(manager_->InitiateValidatorRegistration(settings_.admin, input, 50, state_));
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidNodeID);
}

TEST_F(ValidatorManagerTest, RegistrationExpiryWindow) {
    InitializeDefault();
    ValidatorRegistrationInput input = MakeInput(0x01);

    input.registrationExpiry = Now();
    EXPECT_FALSE(manager_->InitiateValidatorRegistration(settings_.admin, input, 50, state_));
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidRegistrationExpiry);

    input.registrationExpiry = Now() + MAXIMUM_REGISTRATION_EXPIRY_LENGTH;
    state_.Clear();
    EXPECT_FALSE(manager_->InitiateValidatorRegistration(settings_.admin, input, 50, state_));
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidRegistrationExpiry);

    input.registrationExpiry = Now() + MAXIMUM_REGISTRATION_EXPIRY_LENGTH - 1;
    state_.Clear();
    EXPECT_TRUE(manager_->InitiateValidatorRegistration(settings_.admin, input, 50, state_))
        << state_.ToString();
}

TEST_F(ValidatorManagerTest, RegistrationChecksPChainOwners) {
    InitializeDefault();
    ValidatorRegistrationInput input = MakeInput(0x01);
    input.remainingBalanceOwner.threshold = 2;
    input.remainingBalanceOwner.addresses = {MakeAddress(0x01)};
    EXPECT_FALSE(manager_->InitiateValidatorRegistration(settings_.admin, input, 50, state_));
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidPChainOwnerThreshold);

    input = MakeInput(0x01);
    input.disableOwner.threshold = 1;
    input.disableOwner.addresses = {MakeAddress(0x02), MakeAddress(0x01)};
    state_.Clear();
    EXPECT_FALSE(manager_->InitiateValidatorRegistration(settings_.admin, input, 50, state_));
    EXPECT_EQ(state_.GetCode(), ErrorCode::PChainOwnerAddressesNotSorted);
}

TEST_F(ValidatorManagerTest, RegistrationRequiresOwnerAndInitialization) {
    ASSERT_FALSE(Register(0x01, 50).has_value());
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidInitializationStatus);

    InitializeDefault();
    state_.Clear();
    EXPECT_FALSE(manager_->InitiateValidatorRegistration(MakeAddress(0x99), MakeInput(0x01), 50,
                                                         state_));
    EXPECT_EQ(state_.GetCode(), ErrorCode::UnauthorizedOwner);
    EXPECT_EQ(state_.GetKind(), ErrorKind::Authorization);
}

TEST_F(ValidatorManagerTest, RegistrationRejectsRegisteredNode) {
    InitializeDefault();
    EXPECT_FALSE(Register(0xA0, 50).has_value());
    EXPECT_EQ(state_.GetCode(), ErrorCode::NodeAlreadyRegistered);

    state_.Clear();
    ASSERT_TRUE(Register(0x01, 50).has_value());
    EXPECT_FALSE(Register(0x01, 10).has_value());
    EXPECT_EQ(state_.GetCode(), ErrorCode::NodeAlreadyRegistered);
}

TEST_F(ValidatorManagerTest, CompleteRegistration) {
    InitializeDefault();
    auto id = Register(0x01, 90);
    ASSERT_TRUE(id.has_value());
    util::AdvanceMockTime(util::Seconds(120));

    AckRegistration(*id, true);
    auto completed = manager_->CompleteValidatorRegistration(settings_.admin, ACK_INDEX, state_);
    ASSERT_TRUE(completed.has_value()) << state_.ToString();
    EXPECT_EQ(*completed, *id);

    auto v = manager_->GetValidator(*id);
    EXPECT_EQ(v->status, ValidatorStatus::Active);
    EXPECT_EQ(v->startTime, static_cast<Timestamp>(START + 120));
    EXPECT_FALSE(manager_->GetPendingMessage(*id).has_value());
    EXPECT_EQ(events_.back().type, EventType::CompletedValidatorRegistration);

    // A second acknowledgement finds nothing pending
    EXPECT_FALSE(manager_->CompleteValidatorRegistration(settings_.admin, ACK_INDEX, state_).has_value());
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidValidationID);
}

TEST_F(ValidatorManagerTest, CompleteRegistrationRequiresValidProof) {
    InitializeDefault();
    auto id = Register(0x01, 90);
    AckRegistration(*id, false);
    EXPECT_FALSE(manager_->CompleteValidatorRegistration(settings_.admin, ACK_INDEX, state_).has_value());
    EXPECT_EQ(state_.GetCode(), ErrorCode::UnexpectedRegistrationStatus);
    EXPECT_EQ(manager_->GetValidator(*id)->status, ValidatorStatus::PendingAdded);
}

TEST_F(ValidatorManagerTest, ResendRegistrationIsIdempotent) {
    InitializeDefault();
    auto id = Register(0x01, 90);
    ASSERT_TRUE(id.has_value());
    Bytes original = warp_.LastSentMessage();
    Weight total = manager_->L1TotalWeight();

    auto first = manager_->ResendRegisterValidatorMessage(*id, state_);
    auto second = manager_->ResendRegisterValidatorMessage(*id, state_);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, original);
    EXPECT_EQ(*second, original);
    EXPECT_EQ(warp_.SentCount(), 3u);
    EXPECT_EQ(manager_->L1TotalWeight(), total);

    AckRegistration(*id, true);
    ASSERT_TRUE(manager_->CompleteValidatorRegistration(settings_.admin, ACK_INDEX, state_).has_value());
    EXPECT_FALSE(manager_->ResendRegisterValidatorMessage(*id, state_).has_value());
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidValidationID);
}

// ============================================================================
// Removal
// ============================================================================

TEST_F(ValidatorManagerTest, RemovalLifecycle) {
    InitializeDefault();
    Hash256 id = RegisterActive(0x01, 90);
    ASSERT_EQ(manager_->L1TotalWeight(), 590u);

    ASSERT_TRUE(manager_->InitiateValidatorRemoval(settings_.admin, id, state_))
        << state_.ToString();
    auto v = manager_->GetValidator(id);
    EXPECT_EQ(v->status, ValidatorStatus::PendingRemoved);
    EXPECT_EQ(v->weight, 0u);
    EXPECT_EQ(v->sentNonce, 1u);
    EXPECT_EQ(v->endTime, Now());
    EXPECT_EQ(manager_->L1TotalWeight(), 500u);
    EXPECT_EQ(events_.back().type, EventType::InitiatedValidatorRemoval);
    EXPECT_EQ(events_.back().weight, 90u);

    Bytes expected = PackL1ValidatorWeightMessage({id, 1, 0});
    EXPECT_EQ(warp_.LastSentMessage(), expected);
    auto resent = manager_->ResendValidatorRemovalMessage(id, state_);
    ASSERT_TRUE(resent.has_value());
    EXPECT_EQ(*resent, expected);

    // Removal needs the P-Chain to report the validation as ended
    AckRegistration(id, true);
    EXPECT_FALSE(manager_->CompleteValidatorRemoval(settings_.admin, ACK_INDEX, state_).has_value());
    EXPECT_EQ(state_.GetCode(), ErrorCode::UnexpectedRegistrationStatus);
    EXPECT_EQ(state_.GetValue(), 1u);

    AckRegistration(id, false);
    state_.Clear();
    auto verified = manager_->VerifyValidatorRemoval(ACK_INDEX, state_);
    ASSERT_TRUE(verified.has_value());
    EXPECT_EQ(verified->newStatus, ValidatorStatus::Completed);
    EXPECT_EQ(manager_->GetValidator(id)->status, ValidatorStatus::PendingRemoved);

    ASSERT_TRUE(manager_->CompleteValidatorRemoval(settings_.admin, ACK_INDEX, state_).has_value());
    EXPECT_EQ(manager_->GetValidator(id)->status, ValidatorStatus::Completed);
    EXPECT_FALSE(manager_->GetNodeValidationID(NodeID(MakeNodeID(0x01).data(), NODE_ID_LENGTH)));
    EXPECT_FALSE(manager_->GetPendingMessage(id).has_value());
    EXPECT_EQ(events_.back().type, EventType::CompletedValidatorRemoval);

    EXPECT_FALSE(manager_->CompleteValidatorRemoval(settings_.admin, ACK_INDEX, state_).has_value());
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidValidatorStatus);
}

TEST_F(ValidatorManagerTest, NodeReusableAfterRemoval) {
    InitializeDefault();
    Hash256 first = RegisterActive(0x01, 90);
    ASSERT_TRUE(manager_->InitiateValidatorRemoval(settings_.admin, first, state_));
    AckRegistration(first, false);
    ASSERT_TRUE(manager_->CompleteValidatorRemoval(settings_.admin, ACK_INDEX, state_).has_value());
    util::AdvanceMockTime(util::Seconds(CHURN_PERIOD));

    auto second = Register(0x01, 90);
    ASSERT_TRUE(second.has_value()) << state_.ToString();
    EXPECT_NE(*second, first);
    EXPECT_EQ(manager_->GetNodeValidationID(NodeID(MakeNodeID(0x01).data(), NODE_ID_LENGTH)),
              *second);
    EXPECT_EQ(manager_->GetValidator(first)->status, ValidatorStatus::Completed);
}

TEST_F(ValidatorManagerTest, RejectedRegistrationIsInvalidated) {
    InitializeDefault();
    auto id = Register(0x01, 90);
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(manager_->L1TotalWeight(), 590u);

    AckRegistration(*id, false);
    ASSERT_TRUE(manager_->CompleteValidatorRemoval(settings_.admin, ACK_INDEX, state_).has_value())
        << state_.ToString();

    auto v = manager_->GetValidator(*id);
    EXPECT_EQ(v->status, ValidatorStatus::Invalidated);
    EXPECT_EQ(manager_->L1TotalWeight(), 500u);
    EXPECT_FALSE(manager_->GetPendingMessage(*id).has_value());

    // The node ID is free again
    util::AdvanceMockTime(util::Seconds(CHURN_PERIOD));
    EXPECT_TRUE(Register(0x01, 90).has_value()) << state_.ToString();
}

TEST_F(ValidatorManagerTest, RemovalRequiresActiveValidator) {
    InitializeDefault();
    auto id = Register(0x01, 90);
    EXPECT_FALSE(manager_->InitiateValidatorRemoval(settings_.admin, *id, state_));
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidValidatorStatus);
    EXPECT_EQ(state_.GetValue(), static_cast<uint64_t>(ValidatorStatus::PendingAdded));

    state_.Clear();
    EXPECT_FALSE(manager_->InitiateValidatorRemoval(settings_.admin, FilledHash(0xEE), state_));
    EXPECT_EQ(state_.GetValue(), static_cast<uint64_t>(ValidatorStatus::Unknown));

    state_.Clear();
    EXPECT_FALSE(manager_->InitiateValidatorRemoval(MakeAddress(0x99), InitialID(0), state_));
    EXPECT_EQ(state_.GetCode(), ErrorCode::UnauthorizedOwner);
}

TEST_F(ValidatorManagerTest, RemovalRespectsChurn) {
    InitializeDefault();
    // Removing 100 of 500 fits; a second one in the same window does not
    ASSERT_TRUE(manager_->InitiateValidatorRemoval(settings_.admin, InitialID(0), state_));
    EXPECT_FALSE(manager_->InitiateValidatorRemoval(settings_.admin, InitialID(1), state_));
    EXPECT_EQ(state_.GetCode(), ErrorCode::MaxChurnRateExceeded);
    EXPECT_EQ(manager_->GetValidator(InitialID(1))->status, ValidatorStatus::Active);
}

// ============================================================================
// Weight Updates
// ============================================================================

TEST_F(ValidatorManagerTest, WeightUpdateNonces) {
    InitializeDefault();
    Hash256 id = InitialID(0);

    auto first = manager_->InitiateValidatorWeightUpdate(settings_.admin, id, 110, state_);
    ASSERT_TRUE(first.has_value()) << state_.ToString();
    EXPECT_EQ(first->nonce, 1u);
    auto second = manager_->InitiateValidatorWeightUpdate(settings_.admin, id, 120, state_);
    ASSERT_TRUE(second.has_value()) << state_.ToString();
    EXPECT_EQ(second->nonce, 2u);

    auto v = manager_->GetValidator(id);
    EXPECT_EQ(v->weight, 120u);
    EXPECT_EQ(v->sentNonce, 2u);
    EXPECT_EQ(v->receivedNonce, 0u);
    EXPECT_EQ(manager_->L1TotalWeight(), 520u);

    // A nonce that was never sent
    AckWeight(id, 3, 120);
    EXPECT_FALSE(manager_->CompleteValidatorWeightUpdate(settings_.admin, ACK_INDEX, state_).has_value());
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidNonce);
    EXPECT_EQ(state_.GetValue(), 3u);

    // The latest nonce settles everything before it
    AckWeight(id, 2, 120);
    state_.Clear();
    auto ack = manager_->CompleteValidatorWeightUpdate(settings_.admin, ACK_INDEX, state_);
    ASSERT_TRUE(ack.has_value()) << state_.ToString();
    EXPECT_EQ(ack->nonce, 2u);
    EXPECT_EQ(manager_->GetValidator(id)->receivedNonce, 2u);
    EXPECT_FALSE(manager_->GetPendingMessage(id).has_value());

    // A late acknowledgement of an older nonce never moves receivedNonce back
    AckWeight(id, 1, 110);
    ASSERT_TRUE(manager_->CompleteValidatorWeightUpdate(settings_.admin, ACK_INDEX, state_).has_value());
    EXPECT_EQ(manager_->GetValidator(id)->receivedNonce, 2u);
}

TEST_F(ValidatorManagerTest, PartialAckKeepsPendingMessage) {
    InitializeDefault();
    Hash256 id = InitialID(0);
    ASSERT_TRUE(manager_->InitiateValidatorWeightUpdate(settings_.admin, id, 110, state_));
    ASSERT_TRUE(manager_->InitiateValidatorWeightUpdate(settings_.admin, id, 120, state_));

    AckWeight(id, 1, 110);
    ASSERT_TRUE(manager_->CompleteValidatorWeightUpdate(settings_.admin, ACK_INDEX, state_).has_value());
    EXPECT_EQ(manager_->GetValidator(id)->receivedNonce, 1u);
    EXPECT_EQ(manager_->GetPendingMessage(id), PackL1ValidatorWeightMessage({id, 2, 120}));
}

TEST_F(ValidatorManagerTest, WeightUpdateRequiresActive) {
    InitializeDefault();
    auto id = Register(0x01, 50);
    EXPECT_FALSE(manager_->InitiateValidatorWeightUpdate(settings_.admin, *id, 60, state_));
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidValidatorStatus);
}

TEST_F(ValidatorManagerTest, VerifyWeightUpdateDoesNotApply) {
    InitializeDefault();
    Hash256 id = InitialID(0);
    ASSERT_TRUE(manager_->InitiateValidatorWeightUpdate(settings_.admin, id, 110, state_));

    AckWeight(id, 1, 110);
    auto ack = manager_->VerifyValidatorWeightUpdate(ACK_INDEX, state_);
    ASSERT_TRUE(ack.has_value());
    EXPECT_EQ(ack->weight, 110u);
    EXPECT_EQ(manager_->GetValidator(id)->receivedNonce, 0u);
}

TEST_F(ValidatorManagerTest, ResendWeightMessage) {
    InitializeDefault();
    Hash256 id = InitialID(0);
    EXPECT_FALSE(manager_->ResendValidatorWeightMessage(id, state_).has_value());
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidNonce);

    ASSERT_TRUE(manager_->InitiateValidatorWeightUpdate(settings_.admin, id, 110, state_));
    Bytes expected = PackL1ValidatorWeightMessage({id, 1, 110});
    state_.Clear();
    EXPECT_EQ(manager_->ResendValidatorWeightMessage(id, state_), expected);

    // Rebuilt from the record once the cached copy is gone
    AckWeight(id, 1, 110);
    ASSERT_TRUE(
        manager_->CompleteValidatorWeightUpdate(settings_.admin, ACK_INDEX, state_).has_value());
    EXPECT_EQ(manager_->ResendValidatorWeightMessage(id, state_), expected);
}

// ============================================================================
// Ownership
// ============================================================================

TEST_F(ValidatorManagerTest, TransferOwnership) {
    InitializeDefault();
    Address next = MakeAddress(0x0F);

    EXPECT_FALSE(manager_->TransferOwnership(MakeAddress(0x99), next, state_));
    EXPECT_EQ(state_.GetCode(), ErrorCode::UnauthorizedOwner);

    state_.Clear();
    EXPECT_FALSE(manager_->TransferOwnership(settings_.admin, Address(), state_));
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidOwnerAddress);

    state_.Clear();
    ASSERT_TRUE(manager_->TransferOwnership(settings_.admin, next, state_));
    EXPECT_EQ(manager_->GetOwner(), next);
    EXPECT_FALSE(manager_->InitiateValidatorRegistration(settings_.admin, MakeInput(0x01), 50,
                                                         state_));
    EXPECT_TRUE(manager_->InitiateValidatorRegistration(next, MakeInput(0x01), 50, state_));
}

TEST_F(ValidatorManagerTest, MigrateToPermissionless) {
    InitializeDefault();
    Address staking = MakeAddress(0x5A);

    ASSERT_TRUE(manager_->MigrateToPermissionless(settings_.admin, staking, state_));
    EXPECT_TRUE(manager_->IsPermissionless());
    EXPECT_EQ(manager_->GetOwner(), staking);

    // The former admin lost its rights and the hand-off is final
    EXPECT_FALSE(manager_->InitiateValidatorRemoval(settings_.admin, InitialID(0), state_));
    EXPECT_EQ(state_.GetCode(), ErrorCode::UnauthorizedOwner);
    state_.Clear();
    EXPECT_FALSE(manager_->MigrateToPermissionless(staking, MakeAddress(0x5B), state_));
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidInitializationStatus);
    state_.Clear();
    EXPECT_FALSE(manager_->TransferOwnership(staking, MakeAddress(0x5B), state_));
    EXPECT_EQ(state_.GetCode(), ErrorCode::UnauthorizedOwner);
}

TEST_F(ValidatorManagerTest, CompletionsRequireOwner) {
    InitializeDefault();
    Address stranger = MakeAddress(0x99);

    auto id = Register(0x01, 50);
    ASSERT_TRUE(id.has_value());
    AckRegistration(*id, true);
    EXPECT_FALSE(manager_->CompleteValidatorRegistration(stranger, ACK_INDEX, state_).has_value());
    EXPECT_EQ(state_.GetCode(), ErrorCode::UnauthorizedOwner);
    EXPECT_EQ(manager_->GetValidator(*id)->status, ValidatorStatus::PendingAdded);

    state_.Clear();
    ASSERT_TRUE(manager_->InitiateValidatorWeightUpdate(settings_.admin, InitialID(0), 110, state_));
    AckWeight(InitialID(0), 1, 110);
    EXPECT_FALSE(manager_->CompleteValidatorWeightUpdate(stranger, ACK_INDEX, state_).has_value());
    EXPECT_EQ(state_.GetCode(), ErrorCode::UnauthorizedOwner);
    EXPECT_EQ(manager_->GetValidator(InitialID(0))->receivedNonce, 0u);

    state_.Clear();
    util::AdvanceMockTime(util::Seconds(CHURN_PERIOD));
    ASSERT_TRUE(manager_->InitiateValidatorRemoval(settings_.admin, InitialID(1), state_));
    AckRegistration(InitialID(1), false);
    EXPECT_FALSE(manager_->CompleteValidatorRemoval(stranger, ACK_INDEX, state_).has_value());
    EXPECT_EQ(state_.GetCode(), ErrorCode::UnauthorizedOwner);
    EXPECT_EQ(manager_->GetValidator(InitialID(1))->status, ValidatorStatus::PendingRemoved);

    // After migration only the staking manager may complete
    state_.Clear();
    Address staking = MakeAddress(0x5A);
    ASSERT_TRUE(manager_->MigrateToPermissionless(settings_.admin, staking, state_));
    EXPECT_FALSE(
        manager_->CompleteValidatorRemoval(settings_.admin, ACK_INDEX, state_).has_value());
    EXPECT_EQ(state_.GetCode(), ErrorCode::UnauthorizedOwner);
    state_.Clear();
    ASSERT_TRUE(manager_->CompleteValidatorRemoval(staking, ACK_INDEX, state_).has_value())
        << state_.ToString();
    EXPECT_EQ(manager_->GetValidator(InitialID(1))->status, ValidatorStatus::Completed);
}

// ============================================================================
// Deferred Events
// ============================================================================

TEST_F(ValidatorManagerTest, CollectedEventsWaitForEmit) {
    InitializeDefault();
    std::vector<Event> collected;

    auto id = manager_->InitiateValidatorRegistration(settings_.admin, MakeInput(0x01), 50,
                                                      collected, state_);
    ASSERT_TRUE(id.has_value()) << state_.ToString();
    AckRegistration(*id, true);
    ASSERT_TRUE(manager_->CompleteValidatorRegistration(settings_.admin, ACK_INDEX, collected,
                                                        state_));
    ASSERT_EQ(collected.size(), 2u);
    EXPECT_EQ(collected[0].type, EventType::InitiatedValidatorRegistration);
    EXPECT_EQ(collected[1].type, EventType::CompletedValidatorRegistration);
    EXPECT_TRUE(events_.empty());

    // A rejected call leaves the collection alone
    EXPECT_FALSE(manager_->CompleteValidatorRegistration(settings_.admin, ACK_INDEX, collected,
                                                         state_));
    EXPECT_EQ(collected.size(), 2u);

    manager_->EmitEvents(collected);
    ASSERT_EQ(events_.size(), 2u);
    EXPECT_EQ(events_[1].validationID, *id);
}

TEST_F(ValidatorManagerTest, CallbackMayQueryManager) {
    InitializeDefault();
    std::optional<Validator> seen;
    manager_->SetEventCallback([this, &seen](const Event& e) {
        if (e.type == EventType::InitiatedValidatorRemoval) {
            seen = manager_->GetValidator(e.validationID);
        }
    });
    ASSERT_TRUE(manager_->InitiateValidatorRemoval(settings_.admin, InitialID(2), state_));
    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen->status, ValidatorStatus::PendingRemoved);
}

// ============================================================================
// Legacy Records
// ============================================================================

class LegacyMigrationTest : public ValidatorManagerTest {
protected:
    static constexpr Weight LEGACY_WEIGHT = 80;

    void SetUp() override {
        ValidatorManagerTest::SetUp();
        InitializeDefault();

        legacyID_ = FilledHash(0x1E);
        LegacyValidator legacy;
        legacy.status = ValidatorStatus::Active;
        legacy.nodeID = NodeID(MakeNodeID(0x77).data(), NODE_ID_LENGTH);
        legacy.startingWeight = 100;
        legacy.messageNonce = 3;
        legacy.weight = LEGACY_WEIGHT;
        legacy.startedAt = START - 1000;

        ValidatorManagerSnapshot snapshot = manager_->Snapshot();
        snapshot.legacyValidators[legacyID_] = legacy;
        snapshot.churn.totalWeight += LEGACY_WEIGHT;
        manager_->Restore(snapshot);
    }

    Hash256 legacyID_;
};

TEST_F(LegacyMigrationTest, LegacyNodeStaysRegistered) {
    EXPECT_EQ(manager_->GetNodeValidationID(NodeID(MakeNodeID(0x77).data(), NODE_ID_LENGTH)),
              legacyID_);
    EXPECT_FALSE(Register(0x77, 10).has_value());
    EXPECT_EQ(state_.GetCode(), ErrorCode::NodeAlreadyRegistered);
}

TEST_F(LegacyMigrationTest, RequiresOwner) {
    EXPECT_FALSE(manager_->MigrateFromV1(MakeAddress(0x99), legacyID_, 3, state_));
    EXPECT_EQ(state_.GetCode(), ErrorCode::UnauthorizedOwner);
    EXPECT_TRUE(manager_->GetLegacyValidator(legacyID_).has_value());
}

TEST_F(LegacyMigrationTest, RejectsUnknownRecord) {
    EXPECT_FALSE(manager_->MigrateFromV1(settings_.admin, FilledHash(0x2E), 0, state_));
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidValidationID);
}

TEST_F(LegacyMigrationTest, ReceivedNonceCannotExceedSent) {
    EXPECT_FALSE(manager_->MigrateFromV1(settings_.admin, legacyID_, 4, state_));
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidNonce);
    EXPECT_FALSE(manager_->GetValidator(legacyID_).has_value());
}

TEST_F(LegacyMigrationTest, MigratesOnce) {
    ASSERT_TRUE(manager_->MigrateFromV1(settings_.admin, legacyID_, 2, state_))
        << state_.ToString();

    auto v = manager_->GetValidator(legacyID_);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->status, ValidatorStatus::Active);
    EXPECT_EQ(v->sentNonce, 3u);
    EXPECT_EQ(v->receivedNonce, 2u);
    EXPECT_EQ(v->weight, LEGACY_WEIGHT);
    EXPECT_EQ(v->startingWeight, 100u);
    EXPECT_EQ(v->startTime, static_cast<Timestamp>(START - 1000));
    EXPECT_FALSE(manager_->GetLegacyValidator(legacyID_).has_value());

    EXPECT_FALSE(manager_->MigrateFromV1(settings_.admin, legacyID_, 2, state_));
    EXPECT_EQ(state_.GetCode(), ErrorCode::InvalidValidationID);
}

TEST_F(LegacyMigrationTest, MigratedValidatorCanBeRemoved) {
    ASSERT_TRUE(manager_->MigrateFromV1(settings_.admin, legacyID_, 3, state_));
    util::AdvanceMockTime(util::Seconds(CHURN_PERIOD));

    ASSERT_TRUE(manager_->InitiateValidatorRemoval(settings_.admin, legacyID_, state_))
        << state_.ToString();
    EXPECT_EQ(manager_->GetValidator(legacyID_)->sentNonce, 4u);
    EXPECT_EQ(manager_->GetPendingMessage(legacyID_),
              PackL1ValidatorWeightMessage({legacyID_, 4, 0}));

    AckRegistration(legacyID_, false);
    ASSERT_TRUE(manager_->CompleteValidatorRemoval(settings_.admin, ACK_INDEX, state_).has_value());
    EXPECT_EQ(manager_->GetValidator(legacyID_)->status, ValidatorStatus::Completed);
    EXPECT_EQ(manager_->L1TotalWeight(), 500u);
    EXPECT_FALSE(manager_->GetNodeValidationID(NodeID(MakeNodeID(0x77).data(), NODE_ID_LENGTH)));
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(ValidatorManagerTest, SnapshotRestore) {
    InitializeDefault();
    auto pending = Register(0x01, 90);
    ASSERT_TRUE(pending.has_value());
    ValidatorManagerSnapshot snapshot = manager_->Snapshot();

    ValidatorManager restored(settings_, warp_);
    restored.Restore(snapshot);

    EXPECT_TRUE(restored.IsInitialized());
    EXPECT_EQ(restored.ValidatorCount(), 6u);
    EXPECT_EQ(restored.L1TotalWeight(), 590u);
    EXPECT_EQ(restored.GetChurnPeriod(), manager_->GetChurnPeriod());
    EXPECT_EQ(restored.GetPendingMessage(*pending), manager_->GetPendingMessage(*pending));
    EXPECT_EQ(restored.GetNodeValidationID(NodeID(MakeNodeID(0x01).data(), NODE_ID_LENGTH)),
              *pending);

    // The rebuilt node index keeps rejecting live node IDs
    ManagerState state;
    ValidatorRegistrationInput input = MakeInput(0xA0);
    EXPECT_FALSE(restored.InitiateValidatorRegistration(settings_.admin, input, 1, state));
    EXPECT_EQ(state.GetCode(), ErrorCode::NodeAlreadyRegistered);
}

} // namespace test
} // namespace validator
} // namespace valset
