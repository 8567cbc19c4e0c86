// VALSET - Warp Messenger
// Copyright (c) 2024 VALSET Developers
// MIT License
//
// Authenticated cross-chain messaging as seen by the managers. Signature
// aggregation and verification happen outside this library; a messenger
// only hands out messages that were already verified, and accepts outbound
// payloads for off-chain signing and relay.

#ifndef VALSET_VALIDATOR_WARP_H
#define VALSET_VALIDATOR_WARP_H

#include <valset/core/types.h>
#include <valset/validator/errors.h>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace valset {
namespace validator {

/// Blockchain ID under which P-Chain messages are delivered
extern const Hash256 P_CHAIN_BLOCKCHAIN_ID;

struct WarpMessage {
    Hash256 sourceChainID;
    Address originSenderAddress;
    Bytes payload;
};

/// Abstract cross-chain messenger
class IWarpMessenger {
public:
    virtual ~IWarpMessenger() = default;

    /// ID of the chain this messenger runs on
    virtual Hash256 GetBlockchainID() const = 0;

    /// Verified inbound message at `index` of the current transaction
    virtual std::optional<WarpMessage> GetVerifiedWarpMessage(uint32_t index) const = 0;

    /// Publish an outbound payload; returns its message ID
    virtual Hash256 SendWarpMessage(const Bytes& payload) = 0;
};

/// In-process messenger: an outbox plus a table of pre-verified inbound
/// messages indexed the way a transaction's predicate list would be.
class LocalWarpMessenger : public IWarpMessenger {
public:
    explicit LocalWarpMessenger(const Hash256& blockchainID);

    Hash256 GetBlockchainID() const override { return blockchainID_; }
    std::optional<WarpMessage> GetVerifiedWarpMessage(uint32_t index) const override;
    Hash256 SendWarpMessage(const Bytes& payload) override;

    /// Install a verified inbound message at `index`
    void SetVerifiedMessage(uint32_t index, const WarpMessage& message);

    /// Convenience for a P-Chain payload (zero chain ID, zero sender)
    void SetPChainMessage(uint32_t index, const Bytes& payload);

    void ClearVerifiedMessages();

    std::vector<Bytes> GetSentMessages() const;
    size_t SentCount() const;

    /// Most recently sent payload, empty if none
    Bytes LastSentMessage() const;

private:
    const Hash256 blockchainID_;
    std::map<uint32_t, WarpMessage> inbound_;
    std::vector<Bytes> outbox_;
    mutable std::mutex mutex_;
};

/// ID assigned to an outbound payload: sha256(payload)
Hash256 WarpMessageID(const Bytes& payload);

/// Fetch message `index` and require it to come from the P-Chain
std::optional<WarpMessage> GetPChainWarpMessage(const IWarpMessenger& messenger,
                                                uint32_t index, ManagerState& state);

/// Fetch message `index` and require it to come from `sourceChainID` with a
/// zero origin sender (uptime proofs)
std::optional<WarpMessage> GetWarpMessageFrom(const IWarpMessenger& messenger,
                                              uint32_t index,
                                              const Hash256& sourceChainID,
                                              ManagerState& state);

} // namespace validator
} // namespace valset

#endif // VALSET_VALIDATOR_WARP_H
