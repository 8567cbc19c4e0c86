// VALSET - Warp Messenger Implementation
// Copyright (c) 2024 VALSET Developers
// MIT License

#include <valset/validator/warp.h>
#include <valset/crypto/sha256.h>
#include <valset/util/logging.h>

namespace valset {
namespace validator {

namespace LogCategory = util::LogCategory;

const Hash256 P_CHAIN_BLOCKCHAIN_ID{};

Hash256 WarpMessageID(const Bytes& payload) {
    return crypto::SHA256Hash(payload);
}

LocalWarpMessenger::LocalWarpMessenger(const Hash256& blockchainID)
    : blockchainID_(blockchainID) {}

std::optional<WarpMessage> LocalWarpMessenger::GetVerifiedWarpMessage(uint32_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = inbound_.find(index);
    if (it == inbound_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Hash256 LocalWarpMessenger::SendWarpMessage(const Bytes& payload) {
    Hash256 id = WarpMessageID(payload);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outbox_.push_back(payload);
    }
    LOG_DEBUG(LogCategory::WARP) << "Sent message " << id.ToShortHex()
                                 << " (" << payload.size() << " bytes)";
    return id;
}

void LocalWarpMessenger::SetVerifiedMessage(uint32_t index, const WarpMessage& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    inbound_[index] = message;
}

void LocalWarpMessenger::SetPChainMessage(uint32_t index, const Bytes& payload) {
    WarpMessage msg;
    msg.sourceChainID = P_CHAIN_BLOCKCHAIN_ID;
    msg.payload = payload;
    SetVerifiedMessage(index, msg);
}

void LocalWarpMessenger::ClearVerifiedMessages() {
    std::lock_guard<std::mutex> lock(mutex_);
    inbound_.clear();
}

std::vector<Bytes> LocalWarpMessenger::GetSentMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outbox_;
}

size_t LocalWarpMessenger::SentCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outbox_.size();
}

Bytes LocalWarpMessenger::LastSentMessage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outbox_.empty() ? Bytes{} : outbox_.back();
}

std::optional<WarpMessage> GetWarpMessageFrom(const IWarpMessenger& messenger,
                                              uint32_t index,
                                              const Hash256& sourceChainID,
                                              ManagerState& state) {
    auto msg = messenger.GetVerifiedWarpMessage(index);
    if (!msg) {
        state.Invalid(ErrorCode::InvalidWarpMessage, index, "no verified message at index");
        return std::nullopt;
    }
    if (msg->sourceChainID != sourceChainID) {
        state.Invalid(ErrorCode::InvalidWarpSourceChainID, index,
                      "unexpected source chain " + msg->sourceChainID.ToHex());
        return std::nullopt;
    }
    if (!msg->originSenderAddress.IsNull()) {
        state.Invalid(ErrorCode::InvalidWarpOriginSenderAddress, index,
                      "unexpected origin sender " + msg->originSenderAddress.ToHex());
        return std::nullopt;
    }
    return msg;
}

std::optional<WarpMessage> GetPChainWarpMessage(const IWarpMessenger& messenger,
                                                uint32_t index, ManagerState& state) {
    return GetWarpMessageFrom(messenger, index, P_CHAIN_BLOCKCHAIN_ID, state);
}

} // namespace validator
} // namespace valset
