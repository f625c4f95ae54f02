#pragma once
// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/secp256k1.h"
#include "eth/address.h"
#include "eth/client.h"
#include "publish/endpoint.h"

#include <chrono>
#include <string>

namespace eth {

struct EndpointTimeouts {
    std::chrono::milliseconds probe{5000};
    std::chrono::milliseconds request{30000};
    std::chrono::milliseconds receipt{60000};
    std::chrono::milliseconds receipt_poll{1000};
};

/// publish::Endpoint backed by an Ethereum JSON-RPC node. Each submit()
/// resolves chain id and nonce fresh, signs a legacy storeString call
/// with the worker's key and waits for its receipt.
class EthEndpoint : public publish::Endpoint {
public:
    /// @p signer must outlive the endpoint.
    EthEndpoint(rpc::Url url, const crypto::ECKey& signer, Address contract,
                EndpointTimeouts timeouts);

    std::string name() const override;
    bool is_reachable() override;
    core::Result<publish::SubmitOutcome> submit(
        const publish::WriteRequest& request) override;

private:
    EthClient            client_;
    const crypto::ECKey& signer_;
    Address              sender_;
    Address              contract_;
    EndpointTimeouts     timeouts_;
};

} // namespace eth
