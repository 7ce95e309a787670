#pragma once

#include <map>

#include "auction.hpp"

namespace auction
{

  /// In-memory asset-ownership primitive: mint, per-asset approval, custody moves.
  class AssetRegistry final : public AssetCustody
  {
  public:
    // Creates `asset` owned by `owner`. Fails if it exists or owner is kNoAccount.
    bool mint(AssetId asset, AccountId owner);

    // Owner authorises `op` to move `asset` once; kNoAccount clears it.
    bool approve(AccountId owner, AssetId asset, AccountId op);

    AccountId approved(AssetId asset) const;

    AccountId owner_of(AssetId asset) const override;
    bool transfer_custody(AccountId mover, AssetId asset, AccountId from, AccountId to) override;

    std::size_t size() const { return records_.size(); }

  private:
    struct Record
    {
      AccountId owner{kNoAccount};
      AccountId approved{kNoAccount};
    };

    std::map<AssetId, Record> records_;
  };

} // namespace auction
