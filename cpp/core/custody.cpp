#include "custody.hpp"

namespace auction
{

  bool AssetRegistry::mint(AssetId asset, AccountId owner)
  {
    if ( owner == kNoAccount )
      return false;
    return records_.emplace(asset, Record{owner, kNoAccount}).second;
  }

  bool AssetRegistry::approve(AccountId owner, AssetId asset, AccountId op)
  {
    const auto it = records_.find(asset);
    if ( it == records_.end() || it->second.owner != owner )
      return false;
    it->second.approved = op;
    return true;
  }

  AccountId AssetRegistry::approved(AssetId asset) const
  {
    const auto it = records_.find(asset);
    return it == records_.end() ? kNoAccount : it->second.approved;
  }

  AccountId AssetRegistry::owner_of(AssetId asset) const
  {
    const auto it = records_.find(asset);
    return it == records_.end() ? kNoAccount : it->second.owner;
  }

  bool AssetRegistry::transfer_custody(AccountId mover, AssetId asset, AccountId from, AccountId to)
  {
    const auto it = records_.find(asset);
    if ( it == records_.end() || to == kNoAccount )
      return false;

    Record& r = it->second;
    if ( r.owner != from )
      return false;
    if ( mover != from && (mover == kNoAccount || r.approved != mover) )
      return false;

    // Approval is single-use: it never follows the asset to a new owner.
    r.owner = to;
    r.approved = kNoAccount;
    return true;
  }

} // namespace auction
