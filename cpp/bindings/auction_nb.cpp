#include <cstdint>
#include <nanobind/nanobind.h>
#include <nanobind/stl/function.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>
#include <string>
#include <vector>

#include "auction.hpp"
#include "custody.hpp"
#include "journal.hpp"
#include "replay.hpp"
#include "treasury.hpp"

namespace nb = nanobind;

// Helper: copies, so Python never holds references into a vector that the
// house may grow while it runs
template <class T>
static std::vector<T> snapshot_vec(const std::vector<T>& v)
{
  return std::vector<T>(v.begin(), v.end());
}

NB_MODULE(_auction, m)
{
  m.doc() = "NFT auction house engine bindings";

  nb::class_<auction::Ns>(m, "Ns").def(nb::init<auction::u64>()).def_rw("value", &auction::Ns::value);

  m.attr("VALUE_SCALE") = auction::kValueScale;
  m.attr("NO_ACCOUNT") = auction::kNoAccount;

  nb::enum_<auction::RejectReason>(m, "RejectReason")
      .value("None", auction::RejectReason::None)
      .value("NotOwner", auction::RejectReason::NotOwner)
      .value("NotSeller", auction::RejectReason::NotSeller)
      .value("NotListed", auction::RejectReason::NotListed)
      .value("BidTooLow", auction::RejectReason::BidTooLow)
      .value("NotReceiver", auction::RejectReason::NotReceiver)
      .value("NoCredits", auction::RejectReason::NoCredits)
      .value("WithdrawFailed", auction::RejectReason::WithdrawFailed)
      .value("TransferFailed", auction::RejectReason::TransferFailed)
      .value("CustodyFailed", auction::RejectReason::CustodyFailed)
      .value("HasActiveBid", auction::RejectReason::HasActiveBid)
      .value("NoBid", auction::RejectReason::NoBid)
      .value("AuctionEnded", auction::RejectReason::AuctionEnded)
      .value("AuctionNotEnded", auction::RejectReason::AuctionNotEnded)
      .value("InvalidParams", auction::RejectReason::InvalidParams)
      .value("InsufficientResources", auction::RejectReason::InsufficientResources);

  m.def("reason_text", [](auction::RejectReason r) { return std::string(auction::to_string(r)); });

  nb::enum_<auction::TransferStatus>(m, "TransferStatus")
      .value("Ok", auction::TransferStatus::Ok)
      .value("Rejected", auction::TransferStatus::Rejected)
      .value("ResourceExhausted", auction::TransferStatus::ResourceExhausted);

  nb::enum_<auction::EventType>(m, "EventType")
      .value("Listed", auction::EventType::Listed)
      .value("Unlisted", auction::EventType::Unlisted)
      .value("BidAccepted", auction::EventType::BidAccepted)
      .value("Refunded", auction::EventType::Refunded)
      .value("Credited", auction::EventType::Credited)
      .value("Withdrawn", auction::EventType::Withdrawn)
      .value("Settled", auction::EventType::Settled)
      .value("Reject", auction::EventType::Reject);

  nb::class_<auction::AuctionParams>(m, "AuctionParams")
      .def(nb::init<>())
      .def_rw("house", &auction::AuctionParams::house)
      .def_rw("min_increment_pct", &auction::AuctionParams::min_increment_pct)
      .def_rw("max_events", &auction::AuctionParams::max_events)
      .def_rw("max_listings", &auction::AuctionParams::max_listings)
      .def_prop_rw(
          "auction_extension_ns",
          [](const auction::AuctionParams& p) { return p.auction_extension.value; },
          [](auction::AuctionParams& p, auction::u64 v) { p.auction_extension = auction::Ns{v}; });

  nb::class_<auction::Listing>(m, "Listing")
      .def(nb::init<>())
      .def_ro("seller", &auction::Listing::seller)
      .def_ro("min_price_q", &auction::Listing::min_price_q)
      .def_ro("buy_now_price_q", &auction::Listing::buy_now_price_q)
      .def_ro("listed", &auction::Listing::listed)
      .def_prop_ro("auction_end_ns", [](const auction::Listing& l) { return l.auction_end.value; });

  nb::class_<auction::Bid>(m, "Bid")
      .def(nb::init<>())
      .def_ro("bidder", &auction::Bid::bidder)
      .def_ro("amount_q", &auction::Bid::amount_q);

  nb::class_<auction::Ledger>(m, "Ledger")
      .def(nb::init<>())
      .def_ro("received_q", &auction::Ledger::received_q)
      .def_ro("paid_out_q", &auction::Ledger::paid_out_q)
      .def_ro("escrow_q", &auction::Ledger::escrow_q)
      .def_ro("credits_q", &auction::Ledger::credits_q);

  // Audit log entry
  nb::class_<auction::Event>(m, "Event")
      .def_prop_ro("ts", [](const auction::Event& e) { return e.ts.value; })
      .def_ro("type", &auction::Event::type)
      .def_ro("asset", &auction::Event::asset)
      .def_ro("account", &auction::Event::account)
      .def_ro("amount_q", &auction::Event::amount_q)
      .def_ro("reject_reason", &auction::Event::reject_reason);

  // ---------------------------
  // Collaborators
  // ---------------------------
  nb::class_<auction::AssetRegistry>(m, "AssetRegistry")
      .def(nb::init<>())
      .def("mint", &auction::AssetRegistry::mint, nb::arg("asset"), nb::arg("owner"))
      .def("approve", &auction::AssetRegistry::approve, nb::arg("owner"), nb::arg("asset"), nb::arg("op"))
      .def("approved", &auction::AssetRegistry::approved, nb::arg("asset"))
      .def("owner_of", &auction::AssetRegistry::owner_of, nb::arg("asset"))
      .def("__len__", &auction::AssetRegistry::size);

  nb::class_<auction::Treasury>(m, "Treasury")
      .def(nb::init<>())
      .def("send", &auction::Treasury::send, nb::arg("to"), nb::arg("amount_q"))
      .def("set_rejecting", &auction::Treasury::set_rejecting, nb::arg("account"), nb::arg("rejecting"))
      // The hook may call back into the AuctionHouse from Python.
      .def("set_hook", &auction::Treasury::set_hook, nb::arg("account"), nb::arg("hook"))
      .def("clear_hook", &auction::Treasury::clear_hook, nb::arg("account"))
      .def("balance", &auction::Treasury::balance, nb::arg("account"))
      .def_prop_ro("total_sent", &auction::Treasury::total_sent)
      .def_prop_ro("failed_sends", &auction::Treasury::failed_sends);

  // ---------------------------
  // House
  // ---------------------------
  nb::class_<auction::AuctionHouse>(m, "AuctionHouse")
      .def(nb::init<const auction::AuctionParams&, auction::AssetRegistry&, auction::Treasury&>(),
           nb::arg("params"),
           nb::arg("registry"),
           nb::arg("treasury"),
           nb::keep_alive<1, 3>(),
           nb::keep_alive<1, 4>())
      .def("advance",
           [](auction::AuctionHouse& h, auction::u64 now_ns) { h.advance(auction::Ns{now_ns}); },
           nb::arg("now_ns"))
      .def("list", &auction::AuctionHouse::list,
           nb::arg("asset"), nb::arg("caller"), nb::arg("min_price_q"), nb::arg("buy_now_price_q") = 0)
      .def("unlist", &auction::AuctionHouse::unlist, nb::arg("asset"), nb::arg("caller"))
      .def("place_bid", &auction::AuctionHouse::place_bid, nb::arg("asset"), nb::arg("caller"), nb::arg("value_q"))
      .def("settle", &auction::AuctionHouse::settle, nb::arg("asset"), nb::arg("caller"))
      .def("withdraw_all_failed_credits", &auction::AuctionHouse::withdraw_all_failed_credits,
           nb::arg("caller"), nb::arg("receiver"))
      .def("listing", &auction::AuctionHouse::listing, nb::arg("asset"))
      .def("highest_bid", &auction::AuctionHouse::highest_bid, nb::arg("asset"))
      .def("credited_balance", &auction::AuctionHouse::credited_balance, nb::arg("account"))
      .def("next_min_bid", &auction::AuctionHouse::next_min_bid, nb::arg("asset"))
      .def_prop_ro("now", [](const auction::AuctionHouse& h) { return h.now().value; })
      .def_prop_ro("ledger", &auction::AuctionHouse::ledger, nb::rv_policy::reference_internal)
      .def("events", [](const auction::AuctionHouse& h) { return snapshot_vec(h.events()); });

  // ---------------------------
  // Journal
  // ---------------------------
  nb::module_ mj = m.def_submodule("journal", "Operation journal replay");

  nb::class_<auction::journal::ReplayStats>(mj, "ReplayStats")
      .def_ro("applied", &auction::journal::ReplayStats::applied)
      .def_ro("rejected", &auction::journal::ReplayStats::rejected);

  nb::class_<auction::journal::ReplayKernel>(mj, "ReplayKernel")
      .def(nb::init<const std::string&>(), nb::arg("journal_path"))
      .def("size", &auction::journal::ReplayKernel::size)
      .def("pos", &auction::journal::ReplayKernel::pos)
      .def("reset", &auction::journal::ReplayKernel::reset)
      .def("replay",
           [](auction::journal::ReplayKernel& rk, auction::AuctionHouse& house, auction::AssetRegistry& registry) {
             return auction::journal::replay(rk, house, registry);
           },
           nb::arg("house"),
           nb::arg("registry"),
           "Apply every remaining record to `house`");
}
