// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WAGERGAME_LEDGER_HPP
#define WAGERGAME_LEDGER_HPP

#include "custody.hpp"

#include "proto/ledger.pb.h"
#include "wagerutil/amount.hpp"

#include <string>

namespace wager
{

/**
 * Escrow ledger that tracks how much of the value in custody belongs to
 * which identity.  It operates on a LedgerData protocol buffer owned by
 * the caller, and all mutations of balances go through the methods here.
 *
 * Methods that can fail return false and leave the ledger unchanged in
 * that case.
 */
class EscrowLedger
{

private:

  /** The underlying balance data.  */
  proto::LedgerData& data;

  /** The custody used to pay out funds.  */
  Custody& custody;

  /**
   * Sets the balance of the given identity.  A zero balance removes the
   * entry altogether.
   */
  void SetBalance (const std::string& name, const Amount& balance);

public:

  explicit EscrowLedger (proto::LedgerData& d, Custody& c)
    : data(d), custody(c)
  {}

  EscrowLedger () = delete;
  EscrowLedger (const EscrowLedger&) = delete;
  void operator= (const EscrowLedger&) = delete;

  /**
   * Returns the balance of the given identity, zero if it has none.
   */
  Amount GetBalance (const std::string& name) const;

  /**
   * Returns the sum of all balances.
   */
  Amount GetTotal () const;

  /**
   * Credits the given amount to an identity.  Returns false if the
   * balance would overflow.
   */
  bool Deposit (const std::string& name, const Amount& amount);

  /**
   * Debits the given amount from an identity.  Returns false if the
   * balance is insufficient.
   */
  bool Debit (const std::string& name, const Amount& amount);

  /**
   * Debits the amount from an identity and transfers it out of custody
   * to that identity.  Returns false if the balance is insufficient or
   * the transfer is rejected.
   */
  bool Payout (const std::string& name, const Amount& amount);

};

/**
 * Parses all balances of a ledger and checks that they are valid
 * canonical amounts whose total fits into 256 bits.  This is used
 * to validate untrusted ledger data before it is used.
 */
bool IsValidLedger (const proto::LedgerData& data);

} // namespace wager

#endif // WAGERGAME_LEDGER_HPP
