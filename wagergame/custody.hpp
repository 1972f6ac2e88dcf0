// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WAGERGAME_CUSTODY_HPP
#define WAGERGAME_CUSTODY_HPP

#include "wagerutil/amount.hpp"

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace wager
{

/**
 * Interface for the host environment that holds the actual value (as opposed
 * to the ledger, which just accounts for it) and can send it out to
 * recipients.  Transfers are grouped into batches, which take effect
 * all-or-nothing.
 */
class Custody
{

public:

  virtual ~Custody () = default;

  /**
   * Starts a new batch of transfers.  Batches are not nested.
   */
  virtual void BeginBatch () = 0;

  /**
   * Requests to send the given amount to the recipient as part of the
   * current batch.  Returns false if the transfer is rejected, in which
   * case it will not happen even if the batch is committed later.
   */
  virtual bool Transfer (const std::string& recipient,
                         const Amount& amount) = 0;

  /**
   * Makes all accepted transfers of the current batch take effect.
   */
  virtual void CommitBatch () = 0;

  /**
   * Drops all transfers of the current batch.
   */
  virtual void AbortBatch () = 0;

};

/**
 * Custody implementation that just records the delivered amounts in memory.
 * Transfers to a configurable set of recipients are rejected, which can
 * be used to simulate recipients that refuse payments.
 */
class MemoryCustody : public Custody
{

private:

  /** Set to true while a batch is open.  */
  bool inBatch = false;

  /** Transfers accepted in the current batch but not yet committed.  */
  std::vector<std::pair<std::string, Amount>> pending;

  /** Total amounts delivered per recipient.  */
  std::map<std::string, Amount> received;

  /** Recipients for which transfers are rejected.  */
  std::set<std::string> rejecting;

public:

  MemoryCustody () = default;

  MemoryCustody (const MemoryCustody&) = delete;
  void operator= (const MemoryCustody&) = delete;

  /**
   * Marks the given recipient as rejecting (or accepting again) all
   * future transfers.
   */
  void SetRejecting (const std::string& recipient, bool reject);

  /**
   * Returns the total amount delivered to a recipient so far in
   * committed batches.
   */
  Amount GetReceived (const std::string& recipient) const;

  /**
   * Returns the total amounts delivered to all recipients.
   */
  const std::map<std::string, Amount>&
  GetAllReceived () const
  {
    return received;
  }

  /**
   * Returns the sum of all delivered amounts.
   */
  Amount GetTotalDelivered () const;

  void BeginBatch () override;
  bool Transfer (const std::string& recipient, const Amount& amount) override;
  void CommitBatch () override;
  void AbortBatch () override;

};

} // namespace wager

#endif // WAGERGAME_CUSTODY_HPP
