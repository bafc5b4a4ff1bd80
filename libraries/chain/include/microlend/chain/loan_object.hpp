/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once

#include <microlend/chain/types.hpp>
#include <microlend/db/generic_index.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace microlend { namespace chain {

   enum class loan_status : uint8_t
   {
      pending    = 0,
      active     = 1,
      repaid     = 2,
      liquidated = 3
   };

/**
 *  @brief A loan requested by a borrower against posted collateral
 *  @ingroup object
 *  @ingroup protocol
 *
 *  The status only moves forward: pending -> active -> repaid or liquidated. Loans are never removed.
 */
class loan_object : public abstract_object<loan_object>
{
   public:
      static constexpr uint8_t space_id = protocol_ids;
      static constexpr uint8_t type_id  = loan_object_type;

      loan_id_type                loan_id = 0;            ///< Sequential id, the first loan is 1
      account_name_type           borrower;
      share_type                  amount = 0;
      share_type                  collateral_amount = 0;
      asset_symbol_type           collateral_asset;
      optional<asset_symbol_type> debt_asset;             ///< Not set if the loan is denominated in the collateral
      uint32_t                    duration_blocks = 0;
      uint32_t                    interest_rate_bps = 0;
      loan_status                 status = loan_status::pending;
      uint32_t                    created_at_block = 0;
      optional<uint32_t>          activated_at_block;
      optional<uint32_t>          closed_at_block;        ///< Block of the repayment or the liquidation

      /// Last block at which the loan is still in good standing, 0 until activated
      uint64_t                    expiration_block = 0;

      bool is_active()const { return status == loan_status::active; }

      /// An active loan defaults once the current block is past its expiration block
      bool is_defaulted_at( uint32_t block_num )const
      {
         return is_active() && block_num > expiration_block;
      }
};

struct by_loan_id;
struct by_borrower;   // for API
struct by_expiration; // for liquidation

/**
* @ingroup object_index
*/
using loan_multi_index_type = multi_index_container<
   loan_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_loan_id>, member< loan_object, loan_id_type, &loan_object::loan_id > >,
      ordered_unique< tag<by_borrower>,
         composite_key< loan_object,
            member< loan_object, account_name_type, &loan_object::borrower >,
            member< loan_object, loan_id_type, &loan_object::loan_id >
         >
      >,
      ordered_unique< tag<by_expiration>,
         composite_key< loan_object,
            member< loan_object, loan_status, &loan_object::status >,
            member< loan_object, uint64_t, &loan_object::expiration_block >,
            member< loan_object, loan_id_type, &loan_object::loan_id >
         >
      >
   >
>;

/**
* @ingroup object_index
*/
using loan_index = generic_index<loan_object, loan_multi_index_type>;

} } // microlend::chain

FC_REFLECT_ENUM( microlend::chain::loan_status, (pending)(active)(repaid)(liquidated) )

FC_REFLECT_DERIVED( microlend::chain::loan_object, (microlend::db::object),
                    (loan_id)
                    (borrower)
                    (amount)
                    (collateral_amount)
                    (collateral_asset)
                    (debt_asset)
                    (duration_blocks)
                    (interest_rate_bps)
                    (status)
                    (created_at_block)
                    (activated_at_block)
                    (closed_at_block)
                    (expiration_block)
                  )
