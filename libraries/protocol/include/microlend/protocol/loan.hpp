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
#include <microlend/protocol/base.hpp>

namespace microlend { namespace protocol {

   /**
    * @brief Request a loan against posted collateral
    * @ingroup operations
    *
    * The caller becomes the borrower. The loan is created in the pending state and has to be
    * activated by the ledger owner.
    */
   struct loan_create_operation : public base_operation
   {
      share_type                  amount = 0;             ///< Amount to borrow
      share_type                  collateral_amount = 0;  ///< Amount of collateral posted
      asset_symbol_type           collateral_asset;       ///< Symbol of the collateral asset
      /// Asset the loan is denominated in, the collateral asset if not set
      optional<asset_symbol_type> debt_asset;
      uint32_t                    duration_blocks = 0;    ///< Blocks until the loan expires once activated
      uint32_t                    interest_rate_bps = 0;  ///< Flat interest, the denominator is MICROLEND_100_PERCENT

      void            validate()const override;
   };

   /**
    * @brief Activate a pending loan
    * @ingroup operations
    */
   struct loan_activate_operation : public base_operation
   {
      loan_id_type loan_id = 0;
   };

   /**
    * @brief Repay an active loan
    * @ingroup operations
    *
    * Only the borrower may repay. Repayment is accepted until the loan is liquidated.
    */
   struct loan_repay_operation : public base_operation
   {
      loan_id_type loan_id = 0;
   };

   /**
    * @brief Liquidate an active loan whose duration has been exceeded
    * @ingroup operations
    */
   struct loan_liquidate_operation : public base_operation
   {
      loan_id_type loan_id = 0;
   };

} } // microlend::protocol

FC_REFLECT( microlend::protocol::loan_create_operation,
            (amount)(collateral_amount)(collateral_asset)(debt_asset)(duration_blocks)(interest_rate_bps) )
FC_REFLECT( microlend::protocol::loan_activate_operation, (loan_id) )
FC_REFLECT( microlend::protocol::loan_repay_operation, (loan_id) )
FC_REFLECT( microlend::protocol::loan_liquidate_operation, (loan_id) )

MICROLEND_DECLARE_EXTERNAL_SERIALIZATION( microlend::protocol::loan_create_operation )
MICROLEND_DECLARE_EXTERNAL_SERIALIZATION( microlend::protocol::loan_activate_operation )
MICROLEND_DECLARE_EXTERNAL_SERIALIZATION( microlend::protocol::loan_repay_operation )
MICROLEND_DECLARE_EXTERNAL_SERIALIZATION( microlend::protocol::loan_liquidate_operation )
