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
#include <microlend/protocol/collateral_asset.hpp>
#include <microlend/protocol/ledger_admin.hpp>
#include <microlend/protocol/loan.hpp>

namespace microlend { namespace protocol {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    * New operations are appended, the tag of an existing operation never changes.
    */
   typedef fc::static_variant<
            /*  0 */ collateral_asset_add_operation,
            /*  1 */ collateral_asset_update_price_operation,
            /*  2 */ loan_create_operation,
            /*  3 */ loan_activate_operation,
            /*  4 */ loan_liquidate_operation,
            /*  5 */ loan_repay_operation,
            /*  6 */ emergency_stop_toggle_operation,
            /*  7 */ ledger_owner_update_operation,
            /*  8 */ ledger_parameters_update_operation
         > operation;

   /**
    * The result of an applied operation: nothing, a flag, or the id of a new loan
    */
   typedef fc::static_variant<void_result, bool, uint64_t> operation_result;

   /// @} // operations group

   /**
    *  Performs the stateless checks of an operation, throws a ledger_exception if it is malformed
    */
   void operation_validate( const operation& op );

} } // microlend::protocol

FC_REFLECT_TYPENAME( microlend::protocol::operation )
FC_REFLECT_TYPENAME( microlend::protocol::operation_result )

MICROLEND_DECLARE_EXTERNAL_SERIALIZATION( microlend::protocol::operation )
