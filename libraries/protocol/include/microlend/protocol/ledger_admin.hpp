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
#include <microlend/protocol/ledger_parameters.hpp>

namespace microlend { namespace protocol {

   /**
    * @brief Hand the administrator rights of the ledger to another identity
    * @ingroup operations
    *
    * The change is effective for the next operation.
    */
   struct ledger_owner_update_operation : public base_operation
   {
      account_name_type new_owner;

      void            validate()const override;
   };

   /**
    * @brief Flip the emergency stop flag
    * @ingroup operations
    *
    * While the flag is set no new loan can be requested.
    */
   struct emergency_stop_toggle_operation : public base_operation
   {
   };

   /**
    * @brief Replace the risk and reputation settings of the ledger
    * @ingroup operations
    */
   struct ledger_parameters_update_operation : public base_operation
   {
      ledger_parameters new_parameters;

      void            validate()const override;
   };

} } // microlend::protocol

FC_REFLECT( microlend::protocol::ledger_owner_update_operation, (new_owner) )
FC_REFLECT( microlend::protocol::emergency_stop_toggle_operation, )
FC_REFLECT( microlend::protocol::ledger_parameters_update_operation, (new_parameters) )

MICROLEND_DECLARE_EXTERNAL_SERIALIZATION( microlend::protocol::ledger_owner_update_operation )
MICROLEND_DECLARE_EXTERNAL_SERIALIZATION( microlend::protocol::emergency_stop_toggle_operation )
MICROLEND_DECLARE_EXTERNAL_SERIALIZATION( microlend::protocol::ledger_parameters_update_operation )
