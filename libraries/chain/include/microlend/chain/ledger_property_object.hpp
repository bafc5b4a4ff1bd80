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
#include <microlend/protocol/ledger_parameters.hpp>
#include <microlend/db/generic_index.hpp>

namespace microlend { namespace chain {

   /**
    * @class ledger_property_object
    * @brief Maintains the global state of the ledger
    * @ingroup object
    * @ingroup implementation
    *
    * Exactly one instance exists once the genesis state is applied. It is only changed by the ledger owner,
    * except for the loan id counter.
    */
   class ledger_property_object : public microlend::db::abstract_object<ledger_property_object>
   {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id  = impl_ledger_property_object_type;

         account_name_type  owner;
         bool               emergency_stopped = false;
         loan_id_type       next_loan_id = MICROLEND_FIRST_LOAN_ID;
         ledger_parameters  parameters;
   };

   using ledger_property_index = generic_index<ledger_property_object,
      multi_index_container<
         ledger_property_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >
         >
      >
   >;

}}

FC_REFLECT_DERIVED( microlend::chain::ledger_property_object, (microlend::db::object),
                    (owner)
                    (emergency_stopped)
                    (next_loan_id)
                    (parameters)
                  )
