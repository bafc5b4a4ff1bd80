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

namespace microlend { namespace chain {

   /**
    * @class reputation_object
    * @brief Tracks the repayment history of a borrower
    * @ingroup object
    * @ingroup implementation
    *
    * Created on the first completed or defaulted loan of an identity with a score of MICROLEND_REPUTATION_BASELINE.
    */
   class reputation_object : public abstract_object<reputation_object>
   {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id  = impl_reputation_object_type;

         account_name_type account;
         uint32_t          completed_loans = 0;
         uint32_t          defaults = 0;
         uint8_t           reputation_score = MICROLEND_REPUTATION_BASELINE; ///< Always within [0,100]
   };

   struct by_account;

   using reputation_multi_index_type = multi_index_container<
      reputation_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_account>,
            member< reputation_object, account_name_type, &reputation_object::account >
         >
      >
   >;

   using reputation_index = generic_index<reputation_object, reputation_multi_index_type>;

} } // microlend::chain

FC_REFLECT_DERIVED( microlend::chain::reputation_object, (microlend::db::object),
                    (account)(completed_loans)(defaults)(reputation_score) )
