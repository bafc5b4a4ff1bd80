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
#include <microlend/chain/evaluator.hpp>

#include <microlend/protocol/ledger_admin.hpp>

namespace microlend { namespace chain {

   class ledger_owner_update_evaluator : public evaluator<ledger_owner_update_evaluator>
   {
      public:
         using operation_type = ledger_owner_update_operation;

         void do_authorize( const ledger_owner_update_operation& op )const;
         void_result do_evaluate( const ledger_owner_update_operation& op ) const;
         bool do_apply( const ledger_owner_update_operation& op ) const;
   };

   class emergency_stop_toggle_evaluator : public evaluator<emergency_stop_toggle_evaluator>
   {
      public:
         using operation_type = emergency_stop_toggle_operation;

         void do_authorize( const emergency_stop_toggle_operation& op )const;
         void_result do_evaluate( const emergency_stop_toggle_operation& op ) const;
         bool do_apply( const emergency_stop_toggle_operation& op ) const;
   };

   class ledger_parameters_update_evaluator : public evaluator<ledger_parameters_update_evaluator>
   {
      public:
         using operation_type = ledger_parameters_update_operation;

         void do_authorize( const ledger_parameters_update_operation& op )const;
         void_result do_evaluate( const ledger_parameters_update_operation& op ) const;
         bool do_apply( const ledger_parameters_update_operation& op ) const;
   };

} } // microlend::chain
