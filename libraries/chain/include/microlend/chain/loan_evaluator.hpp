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

#include <microlend/protocol/loan.hpp>

namespace microlend { namespace chain {

   class loan_object;

   class loan_create_evaluator : public evaluator<loan_create_evaluator>
   {
      public:
         using operation_type = loan_create_operation;

         void do_authorize( const loan_create_operation& op )const;
         void_result do_evaluate( const loan_create_operation& op ) const;
         loan_id_type do_apply( const loan_create_operation& op ) const;
   };

   class loan_activate_evaluator : public evaluator<loan_activate_evaluator>
   {
      public:
         using operation_type = loan_activate_operation;

         void do_authorize( const loan_activate_operation& op )const;
         void_result do_evaluate( const loan_activate_operation& op );
         bool do_apply( const loan_activate_operation& op ) const;

         const loan_object* _loan = nullptr;
   };

   class loan_repay_evaluator : public evaluator<loan_repay_evaluator>
   {
      public:
         using operation_type = loan_repay_operation;

         void_result do_evaluate( const loan_repay_operation& op );
         bool do_apply( const loan_repay_operation& op ) const;

         const loan_object* _loan = nullptr;
   };

} } // microlend::chain
