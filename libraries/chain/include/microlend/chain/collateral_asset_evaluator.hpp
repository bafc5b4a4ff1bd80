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

#include <microlend/protocol/collateral_asset.hpp>

namespace microlend { namespace chain {

   class collateral_asset_object;

   class collateral_asset_add_evaluator : public evaluator<collateral_asset_add_evaluator>
   {
      public:
         using operation_type = collateral_asset_add_operation;

         void do_authorize( const collateral_asset_add_operation& op )const;
         void_result do_evaluate( const collateral_asset_add_operation& op );
         bool do_apply( const collateral_asset_add_operation& op ) const;

         const collateral_asset_object* _asset = nullptr;
   };

   class collateral_asset_update_price_evaluator : public evaluator<collateral_asset_update_price_evaluator>
   {
      public:
         using operation_type = collateral_asset_update_price_operation;

         void do_authorize( const collateral_asset_update_price_operation& op )const;
         void_result do_evaluate( const collateral_asset_update_price_operation& op );
         bool do_apply( const collateral_asset_update_price_operation& op ) const;

         const collateral_asset_object* _asset = nullptr;
   };

} } // microlend::chain
