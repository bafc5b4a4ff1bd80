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
#include <microlend/chain/database.hpp>

#include <microlend/chain/collateral_asset_object.hpp>
#include <microlend/chain/ledger_property_object.hpp>
#include <microlend/chain/loan_object.hpp>
#include <microlend/chain/reputation_object.hpp>

#include <microlend/chain/collateral_asset_evaluator.hpp>
#include <microlend/chain/ledger_admin_evaluator.hpp>
#include <microlend/chain/liquidation_evaluator.hpp>
#include <microlend/chain/loan_evaluator.hpp>

namespace microlend { namespace chain {

void database::initialize_evaluators()
{
   _operation_evaluators.resize(255);
   register_evaluator<collateral_asset_add_evaluator>();
   register_evaluator<collateral_asset_update_price_evaluator>();
   register_evaluator<loan_create_evaluator>();
   register_evaluator<loan_activate_evaluator>();
   register_evaluator<loan_liquidate_evaluator>();
   register_evaluator<loan_repay_evaluator>();
   register_evaluator<emergency_stop_toggle_evaluator>();
   register_evaluator<ledger_owner_update_evaluator>();
   register_evaluator<ledger_parameters_update_evaluator>();
}

void database::initialize_indexes()
{
   reset_indexes();

   //Protocol object indexes
   add_index< collateral_asset_index >();
   add_index< loan_index >();

   //Implementation object indexes
   add_index< ledger_property_index >();
   add_index< reputation_index >();
}

} }
