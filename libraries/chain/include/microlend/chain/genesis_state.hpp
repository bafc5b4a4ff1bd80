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

#include <microlend/protocol/ledger_parameters.hpp>
#include <microlend/protocol/types.hpp>

#include <fc/filesystem.hpp>

#include <string>
#include <vector>

namespace microlend { namespace chain {
using std::string;
using std::vector;
using protocol::account_name_type;
using protocol::asset_symbol_type;
using protocol::ledger_parameters;
using protocol::share_type;

/**
 * The initial configuration of a ledger: who administers it, which risk settings apply and
 * which collateral assets are listed from the start.
 */
struct genesis_state_type {
   struct initial_collateral_asset_type {
      asset_symbol_type symbol;
      share_type        price = 0; ///< 0 lists the asset without a price
   };

   account_name_type                     initial_owner = MICROLEND_DEFAULT_LEDGER_OWNER;
   ledger_parameters                     initial_parameters;
   vector<initial_collateral_asset_type> initial_collateral_assets;

   /// Throws invalid_genesis_state if the configuration is inconsistent
   void validate()const;

   static genesis_state_type from_json( const string& json );
   static genesis_state_type from_file( const fc::path& path );
};

} } // namespace microlend::chain

FC_REFLECT_TYPENAME( microlend::chain::genesis_state_type::initial_collateral_asset_type )
FC_REFLECT_TYPENAME( microlend::chain::genesis_state_type )

MICROLEND_DECLARE_EXTERNAL_SERIALIZATION( microlend::chain::genesis_state_type::initial_collateral_asset_type )
MICROLEND_DECLARE_EXTERNAL_SERIALIZATION( microlend::chain::genesis_state_type )
