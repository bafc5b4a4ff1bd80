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
#include <microlend/chain/access_control.hpp>
#include <microlend/chain/database.hpp>
#include <microlend/chain/exceptions.hpp>

namespace microlend { namespace chain {

void verify_ledger_owner( const database& d, const account_name_type& caller )
{
   const auto& owner = d.get_ledger_owner();
   MICROLEND_ASSERT( caller == owner, not_authorized,
                     "${caller} is not the ledger owner", ("caller",caller) );
}

void verify_not_emergency_stopped( const database& d )
{
   MICROLEND_ASSERT( !d.get_contract_status(), emergency_stop_active,
                     "The ledger is stopped, no new loans are accepted" );
}

} } // microlend::chain
