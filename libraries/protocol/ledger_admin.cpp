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
#include <microlend/protocol/ledger_admin.hpp>

#include <fc/io/raw.hpp>

namespace microlend { namespace protocol {

void ledger_owner_update_operation::validate()const
{
   MICROLEND_ASSERT( is_valid_account_name( new_owner ), invalid_parameters,
                     "Invalid ledger owner name ${n}", ("n",new_owner) );
}

void ledger_parameters_update_operation::validate()const
{
   new_parameters.validate();
}

} } // microlend::protocol

MICROLEND_IMPLEMENT_EXTERNAL_SERIALIZATION( microlend::protocol::ledger_owner_update_operation )
MICROLEND_IMPLEMENT_EXTERNAL_SERIALIZATION( microlend::protocol::emergency_stop_toggle_operation )
MICROLEND_IMPLEMENT_EXTERNAL_SERIALIZATION( microlend::protocol::ledger_parameters_update_operation )
