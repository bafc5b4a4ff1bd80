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
#include <microlend/protocol/exceptions.hpp>

namespace microlend { namespace protocol {

   FC_IMPLEMENT_EXCEPTION( protocol_exception, 4000000, "protocol exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( ledger_exception,         protocol_exception, 4100000, "ledger operation exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( not_authorized,           ledger_exception, 1000, "caller is not authorized" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_amount,           ledger_exception, 1001, "invalid amount" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_collateral,  ledger_exception, 1002, "insufficient collateral" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( loan_not_found,           ledger_exception, 1003, "loan not found" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( loan_already_active,      ledger_exception, 1004, "loan already active" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( loan_not_active,          ledger_exception, 1005, "loan not active" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( loan_not_defaulted,       ledger_exception, 1006, "loan not defaulted" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_duration,         ledger_exception, 1009, "invalid loan duration" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_interest_rate,    ledger_exception, 1010, "invalid interest rate" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( emergency_stop_active,    ledger_exception, 1011, "emergency stop active" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_parameters,       ledger_exception, 1012, "invalid ledger parameters" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_collateral_asset, ledger_exception, 1013, "invalid collateral asset" )

} } // microlend::protocol
