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

#include <fc/exception/exception.hpp>

#define MICROLEND_ASSERT( expr, exc_type, FORMAT, ... )               \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) )                                                      \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );            \
   FC_MULTILINE_MACRO_END

namespace microlend { namespace protocol {

   FC_DECLARE_EXCEPTION( protocol_exception, 4000000 )

   /**
    * Failures of ledger operations. The codes are stable and callers dispatch on them.
    */
   FC_DECLARE_DERIVED_EXCEPTION( ledger_exception,                  microlend::protocol::protocol_exception, 4100000 )

   FC_DECLARE_DERIVED_EXCEPTION( not_authorized,                    microlend::protocol::ledger_exception, 1000 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_amount,                    microlend::protocol::ledger_exception, 1001 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_collateral,           microlend::protocol::ledger_exception, 1002 )
   FC_DECLARE_DERIVED_EXCEPTION( loan_not_found,                    microlend::protocol::ledger_exception, 1003 )
   FC_DECLARE_DERIVED_EXCEPTION( loan_already_active,               microlend::protocol::ledger_exception, 1004 )
   FC_DECLARE_DERIVED_EXCEPTION( loan_not_active,                   microlend::protocol::ledger_exception, 1005 )
   FC_DECLARE_DERIVED_EXCEPTION( loan_not_defaulted,                microlend::protocol::ledger_exception, 1006 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_duration,                  microlend::protocol::ledger_exception, 1009 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_interest_rate,             microlend::protocol::ledger_exception, 1010 )
   FC_DECLARE_DERIVED_EXCEPTION( emergency_stop_active,             microlend::protocol::ledger_exception, 1011 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_parameters,                microlend::protocol::ledger_exception, 1012 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_collateral_asset,          microlend::protocol::ledger_exception, 1013 )

} } // microlend::protocol
