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
#include <microlend/chain/exceptions.hpp>

namespace microlend { namespace chain {

   FC_IMPLEMENT_EXCEPTION( chain_exception, 3000000, "ledger database exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( database_query_exception,     chain_exception, 3010000, "database query exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( genesis_exception,            chain_exception, 3020000, "genesis exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( query_limit_exceeded,         database_query_exception, 3010001, "query limit exceeded" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( genesis_already_applied,      genesis_exception, 3020001, "genesis state already applied" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_genesis_state,        genesis_exception, 3020002, "invalid genesis state" )

} } // microlend::chain
