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

#include <microlend/protocol/types.hpp>
#include <microlend/protocol/exceptions.hpp>

namespace microlend { namespace protocol {

   /**
    * @defgroup operations Ledger Operations
    * @ingroup transactions Ledger Transactions
    *
    * An operation is a single request against the ledger. The identity of the caller and the
    * current block height are supplied by the host together with the operation, they are never
    * part of it.
    *
    * Every operation is validated in two steps:
    *
    * 1. validate() checks everything that can be checked without the ledger state
    * 2. the evaluator checks the operation against the ledger state and applies it
    *
    * Both steps throw a typed ledger_exception on failure.
    */

   /**
    *  @brief Used to return nothing from an operation
    */
   struct void_result{};

   struct base_operation
   {
      virtual ~base_operation() = default;

      virtual void validate()const{}
   };

   ///@}

} } // microlend::protocol

FC_REFLECT( microlend::protocol::void_result, )
