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

namespace microlend { namespace protocol {

   /**
    * The risk and reputation settings of the ledger. They are set at genesis and may be
    * changed by the ledger owner afterwards.
    */
   struct ledger_parameters
   {
      uint32_t min_collateral_ratio_bps = MICROLEND_DEFAULT_MIN_COLLATERAL_RATIO_BPS;
      uint32_t min_duration_blocks      = MICROLEND_DEFAULT_MIN_DURATION_BLOCKS;
      uint32_t max_duration_blocks      = MICROLEND_DEFAULT_MAX_DURATION_BLOCKS;
      uint32_t max_interest_rate_bps    = MICROLEND_DEFAULT_MAX_INTEREST_RATE_BPS;
      uint8_t  default_penalty          = MICROLEND_DEFAULT_DEFAULT_PENALTY;  ///< score lost per default
      uint8_t  repayment_bonus          = MICROLEND_DEFAULT_REPAYMENT_BONUS;  ///< score gained per repayment

      /// Throws invalid_parameters if the settings are inconsistent or out of range
      void validate()const;
   };

} }  // microlend::protocol

FC_REFLECT( microlend::protocol::ledger_parameters,
            (min_collateral_ratio_bps)
            (min_duration_blocks)
            (max_duration_blocks)
            (max_interest_rate_bps)
            (default_penalty)
            (repayment_bonus)
          )

MICROLEND_DECLARE_EXTERNAL_SERIALIZATION( microlend::protocol::ledger_parameters )
