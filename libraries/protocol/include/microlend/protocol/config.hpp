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

#define MICROLEND_MIN_ASSET_SYMBOL_LENGTH 3
#define MICROLEND_MAX_ASSET_SYMBOL_LENGTH 16

#define MICROLEND_MIN_ACCOUNT_NAME_LENGTH 1
#define MICROLEND_MAX_ACCOUNT_NAME_LENGTH 128

/** Upper bound of every loan amount and collateral amount */
#define MICROLEND_MAX_SHARE_SUPPLY uint64_t(1000000000000000ll)
/** Upper bound of a published price, in micro-units */
#define MICROLEND_MAX_ASSET_PRICE  uint64_t(1000000000000000ll)

#define MICROLEND_100_PERCENT                                 10000
#define MICROLEND_1_PERCENT                                   (MICROLEND_100_PERCENT/100)

/**
 * Don't allow the ledger owner to configure limits that would
 * overflow the risk computations.
 */
#define MICROLEND_MAX_COLLATERAL_RATIO_BPS                    (100 * MICROLEND_100_PERCENT)
#define MICROLEND_MAX_INTEREST_RATE_BPS_LIMIT                 (10 * MICROLEND_100_PERCENT)

#define MICROLEND_DEFAULT_MIN_COLLATERAL_RATIO_BPS            (200 * MICROLEND_1_PERCENT) ///< 200%
#define MICROLEND_DEFAULT_MIN_DURATION_BLOCKS                 1440     ///< about 1 day of blocks
#define MICROLEND_DEFAULT_MAX_DURATION_BLOCKS                 525600   ///< about 1 year of blocks
#define MICROLEND_DEFAULT_MAX_INTEREST_RATE_BPS               (50 * MICROLEND_1_PERCENT) ///< 50%
#define MICROLEND_DEFAULT_DEFAULT_PENALTY                     20
#define MICROLEND_DEFAULT_REPAYMENT_BONUS                     5

#define MICROLEND_REPUTATION_BASELINE                         100
#define MICROLEND_MAX_REPUTATION_SCORE                        100

/** The first id handed out to a new loan */
#define MICROLEND_FIRST_LOAN_ID                               1

#define MICROLEND_MAX_NESTED_OBJECTS                          200

#define MICROLEND_DEFAULT_LEDGER_OWNER                        "admin"

/** Upper bound of the number of loans returned by one query */
#define MICROLEND_MAX_QUERY_LIMIT                             1000
