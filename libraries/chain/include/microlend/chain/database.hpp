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
#include <microlend/chain/evaluator.hpp>
#include <microlend/chain/genesis_state.hpp>
#include <microlend/chain/types.hpp>

#include <microlend/db/object_database.hpp>

#include <microlend/protocol/operations.hpp>

#include <fc/log/logger.hpp>

#include <memory>

namespace microlend { namespace chain {

   class collateral_asset_object;
   class ledger_property_object;
   class loan_object;
   class reputation_object;

   /**
    *   @class database
    *   @brief tracks the ledger state and applies operations to it
    *
    *   Every state-changing call supplies the caller identity and the current block height. The database
    *   is single-threaded, a host serving concurrent clients has to serialize its calls.
    */
   class database : public db::object_database
   {
         //////////////////// db_management.cpp ////////////////////
      public:
         database();
         ~database() override;

         /**
          * @brief Seeds an empty database with the genesis state
          *
          * Can only be called once. Throws genesis_already_applied on a second call and
          * invalid_genesis_state if the genesis state is inconsistent.
          */
         void init_genesis( const genesis_state_type& genesis_state = genesis_state_type() );

         //////////////////// db_apply.cpp ////////////////////

         /**
          * @brief Evaluates and applies an operation on behalf of @p caller at @p block_num
          *
          * All changes are applied together or not at all: on any exception the ledger is left unchanged.
          * @return the loan id for loan_create_operation, the new flag for emergency_stop_toggle_operation,
          *         true otherwise
          */
         operation_result push_operation( const operation& op, const account_name_type& caller,
                                          uint32_t block_num );

         /**
          * Evaluates and applies an operation like push_operation() but always reverts the changes.
          */
         operation_result validate_operation( const operation& op, const account_name_type& caller,
                                              uint32_t block_num );

         operation_result apply_operation( transaction_evaluation_state& eval_state, const operation& op );

         //////////////////// db_getter.cpp ////////////////////

         const ledger_property_object& get_ledger_properties()const;
         const ledger_parameters&      get_ledger_parameters()const;
         const account_name_type&      get_ledger_owner()const;

         /// @return true while the emergency stop is active
         bool                          get_contract_status()const;

         const collateral_asset_object* find_collateral_asset( const asset_symbol_type& symbol )const;
         /// Throws invalid_collateral_asset if the asset is unknown
         const collateral_asset_object& get_collateral_asset( const asset_symbol_type& symbol )const;

         const loan_object* find_loan( loan_id_type loan_id )const;
         /// Throws loan_not_found if the loan is unknown
         const loan_object& get_loan( loan_id_type loan_id )const;

         vector<loan_object> get_loans_by_borrower( const account_name_type& borrower )const;

         /// Throws loan_not_found if the loan is unknown
         share_type calculate_total_due( loan_id_type loan_id )const;

         //////////////////// db_reputation.cpp ////////////////////

         const reputation_object* find_reputation( const account_name_type& account )const;

         /// Counts a default against @p account and lowers its score by the default penalty
         void record_default( const account_name_type& account );
         /// Counts a completed loan of @p account and raises its score by the repayment bonus
         void record_completion( const account_name_type& account );

         //////////////////// db_liquidation.cpp ////////////////////

         /**
          * @return the active loans that can be liquidated at @p block_num, the earliest expiration first
          */
         vector<loan_object> get_defaulted_loans( uint32_t block_num, uint32_t limit = 100 )const;

         /// Moves an active loan to the liquidated state and records the default
         void liquidate_loan( const loan_object& loan, uint32_t block_num );

         //////////////////// db_init.cpp ////////////////////

         /// Reset the object graph in-memory
         void initialize_indexes();

      protected:
         template<typename EvaluatorType>
         void register_evaluator()
         {
            const auto op_type = operation::tag<typename EvaluatorType::operation_type>::value;
            FC_ASSERT( op_type >= 0, "Negative operation type" );
            FC_ASSERT( op_type < _operation_evaluators.size(),
                       "The operation type (${a}) must be smaller than the size of _operation_evaluators (${b})",
                       ("a", op_type)("b", _operation_evaluators.size()) );
            _operation_evaluators[op_type] = std::make_unique<op_evaluator_impl<EvaluatorType>>();
         }

      private:
         void initialize_evaluators();

         const reputation_object& get_or_create_reputation( const account_name_type& account );

         vector< unique_ptr<op_evaluator> >     _operation_evaluators;
   };

} }
