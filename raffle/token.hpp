/**
 *  @file
 *  @copyright defined in eos/LICENSE.txt
 */
#pragma once

#include <eosiolib/asset.hpp>
#include <eosiolib/eosio.hpp>

#include <string>

namespace eosio {

   using std::string;

   class token : public contract {
      public:
         token( account_name self ):contract(self){}

         /// @abi action
         void create( account_name issuer,
                      asset        maximum_supply);

         /// @abi action
         void issue( account_name to, asset quantity, string memo );

         /// @abi action
         void transfer( account_name from,
                        account_name to,
                        asset        quantity,
                        string       memo );

         inline int64_t get_balance_amount( account_name owner, symbol_name sym )const;

      private:
         ///@abi table accounts i64
         struct account {
            asset    balance;

            uint64_t primary_key()const { return balance.symbol.name(); }
         };

         ///@abi table stat i64
         struct currency_stats {
            asset          supply;
            asset          max_supply;
            account_name   issuer;

            uint64_t primary_key()const { return supply.symbol.name(); }
         };

         typedef eosio::multi_index<N(accounts), account> accounts;
         typedef eosio::multi_index<N(stat), currency_stats> stats;

         void sub_balance( account_name owner, asset value );
         void add_balance( account_name owner, asset value, account_name ram_payer );

      public:
         struct transfer_args {
            account_name  from;
            account_name  to;
            asset         quantity;
            string        memo;
         };
   };

   int64_t token::get_balance_amount( account_name owner, symbol_name sym )const
   {
      accounts accountstable( _self, owner );
      const auto ac = accountstable.find( sym );
      if (ac == accountstable.cend()) {
            return 0;
      }

      return ac->balance.amount;
   }

} /// namespace eosio
