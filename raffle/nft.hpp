/**
 *  @file
 *  @copyright defined in eos/LICENSE.txt
 */
#pragma once

#include <eosiolib/eosio.hpp>

#include <string>

namespace eosio {

   using std::string;

   /**
    * Collection of unique items. Every item id exists at most once and
    * has exactly one owner.
    */
   class nft : public contract {
      public:
         nft( account_name self ):contract(self){}

         /// @abi action
         void issue( account_name to, uint64_t id, string memo );

         /// fails unless `from` currently owns item `id`
         /// @abi action
         void transfernft( account_name from,
                           account_name to,
                           uint64_t     id,
                           string       memo );

         inline account_name owner_of( uint64_t id )const;

      private:
         ///@abi table items i64
         struct item {
            uint64_t      id;
            account_name  owner;

            uint64_t primary_key()const { return id; }
         };

         typedef eosio::multi_index<N(items), item> items;

      public:
         struct transfernft_args {
            account_name  from;
            account_name  to;
            uint64_t      id;
            string        memo;
         };
   };

   account_name nft::owner_of( uint64_t id )const
   {
      items itemstable( _self, _self );
      const auto pos = itemstable.find( id );
      if (pos == itemstable.cend()) {
            return 0;
      }

      return pos->owner;
   }

} /// namespace eosio
