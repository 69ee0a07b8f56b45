/**
 *  @file
 *  @copyright defined in eos/LICENSE.txt
 */
#include <eosiolib/eosio.hpp>
#include <eosiolib/asset.hpp>
#include <eosiolib/singleton.hpp>
#include <eosiolib/currency.hpp>
#include <eosiolib/transaction.hpp>
#include <eosiolib/print.hpp>
#include <boost/algorithm/string.hpp>
#include "config.hpp"
#include "random.hpp"
#include "token.hpp"
#include "nft.hpp"

namespace nftraffle {
    using namespace eosio;
    using namespace std;

    //@abi table global i64
    struct global_item {
        account_name owner;
        uint64_t     next_id;
        account_name member_contract;
        symbol_name  member_symbol;
        bool         locked;

        EOSLIB_SERIALIZE( global_item, (owner)(next_id)(member_contract)(member_symbol)(locked) )
    };
    typedef eosio::singleton<N(global), global_item> global_singleton;

    //@abi table raffles i64
    struct raffle_item {
        uint64_t     id;
        account_name prize_contract;
        uint64_t     prize_id;
        uint64_t     max_entries_per_user;
        asset        entry_cost;
        uint64_t     max_entries;
        uint64_t     total_entries_sold;
        uint64_t     free_participants_num;
        uint64_t     ticket_holders_num;
        uint64_t     end_time;
        account_name winner;
        bool         is_open;
        bool         claimed;
        uint64_t     create_time;

        uint64_t primary_key()const { return id; }

        EOSLIB_SERIALIZE( raffle_item, (id)(prize_contract)(prize_id)(max_entries_per_user)(entry_cost)(max_entries)(total_entries_sold)(free_participants_num)(ticket_holders_num)(end_time)(winner)(is_open)(claimed)(create_time) )
    };
    typedef eosio::multi_index<N(raffles), raffle_item> raffles_table;

    //@abi table actives i64
    struct active_item {
        uint64_t id;

        uint64_t primary_key()const { return id; }
        EOSLIB_SERIALIZE( active_item, (id) )
    };
    typedef eosio::multi_index<N(actives), active_item> actives_table;

    // draw pool, scoped by raffle id; one row per join holding pool slots low..high
    //@abi table tickets i64
    struct ticket_item {
        uint64_t     id;
        account_name player;
        uint64_t     low;
        uint64_t     high;

        uint64_t primary_key()const { return id; }
        uint64_t by_high()const { return high; }
        EOSLIB_SERIALIZE( ticket_item, (id)(player)(low)(high) )
    };
    typedef eosio::multi_index<N(tickets), ticket_item,
    indexed_by<N(byhigh), const_mem_fun<ticket_item, uint64_t, &ticket_item::by_high>  >
    > tickets_table;

    //@abi table freeplayers i64
    struct free_item {
        uint64_t     id;
        account_name player;

        uint64_t primary_key()const { return id; }
        EOSLIB_SERIALIZE( free_item, (id)(player) )
    };
    typedef eosio::multi_index<N(freeplayers), free_item> freeplayers_table;

    //@abi table players i64
    struct player_item {
        account_name player;
        uint64_t     tickets;

        uint64_t primary_key()const { return player; }
        EOSLIB_SERIALIZE( player_item, (player)(tickets) )
    };
    typedef eosio::multi_index<N(players), player_item> players_table;

    // contract held balances, scoped by token contract
    //@abi table custody i64
    struct custody_item {
        asset balance;

        uint64_t primary_key()const { return balance.symbol.name(); }
        EOSLIB_SERIALIZE( custody_item, (balance) )
    };
    typedef eosio::multi_index<N(custody), custody_item> custody_table;

    static uint128_t token_key(account_name contract, symbol_name sym) {
        return (uint128_t(contract) << 64) | sym;
    }

    // pre-authorized payment funds, scoped by payer; one row per token contract and symbol
    //@abi table deposits i64
    struct deposit_item {
        uint64_t     id;
        account_name contract;
        asset        balance;

        uint64_t primary_key()const { return id; }
        uint128_t by_token()const { return token_key(contract, balance.symbol.name()); }
        EOSLIB_SERIALIZE( deposit_item, (id)(contract)(balance) )
    };
    typedef eosio::multi_index<N(deposits), deposit_item,
    indexed_by<N(bytoken), const_mem_fun<deposit_item, uint128_t, &deposit_item::by_token>  >
    > deposits_table;

    //@abi table status i64
    struct status {
        uint64_t id;
        uint64_t val;

        uint64_t primary_key()const { return id; }
        EOSLIB_SERIALIZE( status, (id)(val) )
    };
    typedef eosio::multi_index<N(status), status> status_table;

    class reentrancy_guard;

	class raffle : public eosio::contract {
		public:
			raffle(account_name name, account_name code);

	        ~raffle();

            global_item get_default_parameters();

            /// @abi action
            void setowner(account_name owner);

            /// @abi action
            void setmember(account_name contract, uint64_t symbol);

            /// @abi action
            void setstatus(uint64_t id, uint64_t val);

            /// @abi action
            void create(account_name prize_contract, uint64_t prize_id, uint64_t max_entries_per_user,
                        uint64_t end_time, asset entry_cost, uint64_t max_entries);

            /// @abi action
            void join(account_name player, uint64_t raffle_id, uint64_t tickets, account_name token_contract);

            /// @abi action
            void selectwinner(uint64_t raffle_id);

            /// @abi action
            void endraffle(uint64_t raffle_id);

            /// @abi action
            void claim(account_name player, uint64_t raffle_id);

            /// @abi action
            void withdraw(account_name token_contract, asset quantity);

            /// @abi action
            void refund(account_name owner, account_name token_contract, asset quantity);

            /// @abi action
            void unlock();

            /// @abi action
            void created(uint64_t raffle_id);

            /// @abi action
            void entered(uint64_t raffle_id, account_name player, uint64_t tickets);

            /// @abi action
            void drawn(uint64_t raffle_id, account_name winner, uint64_t total_entries_sold);

            /// @abi action
            void claimed(uint64_t raffle_id, account_name player);

            void transfer(account_name from, account_name to);

            bool is_member(account_name player) const;

            asset get_custody_balance(account_name token_contract, symbol_type sym) const;

		private:
            friend class reentrancy_guard;

            uint64_t get_status(uint64_t id, uint64_t default_val) const;

            void add_custody(account_name token_contract, asset quantity);

            void sub_custody(account_name token_contract, asset quantity);

            void add_deposit(account_name owner, account_name token_contract, asset quantity);

            void sub_deposit(account_name owner, account_name token_contract, asset quantity, const char* msg);

            account_name     _code;
            global_singleton _global;
            global_item      _global_state;
            raffles_table    _raffles;
            actives_table    _actives;
            status_table     _status;
	};

    /**
     * Holds the contract wide lock token for the lifetime of a guarded action.
     * When the action has queued transfers to an outside contract the lock is
     * kept until a trailing inline `unlock` has run, so nothing reached from
     * those transfers can enter a guarded action. A failing action reverts
     * the lock together with everything else.
     */
    class reentrancy_guard {
        public:
            reentrancy_guard(raffle& r);

            ~reentrancy_guard();

            void defer_release();

        private:
            raffle& _raffle;
            bool    _deferred;
    };
}
