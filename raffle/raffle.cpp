#include "raffle.hpp"

namespace nftraffle {
    raffle::raffle(account_name name, account_name code):
    contract(name),
    _code(code),
    _global(_self, _self),
    _raffles(_self, _self),
    _actives(_self, _self),
    _status(_self, _self)
    {
        _global_state = _global.exists() ? _global.get() : get_default_parameters();
    }

    raffle::~raffle() {
        _global.set(_global_state, _self);
    }

    global_item raffle::get_default_parameters() {
        global_item global;
        global.owner           = _self;
        global.next_id         = 0;
        global.member_contract = 0;
        global.member_symbol   = 0;
        global.locked          = false;
        return global;
    }

    reentrancy_guard::reentrancy_guard(raffle& r):
    _raffle(r),
    _deferred(false)
    {
        eosio_assert(_raffle._global_state.locked == false, "reentrant call rejected");
        _raffle._global_state.locked = true;
    }

    reentrancy_guard::~reentrancy_guard() {
        if (!_deferred) {
            _raffle._global_state.locked = false;
            return;
        }

        // runs after every inline transfer queued before it, notifications included
        action(
            permission_level{_raffle.get_self(), N(active)},
            _raffle.get_self(),
            N(unlock),
            std::make_tuple()
        ).send();
    }

    void reentrancy_guard::defer_release() {
        _deferred = true;
    }

    void raffle::setowner(account_name owner) {
        require_auth(_global_state.owner);
        eosio_assert(is_account(owner), "owner account does not exist");

        _global_state.owner = owner;
    }

    void raffle::setmember(account_name contract, uint64_t symbol) {
        require_auth(_global_state.owner);
        if (contract != 0) {
            eosio_assert(is_account(contract), "membership token contract does not exist");
        }

        _global_state.member_contract = contract;
        _global_state.member_symbol   = symbol;
    }

    void raffle::setstatus(uint64_t id, uint64_t val) {
        require_auth(_global_state.owner);
        auto pos = _status.find(id);
        if (pos == _status.end()) {
            _status.emplace(_self, [&](auto& info) {
                info.id = id;
                info.val = val;
            });
        } else {
            _status.modify(pos, 0, [&](auto& info) {
                info.val = val;
            });
        }
    }

    uint64_t raffle::get_status(uint64_t id, uint64_t default_val) const {
        auto pos = _status.find(id);
        if (pos == _status.end()) {
            return default_val;
        }
        return pos->val;
    }

    void raffle::create(account_name prize_contract, uint64_t prize_id, uint64_t max_entries_per_user,
                        uint64_t end_time, asset entry_cost, uint64_t max_entries) {
        require_auth(_global_state.owner);
        reentrancy_guard guard(*this);

        eosio_assert(end_time > now(), "end time must be in the future");
        eosio_assert(max_entries > 0, "max entries must be positive");
        eosio_assert(entry_cost.is_valid(), "invalid entry cost");
        eosio_assert(entry_cost.amount >= 0, "entry cost can't be negative");
        eosio_assert(prize_contract != 0 && is_account(prize_contract), "prize contract does not exist");

        eosio::nft collection(prize_contract);
        auto holder = collection.owner_of(prize_id);
        eosio_assert(holder != _self, "prize item is already in custody");
        eosio_assert(holder == _global_state.owner, "operator does not own the prize item");

        uint64_t next = _global_state.next_id + 1;
        eosio_assert(next > _global_state.next_id, "new raffle id is smaller than or equal with the old!");

        _raffles.emplace(_self, [&](raffle_item& info) {
            info.id                    = next;
            info.prize_contract        = prize_contract;
            info.prize_id              = prize_id;
            info.max_entries_per_user  = max_entries_per_user;
            info.entry_cost            = entry_cost;
            info.max_entries           = max_entries;
            info.total_entries_sold    = 0;
            info.free_participants_num = 0;
            info.ticket_holders_num    = 0;
            info.end_time              = end_time;
            info.winner                = 0;
            info.is_open               = true;
            info.claimed               = false;
            info.create_time           = now();
        });

        _actives.emplace(_self, [&](active_item& info) {
            info.id = next;
        });

        _global_state.next_id = next;

        INLINE_ACTION_SENDER(eosio::nft, transfernft)( prize_contract, {holder, N(active)}, {holder, _self, prize_id, string("[raffle] prize escrow for raffle ") + to_string(next)} );
        guard.defer_release();

        SEND_INLINE_ACTION( *this, created, {_self,N(active)}, {next} );
    }

    void raffle::join(account_name player, uint64_t raffle_id, uint64_t tickets, account_name token_contract) {
        require_auth(player);
        reentrancy_guard guard(*this);

        auto pos = _raffles.find(raffle_id);
        eosio_assert(pos != _raffles.end(), "raffle not found");
        eosio_assert(now() < pos->end_time, "raffle has ended");
        eosio_assert(tickets > 0, "ticket count must be positive");

        uint64_t left = pos->max_entries - pos->total_entries_sold;
        if (get_status(STATUS_ID_LEGACY_CAPACITY, STATUS_DEFAULT_LEGACY_CAPACITY)) {
            // the ticket reaching the cap is never sold
            eosio_assert(tickets < left, "not enough tickets left");
        } else {
            eosio_assert(tickets <= left, "not enough tickets left");
        }

        players_table players(_self, raffle_id);
        auto player_pos = players.find(player);
        uint64_t bought = player_pos == players.end() ? 0 : player_pos->tickets;
        if (get_status(STATUS_ID_ENFORCE_USER_CAP, STATUS_DEFAULT_ENFORCE_USER_CAP)) {
            eosio_assert(tickets <= pos->max_entries_per_user && bought <= pos->max_entries_per_user - tickets,
                         "ticket cap per user reached");
        }

        bool free_entry = is_member(player);
        if (free_entry) {
            freeplayers_table freeplayers(_self, raffle_id);
            freeplayers.emplace(_self, [&](free_item& info) {
                info.id     = pos->free_participants_num;
                info.player = player;
            });
        } else {
            eosio_assert(token_contract != 0 && is_account(token_contract), "token contract does not exist");
            asset cost = pos->entry_cost * static_cast<int64_t>(tickets);
            if (cost.amount > 0) {
                sub_deposit(player, token_contract, cost, "insufficient deposit for entry cost");
                add_custody(token_contract, cost);
            }
        }

        uint64_t slots = tickets;
        if (free_entry && get_status(STATUS_ID_FREE_SINGLE_SLOT, STATUS_DEFAULT_FREE_SINGLE_SLOT)) {
            slots = 1;
        }

        tickets_table holders(_self, raffle_id);
        holders.emplace(_self, [&](ticket_item& info) {
            info.id     = holders.available_primary_key();
            info.player = player;
            info.low    = pos->ticket_holders_num;
            info.high   = pos->ticket_holders_num + slots - 1;
        });

        if (player_pos == players.end()) {
            players.emplace(_self, [&](player_item& info) {
                info.player  = player;
                info.tickets = tickets;
            });
        } else {
            players.modify(player_pos, 0, [&](player_item& info) {
                info.tickets += tickets;
            });
        }

        _raffles.modify(pos, 0, [&](raffle_item& info) {
            info.total_entries_sold += tickets;
            info.ticket_holders_num += slots;
            if (free_entry) {
                info.free_participants_num += 1;
            }
        });

        SEND_INLINE_ACTION( *this, entered, {_self,N(active)}, {raffle_id, player, tickets} );
    }

    void raffle::selectwinner(uint64_t raffle_id) {
        require_auth(_global_state.owner);
        reentrancy_guard guard(*this);

        auto pos = _raffles.find(raffle_id);
        eosio_assert(pos != _raffles.end(), "raffle not found");
        eosio_assert(pos->ticket_holders_num > 0, "no ticket holders");
        eosio_assert(pos->prize_contract != 0, "prize is not set");
        eosio_assert(pos->winner == 0, "winner already drawn");

        random rnd;
        checksum256 sseed = rnd.create_sys_seed(pos->free_participants_num);
        checksum256 useed = sseed;
        if (get_status(STATUS_ID_SEED_MIX_TRANSACTION, STATUS_DEFAULT_SEED_MIX_TRANSACTION)) {
            useed = rnd.create_trx_seed();
        }
        rnd.seed(sseed, useed);

        uint64_t lucky = rnd.gen(pos->ticket_holders_num);

        tickets_table holders(_self, raffle_id);
        auto idx = holders.template get_index<N(byhigh)>();
        auto itr = idx.lower_bound(lucky);
        eosio_assert(itr != idx.end() && itr->low <= lucky, "lucky ticket is missing");
        account_name winner = itr->player;

        _raffles.modify(pos, 0, [&](raffle_item& info) {
            info.winner = winner;
        });

        eosio::print("[raffle ", raffle_id, "] lucky ticket ", lucky, " of ", pos->ticket_holders_num, ", winner ", name{winner});

        SEND_INLINE_ACTION( *this, drawn, {_self,N(active)}, {raffle_id, winner, pos->total_entries_sold} );
    }

    void raffle::endraffle(uint64_t raffle_id) {
        auto pos = _raffles.find(raffle_id);
        eosio_assert(pos != _raffles.end(), "raffle not found");

        uint64_t ct = now();
        if (get_status(STATUS_ID_LEGACY_END_CHECK, STATUS_DEFAULT_LEGACY_END_CHECK)) {
            eosio_assert(pos->end_time >= ct, "raffle has already ended");
        } else {
            eosio_assert(pos->is_open, "raffle is already closed");
            eosio_assert(ct >= pos->end_time, "raffle has not ended yet");
        }

        _raffles.modify(pos, 0, [&](raffle_item& info) {
            info.end_time = ct;
            info.is_open  = false;
        });
    }

    void raffle::claim(account_name player, uint64_t raffle_id) {
        require_auth(player);
        reentrancy_guard guard(*this);

        auto pos = _raffles.find(raffle_id);
        eosio_assert(pos != _raffles.end(), "raffle not found");
        eosio_assert(now() >= pos->end_time, "raffle has not ended yet");

        if (get_status(STATUS_ID_LEGACY_CLAIM_CHECK, STATUS_DEFAULT_LEGACY_CLAIM_CHECK)) {
            eosio_assert(pos->free_participants_num > 0, "no winners");
        } else {
            eosio_assert(pos->winner != 0, "no winners");
        }
        eosio_assert(player == pos->winner, "caller is not the winner");

        if (!get_status(STATUS_ID_LEGACY_RECLAIM, STATUS_DEFAULT_LEGACY_RECLAIM)) {
            eosio_assert(!pos->claimed, "prize already claimed");
        }

        INLINE_ACTION_SENDER(eosio::nft, transfernft)( pos->prize_contract, {_self, N(active)}, {_self, player, pos->prize_id, string("[raffle] prize of raffle ") + to_string(raffle_id)} );
        guard.defer_release();

        _raffles.modify(pos, 0, [&](raffle_item& info) {
            info.claimed = true;
        });

        SEND_INLINE_ACTION( *this, claimed, {_self,N(active)}, {raffle_id, player} );
    }

    void raffle::withdraw(account_name token_contract, asset quantity) {
        require_auth(_global_state.owner);
        reentrancy_guard guard(*this);

        eosio_assert(token_contract != 0 && is_account(token_contract), "token contract does not exist");
        eosio_assert(quantity.is_valid(), "invalid withdraw quantity");
        eosio_assert(quantity.amount > 0, "must withdraw positive quantity");

        asset held = get_custody_balance(token_contract, quantity.symbol);
        eosio_assert(held >= quantity, "insufficient custody balance");

        if (get_status(STATUS_ID_LEGACY_WITHDRAW, STATUS_DEFAULT_LEGACY_WITHDRAW)) {
            // destination is the contract's own custody, nothing moves
            eosio::print("[treasury] withdraw of ", quantity, " kept in custody");
            return;
        }

        eosio_assert(_global_state.owner != _self, "owner is the contract itself");
        sub_custody(token_contract, quantity);

        INLINE_ACTION_SENDER(eosio::token, transfer)( token_contract, {_self, N(active)}, {_self, _global_state.owner, quantity, string("[raffle] treasury withdraw")} );
        guard.defer_release();
    }

    void raffle::refund(account_name owner, account_name token_contract, asset quantity) {
        require_auth(owner);
        reentrancy_guard guard(*this);

        eosio_assert(token_contract != 0 && is_account(token_contract), "token contract does not exist");
        eosio_assert(quantity.is_valid(), "invalid refund quantity");
        eosio_assert(quantity.amount > 0, "must refund positive quantity");

        sub_deposit(owner, token_contract, quantity, "insufficient deposit");

        INLINE_ACTION_SENDER(eosio::token, transfer)( token_contract, {_self, N(active)}, {_self, owner, quantity, string("[raffle] deposit refund")} );
        guard.defer_release();
    }

    void raffle::unlock() {
        require_auth(_self);
        _global_state.locked = false;
    }

    void raffle::created(uint64_t raffle_id) {
        require_auth(_self);
    }

    void raffle::entered(uint64_t raffle_id, account_name player, uint64_t tickets) {
        require_auth(_self);
        require_recipient(player);
    }

    void raffle::drawn(uint64_t raffle_id, account_name winner, uint64_t total_entries_sold) {
        require_auth(_self);
        require_recipient(winner);
    }

    void raffle::claimed(uint64_t raffle_id, account_name player) {
        require_auth(_self);
        require_recipient(player);
    }

    void raffle::transfer(account_name from, account_name to) {
        const auto params = eosio::unpack_action_data<eosio::currency::transfer>();

        if (params.from == _self || params.to != _self) {
            return;
        }

        eosio_assert(_global_state.locked == false, "reentrant call rejected");
        eosio_assert(params.quantity.is_valid(), "transfer invalid quantity");
        eosio_assert(params.quantity.amount > 0, "transfer amount not positive");

        vector<string> pieces;
        boost::split(pieces, params.memo, boost::is_any_of("-"));

        if (pieces[0] != DEPOSIT_MEMO) {
            add_custody(_code, params.quantity);
            return;
        }

        account_name beneficiary = params.from;
        if (pieces.size() > 1 && !pieces[1].empty()) {
            beneficiary = eosio::string_to_name(pieces[1].c_str());
            eosio_assert(is_account(beneficiary), "deposit beneficiary does not exist");
        }

        add_deposit(beneficiary, _code, params.quantity);
    }

    bool raffle::is_member(account_name player) const {
        if (_global_state.member_contract == 0) {
            return false;
        }

        eosio::token member_token(_global_state.member_contract);
        return member_token.get_balance_amount(player, _global_state.member_symbol) > 0;
    }

    asset raffle::get_custody_balance(account_name token_contract, symbol_type sym) const {
        custody_table custody(_self, token_contract);
        auto pos = custody.find(sym.name());
        if (pos == custody.end() || pos->balance.symbol != sym) {
            return asset(0, sym);
        }
        return pos->balance;
    }

    void raffle::add_custody(account_name token_contract, asset quantity) {
        custody_table custody(_self, token_contract);
        auto pos = custody.find(quantity.symbol.name());
        if (pos == custody.end()) {
            custody.emplace(_self, [&](custody_item& info) {
                info.balance = quantity;
            });
        } else {
            eosio_assert(pos->balance.symbol == quantity.symbol, "symbol precision mismatch");
            custody.modify(pos, 0, [&](custody_item& info) {
                info.balance += quantity;
            });
        }
    }

    void raffle::sub_custody(account_name token_contract, asset quantity) {
        custody_table custody(_self, token_contract);
        const auto& held = custody.get(quantity.symbol.name(), "no custody balance");
        eosio_assert(held.balance.symbol == quantity.symbol && held.balance >= quantity, "insufficient custody balance");

        custody.modify(held, 0, [&](custody_item& info) {
            info.balance -= quantity;
        });
    }

    void raffle::add_deposit(account_name owner, account_name token_contract, asset quantity) {
        deposits_table deposits(_self, owner);
        auto idx = deposits.template get_index<N(bytoken)>();
        auto pos = idx.find(token_key(token_contract, quantity.symbol.name()));
        if (pos == idx.end()) {
            deposits.emplace(_self, [&](deposit_item& info) {
                info.id       = deposits.available_primary_key();
                info.contract = token_contract;
                info.balance  = quantity;
            });
            return;
        }

        eosio_assert(pos->balance.symbol == quantity.symbol, "symbol precision mismatch");
        idx.modify(pos, 0, [&](deposit_item& info) {
            info.balance += quantity;
        });
    }

    void raffle::sub_deposit(account_name owner, account_name token_contract, asset quantity, const char* msg) {
        deposits_table deposits(_self, owner);
        auto idx = deposits.template get_index<N(bytoken)>();
        auto pos = idx.find(token_key(token_contract, quantity.symbol.name()));
        eosio_assert(pos != idx.end()
                     && pos->balance.symbol == quantity.symbol
                     && pos->balance >= quantity, msg);

        if (pos->balance == quantity) {
            idx.erase(pos);
        } else {
            idx.modify(pos, 0, [&](deposit_item& info) {
                info.balance -= quantity;
            });
        }
    }
};

#define raffle_ABI_EX(TYPE, MEMBERS)                                                   \
	extern "C"                                                                         \
	{                                                                                  \
		void apply(uint64_t receiver, uint64_t code, uint64_t action)                  \
		{                                                                              \
			if (action == N(onerror))                                                  \
			{                                                                          \
				/* onerror is only valid if it is for the "eosio" code account and     \
				 * authorized by "EOS"'s "active permission */                         \
				eosio_assert(code == N(eosio), "onerror action's are only valid from " \
											   "the \"EOS\" system account");          \
			}                                                                          \
			auto self = receiver;                                                      \
            if (code != self && action == N(transfer)) {                               \
                TYPE thiscontract(self, code);                                         \
                eosio::execute_action( &thiscontract, &nftraffle::raffle::transfer );  \
            }                                                                          \
                                                                                       \
            if (code == self || action == N(onerror))                                  \
			{                                                                          \
				TYPE thiscontract(self, code);                                         \
				switch (action)                                                        \
				{                                                                      \
					EOSIO_API(TYPE, MEMBERS)                                           \
				}                                                                      \
			}                                                                          \
		}                                                                              \
	}

raffle_ABI_EX( nftraffle::raffle, (setowner)(setmember)(setstatus)(create)(join)(selectwinner)(endraffle)(claim)(withdraw)(refund)(unlock)(created)(entered)(drawn)(claimed))
