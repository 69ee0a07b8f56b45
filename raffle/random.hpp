/**
 *  @file
 *  @copyright defined in eos/LICENSE.txt
 */
#pragma once

#include <eosiolib/eosio.hpp>
#include <eosiolib/transaction.h>
#include <eosiolib/crypto.h>

#include <vector>

namespace nftraffle {
    using namespace eosio;

    /**
     * Draw seed for selectwinner. The system part hashes the block reference
     * and clock of the pending block together with a caller supplied value,
     * so anyone who can see the chain can predict it. The optional second
     * part is the hash of the packed transaction.
     */
    class random {
		public:
		template<class T>
		struct block_state {
			T        salt;
			int      block;
			int      prefix;
			uint64_t time;

			block_state(T t) {
				salt   = t;
				block  = tapos_block_num();
				prefix = tapos_block_prefix();
				time   = current_time();
			}
		};

		template<class T>
		checksum256 create_sys_seed(T salt) const;

		checksum256 create_trx_seed() const;

		void seed(const checksum256& sseed, const checksum256& useed);

		uint64_t gen(uint64_t range) const;

		private:
		checksum256 _seed;
	};

	template<class T>
	checksum256 random::create_sys_seed(T salt) const {
		checksum256 result;
		block_state<T> state(salt);
		sha256(reinterpret_cast<char *>(&state), sizeof(state), &result);
		return result;
	}

	checksum256 random::create_trx_seed() const {
		auto tx_size = transaction_size();
		std::vector<char> tx(tx_size);
		auto read_size = read_transaction(tx.data(), tx_size);
		eosio_assert(tx_size == read_size, "read_transaction failed");

		checksum256 result;
		sha256(tx.data(), read_size, &result);
		return result;
	}

	// both halves hashed back to back
	void random::seed(const checksum256& sseed, const checksum256& useed) {
		checksum256 pair[2] = { sseed, useed };
		sha256(reinterpret_cast<char *>(pair), sizeof(pair), &_seed);
	}

	uint64_t random::gen(uint64_t range) const {
		eosio_assert(range > 0, "random range must be positive");
		const uint64_t *p64 = reinterpret_cast<const uint64_t *>(&_seed);
		return p64[1] % range;
	}
}
