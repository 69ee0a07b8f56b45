/**
 *  @file
 *  @copyright defined in eos/LICENSE.txt
 */
#pragma once

#define DEPOSIT_MEMO                    "deposit"

// policy switches, stored in the status table
#define STATUS_ID_LEGACY_END_CHECK      101
#define STATUS_ID_LEGACY_CLAIM_CHECK    102
#define STATUS_ID_LEGACY_WITHDRAW       103
#define STATUS_ID_ENFORCE_USER_CAP      104
#define STATUS_ID_LEGACY_CAPACITY       105
#define STATUS_ID_LEGACY_RECLAIM        106
#define STATUS_ID_FREE_SINGLE_SLOT      107
#define STATUS_ID_SEED_MIX_TRANSACTION  108

#define STATUS_DEFAULT_LEGACY_END_CHECK      1
#define STATUS_DEFAULT_LEGACY_CLAIM_CHECK    1
#define STATUS_DEFAULT_LEGACY_WITHDRAW       1
#define STATUS_DEFAULT_ENFORCE_USER_CAP      0
#define STATUS_DEFAULT_LEGACY_CAPACITY       1
#define STATUS_DEFAULT_LEGACY_RECLAIM        1
#define STATUS_DEFAULT_FREE_SINGLE_SLOT      0
#define STATUS_DEFAULT_SEED_MIX_TRANSACTION  0
