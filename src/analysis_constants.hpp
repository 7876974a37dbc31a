#pragma once

#include <cstddef>

// Fixed thresholds of the analytics engine. None of these are runtime
// configurable so the same input always produces the same output.

static constexpr long long HOUR_MS = 60LL * 60LL * 1000LL;
static constexpr long long DAY_MS  = 24LL * HOUR_MS;

// Accepted timestamp range, +-100,000,000 days around the epoch (the
// ECMAScript Date range). Keeps every timestamp difference representable.
static constexpr long long MAX_TIMESTAMP_MS = 8640000000000000LL;

// Session boundaries: Discord moves fast, everything else uses 6h.
static constexpr long long SESSION_GAP_DEFAULT_MS = 6LL * HOUR_MS;
static constexpr long long SESSION_GAP_DISCORD_MS = 2LL * HOUR_MS;

// Late night = [22:00, 04:00)
static constexpr int LATE_NIGHT_START_HOUR = 22;
static constexpr int LATE_NIGHT_END_HOUR   = 4;

// Top-N list sizes
static constexpr std::size_t TOP_EMOJIS          = 10;
static constexpr std::size_t TOP_REACTIONS_GIVEN = 5;
static constexpr std::size_t TOP_WORDS           = 20;
static constexpr std::size_t TOP_PHRASES         = 10;

// Burst detection
static constexpr std::size_t BURST_MIN_DAYS   = 8;
static constexpr std::size_t BURST_WINDOW     = 7;
static constexpr double      BURST_MULTIPLIER = 3.0;

// Response time statistics
static constexpr double TRIMMED_MEAN_FRACTION = 0.1;

// Interest score weights
static constexpr double INTEREST_W_INITIATION  = 0.25;
static constexpr double INTEREST_W_RT_TREND    = 0.20;
static constexpr double INTEREST_W_LEN_TREND   = 0.15;
static constexpr double INTEREST_W_ENGAGEMENT  = 0.20;
static constexpr double INTEREST_W_DOUBLE_TEXT = 0.10;
static constexpr double INTEREST_W_LATE_NIGHT  = 0.10;

// Response time slope: +-60000 ms/month maps to +-50 points around 50.
static constexpr double INTEREST_RT_SLOPE_DIVISOR = 1200.0;
// Message length slope: +-2 words/month maps to +-50 points around 50.
static constexpr double INTEREST_LEN_SLOPE_FACTOR = 25.0;
// Reaction receive rate of 0.2 saturates the engagement factor.
static constexpr double INTEREST_RECEIVE_RATE_FACTOR = 500.0;
// Mention/reply fallback for platforms without reactions.
static constexpr double INTEREST_MENTION_RATE_FACTOR = 200.0;
static constexpr double INTEREST_REPLY_RATE_FACTOR   = 300.0;
// 50 double texts per 1000 messages saturates the factor.
static constexpr double INTEREST_DOUBLE_TEXT_FACTOR = 2.0;

// Ghost risk
static constexpr std::size_t GHOST_RECENT_MONTHS       = 3;
static constexpr std::size_t GHOST_MIN_EARLIER_MONTHS  = 3;
static constexpr double      GHOST_W_RESPONSE_TIME     = 0.30;
static constexpr double      GHOST_W_MESSAGE_LENGTH    = 0.25;
static constexpr double      GHOST_W_INITIATION        = 0.25;
static constexpr double      GHOST_W_VOLUME            = 0.20;
static constexpr double      GHOST_FACTOR_THRESHOLD    = 30.0;

// Delusion gap below this is noise; no holder is reported.
static constexpr double DELUSION_HOLDER_MIN_GAP = 5.0;

// Catchphrases
static constexpr long long   CATCHPHRASE_MIN_COUNT      = 3;
static constexpr double      CATCHPHRASE_MIN_UNIQUENESS = 0.6;
static constexpr std::size_t CATCHPHRASE_MAX_PER_PERSON = 8;
