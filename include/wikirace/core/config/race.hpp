#pragma once

#include <chrono>
#include <cstddef>


namespace wikirace::core::config::race {

/*
===============================================================================
Race timing
===============================================================================

    first finish observed
        |-- FINISH_NOTIFICATION_DELAY --|------- GRACE_PERIOD -------|
        raceEndedAt                     countdown starts             closed

The countdown is always derived from timestamps, never decremented.
===============================================================================
*/

inline constexpr std::chrono::milliseconds FINISH_NOTIFICATION_DELAY{500};
inline constexpr std::chrono::milliseconds GRACE_PERIOD{30'000};

// How long a same-page / finish notification stays visible
inline constexpr std::chrono::milliseconds NOTIFICATION_DURATION{3'000};

// -----------------------------------------------------------------------------
// Split tracker
// -----------------------------------------------------------------------------
inline constexpr std::size_t MAX_SEGMENTS = 7;

// Cosmetic ahead/behind cutoff for segment deltas
inline constexpr std::chrono::milliseconds AHEAD_THRESHOLD{60'000};

} // namespace wikirace::core::config::race
