#ifndef PHASE_CONTEXT_HPP
#define PHASE_CONTEXT_HPP

#include "PhaseScheduler.hpp"
#include <string>

enum class BreathPhase {
    Inhale,
    Exhale
};

inline BreathPhase nextPhase(BreathPhase p) {
    return p == BreathPhase::Inhale ? BreathPhase::Exhale : BreathPhase::Inhale;
}

// Both captions are three characters so the IN and OUT bars line up
inline const char* captionFor(BreathPhase p) {
    return p == BreathPhase::Inhale ? "IN " : "OUT";
}

// Handed to the renderer for one bar; gone once the bar is drawn
struct PhaseContext {
    BreathPhase phase = BreathPhase::Inhale;
    std::string caption;
    PhaseDelay delay;
    long cycleIndex = 0;    // 0 for the first IN/OUT pair, 1 for the next...
};

#endif  // PHASE_CONTEXT_HPP
