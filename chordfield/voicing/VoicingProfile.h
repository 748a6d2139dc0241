#pragma once

#include <QString>

class QSettings;

namespace chordfield::voicing {

// Register constants and session knobs for the voicing engine.
// Versioned and persisted via QSettings.
struct VoicingProfile {
    int version = 1;
    QString name; // optional label, e.g. "Keyboard (Default)"

    // Playable range; every produced note is octave-wrapped into it.
    int minMidiNote = 28; // E1
    int maxMidiNote = 84; // C6

    // From-scratch construction centre (F#3).
    int defaultCenter = 54;

    // Register gravity: a voicing whose mean leaves [low, high] is shifted
    // by whole octaves towards the target.
    int gravityLow = 48;    // C3
    int gravityHigh = 66;   // F#4
    int gravityTarget = 57; // A3

    // Independent bass leading
    int bassMinMidiNote = 40; // E2
    int bassMaxMidiNote = 60; // C4
    int bassCenter = 48;      // C3

    // Bass-to-next-voice gap that triggers raising the bass an octave.
    int maxBassSpread = 19;

    // Open voicing upper-voice window
    int openMinMidiNote = 48;
    int openMaxMidiNote = 84;
    int openStartMidiNote = 58; // first upper target
    int openStep = 5;           // semitones between upper targets

    // Rootless construction cursor
    int rootlessStartMidiNote = 48;

    // Session
    bool autoModulate = true;
    int recentRootWindow = 4; // roots remembered for suggestion filtering

    // Explainability
    bool reasoningLogEnabled = false;
};

VoicingProfile defaultVoicingProfile();

// Persist/load profile under a prefix like "<surface>/voicingProfile".
VoicingProfile loadVoicingProfile(QSettings& settings, const QString& prefix);
void saveVoicingProfile(QSettings& settings, const QString& prefix, const VoicingProfile& p);

} // namespace chordfield::voicing
