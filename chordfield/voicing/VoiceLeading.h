#pragma once

#include <QVector>

#include "chordfield/voicing/VoicingProfile.h"

namespace chordfield::voicing {

// Ascending MIDI note numbers.
using Voicing = QVector<int>;

// Caller-owned memory of the last accepted voicing.
// Single writer: the owner commits only after a voicing has been accepted.
struct VoiceLeadingContext {
    Voicing previousVoicing;
    int previousRootPc = -1; // -1 = absent

    bool isEmpty() const { return previousVoicing.isEmpty(); }
    void clear();
    void commit(const Voicing& voicing, int rootPc);
};

// Direction a tendency tone resolves in (+1/-1), keyed by its interval above
// the previous root. 0 when the interval has no tendency.
int tendencyResolution(int intervalFromRoot);

// Three-phase voice leading of `targetPcs` from `prev`:
//   1) common tones keep their exact MIDI note (once per pitch class),
//   2) tendency tones resolve by semitone when the resolution is a free target,
//   3) remaining voices take the nearest free pitch class.
// Voices left without a pitch class hold their previous note; pitch classes
// left without a voice are added around the previous centroid.
// Result is ascending. An empty `prev` returns `targetPcs` unchanged.
Voicing voiceLeadNatural(const QVector<int>& targetPcs, const Voicing& prev, int prevRootPc,
                         const VoicingProfile& profile);

// Bass placement favouring 4th/5th root motion, then steps, then small leaps.
// prevBass <= 0 means no previous bass.
int voiceLeadBass(int rootPc, int prevBass, const VoicingProfile& profile);

// For every previous note whose pitch class still sounds, makes sure one
// instance sits on exactly that MIDI note (moving an octave-displaced one).
Voicing retainCommonTones(const Voicing& voicing, const Voicing& prev);

// Shifts the whole voicing by octaves when its mean leaves the gravity window.
// Returns the number of octaves applied through `octavesOut` when non-null.
Voicing applyRegisterGravity(const Voicing& voicing, const VoicingProfile& profile, int* octavesOut = nullptr);

Voicing transposeOctaves(const Voicing& voicing, int octaves);

// Octave-wraps each note into the playable range.
Voicing clampToRange(const Voicing& voicing, const VoicingProfile& profile);

// Sorts and removes unisons (raising a duplicate an octave, or dropping it).
Voicing resolveUnisons(const Voicing& voicing, const VoicingProfile& profile);

// Raises the bass an octave when it sits too far below the next voice.
Voicing applyMaxSpread(const Voicing& voicing, const VoicingProfile& profile);

bool isStrictlyAscending(const Voicing& voicing);

// Open voicings: when bass and top voice move the same way, moves the bass
// (or failing that the top voice) an octave the other way if it stays in range.
// `sortedPrev` is the previous voicing, ascending.
void enforceContraryMotion(int& bass, Voicing& upper, const Voicing& sortedPrev, const VoicingProfile& profile);

} // namespace chordfield::voicing
