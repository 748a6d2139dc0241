#pragma once

#include <QString>
#include <QVector>

namespace chordfield::util {

// Normalized pitch class: 0=C, 1=C#/Db, ... 11=B.
inline int normalizePc(int pc) {
    pc %= 12;
    if (pc < 0) pc += 12;
    return pc;
}

// Half-up rounding (2.5 -> 3, -2.5 -> -2).
int roundHalfUp(double v);

// Parse a pitch name like "C", "Eb", "F#", "B♭", "C♯" into a pitch class.
// Returns true on success.
bool parsePitchClass(QString token, int& pcOut);

// Spells a pitch class using either flats or sharps.
QString spellPitchClass(int pc, bool preferFlats);

// Sharp spelling plus octave: 60 -> "C4", 61 -> "C#4".
QString midiNoteName(int midi);

// MIDI note of pitch class `pc` nearest to `target` (octaves o-1, o, o+1 of the target).
// Ties resolve to the lower note.
int findClosest(int pc, int target);

// Lowest MIDI note of pitch class `pc` strictly above `current`.
int findNextAbove(int pc, int current);

// Moves `midi` by whole octaves until it lies in [lo, hi].
int wrapIntoRange(int midi, int lo, int hi);

// Rounded arithmetic mean, or `fallback` for an empty voicing.
int centroid(const QVector<int>& notes, int fallback);

// Distinct pitch classes in first-seen order.
QVector<int> uniquePitchClasses(const QVector<int>& notesOrPcs);

} // namespace chordfield::util
