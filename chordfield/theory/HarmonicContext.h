#pragma once

#include <QJsonArray>
#include <QVector>
#include <array>

#include "chordfield/ontology/ChordModel.h"

namespace chordfield::theory {

enum class RelationKind {
    SecondaryDominant = 0,
    TritoneSubstitution,
    ModalInterchange,
    ChromaticMediant,
    Parallel,
    Relative,
    LeadingTone,
};

// A chord related to some reference by a named harmonic relation.
struct RelatedChord {
    int rootPc = 0;
    ontology::Quality quality = ontology::Quality::Dom7;
    RelationKind kind = RelationKind::SecondaryDominant;
    int degree = -1; // source degree for modal interchange, else -1
};

QString relationKey(RelationKind kind);

// Size of the pitch-class set intersection (symmetric).
int sharedNoteCount(const QVector<int>& a, const QVector<int>& b);

// 8x8 harmonic-distance map of the chord grid: min(3, shared pcs) per cell, row-major.
struct GlowGrid {
    static constexpr int kMaxLevel = 3;
    std::array<int, 64> cells{};

    int at(int row, int column) const;
    QJsonArray toJsonArray() const;
};

GlowGrid glowGrid(const ontology::ChordModel& model,
                  const QVector<int>& referencePcs,
                  int keyPc,
                  ontology::Mode mode,
                  int chromaticRootPc = -1);

// dom7 a fifth above the target (resolves into it).
RelatedChord secondaryDominant(int targetRootPc);
// dom7 a tritone away from the given dominant.
RelatedChord tritoneSubstitution(int dominantRootPc);

// Borrowed diatonic sevenths from the parallel mode: the major-type modes
// (lydian, ionian, mixolydian) borrow from aeolian, the others from ionian.
// One entry per degree whose interval differs.
QVector<RelatedChord> modalInterchange(const ontology::ChordModel& model, int keyPc, ontology::Mode mode);

// +M3 maj7, +m6 maj7, +m3 maj7, +M6 min7.
QVector<RelatedChord> chromaticMediants(int rootPc);

struct NeoRiemannianSet {
    RelatedChord parallel;
    RelatedChord relative;
    RelatedChord leadingTone;
};

// Major-like families (major, dominant, augmented, sus) flip to minor sevenths,
// minor-like families (minor, diminished) to major sevenths.
bool isMajorLike(ontology::QualityFamily family);
NeoRiemannianSet neoRiemannian(const ontology::ChordModel& model, int rootPc, ontology::Quality quality);

} // namespace chordfield::theory
