#pragma once

#include <QJsonObject>
#include <QString>
#include <QVector>

#include "chordfield/ontology/HarmonicTables.h"

namespace chordfield::ontology {

// Fully resolved chord: what a grid cell or a suggestion refers to.
struct ChordDescriptor {
    int rootPc = 0;
    Quality quality = Quality::Maj;
    QString qualityKey;        // "min7"
    QualityFamily family = QualityFamily::Major;
    QVector<int> intervals;    // template order
    QVector<int> pitchClasses; // root first, template order
    QString name;              // "Bbmaj7"
    QString roman;             // "IVΔ7"; empty when the root is outside the key
    int row = -1;              // grid coordinates when produced by gridChord()
    int column = -1;

    QJsonObject toJsonObject() const;
};

// Grid layout, chord construction and display naming over HarmonicTables.
//
// Columns 0..6 are the diatonic degrees of the mode; column 7 is the chromatic
// column (flat-II unless overridden). Rows 0..6 are fixed qualities, row 7 is
// derived from the diatonic triad at that column.
class ChordModel {
public:
    static constexpr int kGridSize = 8;
    static constexpr int kChromaticColumn = 7;

    explicit ChordModel(const HarmonicTables& tables);

    const HarmonicTables& tables() const { return m_tables; }

    QVector<int> columnRoots(int keyPc, Mode mode, int chromaticRootPc = -1) const;
    Quality gridQuality(int row, int column, Mode mode) const;
    ChordDescriptor gridChord(int row, int column, int keyPc, Mode mode, int chromaticRootPc = -1) const;

    // Descriptor for an arbitrary chord, labelled relative to (keyPc, mode).
    ChordDescriptor describe(int rootPc, Quality quality, int keyPc, Mode mode) const;

    // 0..6 when rootPc is a scale degree of (keyPc, mode), else -1.
    int diatonicDegree(int rootPc, int keyPc, Mode mode) const;
    Quality diatonicSeventh(int degree, Mode mode) const;
    // Diatonic seventh for diatonic roots, dom7 otherwise.
    Quality defaultQuality(int rootPc, int keyPc, Mode mode) const;
    int scaleRoot(int degree, int keyPc, Mode mode) const;

    QVector<int> chordPitchClasses(int rootPc, Quality quality) const;
    // Unknown keys fall back to a plain major triad.
    QVector<int> chordPitchClasses(int rootPc, const QString& qualityKey) const;

    QString chordName(int rootPc, Quality quality) const;
    QString romanLabel(int column, Quality quality) const;
    QString keyName(int pc) const;
    QString modeLabel(Mode mode) const;

    Quality applyQualityModifier(Quality base, QualityModifier modifier) const;

    // direction < 0 steps brighter, > 0 darker; wraps around.
    static Mode cycleMode(Mode mode, int direction);

private:
    Quality row7Quality(int column, Mode mode) const;

    const HarmonicTables& m_tables;
};

} // namespace chordfield::ontology
