#pragma once

#include <QJsonObject>
#include <QString>
#include <QVector>

#include "chordfield/ontology/ChordModel.h"

namespace chordfield::theory {

// Context-pad groups: where to land, same energy in a different shade,
// build expectation, jump across the circle.
enum class Quadrant {
    Resolve = 0,
    Color,
    Tension,
    Portal,
};

QString quadrantKey(Quadrant q);

struct ContextChord {
    int rootPc = 0;
    ontology::Quality quality = ontology::Quality::Dom7;
    QString qualityKey;
    Quadrant quadrant = Quadrant::Resolve;
    QString role;  // e.g. "deceptive", "tritone_sub", "coltrane_up"
    QString label; // chord name

    QJsonObject toJsonObject() const;
};

struct Suggestion {
    int rootPc = 0;
    ontology::Quality quality = ontology::Quality::Maj7;
    QString qualityKey;
    QString kind;  // "resolution", "modal_interchange", "chromatic_mediant", "tritone_sub", ...
    QString label;

    QJsonObject toJsonObject() const;
};

struct Suggestions {
    Suggestion safe;
    Suggestion color;
    Suggestion surprise;

    QJsonObject toJsonObject() const;
};

// One of the twelve circle-of-fifths pads.
struct RingChord {
    int index = 0;
    int rootPc = 0;
    ontology::Quality quality = ontology::Quality::Dom7;
    QString qualityKey;
    QString label;
    bool diatonic = false;

    QJsonObject toJsonObject() const;
};

// Deterministic next-chord ideas around the chord that is currently sounding.
class ChordSuggester {
public:
    static constexpr int kContextChordCount = 16;

    explicit ChordSuggester(const ontology::ChordModel& model);

    // Safe (functional resolution), color (borrowed / mediant) and surprise
    // (tritone sub / secondary dominant). Recent roots are avoided for variety.
    Suggestions computeSuggestions(int rootPc,
                                   ontology::Quality quality,
                                   int keyPc,
                                   ontology::Mode mode,
                                   const QVector<int>& recentRoots = {}) const;

    // Always exactly 16 entries: 4 resolve, 4 color, 4 tension, 4 portal.
    QVector<ContextChord> computeContextChords(int rootPc,
                                               ontology::Quality quality,
                                               int keyPc,
                                               ontology::Mode mode) const;

    RingChord innerRingChord(int index, int keyPc, ontology::Mode mode) const;

private:
    // Strongest functional move from rootPc; `fromTonic` is where the tonic goes.
    void resolution(int rootPc, int keyPc, ontology::Mode mode, int fromTonicDegree,
                    int& rootOut, ontology::Quality& qualityOut) const;

    Suggestion makeSuggestion(int rootPc, ontology::Quality quality, const QString& kind) const;
    ContextChord makeContext(int rootPc, ontology::Quality quality, Quadrant quadrant, const QString& role) const;

    const ontology::ChordModel& m_model;
};

} // namespace chordfield::theory
