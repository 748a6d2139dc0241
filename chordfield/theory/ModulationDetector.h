#pragma once

#include <QJsonObject>
#include <QString>

#include "chordfield/ontology/ChordModel.h"

namespace chordfield::theory {

enum class ModulationConfidence {
    Moderate = 0, // IV-V
    Strong,       // ii-V
};

struct ModulationResult {
    bool detected = false;
    int newKeyPc = -1;
    ModulationConfidence confidence = ModulationConfidence::Moderate;
    ontology::Mode mode = ontology::Mode::Ionian; // mode to continue in
    QString modeKey;
    QString evidence;                             // e.g. "Am7 -> D7 (ii-V of G)"

    QJsonObject toJsonObject() const;
};

QString confidenceKey(ModulationConfidence c);

// Detects a predominant -> dominant pair pointing at a key other than the current one:
//  - the current chord must be dominant-family,
//  - its resolution (root + P4) must differ from currentKeyPc,
//  - the previous chord must be ii or IV of that key in some mode.
class ModulationDetector {
public:
    explicit ModulationDetector(const ontology::ChordModel& model);

    ModulationResult detect(int prevRootPc,
                            ontology::Quality prevQuality,
                            int currentRootPc,
                            ontology::Quality currentQuality,
                            int currentKeyPc,
                            ontology::Mode mode) const;

    bool isDominantQuality(ontology::Quality quality) const;

    // ii or IV of targetKeyPc in any of the seven modes.
    bool isPredominantInKey(int rootPc, ontology::Quality quality, int targetKeyPc) const;

private:
    const ontology::ChordModel& m_model;
};

} // namespace chordfield::theory
