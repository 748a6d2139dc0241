#include "chordfield/theory/ModulationDetector.h"

#include "chordfield/util/Pitch.h"

namespace chordfield::theory {

using ontology::Mode;
using ontology::Quality;
using ontology::QualityFamily;
using util::normalizePc;

QJsonObject ModulationResult::toJsonObject() const {
    QJsonObject o;
    o.insert("detected", detected);
    if (!detected) return o;
    o.insert("new_key", newKeyPc);
    o.insert("confidence", confidenceKey(confidence));
    o.insert("mode", modeKey);
    if (!evidence.isEmpty()) o.insert("evidence", evidence);
    return o;
}

QString confidenceKey(ModulationConfidence c) {
    return (c == ModulationConfidence::Strong) ? QString("strong") : QString("moderate");
}

ModulationDetector::ModulationDetector(const ontology::ChordModel& model)
    : m_model(model) {}

bool ModulationDetector::isDominantQuality(Quality quality) const {
    return m_model.tables().family(quality) == QualityFamily::Dominant;
}

bool ModulationDetector::isPredominantInKey(int rootPc, Quality quality, int targetKeyPc) const {
    const QualityFamily family = m_model.tables().family(quality);
    rootPc = normalizePc(rootPc);

    for (const ontology::ModeDef* m : m_model.tables().allModes()) {
        const int iiRoot = normalizePc(targetKeyPc + m->intervals[1]);
        const QualityFamily iiFamily = m_model.tables().family(m->triads[1]);
        if (rootPc == iiRoot && (family == QualityFamily::Minor || family == iiFamily)) return true;

        const int ivRoot = normalizePc(targetKeyPc + m->intervals[3]);
        const QualityFamily ivFamily = m_model.tables().family(m->triads[3]);
        if (rootPc == ivRoot && (family == QualityFamily::Major || family == ivFamily)) return true;
    }
    return false;
}

ModulationResult ModulationDetector::detect(int prevRootPc, Quality prevQuality,
                                            int currentRootPc, Quality currentQuality,
                                            int currentKeyPc, Mode mode) const {
    ModulationResult r;
    if (!isDominantQuality(currentQuality)) return r;

    const int targetKey = normalizePc(currentRootPc + 5);
    if (targetKey == normalizePc(currentKeyPc)) return r;
    if (!isPredominantInKey(prevRootPc, prevQuality, targetKey)) return r;

    const ontology::ModeDef* m = m_model.tables().mode(mode);
    const int iiRoot = normalizePc(targetKey + (m ? m->intervals[1] : 2));

    r.detected = true;
    r.newKeyPc = targetKey;
    r.confidence = (normalizePc(prevRootPc) == iiRoot) ? ModulationConfidence::Strong : ModulationConfidence::Moderate;
    r.mode = mode;
    r.modeKey = m ? m->key : QString();
    r.evidence = QString("%1 -> %2 (%3-V of %4)")
                     .arg(m_model.chordName(prevRootPc, prevQuality),
                          m_model.chordName(currentRootPc, currentQuality),
                          r.confidence == ModulationConfidence::Strong ? QString("ii") : QString("IV"),
                          m_model.keyName(targetKey));
    return r;
}

} // namespace chordfield::theory
