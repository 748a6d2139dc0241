#include "chordfield/engine/ChordFieldEngine.h"

#include <utility>

namespace chordfield::engine {

ChordFieldEngine::ChordFieldEngine(voicing::VoicingProfile profile)
    : m_tables(ontology::HarmonicTables::builtins())
    , m_model(m_tables)
    , m_voicer(m_model, std::move(profile))
    , m_suggester(m_model)
    , m_detector(m_model) {}

voicing::Voicing ChordFieldEngine::voiceChord(int rootPc, ontology::Quality quality, ontology::VoicingType type,
                                              const voicing::Voicing& prev, int octaveOffset, int prevRootPc) const {
    return m_voicer.voiceChord(rootPc, quality, type, prev, octaveOffset, prevRootPc);
}

voicing::Voicing ChordFieldEngine::voiceChord(int rootPc, const QString& qualityKey, const QString& voicingKey,
                                              const voicing::Voicing& prev, int octaveOffset, int prevRootPc) const {
    return m_voicer.voiceChord(rootPc, qualityKey, voicingKey, prev, octaveOffset, prevRootPc);
}

ontology::ChordDescriptor ChordFieldEngine::gridChord(int row, int column, int keyPc, ontology::Mode mode,
                                                      int chromaticRootPc) const {
    return m_model.gridChord(row, column, keyPc, mode, chromaticRootPc);
}

theory::GlowGrid ChordFieldEngine::glowGrid(const QVector<int>& referencePcs, int keyPc, ontology::Mode mode,
                                            int chromaticRootPc) const {
    return theory::glowGrid(m_model, referencePcs, keyPc, mode, chromaticRootPc);
}

theory::Suggestions ChordFieldEngine::computeSuggestions(int rootPc, ontology::Quality quality, int keyPc,
                                                         ontology::Mode mode, const QVector<int>& recentRoots) const {
    return m_suggester.computeSuggestions(rootPc, quality, keyPc, mode, recentRoots);
}

QVector<theory::ContextChord> ChordFieldEngine::computeContextChords(int rootPc, ontology::Quality quality,
                                                                     int keyPc, ontology::Mode mode) const {
    return m_suggester.computeContextChords(rootPc, quality, keyPc, mode);
}

theory::RingChord ChordFieldEngine::innerRingChord(int index, int keyPc, ontology::Mode mode) const {
    return m_suggester.innerRingChord(index, keyPc, mode);
}

theory::ModulationResult ChordFieldEngine::detectModulation(int prevRootPc, ontology::Quality prevQuality,
                                                            int currentRootPc, ontology::Quality currentQuality,
                                                            int currentKeyPc, ontology::Mode mode) const {
    return m_detector.detect(prevRootPc, prevQuality, currentRootPc, currentQuality, currentKeyPc, mode);
}

} // namespace chordfield::engine
