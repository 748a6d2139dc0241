#include "chordfield/ontology/HarmonicTables.h"

#include <utility>

namespace chordfield::ontology {

HarmonicTables HarmonicTables::builtins() {
    HarmonicTables t;

    using Q = Quality;
    using F = QualityFamily;

    // --- Modes (brightest -> darkest) ---
    auto addMode = [&](Mode m, QString key, QString name, QVector<int> iv,
                       QVector<Quality> triads, QVector<Quality> sevenths) {
        ModeDef d;
        d.mode = m;
        d.key = std::move(key);
        d.name = std::move(name);
        d.intervals = std::move(iv);
        d.triads = std::move(triads);
        d.sevenths = std::move(sevenths);
        t.m_modeIndex.insert(d.key, t.m_modes.size());
        t.m_modes.push_back(d);
    };

    addMode(Mode::Lydian, "lydian", "Lydian", {0, 2, 4, 6, 7, 9, 11},
            {Q::Maj, Q::Maj, Q::Min, Q::Dim, Q::Maj, Q::Min, Q::Min},
            {Q::Maj7, Q::Dom7, Q::Min7, Q::HalfDim7, Q::Maj7, Q::Min7, Q::Min7});
    addMode(Mode::Ionian, "ionian", "Major (Ionian)", {0, 2, 4, 5, 7, 9, 11},
            {Q::Maj, Q::Min, Q::Min, Q::Maj, Q::Maj, Q::Min, Q::Dim},
            {Q::Maj7, Q::Min7, Q::Min7, Q::Maj7, Q::Dom7, Q::Min7, Q::HalfDim7});
    addMode(Mode::Mixolydian, "mixolydian", "Mixolydian", {0, 2, 4, 5, 7, 9, 10},
            {Q::Maj, Q::Min, Q::Dim, Q::Maj, Q::Min, Q::Min, Q::Maj},
            {Q::Dom7, Q::Min7, Q::HalfDim7, Q::Maj7, Q::Min7, Q::Min7, Q::Maj7});
    addMode(Mode::Dorian, "dorian", "Dorian", {0, 2, 3, 5, 7, 9, 10},
            {Q::Min, Q::Min, Q::Maj, Q::Maj, Q::Min, Q::Dim, Q::Maj},
            {Q::Min7, Q::Min7, Q::Maj7, Q::Dom7, Q::Min7, Q::HalfDim7, Q::Maj7});
    addMode(Mode::Aeolian, "aeolian", "Minor (Aeolian)", {0, 2, 3, 5, 7, 8, 10},
            {Q::Min, Q::Dim, Q::Maj, Q::Min, Q::Min, Q::Maj, Q::Maj},
            {Q::Min7, Q::HalfDim7, Q::Maj7, Q::Min7, Q::Min7, Q::Maj7, Q::Dom7});
    addMode(Mode::Phrygian, "phrygian", "Phrygian", {0, 1, 3, 5, 7, 8, 10},
            {Q::Min, Q::Maj, Q::Maj, Q::Min, Q::Dim, Q::Maj, Q::Min},
            {Q::Min7, Q::Maj7, Q::Dom7, Q::Min7, Q::HalfDim7, Q::Maj7, Q::Min7});
    addMode(Mode::Locrian, "locrian", "Locrian", {0, 1, 3, 5, 6, 8, 10},
            {Q::Dim, Q::Maj, Q::Min, Q::Min, Q::Maj, Q::Maj, Q::Min},
            {Q::HalfDim7, Q::Maj7, Q::Min7, Q::Min7, Q::Maj7, Q::Dom7, Q::Min7});

    // --- Qualities (enum order) ---
    auto addQuality = [&](Quality q, QString key, QString suffix, QString romanSuffix,
                          QVector<int> iv, QualityFamily family, Quality triad, bool minorNumeral) {
        QualityDef d;
        d.quality = q;
        d.key = std::move(key);
        d.suffix = std::move(suffix);
        d.romanSuffix = std::move(romanSuffix);
        d.intervals = std::move(iv);
        d.family = family;
        d.triad = triad;
        d.minorNumeral = minorNumeral;
        t.m_qualityIndex.insert(d.key, t.m_qualities.size());
        t.m_qualities.push_back(d);
    };

    addQuality(Q::Maj, "maj", "", "", {0, 4, 7}, F::Major, Q::Maj, false);
    addQuality(Q::Min, "min", "m", "", {0, 3, 7}, F::Minor, Q::Min, true);
    addQuality(Q::Dim, "dim", "°", "°", {0, 3, 6}, F::Diminished, Q::Dim, true);
    addQuality(Q::Aug, "aug", "+", "+", {0, 4, 8}, F::Augmented, Q::Aug, false);
    addQuality(Q::Sus2, "sus2", "sus2", "sus2", {0, 2, 7}, F::Sus, Q::Sus2, false);
    addQuality(Q::Sus4, "sus4", "sus4", "sus4", {0, 5, 7}, F::Sus, Q::Sus4, false);

    addQuality(Q::Maj7, "maj7", "maj7", "Δ7", {0, 4, 7, 11}, F::Major, Q::Maj, false);
    addQuality(Q::Min7, "min7", "m7", "7", {0, 3, 7, 10}, F::Minor, Q::Min, true);
    addQuality(Q::Dom7, "dom7", "7", "7", {0, 4, 7, 10}, F::Dominant, Q::Maj, false);
    addQuality(Q::HalfDim7, "halfdim7", "ø7", "ø7", {0, 3, 6, 10}, F::Diminished, Q::Dim, true);
    addQuality(Q::Dim7, "dim7", "°7", "°7", {0, 3, 6, 9}, F::Diminished, Q::Dim, true);
    addQuality(Q::MinMaj7, "minmaj7", "mΔ7", "Δ7", {0, 3, 7, 11}, F::Minor, Q::Min, true);
    addQuality(Q::AugMaj7, "augmaj7", "+Δ7", "+Δ7", {0, 4, 8, 11}, F::Major, Q::Aug, false);

    addQuality(Q::Maj9, "maj9", "maj9", "Δ9", {0, 4, 7, 11, 14}, F::Major, Q::Maj, false);
    addQuality(Q::Min9, "min9", "m9", "9", {0, 3, 7, 10, 14}, F::Minor, Q::Min, true);
    addQuality(Q::Dom9, "dom9", "9", "9", {0, 4, 7, 10, 14}, F::Dominant, Q::Maj, false);
    addQuality(Q::Min9b5, "min9b5", "ø9", "ø9", {0, 3, 6, 10, 14}, F::Minor, Q::Dim, true);

    addQuality(Q::Maj11, "maj11", "maj11", "Δ11", {0, 4, 7, 11, 14, 17}, F::Major, Q::Maj, false);
    addQuality(Q::Min11, "min11", "m11", "11", {0, 3, 7, 10, 14, 17}, F::Minor, Q::Min, true);
    // No 3rd.
    addQuality(Q::Dom11, "dom11", "11", "11", {0, 7, 10, 14, 17}, F::Dominant, Q::Sus4, false);

    addQuality(Q::Maj13, "maj13", "maj13", "Δ13", {0, 4, 7, 11, 14, 21}, F::Major, Q::Maj, false);
    addQuality(Q::Min13, "min13", "m13", "13", {0, 3, 7, 10, 14, 21}, F::Minor, Q::Min, true);
    addQuality(Q::Dom13, "dom13", "13", "13", {0, 4, 7, 10, 14, 21}, F::Dominant, Q::Maj, false);

    addQuality(Q::Dom7Alt, "dom7alt", "7alt", "7alt", {0, 4, 6, 10, 13, 15}, F::Dominant, Q::Maj, false);
    addQuality(Q::Dom7b9, "dom7b9", "7♭9", "7♭9", {0, 4, 7, 10, 13}, F::Dominant, Q::Maj, false);
    addQuality(Q::Dom7Sharp9, "dom7sharp9", "7♯9", "7♯9", {0, 4, 7, 10, 15}, F::Dominant, Q::Maj, false);
    addQuality(Q::Dom7b5, "dom7b5", "7♭5", "7♭5", {0, 4, 6, 10}, F::Dominant, Q::Maj, false);
    addQuality(Q::Dom7Sharp5, "dom7sharp5", "7♯5", "7♯5", {0, 4, 8, 10}, F::Dominant, Q::Maj, false);
    addQuality(Q::Dom7Sharp11, "dom7sharp11", "7♯11", "7♯11", {0, 4, 7, 10, 14, 18}, F::Dominant, Q::Maj, false);

    // --- Voicing types ---
    auto addVoicing = [&](VoicingType v, QString key, QString name) {
        VoicingTypeDef d;
        d.type = v;
        d.key = std::move(key);
        d.name = std::move(name);
        t.m_voicingIndex.insert(d.key, t.m_voicings.size());
        t.m_voicings.push_back(d);
    };

    addVoicing(VoicingType::Close, "close", "Close");
    addVoicing(VoicingType::Drop2, "drop2", "Drop 2");
    addVoicing(VoicingType::Drop3, "drop3", "Drop 3");
    addVoicing(VoicingType::Open, "open", "Open");
    addVoicing(VoicingType::RootlessA, "rootlessA", "Rootless A");
    addVoicing(VoicingType::RootlessB, "rootlessB", "Rootless B");
    addVoicing(VoicingType::Quartal, "quartal", "Quartal");
    addVoicing(VoicingType::Triad, "triad", "Triad");

    return t;
}

const ModeDef* HarmonicTables::mode(Mode m) const {
    const int i = int(m);
    return (i >= 0 && i < m_modes.size()) ? &m_modes[i] : nullptr;
}

const QualityDef* HarmonicTables::quality(Quality q) const {
    const int i = int(q);
    return (i >= 0 && i < m_qualities.size()) ? &m_qualities[i] : nullptr;
}

const VoicingTypeDef* HarmonicTables::voicing(VoicingType v) const {
    const int i = int(v);
    return (i >= 0 && i < m_voicings.size()) ? &m_voicings[i] : nullptr;
}

const ModeDef* HarmonicTables::modeForKey(const QString& key) const {
    const int i = m_modeIndex.value(key.trimmed().toLower(), -1);
    return (i >= 0) ? &m_modes[i] : nullptr;
}

const QualityDef* HarmonicTables::qualityForKey(const QString& key) const {
    const int i = m_qualityIndex.value(key.trimmed(), -1);
    return (i >= 0) ? &m_qualities[i] : nullptr;
}

const VoicingTypeDef* HarmonicTables::voicingForKey(const QString& key) const {
    const int i = m_voicingIndex.value(key.trimmed(), -1);
    return (i >= 0) ? &m_voicings[i] : nullptr;
}

QVector<const ModeDef*> HarmonicTables::allModes() const {
    QVector<const ModeDef*> out;
    out.reserve(m_modes.size());
    for (const auto& m : m_modes) out.push_back(&m);
    return out;
}

QVector<const QualityDef*> HarmonicTables::allQualities() const {
    QVector<const QualityDef*> out;
    out.reserve(m_qualities.size());
    for (const auto& q : m_qualities) out.push_back(&q);
    return out;
}

QVector<const VoicingTypeDef*> HarmonicTables::allVoicings() const {
    QVector<const VoicingTypeDef*> out;
    out.reserve(m_voicings.size());
    for (const auto& v : m_voicings) out.push_back(&v);
    return out;
}

QString HarmonicTables::qualityKey(Quality q) const {
    const QualityDef* d = quality(q);
    return d ? d->key : QString();
}

QualityFamily HarmonicTables::family(Quality q) const {
    const QualityDef* d = quality(q);
    return d ? d->family : QualityFamily::Major;
}

QString familyKey(QualityFamily f) {
    switch (f) {
    case QualityFamily::Major: return "major";
    case QualityFamily::Minor: return "minor";
    case QualityFamily::Dominant: return "dominant";
    case QualityFamily::Diminished: return "diminished";
    case QualityFamily::Augmented: return "augmented";
    case QualityFamily::Sus: return "sus";
    }
    return "major";
}

QString modifierKey(QualityModifier m) {
    switch (m) {
    case QualityModifier::Seventh: return "7th";
    case QualityModifier::Ninth: return "9th";
    case QualityModifier::Eleventh: return "11th";
    case QualityModifier::Thirteenth: return "13th";
    case QualityModifier::Sus4: return "sus4";
    case QualityModifier::Add9: return "add9";
    case QualityModifier::SixNine: return "69";
    case QualityModifier::Triad: return "triad";
    }
    return "7th";
}

bool modifierForKey(const QString& key, QualityModifier& out) {
    const QString k = key.trimmed().toLower();
    for (int i = 0; i < kQualityModifierCount; ++i) {
        const auto m = QualityModifier(i);
        if (modifierKey(m) == k) {
            out = m;
            return true;
        }
    }
    return false;
}

} // namespace chordfield::ontology
