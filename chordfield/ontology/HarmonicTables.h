#pragma once

#include <QHash>
#include <QString>
#include <QVector>

namespace chordfield::ontology {

// Ordered brightest -> darkest; adjacent modes differ by one scale tone.
enum class Mode {
    Lydian = 0,
    Ionian,
    Mixolydian,
    Dorian,
    Aeolian,
    Phrygian,
    Locrian,
};
constexpr int kModeCount = 7;

enum class Quality {
    Maj = 0,
    Min,
    Dim,
    Aug,
    Sus2,
    Sus4,
    Maj7,
    Min7,
    Dom7,
    HalfDim7,
    Dim7,
    MinMaj7,
    AugMaj7,
    Maj9,
    Min9,
    Dom9,
    Min9b5,
    Maj11,
    Min11,
    Dom11,
    Maj13,
    Min13,
    Dom13,
    Dom7Alt,
    Dom7b9,
    Dom7Sharp9,
    Dom7b5,
    Dom7Sharp5,
    Dom7Sharp11,
};
constexpr int kQualityCount = 29;

enum class QualityFamily {
    Major = 0,
    Minor,
    Dominant,
    Diminished,
    Augmented,
    Sus,
};

enum class VoicingType {
    Close = 0,
    Drop2,
    Drop3,
    Open,
    RootlessA,
    RootlessB,
    Quartal,
    Triad,
};
constexpr int kVoicingTypeCount = 8;

// The quality "ring": upgrades applied to a grid chord's base quality.
enum class QualityModifier {
    Seventh = 0,
    Ninth,
    Eleventh,
    Thirteenth,
    Sus4,
    Add9,
    SixNine,
    Triad,
};
constexpr int kQualityModifierCount = 8;

struct QualityDef {
    Quality quality{};
    QString key;            // stable id, e.g. "halfdim7"
    QString suffix;         // chord-name suffix, e.g. "ø7"
    QString romanSuffix;    // roman-label suffix, e.g. "Δ7"
    QVector<int> intervals; // semitone offsets from root, template order
    QualityFamily family{};
    Quality triad{};        // reduction used by triad voicings
    bool minorNumeral = false;
};

struct ModeDef {
    Mode mode{};
    QString key;               // "ionian"
    QString name;              // "Major (Ionian)"
    QVector<int> intervals;    // 7 scale offsets from tonic
    QVector<Quality> triads;   // diatonic triad per degree
    QVector<Quality> sevenths; // diatonic seventh per degree
};

struct VoicingTypeDef {
    VoicingType type{};
    QString key;  // "drop2"
    QString name; // "Drop 2"
};

// Immutable chord/mode/voicing tables.
class HarmonicTables {
public:
    static HarmonicTables builtins();

    const ModeDef* mode(Mode m) const;
    const QualityDef* quality(Quality q) const;
    const VoicingTypeDef* voicing(VoicingType v) const;

    // Lookups by stable key; nullptr when unknown.
    const ModeDef* modeForKey(const QString& key) const;
    const QualityDef* qualityForKey(const QString& key) const;
    const VoicingTypeDef* voicingForKey(const QString& key) const;

    QVector<const ModeDef*> allModes() const;
    QVector<const QualityDef*> allQualities() const;
    QVector<const VoicingTypeDef*> allVoicings() const;

    QString qualityKey(Quality q) const;
    QualityFamily family(Quality q) const;

private:
    QVector<ModeDef> m_modes;
    QVector<QualityDef> m_qualities;
    QVector<VoicingTypeDef> m_voicings;
    QHash<QString, int> m_modeIndex;
    QHash<QString, int> m_qualityIndex;
    QHash<QString, int> m_voicingIndex;
};

QString familyKey(QualityFamily f);
QString modifierKey(QualityModifier m);
bool modifierForKey(const QString& key, QualityModifier& out);

} // namespace chordfield::ontology
