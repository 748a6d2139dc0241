#include "chordfield/ontology/ChordModel.h"

#include "chordfield/util/Pitch.h"

#include <QJsonArray>
#include <QtGlobal>

namespace chordfield::ontology {
namespace {

using util::normalizePc;

static const Quality kRowQualities[7] = {
    Quality::Maj7, Quality::Min7, Quality::Dom7, Quality::HalfDim7,
    Quality::Maj9, Quality::Min9, Quality::Dom9,
};

static Quality byFamily(QualityFamily f, Quality major, Quality minor, Quality dominant,
                        Quality diminished, Quality augmented, Quality sus) {
    switch (f) {
    case QualityFamily::Major: return major;
    case QualityFamily::Minor: return minor;
    case QualityFamily::Dominant: return dominant;
    case QualityFamily::Diminished: return diminished;
    case QualityFamily::Augmented: return augmented;
    case QualityFamily::Sus: return sus;
    }
    return major;
}

} // namespace

QJsonObject ChordDescriptor::toJsonObject() const {
    QJsonObject o;
    o.insert("root", rootPc);
    o.insert("quality", qualityKey);
    o.insert("family", familyKey(family));
    o.insert("name", name);
    if (!roman.isEmpty()) o.insert("roman", roman);
    if (row >= 0) o.insert("row", row);
    if (column >= 0) o.insert("column", column);
    QJsonArray pcs;
    for (int pc : pitchClasses) pcs.push_back(pc);
    o.insert("pitch_classes", pcs);
    return o;
}

ChordModel::ChordModel(const HarmonicTables& tables)
    : m_tables(tables) {}

QVector<int> ChordModel::columnRoots(int keyPc, Mode mode, int chromaticRootPc) const {
    QVector<int> roots;
    roots.reserve(kGridSize);
    const ModeDef* m = m_tables.mode(mode);
    for (int deg = 0; deg < 7; ++deg) {
        const int iv = m ? m->intervals[deg] : 0;
        roots.push_back(normalizePc(keyPc + iv));
    }
    roots.push_back(chromaticRootPc >= 0 ? normalizePc(chromaticRootPc) : normalizePc(keyPc + 1));
    return roots;
}

Quality ChordModel::row7Quality(int column, Mode mode) const {
    if (column >= kChromaticColumn) return Quality::Dom7Alt;
    const ModeDef* m = m_tables.mode(mode);
    const Quality triad = m ? m->triads[column] : Quality::Maj;
    switch (triad) {
    case Quality::Maj: return Quality::Sus2;
    case Quality::Min: return Quality::Dim7;
    case Quality::Dim: return Quality::Dom7Alt;
    default: return Quality::Sus4;
    }
}

Quality ChordModel::gridQuality(int row, int column, Mode mode) const {
    row = qBound(0, row, kGridSize - 1);
    column = qBound(0, column, kGridSize - 1);
    if (row < 7) return kRowQualities[row];
    return row7Quality(column, mode);
}

ChordDescriptor ChordModel::gridChord(int row, int column, int keyPc, Mode mode, int chromaticRootPc) const {
    row = qBound(0, row, kGridSize - 1);
    column = qBound(0, column, kGridSize - 1);

    const QVector<int> roots = columnRoots(keyPc, mode, chromaticRootPc);
    ChordDescriptor d = describe(roots[column], gridQuality(row, column, mode), keyPc, mode);
    d.row = row;
    d.column = column;
    d.roman = romanLabel(column, d.quality);
    return d;
}

ChordDescriptor ChordModel::describe(int rootPc, Quality quality, int keyPc, Mode mode) const {
    ChordDescriptor d;
    d.rootPc = normalizePc(rootPc);
    d.quality = quality;
    d.qualityKey = m_tables.qualityKey(quality);
    d.family = m_tables.family(quality);
    if (const QualityDef* q = m_tables.quality(quality)) d.intervals = q->intervals;
    d.pitchClasses = chordPitchClasses(d.rootPc, quality);
    d.name = chordName(d.rootPc, quality);

    int column = diatonicDegree(d.rootPc, keyPc, mode);
    if (column < 0 && d.rootPc == normalizePc(keyPc + 1)) column = kChromaticColumn;
    if (column >= 0) d.roman = romanLabel(column, quality);
    return d;
}

int ChordModel::diatonicDegree(int rootPc, int keyPc, Mode mode) const {
    const ModeDef* m = m_tables.mode(mode);
    if (!m) return -1;
    const int interval = normalizePc(rootPc - keyPc);
    return m->intervals.indexOf(interval);
}

Quality ChordModel::diatonicSeventh(int degree, Mode mode) const {
    const ModeDef* m = m_tables.mode(mode);
    if (!m || degree < 0 || degree >= m->sevenths.size()) return Quality::Dom7;
    return m->sevenths[degree];
}

Quality ChordModel::defaultQuality(int rootPc, int keyPc, Mode mode) const {
    const int degree = diatonicDegree(rootPc, keyPc, mode);
    return (degree >= 0) ? diatonicSeventh(degree, mode) : Quality::Dom7;
}

int ChordModel::scaleRoot(int degree, int keyPc, Mode mode) const {
    const ModeDef* m = m_tables.mode(mode);
    if (!m) return normalizePc(keyPc);
    return normalizePc(keyPc + m->intervals[((degree % 7) + 7) % 7]);
}

QVector<int> ChordModel::chordPitchClasses(int rootPc, Quality quality) const {
    QVector<int> pcs;
    const QualityDef* q = m_tables.quality(quality);
    if (!q) return pcs;
    pcs.reserve(q->intervals.size());
    for (int iv : q->intervals) pcs.push_back(normalizePc(rootPc + iv));
    return pcs;
}

QVector<int> ChordModel::chordPitchClasses(int rootPc, const QString& qualityKey) const {
    const QualityDef* q = m_tables.qualityForKey(qualityKey);
    return chordPitchClasses(rootPc, q ? q->quality : Quality::Maj);
}

QString ChordModel::chordName(int rootPc, Quality quality) const {
    const QualityDef* q = m_tables.quality(quality);
    return keyName(rootPc) + (q ? q->suffix : QString());
}

QString ChordModel::romanLabel(int column, Quality quality) const {
    static const char* kNumerals[8] = {"I", "II", "III", "IV", "V", "VI", "VII", "♭II"};
    column = qBound(0, column, kGridSize - 1);
    const QualityDef* q = m_tables.quality(quality);
    QString numeral = QString::fromUtf8(kNumerals[column]);
    if (q && q->minorNumeral) numeral = numeral.toLower();
    return numeral + (q ? q->romanSuffix : QString());
}

QString ChordModel::keyName(int pc) const {
    return util::spellPitchClass(pc, true);
}

QString ChordModel::modeLabel(Mode mode) const {
    const ModeDef* m = m_tables.mode(mode);
    return m ? m->name : QString();
}

Quality ChordModel::applyQualityModifier(Quality base, QualityModifier modifier) const {
    const QualityFamily f = m_tables.family(base);
    switch (modifier) {
    case QualityModifier::Seventh:
        return base;
    case QualityModifier::Ninth:
        return byFamily(f, Quality::Maj9, Quality::Min9, Quality::Dom9, Quality::Min9b5, Quality::Maj9, base);
    case QualityModifier::Eleventh:
        return byFamily(f, Quality::Maj11, Quality::Min11, Quality::Dom11, Quality::Min11, Quality::Maj11, base);
    case QualityModifier::Thirteenth:
        return byFamily(f, Quality::Maj13, Quality::Min13, Quality::Dom13, Quality::Min13, Quality::Maj13, base);
    case QualityModifier::Sus4:
        return byFamily(f, Quality::Sus4, Quality::Sus4, Quality::Sus4, base, base, Quality::Sus4);
    case QualityModifier::Add9:
        return byFamily(f, Quality::Maj9, Quality::Min9, Quality::Dom9, base, Quality::Maj9, base);
    case QualityModifier::SixNine:
        return byFamily(f, Quality::Maj13, Quality::Min13, Quality::Dom13, base, Quality::Maj13, base);
    case QualityModifier::Triad:
        return byFamily(f, Quality::Maj, Quality::Min, Quality::Maj, Quality::Dim, Quality::Aug, Quality::Sus4);
    }
    return base;
}

Mode ChordModel::cycleMode(Mode mode, int direction) {
    int i = int(mode);
    if (i < 0 || i >= kModeCount) return Mode::Ionian;
    if (direction > 0) i = (i + 1) % kModeCount;
    else if (direction < 0) i = (i + kModeCount - 1) % kModeCount;
    return Mode(i);
}

} // namespace chordfield::ontology
