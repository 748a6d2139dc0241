#include "chordfield/theory/HarmonicContext.h"

#include "chordfield/util/Pitch.h"

#include <QSet>
#include <QtGlobal>

namespace chordfield::theory {
namespace {

using ontology::Mode;
using ontology::Quality;
using util::normalizePc;

static RelatedChord related(int rootPc, Quality quality, RelationKind kind, int degree = -1) {
    RelatedChord r;
    r.rootPc = normalizePc(rootPc);
    r.quality = quality;
    r.kind = kind;
    r.degree = degree;
    return r;
}

static Mode borrowSource(Mode mode) {
    switch (mode) {
    case Mode::Lydian:
    case Mode::Ionian:
    case Mode::Mixolydian:
        return Mode::Aeolian;
    default:
        return Mode::Ionian;
    }
}

} // namespace

QString relationKey(RelationKind kind) {
    switch (kind) {
    case RelationKind::SecondaryDominant: return "secondary_dominant";
    case RelationKind::TritoneSubstitution: return "tritone_sub";
    case RelationKind::ModalInterchange: return "modal_interchange";
    case RelationKind::ChromaticMediant: return "chromatic_mediant";
    case RelationKind::Parallel: return "parallel";
    case RelationKind::Relative: return "relative";
    case RelationKind::LeadingTone: return "leading_tone";
    }
    return "secondary_dominant";
}

int sharedNoteCount(const QVector<int>& a, const QVector<int>& b) {
    QSet<int> sa;
    for (int n : a) sa.insert(normalizePc(n));
    QSet<int> sb;
    for (int n : b) sb.insert(normalizePc(n));
    return int(sa.intersect(sb).size());
}

int GlowGrid::at(int row, int column) const {
    if (row < 0 || row >= 8 || column < 0 || column >= 8) return 0;
    return cells[size_t(row * 8 + column)];
}

QJsonArray GlowGrid::toJsonArray() const {
    QJsonArray rows;
    for (int r = 0; r < 8; ++r) {
        QJsonArray row;
        for (int c = 0; c < 8; ++c) row.push_back(at(r, c));
        rows.push_back(row);
    }
    return rows;
}

GlowGrid glowGrid(const ontology::ChordModel& model, const QVector<int>& referencePcs,
                  int keyPc, Mode mode, int chromaticRootPc) {
    GlowGrid g;
    if (referencePcs.isEmpty()) return g;

    const QVector<int> roots = model.columnRoots(keyPc, mode, chromaticRootPc);
    for (int row = 0; row < 8; ++row) {
        for (int col = 0; col < 8; ++col) {
            const QVector<int> pcs = model.chordPitchClasses(roots[col], model.gridQuality(row, col, mode));
            g.cells[size_t(row * 8 + col)] = qMin(GlowGrid::kMaxLevel, sharedNoteCount(referencePcs, pcs));
        }
    }
    return g;
}

RelatedChord secondaryDominant(int targetRootPc) {
    return related(targetRootPc + 7, Quality::Dom7, RelationKind::SecondaryDominant);
}

RelatedChord tritoneSubstitution(int dominantRootPc) {
    return related(dominantRootPc + 6, Quality::Dom7, RelationKind::TritoneSubstitution);
}

QVector<RelatedChord> modalInterchange(const ontology::ChordModel& model, int keyPc, Mode mode) {
    QVector<RelatedChord> out;
    const ontology::ModeDef* home = model.tables().mode(mode);
    const ontology::ModeDef* borrow = model.tables().mode(borrowSource(mode));
    if (!home || !borrow) return out;

    for (int deg = 0; deg < 7; ++deg) {
        if (borrow->intervals[deg] == home->intervals[deg]) continue;
        out.push_back(related(keyPc + borrow->intervals[deg], borrow->sevenths[deg],
                              RelationKind::ModalInterchange, deg));
    }
    return out;
}

QVector<RelatedChord> chromaticMediants(int rootPc) {
    return {
        related(rootPc + 4, Quality::Maj7, RelationKind::ChromaticMediant),
        related(rootPc + 8, Quality::Maj7, RelationKind::ChromaticMediant),
        related(rootPc + 3, Quality::Maj7, RelationKind::ChromaticMediant),
        related(rootPc + 9, Quality::Min7, RelationKind::ChromaticMediant),
    };
}

bool isMajorLike(ontology::QualityFamily family) {
    switch (family) {
    case ontology::QualityFamily::Minor:
    case ontology::QualityFamily::Diminished:
        return false;
    default:
        return true;
    }
}

NeoRiemannianSet neoRiemannian(const ontology::ChordModel& model, int rootPc, Quality quality) {
    NeoRiemannianSet s;
    if (isMajorLike(model.tables().family(quality))) {
        s.parallel = related(rootPc, Quality::Min7, RelationKind::Parallel);
        s.relative = related(rootPc + 9, Quality::Min7, RelationKind::Relative);
        s.leadingTone = related(rootPc + 4, Quality::Min7, RelationKind::LeadingTone);
    } else {
        s.parallel = related(rootPc, Quality::Maj7, RelationKind::Parallel);
        s.relative = related(rootPc + 3, Quality::Maj7, RelationKind::Relative);
        s.leadingTone = related(rootPc + 8, Quality::Maj7, RelationKind::LeadingTone);
    }
    return s;
}

} // namespace chordfield::theory
