#ifndef DEVIATIONNOTE_H
#define DEVIATIONNOTE_H

#include <QString>
#include <QStringList>

/**
 * @brief Structured note ("deviation") attached to a node.
 *
 * Content is edited by external forms; the engine only counts notes.
 */
struct DeviationNote {
    QString deviation;
    QStringList causes;
    QString consequence;
    QStringList safeguards;
    QStringList recommendations;
    QString comments;
    bool minimized = false;

    bool operator==(const DeviationNote& other) const
    {
        return deviation == other.deviation
            && causes == other.causes
            && consequence == other.consequence
            && safeguards == other.safeguards
            && recommendations == other.recommendations
            && comments == other.comments
            && minimized == other.minimized;
    }
    bool operator!=(const DeviationNote& other) const { return !(*this == other); }
};

#endif // DEVIATIONNOTE_H
