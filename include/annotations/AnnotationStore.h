#ifndef ANNOTATIONSTORE_H
#define ANNOTATIONSTORE_H

#include <QObject>
#include <QString>
#include <QVector>
#include <memory>
#include <vector>

#include "annotations/NodeAnnotation.h"

/**
 * @brief Owner of every node in an analysis, indexed by page.
 *
 * The store is the only owner of node lifetime. Other components keep node
 * ids and observe annotationRemoved()/cleared() to drop them.
 */
class AnnotationStore : public QObject
{
    Q_OBJECT

public:
    explicit AnnotationStore(QObject* parent = nullptr);
    ~AnnotationStore() override;

    // Takes ownership and assigns a fresh id. Returns the stored node.
    NodeAnnotation* add(std::unique_ptr<NodeAnnotation> annotation);
    NodeAnnotation* create(int page, const NodeStyle& style = NodeStyle());
    bool remove(int id);
    void clear();

    NodeAnnotation* find(int id);
    const NodeAnnotation* find(int id) const;
    bool contains(int id) const { return find(id) != nullptr; }

    // Insertion order
    QVector<NodeAnnotation*> listForPage(int page) const;
    QVector<NodeAnnotation*> all() const;
    int count() const { return static_cast<int>(m_items.size()); }
    bool isEmpty() const { return m_items.empty(); }
    int noteCount() const;

    // "Line N" where N follows the current node count
    QString nextDefaultName() const;

    // Call after mutating a node in place so observers can repaint
    void notifyChanged(int id);

signals:
    void annotationAdded(int id);
    void annotationRemoved(int id);
    void annotationChanged(int id);
    void cleared();

private:
    std::vector<std::unique_ptr<NodeAnnotation>> m_items;
    int m_nextId = 1;
};

#endif // ANNOTATIONSTORE_H
