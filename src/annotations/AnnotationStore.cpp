#include "annotations/AnnotationStore.h"

#include <QDebug>
#include <algorithm>

AnnotationStore::AnnotationStore(QObject* parent)
    : QObject(parent)
{
}

AnnotationStore::~AnnotationStore() = default;

NodeAnnotation* AnnotationStore::add(std::unique_ptr<NodeAnnotation> annotation)
{
    if (!annotation) {
        qWarning() << "AnnotationStore: Ignoring null annotation";
        return nullptr;
    }

    annotation->m_id = m_nextId++;
    NodeAnnotation* stored = annotation.get();
    m_items.push_back(std::move(annotation));
    emit annotationAdded(stored->id());
    return stored;
}

NodeAnnotation* AnnotationStore::create(int page, const NodeStyle& style)
{
    auto annotation = std::make_unique<NodeAnnotation>(page, style);
    annotation->setName(nextDefaultName());
    return add(std::move(annotation));
}

bool AnnotationStore::remove(int id)
{
    auto it = std::find_if(m_items.begin(), m_items.end(),
        [id](const std::unique_ptr<NodeAnnotation>& item) { return item->id() == id; });
    if (it == m_items.end()) {
        return false;
    }

    m_items.erase(it);
    emit annotationRemoved(id);
    return true;
}

void AnnotationStore::clear()
{
    if (m_items.empty()) {
        return;
    }
    m_items.clear();
    emit cleared();
}

NodeAnnotation* AnnotationStore::find(int id)
{
    for (auto& item : m_items) {
        if (item->id() == id) {
            return item.get();
        }
    }
    return nullptr;
}

const NodeAnnotation* AnnotationStore::find(int id) const
{
    for (const auto& item : m_items) {
        if (item->id() == id) {
            return item.get();
        }
    }
    return nullptr;
}

QVector<NodeAnnotation*> AnnotationStore::listForPage(int page) const
{
    QVector<NodeAnnotation*> result;
    for (const auto& item : m_items) {
        if (item->page() == page) {
            result.append(item.get());
        }
    }
    return result;
}

QVector<NodeAnnotation*> AnnotationStore::all() const
{
    QVector<NodeAnnotation*> result;
    result.reserve(static_cast<int>(m_items.size()));
    for (const auto& item : m_items) {
        result.append(item.get());
    }
    return result;
}

int AnnotationStore::noteCount() const
{
    int total = 0;
    for (const auto& item : m_items) {
        total += item->noteCount();
    }
    return total;
}

QString AnnotationStore::nextDefaultName() const
{
    return QStringLiteral("Line %1").arg(count() + 1);
}

void AnnotationStore::notifyChanged(int id)
{
    if (contains(id)) {
        emit annotationChanged(id);
    }
}
