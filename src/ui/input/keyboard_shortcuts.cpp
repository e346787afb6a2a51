#include "keyboard_shortcuts.h"

#include <QKeyEvent>
#include <QSettings>

Q_LOGGING_CATEGORY(cutlineInput, "cutline.input")

namespace cutline {

KeyboardShortcuts::KeyboardShortcuts(QObject* parent)
    : QObject(parent)
{
    setupDefaultShortcuts();

    qCDebug(cutlineInput, "Keyboard shortcuts initialized with %d actions", static_cast<int>(m_shortcuts.size()));
}

void KeyboardShortcuts::setupDefaultShortcuts()
{
    using namespace shortcut_ids;
    m_shortcuts.clear();

    // Playback and navigation
    registerShortcut(TogglePlay, "Play/Pause", {QKeySequence(Qt::Key_Space)});
    registerShortcut(StepBack, "Step Backward", {QKeySequence(Qt::Key_Left)});
    registerShortcut(StepForward, "Step Forward", {QKeySequence(Qt::Key_Right)});
    registerShortcut(StepBackLarge, "Step Backward (Large)", {QKeySequence(Qt::SHIFT | Qt::Key_Left)});
    registerShortcut(StepForwardLarge, "Step Forward (Large)", {QKeySequence(Qt::SHIFT | Qt::Key_Right)});
    registerShortcut(GoToStart, "Go to Beginning", {QKeySequence(Qt::Key_Home)});
    registerShortcut(GoToEnd, "Go to End", {QKeySequence(Qt::Key_End)});

    // Mark in/out points
    registerShortcut(MarkIn, "Mark In", {QKeySequence(Qt::Key_I)});
    registerShortcut(MarkOut, "Mark Out", {QKeySequence(Qt::Key_O)});
    registerShortcut(ClearMarks, "Clear In/Out", {QKeySequence(Qt::Key_Escape)});

    // Editing operations
    registerShortcut(Split, "Split at Playhead", {QKeySequence(Qt::Key_B)});
    registerShortcut(SplitAtMarks, "Split at In/Out", {QKeySequence(Qt::SHIFT | Qt::Key_B)});
    registerShortcut(Delete, "Delete Selected Segment",
                     {QKeySequence(Qt::Key_Delete), QKeySequence(Qt::Key_Backspace)});
    registerShortcut(RippleDelete, "Ripple Delete",
                     {QKeySequence(Qt::SHIFT | Qt::Key_Delete), QKeySequence(Qt::SHIFT | Qt::Key_Backspace)});
    registerShortcut(Undo, "Undo", {QKeySequence(Qt::CTRL | Qt::Key_Z)});
    registerShortcut(Redo, "Redo", {QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_Z), QKeySequence(Qt::CTRL | Qt::Key_Y)});

    // Zoom controls
    registerShortcut(ZoomIn, "Zoom In", {QKeySequence(Qt::Key_Plus), QKeySequence(Qt::Key_Equal)});
    registerShortcut(ZoomOut, "Zoom Out", {QKeySequence(Qt::Key_Minus)});
}

void KeyboardShortcuts::registerShortcut(const QString& id, const QString& description,
                                         const QList<QKeySequence>& keySequences, bool customizable)
{
    ShortcutInfo info;
    info.id = id;
    info.description = description;
    info.keySequences = keySequences;
    info.customizable = customizable;
    m_shortcuts[id] = info;
}

bool KeyboardShortcuts::setShortcut(const QString& id, const QList<QKeySequence>& keySequences)
{
    if (!m_shortcuts.contains(id)) {
        qCWarning(cutlineInput, "Shortcut not found: %s", qPrintable(id));
        return false;
    }

    if (!m_shortcuts[id].customizable) {
        qCWarning(cutlineInput, "Shortcut not customizable: %s", qPrintable(id));
        return false;
    }

    for (const QKeySequence& sequence : keySequences) {
        if (sequence.count() != 1) {
            qCWarning(cutlineInput, "Only single-chord shortcuts are supported: %s",
                      qPrintable(sequence.toString(QKeySequence::PortableText)));
            return false;
        }
        // Check for conflicts
        if (hasConflict(id, sequence)) {
            qCWarning(cutlineInput, "Shortcut conflict detected for: %s",
                      qPrintable(sequence.toString(QKeySequence::PortableText)));
            return false;
        }
    }

    m_shortcuts[id].keySequences = keySequences;
    qCDebug(cutlineInput, "Updated shortcut %s (%d sequences)", qPrintable(id), static_cast<int>(keySequences.size()));
    emit shortcutChanged(id);
    return true;
}

QList<QKeySequence> KeyboardShortcuts::shortcut(const QString& id) const
{
    if (m_shortcuts.contains(id)) {
        return m_shortcuts[id].keySequences;
    }
    return {};
}

QStringList KeyboardShortcuts::conflictingShortcuts(const QKeySequence& sequence) const
{
    QStringList conflicts;
    for (auto it = m_shortcuts.begin(); it != m_shortcuts.end(); ++it) {
        if (it.value().keySequences.contains(sequence)) {
            conflicts.append(it.key());
        }
    }
    return conflicts;
}

bool KeyboardShortcuts::hasConflict(const QString& id, const QKeySequence& sequence) const
{
    QStringList conflicts = conflictingShortcuts(sequence);
    conflicts.removeAll(id); // Remove self from conflicts
    return !conflicts.isEmpty();
}

QKeyCombination KeyboardShortcuts::normalized(QKeyCombination combination)
{
    Qt::KeyboardModifiers modifiers = combination.keyboardModifiers() & ~Qt::KeypadModifier;
    // '+' needs Shift on most layouts; the binding is for the symbol
    if (combination.key() == Qt::Key_Plus) {
        modifiers &= ~Qt::ShiftModifier;
    }
    return QKeyCombination(modifiers, combination.key());
}

QString KeyboardShortcuts::actionFor(const QKeyEvent* event) const
{
    if (!event) {
        return QString();
    }
    return actionFor(event->keyCombination());
}

QString KeyboardShortcuts::actionFor(QKeyCombination combination) const
{
    const QKeyCombination wanted = normalized(combination);
    for (auto it = m_shortcuts.begin(); it != m_shortcuts.end(); ++it) {
        for (const QKeySequence& sequence : it.value().keySequences) {
            if (!sequence.isEmpty() && normalized(sequence[0]) == wanted) {
                return it.key();
            }
        }
    }
    return QString();
}

void KeyboardShortcuts::saveShortcuts(QSettings& settings) const
{
    settings.beginGroup(m_settingsGroup);

    for (auto it = m_shortcuts.begin(); it != m_shortcuts.end(); ++it) {
        const ShortcutInfo& info = it.value();
        if (!info.customizable) {
            continue;
        }
        QStringList keys;
        for (const QKeySequence& sequence : info.keySequences) {
            keys.append(sequence.toString(QKeySequence::PortableText));
        }
        settings.setValue(it.key(), keys);
    }

    settings.endGroup();
    qCDebug(cutlineInput, "Shortcuts saved to settings");
}

void KeyboardShortcuts::loadShortcuts(QSettings& settings)
{
    settings.beginGroup(m_settingsGroup);

    for (const QString& id : m_shortcuts.keys()) {
        if (!settings.contains(id)) {
            continue;
        }
        QList<QKeySequence> sequences;
        bool readable = true;
        for (const QString& key : settings.value(id).toStringList()) {
            const QKeySequence sequence = QKeySequence::fromString(key, QKeySequence::PortableText);
            if (sequence.isEmpty()) {
                readable = false;
                break;
            }
            sequences.append(sequence);
        }
        if (!readable || !setShortcut(id, sequences)) {
            qCWarning(cutlineInput, "Ignoring stored shortcut for %s, keeping default", qPrintable(id));
        }
    }

    settings.endGroup();
    qCDebug(cutlineInput, "Shortcuts loaded from settings");
}

void KeyboardShortcuts::resetToDefaults()
{
    setupDefaultShortcuts();
    for (const QString& id : m_shortcuts.keys()) {
        emit shortcutChanged(id);
    }
}

} // namespace cutline
