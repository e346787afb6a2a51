#pragma once

#include <QKeyCombination>
#include <QKeySequence>
#include <QList>
#include <QLoggingCategory>
#include <QMap>
#include <QObject>
#include <QStringList>

class QKeyEvent;
class QSettings;

Q_DECLARE_LOGGING_CATEGORY(cutlineInput)

namespace cutline {

// Timeline action identifiers (also the QSettings keys)
namespace shortcut_ids {
static const char* const TogglePlay = "toggle_play";
static const char* const StepBack = "step_back";
static const char* const StepForward = "step_forward";
static const char* const StepBackLarge = "step_back_large";
static const char* const StepForwardLarge = "step_forward_large";
static const char* const GoToStart = "go_to_start";
static const char* const GoToEnd = "go_to_end";
static const char* const MarkIn = "mark_in";
static const char* const MarkOut = "mark_out";
static const char* const ClearMarks = "clear_marks";
static const char* const Split = "split";
static const char* const SplitAtMarks = "split_at_marks";
static const char* const Delete = "delete";
static const char* const RippleDelete = "ripple_delete";
static const char* const Undo = "undo";
static const char* const Redo = "redo";
static const char* const ZoomIn = "zoom_in";
static const char* const ZoomOut = "zoom_out";
} // namespace shortcut_ids

/**
 * Rebindable keyboard shortcuts for the timeline
 *
 * Features:
 * - Several key sequences per action (Delete and Backspace both delete)
 * - Conflict detection: a key belongs to at most one action
 * - Persistence through QSettings; unreadable or conflicting stored
 *   bindings fall back to the defaults
 *
 * Only single-chord sequences are bound; matching happens against key
 * events delivered to the timeline widget, so no QShortcut objects exist.
 */
class KeyboardShortcuts : public QObject
{
    Q_OBJECT

public:
    struct ShortcutInfo {
        QString id;
        QString description;
        QList<QKeySequence> keySequences;
        bool customizable = true;
    };

    explicit KeyboardShortcuts(QObject* parent = nullptr);

    // Shortcut registration
    void registerShortcut(const QString& id, const QString& description,
                          const QList<QKeySequence>& keySequences, bool customizable = true);

    // Shortcut management
    bool setShortcut(const QString& id, const QList<QKeySequence>& keySequences);
    bool setShortcut(const QString& id, const QKeySequence& keySequence) {
        return setShortcut(id, QList<QKeySequence>{keySequence});
    }
    QList<QKeySequence> shortcut(const QString& id) const;
    ShortcutInfo shortcutInfo(const QString& id) const { return m_shortcuts.value(id); }
    QStringList shortcutIds() const { return m_shortcuts.keys(); }

    // Conflict detection
    QStringList conflictingShortcuts(const QKeySequence& sequence) const;
    bool hasConflict(const QString& id, const QKeySequence& sequence) const;

    // Key event lookup; empty string when nothing is bound
    QString actionFor(const QKeyEvent* event) const;
    QString actionFor(QKeyCombination combination) const;

    // Persistence
    void saveShortcuts(QSettings& settings) const;
    void loadShortcuts(QSettings& settings);
    void resetToDefaults();

signals:
    void shortcutChanged(const QString& id);

private:
    void setupDefaultShortcuts();
    static QKeyCombination normalized(QKeyCombination combination);

    QMap<QString, ShortcutInfo> m_shortcuts;
    QString m_settingsGroup = "keyboard_shortcuts";
};

} // namespace cutline
