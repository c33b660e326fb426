/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALSURFACE_H
#define TERMINALSURFACE_H

#include <QByteArray>
#include <QObject>
#include <QSize>
#include <QString>

#include <memory>

#include "termweaveprivate_export.h"

namespace Termweave
{

class RendererBackend;

/**
 * The visible terminal emulator view a session writes into.
 *
 * Implemented by the embedding application on top of its terminal
 * widget. The engine only drives it through this interface and listens
 * to its signals; escape sequence parsing and painting stay with the
 * implementation.
 *
 * Implementations must emit aboutToBeDestroyed() at the start of their
 * destructor. The accelerated renderer is released in response, while
 * the view it draws into still exists.
 */
class TERMWEAVEPRIVATE_EXPORT TerminalSurface : public QObject
{
    Q_OBJECT
public:
    explicit TerminalSurface(QObject *parent = nullptr);
    ~TerminalSurface() override;

    virtual void write(const QByteArray &data) = 0;
    virtual void clear() = 0;

    virtual int columns() const = 0;
    virtual int lines() const = 0;

    /**
     * Grid size that fits the current pixel size of the view.
     * Returns an invalid QSize while the view is not laid out.
     */
    virtual QSize proposeDimensions() const = 0;
    virtual void applyDimensions(int columns, int lines) = 0;

    // Absolute line numbers in the scrollback buffer
    virtual int cursorLine() const = 0;
    virtual int viewportTopLine() const = 0;
    virtual void scrollToCursor() = 0;

    /** Keep the rendered cursor where it is while IME composition is in progress. */
    virtual void setCursorPinned(bool pinned) = 0;

    /** Repaint every visible row. */
    virtual void repaint() = 0;

    /**
     * Attaches a GPU accelerated renderer to this surface.
     * Returns nullptr if the backend could not be created; the surface
     * keeps rendering in software in that case.
     */
    virtual std::unique_ptr<RendererBackend> createAcceleratedRenderer() = 0;

Q_SIGNALS:
    void aboutToBeDestroyed();
    void inputEntered(const QByteArray &data);
    void titleChanged(const QString &title);
    void bellRang();
    void oscReceived(int code, const QString &payload);
    void focusGained();
    void compositionStarted();
    void compositionEnded();
    void selectionDragStarted();
    void selectionDragFinished();
    void geometryChanged();
    void devicePixelRatioChanged();
};

} // namespace Termweave

#endif // TERMINALSURFACE_H
