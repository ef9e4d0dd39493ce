/*
 * SelfieLight - Right click menu of the light surfaces
 * License: MIT
 */

#pragma once

#include "layout.h"

#include <QObject>
#include <QPoint>

class Controller;
class QActionGroup;
class QMenu;

class ContextMenu : public QObject {
    Q_OBJECT
public:
    explicit ContextMenu(Controller &controller, QObject *parent = nullptr);

    // Adds the menu entries, bound to the controller's current state
    void populate(QMenu *menu);

public slots:
    void popup(const QPoint &globalPos);
    void showAdjustments();

private:
    void addStyleAction(QMenu *menu, QActionGroup *group, const QString &text, Style style);

    Controller &m_controller;
    bool m_open = false;
};
