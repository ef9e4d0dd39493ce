/*
 * SelfieLight - Right click menu of the light surfaces
 * License: MIT
 */

#include "contextmenu.h"
#include "adjustmentdialog.h"
#include "controller.h"

#include <QActionGroup>
#include <QMenu>

ContextMenu::ContextMenu(Controller &controller, QObject *parent)
    : QObject(parent), m_controller(controller)
{
}

void ContextMenu::addStyleAction(QMenu *menu, QActionGroup *group,
                                 const QString &text, Style style) {
    auto *action = menu->addAction(text);
    action->setCheckable(true);
    action->setChecked(m_controller.style() == style);
    group->addAction(action);
    connect(action, &QAction::triggered, this, [this, style]() {
        m_controller.setStyle(style);
    });
}

void ContextMenu::populate(QMenu *menu) {
    connect(menu->addAction(tr("Adjust Brightness / Temperature...")), &QAction::triggered,
            this, &ContextMenu::showAdjustments);

    auto *styleMenu = menu->addMenu(tr("Style"));
    auto *group = new QActionGroup(styleMenu);
    group->setExclusive(true);
    addStyleAction(styleMenu, group, tr("Ring Light"), Style::Ring);
    addStyleAction(styleMenu, group, tr("Side Bars"), Style::Sides);
    addStyleAction(styleMenu, group, tr("Border"), Style::Border);
    addStyleAction(styleMenu, group, tr("Top Bar"), Style::Top);
    addStyleAction(styleMenu, group, tr("Fullscreen"), Style::Fullscreen);

    menu->addSeparator();
    connect(menu->addAction(tr("Close All")), &QAction::triggered,
            &m_controller, &Controller::closeAll);
}

void ContextMenu::popup(const QPoint &globalPos) {
    // A second right click while the menu is up lands on the menu anyway
    if (m_open) return;
    m_open = true;

    QMenu menu;
    populate(&menu);
    menu.exec(globalPos);
    m_open = false;
}

void ContextMenu::showAdjustments() {
    AdjustmentDialog dialog(m_controller);
    dialog.exec();
}
