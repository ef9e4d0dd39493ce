/*
 * SelfieLight - Test runner for window and dialog tests
 * License: MIT
 */

#include <QApplication>

#include <gtest/gtest.h>

int main(int argc, char *argv[]) {
    ::testing::InitGoogleTest(&argc, argv);

    // Test discovery runs without the test environment
    if (!qEnvironmentVariableIsSet("QT_QPA_PLATFORM"))
        qputenv("QT_QPA_PLATFORM", "offscreen");
    QApplication app(argc, argv);

    return RUN_ALL_TESTS();
}
