#include <QCoreApplication>

#include <gtest/gtest.h>

// The SQLite driver is a plugin and needs an application instance to load.
int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
