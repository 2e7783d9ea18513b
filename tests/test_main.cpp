#include <QCoreApplication>
#include <gtest/gtest.h>

// QtSql 驱动和排队信号需要应用对象
int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("DrinkWaterTests");
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
