#include <gtest/gtest.h>
#include <QCoreApplication>

// QtSql 커넥션/QThread 에 QCoreApplication 이 필요
int main(int argc, char** argv)
{
	QCoreApplication app(argc, argv);
	::testing::InitGoogleTest(&argc, argv);
	return RUN_ALL_TESTS();
}
