/**
 * @file test_connection_manager.cpp
 * @brief Unit tests for ConnectionManager session ownership
 */

#include <gtest/gtest.h>
#include <ldapauth/connection_manager.h>
#include <ldapauth/exceptions.h>
#include "fake_directory.h"

using namespace ldapauth;
using namespace test_helpers;

class NullDialer : public IDirectoryDialer {
public:
    std::unique_ptr<IDirectoryConnection> dial(const ClientConfig&) override { return nullptr; }
};

class ConnectionManagerTest : public ::testing::Test {
protected:
    FakeDirectory directory_;
    ClientConfig config_ = makeConfig();
};

TEST_F(ConnectionManagerTest, Constructor_NullDialerThrows) {
    EXPECT_THROW(ConnectionManager(config_, nullptr), std::invalid_argument);
}

TEST_F(ConnectionManagerTest, StartsDisconnected) {
    ConnectionManager manager(config_, std::make_shared<FakeDialer>(&directory_));
    EXPECT_FALSE(manager.isConnected());
    EXPECT_EQ(directory_.dialCount, 0);
    EXPECT_THROW(manager.connection(), ConnectionException);
}

TEST_F(ConnectionManagerTest, Connect_HoldsSession) {
    ConnectionManager manager(config_, std::make_shared<FakeDialer>(&directory_));
    manager.connect();

    EXPECT_TRUE(manager.isConnected());
    EXPECT_EQ(directory_.dialCount, 1);
    EXPECT_NO_THROW(manager.connection());
}

TEST_F(ConnectionManagerTest, Reconnect_ClosesPreviousSessionFirst) {
    ConnectionManager manager(config_, std::make_shared<FakeDialer>(&directory_));
    manager.connect();
    manager.connect();

    EXPECT_EQ(directory_.dialCount, 2);
    EXPECT_EQ(directory_.closeCount, 1);
    EXPECT_TRUE(manager.isConnected());
}

TEST_F(ConnectionManagerTest, ConnectFailure_LeavesNoSession) {
    ConnectionManager manager(config_, std::make_shared<FakeDialer>(&directory_));
    manager.connect();

    directory_.failDial = true;
    EXPECT_THROW(manager.connect(), ConnectionException);

    EXPECT_FALSE(manager.isConnected());
    EXPECT_EQ(directory_.closeCount, 1);
}

TEST_F(ConnectionManagerTest, DialerReturnsNull_ConnectionError) {
    ConnectionManager manager(config_, std::make_shared<NullDialer>());
    EXPECT_THROW(manager.connect(), ConnectionException);
    EXPECT_FALSE(manager.isConnected());
}

TEST_F(ConnectionManagerTest, Close_IdempotentAndSafeWhenDisconnected) {
    ConnectionManager manager(config_, std::make_shared<FakeDialer>(&directory_));
    EXPECT_NO_THROW(manager.close());

    manager.connect();
    manager.close();
    manager.close();

    EXPECT_FALSE(manager.isConnected());
    EXPECT_EQ(directory_.closeCount, 1);
}

TEST_F(ConnectionManagerTest, Destructor_ClosesSession) {
    {
        ConnectionManager manager(config_, std::make_shared<FakeDialer>(&directory_));
        manager.connect();
    }
    EXPECT_EQ(directory_.closeCount, 1);
}
