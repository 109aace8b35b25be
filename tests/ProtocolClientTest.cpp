#include "Fakes.hpp"

#include "plc/ProtocolClient.hpp"

#include "mclink/coroutine/coroutine.hpp"

#include <gtest/gtest.h>

using mclink::coro::syncWait;
using tcheck::model::TriggerState;
using tcheck::plc::PlcError;
using tcheck::plc::ProtocolClient;
using tcheck::test::FakeDriver;
using tcheck::test::connection_config;

namespace
{
    class ProtocolClientTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            driver = std::make_shared<FakeDriver>();
            client = std::make_unique<ProtocolClient>(driver, connection_config());
            ASSERT_TRUE(syncWait(client->connect()));
        }

        std::shared_ptr<FakeDriver> driver;
        std::unique_ptr<ProtocolClient> client;
    };
}

TEST_F(ProtocolClientTest, ConnectIsIdempotent)
{
    ASSERT_TRUE(syncWait(client->connect()));
    EXPECT_EQ(driver->connects, 1);
    EXPECT_TRUE(client->is_connected());
}

TEST_F(ProtocolClientTest, SuccessWritesValueThenRowsThenTrigger)
{
    ASSERT_TRUE(syncWait(client->write_result(-12.5, 3, true)));

    ASSERT_EQ(driver->writes.size(), 3u);
    EXPECT_EQ(driver->writes[0].head.number, 29u);
    EXPECT_EQ(driver->writes[0].words, (std::vector<uint16_t>{ 0xFB1E, 0xFFFF }));
    EXPECT_EQ(driver->writes[1].head.number, 14u);
    EXPECT_EQ(driver->writes[1].words, (std::vector<uint16_t>{ 3 }));
    EXPECT_EQ(driver->writes[2].head.number, 28u);
    EXPECT_EQ(driver->writes[2].words, (std::vector<uint16_t>{ 88 }));
}

TEST_F(ProtocolClientTest, ErrorResultWritesZeros)
{
    ASSERT_TRUE(syncWait(client->write_result(7.25, 4, false)));

    ASSERT_EQ(driver->writes.size(), 3u);
    EXPECT_EQ(driver->writes[0].words, (std::vector<uint16_t>{ 0, 0 }));
    EXPECT_EQ(driver->writes[1].words, (std::vector<uint16_t>{ 0 }));
    EXPECT_EQ(driver->writes[2].words, (std::vector<uint16_t>{ 77 }));
}

TEST_F(ProtocolClientTest, RowCountIsClampedToRegisterRange)
{
    ASSERT_TRUE(syncWait(client->write_result(0.0, -2, true)));
    EXPECT_EQ(driver->registers[14], 0);

    ASSERT_TRUE(syncWait(client->write_result(0.0, 70000, true)));
    EXPECT_EQ(driver->registers[14], 0xFFFF);
}

TEST_F(ProtocolClientTest, FailedRowWriteSkipsTriggerAndDisconnects)
{
    driver->fail_write_at = 2;

    auto result{ syncWait(client->write_result(2.5, 3, true)) };
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), PlcError::RowCountWriteFailed);

    ASSERT_EQ(driver->writes.size(), 1u);
    EXPECT_EQ(driver->writes[0].head.number, 29u);
    EXPECT_FALSE(driver->registers.contains(28));
    EXPECT_FALSE(client->is_connected());
    EXPECT_EQ(driver->disconnects, 1);
}

TEST_F(ProtocolClientTest, FailedValueWriteReportsFirstStep)
{
    driver->fail_write_at = 1;

    auto result{ syncWait(client->write_result(2.5, 3, true)) };
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), PlcError::ValueWriteFailed);
    EXPECT_TRUE(driver->writes.empty());
}

TEST_F(ProtocolClientTest, DecodesTrigger)
{
    driver->registers[28] = 99;
    auto state{ syncWait(client->read_trigger()) };
    ASSERT_TRUE(state);
    EXPECT_EQ(*state, TriggerState::RequestPending);

    driver->registers[28] = 88;
    EXPECT_EQ(*syncWait(client->read_trigger()), TriggerState::LastSuccess);

    driver->registers[28] = 77;
    EXPECT_EQ(*syncWait(client->read_trigger()), TriggerState::LastError);

    driver->registers[28] = 12;
    EXPECT_EQ(*syncWait(client->read_trigger()), TriggerState::Idle);
}

TEST_F(ProtocolClientTest, ReadFailureDisconnects)
{
    driver->fail_reads = true;

    auto state{ syncWait(client->read_trigger()) };
    ASSERT_FALSE(state);
    EXPECT_EQ(state.error(), PlcError::TriggerReadFailed);
    EXPECT_FALSE(client->is_connected());

    auto write{ syncWait(client->write_result(1.0, 1, true)) };
    ASSERT_FALSE(write);
    EXPECT_EQ(write.error(), PlcError::NotConnected);
}

TEST_F(ProtocolClientTest, ReadsStatus)
{
    driver->registers[28] = 88;
    driver->registers[14] = 5;

    auto status{ syncWait(client->read_status()) };
    ASSERT_TRUE(status);
    EXPECT_EQ(status->raw_trigger, 88);
    EXPECT_EQ(status->trigger, TriggerState::LastSuccess);
    EXPECT_EQ(status->row_count, 5);
    EXPECT_EQ(ProtocolClient::describe(status->trigger), "last result ok");
}

TEST(ProtocolClient, ConnectFailureIsReported)
{
    auto driver{ std::make_shared<FakeDriver>() };
    driver->refuse_connect = true;
    ProtocolClient client(driver, connection_config());

    auto result{ syncWait(client.connect()) };
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), PlcError::ConnectFailed);
    EXPECT_FALSE(client.is_connected());
}
