#include "model/Inspection.hpp"
#include "plc/ProtocolClient.hpp"

#include "mclink/log/format.hpp"

#include <gtest/gtest.h>

#include <format>
#include <optional>

using tcheck::model::TriggerState;

TEST(Format, ScopedEnumByName)
{
    EXPECT_EQ(std::format("{}", TriggerState::LastError), "LastError");
    EXPECT_NE(std::format("{:v}", TriggerState::LastError).find("TriggerState:LastError"), std::string::npos);
}

TEST(Format, AggregateMemberWise)
{
    tcheck::plc::PlcStatus status{ .raw_trigger = 88, .trigger = TriggerState::LastSuccess, .row_count = 4 };

    auto text{ std::format("{}", status) };
    EXPECT_NE(text.find("PlcStatus"), std::string::npos);
    EXPECT_NE(text.find("raw_trigger: 88"), std::string::npos);
    EXPECT_NE(text.find("trigger: LastSuccess"), std::string::npos);
    EXPECT_NE(text.find("row_count: 4"), std::string::npos);
}

TEST(Format, Optional)
{
    EXPECT_EQ(std::format("{}", std::optional<int>{ 5 }), "[ 5 ]");
    EXPECT_EQ(std::format("{}", std::optional<int>{}), "[ null ]");
}
