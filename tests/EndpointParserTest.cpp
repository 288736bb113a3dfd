#include <gtest/gtest.h>

#include <a2s/dns/EndpointParser.hpp>
#include <a2s/dns/Resolver.hpp>

using namespace a2s;

TEST(EndpointParserTest, Ipv4WithPort) {
    EndpointParser parser{"192.168.1.20:27016"};
    ASSERT_EQ(parser.result(), EndpointParseError::Success);
    ASSERT_TRUE(parser.isIpWithPort());
    EXPECT_EQ(parser.asIpWithPort().toString(), "192.168.1.20:27016");
}

TEST(EndpointParserTest, Ipv4DefaultPort) {
    EndpointParser parser{"10.0.0.1"};
    ASSERT_TRUE(parser.isIp());

    auto addr = parser.socketAddress(DEFAULT_PORT);
    ASSERT_TRUE(addr.has_value());
    EXPECT_EQ(addr->toString(), "10.0.0.1:27015");
}

TEST(EndpointParserTest, Ipv6) {
    EndpointParser bare{"::1"};
    ASSERT_EQ(bare.result(), EndpointParseError::Success);
    EXPECT_TRUE(bare.isIp());

    EndpointParser bracketed{"[::1]"};
    ASSERT_EQ(bracketed.result(), EndpointParseError::Success);
    EXPECT_TRUE(bracketed.isIp());

    EndpointParser withPort{"[2001:db8::5]:27020"};
    ASSERT_EQ(withPort.result(), EndpointParseError::Success);
    ASSERT_TRUE(withPort.isIpWithPort());
    EXPECT_TRUE(withPort.asIpWithPort().isV6());
    EXPECT_TRUE(withPort.asIpWithPort().toString().ends_with(":27020"));
}

TEST(EndpointParserTest, Domains) {
    EndpointParser plain{"play.example.com"};
    ASSERT_TRUE(plain.isDomain());
    EXPECT_EQ(plain.asDomain(), "play.example.com");
    EXPECT_FALSE(plain.socketAddress(DEFAULT_PORT).has_value());

    EndpointParser withPort{"play.example.com:27017"};
    ASSERT_TRUE(withPort.isDomainWithPort());
    EXPECT_EQ(withPort.asDomainWithPort().first, "play.example.com");
    EXPECT_EQ(withPort.asDomainWithPort().second, 27017);
}

TEST(EndpointParserTest, Invalid) {
    EXPECT_EQ(EndpointParser{""}.result(), EndpointParseError::Empty);
    EXPECT_EQ(EndpointParser{"host:"}.result(), EndpointParseError::InvalidPort);
    EXPECT_EQ(EndpointParser{"host:abc"}.result(), EndpointParseError::InvalidPort);
    EXPECT_EQ(EndpointParser{"host:70000"}.result(), EndpointParseError::InvalidPort);
    EXPECT_EQ(EndpointParser{"[::1]x"}.result(), EndpointParseError::InvalidPort);
}

TEST(EndpointParserTest, ResolveLiteral) {
    auto addr = resolveEndpoint("127.0.0.1").unwrap();
    EXPECT_EQ(addr.toString(), "127.0.0.1:27015");

    auto res = resolveEndpoint("127.0.0.1:notaport");
    ASSERT_TRUE(res.isErr());
    EXPECT_TRUE(res.unwrapErr().is(QueryError::InvalidEndpoint));
}
