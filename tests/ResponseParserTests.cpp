// ResponseParserTests.cpp
// SSDP advertisement parsing: indicators, port resolution, identity headers.

#include <gtest/gtest.h>
#include "response_parser.h"

namespace {

const char* kWamReply =
    "HTTP/1.1 200 OK\r\n"
    "CACHE-CONTROL: max-age=1800\r\n"
    "LOCATION: http://192.168.1.40:7676/smp_4_\r\n"
    "SERVER: Samsung-Linux/4.1, UPnP/1.0, Samsung_UPnP_SDK/1.0\r\n"
    "ST: urn:samsung.com:device:WAMSpeaker:1\r\n"
    "FRIENDLYNAME: Living Room\r\n"
    "MODELNAME: WAM750\r\n"
    "\r\n";

DeviceDescriptor parseOk(const std::string& payload, const std::string& ip) {
    DeviceDescriptor desc;
    EXPECT_TRUE(parseAdvertisement(payload, ip, ParserOptions(), desc));
    return desc;
}

} // namespace

//==============================================================================
// Indicator filter
//==============================================================================

TEST(ResponseParserTests, RejectsPayloadWithoutVendorIndicator) {
    DeviceDescriptor desc;
    std::string payload =
        "HTTP/1.1 200 OK\r\n"
        "LOCATION: http://192.168.1.9:1400/xml/device_description.xml\r\n"
        "ST: urn:schemas-upnp-org:device:ZonePlayer:1\r\n\r\n";
    EXPECT_FALSE(parseAdvertisement(payload, "192.168.1.9", ParserOptions(), desc));
}

TEST(ResponseParserTests, IndicatorMatchIsCaseInsensitive) {
    DeviceDescriptor desc = parseOk("HTTP/1.1 200 OK\r\nSERVER: allshare/2.0\r\n\r\n", "10.0.0.7");
    EXPECT_EQ(desc.ip, "10.0.0.7");
}

//==============================================================================
// Identity
//==============================================================================

TEST(ResponseParserTests, ExtractsPortNameAndModel) {
    DeviceDescriptor desc = parseOk(kWamReply, "192.168.1.40");
    EXPECT_EQ(desc.ip, "192.168.1.40");
    EXPECT_EQ(desc.port, 7676);
    EXPECT_EQ(desc.advertisedName, "Living Room");
    EXPECT_EQ(desc.advertisedModel, "WAM750");
}

TEST(ResponseParserTests, SourceAddressWinsOverLocationHost) {
    DeviceDescriptor desc = parseOk(kWamReply, "192.168.1.41");
    EXPECT_EQ(desc.ip, "192.168.1.41");
}

TEST(ResponseParserTests, PlaceholdersWhenHeadersMissing) {
    DeviceDescriptor desc = parseOk("HTTP/1.1 200 OK\r\nST: urn:schemas-upnp-org:service:WAM:1\r\n\r\n",
                                    "10.0.0.5");
    EXPECT_EQ(desc.port, 55001);
    EXPECT_EQ(desc.advertisedName, "WAM Speaker at 10.0.0.5");
    EXPECT_EQ(desc.advertisedModel, "Samsung WAM Speaker");
}

TEST(ResponseParserTests, EmptyHeaderValuesKeepPlaceholders) {
    DeviceDescriptor desc = parseOk("HTTP/1.1 200 OK\r\nST: WAM\r\nFRIENDLYNAME:   \r\nMODEL:\r\n\r\n",
                                    "10.0.0.5");
    EXPECT_EQ(desc.advertisedName, "WAM Speaker at 10.0.0.5");
    EXPECT_EQ(desc.advertisedModel, "Samsung WAM Speaker");
}

TEST(ResponseParserTests, ModelHeaderAcceptedAsAlias) {
    DeviceDescriptor desc = parseOk("HTTP/1.1 200 OK\r\nST: WAM\r\nmodel: HW-Q90R\r\n\r\n", "10.0.0.5");
    EXPECT_EQ(desc.advertisedModel, "HW-Q90R");
}

TEST(ResponseParserTests, BareLineFeedsAreAccepted) {
    DeviceDescriptor desc = parseOk("HTTP/1.1 200 OK\nST: WAM\nFRIENDLYNAME: Kitchen\n", "10.0.0.8");
    EXPECT_EQ(desc.advertisedName, "Kitchen");
}

//==============================================================================
// Port resolution
//==============================================================================

TEST(ResponseParserTests, KnownPortUsedWhenLocationHasNone) {
    std::string payload =
        "HTTP/1.1 200 OK\r\n"
        "LOCATION: http://192.168.1.40/description.xml\r\n"
        "X-WAM-CONTROL: 192.168.1.40:55002\r\n"
        "ST: WAM\r\n\r\n";
    DeviceDescriptor desc = parseOk(payload, "192.168.1.40");
    EXPECT_EQ(desc.port, 55002);
}

TEST(ResponseParserTests, KnownPortMustNotBePrefixOfLongerNumber) {
    // ":80801" is not ":8080"
    std::string payload = "HTTP/1.1 200 OK\r\nST: WAM\r\nX-INFO: host:80801\r\n\r\n";
    DeviceDescriptor desc = parseOk(payload, "10.0.0.5");
    EXPECT_EQ(desc.port, 55001);
}

TEST(ResponseParserTests, CustomDefaultPort) {
    ParserOptions options;
    options.defaultPort = 9999;
    DeviceDescriptor desc;
    ASSERT_TRUE(parseAdvertisement("ST: WAM\r\n", "10.0.0.5", options, desc));
    EXPECT_EQ(desc.port, 9999);
}

//==============================================================================
// Helpers
//==============================================================================

TEST(ResponseParserTests, StringHelpers) {
    EXPECT_EQ(toLowerAscii("AllShare"), "allshare");
    EXPECT_EQ(trimCopy("  x y \t"), "x y");
    EXPECT_TRUE(containsNoCase("Server: Mongoose/6.0", "mongoose"));
    EXPECT_FALSE(containsNoCase("nginx", "lighttpd"));
}
