#include <gtest/gtest.h>

#include "core/Errors.h"
#include "parsers/DeviceListParser.h"

using Parsers::mapDeviceState;
using Parsers::parseDeviceList;

namespace {

const char* kMixedListing =
    "* daemon not running; starting now at tcp:5037\n"
    "* daemon started successfully\n"
    "List of devices attached\n"
    "emulator-5554          device product:sdk_gphone64 model:sdk_gphone64_x86_64 device:emu64x transport_id:1\n"
    "R58M12ABCDE            unauthorized usb:1-1 transport_id:2\n"
    "192.168.1.20:5555      offline product:beyond1 model:SM_G973F device:beyond1 transport_id:3\n"
    "0123456789ABCDEF       no permissions (missing udev rules? user is in the plugdev group); see "
    "[http://developer.android.com/tools/device.html] usb:1-2 transport_id:4\n"
    "ZX1G22KLMN             sideload\n"
    "weird01                frobnicated\n"
    "\n"
    "\n";

} // namespace

TEST(DeviceListParser, EveryDeviceLineYieldsOneRecord) {
    const auto recs = parseDeviceList(kMixedListing);
    ASSERT_EQ(recs.size(), 6u);

    EXPECT_EQ(recs[0].id, "emulator-5554");
    EXPECT_EQ(recs[0].state, DeviceState::Connected);
    EXPECT_EQ(recs[0].model, "sdk_gphone64_x86_64");
    EXPECT_EQ(recs[0].product, "sdk_gphone64");
    EXPECT_EQ(recs[0].deviceName, "emu64x");
    EXPECT_EQ(recs[0].transportId, "1");
    EXPECT_EQ(recs[0].transport, Transport::Usb);

    EXPECT_EQ(recs[1].state, DeviceState::Unauthorized);
    EXPECT_EQ(recs[1].rawState, "unauthorized");

    EXPECT_EQ(recs[2].id, "192.168.1.20:5555");
    EXPECT_EQ(recs[2].state, DeviceState::Offline);
    EXPECT_EQ(recs[2].transport, Transport::Network);

    EXPECT_EQ(recs[3].state, DeviceState::Unauthorized);
    EXPECT_EQ(recs[3].rawState, "no permissions (missing udev rules? user is in the plugdev group)");

    EXPECT_EQ(recs[4].state, DeviceState::Offline);
}

TEST(DeviceListParser, UnknownStateIsErrorWithRawTextKept) {
    const auto recs = parseDeviceList(kMixedListing);
    ASSERT_EQ(recs.size(), 6u);
    EXPECT_EQ(recs[5].id, "weird01");
    EXPECT_EQ(recs[5].state, DeviceState::Error);
    EXPECT_EQ(recs[5].rawState, "frobnicated");
}

TEST(DeviceListParser, HeaderOnlyMeansNoDevices) {
    EXPECT_TRUE(parseDeviceList("List of devices attached\n\n").empty());
    EXPECT_TRUE(parseDeviceList("").empty());
}

TEST(DeviceListParser, AcceptsCrLfLineEndings) {
    const auto recs = parseDeviceList("List of devices attached\r\nabc123\tdevice\r\ndef456\trecovery\r\n\r\n");
    ASSERT_EQ(recs.size(), 2u);
    EXPECT_EQ(recs[0].id, "abc123");
    EXPECT_EQ(recs[0].rawState, "device");
    EXPECT_EQ(recs[1].state, DeviceState::Offline);
}

TEST(DeviceListParser, LineWithoutStateIsParseError) {
    try {
        parseDeviceList("List of devices attached\nemulator-5556\n");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ParseError);
        EXPECT_EQ(e.line(), "emulator-5556");
    }
}

TEST(DeviceListParser, MapsEveryKnownState) {
    EXPECT_EQ(mapDeviceState("device"), DeviceState::Connected);
    EXPECT_EQ(mapDeviceState("offline"), DeviceState::Offline);
    EXPECT_EQ(mapDeviceState("bootloader"), DeviceState::Offline);
    EXPECT_EQ(mapDeviceState("recovery"), DeviceState::Offline);
    EXPECT_EQ(mapDeviceState("rescue"), DeviceState::Offline);
    EXPECT_EQ(mapDeviceState("unauthorized"), DeviceState::Unauthorized);
    EXPECT_EQ(mapDeviceState("authorizing"), DeviceState::Connecting);
    EXPECT_EQ(mapDeviceState("connecting"), DeviceState::Connecting);
    EXPECT_EQ(mapDeviceState("host"), DeviceState::Error);
}

TEST(DeviceListParser, MdnsServiceNameIsNetworkTransport) {
    const auto recs = parseDeviceList(
        "List of devices attached\n"
        "adb-R58M12ABCDE-XyZ12a._adb-tls-connect._tcp\tdevice product:x model:y device:z transport_id:7\n");
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_EQ(recs[0].transport, Transport::Network);
}
