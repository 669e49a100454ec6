#include <doctest/doctest.h>
#include "p100link/serial_io.hpp"
#include "p100link/transport/transport_serial.hpp"

#include <algorithm>
#include <cerrno>
#include <string>
#include <vector>

using namespace p100link;

TEST_CASE("Baud table lists the processor's rates") {
    const std::vector<int> rates = supported_baud_rates();
    CHECK(std::find(rates.begin(), rates.end(), 9600) != rates.end());
    CHECK(std::find(rates.begin(), rates.end(), 115200) != rates.end());
    CHECK(std::is_sorted(rates.begin(), rates.end()));
    CHECK(baud_supported(115200));
    CHECK_FALSE(baud_supported(12345));
    CHECK_FALSE(baud_supported(0));
}

TEST_CASE("open_serial refuses an unknown rate before opening the device") {
    errno = 0;
    CHECK(open_serial("/dev/p100link-no-such-port", 12345) == -1);
    CHECK(errno == EINVAL);

    errno = 0;
    CHECK(open_serial("/dev/p100link-no-such-port", 115200) == -1);
    CHECK(errno == ENOENT);
}

TEST_CASE("Serial transport reports an unsupported rate as an invalid argument") {
    transport::SerialTransport t("/dev/ttyUSB0", 12345);
    Error err;
    CHECK_FALSE(t.connect(err));
    CHECK(err.code == ErrorCode::InvalidArgument);
    CHECK(err.detail.find("12345") != std::string::npos);
}
